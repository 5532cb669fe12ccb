// Copyright (C) 2024 Roberto Rossini <roberros@uio.no>
//
// SPDX-License-Identifier: GPL-3.0
//
// This library is free software: you can redistribute it and/or
// modify it under the terms of the GNU Public License as published
// by the Free Software Foundation; either version 3 of the License,
// or (at your option) any later version.
//
// This library is distributed in the hope that it will be useful,
// but WITHOUT ANY WARRANTY; without even the implied warranty of
// MERCHANTABILITY or FITNESS FOR A PARTICULAR PURPOSE.  See the GNU
// Library General Public License for more details.
//
// You should have received a copy of the GNU Public License along
// with this library.  If not, see
// <https://www.gnu.org/licenses/>.

#pragma once

#include <fmt/format.h>

#include <chrono>
#include <filesystem>
#include <system_error>
#include <unistd.h>

namespace fdrbench::test {

// Temporary directory that is removed (together with its content) on destruction
class TmpDir {
  std::filesystem::path _path{};

 public:
  TmpDir() : TmpDir(std::filesystem::temp_directory_path()) {}

  explicit TmpDir(const std::filesystem::path& prefix)
      : _path(prefix / fmt::format("fdrbench-test-{}-{}", ::getpid(),
                                   std::chrono::steady_clock::now().time_since_epoch().count())) {
    std::filesystem::create_directories(_path);
  }

  TmpDir(const TmpDir& other) = delete;
  TmpDir(TmpDir&& other) noexcept = delete;

  ~TmpDir() noexcept {
    std::error_code ec{};
    std::filesystem::remove_all(_path, ec);
  }

  TmpDir& operator=(const TmpDir& other) = delete;
  TmpDir& operator=(TmpDir&& other) noexcept = delete;

  [[nodiscard]] const std::filesystem::path& operator()() const noexcept { return _path; }
};

inline const TmpDir testdir{};  // NOLINT(cert-err58-cpp)

}  // namespace fdrbench::test
