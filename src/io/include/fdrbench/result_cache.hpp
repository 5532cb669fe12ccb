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

#include <cstddef>
#include <filesystem>
#include <optional>
#include <string>
#include <string_view>

namespace fdrbench {

// Key-value store persisting objects as glaze BEVE blobs, one file per key.
// Keys are mapped onto file names by replacing unsafe characters and appending the XXH3 digest
// of the original key. Writes go to a temporary file that is then renamed into place, so
// readers never observe partially written blobs.
template <typename T>
class FileCache {
  std::filesystem::path _root{};

 public:
  static constexpr std::string_view extension{".beve"};

  explicit FileCache(std::filesystem::path root);

  [[nodiscard]] const std::filesystem::path& root() const noexcept;
  [[nodiscard]] std::filesystem::path path(std::string_view key) const;

  [[nodiscard]] bool contains(std::string_view key) const;
  // Throws std::runtime_error when the blob cannot be decoded
  [[nodiscard]] std::optional<T> get(std::string_view key) const;
  void put(std::string_view key, const T& value) const;

  template <typename ComputeFx>
  [[nodiscard]] T get_or_compute(std::string_view key, ComputeFx&& compute) const;

  bool remove(std::string_view key) const;
  // Remove all blobs from the cache. Returns the number of blobs removed
  std::size_t clear() const;

  [[nodiscard]] static std::string sanitize_key(std::string_view key);
};

}  // namespace fdrbench

#include "../../result_cache_impl.hpp"
