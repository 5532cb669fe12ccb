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
#include <fmt/std.h>
#include <spdlog/spdlog.h>
#include <xxhash.h>

#include <algorithm>
#include <cctype>
#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <fstream>
#include <glaze/glaze.hpp>
#include <ios>
#include <iterator>
#include <optional>
#include <stdexcept>
#include <string>
#include <string_view>
#include <system_error>
#include <utility>

namespace fdrbench {

template <typename T>
inline FileCache<T>::FileCache(std::filesystem::path root) : _root(std::move(root)) {
  std::filesystem::create_directories(_root);
}

template <typename T>
inline const std::filesystem::path& FileCache<T>::root() const noexcept {
  return _root;
}

template <typename T>
inline std::filesystem::path FileCache<T>::path(std::string_view key) const {
  return _root / fmt::format("{}{}", sanitize_key(key), extension);
}

template <typename T>
inline bool FileCache<T>::contains(std::string_view key) const {
  return std::filesystem::exists(path(key));
}

template <typename T>
inline std::optional<T> FileCache<T>::get(std::string_view key) const {
  const auto path_ = path(key);
  std::ifstream ifs{};
  ifs.exceptions(ifs.exceptions() | std::ios::badbit);
  ifs.open(path_, std::ios::in | std::ios::binary);
  if (!ifs) {
    return {};
  }

  std::string buff{std::istreambuf_iterator<char>{ifs}, std::istreambuf_iterator<char>{}};

  T value{};
  if (const auto ec = glz::read_beve(value, buff); ec) {
    throw std::runtime_error(
        fmt::format("failed to read cached object from file {}: {}", path_,
                    glz::format_error(ec, buff)));
  }
  SPDLOG_DEBUG("read cached object \"{}\" from file {}", key, path_);
  return value;
}

template <typename T>
inline void FileCache<T>::put(std::string_view key, const T& value) const {
  std::string buff{};
  if (const auto ec = glz::write_beve(value, buff); ec) {
    throw std::runtime_error(
        fmt::format("failed to serialize object \"{}\": {}", key, glz::format_error(ec)));
  }

  const auto dest = path(key);
  auto tmp_path = dest;
  tmp_path += ".tmp";

  try {
    std::ofstream ofs{};
    ofs.exceptions(ofs.exceptions() | std::ios::badbit | std::ios::failbit);
    ofs.open(tmp_path, std::ios::out | std::ios::binary | std::ios::trunc);
    ofs.write(buff.data(), static_cast<std::streamsize>(buff.size()));
    ofs.close();
    std::filesystem::rename(tmp_path, dest);
  } catch (const std::exception& e) {
    std::error_code ec{};
    std::filesystem::remove(tmp_path, ec);
    throw std::runtime_error(
        fmt::format("failed to write cached object \"{}\" to file {}: {}", key, dest, e.what()));
  }
  SPDLOG_DEBUG("written object \"{}\" to file {}", key, dest);
}

template <typename T>
template <typename ComputeFx>
inline T FileCache<T>::get_or_compute(std::string_view key, ComputeFx&& compute) const {
  if (auto value = get(key); value.has_value()) {
    SPDLOG_INFO("found cached result for \"{}\"", key);
    return std::move(*value);
  }

  SPDLOG_DEBUG("cache miss for \"{}\": computing...", key);
  T value = std::forward<ComputeFx>(compute)();
  put(key, value);
  return value;
}

template <typename T>
inline bool FileCache<T>::remove(std::string_view key) const {
  return std::filesystem::remove(path(key));
}

template <typename T>
inline std::size_t FileCache<T>::clear() const {
  std::size_t num_removed = 0;
  for (const auto& entry : std::filesystem::directory_iterator(_root)) {
    if (entry.is_regular_file() && entry.path().extension() == extension) {
      num_removed += std::filesystem::remove(entry.path());
    }
  }
  return num_removed;
}

template <typename T>
inline std::string FileCache<T>::sanitize_key(std::string_view key) {
  constexpr std::size_t max_prefix_length = 64;

  std::string prefix{key.substr(0, std::min(key.size(), max_prefix_length))};
  std::ranges::replace_if(
      prefix,
      [](const char c) {
        return !std::isalnum(static_cast<unsigned char>(c)) && c != '-' && c != '_' && c != '.';
      },
      '_');

  const auto digest = static_cast<std::uint64_t>(XXH3_64bits(key.data(), key.size()));
  return fmt::format("{}.{:016x}", prefix, digest);
}

}  // namespace fdrbench
