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

#include <fmt/format.h>
#include <fmt/std.h>

#include <exception>
#include <glaze/glaze.hpp>
#include <stdexcept>
#include <string>

#include "fdrbench/record_file.hpp"
#include "fdrbench/tools/config.hpp"
#include "fdrbench/tools/tools.hpp"

namespace fdrbench {

[[nodiscard]] static std::string prettify_metadata(const std::string& metadata) {
  glz::json_t json{};
  if (const auto ec = glz::read_json(json, metadata); ec) {
    throw std::runtime_error(
        fmt::format("failed to parse metadata as JSON: {}", glz::format_error(ec, metadata)));
  }

  std::string buff;
  if (const auto ec = glz::write<glz::opts{.prettify = true}>(json, buff); ec) {
    throw std::runtime_error(glz::format_error(ec));
  }

  return buff;
}

int run_command(const MetadataConfig& c) {
  try {
    const RecordFileReader reader{c.input_path};
    if (c.raw) {
      fmt::println("{}", reader.metadata());
    } else {
      fmt::println("{}", prettify_metadata(reader.metadata()));
    }
  } catch (const std::exception& e) {
    throw std::runtime_error(
        fmt::format("failed to read metadata from {}: {}", c.input_path, e.what()));
  }

  return 0;
}

}  // namespace fdrbench
