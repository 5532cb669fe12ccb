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
#include <fmt/ranges.h>

#include <string>
#include <vector>

#include "fdrbench/dataset.hpp"
#include "fdrbench/method_spec.hpp"
#include "fdrbench/reference_methods.hpp"
#include "fdrbench/tools/config.hpp"
#include "fdrbench/tools/tools.hpp"

namespace fdrbench {

[[nodiscard]] static std::string format_inputs(const MethodSpec& spec) {
  std::vector<std::string> inputs{std::string{to_string(Column::p_value)}};
  for (const auto c : spec.inputs()) {
    inputs.emplace_back(to_string(c));
  }
  return fmt::format("{}", fmt::join(inputs, ","));
}

[[nodiscard]] static std::string format_params(const MethodSpec& spec) {
  if (spec.params().empty()) {
    return "-";
  }

  std::vector<std::string> params{};
  for (const auto& [name, value] : spec.params()) {
    params.emplace_back(fmt::format("{}={}", name, to_string(value)));
  }
  return fmt::format("{}", fmt::join(params, ","));
}

int run_command(const MethodsConfig& c) {
  if (c.with_header) {
    fmt::print("method\tinputs\tparams\n");
  }

  for (const auto& spec : methods::make_reference_registry()) {
    fmt::print("{}\t{}\t{}\n", spec->id(), format_inputs(*spec), format_params(*spec));
  }

  return 0;
}

}  // namespace fdrbench
