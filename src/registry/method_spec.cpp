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

#include "fdrbench/method_spec.hpp"

#include <fmt/format.h>
#include <fmt/ranges.h>

#include <algorithm>
#include <cstdint>
#include <span>
#include <stdexcept>
#include <string>
#include <string_view>
#include <type_traits>
#include <utility>
#include <variant>
#include <vector>

#include "fdrbench/dataset.hpp"
#include "fdrbench/errors.hpp"

namespace fdrbench {

std::string to_string(const ParamValue& value) {
  return std::visit(
      []<typename T>(const T& v) -> std::string {
        if constexpr (std::is_same_v<T, std::string>) {
          return v;
        } else {
          return fmt::to_string(v);
        }
      },
      value);
}

MethodArgs::MethodArgs(const Dataset& data, const Params& params,
                       std::span<const Column> inputs) noexcept
    : _data(&data), _params(&params), _inputs(inputs) {}

std::size_t MethodArgs::size() const noexcept { return _data->size(); }

std::span<const double> MethodArgs::p_value() const noexcept { return _data->p_value(); }

std::span<const double> MethodArgs::operator[](Column c) const {
  if (c != Column::p_value && std::ranges::find(_inputs, c) == _inputs.end()) {
    throw std::logic_error(fmt::format(
        "column \"{}\" was accessed but was not declared as a method input", to_string(c)));
  }
  return _data->column(c);
}

const Params& MethodArgs::params() const noexcept { return *_params; }

bool MethodArgs::has_param(std::string_view name) const { return _params->contains(name); }

MethodSpec::MethodSpec(std::string id_, std::vector<Column> inputs_, Params params_,
                       Invoker invoke_)
    : _id(std::move(id_)),
      _inputs(std::move(inputs_)),
      _params(std::move(params_)),
      _invoke(std::move(invoke_)) {
  validate();
}

const std::string& MethodSpec::id() const noexcept { return _id; }
const std::vector<Column>& MethodSpec::inputs() const noexcept { return _inputs; }
const Params& MethodSpec::params() const noexcept { return _params; }

bool MethodSpec::requires_column(Column c) const noexcept {
  return c == Column::p_value || std::ranges::find(_inputs, c) != _inputs.end();
}

MethodSpec MethodSpec::with_params(const Params& overrides) const {
  auto params_ = _params;
  for (const auto& [k, v] : overrides) {
    params_.insert_or_assign(k, v);
  }
  return {_id, _inputs, std::move(params_), _invoke};
}

std::vector<double> MethodSpec::operator()(const Dataset& data) const {
  for (const auto c : _inputs) {
    if (!data.has(c)) {
      throw UnsupportedInputError(
          fmt::format("method \"{}\" requires column \"{}\", which is missing from the dataset",
                      _id, to_string(c)));
    }
  }
  return _invoke(MethodArgs{data, _params, _inputs});
}

void MethodSpec::validate() const {
  std::vector<std::string> errors;
  if (_id.empty()) {
    errors.emplace_back("method id cannot be empty");
  }

  if (!_invoke) {
    errors.emplace_back("callable cannot be empty");
  }

  auto inputs = _inputs;
  std::ranges::sort(inputs);
  if (std::ranges::adjacent_find(inputs) != inputs.end()) {
    errors.emplace_back("inputs contain duplicate columns");
  }

  if (!errors.empty()) {
    throw std::invalid_argument(
        fmt::format("invalid specification for method \"{}\":\n - {}", _id,
                    fmt::join(errors, "\n - ")));
  }
}

}  // namespace fdrbench
