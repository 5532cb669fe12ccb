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

#include <concepts>
#include <cstdint>
#include <functional>
#include <limits>
#include <stdexcept>
#include <string>
#include <string_view>
#include <type_traits>
#include <utility>
#include <variant>
#include <vector>

namespace fdrbench {

namespace internal {

template <typename T>
[[nodiscard]] constexpr std::string_view param_type_name() noexcept {
  if constexpr (std::is_same_v<T, bool>) {
    return "bool";
  } else if constexpr (std::is_integral_v<T>) {
    return "integer";
  } else if constexpr (std::is_same_v<T, double>) {
    return "double";
  } else {
    return "string";
  }
}

}  // namespace internal

template <typename T>
inline T MethodArgs::param(std::string_view name) const {
  const auto match = _params->find(name);
  if (match == _params->end()) {
    throw std::out_of_range(fmt::format("missing required parameter \"{}\"", name));
  }

  const auto& value = match->second;
  if constexpr (std::is_same_v<T, double>) {
    // integer literals are accepted where a double is expected
    if (const auto* ptr = std::get_if<std::int64_t>(&value); ptr) {
      return static_cast<double>(*ptr);
    }
  }

  if constexpr (std::is_integral_v<T> && !std::is_same_v<T, bool>) {
    if (const auto* ptr = std::get_if<std::int64_t>(&value); ptr) {
      if (std::cmp_less(*ptr, std::numeric_limits<T>::min()) ||
          std::cmp_greater(*ptr, std::numeric_limits<T>::max())) {
        throw std::out_of_range(
            fmt::format("parameter \"{}\": value {} does not fit in the requested type", name,
                        *ptr));
      }
      return static_cast<T>(*ptr);
    }
  } else {
    if (const auto* ptr = std::get_if<T>(&value); ptr) {
      return *ptr;
    }
  }

  throw std::invalid_argument(fmt::format("parameter \"{}\" has type {}, expected {}", name,
                                          std::visit(
                                              []<typename U>(const U&) {
                                                return internal::param_type_name<U>();
                                              },
                                              value),
                                          internal::param_type_name<T>()));
}

template <typename T>
inline T MethodArgs::param_or(std::string_view name, T default_value) const {
  if (!has_param(name)) {
    return default_value;
  }
  return param<T>(name);
}

template <typename Fx, typename Extractor>
  requires OutputExtractor<Extractor, Fx>
inline MethodSpec::MethodSpec(std::string id_, std::vector<Column> inputs_, Fx callable,
                              Params params_, Extractor extractor)
    : MethodSpec(std::move(id_), std::move(inputs_), std::move(params_),
                 [fx = std::move(callable), ex = std::move(extractor)](const MethodArgs& args) {
                   return std::vector<double>(std::invoke(ex, std::invoke(fx, args)));
                 }) {}

}  // namespace fdrbench
