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

#include <stdexcept>
#include <string>
#include <string_view>

namespace fdrbench {

// Configuration errors: raised immediately and never retried.

class DuplicateMethodError : public std::runtime_error {
 public:
  explicit DuplicateMethodError(std::string_view method_id)
      : std::runtime_error(
            fmt::format("a method with id \"{}\" has already been registered", method_id)) {}
};

class UnknownMethodError : public std::out_of_range {
 public:
  explicit UnknownMethodError(std::string_view method_id)
      : std::out_of_range(fmt::format("no method with id \"{}\" is registered", method_id)) {}
};

class InvalidSimulationConfigError : public std::invalid_argument {
 public:
  explicit InvalidSimulationConfigError(const std::string &msg)
      : std::invalid_argument(fmt::format("invalid simulation config: {}", msg)) {}
};

// Run-time errors: these are caught by BenchExecutor/ReplicationDriver and recorded as
// missing data instead of aborting the run.

// Thrown by correction methods when the input dataset is outside what they can handle
// (e.g. a covariate with zero variance).
class UnsupportedInputError : public std::runtime_error {
 public:
  explicit UnsupportedInputError(const std::string &msg) : std::runtime_error(msg) {}
};

class ResamplingError : public std::runtime_error {
 public:
  explicit ResamplingError(const std::string &msg) : std::runtime_error(msg) {}
};

}  // namespace fdrbench
