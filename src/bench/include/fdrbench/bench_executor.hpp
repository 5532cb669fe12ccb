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
#include <string>
#include <string_view>
#include <vector>

#include "fdrbench/bench_result.hpp"
#include "fdrbench/dataset.hpp"
#include "fdrbench/registry.hpp"

namespace fdrbench {

// Run every method of a registry against one dataset.
// Methods run sequentially in registry order. A method that throws or returns a vector of the
// wrong length never aborts the run: its column is recorded as missing and the cause is stored
// in BenchResult::failures().
class BenchExecutor {
 public:
  struct Options {
    // copy the ground truth (if any) into the result
    bool use_ground_truth{true};
    // names of dataset columns or features to copy into the result
    std::vector<std::string> passthrough_features{};
  };

 private:
  Registry _registry{};
  Options _opts{};

 public:
  explicit BenchExecutor(Registry registry, Options opts);
  explicit BenchExecutor(Registry registry);

  [[nodiscard]] const Registry& registry() const noexcept;
  [[nodiscard]] const Options& options() const noexcept;

  // Throws std::invalid_argument when a passthrough feature is not found in data.
  // This is checked before running any method.
  [[nodiscard]] BenchResult run(const Dataset& data, std::size_t replicate = 0) const;

  // Result of a replicate whose dataset could not be produced: every method column is missing.
  [[nodiscard]] BenchResult failed(std::size_t replicate, std::size_t num_tests,
                                   std::string_view reason) const;

 private:
  void validate_passthrough_features(const Dataset& data) const;
  void copy_passthrough_features(const Dataset& data, BenchResult& res) const;
};

}  // namespace fdrbench
