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
#include <cstdint>
#include <span>
#include <string>
#include <string_view>
#include <vector>

#include "fdrbench/standardizer.hpp"

namespace fdrbench {

enum class AggregationMode : std::uint_fast8_t { mean, paired_difference };

[[nodiscard]] std::string_view to_string(AggregationMode mode) noexcept;

struct AggregatedRecord {
  std::string method{};
  double alpha{};
  Metric metric{};
  double mean{};
  // NaN when fewer than two replicates contribute
  double standard_error{};
  std::size_t num_replicates{};

  bool operator==(const AggregatedRecord& other) const noexcept = default;
};

// Mean and standard error of each (method, alpha, metric) group across replicates.
// Replicates lacking a record for a group do not contribute to it.
// Output records follow the order in which groups first appear in the input.
[[nodiscard]] std::vector<AggregatedRecord> aggregate(
    std::span<const StandardizedRecord> records,
    std::span<const std::string> excluded_methods = {});

// Join a and b on (replicate, method, alpha, metric), compute the per-replicate difference a - b
// and aggregate the differences. Records without a partner are ignored.
[[nodiscard]] std::vector<AggregatedRecord> aggregate_paired_difference(
    std::span<const StandardizedRecord> a, std::span<const StandardizedRecord> b,
    std::span<const std::string> excluded_methods = {});

// b is ignored when mode is AggregationMode::mean
[[nodiscard]] std::vector<AggregatedRecord> aggregate(
    AggregationMode mode, std::span<const StandardizedRecord> a,
    std::span<const StandardizedRecord> b, std::span<const std::string> excluded_methods = {});

}  // namespace fdrbench
