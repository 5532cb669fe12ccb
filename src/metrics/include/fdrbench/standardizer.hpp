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

#include <array>
#include <cstddef>
#include <cstdint>
#include <span>
#include <string>
#include <string_view>
#include <vector>

#include "fdrbench/bench_result.hpp"

namespace fdrbench {

enum class Metric : std::uint_fast8_t { FDR, TPR, FWER, TNR, rejections, rejectprop };

inline constexpr std::array<Metric, 6> all_metrics{Metric::FDR,        Metric::TPR,
                                                   Metric::FWER,       Metric::TNR,
                                                   Metric::rejections, Metric::rejectprop};

[[nodiscard]] std::string_view to_string(Metric metric) noexcept;
[[nodiscard]] Metric parse_metric(std::string_view name);
// Metrics that can only be computed when the ground truth is known
[[nodiscard]] bool requires_truth(Metric metric) noexcept;

struct StandardizedRecord {
  std::size_t replicate{};
  std::string method{};
  double alpha{};
  Metric metric{};
  double value{};

  bool operator==(const StandardizedRecord& other) const noexcept = default;
};

// Convert BenchResults into long-format, threshold-indexed metrics.
// A hypothesis is rejected at threshold alpha when its q-value is <= alpha (missing q-values are
// never rejected). Methods without q-values for a replicate produce no records.
class Standardizer {
  std::vector<double> _alphas{};

 public:
  // Throws std::invalid_argument unless alphas is non-empty, strictly ascending and in (0, 1]
  explicit Standardizer(std::vector<double> alphas);

  [[nodiscard]] const std::vector<double>& alphas() const noexcept;

  [[nodiscard]] std::vector<StandardizedRecord> standardize(const BenchResult& result) const;
  [[nodiscard]] std::vector<StandardizedRecord> standardize(
      std::span<const BenchResult> ensemble) const;

  // num_steps thresholds evenly spaced in [min, max]
  [[nodiscard]] static std::vector<double> make_grid(double min, double max,
                                                     std::size_t num_steps);

 private:
  void standardize(const BenchResult& result, std::vector<StandardizedRecord>& buffer,
                   bool& missing_truth_reported) const;
};

}  // namespace fdrbench

template <>
struct fmt::formatter<fdrbench::Metric> : fmt::formatter<std::string_view> {
  auto format(fdrbench::Metric metric, format_context& ctx) const -> format_context::iterator {
    return fmt::formatter<std::string_view>::format(fdrbench::to_string(metric), ctx);
  }
};
