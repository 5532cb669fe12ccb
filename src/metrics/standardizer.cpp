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

#include "fdrbench/standardizer.hpp"

#include <fmt/format.h>
#include <spdlog/spdlog.h>

#include <algorithm>
#include <cmath>
#include <cstddef>
#include <iterator>
#include <span>
#include <stdexcept>
#include <string_view>
#include <utility>
#include <vector>

#include "fdrbench/bench_result.hpp"
#include "fdrbench/common.hpp"

namespace fdrbench {

std::string_view to_string(Metric metric) noexcept {
  using enum Metric;
  switch (metric) {
    case FDR:
      return "FDR";
    case TPR:
      return "TPR";
    case FWER:
      return "FWER";
    case TNR:
      return "TNR";
    case rejections:
      return "rejections";
    case rejectprop:
      return "rejectprop";
  }
  unreachable_code();
}

Metric parse_metric(std::string_view name) {
  const auto match =
      std::ranges::find_if(all_metrics, [&](const auto m) { return to_string(m) == name; });
  if (match == all_metrics.end()) {
    throw std::invalid_argument(fmt::format("unknown metric \"{}\"", name));
  }
  return *match;
}

bool requires_truth(Metric metric) noexcept {
  return metric != Metric::rejections && metric != Metric::rejectprop;
}

Standardizer::Standardizer(std::vector<double> alphas) : _alphas(std::move(alphas)) {
  if (_alphas.empty()) {
    throw std::invalid_argument("threshold grid cannot be empty");
  }
  for (std::size_t i = 0; i < _alphas.size(); ++i) {
    const auto alpha = _alphas[i];
    if (!(alpha > 0.0 && alpha <= 1.0)) {
      throw std::invalid_argument(
          fmt::format("thresholds should be in (0, 1], found {} at index {}", alpha, i));
    }
    if (i != 0 && _alphas[i - 1] >= alpha) {
      throw std::invalid_argument(fmt::format(
          "thresholds should be sorted in strictly ascending order, found {} followed by {}",
          _alphas[i - 1], alpha));
    }
  }
}

const std::vector<double>& Standardizer::alphas() const noexcept { return _alphas; }

std::vector<StandardizedRecord> Standardizer::standardize(const BenchResult& result) const {
  std::vector<StandardizedRecord> buffer{};
  bool missing_truth_reported = false;
  standardize(result, buffer, missing_truth_reported);
  return buffer;
}

std::vector<StandardizedRecord> Standardizer::standardize(
    std::span<const BenchResult> ensemble) const {
  std::vector<StandardizedRecord> buffer{};
  bool missing_truth_reported = false;
  for (const auto& result : ensemble) {
    standardize(result, buffer, missing_truth_reported);
  }
  return buffer;
}

std::vector<double> Standardizer::make_grid(double min, double max, std::size_t num_steps) {
  if (num_steps == 0) {
    throw std::invalid_argument("number of thresholds should be greater than 0");
  }
  if (!(min > 0.0 && max <= 1.0 && min <= max)) {
    throw std::invalid_argument(fmt::format(
        "invalid threshold range [{}, {}]: bounds should satisfy 0 < min <= max <= 1", min, max));
  }
  if (num_steps == 1) {
    return {max};
  }
  if (min == max) {
    throw std::invalid_argument(
        fmt::format("cannot generate {} distinct thresholds in [{}, {}]", num_steps, min, max));
  }

  std::vector<double> grid(num_steps);
  const auto step = (max - min) / static_cast<double>(num_steps - 1);
  for (std::size_t i = 0; i < num_steps; ++i) {
    grid[i] = min + static_cast<double>(i) * step;
  }
  grid.back() = max;
  return grid;
}

namespace {

// Sorted q-values of null and non-null hypotheses. Missing q-values are dropped.
struct PartitionedQValues {
  std::vector<double> null{};
  std::vector<double> non_null{};
  std::size_t num_null{};
  std::size_t num_non_null{};
};

[[nodiscard]] PartitionedQValues partition_qvalues(std::span<const double> qvalues,
                                                   const std::vector<bool>* truth) {
  PartitionedQValues res{};
  for (std::size_t i = 0; i < qvalues.size(); ++i) {
    const auto is_non_null = truth && (*truth)[i];
    if (is_non_null) {
      ++res.num_non_null;
    } else {
      ++res.num_null;
    }
    if (std::isnan(qvalues[i])) {
      continue;
    }
    (is_non_null ? res.non_null : res.null).push_back(qvalues[i]);
  }
  std::ranges::sort(res.null);
  std::ranges::sort(res.non_null);
  return res;
}

[[nodiscard]] std::size_t count_rejected(const std::vector<double>& sorted_qvalues,
                                         double alpha) {
  return static_cast<std::size_t>(
      std::distance(sorted_qvalues.begin(), std::ranges::upper_bound(sorted_qvalues, alpha)));
}

[[nodiscard]] double safe_ratio(std::size_t num, std::size_t denom) {
  return static_cast<double>(num) / static_cast<double>(std::max(std::size_t{1}, denom));
}

}  // namespace

void Standardizer::standardize(const BenchResult& result, std::vector<StandardizedRecord>& buffer,
                               bool& missing_truth_reported) const {
  const auto has_truth = result.has_truth();
  if (!has_truth && !missing_truth_reported) {
    SPDLOG_WARN(
        "replicate {} has no ground truth: only rejections and rejectprop will be computed",
        result.replicate());
    missing_truth_reported = true;
  }

  const auto* truth = has_truth ? &result.truth() : nullptr;
  const auto num_tests = result.num_tests();

  for (const auto& col : result.columns()) {
    if (!col.ok) {
      continue;
    }

    const auto qvalues = partition_qvalues(col.qvalues, truth);
    for (const auto alpha : _alphas) {
      const auto false_positives = count_rejected(qvalues.null, alpha);
      const auto true_positives = count_rejected(qvalues.non_null, alpha);
      const auto num_rejected = false_positives + true_positives;

      auto emit = [&](Metric metric, double value) {
        buffer.emplace_back(result.replicate(), col.method, alpha, metric, value);
      };

      if (has_truth) {
        emit(Metric::FDR, safe_ratio(false_positives, num_rejected));
        emit(Metric::TPR, safe_ratio(true_positives, qvalues.num_non_null));
        emit(Metric::FWER, false_positives != 0 ? 1.0 : 0.0);
        emit(Metric::TNR, safe_ratio(qvalues.num_null - false_positives, qvalues.num_null));
      }
      emit(Metric::rejections, static_cast<double>(num_rejected));
      emit(Metric::rejectprop, safe_ratio(num_rejected, num_tests));
    }
  }
}

}  // namespace fdrbench
