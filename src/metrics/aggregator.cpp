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

#include "fdrbench/aggregator.hpp"

// clang-format off
#include "fdrbench/suppress_warnings.hpp"
FDRBENCH_DISABLE_WARNING_PUSH
FDRBENCH_DISABLE_WARNING_DEPRECATED_DECLARATIONS
#include <parallel_hashmap/btree.h>
FDRBENCH_DISABLE_WARNING_POP
// clang-format on

#include <fmt/format.h>
#include <spdlog/spdlog.h>

#include <algorithm>
#include <cmath>
#include <cstddef>
#include <limits>
#include <span>
#include <stdexcept>
#include <string>
#include <string_view>
#include <tuple>
#include <utility>
#include <vector>

#include "fdrbench/common.hpp"
#include "fdrbench/standardizer.hpp"

namespace fdrbench {

std::string_view to_string(AggregationMode mode) noexcept {
  switch (mode) {
    case AggregationMode::mean:
      return "mean";
    case AggregationMode::paired_difference:
      return "paired-difference";
  }
  unreachable_code();
}

namespace {

// Welford's online algorithm
class RunningStats {
  std::size_t _count{};
  double _mean{};
  double _m2{};

 public:
  void add(double x) noexcept {
    ++_count;
    const auto delta = x - _mean;
    _mean += delta / static_cast<double>(_count);
    _m2 += delta * (x - _mean);
  }

  [[nodiscard]] std::size_t count() const noexcept { return _count; }
  [[nodiscard]] double mean() const noexcept { return _mean; }

  [[nodiscard]] double standard_error() const noexcept {
    if (_count < 2) {
      return std::numeric_limits<double>::quiet_NaN();
    }
    const auto n = static_cast<double>(_count);
    const auto variance = _m2 / (n - 1);
    return std::sqrt(variance / n);
  }
};

using GroupKey = std::tuple<std::string_view, double, Metric>;

// Groups are stored in order of first appearance
class GroupedStats {
  phmap::btree_map<GroupKey, std::size_t> _index{};
  std::vector<GroupKey> _keys{};
  std::vector<RunningStats> _stats{};

 public:
  void add(const StandardizedRecord& record, double value) {
    const GroupKey key{record.method, record.alpha, record.metric};
    auto [it, inserted] = _index.try_emplace(key, _stats.size());
    if (inserted) {
      _keys.push_back(key);
      _stats.emplace_back();
    }
    _stats[it->second].add(value);
  }

  [[nodiscard]] std::vector<AggregatedRecord> finalize() const {
    std::vector<AggregatedRecord> records{};
    records.reserve(_stats.size());
    for (std::size_t i = 0; i < _stats.size(); ++i) {
      const auto& [method, alpha, metric] = _keys[i];
      const auto& stats = _stats[i];
      records.emplace_back(std::string{method}, alpha, metric, stats.mean(),
                           stats.standard_error(), stats.count());
    }
    return records;
  }
};

[[nodiscard]] bool is_excluded(std::string_view method,
                               std::span<const std::string> excluded_methods) {
  return std::ranges::find(excluded_methods, method) != excluded_methods.end();
}

}  // namespace

std::vector<AggregatedRecord> aggregate(std::span<const StandardizedRecord> records,
                                        std::span<const std::string> excluded_methods) {
  GroupedStats groups{};
  for (const auto& record : records) {
    if (!is_excluded(record.method, excluded_methods)) {
      groups.add(record, record.value);
    }
  }
  return groups.finalize();
}

std::vector<AggregatedRecord> aggregate_paired_difference(
    std::span<const StandardizedRecord> a, std::span<const StandardizedRecord> b,
    std::span<const std::string> excluded_methods) {
  using RecordKey = std::tuple<std::size_t, std::string_view, double, Metric>;
  phmap::btree_map<RecordKey, double> b_values{};
  for (const auto& record : b) {
    if (is_excluded(record.method, excluded_methods)) {
      continue;
    }
    const RecordKey key{record.replicate, record.method, record.alpha, record.metric};
    if (!b_values.try_emplace(key, record.value).second) {
      throw std::invalid_argument(fmt::format(
          "found duplicate record for replicate={}, method={}, alpha={}, metric={}",
          record.replicate, record.method, record.alpha, record.metric));
    }
  }

  GroupedStats groups{};
  std::size_t num_unpaired = 0;
  for (const auto& record : a) {
    if (is_excluded(record.method, excluded_methods)) {
      continue;
    }
    const auto match =
        b_values.find(RecordKey{record.replicate, record.method, record.alpha, record.metric});
    if (match == b_values.end()) {
      ++num_unpaired;
      continue;
    }
    groups.add(record, record.value - match->second);
  }

  if (num_unpaired != 0) {
    SPDLOG_DEBUG("paired difference: {} records have no matching record and were skipped",
                 num_unpaired);
  }

  return groups.finalize();
}

std::vector<AggregatedRecord> aggregate(AggregationMode mode,
                                        std::span<const StandardizedRecord> a,
                                        std::span<const StandardizedRecord> b,
                                        std::span<const std::string> excluded_methods) {
  switch (mode) {
    case AggregationMode::mean:
      return aggregate(a, excluded_methods);
    case AggregationMode::paired_difference:
      return aggregate_paired_difference(a, b, excluded_methods);
  }
  unreachable_code();
}

}  // namespace fdrbench
