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

// clang-format off
#include "fdrbench/suppress_warnings.hpp"
FDRBENCH_DISABLE_WARNING_PUSH
FDRBENCH_DISABLE_WARNING_DEPRECATED_DECLARATIONS
#include <parallel_hashmap/btree.h>
FDRBENCH_DISABLE_WARNING_POP
// clang-format on

#include <array>
#include <cstddef>
#include <cstdint>
#include <functional>
#include <optional>
#include <span>
#include <string>
#include <string_view>
#include <vector>

namespace fdrbench {

// Per-hypothesis numeric columns that correction methods can bind to.
enum class Column : std::uint_fast8_t {
  p_value,
  test_statistic,
  effect_size,
  standard_error,
  ind_covariate,
};

inline constexpr std::array<Column, 5> all_columns{Column::p_value, Column::test_statistic,
                                                   Column::effect_size, Column::standard_error,
                                                   Column::ind_covariate};

[[nodiscard]] std::string_view to_string(Column c) noexcept;
[[nodiscard]] Column parse_column(std::string_view name);
[[nodiscard]] std::optional<Column> try_parse_column(std::string_view name) noexcept;

// Table of hypotheses: one row per test, all columns aligned by row index.
// Missing numeric values are stored as NaN.
class Dataset {
 public:
  using FeatureMap = phmap::btree_map<std::string, std::vector<double>, std::less<>>;

 private:
  std::size_t _size{};
  std::array<std::optional<std::vector<double>>, all_columns.size()> _columns{};
  std::optional<std::vector<bool>> _truth{};
  FeatureMap _features{};

 public:
  Dataset() = default;
  explicit Dataset(std::vector<double> p_values);

  [[nodiscard]] std::size_t size() const noexcept;
  [[nodiscard]] bool empty() const noexcept;

  [[nodiscard]] bool has(Column c) const noexcept;
  [[nodiscard]] std::span<const double> column(Column c) const;
  [[nodiscard]] std::span<const double> p_value() const noexcept;

  [[nodiscard]] bool has_truth() const noexcept;
  // true = non-null hypothesis
  [[nodiscard]] const std::vector<bool> &truth() const;
  [[nodiscard]] std::size_t num_null() const;
  [[nodiscard]] std::size_t num_non_null() const;

  [[nodiscard]] bool has_feature(std::string_view name) const;
  [[nodiscard]] std::span<const double> feature(std::string_view name) const;
  [[nodiscard]] const FeatureMap &features() const noexcept;

  Dataset &set(Column c, std::vector<double> values);
  Dataset &set_truth(std::vector<bool> values);
  Dataset &add_feature(std::string name, std::vector<double> values);

  [[nodiscard]] Dataset with_column(Column c, std::vector<double> values) const;
  // Row selection. Rows are returned in the order given by rows.
  [[nodiscard]] Dataset subset(std::span<const std::size_t> rows) const;

 private:
  void validate_size(std::string_view name, std::size_t size) const;
  static void validate_pvalues(std::span<const double> pvalues);
};

}  // namespace fdrbench
