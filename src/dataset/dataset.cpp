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

#include "fdrbench/dataset.hpp"

#include <fmt/format.h>

#include <algorithm>
#include <cmath>
#include <cstddef>
#include <optional>
#include <span>
#include <stdexcept>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace fdrbench {

std::string_view to_string(Column c) noexcept {
  switch (c) {
    using enum Column;
    case p_value:
      return "p_value";
    case test_statistic:
      return "test_statistic";
    case effect_size:
      return "effect_size";
    case standard_error:
      return "standard_error";
    case ind_covariate:
      return "ind_covariate";
  }
  return "unknown";
}

std::optional<Column> try_parse_column(std::string_view name) noexcept {
  const auto it =
      std::ranges::find_if(all_columns, [&](const auto c) { return to_string(c) == name; });
  if (it == all_columns.end()) {
    return {};
  }
  return *it;
}

Column parse_column(std::string_view name) {
  if (const auto c = try_parse_column(name); c.has_value()) {
    return *c;
  }
  throw std::invalid_argument(fmt::format("unknown column \"{}\"", name));
}

[[nodiscard]] static constexpr std::size_t column_idx(Column c) noexcept {
  return static_cast<std::size_t>(c);
}

Dataset::Dataset(std::vector<double> p_values) : _size(p_values.size()) {
  set(Column::p_value, std::move(p_values));
}

std::size_t Dataset::size() const noexcept { return _size; }
bool Dataset::empty() const noexcept { return _size == 0; }

bool Dataset::has(Column c) const noexcept { return _columns[column_idx(c)].has_value(); }

std::span<const double> Dataset::column(Column c) const {
  const auto &col = _columns[column_idx(c)];
  if (!col.has_value()) {
    throw std::out_of_range(fmt::format("dataset does not have column \"{}\"", to_string(c)));
  }
  return *col;
}

std::span<const double> Dataset::p_value() const noexcept {
  const auto &col = _columns[column_idx(Column::p_value)];
  if (!col.has_value()) {
    return {};
  }
  return *col;
}

bool Dataset::has_truth() const noexcept { return _truth.has_value(); }

const std::vector<bool> &Dataset::truth() const {
  if (!_truth.has_value()) {
    throw std::out_of_range("dataset does not have ground truth");
  }
  return *_truth;
}

std::size_t Dataset::num_non_null() const {
  return static_cast<std::size_t>(std::ranges::count(truth(), true));
}

std::size_t Dataset::num_null() const { return size() - num_non_null(); }

bool Dataset::has_feature(std::string_view name) const { return _features.contains(name); }

std::span<const double> Dataset::feature(std::string_view name) const {
  const auto match = _features.find(name);
  if (match == _features.end()) {
    throw std::out_of_range(fmt::format("dataset does not have feature \"{}\"", name));
  }
  return match->second;
}

auto Dataset::features() const noexcept -> const FeatureMap & { return _features; }

Dataset &Dataset::set(Column c, std::vector<double> values) {
  if (c == Column::p_value) {
    validate_pvalues(values);
    if (!has(Column::p_value)) {
      _size = values.size();
    }
  }
  validate_size(to_string(c), values.size());
  _columns[column_idx(c)] = std::move(values);
  return *this;
}

Dataset &Dataset::set_truth(std::vector<bool> values) {
  validate_size("truth", values.size());
  _truth = std::move(values);
  return *this;
}

Dataset &Dataset::add_feature(std::string name, std::vector<double> values) {
  if (try_parse_column(name).has_value() || name == "truth") {
    throw std::invalid_argument(
        fmt::format("feature name \"{}\" collides with a reserved column name", name));
  }
  validate_size(name, values.size());
  _features.insert_or_assign(std::move(name), std::move(values));
  return *this;
}

Dataset Dataset::with_column(Column c, std::vector<double> values) const {
  auto copy = *this;
  copy.set(c, std::move(values));
  return copy;
}

template <typename T>
[[nodiscard]] static std::vector<T> select_rows(const std::vector<T> &values,
                                                std::span<const std::size_t> rows) {
  std::vector<T> buff(rows.size());
  for (std::size_t i = 0; i < rows.size(); ++i) {
    buff[i] = values[rows[i]];
  }
  return buff;
}

Dataset Dataset::subset(std::span<const std::size_t> rows) const {
  if (const auto it = std::ranges::find_if(rows, [&](const auto i) { return i >= _size; });
      it != rows.end()) {
    throw std::out_of_range(
        fmt::format("row index {} is out of range for a dataset with {} rows", *it, _size));
  }

  Dataset ds{};
  ds._size = rows.size();
  for (std::size_t i = 0; i < _columns.size(); ++i) {
    if (_columns[i].has_value()) {
      ds._columns[i] = select_rows(*_columns[i], rows);
    }
  }
  if (_truth.has_value()) {
    ds._truth = select_rows(*_truth, rows);
  }
  for (const auto &[name, values] : _features) {
    ds._features.emplace(name, select_rows(values, rows));
  }
  return ds;
}

void Dataset::validate_size(std::string_view name, std::size_t size) const {
  if (size != _size) {
    throw std::invalid_argument(
        fmt::format("column \"{}\" has {} rows, but the dataset has {} rows", name, size, _size));
  }
}

void Dataset::validate_pvalues(std::span<const double> pvalues) {
  const auto it = std::ranges::find_if(
      pvalues, [](const auto p) { return !std::isnan(p) && (p < 0.0 || p > 1.0); });
  if (it != pvalues.end()) {
    throw std::invalid_argument(fmt::format(
        "p-value at row {} is out of range: {} is not in [0, 1]", it - pvalues.begin(), *it));
  }
}

}  // namespace fdrbench
