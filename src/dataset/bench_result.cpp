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

#include "fdrbench/bench_result.hpp"

#include <fmt/format.h>

#include <algorithm>
#include <cstddef>
#include <limits>
#include <span>
#include <stdexcept>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace fdrbench {

BenchResult::BenchResult(std::size_t replicate_, std::size_t num_tests_)
    : _replicate(replicate_), _num_tests(num_tests_) {}

BenchResult BenchResult::failed(std::size_t replicate_, std::size_t num_tests_,
                                std::span<const std::string> methods, std::string_view reason) {
  BenchResult res{replicate_, num_tests_};
  for (const auto &method : methods) {
    res.add_failure(method, std::string{reason});
  }
  return res;
}

std::size_t BenchResult::replicate() const noexcept { return _replicate; }
std::size_t BenchResult::num_tests() const noexcept { return _num_tests; }
std::size_t BenchResult::num_methods() const noexcept { return _columns.size(); }

auto BenchResult::columns() const noexcept -> const std::vector<MethodColumn> & {
  return _columns;
}

auto BenchResult::at(std::string_view method) const -> const MethodColumn & {
  const auto it = std::ranges::find(_columns, method, &MethodColumn::method);
  if (it == _columns.end()) {
    throw std::out_of_range(
        fmt::format("replicate {} has no column for method \"{}\"", _replicate, method));
  }
  return *it;
}

bool BenchResult::contains(std::string_view method) const noexcept {
  return std::ranges::find(_columns, method, &MethodColumn::method) != _columns.end();
}

bool BenchResult::has_qvalues(std::string_view method) const noexcept {
  const auto it = std::ranges::find(_columns, method, &MethodColumn::method);
  return it != _columns.end() && it->ok;
}

std::span<const double> BenchResult::qvalues(std::string_view method) const {
  return at(method).qvalues;
}

std::vector<std::string> BenchResult::methods() const {
  std::vector<std::string> names(_columns.size());
  std::ranges::transform(_columns, names.begin(), &MethodColumn::method);
  return names;
}

bool BenchResult::has_truth() const noexcept { return _truth.has_value(); }

const std::vector<bool> &BenchResult::truth() const {
  if (!_truth.has_value()) {
    throw std::out_of_range(fmt::format("replicate {} has no ground truth", _replicate));
  }
  return *_truth;
}

const Dataset::FeatureMap &BenchResult::features() const noexcept { return _features; }

const std::vector<MethodFailure> &BenchResult::failures() const noexcept { return _failures; }

bool BenchResult::all_failed() const noexcept {
  return std::ranges::none_of(_columns, &MethodColumn::ok);
}

void BenchResult::add_qvalues(std::string method, std::vector<double> qvalues,
                              double runtime_seconds) {
  check_not_registered(method);
  if (qvalues.size() != _num_tests) {
    throw std::invalid_argument(fmt::format(
        "method \"{}\" produced {} q-values, expected {}", method, qvalues.size(), _num_tests));
  }
  _columns.emplace_back(std::move(method), std::move(qvalues), true, runtime_seconds);
}

void BenchResult::add_failure(std::string method, std::string reason, double runtime_seconds) {
  check_not_registered(method);
  _failures.emplace_back(method, _replicate, std::move(reason));
  _columns.emplace_back(std::move(method),
                        std::vector<double>(_num_tests, std::numeric_limits<double>::quiet_NaN()),
                        false, runtime_seconds);
}

void BenchResult::set_truth(std::vector<bool> truth_) {
  if (truth_.size() != _num_tests) {
    throw std::invalid_argument(fmt::format("truth has {} values, expected {}", truth_.size(),
                                            _num_tests));
  }
  _truth = std::move(truth_);
}

void BenchResult::add_feature(std::string name, std::vector<double> values) {
  if (values.size() != _num_tests) {
    throw std::invalid_argument(fmt::format("feature \"{}\" has {} values, expected {}", name,
                                            values.size(), _num_tests));
  }
  _features.insert_or_assign(std::move(name), std::move(values));
}

void BenchResult::check_not_registered(std::string_view method) const {
  if (contains(method)) {
    throw std::logic_error(
        fmt::format("replicate {} already has a column for method \"{}\"", _replicate, method));
  }
}

}  // namespace fdrbench
