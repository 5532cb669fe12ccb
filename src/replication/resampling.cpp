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

#include "fdrbench/resampling.hpp"

#include <fmt/format.h>
#include <spdlog/spdlog.h>

#include <algorithm>
#include <boost/random/uniform_int_distribution.hpp>
#include <cmath>
#include <cstddef>
#include <numeric>
#include <span>
#include <stdexcept>
#include <utility>
#include <vector>

#include "fdrbench/dataset.hpp"
#include "fdrbench/distributions.hpp"
#include "fdrbench/errors.hpp"

namespace fdrbench {

SubsampleResampler::SubsampleResampler() : SubsampleResampler(Params{}) {}

SubsampleResampler::SubsampleResampler(Params params) : _params(params) {
  if (!_params.size.has_value() && !(_params.fraction > 0.0 && _params.fraction <= 1.0)) {
    throw std::invalid_argument(
        fmt::format("fraction should be in (0, 1], found {}", _params.fraction));
  }
  if (_params.size.has_value() && *_params.size == 0) {
    throw std::invalid_argument("sample size should be greater than 0");
  }
  if (_params.max_attempts == 0) {
    throw std::invalid_argument("max_attempts should be greater than 0");
  }
}

auto SubsampleResampler::params() const noexcept -> const Params& { return _params; }

std::size_t SubsampleResampler::sample_size(std::size_t num_rows) const {
  if (_params.size.has_value()) {
    return *_params.size;
  }
  const auto size =
      static_cast<std::size_t>(std::round(_params.fraction * static_cast<double>(num_rows)));
  return std::max(std::size_t{1}, size);
}

void SubsampleResampler::validate(const Dataset& data) const {
  const auto size = sample_size(data.size());
  if (size > data.size()) {
    throw std::invalid_argument(fmt::format(
        "cannot draw {} rows without replacement from a dataset with {} rows", size,
        data.size()));
  }

  if (!data.has_truth()) {
    if (_params.min_null != 0 || _params.min_non_null != 0) {
      SPDLOG_WARN("dataset has no ground truth: ignoring subsample balance constraints");
    }
    return;
  }

  if (_params.min_null + _params.min_non_null > size) {
    throw std::invalid_argument(
        fmt::format("subsamples of {} rows cannot contain at least {} null and {} non-null tests",
                    size, _params.min_null, _params.min_non_null));
  }
  if (data.num_null() < _params.min_null) {
    throw std::invalid_argument(fmt::format("dataset has only {} null tests (min_null={})",
                                            data.num_null(), _params.min_null));
  }
  if (data.num_non_null() < _params.min_non_null) {
    throw std::invalid_argument(fmt::format("dataset has only {} non-null tests (min_non_null={})",
                                            data.num_non_null(), _params.min_non_null));
  }
}

Dataset SubsampleResampler::operator()(const Dataset& data, RandomEngine& eng) const {
  const auto size = sample_size(data.size());
  if (size > data.size()) {
    throw ResamplingError(fmt::format(
        "cannot draw {} rows without replacement from a dataset with {} rows", size,
        data.size()));
  }

  for (std::size_t attempt = 0; attempt < _params.max_attempts; ++attempt) {
    const auto rows = draw_rows(data.size(), size, eng);
    if (is_balanced(data, rows)) {
      return data.subset(rows);
    }
    SPDLOG_DEBUG("subsample #{} does not satisfy the balance constraints: retrying...",
                 attempt + 1);
  }

  throw ResamplingError(fmt::format(
      "unable to draw a subsample with at least {} null and {} non-null tests after {} attempts",
      _params.min_null, _params.min_non_null, _params.max_attempts));
}

std::vector<std::size_t> SubsampleResampler::draw_rows(std::size_t num_rows, std::size_t size,
                                                       RandomEngine& eng) const {
  // partial Fisher-Yates shuffle
  std::vector<std::size_t> rows(num_rows);
  std::iota(rows.begin(), rows.end(), 0);
  for (std::size_t i = 0; i < size; ++i) {
    const auto j = boost::random::uniform_int_distribution<std::size_t>{i, num_rows - 1}(eng);
    std::swap(rows[i], rows[j]);
  }
  rows.resize(size);
  std::ranges::sort(rows);
  return rows;
}

bool SubsampleResampler::is_balanced(const Dataset& data,
                                     std::span<const std::size_t> rows) const {
  if (!data.has_truth()) {
    return true;
  }

  const auto& truth = data.truth();
  const auto num_non_null =
      static_cast<std::size_t>(std::ranges::count_if(rows, [&](const auto i) { return truth[i]; }));
  const auto num_null = rows.size() - num_non_null;
  return num_null >= _params.min_null && num_non_null >= _params.min_non_null;
}

}  // namespace fdrbench
