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

#include <algorithm>
#include <cstddef>
#include <iterator>
#include <numeric>
#include <stdexcept>
#include <utility>
#include <vector>

namespace fdrbench {

template <typename Stats>
inline BH_FDR<Stats>::BH_FDR(std::vector<Stats> pvalues_, double pi0_)
    : _pvalues(std::move(pvalues_)) {
  set_pi0(pi0_);
}

template <typename Stats>
inline void BH_FDR<Stats>::add_record(Stats&& s) {
  _pvalues.emplace_back(std::move(s));
}

template <typename Stats>
template <typename StatsIt>
inline void BH_FDR<Stats>::add_records(StatsIt first, StatsIt last) {
  _pvalues.insert(_pvalues.end(), first, last);
}

template <typename Stats>
template <typename StatsContainer>
inline void BH_FDR<Stats>::add_records(const StatsContainer& stats) {
  add_records(std::begin(stats), std::end(stats));
}

template <typename Stats>
inline void BH_FDR<Stats>::clear() noexcept {
  _pvalues.clear();
  _idx.clear();
  _ranks.clear();
}

template <typename Stats>
inline std::size_t BH_FDR<Stats>::size() const noexcept {
  return _pvalues.size();
}

template <typename Stats>
inline double BH_FDR<Stats>::pi0() const noexcept {
  return _pi0;
}

template <typename Stats>
inline void BH_FDR<Stats>::set_pi0(double pi0_) {
  if (!(pi0_ > 0.0 && pi0_ <= 1.0)) {
    throw std::invalid_argument(fmt::format("pi0 should be in (0, 1], found {}", pi0_));
  }
  _pi0 = pi0_;
}

template <typename Stats>
template <typename UnaryOperation>
inline auto BH_FDR<Stats>::correct(UnaryOperation op) -> std::vector<Stats> {
  if (_pvalues.empty()) {
    return {};
  }

  _idx.resize(_pvalues.size());
  std::iota(_idx.begin(), _idx.end(), 0);

  std::stable_sort(_idx.begin(), _idx.end(), [&](const auto i1, const auto i2) {
    return op(_pvalues[i1]) < op(_pvalues[i2]);
  });

  _ranks.resize(_pvalues.size());
  for (std::size_t i = 0; i < _ranks.size(); ++i) {
    _ranks[_idx[i]] = i;
  }

  std::vector<Stats> adj_pvalues(_pvalues.size());
  for (std::size_t i = 0; i < _ranks.size(); ++i) {
    const auto rank = _ranks[i] + 1;
    const auto pctile_rank =
        _pi0 * static_cast<double>(_pvalues.size()) / static_cast<double>(rank);
    adj_pvalues[i] = _pvalues[i];
    op(adj_pvalues[i]) = std::clamp(op(_pvalues[i]) * pctile_rank, 0.0, 1.0);
  }

  // step-up: adjusted p-values must be monotone in the original p-values
  for (std::size_t i = _ranks.size() - 1; i > 0; --i) {
    auto& pv0 = adj_pvalues[_idx[i - 1]];
    auto& pv1 = adj_pvalues[_idx[i]];

    if (op(pv1) < op(pv0)) {
      op(pv0) = op(pv1);
    }
  }
  return adj_pvalues;
}

}  // namespace fdrbench
