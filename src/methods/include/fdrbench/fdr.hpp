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
#include <vector>

#include "fdrbench/common.hpp"

namespace fdrbench {

// Benjamini-Hochberg step-up procedure.
// Stats can be any type: the UnaryOperation passed to correct() must return a reference to the
// p-value stored in a Stats object.
// When pi0 < 1, adjusted p-values are scaled by the estimated proportion of true null hypotheses
// (Storey's adaptive procedure).
template <typename Stats>
class BH_FDR {
  std::vector<Stats> _pvalues{};
  std::vector<std::size_t> _idx{};
  std::vector<std::size_t> _ranks{};
  double _pi0{1.0};

 public:
  BH_FDR() = default;
  explicit BH_FDR(std::vector<Stats> pvalues_, double pi0_ = 1.0);

  void add_record(Stats&& s);
  template <typename StatsIt>
  void add_records(StatsIt first, StatsIt last);
  template <typename StatsContainer>
  void add_records(const StatsContainer& stats);
  void clear() noexcept;

  [[nodiscard]] std::size_t size() const noexcept;
  [[nodiscard]] double pi0() const noexcept;
  void set_pi0(double pi0_);

  template <typename UnaryOperation = identity>
  [[nodiscard]] auto correct(UnaryOperation op = identity()) -> std::vector<Stats>;
};

}  // namespace fdrbench

#include "../../fdr_impl.hpp"
