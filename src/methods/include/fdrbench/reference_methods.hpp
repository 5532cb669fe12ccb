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

#include <span>
#include <vector>

#include "fdrbench/method_spec.hpp"
#include "fdrbench/registry.hpp"

// Built-in correction methods.
// All methods return q-values aligned with the input rows. NaN p-values are ignored when
// computing the number of tests and are mapped to NaN q-values.
namespace fdrbench::methods {

struct StoreyResult {
  std::vector<double> qvalues{};
  double pi0{1.0};
};

[[nodiscard]] std::vector<double> unadjusted(const MethodArgs& args);
[[nodiscard]] std::vector<double> bonferroni(const MethodArgs& args);
[[nodiscard]] std::vector<double> holm(const MethodArgs& args);
[[nodiscard]] std::vector<double> benjamini_hochberg(const MethodArgs& args);

// Parameters:
// - lambda: p-value threshold used to estimate pi0 (default: 0.5)
[[nodiscard]] StoreyResult storey_bh(const MethodArgs& args);
[[nodiscard]] double estimate_pi0(std::span<const double> pvalues, double lambda);

// BH applied independently within equal-frequency strata of the independent covariate.
// Parameters:
// - nbins: number of strata (default: 5)
// - min_bin_size: minimum number of tests per stratum (default: 10)
// Throws UnsupportedInputError when the covariate has zero variance or a stratum is too small.
[[nodiscard]] std::vector<double> stratified_bh(const MethodArgs& args);

// Registry with all the methods above, in the following order:
// unadjusted, bonferroni, holm, bh, storey-bh, stratified-bh
[[nodiscard]] Registry make_reference_registry();

}  // namespace fdrbench::methods
