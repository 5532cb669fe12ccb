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

#include "fdrbench/reference_methods.hpp"

#include <fmt/format.h>
#include <spdlog/spdlog.h>

#include <algorithm>
#include <cmath>
#include <cstddef>
#include <cstdint>
#include <limits>
#include <span>
#include <stdexcept>
#include <utility>
#include <vector>

#include "fdrbench/dataset.hpp"
#include "fdrbench/errors.hpp"
#include "fdrbench/fdr.hpp"
#include "fdrbench/method_spec.hpp"
#include "fdrbench/registry.hpp"

namespace fdrbench::methods {

namespace {

struct PValue {
  std::size_t i{};
  double pvalue{};
};

[[nodiscard]] std::vector<PValue> collect_pvalues(std::span<const double> pvalues) {
  std::vector<PValue> records;
  records.reserve(pvalues.size());
  for (std::size_t i = 0; i < pvalues.size(); ++i) {
    if (!std::isnan(pvalues[i])) [[likely]] {
      records.emplace_back(i, pvalues[i]);
    }
  }
  return records;
}

[[nodiscard]] std::vector<double> scatter(std::span<const PValue> records, std::size_t size) {
  std::vector<double> qvalues(size, std::numeric_limits<double>::quiet_NaN());
  for (const auto& [i, pvalue] : records) {
    qvalues[i] = pvalue;
  }
  return qvalues;
}

[[nodiscard]] std::vector<PValue> correct_bh(std::vector<PValue> records, double pi0 = 1.0) {
  BH_FDR<PValue> bh{std::move(records), pi0};
  return bh.correct([](auto& r) -> double& { return r.pvalue; });
}

}  // namespace

std::vector<double> unadjusted(const MethodArgs& args) {
  const auto pvalues = args.p_value();
  return {pvalues.begin(), pvalues.end()};
}

std::vector<double> bonferroni(const MethodArgs& args) {
  auto records = collect_pvalues(args.p_value());
  const auto num_tests = static_cast<double>(records.size());
  for (auto& r : records) {
    r.pvalue = std::min(1.0, r.pvalue * num_tests);
  }
  return scatter(records, args.size());
}

std::vector<double> holm(const MethodArgs& args) {
  auto records = collect_pvalues(args.p_value());
  std::ranges::stable_sort(records, {}, &PValue::pvalue);

  // step-down: adjusted p-values must be non-decreasing in the sorted order
  const auto num_tests = records.size();
  double running_max = 0.0;
  for (std::size_t k = 0; k < num_tests; ++k) {
    auto& r = records[k];
    running_max =
        std::max(running_max, std::min(1.0, static_cast<double>(num_tests - k) * r.pvalue));
    r.pvalue = running_max;
  }
  return scatter(records, args.size());
}

std::vector<double> benjamini_hochberg(const MethodArgs& args) {
  return scatter(correct_bh(collect_pvalues(args.p_value())), args.size());
}

double estimate_pi0(std::span<const double> pvalues, double lambda) {
  if (!(lambda >= 0.0 && lambda < 1.0)) {
    throw std::invalid_argument(fmt::format("lambda should be in [0, 1), found {}", lambda));
  }

  std::size_t num_tests = 0;
  std::size_t num_above = 0;
  for (const auto pv : pvalues) {
    if (std::isnan(pv)) {
      continue;
    }
    ++num_tests;
    num_above += pv > lambda;
  }

  if (num_tests == 0) {
    return 1.0;
  }

  const auto pi0 =
      static_cast<double>(num_above) / ((1.0 - lambda) * static_cast<double>(num_tests));
  return std::min(1.0, pi0);
}

StoreyResult storey_bh(const MethodArgs& args) {
  const auto lambda = args.param_or("lambda", 0.5);
  const auto pi0 = estimate_pi0(args.p_value(), lambda);
  if (pi0 <= 0.0) {
    throw UnsupportedInputError(
        fmt::format("estimated pi0 is 0: no p-values are above lambda={}", lambda));
  }
  SPDLOG_DEBUG("storey-bh: estimated pi0={:.4f} (lambda={})", pi0, lambda);

  return {scatter(correct_bh(collect_pvalues(args.p_value()), pi0), args.size()), pi0};
}

std::vector<double> stratified_bh(const MethodArgs& args) {
  const auto nbins = args.param_or<std::size_t>("nbins", 5);
  const auto min_bin_size = args.param_or<std::size_t>("min_bin_size", 10);
  if (nbins == 0) {
    throw std::invalid_argument("nbins should be a positive number");
  }

  const auto pvalues = args.p_value();
  const auto covariate = args[Column::ind_covariate];

  std::vector<std::size_t> rows;
  rows.reserve(pvalues.size());
  for (std::size_t i = 0; i < pvalues.size(); ++i) {
    if (!std::isnan(pvalues[i]) && !std::isnan(covariate[i])) {
      rows.push_back(i);
    }
  }

  if (rows.empty()) {
    return scatter({}, args.size());
  }

  const auto [min_it, max_it] =
      std::ranges::minmax_element(rows, {}, [&](const auto i) { return covariate[i]; });
  if (covariate[*min_it] == covariate[*max_it]) {
    throw UnsupportedInputError("covariate has zero variance");
  }

  std::ranges::stable_sort(rows, {}, [&](const auto i) { return covariate[i]; });

  // equal-frequency strata: the first (size % nbins) strata receive one extra test
  const auto base_size = rows.size() / nbins;
  const auto remainder = rows.size() % nbins;

  std::vector<PValue> corrected;
  corrected.reserve(rows.size());

  BH_FDR<PValue> bh{};
  auto first = rows.begin();
  for (std::size_t bin = 0; bin < nbins; ++bin) {
    const auto bin_size = base_size + static_cast<std::size_t>(bin < remainder);
    if (bin_size < min_bin_size) {
      throw UnsupportedInputError(
          fmt::format("stratum #{} has only {} tests (min_bin_size={})", bin, bin_size,
                      min_bin_size));
    }

    bh.clear();
    const auto last = first + static_cast<std::ptrdiff_t>(bin_size);
    for (auto it = first; it != last; ++it) {
      bh.add_record({*it, pvalues[*it]});
    }
    for (const auto& record : bh.correct([](auto& r) -> double& { return r.pvalue; })) {
      corrected.push_back(record);
    }
    first = last;
  }

  return scatter(corrected, args.size());
}

Registry make_reference_registry() {
  Registry reg{};
  reg.add("unadjusted", {}, unadjusted);
  reg.add("bonferroni", {}, bonferroni);
  reg.add("holm", {}, holm);
  reg.add("bh", {}, benjamini_hochberg);
  reg.add("storey-bh", {}, storey_bh, {{"lambda", 0.5}}, &StoreyResult::qvalues);
  reg.add("stratified-bh", {Column::ind_covariate}, stratified_bh,
          {{"nbins", std::int64_t{5}}, {"min_bin_size", std::int64_t{10}}});
  return reg;
}

}  // namespace fdrbench::methods
