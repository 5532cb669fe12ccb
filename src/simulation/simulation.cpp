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

#include "fdrbench/simulation.hpp"

#include <fmt/format.h>
#include <fmt/ranges.h>
#include <spdlog/spdlog.h>

#include <algorithm>
#include <boost/random/seed_seq.hpp>
#include <boost/random/uniform_01.hpp>
#include <cmath>
#include <cstddef>
#include <cstdint>
#include <functional>
#include <numeric>
#include <span>
#include <string>
#include <utility>
#include <vector>

#include "fdrbench/dataset.hpp"
#include "fdrbench/distributions.hpp"
#include "fdrbench/errors.hpp"

namespace fdrbench {

RandomEngine make_replicate_engine(std::uint64_t seed, std::size_t replicate) {
  const auto rep = static_cast<std::uint64_t>(replicate);
  // clang-format off
  boost::random::seed_seq seq{
      static_cast<std::uint32_t>(seed),
      static_cast<std::uint32_t>(seed >> 32U),
      static_cast<std::uint32_t>(rep),
      static_cast<std::uint32_t>(rep >> 32U)
  };
  // clang-format on
  return RandomEngine{seq};
}

SimulationGenerator::SimulationGenerator(SimulationParams params) : _params(std::move(params)) {
  validate();
}

auto SimulationGenerator::params() const noexcept -> const SimulationParams& { return _params; }

std::size_t SimulationGenerator::size() const noexcept { return _params.m; }

SimulatedReplicate SimulationGenerator::generate(std::size_t replicate) const {
  auto eng = make_replicate_engine(_params.seed, replicate);
  return generate(replicate, eng);
}

SimulatedReplicate SimulationGenerator::generate(std::size_t replicate, RandomEngine& eng) const {
  const auto m = _params.m;

  std::vector<double> covariate(m);
  std::ranges::generate(covariate, [&] { return _params.covariate(eng); });

  std::size_t num_clamped = 0;
  std::vector<double> pi0(m);
  std::ranges::transform(covariate, pi0.begin(), [&](const auto x) {
    const auto p = _params.pi0(x);
    if (std::isnan(p)) [[unlikely]] {
      throw InvalidSimulationConfigError(
          fmt::format("pi0 curve \"{}\" returned NaN for covariate {}", _params.pi0.name, x));
    }
    if (p < 0.0 || p > 1.0) [[unlikely]] {
      ++num_clamped;
      return std::clamp(p, 0.0, 1.0);
    }
    return p;
  });

  if (num_clamped != 0) {
    SPDLOG_WARN("[replicate #{}]: pi0 curve \"{}\" returned {}/{} values outside of [0, 1]: values "
                "have been clamped",
                replicate, _params.pi0.name, num_clamped, m);
  }

  auto truth = draw_truth(pi0, eng);

  std::vector<double> effect_size(m, 0.0);
  for (std::size_t i = 0; i < m; ++i) {
    if (truth[i]) {
      effect_size[i] = _params.effect_size(eng);
    }
  }

  std::vector<double> test_statistic(m);
  std::ranges::transform(effect_size, test_statistic.begin(),
                         [&](const auto effect) { return _params.test_statistic(effect, eng); });

  std::vector<double> p_value(m);
  std::ranges::transform(test_statistic, p_value.begin(),
                         [&](const auto stat) { return _params.null_distribution(stat); });

  // The uninformative covariate is always drawn from U(0, 1), regardless of the sampler used for
  // the informative one
  const auto uninformative_sampler = covariates::uniform();
  std::vector<double> uninformative_covariate(m);
  std::ranges::generate(uninformative_covariate, [&] { return uninformative_sampler(eng); });

  Dataset informative{std::move(p_value)};
  informative.set(Column::test_statistic, std::move(test_statistic))
      .set(Column::effect_size, std::move(effect_size))
      .set(Column::ind_covariate, std::move(covariate))
      .set_truth(std::move(truth));
  if (_params.test_statistic.standard_error.has_value()) {
    informative.set(Column::standard_error,
                    std::vector<double>(m, *_params.test_statistic.standard_error));
  }

  auto uninformative =
      informative.with_column(Column::ind_covariate, std::move(uninformative_covariate));

  SPDLOG_DEBUG("[replicate #{}]: simulated {} tests ({} non-null)", replicate, m,
               informative.num_non_null());

  return {replicate, std::move(informative), std::move(uninformative), num_clamped};
}

std::vector<bool> SimulationGenerator::draw_truth(std::span<const double> pi0,
                                                  RandomEngine& eng) const {
  std::vector<bool> truth(pi0.size(), false);
  boost::random::uniform_01<double> unif{};

  if (!_params.num_non_null.has_value()) {
    for (std::size_t i = 0; i < pi0.size(); ++i) {
      truth[i] = unif(eng) < 1.0 - pi0[i];
    }
    return truth;
  }

  // Weighted sampling without replacement (Efraimidis-Spirakis): hypotheses with the k largest
  // keys log(u) / w are non-null. Hypotheses with weight 0 rank below every hypothesis with a
  // positive weight and are only picked (uniformly at random) when k exceeds the number of
  // hypotheses with a positive weight.
  const auto k = *_params.num_non_null;
  std::vector<std::pair<bool, double>> keys(pi0.size());
  std::ranges::transform(pi0, keys.begin(), [&](const auto p) {
    const auto u = unif(eng);
    const auto w = 1.0 - p;
    return w > 0 ? std::make_pair(true, std::log(u) / w) : std::make_pair(false, u);
  });

  std::vector<std::size_t> idx(pi0.size());
  std::iota(idx.begin(), idx.end(), 0);
  std::ranges::stable_sort(idx, std::greater{}, [&](const auto i) { return keys[i]; });

  for (std::size_t i = 0; i < k; ++i) {
    truth[idx[i]] = true;
  }
  return truth;
}

std::string SimulationGenerator::describe() const {
  return fmt::format(
      "m={}; pi0={}; effect-size={}; test-statistic={}; null={}; covariate={}; num-non-null={}; "
      "seed={}",
      _params.m, _params.pi0.name, _params.effect_size.name, _params.test_statistic.name,
      _params.null_distribution.name, _params.covariate.name,
      _params.num_non_null.has_value() ? fmt::to_string(*_params.num_non_null) : "auto",
      _params.seed);
}

void SimulationGenerator::validate() const {
  std::vector<std::string> errors;
  if (_params.m == 0) {
    errors.emplace_back("the number of hypotheses should be greater than 0");
  }
  if (!_params.pi0.fn) {
    errors.emplace_back("pi0 curve is missing");
  }
  if (!_params.effect_size.sample) {
    errors.emplace_back("effect size distribution is missing");
  }
  if (!_params.test_statistic.perturb) {
    errors.emplace_back("test statistic perturber is missing");
  }
  if (!_params.null_distribution.pvalue) {
    errors.emplace_back("null distribution is missing");
  }
  if (!_params.covariate.sample) {
    errors.emplace_back("covariate sampler is missing");
  }
  if (_params.num_non_null.has_value() && *_params.num_non_null > _params.m) {
    errors.emplace_back(fmt::format(
        "the number of non-null hypotheses ({}) cannot be greater than the number of hypotheses "
        "({})",
        *_params.num_non_null, _params.m));
  }

  if (errors.size() == 1) {
    throw InvalidSimulationConfigError(errors.front());
  }
  if (!errors.empty()) {
    throw InvalidSimulationConfigError(fmt::format("\n - {}", fmt::join(errors, "\n - ")));
  }
}

}  // namespace fdrbench
