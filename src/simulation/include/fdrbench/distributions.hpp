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

#include <boost/random/mersenne_twister.hpp>
#include <functional>
#include <optional>
#include <string>
#include <string_view>

namespace fdrbench {

using RandomEngine = boost::random::mt19937_64;

// Pluggable components of a simulation.
// Every sampling function receives the random engine explicitly: components hold no random state
// and can be shared by replicates running on different threads.

// Maps a covariate value onto the probability that the hypothesis is null
struct Pi0Curve {
  std::string name{};
  std::function<double(double)> fn{};

  [[nodiscard]] double operator()(double covariate) const { return fn(covariate); }
};

// Samples the true effect size of a non-null hypothesis
struct EffectSizeDistribution {
  std::string name{};
  std::function<double(RandomEngine&)> sample{};

  [[nodiscard]] double operator()(RandomEngine& eng) const { return sample(eng); }
};

// Maps a true effect (0 for null hypotheses) onto an observed test statistic
struct TestStatisticPerturber {
  std::string name{};
  std::function<double(double, RandomEngine&)> perturb{};
  // constant standard error of the observed statistic, when meaningful
  std::optional<double> standard_error{};

  [[nodiscard]] double operator()(double effect, RandomEngine& eng) const {
    return perturb(effect, eng);
  }
};

// Maps a test statistic onto a p-value under the reference null distribution
struct NullDistribution {
  std::string name{};
  std::function<double(double)> pvalue{};

  [[nodiscard]] double operator()(double stat) const { return pvalue(stat); }
};

struct CovariateSampler {
  std::string name{};
  std::function<double(RandomEngine&)> sample{};

  [[nodiscard]] double operator()(RandomEngine& eng) const { return sample(eng); }
};

namespace pi0_curves {
[[nodiscard]] Pi0Curve constant(double pi0);
// low for covariates below breakpoint, high otherwise
[[nodiscard]] Pi0Curve step(double low, double high, double breakpoint = 0.5);
[[nodiscard]] Pi0Curve sine(double center, double amplitude, double periods = 1.0);
[[nodiscard]] Pi0Curve cosine(double center, double amplitude, double periods = 1.0);
// low + (high - low) * x^3
[[nodiscard]] Pi0Curve cubic(double low, double high);
}  // namespace pi0_curves

namespace effect_sizes {
[[nodiscard]] EffectSizeDistribution constant(double value);
[[nodiscard]] EffectSizeDistribution normal(double mean, double sd);
[[nodiscard]] EffectSizeDistribution uniform(double low, double high);
// equal-weight mixture of N(-mean, sd) and N(mean, sd)
[[nodiscard]] EffectSizeDistribution bimodal(double mean, double sd = 1.0);

// Unimodal shapes from the adaptive shrinkage (ash) benchmark
[[nodiscard]] EffectSizeDistribution spiky();
[[nodiscard]] EffectSizeDistribution near_normal();
[[nodiscard]] EffectSizeDistribution flat_top();
[[nodiscard]] EffectSizeDistribution skew();
[[nodiscard]] EffectSizeDistribution big_normal();
[[nodiscard]] EffectSizeDistribution bimodal_ash();

// Lookup by name (e.g. "near-normal"). Throws InvalidSimulationConfigError for unknown names.
[[nodiscard]] EffectSizeDistribution ash_shape(std::string_view name);
}  // namespace effect_sizes

namespace perturbers {
// effect + N(0, sd^2)
[[nodiscard]] TestStatisticPerturber gaussian(double sd = 1.0);
// effect + t(df)
[[nodiscard]] TestStatisticPerturber student_t(double df);
// non-central chi-squared with df degrees of freedom and non-centrality effect^2
[[nodiscard]] TestStatisticPerturber chi_squared(double df);
}  // namespace perturbers

namespace null_distributions {
[[nodiscard]] NullDistribution two_sided_normal(double sd = 1.0);
[[nodiscard]] NullDistribution two_sided_t(double df);
[[nodiscard]] NullDistribution chi_squared_upper(double df);
}  // namespace null_distributions

namespace covariates {
[[nodiscard]] CovariateSampler uniform(double low = 0.0, double high = 1.0);
[[nodiscard]] CovariateSampler normal(double mean, double sd);
}  // namespace covariates

}  // namespace fdrbench
