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

#include "fdrbench/distributions.hpp"

#include <fmt/format.h>

#include <algorithm>
#include <boost/math/distributions/chi_squared.hpp>
#include <boost/math/distributions/normal.hpp>
#include <boost/math/distributions/students_t.hpp>
#include <boost/random/chi_squared_distribution.hpp>
#include <boost/random/discrete_distribution.hpp>
#include <boost/random/normal_distribution.hpp>
#include <boost/random/student_t_distribution.hpp>
#include <boost/random/uniform_real_distribution.hpp>
#include <cmath>
#include <cstddef>
#include <limits>
#include <numbers>
#include <optional>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

#include "fdrbench/errors.hpp"

namespace fdrbench {

namespace {

void check_positive(std::string_view component, std::string_view param, double value) {
  if (!(value > 0) || !std::isfinite(value)) {
    throw InvalidSimulationConfigError(
        fmt::format("{}: {} should be a positive number, found {}", component, param, value));
  }
}

void check_finite(std::string_view component, std::string_view param, double value) {
  if (!std::isfinite(value)) {
    throw InvalidSimulationConfigError(
        fmt::format("{}: {} should be a finite number, found {}", component, param, value));
  }
}

void check_interval(std::string_view component, double low, double high) {
  check_finite(component, "low", low);
  check_finite(component, "high", high);
  if (low >= high) {
    throw InvalidSimulationConfigError(
        fmt::format("{}: low should be smaller than high, found [{}, {})", component, low, high));
  }
}

struct MixtureComponent {
  double weight{};
  double mean{};
  double sd{};
};

[[nodiscard]] EffectSizeDistribution make_mixture(std::string name,
                                                  std::vector<MixtureComponent> components) {
  std::vector<double> weights(components.size());
  std::ranges::transform(components, weights.begin(), &MixtureComponent::weight);

  return {std::move(name), [components = std::move(components),
                            weights = std::move(weights)](RandomEngine& eng) {
            boost::random::discrete_distribution<std::size_t> pick(weights.begin(),
                                                                   weights.end());
            const auto& c = components[pick(eng)];
            return boost::random::normal_distribution<double>{c.mean, c.sd}(eng);
          }};
}

[[nodiscard]] double periodic_pi0(double center, double amplitude, double periods, double x,
                                  bool use_cosine) {
  const auto angle = 2.0 * std::numbers::pi * periods * x;
  return center + amplitude * (use_cosine ? std::cos(angle) : std::sin(angle));
}

}  // namespace

namespace pi0_curves {

Pi0Curve constant(double pi0) {
  check_finite("pi0 curve \"constant\"", "pi0", pi0);
  return {fmt::format("constant(pi0={})", pi0), [pi0](double) { return pi0; }};
}

Pi0Curve step(double low, double high, double breakpoint) {
  check_finite("pi0 curve \"step\"", "low", low);
  check_finite("pi0 curve \"step\"", "high", high);
  check_finite("pi0 curve \"step\"", "breakpoint", breakpoint);
  return {fmt::format("step(low={}, high={}, breakpoint={})", low, high, breakpoint),
          [=](double x) { return x < breakpoint ? low : high; }};
}

Pi0Curve sine(double center, double amplitude, double periods) {
  check_finite("pi0 curve \"sine\"", "center", center);
  check_finite("pi0 curve \"sine\"", "amplitude", amplitude);
  check_positive("pi0 curve \"sine\"", "periods", periods);
  return {fmt::format("sine(center={}, amplitude={}, periods={})", center, amplitude, periods),
          [=](double x) { return periodic_pi0(center, amplitude, periods, x, false); }};
}

Pi0Curve cosine(double center, double amplitude, double periods) {
  check_finite("pi0 curve \"cosine\"", "center", center);
  check_finite("pi0 curve \"cosine\"", "amplitude", amplitude);
  check_positive("pi0 curve \"cosine\"", "periods", periods);
  return {fmt::format("cosine(center={}, amplitude={}, periods={})", center, amplitude, periods),
          [=](double x) { return periodic_pi0(center, amplitude, periods, x, true); }};
}

Pi0Curve cubic(double low, double high) {
  check_finite("pi0 curve \"cubic\"", "low", low);
  check_finite("pi0 curve \"cubic\"", "high", high);
  return {fmt::format("cubic(low={}, high={})", low, high),
          [=](double x) { return low + (high - low) * x * x * x; }};
}

}  // namespace pi0_curves

namespace effect_sizes {

EffectSizeDistribution constant(double value) {
  check_finite("effect size \"constant\"", "value", value);
  return {fmt::format("constant(value={})", value), [value](RandomEngine&) { return value; }};
}

EffectSizeDistribution normal(double mean, double sd) {
  check_finite("effect size \"normal\"", "mean", mean);
  check_positive("effect size \"normal\"", "sd", sd);
  return {fmt::format("normal(mean={}, sd={})", mean, sd), [=](RandomEngine& eng) {
            return boost::random::normal_distribution<double>{mean, sd}(eng);
          }};
}

EffectSizeDistribution uniform(double low, double high) {
  check_interval("effect size \"uniform\"", low, high);
  return {fmt::format("uniform(low={}, high={})", low, high), [=](RandomEngine& eng) {
            return boost::random::uniform_real_distribution<double>{low, high}(eng);
          }};
}

EffectSizeDistribution bimodal(double mean, double sd) {
  check_finite("effect size \"bimodal\"", "mean", mean);
  check_positive("effect size \"bimodal\"", "sd", sd);
  return make_mixture(fmt::format("bimodal(mean={}, sd={})", mean, sd),
                      {{0.5, -mean, sd}, {0.5, mean, sd}});
}

// NOLINTBEGIN(*-avoid-magic-numbers, readability-magic-numbers)
EffectSizeDistribution spiky() {
  return make_mixture("spiky",
                      {{0.4, 0.0, 0.25}, {0.2, 0.0, 0.5}, {0.2, 0.0, 1.0}, {0.2, 0.0, 2.0}});
}

EffectSizeDistribution near_normal() {
  return make_mixture("near-normal", {{2.0 / 3, 0.0, 1.0}, {1.0 / 3, 0.0, 2.0}});
}

EffectSizeDistribution flat_top() {
  std::vector<MixtureComponent> components{};
  for (const auto mean : {-1.5, -1.0, -0.5, 0.0, 0.5, 1.0, 1.5}) {
    components.emplace_back(1.0 / 7, mean, 0.5);
  }
  return make_mixture("flat-top", std::move(components));
}

EffectSizeDistribution skew() {
  return make_mixture("skew", {{0.25, -2.0, 2.0}, {0.25, -1.0, 1.5}, {1.0 / 3, 0.0, 1.0},
                               {1.0 / 6, 1.0, 1.0}});
}

EffectSizeDistribution big_normal() { return make_mixture("big-normal", {{1.0, 0.0, 4.0}}); }

EffectSizeDistribution bimodal_ash() {
  return make_mixture("bimodal-ash", {{0.5, -2.0, 1.0}, {0.5, 2.0, 1.0}});
}
// NOLINTEND(*-avoid-magic-numbers, readability-magic-numbers)

EffectSizeDistribution ash_shape(std::string_view name) {
  if (name == "spiky") {
    return spiky();
  }
  if (name == "near-normal") {
    return near_normal();
  }
  if (name == "flat-top") {
    return flat_top();
  }
  if (name == "skew") {
    return skew();
  }
  if (name == "big-normal") {
    return big_normal();
  }
  if (name == "bimodal-ash") {
    return bimodal_ash();
  }
  throw InvalidSimulationConfigError(fmt::format("unknown ash shape \"{}\"", name));
}

}  // namespace effect_sizes

namespace perturbers {

TestStatisticPerturber gaussian(double sd) {
  check_positive("perturber \"gaussian\"", "sd", sd);
  return {fmt::format("gaussian(sd={})", sd),
          [sd](double effect, RandomEngine& eng) {
            return effect + boost::random::normal_distribution<double>{0.0, sd}(eng);
          },
          sd};
}

TestStatisticPerturber student_t(double df) {
  check_positive("perturber \"student-t\"", "df", df);
  return {fmt::format("student-t(df={})", df),
          [df](double effect, RandomEngine& eng) {
            return effect + boost::random::student_t_distribution<double>{df}(eng);
          },
          std::nullopt};
}

TestStatisticPerturber chi_squared(double df) {
  check_positive("perturber \"chi-squared\"", "df", df);
  if (df < 1) {
    throw InvalidSimulationConfigError(
        fmt::format("perturber \"chi-squared\": df should be at least 1, found {}", df));
  }
  // (Z + effect)^2 + chi2(df - 1) follows a non-central chi-squared with df degrees of freedom
  // and non-centrality effect^2
  return {fmt::format("chi-squared(df={})", df),
          [df](double effect, RandomEngine& eng) {
            const auto z = boost::random::normal_distribution<double>{}(eng) + effect;
            auto stat = z * z;
            if (df > 1) {
              stat += boost::random::chi_squared_distribution<double>{df - 1}(eng);
            }
            return stat;
          },
          std::nullopt};
}

}  // namespace perturbers

namespace null_distributions {

NullDistribution two_sided_normal(double sd) {
  check_positive("null distribution \"normal\"", "sd", sd);
  return {fmt::format("two-sided-normal(sd={})", sd),
          [dist = boost::math::normal(0.0, sd)](double stat) {
            if (std::isnan(stat)) [[unlikely]] {
              return std::numeric_limits<double>::quiet_NaN();
            }
            if (std::isinf(stat)) [[unlikely]] {
              return 0.0;
            }
            return std::min(
                1.0, 2.0 * boost::math::cdf(boost::math::complement(dist, std::abs(stat))));
          }};
}

NullDistribution two_sided_t(double df) {
  check_positive("null distribution \"student-t\"", "df", df);
  return {fmt::format("two-sided-t(df={})", df),
          [dist = boost::math::students_t(df)](double stat) {
            if (std::isnan(stat)) [[unlikely]] {
              return std::numeric_limits<double>::quiet_NaN();
            }
            if (std::isinf(stat)) [[unlikely]] {
              return 0.0;
            }
            return std::min(
                1.0, 2.0 * boost::math::cdf(boost::math::complement(dist, std::abs(stat))));
          }};
}

NullDistribution chi_squared_upper(double df) {
  check_positive("null distribution \"chi-squared\"", "df", df);
  return {fmt::format("chi-squared-upper(df={})", df),
          [dist = boost::math::chi_squared(df)](double stat) {
            if (std::isnan(stat)) [[unlikely]] {
              return std::numeric_limits<double>::quiet_NaN();
            }
            if (std::isinf(stat)) [[unlikely]] {
              return 0.0;
            }
            return boost::math::cdf(boost::math::complement(dist, std::max(0.0, stat)));
          }};
}

}  // namespace null_distributions

namespace covariates {

CovariateSampler uniform(double low, double high) {
  check_interval("covariate \"uniform\"", low, high);
  return {fmt::format("uniform(low={}, high={})", low, high), [=](RandomEngine& eng) {
            return boost::random::uniform_real_distribution<double>{low, high}(eng);
          }};
}

CovariateSampler normal(double mean, double sd) {
  check_finite("covariate \"normal\"", "mean", mean);
  check_positive("covariate \"normal\"", "sd", sd);
  return {fmt::format("normal(mean={}, sd={})", mean, sd), [=](RandomEngine& eng) {
            return boost::random::normal_distribution<double>{mean, sd}(eng);
          }};
}

}  // namespace covariates

}  // namespace fdrbench
