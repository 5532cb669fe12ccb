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
#include <cstdint>
#include <optional>
#include <span>
#include <string>
#include <vector>

#include "fdrbench/dataset.hpp"
#include "fdrbench/distributions.hpp"

namespace fdrbench {

struct SimulationParams {
  std::size_t m{};
  Pi0Curve pi0{};
  EffectSizeDistribution effect_size{};
  TestStatisticPerturber test_statistic{};
  NullDistribution null_distribution{};
  CovariateSampler covariate{covariates::uniform()};
  // when set, exactly this many hypotheses are non-null
  std::optional<std::size_t> num_non_null{};
  std::uint64_t seed{};
};

// One synthetic draw in its two variants.
// Both datasets share test statistics, p-values and truth labels: only the covariate differs.
struct SimulatedReplicate {
  std::size_t replicate{};
  Dataset informative{};
  Dataset uninformative{};
  // number of pi0 values that had to be clamped to [0, 1]
  std::size_t num_clamped{};
};

// Engine seeded deterministically from (seed, replicate)
[[nodiscard]] RandomEngine make_replicate_engine(std::uint64_t seed, std::size_t replicate);

class SimulationGenerator {
  SimulationParams _params{};

 public:
  // Throws InvalidSimulationConfigError when params are not valid
  explicit SimulationGenerator(SimulationParams params);

  [[nodiscard]] const SimulationParams& params() const noexcept;
  [[nodiscard]] std::size_t size() const noexcept;

  [[nodiscard]] SimulatedReplicate generate(std::size_t replicate) const;
  [[nodiscard]] SimulatedReplicate generate(std::size_t replicate, RandomEngine& eng) const;

  // Human-readable description of the generator settings (stable across runs)
  [[nodiscard]] std::string describe() const;

 private:
  void validate() const;
  [[nodiscard]] std::vector<bool> draw_truth(std::span<const double> pi0,
                                             RandomEngine& eng) const;
};

}  // namespace fdrbench
