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

#include <atomic>
#include <cstddef>
#include <cstdint>
#include <functional>
#include <glaze/glaze.hpp>
#include <string>
#include <vector>

#include "fdrbench/bench_executor.hpp"
#include "fdrbench/bench_result.hpp"
#include "fdrbench/dataset.hpp"
#include "fdrbench/distributions.hpp"
#include "fdrbench/resampling.hpp"
#include "fdrbench/simulation.hpp"

namespace fdrbench {

// Produces the dataset of one replicate. The engine is seeded from (seed, replicate).
using DatasetFactory = std::function<Dataset(std::size_t, RandomEngine&)>;

// Ensembles produced from the same simulated draws: element i of both ensembles shares test
// statistics, p-values and truth labels.
struct PairedEnsemble {
  Ensemble informative{};
  Ensemble uninformative{};

  struct glaze {
    using T = PairedEnsemble;
    static constexpr auto value = glz::object(&T::informative, &T::uninformative);
  };
};

// Run independent replicates in parallel, each producing one BenchResult.
// Ensembles are always returned in replicate order, regardless of the number of threads.
// Replicates whose dataset cannot be produced are kept with all method columns missing, while
// configuration errors (std::invalid_argument and derived classes) are propagated to the caller.
// When early_return is set, replicates that have not started yet are skipped.
class ReplicationDriver {
 public:
  struct Params {
    std::size_t replicates{1};
    std::uint64_t seed{};
    std::size_t threads{1};
  };

 private:
  BenchExecutor _executor;
  Params _params{};

 public:
  ReplicationDriver(BenchExecutor executor, Params params);

  [[nodiscard]] const BenchExecutor& executor() const noexcept;
  [[nodiscard]] const Params& params() const noexcept;

  [[nodiscard]] Ensemble run(const DatasetFactory& make_dataset,
                             const std::atomic<bool>* early_return = nullptr) const;
  [[nodiscard]] PairedEnsemble run_simulation(
      const SimulationGenerator& generator, const std::atomic<bool>* early_return = nullptr) const;
  [[nodiscard]] Ensemble run_resampling(const Dataset& data, const SubsampleResampler& resampler,
                                        const std::atomic<bool>* early_return = nullptr) const;

 private:
  [[nodiscard]] BenchResult run_replicate(const DatasetFactory& make_dataset,
                                          std::size_t replicate, std::size_t num_tests) const;
};

struct MethodFailureSummary {
  std::string method{};
  std::size_t num_failed{};
  std::size_t num_replicates{};
  double failure_rate{};

  struct glaze {
    using T = MethodFailureSummary;
    static constexpr auto value =
        glz::object(&T::method, &T::num_failed, &T::num_replicates, &T::failure_rate);
  };
};

// Number and fraction of replicates in which each method failed.
// Methods are listed in order of first appearance.
[[nodiscard]] std::vector<MethodFailureSummary> summarize_failures(const Ensemble& ensemble);

}  // namespace fdrbench
