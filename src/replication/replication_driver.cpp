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

#include "fdrbench/replication_driver.hpp"

// clang-format off
#include "fdrbench/suppress_warnings.hpp"
FDRBENCH_DISABLE_WARNING_PUSH
FDRBENCH_DISABLE_WARNING_DEPRECATED_DECLARATIONS
#include <parallel_hashmap/phmap.h>
FDRBENCH_DISABLE_WARNING_POP
// clang-format on

#include <fmt/chrono.h>
#include <fmt/format.h>
#include <spdlog/spdlog.h>

#include <BS_thread_pool.hpp>
#include <algorithm>
#include <atomic>
#include <chrono>
#include <cstddef>
#include <exception>
#include <optional>
#include <stdexcept>
#include <string>
#include <utility>
#include <vector>

#include "fdrbench/bench_executor.hpp"
#include "fdrbench/bench_result.hpp"
#include "fdrbench/dataset.hpp"
#include "fdrbench/distributions.hpp"
#include "fdrbench/resampling.hpp"
#include "fdrbench/simulation.hpp"

namespace fdrbench {

namespace {

[[nodiscard]] bool should_return_early(const std::atomic<bool>* early_return) noexcept {
  return early_return && early_return->load();
}

// Run task(i) for i in [0, num_tasks) and collect the results in index order.
// Tasks skipped because of early_return are absent from the output.
template <typename Result, typename Task>
[[nodiscard]] std::vector<Result> map_replicates(std::size_t num_tasks, std::size_t threads,
                                                 const std::atomic<bool>* early_return,
                                                 const Task& task) {
  std::vector<std::optional<Result>> results{};
  results.reserve(num_tasks);

  if (threads < 2 || num_tasks < 2) {
    for (std::size_t i = 0; i < num_tasks && !should_return_early(early_return); ++i) {
      results.emplace_back(task(i));
    }
  } else {
    BS::light_thread_pool tpool(std::min(threads, num_tasks));
    BS::multi_future<std::optional<Result>> workers;
    workers.reserve(num_tasks);
    for (std::size_t i = 0; i < num_tasks; ++i) {
      workers.emplace_back(tpool.submit_task([&, i]() -> std::optional<Result> {
        if (should_return_early(early_return)) {
          return std::nullopt;
        }
        return task(i);
      }));
    }
    workers.wait();
    results = workers.get();
  }

  std::vector<Result> flat_results{};
  flat_results.reserve(results.size());
  for (auto& res : results) {
    if (res.has_value()) {
      flat_results.emplace_back(std::move(*res));
    }
  }

  if (flat_results.size() != num_tasks) {
    SPDLOG_WARN("early return signal received: only {}/{} replicates have been processed",
                flat_results.size(), num_tasks);
  }

  return flat_results;
}

}  // namespace

ReplicationDriver::ReplicationDriver(BenchExecutor executor, Params params)
    : _executor(std::move(executor)), _params(params) {
  if (_params.replicates == 0) {
    throw std::invalid_argument("the number of replicates should be greater than 0");
  }
  if (_params.threads == 0) {
    throw std::invalid_argument("the number of threads should be greater than 0");
  }
}

const BenchExecutor& ReplicationDriver::executor() const noexcept { return _executor; }

auto ReplicationDriver::params() const noexcept -> const Params& { return _params; }

BenchResult ReplicationDriver::run_replicate(const DatasetFactory& make_dataset,
                                             std::size_t replicate, std::size_t num_tests) const {
  auto eng = make_replicate_engine(_params.seed, replicate);
  std::optional<Dataset> data{};
  try {
    data = make_dataset(replicate, eng);
  } catch (const std::invalid_argument&) {
    throw;
  } catch (const std::exception& e) {
    SPDLOG_WARN("[replicate #{}]: failed to generate dataset: {}", replicate, e.what());
    return _executor.failed(replicate, num_tests, e.what());
  }

  return _executor.run(*data, replicate);
}

Ensemble ReplicationDriver::run(const DatasetFactory& make_dataset,
                                const std::atomic<bool>* early_return) const {
  const auto t0 = std::chrono::steady_clock::now();
  auto ensemble = map_replicates<BenchResult>(
      _params.replicates, _params.threads, early_return,
      [&](std::size_t replicate) { return run_replicate(make_dataset, replicate, 0); });
  const auto t1 = std::chrono::steady_clock::now();
  SPDLOG_INFO("processed {} replicates in {}", ensemble.size(),
              std::chrono::duration_cast<std::chrono::milliseconds>(t1 - t0));
  return ensemble;
}

PairedEnsemble ReplicationDriver::run_simulation(const SimulationGenerator& generator,
                                                 const std::atomic<bool>* early_return) const {
  SPDLOG_INFO("simulating {} replicates with {}", _params.replicates, generator.describe());
  const auto t0 = std::chrono::steady_clock::now();

  using ReplicatePair = std::pair<BenchResult, BenchResult>;
  auto results = map_replicates<ReplicatePair>(
      _params.replicates, _params.threads, early_return,
      [&](std::size_t replicate) -> ReplicatePair {
        auto eng = make_replicate_engine(_params.seed, replicate);
        std::optional<SimulatedReplicate> sim{};
        try {
          sim = generator.generate(replicate, eng);
        } catch (const std::invalid_argument&) {
          throw;
        } catch (const std::exception& e) {
          SPDLOG_WARN("[replicate #{}]: simulation failed: {}", replicate, e.what());
          auto res = _executor.failed(replicate, generator.size(), e.what());
          return {res, res};
        }
        return {_executor.run(sim->informative, replicate),
                _executor.run(sim->uninformative, replicate)};
      });

  PairedEnsemble ensembles{};
  ensembles.informative.reserve(results.size());
  ensembles.uninformative.reserve(results.size());
  for (auto& [informative, uninformative] : results) {
    ensembles.informative.emplace_back(std::move(informative));
    ensembles.uninformative.emplace_back(std::move(uninformative));
  }

  const auto t1 = std::chrono::steady_clock::now();
  SPDLOG_INFO("processed {} simulated replicates in {}", results.size(),
              std::chrono::duration_cast<std::chrono::milliseconds>(t1 - t0));
  return ensembles;
}

Ensemble ReplicationDriver::run_resampling(const Dataset& data,
                                           const SubsampleResampler& resampler,
                                           const std::atomic<bool>* early_return) const {
  resampler.validate(data);
  const auto num_tests = resampler.sample_size(data.size());
  SPDLOG_INFO("drawing {} subsamples of {}/{} tests", _params.replicates, num_tests, data.size());

  const auto t0 = std::chrono::steady_clock::now();
  const DatasetFactory make_dataset = [&](std::size_t, RandomEngine& eng) {
    return resampler(data, eng);
  };
  auto ensemble = map_replicates<BenchResult>(
      _params.replicates, _params.threads, early_return,
      [&](std::size_t replicate) { return run_replicate(make_dataset, replicate, num_tests); });
  const auto t1 = std::chrono::steady_clock::now();
  SPDLOG_INFO("processed {} subsamples in {}", ensemble.size(),
              std::chrono::duration_cast<std::chrono::milliseconds>(t1 - t0));
  return ensemble;
}

std::vector<MethodFailureSummary> summarize_failures(const Ensemble& ensemble) {
  std::vector<MethodFailureSummary> summaries{};
  phmap::flat_hash_map<std::string, std::size_t> idx{};

  for (const auto& res : ensemble) {
    for (const auto& col : res.columns()) {
      auto [it, inserted] = idx.try_emplace(col.method, summaries.size());
      if (inserted) {
        summaries.emplace_back(col.method);
      }
      auto& summary = summaries[it->second];
      ++summary.num_replicates;
      summary.num_failed += !col.ok;
    }
  }

  for (auto& summary : summaries) {
    summary.failure_rate =
        static_cast<double>(summary.num_failed) / static_cast<double>(summary.num_replicates);
    if (summary.num_failed != 0) {
      SPDLOG_WARN("method \"{}\" failed in {}/{} replicates ({:.2f}%)", summary.method,
                  summary.num_failed, summary.num_replicates, 100.0 * summary.failure_rate);
    }
  }

  return summaries;
}

}  // namespace fdrbench
