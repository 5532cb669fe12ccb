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

#include <fmt/format.h>
#include <fmt/ranges.h>
#include <fmt/std.h>
#include <spdlog/spdlog.h>

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <glaze/glaze.hpp>
#include <span>
#include <stdexcept>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

#include "fdrbench/aggregator.hpp"
#include "fdrbench/bench_executor.hpp"
#include "fdrbench/distributions.hpp"
#include "fdrbench/record_file.hpp"
#include "fdrbench/reference_methods.hpp"
#include "fdrbench/registry.hpp"
#include "fdrbench/replication_driver.hpp"
#include "fdrbench/result_cache.hpp"
#include "fdrbench/simulation.hpp"
#include "fdrbench/standardizer.hpp"
#include "fdrbench/tools/common.hpp"
#include "fdrbench/tools/config.hpp"
#include "fdrbench/tools/tools.hpp"
#include "fdrbench/version.hpp"

namespace fdrbench {

namespace {

struct SimulationMetadata {
  std::string created_by{};
  std::string records{};
  std::string generator{};
  std::size_t replicates{};
  std::uint64_t seed{};
  std::vector<std::string> methods{};
  std::vector<std::string> excluded_methods{};
  std::vector<double> alphas{};

  struct glaze {
    using T = SimulationMetadata;
    static constexpr auto value =
        glz::object(&T::created_by, &T::records, &T::generator, &T::replicates, &T::seed,
                    &T::methods, &T::excluded_methods, &T::alphas);
  };
};

}  // namespace

[[nodiscard]] static Pi0Curve make_pi0_curve(const SimulateConfig& c) {
  const auto& p = c.pi0_params;
  if (c.pi0_curve == "constant") {
    return pi0_curves::constant(p.at(0));
  }
  if (c.pi0_curve == "step") {
    return p.size() > 2 ? pi0_curves::step(p[0], p[1], p[2]) : pi0_curves::step(p.at(0), p.at(1));
  }
  if (c.pi0_curve == "sine") {
    return p.size() > 2 ? pi0_curves::sine(p[0], p[1], p[2]) : pi0_curves::sine(p.at(0), p.at(1));
  }
  if (c.pi0_curve == "cosine") {
    return p.size() > 2 ? pi0_curves::cosine(p[0], p[1], p[2])
                        : pi0_curves::cosine(p.at(0), p.at(1));
  }
  if (c.pi0_curve == "cubic") {
    return pi0_curves::cubic(p.at(0), p.at(1));
  }
  throw std::invalid_argument(fmt::format("unknown pi0 curve \"{}\"", c.pi0_curve));
}

[[nodiscard]] static EffectSizeDistribution make_effect_size_distribution(
    const SimulateConfig& c) {
  const auto& p = c.effect_size_params;
  if (c.effect_size == "constant") {
    return effect_sizes::constant(p.at(0));
  }
  if (c.effect_size == "normal") {
    return effect_sizes::normal(p.at(0), p.at(1));
  }
  if (c.effect_size == "uniform") {
    return effect_sizes::uniform(p.at(0), p.at(1));
  }
  if (c.effect_size == "bimodal") {
    return p.size() > 1 ? effect_sizes::bimodal(p[0], p[1]) : effect_sizes::bimodal(p.at(0));
  }
  return effect_sizes::ash_shape(c.effect_size);
}

[[nodiscard]] static std::pair<TestStatisticPerturber, NullDistribution> make_noise_model(
    const SimulateConfig& c) {
  const auto param = c.noise_params.at(0);
  if (c.noise == "gaussian") {
    return {perturbers::gaussian(param), null_distributions::two_sided_normal(param)};
  }
  if (c.noise == "t") {
    return {perturbers::student_t(param), null_distributions::two_sided_t(param)};
  }
  if (c.noise == "chi-squared") {
    return {perturbers::chi_squared(param), null_distributions::chi_squared_upper(param)};
  }
  throw std::invalid_argument(fmt::format("unknown noise model \"{}\"", c.noise));
}

[[nodiscard]] static CovariateSampler make_covariate_sampler(const SimulateConfig& c) {
  const auto& p = c.covariate_params;
  if (c.covariate == "uniform") {
    return covariates::uniform(p.at(0), p.at(1));
  }
  if (c.covariate == "normal") {
    return covariates::normal(p.at(0), p.at(1));
  }
  throw std::invalid_argument(fmt::format("unknown covariate distribution \"{}\"", c.covariate));
}

[[nodiscard]] static SimulationParams make_simulation_params(const SimulateConfig& c) {
  auto [perturber, null_distribution] = make_noise_model(c);
  return {.m = c.num_tests,
          .pi0 = make_pi0_curve(c),
          .effect_size = make_effect_size_distribution(c),
          .test_statistic = std::move(perturber),
          .null_distribution = std::move(null_distribution),
          .covariate = make_covariate_sampler(c),
          .num_non_null = c.num_non_null,
          .seed = c.seed};
}

[[nodiscard]] static std::vector<double> make_alphas(const SimulateConfig& c) {
  if (!c.alphas.empty()) {
    return c.alphas;
  }
  return Standardizer::make_grid(c.alpha_min, c.alpha_max, c.alpha_steps);
}

[[nodiscard]] static std::filesystem::path make_output_path(const std::filesystem::path& prefix,
                                                            std::string_view suffix) {
  return fmt::format("{}.{}.parquet", prefix.string(), suffix);
}

static void check_excluded_methods(const Registry& registry,
                                   std::span<const std::string> excluded_methods) {
  for (const auto& id : excluded_methods) {
    if (!registry.contains(id)) {
      SPDLOG_WARN("excluded method \"{}\" is not a known method: ignoring it", id);
    }
  }
}

[[nodiscard]] static PairedEnsemble run_benchmark(const SimulateConfig& c,
                                                  const ReplicationDriver& driver,
                                                  const SimulationGenerator& generator) {
  if (c.cache_dir.empty()) {
    return driver.run_simulation(generator);
  }

  const FileCache<PairedEnsemble> cache{c.cache_dir};
  const auto key =
      fmt::format("{}; replicates={}; methods={}", generator.describe(), c.replicates,
                  fmt::join(driver.executor().registry().list_ids(), ","));
  return cache.get_or_compute(key, [&] { return driver.run_simulation(generator); });
}

template <typename Record>
static void write_output_file(const SimulateConfig& c, std::string_view suffix,
                              std::span<const Record> records, SimulationMetadata metadata) {
  const auto path = make_output_path(c.output_prefix, suffix);

  std::string buff{};
  if (const auto ec = glz::write_json(metadata, buff); ec) {
    throw std::runtime_error(
        fmt::format("failed to serialize metadata for file {}: {}", path, glz::format_error(ec)));
  }

  const auto num_records = write_records(path, records,
                                         {.force = c.force,
                                          .compression_method = c.compression_method,
                                          .compression_lvl = c.compression_lvl,
                                          .metadata = std::move(buff)});
  SPDLOG_INFO("written {} records to file {}", num_records, path);
}

int run_command(const SimulateConfig& c) {
  const auto t0 = std::chrono::steady_clock::now();

  const SimulationGenerator generator{make_simulation_params(c)};
  const Standardizer standardizer{make_alphas(c)};
  const auto registry = methods::make_reference_registry();
  check_excluded_methods(registry, c.excluded_methods);

  const ReplicationDriver driver{
      BenchExecutor{registry},
      {.replicates = c.replicates, .seed = c.seed, .threads = c.threads}};

  const auto ensemble = run_benchmark(c, driver, generator);

  const auto informative = standardizer.standardize(ensemble.informative);
  const auto uninformative = standardizer.standardize(ensemble.uninformative);

  const auto aggregated = aggregate(informative, c.excluded_methods);
  const auto paired_difference =
      aggregate_paired_difference(informative, uninformative, c.excluded_methods);
  const auto failures = summarize_failures(ensemble.informative);

  const SimulationMetadata metadata{.created_by = std::string{config::version::str_long()},
                                    .generator = generator.describe(),
                                    .replicates = c.replicates,
                                    .seed = c.seed,
                                    .methods = registry.list_ids(),
                                    .excluded_methods = c.excluded_methods,
                                    .alphas = standardizer.alphas()};

  auto metadata_ = metadata;
  metadata_.records = "standardized metrics (informative covariate)";
  write_output_file<StandardizedRecord>(c, "standardized", informative, metadata_);

  metadata_.records = "mean across replicates (informative covariate)";
  write_output_file<AggregatedRecord>(c, "aggregated", aggregated, metadata_);

  metadata_.records = "paired difference across replicates (informative - uninformative)";
  write_output_file<AggregatedRecord>(c, "paired_difference", paired_difference, metadata_);

  metadata_.records = "method failures (informative covariate)";
  write_output_file<MethodFailureSummary>(c, "failures", failures, std::move(metadata_));

  const auto t1 = std::chrono::steady_clock::now();
  SPDLOG_INFO("DONE! Processed {} replicates in {}", ensemble.informative.size(),
              format_duration(t1 - t0));

  return 0;
}

}  // namespace fdrbench
