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

#include <spdlog/logger.h>
#include <spdlog/sinks/ostream_sink.h>
#include <spdlog/spdlog.h>

#include <algorithm>
#include <atomic>
#include <catch2/catch_test_macros.hpp>
#include <catch2/matchers/catch_matchers_floating_point.hpp>
#include <cmath>
#include <cstddef>
#include <memory>
#include <span>
#include <sstream>
#include <stdexcept>
#include <string>
#include <tuple>
#include <utility>
#include <vector>

#include "fdrbench/bench_executor.hpp"
#include "fdrbench/dataset.hpp"
#include "fdrbench/distributions.hpp"
#include "fdrbench/errors.hpp"
#include "fdrbench/method_spec.hpp"
#include "fdrbench/reference_methods.hpp"
#include "fdrbench/registry.hpp"
#include "fdrbench/resampling.hpp"
#include "fdrbench/simulation.hpp"

namespace fdrbench::test {

// NOLINTBEGIN(*-avoid-magic-numbers, readability-magic-numbers, readability-function-cognitive-complexity)
[[nodiscard]] static SimulationGenerator make_generator(std::size_t m = 200) {
  return SimulationGenerator{{.m = m,
                              .pi0 = pi0_curves::step(0.6, 0.95),
                              .effect_size = effect_sizes::normal(2.5, 1.0),
                              .test_statistic = perturbers::gaussian(),
                              .null_distribution = null_distributions::two_sided_normal(),
                              .covariate = covariates::uniform(),
                              .seed = 42}};
}

[[nodiscard]] static Dataset make_dataset(std::size_t replicate, RandomEngine& eng) {
  const auto rep = make_generator(50).generate(replicate, eng);
  return rep.informative;
}

[[nodiscard]] static std::vector<double> to_vector(std::span<const double> data) {
  return {data.begin(), data.end()};
}

static void check_same_qvalues(const BenchResult& r1, const BenchResult& r2) {
  REQUIRE(r1.methods() == r2.methods());
  for (const auto& col : r1.columns()) {
    const auto q1 = to_vector(col.qvalues);
    const auto q2 = to_vector(r2.qvalues(col.method));
    REQUIRE(q1.size() == q2.size());
    for (std::size_t i = 0; i < q1.size(); ++i) {
      CHECK(((q1[i] == q2[i]) || (std::isnan(q1[i]) && std::isnan(q2[i]))));
    }
  }
}

TEST_CASE("ReplicationDriver", "[short][replication]") {
  const BenchExecutor executor{methods::make_reference_registry()};

  SECTION("invalid params") {
    CHECK_THROWS_AS(ReplicationDriver(executor, {.replicates = 0}), std::invalid_argument);
    CHECK_THROWS_AS(ReplicationDriver(executor, {.replicates = 1, .threads = 0}),
                    std::invalid_argument);
  }

  SECTION("replicate order") {
    const ReplicationDriver driver{executor, {.replicates = 16, .seed = 7, .threads = 4}};
    const auto ensemble = driver.run(make_dataset);

    REQUIRE(ensemble.size() == 16);
    for (std::size_t i = 0; i < ensemble.size(); ++i) {
      CHECK(ensemble[i].replicate() == i);
      CHECK(ensemble[i].num_methods() == executor.registry().size());
    }
  }

  SECTION("results do not depend on the number of threads") {
    const ReplicationDriver driver1{executor, {.replicates = 8, .seed = 7, .threads = 1}};
    const ReplicationDriver driver2{executor, {.replicates = 8, .seed = 7, .threads = 3}};

    const auto gen = make_generator();
    const auto ensemble1 = driver1.run_simulation(gen);
    const auto ensemble2 = driver2.run_simulation(gen);

    REQUIRE(ensemble1.informative.size() == 8);
    REQUIRE(ensemble2.informative.size() == 8);
    for (std::size_t i = 0; i < 8; ++i) {
      check_same_qvalues(ensemble1.informative[i], ensemble2.informative[i]);
      check_same_qvalues(ensemble1.uninformative[i], ensemble2.uninformative[i]);
      CHECK(ensemble1.informative[i].truth() == ensemble2.informative[i].truth());
    }
  }

  SECTION("paired ensembles") {
    const ReplicationDriver driver{executor, {.replicates = 4, .seed = 1, .threads = 2}};
    const auto ensemble = driver.run_simulation(make_generator());

    REQUIRE(ensemble.informative.size() == 4);
    REQUIRE(ensemble.uninformative.size() == 4);
    for (std::size_t i = 0; i < 4; ++i) {
      const auto& a = ensemble.informative[i];
      const auto& b = ensemble.uninformative[i];
      CHECK(a.replicate() == b.replicate());
      CHECK(a.truth() == b.truth());
      // methods ignoring the covariate see the same p-values
      CHECK(to_vector(a.qvalues("bh")) == to_vector(b.qvalues("bh")));
    }
  }

  SECTION("simulation progress is logged once") {
    std::ostringstream log{};
    const auto prev_logger = spdlog::default_logger();
    spdlog::set_default_logger(std::make_shared<spdlog::logger>(
        "replication_test", std::make_shared<spdlog::sinks::ostream_sink_mt>(log)));
    spdlog::set_level(spdlog::level::info);

    const ReplicationDriver driver{executor, {.replicates = 2, .seed = 1, .threads = 1}};
    std::ignore = driver.run_simulation(make_generator(20));
    spdlog::set_default_logger(prev_logger);

    const auto msgs = log.str();
    std::size_t num_msgs{};
    for (auto pos = msgs.find("simulating 2 replicates"); pos != std::string::npos;
         pos = msgs.find("simulating 2 replicates", pos + 1)) {
      ++num_msgs;
    }
    CHECK(num_msgs == 1);
  }

  SECTION("failed replicates are kept") {
    const ReplicationDriver driver{executor, {.replicates = 5, .seed = 7, .threads = 2}};
    const auto ensemble = driver.run([](std::size_t replicate, RandomEngine& eng) {
      if (replicate == 2) {
        throw std::runtime_error("unable to generate dataset");
      }
      return make_dataset(replicate, eng);
    });

    REQUIRE(ensemble.size() == 5);
    CHECK(ensemble[2].replicate() == 2);
    CHECK(ensemble[2].all_failed());
    CHECK(ensemble[2].num_methods() == executor.registry().size());
    CHECK(ensemble[2].failures().front().reason == "unable to generate dataset");
    CHECK_FALSE(ensemble[1].all_failed());
    CHECK_FALSE(ensemble[3].all_failed());
  }

  SECTION("configuration errors are propagated") {
    const DatasetFactory make_invalid_dataset = [](std::size_t replicate, RandomEngine& eng) {
      if (replicate == 1) {
        throw std::invalid_argument("invalid dataset");
      }
      return make_dataset(replicate, eng);
    };

    const ReplicationDriver driver1{executor, {.replicates = 3, .threads = 1}};
    CHECK_THROWS_AS(driver1.run(make_invalid_dataset), std::invalid_argument);

    const ReplicationDriver driver2{executor, {.replicates = 3, .threads = 3}};
    CHECK_THROWS_AS(driver2.run(make_invalid_dataset), std::invalid_argument);
  }

  SECTION("early return") {
    std::atomic<bool> early_return{false};

    SECTION("before starting") {
      early_return = true;
      const ReplicationDriver driver{executor, {.replicates = 4, .threads = 2}};
      CHECK(driver.run(make_dataset, &early_return).empty());
      CHECK(driver.run_simulation(make_generator(), &early_return).informative.empty());
    }

    SECTION("while running") {
      const ReplicationDriver driver{executor, {.replicates = 10, .threads = 1}};
      const auto ensemble = driver.run(
          [&](std::size_t replicate, RandomEngine& eng) {
            if (replicate == 1) {
              early_return = true;
            }
            return make_dataset(replicate, eng);
          },
          &early_return);

      REQUIRE(ensemble.size() == 2);
      CHECK(ensemble[0].replicate() == 0);
      CHECK(ensemble[1].replicate() == 1);
    }
  }
}

TEST_CASE("SubsampleResampler", "[short][replication]") {
  std::vector<double> pvalues(100);
  std::vector<bool> truth(100, false);
  for (std::size_t i = 0; i < pvalues.size(); ++i) {
    pvalues[i] = static_cast<double>(i) / 100.0;
    truth[i] = i < 10;
  }
  Dataset data{pvalues};
  data.set_truth(truth);

  SECTION("sample size") {
    CHECK(SubsampleResampler{}.sample_size(100) == 50);
    CHECK(SubsampleResampler{{.fraction = 0.25}}.sample_size(10) == 3);
    CHECK(SubsampleResampler{{.size = 7}}.sample_size(100) == 7);
    CHECK(SubsampleResampler{{.fraction = 0.01}}.sample_size(10) == 1);

    CHECK_THROWS_AS(SubsampleResampler({.fraction = 0.0}), std::invalid_argument);
    CHECK_THROWS_AS(SubsampleResampler({.size = 0}), std::invalid_argument);
    CHECK_THROWS_AS(SubsampleResampler({.max_attempts = 0}), std::invalid_argument);
  }

  SECTION("subsample") {
    const SubsampleResampler resampler{{.size = 20, .min_null = 5, .min_non_null = 2}};
    auto eng = make_replicate_engine(0, 0);
    for (std::size_t i = 0; i < 10; ++i) {
      const auto sub = resampler(data, eng);
      REQUIRE(sub.size() == 20);
      CHECK(sub.num_non_null() >= 2);
      CHECK(sub.num_null() >= 5);

      // rows are drawn without replacement
      auto pv = to_vector(sub.p_value());
      std::ranges::sort(pv);
      CHECK(std::ranges::adjacent_find(pv) == pv.end());
    }
  }

  SECTION("validation") {
    CHECK_NOTHROW(SubsampleResampler{{.size = 20, .min_non_null = 10}}.validate(data));
    CHECK_THROWS_AS(SubsampleResampler({.size = 101}).validate(data), std::invalid_argument);
    CHECK_THROWS_AS(SubsampleResampler({.size = 20, .min_non_null = 11}).validate(data),
                    std::invalid_argument);
    CHECK_THROWS_AS(SubsampleResampler({.size = 20, .min_null = 15, .min_non_null = 6})
                        .validate(data),
                    std::invalid_argument);
  }

  SECTION("attempts are capped") {
    Dataset data2{pvalues};
    data2.set_truth(std::vector<bool>(100, false));

    const SubsampleResampler resampler{{.size = 10, .min_non_null = 1, .max_attempts = 5}};
    auto eng = make_replicate_engine(0, 0);
    CHECK_THROWS_AS(resampler(data2, eng), ResamplingError);
  }

  SECTION("driver") {
    const BenchExecutor executor{methods::make_reference_registry().without(
        std::vector<std::string>{"stratified-bh"})};
    const ReplicationDriver driver{executor, {.replicates = 6, .seed = 3, .threads = 2}};
    const SubsampleResampler resampler{{.fraction = 0.5, .min_non_null = 1}};

    const auto ensemble = driver.run_resampling(data, resampler);
    REQUIRE(ensemble.size() == 6);
    for (const auto& res : ensemble) {
      CHECK(res.num_tests() == 50);
      CHECK(res.failures().empty());
      CHECK(res.has_truth());
    }

    const auto ensemble2 = driver.run_resampling(data, resampler);
    check_same_qvalues(ensemble.front(), ensemble2.front());

    const SubsampleResampler invalid_resampler{{.fraction = 0.5, .min_non_null = 20}};
    CHECK_THROWS_AS(driver.run_resampling(data, invalid_resampler), std::invalid_argument);
  }
}

TEST_CASE("summarize_failures", "[short][replication]") {
  Ensemble ensemble{};
  for (std::size_t i = 0; i < 4; ++i) {
    BenchResult res{i, 2};
    res.add_qvalues("bh", {0.1, 0.2});
    if (i % 2 == 0) {
      res.add_failure("ihw", "failure");
    } else {
      res.add_qvalues("ihw", {0.1, 0.2});
    }
    ensemble.emplace_back(std::move(res));
  }

  const auto summaries = summarize_failures(ensemble);
  REQUIRE(summaries.size() == 2);
  CHECK(summaries[0].method == "bh");
  CHECK(summaries[0].num_failed == 0);
  CHECK(summaries[0].num_replicates == 4);
  CHECK(summaries[0].failure_rate == 0.0);

  CHECK(summaries[1].method == "ihw");
  CHECK(summaries[1].num_failed == 2);
  CHECK(summaries[1].failure_rate == 0.5);

  CHECK(summarize_failures(Ensemble{}).empty());
}
// NOLINTEND(*-avoid-magic-numbers, readability-magic-numbers, readability-function-cognitive-complexity)

}  // namespace fdrbench::test
