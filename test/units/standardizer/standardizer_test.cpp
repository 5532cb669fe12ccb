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

#include "fdrbench/standardizer.hpp"

#include <fmt/format.h>

#include <catch2/catch_test_macros.hpp>
#include <catch2/matchers/catch_matchers_floating_point.hpp>
#include <cstddef>
#include <limits>
#include <optional>
#include <span>
#include <stdexcept>
#include <string_view>
#include <vector>

#include "fdrbench/bench_executor.hpp"
#include "fdrbench/bench_result.hpp"
#include "fdrbench/distributions.hpp"
#include "fdrbench/reference_methods.hpp"
#include "fdrbench/replication_driver.hpp"
#include "fdrbench/simulation.hpp"

namespace fdrbench::test {

// NOLINTBEGIN(*-avoid-magic-numbers, readability-magic-numbers, readability-function-cognitive-complexity)
[[nodiscard]] static std::optional<double> find_value(std::span<const StandardizedRecord> records,
                                                      std::string_view method, double alpha,
                                                      Metric metric) {
  for (const auto& record : records) {
    if (record.method == method && record.alpha == alpha && record.metric == metric) {
      return record.value;
    }
  }
  return {};
}

[[nodiscard]] static BenchResult make_result() {
  BenchResult res{0, 10};
  res.add_qvalues("all-zero", std::vector<double>(10, 0.0));
  res.add_qvalues("all-one", std::vector<double>(10, 1.0));
  res.add_qvalues("ranked", {0.01, 0.02, 0.03, 0.04, 0.05, 0.06, 0.07, 0.08, 0.09, 0.10});
  res.set_truth({true, true, false, true, false, false, false, false, false, false});
  return res;
}

TEST_CASE("Metric", "[short][standardizer]") {
  for (const auto m : all_metrics) {
    CHECK(parse_metric(to_string(m)) == m);
  }
  CHECK(fmt::format("{}", Metric::FDR) == "FDR");
  CHECK_THROWS_AS(parse_metric("AUC"), std::invalid_argument);

  CHECK(requires_truth(Metric::TPR));
  CHECK_FALSE(requires_truth(Metric::rejections));
  CHECK_FALSE(requires_truth(Metric::rejectprop));
}

TEST_CASE("Standardizer", "[short][standardizer]") {
  SECTION("thresholds") {
    CHECK(Standardizer{{0.01, 0.05}}.alphas() == std::vector{0.01, 0.05});
    CHECK_THROWS_AS(Standardizer(std::vector<double>{}), std::invalid_argument);
    CHECK_THROWS_AS(Standardizer({0.05, 0.01}), std::invalid_argument);
    CHECK_THROWS_AS(Standardizer({0.05, 0.05}), std::invalid_argument);
    CHECK_THROWS_AS(Standardizer({0.0, 0.05}), std::invalid_argument);
    CHECK_THROWS_AS(Standardizer({0.05, 1.5}), std::invalid_argument);
  }

  SECTION("threshold grid") {
    const auto grid = Standardizer::make_grid(0.01, 0.1, 10);
    REQUIRE(grid.size() == 10);
    CHECK(grid.front() == 0.01);
    CHECK(grid.back() == 0.1);
    CHECK_THAT(grid[1], Catch::Matchers::WithinAbs(0.02, 1.0e-12));
    CHECK_NOTHROW(Standardizer{grid});

    CHECK(Standardizer::make_grid(0.01, 0.1, 1) == std::vector{0.1});
    CHECK_THROWS_AS(Standardizer::make_grid(0.01, 0.1, 0), std::invalid_argument);
    CHECK_THROWS_AS(Standardizer::make_grid(0.1, 0.01, 5), std::invalid_argument);
    CHECK_THROWS_AS(Standardizer::make_grid(0.1, 0.1, 5), std::invalid_argument);
  }

  SECTION("all-zero and all-one q-values") {
    const Standardizer standardizer{{0.05}};
    const auto records = standardizer.standardize(make_result());
    CHECK(records.size() == 3 * all_metrics.size());

    CHECK(find_value(records, "all-zero", 0.05, Metric::rejections) == 10.0);
    CHECK(find_value(records, "all-zero", 0.05, Metric::rejectprop) == 1.0);
    CHECK(find_value(records, "all-zero", 0.05, Metric::FDR) == 0.7);
    CHECK(find_value(records, "all-zero", 0.05, Metric::TPR) == 1.0);
    CHECK(find_value(records, "all-zero", 0.05, Metric::FWER) == 1.0);
    CHECK(find_value(records, "all-zero", 0.05, Metric::TNR) == 0.0);

    CHECK(find_value(records, "all-one", 0.05, Metric::rejections) == 0.0);
    CHECK(find_value(records, "all-one", 0.05, Metric::FDR) == 0.0);
    CHECK(find_value(records, "all-one", 0.05, Metric::TPR) == 0.0);
    CHECK(find_value(records, "all-one", 0.05, Metric::FWER) == 0.0);
    CHECK(find_value(records, "all-one", 0.05, Metric::TNR) == 1.0);
  }

  SECTION("threshold indexing") {
    const Standardizer standardizer{{0.01, 0.025, 0.04, 0.1}};
    const auto records = standardizer.standardize(make_result());

    // q-values equal to the threshold are rejected
    CHECK(find_value(records, "ranked", 0.01, Metric::rejections) == 1.0);
    CHECK(find_value(records, "ranked", 0.01, Metric::FDR) == 0.0);
    CHECK(find_value(records, "ranked", 0.025, Metric::rejections) == 2.0);
    CHECK(find_value(records, "ranked", 0.04, Metric::rejections) == 4.0);
    CHECK(find_value(records, "ranked", 0.04, Metric::FDR) == 0.25);
    CHECK(find_value(records, "ranked", 0.04, Metric::TPR) == 1.0);
    CHECK(find_value(records, "ranked", 0.04, Metric::FWER) == 1.0);
    CHECK_THAT(*find_value(records, "ranked", 0.04, Metric::TNR),
               Catch::Matchers::WithinAbs(6.0 / 7.0, 1.0e-12));
  }

  SECTION("invariants") {
    const Standardizer standardizer{Standardizer::make_grid(0.01, 1.0, 25)};
    const auto records = standardizer.standardize(make_result());

    for (const auto* method : {"all-zero", "all-one", "ranked"}) {
      double prev_rejections = -1;
      for (const auto alpha : standardizer.alphas()) {
        const auto rejections = *find_value(records, method, alpha, Metric::rejections);
        CHECK(rejections >= prev_rejections);
        prev_rejections = rejections;

        for (const auto metric : {Metric::FDR, Metric::TPR, Metric::FWER, Metric::TNR,
                                  Metric::rejectprop}) {
          const auto value = *find_value(records, method, alpha, metric);
          CHECK((value >= 0.0 && value <= 1.0));
        }

        if (rejections == 0) {
          CHECK(find_value(records, method, alpha, Metric::FDR) == 0.0);
        }
      }
    }
  }

  SECTION("missing q-values") {
    BenchResult res{2, 4};
    const auto nan = std::numeric_limits<double>::quiet_NaN();
    res.add_qvalues("partial", {0.01, nan, nan, 0.01});
    res.add_failure("failed", "covariate has zero variance");
    res.set_truth({true, true, false, false});

    const auto records = Standardizer{{0.05}}.standardize(res);
    CHECK(records.size() == all_metrics.size());
    CHECK(find_value(records, "partial", 0.05, Metric::rejections) == 2.0);
    CHECK(find_value(records, "partial", 0.05, Metric::TPR) == 0.5);
    CHECK(find_value(records, "partial", 0.05, Metric::FDR) == 0.5);
    CHECK_FALSE(find_value(records, "failed", 0.05, Metric::rejections).has_value());
    for (const auto& record : records) {
      CHECK(record.replicate == 2);
    }
  }

  SECTION("missing truth") {
    BenchResult res{0, 4};
    res.add_qvalues("bh", {0.01, 0.2, 0.03, 0.5});

    const auto records = Standardizer{{0.05}}.standardize(res);
    REQUIRE(records.size() == 2);
    CHECK(find_value(records, "bh", 0.05, Metric::rejections) == 2.0);
    CHECK(find_value(records, "bh", 0.05, Metric::rejectprop) == 0.5);
    CHECK_FALSE(find_value(records, "bh", 0.05, Metric::FDR).has_value());
  }

  SECTION("ensemble") {
    std::vector<BenchResult> ensemble{};
    for (std::size_t i = 0; i < 3; ++i) {
      BenchResult res{i, 2};
      res.add_qvalues("bh", {0.01, 0.5});
      res.set_truth({true, false});
      ensemble.emplace_back(std::move(res));
    }

    const auto records = Standardizer{{0.05, 0.1}}.standardize(ensemble);
    REQUIRE(records.size() == 3 * 2 * all_metrics.size());
    CHECK(records.front().replicate == 0);
    CHECK(records.back().replicate == 2);
  }
}

TEST_CASE("Standardizer: simulated replicates", "[medium][standardizer]") {
  const SimulationGenerator gen{{.m = 300,
                                 .pi0 = pi0_curves::sine(0.8, 0.15),
                                 .effect_size = effect_sizes::normal(2.0, 1.0),
                                 .test_statistic = perturbers::gaussian(),
                                 .null_distribution = null_distributions::two_sided_normal(),
                                 .covariate = covariates::uniform(),
                                 .seed = 7}};
  const ReplicationDriver driver{BenchExecutor{methods::make_reference_registry()},
                                 {.replicates = 4, .seed = 7, .threads = 2}};
  const auto ensemble = driver.run_simulation(gen);
  const Standardizer standardizer{Standardizer::make_grid(0.01, 0.2, 5)};

  SECTION("standardizing the same ensemble twice gives identical records") {
    const auto records1 = standardizer.standardize(ensemble.informative);
    const auto records2 = standardizer.standardize(ensemble.informative);
    REQUIRE_FALSE(records1.empty());
    CHECK(records1 == records2);

    const auto records3 = standardizer.standardize(ensemble.uninformative);
    CHECK(records3 == standardizer.standardize(ensemble.uninformative));
  }
}
// NOLINTEND(*-avoid-magic-numbers, readability-magic-numbers, readability-function-cognitive-complexity)

}  // namespace fdrbench::test
