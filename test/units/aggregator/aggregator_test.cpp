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

#include "fdrbench/aggregator.hpp"

#include <catch2/catch_test_macros.hpp>
#include <catch2/matchers/catch_matchers_floating_point.hpp>
#include <cmath>
#include <cstddef>
#include <stdexcept>
#include <string>
#include <utility>
#include <vector>

#include "fdrbench/bench_executor.hpp"
#include "fdrbench/distributions.hpp"
#include "fdrbench/reference_methods.hpp"
#include "fdrbench/replication_driver.hpp"
#include "fdrbench/simulation.hpp"
#include "fdrbench/standardizer.hpp"

namespace fdrbench::test {

// NOLINTBEGIN(*-avoid-magic-numbers, readability-magic-numbers, readability-function-cognitive-complexity)
[[nodiscard]] static StandardizedRecord make_record(std::size_t replicate, std::string method,
                                                    double value, Metric metric = Metric::FDR,
                                                    double alpha = 0.05) {
  return {.replicate = replicate,
          .method = std::move(method),
          .alpha = alpha,
          .metric = metric,
          .value = value};
}

// AggregatedRecord::operator== does not consider two NaN standard errors equal
[[nodiscard]] static bool same_records(const std::vector<AggregatedRecord>& a,
                                       const std::vector<AggregatedRecord>& b) {
  if (a.size() != b.size()) {
    return false;
  }
  for (std::size_t i = 0; i < a.size(); ++i) {
    const auto same_se = a[i].standard_error == b[i].standard_error ||
                         (std::isnan(a[i].standard_error) && std::isnan(b[i].standard_error));
    if (a[i].method != b[i].method || a[i].alpha != b[i].alpha || a[i].metric != b[i].metric ||
        a[i].mean != b[i].mean || !same_se || a[i].num_replicates != b[i].num_replicates) {
      return false;
    }
  }
  return true;
}

TEST_CASE("aggregate", "[short][aggregator]") {
  SECTION("mean and standard error") {
    const std::vector records{make_record(0, "bh", 1.0), make_record(1, "bh", 2.0),
                              make_record(2, "bh", 3.0)};
    const auto aggregated = aggregate(records);

    REQUIRE(aggregated.size() == 1);
    CHECK(aggregated.front().method == "bh");
    CHECK(aggregated.front().alpha == 0.05);
    CHECK(aggregated.front().metric == Metric::FDR);
    CHECK(aggregated.front().num_replicates == 3);
    CHECK_THAT(aggregated.front().mean, Catch::Matchers::WithinAbs(2.0, 1.0e-12));
    CHECK_THAT(aggregated.front().standard_error,
               Catch::Matchers::WithinAbs(std::sqrt(1.0 / 3.0), 1.0e-12));
  }

  SECTION("single replicate") {
    const std::vector records{make_record(0, "bh", 0.1)};
    const auto aggregated = aggregate(records);
    REQUIRE(aggregated.size() == 1);
    CHECK(aggregated.front().mean == 0.1);
    CHECK(std::isnan(aggregated.front().standard_error));
  }

  SECTION("missing replicates do not contribute") {
    // ihw has no records for replicate #1
    const std::vector records{make_record(0, "bh", 0.1), make_record(0, "ihw", 0.2),
                              make_record(1, "bh", 0.3), make_record(2, "bh", 0.5),
                              make_record(2, "ihw", 0.4)};
    const auto aggregated = aggregate(records);

    REQUIRE(aggregated.size() == 2);
    CHECK(aggregated[0].method == "bh");
    CHECK(aggregated[0].num_replicates == 3);
    CHECK_THAT(aggregated[0].mean, Catch::Matchers::WithinAbs(0.3, 1.0e-12));

    CHECK(aggregated[1].method == "ihw");
    CHECK(aggregated[1].num_replicates == 2);
    CHECK_THAT(aggregated[1].mean, Catch::Matchers::WithinAbs(0.3, 1.0e-12));
  }

  SECTION("groups") {
    const std::vector records{
        make_record(0, "holm", 1.0, Metric::rejections, 0.05),
        make_record(0, "holm", 2.0, Metric::rejections, 0.1),
        make_record(0, "holm", 0.1, Metric::rejectprop, 0.05),
        make_record(1, "holm", 3.0, Metric::rejections, 0.05),
        make_record(0, "bh", 5.0, Metric::rejections, 0.05),
    };
    const auto aggregated = aggregate(records);

    REQUIRE(aggregated.size() == 4);
    CHECK(aggregated[0].method == "holm");
    CHECK(aggregated[0].alpha == 0.05);
    CHECK(aggregated[0].metric == Metric::rejections);
    CHECK(aggregated[0].mean == 2.0);
    CHECK(aggregated[1].alpha == 0.1);
    CHECK(aggregated[2].metric == Metric::rejectprop);
    CHECK(aggregated[3].method == "bh");
  }

  SECTION("excluded methods") {
    const std::vector records{make_record(0, "bh", 0.1), make_record(0, "ihw", 0.2)};
    const std::vector<std::string> excluded{"ihw", "unknown"};
    const auto aggregated = aggregate(records, excluded);
    REQUIRE(aggregated.size() == 1);
    CHECK(aggregated.front().method == "bh");
  }

  SECTION("empty") { CHECK(aggregate(std::vector<StandardizedRecord>{}).empty()); }
}

TEST_CASE("aggregate_paired_difference", "[short][aggregator]") {
  SECTION("identical ensembles") {
    const std::vector records{make_record(0, "bh", 0.1), make_record(1, "bh", 0.4),
                              make_record(2, "bh", 0.2)};
    const auto aggregated = aggregate_paired_difference(records, records);

    REQUIRE(aggregated.size() == 1);
    CHECK(aggregated.front().mean == 0.0);
    CHECK(aggregated.front().standard_error == 0.0);
    CHECK(aggregated.front().num_replicates == 3);
  }

  SECTION("pairing reduces the standard error") {
    const std::vector a{make_record(0, "ihw", 0.1), make_record(1, "ihw", 0.5),
                        make_record(2, "ihw", 0.9)};
    const std::vector b{make_record(0, "ihw", 0.05), make_record(1, "ihw", 0.45),
                        make_record(2, "ihw", 0.85)};

    const auto paired = aggregate_paired_difference(a, b);
    const auto unpaired = aggregate(a);

    REQUIRE(paired.size() == 1);
    CHECK_THAT(paired.front().mean, Catch::Matchers::WithinAbs(0.05, 1.0e-12));
    CHECK_THAT(paired.front().standard_error, Catch::Matchers::WithinAbs(0.0, 1.0e-12));
    CHECK(unpaired.front().standard_error > 0.2);
  }

  SECTION("records without a partner are skipped") {
    const std::vector a{make_record(0, "bh", 0.3), make_record(1, "bh", 0.5),
                        make_record(0, "holm", 0.1)};
    const std::vector b{make_record(0, "bh", 0.1), make_record(2, "bh", 0.2)};

    const auto aggregated = aggregate_paired_difference(a, b);
    REQUIRE(aggregated.size() == 1);
    CHECK(aggregated.front().num_replicates == 1);
    CHECK_THAT(aggregated.front().mean, Catch::Matchers::WithinAbs(0.2, 1.0e-12));
  }

  SECTION("duplicate records") {
    const std::vector a{make_record(0, "bh", 0.3)};
    const std::vector b{make_record(0, "bh", 0.1), make_record(0, "bh", 0.2)};
    CHECK_THROWS_AS(aggregate_paired_difference(a, b), std::invalid_argument);
  }

  SECTION("aggregation mode") {
    const std::vector a{make_record(0, "bh", 0.3)};
    const std::vector b{make_record(0, "bh", 0.1)};

    CHECK(aggregate(AggregationMode::mean, a, b).front().mean == 0.3);
    CHECK_THAT(aggregate(AggregationMode::paired_difference, a, b).front().mean,
               Catch::Matchers::WithinAbs(0.2, 1.0e-12));
    CHECK(to_string(AggregationMode::paired_difference) == "paired-difference");
  }
}

TEST_CASE("aggregate_paired_difference: simulated replicates", "[medium][aggregator]") {
  const SimulationGenerator gen{{.m = 500,
                                 .pi0 = pi0_curves::cosine(0.8, 0.15),
                                 .effect_size = effect_sizes::near_normal(),
                                 .test_statistic = perturbers::gaussian(),
                                 .null_distribution = null_distributions::two_sided_normal(),
                                 .covariate = covariates::uniform(),
                                 .seed = 10}};

  const ReplicationDriver driver{BenchExecutor{methods::make_reference_registry()},
                                 {.replicates = 5, .seed = 10, .threads = 2}};
  const auto ensemble = driver.run_simulation(gen);

  const Standardizer standardizer{Standardizer::make_grid(0.01, 0.1, 4)};
  const auto a = standardizer.standardize(ensemble.informative);
  const auto b = standardizer.standardize(ensemble.uninformative);

  const auto aggregated = aggregate_paired_difference(a, b);
  REQUIRE_FALSE(aggregated.empty());

  SECTION("aggregating the same records twice gives identical results") {
    CHECK(same_records(aggregated, aggregate_paired_difference(a, b)));

    const std::vector<std::string> excluded{"holm"};
    const auto means = aggregate(a, excluded);
    REQUIRE_FALSE(means.empty());
    CHECK(same_records(means, aggregate(a, excluded)));
  }

  for (const auto& record : aggregated) {
    if (record.method == "stratified-bh") {
      continue;
    }
    // methods that ignore the covariate see exactly the same p-values
    CHECK(record.mean == 0.0);
    CHECK(record.num_replicates == 5);
  }
}
// NOLINTEND(*-avoid-magic-numbers, readability-magic-numbers, readability-function-cognitive-complexity)

}  // namespace fdrbench::test
