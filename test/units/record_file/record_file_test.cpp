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

#include "fdrbench/record_file.hpp"

#include <fmt/format.h>

#include <catch2/catch_test_macros.hpp>
#include <cmath>
#include <cstddef>
#include <filesystem>
#include <limits>
#include <stdexcept>
#include <string>
#include <vector>

#include "fdrbench/aggregator.hpp"
#include "fdrbench/parquet_helpers.hpp"
#include "fdrbench/replication_driver.hpp"
#include "fdrbench/standardizer.hpp"
#include "fdrbench/test/tmpdir.hpp"

namespace fdrbench::test {

// NOLINTBEGIN(*-avoid-magic-numbers, readability-magic-numbers, readability-function-cognitive-complexity)
[[nodiscard]] static std::vector<StandardizedRecord> make_standardized_records() {
  std::vector<StandardizedRecord> records{};
  for (std::size_t replicate = 0; replicate < 3; ++replicate) {
    for (const auto* method : {"bh", "storey-bh"}) {
      for (const auto alpha : {0.01, 0.05}) {
        for (const auto metric : all_metrics) {
          records.emplace_back(replicate, method, alpha, metric,
                               static_cast<double>(records.size()) / 100.0);
        }
      }
    }
  }
  return records;
}

TEST_CASE("RecordFile", "[short][io][record_file]") {
  const auto path = testdir() / "record_file" / "records.parquet";
  std::filesystem::remove_all(path.parent_path());

  SECTION("standardized records") {
    const auto records = make_standardized_records();
    const auto num_records =
        write_records<StandardizedRecord>(path, records, {.chunk_size = 7});
    CHECK(num_records == records.size());

    RecordFileReader reader{path};
    CHECK(reader.path() == path);
    CHECK(reader.record_type() == RecordType::standardized);
    CHECK(reader.metadata().empty());
    CHECK(reader.read_all<StandardizedRecord>() == records);
  }

  SECTION("aggregated records") {
    const std::vector<AggregatedRecord> records{
        {"bh", 0.05, Metric::FDR, 0.04, 0.01, 10},
        {"bh", 0.05, Metric::TPR, 0.8, 0.05, 10},
        {"holm", 0.1, Metric::rejections, 12.0, std::numeric_limits<double>::quiet_NaN(), 1}};
    write_records<AggregatedRecord>(path, records);

    RecordFileReader reader{path};
    CHECK(reader.record_type() == RecordType::aggregated);
    const auto found = reader.read_all<AggregatedRecord>();
    REQUIRE(found.size() == records.size());
    for (std::size_t i = 0; i < 2; ++i) {
      CHECK(found[i] == records[i]);
    }
    CHECK(found[2].method == "holm");
    CHECK(found[2].metric == Metric::rejections);
    CHECK(std::isnan(found[2].standard_error));
    CHECK(found[2].num_replicates == 1);
  }

  SECTION("failure summaries") {
    const std::vector<MethodFailureSummary> records{{"bh", 0, 10, 0.0},
                                                    {"stratified-bh", 3, 10, 0.3}};
    write_records<MethodFailureSummary>(path, records, {.compression_method = "lz4"});

    RecordFileReader reader{path};
    CHECK(reader.record_type() == RecordType::failure_summary);

    MethodFailureSummary record{};
    REQUIRE(reader.read(record));
    CHECK(record.method == "bh");
    CHECK(record.num_failed == 0);
    REQUIRE(reader.read(record));
    CHECK(record.method == "stratified-bh");
    CHECK(record.num_failed == 3);
    CHECK(record.num_replicates == 10);
    CHECK(record.failure_rate == 0.3);
    CHECK_FALSE(reader.read(record));
  }

  SECTION("empty file") {
    write_records<StandardizedRecord>(path, std::vector<StandardizedRecord>{});
    RecordFileReader reader{path};
    CHECK(reader.read_all<StandardizedRecord>().empty());
  }

  SECTION("metadata") {
    const std::string metadata{R"({"seed":1234,"replicates":100})"};
    write_records<StandardizedRecord>(path, make_standardized_records(),
                                      {.metadata = metadata});
    CHECK(RecordFileReader{path}.metadata() == metadata);
  }

  SECTION("large metadata") {
    std::string metadata{"{\"alphas\":["};
    for (std::size_t i = 0; i < 1000; ++i) {
      metadata += fmt::format("{}0.{},", i == 0 ? "" : " ", i);
    }
    metadata.back() = ']';
    metadata += "}";
    REQUIRE(metadata.size() > 1024);

    write_records<StandardizedRecord>(path, make_standardized_records(),
                                      {.metadata = metadata});
    CHECK(RecordFileReader{path}.metadata() == metadata);
  }

  SECTION("record type mismatch") {
    write_records<StandardizedRecord>(path, make_standardized_records());
    RecordFileReader reader{path};
    AggregatedRecord record{};
    CHECK_THROWS_AS(reader.read(record), std::runtime_error);
  }

  SECTION("existing files") {
    const auto records = make_standardized_records();
    write_records<StandardizedRecord>(path, records);
    CHECK_THROWS_AS(write_records<StandardizedRecord>(path, records), std::runtime_error);
    CHECK(RecordFileReader{path}.read_all<StandardizedRecord>() == records);

    const std::vector<StandardizedRecord> records2{{0, "bh", 0.05, Metric::FDR, 0.1}};
    write_records<StandardizedRecord>(path, records2, {.force = true});
    CHECK(RecordFileReader{path}.read_all<StandardizedRecord>() == records2);
  }

  SECTION("writer") {
    SECTION("files that are not finalized are removed") {
      {
        RecordFileWriter<StandardizedRecord> writer{path, {}};
        writer.append(make_standardized_records().front());
        CHECK(writer.size() == 1);
        CHECK(std::filesystem::exists(path));
      }
      CHECK_FALSE(std::filesystem::exists(path));
    }

    SECTION("finalize") {
      RecordFileWriter<StandardizedRecord> writer{path, {}};
      writer.finalize();
      CHECK(std::filesystem::exists(path));
      CHECK_THROWS_AS(writer.finalize(), std::logic_error);
      CHECK_THROWS_AS(writer.append({}), std::logic_error);
    }

    SECTION("invalid options") {
      CHECK_THROWS_AS(RecordFileWriter<StandardizedRecord>(path, {.chunk_size = 0}),
                      std::invalid_argument);
      CHECK_THROWS_AS(RecordFileWriter<StandardizedRecord>(path, {.compression_method = "gzip"}),
                      std::runtime_error);
      CHECK_FALSE(std::filesystem::exists(path));
    }
  }

  SECTION("invalid files") {
    CHECK_THROWS(RecordFileReader{testdir() / "record_file" / "missing.parquet"});
  }
}

TEST_CASE("RecordType", "[short][io][record_file]") {
  for (const auto type :
       {RecordType::standardized, RecordType::aggregated, RecordType::failure_summary}) {
    CHECK(parse_record_type(to_string(type)) == type);
  }
  CHECK(to_string(RecordType::failure_summary) == "failure-summary");
  CHECK_THROWS_AS(parse_record_type("foo"), std::invalid_argument);

  CHECK(parse_parquet_compression("zstd") == parquet::Compression::ZSTD);
  CHECK(parse_parquet_compression("lz4") == parquet::Compression::LZ4);
  CHECK_THROWS_AS(parse_parquet_compression("gzip"), std::runtime_error);
}
// NOLINTEND(*-avoid-magic-numbers, readability-magic-numbers, readability-function-cognitive-complexity)

}  // namespace fdrbench::test
