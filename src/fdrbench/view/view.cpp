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

#include <fmt/compile.h>
#include <fmt/format.h>

#include <algorithm>
#include <iterator>
#include <string>
#include <string_view>
#include <vector>

#include "fdrbench/aggregator.hpp"
#include "fdrbench/common.hpp"
#include "fdrbench/parquet_helpers.hpp"
#include "fdrbench/record_file.hpp"
#include "fdrbench/replication_driver.hpp"
#include "fdrbench/standardizer.hpp"
#include "fdrbench/tools/config.hpp"
#include "fdrbench/tools/tools.hpp"

namespace fdrbench {

namespace {

class RecordFilter {
  std::vector<std::string> _methods{};
  std::vector<Metric> _metrics{};

 public:
  explicit RecordFilter(const ViewConfig& c) : _methods(c.methods) {
    std::ranges::transform(c.metrics, std::back_inserter(_metrics),
                           [](const auto& name) { return parse_metric(name); });
  }

  [[nodiscard]] bool keep(std::string_view method) const {
    return _methods.empty() || std::ranges::find(_methods, method) != _methods.end();
  }

  [[nodiscard]] bool keep(std::string_view method, Metric metric) const {
    return keep(method) && (_metrics.empty() || std::ranges::contains(_metrics, metric));
  }
};

}  // namespace

static void print_header(RecordType type) {
  switch (type) {
    case RecordType::standardized:
      fmt::print("replicate\tmethod\talpha\tmetric\tvalue\n");
      return;
    case RecordType::aggregated:
      fmt::print("method\talpha\tmetric\tmean\tstandard_error\tnum_replicates\n");
      return;
    case RecordType::failure_summary:
      fmt::print("method\tnum_failed\tnum_replicates\tfailure_rate\n");
      return;
  }
  unreachable_code();
}

static void process_record(const StandardizedRecord& record, const RecordFilter& filter) {
  if (filter.keep(record.method, record.metric)) {
    fmt::print(FMT_COMPILE("{:d}\t{:s}\t{:g}\t{}\t{:g}\n"), record.replicate, record.method,
               record.alpha, record.metric, record.value);
  }
}

static void process_record(const AggregatedRecord& record, const RecordFilter& filter) {
  if (filter.keep(record.method, record.metric)) {
    fmt::print(FMT_COMPILE("{:s}\t{:g}\t{}\t{:g}\t{:g}\t{:d}\n"), record.method, record.alpha,
               record.metric, record.mean, record.standard_error, record.num_replicates);
  }
}

static void process_record(const MethodFailureSummary& record, const RecordFilter& filter) {
  if (filter.keep(record.method)) {
    fmt::print(FMT_COMPILE("{:s}\t{:d}\t{:d}\t{:g}\n"), record.method, record.num_failed,
               record.num_replicates, record.failure_rate);
  }
}

template <typename Record>
[[nodiscard]] static int process_records(RecordFileReader& reader, const ViewConfig& c) {
  const RecordFilter filter{c};

  if (c.with_header) {
    print_header(reader.record_type());
  }

  Record record{};
  while (reader.read(record)) {
    process_record(record, filter);
  }
  return 0;
}

int run_command(const ViewConfig& c) {
  RecordFileReader reader{c.input_path};

  switch (reader.record_type()) {
    case RecordType::standardized:
      return process_records<StandardizedRecord>(reader, c);
    case RecordType::aggregated:
      return process_records<AggregatedRecord>(reader, c);
    case RecordType::failure_summary:
      return process_records<MethodFailureSummary>(reader, c);
  }
  unreachable_code();
}

}  // namespace fdrbench
