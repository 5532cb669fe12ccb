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

// clang-format off
#include "fdrbench/suppress_warnings.hpp"
FDRBENCH_DISABLE_WARNING_PUSH
FDRBENCH_DISABLE_WARNING_DEPRECATED_DECLARATIONS
#include <arrow/builder.h>
#include <arrow/record_batch.h>
#include <arrow/type_fwd.h>
#include <parquet/arrow/writer.h>
FDRBENCH_DISABLE_WARNING_POP
// clang-format on

#include <cstddef>
#include <memory>

#include "fdrbench/aggregator.hpp"
#include "fdrbench/parquet_helpers.hpp"
#include "fdrbench/replication_driver.hpp"
#include "fdrbench/standardizer.hpp"

namespace fdrbench {

// Accumulate records of type Record into Arrow arrays matching get_schema(record_type)
template <typename Record>
class RecordBatchBuilder;

template <>
class RecordBatchBuilder<StandardizedRecord> {
  std::size_t _i{};

  arrow::UInt64Builder _replicate{};
  arrow::StringDictionary32Builder _method{};
  arrow::DoubleBuilder _alpha{};
  arrow::StringDictionary32Builder _metric{};
  arrow::DoubleBuilder _value{};

 public:
  static constexpr auto record_type = RecordType::standardized;

  [[nodiscard]] std::size_t size() const noexcept;
  void append(const StandardizedRecord& r);
  void reset();

  [[nodiscard]] std::shared_ptr<arrow::RecordBatch> get(
      const std::shared_ptr<arrow::Schema>& schema);
  void write(parquet::arrow::FileWriter& writer, const std::shared_ptr<arrow::Schema>& schema);
};

template <>
class RecordBatchBuilder<AggregatedRecord> {
  std::size_t _i{};

  arrow::StringDictionary32Builder _method{};
  arrow::DoubleBuilder _alpha{};
  arrow::StringDictionary32Builder _metric{};
  arrow::DoubleBuilder _mean{};
  arrow::DoubleBuilder _standard_error{};
  arrow::UInt64Builder _num_replicates{};

 public:
  static constexpr auto record_type = RecordType::aggregated;

  [[nodiscard]] std::size_t size() const noexcept;
  void append(const AggregatedRecord& r);
  void reset();

  [[nodiscard]] std::shared_ptr<arrow::RecordBatch> get(
      const std::shared_ptr<arrow::Schema>& schema);
  void write(parquet::arrow::FileWriter& writer, const std::shared_ptr<arrow::Schema>& schema);
};

template <>
class RecordBatchBuilder<MethodFailureSummary> {
  std::size_t _i{};

  arrow::StringDictionary32Builder _method{};
  arrow::UInt64Builder _num_failed{};
  arrow::UInt64Builder _num_replicates{};
  arrow::DoubleBuilder _failure_rate{};

 public:
  static constexpr auto record_type = RecordType::failure_summary;

  [[nodiscard]] std::size_t size() const noexcept;
  void append(const MethodFailureSummary& r);
  void reset();

  [[nodiscard]] std::shared_ptr<arrow::RecordBatch> get(
      const std::shared_ptr<arrow::Schema>& schema);
  void write(parquet::arrow::FileWriter& writer, const std::shared_ptr<arrow::Schema>& schema);
};

}  // namespace fdrbench
