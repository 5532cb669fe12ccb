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

#include "fdrbench/record_batch_builder.hpp"

// clang-format off
#include "fdrbench/suppress_warnings.hpp"
FDRBENCH_DISABLE_WARNING_PUSH
FDRBENCH_DISABLE_WARNING_DEPRECATED_DECLARATIONS
#include <arrow/array/array_base.h>
#include <arrow/builder.h>
#include <arrow/record_batch.h>
#include <parquet/arrow/writer.h>
FDRBENCH_DISABLE_WARNING_POP
// clang-format on

#include <cstddef>
#include <cstdint>
#include <memory>
#include <stdexcept>
#include <string_view>
#include <vector>

#include "fdrbench/aggregator.hpp"
#include "fdrbench/replication_driver.hpp"
#include "fdrbench/standardizer.hpp"

namespace fdrbench {

namespace internal {

template <typename ArrayBuilder, typename T>
void append(ArrayBuilder& builder, const T& data) {
  const auto status = builder.Append(data);
  if (!status.ok()) {
    throw std::runtime_error(status.ToString());
  }
}

template <typename ArrayBuilder>
std::shared_ptr<arrow::Array> finish(ArrayBuilder& builder) {
  auto result = builder.Finish();
  if (!result.status().ok()) {
    throw std::runtime_error(result.status().ToString());
  }

  return result.MoveValueUnsafe();
}

}  // namespace internal

static void write_batch(parquet::arrow::FileWriter& writer, const arrow::RecordBatch& batch) {
  const auto status = writer.WriteRecordBatch(batch);
  if (!status.ok()) {
    throw std::runtime_error(status.ToString());
  }
}

std::size_t RecordBatchBuilder<StandardizedRecord>::size() const noexcept { return _i; }

void RecordBatchBuilder<StandardizedRecord>::append(const StandardizedRecord& r) {
  internal::append(_replicate, static_cast<std::uint64_t>(r.replicate));
  internal::append(_method, std::string_view{r.method});
  internal::append(_alpha, r.alpha);
  internal::append(_metric, to_string(r.metric));
  internal::append(_value, r.value);
  ++_i;
}

void RecordBatchBuilder<StandardizedRecord>::reset() {
  _replicate.Reset();
  _method.Reset();
  _alpha.Reset();
  _metric.Reset();
  _value.Reset();

  _i = 0;
}

std::shared_ptr<arrow::RecordBatch> RecordBatchBuilder<StandardizedRecord>::get(
    const std::shared_ptr<arrow::Schema>& schema) {
  std::vector<std::shared_ptr<arrow::Array>> columns{};
  columns.reserve(5);

  columns.emplace_back(internal::finish(_replicate));
  columns.emplace_back(internal::finish(_method));
  columns.emplace_back(internal::finish(_alpha));
  columns.emplace_back(internal::finish(_metric));
  columns.emplace_back(internal::finish(_value));

  return arrow::RecordBatch::Make(schema, static_cast<std::int64_t>(size()), columns);
}

void RecordBatchBuilder<StandardizedRecord>::write(parquet::arrow::FileWriter& writer,
                                                   const std::shared_ptr<arrow::Schema>& schema) {
  write_batch(writer, *get(schema));
  reset();
}

std::size_t RecordBatchBuilder<AggregatedRecord>::size() const noexcept { return _i; }

void RecordBatchBuilder<AggregatedRecord>::append(const AggregatedRecord& r) {
  internal::append(_method, std::string_view{r.method});
  internal::append(_alpha, r.alpha);
  internal::append(_metric, to_string(r.metric));
  internal::append(_mean, r.mean);
  internal::append(_standard_error, r.standard_error);
  internal::append(_num_replicates, static_cast<std::uint64_t>(r.num_replicates));
  ++_i;
}

void RecordBatchBuilder<AggregatedRecord>::reset() {
  _method.Reset();
  _alpha.Reset();
  _metric.Reset();
  _mean.Reset();
  _standard_error.Reset();
  _num_replicates.Reset();

  _i = 0;
}

std::shared_ptr<arrow::RecordBatch> RecordBatchBuilder<AggregatedRecord>::get(
    const std::shared_ptr<arrow::Schema>& schema) {
  std::vector<std::shared_ptr<arrow::Array>> columns{};
  columns.reserve(6);

  columns.emplace_back(internal::finish(_method));
  columns.emplace_back(internal::finish(_alpha));
  columns.emplace_back(internal::finish(_metric));
  columns.emplace_back(internal::finish(_mean));
  columns.emplace_back(internal::finish(_standard_error));
  columns.emplace_back(internal::finish(_num_replicates));

  return arrow::RecordBatch::Make(schema, static_cast<std::int64_t>(size()), columns);
}

void RecordBatchBuilder<AggregatedRecord>::write(parquet::arrow::FileWriter& writer,
                                                 const std::shared_ptr<arrow::Schema>& schema) {
  write_batch(writer, *get(schema));
  reset();
}

std::size_t RecordBatchBuilder<MethodFailureSummary>::size() const noexcept { return _i; }

void RecordBatchBuilder<MethodFailureSummary>::append(const MethodFailureSummary& r) {
  internal::append(_method, std::string_view{r.method});
  internal::append(_num_failed, static_cast<std::uint64_t>(r.num_failed));
  internal::append(_num_replicates, static_cast<std::uint64_t>(r.num_replicates));
  internal::append(_failure_rate, r.failure_rate);
  ++_i;
}

void RecordBatchBuilder<MethodFailureSummary>::reset() {
  _method.Reset();
  _num_failed.Reset();
  _num_replicates.Reset();
  _failure_rate.Reset();

  _i = 0;
}

std::shared_ptr<arrow::RecordBatch> RecordBatchBuilder<MethodFailureSummary>::get(
    const std::shared_ptr<arrow::Schema>& schema) {
  std::vector<std::shared_ptr<arrow::Array>> columns{};
  columns.reserve(4);

  columns.emplace_back(internal::finish(_method));
  columns.emplace_back(internal::finish(_num_failed));
  columns.emplace_back(internal::finish(_num_replicates));
  columns.emplace_back(internal::finish(_failure_rate));

  return arrow::RecordBatch::Make(schema, static_cast<std::int64_t>(size()), columns);
}

void RecordBatchBuilder<MethodFailureSummary>::write(
    parquet::arrow::FileWriter& writer, const std::shared_ptr<arrow::Schema>& schema) {
  write_batch(writer, *get(schema));
  reset();
}

}  // namespace fdrbench
