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
#include <arrow/memory_pool.h>
#include <parquet/arrow/writer.h>
#include <parquet/exception.h>
#include <parquet/properties.h>
#include <parquet/stream_reader.h>
FDRBENCH_DISABLE_WARNING_POP
// clang-format on

#include <fmt/format.h>
#include <fmt/std.h>
#include <spdlog/spdlog.h>

#include <concepts>
#include <cstddef>
#include <cstdint>
#include <exception>
#include <filesystem>
#include <span>
#include <stdexcept>
#include <string>
#include <system_error>
#include <utility>
#include <vector>

namespace fdrbench {

template <typename Record>
inline RecordFileWriter<Record>::RecordFileWriter(std::filesystem::path path,
                                                  const RecordFileOptions& options)
    : _path(std::move(path)),
      _schema(get_schema(RecordBatchBuilder<Record>::record_type,
                         make_schema_metadata(RecordBatchBuilder<Record>::record_type,
                                              options.metadata))),
      _chunk_capacity(options.chunk_size) {
  if (_chunk_capacity == 0) {
    throw std::invalid_argument("chunk_size cannot be 0");
  }

  const auto props = make_writer_properties(options);
  _fp = create_parquet_file(_path, options.force);

  try {
    const auto arrow_properties =
        parquet::ArrowWriterProperties::Builder().store_schema()->build();
    PARQUET_ASSIGN_OR_THROW(_writer,
                            parquet::arrow::FileWriter::Open(*_schema, arrow::default_memory_pool(),
                                                             _fp, props, arrow_properties));
  } catch (const std::exception& e) {
    _fp.reset();
    std::error_code ec{};
    std::filesystem::remove(_path, ec);
    throw std::runtime_error(
        fmt::format("failed to initialize the file writer for file {}: {}", _path, e.what()));
  }
}

template <typename Record>
inline RecordFileWriter<Record>::~RecordFileWriter() noexcept {
  if (!_fp) {
    return;
  }

  try {
    SPDLOG_DEBUG("removing file {} because it was never finalized...", _path);
    _writer.reset();
    _fp.reset();
    std::filesystem::remove(_path);  // NOLINT
  } catch (const std::exception& e) {
    SPDLOG_ERROR("failed to remove file {}: {}", _path, e.what());
  } catch (...) {
    SPDLOG_ERROR("failed to remove file {}: unknown error", _path);
  }
}

template <typename Record>
inline const std::filesystem::path& RecordFileWriter<Record>::path() const noexcept {
  return _path;
}

template <typename Record>
inline std::size_t RecordFileWriter<Record>::size() const noexcept {
  return _size;
}

template <typename Record>
inline void RecordFileWriter<Record>::append(const Record& r) {
  if (!_writer) [[unlikely]] {
    throw std::logic_error("append() was called on a RecordFileWriter that has been finalized");
  }

  if (_builder.size() == _chunk_capacity) {
    write_chunk();
  }

  _builder.append(r);
  ++_size;
}

template <typename Record>
inline void RecordFileWriter<Record>::finalize() {
  if (!_writer) {
    throw std::logic_error(
        "finalize() was called on a RecordFileWriter instance that has already been finalized!");
  }

  if (_builder.size() != 0) {
    write_chunk();
  }

  PARQUET_THROW_NOT_OK(_writer->Close());
  PARQUET_THROW_NOT_OK(_fp->Close());
  _writer.reset();
  _fp.reset();
  SPDLOG_DEBUG("written {} {} records to file {}", _size,
               to_string(RecordBatchBuilder<Record>::record_type), _path);
}

template <typename Record>
inline void RecordFileWriter<Record>::write_chunk() {
  try {
    _builder.write(*_writer, _schema);
  } catch (const std::exception& e) {
    throw std::runtime_error(
        fmt::format("failed to write record batch to file {}: {}", _path, e.what()));
  }
}

template <typename Record>
inline std::size_t write_records(const std::filesystem::path& path,
                                 std::span<const Record> records,
                                 const RecordFileOptions& options) {
  RecordFileWriter<Record> writer(path, options);
  for (const auto& record : records) {
    writer.append(record);
  }
  writer.finalize();
  return writer.size();
}

template <typename Record>
inline void RecordFileReader::validate_record_type() const {
  constexpr auto expected_type = RecordBatchBuilder<Record>::record_type;
  if (_record_type != expected_type) {
    throw std::runtime_error(fmt::format(
        "file {} contains {} records: unable to read them as {} records", _path,
        to_string(_record_type), to_string(expected_type)));
  }
}

template <typename Record>
inline bool RecordFileReader::read(Record& record) {
  validate_record_type<Record>();
  if (_sr->eof()) {
    return false;
  }

  auto& sr = *_sr;
  if constexpr (std::same_as<Record, StandardizedRecord>) {
    std::uint64_t replicate{};
    std::string metric{};
    sr >> replicate >> record.method >> record.alpha >> metric >> record.value >> parquet::EndRow;
    record.replicate = static_cast<std::size_t>(replicate);
    record.metric = parse_metric(metric);
  } else if constexpr (std::same_as<Record, AggregatedRecord>) {
    std::string metric{};
    std::uint64_t num_replicates{};
    sr >> record.method >> record.alpha >> metric >> record.mean >> record.standard_error >>
        num_replicates >> parquet::EndRow;
    record.metric = parse_metric(metric);
    record.num_replicates = static_cast<std::size_t>(num_replicates);
  } else {
    static_assert(std::same_as<Record, MethodFailureSummary>);
    std::uint64_t num_failed{};
    std::uint64_t num_replicates{};
    sr >> record.method >> num_failed >> num_replicates >> record.failure_rate >> parquet::EndRow;
    record.num_failed = static_cast<std::size_t>(num_failed);
    record.num_replicates = static_cast<std::size_t>(num_replicates);
  }

  return true;
}

template <typename Record>
inline std::vector<Record> RecordFileReader::read_all() {
  std::vector<Record> records{};
  Record record{};
  while (read(record)) {
    records.push_back(record);
  }
  return records;
}

}  // namespace fdrbench
