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
#include <arrow/io/file.h>
#include <arrow/type_fwd.h>
#include <parquet/arrow/writer.h>
#include <parquet/properties.h>
#include <parquet/stream_reader.h>
FDRBENCH_DISABLE_WARNING_POP
// clang-format on

#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <memory>
#include <span>
#include <string>
#include <vector>

#include "fdrbench/aggregator.hpp"
#include "fdrbench/parquet_helpers.hpp"
#include "fdrbench/record_batch_builder.hpp"
#include "fdrbench/replication_driver.hpp"
#include "fdrbench/standardizer.hpp"

namespace fdrbench {

struct RecordFileOptions {
  bool force{false};
  std::string compression_method{"zstd"};
  std::uint8_t compression_lvl{9};
  // JSON document stored in the file schema
  std::string metadata{};
  std::size_t chunk_size{1'000'000};
};

template <typename Record>
class RecordFileWriter {
  std::filesystem::path _path;
  std::shared_ptr<arrow::Schema> _schema;
  std::shared_ptr<arrow::io::FileOutputStream> _fp;
  std::unique_ptr<parquet::arrow::FileWriter> _writer;
  RecordBatchBuilder<Record> _builder{};

  std::size_t _chunk_capacity{};
  std::size_t _size{};

 public:
  RecordFileWriter(std::filesystem::path path, const RecordFileOptions& options);
  RecordFileWriter(const RecordFileWriter& other) = delete;
  RecordFileWriter(RecordFileWriter&& other) noexcept = delete;

  ~RecordFileWriter() noexcept;

  RecordFileWriter& operator=(const RecordFileWriter& other) = delete;
  RecordFileWriter& operator=(RecordFileWriter&& other) noexcept = delete;

  [[nodiscard]] const std::filesystem::path& path() const noexcept;
  [[nodiscard]] std::size_t size() const noexcept;

  void append(const Record& r);

  // If finalize() is not called before a RecordFileWriter object goes out of scope
  // the underlying file will be removed by the destructor
  void finalize();

 private:
  void write_chunk();
};

template <typename Record>
std::size_t write_records(const std::filesystem::path& path, std::span<const Record> records,
                          const RecordFileOptions& options = {});

class RecordFileReader {
  std::filesystem::path _path{};
  RecordType _record_type{};
  std::string _metadata{};
  std::shared_ptr<parquet::StreamReader> _sr{};

 public:
  explicit RecordFileReader(std::filesystem::path path, std::size_t buffer_size = 1'000'000);

  [[nodiscard]] const std::filesystem::path& path() const noexcept;
  [[nodiscard]] RecordType record_type() const noexcept;
  [[nodiscard]] const std::string& metadata() const noexcept;

  // Read the next record. Returns false once all records have been read.
  // Throws std::runtime_error when Record does not match the record type stored in the file
  template <typename Record>
  [[nodiscard]] bool read(Record& record);

  template <typename Record>
  [[nodiscard]] std::vector<Record> read_all();

 private:
  template <typename Record>
  void validate_record_type() const;
};

// Create the parent directories of path and open it for writing.
// Throws when path exists and force is false
[[nodiscard]] std::shared_ptr<arrow::io::FileOutputStream> create_parquet_file(
    const std::filesystem::path& path, bool force);
[[nodiscard]] std::shared_ptr<parquet::WriterProperties> make_writer_properties(
    const RecordFileOptions& options);

}  // namespace fdrbench

#include "../../record_file_impl.hpp"
