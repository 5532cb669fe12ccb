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

// clang-format off
#include "fdrbench/suppress_warnings.hpp"
FDRBENCH_DISABLE_WARNING_PUSH
FDRBENCH_DISABLE_WARNING_DEPRECATED_DECLARATIONS
#include <arrow/io/file.h>
#include <arrow/memory_pool.h>
#include <arrow/record_batch.h>
#include <arrow/type.h>
#include <parquet/arrow/reader.h>
#include <parquet/exception.h>
#include <parquet/file_reader.h>
#include <parquet/properties.h>
#include <parquet/stream_reader.h>
FDRBENCH_DISABLE_WARNING_POP
// clang-format on

#include <fmt/format.h>
#include <fmt/std.h>
#include <spdlog/spdlog.h>

#include <cstddef>
#include <cstdint>
#include <exception>
#include <filesystem>
#include <memory>
#include <stdexcept>
#include <string>
#include <utility>

#include "fdrbench/parquet_helpers.hpp"
#include "fdrbench/version.hpp"

namespace fdrbench {

std::shared_ptr<arrow::io::FileOutputStream> create_parquet_file(const std::filesystem::path& path,
                                                                 bool force) {
  const auto output_dir = path.parent_path();
  if (!output_dir.empty() && !std::filesystem::exists(output_dir)) {
    std::filesystem::create_directories(output_dir);
  }

  if (force) {
    std::filesystem::remove(path);  // NOLINT
  } else if (std::filesystem::exists(path)) {
    throw std::runtime_error(
        fmt::format("refusing to overwrite output file {}. Pass --force to overwrite.", path));
  }

  SPDLOG_DEBUG("initializing file {}...", path);

  std::shared_ptr<arrow::io::FileOutputStream> f{};
  PARQUET_ASSIGN_OR_THROW(f, arrow::io::FileOutputStream::Open(path.string()));
  return f;
}

std::shared_ptr<parquet::WriterProperties> make_writer_properties(
    const RecordFileOptions& options) {
  return parquet::WriterProperties::Builder()
      .created_by(std::string{config::version::str_long()})
      ->version(parquet::ParquetVersion::PARQUET_2_6)
      ->data_page_version(parquet::ParquetDataPageVersion::V2)
      ->compression(parse_parquet_compression(options.compression_method))
      ->compression_level(options.compression_lvl)
      ->max_row_group_length(500'000)
      ->enable_statistics()
      ->build();
}

[[nodiscard]] static std::shared_ptr<arrow::io::ReadableFile> open_parquet_file(
    const std::filesystem::path& path) {
  try {
    std::shared_ptr<arrow::io::ReadableFile> fp;
    PARQUET_ASSIGN_OR_THROW(fp, arrow::io::ReadableFile::Open(path.string()))
    return fp;
  } catch (const std::exception& e) {
    throw std::runtime_error(
        fmt::format("failed to open file {} for reading: {}", path, e.what()));
  }
}

[[nodiscard]] static std::shared_ptr<arrow::Schema> get_file_schema(
    const std::shared_ptr<arrow::io::ReadableFile>& fp) {
  try {
    auto result = parquet::arrow::OpenFile(fp, arrow::default_memory_pool());
    if (!result.ok()) {
      throw std::runtime_error(result.status().ToString());
    }
    const auto reader = result.MoveValueUnsafe();

    std::shared_ptr<arrow::Schema> schema{};
    const auto status = reader->GetSchema(&schema);
    if (!status.ok()) {
      throw std::runtime_error(status.ToString());
    }
    return schema;
  } catch (const std::exception& e) {
    throw std::runtime_error(fmt::format("failed to read file schema: {}", e.what()));
  }
}

[[nodiscard]] static std::shared_ptr<parquet::StreamReader> init_parquet_stream_reader(
    std::shared_ptr<arrow::io::ReadableFile> fp, std::size_t buffer_size) {
  if (buffer_size == 0) {
    throw std::invalid_argument("buffer_size cannot be 0");
  }
  auto props = parquet::default_reader_properties();
  props.set_buffer_size(static_cast<std::int64_t>(buffer_size));

  auto reader = parquet::ParquetFileReader::Open(std::move(fp), props);
  return std::make_shared<parquet::StreamReader>(std::move(reader));
}

RecordFileReader::RecordFileReader(std::filesystem::path path, std::size_t buffer_size)
    : _path(std::move(path)) {
  auto fp = open_parquet_file(_path);
  try {
    const auto schema = get_file_schema(fp);
    _record_type = read_record_type(*schema);
    _metadata = read_metadata(*schema);
  } catch (const std::exception& e) {
    throw std::runtime_error(
        fmt::format("file {} is not a valid fdrbench record file: {}", _path, e.what()));
  }
  _sr = init_parquet_stream_reader(std::move(fp), buffer_size);
}

const std::filesystem::path& RecordFileReader::path() const noexcept { return _path; }

RecordType RecordFileReader::record_type() const noexcept { return _record_type; }

const std::string& RecordFileReader::metadata() const noexcept { return _metadata; }

}  // namespace fdrbench
