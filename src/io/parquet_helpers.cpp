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

#include "fdrbench/parquet_helpers.hpp"

// clang-format off
#include "fdrbench/suppress_warnings.hpp"
FDRBENCH_DISABLE_WARNING_PUSH
FDRBENCH_DISABLE_WARNING_DEPRECATED_DECLARATIONS
#include <arrow/type.h>
#include <arrow/util/base64.h>
#include <arrow/util/key_value_metadata.h>
#include <parquet/platform.h>
FDRBENCH_DISABLE_WARNING_POP
// clang-format on

#include <fmt/format.h>
#include <zstd.h>

#include <charconv>
#include <cstddef>
#include <memory>
#include <stdexcept>
#include <string>
#include <string_view>
#include <system_error>
#include <utility>
#include <vector>

#include "fdrbench/common.hpp"

namespace fdrbench {

std::string_view to_string(RecordType type) noexcept {
  using enum RecordType;
  switch (type) {
    case standardized:
      return "standardized";
    case aggregated:
      return "aggregated";
    case failure_summary:
      return "failure-summary";
  }
  unreachable_code();
}

RecordType parse_record_type(std::string_view name) {
  using enum RecordType;
  for (const auto type : {standardized, aggregated, failure_summary}) {
    if (to_string(type) == name) {
      return type;
    }
  }
  throw std::invalid_argument(fmt::format("unknown record type \"{}\"", name));
}

[[nodiscard]] static std::shared_ptr<const arrow::KeyValueMetadata> make_schema_metadata(
    RecordType type, std::string metadata, std::string_view compression, std::size_t size) {
  // clang-format off
  return arrow::KeyValueMetadata::Make(
      {
        "fdrbench:format-version",
        "fdrbench:record-type",
        "fdrbench:metadata",
        "fdrbench:metadata-compression",
        "fdrbench:metadata-size"
      },
      {
        fmt::to_string(record_file_format_version),
        std::string{to_string(type)},
        std::move(metadata),
        std::string{compression},
        fmt::to_string(size)
      }
  );
  // clang-format on
}

std::shared_ptr<const arrow::KeyValueMetadata> make_schema_metadata(RecordType type,
                                                                    const std::string& metadata) {
  if (metadata.size() < 1024) {
    return make_schema_metadata(type, metadata, "None", metadata.size());
  }

  std::string buffer(ZSTD_compressBound(metadata.size()), '\0');
  const auto compressed_size =
      ZSTD_compress(static_cast<void*>(buffer.data()), buffer.size(),
                    static_cast<const void*>(metadata.data()), metadata.size(), 19);
  if (ZSTD_isError(compressed_size)) {  // NOLINT(*-implicit-bool-conversion)
    throw std::runtime_error(fmt::format("failed to compress metadata using zstd: {}",
                                         ZSTD_getErrorName(compressed_size)));
  }

  buffer.resize(compressed_size);
  auto buffer64 = arrow::util::base64_encode(buffer);
  if (buffer64.size() >= metadata.size()) {
    return make_schema_metadata(type, metadata, "None", metadata.size());
  }
  return make_schema_metadata(type, std::move(buffer64), "zstd", metadata.size());
}

std::shared_ptr<arrow::Schema> get_schema(RecordType type,
                                          std::shared_ptr<const arrow::KeyValueMetadata> metadata) {
  const auto str_dtype = arrow::dictionary(arrow::int32(), arrow::utf8());

  switch (type) {
    case RecordType::standardized:
      return arrow::schema(
          {
              // clang-format off
              arrow::field("replicate", arrow::uint64(),  false),
              arrow::field("method",    str_dtype,        false),
              arrow::field("alpha",     arrow::float64(), false),
              arrow::field("metric",    str_dtype,        false),
              arrow::field("value",     arrow::float64(), false)
              // clang-format on
          },
          std::move(metadata));
    case RecordType::aggregated:
      return arrow::schema(
          {
              // clang-format off
              arrow::field("method",         str_dtype,        false),
              arrow::field("alpha",          arrow::float64(), false),
              arrow::field("metric",         str_dtype,        false),
              arrow::field("mean",           arrow::float64(), false),
              arrow::field("standard_error", arrow::float64(), false),
              arrow::field("num_replicates", arrow::uint64(),  false)
              // clang-format on
          },
          std::move(metadata));
    case RecordType::failure_summary:
      return arrow::schema(
          {
              // clang-format off
              arrow::field("method",         str_dtype,        false),
              arrow::field("num_failed",     arrow::uint64(),  false),
              arrow::field("num_replicates", arrow::uint64(),  false),
              arrow::field("failure_rate",   arrow::float64(), false)
              // clang-format on
          },
          std::move(metadata));
  }
  unreachable_code();
}

parquet::Compression::type parse_parquet_compression(std::string_view method) {
  if (method == "zstd") {
    return parquet::Compression::ZSTD;
  }
  if (method == "lz4") {
    return parquet::Compression::LZ4;
  }
  throw std::runtime_error(fmt::format("unrecognized compression method \"{}\"", method));
}

[[nodiscard]] static std::string read_attribute_or_throw(const arrow::Schema& schema,
                                                         std::string_view key) {
  const auto& metadata = schema.metadata();
  const auto i = metadata ? metadata->FindKey(std::string{key}) : -1;
  if (i == -1) {
    throw std::runtime_error(fmt::format("failed to read {} attribute: key not found", key));
  }
  return metadata->value(i);
}

[[nodiscard]] static std::size_t parse_size(std::string_view key, std::string_view tok) {
  std::size_t value{};
  const auto* last = tok.data() + tok.size();
  const auto [ptr, ec] = std::from_chars(tok.data(), last, value);
  if (ec != std::errc{} || ptr != last) {
    throw std::runtime_error(
        fmt::format("failed to parse {} attribute: \"{}\" is not a number", key, tok));
  }
  return value;
}

RecordType read_record_type(const arrow::Schema& schema) {
  const auto version = parse_size(
      "fdrbench:format-version", read_attribute_or_throw(schema, "fdrbench:format-version"));
  if (version != record_file_format_version) {
    throw std::runtime_error(
        fmt::format("unsupported format version: expected {}, found {}",
                    record_file_format_version, version));
  }

  try {
    return parse_record_type(read_attribute_or_throw(schema, "fdrbench:record-type"));
  } catch (const std::invalid_argument& e) {
    throw std::runtime_error(fmt::format("failed to read record type: {}", e.what()));
  }
}

std::string read_metadata(const arrow::Schema& schema) {
  const auto compression = read_attribute_or_throw(schema, "fdrbench:metadata-compression");
  auto metadata = read_attribute_or_throw(schema, "fdrbench:metadata");

  if (compression == "None") {
    return metadata;
  }

  if (compression == "zstd") {
    const auto buffer_size = parse_size(
        "fdrbench:metadata-size", read_attribute_or_throw(schema, "fdrbench:metadata-size"));
    std::string buffer(buffer_size, '\0');
    metadata = arrow::util::base64_decode(metadata);
    const auto decompressed_size =
        ZSTD_decompress(static_cast<void*>(buffer.data()), buffer.size(),
                        static_cast<const void*>(metadata.data()), metadata.size());
    if (ZSTD_isError(decompressed_size)) {  // NOLINT(*-implicit-bool-conversion)
      throw std::runtime_error(fmt::format("failed to decompress metadata using zstd: {}",
                                           ZSTD_getErrorName(decompressed_size)));
    }
    buffer.resize(decompressed_size);
    return buffer;
  }

  throw std::runtime_error(fmt::format("unknown compression method \"{}\"", compression));
}

}  // namespace fdrbench
