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
#include <arrow/type_fwd.h>
#include <parquet/platform.h>
FDRBENCH_DISABLE_WARNING_POP
// clang-format on

#include <cstdint>
#include <memory>
#include <string>
#include <string_view>

namespace fdrbench {

enum class RecordType : std::uint_fast8_t { standardized, aggregated, failure_summary };

[[nodiscard]] std::string_view to_string(RecordType type) noexcept;
[[nodiscard]] RecordType parse_record_type(std::string_view name);

inline constexpr std::uint8_t record_file_format_version{1};

// Schema-level metadata: format version, record type and (optionally) a JSON document
// describing how the records were generated
[[nodiscard]] std::shared_ptr<const arrow::KeyValueMetadata> make_schema_metadata(
    RecordType type, const std::string& metadata);

[[nodiscard]] std::shared_ptr<arrow::Schema> get_schema(
    RecordType type, std::shared_ptr<const arrow::KeyValueMetadata> metadata = nullptr);

[[nodiscard]] parquet::Compression::type parse_parquet_compression(std::string_view method);

// Read the record type and the metadata document stored in the schema of a record file.
// Throws std::runtime_error when the attributes are missing or invalid.
[[nodiscard]] RecordType read_record_type(const arrow::Schema& schema);
[[nodiscard]] std::string read_metadata(const arrow::Schema& schema);

}  // namespace fdrbench
