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

#include <spdlog/common.h>
#include <spdlog/details/log_msg.h>
#include <spdlog/sinks/sink.h>

#include <atomic>
#include <cstddef>
#include <cstdint>
#include <memory>
#include <mutex>
#include <string>
#include <string_view>
#include <vector>

namespace fdrbench {

// Strips the "[replicate #N]: " prefix from a log message.
// Returns the message unchanged when it does not start with a replicate prefix.
[[nodiscard]] std::string_view strip_replicate_prefix(std::string_view msg) noexcept;

// Installs the default spdlog logger and keeps a copy of the warnings emitted while a command runs.
// Warnings are collapsed into a single entry when they are identical or when they only differ by
// their replicate prefix (e.g. the same method failing on many replicates). Entries are replayed
// together with their number of occurrences when the logger goes out of scope.
class WarningReplayLogger {
  struct Entry {
    spdlog::level::level_enum level{spdlog::level::warn};
    std::string key{};
    std::string first_payload{};
    std::size_t count{};
    bool per_replicate{false};
  };

  std::size_t _capacity{};
  std::vector<Entry> _entries{};
  mutable std::mutex _mtx{};
  std::atomic<std::size_t> _num_warnings{};
  std::atomic<bool> _ok{false};

 public:
  static constexpr std::string_view msg_pattern{"[%Y-%m-%d %T.%e] %^[%l]%$: %v"};

  explicit WarningReplayLogger(std::size_t capacity) noexcept;

  WarningReplayLogger(const WarningReplayLogger& other) = delete;
  WarningReplayLogger(WarningReplayLogger&& other) noexcept = delete;

  ~WarningReplayLogger() noexcept;

  WarningReplayLogger& operator=(const WarningReplayLogger& other) = delete;
  WarningReplayLogger& operator=(WarningReplayLogger&& other) noexcept = delete;

  [[nodiscard]] bool ok() const noexcept;
  [[nodiscard]] std::size_t num_warnings() const noexcept;
  [[nodiscard]] std::size_t num_unique_warnings() const;
  // Messages printed when replaying the collected warnings
  [[nodiscard]] std::vector<std::string> collected_warnings() const;

  static void set_level(std::uint8_t lvl);
  void print_welcome_msg() const;
  void clear() noexcept;

 private:
  [[nodiscard]] static std::shared_ptr<spdlog::sinks::sink> make_stderr_sink(
      spdlog::level::level_enum lvl);
  [[nodiscard]] std::shared_ptr<spdlog::sinks::sink> make_collector_sink();

  [[nodiscard]] static std::string format_entry(const Entry& e);
  void record(const spdlog::details::log_msg& msg) noexcept;
  void replay();
  static void install_fallback_logger() noexcept;
};

}  // namespace fdrbench
