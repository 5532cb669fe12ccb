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

#include "fdrbench/tools/logger.hpp"

#include <fmt/format.h>
#include <spdlog/sinks/callback_sink.h>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/spdlog.h>

#include <algorithm>
#include <cstddef>
#include <cstdint>
#include <cstdio>
#include <exception>
#include <memory>
#include <mutex>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

#include "fdrbench/version.hpp"

namespace fdrbench {

std::string_view strip_replicate_prefix(std::string_view msg) noexcept {
  constexpr std::string_view prefix{"[replicate #"};
  constexpr std::string_view suffix{"]: "};
  if (!msg.starts_with(prefix)) {
    return msg;
  }

  const auto pos = msg.find(suffix, prefix.size());
  if (pos == std::string_view::npos || pos == prefix.size()) {
    return msg;
  }

  const auto id = msg.substr(prefix.size(), pos - prefix.size());
  if (!std::ranges::all_of(id, [](const char c) { return c >= '0' && c <= '9'; })) {
    return msg;
  }
  return msg.substr(pos + suffix.size());
}

WarningReplayLogger::WarningReplayLogger(std::size_t capacity) noexcept : _capacity(capacity) {
  try {
    std::vector<spdlog::sink_ptr> sinks{
        make_stderr_sink(spdlog::level::level_enum{SPDLOG_ACTIVE_LEVEL})};
    if (_capacity != 0) {
      sinks.emplace_back(make_collector_sink());
    }
    spdlog::set_default_logger(
        std::make_shared<spdlog::logger>("main_logger", sinks.begin(), sinks.end()));
    _ok = true;
  } catch (const std::exception& e) {
    std::fputs("FAILURE! Failed to setup fdrbench's logger: ", stderr);
    std::fputs(e.what(), stderr);
    std::fputs("\n", stderr);
  }
}

WarningReplayLogger::~WarningReplayLogger() noexcept {
  if (_ok) {
    try {
      replay();
    } catch (const std::exception& e) {
      std::fputs("FAILURE! Failed to replay fdrbench warnings: ", stderr);
      std::fputs(e.what(), stderr);
      std::fputs("\n", stderr);
    }
  }
  install_fallback_logger();
}

bool WarningReplayLogger::ok() const noexcept { return _ok; }

std::size_t WarningReplayLogger::num_warnings() const noexcept { return _num_warnings; }

std::size_t WarningReplayLogger::num_unique_warnings() const {
  [[maybe_unused]] const std::scoped_lock lck(_mtx);
  return _entries.size();
}

std::vector<std::string> WarningReplayLogger::collected_warnings() const {
  [[maybe_unused]] const std::scoped_lock lck(_mtx);
  std::vector<std::string> msgs(_entries.size());
  std::ranges::transform(_entries, msgs.begin(), &WarningReplayLogger::format_entry);
  return msgs;
}

void WarningReplayLogger::set_level(std::uint8_t lvl) {
  const spdlog::level::level_enum level{lvl};
  auto logger = spdlog::default_logger();
  if (!logger) {
    return;
  }
  for (auto& sink : logger->sinks()) {
    sink->set_level(std::max(sink->level(), level));
  }
  logger->set_level(level);
}

void WarningReplayLogger::print_welcome_msg() const {
  if (_ok) {
    SPDLOG_INFO("Running {}", config::version::str_long());
  }
}

void WarningReplayLogger::clear() noexcept {
  [[maybe_unused]] const std::scoped_lock lck(_mtx);
  _entries.clear();
  _num_warnings = 0;
}

std::shared_ptr<spdlog::sinks::sink> WarningReplayLogger::make_stderr_sink(
    spdlog::level::level_enum lvl) {
  auto sink = std::make_shared<spdlog::sinks::stderr_color_sink_mt>();
  sink->set_pattern(std::string{msg_pattern});
  sink->set_level(lvl);
  return sink;
}

std::shared_ptr<spdlog::sinks::sink> WarningReplayLogger::make_collector_sink() {
  auto sink = std::make_shared<spdlog::sinks::callback_sink_mt>(
      [this](const spdlog::details::log_msg& msg) noexcept { record(msg); });
  sink->set_pattern(std::string{msg_pattern});
  sink->set_level(spdlog::level::warn);
  return sink;
}

void WarningReplayLogger::record(const spdlog::details::log_msg& msg) noexcept {
  if (msg.level < spdlog::level::warn) [[likely]] {
    return;
  }
  ++_num_warnings;

  try {
    const std::string_view payload{msg.payload.data(), msg.payload.size()};
    const auto key = strip_replicate_prefix(payload);
    const auto per_replicate = key.size() != payload.size();

    [[maybe_unused]] const std::scoped_lock lck(_mtx);
    auto match = std::ranges::find_if(_entries, [&](const Entry& e) {
      return e.level == msg.level && e.per_replicate == per_replicate && e.key == key;
    });
    if (match != _entries.end()) {
      ++match->count;
      return;
    }
    if (_entries.size() == _capacity) [[unlikely]] {
      _entries.erase(_entries.begin());
    }
    _entries.emplace_back(
        Entry{msg.level, std::string{key}, std::string{payload}, 1, per_replicate});
  } catch (const std::exception&) {  // NOLINT(bugprone-empty-catch)
    // the message was already written to stderr
  }
}

std::string WarningReplayLogger::format_entry(const Entry& e) {
  if (e.count == 1) {
    return e.first_payload;
  }
  if (e.per_replicate) {
    return fmt::format("{} (in {} replicates)", e.key, e.count);
  }
  return fmt::format("{} (repeated {} times)", e.key, e.count);
}

void WarningReplayLogger::replay() {
  [[maybe_unused]] const std::scoped_lock lck(_mtx);
  if (_entries.empty()) {
    return;
  }

  auto logger =
      std::make_shared<spdlog::logger>("replay_logger", make_stderr_sink(spdlog::level::warn));
  logger->set_level(spdlog::level::warn);

  std::size_t num_replayed{};
  for (const auto& e : _entries) {
    num_replayed += e.count;
  }

  if (num_replayed == _num_warnings) {
    logger->warn("replaying {} warning message(s)", _num_warnings.load());
  } else {
    logger->warn("replaying {}/{} warning messages", num_replayed, _num_warnings.load());
  }

  for (const auto& e : _entries) {
    logger->log(e.level, format_entry(e));
  }
  _entries.clear();
}

void WarningReplayLogger::install_fallback_logger() noexcept {
  try {
    spdlog::set_default_logger(std::make_shared<spdlog::logger>(
        "main_logger", make_stderr_sink(spdlog::level::level_enum{SPDLOG_ACTIVE_LEVEL})));
  } catch (const std::exception& e) {
    std::fputs("FAILURE! Failed to restore fdrbench's logger: ", stderr);
    std::fputs(e.what(), stderr);
    std::fputs("\n", stderr);
  }
}

}  // namespace fdrbench
