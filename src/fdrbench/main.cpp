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

#include <fmt/format.h>
#include <spdlog/spdlog.h>

#include <CLI/CLI.hpp>
#include <cstddef>
#include <cstdio>
#include <filesystem>
#include <iostream>
#include <memory>
#include <new>
#include <stdexcept>
#include <tuple>
#include <type_traits>
#include <utility>
#include <variant>

#include "fdrbench/tools/cli.hpp"
#include "fdrbench/tools/config.hpp"
#include "fdrbench/tools/logger.hpp"
#include "fdrbench/tools/tools.hpp"

using namespace fdrbench;

// Keep a copy of at most this many distinct warnings to be replayed before exiting
inline constexpr std::size_t max_replayed_warnings{256};

static auto global_logger = std::make_unique<WarningReplayLogger>(max_replayed_warnings);

static auto acquire_global_logger() noexcept { return std::move(global_logger); }

// Subcommands whose output goes to stdout should not be preceded by the welcome message
[[nodiscard]] static bool should_print_welcome_msg(Cli::subcommand subcmd) noexcept {
  return subcmd == Cli::subcommand::simulate;
}

static std::tuple<int, Cli::subcommand, Config> parse_cli_and_setup_logger(
    Cli &cli, WarningReplayLogger &logger) {
  try {
    auto config = cli.parse_arguments();
    const auto subcmd = cli.get_subcommand();
    const auto ec = cli.exit();
    std::visit(
        [&]<typename T>(const T &config_) {
          if constexpr (!std::is_same_v<T, std::monostate>) {
            if (logger.ok()) {
              WarningReplayLogger::set_level(config_.verbosity);
              if (should_print_welcome_msg(subcmd)) {
                logger.print_welcome_msg();
              }
            }
          }
        },
        config);

    return std::make_tuple(ec, subcmd, config);
  } catch (const CLI::ParseError &e) {
    //  This takes care of formatting and printing error messages (if any)
    return std::make_tuple(cli.exit(e), Cli::subcommand::help, Config{});
  } catch (const std::filesystem::filesystem_error &e) {
    SPDLOG_ERROR("FAILURE! {}", e.what());
    return std::make_tuple(1, Cli::subcommand::help, Config());
  } catch (const spdlog::spdlog_ex &e) {
    fmt::print(stderr,
               "FAILURE! An error occurred while setting up the main "
               "application logger: {}.\n",
               e.what());
    return std::make_tuple(1, Cli::subcommand::help, Config());
  }
}

int main(int argc, char **argv) noexcept {
  std::unique_ptr<Cli> cli{nullptr};

  try {
    std::ios::sync_with_stdio(false);
    std::cin.tie(nullptr);

    auto local_logger = acquire_global_logger();
    cli = std::make_unique<Cli>(argc, argv);
    const auto [ec, subcmd, config] = parse_cli_and_setup_logger(*cli, *local_logger);
    if (ec != 0 || subcmd == Cli::subcommand::help) {
      local_logger->clear();
      return ec;
    }

    cli->log_warnings();

    return std::visit(
        []<typename Config>(const Config &c) -> int {
          if constexpr (std::is_same_v<Config, std::monostate>) {
            throw std::runtime_error(
                "Caught attempt to visit a Config object in std::monostate. "
                "This should never be possible! "
                "If you see this message, please file an issue on GitHub.");
          } else {
            return run_command(c);
          }
        },
        config);

  } catch (const CLI::ParseError &e) {
    if (cli) {
      return cli->exit(e);  //  This takes care of formatting and printing error
                            //  messages (if any)
    }
    fmt::print(stderr, "FAILURE! {}\n", e.what());
    return 1;
  } catch (const std::bad_alloc &err) {
    SPDLOG_CRITICAL("FAILURE! Unable to allocate enough memory: {}", err.what());
    return 1;
  } catch (const spdlog::spdlog_ex &e) {
    fmt::print(stderr, "FAILURE! fdrbench encountered the following error while logging: {}\n",
               e.what());
    return 1;
  } catch (const std::exception &e) {
    if (cli) {
      SPDLOG_CRITICAL("FAILURE! fdrbench {} encountered the following error: {}",
                      cli->get_printable_subcommand(), e.what());
    } else {
      SPDLOG_CRITICAL("FAILURE! fdrbench encountered the following error: {}", e.what());
    }
    return 1;
  } catch (...) {
    SPDLOG_CRITICAL(
        "FAILURE! fdrbench encountered the following error: caught an unhandled exception!\n"
        "If you see this message, please file an issue on GitHub.");
    return 1;
  }
  return 0;
}
