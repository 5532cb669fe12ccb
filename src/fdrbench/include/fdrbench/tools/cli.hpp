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

#include <CLI/CLI.hpp>
#include <cstdint>
#include <string>
#include <string_view>
#include <vector>

#include "fdrbench/tools/config.hpp"

namespace fdrbench {

class Cli {
 public:
  enum class subcommand : std::uint_fast8_t {
    help,
    metadata,
    methods,
    simulate,
    view,
  };

  Cli(int argc, char** argv);
  [[nodiscard]] subcommand get_subcommand() const noexcept;
  [[nodiscard]] std::string_view get_printable_subcommand() const noexcept;
  [[nodiscard]] auto parse_arguments() -> Config;
  [[nodiscard]] int exit(const CLI::ParseError& e) const;
  [[nodiscard]] int exit() const noexcept;
  [[nodiscard]] static std::string_view subcommand_to_str(subcommand s) noexcept;
  void log_warnings() const noexcept;

 private:
  int _argc;
  char** _argv;
  std::string _exec_name;
  int _exit_code{1};
  Config _config{};
  CLI::App _cli{};
  subcommand _subcommand{subcommand::help};
  mutable std::vector<std::string> _warnings{};

  void make_metadata_subcommand();
  void make_methods_subcommand();
  void make_simulate_subcommand();
  void make_view_subcommand();
  void make_cli();

  void validate_simulate_subcommand() const;
  void validate_view_subcommand() const;
  void validate_args() const;

  void transform_args_metadata_subcommand();
  void transform_args_methods_subcommand();
  void transform_args_simulate_subcommand();
  void transform_args_view_subcommand();
  void transform_args();
};

}  // namespace fdrbench
