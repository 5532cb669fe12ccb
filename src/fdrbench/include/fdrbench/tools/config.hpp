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

#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <optional>
#include <string>
#include <variant>
#include <vector>

namespace fdrbench {

struct SimulateConfig {
  std::filesystem::path output_prefix;
  bool force{false};

  std::size_t num_tests{10'000};
  std::size_t replicates{100};
  std::uint64_t seed{1234};
  std::size_t threads{1};

  std::string pi0_curve{"constant"};
  std::vector<double> pi0_params{};
  std::string effect_size{"normal"};
  std::vector<double> effect_size_params{};
  std::string noise{"gaussian"};
  std::vector<double> noise_params{};
  std::string covariate{"uniform"};
  std::vector<double> covariate_params{};
  std::optional<std::size_t> num_non_null{};

  std::vector<double> alphas{};
  double alpha_min{0.01};
  double alpha_max{0.10};
  std::size_t alpha_steps{10};

  std::vector<std::string> excluded_methods{};
  std::filesystem::path cache_dir{};

  std::string compression_method{"zstd"};
  std::uint8_t compression_lvl{9};

  std::uint8_t verbosity{3};
};

struct ViewConfig {
  std::filesystem::path input_path;

  std::vector<std::string> methods{};
  std::vector<std::string> metrics{};

  bool with_header{true};

  std::uint8_t verbosity{3};
};

struct MetadataConfig {
  std::filesystem::path input_path;

  bool raw{false};

  std::uint8_t verbosity{0};
};

struct MethodsConfig {
  bool with_header{true};

  std::uint8_t verbosity{3};
};

// clang-format off
using Config = std::variant<
    std::monostate,
    MetadataConfig,
    MethodsConfig,
    SimulateConfig,
    ViewConfig>;
// clang-format on

}  // namespace fdrbench
