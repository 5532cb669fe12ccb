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

#include "fdrbench/tools/cli.hpp"

#include <fmt/format.h>
#include <fmt/ranges.h>
#include <fmt/std.h>
#include <spdlog/spdlog.h>

#include <CLI/CLI.hpp>
#include <algorithm>
#include <cstddef>
#include <cstdint>
#include <exception>
#include <filesystem>
#include <stdexcept>
#include <string>
#include <string_view>
#include <thread>
#include <utility>
#include <variant>
#include <vector>

#include "fdrbench/common.hpp"
#include "fdrbench/tools/config.hpp"
#include "fdrbench/version.hpp"

namespace fdrbench {

Cli::Cli(int argc, char** argv) : _argc(argc), _argv(argv), _exec_name(*argv) { make_cli(); }

Cli::subcommand Cli::get_subcommand() const noexcept { return _subcommand; }
std::string_view Cli::get_printable_subcommand() const noexcept {
  return Cli::subcommand_to_str(get_subcommand());
}

auto Cli::parse_arguments() -> Config {
  try {
    _cli.name(_exec_name);
    _cli.parse(_argc, _argv);

    using enum subcommand;
    if (_cli.get_subcommand("metadata")->parsed()) {
      _subcommand = metadata;
    } else if (_cli.get_subcommand("methods")->parsed()) {
      _subcommand = methods;
    } else if (_cli.get_subcommand("simulate")->parsed()) {
      _subcommand = simulate;
    } else if (_cli.get_subcommand("view")->parsed()) {
      _subcommand = view;
    } else {
      _subcommand = help;
    }
  } catch (const CLI::ParseError& e) {
    //  This takes care of formatting and printing error messages (if any)
    _exit_code = _cli.exit(e);
    return _config;
  } catch (const std::exception& e) {
    _exit_code = 1;
    throw std::runtime_error(
        fmt::format("An unexpected error has occurred while parsing "
                    "CLI arguments: {}. If you see this "
                    "message, please file an issue on GitHub",
                    e.what()));
  }
  validate_args();
  transform_args();

  _exit_code = 0;
  return _config;
}

int Cli::exit(const CLI::ParseError& e) const { return _cli.exit(e); }
int Cli::exit() const noexcept { return _exit_code; }

std::string_view Cli::subcommand_to_str(subcommand s) noexcept {
  using enum subcommand;
  switch (s) {
    case metadata:
      return "metadata";
    case methods:
      return "methods";
    case simulate:
      return "simulate";
    case view:
      return "view";
    case help:
      return "--help";
  }
  unreachable_code();
}

void Cli::log_warnings() const noexcept {
  for (const auto& w : _warnings) {
    SPDLOG_WARN("{}", w);
  }
  _warnings.clear();
}

void Cli::make_cli() {
  _cli.name(_exec_name);
  _cli.description("Benchmark multiple hypothesis testing correction methods.");
  _cli.set_version_flag("-V,--version", std::string{config::version::str_long()});
  _cli.require_subcommand(1);

  make_metadata_subcommand();
  make_methods_subcommand();
  make_simulate_subcommand();
  make_view_subcommand();
}

void Cli::make_metadata_subcommand() {
  auto& sc = *_cli.add_subcommand("metadata", "Print the metadata stored in a record file.")
                  ->fallthrough()
                  ->preparse_callback([this]([[maybe_unused]] std::size_t i) {
                    _config = MetadataConfig{};
                  });

  _config = MetadataConfig{};
  auto& c = std::get<MetadataConfig>(_config);

  // clang-format off
  sc.add_option(
    "parquet",
    c.input_path,
    "Path to a .parquet file produced by fdrbench simulate.")
    ->check(CLI::ExistingFile)
    ->required();
  sc.add_flag(
    "--raw",
    c.raw,
    "Print the metadata exactly as it is stored in the file.")
    ->capture_default_str();
  // clang-format on

  _config = std::monostate{};
}

void Cli::make_methods_subcommand() {
  auto& sc =
      *_cli.add_subcommand("methods", "List the correction methods available for benchmarking.")
           ->fallthrough()
           ->preparse_callback([this]([[maybe_unused]] std::size_t i) {
             _config = MethodsConfig{};
           });

  _config = MethodsConfig{};
  auto& c = std::get<MethodsConfig>(_config);

  // clang-format off
  sc.add_flag(
    "--write-header,!--no-write-header",
    c.with_header,
    "Write the table header to stdout.")
    ->capture_default_str();
  sc.add_option(
    "-v,--verbosity",
    c.verbosity,
    "Set verbosity of output to the console.")
    ->check(CLI::Range(1, 4))
    ->capture_default_str();
  // clang-format on

  _config = std::monostate{};
}

void Cli::make_simulate_subcommand() {
  auto& sc =
      *_cli.add_subcommand("simulate",
                           "Benchmark the reference correction methods on synthetic datasets.")
           ->fallthrough()
           ->preparse_callback([this]([[maybe_unused]] std::size_t i) {
             _config = SimulateConfig{};
           });

  _config = SimulateConfig{};
  auto& c = std::get<SimulateConfig>(_config);

  // clang-format off
  sc.add_option(
    "output-prefix",
    c.output_prefix,
    "Path prefix used to name the output .parquet files.")
    ->required();
  sc.add_flag(
    "--force",
    c.force,
    "Force overwrite existing output file(s).")
    ->capture_default_str();
  sc.add_option(
    "-m,--num-tests",
    c.num_tests,
    "Number of hypotheses tested in each replicate.")
    ->check(CLI::PositiveNumber)
    ->capture_default_str();
  sc.add_option(
    "--replicates",
    c.replicates,
    "Number of independent replicates.")
    ->check(CLI::PositiveNumber)
    ->capture_default_str();
  sc.add_option(
    "--seed",
    c.seed,
    "Seed used to initialize the random number generator of each replicate.")
    ->capture_default_str();
  sc.add_option(
    "-t,--threads",
    c.threads,
    "Number of worker threads.")
    ->check(CLI::Range(1U, std::max(1U, std::thread::hardware_concurrency())))
    ->capture_default_str();
  sc.add_option(
    "--pi0-curve",
    c.pi0_curve,
    "Function mapping the covariate onto the probability of a hypothesis being null.")
    ->check(CLI::IsMember({"constant", "step", "sine", "cosine", "cubic"}))
    ->capture_default_str();
  sc.add_option(
    "--pi0-params",
    c.pi0_params,
    "Parameters of the pi0 curve:\n"
    " - constant: pi0 (default: 0.9)\n"
    " - step: low, high[, breakpoint] (default: 0.8, 0.95)\n"
    " - sine, cosine: center, amplitude[, periods] (default: 0.85, 0.1)\n"
    " - cubic: low, high (default: 0.7, 0.99)");
  sc.add_option(
    "--effect-size",
    c.effect_size,
    "Distribution of the effect sizes of non-null hypotheses.")
    ->check(CLI::IsMember({"constant", "normal", "uniform", "bimodal", "spiky", "near-normal",
                           "flat-top", "skew", "big-normal", "bimodal-ash"}))
    ->capture_default_str();
  sc.add_option(
    "--effect-size-params",
    c.effect_size_params,
    "Parameters of the effect size distribution:\n"
    " - constant: value (default: 2)\n"
    " - normal: mean, sd (default: 2, 1)\n"
    " - uniform: low, high (default: 1, 3)\n"
    " - bimodal: mean[, sd] (default: 2, 1)\n"
    " - spiky, near-normal, flat-top, skew, big-normal, bimodal-ash: no parameters");
  sc.add_option(
    "--noise",
    c.noise,
    "Noise model used to generate test statistics and p-values.")
    ->check(CLI::IsMember({"gaussian", "t", "chi-squared"}))
    ->capture_default_str();
  sc.add_option(
    "--noise-params",
    c.noise_params,
    "Parameters of the noise model:\n"
    " - gaussian: sd (default: 1)\n"
    " - t: degrees of freedom (default: 5)\n"
    " - chi-squared: degrees of freedom (default: 4)");
  sc.add_option(
    "--covariate",
    c.covariate,
    "Distribution of the independent covariate.")
    ->check(CLI::IsMember({"uniform", "normal"}))
    ->capture_default_str();
  sc.add_option(
    "--covariate-params",
    c.covariate_params,
    "Parameters of the covariate distribution:\n"
    " - uniform: low, high (default: 0, 1)\n"
    " - normal: mean, sd (default: 0, 1)");
  sc.add_option(
    "--num-non-null",
    c.num_non_null,
    "Draw exactly this many non-null hypotheses in each replicate.\n"
    "When not specified, hypotheses are labeled by independent Bernoulli trials.");
  sc.add_option(
    "--alphas",
    c.alphas,
    "Comma-separated list of significance thresholds in (0, 1].")
    ->check(CLI::PositiveNumber & CLI::Range(0.0, 1.0))
    ->delimiter(',');
  sc.add_option(
    "--alpha-min",
    c.alpha_min,
    "Smallest significance threshold.")
    ->check(CLI::PositiveNumber & CLI::Range(0.0, 1.0))
    ->capture_default_str();
  sc.add_option(
    "--alpha-max",
    c.alpha_max,
    "Largest significance threshold.")
    ->check(CLI::PositiveNumber & CLI::Range(0.0, 1.0))
    ->capture_default_str();
  sc.add_option(
    "--alpha-steps",
    c.alpha_steps,
    "Number of significance thresholds evenly spaced between --alpha-min and --alpha-max.")
    ->check(CLI::PositiveNumber)
    ->capture_default_str();
  sc.add_option(
    "--exclude-methods",
    c.excluded_methods,
    "Comma-separated list of methods to be excluded from the aggregated and paired-difference\n"
    "output files. Excluded methods are still run and reported in the standardized output file.")
    ->delimiter(',');
  sc.add_option(
    "--cache-dir",
    c.cache_dir,
    "Path to a folder used to cache benchmark results.\n"
    "Runs with identical settings re-use cached results instead of re-computing them.");
  sc.add_option(
    "--compression-level",
    c.compression_lvl,
    "Compression level used to compress columns in the output .parquet files.")
    ->check(CLI::Bound(1, 22))
    ->capture_default_str();
  sc.add_option(
    "--compression-method",
    c.compression_method,
    "Method used to compress individual columns in the .parquet files.")
    ->check(CLI::IsMember({"zstd", "lz4"}))
    ->capture_default_str();
  sc.add_option(
    "-v,--verbosity",
    c.verbosity,
    "Set verbosity of output to the console.")
    ->check(CLI::Range(1, 4))
    ->capture_default_str();
  // clang-format on

  sc.get_option("--alphas")->excludes("--alpha-min");
  sc.get_option("--alphas")->excludes("--alpha-max");
  sc.get_option("--alphas")->excludes("--alpha-steps");

  _config = std::monostate{};
}

void Cli::make_view_subcommand() {
  auto& sc = *_cli.add_subcommand("view", "View records stored in a .parquet file.")
                  ->fallthrough()
                  ->preparse_callback([this]([[maybe_unused]] std::size_t i) {
                    _config = ViewConfig{};
                  });

  _config = ViewConfig{};
  auto& c = std::get<ViewConfig>(_config);

  // clang-format off
  sc.add_option(
    "parquet",
    c.input_path,
    "Path to the .parquet file to be viewed.")
    ->check(CLI::ExistingFile)
    ->required();
  sc.add_option(
    "--methods",
    c.methods,
    "Comma-separated list of methods to be printed.\n"
    "When not specified, records for all methods are printed.")
    ->delimiter(',');
  sc.add_option(
    "--metrics",
    c.metrics,
    "Comma-separated list of metrics to be printed.\n"
    "When not specified, records for all metrics are printed.")
    ->check(CLI::IsMember({"FDR", "TPR", "FWER", "TNR", "rejections", "rejectprop"}))
    ->delimiter(',');
  sc.add_flag(
    "--write-header,!--no-write-header",
    c.with_header,
    "Write the file header to stdout.")
    ->capture_default_str();
  sc.add_option(
    "-v,--verbosity",
    c.verbosity,
    "Set verbosity of output to the console.")
    ->check(CLI::Range(1, 4))
    ->capture_default_str();
  // clang-format on

  _config = std::monostate{};
}

void Cli::validate_args() const {
  using enum subcommand;
  switch (get_subcommand()) {
    case simulate:
      return validate_simulate_subcommand();  // NOLINT
    case view:
      return validate_view_subcommand();  // NOLINT
    case metadata:
      [[fallthrough]];
    case methods:
      [[fallthrough]];
    case help:
      return;
  }
}

static void check_num_params(std::vector<std::string>& errors, std::string_view option,
                             std::string_view name, const std::vector<double>& params,
                             std::size_t min_params, std::size_t max_params) {
  if (params.empty()) {
    return;
  }
  if (params.size() < min_params || params.size() > max_params) {
    if (min_params == max_params) {
      errors.emplace_back(fmt::format("{} \"{}\" expects {} parameter(s), found {}", option, name,
                                      min_params, params.size()));
      return;
    }
    errors.emplace_back(fmt::format("{} \"{}\" expects between {} and {} parameters, found {}",
                                    option, name, min_params, max_params, params.size()));
  }
}

[[nodiscard]] static std::vector<std::filesystem::path> output_paths(
    const std::filesystem::path& prefix) {
  std::vector<std::filesystem::path> paths{};
  for (const std::string_view suffix :
       {"standardized", "aggregated", "paired_difference", "failures"}) {
    paths.emplace_back(fmt::format("{}.{}.parquet", prefix.string(), suffix));
  }
  return paths;
}

void Cli::validate_simulate_subcommand() const {
  const auto& c = std::get<SimulateConfig>(_config);

  std::vector<std::string> errors;
  if (!c.force) {
    for (const auto& path : output_paths(c.output_prefix)) {
      if (std::filesystem::exists(path)) {
        errors.emplace_back(
            fmt::format("Refusing to overwrite file {}. Pass --force to overwrite.", path));
      }
    }
  }

  if (c.pi0_curve == "constant") {
    check_num_params(errors, "--pi0-curve", c.pi0_curve, c.pi0_params, 1, 1);
  } else if (c.pi0_curve == "cubic") {
    check_num_params(errors, "--pi0-curve", c.pi0_curve, c.pi0_params, 2, 2);
  } else {
    check_num_params(errors, "--pi0-curve", c.pi0_curve, c.pi0_params, 2, 3);
  }

  if (c.effect_size == "constant") {
    check_num_params(errors, "--effect-size", c.effect_size, c.effect_size_params, 1, 1);
  } else if (c.effect_size == "normal" || c.effect_size == "uniform") {
    check_num_params(errors, "--effect-size", c.effect_size, c.effect_size_params, 2, 2);
  } else if (c.effect_size == "bimodal") {
    check_num_params(errors, "--effect-size", c.effect_size, c.effect_size_params, 1, 2);
  } else if (!c.effect_size_params.empty()) {
    errors.emplace_back(fmt::format("--effect-size \"{}\" does not take any parameter",
                                    c.effect_size));
  }

  check_num_params(errors, "--noise", c.noise, c.noise_params, 1, 1);
  check_num_params(errors, "--covariate", c.covariate, c.covariate_params, 2, 2);

  if (c.num_non_null.has_value() && *c.num_non_null > c.num_tests) {
    errors.emplace_back(fmt::format("--num-non-null cannot be greater than --num-tests: {} > {}",
                                    *c.num_non_null, c.num_tests));
  }

  if (c.alphas.empty() && c.alpha_min >= c.alpha_max && c.alpha_steps > 1) {
    errors.emplace_back(fmt::format("--alpha-min should be smaller than --alpha-max: {} >= {}",
                                    c.alpha_min, c.alpha_max));
  }

  if (c.compression_method == "lz4" && c.compression_lvl > 9) {
    _warnings.emplace_back("compression method lz4 supports compression levels up to 9");
  }

  if (!errors.empty()) {
    throw std::runtime_error(
        fmt::format("the following error(s) where encountered while validating CLI "
                    "arguments and input file(s):\n - {}",
                    fmt::join(errors, "\n - ")));
  }
}

void Cli::validate_view_subcommand() const {
  const auto& c = std::get<ViewConfig>(_config);
  if (c.input_path.extension() != ".parquet") {
    _warnings.emplace_back(
        fmt::format("file {} does not have the .parquet extension", c.input_path));
  }
}

void Cli::transform_args() {
  using enum subcommand;
  switch (get_subcommand()) {
    case metadata:
      return transform_args_metadata_subcommand();  // NOLINT
    case methods:
      return transform_args_methods_subcommand();  // NOLINT
    case simulate:
      return transform_args_simulate_subcommand();  // NOLINT
    case view:
      return transform_args_view_subcommand();  // NOLINT
    case help:
      return;
  }
}

// in spdlog, high numbers correspond to low log levels
[[nodiscard]] static std::uint8_t to_spdlog_level(std::uint8_t verbosity) noexcept {
  return static_cast<std::uint8_t>(spdlog::level::critical) - verbosity;
}

void Cli::transform_args_metadata_subcommand() {
  auto& c = std::get<MetadataConfig>(_config);
  c.verbosity = static_cast<std::uint8_t>(spdlog::level::err);
}

void Cli::transform_args_methods_subcommand() {
  auto& c = std::get<MethodsConfig>(_config);
  c.verbosity = to_spdlog_level(c.verbosity);
}

void Cli::transform_args_simulate_subcommand() {
  auto& c = std::get<SimulateConfig>(_config);

  if (c.pi0_params.empty()) {
    if (c.pi0_curve == "constant") {
      c.pi0_params = {0.9};
    } else if (c.pi0_curve == "step") {
      c.pi0_params = {0.8, 0.95};
    } else if (c.pi0_curve == "cubic") {
      c.pi0_params = {0.7, 0.99};
    } else {
      c.pi0_params = {0.85, 0.1};
    }
  }

  if (c.effect_size_params.empty()) {
    if (c.effect_size == "constant") {
      c.effect_size_params = {2.0};
    } else if (c.effect_size == "normal" || c.effect_size == "bimodal") {
      c.effect_size_params = {2.0, 1.0};
    } else if (c.effect_size == "uniform") {
      c.effect_size_params = {1.0, 3.0};
    }
  }

  if (c.noise_params.empty()) {
    if (c.noise == "gaussian") {
      c.noise_params = {1.0};
    } else if (c.noise == "t") {
      c.noise_params = {5.0};
    } else {
      c.noise_params = {4.0};
    }
  }

  if (c.covariate_params.empty()) {
    c.covariate_params = {0.0, 1.0};
  }

  if (!c.alphas.empty()) {
    std::ranges::sort(c.alphas);
    const auto dups = std::ranges::unique(c.alphas);
    c.alphas.erase(dups.begin(), dups.end());
  }

  if (c.compression_method == "lz4") {
    c.compression_lvl = std::min(c.compression_lvl, std::uint8_t{9});
  }

  c.verbosity = to_spdlog_level(c.verbosity);
}

void Cli::transform_args_view_subcommand() {
  auto& c = std::get<ViewConfig>(_config);
  c.verbosity = to_spdlog_level(c.verbosity);
}

}  // namespace fdrbench
