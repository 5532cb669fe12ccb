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

#include "fdrbench/bench_executor.hpp"

#include <fmt/format.h>
#include <fmt/ranges.h>
#include <spdlog/spdlog.h>

#include <chrono>
#include <cstddef>
#include <exception>
#include <optional>
#include <stdexcept>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

#include "fdrbench/bench_result.hpp"
#include "fdrbench/dataset.hpp"
#include "fdrbench/registry.hpp"

namespace fdrbench {

BenchExecutor::BenchExecutor(Registry registry, Options opts)
    : _registry(std::move(registry)), _opts(std::move(opts)) {}

BenchExecutor::BenchExecutor(Registry registry) : BenchExecutor(std::move(registry), Options{}) {}

const Registry& BenchExecutor::registry() const noexcept { return _registry; }

auto BenchExecutor::options() const noexcept -> const Options& { return _opts; }

[[nodiscard]] static double elapsed_seconds(std::chrono::steady_clock::time_point t0) {
  return std::chrono::duration<double>(std::chrono::steady_clock::now() - t0).count();
}

BenchResult BenchExecutor::run(const Dataset& data, std::size_t replicate) const {
  validate_passthrough_features(data);

  BenchResult res{replicate, data.size()};
  for (const auto& spec : _registry) {
    const auto& method = spec->id();
    const auto t0 = std::chrono::steady_clock::now();
    std::optional<std::string> error{};
    try {
      auto qvalues = (*spec)(data);
      if (qvalues.size() != data.size()) {
        error = fmt::format("method returned {} q-values, expected {}", qvalues.size(),
                            data.size());
      } else {
        const auto t = elapsed_seconds(t0);
        res.add_qvalues(method, std::move(qvalues), t);
        SPDLOG_DEBUG("[replicate #{}]: method \"{}\" processed {} tests in {:.3f}s", replicate,
                     method, data.size(), t);
        continue;
      }
    } catch (const std::exception& e) {
      error = e.what();
    } catch (...) {
      error = "unknown error";
    }

    SPDLOG_WARN("[replicate #{}]: method \"{}\" failed: {}", replicate, method, *error);
    res.add_failure(method, std::move(*error), elapsed_seconds(t0));
  }

  if (_opts.use_ground_truth && data.has_truth()) {
    res.set_truth(data.truth());
  }
  copy_passthrough_features(data, res);

  return res;
}

BenchResult BenchExecutor::failed(std::size_t replicate, std::size_t num_tests,
                                  std::string_view reason) const {
  const auto methods = _registry.list_ids();
  return BenchResult::failed(replicate, num_tests, methods, reason);
}

void BenchExecutor::validate_passthrough_features(const Dataset& data) const {
  std::vector<std::string_view> missing{};
  for (const auto& name : _opts.passthrough_features) {
    if (const auto col = try_parse_column(name); col.has_value()) {
      if (!data.has(*col)) {
        missing.emplace_back(name);
      }
      continue;
    }
    if (!data.has_feature(name)) {
      missing.emplace_back(name);
    }
  }

  if (!missing.empty()) {
    throw std::invalid_argument(
        fmt::format("unable to find the following passthrough features in the dataset: {}",
                    fmt::join(missing, ", ")));
  }
}

void BenchExecutor::copy_passthrough_features(const Dataset& data, BenchResult& res) const {
  for (const auto& name : _opts.passthrough_features) {
    const auto col = try_parse_column(name);
    const auto values = col.has_value() ? data.column(*col) : data.feature(name);
    res.add_feature(name, {values.begin(), values.end()});
  }
}

}  // namespace fdrbench
