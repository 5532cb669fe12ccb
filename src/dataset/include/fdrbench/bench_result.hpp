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
#include <glaze/glaze.hpp>
#include <optional>
#include <span>
#include <string>
#include <string_view>
#include <vector>

#include "fdrbench/dataset.hpp"

namespace fdrbench {

// A correction method that failed on one dataset. Failures are recorded, never raised.
struct MethodFailure {
  std::string method{};
  std::size_t replicate{};
  std::string reason{};

  bool operator==(const MethodFailure &other) const noexcept = default;

  struct glaze {
    using T = MethodFailure;
    static constexpr auto value = glz::object(&T::method, &T::replicate, &T::reason);
  };
};

// Tests x methods matrix of adjusted p-values (q-values) for one dataset.
// A failed method keeps its column, filled with NaN, and is flagged as not ok.
class BenchResult {
 public:
  struct MethodColumn {
    std::string method{};
    std::vector<double> qvalues{};
    bool ok{false};
    double runtime_seconds{};

    struct glaze {
      using T = MethodColumn;
      static constexpr auto value =
          glz::object(&T::method, &T::qvalues, &T::ok, &T::runtime_seconds);
    };
  };

 private:
  std::size_t _replicate{};
  std::size_t _num_tests{};
  std::vector<MethodColumn> _columns{};
  std::optional<std::vector<bool>> _truth{};
  Dataset::FeatureMap _features{};
  std::vector<MethodFailure> _failures{};

 public:
  BenchResult() = default;
  BenchResult(std::size_t replicate_, std::size_t num_tests_);

  // Result for a replicate whose dataset could not be produced at all:
  // every method column is missing.
  [[nodiscard]] static BenchResult failed(std::size_t replicate_, std::size_t num_tests_,
                                          std::span<const std::string> methods,
                                          std::string_view reason);

  [[nodiscard]] std::size_t replicate() const noexcept;
  [[nodiscard]] std::size_t num_tests() const noexcept;
  [[nodiscard]] std::size_t num_methods() const noexcept;

  [[nodiscard]] const std::vector<MethodColumn> &columns() const noexcept;
  [[nodiscard]] const MethodColumn &at(std::string_view method) const;
  [[nodiscard]] bool contains(std::string_view method) const noexcept;
  [[nodiscard]] bool has_qvalues(std::string_view method) const noexcept;
  [[nodiscard]] std::span<const double> qvalues(std::string_view method) const;
  [[nodiscard]] std::vector<std::string> methods() const;

  [[nodiscard]] bool has_truth() const noexcept;
  [[nodiscard]] const std::vector<bool> &truth() const;

  [[nodiscard]] const Dataset::FeatureMap &features() const noexcept;
  [[nodiscard]] const std::vector<MethodFailure> &failures() const noexcept;
  [[nodiscard]] bool all_failed() const noexcept;

  void add_qvalues(std::string method, std::vector<double> qvalues, double runtime_seconds = 0);
  void add_failure(std::string method, std::string reason, double runtime_seconds = 0);
  void set_truth(std::vector<bool> truth_);
  void add_feature(std::string name, std::vector<double> values);

  struct glaze {
    using T = BenchResult;
    // clang-format off
    static constexpr auto value =
        glz::object(
          "replicate", &T::_replicate,
          "num-tests", &T::_num_tests,
          "columns", &T::_columns,
          "truth", &T::_truth,
          "features", &T::_features,
          "failures", &T::_failures
        );
    // clang-format on
  };

 private:
  void check_not_registered(std::string_view method) const;
};

// One BenchResult per replicate, ordered by replicate id.
using Ensemble = std::vector<BenchResult>;

}  // namespace fdrbench
