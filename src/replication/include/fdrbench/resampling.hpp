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
#include <optional>
#include <span>
#include <vector>

#include "fdrbench/dataset.hpp"
#include "fdrbench/distributions.hpp"

namespace fdrbench {

// Random subsampling (without replacement) of the rows of a fixed dataset.
// When the dataset carries ground truth, subsamples must contain at least min_null null and
// min_non_null non-null hypotheses: draws violating these constraints are repeated up to
// max_attempts times before giving up with a ResamplingError.
class SubsampleResampler {
 public:
  struct Params {
    // number of rows to draw. Takes precedence over fraction
    std::optional<std::size_t> size{};
    double fraction{0.5};
    std::size_t min_null{0};
    std::size_t min_non_null{0};
    std::size_t max_attempts{100};
  };

 private:
  Params _params{};

 public:
  SubsampleResampler();
  explicit SubsampleResampler(Params params);

  [[nodiscard]] const Params& params() const noexcept;
  [[nodiscard]] std::size_t sample_size(std::size_t num_rows) const;

  // Throws std::invalid_argument when the constraints cannot be satisfied by data
  void validate(const Dataset& data) const;

  [[nodiscard]] Dataset operator()(const Dataset& data, RandomEngine& eng) const;

 private:
  [[nodiscard]] std::vector<std::size_t> draw_rows(std::size_t num_rows, std::size_t size,
                                                   RandomEngine& eng) const;
  [[nodiscard]] bool is_balanced(const Dataset& data, std::span<const std::size_t> rows) const;
};

}  // namespace fdrbench
