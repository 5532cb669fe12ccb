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
#include <memory>
#include <span>
#include <string>
#include <string_view>
#include <vector>

#include "fdrbench/common.hpp"
#include "fdrbench/method_spec.hpp"

namespace fdrbench {

// Ordered mapping from method id to MethodSpec.
// Insertion order determines the default comparison order.
// Specs are shared between copies of a registry, so cloning is cheap and modifying a copy
// never affects the original. Registries are not thread-safe: build them before starting
// any parallel execution.
class Registry {
  std::vector<std::shared_ptr<const MethodSpec>> _methods{};

 public:
  using const_iterator = std::vector<std::shared_ptr<const MethodSpec>>::const_iterator;

  Registry() = default;

  const MethodSpec& add(MethodSpec spec);
  template <typename Fx, typename Extractor = identity>
    requires OutputExtractor<Extractor, Fx>
  const MethodSpec& add(std::string id, std::vector<Column> inputs, Fx callable,
                        Params params = {}, Extractor extractor = {});

  const MethodSpec& override(std::string_view id, const Params& params);
  void remove(std::string_view id);

  [[nodiscard]] std::vector<std::string> list_ids() const;
  [[nodiscard]] bool contains(std::string_view id) const noexcept;
  [[nodiscard]] const MethodSpec& at(std::string_view id) const;

  [[nodiscard]] std::size_t size() const noexcept;
  [[nodiscard]] bool empty() const noexcept;

  [[nodiscard]] auto begin() const noexcept -> const_iterator;
  [[nodiscard]] auto end() const noexcept -> const_iterator;

  [[nodiscard]] Registry without(std::span<const std::string> ids) const;
  [[nodiscard]] Registry only(std::span<const std::string> ids) const;

 private:
  [[nodiscard]] auto find(std::string_view id) const noexcept -> const_iterator;
  [[nodiscard]] auto find_or_throw(std::string_view id) const -> const_iterator;
};

template <typename Fx, typename Extractor>
  requires OutputExtractor<Extractor, Fx>
inline const MethodSpec& Registry::add(std::string id, std::vector<Column> inputs, Fx callable,
                                       Params params, Extractor extractor) {
  return add(MethodSpec{std::move(id), std::move(inputs), std::move(callable), std::move(params),
                        std::move(extractor)});
}

}  // namespace fdrbench
