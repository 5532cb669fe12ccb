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

#include "fdrbench/registry.hpp"

#include <algorithm>
#include <iterator>
#include <memory>
#include <span>
#include <string>
#include <string_view>
#include <tuple>
#include <utility>
#include <vector>

#include "fdrbench/errors.hpp"
#include "fdrbench/method_spec.hpp"

namespace fdrbench {

const MethodSpec& Registry::add(MethodSpec spec) {
  if (contains(spec.id())) {
    throw DuplicateMethodError(spec.id());
  }
  return *_methods.emplace_back(std::make_shared<const MethodSpec>(std::move(spec)));
}

const MethodSpec& Registry::override(std::string_view id, const Params& params) {
  const auto it = find_or_throw(id);
  const auto offset = std::distance(begin(), it);

  auto& spec = _methods[static_cast<std::size_t>(offset)];
  spec = std::make_shared<const MethodSpec>(spec->with_params(params));
  return *spec;
}

void Registry::remove(std::string_view id) { _methods.erase(find_or_throw(id)); }

std::vector<std::string> Registry::list_ids() const {
  std::vector<std::string> ids(_methods.size());
  std::ranges::transform(_methods, ids.begin(), [](const auto& spec) { return spec->id(); });
  return ids;
}

bool Registry::contains(std::string_view id) const noexcept { return find(id) != end(); }

const MethodSpec& Registry::at(std::string_view id) const { return **find_or_throw(id); }

std::size_t Registry::size() const noexcept { return _methods.size(); }
bool Registry::empty() const noexcept { return _methods.empty(); }

auto Registry::begin() const noexcept -> const_iterator { return _methods.begin(); }
auto Registry::end() const noexcept -> const_iterator { return _methods.end(); }

Registry Registry::without(std::span<const std::string> ids) const {
  for (const auto& id : ids) {
    std::ignore = find_or_throw(id);
  }

  Registry reg{};
  std::ranges::copy_if(_methods, std::back_inserter(reg._methods), [&](const auto& spec) {
    return std::ranges::find(ids, spec->id()) == ids.end();
  });
  return reg;
}

Registry Registry::only(std::span<const std::string> ids) const {
  Registry reg{};
  for (const auto& id : ids) {
    if (reg.contains(id)) {
      throw DuplicateMethodError(id);
    }
    reg._methods.emplace_back(*find_or_throw(id));
  }
  return reg;
}

auto Registry::find(std::string_view id) const noexcept -> const_iterator {
  return std::ranges::find_if(_methods, [&](const auto& spec) { return spec->id() == id; });
}

auto Registry::find_or_throw(std::string_view id) const -> const_iterator {
  const auto it = find(id);
  if (it == end()) {
    throw UnknownMethodError(id);
  }
  return it;
}

}  // namespace fdrbench
