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

#include <catch2/catch_test_macros.hpp>
#include <cstdint>
#include <stdexcept>
#include <string>
#include <variant>
#include <vector>

#include "fdrbench/dataset.hpp"
#include "fdrbench/errors.hpp"
#include "fdrbench/method_spec.hpp"

namespace fdrbench::test {

// NOLINTBEGIN(*-avoid-magic-numbers, readability-magic-numbers, readability-function-cognitive-complexity)
[[nodiscard]] static std::vector<double> constant_method(const MethodArgs& args) {
  return std::vector<double>(args.size(), args.param_or("value", 0.5));
}

[[nodiscard]] static std::vector<double> copy_covariate(const MethodArgs& args) {
  const auto covariate = args[Column::ind_covariate];
  return {covariate.begin(), covariate.end()};
}

TEST_CASE("MethodSpec", "[short][registry]") {
  Dataset data{{0.1, 0.2, 0.3}};
  data.set(Column::ind_covariate, {0.4, 0.5, 0.6});

  SECTION("invoke") {
    const MethodSpec spec{"constant", {}, constant_method, {{"value", 0.25}}};
    CHECK(spec.id() == "constant");
    CHECK(spec.requires_column(Column::p_value));
    CHECK_FALSE(spec.requires_column(Column::ind_covariate));
    CHECK(spec(data) == std::vector<double>{0.25, 0.25, 0.25});
  }

  SECTION("declared inputs") {
    const MethodSpec spec{"covariate", {Column::ind_covariate}, copy_covariate};
    CHECK(spec.requires_column(Column::ind_covariate));
    CHECK(spec(data) == std::vector<double>{0.4, 0.5, 0.6});

    const Dataset data2{{0.1, 0.2, 0.3}};
    CHECK_THROWS_AS(spec(data2), UnsupportedInputError);
  }

  SECTION("undeclared inputs") {
    const MethodSpec spec{"covariate", {}, copy_covariate};
    CHECK_THROWS_AS(spec(data), std::logic_error);
  }

  SECTION("output extractor") {
    struct Output {
      std::vector<double> qvalues{};
      double pi0{};
    };

    const MethodSpec spec{"extractor", {},
                          [](const MethodArgs& args) {
                            return Output{std::vector<double>(args.size(), 0.1), 0.9};
                          },
                          {}, &Output::qvalues};
    CHECK(spec(data) == std::vector<double>{0.1, 0.1, 0.1});
  }

  SECTION("with_params") {
    const MethodSpec spec{"constant", {}, constant_method, {{"value", 0.25}}};
    const auto spec2 = spec.with_params({{"value", 0.75}});

    CHECK(spec(data).front() == 0.25);
    CHECK(spec2(data).front() == 0.75);
    CHECK(std::get<double>(spec.params().at("value")) == 0.25);
  }

  SECTION("invalid specs") {
    CHECK_THROWS_AS(MethodSpec("", {}, constant_method), std::invalid_argument);
    CHECK_THROWS_AS(
        MethodSpec("dup", {Column::ind_covariate, Column::ind_covariate}, copy_covariate),
        std::invalid_argument);
  }
}

TEST_CASE("MethodArgs", "[short][registry]") {
  const Dataset data{{0.1, 0.2}};
  const Params params{{"flag", true},
                      {"nbins", std::int64_t{5}},
                      {"lambda", 0.5},
                      {"mode", std::string{"fast"}}};
  const MethodArgs args{data, params, {}};

  CHECK(args.size() == 2);
  CHECK(args.param<bool>("flag"));
  CHECK(args.param<std::size_t>("nbins") == 5);
  CHECK(args.param<double>("nbins") == 5.0);
  CHECK(args.param<double>("lambda") == 0.5);
  CHECK(args.param<std::string>("mode") == "fast");
  CHECK(args.param_or("alpha", 0.05) == 0.05);

  CHECK_THROWS_AS(args.param<double>("alpha"), std::out_of_range);
  CHECK_THROWS_AS(args.param<std::int64_t>("lambda"), std::invalid_argument);
  CHECK_THROWS_AS(args.param<std::string>("flag"), std::invalid_argument);

  CHECK(to_string(params.at("nbins")) == "5");
  CHECK(to_string(params.at("mode")) == "fast");
}

TEST_CASE("Registry", "[short][registry]") {
  Registry reg{};
  reg.add("a", {}, constant_method);
  reg.add("b", {}, constant_method, {{"value", 0.1}});
  reg.add("c", {Column::ind_covariate}, copy_covariate);

  SECTION("accessors") {
    CHECK(reg.size() == 3);
    CHECK_FALSE(reg.empty());
    CHECK(reg.list_ids() == std::vector<std::string>{"a", "b", "c"});
    CHECK(reg.contains("b"));
    CHECK_FALSE(reg.contains("d"));
    CHECK(reg.at("c").requires_column(Column::ind_covariate));
    CHECK_THROWS_AS(reg.at("d"), UnknownMethodError);

    std::vector<std::string> ids{};
    for (const auto& spec : reg) {
      ids.push_back(spec->id());
    }
    CHECK(ids == reg.list_ids());
  }

  SECTION("duplicate ids") {
    CHECK_THROWS_AS(reg.add("a", {}, constant_method), DuplicateMethodError);
    CHECK(reg.size() == 3);
  }

  SECTION("override") {
    const auto copy = reg;
    reg.override("b", {{"value", 0.9}});

    const Dataset data{{0.5}};
    CHECK(reg.at("b")(data).front() == 0.9);
    CHECK(copy.at("b")(data).front() == 0.1);
    CHECK(reg.list_ids() == copy.list_ids());

    CHECK_THROWS_AS(reg.override("d", {}), UnknownMethodError);
  }

  SECTION("remove") {
    reg.remove("b");
    CHECK(reg.list_ids() == std::vector<std::string>{"a", "c"});
    CHECK_THROWS_AS(reg.remove("b"), UnknownMethodError);
  }

  SECTION("without") {
    const std::vector<std::string> excluded{"a"};
    const auto reg2 = reg.without(excluded);
    CHECK(reg2.list_ids() == std::vector<std::string>{"b", "c"});
    CHECK(reg.size() == 3);

    const std::vector<std::string> unknown{"d"};
    CHECK_THROWS_AS(reg.without(unknown), UnknownMethodError);
  }

  SECTION("only") {
    const std::vector<std::string> selected{"c", "a"};
    CHECK(reg.only(selected).list_ids() == selected);

    const std::vector<std::string> duplicates{"a", "a"};
    CHECK_THROWS_AS(reg.only(duplicates), DuplicateMethodError);
  }
}
// NOLINTEND(*-avoid-magic-numbers, readability-magic-numbers, readability-function-cognitive-complexity)

}  // namespace fdrbench::test
