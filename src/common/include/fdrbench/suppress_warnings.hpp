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

// Source: https://www.fluentcpp.com/2019/08/30/how-to-disable-a-warning-in-cpp/

// clang-format off

// NOLINTBEGIN(cppcoreguidelines-macro-usage)

#ifdef _MSC_VER
    #define FDRBENCH_DISABLE_WARNING_PUSH                      __pragma(warning(push))
    #define FDRBENCH_DISABLE_WARNING_POP                       __pragma(warning(pop))
    #define FDRBENCH_DISABLE_WARNING(warningNumber)            __pragma(warning(disable : warningNumber))

    #define FDRBENCH_DISABLE_WARNING_DEPRECATED_DECLARATIONS   FDRBENCH_DISABLE_WARNING(4996)
    #define FDRBENCH_DISABLE_WARNING_FLOAT_EQUAL
    #define FDRBENCH_DISABLE_WARNING_USELESS_CAST
#endif

#if defined(__GNUC__) || defined(__clang__)
    #define FDRBENCH_DO_PRAGMA(X)                              _Pragma(#X)
    #define FDRBENCH_DISABLE_WARNING_PUSH                      FDRBENCH_DO_PRAGMA(GCC diagnostic push)
    #define FDRBENCH_DISABLE_WARNING_POP                       FDRBENCH_DO_PRAGMA(GCC diagnostic pop)
    #define FDRBENCH_DISABLE_WARNING(warningName)              FDRBENCH_DO_PRAGMA(GCC diagnostic ignored warningName)

    #define FDRBENCH_DISABLE_WARNING_DEPRECATED_DECLARATIONS   FDRBENCH_DISABLE_WARNING("-Wdeprecated-declarations")
    #define FDRBENCH_DISABLE_WARNING_FLOAT_EQUAL               FDRBENCH_DISABLE_WARNING("-Wfloat-equal")
#endif

// Boost.Random and Boost.Math trigger -Wuseless-cast with GCC only
#if defined(__GNUC__) && !defined(__clang__)
    #define FDRBENCH_DISABLE_WARNING_USELESS_CAST              FDRBENCH_DISABLE_WARNING("-Wuseless-cast")
#endif

#ifdef __clang__
    #define FDRBENCH_DISABLE_WARNING_USELESS_CAST
#endif

#if !defined(_MSC_VER) && !defined(__GNUC__) && !defined(__clang__)
    #define FDRBENCH_DISABLE_WARNING
    #define FDRBENCH_DISABLE_WARNING_PUSH
    #define FDRBENCH_DISABLE_WARNING_POP

    #define FDRBENCH_DISABLE_WARNING_DEPRECATED_DECLARATIONS
    #define FDRBENCH_DISABLE_WARNING_FLOAT_EQUAL
    #define FDRBENCH_DISABLE_WARNING_USELESS_CAST
#endif

// NOLINTEND(cppcoreguidelines-macro-usage)

// clang-format on
