////////////////////////////////////////////////////////////////////////////////
/// DISCLAIMER
///
/// Copyright 2016 by EMC Corporation, All Rights Reserved
///
/// Licensed under the Apache License, Version 2.0 (the "License");
/// you may not use this file except in compliance with the License.
/// You may obtain a copy of the License at
///
///     http://www.apache.org/licenses/LICENSE-2.0
///
/// Unless required by applicable law or agreed to in writing, software
/// distributed under the License is distributed on an "AS IS" BASIS,
/// WITHOUT WARRANTIES OR CONDITIONS OF ANY KIND, either express or implied.
/// See the License for the specific language governing permissions and
/// limitations under the License.
///
/// Copyright holder is EMC Corporation
////////////////////////////////////////////////////////////////////////////////

#pragma once

#include <cstddef>
#include <cstdint>

#include "types.hpp"

////////////////////////////////////////////////////////////////////////////////
/// C++ standard
////////////////////////////////////////////////////////////////////////////////

#ifndef __cplusplus
#error C++ is required
#endif

#define STRATA_CXX_20 202002L  // c++20

#if defined(_MSC_VER)
// MSVC doesn't honor __cplusplus macro,
// it always equals to C++98 therefore we use _MSC_VER
#if _MSC_VER < 1920  // before MSVC2019
#error "at least C++20 is required"
#endif
#else  // GCC/Clang
#if __cplusplus < STRATA_CXX_20
#error "at least C++20 is required"
#endif
#endif

////////////////////////////////////////////////////////////////////////////////
/// Compiler specific helpers
////////////////////////////////////////////////////////////////////////////////

#if defined(_MSC_VER)
#define STRATA_FORCE_INLINE inline __forceinline
#else
#define STRATA_FORCE_INLINE inline __attribute__((always_inline))
#endif

// define function name used for pretty printing
#if defined(__FUNCSIG__)
#define STRATA_CURRENT_FUNCTION __FUNCSIG__
#elif defined(__GNUC__) || defined(__clang__)
#define STRATA_CURRENT_FUNCTION __PRETTY_FUNCTION__
#else
#define STRATA_CURRENT_FUNCTION __func__
#endif

// likely/unlikely branch indicator
// macro definitions similar to the ones at
// https://kernelnewbies.org/FAQ/LikelyUnlikely
#if defined(__GNUC__) || defined(__GNUG__)
#define STRATA_LIKELY(v) __builtin_expect(!!(v), 1)
#define STRATA_UNLIKELY(v) __builtin_expect(!!(v), 0)
#else
#define STRATA_LIKELY(v) v
#define STRATA_UNLIKELY(v) v
#endif
