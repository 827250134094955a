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

#include <utility>

#include "utils/noncopyable.hpp"

namespace strata {

// Convenient helper for simulating 'try/catch/finally' semantic
template<typename Func>
class Finally : private util::nonmovable {
 public:
  // cppcheck-suppress noExplicitConstructor
  Finally(Func&& func) : func_{std::move(func)} {}
  ~Finally() { func_(); }

 private:
  Func func_;
};

template<typename Func>
Finally(Func&&) -> Finally<Func>;

}  // namespace strata
