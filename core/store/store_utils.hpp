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

#include <string>
#include <string_view>

#include "error/error.hpp"
#include "store/data_input.hpp"
#include "store/data_output.hpp"

namespace strata {

template<typename StringType>
void WriteStr(DataOutput& out, const StringType& str) {
  out.WriteV32(static_cast<uint32_t>(str.size()));
  out.WriteBytes(reinterpret_cast<const byte_type*>(str.data()), str.size());
}

template<typename StringType>
StringType ReadString(DataInput& in) {
  const size_t len = in.ReadV32();

  StringType str(len, typename StringType::value_type{});
  const auto read = in.ReadBytes(reinterpret_cast<byte_type*>(str.data()), len);

  if (read != len) {
    throw eof_error{};
  }

  return str;
}

// Write 'value' as a single byte flag
inline void WriteBool(DataOutput& out, bool value) {
  out.WriteByte(value ? 1 : 0);
}

inline bool ReadBool(DataInput& in) { return 0 != in.ReadByte(); }

}  // namespace strata
