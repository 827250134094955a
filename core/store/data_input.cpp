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

#include "store/data_input.hpp"

#include <algorithm>

#include <absl/base/internal/endian.h>
#include <boost/crc.hpp>

#include "error/error.hpp"

namespace strata {

template<typename N>
N DataInput::ReadFixImpl() {
  N n;
  if (sizeof(n) != ReadBytes(reinterpret_cast<byte_type*>(&n), sizeof(n))) {
    throw eof_error{};
  }
  return absl::big_endian::ToHost(n);
}

template<typename N>
N DataInput::ReadVarImpl() {
  static constexpr size_t kMaxShift = sizeof(N) * 8;

  N n = 0;
  for (size_t shift = 0; shift < kMaxShift; shift += 7) {
    const byte_type b = ReadByte();
    n |= static_cast<N>(b & 0x7F) << shift;
    if (!(b & 0x80)) {
      return n;
    }
  }

  throw index_error{"Malformed variable length integer."};
}

template uint16_t DataInput::ReadFixImpl<uint16_t>();
template uint32_t DataInput::ReadFixImpl<uint32_t>();
template uint64_t DataInput::ReadFixImpl<uint64_t>();
template uint32_t DataInput::ReadVarImpl<uint32_t>();
template uint64_t DataInput::ReadVarImpl<uint64_t>();

uint32_t IndexInput::Checksum(size_t count) {
  const auto begin = Position();

  boost::crc_32_type crc;
  byte_type buf[1024];

  while (count) {
    const auto to_read = std::min(count, sizeof buf);
    const auto read = ReadBytes(buf, to_read);
    if (read != to_read) {
      throw eof_error{};
    }
    crc.process_bytes(buf, read);
    count -= read;
  }

  Seek(begin);
  return crc.checksum();
}

}  // namespace strata
