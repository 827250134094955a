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

#include <memory>

#include "shared.hpp"
#include "utils/noncopyable.hpp"

namespace strata {

class DataInput {
 public:
  virtual ~DataInput() = default;

  virtual byte_type ReadByte() = 0;

  // Returns number of bytes actually read
  virtual size_t ReadBytes(byte_type* b, size_t count) = 0;

  uint16_t ReadU16() { return ReadFixImpl<uint16_t>(); }
  uint32_t ReadU32() { return ReadFixImpl<uint32_t>(); }
  uint64_t ReadU64() { return ReadFixImpl<uint64_t>(); }
  uint32_t ReadV32() { return ReadVarImpl<uint32_t>(); }
  uint64_t ReadV64() { return ReadVarImpl<uint64_t>(); }

 private:
  template<typename N>
  N ReadFixImpl();

  template<typename N>
  N ReadVarImpl();
};

// Random access input stream of a directory file
class IndexInput : public DataInput, private util::noncopyable {
 public:
  using ptr = std::unique_ptr<IndexInput>;

  virtual size_t Position() const noexcept = 0;
  virtual size_t Length() const noexcept = 0;
  virtual void Seek(size_t pos) = 0;

  bool IsEOF() const noexcept { return Position() >= Length(); }

  // CRC-32 of the 'count' bytes following the current position,
  // the position is restored afterwards
  uint32_t Checksum(size_t count);
};

}  // namespace strata
