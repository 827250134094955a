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

#include <absl/base/internal/endian.h>
#include <boost/crc.hpp>

#include "shared.hpp"
#include "utils/noncopyable.hpp"

namespace strata {

template<typename N, typename Assign>
STRATA_FORCE_INLINE void WriteVarBytes(N n, Assign&& assign) {
  static constexpr N kMax = 0x80;
  while (n >= kMax) {
    assign(static_cast<byte_type>(n | kMax));
    n >>= 7;
  }
  assign(static_cast<byte_type>(n));
}

class DataOutput {
 public:
  virtual ~DataOutput() = default;

  virtual void WriteByte(byte_type b) = 0;
  virtual void WriteBytes(const byte_type* b, size_t len) = 0;

  void WriteU16(uint16_t n) { WriteFixImpl(n); }
  void WriteU32(uint32_t n) { WriteFixImpl(n); }
  void WriteU64(uint64_t n) { WriteFixImpl(n); }
  void WriteV32(uint32_t n) { WriteVarImpl(n); }
  void WriteV64(uint64_t n) { WriteVarImpl(n); }

 private:
  template<typename N>
  STRATA_FORCE_INLINE void WriteFixImpl(N n) {
    n = absl::big_endian::FromHost(n);
    WriteBytes(reinterpret_cast<const byte_type*>(&n), sizeof(n));
  }

  template<typename N>
  STRATA_FORCE_INLINE void WriteVarImpl(N n) {
    WriteVarBytes(n, [&](byte_type b) { WriteByte(b); });
  }
};

// Output stream of a directory file, keeps a running CRC-32 of every byte
// written through it
class IndexOutput : public DataOutput, private util::noncopyable {
 public:
  using ptr = std::unique_ptr<IndexOutput>;

  void WriteByte(byte_type b) final { WriteBytes(&b, 1); }

  void WriteBytes(const byte_type* b, size_t len) final;

  size_t Position() const noexcept { return pos_; }

  uint32_t Checksum() const noexcept { return crc_.checksum(); }

  // Flush buffered data to the underlying storage
  virtual void Flush() = 0;

  // Flush and close output
  virtual void Close() = 0;

 protected:
  virtual void WriteDirect(const byte_type* b, size_t len) = 0;

 private:
  boost::crc_32_type crc_;
  size_t pos_{};
};

}  // namespace strata
