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

#include "formats/format_utils.hpp"

#include <absl/strings/str_cat.h>

#include "error/error.hpp"
#include "store/store_utils.hpp"

namespace strata::format_utils {

void write_header(IndexOutput& out, std::string_view format, int32_t ver) {
  out.WriteU32(kFormatMagic);
  WriteStr(out, format);
  out.WriteU32(static_cast<uint32_t>(ver));
}

void write_footer(IndexOutput& out) {
  const uint64_t checksum = out.Checksum();
  out.WriteU32(kFooterMagic);
  out.WriteU32(0);
  out.WriteU64(checksum);
}

int32_t check_header(IndexInput& in, std::string_view req_format,
                     int32_t min_ver, int32_t max_ver) {
  const auto magic = in.ReadU32();

  if (kFormatMagic != magic) {
    throw index_error{absl::StrCat(
      "While checking header, error: invalid magic number '", magic, "'")};
  }

  const auto format = ReadString<std::string>(in);

  if (req_format != format) {
    throw index_error{absl::StrCat(
      "While checking header, error: format mismatch '", format,
      "' != '", req_format, "'")};
  }

  const auto ver = static_cast<int32_t>(in.ReadU32());

  if (ver < min_ver || ver > max_ver) {
    throw index_error{absl::StrCat(
      "While checking header, error: invalid version '", ver, "'")};
  }

  return ver;
}

void check_footer(IndexInput& in, uint64_t checksum) {
  if (in.Length() - in.Position() != kFooterLen) {
    throw index_error{absl::StrCat(
      "While checking footer, error: invalid position '", in.Position(),
      "'")};
  }

  const auto magic = in.ReadU32();

  if (kFooterMagic != magic) {
    throw index_error{absl::StrCat(
      "While checking footer, error: invalid magic number '", magic, "'")};
  }

  const auto alg_id = in.ReadU32();

  if (0 != alg_id) {
    throw index_error{absl::StrCat(
      "While checking footer, error: invalid algorithm '", alg_id, "'")};
  }

  const auto expected_checksum = in.ReadU64();

  if (expected_checksum != checksum) {
    throw index_error{absl::StrCat(
      "While checking footer, error: invalid checksum '", expected_checksum,
      "' != '", checksum, "'")};
  }
}

uint64_t checksum(IndexInput& in) {
  const auto length = in.Length();

  if (length < kFooterLen) {
    throw index_error{absl::StrCat(
      "While reading footer, error: invalid input length '", length, "'")};
  }

  const auto position = in.Position();
  in.Seek(0);
  const auto result = in.Checksum(length - kFooterLen);
  in.Seek(position);

  return result;
}

}  // namespace strata::format_utils
