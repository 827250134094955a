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

#include <filesystem>

#include "store/directory.hpp"

namespace strata {

// Directory over files of a single filesystem folder
class FSDirectory : public directory {
 public:
  explicit FSDirectory(std::filesystem::path dir);

  const std::filesystem::path& path() const noexcept { return dir_; }

  IndexOutput::ptr create(std::string_view name) noexcept override;

  bool exists(bool& result, std::string_view name) const noexcept override;

  bool length(uint64_t& result, std::string_view name) const noexcept override;

  index_lock::ptr make_lock(std::string_view name) noexcept override;

  bool mtime(std::time_t& result,
             std::string_view name) const noexcept override;

  IndexInput::ptr open(std::string_view name) const noexcept override;

  bool remove(std::string_view name) noexcept override;

  bool rename(std::string_view src, std::string_view dst) noexcept override;

  bool sync(std::span<const std::string_view> files) noexcept override;

  bool visit(const visitor_f& visitor) const override;

 private:
  std::filesystem::path dir_;
};

}  // namespace strata
