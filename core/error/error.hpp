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

#include <exception>
#include <string>
#include <string_view>

#include "shared.hpp"

namespace strata {

enum class ErrorCode : uint32_t {
  no_error = 0U,
  not_supported,
  io_error,
  eof_error,
  lock_obtain_failed,
  file_not_found,
  index_not_found,
  index_error,
  illegal_argument,
  illegal_state,
  merge_aborted,
  undefined_error
};

#define DECLARE_ERROR_CODE(class_name) \
  static constexpr ErrorCode CODE = ErrorCode::class_name

struct error_base : std::exception {
  virtual ErrorCode code() const noexcept { return ErrorCode::undefined_error; }
  const char* what() const noexcept override;
};

// Error with a message supplied at construction
class detailed_error_base : public error_base {
 public:
  detailed_error_base() = default;

  explicit detailed_error_base(std::string&& error) noexcept
    : error_{std::move(error)} {}

  explicit detailed_error_base(std::string_view error) : error_{error} {}

  explicit detailed_error_base(const char* error) : error_{error} {}

  const char* what() const noexcept final { return error_.c_str(); }

 private:
  std::string error_;
};

struct not_supported : public detailed_error_base {
  DECLARE_ERROR_CODE(not_supported);

  not_supported() : detailed_error_base{"Operation not supported."} {}

  template<typename T>
  explicit not_supported(T&& error)
    : detailed_error_base{std::forward<T>(error)} {}

  ErrorCode code() const noexcept override { return CODE; }
};

struct io_error : public detailed_error_base {
  DECLARE_ERROR_CODE(io_error);

  io_error() = default;

  template<typename T>
  explicit io_error(T&& error) : detailed_error_base{std::forward<T>(error)} {}

  ErrorCode code() const noexcept override { return CODE; }
};

struct eof_error : public io_error {
  DECLARE_ERROR_CODE(eof_error);

  eof_error() : io_error{"Read past EOF."} {}

  template<typename T>
  explicit eof_error(T&& error) : io_error{std::forward<T>(error)} {}

  ErrorCode code() const noexcept override { return CODE; }
};

// Failure to obtain an index lock, 'reason' holds the last failure cause
// reported by the lock implementation (if any)
class lock_obtain_failed : public detailed_error_base {
 public:
  DECLARE_ERROR_CODE(lock_obtain_failed);

  explicit lock_obtain_failed(std::string_view filename = {},
                              std::string_view reason = {});

  ErrorCode code() const noexcept override { return CODE; }

  const std::string& reason() const noexcept { return reason_; }

 private:
  std::string reason_;
};

class file_not_found : public detailed_error_base {
 public:
  DECLARE_ERROR_CODE(file_not_found);

  explicit file_not_found(std::string_view filename = {});

  ErrorCode code() const noexcept override { return CODE; }
};

struct index_not_found : public detailed_error_base {
  DECLARE_ERROR_CODE(index_not_found);

  index_not_found() : detailed_error_base{"No segments file found."} {}

  ErrorCode code() const noexcept override { return CODE; }
};

// Corrupt or inconsistent index data
struct index_error : public detailed_error_base {
  DECLARE_ERROR_CODE(index_error);

  template<typename T>
  explicit index_error(T&& error)
    : detailed_error_base{std::forward<T>(error)} {}

  ErrorCode code() const noexcept override { return CODE; }
};

struct illegal_argument : public detailed_error_base {
  DECLARE_ERROR_CODE(illegal_argument);

  template<typename T>
  explicit illegal_argument(T&& error)
    : detailed_error_base{std::forward<T>(error)} {}

  ErrorCode code() const noexcept override { return CODE; }
};

struct illegal_state : public detailed_error_base {
  DECLARE_ERROR_CODE(illegal_state);

  template<typename T>
  explicit illegal_state(T&& error)
    : detailed_error_base{std::forward<T>(error)} {}

  ErrorCode code() const noexcept override { return CODE; }
};

// A merge was stopped through its abort tracker
struct merge_aborted : public detailed_error_base {
  DECLARE_ERROR_CODE(merge_aborted);

  template<typename T>
  explicit merge_aborted(T&& error)
    : detailed_error_base{std::forward<T>(error)} {}

  ErrorCode code() const noexcept override { return CODE; }
};

}  // namespace strata
