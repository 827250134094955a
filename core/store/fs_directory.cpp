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

#include "store/fs_directory.hpp"

#include <cerrno>
#include <csignal>
#include <cstdio>
#include <cstring>

#include <fcntl.h>
#include <sys/types.h>
#include <unistd.h>

#include <absl/strings/numbers.h>
#include <absl/strings/str_cat.h>

#include "error/error.hpp"
#include "utils/log.hpp"

namespace strata {
namespace {

struct FileDeleter {
  void operator()(FILE* f) const noexcept {
    if (f) {
      std::fclose(f);
    }
  }
};

using FileHandle = std::unique_ptr<FILE, FileDeleter>;

// Lock backed by a file holding the pid of the owner process,
// a lock file left by a dead process is considered stale
class FSLock final : public index_lock {
 public:
  FSLock(std::filesystem::path dir, std::string_view file)
    : path_{std::move(dir) / file}, name_{file} {}

  ~FSLock() final { unlock(); }

  bool lock() final {
    if (held_) {
      // don't allow self obtaining
      failure_reason("Lock is already held by this instance");
      return false;
    }

    std::error_code ec;
    std::filesystem::create_directories(path_.parent_path(), ec);

    if (ec) {
      throw io_error{absl::StrCat(
        "Failed to create directory for lock file, path: ",
        path_.parent_path().string(), ", error: ", ec.message())};
    }

    if (VerifyLockFile()) {
      return false;
    }

    // stale or missing lock file
    std::filesystem::remove(path_, ec);

    const int fd = ::open(path_.c_str(), O_WRONLY | O_CREAT | O_EXCL, 0644);

    if (fd < 0) {
      failure_reason(absl::StrCat("Failed to create lock file, path: ",
                                  path_.string(), ", error: ",
                                  std::strerror(errno)));
      return false;
    }

    const auto pid = absl::StrCat(::getpid());
    const bool written =
      ::write(fd, pid.data(), pid.size()) == static_cast<ssize_t>(pid.size()) &&
      0 == ::fsync(fd);
    ::close(fd);

    if (!written) {
      failure_reason(absl::StrCat("Failed to write lock file, path: ",
                                  path_.string()));
      std::filesystem::remove(path_, ec);
      return false;
    }

    held_ = true;
    return true;
  }

  bool is_locked() const final {
    return held_ || const_cast<FSLock*>(this)->VerifyLockFile();
  }

  bool unlock() noexcept final {
    if (!held_) {
      return false;
    }

    held_ = false;

    std::error_code ec;
    std::filesystem::remove(path_, ec);

    if (ec) {
      STRATA_LOG_ERROR(absl::StrCat("Failed to remove lock file, path: ",
                                    path_.string(), ", error: ",
                                    ec.message()));
    }

    return true;
  }

 protected:
  std::string_view name() const noexcept final { return name_; }

 private:
  // Returns 'true' if the lock file exists and its owner is alive
  bool VerifyLockFile() {
    FileHandle handle{std::fopen(path_.c_str(), "rb")};

    if (!handle) {
      return false;
    }

    char buf[32]{};
    const auto read = std::fread(buf, 1, sizeof buf - 1, handle.get());

    int64_t pid;
    if (!absl::SimpleAtoi(std::string_view{buf, read}, &pid) || pid <= 0) {
      failure_reason(absl::StrCat("Malformed lock file, path: ",
                                  path_.string()));
      return false;
    }

    if (0 == ::kill(static_cast<pid_t>(pid), 0) || errno == EPERM) {
      failure_reason(absl::StrCat("Lock file '", path_.string(),
                                  "' is held by process ", pid));
      return true;
    }

    return false;
  }

  std::filesystem::path path_;
  std::string name_;
  bool held_{false};
};

class FSIndexOutput final : public IndexOutput {
 public:
  static IndexOutput::ptr Open(const std::filesystem::path& name) {
    FileHandle handle{std::fopen(name.c_str(), "wb")};

    if (!handle) {
      STRATA_LOG_ERROR(absl::StrCat("Failed to open output file, error: ",
                                    std::strerror(errno),
                                    ", path: ", name.string()));
      return nullptr;
    }

    return std::make_unique<FSIndexOutput>(std::move(handle));
  }

  explicit FSIndexOutput(FileHandle&& handle) noexcept
    : handle_{std::move(handle)} {}

  void Flush() final {
    if (handle_ && 0 != std::fflush(handle_.get())) {
      throw io_error{absl::StrCat("Failed to flush output file, error: ",
                                  std::strerror(errno))};
    }
  }

  void Close() final {
    if (!handle_) {
      return;
    }

    Flush();
    handle_.reset();
  }

 protected:
  void WriteDirect(const byte_type* b, size_t len) final {
    if (!handle_) {
      throw io_error{"Write to a closed output file"};
    }

    const auto written = std::fwrite(b, sizeof(byte_type), len, handle_.get());

    if (written != len) {
      throw io_error{absl::StrCat("Failed to write buffer, written ", written,
                                  " out of ", len, " bytes.")};
    }
  }

 private:
  FileHandle handle_;
};

class FSIndexInput final : public IndexInput {
 public:
  static IndexInput::ptr Open(const std::filesystem::path& name) {
    FileHandle handle{std::fopen(name.c_str(), "rb")};

    if (!handle) {
      STRATA_LOG_ERROR(absl::StrCat("Failed to open input file, error: ",
                                    std::strerror(errno),
                                    ", path: ", name.string()));
      return nullptr;
    }

    std::error_code ec;
    const auto size = std::filesystem::file_size(name, ec);

    if (ec) {
      STRATA_LOG_ERROR(absl::StrCat(
        "Failed to get stat for input file, error: ", ec.message(),
        ", path: ", name.string()));
      return nullptr;
    }

    return std::make_unique<FSIndexInput>(std::move(handle), size);
  }

  FSIndexInput(FileHandle&& handle, size_t size) noexcept
    : handle_{std::move(handle)}, size_{size} {}

  byte_type ReadByte() final {
    byte_type b;
    if (1 != ReadBytes(&b, 1)) {
      throw eof_error{};
    }
    return b;
  }

  size_t ReadBytes(byte_type* b, size_t count) final {
    const auto read = std::fread(b, sizeof(byte_type), count, handle_.get());
    pos_ += read;

    if (read != count && std::ferror(handle_.get())) {
      throw io_error{absl::StrCat("Failed to read from input file, read ",
                                  read, " out of ", count, " bytes")};
    }

    return read;
  }

  size_t Position() const noexcept final { return pos_; }

  size_t Length() const noexcept final { return size_; }

  void Seek(size_t pos) final {
    if (pos > size_) {
      throw io_error{absl::StrCat("Seek out of range for input file, length ",
                                  size_, ", position ", pos)};
    }

    if (0 != std::fseek(handle_.get(), static_cast<long>(pos), SEEK_SET)) {
      throw io_error{absl::StrCat("Failed to seek to ", pos,
                                  " for input file, error ",
                                  std::strerror(errno))};
    }

    pos_ = pos;
  }

 private:
  FileHandle handle_;
  size_t size_;
  size_t pos_{};
};

}  // namespace

FSDirectory::FSDirectory(std::filesystem::path dir) : dir_{std::move(dir)} {}

IndexOutput::ptr FSDirectory::create(std::string_view name) noexcept {
  try {
    return FSIndexOutput::Open(dir_ / name);
  } catch (const std::exception& e) {
    STRATA_LOG_ERROR(absl::StrCat("Failed to create file '", name,
                                  "', error: ", e.what()));
  }

  return nullptr;
}

bool FSDirectory::exists(bool& result, std::string_view name) const noexcept {
  std::error_code ec;
  result = std::filesystem::exists(dir_ / name, ec);
  return !ec;
}

bool FSDirectory::length(uint64_t& result,
                         std::string_view name) const noexcept {
  std::error_code ec;
  result = std::filesystem::file_size(dir_ / name, ec);
  return !ec;
}

index_lock::ptr FSDirectory::make_lock(std::string_view name) noexcept {
  try {
    return std::make_unique<FSLock>(dir_, name);
  } catch (const std::exception& e) {
    STRATA_LOG_ERROR(absl::StrCat("Failed to make lock '", name,
                                  "', error: ", e.what()));
  }

  return nullptr;
}

bool FSDirectory::mtime(std::time_t& result,
                        std::string_view name) const noexcept {
  std::error_code ec;
  const auto time = std::filesystem::last_write_time(dir_ / name, ec);

  if (ec) {
    return false;
  }

  result = std::chrono::system_clock::to_time_t(
    std::chrono::time_point_cast<std::chrono::system_clock::duration>(
      std::chrono::file_clock::to_sys(time)));
  return true;
}

IndexInput::ptr FSDirectory::open(std::string_view name) const noexcept {
  try {
    return FSIndexInput::Open(dir_ / name);
  } catch (const std::exception& e) {
    STRATA_LOG_ERROR(absl::StrCat("Failed to open file '", name,
                                  "', error: ", e.what()));
  }

  return nullptr;
}

bool FSDirectory::remove(std::string_view name) noexcept {
  std::error_code ec;
  std::filesystem::remove(dir_ / name, ec);
  return !ec;
}

bool FSDirectory::rename(std::string_view src, std::string_view dst) noexcept {
  std::error_code ec;
  std::filesystem::rename(dir_ / src, dir_ / dst, ec);

  if (ec) {
    STRATA_LOG_ERROR(absl::StrCat("Failed to rename '", src, "' to '", dst,
                                  "', error: ", ec.message()));
    return false;
  }

  return true;
}

bool FSDirectory::sync(std::span<const std::string_view> files) noexcept {
  for (const auto name : files) {
    const auto path = dir_ / name;
    const int fd = ::open(path.c_str(), O_RDONLY);

    if (fd < 0) {
      STRATA_LOG_ERROR(absl::StrCat("Failed to sync file, error: ",
                                    std::strerror(errno),
                                    " path: ", path.string()));
      return false;
    }

    const bool synced = 0 == ::fsync(fd);
    ::close(fd);

    if (!synced) {
      STRATA_LOG_ERROR(absl::StrCat("Failed to sync file, error: ",
                                    std::strerror(errno),
                                    " path: ", path.string()));
      return false;
    }
  }

  return true;
}

bool FSDirectory::visit(const directory::visitor_f& visitor) const {
  std::error_code ec;
  std::filesystem::directory_iterator it{dir_, ec};

  if (ec) {
    return false;
  }

  for (const auto& entry : it) {
    if (!entry.is_regular_file(ec)) {
      continue;
    }

    const auto name = entry.path().filename().string();

    if (!visitor(name)) {
      return false;
    }
  }

  return true;
}

}  // namespace strata
