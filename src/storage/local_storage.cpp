#include "dv/storage/local_storage.h"

#include <algorithm>
#include <cerrno>
#include <cstring>
#include <string>
#include <system_error>
#include <thread>
#include <utility>

#include <fcntl.h>
#include <sys/file.h>
#include <sys/stat.h>
#include <unistd.h>

#include "dv/common.h"
#include "dv/error.h"
#include "dv/errors.h"

namespace dv::storage {

namespace fs = std::filesystem;

namespace {

constexpr std::chrono::milliseconds kLockPollInterval{5};

[[noreturn]] void ThrowIo(int code, const std::string& what, const fs::path& path, int native) {
  throw Error{ErrorDomain::IO, code, what + ": " + PathToUtf8String(path) + " (" + std::strerror(native) + ")",
              native};
}

[[noreturn]] void ThrowIo(int code, const std::string& what, const fs::path& path,
                          const std::error_code& ec) {
  throw Error{ErrorDomain::IO, code, what + ": " + PathToUtf8String(path) + " (" + ec.message() + ")",
              ec.value()};
}

int OpenWithLock(const fs::path& path, int flags, int lock_op, std::chrono::milliseconds timeout) {
  int fd = ::open(path.c_str(), flags | O_CLOEXEC, 0600);
  if (fd < 0) {
    const int err = errno;
    ThrowIo(err == ENOENT ? errors::io::kNodeMissing : errors::io::kOpenFailed, "Failed to open file", path,
            err);
  }
  const auto deadline = std::chrono::steady_clock::now() + timeout;
  for (;;) {
    if (::flock(fd, lock_op | LOCK_NB) == 0) {
      return fd;
    }
    const int err = errno;
    if (err == EINTR) {
      continue;
    }
    if (err != EWOULDBLOCK) {
      ::close(fd);
      ThrowIo(errors::io::kOpenFailed, "Failed to lock file", path, err);
    }
    const auto now = std::chrono::steady_clock::now();
    if (now >= deadline) {
      ::close(fd);
      throw Error{ErrorDomain::IO, errors::io::kLockTimeout,
                  std::string(errors::msg::kLockTimeout) + ": " + PathToUtf8String(path), std::nullopt,
                  Retryability::kTransient};
    }
    const auto remaining = std::chrono::duration_cast<std::chrono::milliseconds>(deadline - now);
    std::this_thread::sleep_for(std::min(kLockPollInterval, std::max(remaining, std::chrono::milliseconds{1})));
  }
}

std::chrono::system_clock::time_point LastWriteTime(const fs::path& path) {
  std::error_code ec;
  const auto written = fs::last_write_time(path, ec);
  if (ec) {
    ThrowIo(ec == std::errc::no_such_file_or_directory ? errors::io::kNodeMissing : errors::io::kReadFailed,
            "Failed to read modification time", path, ec);
  }
  return std::chrono::time_point_cast<std::chrono::system_clock::duration>(
      std::chrono::file_clock::to_sys(written));
}

std::shared_ptr<PhysicalFolder> ParentOf(const fs::path& path) {
  const auto parent = path.parent_path();
  if (parent.empty() || parent == path) {
    return nullptr;
  }
  return std::make_shared<LocalFolder>(parent);
}

class LocalReadableFile : public ReadableFile {
public:
  LocalReadableFile(int fd, fs::path path) : fd_(fd), path_(std::move(path)) {}

  LocalReadableFile(const LocalReadableFile&) = delete;
  LocalReadableFile& operator=(const LocalReadableFile&) = delete;

  ~LocalReadableFile() override {
    if (fd_ >= 0) {
      ::close(fd_);  // releases the flock
    }
  }

  size_t Read(std::span<uint8_t> out) override {
    for (;;) {
      const ssize_t n = ::read(fd_, out.data(), out.size());
      if (n >= 0) {
        return static_cast<size_t>(n);
      }
      if (errno != EINTR) {
        ThrowIo(errors::io::kReadFailed, "Failed to read file", path_, errno);
      }
    }
  }

  void Seek(uint64_t position) override {
    if (::lseek(fd_, static_cast<off_t>(position), SEEK_SET) < 0) {
      ThrowIo(errors::io::kReadFailed, "Failed to seek file", path_, errno);
    }
  }

  uint64_t Size() const override {
    struct stat st {};
    if (::fstat(fd_, &st) != 0) {
      ThrowIo(errors::io::kReadFailed, "Failed to stat file", path_, errno);
    }
    return static_cast<uint64_t>(st.st_size);
  }

protected:
  int fd_;
  fs::path path_;
};

class LocalWritableFile final : public WritableFile {
public:
  LocalWritableFile(int fd, fs::path path) : reader_(fd, path), fd_(fd), path_(std::move(path)) {}

  size_t Read(std::span<uint8_t> out) override { return reader_.Read(out); }
  void Seek(uint64_t position) override { reader_.Seek(position); }
  uint64_t Size() const override { return reader_.Size(); }

  size_t Write(std::span<const uint8_t> data) override {
    size_t written = 0;
    while (written < data.size()) {
      const ssize_t n = ::write(fd_, data.data() + written, data.size() - written);
      if (n < 0) {
        if (errno == EINTR) {
          continue;
        }
        ThrowIo(errors::io::kWriteFailed, "Failed to write file", path_, errno);
      }
      written += static_cast<size_t>(n);
    }
    return written;
  }

  void Truncate(uint64_t size) override {
    if (::ftruncate(fd_, static_cast<off_t>(size)) != 0) {
      ThrowIo(errors::io::kWriteFailed, "Failed to truncate file", path_, errno);
    }
  }

  void Sync() override {
    if (::fsync(fd_) != 0) {
      ThrowIo(errors::io::kWriteFailed, "Failed to sync file", path_, errno);
    }
  }

  void MoveTo(WritableFile& destination) override {
    auto* target = dynamic_cast<LocalWritableFile*>(&destination);
    if (!target) {
      throw Error{ErrorDomain::IO, errors::io::kMoveFailed,
                  "Move target handle belongs to another storage: " + PathToUtf8String(path_)};
    }
    if (::rename(path_.c_str(), target->path_.c_str()) != 0) {
      ThrowIo(errors::io::kMoveFailed, "Failed to move file", path_, errno);
    }
    path_ = target->path_;
  }

  void Delete() override {
    if (::unlink(path_.c_str()) != 0 && errno != ENOENT) {
      ThrowIo(errors::io::kDeleteFailed, "Failed to delete file", path_, errno);
    }
  }

private:
  LocalReadableFile reader_;  // owns and closes fd_
  int fd_;
  fs::path path_;
};

}  // namespace

LocalFile::LocalFile(fs::path path) : path_(std::move(path)) {}

std::string LocalFile::Name() const { return PathToUtf8String(path_.filename()); }

std::shared_ptr<PhysicalFolder> LocalFile::Parent() const { return ParentOf(path_); }

bool LocalFile::Exists() const {
  std::error_code ec;
  return fs::is_regular_file(path_, ec);
}

std::chrono::system_clock::time_point LocalFile::LastModified() const { return LastWriteTime(path_); }

std::unique_ptr<ReadableFile> LocalFile::OpenReadable(std::chrono::milliseconds timeout) const {
  const int fd = OpenWithLock(path_, O_RDONLY, LOCK_SH, timeout);
  return std::make_unique<LocalReadableFile>(fd, path_);
}

std::unique_ptr<WritableFile> LocalFile::OpenWritable(std::chrono::milliseconds timeout) const {
  const int fd = OpenWithLock(path_, O_RDWR | O_CREAT, LOCK_EX, timeout);
  return std::make_unique<LocalWritableFile>(fd, path_);
}

std::string LocalFile::Describe() const { return PathToUtf8String(path_); }

LocalFolder::LocalFolder(fs::path path) : path_(std::move(path)) {}

std::string LocalFolder::Name() const { return PathToUtf8String(path_.filename()); }

std::shared_ptr<PhysicalFolder> LocalFolder::Parent() const { return ParentOf(path_); }

bool LocalFolder::Exists() const {
  std::error_code ec;
  return fs::is_directory(path_, ec);
}

std::chrono::system_clock::time_point LocalFolder::LastModified() const { return LastWriteTime(path_); }

void LocalFolder::Create(FolderCreateMode mode) {
  std::error_code ec;
  if (mode == FolderCreateMode::kIncludingParents) {
    fs::create_directories(path_, ec);
  } else {
    const auto parent = path_.parent_path();
    if (!parent.empty() && !fs::is_directory(parent, ec)) {
      throw Error{ErrorDomain::IO, errors::io::kParentMissing,
                  std::string(errors::msg::kParentMissing) + ": " + PathToUtf8String(parent)};
    }
    fs::create_directory(path_, ec);
  }
  if (ec) {
    ThrowIo(errors::io::kCreateFailed, "Failed to create folder", path_, ec);
  }
}

void LocalFolder::Delete() {
  std::error_code ec;
  fs::remove_all(path_, ec);
  if (ec && ec != std::errc::no_such_file_or_directory) {
    ThrowIo(errors::io::kDeleteFailed, "Failed to delete folder", path_, ec);
  }
}

bool LocalFolder::DeleteIfEmpty() {
  if (::rmdir(path_.c_str()) == 0) {
    return true;
  }
  const int err = errno;
  if (err == ENOTEMPTY || err == EEXIST || err == ENOENT) {
    return false;
  }
  ThrowIo(errors::io::kDeleteFailed, "Failed to delete folder", path_, err);
}

std::shared_ptr<PhysicalFile> LocalFolder::File(const std::string& name) const {
  return std::make_shared<LocalFile>(path_ / name);
}

std::shared_ptr<PhysicalFolder> LocalFolder::Folder(const std::string& name) const {
  return std::make_shared<LocalFolder>(path_ / name);
}

std::vector<std::shared_ptr<PhysicalFile>> LocalFolder::Files() const {
  std::vector<std::shared_ptr<PhysicalFile>> result;
  if (!Exists()) {
    return result;
  }
  std::error_code ec;
  for (fs::directory_iterator it(path_, ec), end; !ec && it != end; it.increment(ec)) {
    std::error_code type_ec;
    if (it->is_regular_file(type_ec)) {
      result.push_back(std::make_shared<LocalFile>(it->path()));
    }
  }
  if (ec) {
    ThrowIo(errors::io::kListFailed, "Failed to list folder", path_, ec);
  }
  return result;
}

std::vector<std::shared_ptr<PhysicalFolder>> LocalFolder::Folders() const {
  std::vector<std::shared_ptr<PhysicalFolder>> result;
  if (!Exists()) {
    return result;
  }
  std::error_code ec;
  for (fs::directory_iterator it(path_, ec), end; !ec && it != end; it.increment(ec)) {
    std::error_code type_ec;
    if (it->is_directory(type_ec)) {
      result.push_back(std::make_shared<LocalFolder>(it->path()));
    }
  }
  if (ec) {
    ThrowIo(errors::io::kListFailed, "Failed to list folder", path_, ec);
  }
  return result;
}

std::string LocalFolder::Describe() const { return PathToUtf8String(path_); }

}  // namespace dv::storage
