#pragma once

#include <chrono>
#include <cstdint>
#include <memory>
#include <span>
#include <string>
#include <vector>

namespace dv::storage {

enum class FolderCreateMode {
  kFailIfParentMissing,
  kIncludingParents
};

// Shared-locked handle. Reads advance an internal position.
class ReadableFile {
public:
  virtual ~ReadableFile() = default;

  // Returns the number of bytes read, 0 once the end of file is reached.
  virtual size_t Read(std::span<uint8_t> out) = 0;
  virtual void Seek(uint64_t position) = 0;
  virtual uint64_t Size() const = 0;
};

// Exclusively-locked handle. The lock is held until the handle is destroyed.
class WritableFile : public ReadableFile {
public:
  virtual size_t Write(std::span<const uint8_t> data) = 0;
  virtual void Truncate(uint64_t size) = 0;
  virtual void Sync() = 0;

  // Atomically replaces the file behind |destination| with this file. Both
  // handles must come from the same storage implementation and stay locked
  // for the duration of the call.
  virtual void MoveTo(WritableFile& destination) = 0;

  // Removes the file while the lock is still held.
  virtual void Delete() = 0;
};

class PhysicalFolder;

class PhysicalFile {
public:
  virtual ~PhysicalFile() = default;

  virtual std::string Name() const = 0;
  virtual std::shared_ptr<PhysicalFolder> Parent() const = 0;
  virtual bool Exists() const = 0;
  virtual std::chrono::system_clock::time_point LastModified() const = 0;

  // Both throw dv::Error (IO/kLockTimeout) when the lock is not granted within |timeout|.
  virtual std::unique_ptr<ReadableFile> OpenReadable(std::chrono::milliseconds timeout) const = 0;
  // Creates the file when it does not exist yet.
  virtual std::unique_ptr<WritableFile> OpenWritable(std::chrono::milliseconds timeout) const = 0;

  // Human readable location used in error messages.
  virtual std::string Describe() const = 0;
};

class PhysicalFolder {
public:
  virtual ~PhysicalFolder() = default;

  virtual std::string Name() const = 0;
  // nullptr at the top of the storage namespace.
  virtual std::shared_ptr<PhysicalFolder> Parent() const = 0;
  virtual bool Exists() const = 0;
  virtual std::chrono::system_clock::time_point LastModified() const = 0;

  virtual void Create(FolderCreateMode mode) = 0;
  // Removes the folder and everything below it. No-op when absent.
  virtual void Delete() = 0;
  // Removes the folder only when it is empty. Returns whether it was removed.
  virtual bool DeleteIfEmpty() = 0;

  virtual std::shared_ptr<PhysicalFile> File(const std::string& name) const = 0;
  virtual std::shared_ptr<PhysicalFolder> Folder(const std::string& name) const = 0;

  // Each call re-reads the folder. Empty when the folder does not exist.
  virtual std::vector<std::shared_ptr<PhysicalFile>> Files() const = 0;
  virtual std::vector<std::shared_ptr<PhysicalFolder>> Folders() const = 0;

  virtual std::string Describe() const = 0;
};

}  // namespace dv::storage
