#pragma once

#include <chrono>
#include <filesystem>
#include <memory>
#include <string>
#include <vector>

#include "dv/storage/physical_storage.h"

namespace dv::storage {

// std::filesystem backed storage. Handle locks are advisory flock() locks, so
// they exclude other handles of this library (in this or another process) but
// not unrelated programs touching the same files.
class LocalFile final : public PhysicalFile {
public:
  explicit LocalFile(std::filesystem::path path);

  std::string Name() const override;
  std::shared_ptr<PhysicalFolder> Parent() const override;
  bool Exists() const override;
  std::chrono::system_clock::time_point LastModified() const override;
  std::unique_ptr<ReadableFile> OpenReadable(std::chrono::milliseconds timeout) const override;
  std::unique_ptr<WritableFile> OpenWritable(std::chrono::milliseconds timeout) const override;
  std::string Describe() const override;

  const std::filesystem::path& Path() const noexcept { return path_; }

private:
  std::filesystem::path path_;
};

class LocalFolder final : public PhysicalFolder {
public:
  explicit LocalFolder(std::filesystem::path path);

  std::string Name() const override;
  std::shared_ptr<PhysicalFolder> Parent() const override;
  bool Exists() const override;
  std::chrono::system_clock::time_point LastModified() const override;
  void Create(FolderCreateMode mode) override;
  void Delete() override;
  bool DeleteIfEmpty() override;
  std::shared_ptr<PhysicalFile> File(const std::string& name) const override;
  std::shared_ptr<PhysicalFolder> Folder(const std::string& name) const override;
  std::vector<std::shared_ptr<PhysicalFile>> Files() const override;
  std::vector<std::shared_ptr<PhysicalFolder>> Folders() const override;
  std::string Describe() const override;

  const std::filesystem::path& Path() const noexcept { return path_; }

private:
  std::filesystem::path path_;
};

}  // namespace dv::storage
