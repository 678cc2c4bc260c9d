#pragma once

#include <chrono>
#include <memory>
#include <string>

#include "dv/core/node.h"

namespace dv::core {

class File {
public:
  File(std::shared_ptr<const VaultContext> context, std::shared_ptr<Folder> parent, std::string name);

  const std::string& Name() const noexcept { return name_; }
  std::shared_ptr<Folder> Parent() const noexcept { return parent_; }
  std::string LogicalPath() const;
  const std::shared_ptr<const VaultContext>& Context() const noexcept { return context_; }

  // "<encrypted name>.file"
  std::string EncryptedName() const;
  std::shared_ptr<storage::PhysicalFile> PhysicalFile() const;

  bool Exists() const;
  std::chrono::system_clock::time_point LastModified() const;

  // Content is passed through untouched. The timeout defaults to the vault's lock timeout.
  std::unique_ptr<storage::ReadableFile> OpenReadable() const;
  std::unique_ptr<storage::ReadableFile> OpenReadable(std::chrono::milliseconds timeout) const;
  std::unique_ptr<storage::WritableFile> OpenWritable() const;
  std::unique_ptr<storage::WritableFile> OpenWritable(std::chrono::milliseconds timeout) const;

  bool IsSameAs(const File& other) const;

  // Replaces the content of |target|, creating its parent folders as needed.
  void CopyTo(File& target) const;
  // Only another file of the same vault is a valid target.
  void MoveTo(const Node& target);
  void Delete();

private:
  std::shared_ptr<const VaultContext> context_;
  std::shared_ptr<Folder> parent_;
  std::string name_;
};

}  // namespace dv::core
