#pragma once

#include <filesystem>
#include <memory>
#include <string>
#include <string_view>
#include <vector>

#include "dv/core/file.h"
#include "dv/core/filename_cipher.h"
#include "dv/core/folder.h"
#include "dv/core/options.h"
#include "dv/storage/physical_storage.h"

namespace dv::core {

class CryptoFileSystem {
public:
  // Throws dv::Error (Config/kInvalidOption) on invalid |options|. Nothing is
  // written until the root is created.
  static std::shared_ptr<CryptoFileSystem> Open(std::shared_ptr<storage::PhysicalFolder> physical_root,
                                                std::shared_ptr<const FilenameCipher> cipher,
                                                FileSystemOptions options = {});
  static std::shared_ptr<CryptoFileSystem> Open(const std::filesystem::path& physical_root,
                                                std::shared_ptr<const FilenameCipher> cipher,
                                                FileSystemOptions options = {});

  // Always the same instance, so the root identifier is cached once.
  std::shared_ptr<Folder> Root() const noexcept { return root_; }
  const FileSystemOptions& Options() const noexcept { return context_->options; }

  // "/a/b" relative to the root. Empty segments are ignored.
  std::shared_ptr<Folder> ResolveFolder(std::string_view logical_path) const;
  std::shared_ptr<File> ResolveFile(std::string_view logical_path) const;

private:
  explicit CryptoFileSystem(std::shared_ptr<const VaultContext> context);

  std::shared_ptr<const VaultContext> context_;
  std::shared_ptr<Folder> root_;
};

}  // namespace dv::core
