#pragma once

#include <chrono>
#include <memory>
#include <mutex>
#include <string>
#include <vector>

#include "dv/core/directory_id.h"
#include "dv/core/node.h"

namespace dv::core {

class Folder : public std::enable_shared_from_this<Folder> {
public:
  // Nodes are handed out by CryptoFileSystem::Root() and GetFolder(); |parent|
  // is null only for the root.
  Folder(std::shared_ptr<const VaultContext> context, std::shared_ptr<Folder> parent, std::string name);

  Folder(const Folder&) = delete;
  Folder& operator=(const Folder&) = delete;

  const std::string& Name() const noexcept { return name_; }
  std::shared_ptr<Folder> Parent() const noexcept { return parent_; }
  bool IsRoot() const noexcept { return !parent_; }
  std::string LogicalPath() const;
  const std::shared_ptr<const VaultContext>& Context() const noexcept { return context_; }

  // "<encrypted name>.dir"; empty for the root.
  std::string EncryptedName() const;
  std::shared_ptr<storage::PhysicalFile> MarkerFile() const;

  // Identifier anchoring the physical location. Mints (without persisting)
  // when the folder has not been materialized.
  std::string DirectoryId();
  std::shared_ptr<storage::PhysicalFolder> PhysicalFolder();
  DirectoryIdStore& IdStore() noexcept { return id_store_; }

  bool Exists() const;
  // Modification time of the marker. Throws NodeMissing when not materialized.
  std::chrono::system_clock::time_point LastModified() const;

  // No-op when the marker already exists.
  void Create(FolderCreateMode mode);

  // Each call re-reads the physical folder. Entries that fail to decrypt are
  // skipped and reported as undecryptable_entry.
  std::vector<Node> Children();
  std::vector<std::shared_ptr<File>> Files();
  std::vector<std::shared_ptr<Folder>> Folders();

  std::shared_ptr<File> GetFile(const std::string& name);
  std::shared_ptr<Folder> GetFolder(const std::string& name);

  // True when |node| is a strict descendant of this folder.
  bool Contains(const Node& node) const;
  bool IsSameAs(const Folder& other) const;

  // Creates |target| and copies the subtree into it. Fails with
  // HierarchyViolation when |target| is this folder or one of its descendants.
  void CopyTo(Folder& target);

  // Relocates the marker only; the data folder and everything below it stay
  // where they are and become reachable through |target|.
  void MoveTo(const Node& target);

  // Removes the subtree, the data folder and the marker. No-op when absent.
  // Every entry below the folder is write-locked before anything is removed;
  // a busy entry fails the call with LockTimeout and the subtree intact.
  void Delete();

private:
  struct SubtreeLocks;

  void LockSubtree(SubtreeLocks& locks);
  std::shared_ptr<storage::PhysicalFolder> ParentPhysicalFolder() const;
  void CopyChildrenInto(Folder& target);
  void MaterializeLocked(FolderCreateMode mode);

  std::shared_ptr<const VaultContext> context_;
  std::shared_ptr<Folder> parent_;
  std::string name_;
  DirectoryIdStore id_store_;
  std::mutex materialize_mutex_;
};

}  // namespace dv::core
