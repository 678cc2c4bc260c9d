#include "dv/core/folder.h"

#include <optional>
#include <string_view>
#include <utility>

#include "dv/core/events.h"
#include "dv/core/file.h"
#include "dv/error.h"
#include "dv/errors.h"

namespace dv::core {

namespace {

using orchestrator::EventField;
using orchestrator::EventSeverity;
using orchestrator::FieldPrivacy;

[[noreturn]] void ThrowHierarchyViolation(std::string_view message, const std::string& source,
                                          const std::string& target) {
  throw Error{ErrorDomain::Validation, errors::validation::kHierarchyViolation,
              std::string(message) + ": " + source + " -> " + target};
}

bool EndsWith(std::string_view value, std::string_view suffix) {
  return value.size() > suffix.size() && value.substr(value.size() - suffix.size()) == suffix;
}

// Decrypts the cleartext name of a listed entry; std::nullopt when the entry
// does not belong to this vault or was tampered with.
std::optional<std::string> DecryptEntryName(const VaultContext& context, const storage::PhysicalFile& entry,
                                            std::string_view stem, const std::string& folder_path) {
  try {
    std::string clear = context.cipher->DecryptSegment(stem);
    ValidateSegmentName(clear);
    return clear;
  } catch (const Error& err) {
    if (err.domain != ErrorDomain::Crypto && err.domain != ErrorDomain::Validation) {
      throw;
    }
    events::PublishNodeEvent("undecryptable_entry", "Skipping entry that failed to decrypt", folder_path,
                             {EventField("entry", entry.Describe()), EventField("reason", err.what())},
                             EventSeverity::kWarning);
    return std::nullopt;
  }
}

void RemoveDataFolder(storage::PhysicalFolder& data) {
  data.Delete();
  if (auto container = data.Parent()) {
    container->DeleteIfEmpty();
  }
}

}  // namespace

struct Folder::SubtreeLocks {
  struct LockedFile {
    std::shared_ptr<File> node;
    std::unique_ptr<storage::WritableFile> handle;
  };
  struct LockedFolder {
    std::shared_ptr<Folder> node;
    std::shared_ptr<storage::PhysicalFolder> data;
    std::unique_ptr<storage::WritableFile> marker;
  };
  std::vector<LockedFile> files;
  // Descendants come before their ancestors.
  std::vector<LockedFolder> folders;
};

Folder::Folder(std::shared_ptr<const VaultContext> context, std::shared_ptr<Folder> parent, std::string name)
    : context_(std::move(context)),
      parent_(std::move(parent)),
      name_(std::move(name)),
      id_store_(context_->options.max_marker_bytes, context_->options.lock_timeout) {}

std::string Folder::LogicalPath() const {
  if (IsRoot()) {
    return "/";
  }
  const std::string parent_path = parent_->LogicalPath();
  return parent_->IsRoot() ? parent_path + name_ : parent_path + "/" + name_;
}

std::string Folder::EncryptedName() const {
  if (IsRoot()) {
    return {};
  }
  return context_->cipher->EncryptSegment(name_) + std::string(kFolderMarkerSuffix);
}

std::shared_ptr<storage::PhysicalFolder> Folder::ParentPhysicalFolder() const {
  return parent_->PhysicalFolder();
}

std::shared_ptr<storage::PhysicalFile> Folder::MarkerFile() const {
  if (IsRoot()) {
    return context_->physical_root->File(context_->options.root_marker_name);
  }
  return ParentPhysicalFolder()->File(EncryptedName());
}

std::string Folder::DirectoryId() {
  return id_store_.GetOrCreate(*MarkerFile());
}

std::shared_ptr<storage::PhysicalFolder> Folder::PhysicalFolder() {
  return context_->mapper.Resolve(*context_->data_root, DirectoryId());
}

bool Folder::Exists() const {
  return MarkerFile()->Exists();
}

std::chrono::system_clock::time_point Folder::LastModified() const {
  return MarkerFile()->LastModified();
}

void Folder::Create(FolderCreateMode mode) {
  std::lock_guard<std::mutex> lock(materialize_mutex_);
  MaterializeLocked(mode);
}

void Folder::MaterializeLocked(FolderCreateMode mode) {
  if (Exists()) {
    // Another node for this path may have materialized it after this one
    // minted an identifier of its own.
    if (id_store_.Cached()) {
      id_store_.Reload(*MarkerFile());
    }
    return;
  }
  if (IsRoot()) {
    context_->physical_root->Create(FolderCreateMode::kIncludingParents);
  } else if (!parent_->Exists()) {
    if (mode == FolderCreateMode::kFailIfParentMissing) {
      throw Error{ErrorDomain::IO, errors::io::kParentMissing,
                  std::string(errors::msg::kParentMissing) + ": " + parent_->LogicalPath()};
    }
    parent_->Create(FolderCreateMode::kIncludingParents);
  }
  if (!IsRoot()) {
    ParentPhysicalFolder()->Create(FolderCreateMode::kIncludingParents);
  }

  auto marker = MarkerFile();
  // Cache first so concurrent readers of this node never observe the marker
  // before it carries the identifier.
  id_store_.GetOrCreate(*marker);
  const std::string id = id_store_.Persist(*marker);
  context_->mapper.Resolve(*context_->data_root, id)->Create(FolderCreateMode::kIncludingParents);

  events::PublishNodeEvent("folder_materialized", "Folder materialized", LogicalPath(),
                           {EventField("directory_id", id, FieldPrivacy::kHash)});
}

std::vector<Node> Folder::Children() {
  std::vector<Node> children;
  auto physical = PhysicalFolder();
  const std::string path = LogicalPath();
  auto self = shared_from_this();
  for (const auto& entry : physical->Files()) {
    const std::string entry_name = entry->Name();
    if (EndsWith(entry_name, kFolderMarkerSuffix)) {
      const auto stem = std::string_view(entry_name).substr(0, entry_name.size() - kFolderMarkerSuffix.size());
      if (auto clear = DecryptEntryName(*context_, *entry, stem, path)) {
        children.emplace_back(std::make_shared<Folder>(context_, self, std::move(*clear)));
      }
    } else if (EndsWith(entry_name, kFileSuffix)) {
      const auto stem = std::string_view(entry_name).substr(0, entry_name.size() - kFileSuffix.size());
      if (auto clear = DecryptEntryName(*context_, *entry, stem, path)) {
        children.emplace_back(std::make_shared<File>(context_, self, std::move(*clear)));
      }
    }
  }
  return children;
}

std::vector<std::shared_ptr<File>> Folder::Files() {
  std::vector<std::shared_ptr<File>> files;
  for (auto& child : Children()) {
    if (auto* file = std::get_if<std::shared_ptr<File>>(&child)) {
      files.push_back(std::move(*file));
    }
  }
  return files;
}

std::vector<std::shared_ptr<Folder>> Folder::Folders() {
  std::vector<std::shared_ptr<Folder>> folders;
  for (auto& child : Children()) {
    if (auto* folder = std::get_if<std::shared_ptr<Folder>>(&child)) {
      folders.push_back(std::move(*folder));
    }
  }
  return folders;
}

std::shared_ptr<File> Folder::GetFile(const std::string& name) {
  ValidateSegmentName(name);
  return std::make_shared<File>(context_, shared_from_this(), name);
}

std::shared_ptr<Folder> Folder::GetFolder(const std::string& name) {
  ValidateSegmentName(name);
  return std::make_shared<Folder>(context_, shared_from_this(), name);
}

bool Folder::IsSameAs(const Folder& other) const {
  return SameVault(*context_, *other.context_) && LogicalPath() == other.LogicalPath();
}

bool Folder::Contains(const Node& node) const {
  auto ancestor = ParentOf(node);
  for (size_t depth = 0; ancestor && depth < kMaxHierarchyDepth; ++depth) {
    if (ancestor->IsSameAs(*this)) {
      return true;
    }
    ancestor = ancestor->Parent();
  }
  return false;
}

void Folder::CopyTo(Folder& target) {
  if (IsSameAs(target) || Contains(Node{target.shared_from_this()})) {
    ThrowHierarchyViolation(errors::msg::kCopyIntoSelf, LogicalPath(), target.LogicalPath());
  }
  if (!Exists()) {
    throw Error{ErrorDomain::IO, errors::io::kNodeMissing,
                std::string(errors::msg::kCopySourceMissing) + ": " + LogicalPath()};
  }
  target.Create(FolderCreateMode::kIncludingParents);
  CopyChildrenInto(target);
  events::PublishNodeEvent("folder_copied", "Folder copied", LogicalPath(),
                           {EventField("target", target.LogicalPath(), FieldPrivacy::kHash)});
}

void Folder::CopyChildrenInto(Folder& target) {
  for (const auto& child : Children()) {
    if (const auto* file = std::get_if<std::shared_ptr<File>>(&child)) {
      auto destination = target.GetFile((*file)->Name());
      (*file)->CopyTo(*destination);
    } else {
      const auto& folder = std::get<std::shared_ptr<Folder>>(child);
      auto destination = target.GetFolder(folder->Name());
      destination->Create(FolderCreateMode::kIncludingParents);
      folder->CopyChildrenInto(*destination);
    }
  }
}

void Folder::MoveTo(const Node& target) {
  const auto* folder_target = std::get_if<std::shared_ptr<Folder>>(&target);
  if (!folder_target || !*folder_target || !SameVault(*(*folder_target)->context_, *context_)) {
    throw Error{ErrorDomain::Validation, errors::validation::kUnsupportedCrossKindMove,
                std::string(errors::msg::kMoveFolderToForeignNode) + ": " + LogicalPath() + " -> " +
                    LogicalPathOf(target)};
  }
  Folder& destination = **folder_target;
  if (IsSameAs(destination) || Contains(target) || destination.Contains(Node{shared_from_this()})) {
    ThrowHierarchyViolation(errors::msg::kMoveIntoSelf, LogicalPath(), destination.LogicalPath());
  }

  auto source_marker = MarkerFile();
  if (!source_marker->Exists()) {
    throw Error{ErrorDomain::IO, errors::io::kNodeMissing,
                std::string(errors::msg::kMoveSourceMissing) + ": " + LogicalPath()};
  }
  if (destination.Exists()) {
    throw Error{ErrorDomain::State, errors::state::kTargetExists,
                std::string(errors::msg::kMoveTargetExists) + ": " + destination.LogicalPath()};
  }
  destination.parent_->Create(FolderCreateMode::kIncludingParents);
  destination.ParentPhysicalFolder()->Create(FolderCreateMode::kIncludingParents);
  auto target_marker = destination.MarkerFile();

  const auto timeout = context_->options.lock_timeout;
  {
    auto source_handle = events::OpenWritable(*source_marker, timeout);
    const bool created_target = !target_marker->Exists();
    auto target_handle = events::OpenWritable(*target_marker, timeout);
    try {
      source_handle->MoveTo(*target_handle);
    } catch (const Error&) {
      if (created_target) {
        target_handle->Delete();
      }
      throw;
    }
  }
  id_store_.Invalidate();
  destination.id_store_.Invalidate();

  events::PublishNodeEvent("folder_moved", "Folder moved", LogicalPath(),
                           {EventField("target", destination.LogicalPath(), FieldPrivacy::kHash)});
}

void Folder::LockSubtree(SubtreeLocks& locks) {
  const auto timeout = context_->options.lock_timeout;
  for (auto& child : Children()) {
    if (auto* file = std::get_if<std::shared_ptr<File>>(&child)) {
      auto handle = events::OpenWritable(*(*file)->PhysicalFile(), timeout);
      locks.files.push_back({std::move(*file), std::move(handle)});
      continue;
    }
    auto& folder = std::get<std::shared_ptr<Folder>>(child);
    // Resolve before locking: reading the identifier takes a shared lock on the marker.
    auto data = folder->PhysicalFolder();
    folder->LockSubtree(locks);
    auto marker = events::OpenWritable(*folder->MarkerFile(), timeout);
    locks.folders.push_back({std::move(folder), std::move(data), std::move(marker)});
  }
}

void Folder::Delete() {
  if (IsRoot()) {
    throw Error{ErrorDomain::Validation, errors::validation::kRootImmutable,
                std::string(errors::msg::kRootImmutable) + ": delete"};
  }
  auto marker = MarkerFile();
  if (!marker->Exists()) {
    return;
  }
  auto data = PhysicalFolder();
  auto marker_handle = events::OpenWritable(*marker, context_->options.lock_timeout);
  SubtreeLocks locks;
  LockSubtree(locks);

  for (auto& file : locks.files) {
    file.handle->Delete();
    events::PublishNodeEvent("file_deleted", "File deleted", file.node->LogicalPath());
  }
  for (auto& folder : locks.folders) {
    RemoveDataFolder(*folder.data);
    folder.marker->Delete();
    folder.node->id_store_.Invalidate();
    events::PublishNodeEvent("folder_deleted", "Folder deleted", folder.node->LogicalPath());
  }
  RemoveDataFolder(*data);
  marker_handle->Delete();
  id_store_.Invalidate();
  events::PublishNodeEvent("folder_deleted", "Folder deleted", LogicalPath());
}

}  // namespace dv::core
