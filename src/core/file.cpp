#include "dv/core/file.h"

#include <array>
#include <utility>

#include "dv/core/events.h"
#include "dv/core/folder.h"
#include "dv/error.h"
#include "dv/errors.h"

namespace dv::core {

namespace {

using orchestrator::EventField;
using orchestrator::FieldPrivacy;

constexpr size_t kCopyBufferSize = 64 * 1024;

}  // namespace

File::File(std::shared_ptr<const VaultContext> context, std::shared_ptr<Folder> parent, std::string name)
    : context_(std::move(context)), parent_(std::move(parent)), name_(std::move(name)) {}

std::string File::LogicalPath() const {
  const std::string parent_path = parent_->LogicalPath();
  return parent_->IsRoot() ? parent_path + name_ : parent_path + "/" + name_;
}

std::string File::EncryptedName() const {
  return context_->cipher->EncryptSegment(name_) + std::string(kFileSuffix);
}

std::shared_ptr<storage::PhysicalFile> File::PhysicalFile() const {
  return parent_->PhysicalFolder()->File(EncryptedName());
}

bool File::Exists() const {
  return PhysicalFile()->Exists();
}

std::chrono::system_clock::time_point File::LastModified() const {
  return PhysicalFile()->LastModified();
}

std::unique_ptr<storage::ReadableFile> File::OpenReadable() const {
  return OpenReadable(context_->options.lock_timeout);
}

std::unique_ptr<storage::ReadableFile> File::OpenReadable(std::chrono::milliseconds timeout) const {
  return events::OpenReadable(*PhysicalFile(), timeout);
}

std::unique_ptr<storage::WritableFile> File::OpenWritable() const {
  return OpenWritable(context_->options.lock_timeout);
}

std::unique_ptr<storage::WritableFile> File::OpenWritable(std::chrono::milliseconds timeout) const {
  return events::OpenWritable(*PhysicalFile(), timeout);
}

bool File::IsSameAs(const File& other) const {
  return SameVault(*context_, *other.context_) && LogicalPath() == other.LogicalPath();
}

void File::CopyTo(File& target) const {
  if (IsSameAs(target)) {
    throw Error{ErrorDomain::Validation, errors::validation::kHierarchyViolation,
                std::string(errors::msg::kCopyOntoSelf) + ": " + LogicalPath()};
  }
  auto source = PhysicalFile();
  if (!source->Exists()) {
    throw Error{ErrorDomain::IO, errors::io::kNodeMissing,
                std::string(errors::msg::kCopySourceMissing) + ": " + LogicalPath()};
  }
  target.parent_->Create(FolderCreateMode::kIncludingParents);

  auto reader = OpenReadable();
  auto writer = target.OpenWritable();
  writer->Truncate(0);
  writer->Seek(0);
  std::array<uint8_t, kCopyBufferSize> buffer{};
  for (;;) {
    const size_t n = reader->Read(buffer);
    if (n == 0) {
      break;
    }
    writer->Write(std::span<const uint8_t>(buffer.data(), n));
  }
  writer->Sync();
}

void File::MoveTo(const Node& target) {
  const auto* file_target = std::get_if<std::shared_ptr<File>>(&target);
  if (!file_target || !*file_target || !SameVault(*(*file_target)->context_, *context_)) {
    throw Error{ErrorDomain::Validation, errors::validation::kUnsupportedCrossKindMove,
                std::string(errors::msg::kMoveFileToForeignNode) + ": " + LogicalPath() + " -> " +
                    LogicalPathOf(target)};
  }
  File& destination = **file_target;
  if (IsSameAs(destination)) {
    return;
  }
  auto source = PhysicalFile();
  if (!source->Exists()) {
    throw Error{ErrorDomain::IO, errors::io::kNodeMissing,
                std::string(errors::msg::kMoveSourceMissing) + ": " + LogicalPath()};
  }
  if (destination.Exists()) {
    throw Error{ErrorDomain::State, errors::state::kTargetExists,
                std::string(errors::msg::kMoveTargetExists) + ": " + destination.LogicalPath()};
  }
  destination.parent_->Create(FolderCreateMode::kIncludingParents);
  auto target_file = destination.PhysicalFile();

  const auto timeout = context_->options.lock_timeout;
  auto source_handle = events::OpenWritable(*source, timeout);
  auto target_handle = events::OpenWritable(*target_file, timeout);
  try {
    source_handle->MoveTo(*target_handle);
  } catch (const Error&) {
    target_handle->Delete();
    throw;
  }
  events::PublishNodeEvent("file_moved", "File moved", LogicalPath(),
                           {EventField("target", destination.LogicalPath(), FieldPrivacy::kHash)});
}

void File::Delete() {
  auto physical = PhysicalFile();
  if (!physical->Exists()) {
    return;
  }
  auto handle = events::OpenWritable(*physical, context_->options.lock_timeout);
  handle->Delete();
  events::PublishNodeEvent("file_deleted", "File deleted", LogicalPath());
}

}  // namespace dv::core
