#pragma once

#include <memory>
#include <string>
#include <string_view>
#include <variant>

#include "dv/core/filename_cipher.h"
#include "dv/core/options.h"
#include "dv/core/path_mapper.h"
#include "dv/storage/physical_storage.h"

namespace dv::core {

class File;
class Folder;

inline constexpr std::string_view kFolderMarkerSuffix{".dir"};
inline constexpr std::string_view kFileSuffix{".file"};
// Upper bound on the ancestor walk of the containment check.
inline constexpr size_t kMaxHierarchyDepth = 4096;

// Everything nodes of one mounted vault share.
struct VaultContext {
  std::shared_ptr<storage::PhysicalFolder> physical_root;
  std::shared_ptr<storage::PhysicalFolder> data_root;
  std::shared_ptr<const FilenameCipher> cipher;
  PhysicalPathMapper mapper;
  FileSystemOptions options;
};

// A logical node is exactly one of the two variants; there is no common base.
using Node = std::variant<std::shared_ptr<File>, std::shared_ptr<Folder>>;

std::string NameOf(const Node& node);
std::string LogicalPathOf(const Node& node);
std::shared_ptr<Folder> ParentOf(const Node& node);
bool IsFolder(const Node& node) noexcept;

// True when both contexts address the same physical root, whether or not they
// come from the same CryptoFileSystem instance.
bool SameVault(const VaultContext& lhs, const VaultContext& rhs);

// Structural identity: same vault, same kind and same logical path.
bool SameNode(const Node& lhs, const Node& rhs);

}  // namespace dv::core
