#include "dv/core/node.h"

#include "dv/core/file.h"
#include "dv/core/folder.h"

namespace dv::core {

std::string NameOf(const Node& node) {
  return std::visit([](const auto& n) { return n->Name(); }, node);
}

std::string LogicalPathOf(const Node& node) {
  return std::visit([](const auto& n) { return n->LogicalPath(); }, node);
}

std::shared_ptr<Folder> ParentOf(const Node& node) {
  return std::visit([](const auto& n) { return n->Parent(); }, node);
}

bool IsFolder(const Node& node) noexcept {
  return std::holds_alternative<std::shared_ptr<Folder>>(node);
}

bool SameVault(const VaultContext& lhs, const VaultContext& rhs) {
  return &lhs == &rhs || lhs.physical_root->Describe() == rhs.physical_root->Describe();
}

bool SameNode(const Node& lhs, const Node& rhs) {
  if (lhs.index() != rhs.index()) {
    return false;
  }
  if (const auto* folder = std::get_if<std::shared_ptr<Folder>>(&lhs)) {
    return (*folder)->IsSameAs(*std::get<std::shared_ptr<Folder>>(rhs));
  }
  return std::get<std::shared_ptr<File>>(lhs)->IsSameAs(*std::get<std::shared_ptr<File>>(rhs));
}

}  // namespace dv::core
