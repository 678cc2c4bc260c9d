#include "dv/core/crypto_filesystem.h"

#include <cassert>
#include <filesystem>
#include <iostream>
#include <string>

#include "dv/common.h"
#include "dv/crypto/base32.h"
#include "dv/crypto/sha1.h"
#include "test_support.h"

namespace {

namespace fs = std::filesystem;
using dv::core::FolderCreateMode;

fs::path ExpectedDataFolder(const fs::path& vault, const dv::core::PhysicalPathMapper& mapper,
                            const std::string& id) {
  const auto sharded = mapper.Map(id);
  return vault / "d" / sharded.container / sharded.leaf;
}

void TestCreateAndMoveDocs(const fs::path& vault) {
  auto cipher = dv::test::FixedCipher(7);
  auto filesystem = dv::core::CryptoFileSystem::Open(vault, cipher);
  auto root = filesystem->Root();
  root->Create(FolderCreateMode::kIncludingParents);
  const dv::core::PhysicalPathMapper mapper(cipher, 2, true);

  auto docs = root->GetFolder("docs");
  docs->Create(FolderCreateMode::kIncludingParents);
  const auto root_data = ExpectedDataFolder(vault, mapper, root->DirectoryId());
  const auto marker = root_data / (cipher->EncryptSegment("docs") + ".dir");
  assert(fs::is_regular_file(marker) && "docs marker must sit at <root data>/<enc(docs)>.dir");

  const auto docs_id = docs->DirectoryId();
  const auto docs_data = ExpectedDataFolder(vault, mapper, docs_id);
  assert(fs::is_directory(docs_data) && "docs data folder must exist at d/<prefix>/<remainder>");
  assert(docs_data.parent_path().filename().string().size() == 2 && "the shard container has two characters");
  assert(docs->PhysicalFolder()->Describe() == dv::PathToUtf8String(docs_data) && "the node must agree");
  assert(fs::file_size(marker) == docs_id.size() && "the marker holds exactly the identifier");

  auto archive = root->GetFolder("archive");
  docs->MoveTo(dv::core::Node{archive});
  assert(archive->PhysicalFolder()->Describe() == dv::PathToUtf8String(docs_data) &&
         "archive must take over the docs data folder");
  assert(!fs::exists(marker) && "the docs marker must be gone");
  assert(docs->PhysicalFolder()->Describe() != dv::PathToUtf8String(docs_data) &&
         "docs no longer resolves to its old data folder");
  assert(fs::is_directory(docs_data) && "the data folder itself never moves");
}

void TestPhysicalPathFollowsIdentifierOnly(const fs::path& vault) {
  auto cipher = dv::test::FixedCipher(7);
  std::string x_data;
  std::string y_data;
  fs::path x_marker;
  fs::path y_marker;
  {
    auto filesystem = dv::core::CryptoFileSystem::Open(vault, cipher);
    auto x = filesystem->ResolveFolder("/swap/x");
    auto y = filesystem->ResolveFolder("/swap/y");
    x->Create(FolderCreateMode::kIncludingParents);
    y->Create(FolderCreateMode::kIncludingParents);
    x_data = x->PhysicalFolder()->Describe();
    y_data = y->PhysicalFolder()->Describe();
    x_marker = fs::path(x->MarkerFile()->Describe());
    y_marker = fs::path(y->MarkerFile()->Describe());
  }
  const auto parked = x_marker.parent_path() / "parked";
  fs::rename(x_marker, parked);
  fs::rename(y_marker, x_marker);
  fs::rename(parked, y_marker);

  auto filesystem = dv::core::CryptoFileSystem::Open(vault, cipher);
  assert(filesystem->ResolveFolder("/swap/x")->PhysicalFolder()->Describe() == y_data &&
         "swapped markers must swap physical folders");
  assert(filesystem->ResolveFolder("/swap/y")->PhysicalFolder()->Describe() == x_data &&
         "logical names must not influence the physical folder");
}

void TestPlainIdentifierHashing(const fs::path& vault) {
  dv::core::FileSystemOptions options;
  options.encrypt_directory_ids = false;
  options.shard_prefix_length = 3;
  auto filesystem = dv::core::CryptoFileSystem::Open(vault, dv::test::FixedCipher(8), options);
  auto root = filesystem->Root();
  root->Create(FolderCreateMode::kIncludingParents);
  const auto id = root->DirectoryId();
  const auto encoded = dv::crypto::Base32Encode(dv::crypto::SHA1_Hash(dv::AsByteSpan(id)));
  const auto expected = vault / "d" / encoded.substr(0, 3) / encoded.substr(3);
  assert(fs::is_directory(expected) && "plain mode must hash the identifier in the clear");
}

}  // namespace

int main() {
  dv::test::TempDir dir("dv_end_to_end_");
  dv::test::RouteLogsTo(dir.path());
  TestCreateAndMoveDocs(dir.path() / "vault");
  TestPhysicalPathFollowsIdentifierOnly(dir.path() / "vault");
  TestPlainIdentifierHashing(dir.path() / "plain-vault");
  std::cout << "end to end test ok\n";
  return 0;
}
