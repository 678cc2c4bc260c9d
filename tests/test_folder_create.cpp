#include "dv/core/crypto_filesystem.h"

#include <cassert>
#include <chrono>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <set>
#include <string>
#include <thread>
#include <vector>

#include "dv/common.h"
#include "dv/errors.h"
#include "dv/storage/local_storage.h"
#include "test_support.h"

namespace {

namespace fs = std::filesystem;

std::set<std::string> Names(const std::vector<dv::core::Node>& nodes) {
  std::set<std::string> names;
  for (const auto& node : nodes) {
    names.insert(dv::core::NameOf(node));
  }
  return names;
}

void TestRootCreation(const fs::path& vault) {
  auto filesystem = dv::core::CryptoFileSystem::Open(vault, dv::test::FixedCipher(1));
  auto root = filesystem->Root();
  assert(root->IsRoot() && root->LogicalPath() == "/" && "root must be the unnamed top folder");
  assert(!root->Exists() && "nothing exists before creation");
  assert(!fs::exists(vault) && "opening must not write anything");

  root->Create(dv::core::FolderCreateMode::kFailIfParentMissing);
  assert(fs::is_regular_file(vault / "root.dir") && "root marker must be written");
  assert(fs::is_directory(vault / "d") && "data root must exist");
  assert(root->PhysicalFolder()->Exists() && "root data folder must exist");
  [[maybe_unused]] auto modified = root->LastModified();

  dv::test::EventRecorder recorder;
  root->Create(dv::core::FolderCreateMode::kIncludingParents);
  assert(recorder.Count("directory_marker_written") == 0 && "re-creating an existing folder is a no-op");

  auto reopened = dv::core::CryptoFileSystem::Open(vault, dv::test::FixedCipher(1));
  assert(reopened->Root()->DirectoryId() == root->DirectoryId() && "root identifier must survive reopening");
}

void TestParentMissingWritesNothing(const fs::path& vault) {
  auto filesystem = dv::core::CryptoFileSystem::Open(vault, dv::test::FixedCipher(1));
  auto child = filesystem->ResolveFolder("/missing/child");
  const auto before = dv::test::SnapshotTree(vault);
  auto error = dv::test::CaptureError([&] { child->Create(dv::core::FolderCreateMode::kFailIfParentMissing); });
  assert(error && dv::KindOf(*error) == dv::FailureKind::kParentMissing && "absent parent must fail");
  assert(std::string(error->what()).find("/missing") != std::string::npos && "message must name the parent");
  assert(dv::test::SnapshotTree(vault) == before && "a failed create must not touch storage");
  assert(!child->Exists() && !child->Parent()->Exists() && "neither folder may be materialized");
}

void TestRecursiveCreate(const fs::path& vault) {
  auto filesystem = dv::core::CryptoFileSystem::Open(vault, dv::test::FixedCipher(1));
  auto leaf = filesystem->ResolveFolder("/a/b/c");
  leaf->Create(dv::core::FolderCreateMode::kIncludingParents);
  for (auto folder = leaf; folder; folder = folder->Parent()) {
    assert(folder->Exists() && "every ancestor must be materialized");
    assert(folder->PhysicalFolder()->Exists() && "every ancestor must have its data folder");
  }
  assert(leaf->LogicalPath() == "/a/b/c" && "logical path must follow the parent chain");

  auto again = filesystem->ResolveFolder("a/b/c");
  assert(again->DirectoryId() == leaf->DirectoryId() && "separate nodes must read the same marker");
  assert(again->IsSameAs(*leaf) && "nodes at the same path are structurally equal");
}

void TestListing(const fs::path& vault) {
  auto filesystem = dv::core::CryptoFileSystem::Open(vault, dv::test::FixedCipher(1));
  auto docs = filesystem->ResolveFolder("/listing");
  docs->Create(dv::core::FolderCreateMode::kIncludingParents);
  assert(docs->Children().empty() && "a new folder is empty");

  docs->GetFolder("sub")->Create(dv::core::FolderCreateMode::kFailIfParentMissing);
  {
    auto writer = docs->GetFile("notes.txt")->OpenWritable();
    writer->Write(dv::AsByteSpan("notes"));
  }
  assert((Names(docs->Children()) == std::set<std::string>{"sub", "notes.txt"}) && "children must decrypt");
  assert(docs->Files().size() == 1 && docs->Files().front()->Name() == "notes.txt" && "files must be typed");
  assert(docs->Folders().size() == 1 && docs->Folders().front()->Name() == "sub" && "folders must be typed");
  assert(docs->Folders().front()->Parent()->IsSameAs(*docs) && "children must point at their parent");

  dv::test::EventRecorder recorder;
  auto data = docs->PhysicalFolder();
  {
    auto writer = data->File("NOTACIPHERTEXT.dir")->OpenWritable(std::chrono::milliseconds(100));
    writer->Write(dv::AsByteSpan("junk"));
  }
  {
    auto writer = data->File("stray.tmp")->OpenWritable(std::chrono::milliseconds(100));
    writer->Write(dv::AsByteSpan("junk"));
  }
  assert(docs->Children().size() == 2 && "undecryptable and foreign entries must be skipped");
  assert(recorder.Count("undecryptable_entry") == 1 && "undecryptable entries must be reported");

  auto foreign = dv::core::CryptoFileSystem::Open(vault, dv::test::FixedCipher(2));
  assert(foreign->Root()->Exists() && "marker existence does not depend on the key");
}

void TestInvalidNames(const fs::path& vault) {
  auto filesystem = dv::core::CryptoFileSystem::Open(vault, dv::test::FixedCipher(1));
  auto root = filesystem->Root();
  for (const std::string name : {"", ".", "..", "a/b"}) {
    [[maybe_unused]] auto error = dv::test::CaptureError([&] { root->GetFolder(name); });
    assert(error && error->code == dv::errors::validation::kInvalidSegmentName && "invalid names must be rejected");
  }
}

void TestConcurrentMaterializationWritesOnce(const fs::path& vault) {
  auto filesystem = dv::core::CryptoFileSystem::Open(vault, dv::test::FixedCipher(1));
  auto parent = filesystem->ResolveFolder("/concurrent");
  parent->Create(dv::core::FolderCreateMode::kIncludingParents);
  auto target = parent->GetFolder("shared");

  dv::test::EventRecorder recorder;
  constexpr size_t kThreads = 12;
  std::vector<std::string> ids(kThreads);
  std::vector<std::thread> threads;
  threads.reserve(kThreads);
  for (size_t i = 0; i < kThreads; ++i) {
    threads.emplace_back([&, i] {
      if (i % 2 == 0) {
        target->Create(dv::core::FolderCreateMode::kFailIfParentMissing);
      }
      ids[i] = target->DirectoryId();
    });
  }
  for (auto& t : threads) {
    t.join();
  }
  for ([[maybe_unused]] const auto& id : ids) {
    assert(id == ids.front() && "all callers must converge on one identifier");
  }
  assert(recorder.Count("directory_marker_written") == 1 && "exactly one marker write must happen");
  assert(recorder.Count("folder_materialized") == 1 && "the folder must be materialized once");

  auto reloaded = filesystem->ResolveFolder("/concurrent/shared");
  assert(reloaded->DirectoryId() == ids.front() && "the committed identifier must be the persisted one");
}

void TestLastModifiedReadsMarker(const fs::path& vault) {
  auto filesystem = dv::core::CryptoFileSystem::Open(vault, dv::test::FixedCipher(1));
  auto absent = filesystem->ResolveFolder("/stamped");
  auto error = dv::test::CaptureError([&] { (void)absent->LastModified(); });
  assert(error && error->code == dv::errors::io::kNodeMissing && "an absent folder has no modification time");
  assert(!absent->IdStore().Cached() && "reading the time must not mint an identifier");

  absent->Create(dv::core::FolderCreateMode::kIncludingParents);
  const auto marker_time = fs::last_write_time(fs::path(absent->MarkerFile()->Describe()));
  const auto expected = std::chrono::time_point_cast<std::chrono::system_clock::duration>(
      std::chrono::file_clock::to_sys(marker_time));
  assert(absent->LastModified() == expected && "the folder reports its marker's modification time");
}

void TestStaleMintIsDropped(const fs::path& vault) {
  auto filesystem = dv::core::CryptoFileSystem::Open(vault, dv::test::FixedCipher(1));
  auto early = filesystem->ResolveFolder("/late");
  assert(early->Children().empty() && "listing an absent folder is empty");
  const auto minted = early->DirectoryId();
  assert(!early->Exists() && "reading the identifier does not materialize");

  auto creator = filesystem->ResolveFolder("/late");
  creator->Create(dv::core::FolderCreateMode::kIncludingParents);
  assert(creator->DirectoryId() != minted && "an independent node mints its own identifier");

  early->Create(dv::core::FolderCreateMode::kIncludingParents);
  assert(early->DirectoryId() == creator->DirectoryId() && "create must adopt the persisted identifier");
  assert(early->PhysicalFolder()->Describe() == creator->PhysicalFolder()->Describe() &&
         "both nodes must resolve to one data folder");
}

}  // namespace

int main() {
  dv::test::TempDir dir("dv_folder_create_");
  dv::test::RouteLogsTo(dir.path());
  const auto vault = dir.path() / "vault";
  TestRootCreation(vault);
  TestParentMissingWritesNothing(vault);
  TestRecursiveCreate(vault);
  TestListing(vault);
  TestInvalidNames(vault);
  TestConcurrentMaterializationWritesOnce(vault);
  TestLastModifiedReadsMarker(vault);
  TestStaleMintIsDropped(vault);
  std::cout << "folder create test ok\n";
  return 0;
}
