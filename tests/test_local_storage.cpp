#include "dv/storage/local_storage.h"

#include <array>
#include <cassert>
#include <chrono>
#include <fstream>
#include <iostream>
#include <string>

#include "dv/common.h"
#include "dv/errors.h"
#include "test_support.h"

namespace {

using namespace std::chrono_literals;

std::string ReadAll(dv::storage::ReadableFile& handle) {
  std::string out;
  std::array<uint8_t, 16> buffer{};
  for (;;) {
    const size_t n = handle.Read(buffer);
    if (n == 0) {
      break;
    }
    out.append(reinterpret_cast<const char*>(buffer.data()), n);
  }
  return out;
}

void TestWriteReadAndShare(const dv::test::TempDir& dir) {
  dv::storage::LocalFile file(dir.path() / "payload.bin");
  assert(!file.Exists() && "file must start absent");
  {
    auto writer = file.OpenWritable(100ms);
    writer->Write(dv::AsByteSpan("hello marker"));
    assert(writer->Size() == 12 && "size must reflect written bytes");
  }
  assert(file.Exists() && "opening for write must create the file");
  auto first = file.OpenReadable(100ms);
  auto second = file.OpenReadable(100ms);
  assert(ReadAll(*first) == "hello marker" && "content must round-trip");
  assert(ReadAll(*second) == "hello marker" && "shared readers must coexist");
  [[maybe_unused]] const auto modified = file.LastModified();
  assert(modified <= std::chrono::system_clock::now() + 1s && "modification time must be plausible");
}

void TestLockTimeout(const dv::test::TempDir& dir) {
  dv::storage::LocalFile file(dir.path() / "locked.bin");
  auto holder = file.OpenWritable(100ms);
  const auto start = std::chrono::steady_clock::now();
  auto error = dv::test::CaptureError([&] { file.OpenReadable(50ms); });
  const auto waited = std::chrono::steady_clock::now() - start;
  assert(error && dv::KindOf(*error) == dv::FailureKind::kLockTimeout && "blocked reader must time out");
  assert(error->retryability == dv::Retryability::kTransient && "lock timeouts are transient");
  assert(std::string(error->what()).find("locked.bin") != std::string::npos && "message must name the path");
  assert(waited >= 50ms && "timeout must be honoured before failing");

  auto writer_error = dv::test::CaptureError([&] { file.OpenWritable(20ms); });
  assert(writer_error && writer_error->code == dv::errors::io::kLockTimeout && "second writer must time out");

  holder.reset();
  auto reader = file.OpenReadable(50ms);
  assert(reader && "released lock must be grantable");
}

void TestMoveAndDelete(const dv::test::TempDir& dir) {
  dv::storage::LocalFile source(dir.path() / "source.dir");
  dv::storage::LocalFile target(dir.path() / "target.dir");
  {
    auto writer = source.OpenWritable(100ms);
    writer->Write(dv::AsByteSpan("0123456789abcdef"));
  }
  {
    auto source_handle = source.OpenWritable(100ms);
    auto target_handle = target.OpenWritable(100ms);
    source_handle->MoveTo(*target_handle);
  }
  assert(!source.Exists() && "move must remove the source");
  auto reader = target.OpenReadable(100ms);
  assert(ReadAll(*reader) == "0123456789abcdef" && "move must carry the bytes");
  reader.reset();

  {
    auto handle = target.OpenWritable(100ms);
    handle->Delete();
  }
  assert(!target.Exists() && "delete must unlink under the lock");

  auto missing = dv::test::CaptureError([&] { source.OpenReadable(50ms); });
  assert(missing && missing->code == dv::errors::io::kNodeMissing && "reading an absent file must fail");
}

void TestFolders(const dv::test::TempDir& dir) {
  dv::storage::LocalFolder root(dir.path() / "tree");
  auto nested = root.Folder("a")->Folder("b");
  auto error = dv::test::CaptureError([&] { nested->Create(dv::storage::FolderCreateMode::kFailIfParentMissing); });
  assert(error && dv::KindOf(*error) == dv::FailureKind::kParentMissing && "missing parent must be reported");
  assert(!root.Exists() && "failed create must not write anything");

  nested->Create(dv::storage::FolderCreateMode::kIncludingParents);
  assert(nested->Exists() && "create with parents must build the chain");
  assert(nested->Parent()->Name() == "a" && "parent must be the enclosing folder");

  {
    auto writer = root.File("x.file")->OpenWritable(100ms);
    writer->Write(dv::AsByteSpan("x"));
  }
  assert(root.Files().size() == 1 && root.Folders().size() == 1 && "listing must split files and folders");
  assert(dv::storage::LocalFolder(dir.path() / "absent").Files().empty() && "absent folders list as empty");

  assert(!root.DeleteIfEmpty() && "non-empty folders must survive DeleteIfEmpty");
  root.Delete();
  assert(!root.Exists() && "delete must be recursive");
  root.Delete();
}

}  // namespace

int main() {
  dv::test::TempDir dir("dv_local_storage_");
  dv::test::RouteLogsTo(dir.path());
  TestWriteReadAndShare(dir);
  TestLockTimeout(dir);
  TestMoveAndDelete(dir);
  TestFolders(dir);
  std::cout << "local storage test ok\n";
  return 0;
}
