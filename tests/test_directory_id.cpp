#include "dv/core/directory_id.h"

#include <algorithm>
#include <cassert>
#include <chrono>
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

using namespace std::chrono_literals;

std::string ReadMarkerFile(const dv::storage::PhysicalFile& marker) {
  auto handle = marker.OpenReadable(100ms);
  std::vector<uint8_t> buffer(256);
  const size_t n = handle->Read(buffer);
  return dv::BytesToString(std::span<const uint8_t>(buffer.data(), n));
}

void WriteMarkerFile(const dv::storage::PhysicalFile& marker, std::string_view content) {
  auto handle = marker.OpenWritable(100ms);
  handle->Truncate(0);
  handle->Write(dv::AsByteSpan(content));
}

void TestIdentifierFormat() {
  std::set<std::string> seen;
  for (int i = 0; i < 64; ++i) {
    const auto id = dv::core::NewDirectoryId();
    assert(id.size() == 2 * dv::core::kDirectoryIdEntropyBytes && "identifier must be fixed width");
    assert(std::all_of(id.begin(), id.end(), [](char c) { return (c >= '0' && c <= '9') || (c >= 'a' && c <= 'f'); }) &&
           "identifier must be lowercase hex");
    seen.insert(id);
  }
  assert(seen.size() == 64 && "identifiers must be unique");
}

void TestIdempotentMintWithoutPersisting(const dv::test::TempDir& dir) {
  dv::storage::LocalFile marker(dir.path() / "mint.dir");
  dv::core::DirectoryIdStore store(64, 100ms);
  const auto first = store.GetOrCreate(marker);
  const auto second = store.GetOrCreate(marker);
  assert(first == second && "repeated reads must return the minted identifier");
  assert(!marker.Exists() && "minting alone must not persist the identifier");

  store.Invalidate();
  assert(!store.Cached() && "invalidate must clear the cache");
  assert(store.GetOrCreate(marker) != first && "an invalidated unpersisted identifier is never reused");
}

void TestPersistAndReload(const dv::test::TempDir& dir) {
  dv::test::EventRecorder recorder;
  dv::storage::LocalFile marker(dir.path() / "persist.dir");
  dv::core::DirectoryIdStore store(64, 100ms);
  const auto minted = store.GetOrCreate(marker);
  const auto persisted = store.Persist(marker);
  assert(persisted == minted && "persist must write the cached identifier");
  assert(ReadMarkerFile(marker) == minted && "marker content is exactly the identifier bytes");
  assert(recorder.Count("directory_marker_written") == 1 && "one marker write must be reported");

  dv::core::DirectoryIdStore fresh(64, 100ms);
  assert(fresh.GetOrCreate(marker) == minted && "a new store must read the persisted identifier");

  dv::core::DirectoryIdStore competitor(64, 100ms);
  competitor.GetOrCreate(dv::storage::LocalFile(dir.path() / "elsewhere.dir"));
  assert(competitor.Persist(marker) == minted && "persist must adopt an identifier already on disk");
  assert(*competitor.Cached() == minted && "the adopted identifier must replace the cached one");
  assert(recorder.Count("directory_marker_adopted") == 1 && "adoption must be reported");
  assert(recorder.Count("directory_marker_written") == 1 && "adoption must not rewrite the marker");
}

void TestMarkerReadCapAndCorruption(const dv::test::TempDir& dir) {
  dv::storage::LocalFile oversized(dir.path() / "oversized.dir");
  WriteMarkerFile(oversized, std::string(100, 'a'));
  dv::core::DirectoryIdStore store(64, 100ms);
  assert(store.GetOrCreate(oversized) == std::string(64, 'a') && "reads must stop at the marker cap");

  dv::storage::LocalFile empty(dir.path() / "empty.dir");
  WriteMarkerFile(empty, "");
  dv::core::DirectoryIdStore empty_store(64, 100ms);
  auto error = dv::test::CaptureError([&] { empty_store.GetOrCreate(empty); });
  assert(error && error->code == dv::errors::io::kMarkerCorrupt && "an empty marker is corrupt");
}

void TestReadLockTimeout(const dv::test::TempDir& dir) {
  dv::test::EventRecorder recorder;
  dv::storage::LocalFile marker(dir.path() / "busy.dir");
  WriteMarkerFile(marker, dv::core::NewDirectoryId());
  auto holder = marker.OpenWritable(100ms);
  dv::core::DirectoryIdStore store(64, 30ms);
  auto error = dv::test::CaptureError([&] { store.GetOrCreate(marker); });
  assert(error && dv::KindOf(*error) == dv::FailureKind::kLockTimeout && "busy marker must time out");
  assert(!store.Cached() && "a failed read must not populate the cache");
  assert(recorder.Count("lock_timeout") == 1 && "timeouts must be reported");
}

void TestConcurrentResolutionConverges(const dv::test::TempDir& dir) {
  dv::storage::LocalFile marker(dir.path() / "race.dir");
  dv::core::DirectoryIdStore store(64, 500ms);
  constexpr size_t kThreads = 16;
  std::vector<std::string> results(kThreads);
  std::vector<std::thread> threads;
  threads.reserve(kThreads);
  for (size_t i = 0; i < kThreads; ++i) {
    threads.emplace_back([&, i] { results[i] = store.GetOrCreate(marker); });
  }
  for (auto& t : threads) {
    t.join();
  }
  for ([[maybe_unused]] const auto& id : results) {
    assert(id == results.front() && "all racers must observe the winning identifier");
  }
  assert(*store.Cached() == results.front() && "the cache must hold the winner");
}

}  // namespace

int main() {
  dv::test::TempDir dir("dv_directory_id_");
  dv::test::RouteLogsTo(dir.path());
  TestIdentifierFormat();
  TestIdempotentMintWithoutPersisting(dir);
  TestPersistAndReload(dir);
  TestMarkerReadCapAndCorruption(dir);
  TestReadLockTimeout(dir);
  TestConcurrentResolutionConverges(dir);
  std::cout << "directory id test ok\n";
  return 0;
}
