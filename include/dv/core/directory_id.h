#pragma once

#include <chrono>
#include <memory>
#include <string>

#include "dv/storage/physical_storage.h"

namespace dv::core {

inline constexpr size_t kDirectoryIdEntropyBytes = 16;

// 128 random bits as 32 lowercase hex characters.
std::string NewDirectoryId();

// Per-folder cache of the identifier stored in the folder's marker. The marker
// location is passed on every call since it follows the logical parent.
//
// The cache is a single atomically published value: concurrent first readers
// race with compare-and-swap and the losers adopt the winner's identifier.
class DirectoryIdStore {
public:
  DirectoryIdStore(size_t max_marker_bytes, std::chrono::milliseconds lock_timeout);

  DirectoryIdStore(const DirectoryIdStore&) = delete;
  DirectoryIdStore& operator=(const DirectoryIdStore&) = delete;

  // Cached value, else the marker content (read under a shared lock), else a
  // freshly minted identifier that is cached but not persisted.
  std::string GetOrCreate(const storage::PhysicalFile& marker);

  // Writes the identifier into |marker| under an exclusive lock. A marker that
  // already holds an identifier wins over the cached one and is adopted.
  // Returns the identifier now stored in the marker.
  std::string Persist(const storage::PhysicalFile& marker);

  // Replaces the cached identifier with the one stored in |marker|. An empty
  // marker leaves the cache untouched.
  void Reload(const storage::PhysicalFile& marker);

  // Forgets the cached identifier. The next GetOrCreate re-reads or re-mints.
  void Invalidate() noexcept;

  std::shared_ptr<const std::string> Cached() const noexcept;

private:
  std::string Install(std::shared_ptr<const std::string> candidate);
  // Up to max_marker_bytes_ from the start of |handle|; empty for an empty marker.
  std::string ReadMarker(storage::ReadableFile& handle) const;

  std::shared_ptr<const std::string> cached_;
  size_t max_marker_bytes_;
  std::chrono::milliseconds lock_timeout_;
};

}  // namespace dv::core
