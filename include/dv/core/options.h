#pragma once

#include <chrono>
#include <cstddef>
#include <string>

#include "dv/common.h"
#include "dv/storage/physical_storage.h"

namespace dv::core {

using FolderCreateMode = dv::storage::FolderCreateMode;

struct FileSystemOptions {
  // Bound on every wait for a physical marker or file lock.
  std::chrono::milliseconds lock_timeout{kDefaultLockTimeout};
  // Characters of the encoded hash used as the shard container name.
  size_t shard_prefix_length{2};
  // Read cap applied to marker artifacts.
  size_t max_marker_bytes{64};
  std::string root_marker_name{"root.dir"};
  std::string data_folder_name{"d"};
  // When set, identifiers are encrypted with the filename cipher before being
  // hashed into a physical path. Clearing it hashes the identifier as is.
  bool encrypt_directory_ids{true};
};

// Overlays DV_LOCK_TIMEOUT_MS, DV_SHARD_PREFIX_LENGTH and DV_PLAIN_DIRECTORY_HASH
// on |base|. Malformed values keep the base value and publish options_fallback.
FileSystemOptions LoadOptionsFromEnvironment(FileSystemOptions base = {});

// Throws dv::Error (Config/kInvalidOption) on values the folder layer cannot honour.
void ValidateOptions(const FileSystemOptions& options);

}  // namespace dv::core
