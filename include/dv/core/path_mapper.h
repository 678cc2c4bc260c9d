#pragma once

#include <memory>
#include <string>
#include <string_view>

#include "dv/core/filename_cipher.h"
#include "dv/storage/physical_storage.h"

namespace dv::core {

struct ShardedPath {
  std::string container;  // first |prefix_length| characters of the encoded hash
  std::string leaf;       // the remaining characters

  bool operator==(const ShardedPath&) const = default;
};

// Deterministic directory identifier -> physical data folder mapping:
// base32(SHA-1(input)) split into container/leaf. The input is the identifier
// encrypted with |cipher| unless |encrypt_ids| is false, in which case the raw
// identifier bytes are hashed.
class PhysicalPathMapper {
public:
  PhysicalPathMapper(std::shared_ptr<const FilenameCipher> cipher, size_t prefix_length, bool encrypt_ids);

  ShardedPath Map(std::string_view directory_id) const;

  // <data_root>/<container>/<leaf>; nothing is created.
  std::shared_ptr<storage::PhysicalFolder> Resolve(const storage::PhysicalFolder& data_root,
                                                   std::string_view directory_id) const;

private:
  std::shared_ptr<const FilenameCipher> cipher_;
  size_t prefix_length_;
  bool encrypt_ids_;
};

}  // namespace dv::core
