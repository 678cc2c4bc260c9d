#include "dv/core/path_mapper.h"

#include <utility>

#include "dv/common.h"
#include "dv/crypto/base32.h"
#include "dv/crypto/sha1.h"

namespace dv::core {

PhysicalPathMapper::PhysicalPathMapper(std::shared_ptr<const FilenameCipher> cipher, size_t prefix_length,
                                       bool encrypt_ids)
    : cipher_(std::move(cipher)), prefix_length_(prefix_length), encrypt_ids_(encrypt_ids) {}

ShardedPath PhysicalPathMapper::Map(std::string_view directory_id) const {
  std::string hashed_input = encrypt_ids_ ? cipher_->EncryptSegment(directory_id) : std::string(directory_id);
  const auto digest = crypto::SHA1_Hash(AsByteSpan(hashed_input));
  const std::string encoded = crypto::Base32Encode(digest);
  return ShardedPath{encoded.substr(0, prefix_length_), encoded.substr(prefix_length_)};
}

std::shared_ptr<storage::PhysicalFolder> PhysicalPathMapper::Resolve(const storage::PhysicalFolder& data_root,
                                                                     std::string_view directory_id) const {
  const auto sharded = Map(directory_id);
  return data_root.Folder(sharded.container)->Folder(sharded.leaf);
}

}  // namespace dv::core
