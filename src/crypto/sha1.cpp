#include "dv/crypto/sha1.h"

#include "dv/crypto/provider.h"

namespace dv::crypto {

std::array<uint8_t, kSha1DigestSize> SHA1_Hash(std::span<const uint8_t> data) {
  auto provider = GetCryptoProviderShared();
  return provider->SHA1(data);
}

}  // namespace dv::crypto
