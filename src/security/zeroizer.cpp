#include "dv/security/zeroizer.h"

#include <openssl/crypto.h>

#if DV_HAVE_SODIUM
#include <sodium.h>
#endif

namespace dv::security {

void Zeroizer::Wipe(std::span<uint8_t> data) noexcept {
  if (data.empty()) {
    return;
  }
#if DV_HAVE_SODIUM
  sodium_memzero(data.data(), data.size());
#else
  OPENSSL_cleanse(data.data(), data.size());
#endif
}

} // namespace dv::security
