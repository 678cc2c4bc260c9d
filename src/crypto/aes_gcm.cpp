#include "dv/crypto/aes_gcm.h"

#include "dv/crypto/provider.h"

namespace dv::crypto {

AES256_GCM::EncryptionResult AES256_GCM_Encrypt(
    std::span<const uint8_t> plaintext,
    std::span<const uint8_t> aad,
    std::span<const uint8_t, AES256_GCM::NONCE_SIZE> nonce,
    std::span<const uint8_t, AES256_GCM::KEY_SIZE> key) {
  auto provider = GetCryptoProviderShared();
  return provider->EncryptAES256GCM(plaintext, aad, nonce, key);
}

std::vector<uint8_t> AES256_GCM_Decrypt(
    std::span<const uint8_t> ciphertext,
    std::span<const uint8_t> aad,
    std::span<const uint8_t, AES256_GCM::NONCE_SIZE> nonce,
    std::span<const uint8_t, AES256_GCM::TAG_SIZE> tag,
    std::span<const uint8_t, AES256_GCM::KEY_SIZE> key) {
  auto provider = GetCryptoProviderShared();
  std::vector<uint8_t> plaintext(ciphertext.size());
  size_t decrypted_size = provider->DecryptAES256GCM(ciphertext, aad, nonce, tag, key,
                                                      std::span<uint8_t>(plaintext.data(), plaintext.size()));
  plaintext.resize(decrypted_size);
  return plaintext;
}

} // namespace dv::crypto
