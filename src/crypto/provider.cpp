#include "dv/crypto/provider.h"

#include <openssl/err.h>
#include <openssl/evp.h>
#include <openssl/hmac.h>

#if DV_HAVE_SODIUM
#include <sodium.h>
#endif

#include <algorithm>
#include <array>
#include <iostream>
#include <memory>
#include <mutex>
#include <string>
#include <utility>

#include "dv/crypto/ct.h"
#include "dv/error.h"
#include "dv/errors.h"

namespace dv::crypto {

namespace {

std::string BuildOpenSSLErrorMessage(const char* context) {
  unsigned long err = ERR_get_error();
  if (err == 0) {
    return std::string(context) + ": unknown OpenSSL error";
  }

  char buf[256] = {0};
  ERR_error_string_n(err, buf, sizeof(buf));
  std::string message(context);
  message.append(": ");
  message.append(buf);
  return message;
}

class EVPContextDeleter {
public:
  void operator()(EVP_CIPHER_CTX* ctx) const noexcept { EVP_CIPHER_CTX_free(ctx); }
  void operator()(EVP_MD_CTX* ctx) const noexcept { EVP_MD_CTX_free(ctx); }
};

using CipherCtxPtr = std::unique_ptr<EVP_CIPHER_CTX, EVPContextDeleter>;
using DigestCtxPtr = std::unique_ptr<EVP_MD_CTX, EVPContextDeleter>;

struct RuntimeState {
  std::once_flag once;
  bool kat_passed{false};
};

RuntimeState& MutableRuntimeState() {
  static RuntimeState state{};
  return state;
}

std::mutex& ProviderMutex() {
  static std::mutex mutex;
  return mutex;
}

std::shared_ptr<CryptoProvider>& ProviderInstance() {
  static std::shared_ptr<CryptoProvider> instance;
  return instance;
}

[[noreturn]] void ThrowCryptoError(const std::string& message, int code = 0) {
  throw dv::Error(dv::ErrorDomain::Crypto, code, message);
}

[[noreturn]] void ThrowPrimitiveUnavailable(std::string_view message) {
  throw dv::Error(dv::ErrorDomain::Dependency, dv::errors::dependency::kPrimitiveUnavailable,
                  BuildOpenSSLErrorMessage(std::string(message).c_str()));
}

// Digest lookups go through the provider fetch API so a runtime whose active
// providers lack an algorithm (FIPS configurations dropping SHA-1) reports it
// instead of failing later inside EVP_Digest.
template <size_t N>
std::array<uint8_t, N> DigestWith(const char* algorithm, std::string_view unavailable_message,
                                  std::span<const uint8_t> data) {
  std::unique_ptr<EVP_MD, decltype(&EVP_MD_free)> md(EVP_MD_fetch(nullptr, algorithm, nullptr),
                                                     &EVP_MD_free);
  if (!md) {
    ThrowPrimitiveUnavailable(unavailable_message);
  }
  if (EVP_MD_get_size(md.get()) != static_cast<int>(N)) {
    ThrowCryptoError(std::string("Unexpected digest size for ") + algorithm,
                     EVP_MD_get_size(md.get()));
  }
  DigestCtxPtr ctx(EVP_MD_CTX_new());
  if (!ctx) {
    ThrowCryptoError("Failed to allocate digest context");
  }
  std::array<uint8_t, N> out{};
  unsigned int len = 0;
  if (EVP_DigestInit_ex(ctx.get(), md.get(), nullptr) != 1 ||
      EVP_DigestUpdate(ctx.get(), data.data(), data.size()) != 1 ||
      EVP_DigestFinal_ex(ctx.get(), out.data(), &len) != 1) {
    ThrowCryptoError(BuildOpenSSLErrorMessage("EVP_Digest"));
  }
  if (len != out.size()) {
    ThrowCryptoError(std::string("Unexpected digest length for ") + algorithm, static_cast<int>(len));
  }
  return out;
}

using CipherPtr = std::unique_ptr<EVP_CIPHER, decltype(&EVP_CIPHER_free)>;

CipherPtr FetchAES256GCM() {
  CipherPtr cipher(EVP_CIPHER_fetch(nullptr, "AES-256-GCM", nullptr), &EVP_CIPHER_free);
  if (!cipher) {
    ThrowPrimitiveUnavailable(dv::errors::msg::kAesGcmUnavailable);
  }
  return cipher;
}

void RunAESGCMKnownAnswerTest() {
  // NIST GCM test case 16 (256-bit key, 60-byte plaintext, 20-byte AAD).
  static constexpr std::array<uint8_t, AES256_GCM::KEY_SIZE> kKey{
      0xfe, 0xff, 0xe9, 0x92, 0x86, 0x65, 0x73, 0x1c,
      0x6d, 0x6a, 0x8f, 0x94, 0x67, 0x30, 0x83, 0x08,
      0xfe, 0xff, 0xe9, 0x92, 0x86, 0x65, 0x73, 0x1c,
      0x6d, 0x6a, 0x8f, 0x94, 0x67, 0x30, 0x83, 0x08};
  static constexpr std::array<uint8_t, AES256_GCM::NONCE_SIZE> kNonce{
      0xca, 0xfe, 0xba, 0xbe, 0xfa, 0xce,
      0xdb, 0xad, 0xde, 0xca, 0xf8, 0x88};
  static constexpr std::array<uint8_t, 60> kPlaintext{
      0xd9, 0x31, 0x32, 0x25, 0xf8, 0x84, 0x06, 0xe5, 0xa5, 0x59, 0x09, 0xc5,
      0xaf, 0xf5, 0x26, 0x9a, 0x86, 0xa7, 0xa9, 0x53, 0x15, 0x34, 0xf7, 0xda,
      0x2e, 0x4c, 0x30, 0x3d, 0x8a, 0x31, 0x8a, 0x72, 0x1c, 0x3c, 0x0c, 0x95,
      0x95, 0x68, 0x09, 0x53, 0x2f, 0xcf, 0x0e, 0x24, 0x49, 0xa6, 0xb5, 0x25,
      0xb1, 0x6a, 0xed, 0xf5, 0xaa, 0x0d, 0xe6, 0x57, 0xba, 0x63, 0x7b, 0x39};
  static constexpr std::array<uint8_t, 20> kAad{
      0xfe, 0xed, 0xfa, 0xce, 0xde, 0xad, 0xbe, 0xef, 0xfe, 0xed,
      0xfa, 0xce, 0xde, 0xad, 0xbe, 0xef, 0xab, 0xad, 0xda, 0xd2};
  static constexpr std::array<uint8_t, 60> kExpectedCiphertext{
      0x52, 0x2d, 0xc1, 0xf0, 0x99, 0x56, 0x7d, 0x07, 0xf4, 0x7f, 0x37, 0xa3,
      0x2a, 0x84, 0x42, 0x7d, 0x64, 0x3a, 0x8c, 0xdc, 0xbf, 0xe5, 0xc0, 0xc9,
      0x75, 0x98, 0xa2, 0xbd, 0x25, 0x55, 0xd1, 0xaa, 0x8c, 0xb0, 0x8e, 0x48,
      0x59, 0x0d, 0xbb, 0x3d, 0xa7, 0xb0, 0x8b, 0x10, 0x56, 0x82, 0x88, 0x38,
      0xc5, 0xf6, 0x1e, 0x63, 0x93, 0xba, 0x7a, 0x0a, 0xbc, 0xc9, 0xf6, 0x62};
  static constexpr std::array<uint8_t, AES256_GCM::TAG_SIZE> kExpectedTag{
      0x76, 0xfc, 0x6e, 0xce, 0x0f, 0x4e, 0x17, 0x68,
      0xcd, 0xdf, 0x88, 0x53, 0xbb, 0x2d, 0x55, 0x1b};

  OpenSSLCryptoProvider provider;
  const auto enc = provider.EncryptAES256GCM(
      std::span<const uint8_t>(kPlaintext.data(), kPlaintext.size()),
      std::span<const uint8_t>(kAad.data(), kAad.size()),
      std::span<const uint8_t, AES256_GCM::NONCE_SIZE>(kNonce),
      std::span<const uint8_t, AES256_GCM::KEY_SIZE>(kKey));
  if (!ct::CompareEqual(std::span<const uint8_t>(enc.ciphertext), std::span<const uint8_t>(kExpectedCiphertext))) {
    ThrowCryptoError("AES-GCM KAT ciphertext mismatch");
  }
  if (!ct::CompareEqual(enc.tag, kExpectedTag)) {
    ThrowCryptoError("AES-GCM KAT tag mismatch");
  }

  std::array<uint8_t, kPlaintext.size()> plain_buf{};
  const size_t written = provider.DecryptAES256GCM(
      std::span<const uint8_t>(enc.ciphertext.data(), enc.ciphertext.size()),
      std::span<const uint8_t>(kAad.data(), kAad.size()),
      std::span<const uint8_t, AES256_GCM::NONCE_SIZE>(kNonce),
      std::span<const uint8_t, AES256_GCM::TAG_SIZE>(enc.tag),
      std::span<const uint8_t, AES256_GCM::KEY_SIZE>(kKey),
      std::span<uint8_t>(plain_buf));
  if (written != kPlaintext.size() || !ct::CompareEqual(plain_buf, kPlaintext)) {
    ThrowCryptoError("AES-GCM KAT decrypt mismatch");
  }
}

void RunSHA1KnownAnswerTest() {
  // FIPS 180-2 appendix A.1 ("abc").
  static constexpr std::array<uint8_t, 3> kMessage{'a', 'b', 'c'};
  static constexpr std::array<uint8_t, kSha1DigestSize> kExpected{
      0xa9, 0x99, 0x3e, 0x36, 0x47, 0x06, 0x81, 0x6a, 0xba, 0x3e,
      0x25, 0x71, 0x78, 0x50, 0xc2, 0x6c, 0x9c, 0xd0, 0xd8, 0x9d};
  OpenSSLCryptoProvider provider;
  if (!ct::CompareEqual(provider.SHA1(kMessage), kExpected)) {
    ThrowCryptoError("SHA-1 KAT mismatch");
  }
}

void EnsureCryptoRuntimeConfigured() {
  auto& state = MutableRuntimeState();
  std::call_once(state.once, [&state]() {
#if DV_HAVE_SODIUM
    if (sodium_init() < 0) {
      ThrowCryptoError("sodium_init failed");
    }
#endif
    RunAESGCMKnownAnswerTest();
    RunSHA1KnownAnswerTest();
    state.kat_passed = true;
    std::clog << "[crypto] AES-GCM and SHA-1 known-answer tests passed" << std::endl;
  });
}

}  // namespace

void EnsureCryptoProviderInitialized() {
  EnsureCryptoRuntimeConfigured();
}

AES256_GCM::EncryptionResult OpenSSLCryptoProvider::EncryptAES256GCM(
    std::span<const uint8_t> plaintext,
    std::span<const uint8_t> aad,
    std::span<const uint8_t, AES256_GCM::NONCE_SIZE> nonce,
    std::span<const uint8_t, AES256_GCM::KEY_SIZE> key) {
  CipherCtxPtr ctx(EVP_CIPHER_CTX_new());
  if (!ctx) {
    ThrowCryptoError("Failed to allocate AES-GCM context");
  }

  const auto cipher = FetchAES256GCM();
  if (EVP_EncryptInit_ex(ctx.get(), cipher.get(), nullptr, nullptr, nullptr) != 1) {
    ThrowCryptoError(BuildOpenSSLErrorMessage("EVP_EncryptInit_ex"));
  }
  if (EVP_CIPHER_CTX_ctrl(ctx.get(), EVP_CTRL_GCM_SET_IVLEN,
                           static_cast<int>(nonce.size()), nullptr) != 1) {
    ThrowCryptoError(BuildOpenSSLErrorMessage("EVP_CTRL_GCM_SET_IVLEN"));
  }
  if (EVP_EncryptInit_ex(ctx.get(), nullptr, nullptr, key.data(), nonce.data()) != 1) {
    ThrowCryptoError(BuildOpenSSLErrorMessage("EVP_EncryptInit_ex key/iv"));
  }

  int len = 0;
  if (!aad.empty()) {
    if (EVP_EncryptUpdate(ctx.get(), nullptr, &len, aad.data(),
                          static_cast<int>(aad.size())) != 1) {
      ThrowCryptoError(BuildOpenSSLErrorMessage("EVP_EncryptUpdate aad"));
    }
  }

  AES256_GCM::EncryptionResult result;
  result.ciphertext.resize(plaintext.size());
  int total = 0;
  if (!plaintext.empty()) {
    if (EVP_EncryptUpdate(ctx.get(), result.ciphertext.data(), &len,
                          plaintext.data(), static_cast<int>(plaintext.size())) != 1) {
      ThrowCryptoError(BuildOpenSSLErrorMessage("EVP_EncryptUpdate plaintext"));
    }
    total = len;
  }

  if (EVP_EncryptFinal_ex(ctx.get(), result.ciphertext.data() + total, &len) != 1) {
    ThrowCryptoError(BuildOpenSSLErrorMessage("EVP_EncryptFinal_ex"));
  }
  total += len;
  result.ciphertext.resize(static_cast<size_t>(total));

  if (EVP_CIPHER_CTX_ctrl(ctx.get(), EVP_CTRL_GCM_GET_TAG,
                           AES256_GCM::TAG_SIZE, result.tag.data()) != 1) {
    ThrowCryptoError(BuildOpenSSLErrorMessage("EVP_CTRL_GCM_GET_TAG"));
  }

  return result;
}

size_t OpenSSLCryptoProvider::DecryptAES256GCM(
    std::span<const uint8_t> ciphertext,
    std::span<const uint8_t> aad,
    std::span<const uint8_t, AES256_GCM::NONCE_SIZE> nonce,
    std::span<const uint8_t, AES256_GCM::TAG_SIZE> tag,
    std::span<const uint8_t, AES256_GCM::KEY_SIZE> key,
    std::span<uint8_t> destination) {
  if (destination.size() < ciphertext.size()) {
    ThrowCryptoError("AES-GCM destination buffer too small");
  }
  CipherCtxPtr ctx(EVP_CIPHER_CTX_new());
  if (!ctx) {
    ThrowCryptoError("Failed to allocate AES-GCM context");
  }

  const auto cipher = FetchAES256GCM();
  if (EVP_DecryptInit_ex(ctx.get(), cipher.get(), nullptr, nullptr, nullptr) != 1) {
    ThrowCryptoError(BuildOpenSSLErrorMessage("EVP_DecryptInit_ex"));
  }
  if (EVP_CIPHER_CTX_ctrl(ctx.get(), EVP_CTRL_GCM_SET_IVLEN,
                           static_cast<int>(nonce.size()), nullptr) != 1) {
    ThrowCryptoError(BuildOpenSSLErrorMessage("EVP_CTRL_GCM_SET_IVLEN"));
  }
  if (EVP_DecryptInit_ex(ctx.get(), nullptr, nullptr, key.data(), nonce.data()) != 1) {
    ThrowCryptoError(BuildOpenSSLErrorMessage("EVP_DecryptInit_ex key/iv"));
  }

  int len = 0;
  if (!aad.empty()) {
    if (EVP_DecryptUpdate(ctx.get(), nullptr, &len, aad.data(),
                          static_cast<int>(aad.size())) != 1) {
      ThrowCryptoError(BuildOpenSSLErrorMessage("EVP_DecryptUpdate aad"));
    }
  }

  int total = 0;
  if (!ciphertext.empty()) {
    if (EVP_DecryptUpdate(ctx.get(), destination.data(), &len, ciphertext.data(),
                          static_cast<int>(ciphertext.size())) != 1) {
      ThrowCryptoError(BuildOpenSSLErrorMessage("EVP_DecryptUpdate ciphertext"));
    }
    total = len;
  }

  if (EVP_CIPHER_CTX_ctrl(ctx.get(), EVP_CTRL_GCM_SET_TAG,
                           AES256_GCM::TAG_SIZE, const_cast<uint8_t*>(tag.data())) != 1) {
    ThrowCryptoError(BuildOpenSSLErrorMessage("EVP_CTRL_GCM_SET_TAG"));
  }

  int final_len = 0;
  int ret = EVP_DecryptFinal_ex(ctx.get(), destination.data() + total, &final_len);
  if (ret <= 0) {
    std::fill(destination.begin(), destination.begin() + total, uint8_t{0});
    throw dv::AuthenticationFailureError(
        BuildOpenSSLErrorMessage("EVP_DecryptFinal_ex (authentication failed)"));
  }
  total += final_len;
  return static_cast<size_t>(total);
}

std::array<uint8_t, 32> OpenSSLCryptoProvider::HMACSHA256(
    std::span<const uint8_t> key,
    std::span<const uint8_t> message) {
  std::array<uint8_t, 32> out{};
  unsigned int len = 0;
  if (HMAC(EVP_sha256(), key.data(), static_cast<int>(key.size()), message.data(),
           message.size(), out.data(), &len) == nullptr) {
    ThrowCryptoError(BuildOpenSSLErrorMessage("HMAC(EVP_sha256)"));
  }
  if (len != out.size()) {
    ThrowCryptoError("Unexpected HMAC-SHA256 length", static_cast<int>(len));
  }
  return out;
}

std::array<uint8_t, 32> OpenSSLCryptoProvider::SHA256(
    std::span<const uint8_t> data) {
  return DigestWith<32>("SHA256", dv::errors::msg::kSha256Unavailable, data);
}

std::array<uint8_t, kSha1DigestSize> OpenSSLCryptoProvider::SHA1(
    std::span<const uint8_t> data) {
  return DigestWith<kSha1DigestSize>("SHA1", dv::errors::msg::kSha1Unavailable, data);
}

std::shared_ptr<CryptoProvider> GetCryptoProviderShared() {
  EnsureCryptoRuntimeConfigured();
  std::lock_guard<std::mutex> lock(ProviderMutex());
  auto& provider = ProviderInstance();
  if (!provider) {
    provider = std::make_shared<OpenSSLCryptoProvider>();
  }
  return provider;
}

CryptoProvider& GetCryptoProvider() {
  return *GetCryptoProviderShared();
}

void SetCryptoProvider(std::shared_ptr<CryptoProvider> provider) {
  std::lock_guard<std::mutex> lock(ProviderMutex());
  ProviderInstance() = std::move(provider);
}

void ResetCryptoProviderForTesting() {
  std::lock_guard<std::mutex> lock(ProviderMutex());
  ProviderInstance().reset();
}

}  // namespace dv::crypto
