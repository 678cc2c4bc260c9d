#include "dv/core/filename_cipher.h"

#include <algorithm>
#include <vector>

#include "dv/common.h"
#include "dv/crypto/aes_gcm.h"
#include "dv/crypto/base32.h"
#include "dv/crypto/ct.h"
#include "dv/crypto/hmac_sha256.h"
#include "dv/crypto/random.h"
#include "dv/error.h"
#include "dv/errors.h"
#include "dv/security/zeroizer.h"

namespace dv::core {

namespace {

constexpr std::string_view kFilenameAad{"dv-filename"};
constexpr size_t kMinEnvelopeBytes = crypto::AES256_GCM::NONCE_SIZE + crypto::AES256_GCM::TAG_SIZE;

[[noreturn]] void ThrowInvalidSegment(std::string_view message) {
  throw Error{ErrorDomain::Validation, errors::validation::kInvalidSegmentName, std::string(message)};
}

[[noreturn]] void ThrowMalformed() {
  throw Error{ErrorDomain::Crypto, errors::crypto::kMalformedCiphertext,
              std::string(errors::msg::kFilenameMalformed)};
}

[[noreturn]] void ThrowAuthentication() {
  throw Error{ErrorDomain::Crypto, errors::crypto::kFilenameAuthenticationFailed,
              std::string(errors::msg::kFilenameAuthenticationFailed)};
}

std::array<uint8_t, crypto::AES256_GCM::NONCE_SIZE> DeriveNonce(std::span<const uint8_t> mac_key,
                                                                  std::span<const uint8_t> clear) {
  auto mac = crypto::HMAC_SHA256::Compute(mac_key, clear);
  std::array<uint8_t, crypto::AES256_GCM::NONCE_SIZE> nonce{};
  std::copy_n(mac.begin(), nonce.size(), nonce.begin());
  security::Zeroizer::Wipe(mac);
  return nonce;
}

}  // namespace

void ValidateSegmentName(std::string_view segment) {
  if (segment.empty()) {
    ThrowInvalidSegment(errors::msg::kInvalidSegmentEmpty);
  }
  if (segment.size() > DeterministicFilenameCipher::kMaxSegmentBytes) {
    ThrowInvalidSegment(errors::msg::kInvalidSegmentTooLong);
  }
  if (segment.find('/') != std::string_view::npos || segment.find('\0') != std::string_view::npos) {
    ThrowInvalidSegment(errors::msg::kInvalidSegmentCharacter);
  }
  if (segment == "." || segment == "..") {
    ThrowInvalidSegment(errors::msg::kInvalidSegmentDots);
  }
}

DeterministicFilenameCipher::DeterministicFilenameCipher(
    std::span<const uint8_t, kKeyMaterialSize> key_material) {
  std::copy_n(key_material.begin(), enc_key_.size(), enc_key_.begin());
  std::copy_n(key_material.begin() + enc_key_.size(), mac_key_.size(), mac_key_.begin());
}

DeterministicFilenameCipher::~DeterministicFilenameCipher() {
  security::Zeroizer::Wipe(enc_key_);
  security::Zeroizer::Wipe(mac_key_);
}

std::shared_ptr<const DeterministicFilenameCipher> DeterministicFilenameCipher::FromKeyMaterial(
    std::span<const uint8_t> key_material) {
  if (key_material.size() != kKeyMaterialSize) {
    throw Error{ErrorDomain::Config, errors::config::kInvalidOption,
                std::string(errors::msg::kFilenameKeyLength) + ": " + std::to_string(key_material.size())};
  }
  return std::make_shared<const DeterministicFilenameCipher>(
      std::span<const uint8_t, kKeyMaterialSize>(key_material.data(), kKeyMaterialSize));
}

std::shared_ptr<const DeterministicFilenameCipher> DeterministicFilenameCipher::Generate() {
  std::array<uint8_t, kKeyMaterialSize> key{};
  security::Zeroizer::ScopeWiper<uint8_t> wiper(key);
  crypto::SystemRandomBytes(key);
  return FromKeyMaterial(key);
}

std::string DeterministicFilenameCipher::EncryptSegment(std::string_view clear) const {
  const auto clear_bytes = AsByteSpan(clear);
  const auto nonce = DeriveNonce(mac_key_, clear_bytes);
  auto result = crypto::AES256_GCM_Encrypt(clear_bytes, AsByteSpan(kFilenameAad), nonce, enc_key_);

  std::vector<uint8_t> envelope;
  envelope.reserve(nonce.size() + result.ciphertext.size() + result.tag.size());
  envelope.insert(envelope.end(), nonce.begin(), nonce.end());
  envelope.insert(envelope.end(), result.ciphertext.begin(), result.ciphertext.end());
  envelope.insert(envelope.end(), result.tag.begin(), result.tag.end());
  return crypto::Base32Encode(envelope);
}

std::string DeterministicFilenameCipher::DecryptSegment(std::string_view encrypted) const {
  auto decoded = crypto::Base32Decode(encrypted);
  if (!decoded || decoded->size() < kMinEnvelopeBytes) {
    ThrowMalformed();
  }
  const std::span<const uint8_t> envelope(*decoded);
  const auto nonce = envelope.first<crypto::AES256_GCM::NONCE_SIZE>();
  const auto tag = envelope.last<crypto::AES256_GCM::TAG_SIZE>();
  const auto ciphertext = envelope.subspan(crypto::AES256_GCM::NONCE_SIZE,
                                           envelope.size() - kMinEnvelopeBytes);

  std::vector<uint8_t> clear;
  try {
    clear = crypto::AES256_GCM_Decrypt(ciphertext, AsByteSpan(kFilenameAad), nonce, tag, enc_key_);
  } catch (const AuthenticationFailureError&) {
    ThrowAuthentication();
  }
  security::Zeroizer::ScopeWiper<uint8_t> wiper(clear);

  const auto expected_nonce = DeriveNonce(mac_key_, clear);
  if (!crypto::ct::CompareEqual(std::span<const uint8_t>(expected_nonce), nonce)) {
    ThrowAuthentication();
  }
  return BytesToString(clear);
}

}  // namespace dv::core
