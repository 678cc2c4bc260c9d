#pragma once

#include <array>
#include <cstdint>
#include <memory>
#include <span>
#include <string>
#include <string_view>

namespace dv::core {

// Maps clear path segments and directory ids to names safe for the physical
// storage. Implementations must be deterministic: the same input always yields
// the same output for one key.
class FilenameCipher {
public:
  virtual ~FilenameCipher() = default;

  virtual std::string EncryptSegment(std::string_view clear) const = 0;
  // Throws dv::Error (Crypto domain) when |encrypted| was not produced by this
  // cipher under the same key.
  virtual std::string DecryptSegment(std::string_view encrypted) const = 0;
};

// Throws dv::Error (Validation/kInvalidSegmentName) unless |segment| can name a
// logical node.
void ValidateSegmentName(std::string_view segment);

// SIV-style construction: the AES-256-GCM nonce is derived from an HMAC over the
// clear text, and decryption re-derives it to reject tampered names.
// Output is the unpadded base32 form of nonce || ciphertext || tag.
class DeterministicFilenameCipher final : public FilenameCipher {
public:
  static constexpr size_t kKeyMaterialSize = 64;
  static constexpr size_t kMaxSegmentBytes = 128;

  explicit DeterministicFilenameCipher(std::span<const uint8_t, kKeyMaterialSize> key_material);
  ~DeterministicFilenameCipher() override;

  DeterministicFilenameCipher(const DeterministicFilenameCipher&) = delete;
  DeterministicFilenameCipher& operator=(const DeterministicFilenameCipher&) = delete;

  // Throws dv::Error (Config/kInvalidOption) unless |key_material| is 64 bytes.
  static std::shared_ptr<const DeterministicFilenameCipher> FromKeyMaterial(
      std::span<const uint8_t> key_material);
  // Fresh random key, for tests and throwaway vaults.
  static std::shared_ptr<const DeterministicFilenameCipher> Generate();

  std::string EncryptSegment(std::string_view clear) const override;
  std::string DecryptSegment(std::string_view encrypted) const override;

private:
  std::array<uint8_t, 32> enc_key_{};
  std::array<uint8_t, 32> mac_key_{};
};

}  // namespace dv::core
