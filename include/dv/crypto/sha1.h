#pragma once
#include <array>
#include <cstdint>
#include <span>

namespace dv::crypto {

inline constexpr size_t kSha1DigestSize = 20;

// Throws dv::Error (Dependency/kPrimitiveUnavailable) when the crypto runtime
// was built or configured without SHA-1.
std::array<uint8_t, kSha1DigestSize> SHA1_Hash(std::span<const uint8_t> data);

} // namespace dv::crypto
