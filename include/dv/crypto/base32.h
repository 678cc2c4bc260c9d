#pragma once
#include <cstdint>
#include <optional>
#include <span>
#include <string>
#include <string_view>
#include <vector>

namespace dv::crypto {

// RFC 4648 base32. Encoding emits the upper-case alphabet without padding so the
// result is safe as a path segment on case-insensitive filesystems.
std::string Base32Encode(std::span<const uint8_t> data);

// Accepts upper or lower case and optional trailing '=' padding. Returns
// std::nullopt on characters outside the alphabet or non-canonical trailing bits.
std::optional<std::vector<uint8_t>> Base32Decode(std::string_view text);

} // namespace dv::crypto
