#pragma once

#include <string_view>

namespace dv::errors::msg {
// Centralized message catalog
inline constexpr std::string_view kLockTimeout{"Failed to lock file in time"};
inline constexpr std::string_view kParentMissing{"Parent folder does not exist"};
inline constexpr std::string_view kCopyIntoSelf{"Can not copy parent to child directory"};
inline constexpr std::string_view kCopyOntoSelf{"Can not copy a file onto itself"};
inline constexpr std::string_view kMoveIntoSelf{"Can not move directories containing one another"};
inline constexpr std::string_view kMoveFolderToForeignNode{"Can not move folder to a node of another kind"};
inline constexpr std::string_view kMoveFileToForeignNode{"Can not move file to a node of another kind"};
inline constexpr std::string_view kMoveTargetExists{"Move target already exists"};
inline constexpr std::string_view kMoveSourceMissing{"Move source does not exist"};
inline constexpr std::string_view kCopySourceMissing{"Copy source does not exist"};
inline constexpr std::string_view kRootImmutable{"Operation not permitted on the root folder"};
inline constexpr std::string_view kMarkerEmpty{"Directory marker is empty"};
inline constexpr std::string_view kInvalidSegmentEmpty{"Path segment must not be empty"};
inline constexpr std::string_view kInvalidSegmentTooLong{"Path segment too long"};
inline constexpr std::string_view kInvalidSegmentCharacter{"Path segment contains a reserved character"};
inline constexpr std::string_view kInvalidSegmentDots{"Path segment must not be '.' or '..'"};
inline constexpr std::string_view kFilenameAuthenticationFailed{"Filename authentication failed"};
inline constexpr std::string_view kFilenameMalformed{"Encrypted filename malformed"};
inline constexpr std::string_view kFilenameKeyLength{"Filename key material has wrong length"};
inline constexpr std::string_view kSha1Unavailable{"SHA-1 digest not available in crypto runtime"};
inline constexpr std::string_view kAesGcmUnavailable{"AES-256-GCM not available in crypto runtime"};
inline constexpr std::string_view kSha256Unavailable{"SHA-256 digest not available in crypto runtime"};
inline constexpr std::string_view kInvalidShardPrefix{"Shard prefix length out of range"};
inline constexpr std::string_view kInvalidMarkerCap{"Marker read cap out of range"};
inline constexpr std::string_view kInvalidLockTimeout{"Lock timeout must be positive"};
inline constexpr std::string_view kInvalidReservedName{"Reserved physical name invalid"};
}  // namespace dv::errors::msg
