#include "dv/core/options.h"

#include <charconv>
#include <cstdlib>
#include <cstring>
#include <optional>
#include <string_view>

#include "dv/error.h"
#include "dv/errors.h"
#include "dv/orchestrator/event_bus.h"

namespace dv::core {
namespace {

constexpr size_t kMaxShardPrefixLength = 8;
// SHA-1 digests encode to 32 base32 characters; the leaf needs at least one.
constexpr size_t kEncodedDigestLength = 32;
constexpr size_t kMinMarkerBytes = 16;
constexpr size_t kMaxMarkerBytes = 4096;

void PublishFallback(std::string_view variable, std::string_view value) {
  dv::orchestrator::Event event;
  event.category = dv::orchestrator::EventCategory::kDiagnostics;
  event.severity = dv::orchestrator::EventSeverity::kWarning;
  event.event_id = "options_fallback";
  event.message = "Ignoring malformed environment override";
  event.fields.emplace_back("variable", std::string(variable));
  event.fields.emplace_back("value", std::string(value), dv::orchestrator::FieldPrivacy::kRedact);
  dv::orchestrator::EventBus::Instance().Publish(event);
}

std::optional<unsigned long long> ReadUnsigned(const char* name) {
  const char* env = std::getenv(name);
  if (!env || *env == '\0') {
    return std::nullopt;
  }
  unsigned long long value = 0;
  const char* end = env + std::strlen(env);
  auto [ptr, ec] = std::from_chars(env, end, value);
  if (ec != std::errc() || ptr != end) {
    PublishFallback(name, env);
    return std::nullopt;
  }
  return value;
}

std::optional<bool> ReadFlag(const char* name) {
  const char* env = std::getenv(name);
  if (!env || *env == '\0') {
    return std::nullopt;
  }
  const std::string_view value{env};
  if (value == "1" || value == "true" || value == "yes" || value == "on") {
    return true;
  }
  if (value == "0" || value == "false" || value == "no" || value == "off") {
    return false;
  }
  PublishFallback(name, value);
  return std::nullopt;
}

[[noreturn]] void ThrowInvalid(std::string_view message, std::string_view detail) {
  throw Error{ErrorDomain::Config, errors::config::kInvalidOption,
              std::string(message) + ": " + std::string(detail)};
}

bool IsPlainSegment(const std::string& name) {
  return !name.empty() && name != "." && name != ".." &&
         name.find('/') == std::string::npos && name.find('\0') == std::string::npos;
}

}  // namespace

FileSystemOptions LoadOptionsFromEnvironment(FileSystemOptions base) {
  if (auto timeout = ReadUnsigned("DV_LOCK_TIMEOUT_MS")) {
    if (*timeout == 0) {
      PublishFallback("DV_LOCK_TIMEOUT_MS", "0");
    } else {
      base.lock_timeout = std::chrono::milliseconds(static_cast<long long>(*timeout));
    }
  }
  if (auto prefix = ReadUnsigned("DV_SHARD_PREFIX_LENGTH")) {
    if (*prefix == 0 || *prefix > kMaxShardPrefixLength) {
      PublishFallback("DV_SHARD_PREFIX_LENGTH", std::to_string(*prefix));
    } else {
      base.shard_prefix_length = static_cast<size_t>(*prefix);
    }
  }
  if (auto plain = ReadFlag("DV_PLAIN_DIRECTORY_HASH")) {
    base.encrypt_directory_ids = !*plain;
  }
  return base;
}

void ValidateOptions(const FileSystemOptions& options) {
  if (options.lock_timeout.count() <= 0) {
    ThrowInvalid(errors::msg::kInvalidLockTimeout, std::to_string(options.lock_timeout.count()) + "ms");
  }
  if (options.shard_prefix_length == 0 || options.shard_prefix_length > kMaxShardPrefixLength ||
      options.shard_prefix_length >= kEncodedDigestLength) {
    ThrowInvalid(errors::msg::kInvalidShardPrefix, std::to_string(options.shard_prefix_length));
  }
  if (options.max_marker_bytes < kMinMarkerBytes || options.max_marker_bytes > kMaxMarkerBytes) {
    ThrowInvalid(errors::msg::kInvalidMarkerCap, std::to_string(options.max_marker_bytes));
  }
  if (!IsPlainSegment(options.root_marker_name)) {
    ThrowInvalid(errors::msg::kInvalidReservedName, options.root_marker_name);
  }
  if (!IsPlainSegment(options.data_folder_name) || options.data_folder_name == options.root_marker_name) {
    ThrowInvalid(errors::msg::kInvalidReservedName, options.data_folder_name);
  }
}

}  // namespace dv::core
