#include "dv/orchestrator/event_bus.h"

#include "dv/common.h"
#include "dv/error.h"

#include <algorithm>
#include <atomic>
#include <charconv>
#include <cstdlib>
#include <cstring>
#include <ctime>
#include <filesystem>
#include <iostream>
#include <limits>
#include <memory>
#include <mutex>
#include <string>
#include <system_error>

namespace dv::orchestrator {
namespace {

struct EventBusSingletonStorage {
  std::once_flag once;
  std::unique_ptr<EventBus> instance;
};

std::mutex& EventBusSingletonMutex() {
  static std::mutex mutex;
  return mutex;
}

std::unique_ptr<EventBusSingletonStorage>& EventBusSingleton() {
  static auto storage = std::make_unique<EventBusSingletonStorage>();
  return storage;
}

struct PublishReentrancyGuard {  // suppress recursive publish deadlocks
  explicit PublishReentrancyGuard(bool& flag) : flag_(flag) { flag_ = true; }
  ~PublishReentrancyGuard() { flag_ = false; }
  PublishReentrancyGuard(const PublishReentrancyGuard&) = delete;
  PublishReentrancyGuard& operator=(const PublishReentrancyGuard&) = delete;

 private:
  bool& flag_;
};

constexpr size_t kMaxEventBytes = 16 * 1024;
constexpr size_t kDefaultMaxLogBytes = 10 * 1024 * 1024;

std::string HashTag(std::string_view value) {
  auto digest = HashForTelemetry(value);
  if (digest.empty()) {
    return std::string{"hash:"};
  }
  return std::string{"hash:"} + digest;
}

bool AppendWithLimit(std::string& out, std::string_view chunk, size_t limit) {
  if (out.size() + chunk.size() > limit) {
    return false;
  }
  out.append(chunk.data(), chunk.size());
  return true;
}

std::string EscapeJson(std::string_view text) {
  std::string out;
  out.reserve(text.size() + 8);
  for (unsigned char c : text) {
    switch (c) {
    case '\\':
      out += "\\\\";
      break;
    case '"':
      out += "\\\"";
      break;
    case '\b':
      out += "\\b";
      break;
    case '\f':
      out += "\\f";
      break;
    case '\n':
      out += "\\n";
      break;
    case '\r':
      out += "\\r";
      break;
    case '\t':
      out += "\\t";
      break;
    default:
      if (c < 0x20) {
        std::ostringstream hex;
        hex << "\\u" << std::hex << std::setw(4) << std::setfill('0') << static_cast<int>(c);
        out += hex.str();
      } else {
        out.push_back(static_cast<char>(c));
      }
      break;
    }
  }
  return out;
}

bool AppendEscapedWithLimit(std::string& out, std::string_view text, size_t limit) {
  return AppendWithLimit(out, EscapeJson(text), limit);
}

const char* SeverityToString(EventSeverity severity) {
  switch (severity) {
  case EventSeverity::kDebug:
    return "debug";
  case EventSeverity::kInfo:
    return "info";
  case EventSeverity::kWarning:
    return "warning";
  case EventSeverity::kError:
    return "error";
  case EventSeverity::kCritical:
    return "critical";
  }
  return "info";
}

const char* CategoryToString(EventCategory category) {
  switch (category) {
  case EventCategory::kTelemetry:
    return "telemetry";
  case EventCategory::kLifecycle:
    return "lifecycle";
  case EventCategory::kSecurity:
    return "security";
  case EventCategory::kDiagnostics:
    return "diagnostics";
  }
  return "diagnostics";
}

Event BuildOversizeEvent(const Event& original) {
  Event replacement;
  replacement.category = EventCategory::kDiagnostics;
  replacement.severity = EventSeverity::kWarning;
  replacement.event_id = "event_too_large";
  replacement.message = "Event payload exceeded logger limits";
  if (!original.event_id.empty()) {
    replacement.fields.emplace_back("original_event_id", original.event_id, FieldPrivacy::kHash);
  }
  replacement.fields.emplace_back("limit_bytes", std::to_string(kMaxEventBytes), FieldPrivacy::kPublic, true);
  return replacement;
}

}  // namespace

std::optional<std::string> BuildEventJson(const Event& event, const std::string& timestamp,
                                          size_t max_bytes) {
  std::string payload;
  payload.reserve(std::min<size_t>(max_bytes, 256));
  if (!AppendWithLimit(payload, "{\"ts\":\"", max_bytes) ||
      !AppendEscapedWithLimit(payload, timestamp, max_bytes) ||
      !AppendWithLimit(payload, "\",\"severity\":\"", max_bytes) ||
      !AppendWithLimit(payload, SeverityToString(event.severity), max_bytes) ||
      !AppendWithLimit(payload, "\",\"category\":\"", max_bytes) ||
      !AppendWithLimit(payload, CategoryToString(event.category), max_bytes) ||
      !AppendWithLimit(payload, "\"", max_bytes)) {
    return std::nullopt;
  }
  if (!event.event_id.empty()) {
    if (!AppendWithLimit(payload, ",\"event_id\":\"", max_bytes) ||
        !AppendEscapedWithLimit(payload, event.event_id, max_bytes) ||
        !AppendWithLimit(payload, "\"", max_bytes)) {
      return std::nullopt;
    }
  }
  if (!event.message.empty()) {
    if (!AppendWithLimit(payload, ",\"message\":\"", max_bytes) ||
        !AppendEscapedWithLimit(payload, event.message, max_bytes) ||
        !AppendWithLimit(payload, "\"", max_bytes)) {
      return std::nullopt;
    }
  }
  for (const auto& field : event.fields) {
    if (!AppendWithLimit(payload, ",\"", max_bytes) ||
        !AppendEscapedWithLimit(payload, field.key, max_bytes) ||
        !AppendWithLimit(payload, "\":", max_bytes)) {
      return std::nullopt;
    }
    std::string sanitized = field.value;
    if (field.privacy == FieldPrivacy::kRedact) {
      sanitized = "[REDACTED]";
    } else if (field.privacy == FieldPrivacy::kHash) {
      sanitized = HashTag(field.value);
    }
    if (field.numeric && field.privacy == FieldPrivacy::kPublic) {
      if (!AppendWithLimit(payload, sanitized, max_bytes)) {
        return std::nullopt;
      }
    } else {
      if (!AppendWithLimit(payload, "\"", max_bytes) ||
          !AppendEscapedWithLimit(payload, sanitized, max_bytes) ||
          !AppendWithLimit(payload, "\"", max_bytes)) {
        return std::nullopt;
      }
    }
  }
  if (!AppendWithLimit(payload, "}", max_bytes)) {
    return std::nullopt;
  }
  return payload;
}

JsonLineLogger::JsonLineLogger() : JsonLineLogger(DefaultLogPath(), ResolveMaxBytes()) {}

JsonLineLogger::JsonLineLogger(std::filesystem::path log_path, size_t max_bytes)
    : log_path_(std::move(log_path)), max_bytes_(max_bytes == 0 ? kDefaultMaxLogBytes : max_bytes) {}

std::filesystem::path JsonLineLogger::DefaultLogPath() {
  const char* env = std::getenv("DV_LOG_PATH");
  if (env && *env != '\0') {
    return std::filesystem::path(env);
  }
  return std::filesystem::current_path() / "logs" / "dirvault.log";
}

std::string JsonLineLogger::FormatTimestamp(std::chrono::system_clock::time_point tp) {
  auto tt = std::chrono::system_clock::to_time_t(tp);
  std::tm tm{};
#if defined(_WIN32)
  gmtime_s(&tm, &tt);
#else
  gmtime_r(&tt, &tm);
#endif
  auto fractional = std::chrono::duration_cast<std::chrono::microseconds>(tp.time_since_epoch()) %
                    std::chrono::seconds(1);
  std::ostringstream oss;
  oss << std::put_time(&tm, "%Y-%m-%dT%H:%M:%S");
  oss << '.' << std::setw(6) << std::setfill('0') << fractional.count() << 'Z';
  return oss.str();
}

size_t JsonLineLogger::ResolveMaxBytes() {
  const char* env = std::getenv("DV_LOG_MAX_SIZE");
  if (!env || *env == '\0') {
    return kDefaultMaxLogBytes;
  }
  unsigned long long value = 0;
  auto [ptr, ec] = std::from_chars(env, env + std::strlen(env), value);
  if (ec != std::errc() || ptr != env + std::strlen(env) || value == 0) {
    return kDefaultMaxLogBytes;
  }
  return static_cast<size_t>(std::min<unsigned long long>(value, std::numeric_limits<size_t>::max()));
}

void JsonLineLogger::EnsureOpen() {
  if (stream_.is_open() || disabled_) {
    return;
  }
  std::error_code ec;
  auto parent = log_path_.parent_path();
  if (!parent.empty()) {
    std::filesystem::create_directories(parent, ec);
    if (ec) {
      std::clog << "{\"event\":\"logger_error\",\"message\":\"log directory create failed\",\"error_code\":"
                << ec.value() << "}" << std::endl;
      disabled_ = true;
      return;
    }
  }
  stream_.open(log_path_, std::ios::out | std::ios::app);
}

void JsonLineLogger::RotateIfNeeded(size_t incoming_bytes) {
  std::error_code ec;
  auto current_size = std::filesystem::file_size(log_path_, ec);
  if (ec) {
    return;  // nothing written yet
  }
  if (current_size + incoming_bytes <= max_bytes_) {
    return;
  }
  if (stream_.is_open()) {
    stream_.close();
  }
  for (size_t idx = max_files_; idx > 0; --idx) {
    std::filesystem::path src =
        idx == 1 ? log_path_ : std::filesystem::path(log_path_.string() + "." + std::to_string(idx - 1));
    std::filesystem::path dst =
        std::filesystem::path(log_path_.string() + "." + std::to_string(idx));
    std::error_code rotate_ec;
    const bool source_exists = std::filesystem::exists(src, rotate_ec);
    if (rotate_ec || !source_exists) {
      continue;
    }
    std::filesystem::remove(dst, rotate_ec);
    rotate_ec.clear();
    std::filesystem::rename(src, dst, rotate_ec);
    if (rotate_ec) {
      std::clog << "{\"event\":\"logger_error\",\"message\":\"log rotate rename failed\",\"error_code\":"
                << rotate_ec.value() << "}" << std::endl;
    }
  }
}

void JsonLineLogger::Log(const Event& event) {
  std::lock_guard<std::mutex> guard(mutex_);
  if (disabled_) {
    return;
  }
  auto timestamp = FormatTimestamp(std::chrono::system_clock::now());
  auto line = BuildEventJson(event, timestamp, kMaxEventBytes);
  if (!line) {
    line = BuildEventJson(BuildOversizeEvent(event), timestamp, kMaxEventBytes);
    if (!line) {
      return;
    }
  }

  RotateIfNeeded(line->size() + 1);
  EnsureOpen();
  if (!stream_.is_open()) {
    ++dropped_streak_;
    if (dropped_streak_ == 1) {
      std::clog << "{\"event\":\"logger_error\",\"message\":\"failed to open log file\"}"
                << std::endl;
    }
    return;
  }

  stream_ << *line << '\n';
  stream_.flush();
  dropped_streak_ = 0;
}

JsonLineLogger& DefaultJsonLogger() {
  static JsonLineLogger logger;
  return logger;
}

EventBus::EventBus() {
  auto initial = std::make_shared<SubscriberList>();
  initial->push_back([](const Event& e) { DefaultJsonLogger().Log(e); });
  std::lock_guard<std::mutex> guard(subscribers_mutex_);
  std::atomic_store_explicit(&subscribers_snapshot_, std::const_pointer_cast<const SubscriberList>(initial),
                             std::memory_order_release);
}

EventBus& EventBus::Instance() {
  std::lock_guard<std::mutex> guard(EventBusSingletonMutex());
  auto& storage = EventBusSingleton();
  std::call_once(storage->once, [&storage]() {
    storage->instance = std::make_unique<EventBus>();
  });
  return *storage->instance;
}

void EventBus::Publish(const Event& event) {
  static thread_local bool in_publish = false;
  if (in_publish) {
    std::clog << "{\"event\":\"event_bus_reentrancy\",\"message\":\"recursive publish suppressed\"}"
              << std::endl;
    return;
  }
  PublishReentrancyGuard guard(in_publish);
  auto targets = std::atomic_load_explicit(&subscribers_snapshot_, std::memory_order_acquire);
  if (!targets) {
    return;
  }
  for (const auto& subscriber : *targets) {
    if (subscriber) {
      subscriber(event);
    }
  }
}

void EventBus::Subscribe(Subscriber fn) {
  std::lock_guard<std::mutex> guard(subscribers_mutex_);
  auto current = std::atomic_load_explicit(&subscribers_snapshot_, std::memory_order_acquire);
  auto updated = current ? std::make_shared<SubscriberList>(*current) : std::make_shared<SubscriberList>();
  updated->push_back(std::move(fn));
  std::atomic_store_explicit(&subscribers_snapshot_, std::const_pointer_cast<const SubscriberList>(updated),
                             std::memory_order_release);
}

void ResetEventBusForTesting() {
  std::lock_guard<std::mutex> guard(EventBusSingletonMutex());
  EventBusSingleton() = std::make_unique<EventBusSingletonStorage>();
}

} // namespace dv::orchestrator
