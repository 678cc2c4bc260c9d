#pragma once

#include <chrono>
#include <cstdint>
#include <filesystem>
#include <fstream>
#include <functional>
#include <iomanip>
#include <memory>
#include <mutex>
#include <optional>
#include <span>
#include <sstream>
#include <string>
#include <string_view>
#include <vector>

#include "dv/crypto/sha256.h"

namespace dv::orchestrator {

  // structured logging primitives
  enum class EventSeverity { kDebug, kInfo, kWarning, kError, kCritical };

  enum class EventCategory { kTelemetry, kLifecycle, kSecurity, kDiagnostics };

  enum class FieldPrivacy { kPublic, kRedact, kHash };

  struct EventField {
    std::string key;
    std::string value;
    FieldPrivacy privacy{FieldPrivacy::kPublic};
    bool numeric{false};

    EventField(std::string k, std::string v, FieldPrivacy p = FieldPrivacy::kPublic,
               bool is_numeric = false)
        : key(std::move(k)), value(std::move(v)), privacy(p), numeric(is_numeric) {}
  };

  struct Event {
    EventCategory category{EventCategory::kDiagnostics};
    EventSeverity severity{EventSeverity::kInfo};
    std::string event_id;
    std::string message;
    std::vector<EventField> fields;
  };

  inline std::string HashForTelemetry(std::string_view input) {
    if (input.empty()) {
      return "";
    }
    const auto* data = reinterpret_cast<const uint8_t*>(input.data());
    auto digest = dv::crypto::SHA256_Hash(std::span<const uint8_t>(data, input.size()));
    std::ostringstream oss;
    oss << std::hex << std::setfill('0');
    for (uint8_t byte : digest) {
      oss << std::setw(2) << static_cast<int>(byte);
    }
    return oss.str();
  }

  // Renders |event| as a single JSON object. Returns std::nullopt when the
  // payload would exceed |max_bytes|.
  std::optional<std::string> BuildEventJson(const Event& event, const std::string& timestamp,
                                            size_t max_bytes);

  class JsonLineLogger {
  public:
    JsonLineLogger();
    explicit JsonLineLogger(std::filesystem::path log_path, size_t max_bytes = 0);
    void Log(const Event& event);

    const std::filesystem::path& Path() const noexcept { return log_path_; }

  private:
    static std::string FormatTimestamp(std::chrono::system_clock::time_point tp);
    static std::filesystem::path DefaultLogPath();
    static size_t ResolveMaxBytes();
    void EnsureOpen();
    void RotateIfNeeded(size_t incoming_bytes);

    std::mutex mutex_;
    std::ofstream stream_;
    std::filesystem::path log_path_;
    size_t max_bytes_;
    const size_t max_files_ = 3;
    uint64_t dropped_streak_{0};
    bool disabled_{false};
  };

  JsonLineLogger& DefaultJsonLogger();

  class EventBus {
  public:
    using Subscriber = std::function<void(const Event&)>;

    static EventBus& Instance();

    void Publish(const Event& event);
    void Subscribe(Subscriber fn);

    EventBus();

  private:
    using SubscriberList = std::vector<Subscriber>;

    std::shared_ptr<const SubscriberList> subscribers_snapshot_;
    std::mutex subscribers_mutex_;
  };

  void ResetEventBusForTesting();

} // namespace dv::orchestrator
