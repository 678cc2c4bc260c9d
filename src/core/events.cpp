#include "dv/core/events.h"

#include <string>
#include <utility>

#include "dv/error.h"

namespace dv::core::events {

namespace {

using orchestrator::Event;
using orchestrator::EventBus;
using orchestrator::EventCategory;
using orchestrator::EventSeverity;
using orchestrator::FieldPrivacy;

void PublishLockTimeout(const storage::PhysicalFile& file, std::chrono::milliseconds timeout) {
  Event event;
  event.category = EventCategory::kDiagnostics;
  event.severity = EventSeverity::kWarning;
  event.event_id = "lock_timeout";
  event.message = "Timed out waiting for physical file lock";
  event.fields.emplace_back("path", file.Describe());
  event.fields.emplace_back("timeout_ms", std::to_string(timeout.count()), FieldPrivacy::kPublic, true);
  EventBus::Instance().Publish(event);
}

template <typename Handle, typename Open>
Handle ReportingTimeout(const storage::PhysicalFile& file, std::chrono::milliseconds timeout, Open&& open) {
  try {
    return open();
  } catch (const Error& err) {
    if (err.code == errors::io::kLockTimeout) {
      PublishLockTimeout(file, timeout);
    }
    throw;
  }
}

}  // namespace

void PublishNodeEvent(std::string_view event_id, std::string_view message, std::string_view logical_path,
                      std::vector<orchestrator::EventField> extra, orchestrator::EventSeverity severity) {
  Event event;
  event.category = EventCategory::kLifecycle;
  event.severity = severity;
  event.event_id = std::string(event_id);
  event.message = std::string(message);
  event.fields.emplace_back("logical_path", std::string(logical_path), FieldPrivacy::kHash);
  for (auto& field : extra) {
    event.fields.push_back(std::move(field));
  }
  EventBus::Instance().Publish(event);
}

std::unique_ptr<storage::ReadableFile> OpenReadable(const storage::PhysicalFile& file,
                                                    std::chrono::milliseconds timeout) {
  return ReportingTimeout<std::unique_ptr<storage::ReadableFile>>(
      file, timeout, [&] { return file.OpenReadable(timeout); });
}

std::unique_ptr<storage::WritableFile> OpenWritable(const storage::PhysicalFile& file,
                                                    std::chrono::milliseconds timeout) {
  return ReportingTimeout<std::unique_ptr<storage::WritableFile>>(
      file, timeout, [&] { return file.OpenWritable(timeout); });
}

}  // namespace dv::core::events
