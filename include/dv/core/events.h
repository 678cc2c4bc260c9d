#pragma once

#include <chrono>
#include <memory>
#include <string_view>
#include <vector>

#include "dv/orchestrator/event_bus.h"
#include "dv/storage/physical_storage.h"

namespace dv::core::events {

// Lifecycle event for a logical node. |logical_path| is always hashed.
void PublishNodeEvent(std::string_view event_id, std::string_view message, std::string_view logical_path,
                      std::vector<orchestrator::EventField> extra = {},
                      orchestrator::EventSeverity severity = orchestrator::EventSeverity::kInfo);

// Storage handle acquisition that publishes lock_timeout before rethrowing.
std::unique_ptr<storage::ReadableFile> OpenReadable(const storage::PhysicalFile& file,
                                                    std::chrono::milliseconds timeout);
std::unique_ptr<storage::WritableFile> OpenWritable(const storage::PhysicalFile& file,
                                                    std::chrono::milliseconds timeout);

}  // namespace dv::core::events
