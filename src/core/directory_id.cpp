#include "dv/core/directory_id.h"

#include <array>
#include <atomic>
#include <utility>
#include <vector>

#include "dv/common.h"
#include "dv/core/events.h"
#include "dv/crypto/random.h"
#include "dv/error.h"
#include "dv/errors.h"
#include "dv/orchestrator/event_bus.h"

namespace dv::core {

namespace {

using dv::orchestrator::Event;
using dv::orchestrator::EventBus;
using dv::orchestrator::EventCategory;
using dv::orchestrator::EventSeverity;
using dv::orchestrator::FieldPrivacy;

void PublishMarkerEvent(std::string_view event_id, std::string_view message,
                        const storage::PhysicalFile& marker, const std::string& id) {
  Event event;
  event.category = EventCategory::kLifecycle;
  event.severity = EventSeverity::kInfo;
  event.event_id = std::string(event_id);
  event.message = std::string(message);
  event.fields.emplace_back("marker", marker.Describe());
  event.fields.emplace_back("directory_id", id, FieldPrivacy::kHash);
  EventBus::Instance().Publish(event);
}

}  // namespace

std::string NewDirectoryId() {
  std::array<uint8_t, kDirectoryIdEntropyBytes> raw{};
  crypto::SystemRandomBytes(raw);
  static constexpr char kHex[] = "0123456789abcdef";
  std::string id;
  id.reserve(raw.size() * 2);
  for (uint8_t byte : raw) {
    id.push_back(kHex[byte >> 4]);
    id.push_back(kHex[byte & 0x0F]);
  }
  return id;
}

DirectoryIdStore::DirectoryIdStore(size_t max_marker_bytes, std::chrono::milliseconds lock_timeout)
    : max_marker_bytes_(max_marker_bytes), lock_timeout_(lock_timeout) {}

std::string DirectoryIdStore::GetOrCreate(const storage::PhysicalFile& marker) {
  if (auto current = Cached()) {
    return *current;
  }
  if (marker.Exists()) {
    auto handle = events::OpenReadable(marker, lock_timeout_);
    std::string stored = ReadMarker(*handle);
    if (stored.empty()) {
      // A materialization of this node may have created the marker but not
      // yet taken its write lock; it publishes the identifier first.
      if (auto current = Cached()) {
        return *current;
      }
      throw Error{ErrorDomain::IO, errors::io::kMarkerCorrupt,
                  std::string(errors::msg::kMarkerEmpty) + ": " + marker.Describe()};
    }
    return Install(std::make_shared<const std::string>(std::move(stored)));
  }
  return Install(std::make_shared<const std::string>(NewDirectoryId()));
}

std::string DirectoryIdStore::Persist(const storage::PhysicalFile& marker) {
  auto handle = events::OpenWritable(marker, lock_timeout_);
  if (handle->Size() > 0) {
    auto existing = std::make_shared<const std::string>(ReadMarker(*handle));
    std::atomic_store_explicit(&cached_, existing, std::memory_order_release);
    PublishMarkerEvent("directory_marker_adopted", "Adopted identifier already stored in marker", marker,
                       *existing);
    return *existing;
  }
  auto id = Cached();
  if (!id) {
    Install(std::make_shared<const std::string>(NewDirectoryId()));
    id = Cached();
  }
  handle->Write(AsByteSpan(*id));
  handle->Sync();
  PublishMarkerEvent("directory_marker_written", "Persisted directory identifier", marker, *id);
  return *id;
}

void DirectoryIdStore::Reload(const storage::PhysicalFile& marker) {
  auto handle = events::OpenReadable(marker, lock_timeout_);
  std::string stored = ReadMarker(*handle);
  if (!stored.empty()) {
    std::atomic_store_explicit(&cached_, std::make_shared<const std::string>(std::move(stored)),
                               std::memory_order_release);
  }
}

void DirectoryIdStore::Invalidate() noexcept {
  std::atomic_store_explicit(&cached_, std::shared_ptr<const std::string>{}, std::memory_order_release);
}

std::shared_ptr<const std::string> DirectoryIdStore::Cached() const noexcept {
  return std::atomic_load_explicit(&cached_, std::memory_order_acquire);
}

std::string DirectoryIdStore::Install(std::shared_ptr<const std::string> candidate) {
  std::shared_ptr<const std::string> expected;
  if (std::atomic_compare_exchange_strong(&cached_, &expected, candidate)) {
    return *candidate;
  }
  return *expected;  // lost the race; |expected| now holds the winner
}

std::string DirectoryIdStore::ReadMarker(storage::ReadableFile& handle) const {
  std::vector<uint8_t> buffer(max_marker_bytes_);
  size_t filled = 0;
  handle.Seek(0);
  while (filled < buffer.size()) {
    const size_t n = handle.Read(std::span<uint8_t>(buffer.data() + filled, buffer.size() - filled));
    if (n == 0) {
      break;
    }
    filled += n;
  }
  return BytesToString(std::span<const uint8_t>(buffer.data(), filled));
}

}  // namespace dv::core
