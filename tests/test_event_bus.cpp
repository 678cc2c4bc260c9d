#include "dv/orchestrator/event_bus.h"

#include <cassert>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <sstream>
#include <string>
#include <vector>

#include "dv/core/crypto_filesystem.h"
#include "test_support.h"

namespace {

using dv::orchestrator::Event;
using dv::orchestrator::EventField;
using dv::orchestrator::FieldPrivacy;

std::string Slurp(const std::filesystem::path& path) {
  std::ifstream in(path);
  std::stringstream buffer;
  buffer << in.rdbuf();
  return buffer.str();
}

void TestJsonPrivacy() {
  Event event;
  event.event_id = "folder_moved";
  event.message = "Folder moved";
  event.fields.emplace_back("logical_path", "/private/tax", FieldPrivacy::kHash);
  event.fields.emplace_back("secret", "hunter2", FieldPrivacy::kRedact);
  event.fields.emplace_back("timeout_ms", "30", FieldPrivacy::kPublic, true);
  auto json = dv::orchestrator::BuildEventJson(event, "2024-01-01T00:00:00.000000Z", 4096);
  assert(json && "event must render");
  assert(json->find("/private/tax") == std::string::npos && "hashed fields must not leak");
  assert(json->find("\"hash:" + dv::orchestrator::HashForTelemetry("/private/tax") + "\"") != std::string::npos &&
         "hashed fields carry the SHA-256 tag");
  assert(json->find("hunter2") == std::string::npos && json->find("[REDACTED]") != std::string::npos &&
         "redacted fields must be masked");
  assert(json->find("\"timeout_ms\":30") != std::string::npos && "numeric fields are unquoted");
  assert(!dv::orchestrator::BuildEventJson(event, "ts", 16) && "oversized events must be refused");
}

void TestLoggerRotation(const dv::test::TempDir& dir) {
  const auto path = dir.path() / "rotating" / "events.log";
  dv::orchestrator::JsonLineLogger logger(path, 256);
  Event event;
  event.event_id = "rotation_check";
  event.message = std::string(100, 'r');
  for (int i = 0; i < 10; ++i) {
    logger.Log(event);
  }
  assert(std::filesystem::exists(path) && "the active log must exist");
  assert(std::filesystem::exists(path.string() + ".1") && "full logs must rotate");
  assert(!std::filesystem::exists(path.string() + ".4") && "only three generations are kept");
  assert(std::filesystem::file_size(path) <= 256 && "the active log stays under the cap");
}

void TestFanOut() {
  dv::orchestrator::EventBus bus;
  std::vector<std::string> seen;
  bus.Subscribe([&seen](const Event& e) { seen.push_back("first:" + e.event_id); });
  bus.Subscribe([&seen](const Event& e) { seen.push_back("second:" + e.event_id); });
  Event event;
  event.event_id = "ping";
  bus.Publish(event);
  assert((seen == std::vector<std::string>{"first:ping", "second:ping"}) && "subscribers run in order");
}

void TestFilesystemEventsAreHashed(const dv::test::TempDir& dir) {
  auto filesystem = dv::core::CryptoFileSystem::Open(dir.path() / "vault", dv::test::FixedCipher(5));
  filesystem->ResolveFolder("/supersecretproject")->Create(dv::core::FolderCreateMode::kIncludingParents);
  const auto log = Slurp(dv::orchestrator::DefaultJsonLogger().Path());
  assert(log.find("folder_materialized") != std::string::npos && "lifecycle events must reach the log");
  assert(log.find("supersecretproject") == std::string::npos && "logical names must never be logged in clear");
}

}  // namespace

int main() {
  dv::test::TempDir dir("dv_event_bus_");
  dv::test::RouteLogsTo(dir.path());
  TestJsonPrivacy();
  TestLoggerRotation(dir);
  TestFanOut();
  TestFilesystemEventsAreHashed(dir);
  std::cout << "event bus test ok\n";
  return 0;
}
