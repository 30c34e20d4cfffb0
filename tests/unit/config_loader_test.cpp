#include "internal/config/config_loader.hpp"

#include <cassert>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <stdexcept>
#include <string>

#include "internal/config/settings.hpp"

namespace {

using fetchgate::config::ConfigLoader;

std::filesystem::path WriteYaml(const std::string& test_name, const std::string& yaml_content) {
  const auto base_dir = std::filesystem::temp_directory_path() / "fetchgate_config_loader_tests";
  std::filesystem::create_directories(base_dir);

  const auto    file_path = base_dir / (test_name + ".yaml");
  std::ofstream out(file_path);
  out << yaml_content;
  out.close();

  return file_path;
}

void TestFullConfigFromFile() {
  const auto yaml_path = WriteYaml("full",
                                   R"(server:
  bind_address: "127.0.0.1:6000"
transfers:
  download_dir: "/srv/fetchgate"
  chunk_size_bytes: 65536
  inactivity_timeout_ms: 5000
  sweep_interval_ms: 250
  allow_concurrent_per_agent: false
  ingest_shards: 2
  ingest_queue_depth: 16
  fsync_on_complete: true
logging:
  level: "debug"
)");

  auto config = ConfigLoader::LoadFromYaml(yaml_path.string());
  assert(config.server().bind_address() == "127.0.0.1:6000");
  assert(config.transfers().chunk_size_bytes() == 65536);
  assert(config.logging().level() == "debug");

  auto settings = fetchgate::config::ResolveTransferSettings(config);
  assert(settings.download_dir == "/srv/fetchgate");
  assert(settings.chunk_size_bytes == 65536);
  assert(settings.inactivity_timeout == std::chrono::milliseconds(5000));
  assert(settings.sweep_interval == std::chrono::milliseconds(250));
  assert(!settings.allow_concurrent_per_agent);
  assert(settings.ingest_shards == 2);
  assert(settings.ingest_queue_depth == 16);
  assert(settings.fsync_on_complete);
  assert(fetchgate::config::ResolveBindAddress(config) == "127.0.0.1:6000");
}

void TestEmptyDocumentUsesDefaults() {
  auto config   = ConfigLoader::LoadFromYamlString("");
  auto settings = fetchgate::config::ResolveTransferSettings(config);
  assert(settings.download_dir == "./downloads");
  assert(settings.chunk_size_bytes == 1024 * 1024);
  assert(settings.inactivity_timeout == std::chrono::milliseconds(30000));
  assert(settings.allow_concurrent_per_agent);
  assert(fetchgate::config::ResolveBindAddress(config) == "0.0.0.0:50051");
}

void TestUnknownKeyIsRejected() {
  bool thrown = false;
  try {
    ConfigLoader::LoadFromYamlString(R"(transfers:
  chunk_size: 10
)");
  } catch (const std::runtime_error& e) {
    thrown = std::string(e.what()).find("Invalid configuration") != std::string::npos;
  }
  assert(thrown);
}

void TestOversizedChunkIsRejected() {
  auto config = ConfigLoader::LoadFromYamlString(R"(transfers:
  chunk_size_bytes: 8388608
)");
  bool thrown = false;
  try {
    fetchgate::config::ResolveTransferSettings(config);
  } catch (const std::runtime_error&) {
    thrown = true;
  }
  assert(thrown);
}

void TestSweepLongerThanTimeoutIsRejected() {
  auto config = ConfigLoader::LoadFromYamlString(R"(transfers:
  inactivity_timeout_ms: 1000
  sweep_interval_ms: 5000
)");
  bool thrown = false;
  try {
    fetchgate::config::ResolveTransferSettings(config);
  } catch (const std::runtime_error&) {
    thrown = true;
  }
  assert(thrown);
}

void TestMissingFileThrows() {
  bool thrown = false;
  try {
    ConfigLoader::LoadFromYaml("/nonexistent/fetchgate.yaml");
  } catch (const std::exception&) {
    thrown = true;
  }
  assert(thrown);
}

} // namespace

int main() {
  TestFullConfigFromFile();
  TestEmptyDocumentUsesDefaults();
  TestUnknownKeyIsRejected();
  TestOversizedChunkIsRejected();
  TestSweepLongerThanTimeoutIsRejected();
  TestMissingFileThrows();
  std::cout << "config_loader_test: pass\n";
  return 0;
}
