#include "internal/config/config_loader.hpp"
#include "internal/config/relay_settings.hpp"

#include <cassert>
#include <chrono>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <stdexcept>
#include <string>

namespace {

std::filesystem::path WriteYaml(const std::string& test_name, const std::string& yaml_content) {
  const auto base_dir = std::filesystem::temp_directory_path() / "stream_relay_config_loader_tests";
  std::filesystem::create_directories(base_dir);

  const auto    file_path = base_dir / (test_name + ".yaml");
  std::ofstream out(file_path);
  out << yaml_content;
  out.close();

  return file_path;
}

void TestScalarEscapingForQuotedAndBackslashValues() {
  const auto yaml_path = WriteYaml("quoted_backslash",
                                   R"(server:
  bind_address: "0.0.0.0:50061"
database:
  sqlite:
    path: "C:\\relay\\\"quoted\"\\db.sqlite"
    wal_mode: true
)");

  auto config = relay::config::ConfigLoader::LoadFromYaml(yaml_path.string());
  assert(config.database().sqlite().path() == "C:\\relay\\\"quoted\"\\db.sqlite");
  assert(config.database().sqlite().wal_mode());
}

void TestScalarEscapingForNewlineAndUnicode() {
  const auto yaml_path = WriteYaml("newline_unicode",
                                   R"(server:
  bind_address: "line1\nline2☃"
)");

  auto config = relay::config::ConfigLoader::LoadFromYaml(yaml_path.string());
  assert(config.server().bind_address() == std::string("line1\nline2☃"));
}

void TestUnknownFieldsAreRejected() {
  const auto yaml_path = WriteYaml("unknown_field",
                                   R"(server:
  bind_address: "0.0.0.0:50061"
unknown_field: 123
)");

  bool threw = false;
  try {
    (void)relay::config::ConfigLoader::LoadFromYaml(yaml_path.string());
  } catch (const std::runtime_error&) {
    threw = true;
  }

  assert(threw && "ConfigLoader must reject unknown fields.");
}

void TestMissingFileIsReported() {
  bool threw = false;
  try {
    (void)relay::config::ConfigLoader::LoadFromYaml("/nonexistent/stream-relay.yaml");
  } catch (const std::runtime_error&) {
    threw = true;
  }
  assert(threw);
}

void TestEmptyRelaySectionResolvesToDefaults() {
  auto config   = relay::config::ConfigLoader::LoadFromYamlString("relay:\n  max_connections: 0\n");
  auto settings = relay::config::ResolveRelaySettings(config);

  assert(settings.max_connections == 1000);
  assert(settings.connection_timeout == std::chrono::milliseconds(300'000));
  assert(settings.heartbeat_interval == std::chrono::milliseconds(30'000));
  assert(settings.buffer_size_bytes == 8192);
  assert(settings.flush_threshold_fraction == 0.8);
  assert(settings.flush_interval == std::chrono::milliseconds(1'000));
  assert(settings.cleanup_interval == std::chrono::milliseconds(60'000));
  assert(settings.metrics_interval == std::chrono::milliseconds(60'000));
  assert(settings.metrics_cache_ttl == std::chrono::seconds(300));
  assert(!settings.compression_enabled);
  assert(!settings.encryption_enabled);

  assert(relay::config::DefaultBindAddress(config) == "0.0.0.0:50061");
}

void TestRelayOverridesAndTransformSections() {
  auto config = relay::config::ConfigLoader::LoadFromYamlString(R"(relay:
  max_connections: 5
  buffer_size_bytes: 1024
  flush_threshold_fraction: 0.5
  heartbeat_interval_ms: 250
compression:
  enabled: true
  algorithm: COMPRESSION_ALGORITHM_ADAPTIVE
  adaptive_candidates: [COMPRESSION_ALGORITHM_ZSTD, COMPRESSION_ALGORITHM_LZ4]
encryption:
  enabled: true
  algorithm: ENCRYPTION_ALGORITHM_AES_256_GCM
  key_rotation_interval_ms: 1000
transform_workers:
  threads: 3
  queue_capacity: 8
)");

  auto settings = relay::config::ResolveRelaySettings(config);
  assert(settings.max_connections == 5);
  assert(settings.buffer_size_bytes == 1024);
  assert(settings.flush_threshold_fraction == 0.5);
  assert(settings.heartbeat_interval == std::chrono::milliseconds(250));
  assert(settings.compression_enabled);
  assert(settings.encryption_enabled);

  auto transform = relay::config::ResolveTransformSettings(config);
  assert(transform.algorithm == relay::runtime::config::COMPRESSION_ALGORITHM_ADAPTIVE);
  assert(transform.adaptive_candidates.size() == 2);
  assert(transform.adaptive_candidates[0] == relay::runtime::config::COMPRESSION_ALGORITHM_ZSTD);
  assert(transform.key_rotation_interval == std::chrono::milliseconds(1000));
  assert(transform.worker_threads == 3);
  assert(transform.queue_capacity == 8);
}

void TestOutOfRangeThresholdIsRejected() {
  auto config = relay::config::ConfigLoader::LoadFromYamlString("relay:\n  flush_threshold_fraction: 1.5\n");

  bool threw = false;
  try {
    (void)relay::config::ResolveRelaySettings(config);
  } catch (const std::runtime_error&) {
    threw = true;
  }
  assert(threw);

  config = relay::config::ConfigLoader::LoadFromYamlString("relay:\n  flush_threshold_fraction: -0.1\n");
  threw  = false;
  try {
    (void)relay::config::ResolveRelaySettings(config);
  } catch (const std::runtime_error&) {
    threw = true;
  }
  assert(threw);
}

void TestZeroThresholdSelectsDefault() {
  auto config   = relay::config::ConfigLoader::LoadFromYamlString("relay:\n  flush_threshold_fraction: 0\n");
  auto settings = relay::config::ResolveRelaySettings(config);
  assert(settings.flush_threshold_fraction == 0.8);

  config   = relay::config::ConfigLoader::LoadFromYamlString("relay:\n  flush_threshold_fraction: 1\n");
  settings = relay::config::ResolveRelaySettings(config);
  assert(settings.flush_threshold_fraction == 1.0);
}

} // namespace

int main() {
  TestScalarEscapingForQuotedAndBackslashValues();
  TestScalarEscapingForNewlineAndUnicode();
  TestUnknownFieldsAreRejected();
  TestMissingFileIsReported();
  TestEmptyRelaySectionResolvesToDefaults();
  TestRelayOverridesAndTransformSections();
  TestOutOfRangeThresholdIsRejected();
  TestZeroThresholdSelectsDefault();

  std::cout << "relay_unit_config_loader: pass\n";
  return 0;
}
