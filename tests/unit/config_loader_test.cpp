#include "internal/config/config_loader.hpp"

#include <cassert>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <stdexcept>
#include <string>

namespace {

using localdeck::config::ConfigLoader;

std::filesystem::path WriteYaml(const std::string& test_name, const std::string& yaml_content) {
  const auto base_dir = std::filesystem::temp_directory_path() / "localdeck_config_loader_tests";
  std::filesystem::create_directories(base_dir);

  const auto    file_path = base_dir / (test_name + ".yaml");
  std::ofstream out(file_path);
  out << yaml_content;
  out.close();

  return file_path;
}

void TestFullConfigParses() {
  const auto yaml_path = WriteYaml("full",
                                   R"(server:
  bind_address: "0.0.0.0:50061"
database:
  sqlite:
    path: "/var/lib/localdeck/localdeck.db"
    wal_mode: true
content:
  disk:
    root_path: "/var/lib/localdeck/content"
    fsync: true
fetch:
  ytdlp_path: "/usr/local/bin/yt-dlp"
  audio_format: m4a
  workers: 3
  failure_cooldown: "45s"
  extra_args: ["--cookies", "/etc/localdeck/cookies.txt"]
playback:
  player_command: ["mpv", "--no-video", "-"]
  stop_timeout: 1.5s
registry:
  cache_enabled: true
public_endpoint:
  base_url: "http://deck.local:8080"
logging:
  level: debug
observability:
  tracing_enabled: false
  transport: OTLP_TRANSPORT_HTTP
  metrics:
    collection_interval_ms: 500
)");

  const auto config = ConfigLoader::LoadFromYaml(yaml_path.string());
  assert(config.server().bind_address() == "0.0.0.0:50061");
  assert(config.database().has_sqlite());
  assert(config.database().sqlite().path() == "/var/lib/localdeck/localdeck.db");
  assert(config.database().sqlite().wal_mode());
  assert(config.content().has_disk());
  assert(config.content().disk().root_path() == "/var/lib/localdeck/content");
  assert(config.content().disk().fsync());
  assert(config.fetch().ytdlp_path() == "/usr/local/bin/yt-dlp");
  assert(config.fetch().audio_format() == "m4a");
  assert(config.fetch().workers() == 3);
  assert(config.fetch().failure_cooldown().seconds() == 45);
  assert(config.fetch().extra_args_size() == 2);
  assert(config.fetch().extra_args(1) == "/etc/localdeck/cookies.txt");
  assert(config.playback().player_command_size() == 3);
  assert(config.playback().player_command(0) == "mpv");
  assert(config.playback().stop_timeout().seconds() == 1);
  assert(config.playback().stop_timeout().nanos() == 500000000);
  assert(config.registry().cache_enabled());
  assert(config.public_endpoint().base_url() == "http://deck.local:8080");
  assert(config.logging().level() == "debug");
  assert(config.observability().transport() == localdeck::runtime::config::OTLP_TRANSPORT_HTTP);
  assert(config.observability().metrics().collection_interval_ms() == 500);
}

void TestMemoryBackendsFromString() {
  const auto config = ConfigLoader::LoadFromString(R"(database:
  memory: {}
content:
  ram: {}
)");
  assert(config.database().has_memory());
  assert(config.content().has_ram());
  assert(config.server().bind_address().empty());
}

void TestEmptyDocumentYieldsDefaults() {
  const auto config = ConfigLoader::LoadFromString("");
  assert(!config.has_server());
  assert(config.database().backend_case() == localdeck::runtime::config::DatabaseConfig::BACKEND_NOT_SET);
}

void TestScalarEscapingForQuotedAndBackslashValues() {
  const auto yaml_path = WriteYaml("quoted_backslash",
                                   R"(database:
  sqlite:
    path: "C:\\localdeck\\\"quoted\"\\db.sqlite"
    wal_mode: true
)");

  auto config = ConfigLoader::LoadFromYaml(yaml_path.string());
  assert(config.database().sqlite().path() == "C:\\localdeck\\\"quoted\"\\db.sqlite");
}

void TestScalarEscapingForNewlineAndUnicode() {
  const auto config = ConfigLoader::LoadFromString(R"(server:
  bind_address: "line1\nline2☃"
)");
  assert(config.server().bind_address() == std::string("line1\nline2☃"));
}

void TestQuotedNumbersStayStrings() {
  const auto config = ConfigLoader::LoadFromString(R"(playback:
  player_command: ["aplay", "-r", "44100", "true"]
)");
  assert(config.playback().player_command_size() == 4);
  assert(config.playback().player_command(2) == "44100");
  assert(config.playback().player_command(3) == "true");
}

void TestUnknownFieldsAreRejected() {
  bool threw = false;
  try {
    (void)ConfigLoader::LoadFromString(R"(server:
  bind_address: "0.0.0.0:50061"
shuffle:
  enabled: true
)");
  } catch (const std::runtime_error&) {
    threw = true;
  }

  assert(threw && "ConfigLoader must reject unknown fields.");
}

void TestNonMappingTopLevelIsRejected() {
  bool threw = false;
  try {
    (void)ConfigLoader::LoadFromString("- just\n- a list\n");
  } catch (const std::runtime_error&) {
    threw = true;
  }
  assert(threw);
}

void TestMissingFileIsReported() {
  bool threw = false;
  try {
    (void)ConfigLoader::LoadFromYaml("/nonexistent/localdeck.yaml");
  } catch (const std::runtime_error&) {
    threw = true;
  }
  assert(threw);
}

} // namespace

int main() {
  TestFullConfigParses();
  TestMemoryBackendsFromString();
  TestEmptyDocumentYieldsDefaults();
  TestScalarEscapingForQuotedAndBackslashValues();
  TestScalarEscapingForNewlineAndUnicode();
  TestQuotedNumbersStayStrings();
  TestUnknownFieldsAreRejected();
  TestNonMappingTopLevelIsRejected();
  TestMissingFileIsReported();

  std::cout << "localdeck_unit_config_loader: pass\n";
  return 0;
}
