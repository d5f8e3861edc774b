#include "internal/config/config_loader.hpp"

#include <cassert>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <stdexcept>
#include <string>

namespace {

std::filesystem::path WriteYaml(const std::string& test_name, const std::string& yaml_content) {
  const auto base_dir = std::filesystem::temp_directory_path() / "cms_admin_config_loader_tests";
  std::filesystem::create_directories(base_dir);

  const auto    file_path = base_dir / (test_name + ".yaml");
  std::ofstream out(file_path);
  out << yaml_content;
  out.close();

  return file_path;
}

bool Rejects(const std::string& test_name, const std::string& yaml_content) {
  const auto yaml_path = WriteYaml(test_name, yaml_content);
  try {
    (void)cms::config::ConfigLoader::LoadFromYaml(yaml_path.string());
  } catch (const std::runtime_error&) {
    return true;
  }
  return false;
}

void TestFullConfigIsLoaded() {
  const auto yaml_path = WriteYaml("full",
                                   R"(server:
  bind_address: "0.0.0.0:8889"
services:
  Evaluation:
    shards:
      - host: "10.0.0.1"
        port: 25000
  Resource:
    shards:
      - host: "10.0.0.1"
        port: 28000
      - host: "10.0.0.2"
        port: 28000
rpc:
  call_timeout_ms: 2500
database:
  sqlite:
    path: "/var/lib/cms/admin.db"
    wal_mode: true
logging:
  level: "debug"
)");

  auto config = cms::config::ConfigLoader::LoadFromYaml(yaml_path.string());
  assert(config.server().bind_address() == "0.0.0.0:8889");
  assert(config.services().at("Resource").shards_size() == 2);
  assert(config.services().at("Resource").shards(1).host() == "10.0.0.2");
  assert(config.services().at("Evaluation").shards(0).port() == 25000);
  assert(config.rpc().call_timeout_ms() == 2500);
  assert(config.database().sqlite().path() == "/var/lib/cms/admin.db");
  assert(config.logging().level() == "debug");
}

void TestDefaultsAreApplied() {
  const auto yaml_path = WriteYaml("defaults",
                                   R"(server:
  bind_address: "127.0.0.1:0"
)");

  auto config = cms::config::ConfigLoader::LoadFromYaml(yaml_path.string());
  assert(config.rpc().call_timeout_ms() == cms::config::ConfigLoader::kDefaultCallTimeoutMs);
  assert(config.services().empty());
  assert(!config.database().has_sqlite());
}

void TestQuotedScalarsStayStrings() {
  const auto yaml_path = WriteYaml("quoted",
                                   R"(server:
  bind_address: "line1\nline2☃"
database:
  sqlite:
    path: "C:\\cms\\\"quoted\"\\db.sqlite"
    wal_mode: false
)");

  auto config = cms::config::ConfigLoader::LoadFromYaml(yaml_path.string());
  assert(config.server().bind_address() == std::string("line1\nline2☃"));
  assert(config.database().sqlite().path() == "C:\\cms\\\"quoted\"\\db.sqlite");

  const auto numeric_path = WriteYaml("quoted_numeric", R"(server:
  bind_address: "8890"
)");
  assert(cms::config::ConfigLoader::LoadFromYaml(numeric_path.string()).server().bind_address() == "8890");
}

void TestEmptyFileUsesDefaults() {
  const auto yaml_path = WriteYaml("empty", "");

  auto config = cms::config::ConfigLoader::LoadFromYaml(yaml_path.string());
  assert(config.server().bind_address() == cms::config::ConfigLoader::kDefaultBindAddress);
  assert(config.rpc().call_timeout_ms() == cms::config::ConfigLoader::kDefaultCallTimeoutMs);
}

void TestInvalidConfigsAreRejected() {
  assert(Rejects("unknown_field", R"(server:
  bind_address: "0.0.0.0:8889"
unknown_field: 123
)") && "ConfigLoader must reject unknown fields.");

  assert(Rejects("no_shards", R"(services:
  Log:
    shards: []
)") && "a service without shards is unusable");

  assert(Rejects("bad_port", R"(services:
  Log:
    shards:
      - host: "10.0.0.1"
        port: 0
)"));

  assert(Rejects("missing_host", R"(services:
  Log:
    shards:
      - port: 29000
)"));

  assert(Rejects("sqlite_without_path", R"(database:
  sqlite:
    wal_mode: true
)"));

  assert(Rejects("top_level_list", R"(- server
- rpc
)"));

  bool threw = false;
  try {
    (void)cms::config::ConfigLoader::LoadFromYaml("/nonexistent/cms-admin.yaml");
  } catch (const std::runtime_error&) {
    threw = true;
  }
  assert(threw);
}

} // namespace

int main() {
  TestFullConfigIsLoaded();
  TestDefaultsAreApplied();
  TestQuotedScalarsStayStrings();
  TestEmptyFileUsesDefaults();
  TestInvalidConfigsAreRejected();

  std::cout << "cms_admin_unit_config_loader: pass\n";
  return 0;
}
