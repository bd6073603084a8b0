/**
 * @file test_config.cpp
 * @brief Tests for config.hpp - template-based multi-format config parser.
 */

#include "mwd/config.hpp"
#include "mwd/service_registry.hpp"

#include <catch2/catch_test_macros.hpp>

#include <cstdio>
#include <string>

// ============================================================================
// INI Backend Tests
// ============================================================================

#ifdef MWD_CONFIG_INI_ENABLED

using IniCfg = mwd::Config<mwd::IniBackend>;

TEST_CASE("INI LoadBuffer basic", "[config][ini]") {
  const std::string ini_data =
      "[core]\n"
      "stages = pre, core, post\n"
      "system_category = system\n"
      "[dispatcher]\n"
      "shards = 4\n";

  IniCfg cfg;
  auto result = cfg.LoadBuffer(ini_data, mwd::ConfigFormat::kIni);
  REQUIRE(result.has_value());

  REQUIRE(cfg.GetInt("dispatcher", "shards", 0) == 4);
  REQUIRE(cfg.GetString("core", "system_category") == "system");
  REQUIRE(cfg.GetString("core", "stages") == "pre, core, post");
}

TEST_CASE("INI GetString and GetInt defaults", "[config][ini]") {
  IniCfg cfg;
  REQUIRE(cfg.GetString("x", "y", "default") == "default");
  REQUIRE(cfg.GetInt("x", "y", 42) == 42);
  REQUIRE(cfg.GetDouble("x", "y", 1.5) == 1.5);
}

TEST_CASE("INI GetBool", "[config][ini]") {
  const std::string ini_data =
      "[flags]\n"
      "debug = true\n"
      "verbose = 1\n"
      "quiet = false\n"
      "enabled = yes\n"
      "active = on\n";

  IniCfg cfg;
  REQUIRE(cfg.LoadBuffer(ini_data, mwd::ConfigFormat::kIni).has_value());

  REQUIRE(cfg.GetBool("flags", "debug") == true);
  REQUIRE(cfg.GetBool("flags", "verbose") == true);
  REQUIRE(cfg.GetBool("flags", "quiet") == false);
  REQUIRE(cfg.GetBool("flags", "enabled") == true);
  REQUIRE(cfg.GetBool("flags", "active") == true);
  REQUIRE(cfg.GetBool("flags", "missing", true) == true);
}

TEST_CASE("INI GetList trims and drops empties", "[config][ini]") {
  const std::string ini_data = "[core]\nstages = pre , core,, post ,\n";
  IniCfg cfg;
  REQUIRE(cfg.LoadBuffer(ini_data, mwd::ConfigFormat::kIni).has_value());

  auto stages = cfg.GetList("core", "stages");
  REQUIRE(stages.size() == 3U);
  REQUIRE(stages[0] == "pre");
  REQUIRE(stages[1] == "core");
  REQUIRE(stages[2] == "post");
  REQUIRE(cfg.GetList("core", "missing").empty());
}

TEST_CASE("INI HasSection, HasKey and FindInt", "[config][ini]") {
  const std::string ini_data = "[retry]\nbase_ms = 100\nname = abc\n";
  IniCfg cfg;
  REQUIRE(cfg.LoadBuffer(ini_data, mwd::ConfigFormat::kIni).has_value());

  REQUIRE(cfg.HasSection("retry"));
  REQUIRE(!cfg.HasSection("missing"));
  REQUIRE(cfg.HasKey("retry", "base_ms"));
  REQUIRE(!cfg.HasKey("retry", "missing"));

  auto found = cfg.FindInt("retry", "base_ms");
  REQUIRE(found.has_value());
  REQUIRE(found.value() == 100);
  REQUIRE(!cfg.FindInt("retry", "name").has_value());
  REQUIRE(!cfg.FindInt("retry", "nope").has_value());
  REQUIRE(cfg.FindString("retry", "name").value() == "abc");
}

TEST_CASE("INI Sections and SectionEntries keep order", "[config][ini]") {
  const std::string ini_data =
      "[categories]\n"
      "static = strings, pe\n"
      "all = static, dynamic\n"
      "[core]\n"
      "log_level = debug\n";
  IniCfg cfg;
  REQUIRE(cfg.LoadBuffer(ini_data, mwd::ConfigFormat::kIni).has_value());

  auto sections = cfg.Sections();
  REQUIRE(sections.size() == 2U);
  REQUIRE(sections[0] == "categories");
  REQUIRE(sections[1] == "core");

  auto entries = cfg.SectionEntries("categories");
  REQUIRE(entries.size() == 2U);
  REQUIRE(entries[0].first == "static");
  REQUIRE(entries[1].second == "static, dynamic");
  REQUIRE(cfg.EntryCount() == 3U);
}

TEST_CASE("INI override on reload and Set", "[config][ini]") {
  IniCfg cfg;
  REQUIRE(cfg.LoadBuffer("[s]\nk = v1\n", mwd::ConfigFormat::kIni).has_value());
  REQUIRE(cfg.LoadBuffer("[s]\nk = v2\n", mwd::ConfigFormat::kIni).has_value());
  REQUIRE(cfg.GetString("s", "k") == "v2");

  cfg.Set("s", "k", "v3");
  REQUIRE(cfg.GetString("s", "k") == "v3");
  REQUIRE(cfg.EntryCount() == 1U);
}

TEST_CASE("INI case insensitive keys", "[config][ini]") {
  IniCfg cfg;
  REQUIRE(cfg.LoadBuffer("[Dispatcher]\nShards = 3\n", mwd::ConfigFormat::kIni)
              .has_value());
  REQUIRE(cfg.GetInt("dispatcher", "shards", 0) == 3);
  REQUIRE(cfg.GetInt("DISPATCHER", "SHARDS", 0) == 3);
}

TEST_CASE("INI LoadFile nonexistent", "[config][ini]") {
  IniCfg cfg;
  auto result = cfg.LoadFile("/tmp/__mwd_nonexistent__.ini");
  REQUIRE(!result.has_value());
  REQUIRE(result.get_error() == mwd::ConfigError::kFileNotFound);
}

TEST_CASE("INI format not supported returns error", "[config][ini]") {
  IniCfg cfg;
  auto result = cfg.LoadBuffer("{}", mwd::ConfigFormat::kJson);
  REQUIRE(!result.has_value());
  REQUIRE(result.get_error() == mwd::ConfigError::kFormatNotSupported);
}

TEST_CASE("INI LoadFile from disk", "[config][ini]") {
  const char* path = "/tmp/__mwd_test_config__.ini";
  FILE* f = std::fopen(path, "w");
  REQUIRE(f != nullptr);
  std::fprintf(f, "[expiry]\ndelay_hours = 12\nbatch_delete = true\n");
  std::fclose(f);

  IniCfg cfg;
  auto result = cfg.LoadFile(path);
  REQUIRE(result.has_value());
  REQUIRE(cfg.GetInt("expiry", "delay_hours", 0) == 12);
  REQUIRE(cfg.GetBool("expiry", "batch_delete"));

  std::remove(path);
}

TEST_CASE("INI service sections become definitions", "[config][ini]") {
  const std::string ini_data =
      "[service.extract]\n"
      "category = static\n"
      "stage = core\n"
      "accepts = archive/.*\n"
      "rejects = archive/iso\n"
      "failure_limit = 2\n"
      "version = 4.1\n"
      "timeout = 30\n"
      "config = {\"password\": \"infected\", \"depth\": 3}\n"
      "[service.disabled]\n"
      "stage = core\n"
      "accepts = .*\n"
      "enabled = false\n"
      "[service.broken]\n"
      "stage = core\n"
      "config = [1, 2]\n"
      "[core]\n"
      "stages = core\n";

  IniCfg cfg;
  REQUIRE(cfg.LoadBuffer(ini_data, mwd::ConfigFormat::kIni).has_value());

  auto defs = mwd::ServiceDefinitionsFromConfig(cfg);
  REQUIRE(defs.size() == 2U);

  const auto& extract = defs[0];
  REQUIRE(extract.name == "extract");
  REQUIRE(extract.category == "static");
  REQUIRE(extract.stage == "core");
  REQUIRE(extract.accepts == "archive/.*");
  REQUIRE(extract.rejects == "archive/iso");
  REQUIRE(extract.failure_limit == 2);
  REQUIRE(extract.version == "4.1");
  REQUIRE(extract.timeout_s == 30U);
  REQUIRE(extract.enabled);
  REQUIRE(extract.config["password"] == "infected");
  REQUIRE(extract.config["depth"] == 3);

  REQUIRE(defs[1].name == "disabled");
  REQUIRE(!defs[1].enabled);
  REQUIRE(defs[1].config.is_object());
  REQUIRE(defs[1].config.empty());
}

#endif  // MWD_CONFIG_INI_ENABLED

// ============================================================================
// JSON Backend Tests
// ============================================================================

#ifdef MWD_CONFIG_JSON_ENABLED

using JsonCfg = mwd::Config<mwd::JsonBackend>;

TEST_CASE("JSON LoadBuffer basic", "[config][json]") {
  const std::string json_data = R"({
    "dispatcher": {"shards": 3, "poll_timeout_ms": 50},
    "core": {"stages": ["pre", "core"], "log_level": "warn"}
  })";

  JsonCfg cfg;
  auto result = cfg.LoadBuffer(json_data, mwd::ConfigFormat::kJson);
  REQUIRE(result.has_value());

  REQUIRE(cfg.GetInt("dispatcher", "shards", 0) == 3);
  REQUIRE(cfg.GetString("core", "log_level") == "warn");
  auto stages = cfg.GetList("core", "stages");
  REQUIRE(stages.size() == 2U);
  REQUIRE(stages[1] == "core");
}

TEST_CASE("JSON flat keys (no section)", "[config][json]") {
  JsonCfg cfg;
  REQUIRE(cfg.LoadBuffer(R"({"name": "test", "count": 42})",
                         mwd::ConfigFormat::kJson)
              .has_value());
  REQUIRE(cfg.GetString("", "name") == "test");
  REQUIRE(cfg.GetInt("", "count", 0) == 42);
}

TEST_CASE("JSON boolean and numeric values", "[config][json]") {
  const std::string json_data = R"({
    "expiry": {"batch_delete": true, "delete_storage": false},
    "math": {"pi": 3.14159, "negative": -10}
  })";

  JsonCfg cfg;
  REQUIRE(cfg.LoadBuffer(json_data, mwd::ConfigFormat::kJson).has_value());
  REQUIRE(cfg.GetBool("expiry", "batch_delete") == true);
  REQUIRE(cfg.GetBool("expiry", "delete_storage", true) == false);
  REQUIRE(cfg.GetDouble("math", "pi") > 3.14);
  REQUIRE(cfg.GetDouble("math", "pi") < 3.15);
  REQUIRE(cfg.GetInt("math", "negative", 0) == -10);
}

TEST_CASE("JSON nested service config stays JSON", "[config][json]") {
  const std::string json_data = R"({
    "service.extract": {
      "stage": "core",
      "accepts": ".*",
      "config": {"password": "infected", "nested": {"a": 1}}
    }
  })";

  JsonCfg cfg;
  REQUIRE(cfg.LoadBuffer(json_data, mwd::ConfigFormat::kJson).has_value());
  auto defs = mwd::ServiceDefinitionsFromConfig(cfg);
  REQUIRE(defs.size() == 1U);
  REQUIRE(defs[0].config["nested"]["a"] == 1);
  REQUIRE(defs[0].config["password"] == "infected");
}

TEST_CASE("JSON parse error", "[config][json]") {
  JsonCfg cfg;
  auto result = cfg.LoadBuffer("{ invalid json ]", mwd::ConfigFormat::kJson);
  REQUIRE(!result.has_value());
  REQUIRE(result.get_error() == mwd::ConfigError::kParseError);

  auto not_object = cfg.LoadBuffer("[1, 2]", mwd::ConfigFormat::kJson);
  REQUIRE(!not_object.has_value());
  REQUIRE(not_object.get_error() == mwd::ConfigError::kParseError);
}

TEST_CASE("JSON LoadFile from disk", "[config][json]") {
  const char* path = "/tmp/__mwd_test_config__.json";
  FILE* f = std::fopen(path, "w");
  REQUIRE(f != nullptr);
  std::fprintf(f, R"({"archive": {"queue": "arch", "poll_timeout_ms": 20}})");
  std::fclose(f);

  JsonCfg cfg;
  auto result = cfg.LoadFile(path);
  REQUIRE(result.has_value());
  REQUIRE(cfg.GetString("archive", "queue") == "arch");
  REQUIRE(cfg.GetInt("archive", "poll_timeout_ms", 0) == 20);

  std::remove(path);
}

TEST_CASE("JSON LoadFile nonexistent", "[config][json]") {
  JsonCfg cfg;
  auto result = cfg.LoadFile("/tmp/__mwd_nonexistent__.json");
  REQUIRE(!result.has_value());
  REQUIRE(result.get_error() == mwd::ConfigError::kFileNotFound);
}

#endif  // MWD_CONFIG_JSON_ENABLED

// ============================================================================
// YAML Backend Tests
// ============================================================================

#ifdef MWD_CONFIG_YAML_ENABLED

using YamlCfg = mwd::Config<mwd::YamlBackend>;

TEST_CASE("YAML LoadBuffer basic", "[config][yaml]") {
  const std::string yaml_data =
      "dispatcher:\n"
      "  shards: 5\n"
      "core:\n"
      "  stages: [pre, core, post]\n"
      "  system_category: \"system\"\n";

  YamlCfg cfg;
  auto result = cfg.LoadBuffer(yaml_data, mwd::ConfigFormat::kYaml);
  REQUIRE(result.has_value());

  REQUIRE(cfg.GetInt("dispatcher", "shards", 0) == 5);
  REQUIRE(cfg.GetString("core", "system_category") == "system");
  REQUIRE(cfg.GetList("core", "stages").size() == 3U);
}

TEST_CASE("YAML boolean values", "[config][yaml]") {
  const std::string yaml_data =
      "expiry:\n"
      "  batch_delete: true\n"
      "  delete_storage: false\n";

  YamlCfg cfg;
  REQUIRE(cfg.LoadBuffer(yaml_data, mwd::ConfigFormat::kYaml).has_value());
  REQUIRE(cfg.GetBool("expiry", "batch_delete") == true);
  REQUIRE(cfg.GetBool("expiry", "delete_storage", true) == false);
}

TEST_CASE("YAML LoadFile from disk", "[config][yaml]") {
  const char* path = "/tmp/__mwd_test_config__.yaml";
  FILE* f = std::fopen(path, "w");
  REQUIRE(f != nullptr);
  std::fprintf(f, "retry:\n  base_ms: 250\n  max_ms: 1000\n");
  std::fclose(f);

  YamlCfg cfg;
  auto result = cfg.LoadFile(path);
  REQUIRE(result.has_value());
  REQUIRE(cfg.GetInt("retry", "base_ms", 0) == 250);
  REQUIRE(cfg.GetInt("retry", "max_ms", 0) == 1000);

  std::remove(path);
}

TEST_CASE("YAML auto-detect extension yml", "[config][yaml]") {
  YamlCfg cfg;
  auto result = cfg.LoadFile("/tmp/__mwd_nonexistent__.yml");
  REQUIRE(!result.has_value());
  REQUIRE(result.get_error() == mwd::ConfigError::kFileNotFound);
}

#endif  // MWD_CONFIG_YAML_ENABLED

// ============================================================================
// MultiConfig / backend tags
// ============================================================================

#if defined(MWD_CONFIG_INI_ENABLED) || defined(MWD_CONFIG_JSON_ENABLED) || \
    defined(MWD_CONFIG_YAML_ENABLED)
TEST_CASE("MultiConfig instantiation", "[config]") {
  mwd::MultiConfig cfg;
  REQUIRE(cfg.EntryCount() == 0U);
  REQUIRE(cfg.GetBool("x", "y") == false);
  REQUIRE(cfg.GetBool("x", "y", true) == true);
}
#endif

#if defined(MWD_CONFIG_INI_ENABLED) && defined(MWD_CONFIG_JSON_ENABLED)
TEST_CASE("MultiConfig dispatches INI and JSON", "[config][multi]") {
  mwd::MultiConfig cfg;
  REQUIRE(cfg.LoadBuffer("[sec]\nkey1 = val1\n", mwd::ConfigFormat::kIni)
              .has_value());
  REQUIRE(cfg.LoadBuffer(R"({"sec": {"key2": "val2"}})", mwd::ConfigFormat::kJson)
              .has_value());
  REQUIRE(cfg.GetString("sec", "key1") == "val1");
  REQUIRE(cfg.GetString("sec", "key2") == "val2");
}
#endif

TEST_CASE("Backend MatchesExtension", "[config][tag]") {
  REQUIRE(mwd::IniBackend::MatchesExtension("ini"));
  REQUIRE(mwd::IniBackend::MatchesExtension("CFG"));
  REQUIRE(!mwd::IniBackend::MatchesExtension("json"));
  REQUIRE(mwd::JsonBackend::MatchesExtension("json"));
  REQUIRE(!mwd::JsonBackend::MatchesExtension("yaml"));
  REQUIRE(mwd::YamlBackend::MatchesExtension("yml"));
  REQUIRE(mwd::YamlBackend::MatchesExtension("YAML"));
  REQUIRE(!mwd::YamlBackend::MatchesExtension("ini"));

  REQUIRE(mwd::IniBackend::kFormat == mwd::ConfigFormat::kIni);
  REQUIRE(mwd::JsonBackend::kFormat == mwd::ConfigFormat::kJson);
  REQUIRE(mwd::YamlBackend::kFormat == mwd::ConfigFormat::kYaml);
}
