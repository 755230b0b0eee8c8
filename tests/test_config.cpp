/**
 * @file test_config.cpp
 * @brief Tests for config.hpp and DispatcherOptions::FromConfig.
 */

#include "flux/config.hpp"
#include "flux/dispatcher.hpp"

#include <catch2/catch_test_macros.hpp>

#include <cstdio>
#include <cstring>
#include <string>

namespace {

bool WriteTempFile(const char* path, const char* content) {
  FILE* f = std::fopen(path, "w");
  if (f == nullptr) return false;
  std::fputs(content, f);
  std::fclose(f);
  return true;
}

}  // namespace

// ============================================================================
// INI Backend Tests
// ============================================================================

#ifdef FLUX_CONFIG_INI_ENABLED

TEST_CASE("INI LoadBuffer dispatcher section", "[config][ini]") {
  const char* ini_data =
      "[dispatcher]\n"
      "name = store\n"
      "max_queue_depth = 16\n"
      "log_level = warn\n";

  flux::IniConfig cfg;
  auto result = cfg.LoadBuffer(ini_data,
                               static_cast<uint32_t>(std::strlen(ini_data)),
                               flux::ConfigFormat::kIni);
  REQUIRE(result.has_value());
  REQUIRE(std::strcmp(cfg.GetString("dispatcher", "name"), "store") == 0);
  REQUIRE(cfg.GetUint("dispatcher", "max_queue_depth") == 16U);

  auto opts = flux::DispatcherOptions::FromConfig(cfg);
  REQUIRE(opts.name == "store");
  REQUIRE(opts.max_queue_depth == 16U);
  REQUIRE(opts.log_level.has_value());
  REQUIRE(opts.log_level.value() == flux::log::Level::kWarn);
}

#endif  // FLUX_CONFIG_INI_ENABLED

// ============================================================================
// JSON Backend Tests
// ============================================================================

#ifdef FLUX_CONFIG_JSON_ENABLED

TEST_CASE("JSON LoadBuffer flattens sections", "[config][json]") {
  const char* json_data =
      R"({"dispatcher": {"name": "actions", "max_queue_depth": 8,)"
      R"( "trace": true}, "version": 3})";

  flux::JsonConfig cfg;
  auto result = cfg.LoadBuffer(json_data,
                               static_cast<uint32_t>(std::strlen(json_data)),
                               flux::ConfigFormat::kJson);
  REQUIRE(result.has_value());

  REQUIRE(cfg.HasSection("dispatcher"));
  REQUIRE(cfg.HasSection("DISPATCHER"));
  REQUIRE(!cfg.HasSection("missing"));
  REQUIRE(std::strcmp(cfg.GetString("dispatcher", "name"), "actions") == 0);
  REQUIRE(cfg.GetInt("dispatcher", "max_queue_depth") == 8);
  REQUIRE(cfg.GetBool("dispatcher", "trace"));
  REQUIRE(cfg.GetInt("", "version") == 3);
  REQUIRE(cfg.EntryCount() == 4U);
}

TEST_CASE("JSON getters fall back to defaults", "[config][json]") {
  flux::JsonConfig cfg;
  REQUIRE(std::strcmp(cfg.GetString("x", "y", "dflt"), "dflt") == 0);
  REQUIRE(cfg.GetInt("x", "y", 42) == 42);
  REQUIRE(cfg.GetUint("x", "y", 7U) == 7U);
  REQUIRE(cfg.GetBool("x", "y", true));
  REQUIRE(!cfg.FindInt("x", "y").has_value());
}

TEST_CASE("JSON GetUint clamps negatives", "[config][json]") {
  const char* json_data = R"({"dispatcher": {"max_queue_depth": -5}})";
  flux::JsonConfig cfg;
  REQUIRE(cfg.LoadBuffer(json_data,
                         static_cast<uint32_t>(std::strlen(json_data)),
                         flux::ConfigFormat::kJson)
              .has_value());
  REQUIRE(cfg.GetUint("dispatcher", "max_queue_depth", 9U) == 0U);
}

TEST_CASE("JSON malformed input is a parse error", "[config][json]") {
  const char* json_data = "{\"dispatcher\": ";
  flux::JsonConfig cfg;
  auto result = cfg.LoadBuffer(json_data,
                               static_cast<uint32_t>(std::strlen(json_data)),
                               flux::ConfigFormat::kJson);
  REQUIRE(!result.has_value());
  REQUIRE(result.get_error() == flux::ConfigError::kParseError);
}

TEST_CASE("JSON unrouted format is not supported", "[config][json]") {
  const char* data = "dispatcher:\n  name: x\n";
  flux::JsonConfig cfg;
  auto result = cfg.LoadBuffer(data, static_cast<uint32_t>(std::strlen(data)),
                               flux::ConfigFormat::kYaml);
  REQUIRE(!result.has_value());
  REQUIRE(result.get_error() == flux::ConfigError::kFormatNotSupported);
}

TEST_CASE("JSON LoadFile", "[config][json]") {
  const char* path = "/tmp/flux_test_config.json";
  REQUIRE(WriteTempFile(path,
                        "{\"dispatcher\": {\"log_level\": \"ERROR\"}}\n"));

  flux::JsonConfig cfg;
  auto result = cfg.LoadFile(path);
  std::remove(path);
  REQUIRE(result.has_value());
  REQUIRE(std::strcmp(cfg.GetString("dispatcher", "log_level"), "ERROR") == 0);
}

TEST_CASE("JSON LoadFile missing file", "[config][json]") {
  flux::JsonConfig cfg;
  auto result = cfg.LoadFile("/nonexistent/flux_missing.json");
  REQUIRE(!result.has_value());
  REQUIRE(result.get_error() == flux::ConfigError::kFileNotFound);
}

TEST_CASE("JSON LoadFile larger than the buffer", "[config][json]") {
  const char* path = "/tmp/flux_test_config_big.json";
  std::string body = "{\"pad\": \"";
  body.append(FLUX_CONFIG_MAX_FILE_SIZE, 'x');
  body += "\"}\n";
  REQUIRE(WriteTempFile(path, body.c_str()));

  flux::JsonConfig cfg;
  auto result = cfg.LoadFile(path);
  std::remove(path);
  REQUIRE(!result.has_value());
  REQUIRE(result.get_error() == flux::ConfigError::kBufferFull);
}

TEST_CASE("DispatcherOptions FromConfig", "[config][json][dispatcher]") {
  const char* json_data =
      R"({"bus": {"name": "ui", "max_queue_depth": 2, "log_level": "error"}})";
  flux::JsonConfig cfg;
  REQUIRE(cfg.LoadBuffer(json_data,
                         static_cast<uint32_t>(std::strlen(json_data)),
                         flux::ConfigFormat::kJson)
              .has_value());

  auto opts = flux::DispatcherOptions::FromConfig(cfg, "bus");
  REQUIRE(opts.name == "ui");
  REQUIRE(opts.max_queue_depth == 2U);
  REQUIRE(opts.log_level.has_value());
  REQUIRE(opts.log_level.value() == flux::log::Level::kError);

  auto dflt = flux::DispatcherOptions::FromConfig(cfg, "absent");
  REQUIRE(dflt.name == "dispatcher");
  REQUIRE(dflt.max_queue_depth == FLUX_DISPATCH_MAX_QUEUE_DEPTH);
  REQUIRE(!dflt.log_level.has_value());
}

TEST_CASE("Dispatcher built from config applies options", "[config][json][dispatcher]") {
  const char* json_data =
      R"({"dispatcher": {"name": "cfg", "log_level": "warn"}})";
  flux::JsonConfig cfg;
  REQUIRE(cfg.LoadBuffer(json_data,
                         static_cast<uint32_t>(std::strlen(json_data)),
                         flux::ConfigFormat::kJson)
              .has_value());

  const flux::log::Level saved = flux::log::GetLevel();
  {
    flux::Dispatcher<int> dispatcher(flux::DispatcherOptions::FromConfig(cfg));
    REQUIRE(std::strcmp(dispatcher.Name(), "cfg") == 0);
    REQUIRE(flux::log::GetLevel() == flux::log::Level::kWarn);
  }
  flux::log::SetLevel(saved);
}

#endif  // FLUX_CONFIG_JSON_ENABLED

// ============================================================================
// YAML Backend Tests
// ============================================================================

#ifdef FLUX_CONFIG_YAML_ENABLED

TEST_CASE("YAML LoadBuffer dispatcher section", "[config][yaml]") {
  const char* yaml_data =
      "dispatcher:\n"
      "  name: flows\n"
      "  max_queue_depth: 32\n"
      "  log_level: debug\n";

  flux::YamlConfig cfg;
  auto result = cfg.LoadBuffer(yaml_data,
                               static_cast<uint32_t>(std::strlen(yaml_data)),
                               flux::ConfigFormat::kYaml);
  REQUIRE(result.has_value());

  auto opts = flux::DispatcherOptions::FromConfig(cfg);
  REQUIRE(opts.name == "flows");
  REQUIRE(opts.max_queue_depth == 32U);
  REQUIRE(opts.log_level.value() == flux::log::Level::kDebug);
}

#endif  // FLUX_CONFIG_YAML_ENABLED

// ============================================================================
// Backend-independent
// ============================================================================

#ifndef FLUX_CONFIG_INI_ENABLED

TEST_CASE("Compiled-out backend reports not supported", "[config]") {
  const char* ini_data = "[dispatcher]\nname = x\n";
  flux::Config<flux::IniBackend> cfg;
  auto result = cfg.LoadBuffer(ini_data,
                               static_cast<uint32_t>(std::strlen(ini_data)),
                               flux::ConfigFormat::kIni);
  REQUIRE(!result.has_value());
  REQUIRE(result.get_error() == flux::ConfigError::kFormatNotSupported);
  REQUIRE(cfg.EntryCount() == 0U);
}

#endif  // FLUX_CONFIG_INI_ENABLED
