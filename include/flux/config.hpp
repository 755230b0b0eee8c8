/**
 * @file config.hpp
 * @brief Flat section/key/value configuration with pluggable file formats.
 *
 * Every supported format is flattened to "section + key = value":
 *
 *   INI   [dispatcher]\nmax_queue_depth = 64
 *   JSON  {"dispatcher": {"max_queue_depth": 64}}
 *   YAML  dispatcher:\n  max_queue_depth: 64
 *
 * Backends are opt-in at build time:
 *   - IniBackend  : inih          (FLUX_CONFIG_INI_ENABLED)
 *   - JsonBackend : nlohmann/json (FLUX_CONFIG_JSON_ENABLED)
 *   - YamlBackend : fkYAML        (FLUX_CONFIG_YAML_ENABLED)
 *
 * Config<Backends...> picks the parser for a file from its extension (or an
 * explicit ConfigFormat) with compile-time recursion over the backend list.
 * Compatible with -fno-exceptions -fno-rtti.
 */

#ifndef FLUX_CONFIG_HPP_
#define FLUX_CONFIG_HPP_

#include "flux/platform.hpp"
#include "flux/vocabulary.hpp"

#include <cstdint>
#include <cstdio>
#include <cstdlib>
#include <cstring>
#include <string>
#include <tuple>

#ifdef FLUX_CONFIG_INI_ENABLED
#include <ini.h>
#endif

#ifdef FLUX_CONFIG_JSON_ENABLED
#include <nlohmann/json.hpp>
#endif

#ifdef FLUX_CONFIG_YAML_ENABLED
#include <fkYAML/node.hpp>
#endif

#ifndef FLUX_CONFIG_MAX_FILE_SIZE
#define FLUX_CONFIG_MAX_FILE_SIZE 8192U
#endif

namespace flux {

enum class ConfigFormat : uint8_t {
  kAuto = 0,
  kIni,
  kJson,
  kYaml,
};

namespace detail {

inline bool AsciiCaseEqual(const char* a, const char* b) noexcept {
  while (*a != '\0' && *b != '\0') {
    char la = (*a >= 'A' && *a <= 'Z') ? static_cast<char>(*a + 32) : *a;
    char lb = (*b >= 'A' && *b <= 'Z') ? static_cast<char>(*b + 32) : *b;
    if (la != lb) return false;
    ++a;
    ++b;
  }
  return *a == *b;
}

inline void CopyBounded(char* dst, const char* src, uint32_t dst_size) noexcept {
  if (src == nullptr) {
    dst[0] = '\0';
    return;
  }
  uint32_t i = 0;
  while (i < (dst_size - 1U) && src[i] != '\0') {
    dst[i] = src[i];
    ++i;
  }
  dst[i] = '\0';
}

}  // namespace detail

// ============================================================================
// Backend Tags
// ============================================================================

struct IniBackend {
  static constexpr ConfigFormat kFormat = ConfigFormat::kIni;
  static bool MatchesExtension(const char* ext) noexcept {
    return detail::AsciiCaseEqual(ext, "ini") ||
           detail::AsciiCaseEqual(ext, "conf");
  }
};

struct JsonBackend {
  static constexpr ConfigFormat kFormat = ConfigFormat::kJson;
  static bool MatchesExtension(const char* ext) noexcept {
    return detail::AsciiCaseEqual(ext, "json");
  }
};

struct YamlBackend {
  static constexpr ConfigFormat kFormat = ConfigFormat::kYaml;
  static bool MatchesExtension(const char* ext) noexcept {
    return detail::AsciiCaseEqual(ext, "yaml") ||
           detail::AsciiCaseEqual(ext, "yml");
  }
};

// ============================================================================
// ConfigStore
// ============================================================================

/**
 * @brief Fixed-capacity flat store of section/key/value strings.
 *
 * Section and key lookups are ASCII case-insensitive.  The empty section
 * holds top-level keys.  Re-adding an existing key overwrites its value.
 */
class ConfigStore {
 public:
  static constexpr uint32_t kMaxEntries = 64;
  static constexpr uint32_t kMaxKeyLen = 48;
  static constexpr uint32_t kMaxValueLen = 128;

  const char* GetString(const char* section, const char* key,
                        const char* default_val = "") const {
    const Entry* e = FindEntry(section, key);
    return (e != nullptr) ? e->value : default_val;
  }

  int32_t GetInt(const char* section, const char* key,
                 int32_t default_val = 0) const {
    optional<int32_t> v = FindInt(section, key);
    return v.value_or(default_val);
  }

  /** @brief Non-negative integer; negative values clamp to 0. */
  uint32_t GetUint(const char* section, const char* key,
                   uint32_t default_val = 0) const {
    const Entry* e = FindEntry(section, key);
    if (e == nullptr) return default_val;
    char* end = nullptr;
    long long val = std::strtoll(e->value, &end, 10);
    if (end == e->value) return default_val;
    if (val < 0) return 0U;
    if (val > static_cast<long long>(UINT32_MAX)) return UINT32_MAX;
    return static_cast<uint32_t>(val);
  }

  bool GetBool(const char* section, const char* key,
               bool default_val = false) const {
    const Entry* e = FindEntry(section, key);
    return (e != nullptr) ? ParseBool(e->value) : default_val;
  }

  optional<int32_t> FindInt(const char* section, const char* key) const {
    const Entry* e = FindEntry(section, key);
    if (e == nullptr) return {};
    char* end = nullptr;
    long val = std::strtol(e->value, &end, 10);
    return (end == e->value) ? optional<int32_t>{}
                             : optional<int32_t>{static_cast<int32_t>(val)};
  }

  bool HasSection(const char* section) const {
    FLUX_ASSERT(section != nullptr);
    for (uint32_t i = 0; i < count_; ++i) {
      if (detail::AsciiCaseEqual(entries_[i].section, section)) return true;
    }
    return false;
  }

  bool HasKey(const char* section, const char* key) const {
    return FindEntry(section, key) != nullptr;
  }

  uint32_t EntryCount() const noexcept { return count_; }

 protected:
  struct Entry {
    char section[kMaxKeyLen];
    char key[kMaxKeyLen];
    char value[kMaxValueLen];
  };

  Entry entries_[kMaxEntries];
  uint32_t count_ = 0;

  bool AddEntry(const char* section, const char* key, const char* value) {
    for (uint32_t i = 0; i < count_; ++i) {
      if (detail::AsciiCaseEqual(entries_[i].section, section) &&
          detail::AsciiCaseEqual(entries_[i].key, key)) {
        detail::CopyBounded(entries_[i].value, value, kMaxValueLen);
        return true;
      }
    }
    if (count_ >= kMaxEntries) return false;
    Entry& e = entries_[count_];
    detail::CopyBounded(e.section, section, kMaxKeyLen);
    detail::CopyBounded(e.key, key, kMaxKeyLen);
    detail::CopyBounded(e.value, value, kMaxValueLen);
    ++count_;
    return true;
  }

  const Entry* FindEntry(const char* section, const char* key) const {
    FLUX_ASSERT(section != nullptr && key != nullptr);
    for (uint32_t i = 0; i < count_; ++i) {
      if (detail::AsciiCaseEqual(entries_[i].section, section) &&
          detail::AsciiCaseEqual(entries_[i].key, key)) {
        return &entries_[i];
      }
    }
    return nullptr;
  }

  static expected<uint32_t, ConfigError> ReadFile(const char* path, char* buf,
                                                  uint32_t buf_size) {
    FILE* f = std::fopen(path, "r");
    if (f == nullptr) {
      return expected<uint32_t, ConfigError>::error(ConfigError::kFileNotFound);
    }
    FLUX_SCOPE_EXIT((void)std::fclose(f));
    size_t bytes = std::fread(buf, 1, buf_size - 1U, f);
    bool truncated = (bytes == buf_size - 1U) && (std::fgetc(f) != EOF);
    if (truncated) {
      return expected<uint32_t, ConfigError>::error(ConfigError::kBufferFull);
    }
    buf[bytes] = '\0';
    return expected<uint32_t, ConfigError>::success(
        static_cast<uint32_t>(bytes));
  }

  static bool ParseBool(const char* str) noexcept {
    if (str == nullptr) return false;
    return detail::AsciiCaseEqual(str, "true") ||
           detail::AsciiCaseEqual(str, "1") ||
           detail::AsciiCaseEqual(str, "yes") ||
           detail::AsciiCaseEqual(str, "on");
  }

  static const char* Extension(const char* path) noexcept {
    const char* dot = std::strrchr(path, '.');
    const char* slash = std::strrchr(path, '/');
    if (dot == nullptr || (slash != nullptr && dot < slash)) return nullptr;
    return dot + 1;
  }

  template <typename>
  friend struct ConfigParser;
};

// ============================================================================
// ConfigParser<Backend>
// ============================================================================

/** Primary template: backend compiled out. */
template <typename Backend>
struct ConfigParser {
  static expected<void, ConfigError> ParseFile(ConfigStore&, const char*) {
    return expected<void, ConfigError>::error(ConfigError::kFormatNotSupported);
  }
  static expected<void, ConfigError> ParseBuffer(ConfigStore&, const char*,
                                                 uint32_t) {
    return expected<void, ConfigError>::error(ConfigError::kFormatNotSupported);
  }
};

#ifdef FLUX_CONFIG_INI_ENABLED
template <>
struct ConfigParser<IniBackend> {
  static expected<void, ConfigError> ParseFile(ConfigStore& store,
                                               const char* path) {
    int rc = ini_parse(path, OnEntry, &store);
    if (rc == -1) {
      return expected<void, ConfigError>::error(ConfigError::kFileNotFound);
    }
    if (rc != 0) {
      return expected<void, ConfigError>::error(ConfigError::kParseError);
    }
    return expected<void, ConfigError>::success();
  }

  static expected<void, ConfigError> ParseBuffer(ConfigStore& store,
                                                 const char* data, uint32_t) {
    if (ini_parse_string(data, OnEntry, &store) != 0) {
      return expected<void, ConfigError>::error(ConfigError::kParseError);
    }
    return expected<void, ConfigError>::success();
  }

 private:
  static int OnEntry(void* user, const char* section, const char* name,
                     const char* value) {
    auto* store = static_cast<ConfigStore*>(user);
    return store->AddEntry(section ? section : "", name ? name : "",
                           value ? value : "")
               ? 1
               : 0;
  }
};
#endif

#ifdef FLUX_CONFIG_JSON_ENABLED
template <>
struct ConfigParser<JsonBackend> {
  static expected<void, ConfigError> ParseFile(ConfigStore& store,
                                               const char* path) {
    char buf[FLUX_CONFIG_MAX_FILE_SIZE];
    return and_then(ConfigStore::ReadFile(path, buf, sizeof(buf)),
                    [&store, &buf](uint32_t size) {
                      return ParseBuffer(store, buf, size);
                    });
  }

  static expected<void, ConfigError> ParseBuffer(ConfigStore& store,
                                                 const char* data,
                                                 uint32_t size) {
    auto root = nlohmann::json::parse(data, data + size, nullptr, false);
    if (root.is_discarded() || !root.is_object()) {
      return expected<void, ConfigError>::error(ConfigError::kParseError);
    }

    for (auto it = root.begin(); it != root.end(); ++it) {
      if (it->is_object()) {
        for (auto kit = it->begin(); kit != it->end(); ++kit) {
          if (!Add(store, it.key().c_str(), kit.key().c_str(), *kit)) {
            return expected<void, ConfigError>::error(ConfigError::kBufferFull);
          }
        }
      } else if (!Add(store, "", it.key().c_str(), *it)) {
        return expected<void, ConfigError>::error(ConfigError::kBufferFull);
      }
    }
    return expected<void, ConfigError>::success();
  }

 private:
  static bool Add(ConfigStore& store, const char* section, const char* key,
                  const nlohmann::json& node) {
    char val[ConfigStore::kMaxValueLen];
    if (node.is_string()) {
      detail::CopyBounded(val, node.get_ref<const std::string&>().c_str(),
                          sizeof(val));
    } else if (node.is_boolean()) {
      detail::CopyBounded(val, node.get<bool>() ? "true" : "false",
                          sizeof(val));
    } else if (node.is_number_integer()) {
      (void)std::snprintf(val, sizeof(val), "%lld",
                          static_cast<long long>(node.get<int64_t>()));
    } else if (node.is_number_float()) {
      (void)std::snprintf(val, sizeof(val), "%g", node.get<double>());
    } else {
      detail::CopyBounded(val, node.dump().c_str(), sizeof(val));
    }
    return store.AddEntry(section, key, val);
  }
};
#endif

#ifdef FLUX_CONFIG_YAML_ENABLED
template <>
struct ConfigParser<YamlBackend> {
  static expected<void, ConfigError> ParseFile(ConfigStore& store,
                                               const char* path) {
    char buf[FLUX_CONFIG_MAX_FILE_SIZE];
    return and_then(ConfigStore::ReadFile(path, buf, sizeof(buf)),
                    [&store, &buf](uint32_t size) {
                      return ParseBuffer(store, buf, size);
                    });
  }

  static expected<void, ConfigError> ParseBuffer(ConfigStore& store,
                                                 const char* data,
                                                 uint32_t size) {
    auto root = fkyaml::node::deserialize(std::string(data, size));
    if (root.is_null() || !root.is_mapping()) {
      return expected<void, ConfigError>::error(ConfigError::kParseError);
    }

    for (auto it = root.begin(); it != root.end(); ++it) {
      auto name = it.key().get_value<std::string>();
      auto& node = *it;
      if (node.is_mapping()) {
        for (auto kit = node.begin(); kit != node.end(); ++kit) {
          auto key = kit.key().get_value<std::string>();
          if (!Add(store, name.c_str(), key.c_str(), *kit)) {
            return expected<void, ConfigError>::error(ConfigError::kBufferFull);
          }
        }
      } else if (!Add(store, "", name.c_str(), node)) {
        return expected<void, ConfigError>::error(ConfigError::kBufferFull);
      }
    }
    return expected<void, ConfigError>::success();
  }

 private:
  static bool Add(ConfigStore& store, const char* section, const char* key,
                  const fkyaml::node& node) {
    char val[ConfigStore::kMaxValueLen];
    if (node.is_string()) {
      detail::CopyBounded(val, node.get_value<std::string>().c_str(),
                          sizeof(val));
    } else if (node.is_boolean()) {
      detail::CopyBounded(val, node.get_value<bool>() ? "true" : "false",
                          sizeof(val));
    } else if (node.is_integer()) {
      (void)std::snprintf(val, sizeof(val), "%lld",
                          static_cast<long long>(node.get_value<int64_t>()));
    } else if (node.is_float_number()) {
      (void)std::snprintf(val, sizeof(val), "%g", node.get_value<double>());
    } else {
      val[0] = '\0';
    }
    return store.AddEntry(section, key, val);
  }
};
#endif

// ============================================================================
// Config<Backends...>
// ============================================================================

template <typename... Backends>
class Config final : public ConfigStore {
  static_assert(sizeof...(Backends) > 0, "Config requires at least one backend");

 public:
  Config() = default;

  expected<void, ConfigError> LoadFile(
      const char* path, ConfigFormat format = ConfigFormat::kAuto) {
    FLUX_ASSERT(path != nullptr);
    if (format == ConfigFormat::kAuto) format = DetectFormat(path);
    return RouteFile<Backends...>(path, format);
  }

  expected<void, ConfigError> LoadBuffer(const char* data, uint32_t size,
                                         ConfigFormat format) {
    FLUX_ASSERT(data != nullptr);
    return RouteBuffer<Backends...>(data, size, format);
  }

 private:
  using Fallback = typename std::tuple_element<0, std::tuple<Backends...>>::type;

  template <typename First, typename... Rest>
  expected<void, ConfigError> RouteFile(const char* path, ConfigFormat format) {
    if (First::kFormat == format) {
      return ConfigParser<First>::ParseFile(*this, path);
    }
    if constexpr (sizeof...(Rest) > 0) {
      return RouteFile<Rest...>(path, format);
    }
    return expected<void, ConfigError>::error(ConfigError::kFormatNotSupported);
  }

  template <typename First, typename... Rest>
  expected<void, ConfigError> RouteBuffer(const char* data, uint32_t size,
                                          ConfigFormat format) {
    if (First::kFormat == format) {
      return ConfigParser<First>::ParseBuffer(*this, data, size);
    }
    if constexpr (sizeof...(Rest) > 0) {
      return RouteBuffer<Rest...>(data, size, format);
    }
    return expected<void, ConfigError>::error(ConfigError::kFormatNotSupported);
  }

  ConfigFormat DetectFormat(const char* path) const noexcept {
    const char* ext = Extension(path);
    if (ext == nullptr) return Fallback::kFormat;
    return MatchExtension<Backends...>(ext);
  }

  template <typename First, typename... Rest>
  ConfigFormat MatchExtension(const char* ext) const noexcept {
    if (First::MatchesExtension(ext)) return First::kFormat;
    if constexpr (sizeof...(Rest) > 0) {
      return MatchExtension<Rest...>(ext);
    }
    return Fallback::kFormat;
  }
};

#ifdef FLUX_CONFIG_INI_ENABLED
using IniConfig = Config<IniBackend>;
#endif
#ifdef FLUX_CONFIG_JSON_ENABLED
using JsonConfig = Config<JsonBackend>;
#endif
#ifdef FLUX_CONFIG_YAML_ENABLED
using YamlConfig = Config<YamlBackend>;
#endif

}  // namespace flux

#endif  // FLUX_CONFIG_HPP_
