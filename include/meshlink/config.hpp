/**
 * MIT License
 *
 * Copyright (c) 2024 liudegui
 *
 * Permission is hereby granted, free of charge, to any person obtaining a copy
 * of this software and associated documentation files (the "Software"), to deal
 * in the Software without restriction, including without limitation the rights
 * to use, copy, modify, merge, publish, distribute, sublicense, and/or sell
 * copies of the Software, and to permit persons to whom the Software is
 * furnished to do so, subject to the following conditions:
 *
 * The above copyright notice and this permission notice shall be included in all
 * copies or substantial portions of the Software.
 *
 * THE SOFTWARE IS PROVIDED "AS IS", WITHOUT WARRANTY OF ANY KIND, EXPRESS OR
 * IMPLIED, INCLUDING BUT NOT LIMITED TO THE WARRANTIES OF MERCHANTABILITY,
 * FITNESS FOR A PARTICULAR PURPOSE AND NONINFRINGEMENT. IN NO EVENT SHALL THE
 * AUTHORS OR COPYRIGHT HOLDERS BE LIABLE FOR ANY CLAIM, DAMAGES OR OTHER
 * LIABILITY, WHETHER IN AN ACTION OF CONTRACT, TORT OR OTHERWISE, ARISING FROM,
 * OUT OF OR IN CONNECTION WITH THE SOFTWARE OR THE USE OR OTHER DEALINGS IN THE
 * SOFTWARE.
 */

/**
 * @file config.hpp
 * @brief Link configuration store with INI / JSON / YAML front ends.
 *
 * Every format is flattened into "section + key = value" text entries:
 *
 *   [serial]              {"serial": {"baud_rate": 115200}}
 *   baud_rate = 115200    serial:
 *                           baud_rate: 115200
 *
 * Nested objects below the first level join their names with '.', so
 * {"link": {"retry": {"delay_ms": 5}}} becomes section "link",
 * key "retry.delay_ms". Top-level scalars land in section "".
 *
 * Backends are compiled in per CMake option:
 *   IniBackend  (inih)          MESHLINK_CONFIG_INI_ENABLED
 *   JsonBackend (nlohmann/json) MESHLINK_CONFIG_JSON_ENABLED
 *   YamlBackend (fkYAML)        MESHLINK_CONFIG_YAML_ENABLED
 *
 * Usage:
 * @code
 *   meshlink::MultiConfig cfg;
 *   auto r = cfg.LoadFile("meshlink.yaml");
 *   uint32_t baud = cfg.GetUint("serial", "baud_rate", 115200U);
 * @endcode
 */

#ifndef MESHLINK_CONFIG_HPP_
#define MESHLINK_CONFIG_HPP_

#include "meshlink/log.hpp"
#include "meshlink/platform.hpp"
#include "meshlink/vocabulary.hpp"

#include <cstdint>
#include <cstdio>
#include <cstdlib>
#include <cstring>

#include <string>
#include <tuple>

#ifdef MESHLINK_CONFIG_INI_ENABLED
#include "ini.h"
#endif

#ifdef MESHLINK_CONFIG_JSON_ENABLED
#include <nlohmann/json.hpp>
#endif

#ifdef MESHLINK_CONFIG_YAML_ENABLED
#include <fkYAML/node.hpp>
#endif

#ifndef MESHLINK_CONFIG_MAX_FILE_SIZE
#define MESHLINK_CONFIG_MAX_FILE_SIZE 8192U
#endif

#ifndef MESHLINK_CONFIG_MAX_ENTRIES
#define MESHLINK_CONFIG_MAX_ENTRIES 64U
#endif

namespace meshlink {

enum class ConfigFormat : uint8_t {
  kAuto = 0,
  kIni,
  kJson,
  kYaml,
};

namespace detail {

inline char AsciiLower(char c) noexcept {
  return (c >= 'A' && c <= 'Z') ? static_cast<char>(c + ('a' - 'A')) : c;
}

inline bool CaseEqual(const char* a, const char* b) noexcept {
  for (; *a != '\0' && *b != '\0'; ++a, ++b) {
    if (AsciiLower(*a) != AsciiLower(*b)) {
      return false;
    }
  }
  return *a == *b;
}

inline const char* FileExtension(const char* path) noexcept {
  const char* dot = std::strrchr(path, '.');
  const char* slash = std::strrchr(path, '/');
  if (dot == nullptr || (slash != nullptr && dot < slash)) {
    return nullptr;
  }
  return dot + 1;
}

}  // namespace detail

// ============================================================================
// Backend tags
// ============================================================================

struct IniBackend {
  static constexpr ConfigFormat kFormat = ConfigFormat::kIni;
  static constexpr const char* kName = "ini";
  static bool MatchesExtension(const char* ext) noexcept {
    return detail::CaseEqual(ext, "ini") || detail::CaseEqual(ext, "conf");
  }
};

struct JsonBackend {
  static constexpr ConfigFormat kFormat = ConfigFormat::kJson;
  static constexpr const char* kName = "json";
  static bool MatchesExtension(const char* ext) noexcept {
    return detail::CaseEqual(ext, "json");
  }
};

struct YamlBackend {
  static constexpr ConfigFormat kFormat = ConfigFormat::kYaml;
  static constexpr const char* kName = "yaml";
  static bool MatchesExtension(const char* ext) noexcept {
    return detail::CaseEqual(ext, "yaml") || detail::CaseEqual(ext, "yml");
  }
};

// ============================================================================
// ConfigStore
// ============================================================================

/**
 * @brief Case-insensitive flat store; later values replace earlier ones.
 *
 * Numeric getters return the default when the key is missing or the value
 * is not a complete number ("12abc" is rejected).
 */
class ConfigStore {
 public:
  using SectionName = FixedString<31>;
  using KeyName = FixedString<47>;
  using Value = FixedString<127>;

  /// @brief Insert or replace; false when the store is full.
  bool Set(const char* section, const char* key, const char* value) noexcept {
    MESHLINK_ASSERT(section != nullptr && key != nullptr);
    Entry* e = Lookup(section, key);
    if (e != nullptr) {
      e->value.assign(TruncateToCapacity, (value != nullptr) ? value : "");
      return true;
    }
    Entry fresh;
    fresh.section.assign(TruncateToCapacity, section);
    fresh.key.assign(TruncateToCapacity, key);
    fresh.value.assign(TruncateToCapacity, (value != nullptr) ? value : "");
    if (!entries_.push_back(fresh)) {
      MESHLINK_LOG_WARN("CONFIG", "store full, dropping [%s] %s", section, key);
      return false;
    }
    return true;
  }

  /**
   * @brief Apply a "section.key=value" override, e.g. from the command line.
   *
   * The section is everything before the first '.', so "link.retry.delay=5"
   * sets key "retry.delay" in section "link".
   */
  expected<void, ConfigError> ApplyOverride(const char* assignment) noexcept {
    const char* eq = std::strchr(assignment, '=');
    const char* dot = std::strchr(assignment, '.');
    if (eq == nullptr || dot == nullptr || dot > eq || dot == assignment ||
        dot + 1 == eq) {
      return expected<void, ConfigError>::error(ConfigError::kParseError);
    }
    SectionName section(TruncateToCapacity, assignment,
                        static_cast<uint32_t>(dot - assignment));
    KeyName key(TruncateToCapacity, dot + 1,
                static_cast<uint32_t>(eq - dot - 1));
    if (!Set(section.c_str(), key.c_str(), eq + 1)) {
      return expected<void, ConfigError>::error(ConfigError::kBufferFull);
    }
    return expected<void, ConfigError>::success();
  }

  const char* GetString(const char* section, const char* key,
                        const char* default_val = "") const noexcept {
    const Entry* e = Lookup(section, key);
    return (e != nullptr) ? e->value.c_str() : default_val;
  }

  int32_t GetInt(const char* section, const char* key,
                 int32_t default_val = 0) const noexcept {
    return FindInt(section, key).value_or(default_val);
  }

  uint32_t GetUint(const char* section, const char* key,
                   uint32_t default_val = 0U) const noexcept {
    return FindUint(section, key).value_or(default_val);
  }

  bool GetBool(const char* section, const char* key,
               bool default_val = false) const noexcept {
    return FindBool(section, key).value_or(default_val);
  }

  double GetDouble(const char* section, const char* key,
                   double default_val = 0.0) const noexcept {
    const Entry* e = Lookup(section, key);
    if (e == nullptr) {
      return default_val;
    }
    char* end = nullptr;
    const double v = std::strtod(e->value.c_str(), &end);
    return (end == e->value.c_str() || *end != '\0') ? default_val : v;
  }

  optional<int32_t> FindInt(const char* section,
                            const char* key) const noexcept {
    const Entry* e = Lookup(section, key);
    if (e == nullptr) {
      return optional<int32_t>();
    }
    char* end = nullptr;
    const long long v = std::strtoll(e->value.c_str(), &end, 0);
    if (end == e->value.c_str() || *end != '\0' || v < INT32_MIN ||
        v > INT32_MAX) {
      return optional<int32_t>();
    }
    return optional<int32_t>(static_cast<int32_t>(v));
  }

  optional<uint32_t> FindUint(const char* section,
                              const char* key) const noexcept {
    const Entry* e = Lookup(section, key);
    if (e == nullptr || e->value.c_str()[0] == '-') {
      return optional<uint32_t>();
    }
    char* end = nullptr;
    const unsigned long long v = std::strtoull(e->value.c_str(), &end, 0);
    if (end == e->value.c_str() || *end != '\0' || v > UINT32_MAX) {
      return optional<uint32_t>();
    }
    return optional<uint32_t>(static_cast<uint32_t>(v));
  }

  optional<bool> FindBool(const char* section, const char* key) const noexcept {
    const Entry* e = Lookup(section, key);
    if (e == nullptr) {
      return optional<bool>();
    }
    const char* v = e->value.c_str();
    if (detail::CaseEqual(v, "true") || detail::CaseEqual(v, "yes") ||
        detail::CaseEqual(v, "on") || detail::CaseEqual(v, "1")) {
      return optional<bool>(true);
    }
    if (detail::CaseEqual(v, "false") || detail::CaseEqual(v, "no") ||
        detail::CaseEqual(v, "off") || detail::CaseEqual(v, "0")) {
      return optional<bool>(false);
    }
    return optional<bool>();
  }

  bool HasSection(const char* section) const noexcept {
    for (const Entry& e : entries_) {
      if (detail::CaseEqual(e.section.c_str(), section)) {
        return true;
      }
    }
    return false;
  }

  bool HasKey(const char* section, const char* key) const noexcept {
    return Lookup(section, key) != nullptr;
  }

  uint32_t EntryCount() const noexcept { return entries_.size(); }

  void Clear() noexcept { entries_.clear(); }

 protected:
  static expected<uint32_t, ConfigError> ReadFile(const char* path, char* buf,
                                                  uint32_t cap) noexcept {
    FILE* f = std::fopen(path, "rb");
    if (f == nullptr) {
      return expected<uint32_t, ConfigError>::error(ConfigError::kFileNotFound);
    }
    const size_t n = std::fread(buf, 1U, cap - 1U, f);
    const bool truncated = (n == cap - 1U) && (std::fgetc(f) != EOF);
    (void)std::fclose(f);
    if (truncated) {
      MESHLINK_LOG_ERROR("CONFIG", "%s exceeds %u bytes", path, cap - 1U);
      return expected<uint32_t, ConfigError>::error(ConfigError::kBufferFull);
    }
    buf[n] = '\0';
    return expected<uint32_t, ConfigError>::success(static_cast<uint32_t>(n));
  }

  template <typename>
  friend struct ConfigParser;

 private:
  struct Entry {
    SectionName section;
    KeyName key;
    Value value;
  };

  const Entry* Lookup(const char* section, const char* key) const noexcept {
    for (const Entry& e : entries_) {
      if (detail::CaseEqual(e.section.c_str(), section) &&
          detail::CaseEqual(e.key.c_str(), key)) {
        return &e;
      }
    }
    return nullptr;
  }

  Entry* Lookup(const char* section, const char* key) noexcept {
    return const_cast<Entry*>(
        static_cast<const ConfigStore*>(this)->Lookup(section, key));
  }

  FixedVector<Entry, MESHLINK_CONFIG_MAX_ENTRIES> entries_;
};

// ============================================================================
// ConfigParser<Backend>
// ============================================================================

/// Backend compiled out: every load reports kFormatNotSupported.
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

#ifdef MESHLINK_CONFIG_INI_ENABLED
template <>
struct ConfigParser<IniBackend> {
  static expected<void, ConfigError> ParseFile(ConfigStore& store,
                                               const char* path) {
    const int rc = ini_parse(path, &OnEntry, &store);
    if (rc == -1) {
      return expected<void, ConfigError>::error(ConfigError::kFileNotFound);
    }
    return Check(rc, path);
  }

  static expected<void, ConfigError> ParseBuffer(ConfigStore& store,
                                                 const char* data,
                                                 uint32_t size) {
    // inih wants a terminated string; the caller's buffer may not be one.
    char text[MESHLINK_CONFIG_MAX_FILE_SIZE];
    if (size >= sizeof(text)) {
      return expected<void, ConfigError>::error(ConfigError::kBufferFull);
    }
    std::memcpy(text, data, size);
    text[size] = '\0';
    return Check(ini_parse_string(text, &OnEntry, &store), "<buffer>");
  }

 private:
  // inih: >0 is the first bad line, -2 is an allocation failure.
  static expected<void, ConfigError> Check(int rc, const char* origin) {
    if (rc == 0) {
      return expected<void, ConfigError>::success();
    }
    MESHLINK_LOG_ERROR("CONFIG", "%s: ini error at line %d", origin, rc);
    return expected<void, ConfigError>::error(ConfigError::kParseError);
  }

  static int OnEntry(void* user, const char* section, const char* name,
                     const char* value) {
    return static_cast<ConfigStore*>(user)->Set(
               (section != nullptr) ? section : "",
               (name != nullptr) ? name : "", value)
               ? 1
               : 0;
  }
};
#endif

#ifdef MESHLINK_CONFIG_JSON_ENABLED
template <>
struct ConfigParser<JsonBackend> {
  static expected<void, ConfigError> ParseFile(ConfigStore& store,
                                               const char* path) {
    char buf[MESHLINK_CONFIG_MAX_FILE_SIZE];
    auto r = ConfigStore::ReadFile(path, buf, sizeof(buf));
    if (!r) {
      return expected<void, ConfigError>::error(r.get_error());
    }
    return ParseBuffer(store, buf, r.value());
  }

  static expected<void, ConfigError> ParseBuffer(ConfigStore& store,
                                                 const char* data,
                                                 uint32_t size) {
    const nlohmann::json root =
        nlohmann::json::parse(data, data + size, nullptr, false);
    if (root.is_discarded() || !root.is_object()) {
      MESHLINK_LOG_ERROR("CONFIG", "json root is not an object");
      return expected<void, ConfigError>::error(ConfigError::kParseError);
    }
    for (auto it = root.begin(); it != root.end(); ++it) {
      const bool ok = it->is_object()
                          ? Flatten(store, it.key().c_str(), "", *it)
                          : Put(store, "", it.key().c_str(), *it);
      if (!ok) {
        return expected<void, ConfigError>::error(ConfigError::kBufferFull);
      }
    }
    return expected<void, ConfigError>::success();
  }

 private:
  static bool Flatten(ConfigStore& store, const char* section,
                      const std::string& prefix, const nlohmann::json& obj) {
    for (auto it = obj.begin(); it != obj.end(); ++it) {
      const std::string key =
          prefix.empty() ? it.key() : prefix + "." + it.key();
      const bool ok = it->is_object() ? Flatten(store, section, key, *it)
                                      : Put(store, section, key.c_str(), *it);
      if (!ok) {
        return false;
      }
    }
    return true;
  }

  static bool Put(ConfigStore& store, const char* section, const char* key,
                  const nlohmann::json& v) {
    if (v.is_string()) {
      return store.Set(section, key,
                       v.get_ref<const std::string&>().c_str());
    }
    if (v.is_null()) {
      return store.Set(section, key, "");
    }
    // Numbers, booleans and arrays keep their JSON spelling.
    return store.Set(section, key, v.dump().c_str());
  }
};
#endif

#ifdef MESHLINK_CONFIG_YAML_ENABLED
template <>
struct ConfigParser<YamlBackend> {
  static expected<void, ConfigError> ParseFile(ConfigStore& store,
                                               const char* path) {
    char buf[MESHLINK_CONFIG_MAX_FILE_SIZE];
    auto r = ConfigStore::ReadFile(path, buf, sizeof(buf));
    if (!r) {
      return expected<void, ConfigError>::error(r.get_error());
    }
    return ParseBuffer(store, buf, r.value());
  }

  static expected<void, ConfigError> ParseBuffer(ConfigStore& store,
                                                 const char* data,
                                                 uint32_t size) {
    fkyaml::node root;
    try {
      root = fkyaml::node::deserialize(std::string(data, size));
    } catch (const fkyaml::exception& e) {
      MESHLINK_LOG_ERROR("CONFIG", "yaml: %s", e.what());
      return expected<void, ConfigError>::error(ConfigError::kParseError);
    }
    if (!root.is_mapping()) {
      MESHLINK_LOG_ERROR("CONFIG", "yaml root is not a mapping");
      return expected<void, ConfigError>::error(ConfigError::kParseError);
    }
    for (auto it = root.begin(); it != root.end(); ++it) {
      const std::string name = it.key().get_value<std::string>();
      const bool ok = it->is_mapping()
                          ? Flatten(store, name.c_str(), "", *it)
                          : Put(store, "", name.c_str(), *it);
      if (!ok) {
        return expected<void, ConfigError>::error(ConfigError::kBufferFull);
      }
    }
    return expected<void, ConfigError>::success();
  }

 private:
  static bool Flatten(ConfigStore& store, const char* section,
                      const std::string& prefix, const fkyaml::node& map) {
    for (auto it = map.begin(); it != map.end(); ++it) {
      const std::string name = it.key().get_value<std::string>();
      const std::string key = prefix.empty() ? name : prefix + "." + name;
      const bool ok = it->is_mapping() ? Flatten(store, section, key, *it)
                                       : Put(store, section, key.c_str(), *it);
      if (!ok) {
        return false;
      }
    }
    return true;
  }

  static bool Put(ConfigStore& store, const char* section, const char* key,
                  const fkyaml::node& v) {
    char text[ConfigStore::Value::capacity() + 1U];
    if (v.is_string()) {
      return store.Set(section, key, v.get_value<std::string>().c_str());
    }
    if (v.is_boolean()) {
      return store.Set(section, key, v.get_value<bool>() ? "true" : "false");
    }
    if (v.is_integer()) {
      (void)std::snprintf(text, sizeof(text), "%lld",
                          static_cast<long long>(v.get_value<int64_t>()));
      return store.Set(section, key, text);
    }
    if (v.is_float_number()) {
      (void)std::snprintf(text, sizeof(text), "%g", v.get_value<double>());
      return store.Set(section, key, text);
    }
    return store.Set(section, key, "");
  }
};
#endif

// ============================================================================
// Config<Backends...>
// ============================================================================

template <typename... Backends>
class Config final : public ConfigStore {
  static_assert(sizeof...(Backends) > 0, "Config requires a backend");
  using Primary = typename std::tuple_element<0, std::tuple<Backends...>>::type;

 public:
  /// @brief Load @p path; kAuto picks the backend from the file extension.
  expected<void, ConfigError> LoadFile(
      const char* path, ConfigFormat format = ConfigFormat::kAuto) {
    MESHLINK_ASSERT(path != nullptr);
    if (format == ConfigFormat::kAuto) {
      const char* ext = detail::FileExtension(path);
      format = (ext != nullptr) ? Detect<Backends...>(ext) : Primary::kFormat;
    }
    auto r = LoadFileAs<Backends...>(path, format);
    if (r) {
      MESHLINK_LOG_INFO("CONFIG", "loaded %s (%u entries)", path, EntryCount());
    } else {
      MESHLINK_LOG_WARN("CONFIG", "cannot load %s", path);
    }
    return r;
  }

  expected<void, ConfigError> LoadBuffer(const char* data, uint32_t size,
                                         ConfigFormat format) {
    MESHLINK_ASSERT(data != nullptr);
    if (format == ConfigFormat::kAuto) {
      format = Primary::kFormat;
    }
    return LoadBufferAs<Backends...>(data, size, format);
  }

 private:
  template <typename B, typename... Rest>
  expected<void, ConfigError> LoadFileAs(const char* path, ConfigFormat f) {
    if (B::kFormat == f) {
      return ConfigParser<B>::ParseFile(*this, path);
    }
    if constexpr (sizeof...(Rest) > 0) {
      return LoadFileAs<Rest...>(path, f);
    } else {
      return expected<void, ConfigError>::error(
          ConfigError::kFormatNotSupported);
    }
  }

  template <typename B, typename... Rest>
  expected<void, ConfigError> LoadBufferAs(const char* data, uint32_t size,
                                           ConfigFormat f) {
    if (B::kFormat == f) {
      return ConfigParser<B>::ParseBuffer(*this, data, size);
    }
    if constexpr (sizeof...(Rest) > 0) {
      return LoadBufferAs<Rest...>(data, size, f);
    } else {
      return expected<void, ConfigError>::error(
          ConfigError::kFormatNotSupported);
    }
  }

  template <typename B, typename... Rest>
  static ConfigFormat Detect(const char* ext) noexcept {
    if (B::MatchesExtension(ext)) {
      return B::kFormat;
    }
    if constexpr (sizeof...(Rest) > 0) {
      return Detect<Rest...>(ext);
    } else {
      return Primary::kFormat;
    }
  }
};

// ============================================================================
// Aliases
// ============================================================================

#if defined(MESHLINK_CONFIG_INI_ENABLED) && \
    defined(MESHLINK_CONFIG_JSON_ENABLED) && defined(MESHLINK_CONFIG_YAML_ENABLED)
using MultiConfig = Config<IniBackend, JsonBackend, YamlBackend>;
#elif defined(MESHLINK_CONFIG_INI_ENABLED) && defined(MESHLINK_CONFIG_JSON_ENABLED)
using MultiConfig = Config<IniBackend, JsonBackend>;
#elif defined(MESHLINK_CONFIG_INI_ENABLED) && defined(MESHLINK_CONFIG_YAML_ENABLED)
using MultiConfig = Config<IniBackend, YamlBackend>;
#elif defined(MESHLINK_CONFIG_JSON_ENABLED) && defined(MESHLINK_CONFIG_YAML_ENABLED)
using MultiConfig = Config<JsonBackend, YamlBackend>;
#elif defined(MESHLINK_CONFIG_JSON_ENABLED)
using MultiConfig = Config<JsonBackend>;
#elif defined(MESHLINK_CONFIG_YAML_ENABLED)
using MultiConfig = Config<YamlBackend>;
#else
using MultiConfig = Config<IniBackend>;
#endif

#ifdef MESHLINK_CONFIG_INI_ENABLED
using IniConfig = Config<IniBackend>;
#endif
#ifdef MESHLINK_CONFIG_JSON_ENABLED
using JsonConfig = Config<JsonBackend>;
#endif
#ifdef MESHLINK_CONFIG_YAML_ENABLED
using YamlConfig = Config<YamlBackend>;
#endif

}  // namespace meshlink

#endif  // MESHLINK_CONFIG_HPP_
