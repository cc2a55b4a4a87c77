/**
 * @file config.hpp
 * @brief Multi-format configuration reader and the typed mirror settings
 *        built from it.
 *
 * Backends are selected at compile time through tag types:
 *   - JsonBackend : nlohmann/json (always available)
 *   - IniBackend  : inih          (MIRROR_CONFIG_INI_ENABLED)
 *   - YamlBackend : fkYAML        (MIRROR_CONFIG_YAML_ENABLED)
 *
 * Every format is flattened to "section + key = value". Nested objects
 * join their names with '.', so {"tier":{"quality":{"enabled":false}}}
 * becomes section "tier.quality", key "enabled".
 *
 * Usage:
 * @code
 *   mirror::MultiConfig cfg;
 *   if (cfg.LoadFile("mirror.json")) {
 *     auto settings = mirror::LoadMirrorConfig(cfg);
 *   }
 * @endcode
 */

#ifndef MIRROR_CONFIG_HPP_
#define MIRROR_CONFIG_HPP_

#include "mirror/log.hpp"
#include "mirror/platform.hpp"
#include "mirror/quality.hpp"
#include "mirror/session.hpp"
#include "mirror/vocabulary.hpp"

#include <cerrno>
#include <cstdio>
#include <cstdlib>
#include <cstring>
#include <string>
#include <tuple>

#include <nlohmann/json.hpp>

#ifdef MIRROR_CONFIG_INI_ENABLED
#include "ini.h"
#endif

#ifdef MIRROR_CONFIG_YAML_ENABLED
#include <fkYAML/node.hpp>
#endif

namespace mirror {

enum class ConfigFormat : uint8_t {
  kAuto = 0,
  kIni,
  kJson,
  kYaml,
};

namespace detail {

inline bool StrCaseEqual(const char* a, const char* b) noexcept {
  while (*a != '\0' && *b != '\0') {
    char la = (*a >= 'A' && *a <= 'Z') ? static_cast<char>(*a + 32) : *a;
    char lb = (*b >= 'A' && *b <= 'Z') ? static_cast<char>(*b + 32) : *b;
    if (la != lb) return false;
    ++a;
    ++b;
  }
  return *a == *b;
}

}  // namespace detail

// ============================================================================
// Backend tags
// ============================================================================

struct JsonBackend {
  static constexpr ConfigFormat kFormat = ConfigFormat::kJson;
  static bool MatchesExtension(const char* ext) noexcept {
    return detail::StrCaseEqual(ext, "json");
  }
};

struct IniBackend {
  static constexpr ConfigFormat kFormat = ConfigFormat::kIni;
  static bool MatchesExtension(const char* ext) noexcept {
    return detail::StrCaseEqual(ext, "ini") ||
           detail::StrCaseEqual(ext, "conf");
  }
};

struct YamlBackend {
  static constexpr ConfigFormat kFormat = ConfigFormat::kYaml;
  static bool MatchesExtension(const char* ext) noexcept {
    return detail::StrCaseEqual(ext, "yaml") ||
           detail::StrCaseEqual(ext, "yml");
  }
};

// ============================================================================
// ConfigStore
// ============================================================================

#ifndef MIRROR_CONFIG_MAX_FILE_SIZE
#define MIRROR_CONFIG_MAX_FILE_SIZE 8192U
#endif

/**
 * @brief Flat, case-insensitive section/key/value table shared by all
 *        backends. Later entries overwrite earlier ones.
 */
class ConfigStore {
 public:
  static constexpr uint32_t kMaxEntries = 64;
  static constexpr uint32_t kMaxKeyLen = 64;
  static constexpr uint32_t kMaxValueLen = 128;

  const char* GetString(const char* section, const char* key,
                        const char* default_val = "") const {
    const Entry* e = FindEntry(section, key);
    return (e != nullptr) ? e->value : default_val;
  }

  bool GetBool(const char* section, const char* key,
               bool default_val = false) const {
    bool v = default_val;
    return ParseBool(FindValue(section, key), v) ? v : default_val;
  }

  bool HasSection(const char* section) const {
    MIRROR_ASSERT(section != nullptr);
    for (uint32_t i = 0; i < count_; ++i) {
      if (detail::StrCaseEqual(entries_[i].section, section)) return true;
    }
    return false;
  }

  bool HasKey(const char* section, const char* key) const {
    return FindEntry(section, key) != nullptr;
  }

  uint32_t EntryCount() const noexcept { return count_; }

  /// Raw value or nullptr when absent.
  const char* FindValue(const char* section, const char* key) const {
    const Entry* e = FindEntry(section, key);
    return (e != nullptr) ? e->value : nullptr;
  }

  /** @brief Whole-string unsigned parse; false on any trailing garbage. */
  static bool ParseUint(const char* str, uint32_t& out) noexcept {
    if (str == nullptr || *str == '\0' || *str == '-') return false;
    char* end = nullptr;
    errno = 0;
    unsigned long long v = std::strtoull(str, &end, 10);
    if (errno != 0 || *end != '\0' || v > 0xFFFFFFFFULL) return false;
    out = static_cast<uint32_t>(v);
    return true;
  }

  static bool ParseDouble(const char* str, double& out) noexcept {
    if (str == nullptr || *str == '\0') return false;
    char* end = nullptr;
    errno = 0;
    double v = std::strtod(str, &end);
    if (errno != 0 || *end != '\0') return false;
    out = v;
    return true;
  }

  static bool ParseBool(const char* str, bool& out) noexcept {
    if (str == nullptr) return false;
    if (detail::StrCaseEqual(str, "true") || detail::StrCaseEqual(str, "1") ||
        detail::StrCaseEqual(str, "yes") || detail::StrCaseEqual(str, "on")) {
      out = true;
      return true;
    }
    if (detail::StrCaseEqual(str, "false") || detail::StrCaseEqual(str, "0") ||
        detail::StrCaseEqual(str, "no") || detail::StrCaseEqual(str, "off")) {
      out = false;
      return true;
    }
    return false;
  }

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
      if (detail::StrCaseEqual(entries_[i].section, section) &&
          detail::StrCaseEqual(entries_[i].key, key)) {
        SafeCopy(entries_[i].value, value, kMaxValueLen);
        return true;
      }
    }
    if (count_ >= kMaxEntries) return false;
    Entry& e = entries_[count_];
    SafeCopy(e.section, section, kMaxKeyLen);
    SafeCopy(e.key, key, kMaxKeyLen);
    SafeCopy(e.value, value, kMaxValueLen);
    ++count_;
    return true;
  }

  const Entry* FindEntry(const char* section, const char* key) const {
    MIRROR_ASSERT(section != nullptr && key != nullptr);
    for (uint32_t i = 0; i < count_; ++i) {
      if (detail::StrCaseEqual(entries_[i].section, section) &&
          detail::StrCaseEqual(entries_[i].key, key)) {
        return &entries_[i];
      }
    }
    return nullptr;
  }

  static expected<uint32_t, ConfigError> ReadFileToBuffer(const char* path,
                                                          char* buf,
                                                          uint32_t buf_size) {
    FILE* f = std::fopen(path, "rb");
    if (f == nullptr) {
      return expected<uint32_t, ConfigError>::error(ConfigError::kFileNotFound);
    }
    size_t bytes = std::fread(buf, 1, buf_size - 1, f);
    const bool truncated = (bytes == buf_size - 1) && std::fgetc(f) != EOF;
    std::fclose(f);
    if (truncated) {
      return expected<uint32_t, ConfigError>::error(ConfigError::kBufferFull);
    }
    buf[bytes] = '\0';
    return expected<uint32_t, ConfigError>::success(
        static_cast<uint32_t>(bytes));
  }

  static void SafeCopy(char* dst, const char* src, uint32_t dst_size) noexcept {
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

  /// "a" + "b" -> "a.b"; empty parent yields the child alone.
  static void JoinSection(char* dst, const char* parent,
                          const char* child) noexcept {
    if (parent[0] == '\0') {
      SafeCopy(dst, child, kMaxKeyLen);
      return;
    }
    (void)std::snprintf(dst, kMaxKeyLen, "%s.%s", parent, child);
  }

  static const char* GetExtension(const char* path) noexcept {
    const char* dot = nullptr;
    for (const char* p = path; *p != '\0'; ++p) {
      if (*p == '.') dot = p;
      if (*p == '/') dot = nullptr;
    }
    return (dot != nullptr) ? dot + 1 : nullptr;
  }

  template <typename>
  friend struct ConfigParser;
};

// ============================================================================
// ConfigParser<Backend>
// ============================================================================

/** Fallback for backends compiled out. */
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

// --- JSON ---

template <>
struct ConfigParser<JsonBackend> {
  static expected<void, ConfigError> ParseFile(ConfigStore& store,
                                               const char* path) {
    char buf[MIRROR_CONFIG_MAX_FILE_SIZE];
    auto r = ConfigStore::ReadFileToBuffer(path, buf, sizeof(buf));
    if (!r.has_value()) {
      return expected<void, ConfigError>::error(r.get_error());
    }
    return ParseBuffer(store, buf, r.value());
  }

  static expected<void, ConfigError> ParseBuffer(ConfigStore& store,
                                                 const char* data,
                                                 uint32_t size) {
    auto j = nlohmann::json::parse(data, data + size, nullptr, false);
    if (j.is_discarded() || !j.is_object()) {
      return expected<void, ConfigError>::error(ConfigError::kParseError);
    }
    if (!Flatten(store, "", j)) {
      return expected<void, ConfigError>::error(ConfigError::kBufferFull);
    }
    return expected<void, ConfigError>::success();
  }

 private:
  static bool Flatten(ConfigStore& store, const char* section,
                      const nlohmann::json& obj) {
    for (auto it = obj.begin(); it != obj.end(); ++it) {
      if (it->is_object()) {
        char child[ConfigStore::kMaxKeyLen];
        ConfigStore::JoinSection(child, section, it.key().c_str());
        if (!Flatten(store, child, *it)) return false;
        continue;
      }
      char val[ConfigStore::kMaxValueLen];
      ToStr(*it, val, sizeof(val));
      if (!store.AddEntry(section, it.key().c_str(), val)) return false;
    }
    return true;
  }

  static void ToStr(const nlohmann::json& n, char* b, uint32_t sz) {
    if (n.is_string()) {
      ConfigStore::SafeCopy(b, n.get_ref<const std::string&>().c_str(), sz);
    } else if (n.is_boolean()) {
      ConfigStore::SafeCopy(b, n.get<bool>() ? "true" : "false", sz);
    } else if (n.is_number_unsigned()) {
      (void)std::snprintf(b, sz, "%llu",
                          static_cast<unsigned long long>(n.get<uint64_t>()));
    } else if (n.is_number_integer()) {
      (void)std::snprintf(b, sz, "%lld",
                          static_cast<long long>(n.get<int64_t>()));
    } else if (n.is_number_float()) {
      (void)std::snprintf(b, sz, "%.17g", n.get<double>());
    } else {
      auto s = n.dump(-1, ' ', false, nlohmann::json::error_handler_t::replace);
      ConfigStore::SafeCopy(b, s.c_str(), sz);
    }
  }
};

// --- INI ---

#ifdef MIRROR_CONFIG_INI_ENABLED
template <>
struct ConfigParser<IniBackend> {
  static expected<void, ConfigError> ParseFile(ConfigStore& store,
                                               const char* path) {
    int result = ini_parse(path, Handler, &store);
    if (result == -1) {
      return expected<void, ConfigError>::error(ConfigError::kFileNotFound);
    }
    if (result != 0) {
      return expected<void, ConfigError>::error(ConfigError::kParseError);
    }
    return expected<void, ConfigError>::success();
  }

  static expected<void, ConfigError> ParseBuffer(ConfigStore& store,
                                                 const char* data, uint32_t) {
    if (ini_parse_string(data, Handler, &store) != 0) {
      return expected<void, ConfigError>::error(ConfigError::kParseError);
    }
    return expected<void, ConfigError>::success();
  }

 private:
  static int Handler(void* user, const char* section, const char* name,
                     const char* value) {
    auto* s = static_cast<ConfigStore*>(user);
    return s->AddEntry(section ? section : "", name ? name : "",
                       value ? value : "")
               ? 1
               : 0;
  }
};
#endif

// --- YAML ---

#ifdef MIRROR_CONFIG_YAML_ENABLED
template <>
struct ConfigParser<YamlBackend> {
  static expected<void, ConfigError> ParseFile(ConfigStore& store,
                                               const char* path) {
    char buf[MIRROR_CONFIG_MAX_FILE_SIZE];
    auto r = ConfigStore::ReadFileToBuffer(path, buf, sizeof(buf));
    if (!r.has_value()) {
      return expected<void, ConfigError>::error(r.get_error());
    }
    return ParseBuffer(store, buf, r.value());
  }

  static expected<void, ConfigError> ParseBuffer(ConfigStore& store,
                                                 const char* data,
                                                 uint32_t size) {
    std::string yaml_str(data, size);
    auto root = fkyaml::node::deserialize(yaml_str);
    if (root.is_null() || !root.is_mapping()) {
      return expected<void, ConfigError>::error(ConfigError::kParseError);
    }
    if (!Flatten(store, "", root)) {
      return expected<void, ConfigError>::error(ConfigError::kBufferFull);
    }
    return expected<void, ConfigError>::success();
  }

 private:
  static bool Flatten(ConfigStore& store, const char* section,
                      fkyaml::node& map) {
    for (auto it = map.begin(); it != map.end(); ++it) {
      auto key = it.key().get_value<std::string>();
      auto& node = *it;
      if (node.is_mapping()) {
        char child[ConfigStore::kMaxKeyLen];
        ConfigStore::JoinSection(child, section, key.c_str());
        if (!Flatten(store, child, node)) return false;
        continue;
      }
      char val[ConfigStore::kMaxValueLen];
      ToStr(node, val, sizeof(val));
      if (!store.AddEntry(section, key.c_str(), val)) return false;
    }
    return true;
  }

  static void ToStr(const fkyaml::node& n, char* b, uint32_t sz) {
    if (n.is_string()) {
      auto s = n.get_value<std::string>();
      ConfigStore::SafeCopy(b, s.c_str(), sz);
    } else if (n.is_boolean()) {
      ConfigStore::SafeCopy(b, n.get_value<bool>() ? "true" : "false", sz);
    } else if (n.is_integer()) {
      (void)std::snprintf(b, sz, "%lld",
                          static_cast<long long>(n.get_value<int64_t>()));
    } else if (n.is_float_number()) {
      (void)std::snprintf(b, sz, "%.17g", n.get_value<double>());
    } else {
      b[0] = '\0';
    }
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
    MIRROR_ASSERT(path != nullptr);
    if (format == ConfigFormat::kAuto) format = DetectFormat(path);
    return DispatchFile<Backends...>(path, format);
  }

  expected<void, ConfigError> LoadBuffer(const char* data, uint32_t size,
                                         ConfigFormat format) {
    MIRROR_ASSERT(data != nullptr);
    return DispatchBuffer<Backends...>(data, size, format);
  }

 private:
  template <typename First, typename... Rest>
  expected<void, ConfigError> DispatchFile(const char* path,
                                           ConfigFormat format) {
    if (First::kFormat == format) {
      return ConfigParser<First>::ParseFile(*this, path);
    }
    if constexpr (sizeof...(Rest) > 0) {
      return DispatchFile<Rest...>(path, format);
    }
    return expected<void, ConfigError>::error(ConfigError::kFormatNotSupported);
  }

  template <typename First, typename... Rest>
  expected<void, ConfigError> DispatchBuffer(const char* data, uint32_t size,
                                             ConfigFormat format) {
    if (First::kFormat == format) {
      return ConfigParser<First>::ParseBuffer(*this, data, size);
    }
    if constexpr (sizeof...(Rest) > 0) {
      return DispatchBuffer<Rest...>(data, size, format);
    }
    return expected<void, ConfigError>::error(ConfigError::kFormatNotSupported);
  }

  ConfigFormat DetectFormat(const char* path) const noexcept {
    const char* ext = GetExtension(path);
    if (ext == nullptr) return Head::kFormat;
    return DetectExt<Backends...>(ext);
  }

  template <typename First, typename... Rest>
  ConfigFormat DetectExt(const char* ext) const noexcept {
    if (First::MatchesExtension(ext)) return First::kFormat;
    if constexpr (sizeof...(Rest) > 0) return DetectExt<Rest...>(ext);
    return Head::kFormat;
  }

  using Head = typename std::tuple_element<0, std::tuple<Backends...>>::type;
};

using MultiConfig = Config<JsonBackend
#ifdef MIRROR_CONFIG_INI_ENABLED
                           , IniBackend
#endif
#ifdef MIRROR_CONFIG_YAML_ENABLED
                           , YamlBackend
#endif
                           >;

using JsonConfig = Config<JsonBackend>;
#ifdef MIRROR_CONFIG_INI_ENABLED
using IniConfig = Config<IniBackend>;
#endif
#ifdef MIRROR_CONFIG_YAML_ENABLED
using YamlConfig = Config<YamlBackend>;
#endif

// ============================================================================
// MirrorConfig
// ============================================================================

/** @brief Typed settings for one mirroring endpoint. */
struct MirrorConfig {
  SessionConfig session;
  FixedString<63> display_name = "mirror-device";
  QualityPolicy policy;
  QualityTier default_tier = QualityTier::kBalanced;
  uint32_t announce_interval_ms = 5000;
  log::Level log_level = log::Level::kInfo;
};

namespace detail {

inline bool ReadUint(const ConfigStore& store, const char* section,
                     const char* key, uint32_t& out) {
  const char* v = store.FindValue(section, key);
  if (v == nullptr) return true;
  if (ConfigStore::ParseUint(v, out)) return true;
  MIRROR_LOG_ERROR("Config", "%s.%s: '%s' is not an unsigned integer",
                   section, key, v);
  return false;
}

inline bool ReadBool(const ConfigStore& store, const char* section,
                     const char* key, bool& out) {
  const char* v = store.FindValue(section, key);
  if (v == nullptr) return true;
  if (ConfigStore::ParseBool(v, out)) return true;
  MIRROR_LOG_ERROR("Config", "%s.%s: '%s' is not a boolean", section, key, v);
  return false;
}

inline bool ReadTier(const ConfigStore& store, QualityTier tier,
                     TierPolicy& p) {
  char section[ConfigStore::kMaxKeyLen];
  (void)std::snprintf(section, sizeof(section), "tier.%s", TierName(tier));

  if (!ReadBool(store, section, "enabled", p.enabled) ||
      !ReadUint(store, section, "frame_rate", p.frame_rate) ||
      !ReadUint(store, section, "max_payload_bytes", p.max_payload_bytes) ||
      !ReadUint(store, section, "width", p.width) ||
      !ReadUint(store, section, "height", p.height)) {
    return false;
  }
  const char* c = store.FindValue(section, "compression");
  if (c != nullptr) {
    double q = 0.0;
    if (!ConfigStore::ParseDouble(c, q)) {
      MIRROR_LOG_ERROR("Config", "%s.compression: '%s' is not a number",
                       section, c);
      return false;
    }
    p.encoding.compression = static_cast<float>(q);
  }

  if (p.frame_rate == 0U || p.max_payload_bytes == 0U ||
      !(p.encoding.compression > 0.0F) || p.encoding.compression > 1.0F) {
    MIRROR_LOG_ERROR("Config", "%s: frame_rate, max_payload_bytes and "
                     "compression must be positive (compression <= 1)",
                     section);
    return false;
  }
  return true;
}

}  // namespace detail

/**
 * @brief Map flattened entries onto MirrorConfig, starting from defaults.
 * @return kInvalidValue when any present value is malformed or violates a
 *         constraint (see SessionConfig / TierPolicy).
 */
inline expected<MirrorConfig, ConfigError> LoadMirrorConfig(
    const ConfigStore& store) {
  using R = expected<MirrorConfig, ConfigError>;
  MirrorConfig cfg;

  const char* service = store.FindValue("session", "service_type");
  if (service != nullptr) {
    if (*service == '\0') {
      MIRROR_LOG_ERROR("Config", "session.service_type must not be empty");
      return R::error(ConfigError::kInvalidValue);
    }
    cfg.session.service_type.assign(TruncateToCapacity, service);
  }
  const char* name = store.FindValue("session", "display_name");
  if (name != nullptr && *name != '\0') {
    cfg.display_name.assign(TruncateToCapacity, name);
  }
  if (!detail::ReadUint(store, "session", "max_retries",
                        cfg.session.max_retries) ||
      !detail::ReadUint(store, "session", "invite_timeout_s",
                        cfg.session.invite_timeout_s) ||
      !detail::ReadBool(store, "session", "accept_while_connected",
                        cfg.session.accept_while_connected) ||
      !detail::ReadUint(store, "stream", "announce_interval_ms",
                        cfg.announce_interval_ms)) {
    return R::error(ConfigError::kInvalidValue);
  }
  if (cfg.session.max_retries == 0U) {
    MIRROR_LOG_ERROR("Config", "session.max_retries must be >= 1");
    return R::error(ConfigError::kInvalidValue);
  }

  for (uint32_t i = 0; i < kTierCount; ++i) {
    auto tier = static_cast<QualityTier>(i);
    if (!detail::ReadTier(store, tier, cfg.policy.Edit(tier))) {
      return R::error(ConfigError::kInvalidValue);
    }
  }
  if (cfg.policy.EnabledCount() == 0U) {
    MIRROR_LOG_ERROR("Config", "at least one tier must be enabled");
    return R::error(ConfigError::kInvalidValue);
  }

  const char* tier_name = store.FindValue("stream", "default_tier");
  if (tier_name != nullptr && !ParseTier(tier_name, cfg.default_tier)) {
    MIRROR_LOG_ERROR("Config", "stream.default_tier: unknown tier '%s'",
                     tier_name);
    return R::error(ConfigError::kInvalidValue);
  }
  if (!cfg.policy.IsEnabled(cfg.default_tier)) {
    MIRROR_LOG_ERROR("Config", "stream.default_tier '%s' is disabled",
                     TierName(cfg.default_tier));
    return R::error(ConfigError::kInvalidValue);
  }

  cfg.log_level = log::ParseLevel(store.GetString("log", "level", "info"));
  return R::success(cfg);
}

}  // namespace mirror

#endif  // MIRROR_CONFIG_HPP_
