#pragma once

#include <algorithm>
#include <cctype>
#include <cstddef>
#include <cstdint>
#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <limits>
#include <optional>
#include <stdexcept>
#include <string>
#include <vector>

#include <nlohmann/json.hpp>

#include "log.hpp"

inline const nlohmann::json SETTINGS_SPECIFICATION = nlohmann::json::array({
  {{"key","streams"},            {"aliases", {"s"}},                 {"type","uint"},   {"default",20},    {"description","Number of parallel streams (chunks)"}},
  {{"key","port"},               {"aliases", {"p"}},                 {"type","uint"},   {"default",22},    {"description","Remote SSH port (1-65535)"}},
  {{"key","retries"},            {"aliases", {"r"}},                 {"type","uint"},   {"default",3},     {"description","Retries per chunk before the job fails"}},
  {{"key","identity"},           {"aliases", {"i","ssh_key_path"}},  {"type","string"}, {"default",""},    {"description","Private key file used for authentication"}},
  {{"key","user"},               {"aliases", {"u"}},                 {"type","string"}, {"default",""},    {"description","Remote user when the specifier names none"}},
  {{"key","retry_delay_ms"},     {"aliases", {"rd"}},                {"type","uint"},   {"default",1000},  {"description","Base delay before a chunk is retried"}},
  {{"key","retry_max_delay_ms"}, {"aliases", {"rmd"}},               {"type","uint"},   {"default",30000}, {"description","Upper bound for the retry delay"}},
  {{"key","timeout_s"},          {"aliases", {"t"}},                 {"type","uint"},   {"default",30},    {"description","Connect and channel I/O timeout in seconds"}},
  {{"key","buffer_kb"},          {"aliases", {"b"}},                 {"type","uint"},   {"default",1024},  {"description","Copy buffer per stream in KiB"}},
  {{"key","verify"},             {"aliases", {"V"}},                 {"type","bool"},   {"default",false}, {"description","Compare SHA-256 of source and result"}},
  {{"key","known_hosts"},        {"aliases", {"kh"}},                {"type","string"}, {"default",""},    {"description","known_hosts file (default ~/.ssh/known_hosts)"}},
  {{"key","strict_host_keys"},   {"aliases", {"shk"}},               {"type","bool"},   {"default",false}, {"description","Refuse hosts missing from known_hosts"}},
  {{"key","progress"},           {"aliases", {"P"}},                 {"type","bool"},   {"default",true},  {"description","Show the transfer progress meter"}},
  {{"key","quiet"},              {"aliases", {"q"}},                 {"type","bool"},   {"default",false}, {"description","Only report warnings and errors"}},
  {{"key","verbose"},            {"aliases", {"v"}},                 {"type","bool"},   {"default",false}, {"description","Enable debug logging"}},
  {{"key","help"},               {"aliases", {"h","?"}},             {"type","bool"},   {"default",false}, {"description","Show command help and exit"}, {"file", false}},
  {{"key","source"},             {"type","string"},                  {"default",""},    {"description","File to send: local path or [user@]host:path"}, {"file", false}},
  {{"key","destination"},        {"type","string"},                  {"default",""},    {"description","Target: local directory or [user@]host:path"}, {"file", false}}
});

// Typed option store. Values arrive from the settings file (JSON) or from the
// command line (strings); both go through the same per-type conversion so a
// bad token is rejected identically wherever it came from.
class SettingsManager {
public:
  SettingsManager();
  explicit SettingsManager(const nlohmann::json& specification);

  template<typename T>
  T get(const std::string& key) const;

  bool has(const std::string& key) const;

  bool set_from_string(const std::string& key, const std::string& value, std::string& error);
  bool set_from_json(const std::string& key, const nlohmann::json& value, std::string& error);

  bool load();
  bool load_from_file(const std::filesystem::path& path);

  bool help_requested() const { return has("help") && get<bool>("help"); }

  std::optional<std::string> resolve_key(const std::string& token) const;
  bool is_bool_setting(const std::string& key) const;

  std::filesystem::path settings_path() const;
  void set_settings_path(const std::filesystem::path& path);

  static std::filesystem::path default_settings_path();
  static std::string to_lower(std::string value);
  static std::string trim_copy(std::string value);
  static bool is_bool_literal(const std::string& value);

private:
  struct SettingSpec {
    std::string key;
    std::vector<std::string> aliases;
    std::string normalized_key;
    std::string type;
    nlohmann::json default_value;
    std::string description;
    bool from_file = true;
  };

  static std::vector<SettingSpec> build_setting_specs(const nlohmann::json& specification);

  const SettingSpec* find_spec(const std::string& token) const;

  void apply_defaults();
  void merge_from_json(const nlohmann::json& doc);

  bool convert_and_store(const SettingSpec& spec, const nlohmann::json& value, std::string& error);
  nlohmann::json parse_string_value(const SettingSpec& spec, const std::string& value, std::string& error) const;

  nlohmann::json specification_;
  nlohmann::json settings_;
  std::vector<SettingSpec> setting_specs_;
  std::filesystem::path settings_path_override_;
};

// ---- implementation -------------------------------------------------------

inline std::vector<SettingsManager::SettingSpec> SettingsManager::build_setting_specs(const nlohmann::json& specification) {
  std::vector<SettingSpec> result;
  for(const auto& entry : specification) {
    SettingSpec spec;
    spec.key = entry.at("key").get<std::string>();
    spec.normalized_key = SettingsManager::to_lower(spec.key);
    if(entry.contains("aliases")) {
      spec.aliases = entry.at("aliases").get<std::vector<std::string>>();
    }
    spec.type = entry.at("type").get<std::string>();
    spec.default_value = entry.at("default");
    spec.description = entry.value("description", "");
    spec.from_file = entry.value("file", true);
    result.push_back(std::move(spec));
  }
  return result;
}

inline SettingsManager::SettingsManager()
  : SettingsManager(SETTINGS_SPECIFICATION) {}

inline SettingsManager::SettingsManager(const nlohmann::json& specification)
  : specification_(specification),
    setting_specs_(build_setting_specs(specification)) {
  apply_defaults();
}

inline void SettingsManager::apply_defaults() {
  settings_ = nlohmann::json::object();
  for(const auto& spec : setting_specs_) {
    settings_[spec.key] = spec.default_value;
  }
}

// Long keys match case-insensitively; aliases are case-sensitive so that
// -v (verbose) and -V (verify) stay distinct.
inline const SettingsManager::SettingSpec* SettingsManager::find_spec(const std::string& token) const {
  std::string lowered = to_lower(token);
  for(const auto& spec : setting_specs_) {
    if(lowered == spec.normalized_key) return &spec;
  }
  for(const auto& spec : setting_specs_) {
    if(std::find(spec.aliases.begin(), spec.aliases.end(), token) != spec.aliases.end()) {
      return &spec;
    }
  }
  return nullptr;
}

inline bool SettingsManager::has(const std::string& key) const {
  return settings_.contains(key);
}

inline void SettingsManager::set_settings_path(const std::filesystem::path& path) {
  settings_path_override_ = path;
}

inline std::filesystem::path SettingsManager::default_settings_path() {
  if(const char* xdg = std::getenv("XDG_CONFIG_HOME"); xdg && *xdg) {
    return std::filesystem::path(xdg) / "zap" / "settings.json";
  }
  if(const char* home = std::getenv("HOME"); home && *home) {
    return std::filesystem::path(home) / ".config" / "zap" / "settings.json";
  }
  return {};
}

inline std::filesystem::path SettingsManager::settings_path() const {
  if(!settings_path_override_.empty()) {
    return settings_path_override_;
  }
  return default_settings_path();
}

inline bool SettingsManager::load() {
  return load_from_file(settings_path());
}

inline bool SettingsManager::load_from_file(const std::filesystem::path& path) {
  if(path.empty()) return false;
  std::ifstream in(path);
  if(!in) return false;
  try {
    nlohmann::json doc;
    in >> doc;
    merge_from_json(doc);
    return true;
  } catch(const nlohmann::json::exception& e) {
    print_err(nullptr, "Failed to parse {}: {}", path.string(), e.what());
    return false;
  }
}

inline void SettingsManager::merge_from_json(const nlohmann::json& doc) {
  if(!doc.is_object()) {
    print_err(nullptr, "Ignoring settings file: top level is not an object");
    return;
  }
  for(const auto& item : doc.items()) {
    const auto* spec = find_spec(item.key());
    if(!spec || !spec->from_file) {
      print_err(nullptr, "Ignoring unknown setting '{}'", item.key());
      continue;
    }
    std::string error;
    if(!convert_and_store(*spec, item.value(), error)) {
      print_err(nullptr, "Ignoring invalid setting '{}': {}", item.key(), error);
    }
  }
}

inline bool SettingsManager::convert_and_store(const SettingSpec& spec,
                                               const nlohmann::json& value,
                                               std::string& error) {
  if(spec.type == "bool") {
    if(value.is_boolean()) {
      settings_[spec.key] = value.get<bool>();
      return true;
    }
    error = "expected boolean";
    return false;
  }
  if(spec.type == "uint") {
    if(value.is_number_unsigned() ||
       (value.is_number_integer() && value.get<std::int64_t>() >= 0)) {
      settings_[spec.key] = value.get<std::uint64_t>();
      return true;
    }
    error = value.is_number_integer() ? "expected a non-negative integer" : "expected integer";
    return false;
  }
  if(spec.type == "string") {
    if(value.is_string()) {
      settings_[spec.key] = value.get<std::string>();
      return true;
    }
    error = "expected string";
    return false;
  }
  error = "unsupported type '" + spec.type + "'";
  return false;
}

inline nlohmann::json SettingsManager::parse_string_value(const SettingSpec& spec,
                                                          const std::string& value,
                                                          std::string& error) const {
  error.clear();
  std::string clean = trim_copy(value);
  if(spec.type == "bool") {
    std::string v = to_lower(clean);
    if(v == "true" || v == "1" || v == "on" || v == "yes") return true;
    if(v == "false" || v == "0" || v == "off" || v == "no") return false;
    error = "expected boolean (true|false|on|off)";
    return {};
  }
  if(spec.type == "uint") {
    if(clean.empty() || !std::all_of(clean.begin(), clean.end(),
                                     [](unsigned char ch){ return std::isdigit(ch); })) {
      error = "expected a non-negative integer, got '" + clean + "'";
      return {};
    }
    try {
      return static_cast<std::uint64_t>(std::stoull(clean));
    } catch(const std::out_of_range&) {
      error = "value '" + clean + "' is too large";
      return {};
    }
  }
  if(spec.type == "string") {
    // Strings are taken verbatim: whitespace inside a path is significant.
    return value;
  }
  error = "unsupported type '" + spec.type + "'";
  return {};
}

inline bool SettingsManager::set_from_string(const std::string& key,
                                             const std::string& value,
                                             std::string& error) {
  const auto* spec = find_spec(key);
  if(!spec) {
    error = "unknown setting";
    return false;
  }
  auto parsed = parse_string_value(*spec, value, error);
  if(!error.empty()) return false;
  return convert_and_store(*spec, parsed, error);
}

inline bool SettingsManager::set_from_json(const std::string& key,
                                           const nlohmann::json& value,
                                           std::string& error) {
  const auto* spec = find_spec(key);
  if(!spec) {
    error = "unknown setting";
    return false;
  }
  error.clear();
  return convert_and_store(*spec, value, error);
}

inline std::string SettingsManager::to_lower(std::string value) {
  std::transform(value.begin(), value.end(), value.begin(),
                 [](unsigned char ch){ return static_cast<char>(std::tolower(ch)); });
  return value;
}

inline std::string SettingsManager::trim_copy(std::string value) {
  value.erase(value.begin(), std::find_if(value.begin(), value.end(),
    [](unsigned char ch){ return !std::isspace(ch); }));
  value.erase(std::find_if(value.rbegin(), value.rend(),
    [](unsigned char ch){ return !std::isspace(ch); }).base(), value.end());
  return value;
}

inline bool SettingsManager::is_bool_literal(const std::string& value) {
  std::string lowered = to_lower(trim_copy(value));
  return lowered == "true" || lowered == "false" ||
         lowered == "on" || lowered == "off" ||
         lowered == "1" || lowered == "0" ||
         lowered == "yes" || lowered == "no";
}

inline std::optional<std::string> SettingsManager::resolve_key(const std::string& token) const {
  if(const auto* spec = find_spec(token)) {
    return spec->key;
  }
  return std::nullopt;
}

inline bool SettingsManager::is_bool_setting(const std::string& key) const {
  const auto* spec = find_spec(key);
  return spec && spec->type == "bool";
}

template<typename T>
inline T SettingsManager::get(const std::string& key) const {
  if(!has(key)) {
    throw std::runtime_error("Unknown setting: " + key);
  }
  return settings_.at(key).get<T>();
}
