#pragma once

#include <algorithm>
#include <cctype>
#include <charconv>
#include <cstddef>
#include <filesystem>
#include <fstream>
#include <optional>
#include <stdexcept>
#include <string>
#include <system_error>
#include <utility>
#include <vector>

#include <nlohmann/json.hpp>

#include "log.hpp"

inline const nlohmann::json SETTINGS_SPECIFICATION = nlohmann::json::array({
  {{"key","device_id"},           {"aliases", {"id"}},                 {"type","string"}, {"default",""},                {"description","Stable device identifier (random UUID when empty)"}, {"persistent", true}},
  {{"key","device_name"},         {"aliases", {"name","dn"}},          {"type","string"}, {"default",""},                {"description","Name announced to peers (host name when empty)"}, {"persistent", true}},
  {{"key","local_ip"},            {"aliases", {"ip"}},                 {"type","string"}, {"default",""},                {"description","Address announced to peers (auto-detected when empty)"}, {"persistent", true}},
  {{"key","listen_ip"},           {"aliases", {"li"}},                 {"type","string"}, {"default","0.0.0.0"},         {"description","Interface the discovery listener binds"}, {"persistent", true}},
  {{"key","discovery_port"},      {"aliases", {"dp"}},                 {"type","int"},    {"default",9988}, {"min",0}, {"max",65535}, {"description","UDP port beacons are sent to and received on"}, {"persistent", true}},
  {{"key","broadcast_address"},   {"aliases", {"bcast"}},              {"type","string"}, {"default","255.255.255.255"}, {"description","Beacon broadcast destination (empty disables)"}, {"persistent", true}},
  {{"key","multicast_group"},     {"aliases", {"mcast"}},              {"type","string"}, {"default","224.0.0.251"},     {"description","Beacon multicast group (empty disables)"}, {"persistent", true}},
  {{"key","beacon_interval_ms"},  {"aliases", {"interval","bi"}},      {"type","int"},    {"default",1000}, {"min",10}, {"max",3600000}, {"description","Milliseconds between beacons"}, {"persistent", true}},
  {{"key","http_bind_ip"},        {"aliases", {"hi"}},                 {"type","string"}, {"default","0.0.0.0"},         {"description","Interface the file server binds"}, {"persistent", true}},
  {{"key","http_port"},           {"aliases", {"port","hp"}},          {"type","int"},    {"default",8080}, {"min",0}, {"max",65535}, {"description","File server TCP port (0 = ephemeral)"}, {"persistent", true}},
  {{"key","http_threads"},        {"aliases", {"ht"}},                 {"type","int"},    {"default",2}, {"min",1}, {"max",64}, {"description","Threads serving HTTP connections"}, {"persistent", true}},
  {{"key","shared_dir"},          {"aliases", {"dir","sd"}},           {"type","string"}, {"default","shared"},          {"description","Directory served and written by the file server"}, {"persistent", true}},
  {{"key","max_upload_bytes"},    {"aliases", {"mub"}},                {"type","int"},    {"default",536870912}, {"min",0}, {"max",2147483647}, {"description","Largest accepted request body"}, {"persistent", true}},
  {{"key","download_timeout_ms"}, {"aliases", {"dt"}},                 {"type","int"},    {"default",30000}, {"min",1}, {"max",86400000}, {"description","Upper bound for one download"}, {"persistent", true}},
  {{"key","enable_beacon"},       {"aliases", {"beacon"}},             {"type","bool"},   {"default",true},              {"description","Run the beacon broadcaster"}, {"persistent", true}},
  {{"key","enable_listener"},     {"aliases", {"listener"}},           {"type","bool"},   {"default",true},              {"description","Run the discovery listener"}, {"persistent", true}},
  {{"key","enable_server"},       {"aliases", {"server"}},             {"type","bool"},   {"default",true},              {"description","Run the HTTP file server"}, {"persistent", true}},
  {{"key","verbose"},             {"aliases", {"v"}},                  {"type","bool"},   {"default",false},             {"description","Enable verbose logging"}, {"persistent", true}},
  {{"key","log_file"},            {"aliases", {"lf"}},                 {"type","string"}, {"default",""},                {"description","Also append log output to this file"}, {"persistent", true}},
  {{"key","help"},                {"aliases", {"h","?"}},              {"type","bool"},   {"default",false},             {"description","Show command help and exit"}, {"persistent", false}},
  {{"key","save"},                {"aliases", {"persist"}},            {"type","bool"},   {"default",false},             {"description","Persist current settings to disk"}, {"persistent", false}}
});

class SettingsManager {
public:
  SettingsManager();
  explicit SettingsManager(const nlohmann::json& specification);

  template<typename T>
  T get(const std::string& key) const;

  bool has(const std::string& key) const;

  bool set_from_string(const std::string& key, const std::string& value, std::string& error);
  bool set_from_json(const std::string& key, const nlohmann::json& value, std::string& error);

  // Persistent settings to and from settings_path(). load() keeps the
  // defaults when the file is missing or unreadable.
  bool save() const;
  bool load();

  bool save_requested() const { return has("save") && get<bool>("save"); }
  bool help_requested() const { return has("help") && get<bool>("help"); }

  std::optional<std::string> resolve_key(const std::string& token) const;
  bool is_bool_setting(const std::string& key) const;

  std::filesystem::path settings_path() const;
  void set_settings_path(const std::filesystem::path& path);

  static std::string to_lower(std::string value);
  static std::string trim_copy(std::string value);
  // true/false, on/off, yes/no, 1/0 in any case; nullopt for anything else.
  static std::optional<bool> parse_bool_literal(const std::string& value);
  static bool is_bool_literal(const std::string& value) { return parse_bool_literal(value).has_value(); }

private:
  enum class SettingType { Bool, Int, String };

  struct SettingSpec {
    std::string key;
    std::vector<std::string> aliases;
    std::string normalized_key;
    SettingType type = SettingType::String;
    nlohmann::json default_value;
    std::optional<long long> min_value;
    std::optional<long long> max_value;
    std::string description;
    bool persistent = true;
  };

  static std::vector<SettingSpec> build_setting_specs(const nlohmann::json& specification);

  const SettingSpec* find_spec(const std::string& token) const;

  void merge_from_json(const nlohmann::json& doc);
  nlohmann::json persistent_values() const;

  bool convert_and_store(const SettingSpec& spec, const nlohmann::json& value, std::string& error);
  nlohmann::json parse_string_value(const SettingSpec& spec, const std::string& value, std::string& error) const;

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
    spec.normalized_key = to_lower(spec.key);
    if(entry.contains("aliases")) {
      spec.aliases = entry.at("aliases").get<std::vector<std::string>>();
      for(auto& alias : spec.aliases) {
        alias = to_lower(alias);
      }
    }
    const auto type = entry.at("type").get<std::string>();
    if(type == "bool") spec.type = SettingType::Bool;
    else if(type == "int") spec.type = SettingType::Int;
    else if(type == "string") spec.type = SettingType::String;
    else throw std::invalid_argument("setting " + spec.key + " has unknown type " + type);
    spec.default_value = entry.at("default");
    if(entry.contains("min")) spec.min_value = entry.at("min").get<long long>();
    if(entry.contains("max")) spec.max_value = entry.at("max").get<long long>();
    spec.description = entry.value("description", "");
    spec.persistent = entry.value("persistent", true);
    result.push_back(std::move(spec));
  }
  return result;
}

inline SettingsManager::SettingsManager()
  : SettingsManager(SETTINGS_SPECIFICATION) {}

inline SettingsManager::SettingsManager(const nlohmann::json& specification)
  : settings_(nlohmann::json::object()),
    setting_specs_(build_setting_specs(specification)) {
  for(const auto& spec : setting_specs_) settings_[spec.key] = spec.default_value;
}

// Matches the canonical key or any alias, case-insensitively.
inline const SettingsManager::SettingSpec* SettingsManager::find_spec(const std::string& token) const {
  const std::string lowered = to_lower(token);
  auto it = std::find_if(setting_specs_.begin(), setting_specs_.end(), [&](const SettingSpec& spec){
    return lowered == spec.normalized_key ||
           std::find(spec.aliases.begin(), spec.aliases.end(), lowered) != spec.aliases.end();
  });
  return it == setting_specs_.end() ? nullptr : &*it;
}

inline bool SettingsManager::has(const std::string& key) const {
  return settings_.contains(key);
}

inline void SettingsManager::set_settings_path(const std::filesystem::path& path) {
  settings_path_override_ = path;
}

inline std::filesystem::path SettingsManager::settings_path() const {
  if(!settings_path_override_.empty()) {
    return settings_path_override_;
  }
  return std::filesystem::current_path() / ".config" / "settings.json";
}

inline bool SettingsManager::load() {
  const auto path = settings_path();
  std::ifstream in(path);
  if(!in) return false;
  nlohmann::json doc = nlohmann::json::parse(in, nullptr, false);
  if(doc.is_discarded()) {
    log_to(nullptr, LogChannel::PrintErr, "Failed to parse {}; keeping defaults", path.string());
    return false;
  }
  merge_from_json(doc);
  return true;
}

inline bool SettingsManager::save() const {
  const auto path = settings_path();
  std::error_code ec;
  if(path.has_parent_path()) std::filesystem::create_directories(path.parent_path(), ec);
  std::ofstream out(path);
  if(!out) {
    log_to(nullptr, LogChannel::PrintErr, "Unable to write {}", path.string());
    return false;
  }
  out << persistent_values().dump(2);
  return static_cast<bool>(out);
}

inline void SettingsManager::merge_from_json(const nlohmann::json& doc) {
  if(!doc.is_object()) return;
  for(const auto& item : doc.items()) {
    const auto* spec = find_spec(item.key());
    if(!spec) continue;
    std::string error;
    if(!convert_and_store(*spec, item.value(), error) && !error.empty()) {
      log_to(nullptr, LogChannel::PrintErr, "Ignoring invalid setting '{}': {}", item.key(), error);
    }
  }
}

inline nlohmann::json SettingsManager::persistent_values() const {
  nlohmann::json doc = nlohmann::json::object();
  for(const auto& spec : setting_specs_) {
    if(!spec.persistent) continue;
    if(settings_.contains(spec.key)) {
      doc[spec.key] = settings_.at(spec.key);
    }
  }
  return doc;
}

inline bool SettingsManager::convert_and_store(const SettingSpec& spec,
                                               const nlohmann::json& value,
                                               std::string& error) {
  switch(spec.type) {
    case SettingType::Bool:
      if(value.is_boolean()) {
        settings_[spec.key] = value.get<bool>();
      } else if(value.is_number_integer()) {
        settings_[spec.key] = (value.get<long long>() != 0);
      } else {
        error = "expected boolean";
        return false;
      }
      return true;
    case SettingType::Int: {
      if(!value.is_number_integer()) {
        error = "expected integer";
        return false;
      }
      auto number = value.get<long long>();
      if((spec.min_value && number < *spec.min_value) ||
         (spec.max_value && number > *spec.max_value)) {
        error = "out of range [" + std::to_string(spec.min_value.value_or(0)) + ", " +
                std::to_string(spec.max_value.value_or(0)) + "]";
        return false;
      }
      settings_[spec.key] = static_cast<int>(number);
      return true;
    }
    case SettingType::String:
      if(!value.is_string()) {
        error = "expected string";
        return false;
      }
      settings_[spec.key] = value.get<std::string>();
      return true;
  }
  error = "unknown type";
  return false;
}

// Command-line text to the JSON value convert_and_store expects.
inline nlohmann::json SettingsManager::parse_string_value(const SettingSpec& spec,
                                                          const std::string& value,
                                                          std::string& error) const {
  error.clear();
  std::string clean = trim_copy(value);
  switch(spec.type) {
    case SettingType::Bool:
      if(auto flag = parse_bool_literal(clean)) return *flag;
      error = "expected boolean (true|false|on|off)";
      return {};
    case SettingType::Int: {
      long long parsed = 0;
      auto [ptr, ec] = std::from_chars(clean.data(), clean.data() + clean.size(), parsed);
      if(ec != std::errc() || clean.empty()) {
        error = "expected integer";
        return {};
      }
      if(ptr != clean.data() + clean.size()) {
        error = "trailing characters after number";
        return {};
      }
      return parsed;
    }
    case SettingType::String:
      return clean;
  }
  error = "unsupported type";
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

inline std::optional<bool> SettingsManager::parse_bool_literal(const std::string& value) {
  static const std::pair<const char*, bool> kLiterals[] = {
    {"true", true}, {"on", true}, {"yes", true}, {"1", true},
    {"false", false}, {"off", false}, {"no", false}, {"0", false},
  };
  const std::string lowered = to_lower(trim_copy(value));
  for(const auto& [text, flag] : kLiterals) {
    if(lowered == text) return flag;
  }
  return std::nullopt;
}

inline std::optional<std::string> SettingsManager::resolve_key(const std::string& token) const {
  if(const auto* spec = find_spec(token)) {
    return spec->key;
  }
  return std::nullopt;
}

inline bool SettingsManager::is_bool_setting(const std::string& key) const {
  const auto* spec = find_spec(key);
  return spec && spec->type == SettingType::Bool;
}

template<typename T>
inline T SettingsManager::get(const std::string& key) const {
  if(!has(key)) {
    throw std::runtime_error("Unknown setting: " + key);
  }
  return settings_.at(key).get<T>();
}
