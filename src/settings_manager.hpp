#pragma once

#include <filesystem>
#include <optional>
#include <stdexcept>
#include <string>
#include <vector>

#include <nlohmann/json.hpp>

enum class SettingType { Bool, Int, String };

const char* to_string(SettingType type);

struct SettingSpec {
  std::string key;
  std::vector<std::string> aliases; // lower case
  SettingType type = SettingType::String;
  nlohmann::json default_value;
  std::optional<long long> min;
  std::optional<long long> max;
  std::string description;
  bool persistent = true; // false: never written to or read from the settings file
};

void from_json(const nlohmann::json& j, SettingSpec& spec);

// Every setting sendme understands, in usage order.
const std::vector<SettingSpec>& default_setting_specs();

// Typed settings backed by a JSON document. Values arrive from the settings
// file, the command line, or defaults; each is checked against its spec.
class SettingsManager {
public:
  SettingsManager();
  explicit SettingsManager(std::vector<SettingSpec> specs);

  // Throws std::runtime_error for an unknown key.
  template<typename T>
  T get(const std::string& key) const {
    auto it = values_.find(key);
    if(it == values_.end()) {
      throw std::runtime_error("Unknown setting: " + key);
    }
    return it->template get<T>();
  }

  // Accepts the key or any alias, case-insensitively.
  const SettingSpec* find_spec(const std::string& token) const;
  std::optional<std::string> resolve_key(const std::string& token) const;
  bool is_bool_setting(const std::string& key) const;
  const std::vector<SettingSpec>& specs() const { return specs_; }

  bool set_from_string(const std::string& key, const std::string& value, std::string& error);

  std::filesystem::path settings_path() const;
  void set_settings_path(const std::filesystem::path& path);
  bool load();
  bool save() const;

  bool save_requested() const { return get<bool>("save"); }
  bool help_requested() const { return get<bool>("help"); }

  nlohmann::json get_json(bool persistent_only = true) const;

  static bool is_bool_literal(const std::string& value);

private:
  bool store(const SettingSpec& spec, const nlohmann::json& value, std::string& error);

  std::vector<SettingSpec> specs_;
  nlohmann::json values_ = nlohmann::json::object();
  std::filesystem::path path_override_;
};
