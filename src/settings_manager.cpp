#include "settings_manager.hpp"

#include <algorithm>
#include <cctype>
#include <fstream>

#include "log.hpp"
#include "utils.hpp"

namespace {

// "min"/"max" bound int settings; "persistent": false keeps one-shot values
// out of the settings file.
const nlohmann::json kSettingsTable = nlohmann::json::array({
  {{"key","listen_ip"},           {"aliases", {"li"}},           {"type","string"}, {"default","0.0.0.0"},   {"description","Interface/IP the provider binds"}},
  {{"key","listen_port"},         {"aliases", {"lp"}},           {"type","int"},    {"default",0},           {"min",0}, {"max",65535}, {"description","Provider TCP port (0 = ephemeral)"}},
  {{"key","advertise_ip"},        {"aliases", {"ai"}},           {"type","string"}, {"default","127.0.0.1"}, {"description","Address written into tickets"}},
  {{"key","peer_id"},             {"aliases", {"id"}},           {"type","string"}, {"default",""},          {"description","Node id written into tickets (random if empty)"}},
  {{"key","download_dir"},        {"aliases", {"dir","target"}}, {"type","string"}, {"default",""},          {"description","Default download folder (current directory if empty)"}},
  {{"key","chunk_size"},          {"aliases", {"cs"}},           {"type","int"},    {"default",262144},      {"min",4096}, {"max",262144}, {"description","Transfer chunk size in bytes"}},
  {{"key","progress_capacity"},   {"aliases", {"pc"}},           {"type","int"},    {"default",32},          {"min",1}, {"max",4096}, {"description","Progress events buffered before the engine waits"}},
  {{"key","cancel_superseded"},   {"aliases", {"cancel"}},       {"type","bool"},   {"default",false},       {"description","Cancel a running share when a new file is selected"}},
  {{"key","frame_interval_ms"},   {"aliases", {"frame","fi"}},   {"type","int"},    {"default",250},         {"min",16}, {"max",10000}, {"description","Milliseconds between status redraws"}},
  {{"key","progress_meter_size"}, {"aliases", {"meter","pms"}},  {"type","int"},    {"default",40},          {"min",8}, {"max",200}, {"description","Number of characters used for the progress meter"}},
  {{"key","connect_timeout_ms"},  {"aliases", {"timeout","ct"}}, {"type","int"},    {"default",5000},        {"min",100}, {"max",600000}, {"description","Connect/read timeout while fetching"}},
  {{"key","log_file"},            {"aliases", {"lf"}},           {"type","string"}, {"default",""},          {"description","Also write log lines to this file"}},
  {{"key","verbose"},             {"aliases", {"v"}},            {"type","bool"},   {"default",false},       {"description","Enable verbose logging"}},
  {{"key","share"},               {"aliases", {"s"}},            {"type","string"}, {"default",""},          {"description","File to share right after startup"}, {"persistent", false}},
  {{"key","ticket"},              {"aliases", {"t"}},            {"type","string"}, {"default",""},          {"description","Ticket to download right after startup"}, {"persistent", false}},
  {{"key","help"},                {"aliases", {"h","?"}},        {"type","bool"},   {"default",false},       {"description","Show command help and exit"}, {"persistent", false}},
  {{"key","save"},                {"aliases", {"persist"}},      {"type","bool"},   {"default",false},       {"description","Persist current settings to disk"}, {"persistent", false}}
});

std::string lower(std::string value) {
  std::transform(value.begin(), value.end(), value.begin(),
                 [](unsigned char ch){ return static_cast<char>(std::tolower(ch)); });
  return value;
}

std::optional<bool> parse_bool(const std::string& text) {
  auto v = lower(trim_copy(text));
  if(v == "true" || v == "1" || v == "on" || v == "yes") return true;
  if(v == "false" || v == "0" || v == "off" || v == "no") return false;
  return std::nullopt;
}

} // namespace

const char* to_string(SettingType type) {
  switch(type) {
    case SettingType::Bool: return "bool";
    case SettingType::Int: return "int";
    case SettingType::String: return "string";
  }
  return "string";
}

void from_json(const nlohmann::json& j, SettingSpec& spec) {
  spec.key = j.at("key").get<std::string>();
  spec.aliases.clear();
  for(const auto& alias : j.value("aliases", nlohmann::json::array())) {
    spec.aliases.push_back(lower(alias.get<std::string>()));
  }
  const auto type = j.at("type").get<std::string>();
  if(type == "bool") {
    spec.type = SettingType::Bool;
  } else if(type == "int") {
    spec.type = SettingType::Int;
  } else if(type == "string") {
    spec.type = SettingType::String;
  } else {
    throw std::runtime_error("setting '" + spec.key + "' has unknown type '" + type + "'");
  }
  spec.default_value = j.at("default");
  spec.min = j.contains("min") ? std::optional<long long>(j.at("min").get<long long>()) : std::nullopt;
  spec.max = j.contains("max") ? std::optional<long long>(j.at("max").get<long long>()) : std::nullopt;
  spec.description = j.value("description", "");
  spec.persistent = j.value("persistent", true);
}

const std::vector<SettingSpec>& default_setting_specs() {
  static const std::vector<SettingSpec> specs = kSettingsTable.get<std::vector<SettingSpec>>();
  return specs;
}

SettingsManager::SettingsManager()
  : SettingsManager(default_setting_specs()) {}

SettingsManager::SettingsManager(std::vector<SettingSpec> specs)
  : specs_(std::move(specs)) {
  for(const auto& spec : specs_) {
    values_[spec.key] = spec.default_value;
  }
}

const SettingSpec* SettingsManager::find_spec(const std::string& token) const {
  const auto wanted = lower(token);
  for(const auto& spec : specs_) {
    if(lower(spec.key) == wanted ||
       std::find(spec.aliases.begin(), spec.aliases.end(), wanted) != spec.aliases.end()) {
      return &spec;
    }
  }
  return nullptr;
}

std::optional<std::string> SettingsManager::resolve_key(const std::string& token) const {
  if(const auto* spec = find_spec(token)) return spec->key;
  return std::nullopt;
}

bool SettingsManager::is_bool_setting(const std::string& key) const {
  const auto* spec = find_spec(key);
  return spec && spec->type == SettingType::Bool;
}

bool SettingsManager::is_bool_literal(const std::string& value) {
  return parse_bool(value).has_value();
}

bool SettingsManager::store(const SettingSpec& spec, const nlohmann::json& value, std::string& error) {
  switch(spec.type) {
    case SettingType::Bool:
      if(!value.is_boolean()) {
        error = "expected boolean (true|false|on|off)";
        return false;
      }
      break;
    case SettingType::Int: {
      if(!value.is_number_integer()) {
        error = "expected integer";
        return false;
      }
      const auto v = value.get<long long>();
      if((spec.min && v < *spec.min) || (spec.max && v > *spec.max)) {
        error = fmt::format("out of range [{}, {}]", spec.min.value_or(v), spec.max.value_or(v));
        return false;
      }
      values_[spec.key] = static_cast<int>(v);
      return true;
    }
    case SettingType::String:
      if(!value.is_string()) {
        error = "expected string";
        return false;
      }
      break;
  }
  values_[spec.key] = value;
  return true;
}

bool SettingsManager::set_from_string(const std::string& key, const std::string& value, std::string& error) {
  error.clear();
  const auto* spec = find_spec(key);
  if(!spec) {
    error = "unknown setting";
    return false;
  }
  const auto text = trim_copy(value);
  switch(spec->type) {
    case SettingType::Bool: {
      auto parsed = parse_bool(text);
      if(!parsed) {
        error = "expected boolean (true|false|on|off)";
        return false;
      }
      return store(*spec, *parsed, error);
    }
    case SettingType::Int:
      try {
        std::size_t used = 0;
        long long parsed = std::stoll(text, &used);
        if(used != text.size()) {
          error = "trailing characters after number";
          return false;
        }
        return store(*spec, parsed, error);
      } catch(const std::exception& e) {
        error = std::string("not a number (") + e.what() + ")";
        return false;
      }
    case SettingType::String:
      return store(*spec, text, error);
  }
  return false;
}

void SettingsManager::set_settings_path(const std::filesystem::path& path) {
  path_override_ = path;
}

std::filesystem::path SettingsManager::settings_path() const {
  if(!path_override_.empty()) return path_override_;
  return std::filesystem::current_path() / ".config" / "settings.json";
}

// Only persistent keys are taken from the file; a stale one-shot value must
// not trigger a share or download.
bool SettingsManager::load() {
  const auto path = settings_path();
  std::ifstream in(path);
  if(!in) return false;

  nlohmann::json doc;
  try {
    in >> doc;
  } catch(const nlohmann::json::exception& e) {
    print_err(nullptr, "Failed to parse {}: {}", path.string(), e.what());
    return false;
  }
  if(!doc.is_object()) {
    print_err(nullptr, "Ignoring {}: not a JSON object", path.string());
    return false;
  }

  for(const auto& item : doc.items()) {
    const auto* spec = find_spec(item.key());
    if(!spec || !spec->persistent) continue;
    std::string error;
    if(!store(*spec, item.value(), error)) {
      print_err(nullptr, "Ignoring invalid setting '{}': {}", item.key(), error);
    }
  }
  return true;
}

bool SettingsManager::save() const {
  const auto path = settings_path();
  std::error_code ec;
  if(path.has_parent_path()) {
    std::filesystem::create_directories(path.parent_path(), ec);
  }
  std::ofstream out(path);
  if(!out) {
    print_err(nullptr, "Unable to write {}", path.string());
    return false;
  }
  out << get_json(true).dump(2) << "\n";
  return static_cast<bool>(out);
}

nlohmann::json SettingsManager::get_json(bool persistent_only) const {
  nlohmann::json doc = nlohmann::json::object();
  for(const auto& spec : specs_) {
    if(persistent_only && !spec.persistent) continue;
    doc[spec.key] = values_.at(spec.key);
  }
  return doc;
}
