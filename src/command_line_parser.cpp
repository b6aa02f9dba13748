#include "command_line_parser.hpp"

#include <cctype>

#include "log.hpp"

namespace {

std::string describe_default(const SettingSpec& spec) {
  const auto& value = spec.default_value;
  if(value.is_string()) {
    auto text = value.get<std::string>();
    return text.empty() ? "\"\"" : text;
  }
  return value.dump();
}

} // namespace

CommandLineParser::CommandLineParser(std::string process_name,
                                     std::vector<std::string> positional_keys)
  : process_name_(std::move(process_name)),
    positional_keys_(std::move(positional_keys)) {}

bool CommandLineParser::looks_like_option(const std::string& token) {
  if(token.rfind("--", 0) == 0) return true;
  return token.size() >= 2 && token[0] == '-' &&
         std::isalpha(static_cast<unsigned char>(token[1]));
}

void CommandLineParser::parse(int argc, char* argv[], SettingsManager& settings) const {
  std::vector<std::string> args;
  for(int i = 1; i < argc; ++i) args.emplace_back(argv[i]);
  parse(args, settings);
}

void CommandLineParser::parse(const std::vector<std::string>& args, SettingsManager& settings) const {
  std::size_t next_positional = 0;
  std::string error;

  for(std::size_t i = 0; i < args.size(); ++i) {
    const auto& token = args[i];
    const bool long_form = token.rfind("--", 0) == 0;
    const SettingSpec* spec = nullptr;
    if(long_form) {
      spec = settings.find_spec(token.substr(2));
      if(!spec) throw CommandLineError("Unknown option " + token);
    } else if(token.size() > 1 && token[0] == '-') {
      // Unknown short tokens fall through as positionals ("-" or "-1.bin").
      spec = settings.find_spec(token.substr(1));
    }

    if(spec) {
      std::string value;
      if(spec->type == SettingType::Bool) {
        const bool has_literal = i + 1 < args.size() && !looks_like_option(args[i + 1]) &&
                                 SettingsManager::is_bool_literal(args[i + 1]);
        value = has_literal ? args[++i] : "true";
      } else if(i + 1 < args.size()) {
        value = args[++i];
      } else {
        throw CommandLineError("Missing value for option '" + token + "'");
      }
      if(!settings.set_from_string(spec->key, value, error)) {
        throw CommandLineError("Invalid value for option '" + token + "': " + error);
      }
      continue;
    }

    if(next_positional >= positional_keys_.size()) {
      throw CommandLineError("Unexpected argument '" + token + "'");
    }
    const auto& key = positional_keys_[next_positional++];
    if(!settings.set_from_string(key, token, error)) {
      throw CommandLineError("Invalid value for " + key + " '" + token + "': " + error);
    }
  }
}

void CommandLineParser::usage(const SettingsManager& settings) const {
  std::string synopsis = process_name_ + " [options]";
  for(const auto& key : positional_keys_) synopsis += " [" + key + "]";

  print_out(nullptr, "{} - share a file or fetch one from a ticket", process_name_);
  print_out(nullptr, "Usage:");
  print_out(nullptr, "  {}", synopsis);
  print_out(nullptr, "");
  print_out(nullptr, "Options:");
  for(const auto& spec : settings.specs()) {
    std::string hint = spec.type == SettingType::Bool
      ? "[true|false]"
      : std::string("<") + to_string(spec.type) + ">";
    std::string aliases;
    for(const auto& alias : spec.aliases) {
      aliases += aliases.empty() ? " (alias: -" : ", -";
      aliases += alias;
    }
    if(!aliases.empty()) aliases += ")";
    print_out(nullptr, "  --{:<20} {:<12} {}{} (default: {})",
              spec.key, hint, spec.description, aliases, describe_default(spec));
  }
  print_out(nullptr, "");
  print_out(nullptr, "Interactive commands are listed by 'help' once running.");
}
