#pragma once

#include <stdexcept>
#include <string>
#include <vector>

#include "settings_manager.hpp"

// Bad command line; main prints the message followed by usage().
class CommandLineError : public std::runtime_error {
public:
  using std::runtime_error::runtime_error;
};

// Applies "--key value", "-alias value" and bare positional arguments to a
// SettingsManager. Bool settings take an optional literal ("-v", "-v off").
class CommandLineParser {
public:
  explicit CommandLineParser(std::string process_name = "sendme",
                             std::vector<std::string> positional_keys = {"share"});

  // Throws CommandLineError.
  void parse(int argc, char* argv[], SettingsManager& settings) const;
  void parse(const std::vector<std::string>& args, SettingsManager& settings) const;

  void usage(const SettingsManager& settings) const;

private:
  static bool looks_like_option(const std::string& token);

  std::string process_name_;
  std::vector<std::string> positional_keys_;
};
