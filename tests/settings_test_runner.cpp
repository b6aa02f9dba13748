#include "command_line_parser.hpp"
#include "log.hpp"
#include "settings_manager.hpp"
#include "test_runner_utils.hpp"

#include <fstream>
#include <string>
#include <vector>

using sendme::test::TempWorkspace;
using sendme::test::TestCase;
using sendme::test::TestContext;

namespace {

bool throws_command_line_error(const std::vector<std::string>& args) {
  SettingsManager settings;
  CommandLineParser parser;
  try {
    parser.parse(args, settings);
  } catch(const CommandLineError&) {
    return true;
  }
  return false;
}

bool test_defaults(TestContext&) {
  SettingsManager settings;
  SENDME_CHECK(settings.get<std::string>("listen_ip") == "0.0.0.0");
  SENDME_CHECK(settings.get<int>("listen_port") == 0);
  SENDME_CHECK(settings.get<int>("chunk_size") == 262144);
  SENDME_CHECK(settings.get<int>("progress_capacity") == 32);
  SENDME_CHECK(settings.get<int>("frame_interval_ms") == 250);
  SENDME_CHECK(!settings.get<bool>("cancel_superseded"));
  SENDME_CHECK(!settings.help_requested());
  SENDME_CHECK(!settings.save_requested());
  return true;
}

bool test_string_values_validated(TestContext&) {
  SettingsManager settings;
  std::string error;
  SENDME_CHECK(settings.set_from_string("listen_port", " 4100 ", error));
  SENDME_CHECK(settings.get<int>("listen_port") == 4100);
  SENDME_CHECK(!settings.set_from_string("listen_port", "70000", error));
  SENDME_CHECK(error.find("out of range") != std::string::npos);
  SENDME_CHECK(!settings.set_from_string("listen_port", "41x", error));
  SENDME_CHECK(!settings.set_from_string("chunk_size", "1024", error));
  SENDME_CHECK(settings.get<int>("chunk_size") == 262144);
  SENDME_CHECK(settings.set_from_string("cancel", "on", error));
  SENDME_CHECK(settings.get<bool>("cancel_superseded"));
  SENDME_CHECK(!settings.set_from_string("verbose", "maybe", error));
  SENDME_CHECK(!settings.set_from_string("no_such_key", "1", error));
  SENDME_CHECK(error == "unknown setting");
  return true;
}

bool test_aliases_resolve(TestContext&) {
  SettingsManager settings;
  SENDME_CHECK(settings.resolve_key("lp") == std::string("listen_port"));
  SENDME_CHECK(settings.resolve_key("TARGET") == std::string("download_dir"));
  SENDME_CHECK(settings.resolve_key("?") == std::string("help"));
  SENDME_CHECK(!settings.resolve_key("bogus"));
  return true;
}

bool test_command_line(TestContext&) {
  SettingsManager settings;
  CommandLineParser parser;
  parser.parse(std::vector<std::string>{"--listen_port", "4200", "-v", "-dir", "/tmp/in", "photo.jpg"}, settings);
  SENDME_CHECK(settings.get<int>("listen_port") == 4200);
  SENDME_CHECK(settings.get<bool>("verbose"));
  SENDME_CHECK(settings.get<std::string>("download_dir") == "/tmp/in");
  SENDME_CHECK(settings.get<std::string>("share") == "photo.jpg");

  SettingsManager flags;
  parser.parse(std::vector<std::string>{"--verbose", "false", "--cancel_superseded"}, flags);
  SENDME_CHECK(!flags.get<bool>("verbose"));
  SENDME_CHECK(flags.get<bool>("cancel_superseded"));
  return true;
}

bool test_command_line_errors(TestContext&) {
  SENDME_CHECK(throws_command_line_error({"--nope", "1"}));
  SENDME_CHECK(throws_command_line_error({"--listen_port"}));
  SENDME_CHECK(throws_command_line_error({"--listen_port", "abc"}));
  SENDME_CHECK(throws_command_line_error({"a.txt", "b.txt"}));
  SENDME_CHECK(!throws_command_line_error({"-h"}));
  return true;
}

bool test_persistence_skips_one_shot_keys(TestContext&) {
  TempWorkspace ws("sendme-settings");
  auto path = ws.root() / ".config" / "settings.json";

  SettingsManager settings;
  settings.set_settings_path(path);
  std::string error;
  SENDME_CHECK(settings.set_from_string("listen_port", "4300", error));
  SENDME_CHECK(settings.set_from_string("ticket", "blobabc", error));
  SENDME_CHECK(settings.save());

  auto saved = settings.get_json(true);
  SENDME_CHECK(!saved.contains("ticket"));
  SENDME_CHECK(!saved.contains("help"));

  SettingsManager reloaded;
  reloaded.set_settings_path(path);
  SENDME_CHECK(reloaded.load());
  SENDME_CHECK(reloaded.get<int>("listen_port") == 4300);
  SENDME_CHECK(reloaded.get<std::string>("ticket").empty());
  return true;
}

bool test_load_ignores_stale_and_invalid_entries(TestContext&) {
  TempWorkspace ws("sendme-settings");
  auto path = ws.write_file("settings.json",
    R"({"share":"old.bin","chunk_size":12,"peer_id":"laptop","unknown":true})");
  SettingsManager settings;
  settings.set_settings_path(path);
  SENDME_CHECK(settings.load());
  SENDME_CHECK(settings.get<std::string>("share").empty());
  SENDME_CHECK(settings.get<int>("chunk_size") == 262144);
  SENDME_CHECK(settings.get<std::string>("peer_id") == "laptop");

  auto broken = ws.write_file("broken.json", "{ not json");
  SettingsManager untouched;
  untouched.set_settings_path(broken);
  SENDME_CHECK(!untouched.load());
  SENDME_CHECK(untouched.get<int>("listen_port") == 0);
  return true;
}

bool test_listener_claims_line(TestContext&) {
  Logger logger("unit");
  std::vector<std::string> seen;
  auto handle = logger.add_listener([&](const std::string& channel,
                                        spdlog::level::level_enum level,
                                        const std::string& message) {
    seen.push_back(channel + "|" + std::to_string(static_cast<int>(level)) + "|" + message);
    return true;
  });
  logger.warn("disk {} full", "nearly");
  logger.remove_listener(handle);
  logger.debug("not captured");
  SENDME_CHECK(seen.size() == 1);
  SENDME_CHECK(seen[0] == "unit:warn|" + std::to_string(static_cast<int>(spdlog::level::warn)) + "|disk nearly full");
  return true;
}

bool test_log_file_mirrors_lines(TestContext&) {
  TempWorkspace ws("sendme-settings");
  auto path = ws.root() / "sendme.log";
  const bool passthrough = log_passthrough();
  set_log_passthrough(true);
  init(false, path.string());
  Logger logger("filetest");
  logger.warn("written to {}", "file");
  logger.debug("below the level");
  init(false);
  set_log_passthrough(passthrough);

  auto text = sendme::test::read_file(path);
  SENDME_CHECK(text.find("[filetest] written to file") != std::string::npos);
  SENDME_CHECK(text.find("below the level") == std::string::npos);
  return true;
}

} // namespace

int main(int argc, char** argv) {
  std::vector<TestCase> tests = {
    {"defaults", test_defaults},
    {"string_values_validated", test_string_values_validated},
    {"aliases_resolve", test_aliases_resolve},
    {"command_line", test_command_line},
    {"command_line_errors", test_command_line_errors},
    {"persistence_skips_one_shot_keys", test_persistence_skips_one_shot_keys},
    {"load_ignores_stale_and_invalid_entries", test_load_ignores_stale_and_invalid_entries},
    {"listener_claims_line", test_listener_claims_line},
    {"log_file_mirrors_lines", test_log_file_mirrors_lines}
  };
  return sendme::test::run_test_cases("settings", tests, argc, argv);
}
