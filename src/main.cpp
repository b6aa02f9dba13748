#include <cpptrace/cpptrace.hpp>

#include <chrono>
#include <filesystem>
#include <memory>

#include "command_line_parser.hpp"
#include "console_frontend.hpp"
#include "log.hpp"
#include "mesh_transfer_engine.hpp"
#include "settings_manager.hpp"
#include "shared_state.hpp"
#include "worker.hpp"

int main(int argc, char** argv){
  try {
    auto settings = std::make_shared<SettingsManager>();
    settings->set_settings_path(std::filesystem::current_path() / ".config" / "settings.json");
    settings->load();

    CommandLineParser parser("sendme");
    try {
      parser.parse(argc, argv, *settings);
    } catch(const CommandLineError& e) {
      print_err(nullptr, "{}", e.what());
      parser.usage(*settings);
      return 1;
    }
    if(settings->help_requested()) {
      parser.usage(*settings);
      return 0;
    }

    init(settings->get<bool>("verbose"), settings->get<std::string>("log_file"));
    auto logger = std::make_shared<Logger>("sendme");
    logger->debug("Verbose logging enabled");

    if(settings->save_requested()) {
      if(!settings->save()) {
        logger->error("Unable to persist settings to {}", settings->settings_path().string());
      }
    }

    MeshTransferEngine::Options engine_options;
    engine_options.listen_ip = settings->get<std::string>("listen_ip");
    engine_options.listen_port = static_cast<uint16_t>(settings->get<int>("listen_port"));
    engine_options.advertise_ip = settings->get<std::string>("advertise_ip");
    engine_options.peer_id = settings->get<std::string>("peer_id");
    engine_options.chunk_size = static_cast<std::size_t>(settings->get<int>("chunk_size"));
    engine_options.io_timeout = std::chrono::milliseconds(settings->get<int>("connect_timeout_ms"));
    auto engine = std::make_shared<MeshTransferEngine>(engine_options, std::make_shared<Logger>("engine"));
    engine->start();

    auto state = std::make_shared<StateStore>();
    Worker::Options worker_options;
    worker_options.progress_capacity = static_cast<std::size_t>(settings->get<int>("progress_capacity"));
    auto worker = std::make_shared<Worker>(engine, state, worker_options, std::make_shared<Logger>("worker"));

    ConsoleFrontend::Options ui_options;
    ui_options.frame_interval = std::chrono::milliseconds(settings->get<int>("frame_interval_ms"));
    ui_options.meter_size = static_cast<std::size_t>(settings->get<int>("progress_meter_size"));
    ui_options.download_dir = settings->get<std::string>("download_dir");
    ui_options.cancel_superseded = settings->get<bool>("cancel_superseded");
    ConsoleFrontend frontend(worker, state, ui_options, logger);

    worker->start();
    frontend.start_render();

    auto share = settings->get<std::string>("share");
    if(!share.empty()) {
      frontend.execute_command("select " + share);
      frontend.execute_command("share");
    }
    auto ticket = settings->get<std::string>("ticket");
    if(!ticket.empty()) {
      frontend.execute_command("paste " + ticket);
      frontend.execute_command("download");
    }

    frontend.run();

    // The worker goes first: its repaint callback points at the front end.
    worker->stop();
    frontend.stop_render();
    engine->stop();
    return 0;
  } catch(std::exception& e) {
    init(false);
    Logger logger("sendme-main");
    logger.error("Exception: {}", e.what());
    cpptrace::generate_trace().print();
    return 1;
  }
}
