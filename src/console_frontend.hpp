#pragma once

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <thread>

#include "log.hpp"
#include "progress.hpp"
#include "shared_state.hpp"
#include "worker.hpp"

// ASCII meter of `slots` characters for a determinate ratio; a short cycling
// "[....]" spinner otherwise.
std::string format_progress_meter(const Progress& progress, std::size_t slots, std::size_t frame);

// Interactive presentation loop. Owns the user-side state (selected file,
// pasted ticket text, download folder), turns commands into worker requests
// and repaints from StateStore snapshots on a frame timer or when the worker
// asks for it.
class ConsoleFrontend {
public:
  struct Options {
    std::chrono::milliseconds frame_interval{250};
    std::size_t meter_size = 40;
    std::filesystem::path download_dir;
    bool cancel_superseded = false;
  };

  ConsoleFrontend(std::shared_ptr<Worker> worker,
                  std::shared_ptr<StateStore> state,
                  Options options,
                  std::shared_ptr<Logger> logger = nullptr);
  ~ConsoleFrontend();

  ConsoleFrontend(const ConsoleFrontend&) = delete;
  ConsoleFrontend& operator=(const ConsoleFrontend&) = delete;

  void start_render();
  void stop_render();

  // Reads commands until quit or end of input.
  void run();

  // Returns false when the command asks to quit.
  bool execute_command(const std::string& line);

  // Multi-line description of the current state, as printed by `status`.
  std::string describe_state(const StateSnapshot& snapshot) const;

  std::optional<std::filesystem::path> selected_file() const;
  std::string ticket_text() const;
  std::filesystem::path download_target() const;

private:
  void select_file(const std::string& arg);
  void reset_selection();
  void request_share();
  void request_download();
  void acknowledge_error();
  void print_help();

  void render_loop();
  void render_frame(std::size_t frame);
  void request_repaint();
  std::optional<std::string> read_command_line(const char* prompt);

  std::shared_ptr<Worker> worker_;
  std::shared_ptr<StateStore> state_;
  Options options_;
  std::shared_ptr<Logger> logger_;

  mutable std::mutex ui_mutex_;
  std::optional<std::filesystem::path> selected_;
  std::string ticket_text_;
  std::filesystem::path target_;

  std::mutex render_mutex_;
  std::condition_variable render_cv_;
  bool repaint_requested_ = false;
  std::atomic<bool> rendering_{false};
  std::thread render_thread_;

  // Render-thread only.
  uint64_t last_generation_ = 0;
  std::optional<std::string> last_ticket_text_;
  std::size_t last_error_count_ = 0;
  bool meter_visible_ = false;
};
