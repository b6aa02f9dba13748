#include "console_frontend.hpp"

#include <algorithm>
#include <cstdlib>
#include <iostream>
#include <sstream>

#ifdef HAVE_READLINE
#include <readline/readline.h>
#include <readline/history.h>
#endif

#include "utils.hpp"

namespace {

constexpr std::size_t kSpinnerWidth = 4;

std::string split_argument(const std::string& line, std::string& command) {
  std::istringstream iss(line);
  iss >> command;
  std::string rest;
  std::getline(iss, rest);
  return trim_copy(rest);
}

} // namespace

std::string format_progress_meter(const Progress& progress, std::size_t slots, std::size_t frame) {
  if(!progress.determinate()) {
    std::size_t dots = frame % (kSpinnerWidth + 1);
    return "[" + std::string(dots, '.') + std::string(kSpinnerWidth - dots, ' ') + "]";
  }
  static constexpr char kMeterChars[] = {' ', '.', '_', 'v', 'Y', 'X', 'H', '#'};
  constexpr std::size_t kMeterCharCount = sizeof(kMeterChars) / sizeof(kMeterChars[0]);
  slots = std::max<std::size_t>(1, slots);
  const double filled = std::clamp(static_cast<double>(*progress.ratio), 0.0, 1.0) *
                        static_cast<double>(slots);
  std::string bar;
  bar.reserve(slots + 2);
  bar.push_back('[');
  for(std::size_t slot = 0; slot < slots; ++slot) {
    const double slot_fill = std::clamp(filled - static_cast<double>(slot), 0.0, 1.0);
    std::size_t index = slot_fill >= 1.0
      ? kMeterCharCount - 1
      : static_cast<std::size_t>(slot_fill * static_cast<double>(kMeterCharCount - 1));
    bar.push_back(kMeterChars[index]);
  }
  bar.push_back(']');
  return bar;
}

ConsoleFrontend::ConsoleFrontend(std::shared_ptr<Worker> worker,
                                 std::shared_ptr<StateStore> state,
                                 Options options,
                                 std::shared_ptr<Logger> logger)
  : worker_(std::move(worker)),
    state_(std::move(state)),
    options_(std::move(options)),
    logger_(logger ? std::move(logger) : std::make_shared<Logger>("sendme")) {
  target_ = options_.download_dir.empty() ? std::filesystem::current_path() : options_.download_dir;
  if(options_.frame_interval.count() <= 0) {
    options_.frame_interval = std::chrono::milliseconds(250);
  }
}

ConsoleFrontend::~ConsoleFrontend() {
  stop_render();
}

std::optional<std::filesystem::path> ConsoleFrontend::selected_file() const {
  std::lock_guard<std::mutex> lock(ui_mutex_);
  return selected_;
}

std::string ConsoleFrontend::ticket_text() const {
  std::lock_guard<std::mutex> lock(ui_mutex_);
  return ticket_text_;
}

std::filesystem::path ConsoleFrontend::download_target() const {
  std::lock_guard<std::mutex> lock(ui_mutex_);
  return target_;
}

void ConsoleFrontend::run() {
  print_help();
  for(;;) {
    auto input = read_command_line("> ");
    if(!input) break;
    if(!execute_command(*input)) break;
  }
}

bool ConsoleFrontend::execute_command(const std::string& line) {
  std::string cmd;
  std::string arg = split_argument(line, cmd);
  if(cmd.empty()) return true;

  if(cmd == "select" || cmd == "drop") {
    select_file(arg);
  } else if(cmd == "share") {
    request_share();
  } else if(cmd == "paste") {
    std::lock_guard<std::mutex> lock(ui_mutex_);
    ticket_text_ = arg;
    if(arg.empty()) logger_->print("ticket cleared");
  } else if(cmd == "target") {
    if(arg.empty()) {
      logger_->print("download folder: {}", download_target().string());
    } else {
      std::lock_guard<std::mutex> lock(ui_mutex_);
      target_ = arg;
      logger_->print("download folder set to {}", target_.string());
    }
  } else if(cmd == "download" || cmd == "get") {
    request_download();
  } else if(cmd == "ok") {
    acknowledge_error();
  } else if(cmd == "reset") {
    reset_selection();
  } else if(cmd == "cancel") {
    if(!worker_->cancel_current()) logger_->print("nothing to cancel");
  } else if(cmd == "status") {
    logger_->print("{}", describe_state(*state_->snapshot()));
  } else if(cmd == "help" || cmd == "?") {
    print_help();
  } else if(cmd == "quit" || cmd == "exit" || cmd == "q") {
    return false;
  } else {
    logger_->print("unknown command '{}' (try help)", cmd);
  }
  return true;
}

void ConsoleFrontend::select_file(const std::string& arg) {
  if(arg.empty()) {
    logger_->print("usage: select <path>");
    return;
  }
  {
    std::lock_guard<std::mutex> lock(ui_mutex_);
    selected_ = std::filesystem::path(arg);
  }
  if(options_.cancel_superseded) {
    worker_->cancel_current(OperationKind::Share);
  }
  state_->reset_share_cycle();
  logger_->print("selected {}", arg);
}

void ConsoleFrontend::reset_selection() {
  {
    std::lock_guard<std::mutex> lock(ui_mutex_);
    selected_.reset();
  }
  if(options_.cancel_superseded) {
    worker_->cancel_current(OperationKind::Share);
  }
  state_->reset_share_cycle();
  logger_->print("selection cleared");
}

void ConsoleFrontend::request_share() {
  auto source = selected_file();
  if(!source) {
    logger_->print("select a file first");
    return;
  }
  auto snapshot = state_->snapshot();
  if(snapshot->ticket) {
    logger_->print("already shared; select another file or reset to share again");
    return;
  }
  if(snapshot->sharing_progress) {
    logger_->print("share already in progress");
    return;
  }
  worker_->share(*source);
}

void ConsoleFrontend::request_download() {
  std::string text;
  std::filesystem::path target;
  {
    std::lock_guard<std::mutex> lock(ui_mutex_);
    text = ticket_text_;
    target = target_;
  }
  if(text.empty()) {
    logger_->print("paste a ticket first");
    return;
  }
  if(state_->snapshot()->download_progress) {
    logger_->print("download already in progress");
    return;
  }
  worker_->get(text, target);
}

void ConsoleFrontend::acknowledge_error() {
  if(!state_->acknowledge_error()) {
    logger_->print("no errors");
  }
}

void ConsoleFrontend::print_help() {
  logger_->print("Commands:");
  logger_->print("  select|drop <path>  choose the file to share (starts a new share)");
  logger_->print("  share               share the selected file and print its ticket");
  logger_->print("  paste <ticket>      set the ticket to download");
  logger_->print("  target <dir>        set the download folder");
  logger_->print("  download            fetch the pasted ticket into the download folder");
  logger_->print("  cancel              cancel the running transfer");
  logger_->print("  ok                  dismiss the error shown");
  logger_->print("  reset               clear the selected file and ticket");
  logger_->print("  status              show the current state");
  logger_->print("  quit");
}

std::string ConsoleFrontend::describe_state(const StateSnapshot& snapshot) const {
  std::ostringstream out;
  std::optional<std::filesystem::path> selected;
  std::string pasted;
  std::filesystem::path target;
  {
    std::lock_guard<std::mutex> lock(ui_mutex_);
    selected = selected_;
    pasted = ticket_text_;
    target = target_;
  }
  out << "file:     " << (selected ? selected->string() : "(none)") << "\n";
  if(snapshot.sharing_progress) {
    out << "sharing:  " << format_progress_meter(*snapshot.sharing_progress, options_.meter_size, 0)
        << " " << format_progress(*snapshot.sharing_progress) << "\n";
  }
  if(snapshot.ticket) {
    out << "ticket:   " << snapshot.ticket->to_string() << "\n";
    out << "          " << snapshot.ticket->name << " (" << format_size(snapshot.ticket->size) << ")\n";
  }
  out << "paste:    " << (pasted.empty() ? "(none)" : pasted) << "\n";
  out << "target:   " << target.string() << "\n";
  if(snapshot.download_progress) {
    out << "download: " << format_progress_meter(*snapshot.download_progress, options_.meter_size, 0)
        << " " << format_progress(*snapshot.download_progress) << "\n";
  }
  if(const auto* error = snapshot.current_error()) {
    out << "error:    " << describe(*error) << " (ok to dismiss";
    if(snapshot.errors.size() > 1) out << ", " << snapshot.errors.size() - 1 << " more";
    out << ")\n";
  }
  std::string text = out.str();
  if(!text.empty() && text.back() == '\n') text.pop_back();
  return text;
}

void ConsoleFrontend::start_render() {
  if(rendering_.exchange(true)) return;
  state_->set_repaint_callback([this](){ request_repaint(); });
  render_thread_ = std::thread([this](){ render_loop(); });
}

void ConsoleFrontend::stop_render() {
  if(!rendering_.exchange(false)) return;
  state_->set_repaint_callback(nullptr);
  render_cv_.notify_all();
  if(render_thread_.joinable()) render_thread_.join();
}

void ConsoleFrontend::request_repaint() {
  {
    std::lock_guard<std::mutex> lock(render_mutex_);
    repaint_requested_ = true;
  }
  render_cv_.notify_one();
}

void ConsoleFrontend::render_loop() {
  std::size_t frame = 0;
  while(rendering_) {
    {
      std::unique_lock<std::mutex> lock(render_mutex_);
      render_cv_.wait_for(lock, options_.frame_interval,
                          [this]{ return repaint_requested_ || !rendering_; });
      repaint_requested_ = false;
    }
    if(!rendering_) break;
    render_frame(frame++);
  }
}

// Ticket and error changes are printed once as full lines; progress is a
// single line redrawn in place.
void ConsoleFrontend::render_frame(std::size_t frame) {
  auto snapshot = state_->snapshot();
  const bool changed = snapshot->generation != last_generation_;
  last_generation_ = snapshot->generation;

  const std::optional<Progress>& active = snapshot->download_progress
    ? snapshot->download_progress
    : snapshot->sharing_progress;

  if(changed) {
    std::optional<std::string> ticket_text;
    if(snapshot->ticket) ticket_text = snapshot->ticket->to_string();
    if(ticket_text != last_ticket_text_ || snapshot->errors.size() != last_error_count_) {
      if(meter_visible_) {
        std::cout << "\r\x1b[K";
        meter_visible_ = false;
      }
      if(ticket_text && ticket_text != last_ticket_text_) {
        std::cout << "ticket for " << snapshot->ticket->name << ":\n" << *ticket_text << "\n";
      }
      if(snapshot->errors.size() > last_error_count_) {
        if(const auto* error = snapshot->current_error()) {
          std::cout << "error: " << describe(*error) << " (ok to dismiss)\n";
        }
      }
      last_ticket_text_ = ticket_text;
      last_error_count_ = snapshot->errors.size();
    }
  }

  if(active) {
    const char* label = snapshot->download_progress ? "Downloading" : "Sharing";
    std::cout << "\r" << label << " " << format_progress_meter(*active, options_.meter_size, frame)
              << " " << format_progress(*active) << "\x1b[K";
    meter_visible_ = true;
  } else if(meter_visible_) {
    std::cout << "\r\x1b[K";
    meter_visible_ = false;
  }
  std::cout.flush();
}

std::optional<std::string> ConsoleFrontend::read_command_line(const char* prompt) {
#ifdef HAVE_READLINE
  char* line = readline(prompt);
  if(!line) return std::nullopt;
  std::string result(line);
  if(!result.empty()) add_history(result.c_str());
  free(line);
  return result;
#else
  std::cout << prompt;
  std::cout.flush();
  std::string line;
  if(!std::getline(std::cin, line)) return std::nullopt;
  return line;
#endif
}
