#include "log.hpp"

#include <spdlog/sinks/basic_file_sink.h>
#include <spdlog/sinks/stdout_color_sinks.h>

#include <atomic>
#include <exception>
#include <memory>

namespace {

constexpr const char* kStampedPattern = "[%H:%M:%S.%e] [%^%l%$] %v";

struct Sinks {
  std::shared_ptr<spdlog::logger> stamped_out;
  std::shared_ptr<spdlog::logger> stamped_err;
  std::shared_ptr<spdlog::logger> plain_out;
  std::shared_ptr<spdlog::logger> plain_err;
};

std::mutex g_sinks_mutex;
std::shared_ptr<const Sinks> g_sinks;
std::atomic<bool> g_log_passthrough{true};

std::shared_ptr<spdlog::logger> make_logger(const char* name, spdlog::sink_ptr console,
                                            const spdlog::sink_ptr& file) {
  std::vector<spdlog::sink_ptr> sinks{std::move(console)};
  if(file) sinks.push_back(file);
  return std::make_shared<spdlog::logger>(name, sinks.begin(), sinks.end());
}

std::shared_ptr<const Sinks> build_sinks(bool verbose, const std::string& log_file) {
  spdlog::sink_ptr file_sink;
  if(!log_file.empty()) {
    // Throws spdlog::spdlog_ex when the file cannot be opened; main reports it.
    file_sink = std::make_shared<spdlog::sinks::basic_file_sink_mt>(log_file, false);
    file_sink->set_pattern(kStampedPattern);
    file_sink->set_level(verbose ? spdlog::level::debug : spdlog::level::info);
  }

  auto out = std::make_shared<spdlog::sinks::stdout_color_sink_mt>();
  out->set_pattern(kStampedPattern);
  auto err = std::make_shared<spdlog::sinks::stderr_color_sink_mt>();
  err->set_pattern(kStampedPattern);
  auto plain_out = std::make_shared<spdlog::sinks::stdout_color_sink_mt>();
  plain_out->set_pattern("%v");
  auto plain_err = std::make_shared<spdlog::sinks::stderr_color_sink_mt>();
  plain_err->set_pattern("%v");

  auto sinks = std::make_shared<Sinks>();
  sinks->stamped_out = make_logger("sendme", out, file_sink);
  sinks->stamped_err = make_logger("sendme.err", err, file_sink);
  sinks->plain_out = make_logger("sendme.out", plain_out, nullptr);
  sinks->plain_err = make_logger("sendme.out_err", plain_err, nullptr);

  sinks->stamped_out->set_level(verbose ? spdlog::level::debug : spdlog::level::info);
  sinks->stamped_out->flush_on(spdlog::level::warn);
  sinks->stamped_err->flush_on(spdlog::level::err);
  sinks->plain_out->flush_on(spdlog::level::info);
  sinks->plain_err->flush_on(spdlog::level::err);
  return sinks;
}

std::shared_ptr<const Sinks> current_sinks() {
  std::lock_guard<std::mutex> lock(g_sinks_mutex);
  if(!g_sinks) {
    g_sinks = build_sinks(false, std::string());
  }
  return g_sinks;
}

void emit(LogStream stream, const std::string& channel, const std::string& message) {
  if(!log_passthrough()) return;
  auto sinks = current_sinks();

  spdlog::logger* target = nullptr;
  switch(stream) {
    case LogStream::Print: target = sinks->plain_out.get(); break;
    case LogStream::PrintErr: target = sinks->plain_err.get(); break;
    case LogStream::Error: target = sinks->stamped_err.get(); break;
    default: target = sinks->stamped_out.get(); break;
  }

  if(stream == LogStream::Print || stream == LogStream::PrintErr || channel.empty()) {
    target->log(level_of(stream), message);
  } else {
    target->log(level_of(stream), "[{}] {}", channel, message);
  }
}

} // namespace

const char* to_string(LogStream stream) {
  switch(stream) {
    case LogStream::Info: return "info";
    case LogStream::Warn: return "warn";
    case LogStream::Error: return "error";
    case LogStream::Debug: return "debug";
    case LogStream::Print: return "print";
    case LogStream::PrintErr: return "print_err";
  }
  return "info";
}

spdlog::level::level_enum level_of(LogStream stream) {
  switch(stream) {
    case LogStream::Warn: return spdlog::level::warn;
    case LogStream::Error:
    case LogStream::PrintErr: return spdlog::level::err;
    case LogStream::Debug: return spdlog::level::debug;
    default: return spdlog::level::info;
  }
}

void init(bool verbose, const std::string& log_file) {
  auto sinks = build_sinks(verbose, log_file);
  {
    std::lock_guard<std::mutex> lock(g_sinks_mutex);
    g_sinks = sinks;
  }
  spdlog::set_default_logger(sinks->stamped_out);
}

void set_log_passthrough(bool enabled) {
  g_log_passthrough.store(enabled, std::memory_order_release);
}

bool log_passthrough() {
  return g_log_passthrough.load(std::memory_order_acquire);
}

Logger::Logger(std::string name) : name_(std::move(name)) {}

LogListenerHandle Logger::add_listener(Listener listener) {
  if(!listener) return 0;
  std::lock_guard<std::mutex> lock(listener_mutex_);
  const auto id = next_listener_id_++;
  listeners_.emplace_back(id, std::move(listener));
  return id;
}

void Logger::remove_listener(LogListenerHandle handle) {
  std::lock_guard<std::mutex> lock(listener_mutex_);
  for(auto it = listeners_.begin(); it != listeners_.end(); ++it) {
    if(it->first == handle) {
      listeners_.erase(it);
      return;
    }
  }
}

void Logger::write(LogStream stream, const std::string& message) {
  std::vector<Listener> listeners;
  {
    std::lock_guard<std::mutex> lock(listener_mutex_);
    listeners.reserve(listeners_.size());
    for(const auto& entry : listeners_) listeners.push_back(entry.second);
  }

  const std::string channel = name_.empty()
    ? std::string(to_string(stream))
    : name_ + ":" + to_string(stream);
  bool claimed = false;
  for(auto& listener : listeners) {
    try {
      claimed = listener(channel, level_of(stream), message) || claimed;
    } catch(const std::exception& e) {
      emit(LogStream::Error, "log-listener", std::string("listener threw: ") + e.what());
    }
  }
  if(!claimed) emit(stream, name_, message);
}

void write_log(Logger* logger, LogStream stream, const std::string& message) {
  if(logger) {
    logger->write(stream, message);
  } else {
    emit(stream, std::string(), message);
  }
}
