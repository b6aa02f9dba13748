#pragma once

#include <spdlog/spdlog.h>
#include <spdlog/fmt/fmt.h>

#include <cstddef>
#include <functional>
#include <mutex>
#include <string>
#include <utility>
#include <vector>

// Where a line ends up once no listener claims it. Info/Warn/Debug share the
// timestamped stdout sink, Error goes to stderr, Print/PrintErr are bare text
// for console output.
enum class LogStream { Info, Warn, Error, Debug, Print, PrintErr };

const char* to_string(LogStream stream);
spdlog::level::level_enum level_of(LogStream stream);

// Sets levels and, when log_file is non-empty, mirrors every timestamped line
// into that file. Safe to call more than once.
void init(bool verbose = false, const std::string& log_file = std::string());

// When disabled, unclaimed lines are dropped instead of reaching the sinks.
void set_log_passthrough(bool enabled);
bool log_passthrough();

using LogListenerHandle = std::size_t;

// Named source of log lines ("worker", "engine", ...). Listeners receive the
// line as "<name>:<stream>" plus the formatted message; returning true claims
// it and keeps it off the shared sinks.
class Logger {
public:
  using Listener = std::function<bool(const std::string& channel,
                                      spdlog::level::level_enum level,
                                      const std::string& message)>;

  explicit Logger(std::string name = std::string());

  const std::string& name() const { return name_; }

  LogListenerHandle add_listener(Listener listener);
  void remove_listener(LogListenerHandle handle);

  void write(LogStream stream, const std::string& message);

  template<typename... Args>
  void info(spdlog::format_string_t<Args...> fmt, Args&&... args) {
    write(LogStream::Info, fmt::format(fmt, std::forward<Args>(args)...));
  }

  template<typename... Args>
  void warn(spdlog::format_string_t<Args...> fmt, Args&&... args) {
    write(LogStream::Warn, fmt::format(fmt, std::forward<Args>(args)...));
  }

  template<typename... Args>
  void error(spdlog::format_string_t<Args...> fmt, Args&&... args) {
    write(LogStream::Error, fmt::format(fmt, std::forward<Args>(args)...));
  }

  template<typename... Args>
  void debug(spdlog::format_string_t<Args...> fmt, Args&&... args) {
    write(LogStream::Debug, fmt::format(fmt, std::forward<Args>(args)...));
  }

  template<typename... Args>
  void print(spdlog::format_string_t<Args...> fmt, Args&&... args) {
    write(LogStream::Print, fmt::format(fmt, std::forward<Args>(args)...));
  }

  template<typename... Args>
  void print_err(spdlog::format_string_t<Args...> fmt, Args&&... args) {
    write(LogStream::PrintErr, fmt::format(fmt, std::forward<Args>(args)...));
  }

private:
  const std::string name_;
  std::mutex listener_mutex_;
  std::vector<std::pair<LogListenerHandle, Listener>> listeners_;
  LogListenerHandle next_listener_id_ = 1;
};

// Routes through logger when given, straight to the shared sinks otherwise.
void write_log(Logger* logger, LogStream stream, const std::string& message);

template<typename... Args>
inline void log_info(Logger* logger, spdlog::format_string_t<Args...> fmt, Args&&... args) {
  write_log(logger, LogStream::Info, fmt::format(fmt, std::forward<Args>(args)...));
}

template<typename... Args>
inline void log_warn(Logger* logger, spdlog::format_string_t<Args...> fmt, Args&&... args) {
  write_log(logger, LogStream::Warn, fmt::format(fmt, std::forward<Args>(args)...));
}

template<typename... Args>
inline void log_error(Logger* logger, spdlog::format_string_t<Args...> fmt, Args&&... args) {
  write_log(logger, LogStream::Error, fmt::format(fmt, std::forward<Args>(args)...));
}

template<typename... Args>
inline void log_debug(Logger* logger, spdlog::format_string_t<Args...> fmt, Args&&... args) {
  write_log(logger, LogStream::Debug, fmt::format(fmt, std::forward<Args>(args)...));
}

template<typename... Args>
inline void print_out(Logger* logger, spdlog::format_string_t<Args...> fmt, Args&&... args) {
  write_log(logger, LogStream::Print, fmt::format(fmt, std::forward<Args>(args)...));
}

template<typename... Args>
inline void print_err(Logger* logger, spdlog::format_string_t<Args...> fmt, Args&&... args) {
  write_log(logger, LogStream::PrintErr, fmt::format(fmt, std::forward<Args>(args)...));
}
