#pragma once

#include <spdlog/spdlog.h>
#include <spdlog/fmt/fmt.h>

#include <atomic>
#include <cstddef>
#include <functional>
#include <mutex>
#include <string>
#include <unordered_map>
#include <utility>

// Installs the console sinks; a non-empty log_file adds a plain file sink shared by all
// loggers. Safe to call more than once, the latest call wins.
void init(bool verbose = false, const std::string& log_file = std::string());

// Test runners switch console output off and read lines through listeners instead.
void set_log_passthrough(bool enabled);
bool log_passthrough();

using LogListenerHandle = std::size_t;

class Logger {
public:
  using Listener = std::function<bool(void* user_data,
                                      const std::string& channel,
                                      spdlog::level::level_enum level,
                                      const std::string& message)>;

  Logger() = default;
  explicit Logger(std::string name) : name_(std::move(name)) {}

  const std::string& name() const { return name_; }

  LogListenerHandle add_listener(Listener listener, void* user_data = nullptr);
  void remove_listener(LogListenerHandle handle);

  template<typename... Args>
  void debug(spdlog::format_string_t<Args...> fmt, Args&&... args) {
    log(spdlog::level::debug, fmt, std::forward<Args>(args)...);
  }

  template<typename... Args>
  void info(spdlog::format_string_t<Args...> fmt, Args&&... args) {
    log(spdlog::level::info, fmt, std::forward<Args>(args)...);
  }

  template<typename... Args>
  void warn(spdlog::format_string_t<Args...> fmt, Args&&... args) {
    log(spdlog::level::warn, fmt, std::forward<Args>(args)...);
  }

  template<typename... Args>
  void error(spdlog::format_string_t<Args...> fmt, Args&&... args) {
    log(spdlog::level::err, fmt, std::forward<Args>(args)...);
  }

private:
  template<typename... Args>
  void log(spdlog::level::level_enum level, spdlog::format_string_t<Args...> fmt, Args&&... args) {
    auto formatted = fmt::format(fmt, std::forward<Args>(args)...);
    if(notify_listeners(level, formatted)) return;
    emit(level, formatted);
  }

  bool notify_listeners(spdlog::level::level_enum level, const std::string& message);
  void emit(spdlog::level::level_enum level, const std::string& message) const;

  struct ListenerBinding {
    void* user_data = nullptr;
    Listener callback;
  };

  std::string name_;
  std::mutex listener_mutex_;
  std::unordered_map<LogListenerHandle, ListenerBinding> listeners_;
  std::atomic<LogListenerHandle> next_listener_id_{1};
};

namespace detail {
enum class Sink { Log, Print, PrintErr };

void emit_to_sink(Sink sink, spdlog::level::level_enum level, const std::string& message);

template<typename... Args>
void emit_formatted(Sink sink,
                    spdlog::level::level_enum level,
                    spdlog::format_string_t<Args...> fmt,
                    Args&&... args) {
  emit_to_sink(sink, level, fmt::format(fmt, std::forward<Args>(args)...));
}
} // namespace detail

template<typename... Args>
inline void log_debug(Logger* logger, spdlog::format_string_t<Args...> fmt, Args&&... args) {
  if(logger) logger->debug(fmt, std::forward<Args>(args)...);
  else detail::emit_formatted(detail::Sink::Log, spdlog::level::debug, fmt, std::forward<Args>(args)...);
}

template<typename... Args>
inline void log_info(Logger* logger, spdlog::format_string_t<Args...> fmt, Args&&... args) {
  if(logger) logger->info(fmt, std::forward<Args>(args)...);
  else detail::emit_formatted(detail::Sink::Log, spdlog::level::info, fmt, std::forward<Args>(args)...);
}

template<typename... Args>
inline void log_warn(Logger* logger, spdlog::format_string_t<Args...> fmt, Args&&... args) {
  if(logger) logger->warn(fmt, std::forward<Args>(args)...);
  else detail::emit_formatted(detail::Sink::Log, spdlog::level::warn, fmt, std::forward<Args>(args)...);
}

template<typename... Args>
inline void log_error(Logger* logger, spdlog::format_string_t<Args...> fmt, Args&&... args) {
  if(logger) logger->error(fmt, std::forward<Args>(args)...);
  else detail::emit_formatted(detail::Sink::Log, spdlog::level::err, fmt, std::forward<Args>(args)...);
}

// Undecorated output for command results and usage text.
template<typename... Args>
inline void print_out(spdlog::format_string_t<Args...> fmt, Args&&... args) {
  detail::emit_formatted(detail::Sink::Print, spdlog::level::info, fmt, std::forward<Args>(args)...);
}

template<typename... Args>
inline void print_err(spdlog::format_string_t<Args...> fmt, Args&&... args) {
  detail::emit_formatted(detail::Sink::PrintErr, spdlog::level::err, fmt, std::forward<Args>(args)...);
}
