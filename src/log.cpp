#include "log.hpp"

#include <spdlog/sinks/basic_file_sink.h>
#include <spdlog/sinks/stdout_color_sinks.h>

#include <memory>
#include <vector>

namespace {

constexpr const char* kDecoratedPattern = "[%Y-%m-%d %H:%M:%S.%e] [%^%l%$] [%t] %v";

struct LogSinks {
  std::shared_ptr<spdlog::logger> log;
  std::shared_ptr<spdlog::logger> print;
  std::shared_ptr<spdlog::logger> print_err;
};

std::mutex g_sinks_mutex;
LogSinks g_sinks;
std::atomic<bool> g_log_passthrough{true};

LogSinks build_sinks(bool verbose, const std::string& log_file) {
  auto out_sink = std::make_shared<spdlog::sinks::stdout_color_sink_mt>();
  out_sink->set_pattern(kDecoratedPattern);
  out_sink->set_level(verbose ? spdlog::level::debug : spdlog::level::info);

  std::vector<spdlog::sink_ptr> log_sinks{out_sink};
  if(!log_file.empty()) {
    auto file_sink = std::make_shared<spdlog::sinks::basic_file_sink_mt>(log_file, false);
    file_sink->set_pattern(kDecoratedPattern);
    file_sink->set_level(spdlog::level::debug);
    log_sinks.push_back(std::move(file_sink));
  }

  auto plain_out = std::make_shared<spdlog::sinks::stdout_color_sink_mt>();
  plain_out->set_pattern("%v");
  auto plain_err = std::make_shared<spdlog::sinks::stderr_color_sink_mt>();
  plain_err->set_pattern("%v");

  LogSinks sinks;
  sinks.log = std::make_shared<spdlog::logger>("stagexfer", log_sinks.begin(), log_sinks.end());
  sinks.log->set_level(spdlog::level::debug);
  sinks.log->flush_on(spdlog::level::warn);
  sinks.print = std::make_shared<spdlog::logger>("stagexfer.print", std::move(plain_out));
  sinks.print->flush_on(spdlog::level::info);
  sinks.print_err = std::make_shared<spdlog::logger>("stagexfer.print_err", std::move(plain_err));
  sinks.print_err->flush_on(spdlog::level::err);
  return sinks;
}

std::shared_ptr<spdlog::logger> sink_for(detail::Sink sink) {
  std::lock_guard<std::mutex> lock(g_sinks_mutex);
  if(!g_sinks.log) g_sinks = build_sinks(false, std::string());
  switch(sink) {
    case detail::Sink::Print: return g_sinks.print;
    case detail::Sink::PrintErr: return g_sinks.print_err;
    case detail::Sink::Log: break;
  }
  return g_sinks.log;
}

} // namespace

void init(bool verbose, const std::string& log_file) {
  auto sinks = build_sinks(verbose, log_file);
  std::lock_guard<std::mutex> lock(g_sinks_mutex);
  g_sinks = std::move(sinks);
}

void set_log_passthrough(bool enabled) {
  g_log_passthrough.store(enabled, std::memory_order_release);
}

bool log_passthrough() {
  return g_log_passthrough.load(std::memory_order_acquire);
}

LogListenerHandle Logger::add_listener(Listener listener, void* user_data) {
  if(!listener) return 0;
  std::lock_guard<std::mutex> lock(listener_mutex_);
  const auto id = next_listener_id_++;
  listeners_.emplace(id, ListenerBinding{user_data, std::move(listener)});
  return id;
}

void Logger::remove_listener(LogListenerHandle handle) {
  std::lock_guard<std::mutex> lock(listener_mutex_);
  listeners_.erase(handle);
}

bool Logger::notify_listeners(spdlog::level::level_enum level, const std::string& message) {
  std::vector<ListenerBinding> snapshot;
  {
    std::lock_guard<std::mutex> lock(listener_mutex_);
    snapshot.reserve(listeners_.size());
    for(const auto& entry : listeners_) snapshot.push_back(entry.second);
  }
  bool handled = false;
  for(auto& binding : snapshot) {
    if(binding.callback(binding.user_data, name_, level, message)) handled = true;
  }
  return handled;
}

void Logger::emit(spdlog::level::level_enum level, const std::string& message) const {
  if(name_.empty()) {
    detail::emit_to_sink(detail::Sink::Log, level, message);
  } else {
    detail::emit_to_sink(detail::Sink::Log, level, fmt::format("[{}] {}", name_, message));
  }
}

namespace detail {

void emit_to_sink(Sink sink, spdlog::level::level_enum level, const std::string& message) {
  if(!log_passthrough()) return;
  auto target = sink_for(sink);
  if(target) target->log(level, message);
}

} // namespace detail
