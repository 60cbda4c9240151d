#include "log.hpp"

#include <spdlog/sinks/stdout_color_sinks.h>

#include <vector>

namespace {
std::shared_ptr<spdlog::logger> g_info_logger;
std::shared_ptr<spdlog::logger> g_error_logger;
std::shared_ptr<spdlog::logger> g_print_logger;
std::shared_ptr<spdlog::logger> g_print_err_logger;
std::once_flag g_create_once;
std::atomic<bool> g_log_passthrough{true};

void create_loggers() {
  auto info_sink = std::make_shared<spdlog::sinks::stdout_color_sink_mt>();
  info_sink->set_pattern("[%Y-%m-%d %H:%M:%S.%e] [%^%l%$] %v");

  auto error_sink = std::make_shared<spdlog::sinks::stderr_color_sink_mt>();
  error_sink->set_pattern("[%Y-%m-%d %H:%M:%S.%e] [%^%l%$] %v");

  auto plain_out_sink = std::make_shared<spdlog::sinks::stdout_color_sink_mt>();
  plain_out_sink->set_pattern("%v");

  auto plain_err_sink = std::make_shared<spdlog::sinks::stderr_color_sink_mt>();
  plain_err_sink->set_pattern("%v");

  g_info_logger = std::make_shared<spdlog::logger>("zap.info", std::move(info_sink));
  g_error_logger = std::make_shared<spdlog::logger>("zap.error", std::move(error_sink));
  g_print_logger = std::make_shared<spdlog::logger>("zap.print", std::move(plain_out_sink));
  g_print_err_logger = std::make_shared<spdlog::logger>("zap.print_err", std::move(plain_err_sink));

  const LogLevels defaults;
  g_info_logger->set_level(defaults.info);
  g_error_logger->set_level(defaults.error);
  g_print_logger->set_level(defaults.print);
  g_print_err_logger->set_level(defaults.print_err);

  g_info_logger->flush_on(spdlog::level::info);
  g_error_logger->flush_on(spdlog::level::warn);
  g_print_logger->flush_on(spdlog::level::info);
  g_print_err_logger->flush_on(spdlog::level::err);
}

void ensure_loggers() {
  std::call_once(g_create_once, create_loggers);
}

} // namespace

void set_log_passthrough(bool enabled) {
  g_log_passthrough.store(enabled, std::memory_order_release);
}

bool log_passthrough() {
  return g_log_passthrough.load(std::memory_order_acquire);
}

const char* log_channel_name(LogChannel channel) {
  switch(channel) {
    case LogChannel::Info: return "info";
    case LogChannel::Warn: return "warn";
    case LogChannel::Error: return "error";
    case LogChannel::Debug: return "debug";
    case LogChannel::Print: return "print";
    case LogChannel::PrintErr: return "print_err";
  }
  return "info";
}

spdlog::level::level_enum log_channel_level(LogChannel channel) {
  switch(channel) {
    case LogChannel::Info: return spdlog::level::info;
    case LogChannel::Warn: return spdlog::level::warn;
    case LogChannel::Error: return spdlog::level::err;
    case LogChannel::Debug: return spdlog::level::debug;
    case LogChannel::Print: return spdlog::level::info;
    case LogChannel::PrintErr: return spdlog::level::err;
  }
  return spdlog::level::info;
}

LogLevels log_levels(bool verbose, bool quiet) {
  LogLevels levels;
  if(quiet) {
    levels.info = spdlog::level::off;
    levels.print = spdlog::level::off;
  } else if(verbose) {
    levels.info = spdlog::level::debug;
  }
  return levels;
}

void init(bool verbose, bool quiet) {
  ensure_loggers();
  const auto levels = log_levels(verbose, quiet);
  g_info_logger->set_level(levels.info);
  g_error_logger->set_level(levels.error);
  g_print_logger->set_level(levels.print);
  g_print_err_logger->set_level(levels.print_err);
  spdlog::set_default_logger(g_info_logger);
}

Logger::Logger() = default;
Logger::Logger(std::string name) : name_(std::move(name)) {}

std::shared_ptr<Logger> Logger::child(const std::string& suffix) {
  auto result = std::make_shared<Logger>(name_.empty() ? suffix : name_ + "/" + suffix);
  result->parent_ = weak_from_this();
  return result;
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

void Logger::emit(LogChannel channel, const std::string& message) {
  const char* base = log_channel_name(channel);
  std::string channel_name = name_.empty() ? std::string(base) : name_ + ":" + base;
  if(dispatch(channel_name, log_channel_level(channel), message)) return;
  detail::emit_to_default(channel, channel_name, message);
}

// Listeners run outside the lock so a callback may add or remove listeners.
bool Logger::dispatch(const std::string& channel,
                      spdlog::level::level_enum level,
                      const std::string& message) {
  std::vector<ListenerBinding> snapshot;
  {
    std::lock_guard<std::mutex> lock(listener_mutex_);
    snapshot.reserve(listeners_.size());
    for(const auto& entry : listeners_) {
      snapshot.push_back(entry.second);
    }
  }
  bool handled = false;
  for(auto& binding : snapshot) {
    if(binding.callback && binding.callback(binding.user_data, channel, level, message)) {
      handled = true;
    }
  }
  if(auto parent = parent_.lock()) {
    handled = parent->dispatch(channel, level, message) || handled;
  }
  return handled;
}

namespace detail {

void emit_to_default(LogChannel channel, const std::string& channel_name, const std::string& message) {
  ensure_loggers();
  if(!log_passthrough()) return;

  spdlog::logger* sink = g_info_logger.get();
  switch(channel) {
    case LogChannel::Print: sink = g_print_logger.get(); break;
    case LogChannel::PrintErr: sink = g_print_err_logger.get(); break;
    case LogChannel::Warn:
    case LogChannel::Error: sink = g_error_logger.get(); break;
    case LogChannel::Info:
    case LogChannel::Debug: break;
  }

  const auto level = log_channel_level(channel);
  if(channel_name != log_channel_name(channel)) {
    sink->log(level, fmt::format("[{}] {}", channel_name, message));
  } else {
    sink->log(level, message);
  }
}

} // namespace detail
