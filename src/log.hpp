#pragma once

#include <spdlog/spdlog.h>
#include <spdlog/fmt/fmt.h>

#include <atomic>
#include <cstddef>
#include <functional>
#include <memory>
#include <mutex>
#include <string>
#include <unordered_map>
#include <utility>

// Where a line goes when no listener consumes it. Info and Debug share the
// timestamped stdout sink, Warn and Error the timestamped stderr sink; Print
// and PrintErr are the bare user-facing streams.
enum class LogChannel {
  Info,
  Warn,
  Error,
  Debug,
  Print,
  PrintErr
};

const char* log_channel_name(LogChannel channel);
spdlog::level::level_enum log_channel_level(LogChannel channel);

// Thresholds applied by init() to the four default sinks.
struct LogLevels {
  spdlog::level::level_enum info = spdlog::level::info;
  spdlog::level::level_enum error = spdlog::level::warn;
  spdlog::level::level_enum print = spdlog::level::info;
  spdlog::level::level_enum print_err = spdlog::level::info;
};

// Verbose lowers stdout to debug. Quiet silences both stdout sinks; retry
// warnings and errors still reach stderr.
LogLevels log_levels(bool verbose, bool quiet);

void init(bool verbose = false, bool quiet = false);

// When disabled, lines that no listener consumed are dropped instead of
// reaching the default sinks. Test runners turn this off.
void set_log_passthrough(bool enabled);
bool log_passthrough();

using LogListenerHandle = std::size_t;

// Named source of log lines. Listeners see "<name>:<channel>" and the
// formatted message; returning true consumes the line.
class Logger : public std::enable_shared_from_this<Logger> {
public:
  using Listener = std::function<bool(void* user_data,
                                      const std::string& channel,
                                      spdlog::level::level_enum level,
                                      const std::string& message)>;

  Logger();
  explicit Logger(std::string name);

  const std::string& name() const { return name_; }

  LogListenerHandle add_listener(Listener listener, void* user_data = nullptr);
  void remove_listener(LogListenerHandle handle);

  template<typename... Args>
  void write(LogChannel channel, spdlog::format_string_t<Args...> fmt, Args&&... args) {
    emit(channel, fmt::format(fmt, std::forward<Args>(args)...));
  }

  template<typename... Args>
  void info(spdlog::format_string_t<Args...> fmt, Args&&... args) {
    write(LogChannel::Info, fmt, std::forward<Args>(args)...);
  }

  template<typename... Args>
  void warn(spdlog::format_string_t<Args...> fmt, Args&&... args) {
    write(LogChannel::Warn, fmt, std::forward<Args>(args)...);
  }

  template<typename... Args>
  void error(spdlog::format_string_t<Args...> fmt, Args&&... args) {
    write(LogChannel::Error, fmt, std::forward<Args>(args)...);
  }

  template<typename... Args>
  void debug(spdlog::format_string_t<Args...> fmt, Args&&... args) {
    write(LogChannel::Debug, fmt, std::forward<Args>(args)...);
  }

  // Child logger named "<this>/<suffix>" whose lines also reach this
  // logger's listeners. Only valid on a logger owned by a shared_ptr.
  std::shared_ptr<Logger> child(const std::string& suffix);

private:
  void emit(LogChannel channel, const std::string& message);
  bool dispatch(const std::string& channel,
                spdlog::level::level_enum level,
                const std::string& message);

  struct ListenerBinding {
    void* user_data = nullptr;
    Listener callback;
  };

  std::string name_;
  std::mutex listener_mutex_;
  std::unordered_map<LogListenerHandle, ListenerBinding> listeners_;
  std::atomic<LogListenerHandle> next_listener_id_{1};
  std::weak_ptr<Logger> parent_;
};

namespace detail {
void emit_to_default(LogChannel channel, const std::string& channel_name, const std::string& message);

template<typename... Args>
void log_via(Logger* logger, LogChannel channel, spdlog::format_string_t<Args...> fmt, Args&&... args) {
  if(logger) {
    logger->write(channel, fmt, std::forward<Args>(args)...);
    return;
  }
  emit_to_default(channel, log_channel_name(channel), fmt::format(fmt, std::forward<Args>(args)...));
}
} // namespace detail

// Free helpers taking an optional logger; a null logger writes straight to
// the default sinks.
template<typename... Args>
inline void log_info(Logger* logger, spdlog::format_string_t<Args...> fmt, Args&&... args) {
  detail::log_via(logger, LogChannel::Info, fmt, std::forward<Args>(args)...);
}

template<typename... Args>
inline void log_warn(Logger* logger, spdlog::format_string_t<Args...> fmt, Args&&... args) {
  detail::log_via(logger, LogChannel::Warn, fmt, std::forward<Args>(args)...);
}

template<typename... Args>
inline void log_error(Logger* logger, spdlog::format_string_t<Args...> fmt, Args&&... args) {
  detail::log_via(logger, LogChannel::Error, fmt, std::forward<Args>(args)...);
}

template<typename... Args>
inline void log_debug(Logger* logger, spdlog::format_string_t<Args...> fmt, Args&&... args) {
  detail::log_via(logger, LogChannel::Debug, fmt, std::forward<Args>(args)...);
}

template<typename... Args>
inline void print_out(Logger* logger, spdlog::format_string_t<Args...> fmt, Args&&... args) {
  detail::log_via(logger, LogChannel::Print, fmt, std::forward<Args>(args)...);
}

template<typename... Args>
inline void print_err(Logger* logger, spdlog::format_string_t<Args...> fmt, Args&&... args) {
  detail::log_via(logger, LogChannel::PrintErr, fmt, std::forward<Args>(args)...);
}
