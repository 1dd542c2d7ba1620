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

// Debug/Info/Warn go to stdout and Error to stderr, all stamped and tagged
// with the source. Print/PrintErr are bare protocol lines for whatever
// process drives the console.
enum class LogChannel { Debug, Info, Warn, Error, Print, PrintErr };

// Sets up the console sinks (and an optional file sink). Safe to call more
// than once; later calls only adjust the level and attach the file sink if
// it was not attached yet.
void init(bool verbose = false, const std::string& log_file = std::string());

// When disabled, messages that no listener claimed are dropped instead of
// reaching the console. Test runners turn this off to keep output quiet.
void set_log_passthrough(bool enabled);
bool log_passthrough();

// Writes straight to the shared sinks; `source` is empty for untagged lines.
void emit_log(LogChannel channel, const std::string& source, const std::string& message);

using LogListenerHandle = std::size_t;

// Named front end over the shared sinks. Listeners see every message first
// as "<name>:<channel>"; one returning true keeps it off the console.
class Logger {
public:
  using Listener = std::function<bool(const std::string& channel,
                                      spdlog::level::level_enum level,
                                      const std::string& message)>;

  Logger() = default;
  explicit Logger(std::string name);

  void set_name(std::string name);

  LogListenerHandle add_listener(Listener listener);
  void remove_listener(LogListenerHandle handle);

  template<typename... Args>
  void write(LogChannel channel, spdlog::format_string_t<Args...> fmt, Args&&... args) {
    publish(channel, fmt::format(fmt, std::forward<Args>(args)...));
  }

  template<typename... Args>
  void debug(spdlog::format_string_t<Args...> fmt, Args&&... args) {
    write(LogChannel::Debug, fmt, std::forward<Args>(args)...);
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
  void print(spdlog::format_string_t<Args...> fmt, Args&&... args) {
    write(LogChannel::Print, fmt, std::forward<Args>(args)...);
  }

  template<typename... Args>
  void print_err(spdlog::format_string_t<Args...> fmt, Args&&... args) {
    write(LogChannel::PrintErr, fmt, std::forward<Args>(args)...);
  }

private:
  void publish(LogChannel channel, const std::string& message);
  bool offer_to_listeners(const std::string& channel,
                          spdlog::level::level_enum level,
                          const std::string& message);

  mutable std::mutex name_mutex_;
  std::string name_;
  std::mutex listener_mutex_;
  std::unordered_map<LogListenerHandle, Listener> listeners_;
  std::atomic<LogListenerHandle> next_listener_id_{1};
};

// For code that may run before any Logger exists (settings loading, usage
// text); a null logger writes untagged to the shared sinks.
template<typename... Args>
void log_to(Logger* logger, LogChannel channel, spdlog::format_string_t<Args...> fmt, Args&&... args) {
  if(logger) {
    logger->write(channel, fmt, std::forward<Args>(args)...);
  } else {
    emit_log(channel, std::string(), fmt::format(fmt, std::forward<Args>(args)...));
  }
}
