#include "log.hpp"

#include <spdlog/sinks/basic_file_sink.h>
#include <spdlog/sinks/stdout_color_sinks.h>

#include <exception>
#include <vector>

namespace {

constexpr const char* kStampedPattern = "[%Y-%m-%d %H:%M:%S.%e] [%^%l%$] %v";

struct ChannelTraits {
  const char* name;
  spdlog::level::level_enum level;
  bool plain;   // protocol line, written verbatim
};

// indexed by LogChannel
constexpr ChannelTraits kChannels[] = {
  {"debug", spdlog::level::debug, false},
  {"info", spdlog::level::info, false},
  {"warn", spdlog::level::warn, false},
  {"error", spdlog::level::err, false},
  {"print", spdlog::level::info, true},
  {"print_err", spdlog::level::err, true},
};

const ChannelTraits& traits(LogChannel channel) {
  return kChannels[static_cast<std::size_t>(channel)];
}

struct SharedSinks {
  std::shared_ptr<spdlog::logger> stamped_out;
  std::shared_ptr<spdlog::logger> stamped_err;
  std::shared_ptr<spdlog::logger> plain_out;
  std::shared_ptr<spdlog::logger> plain_err;
  std::shared_ptr<spdlog::sinks::basic_file_sink_mt> file;
};

SharedSinks g_sinks;
std::mutex g_setup_mutex;
std::atomic<bool> g_log_passthrough{true};

template<typename Sink>
std::shared_ptr<spdlog::logger> make_console_logger(const char* name,
                                                    const char* pattern,
                                                    spdlog::level::level_enum flush_level) {
  auto sink = std::make_shared<Sink>();
  sink->set_pattern(pattern);
  auto logger = std::make_shared<spdlog::logger>(name, std::move(sink));
  logger->flush_on(flush_level);
  return logger;
}

void create_sinks_locked() {
  if(g_sinks.stamped_out) return;
  using spdlog::sinks::stdout_color_sink_mt;
  using spdlog::sinks::stderr_color_sink_mt;
  g_sinks.stamped_out = make_console_logger<stdout_color_sink_mt>("handoff.out", kStampedPattern, spdlog::level::warn);
  g_sinks.stamped_err = make_console_logger<stderr_color_sink_mt>("handoff.err", kStampedPattern, spdlog::level::err);
  // protocol lines are read by another process, flush every one
  g_sinks.plain_out = make_console_logger<stdout_color_sink_mt>("handoff.print", "%v", spdlog::level::trace);
  g_sinks.plain_err = make_console_logger<stderr_color_sink_mt>("handoff.print_err", "%v", spdlog::level::trace);
}

void attach_file_sink_locked(const std::string& log_file) {
  if(log_file.empty() || g_sinks.file) return;
  g_sinks.file = std::make_shared<spdlog::sinks::basic_file_sink_mt>(log_file, false);
  g_sinks.file->set_pattern(kStampedPattern);
  g_sinks.stamped_out->sinks().push_back(g_sinks.file);
  g_sinks.stamped_err->sinks().push_back(g_sinks.file);
}

spdlog::logger* target(LogChannel channel) {
  switch(channel) {
    case LogChannel::Print: return g_sinks.plain_out.get();
    case LogChannel::PrintErr: return g_sinks.plain_err.get();
    case LogChannel::Error: return g_sinks.stamped_err.get();
    default: return g_sinks.stamped_out.get();
  }
}

} // namespace

void set_log_passthrough(bool enabled) {
  g_log_passthrough.store(enabled, std::memory_order_release);
}

bool log_passthrough() {
  return g_log_passthrough.load(std::memory_order_acquire);
}

void init(bool verbose, const std::string& log_file) {
  std::lock_guard<std::mutex> lock(g_setup_mutex);
  create_sinks_locked();
  attach_file_sink_locked(log_file);

  auto level = verbose ? spdlog::level::debug : spdlog::level::info;
  g_sinks.stamped_out->set_level(level);
  g_sinks.stamped_err->set_level(spdlog::level::info);
  g_sinks.plain_out->set_level(spdlog::level::info);
  g_sinks.plain_err->set_level(spdlog::level::info);

  spdlog::set_default_logger(g_sinks.stamped_out);
  spdlog::set_level(level);
}

void emit_log(LogChannel channel, const std::string& source, const std::string& message) {
  if(!log_passthrough()) return;
  spdlog::logger* sink = nullptr;
  {
    std::lock_guard<std::mutex> lock(g_setup_mutex);
    create_sinks_locked();
    sink = target(channel);
  }
  const auto& t = traits(channel);
  if(t.plain || source.empty()) {
    sink->log(t.level, message);
  } else {
    sink->log(t.level, fmt::format("[{}] {}", source, message));
  }
}

Logger::Logger(std::string name) : name_(std::move(name)) {}

void Logger::set_name(std::string name) {
  std::lock_guard<std::mutex> lock(name_mutex_);
  name_ = std::move(name);
}

LogListenerHandle Logger::add_listener(Listener listener) {
  if(!listener) return 0;
  std::lock_guard<std::mutex> lock(listener_mutex_);
  const auto id = next_listener_id_++;
  listeners_.emplace(id, std::move(listener));
  return id;
}

void Logger::remove_listener(LogListenerHandle handle) {
  std::lock_guard<std::mutex> lock(listener_mutex_);
  listeners_.erase(handle);
}

void Logger::publish(LogChannel channel, const std::string& message) {
  std::string source;
  {
    std::lock_guard<std::mutex> lock(name_mutex_);
    source = name_;
  }
  const auto& t = traits(channel);
  const std::string qualified = source.empty() ? std::string(t.name) : source + ":" + t.name;
  if(offer_to_listeners(qualified, t.level, message)) return;
  emit_log(channel, source.empty() ? std::string() : qualified, message);
}

bool Logger::offer_to_listeners(const std::string& channel,
                                spdlog::level::level_enum level,
                                const std::string& message) {
  std::vector<Listener> snapshot;
  {
    std::lock_guard<std::mutex> lock(listener_mutex_);
    if(listeners_.empty()) return false;
    snapshot.reserve(listeners_.size());
    for(const auto& entry : listeners_) snapshot.push_back(entry.second);
  }
  bool handled = false;
  for(auto& listener : snapshot) {
    try {
      handled = listener(channel, level, message) || handled;
    } catch(const std::exception& e) {
      emit_log(LogChannel::Error, channel, fmt::format("log listener threw: {}", e.what()));
    }
  }
  return handled;
}
