#include "infrastructure/logging/Logger_Spdlog.hpp"

#include <spdlog/async.h>
#include <spdlog/async_logger.h>
#include <spdlog/sinks/rotating_file_sink.h>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/spdlog.h>

#include <algorithm>
#include <boost/filesystem.hpp>
#include <chrono>
#include <vector>

namespace fs = boost::filesystem;
using streamscout::application::ports::LogLevel;

namespace streamscout::infrastructure::logging {

namespace {

constexpr std::size_t kRotateBytes = 5 * 1024 * 1024;
constexpr std::size_t kRotateFiles = 3;
constexpr std::size_t kQueueSize   = 8192;
constexpr const char* kPattern     = "[%Y-%m-%d %H:%M:%S.%e] [%n] %^[%l]%$ %v";

spdlog::sink_ptr file_sink(const fs::path& path) {
  auto sink = std::make_shared<spdlog::sinks::rotating_file_sink_mt>(path.string(), kRotateBytes,
                                                                     kRotateFiles);
  sink->set_level(spdlog::level::trace);
  return sink;
}

// Colors apply to the [level] token only; file sinks get the same pattern without escapes.
spdlog::sink_ptr console_sink(spdlog::level::level_enum level) {
#if defined(_WIN32)
  auto sink = std::make_shared<spdlog::sinks::stdout_color_sink_mt>();
#else
  auto sink = std::make_shared<spdlog::sinks::ansicolor_stdout_sink_mt>();
  sink->set_color(spdlog::level::trace,    "\x1b[90m");
  sink->set_color(spdlog::level::debug,    "\x1b[36m");
  sink->set_color(spdlog::level::info,     "\x1b[32m");
  sink->set_color(spdlog::level::warn,     "\x1b[33m");
  sink->set_color(spdlog::level::err,      "\x1b[31m");
  sink->set_color(spdlog::level::critical, "\x1b[35m");
#endif
  sink->set_level(level);
  return sink;
}

std::shared_ptr<spdlog::logger> make_logger(const char* name, std::vector<spdlog::sink_ptr> sinks,
                                            spdlog::level::level_enum level) {
  if (auto prev = spdlog::get(name)) spdlog::drop(prev->name());

  auto logger = std::make_shared<spdlog::async_logger>(name, sinks.begin(), sinks.end(),
                                                       spdlog::thread_pool(),
                                                       spdlog::async_overflow_policy::block);
  logger->set_pattern(kPattern);
  logger->set_level(level);
  logger->flush_on(spdlog::level::err);
  spdlog::register_logger(logger);
  return logger;
}

}  // namespace

spdlog::level::level_enum Logger_Spdlog::map_level(LogLevel l) {
  switch (l) {
    case LogLevel::trace:    return spdlog::level::trace;
    case LogLevel::debug:    return spdlog::level::debug;
    case LogLevel::info:     return spdlog::level::info;
    case LogLevel::warn:     return spdlog::level::warn;
    case LogLevel::err:      return spdlog::level::err;
    case LogLevel::critical: return spdlog::level::critical;
    case LogLevel::off:      return spdlog::level::off;
  }
  return spdlog::level::info;
}

LogLevel Logger_Spdlog::parse_level(std::string_view name) {
  if (name == "trace")                      return LogLevel::trace;
  if (name == "debug")                      return LogLevel::debug;
  if (name == "info")                       return LogLevel::info;
  if (name == "warn" || name == "warning")  return LogLevel::warn;
  if (name == "error" || name == "err")     return LogLevel::err;
  if (name == "critical")                   return LogLevel::critical;
  if (name == "off")                        return LogLevel::off;
  return LogLevel::info;
}

// -------------------------------------------------------------------------------------------------
// init(settings)
//  - "app" channel: lifecycle, discoveries, expiries and errors.
//  - "net" channel: one line per connect failure, rejected handshake or sniffed body. It reaches
//    the console only from warn upwards, so a sweep over a /24 does not bury the progress line.
//  - Each channel gets its own rotating file when saveLog / saveNetLog is set.
//  - Both loggers are async on the shared spdlog pool; probe coroutines never wait on disk.
// -------------------------------------------------------------------------------------------------
void Logger_Spdlog::init(const streamscout::domain::Settings& s) {
  const streamscout::domain::Settings d;
  const fs::path dir = s.logsDir.empty() ? fs::path{d.logsDir} : fs::path{s.logsDir};
  const auto level   = map_level(parse_level(s.logLevel));

  if (s.saveLog || s.saveNetLog) {
    boost::system::error_code ec;
    fs::create_directories(dir, ec);
  }

  std::vector<spdlog::sink_ptr> app_sinks;
  std::vector<spdlog::sink_ptr> net_sinks;

  if (s.saveLog)
    app_sinks.push_back(file_sink(dir / (s.appLogFilename.empty() ? d.appLogFilename : s.appLogFilename)));
  if (s.saveNetLog)
    net_sinks.push_back(file_sink(dir / (s.netLogFilename.empty() ? d.netLogFilename : s.netLogFilename)));

  if (s.showConsole) {
    app_sinks.push_back(console_sink(level));
    net_sinks.push_back(console_sink(std::max(level, spdlog::level::warn)));
  }

  if (!spdlog::thread_pool()) spdlog::init_thread_pool(kQueueSize, 1);
  app_ = make_logger("app", std::move(app_sinks), level);
  net_ = make_logger("net", std::move(net_sinks), level);

  spdlog::flush_every(std::chrono::seconds(2));
}

void Logger_Spdlog::app(LogLevel level, const std::string& msg) {
  if (app_) app_->log(map_level(level), msg);
}

void Logger_Spdlog::net(LogLevel level, std::string_view msg) {
  if (net_) net_->log(map_level(level), msg);
}

// Both channels; per-sink thresholds (console net >= warn) still apply.
void Logger_Spdlog::set_level(LogLevel level) {
  const auto lv = map_level(level);
  if (app_) app_->set_level(lv);
  if (net_) net_->set_level(lv);
}

} // namespace streamscout::infrastructure::logging
