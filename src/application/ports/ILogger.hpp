#pragma once

#include <string>
#include <string_view>

#include "domain/Settings.hpp"

namespace streamscout::application::ports
{

enum class LogLevel
{
  trace,
  debug,
  info,
  warn,
  err,
  critical,
  off
};

struct ILogger
{
  virtual ~ILogger() = default;
  virtual void init(const streamscout::domain::Settings& s) = 0;

  // lifecycle, results, errors
  virtual void app(LogLevel level, const std::string& msg) = 0;

  // per-connection diagnostics
  virtual void net(LogLevel level, std::string_view msg) = 0;
};

}  // namespace streamscout::application::ports
