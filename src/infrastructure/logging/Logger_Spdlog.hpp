#pragma once
#include <spdlog/spdlog.h>

#include <memory>
#include <string>
#include <string_view>

#include "application/ports/ILogger.hpp"
#include "domain/Settings.hpp"

namespace streamscout::infrastructure::logging
{

class Logger_Spdlog final : public streamscout::application::ports::ILogger
{
 public:
  void init(const streamscout::domain::Settings& s) override;

  void app(streamscout::application::ports::LogLevel level, const std::string& msg) override;

  void net(streamscout::application::ports::LogLevel level, std::string_view msg) override;

  void set_level(streamscout::application::ports::LogLevel level);

  // "trace" ... "off"; unknown names read as info
  static streamscout::application::ports::LogLevel parse_level(std::string_view name);

 private:
  std::shared_ptr<spdlog::logger> app_;
  std::shared_ptr<spdlog::logger> net_;

  // Helpers
  static spdlog::level::level_enum map_level(streamscout::application::ports::LogLevel l);
};

}  // namespace streamscout::infrastructure::logging
