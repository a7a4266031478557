#include <gtest/gtest.h>

#include <boost/filesystem.hpp>

#include "application/ports/ILogger.hpp"
#include "domain/Settings.hpp"
#include "infrastructure/logging/Logger_Spdlog.hpp"

using streamscout::application::ports::LogLevel;
using streamscout::domain::Settings;
using streamscout::infrastructure::logging::Logger_Spdlog;
namespace fs = boost::filesystem;

static fs::path tmp_dir(const std::string& name)
{
  auto dir = fs::temp_directory_path() / ("streamscout-logs-" + name);
  fs::remove_all(dir);
  fs::create_directories(dir);
  return dir;
}

TEST(LoggerSpdlog, CreatesFilesAndIsIdempotent)
{
  Settings s;
  auto dir = tmp_dir("smoke");
  s.logsDir = dir.string();
  s.appLogFilename = "app.log";
  s.netLogFilename = "net.log";
  s.showConsole = false;
  s.saveLog = true;
  s.saveNetLog = true;

  Logger_Spdlog log;
  EXPECT_NO_THROW(log.init(s));
  EXPECT_NO_THROW(log.app(LogLevel::info, "hello app"));
  EXPECT_NO_THROW(log.net(LogLevel::info, "hello net"));

  EXPECT_TRUE(fs::exists(dir / "app.log"));
  EXPECT_TRUE(fs::exists(dir / "net.log"));

  EXPECT_NO_THROW(log.init(s));
}

TEST(LoggerSpdlog, FileSinksFollowSaveFlags)
{
  Settings s;
  auto dir = tmp_dir("flags");
  s.logsDir = dir.string();
  s.appLogFilename = "app.log";
  s.netLogFilename = "net.log";
  s.showConsole = false;
  s.saveLog = true;
  s.saveNetLog = false;

  Logger_Spdlog log;
  log.init(s);
  log.net(LogLevel::warn, "dropped");

  EXPECT_TRUE(fs::exists(dir / "app.log"));
  EXPECT_FALSE(fs::exists(dir / "net.log"));
}

TEST(LoggerSpdlog, ParsesLevelNames)
{
  EXPECT_EQ(Logger_Spdlog::parse_level("trace"), LogLevel::trace);
  EXPECT_EQ(Logger_Spdlog::parse_level("debug"), LogLevel::debug);
  EXPECT_EQ(Logger_Spdlog::parse_level("warning"), LogLevel::warn);
  EXPECT_EQ(Logger_Spdlog::parse_level("error"), LogLevel::err);
  EXPECT_EQ(Logger_Spdlog::parse_level("off"), LogLevel::off);
  EXPECT_EQ(Logger_Spdlog::parse_level("loud"), LogLevel::info);
}
