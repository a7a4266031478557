#include "infrastructure/config/Config_Toml.hpp"
#include "domain/Settings.hpp"
#include <algorithm>
#include <filesystem>
#include <gtest/gtest.h>
#include <fstream>

using streamscout::infrastructure::config::Config_Toml;
using streamscout::domain::ProbeStrategy;
using streamscout::domain::ProtocolSpec;
using streamscout::domain::Settings;
namespace fs = std::filesystem;

static fs::path tmp_file(const std::string& name) {
  auto dir = fs::temp_directory_path() / "streamscout-tests";
  fs::create_directories(dir);
  return dir / name;
}

static void write(const fs::path& p, const std::string& text) {
  std::ofstream out(p.string());
  out << text;
}

static const ProtocolSpec* find(const Settings& s, const std::string& name) {
  auto it = std::find_if(s.protocols.begin(), s.protocols.end(),
                         [&](const ProtocolSpec& p) { return p.name == name; });
  return it == s.protocols.end() ? nullptr : &*it;
}

TEST(ConfigToml, CreatesWithDefaultsWhenMissing) {
  auto cfg = tmp_file("missing.toml");
  if (fs::exists(cfg)) fs::remove(cfg);

  Config_Toml impl;
  Settings s = impl.load_or_create(cfg.string());

  EXPECT_TRUE(fs::exists(cfg));
  EXPECT_EQ(s.protocols.size(), 7u);
  EXPECT_EQ(s.scan.maxConcurrentHosts, 20u);
  EXPECT_EQ(s.scan.profile, "lan");
  EXPECT_EQ(s.monitor.intervalMs, 10000);
  EXPECT_EQ(s.monitor.staleAfterS, 300);
  EXPECT_FALSE(s.appLogFilename.empty());
  EXPECT_FALSE(s.netLogFilename.empty());
  EXPECT_FALSE(s.logsDir.empty());

  // the generated file loads back to the same values
  Settings again = impl.load_or_create(cfg.string());
  EXPECT_TRUE(again.configNotes.empty());
  EXPECT_EQ(again.scan.maxConcurrentConnections, s.scan.maxConcurrentConnections);
  EXPECT_EQ(again.monitor.activeFile, s.monitor.activeFile);
}

TEST(ConfigToml, ReadsCustomValues) {
  auto cfg = tmp_file("custom.toml");
  write(cfg,
        "[logging]\nshowConsole=false\nsaveLog=false\nsaveNetLog=false\nlogLevel=\"debug\"\n"
        "logsDir=\"logs-x\"\nappLogFilename=\"a.log\"\nnetLogFilename=\"n.log\"\n"
        "\n[scan]\ntargets=[\"10.0.0.0/30\", \"10.0.1.7\"]\nmaxConcurrentHosts=8\n"
        "maxConcurrentConnections=16\nconnectTimeoutMs=900\nportPacingMs=50\n"
        "resultsFile=\"found.txt\"\n"
        "\n[monitor]\nintervalMs=2000\nstaleAfterS=60\nactiveFile=\"a.json\"\n");

  Config_Toml impl;
  Settings s = impl.load_or_create(cfg.string());

  EXPECT_FALSE(s.showConsole);
  EXPECT_FALSE(s.saveLog);
  EXPECT_FALSE(s.saveNetLog);
  EXPECT_EQ(s.logLevel, "debug");
  EXPECT_EQ(s.logsDir, "logs-x");
  EXPECT_EQ(s.appLogFilename, "a.log");
  EXPECT_EQ(s.netLogFilename, "n.log");

  ASSERT_EQ(s.scan.targets.size(), 2u);
  EXPECT_EQ(s.scan.targets[0], "10.0.0.0/30");
  EXPECT_EQ(s.scan.maxConcurrentHosts, 8u);
  EXPECT_EQ(s.scan.maxConcurrentConnections, 16u);
  EXPECT_EQ(s.scan.connectTimeoutMs, 900);
  EXPECT_EQ(s.scan.portPacingMs, 50);
  EXPECT_EQ(s.scan.resultsFile, "found.txt");

  EXPECT_EQ(s.monitor.intervalMs, 2000);
  EXPECT_EQ(s.monitor.staleAfterS, 60);
  EXPECT_EQ(s.monitor.activeFile, "a.json");
  EXPECT_EQ(s.monitor.historyFile, "stream_history.json");
}

TEST(ConfigToml, FallbackWhenSectionMissing) {
  auto cfg = tmp_file("no-logging.toml");
  write(cfg, "[scan]\nprofile=\"lan\"\n");

  Config_Toml impl;
  Settings s = impl.load_or_create(cfg.string());

  EXPECT_FALSE(s.logsDir.empty());
  EXPECT_FALSE(s.appLogFilename.empty());
  EXPECT_FALSE(s.netLogFilename.empty());
  EXPECT_EQ(s.protocols.size(), 7u);
}

TEST(ConfigToml, ProtocolTablesOverrideAndExtendCatalog) {
  auto cfg = tmp_file("protocols.toml");
  write(cfg,
        "[protocols.rtsp]\nports=[8554, 554, 8554]\npaths=[\"cam1\"]\ntimeoutMs=1500\n"
        "\n[protocols.mjpeg]\nstrategy=\"http\"\nports=[8090]\npaths=[\"video.mjpg\"]\n");

  Config_Toml impl;
  Settings s = impl.load_or_create(cfg.string());

  const auto* rtsp = find(s, "rtsp");
  ASSERT_NE(rtsp, nullptr);
  EXPECT_EQ(rtsp->ports, (std::vector<uint16_t>{8554, 554}));
  EXPECT_EQ(rtsp->paths, (std::vector<std::string>{"cam1"}));
  EXPECT_EQ(rtsp->timeout.count(), 1500);
  EXPECT_EQ(rtsp->retries, 3);  // untouched field keeps its default
  EXPECT_EQ(rtsp->strategy, ProbeStrategy::rtsp);

  const auto* mjpeg = find(s, "mjpeg");
  ASSERT_NE(mjpeg, nullptr);
  EXPECT_EQ(mjpeg->strategy, ProbeStrategy::http);
  EXPECT_EQ(mjpeg->schemes, (std::vector<std::string>{"http"}));
  EXPECT_EQ(mjpeg->ports, (std::vector<uint16_t>{8090}));
  EXPECT_FALSE(mjpeg->contentTypes.empty());
  EXPECT_EQ(s.protocols.size(), 8u);
}

TEST(ConfigToml, MobileProfileCapsConcurrency) {
  auto cfg = tmp_file("mobile.toml");
  write(cfg, "[scan]\nprofile=\"mobile\"\nmaxConcurrentHosts=30\nmaxConcurrentConnections=100\n");

  Config_Toml impl;
  Settings s = impl.load_or_create(cfg.string());

  EXPECT_EQ(s.scan.profile, "mobile");
  EXPECT_EQ(s.scan.maxConcurrentHosts, 5u);
  EXPECT_EQ(s.scan.maxConcurrentConnections, 20u);
}

TEST(ConfigToml, InvalidValuesKeepDefaults) {
  auto cfg = tmp_file("invalid.toml");
  write(cfg, "[scan]\nmaxConcurrentHosts=-4\nconnectTimeoutMs=\"fast\"\nprofile=\"satellite\"\n"
             "\n[protocols.http]\nports=[80, 70000]\n");

  Config_Toml impl;
  Settings s = impl.load_or_create(cfg.string());

  EXPECT_EQ(s.scan.maxConcurrentHosts, 20u);
  EXPECT_EQ(s.scan.connectTimeoutMs, 2000);
  EXPECT_EQ(s.scan.profile, "lan");
  const auto* h = find(s, "http");
  ASSERT_NE(h, nullptr);
  EXPECT_EQ(h->ports, (std::vector<uint16_t>{80}));
  EXPECT_GE(s.configNotes.size(), 4u);
}

TEST(ConfigToml, DelaysMayBeZeroButNotNegative) {
  auto cfg = tmp_file("delays.toml");
  write(cfg, "[scan]\nportPacingMs=0\nconnectRetryDelayMs=0\nprobeRetryDelayMs=-1\n"
             "connectTimeoutMs=0\n");

  Config_Toml impl;
  Settings s = impl.load_or_create(cfg.string());

  EXPECT_EQ(s.scan.portPacingMs, 0);
  EXPECT_EQ(s.scan.connectRetryDelayMs, 0);
  EXPECT_EQ(s.scan.probeRetryDelayMs, 1000);
  EXPECT_EQ(s.scan.connectTimeoutMs, 2000);
  EXPECT_EQ(s.configNotes.size(), 2u);
}

TEST(ConfigToml, UnparsableFileIsReplacedAndKeptAside) {
  auto cfg = tmp_file("broken.toml");
  const fs::path bak = cfg.string() + ".bak";
  if (fs::exists(bak)) fs::remove(bak);
  write(cfg, "[scan\nthis is not toml = = =\n");

  Config_Toml impl;
  Settings s = impl.load_or_create(cfg.string());

  EXPECT_EQ(s.scan.maxConcurrentHosts, 20u);
  EXPECT_EQ(s.configNotes.size(), 1u);
  EXPECT_TRUE(fs::exists(bak));

  // the rewritten file parses cleanly
  Settings again = impl.load_or_create(cfg.string());
  EXPECT_TRUE(again.configNotes.empty());
}
