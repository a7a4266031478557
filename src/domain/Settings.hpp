#pragma once

#include <cstddef>
#include <cstdint>
#include <string>
#include <vector>

#include "domain/ProtocolSpec.hpp"

namespace streamscout::domain
{

struct Settings
{
  struct Scan
  {
    std::vector<std::string> targets;  // CIDR ranges or single hosts; empty = local /24
    std::string profile{"lan"};        // "lan" | "mobile"
    std::size_t maxConcurrentHosts{20};
    std::size_t maxConcurrentConnections{50};
    int connectTimeoutMs{2000};
    int connectAttempts{2};
    int connectRetryDelayMs{250};
    int portPacingMs{200};
    int probeRetryDelayMs{1000};
    std::string resultsFile{"streams.txt"};
  } scan;

  struct Monitor
  {
    int intervalMs{10000};
    int errorBackoffMs{5000};
    int staleAfterS{300};
    int probeTimeoutMs{30000};
    std::size_t sampleBytes{8192};
    std::string activeFile{"active_streams.json"};
    std::string historyFile{"stream_history.json"};
  } monitor;

  // Resolved protocol catalog (defaults merged with [protocols.*] overrides)
  std::vector<ProtocolSpec> protocols;

  // Console / Logs
  bool showConsole{true};
  bool saveLog{true};
  bool saveNetLog{true};
  std::string logLevel{"info"};
  std::string logsDir{"logs"};
  std::string appLogFilename{"scout_app.log"};
  std::string netLogFilename{"scout_net.log"};
  std::string configPath{"streamscout.toml"};

  // problems found while loading, logged once the logger is up
  std::vector<std::string> configNotes;
};

}  // namespace streamscout::domain
