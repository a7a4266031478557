#pragma once
#include <string>
#include <sstream>
#include "application/ports/IConfigProvider.hpp"
#include "application/ports/ILogger.hpp"
#include "domain/Settings.hpp"
#include "shared/text/Text.hpp"

namespace streamscout::application::services {

struct Bootstrap {
  ports::IConfigProvider& cfg;
  ports::ILogger&         log;

  static inline const char* b2s(bool b) { return b ? "true" : "false"; }

  // Loads (or creates) the configuration, starts logging and prints the effective setup.
  domain::Settings run(const std::string& configPath) {
    auto s = cfg.load_or_create(configPath);
    log.init(s);

    using ports::LogLevel;

    log.app(LogLevel::info, "streamscout started");
    log.app(LogLevel::info, std::string("Config file: ") + s.configPath);
    for (const auto& note : s.configNotes) log.app(LogLevel::warn, note);

    log.app(LogLevel::info, std::string("Targets: ") +
                                (s.scan.targets.empty() ? std::string{"local /24"}
                                                        : shared::text::join(s.scan.targets)));

    std::ostringstream limits;
    limits << "Profile: " << s.scan.profile
           << " | hosts: " << s.scan.maxConcurrentHosts
           << " | connections: " << s.scan.maxConcurrentConnections
           << " | connect timeout: " << s.scan.connectTimeoutMs << " ms";
    log.app(LogLevel::info, limits.str());

    for (const auto& p : s.protocols) {
      std::ostringstream line;
      line << "Protocol " << p.name << " [" << domain::to_string(p.strategy) << "] ports: "
           << shared::text::join(p.ports) << " | paths: " << p.paths.size()
           << " | timeout: " << p.timeout.count() << " ms | retries: " << p.retries;
      log.app(LogLevel::debug, line.str());
    }

    std::ostringstream flags;
    flags << "Console: " << b2s(s.showConsole)
          << " | saveLog: " << b2s(s.saveLog)
          << " | saveNetLog: " << b2s(s.saveNetLog)
          << " | level: " << s.logLevel;
    log.app(LogLevel::info, flags.str());
    return s;
  }
};

} // namespace streamscout::application::services
