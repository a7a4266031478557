#pragma once

#include <utility>  // Boost 1.74 awaitable.hpp uses std::exchange without including it
#include <boost/asio/awaitable.hpp>
#include <chrono>
#include <set>
#include <string>

#include "application/ports/IConnectivityProbe.hpp"
#include "application/ports/ILogger.hpp"
#include "application/ports/IProtocolProber.hpp"
#include "domain/ScanProgress.hpp"
#include "domain/protocol/ProtocolCatalog.hpp"

namespace streamscout::application::services
{

class HostScanner
{
 public:
  struct Options
  {
    std::chrono::milliseconds connectTimeout{2000};
    std::chrono::milliseconds pacing{200};  // before every fresh port check
  };

  HostScanner(ports::IConnectivityProbe& connectivity, ports::IProtocolProber& prober,
              ports::ILogger& log, const domain::protocol::ProtocolCatalog& catalog, Options opts)
      : connectivity_(connectivity), prober_(prober), log_(log), catalog_(catalog), opts_(opts)
  {
  }

  // Checks every (protocol, port) of the catalog and fans out probers for the open ones.
  // `progress` is updated exactly once when the host is done.
  boost::asio::awaitable<std::set<domain::StreamCandidate>> scan(std::string host,
                                                                 domain::ScanProgress& progress);

 private:
  ports::IConnectivityProbe& connectivity_;
  ports::IProtocolProber& prober_;
  ports::ILogger& log_;
  const domain::protocol::ProtocolCatalog& catalog_;
  Options opts_;
};

}  // namespace streamscout::application::services
