#pragma once

#include <utility>  // Boost 1.74 awaitable.hpp uses std::exchange without including it
#include <boost/asio/awaitable.hpp>
#include <chrono>
#include <cstdint>
#include <string>

#include "application/ports/IConnectivityProbe.hpp"
#include "application/ports/ILogger.hpp"
#include "shared/async/AsyncGate.hpp"

namespace streamscout::infrastructure::net
{

class ConnectivityProbe_Asio final : public streamscout::application::ports::IConnectivityProbe
{
 public:
  static constexpr int kMaxAttempts = 2;

  // `gate` is the process-wide connection gate shared with every other connector
  ConnectivityProbe_Asio(shared::async::AsyncGate& gate,
                         streamscout::application::ports::ILogger& log,
                         streamscout::application::ports::ConnectPolicy policy = {});

  // IConnectivityProbe
  boost::asio::awaitable<bool> is_reachable(std::string host, uint16_t port,
                                            std::chrono::milliseconds timeout) override;

  const streamscout::application::ports::ConnectPolicy& policy() const noexcept { return policy_; }

 private:
  shared::async::AsyncGate& gate_;
  streamscout::application::ports::ILogger& log_;
  streamscout::application::ports::ConnectPolicy policy_;
};

}  // namespace streamscout::infrastructure::net
