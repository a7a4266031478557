#pragma once

#include <utility>  // Boost 1.74 awaitable.hpp uses std::exchange without including it
#include <boost/asio/awaitable.hpp>
#include <chrono>
#include <cstdint>
#include <functional>
#include <string>
#include <vector>

#include "application/ports/IConnectivityProbe.hpp"
#include "application/ports/ILogger.hpp"
#include "application/ports/IProtocolProber.hpp"
#include "infrastructure/net/HttpClient_Beast.hpp"
#include "infrastructure/probe/RtspProbe.hpp"
#include "infrastructure/probe/WebSocketProbe.hpp"

namespace streamscout::infrastructure::probe
{

// Strategy dispatch on ProtocolSpec::strategy. Every path (x variant x scheme) is one
// independent check; a failing check never aborts the remaining ones.
class ProtocolProber_Asio final : public streamscout::application::ports::IProtocolProber
{
 public:
  ProtocolProber_Asio(streamscout::application::ports::IConnectivityProbe& connectivity,
                      net::HttpClient_Beast& http, RtspProbe& rtsp, WebSocketProbe& ws,
                      streamscout::application::ports::ILogger& log,
                      std::chrono::milliseconds retryDelay = std::chrono::milliseconds(1000));

  // IProtocolProber
  boost::asio::awaitable<std::vector<domain::StreamCandidate>> probe(
      const domain::ProtocolSpec& spec, std::string host, uint16_t port) override;

 private:
  using Attempt = std::function<boost::asio::awaitable<Verdict>()>;

  // Runs `attempt` up to `attempts` times; only Verdict::unreachable is retried.
  boost::asio::awaitable<Verdict> with_retries(int attempts, const Attempt& attempt);

  boost::asio::awaitable<Verdict> check_rtsp(const domain::ProtocolSpec& spec,
                                             const std::string& host, uint16_t port,
                                             const std::string& url);
  boost::asio::awaitable<Verdict> check_hls(const domain::ProtocolSpec& spec,
                                            const std::string& url);
  boost::asio::awaitable<Verdict> check_dash(const domain::ProtocolSpec& spec,
                                             const std::string& url);
  boost::asio::awaitable<Verdict> check_http(const domain::ProtocolSpec& spec,
                                             const std::string& url);

  boost::asio::awaitable<std::vector<domain::StreamCandidate>> probe_rtmp(
      const domain::ProtocolSpec& spec, const std::string& host, uint16_t port);

  streamscout::application::ports::IConnectivityProbe& connectivity_;
  net::HttpClient_Beast& http_;
  RtspProbe& rtsp_;
  WebSocketProbe& ws_;
  streamscout::application::ports::ILogger& log_;
  std::chrono::milliseconds retry_delay_;
};

}  // namespace streamscout::infrastructure::probe
