#include "infrastructure/net/NetworkRange.hpp"

#include <utility>  // Boost 1.74 awaitable.hpp uses std::exchange without including it
#include <boost/asio/io_context.hpp>
#include <boost/asio/ip/network_v4.hpp>
#include <boost/asio/ip/udp.hpp>
#include <set>

using streamscout::application::ports::LogLevel;

namespace streamscout::infrastructure::net
{
namespace asio = boost::asio;

std::string NetworkRange::local_ipv4(application::ports::ILogger& log)
{
  // connect() on a UDP socket only selects the route; nothing is sent
  asio::io_context io;
  asio::ip::udp::socket sock(io);
  boost::system::error_code ec;

  sock.open(asio::ip::udp::v4(), ec);
  if (!ec) sock.connect({asio::ip::make_address_v4("8.8.8.8"), 80}, ec);
  if (ec)
  {
    log.app(LogLevel::warn, "Failed to get local IP (" + ec.message() + "), using 127.0.0.1");
    return "127.0.0.1";
  }

  const auto ep = sock.local_endpoint(ec);
  if (ec)
  {
    log.app(LogLevel::warn, "Failed to get local IP (" + ec.message() + "), using 127.0.0.1");
    return "127.0.0.1";
  }
  return ep.address().to_string();
}

std::vector<std::string> NetworkRange::expand_cidr(const std::string& cidr,
                                                   application::ports::ILogger& log)
{
  boost::system::error_code ec;
  const auto net = asio::ip::make_network_v4(cidr, ec);
  if (ec)
  {
    log.app(LogLevel::err, "Invalid network range '" + cidr + "': " + ec.message());
    return {};
  }
  if (net.prefix_length() < kMinPrefix)
  {
    log.app(LogLevel::err, "Network range '" + cidr + "' is wider than /" +
                               std::to_string(kMinPrefix) + ", refusing to scan it");
    return {};
  }

  std::vector<std::string> out;
  const auto hosts = net.canonical().hosts();
  for (auto it = hosts.begin(); it != hosts.end(); ++it) out.push_back(it->to_string());

  // /32 has no host range; the address itself is the target
  if (out.empty()) out.push_back(net.address().to_string());
  return out;
}

std::vector<std::string> NetworkRange::enumerate(const std::vector<std::string>& targets,
                                                 application::ports::ILogger& log)
{
  std::vector<std::string> expanded;

  if (targets.empty())
  {
    const auto ip = local_ipv4(log);
    expanded = expand_cidr(ip + "/24", log);
  }
  else
  {
    for (const auto& t : targets)
    {
      if (t.find('/') != std::string::npos)
      {
        auto part = expand_cidr(t, log);
        expanded.insert(expanded.end(), part.begin(), part.end());
      }
      else if (!t.empty())
      {
        expanded.push_back(t);
      }
    }
  }

  std::vector<std::string> out;
  out.reserve(expanded.size());
  std::set<std::string> seen;
  for (auto& h : expanded)
  {
    if (seen.insert(h).second) out.push_back(std::move(h));
  }

  log.app(LogLevel::info, "Scan targets: " + std::to_string(out.size()) + " host(s)");
  return out;
}

}  // namespace streamscout::infrastructure::net
