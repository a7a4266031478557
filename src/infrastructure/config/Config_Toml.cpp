#include "infrastructure/config/Config_Toml.hpp"

#include <algorithm>
#include <boost/filesystem/operations.hpp>
#include <boost/filesystem/path.hpp>
#include <exception>
#include <fstream>
#include <limits>
#include <toml++/toml.hpp>
#include <vector>

#include "domain/protocol/ProtocolCatalog.hpp"
#include "shared/text/Text.hpp"

using streamscout::domain::ProtocolSpec;
using streamscout::domain::Settings;
using streamscout::domain::protocol::ProtocolCatalog;
namespace fs = boost::filesystem;

namespace streamscout::infrastructure::config
{

namespace
{
constexpr std::size_t kMobileMaxHosts = 5;
constexpr std::size_t kMobileMaxConnections = 20;

static std::string quoted_list(const std::vector<std::string>& v)
{
  std::vector<std::string> q;
  q.reserve(v.size());
  for (const auto& s : v) q.push_back("\"" + s + "\"");
  return "[" + shared::text::join(q) + "]";
}

static std::vector<std::string> read_strings(const toml::array& arr)
{
  std::vector<std::string> out;
  for (auto& e : arr)
  {
    if (auto v = e.value<std::string>()) out.push_back(*v);
  }
  return out;
}

// integers >= `minimum` only; anything else keeps the default and leaves a note
template <typename T>
static void read_at_least(const toml::table& t, const char* key, T& dst, int64_t minimum,
                          std::vector<std::string>& notes)
{
  auto node = t[key];
  if (!node) return;
  auto v = node.value<int64_t>();
  if (!v || *v < minimum || static_cast<uint64_t>(*v) > std::numeric_limits<T>::max())
  {
    notes.push_back(std::string("Invalid value for '") + key + "', keeping " +
                    std::to_string(dst));
    return;
  }
  dst = static_cast<T>(*v);
}

template <typename T>
static void read_positive(const toml::table& t, const char* key, T& dst,
                          std::vector<std::string>& notes)
{
  read_at_least(t, key, dst, 1, notes);
}

// delays: 0 disables the wait
template <typename T>
static void read_delay(const toml::table& t, const char* key, T& dst,
                       std::vector<std::string>& notes)
{
  read_at_least(t, key, dst, 0, notes);
}

static std::vector<uint16_t> read_ports(const toml::array& arr, const std::string& proto,
                                        std::vector<std::string>& notes)
{
  std::vector<uint16_t> out;
  for (auto& e : arr)
  {
    auto p = e.value<int64_t>();
    if (p && *p > 0 && *p <= 65535)
      out.push_back(static_cast<uint16_t>(*p));
    else
      notes.push_back("Ignoring invalid port in [protocols." + proto + "]");
  }
  return out;
}

// [protocols.<name>] tables override catalog entries field by field or add new entries
static void read_protocols(const toml::table& protos, Settings& s)
{
  for (auto&& [key, node] : protos)
  {
    const std::string name{key.str()};
    auto t = node.as_table();
    if (!t)
    {
      s.configNotes.push_back("Ignoring [protocols." + name + "]: not a table");
      continue;
    }

    auto it = std::find_if(s.protocols.begin(), s.protocols.end(),
                           [&](const ProtocolSpec& p) { return p.name == name; });
    const bool added = it == s.protocols.end();

    ProtocolSpec spec;
    if (added)
    {
      spec.name = name;
      spec.schemes = {"http"};
      spec.contentTypes = ProtocolCatalog::video_content_types();
    }
    else
    {
      spec = *it;
    }

    if (auto v = (*t)["strategy"].value<std::string>())
    {
      if (auto st = domain::strategy_from_string(*v))
        spec.strategy = *st;
      else
        s.configNotes.push_back("Unknown strategy '" + *v + "' for protocol " + name);
    }
    else if (added)
    {
      // a new entry named after a strategy uses it
      if (auto st = domain::strategy_from_string(name)) spec.strategy = *st;
    }

    if (auto a = (*t)["schemes"].as_array()) spec.schemes = read_strings(*a);
    if (auto a = (*t)["ports"].as_array()) spec.ports = read_ports(*a, name, s.configNotes);
    if (auto a = (*t)["paths"].as_array()) spec.paths = read_strings(*a);
    if (auto a = (*t)["variants"].as_array()) spec.variants = read_strings(*a);
    if (auto a = (*t)["contentTypes"].as_array()) spec.contentTypes = read_strings(*a);
    if (auto v = (*t)["signature"].value<std::string>()) spec.signature = *v;

    int timeoutMs = static_cast<int>(spec.timeout.count());
    read_positive(*t, "timeoutMs", timeoutMs, s.configNotes);
    spec.timeout = std::chrono::milliseconds(timeoutMs);
    read_positive(*t, "retries", spec.retries, s.configNotes);

    ProtocolCatalog::normalize(spec);
    if (added)
      s.protocols.push_back(std::move(spec));
    else
      *it = std::move(spec);
  }
}
}  // namespace

void Config_Toml::apply_profile(Settings& s)
{
  if (s.scan.profile != "mobile") return;
  s.scan.maxConcurrentHosts = std::min(s.scan.maxConcurrentHosts, kMobileMaxHosts);
  s.scan.maxConcurrentConnections = std::min(s.scan.maxConcurrentConnections, kMobileMaxConnections);
}

void Config_Toml::write_default(const fs::path& path, Settings& s)
{
  boost::system::error_code ec;
  if (path.has_parent_path()) fs::create_directories(path.parent_path(), ec);
  std::ofstream out(path.string());
  if (!out)
  {
    s.configNotes.push_back("Could not write default configuration to " + path.string());
    return;
  }

  const Settings d;

  // Header
  out << "# streamscout.toml - auto-generated initial configuration\n"
         "# Edit as needed and restart the application\n\n";

  // [logging]
  out << "[logging]\n";
  out << "showConsole    = " << (d.showConsole ? "true" : "false") << "\n";
  out << "saveLog        = " << (d.saveLog ? "true" : "false") << "\n";
  out << "saveNetLog     = " << (d.saveNetLog ? "true" : "false") << "\n";
  out << "logLevel       = \"" << d.logLevel << "\"\n";
  out << "logsDir        = \"" << d.logsDir << "\"\n";
  out << "appLogFilename = \"" << d.appLogFilename << "\"\n";
  out << "netLogFilename = \"" << d.netLogFilename << "\"\n\n";

  // [scan]
  out << "[scan]\n";
  out << "# CIDR ranges or single hosts; empty scans the local /24\n";
  out << "targets                  = " << quoted_list(d.scan.targets) << "\n";
  out << "# \"lan\" or \"mobile\" (caps hosts at " << kMobileMaxHosts << " and connections at "
      << kMobileMaxConnections << ")\n";
  out << "profile                  = \"" << d.scan.profile << "\"\n";
  out << "maxConcurrentHosts       = " << d.scan.maxConcurrentHosts << "\n";
  out << "maxConcurrentConnections = " << d.scan.maxConcurrentConnections << "\n";
  out << "connectTimeoutMs         = " << d.scan.connectTimeoutMs << "\n";
  out << "connectAttempts          = " << d.scan.connectAttempts << "\n";
  out << "connectRetryDelayMs      = " << d.scan.connectRetryDelayMs << "\n";
  out << "portPacingMs             = " << d.scan.portPacingMs << "\n";
  out << "probeRetryDelayMs        = " << d.scan.probeRetryDelayMs << "\n";
  out << "resultsFile              = \"" << d.scan.resultsFile << "\"\n\n";

  // [monitor]
  out << "[monitor]\n";
  out << "intervalMs     = " << d.monitor.intervalMs << "\n";
  out << "errorBackoffMs = " << d.monitor.errorBackoffMs << "\n";
  out << "staleAfterS    = " << d.monitor.staleAfterS << "\n";
  out << "probeTimeoutMs = " << d.monitor.probeTimeoutMs << "\n";
  out << "sampleBytes    = " << d.monitor.sampleBytes << "\n";
  out << "activeFile     = \"" << d.monitor.activeFile << "\"\n";
  out << "historyFile    = \"" << d.monitor.historyFile << "\"\n\n";

  // [protocols.*] (commented: the built-in catalog applies)
  out << "# Override any field of a built-in protocol or add a new one:\n";
  out << "# [protocols.rtsp]\n";
  out << "# ports     = [554, 8554]\n";
  out << "# paths     = [\"live\", \"stream\"]\n";
  out << "# timeoutMs = 5000\n";
  out << "# retries   = 3\n";
  out << "#\n";
  out << "# [protocols.mjpeg]\n";
  out << "# strategy  = \"http\"\n";
  out << "# schemes   = [\"http\"]\n";
  out << "# ports     = [8090]\n";
  out << "# paths     = [\"video.mjpg\"]\n";

  out.close();
}

Settings Config_Toml::load_or_create(const std::string& configPath)
{
  Settings s;
  s.configPath = configPath;
  s.protocols = ProtocolCatalog::default_specs();
  const fs::path path{configPath};

  if (!fs::exists(path))
  {
    write_default(path, s);
    return s;
  }

  toml::table tbl;
  try
  {
    tbl = toml::parse_file(path.string());
  }
  catch (const toml::parse_error& e)
  {
    // keep the broken file aside, then recreate with defaults
    boost::system::error_code ec;
    fs::copy_file(path, fs::path(path.string() + ".bak"), fs::copy_options::overwrite_existing, ec);
    s.configNotes.push_back("Could not parse " + path.string() + " (" +
                            std::string(e.description()) + "), defaults restored");
    write_default(path, s);
    return s;
  }

  // ---------------------------
  // [logging]
  // ---------------------------
  if (auto log = tbl["logging"].as_table())
  {
    if (auto v = (*log)["showConsole"].value<bool>()) s.showConsole = *v;
    if (auto v = (*log)["saveLog"].value<bool>()) s.saveLog = *v;
    if (auto v = (*log)["saveNetLog"].value<bool>()) s.saveNetLog = *v;
    if (auto v = (*log)["logLevel"].value<std::string>()) s.logLevel = *v;
    if (auto v = (*log)["logsDir"].value<std::string>()) s.logsDir = *v;
    if (auto v = (*log)["appLogFilename"].value<std::string>()) s.appLogFilename = *v;
    if (auto v = (*log)["netLogFilename"].value<std::string>()) s.netLogFilename = *v;
  }

  const Settings d;
  if (s.logsDir.empty()) s.logsDir = d.logsDir;
  if (s.appLogFilename.empty()) s.appLogFilename = d.appLogFilename;
  if (s.netLogFilename.empty()) s.netLogFilename = d.netLogFilename;

  // ---------------------------
  // [scan]
  // ---------------------------
  if (auto sc = tbl["scan"].as_table())
  {
    if (auto a = (*sc)["targets"].as_array()) s.scan.targets = read_strings(*a);
    if (auto v = (*sc)["profile"].value<std::string>())
    {
      const auto p = shared::text::to_lower(*v);
      if (p == "lan" || p == "mobile")
        s.scan.profile = p;
      else
        s.configNotes.push_back("Unknown scan profile '" + *v + "', using lan");
    }
    read_positive(*sc, "maxConcurrentHosts", s.scan.maxConcurrentHosts, s.configNotes);
    read_positive(*sc, "maxConcurrentConnections", s.scan.maxConcurrentConnections, s.configNotes);
    read_positive(*sc, "connectTimeoutMs", s.scan.connectTimeoutMs, s.configNotes);
    read_positive(*sc, "connectAttempts", s.scan.connectAttempts, s.configNotes);
    read_delay(*sc, "connectRetryDelayMs", s.scan.connectRetryDelayMs, s.configNotes);
    read_delay(*sc, "portPacingMs", s.scan.portPacingMs, s.configNotes);
    read_delay(*sc, "probeRetryDelayMs", s.scan.probeRetryDelayMs, s.configNotes);
    if (auto v = (*sc)["resultsFile"].value<std::string>(); v && !v->empty())
      s.scan.resultsFile = *v;
  }

  // ---------------------------
  // [monitor]
  // ---------------------------
  if (auto m = tbl["monitor"].as_table())
  {
    read_positive(*m, "intervalMs", s.monitor.intervalMs, s.configNotes);
    read_positive(*m, "errorBackoffMs", s.monitor.errorBackoffMs, s.configNotes);
    read_positive(*m, "staleAfterS", s.monitor.staleAfterS, s.configNotes);
    read_positive(*m, "probeTimeoutMs", s.monitor.probeTimeoutMs, s.configNotes);
    read_positive(*m, "sampleBytes", s.monitor.sampleBytes, s.configNotes);
    if (auto v = (*m)["activeFile"].value<std::string>(); v && !v->empty())
      s.monitor.activeFile = *v;
    if (auto v = (*m)["historyFile"].value<std::string>(); v && !v->empty())
      s.monitor.historyFile = *v;
  }

  // ---------------------------
  // [protocols.<name>]
  // ---------------------------
  if (auto protos = tbl["protocols"].as_table()) read_protocols(*protos, s);

  apply_profile(s);
  return s;
}

}  // namespace streamscout::infrastructure::config
