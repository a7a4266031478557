#include "infrastructure/persistence/StreamStore_Json.hpp"

#include <algorithm>
#include <boost/filesystem/operations.hpp>
#include <fstream>
#include <nlohmann/json.hpp>
#include <optional>

#include "shared/time/Timestamp.hpp"

using streamscout::application::ports::LogLevel;
using streamscout::application::ports::StreamDocument;
using streamscout::domain::ActiveStreamRecord;
using json = nlohmann::json;
namespace fs = boost::filesystem;

namespace streamscout::infrastructure::persistence
{

namespace
{
json to_json(const ActiveStreamRecord& r)
{
  return json{{"url", r.url},
              {"content_type", r.contentType},
              {"first_seen", shared::time::to_iso8601(r.firstSeen)},
              {"last_active", shared::time::to_iso8601(r.lastActive)},
              {"size", r.size},
              {"active", r.active}};
}

// false when the entry lacks a url, carries unreadable timestamps or a field of the wrong type
bool from_json(const json& j, ActiveStreamRecord& r)
{
  if (!j.is_object()) return false;

  const auto url = j.find("url");
  const auto contentType = j.find("content_type");
  const auto size = j.find("size");
  const auto active = j.find("active");
  const auto first = j.find("first_seen");
  const auto last = j.find("last_active");

  if (url == j.end() || !url->is_string()) return false;
  if (contentType != j.end() && !contentType->is_string()) return false;
  if (size != j.end() && !size->is_number_unsigned()) return false;
  if (active != j.end() && !active->is_boolean()) return false;
  if (first != j.end() && !first->is_string()) return false;
  if (last == j.end() || !last->is_string()) return false;

  const auto lastActive = shared::time::from_iso8601(last->get<std::string>());
  if (!lastActive) return false;
  const auto firstSeen =
      first == j.end() ? std::nullopt : shared::time::from_iso8601(first->get<std::string>());

  r.url = url->get<std::string>();
  r.contentType = contentType == j.end() ? std::string{} : contentType->get<std::string>();
  r.size = size == j.end() ? 0 : size->get<std::size_t>();
  r.active = active == j.end() ? true : active->get<bool>();
  r.lastActive = *lastActive;
  r.firstSeen = firstSeen ? *firstSeen : *lastActive;
  return true;
}

void ensure_parent(const fs::path& p)
{
  boost::system::error_code ec;
  if (p.has_parent_path()) fs::create_directories(p.parent_path(), ec);
}
}  // namespace

StreamStore_Json::StreamStore_Json(fs::path activeFile, fs::path historyFile, fs::path resultsFile,
                                   application::ports::ILogger& log)
    : active_(std::move(activeFile)), history_(std::move(historyFile)),
      results_(std::move(resultsFile)), log_(log)
{
}

const fs::path& StreamStore_Json::path_of(StreamDocument doc) const
{
  return doc == StreamDocument::active ? active_ : history_;
}

std::vector<ActiveStreamRecord> StreamStore_Json::load(StreamDocument doc)
{
  const auto& path = path_of(doc);
  std::vector<ActiveStreamRecord> out;

  std::ifstream in(path.string());
  if (!in) return out;

  const json root = json::parse(in, nullptr, /*allow_exceptions=*/false);
  if (root.is_discarded() || !root.is_object() || !root.contains("streams") ||
      !root["streams"].is_array())
  {
    log_.app(LogLevel::warn, "Ignoring unreadable stream document " + path.string());
    return out;
  }

  for (const auto& entry : root["streams"])
  {
    ActiveStreamRecord r;
    if (from_json(entry, r))
      out.push_back(std::move(r));
    else
      log_.app(LogLevel::debug, "Skipping malformed entry in " + path.string());
  }
  return out;
}

bool StreamStore_Json::upsert(StreamDocument doc, const std::vector<ActiveStreamRecord>& records)
{
  if (records.empty()) return true;

  auto current = load(doc);
  for (const auto& r : records)
  {
    auto it = std::find_if(current.begin(), current.end(),
                           [&](const ActiveStreamRecord& c) { return c.url == r.url; });
    if (it != current.end())
      *it = r;
    else
      current.push_back(r);
  }
  return save(path_of(doc), current);
}

bool StreamStore_Json::remove(StreamDocument doc, const std::vector<std::string>& urls)
{
  if (urls.empty()) return true;

  auto current = load(doc);
  const auto before = current.size();
  current.erase(std::remove_if(current.begin(), current.end(),
                               [&](const ActiveStreamRecord& c)
                               { return std::find(urls.begin(), urls.end(), c.url) != urls.end(); }),
                current.end());
  if (current.size() == before) return true;
  return save(path_of(doc), current);
}

bool StreamStore_Json::save(const fs::path& path, const std::vector<ActiveStreamRecord>& records)
{
  json streams = json::array();
  for (const auto& r : records) streams.push_back(to_json(r));
  const json root{{"streams", std::move(streams)}};

  ensure_parent(path);
  std::ofstream out(path.string(), std::ios::trunc);
  out << root.dump(2) << "\n";
  out.flush();
  if (!out)
  {
    log_.app(LogLevel::err, "Failed to write " + path.string());
    return false;
  }
  return true;
}

bool StreamStore_Json::write_results(const std::set<std::string>& urls)
{
  ensure_parent(results_);
  std::ofstream out(results_.string(), std::ios::trunc);
  for (const auto& u : urls) out << u << "\n";
  out.flush();
  if (!out)
  {
    log_.app(LogLevel::err, "Failed to write results to " + results_.string());
    return false;
  }
  log_.app(LogLevel::info,
           "Saved " + std::to_string(urls.size()) + " stream URL(s) to " + results_.string());
  return true;
}

std::set<std::string> StreamStore_Json::load_results()
{
  std::set<std::string> out;
  std::ifstream in(results_.string());
  std::string line;
  while (std::getline(in, line))
  {
    if (!line.empty() && line.back() == '\r') line.pop_back();
    if (!line.empty()) out.insert(line);
  }
  return out;
}

}  // namespace streamscout::infrastructure::persistence
