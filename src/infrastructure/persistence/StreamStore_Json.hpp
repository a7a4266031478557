#pragma once

#include <boost/filesystem/path.hpp>
#include <set>
#include <string>
#include <vector>

#include "application/ports/ILogger.hpp"
#include "application/ports/IStreamStore.hpp"

namespace streamscout::infrastructure::persistence
{

// Active/history documents as {"streams": [...]} JSON files and the scan results as a sorted
// plain-text URL list. Every call re-reads the file it touches, so external edits between
// cycles are respected.
class StreamStore_Json final : public streamscout::application::ports::IStreamStore
{
 public:
  StreamStore_Json(boost::filesystem::path activeFile, boost::filesystem::path historyFile,
                   boost::filesystem::path resultsFile,
                   streamscout::application::ports::ILogger& log);

  // IStreamStore
  std::vector<domain::ActiveStreamRecord> load(
      streamscout::application::ports::StreamDocument doc) override;
  bool upsert(streamscout::application::ports::StreamDocument doc,
              const std::vector<domain::ActiveStreamRecord>& records) override;
  bool remove(streamscout::application::ports::StreamDocument doc,
              const std::vector<std::string>& urls) override;
  bool write_results(const std::set<std::string>& urls) override;
  std::set<std::string> load_results() override;

 private:
  const boost::filesystem::path& path_of(streamscout::application::ports::StreamDocument doc) const;
  bool save(const boost::filesystem::path& path,
            const std::vector<domain::ActiveStreamRecord>& records);

  boost::filesystem::path active_;
  boost::filesystem::path history_;
  boost::filesystem::path results_;
  streamscout::application::ports::ILogger& log_;
};

}  // namespace streamscout::infrastructure::persistence
