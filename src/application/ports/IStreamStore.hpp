#pragma once

#include <set>
#include <string>
#include <vector>

#include "domain/StreamRecord.hpp"

namespace streamscout::application::ports
{

enum class StreamDocument
{
  active,
  history
};

struct IStreamStore
{
  virtual ~IStreamStore() = default;

  // Missing or corrupt documents load as empty.
  virtual std::vector<streamscout::domain::ActiveStreamRecord> load(StreamDocument doc) = 0;

  // Read-modify-write keyed by url. false when the document could not be written.
  virtual bool upsert(StreamDocument doc,
                      const std::vector<streamscout::domain::ActiveStreamRecord>& records) = 0;
  virtual bool remove(StreamDocument doc, const std::vector<std::string>& urls) = 0;

  // Plain-text scan results: sorted, one URL per line.
  virtual bool write_results(const std::set<std::string>& urls) = 0;
  virtual std::set<std::string> load_results() = 0;
};

}  // namespace streamscout::application::ports
