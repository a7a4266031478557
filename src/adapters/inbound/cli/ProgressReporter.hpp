#pragma once
#include <cstdio>
#include <ostream>
#include <string>

#include "domain/ScanProgress.hpp"

namespace streamscout::adapters::cli {

// Single-line scan progress, rewritten in place after every host.
class ProgressReporter {
 public:
  explicit ProgressReporter(std::ostream& out) : out_(out) {}

  static std::string format(const domain::ScanProgress& p) {
    char b[160];
    std::snprintf(b, sizeof(b), "Scanning progress: %.1f%% (%zu/%zu) [Success: %zu, Failed: %zu]",
                  p.percent(), p.scannedCount, p.totalHosts, p.successfulScans, p.failedScans);
    return b;
  }

  void operator()(const domain::ScanProgress& p) {
    out_ << '\r' << format(p) << std::flush;
    dirty_ = true;
  }

  // ends the progress line so regular output starts on a fresh one
  void finish() {
    if (!dirty_) return;
    out_ << '\n' << std::flush;
    dirty_ = false;
  }

 private:
  std::ostream& out_;
  bool dirty_{false};
};

}  // namespace streamscout::adapters::cli
