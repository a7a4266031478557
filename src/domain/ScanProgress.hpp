#pragma once

#include <cstddef>

namespace streamscout::domain
{

struct ScanProgress
{
  std::size_t scannedCount{0};
  std::size_t totalHosts{0};
  std::size_t successfulScans{0};
  std::size_t failedScans{0};

  double percent() const noexcept
  {
    if (totalHosts == 0) return 100.0;
    return 100.0 * static_cast<double>(scannedCount) / static_cast<double>(totalHosts);
  }
};

}  // namespace streamscout::domain
