#include "shared/time/Timestamp.hpp"

#include <cstdio>
#include <ctime>

namespace streamscout::shared::time
{

using std::chrono::milliseconds;
using std::chrono::system_clock;

namespace
{
std::time_t utc_to_time_t(std::tm& tm)
{
#if defined(_WIN32)
  return ::_mkgmtime(&tm);
#else
  return ::timegm(&tm);
#endif
}

bool utc_from_time_t(std::time_t t, std::tm& out)
{
#if defined(_WIN32)
  return ::gmtime_s(&out, &t) == 0;
#else
  return ::gmtime_r(&t, &out) != nullptr;
#endif
}

bool digits(std::string_view s, std::size_t pos, std::size_t n, int& out)
{
  if (pos + n > s.size()) return false;
  int v = 0;
  for (std::size_t i = pos; i < pos + n; ++i)
  {
    if (s[i] < '0' || s[i] > '9') return false;
    v = v * 10 + (s[i] - '0');
  }
  out = v;
  return true;
}
}  // namespace

domain::Timestamp now()
{
  return std::chrono::time_point_cast<milliseconds>(system_clock::now());
}

std::string to_iso8601(domain::Timestamp t)
{
  const auto ms = t.time_since_epoch().count();
  auto secs = ms / 1000;
  auto frac = ms % 1000;
  if (frac < 0)
  {
    frac += 1000;
    secs -= 1;
  }

  std::tm tm{};
  if (!utc_from_time_t(static_cast<std::time_t>(secs), tm)) return {};

  char b[40];
  std::snprintf(b, sizeof(b), "%04d-%02d-%02dT%02d:%02d:%02d.%03dZ", tm.tm_year + 1900,
                tm.tm_mon + 1, tm.tm_mday, tm.tm_hour, tm.tm_min, tm.tm_sec,
                static_cast<int>(frac));
  return b;
}

std::optional<domain::Timestamp> from_iso8601(std::string_view s)
{
  // YYYY-MM-DDTHH:MM:SS
  int Y, M, D, h, m, sec;
  if (!digits(s, 0, 4, Y) || s.size() < 19 || s[4] != '-' || !digits(s, 5, 2, M) || s[7] != '-' ||
      !digits(s, 8, 2, D) || (s[10] != 'T' && s[10] != ' ') || !digits(s, 11, 2, h) ||
      s[13] != ':' || !digits(s, 14, 2, m) || s[16] != ':' || !digits(s, 17, 2, sec))
    return std::nullopt;

  if (M < 1 || M > 12 || D < 1 || D > 31 || h > 23 || m > 59 || sec > 60) return std::nullopt;

  std::size_t pos = 19;
  long long frac_ms = 0;
  if (pos < s.size() && s[pos] == '.')
  {
    ++pos;
    int scale = 100;
    std::size_t n = 0;
    while (pos < s.size() && s[pos] >= '0' && s[pos] <= '9' && n < 9)
    {
      if (scale > 0)
      {
        frac_ms += (s[pos] - '0') * scale;
        scale /= 10;
      }
      ++pos;
      ++n;
    }
    if (n == 0) return std::nullopt;
  }
  if (pos < s.size() && s[pos] == 'Z') ++pos;
  if (pos != s.size()) return std::nullopt;

  std::tm tm{};
  tm.tm_year = Y - 1900;
  tm.tm_mon = M - 1;
  tm.tm_mday = D;
  tm.tm_hour = h;
  tm.tm_min = m;
  tm.tm_sec = sec;
  const std::time_t t = utc_to_time_t(tm);
  if (t == static_cast<std::time_t>(-1)) return std::nullopt;

  return domain::Timestamp{milliseconds(static_cast<long long>(t) * 1000 + frac_ms)};
}

}  // namespace streamscout::shared::time
