#pragma once
#include <string>

#include "application/ports/IConfigProvider.hpp"

namespace boost
{
namespace filesystem
{
class path;
}
}  // namespace boost

namespace streamscout::infrastructure::config
{

class Config_Toml : public streamscout::application::ports::IConfigProvider
{
 public:
  streamscout::domain::Settings load_or_create(const std::string& path) override;

  // "mobile" lowers both concurrency ceilings
  static void apply_profile(streamscout::domain::Settings& s);

 private:
  static void write_default(const boost::filesystem::path& path, streamscout::domain::Settings& s);
};

}  // namespace streamscout::infrastructure::config
