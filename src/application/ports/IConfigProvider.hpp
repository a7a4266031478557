#pragma once
#include <string>
#include "domain/Settings.hpp"

namespace streamscout::application::ports {

struct IConfigProvider {
    virtual ~IConfigProvider() = default;
    virtual streamscout::domain::Settings load_or_create(const std::string& path) = 0;
};

} // namespace streamscout::application::ports
