#pragma once

#include "modules/config_module.hpp"
#include <string>
#include <vector>

namespace voxplay::modules {

class ConfigValidator {
public:
    // Returns a list of error messages. Empty = valid.
    static std::vector<std::string> validate(const PlayerConfig& config);
};

} // namespace voxplay::modules
