#pragma once
#include "Config.h"
#include <string>

namespace inviscan {

class ConfigValidator {
public:
    // Normalizes cfg in place and reports the first problem on stderr.
    bool validate(Config& cfg);

private:
    bool validate_patterns(const Config& cfg);
    bool validate_log_level(const std::string& level);
};

}
