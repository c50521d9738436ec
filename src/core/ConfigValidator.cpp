#include "ConfigValidator.h"
#include "Logging.h"
#include <iostream>

namespace inviscan {

bool ConfigValidator::validate(Config& cfg) {
    if(cfg.json && cfg.sarif) {
        std::cerr << "--json and --sarif are mutually exclusive\n";
        return false;
    }

    if(cfg.parallel_max_threads < 0) {
        std::cerr << "--parallel-threads must not be negative\n";
        return false;
    }
    // An explicit thread count implies --parallel.
    if(cfg.parallel_max_threads > 0) cfg.parallel = true;

    if(cfg.max_file_size < 0) {
        std::cerr << "--max-file-size must not be negative\n";
        return false;
    }

    if(!validate_log_level(cfg.log_level)) return false;

    // Component names only; a slash would never match a single component.
    for(const auto& d : cfg.ignore_dirs) {
        if(d.find('/') != std::string::npos || d.find('\\') != std::string::npos) {
            std::cerr << "--ignore-dir takes directory names, not paths: " << d << "\n";
            return false;
        }
    }

    return validate_patterns(cfg);
}

bool ConfigValidator::validate_patterns(const Config& cfg) {
    for(const auto& p : cfg.patterns) {
        if(p.empty()) {
            std::cerr << "Empty file pattern\n";
            return false;
        }
        if(p.find('\0') != std::string::npos) {
            std::cerr << "File pattern contains NUL byte\n";
            return false;
        }
    }
    return true;
}

bool ConfigValidator::validate_log_level(const std::string& level) {
    if(level.empty()) return true;
    LogLevel parsed;
    if(!parse_log_level(level, parsed)) {
        std::cerr << "Invalid --log-level value: " << level << "\n";
        return false;
    }
    return true;
}

}
