#pragma once
#include "Classifier.h"
#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace inviscan {

// One occurrence of a risky code point. Built by the scanner and not
// modified afterwards.
struct Finding {
    std::string file_path;
    size_t byte_offset = 0; // 0-based
    size_t line = 1;        // 1-based
    size_t column = 1;      // 1-based, in scalar values
    uint32_t code_point = 0;
    RiskCategory category = RiskCategory::Benign;
    std::string context;    // escaped snippet, safe to print
};

struct ScanResult {
    std::string file_path;
    std::vector<Finding> findings; // strictly increasing byte_offset
    std::optional<std::string> decode_error; // decode, read or size failure
    size_t byte_size = 0;
    std::string sha256; // empty when hashing is unavailable or the file was not read

    bool skipped() const { return decode_error.has_value(); }
};

}
