#pragma once
#include "Config.h"
#include "Scanner.h"
#include "../scanners/InvisibleCharScanner.h"
#include <string>
#include <vector>

namespace inviscan {

// Reads each file, applies the size policy and runs the scanner, either
// inline or on a bounded worker pool. Results come back in input order.
class ScanRunner {
public:
    explicit ScanRunner(const Config& cfg);

    std::vector<ScanResult> run(const std::vector<std::string>& files) const;

    ScanResult scan_file(const std::string& path) const;
    size_t worker_count(size_t file_count) const;

private:
    const Config& cfg_;
    InvisibleCharScanner scanner_;
};

}
