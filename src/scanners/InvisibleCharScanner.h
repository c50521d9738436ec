#pragma once
#include "../core/Scanner.h"
#include <string>
#include <string_view>

namespace inviscan {

// Scalar values shown on each side of a finding in its context snippet.
constexpr size_t kDefaultContextRadius = 20;
constexpr size_t kVerboseContextRadius = 48;

class InvisibleCharScanner {
public:
    explicit InvisibleCharScanner(size_t context_radius = kDefaultContextRadius)
        : context_radius_(context_radius) {}

    // Decodes content as UTF-8 and reports every non-benign scalar value.
    // A decode failure yields a result with decode_error set and no findings.
    ScanResult scan(const std::string& file_path, std::string_view content) const;

    // Result for a file the caller could not read (or refused to read).
    ScanResult scan_unreadable(const std::string& file_path, const std::string& reason) const;

    size_t context_radius() const { return context_radius_; }

private:
    size_t context_radius_;
};

}
