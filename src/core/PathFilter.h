#pragma once
#include <string>
#include <vector>

namespace inviscan {

// Path exclusion applied before any file is handed to the scanner. Matching
// is per path component, so "distance/x.js" is not caught by "dist".
class PathFilter {
public:
    explicit PathFilter(bool scan_bundles, std::vector<std::string> extra_ignored = {});

    bool should_ignore(const std::string& path) const;
    bool is_ignored_component(const std::string& component) const;

private:
    bool scan_bundles_;
    std::vector<std::string> extra_ignored_;
};

std::vector<std::string> split_path_components(const std::string& path);

}
