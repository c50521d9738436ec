#include "PathFilter.h"
#include <algorithm>

namespace inviscan {

namespace {
const char* const kAlwaysIgnored[] = {"node_modules", ".git", ".cargo", "target", ".vscode"};
// Build output; scanned only with --scan-bundles (useful for shipped extensions).
const char* const kBundleDirs[] = {"dist", "build", "out", ".next", ".nuxt"};
}

PathFilter::PathFilter(bool scan_bundles, std::vector<std::string> extra_ignored)
    : scan_bundles_(scan_bundles), extra_ignored_(std::move(extra_ignored)) {}

std::vector<std::string> split_path_components(const std::string& path) {
    std::vector<std::string> out; std::string cur;
    for(char c : path) {
        if(c == '/' || c == '\\') { if(!cur.empty()) out.push_back(cur); cur.clear(); }
        else cur.push_back(c);
    }
    if(!cur.empty()) out.push_back(cur);
    return out;
}

bool PathFilter::is_ignored_component(const std::string& component) const {
    for(const char* name : kAlwaysIgnored) if(component == name) return true;
    if(std::find(extra_ignored_.begin(), extra_ignored_.end(), component) != extra_ignored_.end()) return true;
    if(!scan_bundles_) {
        for(const char* name : kBundleDirs) if(component == name) return true;
    }
    return false;
}

bool PathFilter::should_ignore(const std::string& path) const {
    for(const auto& c : split_path_components(path)) {
        if(is_ignored_component(c)) return true;
    }
    return false;
}

}
