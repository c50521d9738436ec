#pragma once
#include "PathFilter.h"
#include <stdexcept>
#include <string>
#include <unordered_set>
#include <vector>

namespace inviscan {

// Bad pattern, unlistable base directory, or nothing matched at all. The
// run stops with an operational error before anything is scanned.
class InputResolutionError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

struct CollectedFiles {
    std::vector<std::string> files;   // in pattern order, then sorted walk order
    std::vector<std::string> ignored; // matched but excluded by the path filter
};

// Expands glob patterns to a deterministic file list. Supports * ? [..]
// within a component and ** as a whole component (zero or more directories).
// A pattern without wildcards names a file, or a directory to walk.
class FileCollector {
public:
    explicit FileCollector(const PathFilter& filter) : filter_(filter) {}

    CollectedFiles collect(const std::vector<std::string>& patterns) const;

    static bool has_wildcard(const std::string& s);
    // Throws InputResolutionError describing the problem.
    static void validate_pattern(const std::string& pattern);

private:
    struct Acc {
        CollectedFiles out;
        std::unordered_set<std::string> seen;
    };

    void expand(const std::string& pattern, Acc& acc) const;
    void match(const std::string& dir, const std::vector<std::string>& comps, size_t idx, Acc& acc) const;
    void walk_all(const std::string& dir, Acc& acc) const;
    void add_match(const std::string& path, Acc& acc) const;
    // Sorted entry names of dir; throws for the base directory, warns below it.
    std::vector<std::string> list_dir(const std::string& dir, bool is_base) const;

    const PathFilter& filter_;
};

}
