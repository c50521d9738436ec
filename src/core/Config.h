#pragma once
#include <string>
#include <vector>

namespace inviscan {

struct Config {
    std::vector<std::string> patterns; // glob patterns or literal paths, in order given
    bool json = false;
    bool sarif = false;
    bool compact = false; // single-line JSON; pretty otherwise
    std::string output_file; // empty = stdout
    bool verbose = false; // debug logging and wider context snippets
    bool scan_bundles = false; // include dist/ build/ out/ .next/ .nuxt/
    bool fail_on_skip = false; // unreadable or undecodable file => exit 2
    bool fail_fast = false; // stop dispatching once a threat is certain
    bool parallel = false;
    int parallel_max_threads = 0; // 0 = hardware concurrency
    long long max_file_size = 16LL * 1024 * 1024; // bytes; 0 = unlimited
    std::vector<std::string> ignore_dirs; // extra path components always ignored
    std::string log_level; // empty = info (debug with verbose)
};

}
