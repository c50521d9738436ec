#include "ArgumentParser.h"
#include "BuildInfo.h"
#include "Utils.h"
#include <functional>
#include <iostream>
#include <limits>
#include <stdexcept>
#include <string>
#include <vector>

namespace inviscan {

void ArgumentParser::print_help(std::ostream& os) {
    os << "inviscan - find invisible and direction-changing Unicode in source files\n\n"
       << "usage: inviscan PATTERN... [options]\n\n"
       << "examples:\n"
       << "  inviscan \"**/*.rs\"\n"
       << "  inviscan \"src/**/*.ts\" --json\n"
       << "  inviscan \"**/*.js\" --scan-bundles --fail-on-skip\n\n"
       << "options:\n";
    struct Line { std::string name; std::string help; };
    static const std::vector<Line> lines = {
        {"--json", "Emit the report as JSON"},
        {"--sarif", "Emit SARIF 2.1.0 JSON"},
        {"--compact", "Single-line JSON output"},
        {"--output FILE", "Write the report to FILE (default stdout)"},
        {"--verbose, -v", "Log ignored/unreadable files, wider context"},
        {"--scan-bundles", "Include dist/, build/, out/, .next/, .nuxt/"},
        {"--fail-on-skip", "Exit 2 if any file cannot be read or decoded"},
        {"--fail-fast", "Stop scanning after the first file with findings"},
        {"--parallel", "Scan files on a worker pool"},
        {"--parallel-threads N", "Worker count (default: hardware threads)"},
        {"--max-file-size BYTES", "Skip larger files (0 = unlimited)"},
        {"--ignore-dir name[,name...]", "Extra directory names to ignore"},
        {"--log-level LEVEL", "error|warn|info|debug|trace"},
        {"--version", "Print version & exit"},
        {"--help, -h", "Show this help"}
    };
    for(const auto& l : lines) {
        os << "  " << l.name;
        if(l.name.size() < 30) for(size_t i = l.name.size(); i < 30; ++i) os << ' '; else os << ' ';
        os << l.help << "\n";
    }
    os << "\ndetects:\n"
       << "  zero-width / joiners (U+200B-U+200D, U+2060)\n"
       << "  bidirectional controls and marks (U+202A-U+202E, U+2066-U+2069, U+200E, U+200F, U+061C)\n"
       << "  variation selectors (U+FE00-U+FE0F)\n"
       << "  private use area characters\n"
       << "  C0/C1 control characters other than tab, LF and CR\n"
       << "  confusable whitespace (U+00A0, U+2007, U+202F, U+2028, U+2029, U+3000, U+00AD, U+3164)\n"
       << "\nexit codes:\n"
       << "  0  no suspicious characters found\n"
       << "  1  suspicious characters detected\n"
       << "  2  operational error (bad pattern, no match, skipped file with --fail-on-skip)\n";
}

void ArgumentParser::print_version(std::ostream& os) {
    os << "inviscan " << buildinfo::APP_VERSION << " (git=" << buildinfo::GIT_COMMIT
       << ", compiler=" << buildinfo::COMPILER_ID << " " << buildinfo::COMPILER_VERSION
       << ", cxx_std=" << buildinfo::CXX_STANDARD << ")\n";
}

bool ArgumentParser::parse(int argc, char** argv, Config& cfg) {
    exit_code_ = 0;
    enum class ArgKind { None, String, Int, CSV };
    struct FlagSpec { const char* name; ArgKind kind; std::function<void(const std::string&)> apply; };
    bool int_error = false;
    auto need_ll = [&](const std::string& v, const char* flag) -> long long {
        try {
            size_t used = 0;
            long long n = std::stoll(v, &used);
            if(used != v.size()) throw std::invalid_argument(v);
            return n;
        } catch(const std::exception&) {
            std::cerr << "Invalid integer for " << flag << ": " << v << "\n";
            int_error = true;
            return 0;
        }
    };
    auto need_int = [&](const std::string& v, const char* flag) -> int {
        long long n = need_ll(v, flag);
        if(!int_error && (n < std::numeric_limits<int>::min() || n > std::numeric_limits<int>::max())) {
            std::cerr << "Value out of range for " << flag << ": " << v << "\n";
            int_error = true;
            return 0;
        }
        return static_cast<int>(n);
    };
    std::vector<FlagSpec> specs = {
        {"--json", ArgKind::None, [&](const std::string&){ cfg.json = true; }},
        {"--sarif", ArgKind::None, [&](const std::string&){ cfg.sarif = true; }},
        {"--compact", ArgKind::None, [&](const std::string&){ cfg.compact = true; }},
        {"--output", ArgKind::String, [&](const std::string& v){ cfg.output_file = v; }},
        {"--verbose", ArgKind::None, [&](const std::string&){ cfg.verbose = true; }},
        {"-v", ArgKind::None, [&](const std::string&){ cfg.verbose = true; }},
        {"--scan-bundles", ArgKind::None, [&](const std::string&){ cfg.scan_bundles = true; }},
        {"--fail-on-skip", ArgKind::None, [&](const std::string&){ cfg.fail_on_skip = true; }},
        {"--fail-fast", ArgKind::None, [&](const std::string&){ cfg.fail_fast = true; }},
        {"--parallel", ArgKind::None, [&](const std::string&){ cfg.parallel = true; }},
        {"--parallel-threads", ArgKind::Int, [&](const std::string& v){ cfg.parallel_max_threads = need_int(v, "--parallel-threads"); }},
        {"--max-file-size", ArgKind::Int, [&](const std::string& v){ cfg.max_file_size = need_ll(v, "--max-file-size"); }},
        {"--ignore-dir", ArgKind::CSV, [&](const std::string& v){ auto dirs = utils::split_csv(v); cfg.ignore_dirs.insert(cfg.ignore_dirs.end(), dirs.begin(), dirs.end()); }},
        {"--log-level", ArgKind::String, [&](const std::string& v){ cfg.log_level = v; }}
    };
    auto find_spec = [&](const std::string& flag) -> FlagSpec* {
        for(auto& s : specs) if(flag == s.name) return &s;
        return nullptr;
    };

    for(int i = 1; i < argc; ++i) {
        std::string a = argv[i];
        if(a == "--help" || a == "-h") { print_help(std::cout); return false; }
        if(a == "--version") { print_version(std::cout); return false; }
        if(a.size() > 1 && a[0] == '-') {
            auto* spec = find_spec(a);
            if(!spec) {
                std::cerr << "Unknown arg: " << a << "\n";
                print_help(std::cerr);
                exit_code_ = 2;
                return false;
            }
            std::string val;
            if(spec->kind != ArgKind::None) {
                if(i + 1 >= argc) {
                    std::cerr << "Missing value for " << a << "\n";
                    exit_code_ = 2;
                    return false;
                }
                val = argv[++i];
            }
            spec->apply(val);
            if(int_error) { exit_code_ = 2; return false; }
            continue;
        }
        cfg.patterns.push_back(a);
    }
    return true;
}

}
