#pragma once
#include "Scanner.h"
#include <map>
#include <string>
#include <vector>

namespace inviscan {

enum class Verdict { Clean, Threat, OperationalError };

const char* verdict_to_string(Verdict v);
// 0 = Clean, 1 = Threat, 2 = OperationalError. CI pipelines depend on it.
int exit_code(Verdict v);

struct SkippedFile {
    std::string path;
    std::string reason;
};

// Aggregated outcome of one invocation. Built once by aggregate() and
// read-only afterwards.
class Report {
public:
    // per_file keeps the order of `results`. With fail_on_skip any skipped
    // file turns the verdict into OperationalError.
    static Report aggregate(std::vector<ScanResult> results, bool fail_on_skip);

    size_t total_files_scanned() const { return per_file_.size(); }
    size_t total_findings() const { return total_findings_; }
    // Keyed by category_label(); all six risk categories are present.
    const std::map<std::string, size_t>& findings_by_category() const { return by_category_; }
    const std::vector<ScanResult>& per_file() const { return per_file_; }
    const std::vector<SkippedFile>& skipped_files() const { return skipped_; }
    Verdict verdict() const { return verdict_; }
    bool fail_on_skip() const { return fail_on_skip_; }

private:
    Report() = default;

    std::vector<ScanResult> per_file_;
    std::vector<SkippedFile> skipped_;
    std::map<std::string, size_t> by_category_;
    size_t total_findings_ = 0;
    Verdict verdict_ = Verdict::Clean;
    bool fail_on_skip_ = false;
};

}
