#include "Report.h"

namespace inviscan {

const char* verdict_to_string(Verdict v) {
    switch(v) {
        case Verdict::Clean: return "clean";
        case Verdict::Threat: return "threat";
        case Verdict::OperationalError: return "operational_error";
    }
    return "operational_error";
}

int exit_code(Verdict v) {
    switch(v) {
        case Verdict::Clean: return 0;
        case Verdict::Threat: return 1;
        case Verdict::OperationalError: return 2;
    }
    return 2;
}

Report Report::aggregate(std::vector<ScanResult> results, bool fail_on_skip) {
    Report report;
    report.fail_on_skip_ = fail_on_skip;
    for(RiskCategory c : risk_categories()) report.by_category_[category_label(c)] = 0;

    for(const auto& r : results) {
        if(r.skipped()) {
            report.skipped_.push_back({r.file_path, *r.decode_error});
            continue;
        }
        for(const auto& f : r.findings) {
            ++report.by_category_[category_label(f.category)];
            ++report.total_findings_;
        }
    }
    report.per_file_ = std::move(results);

    if(fail_on_skip && !report.skipped_.empty()) report.verdict_ = Verdict::OperationalError;
    else if(report.total_findings_ > 0) report.verdict_ = Verdict::Threat;
    else report.verdict_ = Verdict::Clean;
    return report;
}

}
