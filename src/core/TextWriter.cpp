#include "TextWriter.h"
#include "Classifier.h"
#include "Severity.h"
#include "Utils.h"
#include <sstream>

namespace inviscan {

std::string TextWriter::write(const Report& report, const Config& cfg) const {
    std::ostringstream os;
    const size_t files_with_findings = [&]{
        size_t n = 0;
        for(const auto& r : report.per_file()) if(!r.findings.empty()) ++n;
        return n;
    }();

    if(report.total_findings() == 0) {
        os << "No suspicious invisible characters detected.\n";
    } else {
        os << "Found " << report.total_findings() << " suspicious character(s) in "
           << files_with_findings << " file(s):\n\n";
        for(const auto& r : report.per_file()) {
            if(r.findings.empty()) continue;
            os << utils::make_visible(r.file_path) << "\n";
            for(const auto& f : r.findings) {
                os << "    Line " << f.line << ":" << f.column << " (byte " << f.byte_offset << ") - "
                   << code_point_name(f.code_point) << " (" << format_code_point(f.code_point) << ") ["
                   << category_label(f.category) << ", " << severity_to_string(category_severity(f.category)) << "]\n";
                os << "      " << code_point_description(f.code_point) << "\n";
                if(!f.context.empty()) os << "      context: " << f.context << "\n";
            }
            os << "\n";
        }
    }

    if(!report.skipped_files().empty()) {
        os << "\nSkipped " << report.skipped_files().size() << " file(s)"
           << (cfg.fail_on_skip ? " (--fail-on-skip enabled)" : "") << ":\n";
        for(const auto& s : report.skipped_files()) {
            os << "    " << utils::make_visible(s.path) << ": " << s.reason << "\n";
        }
    }

    os << "\nScanned " << report.total_files_scanned() << " file(s)";
    if(report.total_findings() > 0) {
        os << "; by category:";
        for(const auto& kv : report.findings_by_category()) {
            if(kv.second == 0) continue;
            os << " " << kv.first << "=" << kv.second;
        }
    }
    os << "\nVerdict: " << verdict_to_string(report.verdict()) << "\n";
    return os.str();
}

}
