#include "core/Report.h"
#include "core/JSONWriter.h"
#include "scanners/InvisibleCharScanner.h"
#include <cstddef>
#include <cstdint>
#include <cstdlib>
#include <string_view>
#include <vector>

// Arbitrary bytes through decoder, scanner, aggregator and JSON writer.
extern "C" int LLVMFuzzerTestOneInput(const uint8_t *data, size_t size) {
    std::string_view bytes(reinterpret_cast<const char*>(data), size);
    inviscan::InvisibleCharScanner scanner;
    inviscan::ScanResult r = scanner.scan("fuzz.txt", bytes);

    size_t last = 0;
    for (size_t i = 0; i < r.findings.size(); ++i) {
        if (i > 0 && r.findings[i].byte_offset <= last) std::abort();
        last = r.findings[i].byte_offset;
    }

    std::vector<inviscan::ScanResult> results;
    results.push_back(std::move(r));
    auto report = inviscan::Report::aggregate(std::move(results), true);
    size_t sum = 0;
    for (const auto& kv : report.findings_by_category()) sum += kv.second;
    if (sum != report.total_findings()) std::abort();

    inviscan::Config cfg;
    cfg.compact = true;
    inviscan::JSONWriter().write(report, cfg);
    return 0;
}
