#pragma once
#include "Config.h"
#include "Report.h"
#include <string>

namespace inviscan {

// Renders a Report as JSON (mirroring the report fields) or as SARIF 2.1.0.
// Object keys are sorted and nothing time- or host-dependent is emitted, so
// identical input gives byte-identical output.
class JSONWriter {
public:
    std::string write(const Report& report, const Config& cfg) const;
    std::string write_sarif(const Report& report, const Config& cfg) const;
};

}
