#pragma once
#include "Config.h"
#include "Report.h"
#include <string>

namespace inviscan {

// Human-readable rendering of a Report: one block per file with findings,
// in scan order, followed by skipped files and the category summary.
class TextWriter {
public:
    std::string write(const Report& report, const Config& cfg) const;
};

}
