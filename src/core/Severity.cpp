#include "Severity.h"

namespace inviscan {

const char* severity_to_string(Severity s) {
    switch(s) {
        case Severity::Info: return "info";
        case Severity::Low: return "low";
        case Severity::Medium: return "medium";
        case Severity::High: return "high";
        case Severity::Critical: return "critical";
    }
    return "info";
}

const char* severity_to_sarif_level(Severity s) {
    switch(s) {
        case Severity::Critical:
        case Severity::High: return "error";
        case Severity::Medium: return "warning";
        default: return "note";
    }
}

}
