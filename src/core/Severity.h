#pragma once
#include <string>

namespace inviscan {

enum class Severity { Info = 0, Low = 1, Medium = 2, High = 3, Critical = 4 };

const char* severity_to_string(Severity s);
// SARIF result level: error | warning | note
const char* severity_to_sarif_level(Severity s);

}
