#pragma once
#include "Severity.h"
#include <array>
#include <cstdint>
#include <string>

namespace inviscan {

enum class RiskCategory {
    Benign = 0,
    ZeroWidthOrJoiner,
    BidiControl,
    VariationSelector,
    PrivateUseArea,
    SuspiciousControl,
    ConfusableWhitespace
};

struct CategoryRange {
    uint32_t first; // inclusive
    uint32_t last;  // inclusive
    RiskCategory category;
};

// Maps a Unicode scalar value to its risk category. Total over 0..0x10FFFF;
// anything outside the risk table (including surrogates, which a decoder
// never yields) is Benign.
RiskCategory classify(uint32_t code_point);

// Sorted, pairwise disjoint table backing classify().
const CategoryRange* category_ranges_begin();
const CategoryRange* category_ranges_end();

// The six reportable categories in declaration order.
const std::array<RiskCategory, 6>& risk_categories();

// Stable identifier, used as JSON key and SARIF rule id.
const char* category_label(RiskCategory c);
const char* category_title(RiskCategory c);
Severity category_severity(RiskCategory c);

// Unicode character name for risky code points ("ZERO WIDTH SPACE"); range
// members without an individual entry get a generic name.
std::string code_point_name(uint32_t code_point);
std::string code_point_description(uint32_t code_point);

// "U+200B"; at least four upper-case hex digits.
std::string format_code_point(uint32_t code_point);

// True if the code point must not be echoed raw into a report: every risky
// category, C0 controls, DEL and other invisible formatting characters.
bool needs_visible_escape(uint32_t code_point);

}
