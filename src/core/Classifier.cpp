#include "Classifier.h"
#include <algorithm>
#include <cstdio>

namespace inviscan {
namespace {

using RC = RiskCategory;

// Must stay sorted by `first` with no overlap; classify() binary-searches it.
const CategoryRange kRanges[] = {
    {0x0000, 0x0008, RC::SuspiciousControl},
    {0x000B, 0x000C, RC::SuspiciousControl},
    {0x000E, 0x001F, RC::SuspiciousControl},
    {0x0080, 0x009F, RC::SuspiciousControl},
    {0x00A0, 0x00A0, RC::ConfusableWhitespace},
    {0x00AD, 0x00AD, RC::ConfusableWhitespace},
    {0x061C, 0x061C, RC::BidiControl},
    {0x2007, 0x2007, RC::ConfusableWhitespace},
    {0x200B, 0x200D, RC::ZeroWidthOrJoiner},
    {0x200E, 0x200F, RC::BidiControl},
    {0x2028, 0x2029, RC::ConfusableWhitespace},
    {0x202A, 0x202E, RC::BidiControl},
    {0x202F, 0x202F, RC::ConfusableWhitespace},
    {0x2060, 0x2060, RC::ZeroWidthOrJoiner},
    {0x2066, 0x2069, RC::BidiControl},
    {0x3000, 0x3000, RC::ConfusableWhitespace},
    {0x3164, 0x3164, RC::ConfusableWhitespace},
    {0xE000, 0xF8FF, RC::PrivateUseArea},
    {0xFE00, 0xFE0F, RC::VariationSelector},
    {0xF0000, 0xFFFFD, RC::PrivateUseArea},
    {0x100000, 0x10FFFD, RC::PrivateUseArea},
};

struct NamedCodePoint {
    uint32_t cp;
    const char* name;
    const char* description;
};

// Sorted by code point.
const NamedCodePoint kNames[] = {
    {0x00A0, "NO-BREAK SPACE", "Non-ASCII whitespace; may bypass naive filters"},
    {0x00AD, "SOFT HYPHEN", "Invisible in most contexts; used for obfuscation"},
    {0x061C, "ARABIC LETTER MARK", "Invisible directional marker"},
    {0x2007, "FIGURE SPACE", "Non-ASCII whitespace; may bypass naive filters"},
    {0x200B, "ZERO WIDTH SPACE", "Invisible character used to hide code"},
    {0x200C, "ZERO WIDTH NON-JOINER", "Can alter code logic invisibly"},
    {0x200D, "ZERO WIDTH JOINER", "Can alter code logic invisibly"},
    {0x200E, "LEFT-TO-RIGHT MARK", "Invisible directional marker"},
    {0x200F, "RIGHT-TO-LEFT MARK", "Invisible directional marker"},
    {0x2028, "LINE SEPARATOR", "Can break parsing/tokenization"},
    {0x2029, "PARAGRAPH SEPARATOR", "Can break parsing/tokenization"},
    {0x202A, "LEFT-TO-RIGHT EMBEDDING", "Bidi control; can mislead code review"},
    {0x202B, "RIGHT-TO-LEFT EMBEDDING", "Bidi control; can mislead code review"},
    {0x202C, "POP DIRECTIONAL FORMATTING", "Bidi control; terminates embeddings/overrides"},
    {0x202D, "LEFT-TO-RIGHT OVERRIDE", "Bidi override; can reorder displayed code"},
    {0x202E, "RIGHT-TO-LEFT OVERRIDE", "Bidi override; can reorder displayed code"},
    {0x202F, "NARROW NO-BREAK SPACE", "Non-ASCII whitespace; may bypass naive filters"},
    {0x2060, "WORD JOINER", "Invisible joiner; often used to hide payloads"},
    {0x2066, "LEFT-TO-RIGHT ISOLATE", "Bidi isolate; can affect display order"},
    {0x2067, "RIGHT-TO-LEFT ISOLATE", "Bidi isolate; can affect display order"},
    {0x2068, "FIRST STRONG ISOLATE", "Bidi isolate; can affect display order"},
    {0x2069, "POP DIRECTIONAL ISOLATE", "Bidi isolate terminator"},
    {0x3000, "IDEOGRAPHIC SPACE", "Non-ASCII whitespace; may bypass naive filters"},
    {0x3164, "HANGUL FILLER", "Often renders as blank; used for obfuscation"},
};

// Benign for classification but invisible when rendered; escaped in snippets.
const CategoryRange kInvisibleFormatting[] = {
    {0x034F, 0x034F, RC::Benign}, // combining grapheme joiner
    {0x115F, 0x1160, RC::Benign}, // hangul choseong/jungseong fillers
    {0x17B4, 0x17B5, RC::Benign},
    {0x180E, 0x180E, RC::Benign}, // mongolian vowel separator
    {0x2061, 0x2064, RC::Benign}, // invisible operators
    {0x206A, 0x206F, RC::Benign}, // deprecated formatting
    {0xFEFF, 0xFEFF, RC::Benign}, // zero width no-break space
    {0xFFA0, 0xFFA0, RC::Benign}, // halfwidth hangul filler
    {0xFFF9, 0xFFFB, RC::Benign}, // interlinear annotation
    {0x1D173, 0x1D17A, RC::Benign}, // musical formatting
    {0xE0000, 0xE007F, RC::Benign}, // tag characters
};

template <size_t N>
const CategoryRange* find_range(const CategoryRange (&table)[N], uint32_t cp) {
    auto it = std::upper_bound(std::begin(table), std::end(table), cp,
        [](uint32_t v, const CategoryRange& r){ return v < r.first; });
    if(it == std::begin(table)) return nullptr;
    --it;
    return (cp <= it->last) ? &*it : nullptr;
}

const NamedCodePoint* find_name(uint32_t cp) {
    auto it = std::lower_bound(std::begin(kNames), std::end(kNames), cp,
        [](const NamedCodePoint& n, uint32_t v){ return n.cp < v; });
    if(it != std::end(kNames) && it->cp == cp) return &*it;
    return nullptr;
}

} // namespace

RiskCategory classify(uint32_t code_point) {
    const CategoryRange* r = find_range(kRanges, code_point);
    return r ? r->category : RiskCategory::Benign;
}

const CategoryRange* category_ranges_begin() { return std::begin(kRanges); }
const CategoryRange* category_ranges_end() { return std::end(kRanges); }

const std::array<RiskCategory, 6>& risk_categories() {
    static const std::array<RiskCategory, 6> all = {
        RC::ZeroWidthOrJoiner, RC::BidiControl, RC::VariationSelector,
        RC::PrivateUseArea, RC::SuspiciousControl, RC::ConfusableWhitespace};
    return all;
}

const char* category_label(RiskCategory c) {
    switch(c) {
        case RC::Benign: return "Benign";
        case RC::ZeroWidthOrJoiner: return "ZeroWidthOrJoiner";
        case RC::BidiControl: return "BidiControl";
        case RC::VariationSelector: return "VariationSelector";
        case RC::PrivateUseArea: return "PrivateUseArea";
        case RC::SuspiciousControl: return "SuspiciousControl";
        case RC::ConfusableWhitespace: return "ConfusableWhitespace";
    }
    return "Benign";
}

const char* category_title(RiskCategory c) {
    switch(c) {
        case RC::Benign: return "Benign";
        case RC::ZeroWidthOrJoiner: return "Zero-width / joiner character";
        case RC::BidiControl: return "Bidirectional control character";
        case RC::VariationSelector: return "Variation selector";
        case RC::PrivateUseArea: return "Private Use Area character";
        case RC::SuspiciousControl: return "Suspicious control character";
        case RC::ConfusableWhitespace: return "Confusable whitespace";
    }
    return "Benign";
}

Severity category_severity(RiskCategory c) {
    switch(c) {
        case RC::BidiControl: return Severity::Critical;
        case RC::ZeroWidthOrJoiner:
        case RC::VariationSelector: return Severity::High;
        case RC::PrivateUseArea:
        case RC::SuspiciousControl: return Severity::Medium;
        case RC::ConfusableWhitespace: return Severity::Low;
        case RC::Benign: break;
    }
    return Severity::Info;
}

std::string code_point_name(uint32_t code_point) {
    if(const auto* n = find_name(code_point)) return n->name;
    switch(classify(code_point)) {
        case RC::VariationSelector:
            return "VARIATION SELECTOR-" + std::to_string(code_point - 0xFE00 + 1);
        case RC::PrivateUseArea: return "PRIVATE USE CHARACTER";
        case RC::SuspiciousControl: return "CONTROL CHARACTER";
        default: break;
    }
    return "";
}

std::string code_point_description(uint32_t code_point) {
    if(const auto* n = find_name(code_point)) return n->description;
    switch(classify(code_point)) {
        case RC::VariationSelector:
            return "Can modify character appearance; sequences can encode hidden payload bits";
        case RC::PrivateUseArea:
            return "Private use character (" + format_code_point(code_point) + ") - commonly used for payload hiding";
        case RC::SuspiciousControl:
            return "Suspicious control character (" + format_code_point(code_point) + ")";
        default: break;
    }
    return "";
}

std::string format_code_point(uint32_t code_point) {
    char buf[16];
    std::snprintf(buf, sizeof(buf), "U+%04X", static_cast<unsigned>(code_point));
    return buf;
}

bool needs_visible_escape(uint32_t code_point) {
    if(code_point < 0x20 || code_point == 0x7F) return true;
    if(classify(code_point) != RC::Benign) return true;
    return find_range(kInvisibleFormatting, code_point) != nullptr;
}

}
