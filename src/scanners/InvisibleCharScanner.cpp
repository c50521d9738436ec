#include "InvisibleCharScanner.h"
#include "../core/Utf8Decoder.h"
#include "../core/Utils.h"
#include <deque>

namespace inviscan {

namespace {

// Finding still collecting the characters that follow it on its line.
struct OpenSuffix {
    size_t index;
    size_t remaining;
};

} // namespace

ScanResult InvisibleCharScanner::scan(const std::string& file_path, std::string_view content) const {
    ScanResult result;
    result.file_path = file_path;
    result.byte_size = content.size();

    Utf8Decoder decoder(content);
    std::deque<std::string> before; // rendered characters preceding the cursor on this line
    std::vector<OpenSuffix> open;
    size_t line = 1;
    size_t column = 0;

    DecodedChar ch;
    while(decoder.next(ch)) {
        if(ch.byte_offset == 0 && ch.code_point == 0xFEFF) continue; // byte order mark
        if(ch.code_point == '\n') {
            open.clear();
            before.clear();
            ++line;
            column = 0;
            continue;
        }
        ++column;

        std::string token = utils::render_visible(ch.code_point);
        for(auto it = open.begin(); it != open.end();) {
            result.findings[it->index].context += token;
            if(--it->remaining == 0) it = open.erase(it);
            else ++it;
        }

        RiskCategory cat = classify(ch.code_point);
        if(cat != RiskCategory::Benign) {
            Finding f;
            f.file_path = file_path;
            f.byte_offset = ch.byte_offset;
            f.line = line;
            f.column = column;
            f.code_point = ch.code_point;
            f.category = cat;
            for(const auto& t : before) f.context += t;
            f.context += token;
            result.findings.push_back(std::move(f));
            if(context_radius_ > 0) open.push_back({result.findings.size() - 1, context_radius_});
        }

        if(context_radius_ > 0) {
            before.push_back(std::move(token));
            if(before.size() > context_radius_) before.pop_front();
        }
    }

    if(decoder.failed()) {
        result.findings.clear();
        result.decode_error = decoder.error();
    }
    return result;
}

ScanResult InvisibleCharScanner::scan_unreadable(const std::string& file_path, const std::string& reason) const {
    ScanResult result;
    result.file_path = file_path;
    result.decode_error = reason;
    return result;
}

}
