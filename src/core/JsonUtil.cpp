#include "JsonUtil.h"
#include "Classifier.h"
#include "Utf8Decoder.h"
#include <cstdio>

namespace inviscan {
namespace jsonutil {

namespace {

void append_u16(std::string& o, unsigned v) {
    char buf[8];
    std::snprintf(buf, sizeof(buf), "\\u%04x", v);
    o += buf;
}

void append_escaped_code_point(std::string& o, uint32_t cp) {
    if(cp >= 0x10000) {
        uint32_t v = cp - 0x10000;
        append_u16(o, 0xD800 + (v >> 10));
        append_u16(o, 0xDC00 + (v & 0x3FF));
    } else {
        append_u16(o, cp);
    }
}

} // namespace

std::string escape(std::string_view s) {
    std::string o;
    o.reserve(s.size() + 8);
    size_t pos = 0;
    while(pos < s.size()) {
        Utf8Decoder dec(s.substr(pos));
        DecodedChar ch;
        while(dec.next(ch)) {
            const uint32_t cp = ch.code_point;
            switch(cp) {
                case '"': o += "\\\""; continue;
                case '\\': o += "\\\\"; continue;
                case '\n': o += "\\n"; continue;
                case '\r': o += "\\r"; continue;
                case '\t': o += "\\t"; continue;
                default: break;
            }
            if(needs_visible_escape(cp)) {
                append_escaped_code_point(o, cp);
            } else {
                o.append(s.data() + pos + ch.byte_offset, ch.byte_length);
            }
        }
        if(!dec.failed()) break;
        pos += dec.error_offset();
        o += "\\ufffd";
        ++pos;
    }
    return o;
}

}
}
