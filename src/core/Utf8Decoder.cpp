#include "Utf8Decoder.h"

namespace inviscan {

bool Utf8Decoder::fail(size_t offset) {
    failed_ = true;
    error_offset_ = offset;
    error_ = "invalid UTF-8 sequence at byte offset " + std::to_string(offset);
    return false;
}

bool Utf8Decoder::next(DecodedChar& out) {
    if(failed_ || pos_ >= bytes_.size()) return false;

    const size_t start = pos_;
    const auto b0 = static_cast<unsigned char>(bytes_[start]);
    if(b0 < 0x80) {
        out.code_point = b0;
        out.byte_offset = start;
        out.byte_length = 1;
        ++pos_;
        return true;
    }

    size_t len = 0;
    uint32_t cp = 0;
    // Bounds for the second byte; tighter than 80..BF for E0, ED, F0, F4 to
    // exclude overlong forms, surrogates and values above U+10FFFF.
    unsigned char lo = 0x80, hi = 0xBF;
    if(b0 >= 0xC2 && b0 <= 0xDF) { len = 2; cp = b0 & 0x1F; }
    else if(b0 == 0xE0) { len = 3; cp = b0 & 0x0F; lo = 0xA0; }
    else if(b0 == 0xED) { len = 3; cp = b0 & 0x0F; hi = 0x9F; }
    else if(b0 >= 0xE1 && b0 <= 0xEF) { len = 3; cp = b0 & 0x0F; }
    else if(b0 == 0xF0) { len = 4; cp = b0 & 0x07; lo = 0x90; }
    else if(b0 >= 0xF1 && b0 <= 0xF3) { len = 4; cp = b0 & 0x07; }
    else if(b0 == 0xF4) { len = 4; cp = b0 & 0x07; hi = 0x8F; }
    else return fail(start); // continuation byte, C0/C1 or F5..FF

    if(start + len > bytes_.size()) return fail(start);
    for(size_t i = 1; i < len; ++i) {
        const auto b = static_cast<unsigned char>(bytes_[start + i]);
        const unsigned char min = (i == 1) ? lo : 0x80;
        const unsigned char max = (i == 1) ? hi : 0xBF;
        if(b < min || b > max) return fail(start);
        cp = (cp << 6) | (b & 0x3F);
    }

    out.code_point = cp;
    out.byte_offset = start;
    out.byte_length = len;
    pos_ += len;
    return true;
}

}
