#pragma once
#include <cstddef>
#include <cstdint>
#include <string>
#include <string_view>

namespace inviscan {

struct DecodedChar {
    uint32_t code_point = 0;
    size_t byte_offset = 0; // 0-based offset of the first byte
    size_t byte_length = 0;
};

// Lazy, validating UTF-8 decoder. Accepts exactly the well-formed byte
// sequences of Unicode Table 3-7; the first ill-formed sequence stops
// decoding and is reported through error()/error_offset().
class Utf8Decoder {
public:
    explicit Utf8Decoder(std::string_view bytes) : bytes_(bytes) {}

    // Returns false at end of input or on a decode error.
    bool next(DecodedChar& out);

    bool failed() const { return failed_; }
    const std::string& error() const { return error_; }
    size_t error_offset() const { return error_offset_; }
    size_t position() const { return pos_; }

private:
    bool fail(size_t offset);

    std::string_view bytes_;
    size_t pos_ = 0;
    bool failed_ = false;
    size_t error_offset_ = 0;
    std::string error_;
};

}
