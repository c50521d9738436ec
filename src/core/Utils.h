#pragma once
#include <cstdint>
#include <string>
#include <string_view>
#include <vector>

namespace inviscan {
namespace utils {

void append_utf8(std::string& out, uint32_t code_point);

// Printable form of one scalar value: risky and invisible characters become
// "[U+XXXX]", Tab and CR become "\\t" and "\\r".
std::string render_visible(uint32_t code_point);

// Applies render_visible to every scalar value of text, so that paths and
// other untrusted strings cannot smuggle invisible characters into output.
// Bytes that are not valid UTF-8 are shown as "[0xNN]".
std::string make_visible(std::string_view text);

// Lower-case hex SHA-256 of data; empty string when built without OpenSSL.
std::string sha256_hex(std::string_view data);

// Reads the whole file in binary mode. On failure returns false and fills err.
bool read_file(const std::string& path, std::string& out, std::string& err);

std::vector<std::string> split_csv(const std::string& s);

}
}
