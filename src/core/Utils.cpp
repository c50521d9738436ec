#include "Utils.h"
#include "Classifier.h"
#include "Utf8Decoder.h"
#include <cstdio>
#include <cerrno>
#include <cstring>
#include <fstream>
#include <iterator>
#ifdef INVISCAN_HAVE_OPENSSL
#include <openssl/evp.h>
#endif

namespace inviscan {
namespace utils {

void append_utf8(std::string& out, uint32_t cp) {
    if(cp < 0x80) {
        out.push_back(static_cast<char>(cp));
    } else if(cp < 0x800) {
        out.push_back(static_cast<char>(0xC0 | (cp >> 6)));
        out.push_back(static_cast<char>(0x80 | (cp & 0x3F)));
    } else if(cp < 0x10000) {
        out.push_back(static_cast<char>(0xE0 | (cp >> 12)));
        out.push_back(static_cast<char>(0x80 | ((cp >> 6) & 0x3F)));
        out.push_back(static_cast<char>(0x80 | (cp & 0x3F)));
    } else {
        out.push_back(static_cast<char>(0xF0 | (cp >> 18)));
        out.push_back(static_cast<char>(0x80 | ((cp >> 12) & 0x3F)));
        out.push_back(static_cast<char>(0x80 | ((cp >> 6) & 0x3F)));
        out.push_back(static_cast<char>(0x80 | (cp & 0x3F)));
    }
}

std::string render_visible(uint32_t code_point) {
    if(code_point == '\t') return "\\t";
    if(code_point == '\r') return "\\r";
    if(needs_visible_escape(code_point)) return "[" + format_code_point(code_point) + "]";
    std::string s;
    append_utf8(s, code_point);
    return s;
}

std::string make_visible(std::string_view text) {
    std::string out;
    out.reserve(text.size());
    size_t pos = 0;
    while(pos < text.size()) {
        Utf8Decoder dec(text.substr(pos));
        DecodedChar ch;
        while(dec.next(ch)) out += render_visible(ch.code_point);
        if(!dec.failed()) break;
        pos += dec.error_offset();
        char buf[8];
        std::snprintf(buf, sizeof(buf), "[0x%02X]", static_cast<unsigned char>(text[pos]));
        out += buf;
        ++pos;
    }
    return out;
}

std::string sha256_hex(std::string_view data) {
    std::string hexsum;
#ifdef INVISCAN_HAVE_OPENSSL
    unsigned char md[EVP_MAX_MD_SIZE];
    unsigned int mdlen = 0;
    EVP_MD_CTX* ctx = EVP_MD_CTX_new();
    if(!ctx) return hexsum;
    if(EVP_DigestInit_ex(ctx, EVP_sha256(), nullptr) == 1 &&
       EVP_DigestUpdate(ctx, data.data(), data.size()) == 1 &&
       EVP_DigestFinal_ex(ctx, md, &mdlen) == 1) {
        static const char* hx = "0123456789abcdef";
        hexsum.reserve(mdlen * 2);
        for(unsigned i = 0; i < mdlen; ++i) {
            hexsum.push_back(hx[md[i] >> 4]);
            hexsum.push_back(hx[md[i] & 0xF]);
        }
    }
    EVP_MD_CTX_free(ctx);
#else
    (void)data;
#endif
    return hexsum;
}

bool read_file(const std::string& path, std::string& out, std::string& err) {
    errno = 0;
    std::ifstream ifs(path, std::ios::binary);
    if(!ifs) {
        err = std::string("cannot open file: ") + (errno ? std::strerror(errno) : "unknown error");
        return false;
    }
    out.assign(std::istreambuf_iterator<char>(ifs), std::istreambuf_iterator<char>());
    if(ifs.bad()) {
        err = std::string("read failed: ") + (errno ? std::strerror(errno) : "I/O error");
        return false;
    }
    return true;
}

std::vector<std::string> split_csv(const std::string& s) {
    std::vector<std::string> out; std::string cur;
    for(char c : s) { if(c == ',') { if(!cur.empty()) out.push_back(cur); cur.clear(); } else cur.push_back(c); }
    if(!cur.empty()) out.push_back(cur);
    return out;
}

}
}
