#pragma once
#include <string>
#include <string_view>

namespace inviscan {
namespace jsonutil {

// Escapes s for use inside a JSON string literal. Besides the mandatory
// escapes, every code point that is invisible or direction-changing is
// written as \uXXXX so the document itself never carries one raw; bytes
// that are not valid UTF-8 become �.
std::string escape(std::string_view s);

}
}
