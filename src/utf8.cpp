#include "utf8.h"

#include <cstdint>

#include <unicode/utf8.h>

using namespace std;

namespace grep {

u32string decode_utf8(const string& text) {
    const uint8_t* bytes = reinterpret_cast<const uint8_t*>(text.data());
    const int32_t length = static_cast<int32_t>(text.size());

    u32string out;
    out.reserve(text.size());

    int32_t i = 0;
    while (i < length) {
        int32_t start = i;
        UChar32 c;
        U8_NEXT(bytes, i, length, c);
        if (c >= 0) {
            out.push_back(static_cast<char32_t>(c));
        } else {
            for (int32_t k = start; k < i; k++) {
                out.push_back(INVALID_BYTE_BASE + bytes[k]);
            }
        }
    }

    return out;
}

string encode_utf8(const u32string& text) {
    string out;
    for (char32_t cp : text) {
        if (cp >= INVALID_BYTE_BASE + 0x80 && cp <= INVALID_BYTE_BASE + 0xFF) {
            out += static_cast<char>(cp - INVALID_BYTE_BASE);
            continue;
        }

        uint8_t buffer[U8_MAX_LENGTH];
        int32_t n = 0;
        UBool error = false;
        U8_APPEND(buffer, n, U8_MAX_LENGTH, static_cast<UChar32>(cp), error);
        if (error) {
            // not representable; U+FFFD in its place
            out += "\xEF\xBF\xBD";
        } else {
            out.append(reinterpret_cast<const char*>(buffer), n);
        }
    }
    return out;
}

} // namespace grep
