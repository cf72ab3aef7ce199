#ifndef GREP_UTF8_H
#define GREP_UTF8_H

#include <string>

namespace grep {

// Bytes of ill-formed UTF-8 are decoded one by one to a lone surrogate in
// this range (byte value added), so they never equal a real character.
const char32_t INVALID_BYTE_BASE = 0xDC00;

// Decode UTF-8 text into codepoints.
std::u32string decode_utf8(const std::string& text);

// Inverse of decode_utf8; lone surrogates from invalid bytes become the
// original bytes again.
std::string encode_utf8(const std::u32string& text);

} // namespace grep

#endif // GREP_UTF8_H
