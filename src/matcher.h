#ifndef GREP_MATCHER_H
#define GREP_MATCHER_H

#include "pattern.h"

#include <string>

namespace grep {

// Check if a single character satisfies an atomic token.
// Throws std::logic_error for quantifier and alternation tokens.
bool match_one(char32_t c, const Token& token);

// True if some substring of `subject` matches `compiled` (the whole subject
// when both anchors are set). Tries start offsets left to right.
bool is_match(const std::u32string& subject, const CompiledPattern& compiled);
bool is_match(const std::string& subject, const CompiledPattern& compiled);

} // namespace grep

#endif // GREP_MATCHER_H
