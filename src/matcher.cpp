#include "matcher.h"
#include "utf8.h"

#include <stdexcept>

using namespace std;

namespace grep {

namespace {

bool is_ascii_digit(char32_t c) {
    return c >= U'0' && c <= U'9';
}

bool is_ascii_alpha(char32_t c) {
    return (c >= U'a' && c <= U'z') || (c >= U'A' && c <= U'Z');
}

// Recursive matcher over the remaining subject and remaining tokens.
class Backtracker {
public:
    Backtracker(const u32string& subject, const CompiledPattern& compiled)
        : subject_(subject), tokens_(compiled.tokens), anchor_end_(compiled.anchor_end) {}

    bool match_here(size_t pos, size_t index) const {
        if (index >= tokens_.size()) {
            return !anchor_end_ || pos == subject_.size();
        }

        const Token& current = tokens_[index];
        switch (current.type) {
            case Token::ONE_OR_MORE: {
                // At least one repetition is mandatory.
                if (pos >= subject_.size() || !match_one(subject_[pos], *current.child)) {
                    return false;
                }
                // Continuation points after the first repetition are tried
                // without re-checking the characters in between.
                for (size_t len = 1; pos + len <= subject_.size(); len++) {
                    if (match_here(pos + len, index + 1)) {
                        return true;
                    }
                }
                return false;
            }

            case Token::ZERO_OR_ONE:
                if (pos < subject_.size() && match_one(subject_[pos], *current.child) &&
                    match_here(pos + 1, index + 1)) {
                    return true;
                }
                return match_here(pos, index + 1);

            case Token::ALTERNATION:
                for (const u32string& option : current.options) {
                    if (pos + option.size() <= subject_.size() &&
                        subject_.compare(pos, option.size(), option) == 0 &&
                        match_here(pos + option.size(), index + 1)) {
                        return true;
                    }
                }
                return false;

            default:
                if (pos < subject_.size() && match_one(subject_[pos], current)) {
                    return match_here(pos + 1, index + 1);
                }
                return false;
        }
    }

private:
    const u32string& subject_;
    const vector<Token>& tokens_;
    bool anchor_end_;
};

} // namespace

bool match_one(char32_t c, const Token& token) {
    switch (token.type) {
        case Token::LITERAL:
            return c == token.ch;

        case Token::DIGIT:
            return is_ascii_digit(c);

        case Token::WORD:
            return is_ascii_alpha(c) || is_ascii_digit(c) || c == U'_';

        case Token::WILDCARD:
            return c != U'\n';

        case Token::CLASS:
            return token.members.find(c) != u32string::npos;

        case Token::NEG_CLASS:
            return token.members.find(c) == u32string::npos;

        case Token::ONE_OR_MORE:
        case Token::ZERO_OR_ONE:
        case Token::ALTERNATION:
            break;
    }
    throw logic_error("match_one called with a non-atomic token");
}

bool is_match(const u32string& subject, const CompiledPattern& compiled) {
    Backtracker backtracker(subject, compiled);

    size_t last_start = compiled.anchor_start ? 0 : subject.size();
    for (size_t start = 0; start <= last_start; start++) {
        if (backtracker.match_here(start, 0)) {
            return true;
        }
    }
    return false;
}

bool is_match(const string& subject, const CompiledPattern& compiled) {
    return is_match(decode_utf8(subject), compiled);
}

} // namespace grep
