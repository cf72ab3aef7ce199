#include "pattern.h"
#include "utf8.h"

#include <utility>

using namespace std;

namespace grep {

Token Token::literal(char32_t c) {
    Token token(LITERAL);
    token.ch = c;
    return token;
}

Token Token::char_class(u32string set, bool negated) {
    Token token(negated ? NEG_CLASS : CLASS);
    token.members = std::move(set);
    return token;
}

Token Token::alternation(vector<u32string> alternatives) {
    Token token(ALTERNATION);
    token.options = std::move(alternatives);
    return token;
}

Token Token::quantified(Type quantifier, Token inner) {
    Token token(quantifier);
    token.child = std::make_unique<Token>(std::move(inner));
    return token;
}

bool Token::is_atomic() const {
    switch (type) {
        case LITERAL:
        case DIGIT:
        case WORD:
        case WILDCARD:
        case CLASS:
        case NEG_CLASS:
            return true;
        case ONE_OR_MORE:
        case ZERO_OR_ONE:
        case ALTERNATION:
            return false;
    }
    return false;
}

CompiledPattern compile(const string& pattern) {
    return compile(decode_utf8(pattern));
}

CompiledPattern compile(const u32string& source) {
    CompiledPattern compiled;
    u32string pattern = source;

    // Anchors are stripped independently, so "^$" leaves nothing behind.
    if (!pattern.empty() && pattern.front() == U'^') {
        compiled.anchor_start = true;
        pattern.erase(0, 1);
    }
    if (!pattern.empty() && pattern.back() == U'$') {
        compiled.anchor_end = true;
        pattern.pop_back();
    }

    vector<Token>& tokens = compiled.tokens;
    size_t i = 0;
    while (i < pattern.size()) {
        char32_t c = pattern[i++];

        if (c == U'\\') {
            if (i >= pattern.size()) {
                throw PatternError(PatternError::INVALID_ESCAPE, "Escape character at end of pattern");
            }
            char32_t next = pattern[i++];
            if (next == U'd') {
                tokens.push_back(Token(Token::DIGIT));
            } else if (next == U'w') {
                tokens.push_back(Token(Token::WORD));
            } else if (next == U'\\') {
                tokens.push_back(Token::literal(U'\\'));
            } else {
                throw PatternError(PatternError::INVALID_ESCAPE,
                                   "Unhandled escape: \\" + encode_utf8(u32string(1, next)));
            }
        } else if (c == U'[') {
            bool negated = false;
            if (i < pattern.size() && pattern[i] == U'^') {
                negated = true;
                i++;
            }
            // Without a closing bracket the class takes the rest of the pattern.
            size_t close = pattern.find(U']', i);
            size_t end = close == u32string::npos ? pattern.size() : close;
            tokens.push_back(Token::char_class(pattern.substr(i, end - i), negated));
            i = close == u32string::npos ? end : end + 1;
        } else if (c == U'(') {
            size_t close = pattern.find(U')', i);
            size_t end = close == u32string::npos ? pattern.size() : close;
            u32string group = pattern.substr(i, end - i);
            i = close == u32string::npos ? end : end + 1;

            vector<u32string> alternatives;
            size_t start = 0;
            size_t bar;
            while ((bar = group.find(U'|', start)) != u32string::npos) {
                alternatives.push_back(group.substr(start, bar - start));
                start = bar + 1;
            }
            alternatives.push_back(group.substr(start));
            tokens.push_back(Token::alternation(std::move(alternatives)));
        } else if (c == U'.') {
            tokens.push_back(Token(Token::WILDCARD));
        } else if (c == U'+' || c == U'?') {
            if (tokens.empty()) {
                throw PatternError(PatternError::DANGLING_QUANTIFIER,
                                   string("Quantifier '") + static_cast<char>(c) + "' has nothing to repeat");
            }
            if (!tokens.back().is_atomic()) {
                throw PatternError(PatternError::DANGLING_QUANTIFIER,
                                   string("Quantifier '") + static_cast<char>(c) + "' must follow a single-character token");
            }
            Token inner = std::move(tokens.back());
            tokens.pop_back();
            tokens.push_back(Token::quantified(c == U'+' ? Token::ONE_OR_MORE : Token::ZERO_OR_ONE, std::move(inner)));
        } else {
            tokens.push_back(Token::literal(c));
        }
    }

    return compiled;
}

} // namespace grep
