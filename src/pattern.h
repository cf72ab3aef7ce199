#ifndef GREP_PATTERN_H
#define GREP_PATTERN_H

#include <memory>
#include <stdexcept>
#include <string>
#include <vector>

namespace grep {

// One compiled unit of pattern syntax.
struct Token {
    enum Type { LITERAL, DIGIT, WORD, WILDCARD, CLASS, NEG_CLASS, ONE_OR_MORE, ZERO_OR_ONE, ALTERNATION };
    Type type;
    char32_t ch = 0;                   // For LITERAL
    std::u32string members;            // For CLASS and NEG_CLASS
    std::vector<std::u32string> options; // For ALTERNATION, raw literal text
    std::unique_ptr<Token> child;      // For ONE_OR_MORE and ZERO_OR_ONE

    explicit Token(Type t) : type(t) {}

    static Token literal(char32_t c);
    static Token char_class(std::u32string set, bool negated);
    static Token alternation(std::vector<std::u32string> alternatives);
    static Token quantified(Type quantifier, Token inner);

    // True for tokens that consume exactly one character.
    bool is_atomic() const;
};

struct CompiledPattern {
    bool anchor_start = false;
    bool anchor_end = false;
    std::vector<Token> tokens;
};

class PatternError : public std::runtime_error {
public:
    enum Kind { INVALID_ESCAPE, DANGLING_QUANTIFIER };

    PatternError(Kind kind, const std::string& message)
        : std::runtime_error(message), kind_(kind) {}

    Kind kind() const { return kind_; }

private:
    Kind kind_;
};

// Compile a pattern. Throws PatternError on an unknown escape or a quantifier
// with nothing to repeat.
CompiledPattern compile(const std::string& pattern);
CompiledPattern compile(const std::u32string& pattern);

} // namespace grep

#endif // GREP_PATTERN_H
