#include "altb/tag_order.hpp"

#include <algorithm>
#include <cctype>

namespace altb {

namespace {

// Token classes in ascending order
enum class TokenClass {
    Dash,
    End,
    Number,
    Byte
};

struct Token {
    TokenClass cls;
    std::string text;   // digit run without leading zeros, or the single byte
};

bool is_digit(char c) {
    return std::isdigit(static_cast<unsigned char>(c)) != 0;
}

Token next_token(const std::string& s, size_t& pos) {
    if (pos >= s.size()) return Token{TokenClass::End, ""};

    if (is_digit(s[pos])) {
        size_t start = pos;
        while (pos < s.size() && is_digit(s[pos])) ++pos;
        size_t first = s.find_first_not_of('0', start);
        if (first == std::string::npos || first >= pos) return Token{TokenClass::Number, ""};
        return Token{TokenClass::Number, s.substr(first, pos - first)};
    }

    char c = s[pos++];
    if (c == '-') return Token{TokenClass::Dash, "-"};
    return Token{TokenClass::Byte, std::string(1, c)};
}

int compare_tokens(const Token& a, const Token& b) {
    if (a.cls != b.cls) return a.cls < b.cls ? -1 : 1;

    switch (a.cls) {
        case TokenClass::Number:
            // Same length digit strings without leading zeros compare like numbers
            if (a.text.size() != b.text.size()) return a.text.size() < b.text.size() ? -1 : 1;
            break;
        case TokenClass::Byte:
            break;
        case TokenClass::Dash:
        case TokenClass::End:
            return 0;
    }

    int c = a.text.compare(b.text);
    if (c == 0) return 0;
    return c < 0 ? -1 : 1;
}

int compare_natural(const std::string& a, const std::string& b) {
    size_t i = 0;
    size_t j = 0;
    while (true) {
        Token ta = next_token(a, i);
        Token tb = next_token(b, j);
        int c = compare_tokens(ta, tb);
        if (c != 0) return c;
        if (ta.cls == TokenClass::End) return 0;
    }
}

} // namespace

int compare_tags(const std::string& a, const std::string& b) {
    if (a == b) return 0;

    int c = compare_natural(a, b);
    if (c != 0) return c;

    // Equal under natural ordering ("01" vs "1"): fall back to bytes for a total order
    return a < b ? -1 : 1;
}

void sort_tags(std::vector<std::string>& tags) {
    std::sort(tags.begin(), tags.end(), TagLess{});
}

} // namespace altb
