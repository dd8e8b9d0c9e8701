#include "syntax/token.hpp"

#include <array>
#include <cctype>
#include <unordered_set>

#include "core/errors.hpp"

namespace sandforge::syntax {
namespace {

constexpr std::array<const char*, 3> kThreeCharOps = {"**=", "//=", "..."};
constexpr std::array<const char*, 2> kThreeCharShiftOps = {">>=", "<<="};
constexpr std::array<const char*, 20> kTwoCharOps = {
    "->", ":=", "**", "//", "<<", ">>", "<=", ">=", "==", "!=",
    "+=", "-=", "*=", "/=", "%=", "&=", "|=", "^=", "@=", "<>"};
constexpr const char* kOneCharOps = "+-*/%@&|^~<>()[]{},:.;=";

bool IsIdentStart(char c) {
    return std::isalpha(static_cast<unsigned char>(c)) || c == '_';
}

bool IsIdentChar(char c) {
    return std::isalnum(static_cast<unsigned char>(c)) || c == '_';
}

bool IsStringPrefix(const std::string& word) {
    static const std::unordered_set<std::string> kPrefixes = {
        "r", "u", "b", "f", "br", "rb", "fr", "rf"};
    std::string lowered;
    for (char c : word) {
        lowered.push_back(static_cast<char>(std::tolower(static_cast<unsigned char>(c))));
    }
    return kPrefixes.count(lowered) > 0;
}

class Lexer {
public:
    explicit Lexer(const std::string& source) : src_(source) {}

    std::vector<Token> Run() {
        indents_.push_back(0);
        bool at_line_start = true;
        while (pos_ < src_.size()) {
            if (at_line_start && depth_ == 0) {
                if (!HandleIndentation()) {
                    continue;
                }
                at_line_start = false;
            }
            const char c = src_[pos_];
            if (c == '\n') {
                if (depth_ == 0) {
                    Emit(TokenType::kNewline, "", Here());
                    at_line_start = true;
                }
                Advance();
                continue;
            }
            if (c == ' ' || c == '\t' || c == '\f' || c == '\r') {
                Advance();
                continue;
            }
            if (c == '#') {
                SkipComment();
                continue;
            }
            if (c == '\\') {
                const auto next = Peek(1);
                if (next == '\n' || (next == '\r' && Peek(2) == '\n')) {
                    Advance();
                    if (Peek(0) == '\r') {
                        Advance();
                    }
                    Advance();
                    continue;
                }
                Fail("unexpected character after line continuation character");
            }
            if (IsIdentStart(c)) {
                LexNameOrString();
                continue;
            }
            if (std::isdigit(static_cast<unsigned char>(c)) ||
                (c == '.' && std::isdigit(static_cast<unsigned char>(Peek(1))))) {
                LexNumber();
                continue;
            }
            if (c == '"' || c == '\'') {
                LexString("", Here());
                continue;
            }
            if (static_cast<unsigned char>(c) >= 0x80) {
                // Identifiers are NFKC-normalized by the interpreter, so
                // non-ASCII spellings could alias denied names.
                Fail("non-ASCII character outside string literal");
            }
            LexOperator();
        }
        if (depth_ > 0) {
            Fail("unexpected EOF: unclosed bracket");
        }
        if (!tokens_.empty() && tokens_.back().type != TokenType::kNewline &&
            tokens_.back().type != TokenType::kDedent) {
            Emit(TokenType::kNewline, "", Here());
        }
        while (indents_.size() > 1) {
            indents_.pop_back();
            Emit(TokenType::kDedent, "", Here());
        }
        Emit(TokenType::kEnd, "", Here());
        return std::move(tokens_);
    }

private:
    const std::string& src_;
    std::size_t pos_ = 0;
    int line_ = 1;
    int column_ = 1;
    int depth_ = 0;
    std::vector<int> indents_;
    std::vector<Token> tokens_;

    SourceLocation Here() const { return SourceLocation{line_, column_}; }

    char Peek(std::size_t offset) const {
        return pos_ + offset < src_.size() ? src_[pos_ + offset] : '\0';
    }

    void Advance() {
        if (src_[pos_] == '\n') {
            ++line_;
            column_ = 1;
        } else {
            ++column_;
        }
        ++pos_;
    }

    [[noreturn]] void Fail(const std::string& message) const {
        throw SyntaxError(message, line_, column_);
    }

    void Emit(TokenType type, std::string text, SourceLocation location, std::string prefix = "") {
        Token token{};
        token.type = type;
        token.text = std::move(text);
        token.prefix = std::move(prefix);
        token.location = location;
        tokens_.push_back(std::move(token));
    }

    void SkipComment() {
        while (pos_ < src_.size() && src_[pos_] != '\n') {
            Advance();
        }
    }

    // Returns false when the line is blank or comment-only and was consumed.
    bool HandleIndentation() {
        int width = 0;
        while (pos_ < src_.size()) {
            const char c = src_[pos_];
            if (c == ' ') {
                ++width;
            } else if (c == '\t') {
                width = (width / 8 + 1) * 8;
            } else if (c == '\f' || c == '\r') {
                // ignored
            } else {
                break;
            }
            Advance();
        }
        if (pos_ >= src_.size()) {
            return false;
        }
        const char c = src_[pos_];
        if (c == '\n') {
            Advance();
            return false;
        }
        if (c == '#') {
            SkipComment();
            if (pos_ < src_.size()) {
                Advance();
            }
            return false;
        }
        if (width > indents_.back()) {
            indents_.push_back(width);
            Emit(TokenType::kIndent, "", Here());
        } else {
            while (width < indents_.back()) {
                indents_.pop_back();
                Emit(TokenType::kDedent, "", Here());
            }
            if (width != indents_.back()) {
                Fail("unindent does not match any outer indentation level");
            }
        }
        return true;
    }

    void LexNameOrString() {
        const auto start = Here();
        std::string word;
        while (pos_ < src_.size() && IsIdentChar(src_[pos_])) {
            word.push_back(src_[pos_]);
            Advance();
        }
        if (pos_ < src_.size() && (src_[pos_] == '"' || src_[pos_] == '\'') && IsStringPrefix(word)) {
            std::string lowered;
            for (char ch : word) {
                lowered.push_back(static_cast<char>(std::tolower(static_cast<unsigned char>(ch))));
            }
            LexString(lowered, start);
            return;
        }
        if (pos_ < src_.size() && static_cast<unsigned char>(src_[pos_]) >= 0x80) {
            Fail("non-ASCII character in identifier");
        }
        Emit(TokenType::kName, word, start);
    }

    void LexNumber() {
        const auto start = Here();
        std::string text;
        auto take_digits = [&](auto predicate) {
            while (pos_ < src_.size() && (predicate(src_[pos_]) || src_[pos_] == '_')) {
                text.push_back(src_[pos_]);
                Advance();
            }
        };
        auto is_dec = [](char ch) { return std::isdigit(static_cast<unsigned char>(ch)) != 0; };
        if (src_[pos_] == '0' && (Peek(1) == 'x' || Peek(1) == 'X' || Peek(1) == 'o' ||
                                   Peek(1) == 'O' || Peek(1) == 'b' || Peek(1) == 'B')) {
            text.push_back(src_[pos_]);
            Advance();
            text.push_back(src_[pos_]);
            Advance();
            take_digits([](char ch) { return std::isxdigit(static_cast<unsigned char>(ch)) != 0; });
            if (text.size() == 2) {
                Fail("invalid number literal");
            }
        } else {
            take_digits(is_dec);
            if (pos_ < src_.size() && src_[pos_] == '.') {
                text.push_back('.');
                Advance();
                take_digits(is_dec);
            }
            if (pos_ < src_.size() && (src_[pos_] == 'e' || src_[pos_] == 'E')) {
                text.push_back(src_[pos_]);
                Advance();
                if (pos_ < src_.size() && (src_[pos_] == '+' || src_[pos_] == '-')) {
                    text.push_back(src_[pos_]);
                    Advance();
                }
                const auto before = text.size();
                take_digits(is_dec);
                if (text.size() == before) {
                    Fail("invalid exponent in number literal");
                }
            }
            if (pos_ < src_.size() && (src_[pos_] == 'j' || src_[pos_] == 'J')) {
                text.push_back(src_[pos_]);
                Advance();
            }
        }
        if (pos_ < src_.size() && IsIdentStart(src_[pos_])) {
            Fail("invalid number literal");
        }
        Emit(TokenType::kNumber, text, start);
    }

    void LexString(const std::string& prefix, SourceLocation start) {
        const char quote = src_[pos_];
        const bool triple = Peek(1) == quote && Peek(2) == quote;
        const std::size_t quote_len = triple ? 3 : 1;
        for (std::size_t i = 0; i < quote_len; ++i) {
            Advance();
        }
        std::string body;
        while (true) {
            if (pos_ >= src_.size()) {
                throw SyntaxError("unterminated string literal", start.line, start.column);
            }
            const char c = src_[pos_];
            if (c == '\\') {
                body.push_back(c);
                Advance();
                if (pos_ >= src_.size()) {
                    throw SyntaxError("unterminated string literal", start.line, start.column);
                }
                body.push_back(src_[pos_]);
                Advance();
                continue;
            }
            if (c == '\n' && !triple) {
                throw SyntaxError("unterminated string literal", start.line, start.column);
            }
            if (c == quote) {
                if (!triple) {
                    Advance();
                    break;
                }
                if (Peek(1) == quote && Peek(2) == quote) {
                    Advance();
                    Advance();
                    Advance();
                    break;
                }
            }
            body.push_back(c);
            Advance();
        }
        Emit(TokenType::kString, body, start, prefix);
    }

    void LexOperator() {
        const auto start = Here();
        auto matches = [&](const char* op) {
            return src_.compare(pos_, std::char_traits<char>::length(op), op) == 0;
        };
        auto take = [&](const char* op) {
            const auto len = std::char_traits<char>::length(op);
            for (std::size_t i = 0; i < len; ++i) {
                Advance();
            }
            Emit(TokenType::kOp, op, start);
        };
        for (const char* op : kThreeCharOps) {
            if (matches(op)) {
                take(op);
                return;
            }
        }
        for (const char* op : kThreeCharShiftOps) {
            if (matches(op)) {
                take(op);
                return;
            }
        }
        for (const char* op : kTwoCharOps) {
            if (matches(op)) {
                if (std::string(op) == "<>") {
                    Fail("invalid syntax");
                }
                take(op);
                return;
            }
        }
        const char c = src_[pos_];
        if (std::char_traits<char>::find(kOneCharOps, std::char_traits<char>::length(kOneCharOps), c) == nullptr) {
            Fail(std::string("invalid character '") + c + "'");
        }
        if (c == '(' || c == '[' || c == '{') {
            ++depth_;
        } else if (c == ')' || c == ']' || c == '}') {
            if (depth_ == 0) {
                Fail(std::string("unmatched '") + c + "'");
            }
            --depth_;
        }
        Advance();
        Emit(TokenType::kOp, std::string(1, c), start);
    }
};

}  // namespace

const char* ToString(TokenType type) {
    switch (type) {
        case TokenType::kName: return "NAME";
        case TokenType::kNumber: return "NUMBER";
        case TokenType::kString: return "STRING";
        case TokenType::kOp: return "OP";
        case TokenType::kNewline: return "NEWLINE";
        case TokenType::kIndent: return "INDENT";
        case TokenType::kDedent: return "DEDENT";
        case TokenType::kEnd: return "END";
    }
    return "UNKNOWN";
}

bool IsKeyword(const std::string& word) {
    static const std::unordered_set<std::string> kKeywords = {
        "False", "None", "True", "and", "as", "assert", "async", "await",
        "break", "class", "continue", "def", "del", "elif", "else", "except",
        "finally", "for", "from", "global", "if", "import", "in", "is",
        "lambda", "nonlocal", "not", "or", "pass", "raise", "return", "try",
        "while", "with", "yield"};
    return kKeywords.count(word) > 0;
}

std::vector<Token> Tokenize(const std::string& source) {
    Lexer lexer(source);
    return lexer.Run();
}

}  // namespace sandforge::syntax
