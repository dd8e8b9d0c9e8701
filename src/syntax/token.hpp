#pragma once

#include <string>
#include <vector>

#include "core/types.hpp"

namespace sandforge::syntax {

enum class TokenType {
    kName,
    kNumber,
    kString,
    kOp,
    kNewline,
    kIndent,
    kDedent,
    kEnd
};

const char* ToString(TokenType type);

struct Token {
    TokenType type = TokenType::kEnd;
    // Names, numbers and operators hold their exact spelling. Strings hold
    // the body between the quotes, undecoded.
    std::string text;
    // Lowercased string prefix ("", "r", "b", "f", "rb", "fr", ...).
    std::string prefix;
    SourceLocation location;

    bool Is(TokenType t, const char* spelling) const {
        return type == t && text == spelling;
    }
    bool IsOp(const char* spelling) const { return Is(TokenType::kOp, spelling); }
    bool IsKeyword(const char* spelling) const { return Is(TokenType::kName, spelling); }
};

// Splits source text into tokens, emitting NEWLINE, INDENT and DEDENT the way
// the interpreter's tokenizer does. Throws SyntaxError on malformed input.
std::vector<Token> Tokenize(const std::string& source);

bool IsKeyword(const std::string& word);

}  // namespace sandforge::syntax
