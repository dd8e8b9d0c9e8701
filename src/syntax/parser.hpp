#pragma once

#include <string>

#include "syntax/ast.hpp"

namespace sandforge::syntax {

// Parses a complete module. Throws SyntaxError for anything outside the
// supported grammar.
Module Parse(const std::string& source);

// Parses a single expression, as found in an f-string replacement field.
ExprPtr ParseExpression(const std::string& source, SourceLocation origin = {1, 1});

}  // namespace sandforge::syntax
