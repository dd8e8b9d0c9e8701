#include <gtest/gtest.h>

#include <algorithm>
#include <string>
#include <vector>

#include "core/errors.hpp"
#include "syntax/parser.hpp"
#include "syntax/token.hpp"
#include "syntax/walker.hpp"

namespace sandforge::syntax {
namespace {

std::vector<TokenType> Types(const std::vector<Token>& tokens) {
    std::vector<TokenType> types;
    for (const auto& token : tokens) {
        types.push_back(token.type);
    }
    return types;
}

int Count(const std::vector<Token>& tokens, TokenType type) {
    int count = 0;
    for (const auto& token : tokens) {
        if (token.type == type) {
            ++count;
        }
    }
    return count;
}

TEST(LexerTest, SimpleAssignment) {
    const auto tokens = Tokenize("x = 1\n");
    ASSERT_GE(tokens.size(), 4u);
    EXPECT_TRUE(tokens[0].Is(TokenType::kName, "x"));
    EXPECT_TRUE(tokens[1].IsOp("="));
    EXPECT_TRUE(tokens[2].Is(TokenType::kNumber, "1"));
    EXPECT_EQ(tokens[3].type, TokenType::kNewline);
    EXPECT_EQ(tokens.back().type, TokenType::kEnd);
    EXPECT_EQ(tokens[0].location.line, 1);
    EXPECT_EQ(tokens[0].location.column, 1);
    EXPECT_EQ(tokens[2].location.column, 5);
}

TEST(LexerTest, IndentationProducesBalancedIndentAndDedent) {
    const auto tokens = Tokenize("if x:\n    if y:\n        z = 1\nw = 2\n");
    EXPECT_EQ(Count(tokens, TokenType::kIndent), 2);
    EXPECT_EQ(Count(tokens, TokenType::kDedent), 2);
}

TEST(LexerTest, BracketsJoinLines) {
    const auto tokens = Tokenize("x = [1,\n     2]\n");
    EXPECT_EQ(Count(tokens, TokenType::kNewline), 1);
    EXPECT_EQ(Count(tokens, TokenType::kIndent), 0);
}

TEST(LexerTest, CommentsAndBlankLinesAreSkipped) {
    const auto tokens = Tokenize("# header\n\nx = 1  # trailing\n\n");
    EXPECT_EQ(Count(tokens, TokenType::kNewline), 1);
    EXPECT_EQ(Count(tokens, TokenType::kName), 1);
}

TEST(LexerTest, StringPrefixesAreLowercased) {
    const auto tokens = Tokenize("a = RB'raw'\n");
    ASSERT_GE(tokens.size(), 3u);
    EXPECT_EQ(tokens[2].type, TokenType::kString);
    EXPECT_EQ(tokens[2].prefix, "rb");
    EXPECT_EQ(tokens[2].text, "raw");
}

TEST(LexerTest, TripleQuotedStringSpansLines) {
    const auto tokens = Tokenize("s = \"\"\"one\ntwo\"\"\"\nt = 1\n");
    ASSERT_GE(tokens.size(), 3u);
    EXPECT_EQ(tokens[2].type, TokenType::kString);
    EXPECT_EQ(tokens[2].text, "one\ntwo");
}

TEST(LexerTest, UnterminatedStringReportsItsStart) {
    try {
        Tokenize("x = 1\ny = 'abc\n");
        FAIL() << "expected SyntaxError";
    } catch (const SyntaxError& error) {
        EXPECT_EQ(error.Line(), 2);
        EXPECT_EQ(error.Column(), 5);
    }
}

TEST(LexerTest, InconsistentDedentFails) {
    EXPECT_THROW(Tokenize("if x:\n        y = 1\n    z = 2\n"), SyntaxError);
}

TEST(ParserTest, ParsesStatementsWithLocations) {
    const auto module = Parse("import math\nx = math.sqrt(4)\nif x > 1:\n    y = x\nelse:\n    y = 0\n");
    ASSERT_EQ(module.body.size(), 3u);
    EXPECT_TRUE(std::holds_alternative<ImportStmt>(module.body[0]->node));
    EXPECT_TRUE(std::holds_alternative<AssignStmt>(module.body[1]->node));
    EXPECT_TRUE(std::holds_alternative<IfStmt>(module.body[2]->node));
    EXPECT_EQ(module.body[2]->location.line, 3);

    const auto& branch = std::get<IfStmt>(module.body[2]->node);
    EXPECT_EQ(branch.body.size(), 1u);
    EXPECT_EQ(branch.orelse.size(), 1u);
}

TEST(ParserTest, ParsesFunctionSignature) {
    const auto module = Parse("@decorate\ndef f(a, b=2, *args, c, **kw) -> int:\n    return a\n");
    ASSERT_EQ(module.body.size(), 1u);
    const auto& def = std::get<FunctionDefStmt>(module.body[0]->node);
    EXPECT_EQ(def.name, "f");
    ASSERT_EQ(def.params.size(), 5u);
    EXPECT_EQ(def.params[0].kind, ParamKind::kPositional);
    EXPECT_NE(def.params[1].default_value, nullptr);
    EXPECT_EQ(def.params[2].kind, ParamKind::kVarArgs);
    EXPECT_EQ(def.params[3].kind, ParamKind::kKeywordOnly);
    EXPECT_EQ(def.params[4].kind, ParamKind::kVarKeywords);
    EXPECT_EQ(def.decorators.size(), 1u);
    EXPECT_NE(def.returns, nullptr);
}

TEST(ParserTest, ParsesRelativeAndWildcardImports) {
    const auto module = Parse("from .. import x\nfrom m import *\n");
    const auto& relative = std::get<ImportFromStmt>(module.body[0]->node);
    EXPECT_EQ(relative.level, 2);
    const auto& wildcard = std::get<ImportFromStmt>(module.body[1]->node);
    EXPECT_EQ(wildcard.module, "m");
    ASSERT_EQ(wildcard.names.size(), 1u);
    EXPECT_EQ(wildcard.names[0].name, "*");
}

TEST(ParserTest, ParsesComprehensionsAndChainedComparisons) {
    EXPECT_NO_THROW(Parse("r = [x * 2 for x in items if 0 < x <= 10]\n"
                          "d = {k: v for k, v in pairs}\n"
                          "s = {x for x in items}\n"
                          "g = sum(x for x in items)\n"
                          "t = a if b else c\n"
                          "f = lambda y, z=1: y + z\n"
                          "n = (w := 3)\n"));
}

TEST(ParserTest, ParsesCompoundStatements) {
    EXPECT_NO_THROW(Parse("try:\n    x = 1\nexcept (ValueError, KeyError) as e:\n    raise RuntimeError('x') from e\n"
                          "else:\n    pass\nfinally:\n    del x\n"
                          "with ctx() as (a, b):\n    assert a, 'msg'\n"
                          "for i in range(3):\n    continue\nelse:\n    pass\n"
                          "while False:\n    break\n"
                          "class C(Base, metaclass=M):\n    x: int = 1\n"
                          "def g():\n    global q\n    q += 1\n"));
}

TEST(ParserTest, FStringFieldsAreParsedAsExpressions) {
    const auto module = Parse("s = f'{name!r:>10} and {obj.__class__}'\n");
    const auto& assign = std::get<AssignStmt>(module.body[0]->node);
    const auto& fstring = std::get<FStringExpr>(assign.value->node);
    ASSERT_EQ(fstring.values.size(), 2u);
    EXPECT_TRUE(std::holds_alternative<NameExpr>(fstring.values[0]->node));
    EXPECT_TRUE(std::holds_alternative<AttributeExpr>(fstring.values[1]->node));
}

TEST(ParserTest, RejectsUnsupportedConstructs) {
    EXPECT_THROW(Parse("async def f():\n    pass\n"), SyntaxError);
    EXPECT_THROW(Parse("def f():\n    yield 1\n"), SyntaxError);
}

TEST(ParserTest, RejectsInvalidAssignmentTargets) {
    EXPECT_THROW(Parse("f() = 1\n"), SyntaxError);
    EXPECT_THROW(Parse("a + b += 1\n"), SyntaxError);
}

TEST(ParserTest, SyntaxErrorCarriesLocation) {
    try {
        Parse("x = 1\ny = (2 +\n");
        FAIL() << "expected SyntaxError";
    } catch (const SyntaxError& error) {
        EXPECT_GE(error.Line(), 2);
    }
}

class NameCollector : public TreeWalker {
public:
    std::vector<std::string> names;
    bool skip_lambdas = false;

protected:
    bool EnterExpr(const Expr& expr) override {
        if (const auto* name = std::get_if<NameExpr>(&expr.node)) {
            names.push_back(name->id);
        }
        return !(skip_lambdas && std::holds_alternative<LambdaExpr>(expr.node));
    }
};

TEST(TreeWalkerTest, VisitsNestedExpressions) {
    const auto module = Parse("result = [f(a) for a in items if g(a)]\n");
    NameCollector collector;
    collector.Walk(module);
    const std::vector<std::string> expected = {"result", "f", "a", "a", "items", "g", "a"};
    std::vector<std::string> sorted_names = collector.names;
    std::sort(sorted_names.begin(), sorted_names.end());
    std::vector<std::string> sorted_expected = expected;
    std::sort(sorted_expected.begin(), sorted_expected.end());
    EXPECT_EQ(sorted_names, sorted_expected);
}

TEST(TreeWalkerTest, EnterReturningFalseSkipsChildren) {
    const auto module = Parse("x = lambda: hidden\n");
    NameCollector collector;
    collector.skip_lambdas = true;
    collector.Walk(module);
    EXPECT_EQ(collector.names, std::vector<std::string>{"x"});
}

}  // namespace
}  // namespace sandforge::syntax
