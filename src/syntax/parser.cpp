#include "syntax/parser.hpp"

#include <initializer_list>
#include <utility>

#include "core/errors.hpp"
#include "syntax/token.hpp"

namespace sandforge::syntax {
namespace {

template <class T>
ExprPtr MakeExpr(SourceLocation location, T node) {
    auto expr = std::make_unique<Expr>();
    expr->location = location;
    expr->node = std::move(node);
    return expr;
}

template <class T>
StmtPtr MakeStmt(SourceLocation location, T node) {
    auto stmt = std::make_unique<Stmt>();
    stmt->location = location;
    stmt->node = std::move(node);
    return stmt;
}

bool IsAugAssignOp(const Token& token) {
    static const char* kOps[] = {"+=", "-=", "*=", "/=", "//=", "%=", "**=",
                                 ">>=", "<<=", "&=", "|=", "^=", "@="};
    if (token.type != TokenType::kOp) {
        return false;
    }
    for (const char* op : kOps) {
        if (token.text == op) {
            return true;
        }
    }
    return false;
}

// Extracts the replacement-field expressions of an f-string body.
std::vector<std::string> SplitFStringFields(const std::string& body, SourceLocation location) {
    std::vector<std::string> fields;
    std::size_t i = 0;
    while (i < body.size()) {
        const char c = body[i];
        if (c == '{') {
            if (i + 1 < body.size() && body[i + 1] == '{') {
                i += 2;
                continue;
            }
            int depth = 0;
            char quote = '\0';
            std::size_t expr_end = std::string::npos;
            std::size_t j = i + 1;
            for (; j < body.size(); ++j) {
                const char ch = body[j];
                if (quote != '\0') {
                    if (ch == quote) {
                        quote = '\0';
                    }
                    continue;
                }
                if (ch == '\'' || ch == '"') {
                    quote = ch;
                } else if (ch == '(' || ch == '[' || ch == '{') {
                    ++depth;
                } else if (ch == ')' || ch == ']') {
                    --depth;
                } else if (ch == '}') {
                    if (depth == 0) {
                        break;
                    }
                    --depth;
                } else if (depth == 0 && expr_end == std::string::npos) {
                    if (ch == '!' && j + 1 < body.size() && body[j + 1] != '=') {
                        expr_end = j;
                    } else if (ch == ':') {
                        expr_end = j;
                    }
                }
            }
            if (j >= body.size()) {
                throw SyntaxError("f-string: expecting '}'", location.line, location.column);
            }
            const auto end = expr_end == std::string::npos ? j : expr_end;
            std::string expression = body.substr(i + 1, end - i - 1);
            while (!expression.empty() && (expression.back() == '=' || expression.back() == ' ')) {
                // "{value=}" debugging form.
                if (expression.back() == '=' && expression.size() >= 2) {
                    const char prev = expression[expression.size() - 2];
                    if (prev == '=' || prev == '!' || prev == '<' || prev == '>') {
                        break;
                    }
                }
                expression.pop_back();
            }
            if (expression.find_first_not_of(" \t") == std::string::npos) {
                throw SyntaxError("f-string: empty expression not allowed", location.line, location.column);
            }
            fields.push_back(expression);
            if (expr_end != std::string::npos && body[expr_end] == ':') {
                // Nested fields inside the format spec.
                const auto nested = SplitFStringFields(body.substr(expr_end + 1, j - expr_end - 1), location);
                fields.insert(fields.end(), nested.begin(), nested.end());
            }
            i = j + 1;
            continue;
        }
        if (c == '}') {
            if (i + 1 < body.size() && body[i + 1] == '}') {
                i += 2;
                continue;
            }
            throw SyntaxError("f-string: single '}' is not allowed", location.line, location.column);
        }
        ++i;
    }
    return fields;
}

class Parser {
public:
    explicit Parser(std::vector<Token> tokens) : tokens_(std::move(tokens)) {}

    Module ParseModule() {
        Module module{};
        while (!Check(TokenType::kEnd)) {
            if (Check(TokenType::kNewline)) {
                Next();
                continue;
            }
            ParseStatement(module.body);
        }
        return module;
    }

    ExprPtr ParseStandaloneExpression() {
        while (Check(TokenType::kNewline)) {
            Next();
        }
        auto expr = ParseStarExpressions();
        while (Check(TokenType::kNewline)) {
            Next();
        }
        if (!Check(TokenType::kEnd)) {
            Fail("invalid syntax");
        }
        return expr;
    }

private:
    std::vector<Token> tokens_;
    std::size_t pos_ = 0;

    const Token& Current() const { return tokens_[pos_]; }
    const Token& PeekToken(std::size_t offset = 1) const {
        const auto index = pos_ + offset;
        return index < tokens_.size() ? tokens_[index] : tokens_.back();
    }
    bool Check(TokenType type) const { return Current().type == type; }
    bool CheckOp(const char* op) const { return Current().IsOp(op); }
    bool CheckKeyword(const char* word) const { return Current().IsKeyword(word); }

    const Token& Next() {
        const Token& token = tokens_[pos_];
        if (pos_ + 1 < tokens_.size()) {
            ++pos_;
        }
        return token;
    }

    bool AcceptOp(const char* op) {
        if (CheckOp(op)) {
            Next();
            return true;
        }
        return false;
    }

    bool AcceptKeyword(const char* word) {
        if (CheckKeyword(word)) {
            Next();
            return true;
        }
        return false;
    }

    [[noreturn]] void Fail(const std::string& message) const {
        const auto& location = Current().location;
        throw SyntaxError(message, location.line, location.column);
    }

    void ExpectOp(const char* op) {
        if (!AcceptOp(op)) {
            Fail(std::string("expected '") + op + "'");
        }
    }

    void ExpectKeyword(const char* word) {
        if (!AcceptKeyword(word)) {
            Fail(std::string("expected '") + word + "'");
        }
    }

    std::string ExpectName() {
        if (!Check(TokenType::kName) || IsKeyword(Current().text)) {
            Fail("expected identifier");
        }
        return Next().text;
    }

    void ExpectNewline() {
        if (Check(TokenType::kEnd)) {
            return;
        }
        if (!Check(TokenType::kNewline)) {
            Fail("invalid syntax");
        }
        Next();
    }

    // ---- statements -----------------------------------------------------

    void ParseStatement(Block& out) {
        const auto& token = Current();
        if (token.type == TokenType::kIndent) {
            Fail("unexpected indent");
        }
        if (token.type == TokenType::kDedent) {
            Fail("unexpected unindent");
        }
        if (token.type == TokenType::kName) {
            const auto& word = token.text;
            if (word == "if") {
                out.push_back(ParseIf());
                return;
            }
            if (word == "while") {
                out.push_back(ParseWhile());
                return;
            }
            if (word == "for") {
                out.push_back(ParseFor());
                return;
            }
            if (word == "try") {
                out.push_back(ParseTry());
                return;
            }
            if (word == "with") {
                out.push_back(ParseWith());
                return;
            }
            if (word == "def") {
                out.push_back(ParseFunctionDef({}));
                return;
            }
            if (word == "class") {
                out.push_back(ParseClassDef({}));
                return;
            }
            if (word == "async" || word == "await" || word == "yield") {
                Fail("unsupported construct '" + word + "'");
            }
        }
        if (token.IsOp("@")) {
            out.push_back(ParseDecorated());
            return;
        }
        ParseSimpleStatementLine(out);
    }

    void ParseSimpleStatementLine(Block& out) {
        out.push_back(ParseSmallStatement());
        while (AcceptOp(";")) {
            if (Check(TokenType::kNewline) || Check(TokenType::kEnd)) {
                break;
            }
            out.push_back(ParseSmallStatement());
        }
        ExpectNewline();
    }

    Block ParseBlock() {
        ExpectOp(":");
        Block body;
        if (Check(TokenType::kNewline)) {
            Next();
            if (!Check(TokenType::kIndent)) {
                Fail("expected an indented block");
            }
            Next();
            while (!Check(TokenType::kDedent) && !Check(TokenType::kEnd)) {
                if (Check(TokenType::kNewline)) {
                    Next();
                    continue;
                }
                ParseStatement(body);
            }
            if (Check(TokenType::kDedent)) {
                Next();
            }
            return body;
        }
        ParseSimpleStatementLine(body);
        return body;
    }

    StmtPtr ParseSmallStatement() {
        const auto location = Current().location;
        const auto& token = Current();
        if (token.type == TokenType::kName) {
            const auto word = token.text;
            if (word == "pass") {
                Next();
                return MakeStmt(location, PassStmt{});
            }
            if (word == "break") {
                Next();
                return MakeStmt(location, BreakStmt{});
            }
            if (word == "continue") {
                Next();
                return MakeStmt(location, ContinueStmt{});
            }
            if (word == "return") {
                Next();
                ReturnStmt stmt{};
                if (!AtStatementEnd()) {
                    stmt.value = ParseStarExpressions();
                }
                return MakeStmt(location, std::move(stmt));
            }
            if (word == "raise") {
                Next();
                RaiseStmt stmt{};
                if (!AtStatementEnd()) {
                    stmt.exc = ParseTest();
                    if (AcceptKeyword("from")) {
                        stmt.cause = ParseTest();
                    }
                }
                return MakeStmt(location, std::move(stmt));
            }
            if (word == "global" || word == "nonlocal") {
                Next();
                std::vector<std::string> names;
                names.push_back(ExpectName());
                while (AcceptOp(",")) {
                    names.push_back(ExpectName());
                }
                if (word == "global") {
                    return MakeStmt(location, GlobalStmt{std::move(names)});
                }
                return MakeStmt(location, NonlocalStmt{std::move(names)});
            }
            if (word == "del") {
                Next();
                DeleteStmt stmt{};
                stmt.targets.push_back(ParseTarget());
                while (AcceptOp(",")) {
                    if (AtStatementEnd()) {
                        break;
                    }
                    stmt.targets.push_back(ParseTarget());
                }
                for (const auto& target : stmt.targets) {
                    CheckAssignable(*target);
                }
                return MakeStmt(location, std::move(stmt));
            }
            if (word == "assert") {
                Next();
                AssertStmt stmt{};
                stmt.test = ParseTest();
                if (AcceptOp(",")) {
                    stmt.msg = ParseTest();
                }
                return MakeStmt(location, std::move(stmt));
            }
            if (word == "import") {
                return ParseImport();
            }
            if (word == "from") {
                return ParseImportFrom();
            }
            if (word == "async" || word == "await" || word == "yield") {
                Fail("unsupported construct '" + word + "'");
            }
        }
        return ParseExpressionStatement();
    }

    bool AtStatementEnd() const {
        return Check(TokenType::kNewline) || Check(TokenType::kEnd) || CheckOp(";");
    }

    StmtPtr ParseExpressionStatement() {
        const auto location = Current().location;
        auto first = ParseStarExpressions();
        if (CheckOp("=")) {
            AssignStmt stmt{};
            stmt.targets.push_back(std::move(first));
            ExprPtr value;
            while (AcceptOp("=")) {
                value = ParseStarExpressions();
                if (CheckOp("=")) {
                    stmt.targets.push_back(std::move(value));
                }
            }
            for (const auto& target : stmt.targets) {
                CheckAssignable(*target);
            }
            stmt.value = std::move(value);
            return MakeStmt(location, std::move(stmt));
        }
        if (IsAugAssignOp(Current())) {
            const auto op = Next().text;
            CheckAugAssignable(*first);
            AugAssignStmt stmt{};
            stmt.target = std::move(first);
            stmt.op = op.substr(0, op.size() - 1);
            stmt.value = ParseStarExpressions();
            return MakeStmt(location, std::move(stmt));
        }
        if (AcceptOp(":")) {
            CheckAugAssignable(*first);
            AnnAssignStmt stmt{};
            stmt.target = std::move(first);
            stmt.annotation = ParseTest();
            if (AcceptOp("=")) {
                stmt.value = ParseStarExpressions();
            }
            return MakeStmt(location, std::move(stmt));
        }
        return MakeStmt(location, ExprStmt{std::move(first)});
    }

    void CheckAssignable(const Expr& expr) const {
        const bool ok = std::visit(Overloaded{
            [](const NameExpr&) { return true; },
            [](const AttributeExpr&) { return true; },
            [](const SubscriptExpr&) { return true; },
            [this](const StarredExpr& node) {
                CheckAssignable(*node.value);
                return true;
            },
            [this](const TupleExpr& node) {
                for (const auto& elt : node.elts) {
                    CheckAssignable(*elt);
                }
                return true;
            },
            [this](const ListExpr& node) {
                for (const auto& elt : node.elts) {
                    CheckAssignable(*elt);
                }
                return true;
            },
            [](const auto&) { return false; }},
            expr.node);
        if (!ok) {
            throw SyntaxError("cannot assign to expression", expr.location.line, expr.location.column);
        }
    }

    void CheckAugAssignable(const Expr& expr) const {
        const bool ok = std::holds_alternative<NameExpr>(expr.node) ||
            std::holds_alternative<AttributeExpr>(expr.node) ||
            std::holds_alternative<SubscriptExpr>(expr.node);
        if (!ok) {
            throw SyntaxError("illegal expression for augmented assignment",
                              expr.location.line, expr.location.column);
        }
    }

    std::string ParseDottedName() {
        std::string name = ExpectName();
        while (AcceptOp(".")) {
            name += "." + ExpectName();
        }
        return name;
    }

    StmtPtr ParseImport() {
        const auto location = Next().location;
        ImportStmt stmt{};
        do {
            ImportAlias alias{};
            alias.location = Current().location;
            alias.name = ParseDottedName();
            if (AcceptKeyword("as")) {
                alias.asname = ExpectName();
            }
            stmt.names.push_back(std::move(alias));
        } while (AcceptOp(","));
        return MakeStmt(location, std::move(stmt));
    }

    StmtPtr ParseImportFrom() {
        const auto location = Next().location;
        ImportFromStmt stmt{};
        while (CheckOp(".") || CheckOp("...")) {
            stmt.level += CheckOp("...") ? 3 : 1;
            Next();
        }
        if (!CheckKeyword("import")) {
            stmt.module = ParseDottedName();
        } else if (stmt.level == 0) {
            Fail("expected module name");
        }
        ExpectKeyword("import");
        if (CheckOp("*")) {
            ImportAlias alias{};
            alias.location = Current().location;
            alias.name = "*";
            Next();
            stmt.names.push_back(std::move(alias));
            return MakeStmt(location, std::move(stmt));
        }
        const bool parenthesized = AcceptOp("(");
        do {
            if (parenthesized && CheckOp(")")) {
                break;
            }
            ImportAlias alias{};
            alias.location = Current().location;
            alias.name = ExpectName();
            if (AcceptKeyword("as")) {
                alias.asname = ExpectName();
            }
            stmt.names.push_back(std::move(alias));
        } while (AcceptOp(","));
        if (parenthesized) {
            ExpectOp(")");
        }
        if (stmt.names.empty()) {
            Fail("expected import name");
        }
        return MakeStmt(location, std::move(stmt));
    }

    StmtPtr ParseIf() {
        const auto location = Next().location;
        IfStmt stmt{};
        stmt.test = ParseNamedExpression();
        stmt.body = ParseBlock();
        if (CheckKeyword("elif")) {
            stmt.orelse.push_back(ParseIf());
        } else if (AcceptKeyword("else")) {
            stmt.orelse = ParseBlock();
        }
        return MakeStmt(location, std::move(stmt));
    }

    StmtPtr ParseWhile() {
        const auto location = Next().location;
        WhileStmt stmt{};
        stmt.test = ParseNamedExpression();
        stmt.body = ParseBlock();
        if (AcceptKeyword("else")) {
            stmt.orelse = ParseBlock();
        }
        return MakeStmt(location, std::move(stmt));
    }

    StmtPtr ParseFor() {
        const auto location = Next().location;
        ForStmt stmt{};
        stmt.target = ParseTargetList();
        CheckAssignable(*stmt.target);
        ExpectKeyword("in");
        stmt.iter = ParseStarExpressions();
        stmt.body = ParseBlock();
        if (AcceptKeyword("else")) {
            stmt.orelse = ParseBlock();
        }
        return MakeStmt(location, std::move(stmt));
    }

    StmtPtr ParseTry() {
        const auto location = Next().location;
        TryStmt stmt{};
        stmt.body = ParseBlock();
        while (CheckKeyword("except")) {
            ExceptHandler handler{};
            handler.location = Next().location;
            if (!CheckOp(":")) {
                handler.type = ParseTest();
                if (AcceptOp(",")) {
                    // "except A, B:" is Python 2 syntax.
                    Fail("multiple exception types must be parenthesized");
                }
                if (AcceptKeyword("as")) {
                    handler.name = ExpectName();
                }
            }
            handler.body = ParseBlock();
            stmt.handlers.push_back(std::move(handler));
        }
        if (AcceptKeyword("else")) {
            if (stmt.handlers.empty()) {
                Fail("invalid syntax");
            }
            stmt.orelse = ParseBlock();
        }
        if (AcceptKeyword("finally")) {
            stmt.finalbody = ParseBlock();
        }
        if (stmt.handlers.empty() && stmt.finalbody.empty()) {
            Fail("expected 'except' or 'finally' block");
        }
        return MakeStmt(location, std::move(stmt));
    }

    StmtPtr ParseWith() {
        const auto location = Next().location;
        WithStmt stmt{};
        do {
            WithItem item{};
            item.context = ParseTest();
            if (AcceptKeyword("as")) {
                item.target = ParseTarget();
                CheckAssignable(*item.target);
            }
            stmt.items.push_back(std::move(item));
        } while (AcceptOp(","));
        stmt.body = ParseBlock();
        return MakeStmt(location, std::move(stmt));
    }

    StmtPtr ParseDecorated() {
        std::vector<ExprPtr> decorators;
        while (AcceptOp("@")) {
            decorators.push_back(ParseNamedExpression());
            ExpectNewline();
        }
        if (CheckKeyword("def")) {
            return ParseFunctionDef(std::move(decorators));
        }
        if (CheckKeyword("class")) {
            return ParseClassDef(std::move(decorators));
        }
        Fail("expected function or class definition after decorator");
    }

    StmtPtr ParseFunctionDef(std::vector<ExprPtr> decorators) {
        const auto location = Next().location;
        FunctionDefStmt stmt{};
        stmt.decorators = std::move(decorators);
        stmt.name = ExpectName();
        ExpectOp("(");
        stmt.params = ParseParameters(")", true);
        ExpectOp(")");
        if (AcceptOp("->")) {
            stmt.returns = ParseTest();
        }
        stmt.body = ParseBlock();
        return MakeStmt(location, std::move(stmt));
    }

    StmtPtr ParseClassDef(std::vector<ExprPtr> decorators) {
        const auto location = Next().location;
        ClassDefStmt stmt{};
        stmt.decorators = std::move(decorators);
        stmt.name = ExpectName();
        if (AcceptOp("(")) {
            ParseArguments(stmt.bases, stmt.keywords);
            ExpectOp(")");
        }
        stmt.body = ParseBlock();
        return MakeStmt(location, std::move(stmt));
    }

    std::vector<Parameter> ParseParameters(const char* terminator, bool allow_annotations) {
        std::vector<Parameter> params;
        bool keyword_only = false;
        bool seen_default = false;
        while (!CheckOp(terminator)) {
            Parameter param{};
            param.location = Current().location;
            if (AcceptOp("/")) {
                // Positional-only marker carries no binding.
                if (!AcceptOp(",")) {
                    break;
                }
                continue;
            }
            if (AcceptOp("**")) {
                param.kind = ParamKind::kVarKeywords;
                param.name = ExpectName();
                if (allow_annotations && AcceptOp(":")) {
                    param.annotation = ParseTest();
                }
                params.push_back(std::move(param));
                AcceptOp(",");
                if (!CheckOp(terminator)) {
                    Fail("parameter after '**' parameter");
                }
                break;
            }
            if (AcceptOp("*")) {
                keyword_only = true;
                if (CheckOp(",") || CheckOp(terminator)) {
                    AcceptOp(",");
                    continue;
                }
                param.kind = ParamKind::kVarArgs;
                param.name = ExpectName();
                if (allow_annotations && AcceptOp(":")) {
                    param.annotation = ParseTest();
                }
            } else {
                param.kind = keyword_only ? ParamKind::kKeywordOnly : ParamKind::kPositional;
                param.name = ExpectName();
                if (allow_annotations && AcceptOp(":")) {
                    param.annotation = ParseTest();
                }
                if (AcceptOp("=")) {
                    param.default_value = ParseTest();
                    seen_default = true;
                } else if (seen_default && !keyword_only) {
                    Fail("non-default argument follows default argument");
                }
            }
            for (const auto& existing : params) {
                if (existing.name == param.name) {
                    Fail("duplicate argument '" + param.name + "' in function definition");
                }
            }
            params.push_back(std::move(param));
            if (!AcceptOp(",")) {
                break;
            }
        }
        return params;
    }

    // ---- expressions ----------------------------------------------------

    ExprPtr ParseStarExpressions() {
        const auto location = Current().location;
        auto first = ParseStarOrTest();
        if (!CheckOp(",")) {
            return first;
        }
        TupleExpr tuple{};
        tuple.elts.push_back(std::move(first));
        while (AcceptOp(",")) {
            if (!StartsExpression()) {
                break;
            }
            tuple.elts.push_back(ParseStarOrTest());
        }
        return MakeExpr(location, std::move(tuple));
    }

    ExprPtr ParseStarOrTest() {
        if (CheckOp("*")) {
            const auto location = Next().location;
            return MakeExpr(location, StarredExpr{ParseBitOr()});
        }
        return ParseNamedExpression();
    }

    ExprPtr ParseTarget() {
        if (CheckOp("*")) {
            const auto location = Next().location;
            return MakeExpr(location, StarredExpr{ParseBitOr()});
        }
        return ParseBitOr();
    }

    ExprPtr ParseTargetList() {
        const auto location = Current().location;
        auto first = ParseTarget();
        if (!CheckOp(",")) {
            return first;
        }
        TupleExpr tuple{};
        tuple.elts.push_back(std::move(first));
        while (AcceptOp(",")) {
            if (CheckKeyword("in") || CheckOp("=")) {
                break;
            }
            tuple.elts.push_back(ParseTarget());
        }
        return MakeExpr(location, std::move(tuple));
    }

    bool StartsExpression() const {
        const auto& token = Current();
        switch (token.type) {
            case TokenType::kName:
                return !IsKeyword(token.text) || token.text == "not" || token.text == "lambda" ||
                    token.text == "True" || token.text == "False" || token.text == "None";
            case TokenType::kNumber:
            case TokenType::kString:
                return true;
            case TokenType::kOp:
                return token.text == "(" || token.text == "[" || token.text == "{" ||
                    token.text == "-" || token.text == "+" || token.text == "~" ||
                    token.text == "*" || token.text == "...";
            default:
                return false;
        }
    }

    ExprPtr ParseNamedExpression() {
        const auto location = Current().location;
        if (Check(TokenType::kName) && PeekToken().IsOp(":=")) {
            auto target = MakeExpr(location, NameExpr{ExpectName()});
            Next();
            NamedExpr named{};
            named.target = std::move(target);
            named.value = ParseTest();
            return MakeExpr(location, std::move(named));
        }
        return ParseTest();
    }

    ExprPtr ParseTest() {
        if (CheckKeyword("lambda")) {
            return ParseLambda();
        }
        const auto location = Current().location;
        auto body = ParseOr();
        if (CheckKeyword("if")) {
            Next();
            IfExpr node{};
            node.body = std::move(body);
            node.test = ParseOr();
            ExpectKeyword("else");
            node.orelse = ParseTest();
            return MakeExpr(location, std::move(node));
        }
        return body;
    }

    ExprPtr ParseTestNoCond() {
        if (CheckKeyword("lambda")) {
            return ParseLambda();
        }
        return ParseOr();
    }

    ExprPtr ParseLambda() {
        const auto location = Next().location;
        LambdaExpr node{};
        node.params = ParseParameters(":", false);
        ExpectOp(":");
        node.body = ParseTest();
        return MakeExpr(location, std::move(node));
    }

    ExprPtr ParseOr() {
        const auto location = Current().location;
        auto first = ParseAnd();
        if (!CheckKeyword("or")) {
            return first;
        }
        BoolOpExpr node{};
        node.op = "or";
        node.values.push_back(std::move(first));
        while (AcceptKeyword("or")) {
            node.values.push_back(ParseAnd());
        }
        return MakeExpr(location, std::move(node));
    }

    ExprPtr ParseAnd() {
        const auto location = Current().location;
        auto first = ParseNot();
        if (!CheckKeyword("and")) {
            return first;
        }
        BoolOpExpr node{};
        node.op = "and";
        node.values.push_back(std::move(first));
        while (AcceptKeyword("and")) {
            node.values.push_back(ParseNot());
        }
        return MakeExpr(location, std::move(node));
    }

    ExprPtr ParseNot() {
        if (CheckKeyword("not")) {
            const auto location = Next().location;
            return MakeExpr(location, UnaryExpr{"not", ParseNot()});
        }
        return ParseComparison();
    }

    bool AcceptComparisonOp(std::string& op) {
        const auto& token = Current();
        if (token.type == TokenType::kOp) {
            static const char* kOps[] = {"<", ">", "==", ">=", "<=", "!="};
            for (const char* candidate : kOps) {
                if (token.text == candidate) {
                    op = candidate;
                    Next();
                    return true;
                }
            }
            return false;
        }
        if (token.IsKeyword("in")) {
            Next();
            op = "in";
            return true;
        }
        if (token.IsKeyword("not") && PeekToken().IsKeyword("in")) {
            Next();
            Next();
            op = "not in";
            return true;
        }
        if (token.IsKeyword("is")) {
            Next();
            op = AcceptKeyword("not") ? "is not" : "is";
            return true;
        }
        return false;
    }

    ExprPtr ParseComparison() {
        const auto location = Current().location;
        auto left = ParseBitOr();
        std::string op;
        if (!AcceptComparisonOp(op)) {
            return left;
        }
        CompareExpr node{};
        node.left = std::move(left);
        do {
            node.ops.push_back(op);
            node.comparators.push_back(ParseBitOr());
        } while (AcceptComparisonOp(op));
        return MakeExpr(location, std::move(node));
    }

    template <class Operand>
    ExprPtr ParseBinaryLevel(std::initializer_list<const char*> ops, Operand next) {
        const auto location = Current().location;
        auto left = next();
        while (true) {
            const char* matched = nullptr;
            for (const char* op : ops) {
                if (CheckOp(op)) {
                    matched = op;
                    break;
                }
            }
            if (matched == nullptr) {
                return left;
            }
            Next();
            BinaryExpr node{};
            node.op = matched;
            node.left = std::move(left);
            node.right = next();
            left = MakeExpr(location, std::move(node));
        }
    }

    ExprPtr ParseBitOr() {
        return ParseBinaryLevel({"|"}, [this] { return ParseBitXor(); });
    }
    ExprPtr ParseBitXor() {
        return ParseBinaryLevel({"^"}, [this] { return ParseBitAnd(); });
    }
    ExprPtr ParseBitAnd() {
        return ParseBinaryLevel({"&"}, [this] { return ParseShift(); });
    }
    ExprPtr ParseShift() {
        return ParseBinaryLevel({"<<", ">>"}, [this] { return ParseArith(); });
    }
    ExprPtr ParseArith() {
        return ParseBinaryLevel({"+", "-"}, [this] { return ParseTerm(); });
    }
    ExprPtr ParseTerm() {
        return ParseBinaryLevel({"*", "/", "//", "%", "@"}, [this] { return ParseFactor(); });
    }

    ExprPtr ParseFactor() {
        if (CheckOp("+") || CheckOp("-") || CheckOp("~")) {
            const auto& token = Next();
            const auto location = token.location;
            const auto op = token.text;
            return MakeExpr(location, UnaryExpr{op, ParseFactor()});
        }
        return ParsePower();
    }

    ExprPtr ParsePower() {
        const auto location = Current().location;
        auto base = ParsePrimary();
        if (AcceptOp("**")) {
            BinaryExpr node{};
            node.op = "**";
            node.left = std::move(base);
            node.right = ParseFactor();
            return MakeExpr(location, std::move(node));
        }
        return base;
    }

    ExprPtr ParsePrimary() {
        auto expr = ParseAtom();
        while (true) {
            const auto location = expr->location;
            if (AcceptOp("(")) {
                CallExpr call{};
                call.func = std::move(expr);
                ParseArguments(call.args, call.keywords);
                ExpectOp(")");
                expr = MakeExpr(location, std::move(call));
            } else if (AcceptOp("[")) {
                SubscriptExpr sub{};
                sub.value = std::move(expr);
                sub.index = ParseSubscriptList();
                ExpectOp("]");
                expr = MakeExpr(location, std::move(sub));
            } else if (AcceptOp(".")) {
                AttributeExpr attr{};
                attr.value = std::move(expr);
                attr.attr = ExpectName();
                expr = MakeExpr(location, std::move(attr));
            } else {
                return expr;
            }
        }
    }

    void ParseArguments(std::vector<ExprPtr>& args, std::vector<Keyword>& keywords) {
        while (!CheckOp(")")) {
            const auto location = Current().location;
            if (AcceptOp("**")) {
                Keyword keyword{};
                keyword.location = location;
                keyword.value = ParseTest();
                keywords.push_back(std::move(keyword));
            } else if (AcceptOp("*")) {
                args.push_back(MakeExpr(location, StarredExpr{ParseTest()}));
            } else if (Check(TokenType::kName) && PeekToken().IsOp("=")) {
                Keyword keyword{};
                keyword.location = location;
                keyword.name = ExpectName();
                Next();
                keyword.value = ParseTest();
                keywords.push_back(std::move(keyword));
            } else {
                auto value = ParseNamedExpression();
                if (CheckKeyword("for")) {
                    value = ParseComprehensionTail(location, ComprehensionKind::kGenerator, std::move(value), nullptr);
                }
                if (!keywords.empty()) {
                    Fail("positional argument follows keyword argument");
                }
                args.push_back(std::move(value));
            }
            if (!AcceptOp(",")) {
                break;
            }
        }
    }

    ExprPtr ParseSubscriptList() {
        const auto location = Current().location;
        auto first = ParseSubscript();
        if (!CheckOp(",")) {
            return first;
        }
        TupleExpr tuple{};
        tuple.elts.push_back(std::move(first));
        while (AcceptOp(",")) {
            if (CheckOp("]")) {
                break;
            }
            tuple.elts.push_back(ParseSubscript());
        }
        return MakeExpr(location, std::move(tuple));
    }

    ExprPtr ParseSubscript() {
        const auto location = Current().location;
        ExprPtr lower;
        if (!CheckOp(":")) {
            lower = ParseNamedExpression();
            if (!CheckOp(":")) {
                return lower;
            }
        }
        ExpectOp(":");
        SliceExpr slice{};
        slice.lower = std::move(lower);
        if (!CheckOp(":") && !CheckOp("]") && !CheckOp(",")) {
            slice.upper = ParseTest();
        }
        if (AcceptOp(":")) {
            if (!CheckOp("]") && !CheckOp(",")) {
                slice.step = ParseTest();
            }
        }
        return MakeExpr(location, std::move(slice));
    }

    ExprPtr ParseComprehensionTail(SourceLocation location,
                                   ComprehensionKind kind,
                                   ExprPtr element,
                                   ExprPtr value) {
        ComprehensionExpr node{};
        node.kind = kind;
        node.element = std::move(element);
        node.value = std::move(value);
        while (CheckKeyword("for")) {
            Next();
            Comprehension generator{};
            generator.target = ParseTargetList();
            CheckAssignable(*generator.target);
            ExpectKeyword("in");
            generator.iter = ParseOr();
            while (CheckKeyword("if")) {
                Next();
                generator.ifs.push_back(ParseTestNoCond());
            }
            node.generators.push_back(std::move(generator));
        }
        if (CheckKeyword("async")) {
            Fail("unsupported construct 'async'");
        }
        return MakeExpr(location, std::move(node));
    }

    ExprPtr ParseAtom() {
        const auto& token = Current();
        const auto location = token.location;
        switch (token.type) {
            case TokenType::kNumber: {
                const auto text = Next().text;
                ConstantExpr node{};
                node.text = text;
                const bool is_hex = text.size() > 1 && (text[1] == 'x' || text[1] == 'X');
                if (!text.empty() && (text.back() == 'j' || text.back() == 'J')) {
                    node.kind = ConstantKind::kImaginary;
                } else if (!is_hex && (text.find('.') != std::string::npos ||
                                       text.find('e') != std::string::npos ||
                                       text.find('E') != std::string::npos)) {
                    node.kind = ConstantKind::kFloat;
                } else {
                    node.kind = ConstantKind::kInt;
                }
                return MakeExpr(location, std::move(node));
            }
            case TokenType::kString:
                return ParseStrings();
            case TokenType::kName: {
                const auto& word = token.text;
                if (word == "True" || word == "False" || word == "None") {
                    ConstantExpr node{};
                    node.kind = word == "True" ? ConstantKind::kTrue
                        : word == "False"      ? ConstantKind::kFalse
                                               : ConstantKind::kNone;
                    node.text = word;
                    Next();
                    return MakeExpr(location, std::move(node));
                }
                if (word == "await" || word == "yield" || word == "async") {
                    Fail("unsupported construct '" + word + "'");
                }
                if (IsKeyword(word)) {
                    Fail("invalid syntax");
                }
                return MakeExpr(location, NameExpr{Next().text});
            }
            case TokenType::kOp:
                if (token.text == "(") {
                    return ParseParenthesized();
                }
                if (token.text == "[") {
                    return ParseListDisplay();
                }
                if (token.text == "{") {
                    return ParseBraceDisplay();
                }
                if (token.text == "...") {
                    Next();
                    ConstantExpr node{};
                    node.kind = ConstantKind::kEllipsis;
                    node.text = "...";
                    return MakeExpr(location, std::move(node));
                }
                break;
            default:
                break;
        }
        Fail("invalid syntax");
    }

    ExprPtr ParseStrings() {
        const auto location = Current().location;
        bool has_fstring = false;
        bool has_bytes = false;
        bool has_text = false;
        std::string concatenated;
        std::vector<ExprPtr> fields;
        while (Check(TokenType::kString)) {
            const auto& token = Next();
            const bool is_bytes = token.prefix.find('b') != std::string::npos;
            has_bytes = has_bytes || is_bytes;
            has_text = has_text || !is_bytes;
            if (token.prefix.find('f') != std::string::npos) {
                has_fstring = true;
                for (const auto& field : SplitFStringFields(token.text, token.location)) {
                    fields.push_back(ParseExpression(field, token.location));
                }
            }
            concatenated += token.text;
        }
        if (has_bytes && has_text) {
            throw SyntaxError("cannot mix bytes and nonbytes literals", location.line, location.column);
        }
        if (has_fstring) {
            return MakeExpr(location, FStringExpr{std::move(fields)});
        }
        ConstantExpr node{};
        node.kind = has_bytes ? ConstantKind::kBytes : ConstantKind::kString;
        node.text = std::move(concatenated);
        return MakeExpr(location, std::move(node));
    }

    ExprPtr ParseParenthesized() {
        const auto location = Next().location;
        if (AcceptOp(")")) {
            return MakeExpr(location, TupleExpr{});
        }
        if (CheckKeyword("yield")) {
            Fail("unsupported construct 'yield'");
        }
        auto first = ParseStarOrTest();
        if (CheckKeyword("for")) {
            auto comp = ParseComprehensionTail(location, ComprehensionKind::kGenerator, std::move(first), nullptr);
            ExpectOp(")");
            return comp;
        }
        if (AcceptOp(")")) {
            if (std::holds_alternative<StarredExpr>(first->node)) {
                Fail("cannot use starred expression here");
            }
            return first;
        }
        TupleExpr tuple{};
        tuple.elts.push_back(std::move(first));
        while (AcceptOp(",")) {
            if (CheckOp(")")) {
                break;
            }
            tuple.elts.push_back(ParseStarOrTest());
        }
        ExpectOp(")");
        return MakeExpr(location, std::move(tuple));
    }

    ExprPtr ParseListDisplay() {
        const auto location = Next().location;
        ListExpr list{};
        if (AcceptOp("]")) {
            return MakeExpr(location, std::move(list));
        }
        auto first = ParseStarOrTest();
        if (CheckKeyword("for")) {
            auto comp = ParseComprehensionTail(location, ComprehensionKind::kList, std::move(first), nullptr);
            ExpectOp("]");
            return comp;
        }
        list.elts.push_back(std::move(first));
        while (AcceptOp(",")) {
            if (CheckOp("]")) {
                break;
            }
            list.elts.push_back(ParseStarOrTest());
        }
        ExpectOp("]");
        return MakeExpr(location, std::move(list));
    }

    ExprPtr ParseBraceDisplay() {
        const auto location = Next().location;
        if (AcceptOp("}")) {
            return MakeExpr(location, DictExpr{});
        }
        if (CheckOp("**")) {
            return ParseDictRest(location, nullptr, nullptr);
        }
        auto first = ParseStarOrTest();
        if (AcceptOp(":")) {
            auto value = ParseTest();
            if (CheckKeyword("for")) {
                auto comp = ParseComprehensionTail(location, ComprehensionKind::kDict, std::move(first), std::move(value));
                ExpectOp("}");
                return comp;
            }
            return ParseDictRest(location, std::move(first), std::move(value));
        }
        if (CheckKeyword("for")) {
            auto comp = ParseComprehensionTail(location, ComprehensionKind::kSet, std::move(first), nullptr);
            ExpectOp("}");
            return comp;
        }
        SetExpr set{};
        set.elts.push_back(std::move(first));
        while (AcceptOp(",")) {
            if (CheckOp("}")) {
                break;
            }
            set.elts.push_back(ParseStarOrTest());
        }
        ExpectOp("}");
        return MakeExpr(location, std::move(set));
    }

    ExprPtr ParseDictRest(SourceLocation location, ExprPtr first_key, ExprPtr first_value) {
        DictExpr dict{};
        bool need_entry = true;
        if (first_value) {
            dict.keys.push_back(std::move(first_key));
            dict.values.push_back(std::move(first_value));
            need_entry = false;
        }
        while (true) {
            if (!need_entry) {
                if (!AcceptOp(",")) {
                    break;
                }
                if (CheckOp("}")) {
                    break;
                }
            }
            need_entry = false;
            if (AcceptOp("**")) {
                dict.keys.push_back(nullptr);
                dict.values.push_back(ParseBitOr());
                continue;
            }
            dict.keys.push_back(ParseTest());
            ExpectOp(":");
            dict.values.push_back(ParseTest());
        }
        ExpectOp("}");
        return MakeExpr(location, std::move(dict));
    }
};

}  // namespace

Module Parse(const std::string& source) {
    Parser parser(Tokenize(source));
    return parser.ParseModule();
}

ExprPtr ParseExpression(const std::string& source, SourceLocation origin) {
    try {
        Parser parser(Tokenize(source));
        return parser.ParseStandaloneExpression();
    } catch (const SyntaxError& error) {
        // Report against the enclosing literal rather than the field offset.
        throw SyntaxError(error.Detail(), origin.line, origin.column);
    }
}

}  // namespace sandforge::syntax
