#pragma once

#include <memory>
#include <string>
#include <variant>
#include <vector>

#include "core/types.hpp"

namespace sandforge::syntax {

// Syntax tree for the supported Python subset. Every node kind is an explicit
// alternative of Expr::Node or Stmt::Node so visitors written as overload sets
// without a catch-all fail to compile when a kind is added.

struct Expr;
struct Stmt;
using ExprPtr = std::unique_ptr<Expr>;
using StmtPtr = std::unique_ptr<Stmt>;
using Block = std::vector<StmtPtr>;

enum class ConstantKind {
    kInt,
    kFloat,
    kImaginary,
    kString,
    kBytes,
    kTrue,
    kFalse,
    kNone,
    kEllipsis
};

enum class ParamKind {
    kPositional,
    kVarArgs,
    kKeywordOnly,
    kVarKeywords
};

struct Parameter {
    std::string name;
    ParamKind kind = ParamKind::kPositional;
    ExprPtr annotation;
    ExprPtr default_value;
    SourceLocation location;
};

struct Keyword {
    // Empty for "**mapping" arguments.
    std::string name;
    ExprPtr value;
    SourceLocation location;
};

struct Comprehension {
    ExprPtr target;
    ExprPtr iter;
    std::vector<ExprPtr> ifs;
};

enum class ComprehensionKind {
    kList,
    kSet,
    kDict,
    kGenerator
};

struct NameExpr {
    std::string id;
};

struct ConstantExpr {
    ConstantKind kind = ConstantKind::kNone;
    std::string text;
};

// Only the replacement fields are kept; literal text carries no behavior.
struct FStringExpr {
    std::vector<ExprPtr> values;
};

struct AttributeExpr {
    ExprPtr value;
    std::string attr;
};

struct CallExpr {
    ExprPtr func;
    std::vector<ExprPtr> args;
    std::vector<Keyword> keywords;
};

struct SubscriptExpr {
    ExprPtr value;
    ExprPtr index;
};

struct SliceExpr {
    ExprPtr lower;
    ExprPtr upper;
    ExprPtr step;
};

struct BinaryExpr {
    std::string op;
    ExprPtr left;
    ExprPtr right;
};

struct UnaryExpr {
    std::string op;
    ExprPtr operand;
};

struct BoolOpExpr {
    std::string op;
    std::vector<ExprPtr> values;
};

struct CompareExpr {
    ExprPtr left;
    std::vector<std::string> ops;
    std::vector<ExprPtr> comparators;
};

struct IfExpr {
    ExprPtr test;
    ExprPtr body;
    ExprPtr orelse;
};

struct LambdaExpr {
    std::vector<Parameter> params;
    ExprPtr body;
};

struct ListExpr {
    std::vector<ExprPtr> elts;
};

struct TupleExpr {
    std::vector<ExprPtr> elts;
};

struct SetExpr {
    std::vector<ExprPtr> elts;
};

struct DictExpr {
    // A null key marks a "**mapping" entry.
    std::vector<ExprPtr> keys;
    std::vector<ExprPtr> values;
};

struct ComprehensionExpr {
    ComprehensionKind kind = ComprehensionKind::kList;
    ExprPtr element;
    // Dict comprehensions only.
    ExprPtr value;
    std::vector<Comprehension> generators;
};

struct StarredExpr {
    ExprPtr value;
};

struct NamedExpr {
    ExprPtr target;
    ExprPtr value;
};

struct Expr {
    using Node = std::variant<
        NameExpr,
        ConstantExpr,
        FStringExpr,
        AttributeExpr,
        CallExpr,
        SubscriptExpr,
        SliceExpr,
        BinaryExpr,
        UnaryExpr,
        BoolOpExpr,
        CompareExpr,
        IfExpr,
        LambdaExpr,
        ListExpr,
        TupleExpr,
        SetExpr,
        DictExpr,
        ComprehensionExpr,
        StarredExpr,
        NamedExpr>;

    SourceLocation location;
    Node node;
};

struct ExprStmt {
    ExprPtr value;
};

struct AssignStmt {
    std::vector<ExprPtr> targets;
    ExprPtr value;
};

struct AugAssignStmt {
    ExprPtr target;
    std::string op;
    ExprPtr value;
};

struct AnnAssignStmt {
    ExprPtr target;
    ExprPtr annotation;
    ExprPtr value;
};

struct IfStmt {
    ExprPtr test;
    Block body;
    Block orelse;
};

struct ForStmt {
    ExprPtr target;
    ExprPtr iter;
    Block body;
    Block orelse;
};

struct WhileStmt {
    ExprPtr test;
    Block body;
    Block orelse;
};

struct BreakStmt {};
struct ContinueStmt {};
struct PassStmt {};

struct ReturnStmt {
    ExprPtr value;
};

struct FunctionDefStmt {
    std::string name;
    std::vector<Parameter> params;
    ExprPtr returns;
    std::vector<ExprPtr> decorators;
    Block body;
};

struct ClassDefStmt {
    std::string name;
    std::vector<ExprPtr> bases;
    std::vector<Keyword> keywords;
    std::vector<ExprPtr> decorators;
    Block body;
};

struct ImportAlias {
    std::string name;
    std::string asname;
    SourceLocation location;
};

struct ImportStmt {
    std::vector<ImportAlias> names;
};

struct ImportFromStmt {
    std::string module;
    // Number of leading dots.
    int level = 0;
    std::vector<ImportAlias> names;
};

struct ExceptHandler {
    ExprPtr type;
    std::string name;
    Block body;
    SourceLocation location;
};

struct TryStmt {
    Block body;
    std::vector<ExceptHandler> handlers;
    Block orelse;
    Block finalbody;
};

struct RaiseStmt {
    ExprPtr exc;
    ExprPtr cause;
};

struct WithItem {
    ExprPtr context;
    ExprPtr target;
};

struct WithStmt {
    std::vector<WithItem> items;
    Block body;
};

struct GlobalStmt {
    std::vector<std::string> names;
};

struct NonlocalStmt {
    std::vector<std::string> names;
};

struct DeleteStmt {
    std::vector<ExprPtr> targets;
};

struct AssertStmt {
    ExprPtr test;
    ExprPtr msg;
};

struct Stmt {
    using Node = std::variant<
        ExprStmt,
        AssignStmt,
        AugAssignStmt,
        AnnAssignStmt,
        IfStmt,
        ForStmt,
        WhileStmt,
        BreakStmt,
        ContinueStmt,
        PassStmt,
        ReturnStmt,
        FunctionDefStmt,
        ClassDefStmt,
        ImportStmt,
        ImportFromStmt,
        TryStmt,
        RaiseStmt,
        WithStmt,
        GlobalStmt,
        NonlocalStmt,
        DeleteStmt,
        AssertStmt>;

    SourceLocation location;
    Node node;
};

struct Module {
    Block body;
};

template <class... Ts>
struct Overloaded : Ts... {
    using Ts::operator()...;
};
template <class... Ts>
Overloaded(Ts...) -> Overloaded<Ts...>;

}  // namespace sandforge::syntax
