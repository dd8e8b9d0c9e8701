#pragma once

#include "syntax/ast.hpp"

namespace sandforge::syntax {

// Depth-first traversal over every node of a module. Subclasses hook the
// Enter/Leave callbacks; returning false from an Enter callback skips the
// node's children (Leave is still called).
class TreeWalker {
public:
    virtual ~TreeWalker() = default;

    void Walk(const Module& module);
    void WalkBlock(const Block& block);
    void WalkStmt(const Stmt& stmt);
    void WalkExpr(const Expr& expr);

protected:
    virtual bool EnterStmt(const Stmt&) { return true; }
    virtual void LeaveStmt(const Stmt&) {}
    virtual bool EnterExpr(const Expr&) { return true; }
    virtual void LeaveExpr(const Expr&) {}

private:
    void WalkOptional(const ExprPtr& expr);
    void WalkAll(const std::vector<ExprPtr>& exprs);
    void WalkParameters(const std::vector<Parameter>& params);
    void WalkKeywords(const std::vector<Keyword>& keywords);
};

}  // namespace sandforge::syntax
