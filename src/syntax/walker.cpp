#include "syntax/walker.hpp"

namespace sandforge::syntax {

void TreeWalker::Walk(const Module& module) {
    WalkBlock(module.body);
}

void TreeWalker::WalkBlock(const Block& block) {
    for (const auto& stmt : block) {
        WalkStmt(*stmt);
    }
}

void TreeWalker::WalkOptional(const ExprPtr& expr) {
    if (expr) {
        WalkExpr(*expr);
    }
}

void TreeWalker::WalkAll(const std::vector<ExprPtr>& exprs) {
    for (const auto& expr : exprs) {
        WalkOptional(expr);
    }
}

void TreeWalker::WalkParameters(const std::vector<Parameter>& params) {
    for (const auto& param : params) {
        WalkOptional(param.annotation);
        WalkOptional(param.default_value);
    }
}

void TreeWalker::WalkKeywords(const std::vector<Keyword>& keywords) {
    for (const auto& keyword : keywords) {
        WalkOptional(keyword.value);
    }
}

void TreeWalker::WalkStmt(const Stmt& stmt) {
    if (EnterStmt(stmt)) {
        std::visit(Overloaded{
            [this](const ExprStmt& node) { WalkOptional(node.value); },
            [this](const AssignStmt& node) {
                WalkAll(node.targets);
                WalkOptional(node.value);
            },
            [this](const AugAssignStmt& node) {
                WalkOptional(node.target);
                WalkOptional(node.value);
            },
            [this](const AnnAssignStmt& node) {
                WalkOptional(node.target);
                WalkOptional(node.annotation);
                WalkOptional(node.value);
            },
            [this](const IfStmt& node) {
                WalkOptional(node.test);
                WalkBlock(node.body);
                WalkBlock(node.orelse);
            },
            [this](const ForStmt& node) {
                WalkOptional(node.target);
                WalkOptional(node.iter);
                WalkBlock(node.body);
                WalkBlock(node.orelse);
            },
            [this](const WhileStmt& node) {
                WalkOptional(node.test);
                WalkBlock(node.body);
                WalkBlock(node.orelse);
            },
            [](const BreakStmt&) {},
            [](const ContinueStmt&) {},
            [](const PassStmt&) {},
            [this](const ReturnStmt& node) { WalkOptional(node.value); },
            [this](const FunctionDefStmt& node) {
                WalkAll(node.decorators);
                WalkParameters(node.params);
                WalkOptional(node.returns);
                WalkBlock(node.body);
            },
            [this](const ClassDefStmt& node) {
                WalkAll(node.decorators);
                WalkAll(node.bases);
                WalkKeywords(node.keywords);
                WalkBlock(node.body);
            },
            [](const ImportStmt&) {},
            [](const ImportFromStmt&) {},
            [this](const TryStmt& node) {
                WalkBlock(node.body);
                for (const auto& handler : node.handlers) {
                    WalkOptional(handler.type);
                    WalkBlock(handler.body);
                }
                WalkBlock(node.orelse);
                WalkBlock(node.finalbody);
            },
            [this](const RaiseStmt& node) {
                WalkOptional(node.exc);
                WalkOptional(node.cause);
            },
            [this](const WithStmt& node) {
                for (const auto& item : node.items) {
                    WalkOptional(item.context);
                    WalkOptional(item.target);
                }
                WalkBlock(node.body);
            },
            [](const GlobalStmt&) {},
            [](const NonlocalStmt&) {},
            [this](const DeleteStmt& node) { WalkAll(node.targets); },
            [this](const AssertStmt& node) {
                WalkOptional(node.test);
                WalkOptional(node.msg);
            }},
            stmt.node);
    }
    LeaveStmt(stmt);
}

void TreeWalker::WalkExpr(const Expr& expr) {
    if (EnterExpr(expr)) {
        std::visit(Overloaded{
            [](const NameExpr&) {},
            [](const ConstantExpr&) {},
            [this](const FStringExpr& node) { WalkAll(node.values); },
            [this](const AttributeExpr& node) { WalkOptional(node.value); },
            [this](const CallExpr& node) {
                WalkOptional(node.func);
                WalkAll(node.args);
                WalkKeywords(node.keywords);
            },
            [this](const SubscriptExpr& node) {
                WalkOptional(node.value);
                WalkOptional(node.index);
            },
            [this](const SliceExpr& node) {
                WalkOptional(node.lower);
                WalkOptional(node.upper);
                WalkOptional(node.step);
            },
            [this](const BinaryExpr& node) {
                WalkOptional(node.left);
                WalkOptional(node.right);
            },
            [this](const UnaryExpr& node) { WalkOptional(node.operand); },
            [this](const BoolOpExpr& node) { WalkAll(node.values); },
            [this](const CompareExpr& node) {
                WalkOptional(node.left);
                WalkAll(node.comparators);
            },
            [this](const IfExpr& node) {
                WalkOptional(node.test);
                WalkOptional(node.body);
                WalkOptional(node.orelse);
            },
            [this](const LambdaExpr& node) {
                WalkParameters(node.params);
                WalkOptional(node.body);
            },
            [this](const ListExpr& node) { WalkAll(node.elts); },
            [this](const TupleExpr& node) { WalkAll(node.elts); },
            [this](const SetExpr& node) { WalkAll(node.elts); },
            [this](const DictExpr& node) {
                WalkAll(node.keys);
                WalkAll(node.values);
            },
            [this](const ComprehensionExpr& node) {
                for (const auto& generator : node.generators) {
                    WalkOptional(generator.target);
                    WalkOptional(generator.iter);
                    WalkAll(generator.ifs);
                }
                WalkOptional(node.element);
                WalkOptional(node.value);
            },
            [this](const StarredExpr& node) { WalkOptional(node.value); },
            [this](const NamedExpr& node) {
                WalkOptional(node.target);
                WalkOptional(node.value);
            }},
            expr.node);
    }
    LeaveExpr(expr);
}

}  // namespace sandforge::syntax
