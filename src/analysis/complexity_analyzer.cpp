#include "analysis/complexity_analyzer.hpp"

#include <algorithm>
#include <map>
#include <set>
#include <tuple>
#include <unordered_set>
#include <vector>

#include "syntax/parser.hpp"
#include "syntax/walker.hpp"

namespace sandforge::analysis {
namespace {

using namespace sandforge::syntax;

struct LineCounts {
    int total = 0;
    int code = 0;
    int comment = 0;
    int blank = 0;
};

LineCounts CountLines(const std::string& source) {
    LineCounts counts{};
    std::size_t start = 0;
    while (start < source.size()) {
        auto end = source.find('\n', start);
        if (end == std::string::npos) {
            end = source.size();
        }
        const auto line = source.substr(start, end - start);
        const auto first = line.find_first_not_of(" \t\r\f\v");
        ++counts.total;
        if (first == std::string::npos) {
            ++counts.blank;
        } else if (line[first] == '#') {
            ++counts.comment;
        } else {
            ++counts.code;
        }
        start = end + 1;
    }
    return counts;
}

bool IsStringValue(const Expr& expr) {
    if (std::holds_alternative<FStringExpr>(expr.node)) {
        return true;
    }
    if (const auto* constant = std::get_if<ConstantExpr>(&expr.node)) {
        return constant->kind == ConstantKind::kString;
    }
    return false;
}

const NameExpr* AsName(const ExprPtr& expr) {
    return expr ? std::get_if<NameExpr>(&expr->node) : nullptr;
}

// Matches a call of the form name(<one argument>) and returns the argument.
const Expr* SingleArgCall(const Expr& expr, const char* name) {
    const auto* call = std::get_if<CallExpr>(&expr.node);
    if (!call || call->args.size() != 1 || !call->keywords.empty()) {
        return nullptr;
    }
    const auto* func = AsName(call->func);
    if (!func || func->id != name) {
        return nullptr;
    }
    return call->args[0].get();
}

class MetricsWalker : public TreeWalker {
public:
    explicit MetricsWalker(const ComplexityThresholds& thresholds) : thresholds_(thresholds) {}

    int statements = 0;
    int branches = 0;
    int loops = 0;
    int functions = 0;
    int classes = 0;
    int lambdas = 0;
    int comprehensions = 0;
    int calls = 0;
    int returns = 0;
    int tries = 0;
    int boolean_operators = 0;
    int cyclomatic = 1;
    int subscripts = 0;
    int max_depth = 0;
    int max_function_length = 0;
    int max_parameters = 0;
    std::set<std::string> names;
    std::vector<OptimizationSuggestion> suggestions;

    void Finish() {
        for (const auto& [name, location] : bindings_) {
            if (loads_[name] > 0 || ignored_.count(name) > 0 || name == "result" || name.rfind('_', 0) == 0) {
                continue;
            }
            Suggest("unused-binding", location, "'" + name + "' is assigned but never used");
        }
        std::stable_sort(suggestions.begin(), suggestions.end(),
                         [](const OptimizationSuggestion& a, const OptimizationSuggestion& b) {
                             return std::tie(a.location.line, a.location.column, a.type) <
                                 std::tie(b.location.line, b.location.column, b.type);
                         });
    }

protected:
    bool EnterStmt(const Stmt& stmt) override {
        ++statements;
        Touch(stmt.location.line);
        bool nests = false;
        bool is_loop = false;
        std::visit(Overloaded{
            [&](const ExprStmt&) {},
            [&](const AssignStmt& node) {
                for (const auto& target : node.targets) {
                    CollectStores(*target);
                }
                if (node.targets.size() == 1 && node.value) {
                    const auto* target = AsName(node.targets[0]);
                    if (target && IsStringValue(*node.value)) {
                        string_names_.insert(target->id);
                    }
                    if (target && loop_depth_ > 0) {
                        CheckSelfConcat(*target, *node.value, stmt.location);
                    }
                }
            },
            [&](const AugAssignStmt& node) {
                CollectStores(*node.target);
                const auto* target = AsName(node.target);
                if (target && node.op == "+" && loop_depth_ > 0 &&
                    (string_names_.count(target->id) > 0 || IsStringValue(*node.value))) {
                    Suggest("string-concat-in-loop", stmt.location,
                            "repeated string concatenation onto '" + target->id +
                                "' inside a loop is quadratic; collect parts and join them");
                }
            },
            [&](const AnnAssignStmt& node) {
                if (node.value) {
                    CollectStores(*node.target);
                }
            },
            [&](const IfStmt& node) {
                ++branches;
                ++cyclomatic;
                nests = elif_nodes_.count(&stmt) == 0;
                if (node.orelse.size() == 1 && std::holds_alternative<IfStmt>(node.orelse[0]->node)) {
                    elif_nodes_.insert(node.orelse[0].get());
                }
            },
            [&](const ForStmt& node) {
                ++loops;
                ++cyclomatic;
                nests = true;
                is_loop = true;
                CollectStores(*node.target);
                if (const auto* length = SingleArgCall(*node.iter, "range")) {
                    if (SingleArgCall(*length, "len")) {
                        Suggest("range-len-loop", stmt.location,
                                "iterate directly or use enumerate() instead of range(len(...))");
                    }
                }
            },
            [&](const WhileStmt&) {
                ++loops;
                ++cyclomatic;
                nests = true;
                is_loop = true;
            },
            [&](const BreakStmt&) {},
            [&](const ContinueStmt&) {},
            [&](const PassStmt&) {},
            [&](const ReturnStmt&) { ++returns; },
            [&](const FunctionDefStmt& node) {
                ++functions;
                nests = true;
                max_parameters = std::max(max_parameters, static_cast<int>(node.params.size()));
                frames_.push_back(FunctionFrame{&stmt, node.name, stmt.location.line, stmt.location.line});
            },
            [&](const ClassDefStmt&) {
                ++classes;
                nests = true;
            },
            [&](const ImportStmt& node) {
                for (const auto& alias : node.names) {
                    const auto bound = alias.asname.empty() ? alias.name.substr(0, alias.name.find('.'))
                                                            : alias.asname;
                    Bind(bound, alias.location);
                }
            },
            [&](const ImportFromStmt& node) {
                for (const auto& alias : node.names) {
                    if (alias.name != "*") {
                        Bind(alias.asname.empty() ? alias.name : alias.asname, alias.location);
                    }
                }
            },
            [&](const TryStmt& node) {
                ++tries;
                nests = true;
                cyclomatic += static_cast<int>(node.handlers.size());
                for (const auto& handler : node.handlers) {
                    if (!handler.type) {
                        Suggest("bare-except", handler.location,
                                "bare 'except:' also catches SystemExit and KeyboardInterrupt; name the exception");
                    }
                }
            },
            [&](const RaiseStmt&) {},
            [&](const WithStmt& node) {
                nests = true;
                for (const auto& item : node.items) {
                    if (item.target) {
                        CollectStores(*item.target);
                    }
                }
            },
            [&](const GlobalStmt& node) { ignored_.insert(node.names.begin(), node.names.end()); },
            [&](const NonlocalStmt& node) { ignored_.insert(node.names.begin(), node.names.end()); },
            [&](const DeleteStmt&) {},
            [&](const AssertStmt&) { ++cyclomatic; }},
            stmt.node);

        if (is_loop) {
            if (loop_depth_ > 0) {
                Suggest("nested-loop", stmt.location,
                        "nested loop; consider a lookup table or a single pass if the data allows");
            }
            ++loop_depth_;
        }
        if (nests) {
            ++depth_;
            max_depth = std::max(max_depth, depth_);
            if (depth_ == thresholds_.deep_nesting + 1) {
                Suggest("deep-nesting", stmt.location,
                        "nesting deeper than " + std::to_string(thresholds_.deep_nesting) +
                            " levels; extract a function or return early");
            }
        }
        scope_stack_.push_back({nests, is_loop});
        return true;
    }

    void LeaveStmt(const Stmt& stmt) override {
        const auto [nests, is_loop] = scope_stack_.back();
        scope_stack_.pop_back();
        if (nests) {
            --depth_;
        }
        if (is_loop) {
            --loop_depth_;
        }
        if (!frames_.empty() && frames_.back().stmt == &stmt) {
            const auto frame = frames_.back();
            frames_.pop_back();
            const int length = frame.max_line - frame.start_line + 1;
            max_function_length = std::max(max_function_length, length);
            if (length > thresholds_.long_function_lines) {
                Suggest("long-function", stmt.location,
                        "function '" + frame.name + "' spans " + std::to_string(length) +
                            " lines; split it into smaller functions");
            }
            if (!frames_.empty()) {
                frames_.back().max_line = std::max(frames_.back().max_line, frame.max_line);
            }
        }
    }

    bool EnterExpr(const Expr& expr) override {
        Touch(expr.location.line);
        std::visit(Overloaded{
            [&](const NameExpr& node) {
                names.insert(node.id);
                if (store_nodes_.count(&expr) == 0) {
                    ++loads_[node.id];
                }
            },
            [&](const ConstantExpr&) {},
            [&](const FStringExpr&) {},
            [&](const AttributeExpr&) {},
            [&](const CallExpr&) { ++calls; },
            [&](const SubscriptExpr&) { ++subscripts; },
            [&](const SliceExpr&) {},
            [&](const BinaryExpr&) {},
            [&](const UnaryExpr&) {},
            [&](const BoolOpExpr& node) {
                const auto extra = static_cast<int>(node.values.size()) - 1;
                boolean_operators += extra;
                cyclomatic += extra;
            },
            [&](const CompareExpr&) {},
            [&](const IfExpr&) {
                ++branches;
                ++cyclomatic;
            },
            [&](const LambdaExpr& node) {
                ++lambdas;
                max_parameters = std::max(max_parameters, static_cast<int>(node.params.size()));
            },
            [&](const ListExpr&) {},
            [&](const TupleExpr&) {},
            [&](const SetExpr&) {},
            [&](const DictExpr&) {},
            [&](const ComprehensionExpr& node) {
                ++comprehensions;
                for (const auto& generator : node.generators) {
                    ++cyclomatic;
                    cyclomatic += static_cast<int>(generator.ifs.size());
                    CollectStores(*generator.target);
                }
                if (node.generators.size() > 1) {
                    Suggest("nested-loop", expr.location,
                            "comprehension with nested loops; consider a lookup table or a single pass");
                }
            },
            [&](const StarredExpr&) {},
            [&](const NamedExpr& node) { CollectStores(*node.target); }},
            expr.node);
        return true;
    }

private:
    struct FunctionFrame {
        const Stmt* stmt;
        std::string name;
        int start_line;
        int max_line;
    };

    const ComplexityThresholds& thresholds_;
    int depth_ = 0;
    int loop_depth_ = 0;
    std::vector<std::pair<bool, bool>> scope_stack_;
    std::vector<FunctionFrame> frames_;
    std::unordered_set<const Stmt*> elif_nodes_;
    std::unordered_set<const Expr*> store_nodes_;
    std::set<std::string> string_names_;
    std::set<std::string> ignored_;
    std::map<std::string, SourceLocation> bindings_;
    std::map<std::string, int> loads_;

    void Touch(int line) {
        if (!frames_.empty()) {
            frames_.back().max_line = std::max(frames_.back().max_line, line);
        }
    }

    void Suggest(const char* type, SourceLocation location, std::string message) {
        suggestions.push_back(OptimizationSuggestion{type, location, std::move(message)});
    }

    void Bind(const std::string& name, SourceLocation location) {
        bindings_.emplace(name, location);
    }

    void CollectStores(const Expr& target) {
        std::visit(Overloaded{
            [&](const NameExpr& node) {
                store_nodes_.insert(&target);
                Bind(node.id, target.location);
            },
            [&](const TupleExpr& node) {
                for (const auto& elt : node.elts) {
                    CollectStores(*elt);
                }
            },
            [&](const ListExpr& node) {
                for (const auto& elt : node.elts) {
                    CollectStores(*elt);
                }
            },
            [&](const StarredExpr& node) { CollectStores(*node.value); },
            // Attribute and subscript targets write into existing objects.
            [](const auto&) {}},
            target.node);
    }

    void CheckSelfConcat(const NameExpr& target, const Expr& value, SourceLocation location) {
        const auto* binary = std::get_if<BinaryExpr>(&value.node);
        if (!binary || binary->op != "+") {
            return;
        }
        const auto* left = AsName(binary->left);
        if (!left || left->id != target.id) {
            return;
        }
        if (string_names_.count(target.id) > 0 || IsStringValue(*binary->right)) {
            Suggest("string-concat-in-loop", location,
                    "repeated string concatenation onto '" + target.id +
                        "' inside a loop is quadratic; collect parts and join them");
        }
    }
};

}  // namespace

ComplexityRating RateScore(double score, const ComplexityThresholds& thresholds) {
    if (score <= thresholds.low_max) {
        return ComplexityRating::kLow;
    }
    if (score <= thresholds.medium_max) {
        return ComplexityRating::kMedium;
    }
    return ComplexityRating::kHigh;
}

ComplexityAnalyzer::ComplexityAnalyzer(ComplexityThresholds thresholds) : thresholds_(thresholds) {}

ComplexityReport ComplexityAnalyzer::Analyze(const std::string& source) const {
    const auto module = syntax::Parse(source);
    return Analyze(source, module);
}

ComplexityReport ComplexityAnalyzer::Analyze(const std::string& source, const syntax::Module& module) const {
    MetricsWalker walker(thresholds_);
    walker.Walk(module);
    walker.Finish();
    const auto lines = CountLines(source);

    ComplexityReport report{};
    auto& m = report.metrics;
    m["line_count"] = lines.total;
    m["code_line_count"] = lines.code;
    m["comment_line_count"] = lines.comment;
    m["blank_line_count"] = lines.blank;
    m["statement_count"] = walker.statements;
    m["branch_count"] = walker.branches;
    m["loop_count"] = walker.loops;
    m["max_nesting_depth"] = walker.max_depth;
    m["function_count"] = walker.functions;
    m["class_count"] = walker.classes;
    m["lambda_count"] = walker.lambdas;
    m["comprehension_count"] = walker.comprehensions;
    m["call_count"] = walker.calls;
    m["return_count"] = walker.returns;
    m["try_count"] = walker.tries;
    m["boolean_operator_count"] = walker.boolean_operators;
    m["cyclomatic_complexity"] = walker.cyclomatic;
    m["max_function_length"] = walker.max_function_length;
    m["max_parameter_count"] = walker.max_parameters;
    m["distinct_name_count"] = static_cast<double>(walker.names.size());
    m["subscript_count"] = walker.subscripts;

    report.score = walker.cyclomatic + 2.0 * std::max(0, walker.max_depth - 1) + walker.functions +
        walker.classes + walker.loops + walker.statements / 10.0;
    report.rating = RateScore(report.score, thresholds_);
    report.suggestions = std::move(walker.suggestions);
    return report;
}

}  // namespace sandforge::analysis
