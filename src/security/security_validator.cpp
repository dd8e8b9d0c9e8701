#include "security/security_validator.hpp"

#include <algorithm>
#include <tuple>
#include <unordered_set>
#include <utility>
#include <vector>

#include "core/errors.hpp"
#include "syntax/parser.hpp"
#include "syntax/walker.hpp"

namespace sandforge::security {
namespace {

using namespace sandforge::syntax;

bool IsDunder(const std::string& name) {
    return name.size() > 4 && name.rfind("__", 0) == 0 &&
        name.compare(name.size() - 2, 2, "__") == 0;
}

int HexValue(char c) {
    if (c >= '0' && c <= '9') return c - '0';
    if (c >= 'a' && c <= 'f') return c - 'a' + 10;
    if (c >= 'A' && c <= 'F') return c - 'A' + 10;
    return -1;
}

// Resolves backslash escapes that can spell an identifier, so '\x5f\x5fimport\x5f\x5f'
// compares equal to '__import__'. Code points outside ASCII are left escaped.
std::string DecodeEscapes(const std::string& text) {
    std::string out;
    for (std::size_t i = 0; i < text.size(); ++i) {
        if (text[i] != '\\' || i + 1 >= text.size()) {
            out.push_back(text[i]);
            continue;
        }
        const char kind = text[i + 1];
        std::size_t digits = 0;
        int base = 16;
        if (kind == 'x') {
            digits = 2;
        } else if (kind == 'u') {
            digits = 4;
        } else if (kind == 'U') {
            digits = 8;
        } else if (kind >= '0' && kind <= '7') {
            base = 8;
        } else {
            out.push_back(text[i]);
            continue;
        }
        std::size_t start = base == 8 ? i + 1 : i + 2;
        std::size_t end = start;
        long value = 0;
        while (end < text.size() && (base == 8 ? end - start < 3 : end - start < digits)) {
            const int digit = HexValue(text[end]);
            if (digit < 0 || digit >= base) {
                break;
            }
            value = value * base + digit;
            ++end;
        }
        if (end == start || value > 0x7f) {
            out.push_back(text[i]);
            continue;
        }
        out.push_back(static_cast<char>(value));
        i = end - 1;
    }
    return out;
}

const std::string* StringConstant(const Expr& expr) {
    const auto* constant = std::get_if<ConstantExpr>(&expr.node);
    if (constant == nullptr || constant->kind != ConstantKind::kString) {
        return nullptr;
    }
    return &constant->text;
}

// Leftmost name of an attribute chain such as "a.b.c", or empty when the
// chain starts at something other than a plain name.
std::string ChainRoot(const Expr& expr) {
    const Expr* current = &expr;
    while (const auto* attr = std::get_if<AttributeExpr>(&current->node)) {
        current = attr->value.get();
    }
    if (const auto* name = std::get_if<NameExpr>(&current->node)) {
        return name->id;
    }
    return "";
}

class SecurityWalker : public TreeWalker {
public:
    explicit SecurityWalker(const SecurityPolicy& policy) : policy_(policy) {}

    std::vector<Violation> TakeViolations() { return std::move(violations_); }

protected:
    bool EnterStmt(const Stmt& stmt) override {
        std::visit(Overloaded{
            [this](const ImportStmt& node) {
                for (const auto& alias : node.names) {
                    CheckModule(alias.name, alias.location);
                }
            },
            [this, &stmt](const ImportFromStmt& node) {
                if (node.level > 0) {
                    Report("relative-import", stmt.location, Severity::kError,
                           "relative import target cannot be resolved statically");
                }
                if (!node.module.empty()) {
                    CheckModule(node.module, stmt.location);
                }
                for (const auto& alias : node.names) {
                    if (alias.name == "*") {
                        Report("wildcard-import", alias.location, Severity::kError,
                               "wildcard import from '" + node.module + "' binds unknown names");
                    } else if (!node.module.empty()) {
                        CheckModule(node.module + "." + alias.name, alias.location, true);
                    }
                }
            },
            [](const ExprStmt&) {},
            [](const AssignStmt&) {},
            [](const AugAssignStmt&) {},
            [](const AnnAssignStmt&) {},
            [](const IfStmt&) {},
            [](const ForStmt&) {},
            [](const WhileStmt&) {},
            [](const BreakStmt&) {},
            [](const ContinueStmt&) {},
            [](const PassStmt&) {},
            [](const ReturnStmt&) {},
            [](const FunctionDefStmt&) {},
            [](const ClassDefStmt&) {},
            [](const TryStmt&) {},
            [](const RaiseStmt&) {},
            [](const WithStmt&) {},
            [](const GlobalStmt&) {},
            [](const NonlocalStmt&) {},
            [](const DeleteStmt&) {},
            [](const AssertStmt&) {}},
            stmt.node);
        return true;
    }

    bool EnterExpr(const Expr& expr) override {
        std::visit(Overloaded{
            [this, &expr](const NameExpr& node) { CheckName(node, expr.location, callees_.count(&expr) > 0); },
            [this, &expr](const AttributeExpr& node) { CheckAttribute(node, expr.location); },
            [this, &expr](const CallExpr& node) { CheckCall(node, expr.location); },
            [this, &expr](const ConstantExpr& node) { CheckFormatFields(node, expr.location); },
            [](const FStringExpr&) {},
            [this](const SubscriptExpr& node) { CheckStringKey(*node.index); },
            [](const SliceExpr&) {},
            [](const BinaryExpr&) {},
            [](const UnaryExpr&) {},
            [](const BoolOpExpr&) {},
            [](const CompareExpr&) {},
            [](const IfExpr&) {},
            [](const LambdaExpr&) {},
            [](const ListExpr&) {},
            [](const TupleExpr&) {},
            [](const SetExpr&) {},
            [](const DictExpr&) {},
            [](const ComprehensionExpr&) {},
            [](const StarredExpr&) {},
            [](const NamedExpr&) {}},
            expr.node);
        return true;
    }

private:
    const SecurityPolicy& policy_;
    std::vector<Violation> violations_;
    // Name nodes already judged as call targets.
    std::unordered_set<const Expr*> callees_;

    void Report(const char* rule, SourceLocation location, Severity severity, std::string message) {
        violations_.push_back(Violation{rule, location, severity, std::move(message)});
    }

    bool IsForbiddenAttribute(const std::string& attr) const {
        if (IsDunder(attr)) {
            return policy_.allowed_dunders.count(attr) == 0;
        }
        if (policy_.forbidden_attributes.count(attr) > 0) {
            return true;
        }
        return std::any_of(policy_.forbidden_attribute_prefixes.begin(), policy_.forbidden_attribute_prefixes.end(),
                           [&attr](const std::string& prefix) { return attr.rfind(prefix, 0) == 0; });
    }

    // A string used as a lookup key or call argument reaches the same
    // objects as the identifier it spells: builtins['__import__'],
    // operator.attrgetter('gi_frame').
    void CheckStringKey(const Expr& expr) {
        const auto* text = StringConstant(expr);
        if (text == nullptr) {
            return;
        }
        const auto value = DecodeEscapes(*text);
        if (IsForbiddenAttribute(value) || policy_.forbidden_calls.count(value) > 0 ||
            policy_.forbidden_names.count(value) > 0) {
            Report("forbidden-string", expr.location, Severity::kCritical,
                   "string '" + value + "' names a forbidden builtin or attribute");
        }
    }

    // str.format fields may walk attributes: '{0.__class__}'.format(x).
    void CheckFormatFields(const ConstantExpr& node, SourceLocation location) {
        if (node.kind != ConstantKind::kString) {
            return;
        }
        const auto text = DecodeEscapes(node.text);
        std::size_t pos = 0;
        while ((pos = text.find('{', pos)) != std::string::npos) {
            if (pos + 1 < text.size() && text[pos + 1] == '{') {
                pos += 2;
                continue;
            }
            const auto close = text.find_first_of("}!:", pos + 1);
            const auto field = text.substr(pos + 1, close == std::string::npos ? std::string::npos : close - pos - 1);
            std::size_t dot = 0;
            while ((dot = field.find('.', dot)) != std::string::npos) {
                const auto end = field.find_first_of(".[", dot + 1);
                const auto attr = field.substr(dot + 1, end == std::string::npos ? std::string::npos : end - dot - 1);
                if (IsForbiddenAttribute(attr)) {
                    Report("forbidden-attribute", location, Severity::kCritical,
                           "format field reaches attribute '" + attr + "'");
                    return;
                }
                dot += 1;
            }
            pos += 1;
        }
    }

    // "from pkg import mod" may name a submodule, so the joined path is
    // checked too; only an exact or prefix deny-list hit counts there.
    void CheckModule(const std::string& module, SourceLocation location, bool joined = false) {
        if (policy_.forbid_private_modules && module.size() > 1 && module[0] == '_' &&
            module.rfind("__future__", 0) != 0) {
            Report("forbidden-import", location, Severity::kCritical,
                   "import of private module '" + module + "'");
            return;
        }
        std::string prefix;
        std::size_t start = 0;
        while (true) {
            const auto dot = module.find('.', start);
            prefix = module.substr(0, dot);
            if (policy_.forbidden_modules.count(prefix) > 0) {
                if (!joined || prefix == module) {
                    Report("forbidden-import", location, Severity::kCritical,
                           "import of forbidden module '" + module + "'");
                }
                return;
            }
            if (dot == std::string::npos) {
                return;
            }
            start = dot + 1;
        }
    }

    void CheckName(const NameExpr& node, SourceLocation location, bool is_callee) {
        if (policy_.forbidden_names.count(node.id) > 0) {
            Report("forbidden-name", location, Severity::kCritical,
                   "reference to interpreter internals '" + node.id + "'");
            return;
        }
        if (!is_callee && policy_.forbidden_calls.count(node.id) > 0) {
            Report("forbidden-name", location, Severity::kCritical,
                   "forbidden builtin '" + node.id + "' referenced as a value");
        }
    }

    void CheckAttribute(const AttributeExpr& node, SourceLocation location) {
        if (!IsForbiddenAttribute(node.attr)) {
            return;
        }
        if (IsDunder(node.attr)) {
            Report("forbidden-attribute", location, Severity::kError,
                   "access to dunder attribute '" + node.attr + "'");
        } else {
            Report("forbidden-attribute", location, Severity::kCritical,
                   "access to interpreter frame attribute '" + node.attr + "'");
        }
    }

    void CheckCall(const CallExpr& node, SourceLocation location) {
        for (const auto& arg : node.args) {
            CheckStringKey(*arg);
        }
        for (const auto& keyword : node.keywords) {
            CheckStringKey(*keyword.value);
        }
        const Expr& func = *node.func;
        if (const auto* name = std::get_if<NameExpr>(&func.node)) {
            callees_.insert(&func);
            if (policy_.forbidden_calls.count(name->id) > 0) {
                Report("forbidden-call", location, Severity::kCritical,
                       "call to forbidden builtin '" + name->id + "'");
            }
            return;
        }
        if (const auto* attr = std::get_if<AttributeExpr>(&func.node)) {
            if (policy_.forbidden_methods.count(attr->attr) > 0) {
                Report("forbidden-call", location, Severity::kCritical,
                       "call to forbidden method '" + attr->attr + "'");
                return;
            }
            const auto root = ChainRoot(func);
            if ((root == "builtins" || root == "__builtins__") &&
                policy_.forbidden_calls.count(attr->attr) > 0) {
                Report("forbidden-call", location, Severity::kCritical,
                       "call to forbidden builtin '" + attr->attr + "'");
            }
            return;
        }
        Report("unresolvable-call", location, Severity::kError,
               "call target cannot be resolved statically");
    }
};

SecurityVerdict BuildVerdict(std::vector<Violation> violations, bool syntax_valid) {
    std::stable_sort(violations.begin(), violations.end(), [](const Violation& a, const Violation& b) {
        return std::tie(a.location.line, a.location.column, a.rule_id) <
            std::tie(b.location.line, b.location.column, b.rule_id);
    });
    SecurityVerdict verdict{};
    verdict.syntax_valid = syntax_valid;
    verdict.allowed = syntax_valid && std::none_of(violations.begin(), violations.end(), [](const Violation& v) {
        return v.severity != Severity::kWarning;
    });
    verdict.violations = std::move(violations);
    return verdict;
}

}  // namespace

SecurityValidator::SecurityValidator(SecurityPolicy policy) : policy_(std::move(policy)) {}

SecurityVerdict SecurityValidator::Validate(const CodeCandidate& candidate) const {
    if (candidate.language != policy_.language) {
        return BuildVerdict({Violation{"unsupported-language", {0, 0}, Severity::kCritical,
                                       "language '" + candidate.language + "' is not supported, expected '" +
                                           policy_.language + "'"}},
                            false);
    }
    syntax::Module module;
    try {
        module = syntax::Parse(candidate.source);
    } catch (const SyntaxError& error) {
        return BuildVerdict({Violation{"syntax-error", {error.Line(), error.Column()}, Severity::kError,
                                       error.Detail()}},
                            false);
    }
    return Validate(module);
}

SecurityVerdict SecurityValidator::Validate(const syntax::Module& module) const {
    SecurityWalker walker(policy_);
    walker.Walk(module);
    return BuildVerdict(walker.TakeViolations(), true);
}

std::string Describe(const Violation& violation) {
    return violation.rule_id + " at " + ToString(violation.location) + ": " + violation.message;
}

}  // namespace sandforge::security
