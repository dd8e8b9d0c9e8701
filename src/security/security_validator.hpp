#pragma once

#include <string>

#include "core/types.hpp"
#include "security/security_policy.hpp"
#include "syntax/ast.hpp"

namespace sandforge::security {

// Static gate in front of the sandbox. Parses the candidate and collects every
// deny-list violation; never executes anything.
class SecurityValidator {
public:
    explicit SecurityValidator(SecurityPolicy policy = DefaultSecurityPolicy());

    SecurityVerdict Validate(const CodeCandidate& candidate) const;
    // Checks an already parsed module.
    SecurityVerdict Validate(const syntax::Module& module) const;

    const SecurityPolicy& Policy() const { return policy_; }

private:
    SecurityPolicy policy_;
};

// Human readable one-line rendering of a violation, "rule at line:col: message".
std::string Describe(const Violation& violation);

}  // namespace sandforge::security
