#pragma once

#include <set>
#include <string>

namespace sandforge::security {

// Deny-lists enforced by the validator. Loaded from the "security" config
// section; anything left empty there falls back to the defaults below.
struct SecurityPolicy {
    std::string language = "python";
    // A module is forbidden when it or any dotted prefix of it is listed.
    std::set<std::string> forbidden_modules;
    // Underscore-prefixed top-level modules are the C halves of the stdlib
    // (_socket, _posixsubprocess, _io) and bypass the listed wrappers.
    bool forbid_private_modules = true;
    // Builtins that may be neither called nor referenced.
    std::set<std::string> forbidden_calls;
    // Method names rejected as the final attribute of any call.
    std::set<std::string> forbidden_methods;
    // Module-level names that expose interpreter internals.
    std::set<std::string> forbidden_names;
    // Dunder attributes that may still be accessed.
    std::set<std::string> allowed_dunders;
    // Frame, generator and traceback members that lead back to globals and
    // builtins without naming a dunder.
    std::set<std::string> forbidden_attributes;
    std::set<std::string> forbidden_attribute_prefixes;
};

SecurityPolicy DefaultSecurityPolicy();

}  // namespace sandforge::security
