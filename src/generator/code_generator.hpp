#pragma once

#include <optional>
#include <string>

#include "core/types.hpp"

namespace sandforge::generator {

// Produces candidate source for a task. Implementations throw
// GeneratorUnavailable when no candidate can be produced at all.
class CodeGenerator {
public:
    virtual ~CodeGenerator() = default;
    virtual CodeCandidate Generate(const std::string& task_description,
                                   const std::string& language,
                                   const std::optional<std::string>& feedback) = 0;
};

}  // namespace sandforge::generator
