#pragma once

#include <string>

#include "core/types.hpp"
#include "syntax/ast.hpp"

namespace sandforge::analysis {

struct ComplexityThresholds {
    double low_max = 10.0;
    double medium_max = 25.0;
    int deep_nesting = 4;
    int long_function_lines = 50;
};

ComplexityRating RateScore(double score, const ComplexityThresholds& thresholds = {});

// Static structural metrics and anti-pattern hints. Never executes code.
class ComplexityAnalyzer {
public:
    explicit ComplexityAnalyzer(ComplexityThresholds thresholds = {});

    // Throws SyntaxError when the source does not parse.
    ComplexityReport Analyze(const std::string& source) const;
    ComplexityReport Analyze(const std::string& source, const syntax::Module& module) const;

private:
    ComplexityThresholds thresholds_;
};

}  // namespace sandforge::analysis
