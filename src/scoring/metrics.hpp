#pragma once

#include <map>
#include <string>

namespace codecred::scoring {

// Produced by the static structure analyzer. Negative values mean the
// analyzer could not compute the field.
struct StructuralMetrics {
    int token_count = 0;
    int function_count = 0;
    int class_count = 0;
    int num_lines = 0;
    int num_nonempty_lines = 0;
    int import_count = 0;
    int ast_depth = 0;
    double avg_cyclomatic_complexity = 0.0;
    double max_cyclomatic_complexity = 0.0;
    double comment_density_percent = 0.0;
    double avg_function_size_lines = 0.0;
    double import_redundancy_ratio = 0.0;
};

// Produced by the lint and type-check tools. An error count of -1 means the
// tool itself failed.
struct SemanticMetrics {
    bool syntax_valid = true;
    int lint_error_count = 0;
    std::map<std::string, int> lint_error_breakdown;
    int typecheck_error_count = 0;
    std::map<std::string, int> typecheck_error_breakdown;
    double semantic_quality_score = 0.0;
};

}  // namespace codecred::scoring
