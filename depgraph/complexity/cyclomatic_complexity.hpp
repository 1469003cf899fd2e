#ifndef DEPGRAPH_COMPLEXITY_CYCLOMATIC_COMPLEXITY_HPP
#define DEPGRAPH_COMPLEXITY_CYCLOMATIC_COMPLEXITY_HPP

#pragma once

#include <cstddef>
#include <string>
#include <unordered_set>
#include <vector>
#include <tree_sitter/api.h>

namespace depgraph::complexity {

// Node types that introduce a path, per grammar.
struct BranchRules {
    std::unordered_set<std::string> decision_points;
    // Binary expression node types whose `operator` field may be one of
    // logical_operators. Each such node joins two operands, so a chain of N
    // operands contributes N-1.
    std::unordered_set<std::string> logical_expressions;
    std::unordered_set<std::string> logical_operators;
};

const BranchRules &python_rules();
const BranchRules &cpp_rules();

struct ComplexityFactor {
    std::string description;
    size_t line_number;
};

struct ComplexityResult {
    double score{1.0};
    size_t lines_of_code{1};
    std::vector<ComplexityFactor> factors;
};

// Structural approximation of cyclomatic complexity: 1 plus one per branch
// construct found anywhere under the unit. The walk does not stop at nested
// functions or methods, so a class accumulates the branches of its methods.
class CyclomaticComplexity {
public:
    explicit CyclomaticComplexity(const BranchRules &rules) : rules_(rules) {}

    ComplexityResult calculate(TSNode unit) const;

    // end_line - start_line + 1; 1 for a null node.
    static size_t count_lines(TSNode unit);

private:
    bool is_logical_operator(TSNode node, const char *type) const;
    void add_increment(ComplexityResult &result, const std::string &reason, size_t line_number) const;

    const BranchRules &rules_;
};

} // namespace depgraph::complexity

#endif // DEPGRAPH_COMPLEXITY_CYCLOMATIC_COMPLEXITY_HPP
