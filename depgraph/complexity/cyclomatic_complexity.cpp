#include "complexity/cyclomatic_complexity.hpp"
#include <cstring>
#include <spdlog/spdlog.h>
#include <stack>

namespace depgraph::complexity {

const BranchRules &python_rules() {
    static const BranchRules rules{
        {
            "if_statement",
            "elif_clause",
            "for_statement",        // also `async for`
            "while_statement",
            "except_clause",
            "except_group_clause",
            "with_statement",       // also `async with`
            "assert_statement"
        },
        {"boolean_operator"},
        {"and", "or"}
    };
    return rules;
}

const BranchRules &cpp_rules() {
    static const BranchRules rules{
        {
            "if_statement",
            "for_statement",
            "for_range_loop",
            "while_statement",
            "do_statement",
            "case_statement",
            "catch_clause"
        },
        {"binary_expression"},
        {"&&", "||", "and", "or"}
    };
    return rules;
}

ComplexityResult CyclomaticComplexity::calculate(TSNode unit) const {
    ComplexityResult result;

    if (ts_node_is_null(unit)) {
        spdlog::debug("Complexity requested for a null node");
        return result;
    }

    result.lines_of_code = count_lines(unit);

    std::stack<TSNode> nodes;
    nodes.push(unit);

    while (!nodes.empty()) {
        TSNode current = nodes.top();
        nodes.pop();

        const char *type = ts_node_type(current);
        size_t line_number = ts_node_start_point(current).row + 1;

        if (rules_.decision_points.count(type) > 0) {
            add_increment(result, type, line_number);
        } else if (is_logical_operator(current, type)) {
            add_increment(result, "logical operator", line_number);
        }

        uint32_t child_count = ts_node_named_child_count(current);
        for (uint32_t i = child_count; i > 0; --i) {
            nodes.push(ts_node_named_child(current, i - 1));
        }
    }

    return result;
}

size_t CyclomaticComplexity::count_lines(TSNode unit) {
    if (ts_node_is_null(unit)) {
        return 1;
    }

    TSPoint start = ts_node_start_point(unit);
    TSPoint end = ts_node_end_point(unit);

    // A node that swallowed its trailing newline ends at column 0 of the
    // following row.
    uint32_t end_row = end.row;
    if (end.column == 0 && end_row > start.row) {
        --end_row;
    }
    return static_cast<size_t>(end_row - start.row) + 1;
}

bool CyclomaticComplexity::is_logical_operator(TSNode node, const char *type) const {
    if (rules_.logical_expressions.count(type) == 0) {
        return false;
    }

    TSNode op = ts_node_child_by_field_name(node, "operator", static_cast<uint32_t>(strlen("operator")));
    if (ts_node_is_null(op)) {
        return false;
    }
    return rules_.logical_operators.count(ts_node_type(op)) > 0;
}

void CyclomaticComplexity::add_increment(ComplexityResult &result,
                                         const std::string &reason,
                                         size_t line_number) const {
    result.score += 1.0;
    result.factors.push_back({reason, line_number});
    spdlog::trace("Complexity +1 for {} at line {}", reason, line_number);
}

} // namespace depgraph::complexity
