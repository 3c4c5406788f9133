#pragma once

#include "graph/graph.hpp"
#include <string>
#include <vector>

namespace gitty {

/// Result of a single structural check.
struct ValidationIssue {
    bool passed = false;
    std::string check_name;
    std::string message;
    std::string commit_id;  // empty = graph-level
};

/// Checks the structural invariants of a commit graph: a single root at
/// depth 0, resolvable parents, the depth rule, resolvable branch tips
/// and a valid HEAD.
class GraphValidator {
public:
    std::vector<ValidationIssue> check(const Graph& graph) const;

    bool isValid(const Graph& graph) const;
};

} // namespace gitty
