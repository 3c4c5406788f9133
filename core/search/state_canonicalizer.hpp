#pragma once

#include "graph/graph.hpp"
#include "puzzle/file_target.hpp"

#include <cstdint>
#include <string>
#include <unordered_map>
#include <vector>

namespace gitty {

// ─── State Canonicalizer ───────────────────────────────────────
// Reduces a (graph, files) pair to a signature string used to
// deduplicate search states.
//
// The signature encodes:
// - Branch tips, sorted by branch name
// - HEAD (branch name, or the commit it is detached at)
// - Sorted ids of collected files
//
// Commits are named by shape rather than id: a shape is interned from
// (depth, origin label, parent shapes), so two graphs that grew the same
// structure through different commit ids produce the same signature.

class StateCanonicalizer {
public:
    /// Structural signature. Shapes are interned per canonicalizer, so
    /// only compare signatures produced by the same instance.
    std::string compute(const Graph& graph, const std::vector<FileTarget>& files);

    /// Signature over raw commit ids. Identical only for identical graphs.
    static std::string exact(const Graph& graph, const std::vector<FileTarget>& files);

    /// Number of distinct commit shapes seen so far.
    size_t shapeCount() const { return shapes_.size(); }

private:
    using ShapeMemo = std::unordered_map<std::string, uint64_t>;

    uint64_t shapeOf(const Graph& graph, const std::string& commit_id, ShapeMemo& memo);

    static std::string collectedIds(const std::vector<FileTarget>& files);

    std::unordered_map<std::string, uint64_t> shapes_;
};

} // namespace gitty
