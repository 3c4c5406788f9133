#include "search/state_canonicalizer.hpp"

#include <algorithm>
#include <sstream>
#include <stdexcept>

namespace gitty {

uint64_t StateCanonicalizer::shapeOf(const Graph& graph, const std::string& commit_id,
                                     ShapeMemo& memo) {
    auto cached = memo.find(commit_id);
    if (cached != memo.end()) return cached->second;

    const Commit* c = graph.getCommit(commit_id);
    if (!c) {
        throw std::runtime_error("Cannot canonicalize missing commit: " + commit_id);
    }

    std::ostringstream key;
    key << c->depth << ':' << c->origin_branch << ':';
    for (size_t i = 0; i < c->parent_ids.size(); i++) {
        if (i > 0) key << ',';
        key << shapeOf(graph, c->parent_ids[i], memo);
    }

    auto inserted = shapes_.emplace(key.str(), shapes_.size() + 1);
    uint64_t shape = inserted.first->second;
    memo[commit_id] = shape;
    return shape;
}

std::string StateCanonicalizer::collectedIds(const std::vector<FileTarget>& files) {
    std::vector<std::string> ids;
    for (const auto& f : files) {
        if (f.collected) ids.push_back(f.id);
    }
    std::sort(ids.begin(), ids.end());

    std::ostringstream oss;
    for (size_t i = 0; i < ids.size(); i++) {
        if (i > 0) oss << ",";
        oss << ids[i];
    }
    return oss.str();
}

std::string StateCanonicalizer::compute(const Graph& graph, const std::vector<FileTarget>& files) {
    ShapeMemo memo;
    std::ostringstream sig;

    // Branch map is ordered by name
    sig << "B:";
    bool first = true;
    for (const auto& [name, branch] : graph.branches()) {
        if (!first) sig << ";";
        sig << name << "=" << shapeOf(graph, branch.tip_commit_id, memo);
        first = false;
    }

    const Head& head = graph.head();
    sig << "|H:";
    if (head.isDetached()) {
        sig << "#" << shapeOf(graph, head.ref, memo);
    } else {
        sig << "@" << head.ref;
    }

    sig << "|F:" << collectedIds(files);
    return sig.str();
}

std::string StateCanonicalizer::exact(const Graph& graph, const std::vector<FileTarget>& files) {
    std::ostringstream sig;
    sig << "B:";
    bool first = true;
    for (const auto& [name, branch] : graph.branches()) {
        if (!first) sig << ";";
        sig << name << "=" << branch.tip_commit_id;
        first = false;
    }
    const Head& head = graph.head();
    sig << "|H:" << (head.isDetached() ? "#" : "@") << head.ref;
    sig << "|N:" << graph.commitCount();
    sig << "|F:" << collectedIds(files);
    return sig.str();
}

} // namespace gitty
