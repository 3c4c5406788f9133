#include <gtest/gtest.h>
#include "search/state_canonicalizer.hpp"

using namespace gitty;

namespace {

Graph rootedAt(const std::string& root_id) {
    Graph g;
    g.insertCommit(Commit(root_id, "Initial commit", {}, "main", 0));
    g.addBranch("main", root_id);
    g.setHead(Head::attached("main"));
    return g;
}

FileTarget file(const std::string& id, bool collected) {
    FileTarget f;
    f.id = id;
    f.name = id;
    f.branch = "main";
    f.depth = 1;
    f.collected = collected;
    return f;
}

} // namespace

// ─── Structural Signature ──────────────────────────────────────

TEST(CanonicalizerTest, SameStructureDifferentIdsMatch) {
    StateCanonicalizer canon;
    Graph a = rootedAt("r-one");
    Graph b = rootedAt("r-two");
    a.insertCommit(Commit("x1", "m", {"r-one"}, "main", 1));
    b.insertCommit(Commit("y9", "other message", {"r-two"}, "main", 1));
    a.moveBranchTip("main", "x1");
    b.moveBranchTip("main", "y9");

    EXPECT_EQ(canon.compute(a, {}), canon.compute(b, {}));
    EXPECT_NE(StateCanonicalizer::exact(a, {}), StateCanonicalizer::exact(b, {}));
}

TEST(CanonicalizerTest, OriginLabelDistinguishesCommits) {
    StateCanonicalizer canon;
    Graph a = rootedAt("r");
    Graph b = rootedAt("r");
    a.insertCommit(Commit("c", "m", {"r"}, "main", 1));
    b.insertCommit(Commit("c", "m", {"r"}, "feature", 1));
    a.moveBranchTip("main", "c");
    b.moveBranchTip("main", "c");

    EXPECT_NE(canon.compute(a, {}), canon.compute(b, {}));
}

TEST(CanonicalizerTest, HeadIsPartOfSignature) {
    StateCanonicalizer canon;
    Graph attached = rootedAt("r");
    attached.addBranch("feature", "r");
    Graph other = attached;
    other.setHead(Head::attached("feature"));
    Graph detached = attached;
    detached.setHead(Head::detached("r"));

    const std::string s1 = canon.compute(attached, {});
    EXPECT_NE(s1, canon.compute(other, {}));
    EXPECT_NE(s1, canon.compute(detached, {}));
}

TEST(CanonicalizerTest, CollectedFilesAreSortedIds) {
    StateCanonicalizer canon;
    Graph g = rootedAt("r");
    const std::string forward = canon.compute(g, {file("1", true), file("2", true)});
    const std::string reversed = canon.compute(g, {file("2", true), file("1", true)});
    const std::string partial = canon.compute(g, {file("1", true), file("2", false)});

    EXPECT_EQ(forward, reversed);
    EXPECT_NE(forward, partial);
    EXPECT_NE(forward.find("|F:1,2"), std::string::npos);
}

TEST(CanonicalizerTest, UnreferencedCommitsAreIgnored) {
    StateCanonicalizer canon;
    Graph a = rootedAt("r");
    Graph b = rootedAt("r");
    b.insertCommit(Commit("orphan", "left behind", {"r"}, "feature", 1));

    EXPECT_EQ(canon.compute(a, {}), canon.compute(b, {}));
    EXPECT_NE(StateCanonicalizer::exact(a, {}), StateCanonicalizer::exact(b, {}));
}

TEST(CanonicalizerTest, ShapesAreInterned) {
    StateCanonicalizer canon;
    Graph g = rootedAt("r");
    canon.compute(g, {});
    EXPECT_EQ(canon.shapeCount(), 1u);
    canon.compute(rootedAt("q"), {});
    EXPECT_EQ(canon.shapeCount(), 1u);

    g.insertCommit(Commit("c", "m", {"r"}, "main", 1));
    g.moveBranchTip("main", "c");
    canon.compute(g, {});
    EXPECT_EQ(canon.shapeCount(), 2u);
}
