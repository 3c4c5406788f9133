#include <gtest/gtest.h>
#include "graph/graph_validator.hpp"
#include "serialization/json_codec.hpp"

using namespace gitty;

namespace {

bool hasFailure(const std::vector<ValidationIssue>& issues, const std::string& check) {
    for (const auto& issue : issues) {
        if (!issue.passed && issue.check_name == check) return true;
    }
    return false;
}

} // namespace

TEST(GraphValidatorTest, FreshGraphIsValid) {
    GraphValidator validator;
    Graph g = Graph::withRoot("main");
    auto issues = validator.check(g);
    ASSERT_EQ(issues.size(), 1u);
    EXPECT_TRUE(issues[0].passed);
    EXPECT_TRUE(validator.isValid(g));
}

TEST(GraphValidatorTest, GrownGraphStaysValid) {
    GraphValidator validator;
    Graph g = Graph::withRoot("main");
    std::string root = g.commitIds().front();
    std::string a = g.addCommit("a", {root}, "main");
    std::string b = g.addCommit("b", {root}, "feature");
    std::string m = g.addCommit("m", {a, b}, "main");
    g.moveBranchTip("main", m);
    g.addBranch("feature", b);
    g.setHead(Head::detached(b));
    EXPECT_TRUE(validator.isValid(g));
}

TEST(GraphValidatorTest, EmptyGraphHasNoRoot) {
    GraphValidator validator;
    Graph g;
    auto issues = validator.check(g);
    EXPECT_FALSE(validator.isValid(g));
    EXPECT_TRUE(hasFailure(issues, "single_root"));
}

TEST(GraphValidatorTest, DecoderRejectsBrokenGraphs) {
    // Bad depth never reaches the validator: the decoder refuses it.
    json doc = encodeGraph(Graph::withRoot("main"));
    std::string root = doc["commits"].begin().key();
    doc["commits"]["zz"] = {{"id", "zz"}, {"parentIds", json::array({root})}, {"originBranch", "main"},
                            {"depth", 5}};
    EXPECT_THROW(decodeGraph(doc), DecodeError);
}
