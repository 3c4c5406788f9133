#include <gtest/gtest.h>
#include "util/log.hpp"

#include <sstream>

using namespace gitty;

TEST(LogTest, DisabledLoggerWritesNothing) {
    TaggedLogger log;
    std::ostringstream out;
    log.setOutput(&out);
    log.log("hidden", __FILE__, __LINE__, {"Executor"});
    EXPECT_TRUE(out.str().empty());
}

TEST(LogTest, MessageCarriesTagsAndLocation) {
    TaggedLogger log;
    std::ostringstream out;
    log.setOutput(&out);
    log.setLoggingEnabled(true);
    log.log("solved", "/src/core/search/bfs_solver.cpp", 42, {"Solver", "Search"});

    const std::string line = out.str();
    EXPECT_NE(line.find("[Solver][Search] "), std::string::npos);
    EXPECT_NE(line.find("[search/bfs_solver.cpp:42] solved\n"), std::string::npos);
}

TEST(LogTest, TagFiltersApply) {
    TaggedLogger log;
    std::ostringstream out;
    log.setOutput(&out);
    log.setLoggingEnabled(true);

    log.skipTag("Solver");
    log.log("skipped", "a.cpp", 1, {"Solver"});
    log.log("kept", "a.cpp", 2, {"Generator"});
    EXPECT_EQ(out.str().find("skipped"), std::string::npos);
    EXPECT_NE(out.str().find("kept"), std::string::npos);

    log.clearTagFilters();
    log.enableTag("Session");
    log.log("other", "a.cpp", 3, {"Executor"});
    log.log("session", "a.cpp", 4, {"Session"});
    EXPECT_EQ(out.str().find("other"), std::string::npos);
    EXPECT_NE(out.str().find("session"), std::string::npos);
}

TEST(LogTest, GlobalSwitchControlsSingleton) {
    set_logging_enabled(true);
    EXPECT_TRUE(logger().loggingEnabled());
    set_logging_enabled(false);
    EXPECT_FALSE(logger().loggingEnabled());
}

#ifdef GITTY_LOG_DEBUG
TEST(LogTest, MacroRoutesThroughSingleton) {
    std::ostringstream out;
    logger().setOutput(&out);
    set_logging_enabled(true);
    gitty_log("from macro", "Test");
    set_logging_enabled(false);
    logger().setOutput(nullptr);
    EXPECT_NE(out.str().find("[Test] "), std::string::npos);
    EXPECT_NE(out.str().find("from macro"), std::string::npos);
}
#endif
