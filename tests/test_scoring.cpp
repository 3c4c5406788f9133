#include <gtest/gtest.h>
#include "engine/command_executor.hpp"
#include "engine/scoring.hpp"

using namespace gitty;

namespace {

Puzzle onePuzzle() {
    Puzzle p;
    p.id = "score";
    p.branch_names = {"main"};
    p.initial_graph = Graph::withRoot("main");
    FileTarget f;
    f.id = "1";
    f.name = "README.md";
    f.branch = "main";
    f.depth = 2;
    p.files = {f};
    p.par_score = 2;
    p.solution = {Command::commit(), Command::commit()};
    return p;
}

} // namespace

TEST(ScoringTest, ScoreAroundPar) {
    EXPECT_EQ(calculateScore(6, 6), 100);
    EXPECT_EQ(calculateScore(4, 6), 140);
    EXPECT_EQ(calculateScore(8, 6), 80);
    EXPECT_EQ(calculateScore(50, 6), 10);
}

TEST(ScoringTest, RewardsOnlyForWonGames) {
    Puzzle puzzle = onePuzzle();
    GameState state = startGame(puzzle);
    EXPECT_FALSE(computeRewards(puzzle, state).has_value());

    ASSERT_TRUE(applyCommand(puzzle, state, Command::commit()).success);
    ASSERT_TRUE(applyCommand(puzzle, state, Command::commit()).game_won);

    auto rewards = computeRewards(puzzle, state);
    ASSERT_TRUE(rewards.has_value());
    EXPECT_EQ(rewards->score, 100);
    EXPECT_EQ(rewards->commands_used, 2);
    EXPECT_EQ(rewards->commands_under_par, 0);
    EXPECT_EQ(rewards->bonus_points, 0);
    EXPECT_EQ(rewards->performance, Performance::AT_PAR);
    EXPECT_EQ(rewards->optimal_solution, puzzle.solution);
}

TEST(ScoringTest, PerformanceBands) {
    Puzzle puzzle = onePuzzle();
    GameState state = startGame(puzzle);
    state.status = GameStatus::WON;

    state.commands_used = 1;
    auto under = computeRewards(puzzle, state);
    EXPECT_EQ(under->performance, Performance::UNDER_PAR);
    EXPECT_EQ(under->bonus_points, 20);

    state.commands_used = 5;
    auto over = computeRewards(puzzle, state);
    EXPECT_EQ(over->performance, Performance::OVER_PAR);
    EXPECT_EQ(over->commands_under_par, -3);
    EXPECT_EQ(over->score, 70);
    EXPECT_EQ(performanceName(over->performance), "over_par");
}
