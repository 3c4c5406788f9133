#include <gtest/gtest.h>
#include "engine/command_executor.hpp"
#include "search/state_canonicalizer.hpp"
#include "serialization/json_codec.hpp"

using namespace gitty;

namespace {

Puzzle samplePuzzle() {
    Puzzle p;
    p.id = "daily-2024-03-01";
    p.date = "2024-03-01";
    p.difficulty = Difficulty::MEDIUM;
    p.branch_names = {"main", "feature"};
    p.initial_graph = Graph::withRoot("main");
    FileTarget a;
    a.id = "1";
    a.name = "index.ts";
    a.branch = "feature";
    a.depth = 1;
    FileTarget b;
    b.id = "2";
    b.name = "README.md";
    b.branch = "main";
    b.depth = 1;
    p.files = {a, b};
    p.constraints.max_consecutive_commits = 3;
    p.constraints.allowed_commands = {CommandType::COMMIT, CommandType::BRANCH,
                                      CommandType::CHECKOUT, CommandType::MERGE,
                                      CommandType::UNDO};
    p.par_score = 6;
    p.solution = {Command::branch("feature"), Command::checkout("feature"), Command::commit(),
                  Command::checkout("main"), Command::commit(), Command::merge("feature")};
    return p;
}

} // namespace

// ─── Graph ─────────────────────────────────────────────────────

TEST(JsonCodecTest, GraphUsesKeyedRecords) {
    Graph g = Graph::withRoot("main");
    std::string root = g.commitIds().front();
    std::string a = g.addCommit("a", {root}, "feature", 1234);
    g.addBranch("feature", a);
    g.setHead(Head::detached(a));

    json doc = encodeGraph(g);
    ASSERT_TRUE(doc["commits"].is_object());
    ASSERT_TRUE(doc["branches"].is_object());
    EXPECT_EQ(doc["commits"][a]["parentIds"], json::array({root}));
    EXPECT_EQ(doc["commits"][a]["originBranch"], "feature");
    EXPECT_EQ(doc["commits"][a]["depth"], 1);
    EXPECT_EQ(doc["commits"][a]["timestamp"], 1234);
    EXPECT_EQ(doc["branches"]["feature"]["tipCommitId"], a);
    EXPECT_EQ(doc["headRef"], a);
    EXPECT_EQ(doc["isDetached"], true);

    Graph back = decodeGraph(parseJson(doc.dump()));
    EXPECT_EQ(back, g);
    EXPECT_EQ(back.getCommit(a)->timestamp, 1234);
}

TEST(JsonCodecTest, GraphDecodesOutOfOrderRecords) {
    json doc = {
        {"commits", {
            {"c2", {{"id", "c2"}, {"message", "second"}, {"parentIds", json::array({"c1"})},
                    {"originBranch", "main"}, {"depth", 1}}},
            {"c1", {{"id", "c1"}, {"message", "root"}, {"parentIds", json::array()},
                    {"originBranch", "main"}, {"depth", 0}}},
        }},
        {"branches", {{"main", {{"name", "main"}, {"tipCommitId", "c2"}}}}},
        {"headRef", "main"},
        {"isDetached", false},
    };
    Graph g = decodeGraph(doc);
    EXPECT_EQ(g.commitCount(), 2u);
    EXPECT_EQ(g.commitIds().front(), "c1");
    EXPECT_EQ(g.currentCommit()->id, "c2");
}

TEST(JsonCodecTest, BrokenGraphsAreDecodeErrors) {
    json missing_parent = encodeGraph(Graph::withRoot("main"));
    missing_parent["commits"]["x"] = {{"id", "x"}, {"parentIds", json::array({"nope"})},
                                      {"originBranch", "main"}, {"depth", 1}};
    EXPECT_THROW(decodeGraph(missing_parent), DecodeError);

    json bad_branch = encodeGraph(Graph::withRoot("main"));
    bad_branch["branches"]["ghost"] = {{"name", "ghost"}, {"tipCommitId", "nope"}};
    EXPECT_THROW(decodeGraph(bad_branch), DecodeError);

    json bad_head = encodeGraph(Graph::withRoot("main"));
    bad_head["headRef"] = "ghost";
    EXPECT_THROW(decodeGraph(bad_head), DecodeError);

    json wrong_type = encodeGraph(Graph::withRoot("main"));
    wrong_type["commits"] = json::array();
    EXPECT_THROW(decodeGraph(wrong_type), DecodeError);

    EXPECT_THROW(parseJson("{not json"), DecodeError);
}

// ─── Commands ──────────────────────────────────────────────────

TEST(JsonCodecTest, CommandFieldsDependOnType) {
    EXPECT_EQ(encodeCommand(Command::commit("msg")), json({{"type", "commit"}, {"message", "msg"}}));
    EXPECT_EQ(encodeCommand(Command::branch("b")), json({{"type", "branch"}, {"name", "b"}}));
    EXPECT_EQ(encodeCommand(Command::checkout("t")), json({{"type", "checkout"}, {"target", "t"}}));
    EXPECT_EQ(encodeCommand(Command::merge("m")), json({{"type", "merge"}, {"branch", "m"}}));
    EXPECT_EQ(encodeCommand(Command::rebase("o")), json({{"type", "rebase"}, {"onto", "o"}}));
    EXPECT_EQ(encodeCommand(Command::undo()), json({{"type", "undo"}}));

    EXPECT_EQ(decodeCommand(parseJson(R"({"type":"rebase","onto":"main"})")), Command::rebase("main"));
    EXPECT_EQ(decodeCommand(parseJson(R"({"type":"commit"})")), Command::commit("Commit"));
}

TEST(JsonCodecTest, MalformedCommandsAreRejected) {
    EXPECT_THROW(decodeCommand(parseJson(R"({"type":"push"})")), DecodeError);
    EXPECT_THROW(decodeCommand(parseJson(R"({"type":"merge"})")), DecodeError);
    EXPECT_THROW(decodeCommand(parseJson(R"({"type":"checkout","target":7})")), DecodeError);
    EXPECT_THROW(decodeCommand(parseJson(R"({"target":"main"})")), DecodeError);
    EXPECT_THROW(decodeCommand(parseJson("[]")), DecodeError);
}

// ─── Puzzles and sessions ──────────────────────────────────────

TEST(JsonCodecTest, PuzzleRoundTrip) {
    Puzzle p = samplePuzzle();
    Puzzle back = decodePuzzle(parseJson(encodePuzzle(p).dump()));

    EXPECT_EQ(back.id, p.id);
    EXPECT_EQ(back.date, p.date);
    EXPECT_EQ(back.difficulty, Difficulty::MEDIUM);
    EXPECT_EQ(back.branch_names, p.branch_names);
    EXPECT_EQ(back.initial_graph, p.initial_graph);
    EXPECT_EQ(back.files, p.files);
    EXPECT_EQ(back.constraints.max_consecutive_commits, 3);
    EXPECT_EQ(back.constraints.allowed_commands, p.constraints.allowed_commands);
    EXPECT_EQ(back.par_score, 6);
    EXPECT_EQ(back.solution, p.solution);
}

TEST(JsonCodecTest, ArchivePuzzleHasNullDate) {
    Puzzle p = samplePuzzle();
    p.date.reset();
    json doc = encodePuzzle(p);
    EXPECT_TRUE(doc["date"].is_null());
    EXPECT_FALSE(decodePuzzle(doc).date.has_value());
}

TEST(JsonCodecTest, GameStateRestoresUndoHistory) {
    Puzzle puzzle = samplePuzzle();
    CommandExecutor ex(puzzle);
    GameState state = ex.newGame();
    for (size_t i = 0; i < 4; i++) {
        ASSERT_TRUE(ex.execute(state, puzzle.solution[i]).success);
    }

    GameState back = decodeGameState(parseJson(encodeGameState(state).dump()));
    EXPECT_EQ(back.puzzle_id, state.puzzle_id);
    EXPECT_EQ(back.graph, state.graph);
    EXPECT_EQ(back.files, state.files);
    EXPECT_EQ(back.commands_used, 4);
    EXPECT_EQ(back.checkouts_used, 2);
    EXPECT_EQ(back.status, GameStatus::IN_PROGRESS);
    EXPECT_EQ(back.undo_stack.size(), 4u);
    EXPECT_EQ(back.undo_stack.capacity(), state.undo_stack.capacity());
    ASSERT_EQ(back.command_history.size(), 4u);
    EXPECT_EQ(back.command_history[1].command, Command::checkout("feature"));

    // The restored session plays on identically.
    ASSERT_TRUE(ex.execute(back, puzzle.solution[4]).success);
    EXPECT_TRUE(ex.execute(back, puzzle.solution[5]).game_won);

    for (int i = 0; i < 4; i++) ASSERT_TRUE(ex.undo(state).success);
    EXPECT_EQ(state.graph, puzzle.initial_graph);
}

TEST(JsonCodecTest, CommandResponseCarriesGraph) {
    Puzzle puzzle = samplePuzzle();
    GameState state = startGame(puzzle);
    CommandResult r = applyCommand(puzzle, state, Command::commit());

    json doc = encodeCommandResponse(r, state);
    EXPECT_EQ(doc["success"], true);
    EXPECT_TRUE(doc["error"].is_null());
    EXPECT_EQ(doc["filesCollected"].size(), 1u);
    EXPECT_EQ(doc["filesCollected"][0]["id"], "2");
    EXPECT_EQ(doc["gameWon"], false);
    EXPECT_EQ(doc["graph"]["commits"].size(), 2u);
    EXPECT_EQ(doc["status"], "in_progress");

    CommandResult fail = applyCommand(puzzle, state, Command::checkout("nowhere"));
    EXPECT_EQ(encodeCommandResult(fail)["error"], "reference");
}
