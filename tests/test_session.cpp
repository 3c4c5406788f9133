#include <gtest/gtest.h>
#include "engine/command_executor.hpp"
#include "serialization/json_codec.hpp"
#include "session/session_manager.hpp"

#include <cstdio>
#include <fstream>
#include <string>

using namespace gitty;

namespace {

Puzzle dailyPuzzle() {
    Puzzle p;
    p.id = "daily-2024-05-01";
    p.date = "2024-05-01";
    p.branch_names = {"main", "feature"};
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

struct SessionFixture : public ::testing::Test {
    InMemoryPuzzleStore puzzles;
    InMemorySessionStore sessions;
    Puzzle puzzle = dailyPuzzle();

    void SetUp() override { puzzles.save(puzzle); }
};

} // namespace

TEST_F(SessionFixture, OpenCheckpointsFreshSession) {
    SessionManager mgr(puzzles, sessions);
    EXPECT_FALSE(mgr.hydrate(puzzle.id, "alice").has_value());

    GameState state = mgr.open(puzzle.id, "alice");
    EXPECT_EQ(state.puzzle_id, puzzle.id);
    EXPECT_EQ(state.commands_used, 0);
    EXPECT_EQ(sessions.saveCount(), 1u);
    EXPECT_FALSE(sessions.document(SessionManager::sessionKey(puzzle.id, "alice")).empty());

    // Opening again reuses the checkpoint.
    mgr.open(puzzle.id, "alice");
    EXPECT_EQ(sessions.saveCount(), 1u);
    EXPECT_EQ(sessions.count(), 1u);
}

TEST_F(SessionFixture, OnlySuccessfulCommandsCheckpoint) {
    SessionManager mgr(puzzles, sessions);
    SessionReply ok = mgr.submit(puzzle.id, "alice", Command::commit());
    EXPECT_TRUE(ok.result.success);
    EXPECT_EQ(sessions.saveCount(), 2u);

    SessionReply bad = mgr.submit(puzzle.id, "alice", Command::checkout("nowhere"));
    EXPECT_FALSE(bad.result.success);
    EXPECT_EQ(bad.result.error, ErrorKind::REFERENCE);
    EXPECT_EQ(sessions.saveCount(), 2u);

    auto stored = mgr.hydrate(puzzle.id, "alice");
    ASSERT_TRUE(stored.has_value());
    EXPECT_EQ(stored->commands_used, 1);
    EXPECT_EQ(stored->graph, ok.state.graph);
}

TEST_F(SessionFixture, SessionsAreIsolatedPerUser) {
    SessionManager mgr(puzzles, sessions);
    mgr.submit(puzzle.id, "alice", Command::commit());
    SessionReply bob = mgr.submit(puzzle.id, "bob", Command::branch("feature"));
    EXPECT_TRUE(bob.result.success);
    EXPECT_EQ(bob.state.commands_used, 1);
    EXPECT_EQ(sessions.count(), 2u);
    EXPECT_FALSE(mgr.hydrate(puzzle.id, "alice")->graph.hasBranch("feature"));
}

TEST_F(SessionFixture, SubmitLineParsesInput) {
    SessionManager mgr(puzzles, sessions);
    SessionReply reply = mgr.submitLine(puzzle.id, "alice", "git commit -m \"first\"");
    EXPECT_TRUE(reply.result.success);
    EXPECT_EQ(reply.state.command_history.back().command, Command::commit("first"));

    SessionReply junk = mgr.submitLine(puzzle.id, "alice", "git push origin");
    EXPECT_FALSE(junk.result.success);
    EXPECT_EQ(junk.result.error, ErrorKind::VALIDATION);
    EXPECT_EQ(junk.state.commands_used, 1);
}

TEST_F(SessionFixture, UnparseableLineDoesNotStartSession) {
    SessionManager mgr(puzzles, sessions);
    SessionReply junk = mgr.submitLine(puzzle.id, "carol", "git stash");
    EXPECT_FALSE(junk.result.success);
    EXPECT_EQ(junk.result.error, ErrorKind::VALIDATION);
    EXPECT_EQ(junk.result.message, "Unrecognized command: git stash");
    EXPECT_EQ(junk.state.commands_used, 0);
    EXPECT_EQ(junk.state.graph, puzzle.initial_graph);

    EXPECT_EQ(sessions.saveCount(), 0u);
    EXPECT_EQ(sessions.count(), 0u);
    EXPECT_FALSE(mgr.hydrate(puzzle.id, "carol").has_value());
    EXPECT_THROW(mgr.submitLine("missing", "carol", "git stash"), std::runtime_error);
}

TEST_F(SessionFixture, UndoThroughManagerPersists) {
    SessionManager mgr(puzzles, sessions);
    mgr.submit(puzzle.id, "alice", Command::commit());
    SessionReply undone = mgr.undo(puzzle.id, "alice");
    EXPECT_TRUE(undone.result.success);
    EXPECT_EQ(undone.state.graph, puzzle.initial_graph);

    auto stored = mgr.hydrate(puzzle.id, "alice");
    EXPECT_EQ(stored->graph, puzzle.initial_graph);
    EXPECT_TRUE(stored->undo_stack.empty());

    EXPECT_FALSE(mgr.undo(puzzle.id, "alice").result.success);
}

TEST_F(SessionFixture, WinAndRewards) {
    SessionManager mgr(puzzles, sessions);
    mgr.submit(puzzle.id, "alice", Command::commit());
    EXPECT_FALSE(mgr.rewards(puzzle.id, "alice").has_value());

    SessionReply win = mgr.submit(puzzle.id, "alice", Command::commit());
    EXPECT_TRUE(win.result.game_won);
    EXPECT_EQ(mgr.hydrate(puzzle.id, "alice")->status, GameStatus::WON);

    auto rewards = mgr.rewards(puzzle.id, "alice");
    ASSERT_TRUE(rewards.has_value());
    EXPECT_EQ(rewards->score, 100);
    EXPECT_EQ(rewards->performance, Performance::AT_PAR);

    SessionReply after = mgr.submit(puzzle.id, "alice", Command::commit());
    EXPECT_FALSE(after.result.success);
    EXPECT_EQ(after.result.error, ErrorKind::VALIDATION);
    EXPECT_FALSE(mgr.abandon(puzzle.id, "alice"));
}

TEST_F(SessionFixture, AbandonEndsSession) {
    SessionManager mgr(puzzles, sessions);
    EXPECT_FALSE(mgr.abandon(puzzle.id, "alice"));

    mgr.open(puzzle.id, "alice");
    EXPECT_TRUE(mgr.abandon(puzzle.id, "alice"));
    EXPECT_FALSE(mgr.abandon(puzzle.id, "alice"));

    auto stored = mgr.hydrate(puzzle.id, "alice");
    EXPECT_EQ(stored->status, GameStatus::ABANDONED);
    EXPECT_GT(stored->completed_at, 0);

    SessionReply reply = mgr.submit(puzzle.id, "alice", Command::commit());
    EXPECT_FALSE(reply.result.success);
    EXPECT_FALSE(mgr.rewards(puzzle.id, "alice").has_value());
}

TEST_F(SessionFixture, UnknownPuzzleThrows) {
    SessionManager mgr(puzzles, sessions);
    EXPECT_THROW(mgr.open("missing", "alice"), std::runtime_error);
    EXPECT_THROW(mgr.submit("missing", "alice", Command::commit()), std::runtime_error);
}

TEST(SessionStoreTest, RemoveDropsCheckpoint) {
    InMemorySessionStore store;
    GameState state = startGame(dailyPuzzle());
    store.save("k", state);
    EXPECT_TRUE(store.load("k").has_value());
    EXPECT_TRUE(store.remove("k"));
    EXPECT_FALSE(store.remove("k"));
    EXPECT_FALSE(store.load("k").has_value());
    EXPECT_EQ(store.document("k"), "");
}

TEST(PuzzleStoreTest, LookupByDateAndDifficulty) {
    InMemoryPuzzleStore store;
    Puzzle easy = dailyPuzzle();
    Puzzle hard = dailyPuzzle();
    hard.id = "daily-2024-05-01-hard";
    hard.difficulty = Difficulty::HARD;
    Puzzle archive = dailyPuzzle();
    archive.id = "archive-1";
    archive.date.reset();
    store.save(easy);
    store.save(hard);
    store.save(archive);

    EXPECT_EQ(store.count(), 3u);
    EXPECT_EQ(store.loadByDate("2024-05-01", Difficulty::HARD)->id, hard.id);
    EXPECT_EQ(store.loadByDate("2024-05-01", Difficulty::EASY)->id, easy.id);
    EXPECT_FALSE(store.loadByDate("2024-05-01", Difficulty::MEDIUM).has_value());
    EXPECT_FALSE(store.loadByDate("2024-05-02", Difficulty::EASY).has_value());
    EXPECT_FALSE(store.load("nope").has_value());
}

TEST(PuzzleStoreTest, ExportImportRoundTrip) {
    std::string path = ::testing::TempDir() + "gitty_puzzles.jsonl";
    InMemoryPuzzleStore store;
    Puzzle a = dailyPuzzle();
    Puzzle b = dailyPuzzle();
    b.id = "archive-7";
    b.date.reset();
    store.save(a);
    store.save(b);
    store.exportToFile(path);

    InMemoryPuzzleStore restored;
    EXPECT_EQ(restored.importFromFile(path), 2u);
    EXPECT_EQ(restored.ids(), store.ids());
    EXPECT_EQ(restored.load("archive-7")->solution, b.solution);
    EXPECT_EQ(restored.load(a.id)->initial_graph, a.initial_graph);

    {
        std::ofstream out(path, std::ios::app);
        out << "{broken\n";
    }
    InMemoryPuzzleStore broken;
    EXPECT_THROW(broken.importFromFile(path), DecodeError);
    std::remove(path.c_str());
}
