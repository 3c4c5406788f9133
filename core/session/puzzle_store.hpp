#pragma once

#include "puzzle/puzzle.hpp"

#include <map>
#include <optional>
#include <string>
#include <vector>

namespace gitty {

// ─── Puzzle Store ──────────────────────────────────────────────
// Published puzzles, keyed by id. Daily puzzles can also be looked up
// by date.

class PuzzleStore {
public:
    virtual ~PuzzleStore() = default;

    /// Insert or replace a puzzle.
    virtual void save(const Puzzle& puzzle) = 0;

    virtual std::optional<Puzzle> load(const std::string& puzzle_id) const = 0;

    /// Daily puzzle for "YYYY-MM-DD" at the given difficulty.
    virtual std::optional<Puzzle> loadByDate(const std::string& date,
                                             Difficulty difficulty) const = 0;

    virtual size_t count() const = 0;
};

class InMemoryPuzzleStore : public PuzzleStore {
public:
    InMemoryPuzzleStore() = default;

    void save(const Puzzle& puzzle) override;
    std::optional<Puzzle> load(const std::string& puzzle_id) const override;
    std::optional<Puzzle> loadByDate(const std::string& date,
                                     Difficulty difficulty) const override;
    size_t count() const override { return puzzles_.size(); }

    /// Ids in sorted order.
    std::vector<std::string> ids() const;

    /// Export all puzzles as JSON lines.
    void exportToFile(const std::string& path) const;

    /// Import puzzles from a JSON-lines file (inserts or replaces).
    /// Returns the number imported; throws DecodeError on a bad line.
    size_t importFromFile(const std::string& path);

    void clear() { puzzles_.clear(); }

private:
    std::map<std::string, Puzzle> puzzles_;
};

} // namespace gitty
