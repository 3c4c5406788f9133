#pragma once

#include "puzzle/puzzle.hpp"
#include "search/search_state.hpp"

#include <cstdint>
#include <map>
#include <optional>
#include <stdexcept>
#include <string>
#include <vector>

namespace gitty {

/// Raised when no acceptable puzzle could be produced for a seed.
/// Fatal for that day's job; callers must surface it, not substitute a
/// default puzzle.
class GenerationError : public std::runtime_error {
public:
    GenerationError(const std::string& seed_key, int attempts, const std::string& reason)
        : std::runtime_error("Puzzle generation failed for '" + seed_key + "' after " +
                             std::to_string(attempts) + " attempts: " + reason),
          seed_key_(seed_key), attempts_(attempts) {}

    const std::string& seedKey() const { return seed_key_; }
    int attempts() const { return attempts_; }

private:
    std::string seed_key_;
    int attempts_;
};

/// Shape of the puzzles for one difficulty tier.
struct TierConfig {
    std::vector<std::string> branch_names;  // trunk first
    int min_files = 2;
    int max_files = 2;
    int min_depth = 1;                      // file depth range, inclusive
    int max_depth = 2;
    int min_par = 4;                        // acceptable par band, inclusive
    int max_par = 8;
    PuzzleConstraints constraints;
};

/// Built-in tier settings.
TierConfig defaultTier(Difficulty difficulty);

/// Generator configuration parameters.
struct GeneratorConfig {
    std::string trunk = "main";
    int max_attempts = 25;
    SolverConfig solver{0, 400000, 20.0};
    std::map<Difficulty, TierConfig> tiers = {
        {Difficulty::EASY, defaultTier(Difficulty::EASY)},
        {Difficulty::MEDIUM, defaultTier(Difficulty::MEDIUM)},
        {Difficulty::HARD, defaultTier(Difficulty::HARD)},
    };
};

/// Seeded puzzle generator. Places file targets at random (branch, depth)
/// positions, solves the result, and accepts it only if it is solvable
/// with a par inside the tier's band. Rejected attempts are retried with
/// the seed advanced by the attempt counter.
class PuzzleGenerator {
public:
    /// Throws std::invalid_argument for an unusable configuration.
    explicit PuzzleGenerator(GeneratorConfig config = {});

    /// Puzzle for a calendar date ("YYYY-MM-DD"), id "daily-<date>".
    Puzzle generateDaily(const std::string& date, Difficulty difficulty) const;

    /// Puzzle for an archive identifier, with no date.
    Puzzle generateArchive(const std::string& archive_id, Difficulty difficulty) const;

    /// Full generation loop. Throws GenerationError when every attempt fails.
    Puzzle generate(const std::string& seed_key, const std::string& puzzle_id,
                    const std::optional<std::string>& date, Difficulty difficulty) const;

    /// Unsolved candidate for one attempt: initial graph, files, constraints.
    Puzzle buildCandidate(const std::string& seed_key, int attempt, Difficulty difficulty) const;

    /// Deterministic 64-bit seed for a key (FNV-1a).
    static uint64_t seedFor(const std::string& key);

    const TierConfig& tier(Difficulty difficulty) const;
    const GeneratorConfig& config() const { return config_; }

private:
    GeneratorConfig config_;
};

} // namespace gitty
