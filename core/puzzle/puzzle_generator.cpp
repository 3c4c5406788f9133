#include "puzzle/puzzle_generator.hpp"
#include "engine/command_parser.hpp"
#include "search/bfs_solver.hpp"
#include "util/log.hpp"

#include <algorithm>
#include <random>
#include <utility>

namespace gitty {

namespace {

const std::vector<std::string>& fileNamePool() {
    static const std::vector<std::string> pool = {
        "README.md", "index.ts", "config.json", "styles.css", "main.cpp",
        "Makefile", "utils.py", "schema.sql", "app.yaml", "LICENSE",
    };
    return pool;
}

} // namespace

TierConfig defaultTier(Difficulty difficulty) {
    TierConfig tier;
    switch (difficulty) {
        case Difficulty::EASY:
            tier.branch_names = {"main", "feature"};
            tier.min_files = 2;
            tier.max_files = 2;
            tier.min_depth = 1;
            tier.max_depth = 2;
            tier.min_par = 4;
            tier.max_par = 8;
            tier.constraints.max_commands = 12;
            tier.constraints.max_commits = 10;
            tier.constraints.max_checkouts = 6;
            tier.constraints.max_branches = 2;
            break;
        case Difficulty::MEDIUM:
            tier.branch_names = {"main", "feature"};
            tier.min_files = 3;
            tier.max_files = 3;
            tier.min_depth = 1;
            tier.max_depth = 3;
            tier.min_par = 6;
            tier.max_par = 11;
            tier.constraints.max_commands = 14;
            tier.constraints.max_commits = 12;
            tier.constraints.max_checkouts = 6;
            tier.constraints.max_branches = 2;
            break;
        case Difficulty::HARD:
            tier.branch_names = {"main", "feature", "hotfix"};
            tier.min_files = 3;
            tier.max_files = 4;
            tier.min_depth = 1;
            tier.max_depth = 3;
            tier.min_par = 8;
            tier.max_par = 14;
            tier.constraints.max_commands = 16;
            tier.constraints.max_commits = 14;
            tier.constraints.max_checkouts = 8;
            tier.constraints.max_branches = 3;
            break;
    }
    return tier;
}

PuzzleGenerator::PuzzleGenerator(GeneratorConfig config) : config_(std::move(config)) {
    if (config_.max_attempts <= 0) {
        throw std::invalid_argument("max_attempts must be positive");
    }
    for (const auto& [difficulty, tier] : config_.tiers) {
        const std::string name = difficultyName(difficulty);
        if (tier.branch_names.size() < 2 || tier.branch_names.front() != config_.trunk) {
            throw std::invalid_argument("Tier " + name + " must list the trunk first and at least one other branch");
        }
        for (const auto& branch : tier.branch_names) {
            if (!isValidBranchName(branch)) {
                throw std::invalid_argument("Tier " + name + " has invalid branch name '" + branch + "'");
            }
        }
        if (tier.min_files < 1 || tier.min_files > tier.max_files ||
            tier.min_depth < 1 || tier.min_depth > tier.max_depth ||
            tier.min_par > tier.max_par) {
            throw std::invalid_argument("Tier " + name + " has an empty range");
        }
        const int positions = static_cast<int>(tier.branch_names.size()) *
                              (tier.max_depth - tier.min_depth + 1);
        if (tier.max_files > positions ||
            tier.max_files > static_cast<int>(fileNamePool().size())) {
            throw std::invalid_argument("Tier " + name + " places more files than positions");
        }
    }
}

const TierConfig& PuzzleGenerator::tier(Difficulty difficulty) const {
    auto it = config_.tiers.find(difficulty);
    if (it == config_.tiers.end()) {
        throw std::invalid_argument("No tier configured for " + difficultyName(difficulty));
    }
    return it->second;
}

uint64_t PuzzleGenerator::seedFor(const std::string& key) {
    uint64_t hash = 1469598103934665603ULL;
    for (unsigned char c : key) {
        hash ^= c;
        hash *= 1099511628211ULL;
    }
    return hash;
}

Puzzle PuzzleGenerator::generateDaily(const std::string& date, Difficulty difficulty) const {
    return generate(date, "daily-" + date, date, difficulty);
}

Puzzle PuzzleGenerator::generateArchive(const std::string& archive_id, Difficulty difficulty) const {
    return generate(archive_id, archive_id, std::nullopt, difficulty);
}

// ─── Candidate placement ───────────────────────────────────────

Puzzle PuzzleGenerator::buildCandidate(const std::string& seed_key, int attempt,
                                       Difficulty difficulty) const {
    const TierConfig& t = tier(difficulty);
    std::mt19937_64 rng(seedFor(seed_key) + static_cast<uint64_t>(attempt));

    Puzzle puzzle;
    puzzle.difficulty = difficulty;
    puzzle.trunk = config_.trunk;
    puzzle.branch_names = t.branch_names;
    puzzle.constraints = t.constraints;
    puzzle.initial_graph = Graph::withRoot(config_.trunk);

    std::vector<std::pair<std::string, int>> positions;
    for (const auto& branch : t.branch_names) {
        for (int depth = t.min_depth; depth <= t.max_depth; depth++) {
            positions.emplace_back(branch, depth);
        }
    }
    std::shuffle(positions.begin(), positions.end(), rng);

    std::uniform_int_distribution<int> count_dist(t.min_files, t.max_files);
    const int count = count_dist(rng);
    positions.resize(static_cast<size_t>(count));

    // At least one file must sit off the trunk.
    bool off_trunk = std::any_of(positions.begin(), positions.end(),
                                 [&](const auto& p) { return p.first != config_.trunk; });
    if (!off_trunk) {
        std::uniform_int_distribution<size_t> branch_dist(1, t.branch_names.size() - 1);
        const std::string& branch = t.branch_names[branch_dist(rng)];
        int depth = positions.back().second;
        positions.back() = {branch, depth};
    }

    std::vector<std::string> names = fileNamePool();
    std::shuffle(names.begin(), names.end(), rng);

    for (int i = 0; i < count; i++) {
        FileTarget file;
        file.id = std::to_string(i + 1);
        file.name = names[static_cast<size_t>(i)];
        file.branch = positions[static_cast<size_t>(i)].first;
        file.depth = positions[static_cast<size_t>(i)].second;
        puzzle.files.push_back(std::move(file));
    }
    return puzzle;
}

// ─── Accept/reject loop ────────────────────────────────────────

Puzzle PuzzleGenerator::generate(const std::string& seed_key, const std::string& puzzle_id,
                                 const std::optional<std::string>& date,
                                 Difficulty difficulty) const {
    const TierConfig& t = tier(difficulty);
    const BfsSolver solver;
    std::string last_reason = "no attempts made";

    for (int attempt = 0; attempt < config_.max_attempts; attempt++) {
        Puzzle puzzle = buildCandidate(seed_key, attempt, difficulty);
        puzzle.id = puzzle_id;
        puzzle.date = date;

        SolveResult solved = solver.solve(puzzle, config_.solver);
        if (!solved.solved) {
            last_reason = solved.budget_exhausted ? "search budget exhausted" : "unsolvable";
            gitty_log("Attempt " + std::to_string(attempt) + " for " + seed_key + " rejected: " +
                      last_reason, "Generator");
            continue;
        }
        if (solved.par_score < t.min_par || solved.par_score > t.max_par) {
            last_reason = "par " + std::to_string(solved.par_score) + " outside [" +
                          std::to_string(t.min_par) + ", " + std::to_string(t.max_par) + "]";
            gitty_log("Attempt " + std::to_string(attempt) + " for " + seed_key + " rejected: " +
                      last_reason, "Generator");
            continue;
        }

        puzzle.par_score = solved.par_score;
        puzzle.solution = std::move(solved.solution);
        gitty_log("Generated " + puzzle_id + " (" + difficultyName(difficulty) + ") with par " +
                  std::to_string(puzzle.par_score) + " on attempt " + std::to_string(attempt),
                  "Generator");
        return puzzle;
    }

    throw GenerationError(seed_key, config_.max_attempts, last_reason);
}

} // namespace gitty
