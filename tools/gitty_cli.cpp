// gitty command-line host: generate, solve and play puzzles.

#include "engine/command.hpp"
#include "engine/scoring.hpp"
#include "puzzle/puzzle_generator.hpp"
#include "search/bfs_solver.hpp"
#include "serialization/json_codec.hpp"
#include "session/puzzle_store.hpp"
#include "session/session_manager.hpp"
#include "session/session_store.hpp"
#include "util/log.hpp"

#include <fstream>
#include <iostream>
#include <optional>
#include <sstream>
#include <stdexcept>
#include <string>

namespace {

void print_usage() {
    std::cerr
        << "Usage:\n"
        << "  gitty_cli generate (--date YYYY-MM-DD | --archive ID) [--difficulty easy|medium|hard]\n"
        << "                     [--max-attempts N] [--out FILE] [--verbose]\n"
        << "  gitty_cli solve PUZZLE.json [--max-states N] [--budget SECONDS] [--verbose]\n"
        << "  gitty_cli play PUZZLE.json [--user NAME] [--verbose]\n";
}

gitty::Puzzle load_puzzle(const std::string& path) {
    std::ifstream in(path);
    if (!in) {
        throw std::runtime_error("Cannot open " + path);
    }
    std::stringstream buffer;
    buffer << in.rdbuf();
    return gitty::decodePuzzle(gitty::parseJson(buffer.str()));
}

void print_files(const std::vector<gitty::FileTarget>& files) {
    for (const auto& f : files) {
        std::cout << "  [" << (f.collected ? 'x' : ' ') << "] " << f.name
                  << " @ " << f.branch << ":" << f.depth << "\n";
    }
}

int generate(int argc, char** argv) {
    std::optional<std::string> date;
    std::optional<std::string> archive;
    std::string out_path;
    gitty::Difficulty difficulty = gitty::Difficulty::EASY;
    gitty::GeneratorConfig config;

    for (int i = 2; i < argc; ++i) {
        std::string arg = argv[i];
        if (arg == "--date" && i + 1 < argc) {
            date = argv[++i];
        } else if (arg == "--archive" && i + 1 < argc) {
            archive = argv[++i];
        } else if (arg == "--difficulty" && i + 1 < argc) {
            auto parsed = gitty::parseDifficulty(argv[++i]);
            if (!parsed) {
                std::cerr << "Unknown difficulty: " << argv[i] << "\n";
                return 1;
            }
            difficulty = *parsed;
        } else if (arg == "--max-attempts" && i + 1 < argc) {
            config.max_attempts = std::stoi(argv[++i]);
        } else if (arg == "--out" && i + 1 < argc) {
            out_path = argv[++i];
        } else if (arg == "--verbose") {
            gitty::set_logging_enabled(true);
        } else {
            print_usage();
            return 1;
        }
    }
    if (date.has_value() == archive.has_value()) {
        print_usage();
        return 1;
    }

    gitty::PuzzleGenerator generator(config);
    gitty::Puzzle puzzle = date ? generator.generateDaily(*date, difficulty)
                                : generator.generateArchive(*archive, difficulty);
    const std::string text = gitty::encodePuzzle(puzzle).dump(2);

    if (out_path.empty()) {
        std::cout << text << "\n";
    } else {
        std::ofstream out(out_path);
        if (!out) {
            std::cerr << "Cannot write " << out_path << "\n";
            return 1;
        }
        out << text << "\n";
        std::cerr << "Wrote " << puzzle.id << " (par " << puzzle.par_score << ") to "
                  << out_path << "\n";
    }
    return 0;
}

int solve(int argc, char** argv) {
    if (argc < 3) {
        print_usage();
        return 1;
    }
    const std::string path = argv[2];
    gitty::SolverConfig config;
    for (int i = 3; i < argc; ++i) {
        std::string arg = argv[i];
        if (arg == "--max-states" && i + 1 < argc) {
            config.max_states = std::stoul(argv[++i]);
        } else if (arg == "--budget" && i + 1 < argc) {
            config.budget_seconds = std::stod(argv[++i]);
        } else if (arg == "--verbose") {
            gitty::set_logging_enabled(true);
        } else {
            print_usage();
            return 1;
        }
    }

    gitty::Puzzle puzzle = load_puzzle(path);
    gitty::BfsSolver solver;
    gitty::SolveResult result = solver.solve(puzzle, config);

    std::cout << "states visited: " << result.states_visited
              << " (" << result.elapsed_seconds << "s)\n";
    if (!result.solved) {
        std::cout << (result.budget_exhausted ? "search budget exhausted\n" : "unsolvable\n");
        return 2;
    }
    std::cout << "par: " << result.par_score << "\n";
    for (const auto& cmd : result.solution) {
        std::cout << "  " << gitty::toString(cmd) << "\n";
    }
    return 0;
}

int play(int argc, char** argv) {
    if (argc < 3) {
        print_usage();
        return 1;
    }
    const std::string path = argv[2];
    std::string user = "player";
    for (int i = 3; i < argc; ++i) {
        std::string arg = argv[i];
        if (arg == "--user" && i + 1 < argc) {
            user = argv[++i];
        } else if (arg == "--verbose") {
            gitty::set_logging_enabled(true);
        } else {
            print_usage();
            return 1;
        }
    }

    gitty::InMemoryPuzzleStore puzzles;
    gitty::InMemorySessionStore sessions;
    gitty::Puzzle puzzle = load_puzzle(path);
    puzzles.save(puzzle);

    gitty::SessionManager manager(puzzles, sessions);
    gitty::GameState state = manager.open(puzzle.id, user);

    std::cout << "Puzzle " << puzzle.id << " (" << gitty::difficultyName(puzzle.difficulty)
              << ", par " << puzzle.par_score << ")\n";
    print_files(state.files);

    std::string line;
    while (std::cout << "> " << std::flush, std::getline(std::cin, line)) {
        if (line.empty()) continue;
        if (line == "quit" || line == "exit") {
            manager.abandon(puzzle.id, user);
            std::cout << "Session abandoned\n";
            return 0;
        }
        if (line == "status") {
            print_files(state.files);
            continue;
        }

        gitty::SessionReply reply = manager.submitLine(puzzle.id, user, line);
        state = reply.state;
        if (!reply.result.success) {
            std::cout << gitty::errorKindName(reply.result.error) << ": "
                      << reply.result.message << "\n";
            continue;
        }
        std::cout << reply.result.message << "\n";
        for (const auto& f : reply.result.files_collected) {
            std::cout << "  collected " << f.name << "\n";
        }
        if (reply.result.game_won) {
            if (auto rewards = manager.rewards(puzzle.id, user)) {
                std::cout << "Solved in " << rewards->commands_used << " commands ("
                          << gitty::performanceName(rewards->performance) << "), score "
                          << rewards->score << "\n";
            }
            return 0;
        }
    }
    return 0;
}

} // namespace

int main(int argc, char** argv) {
    if (argc < 2) {
        print_usage();
        return 1;
    }

    const std::string command = argv[1];
    try {
        if (command == "generate") return generate(argc, argv);
        if (command == "solve") return solve(argc, argv);
        if (command == "play") return play(argc, argv);
    } catch (const std::exception& e) {
        std::cerr << "error: " << e.what() << "\n";
        return 1;
    }

    print_usage();
    return 1;
}
