#include "puzzle/puzzle.hpp"

namespace gitty {

std::string difficultyName(Difficulty difficulty) {
    switch (difficulty) {
        case Difficulty::EASY:   return "easy";
        case Difficulty::MEDIUM: return "medium";
        case Difficulty::HARD:   return "hard";
    }
    return "unknown";
}

std::optional<Difficulty> parseDifficulty(const std::string& name) {
    if (name == "easy") return Difficulty::EASY;
    if (name == "medium") return Difficulty::MEDIUM;
    if (name == "hard") return Difficulty::HARD;
    return std::nullopt;
}

} // namespace gitty
