#include "session/puzzle_store.hpp"
#include "serialization/json_codec.hpp"

#include <fstream>
#include <stdexcept>

namespace gitty {

void InMemoryPuzzleStore::save(const Puzzle& puzzle) {
    puzzles_[puzzle.id] = puzzle;
}

std::optional<Puzzle> InMemoryPuzzleStore::load(const std::string& puzzle_id) const {
    auto it = puzzles_.find(puzzle_id);
    if (it == puzzles_.end()) return std::nullopt;
    return it->second;
}

std::optional<Puzzle> InMemoryPuzzleStore::loadByDate(const std::string& date,
                                                      Difficulty difficulty) const {
    for (const auto& [id, puzzle] : puzzles_) {
        if (puzzle.date && *puzzle.date == date && puzzle.difficulty == difficulty) {
            return puzzle;
        }
    }
    return std::nullopt;
}

std::vector<std::string> InMemoryPuzzleStore::ids() const {
    std::vector<std::string> result;
    result.reserve(puzzles_.size());
    for (const auto& [id, puzzle] : puzzles_) result.push_back(id);
    return result;
}

void InMemoryPuzzleStore::exportToFile(const std::string& path) const {
    std::ofstream out(path);
    if (!out) {
        throw std::runtime_error("Cannot open " + path + " for writing");
    }
    for (const auto& [id, puzzle] : puzzles_) {
        out << encodePuzzle(puzzle).dump() << "\n";
    }
}

size_t InMemoryPuzzleStore::importFromFile(const std::string& path) {
    std::ifstream in(path);
    if (!in) {
        throw std::runtime_error("Cannot open " + path + " for reading");
    }
    size_t imported = 0;
    std::string line;
    while (std::getline(in, line)) {
        if (line.empty()) continue;
        save(decodePuzzle(parseJson(line)));
        imported++;
    }
    return imported;
}

} // namespace gitty
