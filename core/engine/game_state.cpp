#include "engine/game_state.hpp"

#include <algorithm>

namespace gitty {

std::string gameStatusName(GameStatus status) {
    switch (status) {
        case GameStatus::IN_PROGRESS: return "in_progress";
        case GameStatus::WON:         return "won";
        case GameStatus::ABANDONED:   return "abandoned";
    }
    return "unknown";
}

std::optional<GameStatus> parseGameStatus(const std::string& name) {
    if (name == "in_progress") return GameStatus::IN_PROGRESS;
    if (name == "won") return GameStatus::WON;
    if (name == "abandoned") return GameStatus::ABANDONED;
    return std::nullopt;
}

bool GameState::allFilesCollected() const {
    return std::all_of(files.begin(), files.end(),
                       [](const FileTarget& f) { return f.collected; });
}

std::vector<std::string> GameState::collectedFileIds() const {
    std::vector<std::string> ids;
    for (const auto& f : files) {
        if (f.collected) ids.push_back(f.id);
    }
    std::sort(ids.begin(), ids.end());
    return ids;
}

} // namespace gitty
