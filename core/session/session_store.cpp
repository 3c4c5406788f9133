#include "session/session_store.hpp"
#include "serialization/json_codec.hpp"

namespace gitty {

void InMemorySessionStore::save(const std::string& session_id, const GameState& state) {
    documents_[session_id] = encodeGameState(state).dump();
    saves_++;
}

std::optional<GameState> InMemorySessionStore::load(const std::string& session_id) const {
    auto it = documents_.find(session_id);
    if (it == documents_.end()) return std::nullopt;
    return decodeGameState(parseJson(it->second));
}

bool InMemorySessionStore::remove(const std::string& session_id) {
    return documents_.erase(session_id) > 0;
}

std::string InMemorySessionStore::document(const std::string& session_id) const {
    auto it = documents_.find(session_id);
    return it != documents_.end() ? it->second : std::string();
}

} // namespace gitty
