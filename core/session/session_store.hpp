#pragma once

#include "engine/game_state.hpp"

#include <map>
#include <optional>
#include <string>

namespace gitty {

// ─── Session Store ─────────────────────────────────────────────
// Durable checkpoints of per-player game state. A checkpoint is the
// whole GameState, undo stack included, so a session can be rebuilt
// on any host.

class SessionStore {
public:
    virtual ~SessionStore() = default;

    /// Insert or replace the checkpoint for `session_id`.
    virtual void save(const std::string& session_id, const GameState& state) = 0;

    virtual std::optional<GameState> load(const std::string& session_id) const = 0;

    virtual bool remove(const std::string& session_id) = 0;

    virtual size_t count() const = 0;
};

/// Keeps each checkpoint as its serialized JSON document, so loading
/// goes through the same decode path a remote store would.
class InMemorySessionStore : public SessionStore {
public:
    InMemorySessionStore() = default;

    void save(const std::string& session_id, const GameState& state) override;
    std::optional<GameState> load(const std::string& session_id) const override;
    bool remove(const std::string& session_id) override;
    size_t count() const override { return documents_.size(); }

    /// Number of save() calls so far.
    size_t saveCount() const { return saves_; }

    /// Raw document for `session_id`, empty if absent.
    std::string document(const std::string& session_id) const;

private:
    std::map<std::string, std::string> documents_;
    size_t saves_ = 0;
};

} // namespace gitty
