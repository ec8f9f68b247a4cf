#include "lensbridge/transport/session_manager.hpp"

namespace lensbridge {

// ─────────────────────────────────────────────────────────────────────────────
// State Queries
// ─────────────────────────────────────────────────────────────────────────────

SessionState SessionManager::state() const noexcept {
    std::lock_guard<std::mutex> lock(mutex_);
    return state_;
}

bool SessionManager::is_active() const noexcept {
    std::lock_guard<std::mutex> lock(mutex_);
    return state_ == SessionState::Active;
}

std::optional<SessionInfo> SessionManager::session() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return session_;
}

std::optional<std::string> SessionManager::session_id() const {
    std::lock_guard<std::mutex> lock(mutex_);
    if (session_.has_value() == false) {
        return std::nullopt;
    }
    return session_->session_id;
}

std::string SessionManager::last_error() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return last_error_;
}

// ─────────────────────────────────────────────────────────────────────────────
// State Transitions
// ─────────────────────────────────────────────────────────────────────────────

void SessionManager::begin_connect() {
    std::vector<StateChangeCallback> state_callbacks;
    std::vector<SessionLostCallback> lost_callbacks;
    SessionState old_state;
    bool was_active = false;

    {
        std::lock_guard<std::mutex> lock(mutex_);

        old_state = state_;
        was_active = (state_ == SessionState::Active);
        session_.reset();
        state_ = SessionState::Connecting;

        state_callbacks = state_change_callbacks_;
        if (was_active) {
            lost_callbacks = session_lost_callbacks_;
        }
    }

    if (was_active) {
        for (const auto& callback : lost_callbacks) {
            callback("Session replaced");
        }
    }
    if (old_state != SessionState::Connecting) {
        fire_state_change_unlocked(old_state, SessionState::Connecting, state_callbacks);
    }
}

bool SessionManager::stream_opened() {
    std::vector<StateChangeCallback> callbacks;

    {
        std::lock_guard<std::mutex> lock(mutex_);

        const bool is_connecting = (state_ == SessionState::Connecting);
        if (is_connecting == false) {
            return false;
        }

        state_ = SessionState::SessionPending;
        callbacks = state_change_callbacks_;
    }

    fire_state_change_unlocked(SessionState::Connecting, SessionState::SessionPending, callbacks);
    return true;
}

bool SessionManager::is_valid_session_id(std::string_view session_id) noexcept {
    if (session_id.empty()) {
        return false;
    }

    constexpr std::size_t max_session_id_length = 256;
    if (session_id.size() > max_session_id_length) {
        return false;
    }

    // Ids end up in logs and query strings
    for (char c : session_id) {
        const bool is_alphanumeric = (c >= 'a' && c <= 'z') ||
                                      (c >= 'A' && c <= 'Z') ||
                                      (c >= '0' && c <= '9');
        const bool is_safe_special = (c == '-') || (c == '_') || (c == '.');
        if (!is_alphanumeric && !is_safe_special) {
            return false;
        }
    }

    return true;
}

bool SessionManager::session_discovered(SessionInfo session) {
    const bool has_id = session.session_id.has_value();
    if (has_id && !is_valid_session_id(*session.session_id)) {
        return false;
    }
    if (session.endpoint_target.empty()) {
        return false;
    }

    std::vector<StateChangeCallback> state_callbacks;
    std::vector<SessionEstablishedCallback> established_callbacks;
    SessionState old_state;
    SessionInfo established;

    {
        std::lock_guard<std::mutex> lock(mutex_);

        const bool is_connecting = (state_ == SessionState::Connecting);
        const bool is_pending = (state_ == SessionState::SessionPending);
        if ((is_connecting || is_pending) == false) {
            return false;
        }

        session_ = std::move(session);
        last_error_.clear();

        old_state = state_;
        state_ = SessionState::Active;
        established = *session_;
        state_callbacks = state_change_callbacks_;
        established_callbacks = session_established_callbacks_;
    }

    fire_state_change_unlocked(old_state, SessionState::Active, state_callbacks);
    for (const auto& callback : established_callbacks) {
        callback(established);
    }
    return true;
}

void SessionManager::connection_failed(std::string reason) {
    std::vector<StateChangeCallback> callbacks;
    SessionState old_state;

    {
        std::lock_guard<std::mutex> lock(mutex_);

        const bool is_connecting = (state_ == SessionState::Connecting);
        const bool is_pending = (state_ == SessionState::SessionPending);
        if ((is_connecting || is_pending) == false) {
            return;
        }

        last_error_ = std::move(reason);
        session_.reset();

        old_state = state_;
        state_ = SessionState::Disconnected;
        callbacks = state_change_callbacks_;
    }

    fire_state_change_unlocked(old_state, SessionState::Disconnected, callbacks);
}

void SessionManager::invalidate(std::string reason) {
    std::vector<StateChangeCallback> state_callbacks;
    std::vector<SessionLostCallback> lost_callbacks;

    {
        std::lock_guard<std::mutex> lock(mutex_);

        const bool is_active = (state_ == SessionState::Active);
        if (is_active == false) {
            return;
        }

        session_.reset();
        last_error_ = reason;

        state_ = SessionState::Disconnected;
        state_callbacks = state_change_callbacks_;
        lost_callbacks = session_lost_callbacks_;
    }

    for (const auto& callback : lost_callbacks) {
        callback(reason);
    }
    fire_state_change_unlocked(SessionState::Active, SessionState::Disconnected, state_callbacks);
}

void SessionManager::reset() {
    std::vector<StateChangeCallback> callbacks;
    SessionState old_state;
    bool should_fire = false;

    {
        std::lock_guard<std::mutex> lock(mutex_);

        session_.reset();
        last_error_.clear();

        old_state = state_;
        state_ = SessionState::Disconnected;

        const bool state_changed = (old_state != SessionState::Disconnected);
        if (state_changed) {
            callbacks = state_change_callbacks_;
            should_fire = true;
        }
    }

    if (should_fire) {
        fire_state_change_unlocked(old_state, SessionState::Disconnected, callbacks);
    }
}

// ─────────────────────────────────────────────────────────────────────────────
// Event Callbacks
// ─────────────────────────────────────────────────────────────────────────────

void SessionManager::on_state_change(StateChangeCallback callback) {
    std::lock_guard<std::mutex> lock(mutex_);
    state_change_callbacks_.push_back(std::move(callback));
}

void SessionManager::on_session_established(SessionEstablishedCallback callback) {
    std::lock_guard<std::mutex> lock(mutex_);
    session_established_callbacks_.push_back(std::move(callback));
}

void SessionManager::on_session_lost(SessionLostCallback callback) {
    std::lock_guard<std::mutex> lock(mutex_);
    session_lost_callbacks_.push_back(std::move(callback));
}

void SessionManager::fire_state_change_unlocked(
    SessionState old_state,
    SessionState new_state,
    const std::vector<StateChangeCallback>& callbacks
) {
    for (const auto& callback : callbacks) {
        callback(old_state, new_state);
    }
}

}  // namespace lensbridge
