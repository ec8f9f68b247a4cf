#pragma once

#include <functional>
#include <mutex>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace lensbridge {

// ─────────────────────────────────────────────────────────────────────────────
// Session State
// ─────────────────────────────────────────────────────────────────────────────

/// Lifecycle of the upstream session.
///
///                 ┌──────────────┐
///       ┌────────▶│ Disconnected │◀──────────────────────────┐
///       │         └──────┬───────┘                           │
///       │                │ begin_connect()                   │
///       │                ▼                                   │
///       │         ┌──────────────┐                           │
///       ├─────────│  Connecting  │                           │
///       │         └──────┬───────┘                           │
///       │                │ stream_opened()                   │
///       │ connection_    ▼                                   │
///       │ failed() ┌──────────────┐                          │
///       └──────────│SessionPending│                          │
///                  └──────┬───────┘                          │
///                         │ session_discovered()             │
///                         ▼                                  │
///                  ┌──────────────┐  invalidate()            │
///                  │    Active    │──────────────────────────┘
///                  └──────────────┘
///
/// begin_connect() is accepted from every state; from Active it drops the
/// current session first, so re-establishment replaces it.
enum class SessionState {
    Disconnected,    ///< No session, nothing in progress
    Connecting,      ///< Session stream requested
    SessionPending,  ///< Stream open, waiting for the announcement line
    Active           ///< Message endpoint known
};

[[nodiscard]] constexpr std::string_view to_string(SessionState state) noexcept {
    switch (state) {
        case SessionState::Disconnected:   return "Disconnected";
        case SessionState::Connecting:     return "Connecting";
        case SessionState::SessionPending: return "SessionPending";
        case SessionState::Active:         return "Active";
    }
    return "Unknown";
}

/// What the announcement line told us.
struct SessionInfo {
    std::optional<std::string> session_id;  // absent for a bare "/message" line
    std::string endpoint_target;            // path and query relative to the upstream origin
    std::string message_url;                // absolute URL, for logs and introspection
};

// ─────────────────────────────────────────────────────────────────────────────
// Session Manager
// ─────────────────────────────────────────────────────────────────────────────

/// Thread-safe session state machine. Callbacks are fired after the internal
/// lock is released, so they may query the manager.
class SessionManager {
public:
    using StateChangeCallback = std::function<void(SessionState old_state, SessionState new_state)>;
    using SessionEstablishedCallback = std::function<void(const SessionInfo& session)>;
    using SessionLostCallback = std::function<void(const std::string& reason)>;

    SessionManager() = default;

    SessionManager(const SessionManager&) = delete;
    SessionManager& operator=(const SessionManager&) = delete;
    SessionManager(SessionManager&&) = delete;
    SessionManager& operator=(SessionManager&&) = delete;

    ~SessionManager() = default;

    // ─────────────────────────────────────────────────────────────────────────
    // State Queries
    // ─────────────────────────────────────────────────────────────────────────

    [[nodiscard]] SessionState state() const noexcept;

    [[nodiscard]] bool is_active() const noexcept;

    [[nodiscard]] std::optional<SessionInfo> session() const;

    [[nodiscard]] std::optional<std::string> session_id() const;

    /// Reason of the last failed establishment or invalidation
    [[nodiscard]] std::string last_error() const;

    // ─────────────────────────────────────────────────────────────────────────
    // State Transitions
    // ─────────────────────────────────────────────────────────────────────────

    /// * → Connecting. Fires session-lost when an Active session is dropped.
    void begin_connect();

    /// Connecting → SessionPending. Returns false from any other state.
    bool stream_opened();

    /// Connecting|SessionPending → Active.
    /// Returns false for an invalid session id or from any other state.
    [[nodiscard]] bool session_discovered(SessionInfo session);

    /// Connecting|SessionPending → Disconnected
    void connection_failed(std::string reason);

    /// Active → Disconnected
    void invalidate(std::string reason);

    /// * → Disconnected, clearing the session and the last error
    void reset();

    /// Non-empty, at most 256 characters of [A-Za-z0-9._-]
    [[nodiscard]] static bool is_valid_session_id(std::string_view session_id) noexcept;

    // ─────────────────────────────────────────────────────────────────────────
    // Event Callbacks
    // ─────────────────────────────────────────────────────────────────────────

    void on_state_change(StateChangeCallback callback);
    void on_session_established(SessionEstablishedCallback callback);
    void on_session_lost(SessionLostCallback callback);

private:
    void fire_state_change_unlocked(
        SessionState old_state,
        SessionState new_state,
        const std::vector<StateChangeCallback>& callbacks
    );

    mutable std::mutex mutex_;
    SessionState state_{SessionState::Disconnected};
    std::optional<SessionInfo> session_;
    std::string last_error_;

    std::vector<StateChangeCallback> state_change_callbacks_;
    std::vector<SessionEstablishedCallback> session_established_callbacks_;
    std::vector<SessionLostCallback> session_lost_callbacks_;
};

}  // namespace lensbridge
