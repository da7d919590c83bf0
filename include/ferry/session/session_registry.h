#pragma once

#include <ferry/core/types.h>
#include <ferry/media/format_catalog.h>
#include <ferry/media/selection_key.h>

#include <chrono>
#include <cstddef>
#include <functional>
#include <mutex>
#include <optional>
#include <string>
#include <unordered_map>

namespace ferry::session {

enum class SessionStatus {
    Pending,
    Resolving,
    AwaitingSelection,
    Fetching,
    SizeCheck,
    DeliveringInline,
    Offloading,
    Cleanup,
    Complete,
    Failed,
    Expired
};

constexpr const char* toString(SessionStatus status) {
    switch (status) {
        case SessionStatus::Pending: return "Pending";
        case SessionStatus::Resolving: return "Resolving";
        case SessionStatus::AwaitingSelection: return "AwaitingSelection";
        case SessionStatus::Fetching: return "Fetching";
        case SessionStatus::SizeCheck: return "SizeCheck";
        case SessionStatus::DeliveringInline: return "DeliveringInline";
        case SessionStatus::Offloading: return "Offloading";
        case SessionStatus::Cleanup: return "Cleanup";
        case SessionStatus::Complete: return "Complete";
        case SessionStatus::Failed: return "Failed";
        case SessionStatus::Expired: return "Expired";
    }
    return "Unknown";
}

constexpr bool isTerminal(SessionStatus status) {
    return status == SessionStatus::Complete || status == SessionStatus::Failed ||
           status == SessionStatus::Expired;
}

// Forward edges of the pipeline, plus: any non-terminal state -> Cleanup (once) or Failed,
// AwaitingSelection -> Expired.
bool canTransition(SessionStatus from, SessionStatus to);

struct TransferSession {
    SessionId id;
    std::string sourceUri;
    std::optional<media::FormatVariant> variant;
    SessionStatus status{SessionStatus::Pending};
    std::string owner;
    TimePoint createdAt{};
    std::string correlation;
    std::string title;
    media::FormatCatalog catalog;
    // Set on entry to AwaitingSelection; the TTL counts from here.
    std::optional<SteadyPoint> awaitingSince;
};

enum class LookupStatus { Found, NotFound, Expired };

struct LookupResult {
    LookupStatus status{LookupStatus::NotFound};
    std::optional<TransferSession> session; // copy, only when Found
};

struct RegistryOptions {
    std::chrono::seconds ttl{900};
    std::function<SteadyPoint()> clock; // empty = steady_clock::now
};

/**
 * Explicitly owned store of live transfer sessions.
 *
 * All mutations of one id are serialized by the registry lock. Expiry is lazy: a session
 * waiting for a selection longer than the TTL is marked Expired and dropped the next time
 * it is touched (or by purgeExpired()).
 */
class SessionRegistry {
public:
    explicit SessionRegistry(RegistryOptions options = {});

    SessionRegistry(const SessionRegistry&) = delete;
    SessionRegistry& operator=(const SessionRegistry&) = delete;

    // AlreadyExists if a session with this id is in flight. A session still waiting for a
    // selection is replaced.
    Result<void> insert(TransferSession session);

    LookupResult lookup(const SessionId& id);

    // InvalidState on an illegal edge, NotFound for unknown ids.
    Result<void> transition(const SessionId& id, SessionStatus to);

    // Applies fn to the live session under the lock; fn must not change `status`.
    Result<void> update(const SessionId& id, const std::function<void(TransferSession&)>& fn);

    /**
     * Atomically binds the variant named by `key` and moves AwaitingSelection -> Fetching.
     * SelectionError: unknown id, already claimed, or no such variant (nothing is mutated).
     * SessionExpired: TTL elapsed; the session is marked Expired and removed.
     */
    Result<TransferSession> claimForSelection(const media::SelectionKey& key);

    // True exactly once per live id.
    bool remove(const SessionId& id);

    // Drops every expired AwaitingSelection session; returns how many were dropped.
    std::size_t purgeExpired();

    std::size_t size() const;

private:
    SteadyPoint now() const;
    bool isExpiredLocked(const TransferSession& s, SteadyPoint at) const;

    RegistryOptions options_;
    mutable std::mutex mutex_;
    std::unordered_map<SessionId, TransferSession> sessions_;
};

} // namespace ferry::session
