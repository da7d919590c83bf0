#include <spdlog/spdlog.h>
#include <ferry/session/session_registry.h>

namespace ferry::session {

bool canTransition(SessionStatus from, SessionStatus to) {
    if (isTerminal(from)) {
        return false;
    }
    if (to == SessionStatus::Failed) {
        return true;
    }
    if (to == SessionStatus::Cleanup) {
        return from != SessionStatus::Cleanup;
    }
    switch (from) {
        case SessionStatus::Pending:
            return to == SessionStatus::Resolving;
        case SessionStatus::Resolving:
            return to == SessionStatus::AwaitingSelection;
        case SessionStatus::AwaitingSelection:
            return to == SessionStatus::Fetching || to == SessionStatus::Expired;
        case SessionStatus::Fetching:
            return to == SessionStatus::SizeCheck;
        case SessionStatus::SizeCheck:
            return to == SessionStatus::DeliveringInline || to == SessionStatus::Offloading;
        case SessionStatus::DeliveringInline:
        case SessionStatus::Offloading:
            return false; // only Cleanup / Failed, handled above
        case SessionStatus::Cleanup:
            return to == SessionStatus::Complete;
        default:
            return false;
    }
}

SessionRegistry::SessionRegistry(RegistryOptions options) : options_(std::move(options)) {}

SteadyPoint SessionRegistry::now() const {
    return options_.clock ? options_.clock() : std::chrono::steady_clock::now();
}

bool SessionRegistry::isExpiredLocked(const TransferSession& s, SteadyPoint at) const {
    return s.status == SessionStatus::AwaitingSelection && s.awaitingSince &&
           at - *s.awaitingSince > options_.ttl;
}

Result<void> SessionRegistry::insert(TransferSession session) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = sessions_.find(session.id);
    if (it != sessions_.end()) {
        const auto status = it->second.status;
        if (status != SessionStatus::AwaitingSelection && !isTerminal(status)) {
            return Error{ErrorCode::AlreadyExists,
                         "session " + session.id + " is already " + toString(status)};
        }
        spdlog::debug("[Registry] replacing session {} ({})", session.id, toString(status));
        sessions_.erase(it);
    }
    if (session.status == SessionStatus::AwaitingSelection && !session.awaitingSince) {
        session.awaitingSince = now();
    }
    auto id = session.id;
    sessions_.emplace(std::move(id), std::move(session));
    return Result<void>();
}

LookupResult SessionRegistry::lookup(const SessionId& id) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = sessions_.find(id);
    if (it == sessions_.end()) {
        return LookupResult{LookupStatus::NotFound, std::nullopt};
    }
    if (isExpiredLocked(it->second, now())) {
        spdlog::info("[Registry] session {} expired while awaiting selection", id);
        sessions_.erase(it);
        return LookupResult{LookupStatus::Expired, std::nullopt};
    }
    return LookupResult{LookupStatus::Found, it->second};
}

Result<void> SessionRegistry::transition(const SessionId& id, SessionStatus to) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = sessions_.find(id);
    if (it == sessions_.end()) {
        return Error{ErrorCode::NotFound, "unknown session " + id};
    }
    auto& s = it->second;
    if (!canTransition(s.status, to)) {
        return Error{ErrorCode::InvalidState, std::string("illegal transition ") +
                                                  toString(s.status) + " -> " + toString(to) +
                                                  " for session " + id};
    }
    spdlog::debug("[Registry] {}: {} -> {}", id, toString(s.status), toString(to));
    s.status = to;
    if (to == SessionStatus::AwaitingSelection) {
        s.awaitingSince = now();
    }
    return Result<void>();
}

Result<void> SessionRegistry::update(const SessionId& id,
                                     const std::function<void(TransferSession&)>& fn) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = sessions_.find(id);
    if (it == sessions_.end()) {
        return Error{ErrorCode::NotFound, "unknown session " + id};
    }
    const auto status = it->second.status;
    fn(it->second);
    it->second.status = status;
    return Result<void>();
}

Result<TransferSession> SessionRegistry::claimForSelection(const media::SelectionKey& key) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = sessions_.find(key.sessionId);
    if (it == sessions_.end()) {
        return Error{ErrorCode::SelectionError, "unknown or finished session " + key.sessionId};
    }
    auto& s = it->second;
    if (isExpiredLocked(s, now())) {
        spdlog::info("[Registry] selection for {} arrived after the TTL", key.sessionId);
        sessions_.erase(it);
        return Error{ErrorCode::SessionExpired, "session " + key.sessionId + " expired"};
    }
    if (s.status != SessionStatus::AwaitingSelection) {
        return Error{ErrorCode::SelectionError, "session " + key.sessionId + " is already " +
                                                    toString(s.status)};
    }
    auto variant = media::resolveVariant(s.catalog, key);
    if (!variant) {
        return variant.error();
    }
    s.variant = std::move(variant).value();
    s.status = SessionStatus::Fetching;
    return s;
}

bool SessionRegistry::remove(const SessionId& id) {
    std::lock_guard<std::mutex> lock(mutex_);
    return sessions_.erase(id) > 0;
}

std::size_t SessionRegistry::purgeExpired() {
    std::lock_guard<std::mutex> lock(mutex_);
    const auto at = now();
    std::size_t dropped = 0;
    for (auto it = sessions_.begin(); it != sessions_.end();) {
        if (isExpiredLocked(it->second, at)) {
            it = sessions_.erase(it);
            ++dropped;
        } else {
            ++it;
        }
    }
    if (dropped > 0) {
        spdlog::debug("[Registry] purged {} expired session(s)", dropped);
    }
    return dropped;
}

std::size_t SessionRegistry::size() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return sessions_.size();
}

} // namespace ferry::session
