#pragma once

#include <ferry/core/types.h>
#include <ferry/downloader/downloader.hpp>
#include <ferry/media/format_catalog.h>
#include <ferry/media/selection_key.h>
#include <ferry/progress/progress_reporter.h>
#include <ferry/session/session_registry.h>
#include <ferry/uploader/uploader.hpp>

#include <boost/asio/awaitable.hpp>

#include <cstdint>
#include <filesystem>
#include <optional>
#include <string>
#include <vector>

namespace ferry::pipeline {

// ================
// Size routing
// ================

enum class Route { Inline, Offload };

constexpr const char* toString(Route route) {
    return route == Route::Offload ? "offload" : "inline";
}

struct RoutingPolicy {
    std::uint64_t inlineThresholdBytes{2048 * MiB};
    bool forceOffload{false};
};

// size > threshold, or forceOffload -> Offload.
Route routeFor(std::uint64_t sizeBytes, const RoutingPolicy& policy);

// ======================
// External collaborators
// ======================

struct DeliveryRequest {
    SessionId sessionId;
    std::string owner;
    std::string correlation;
    std::filesystem::path path;
    std::string title;
    std::uint64_t sizeBytes{0};
    media::FormatVariant variant;
};

/**
 * Sends an artifact small enough to go directly to the requester.
 * Must not take ownership of the file; the coordinator deletes it afterwards.
 */
class IInlineDelivery {
public:
    virtual ~IInlineDelivery() = default;
    virtual boost::asio::awaitable<Result<void>> deliver(DeliveryRequest request) = 0;
};

enum class AuditEvent {
    RequestReceived,
    DownloadStarted,
    DeliveredInline,
    Offloaded,
    ArtifactDeleted,
    CleanupWarning,
    Failed,
    Expired
};

constexpr const char* toString(AuditEvent event) {
    switch (event) {
        case AuditEvent::RequestReceived: return "request";
        case AuditEvent::DownloadStarted: return "download-started";
        case AuditEvent::DeliveredInline: return "delivered";
        case AuditEvent::Offloaded: return "offloaded";
        case AuditEvent::ArtifactDeleted: return "artifact-deleted";
        case AuditEvent::CleanupWarning: return "cleanup-warning";
        case AuditEvent::Failed: return "failed";
        case AuditEvent::Expired: return "expired";
    }
    return "unknown";
}

struct AuditRecord {
    AuditEvent event{AuditEvent::RequestReceived};
    SessionId sessionId;
    std::string owner;
    std::string detail;
};

// Operator-facing trail, separate from the requester's status channel.
class IAuditLog {
public:
    virtual ~IAuditLog() = default;
    virtual void record(const AuditRecord& record) = 0;
};

// ================
// Results
// ================

struct ResolvedRequest {
    SessionId sessionId;
    std::string sourceUri;
    std::string title;
    std::string uploader;
    std::optional<double> durationSeconds;
    std::optional<std::uint64_t> viewCount;
    media::FormatCatalog catalog;
};

struct MenuEntry {
    std::string label;
    std::string selectionKey;
    media::MediaKind kind{media::MediaKind::Video};
    std::string quality;
    std::string container;
};

// Audio formats first, then video qualities by ascending height, containers sorted.
std::vector<MenuEntry> buildMenu(const SessionId& sessionId, const media::FormatCatalog& catalog);

struct PipelineOutcome {
    SessionId sessionId;
    session::SessionStatus status{session::SessionStatus::Failed}; // Complete or Failed
    std::optional<Route> route;
    std::string title;
    std::uint64_t sizeBytes{0};
    std::optional<uploader::UploadResult> upload;
    std::vector<uploader::TransferAttempt> attempts;
    std::optional<Error> error;
    bool cleanupWarning{false};
    std::string summary; // the terminal message sent to the status sink
};

// ================
// Coordinator
// ================

struct CoordinatorOptions {
    RoutingPolicy routing{};
    progress::ReporterOptions progress{};
};

struct CoordinatorDeps {
    session::SessionRegistry& registry;
    downloader::DownloadOrchestrator& downloader;
    uploader::UploadOrchestrator& uploader;
    progress::IStatusSink& sink;
    IInlineDelivery& delivery;
    IAuditLog& audit;
};

/**
 * Drives one session through
 *   Pending -> Resolving -> AwaitingSelection -> Fetching -> SizeCheck
 *     -> {DeliveringInline | Offloading} -> Cleanup -> {Complete | Failed}
 *
 * Runs on the single-threaded scheduler. Every session that reaches Complete or Failed gets
 * exactly one terminal message on the status sink, one cleanup pass and is removed from
 * the registry.
 */
class PipelineCoordinator {
public:
    PipelineCoordinator(CoordinatorDeps deps, CoordinatorOptions options = {});

    /**
     * Validates the uri, registers a session and resolves its format catalog.
     * ValidationError (bad uri, nothing registered), AlreadyExists (id in flight),
     * ResolutionError (session failed and removed).
     */
    boost::asio::awaitable<Result<ResolvedRequest>>
    submit(std::string uri, std::string owner, std::string correlation);

    /**
     * Runs the selected variant to completion. ValidationError, SelectionError and
     * SessionExpired are returned before any state change; every other failure yields an
     * outcome with status Failed.
     */
    boost::asio::awaitable<Result<PipelineOutcome>> select(std::string selectionKey);

    std::vector<MenuEntry> menuFor(const ResolvedRequest& request) const;

    // Drops sessions whose selection window elapsed.
    std::size_t purgeExpired();

private:
    // Fetch, route and deliver a claimed session; fills `outcome` and `artifact`.
    boost::asio::awaitable<void> runSelected(const session::TransferSession& s,
                                             progress::ProgressReporter& reporter,
                                             PipelineOutcome& outcome,
                                             std::optional<std::filesystem::path>& artifact);
    void advance(const SessionId& id, session::SessionStatus to);
    void audit(AuditEvent event, const session::TransferSession& s, std::string detail);
    void finish(const session::TransferSession& s, PipelineOutcome& outcome,
                const std::optional<std::filesystem::path>& artifact);
    std::string describe(const PipelineOutcome& outcome) const;

    CoordinatorDeps deps_;
    CoordinatorOptions options_;
};

} // namespace ferry::pipeline
