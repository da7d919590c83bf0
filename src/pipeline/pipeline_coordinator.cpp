#include <spdlog/spdlog.h>
#include <ferry/media/source_uri.h>
#include <ferry/pipeline/pipeline_coordinator.h>

#include <fmt/format.h>

#include <algorithm>
#include <cctype>
#include <exception>
#include <system_error>

namespace ferry::pipeline {

using session::SessionStatus;

namespace {

std::string upper(std::string s) {
    std::transform(s.begin(), s.end(), s.begin(),
                   [](unsigned char c) { return static_cast<char>(std::toupper(c)); });
    return s;
}

// Re-labels a module error with its pipeline-level kind, keeping the detail.
Error wrap(ErrorCode kind, const Error& inner) {
    return Error{kind, fmt::format("{}: {}", errorToString(inner.code), inner.message)};
}

} // namespace

Route routeFor(std::uint64_t sizeBytes, const RoutingPolicy& policy) {
    if (policy.forceOffload || sizeBytes > policy.inlineThresholdBytes) {
        return Route::Offload;
    }
    return Route::Inline;
}

std::vector<MenuEntry> buildMenu(const SessionId& sessionId, const media::FormatCatalog& catalog) {
    std::vector<MenuEntry> menu;
    for (const auto kind : {media::MediaKind::Audio, media::MediaKind::Video}) {
        for (const auto& quality : catalog.qualities(kind)) {
            for (const auto& container : catalog.containers(kind, quality)) {
                auto best = catalog.best(media::VariantKey{kind, quality, container});
                if (!best) {
                    continue;
                }
                MenuEntry entry;
                entry.kind = kind;
                entry.quality = quality;
                entry.container = container;
                entry.label = kind == media::MediaKind::Audio
                                  ? fmt::format("Audio {}", upper(quality))
                                  : fmt::format("{} {}", quality, container);
                entry.selectionKey = media::makeSelectionKey(*best, sessionId).encode();
                menu.push_back(std::move(entry));
            }
        }
    }
    return menu;
}

PipelineCoordinator::PipelineCoordinator(CoordinatorDeps deps, CoordinatorOptions options)
    : deps_(deps), options_(std::move(options)) {}

std::vector<MenuEntry> PipelineCoordinator::menuFor(const ResolvedRequest& request) const {
    return buildMenu(request.sessionId, request.catalog);
}

std::size_t PipelineCoordinator::purgeExpired() {
    return deps_.registry.purgeExpired();
}

void PipelineCoordinator::advance(const SessionId& id, SessionStatus to) {
    if (auto r = deps_.registry.transition(id, to); !r) {
        spdlog::error("[Coordinator] {}", r.error().message);
    }
}

void PipelineCoordinator::audit(AuditEvent event, const session::TransferSession& s,
                                std::string detail) {
    deps_.audit.record(AuditRecord{event, s.id, s.owner, std::move(detail)});
}

std::string PipelineCoordinator::describe(const PipelineOutcome& outcome) const {
    const auto& title = outcome.title.empty() ? std::string(media::kUnknownTitle) : outcome.title;
    if (outcome.status != SessionStatus::Complete) {
        return fmt::format("Failed: {}\n{}", title,
                           outcome.error ? outcome.error->message : std::string("unknown error"));
    }
    const auto size = progress::formatSize(static_cast<double>(outcome.sizeBytes));
    if (outcome.upload) {
        std::string text = fmt::format("Uploaded: {} ({})\nDownload: {}", title, size,
                                       outcome.upload->downloadPage);
        if (!outcome.upload->directLink.empty()) {
            text += fmt::format("\nDirect link: {}", outcome.upload->directLink);
        }
        return text;
    }
    return fmt::format("Delivered: {} ({})", title, size);
}

void PipelineCoordinator::finish(const session::TransferSession& s, PipelineOutcome& outcome,
                                 const std::optional<std::filesystem::path>& artifact) {
    advance(s.id, SessionStatus::Cleanup);

    if (artifact && !artifact->empty()) {
        std::error_code ec;
        const bool existed = std::filesystem::exists(*artifact, ec);
        std::filesystem::remove(*artifact, ec);
        if (ec) {
            outcome.cleanupWarning = true;
            spdlog::warn("[Coordinator] {}: could not delete {}: {}", s.id, artifact->string(),
                         ec.message());
            audit(AuditEvent::CleanupWarning, s,
                  fmt::format("{}: {}", artifact->string(), ec.message()));
        } else if (existed) {
            audit(AuditEvent::ArtifactDeleted, s, artifact->string());
        }
    }

    advance(s.id, outcome.status);
    deps_.registry.remove(s.id);

    if (outcome.status == SessionStatus::Failed) {
        audit(AuditEvent::Failed, s,
              outcome.error ? outcome.error->message : std::string("unknown error"));
    }

    outcome.summary = describe(outcome);
    try {
        deps_.sink.send(s.correlation, outcome.summary);
    } catch (const std::exception& e) {
        spdlog::debug("[Coordinator] final status for {} dropped: {}", s.id, e.what());
    } catch (...) {
        spdlog::debug("[Coordinator] final status for {} dropped: unknown error", s.id);
    }
    spdlog::info("[Coordinator] {} finished: {}", s.id, session::toString(outcome.status));
}

boost::asio::awaitable<Result<ResolvedRequest>>
PipelineCoordinator::submit(std::string uri, std::string owner, std::string correlation) {
    auto valid = media::validateUri(uri);
    if (!valid) {
        co_return valid.error();
    }
    auto id = media::sessionIdFor(valid.value());
    if (!id) {
        co_return id.error();
    }

    session::TransferSession s;
    s.id = id.value();
    s.sourceUri = valid.value();
    s.owner = std::move(owner);
    s.correlation = std::move(correlation);
    s.createdAt = std::chrono::system_clock::now();
    if (auto r = deps_.registry.insert(s); !r) {
        co_return r.error();
    }
    audit(AuditEvent::RequestReceived, s, s.sourceUri);
    spdlog::info("[Coordinator] {} requested by {}", s.id, s.owner);

    advance(s.id, SessionStatus::Resolving);
    auto resolved = co_await deps_.downloader.resolve(s.sourceUri);
    if (!resolved) {
        PipelineOutcome outcome;
        outcome.sessionId = s.id;
        outcome.status = SessionStatus::Failed;
        outcome.error = wrap(ErrorCode::ResolutionError, resolved.error());
        finish(s, outcome, std::nullopt);
        co_return *outcome.error;
    }

    auto found = std::move(resolved).value();
    ResolvedRequest request;
    request.sessionId = s.id;
    request.sourceUri = s.sourceUri;
    request.title = found.info.title;
    request.uploader = found.info.uploader;
    request.durationSeconds = found.info.durationSeconds;
    request.viewCount = found.info.viewCount;
    request.catalog = found.catalog;

    if (auto r = deps_.registry.update(s.id,
                                       [&](session::TransferSession& live) {
                                           live.title = found.info.title;
                                           live.catalog = std::move(found.catalog);
                                       });
        !r) {
        co_return r.error();
    }
    advance(s.id, SessionStatus::AwaitingSelection);
    co_return request;
}

boost::asio::awaitable<Result<PipelineOutcome>>
PipelineCoordinator::select(std::string selectionKey) {
    auto key = media::parseSelectionKey(selectionKey);
    if (!key) {
        co_return key.error();
    }

    auto claimed = deps_.registry.claimForSelection(key.value());
    if (!claimed) {
        const auto& err = claimed.error();
        if (err.code == ErrorCode::SessionExpired) {
            deps_.audit.record(AuditRecord{AuditEvent::Expired, key.value().sessionId, {},
                                           err.message});
        }
        co_return err;
    }
    const auto s = std::move(claimed).value();

    PipelineOutcome outcome;
    outcome.sessionId = s.id;
    outcome.title = s.title;

    progress::ProgressReporter reporter(deps_.sink, s.correlation, options_.progress);
    reporter.setHeader(fmt::format("Title: {}\nStatus:\n", s.title));

    // Whatever a collaborator throws, the claimed session still gets its cleanup pass.
    std::optional<std::filesystem::path> artifact;
    try {
        co_await runSelected(s, reporter, outcome, artifact);
    } catch (const std::exception& e) {
        spdlog::error("[Coordinator] {} aborted: {}", s.id, e.what());
        outcome.status = SessionStatus::Failed;
        outcome.error = Error{ErrorCode::InternalError,
                              fmt::format("{}: {}", errorToString(ErrorCode::InternalError),
                                          e.what())};
    } catch (...) {
        spdlog::error("[Coordinator] {} aborted by an unknown exception", s.id);
        outcome.status = SessionStatus::Failed;
        outcome.error = Error{ErrorCode::InternalError,
                              fmt::format("{}: unknown exception",
                                          errorToString(ErrorCode::InternalError))};
    }

    finish(s, outcome, artifact);
    co_return outcome;
}

boost::asio::awaitable<void>
PipelineCoordinator::runSelected(const session::TransferSession& s,
                                 progress::ProgressReporter& reporter, PipelineOutcome& outcome,
                                 std::optional<std::filesystem::path>& artifact) {
    const auto& variant = *s.variant;

    audit(AuditEvent::DownloadStarted, s,
          fmt::format("{} {} {}", media::toString(variant.kind), variant.quality,
                      variant.container));

    auto fetched =
        co_await deps_.downloader.fetch(s.sourceUri, s.id, variant, reporter);
    if (!fetched) {
        outcome.status = SessionStatus::Failed;
        outcome.error = wrap(ErrorCode::TransferError, fetched.error());
        co_return;
    }
    artifact = fetched.value().path;
    outcome.sizeBytes = fetched.value().sizeBytes;
    if (!fetched.value().title.empty()) {
        outcome.title = fetched.value().title;
    }

    advance(s.id, SessionStatus::SizeCheck);
    const auto route = routeFor(outcome.sizeBytes, options_.routing);
    outcome.route = route;

    if (route == Route::Inline) {
        advance(s.id, SessionStatus::DeliveringInline);
        DeliveryRequest req;
        req.sessionId = s.id;
        req.owner = s.owner;
        req.correlation = s.correlation;
        req.path = *artifact;
        req.title = outcome.title;
        req.sizeBytes = outcome.sizeBytes;
        req.variant = variant;
        auto delivered = co_await deps_.delivery.deliver(std::move(req));
        if (!delivered) {
            outcome.status = SessionStatus::Failed;
            outcome.error = wrap(ErrorCode::TransferError, delivered.error());
        } else {
            outcome.status = SessionStatus::Complete;
            audit(AuditEvent::DeliveredInline, s,
                  fmt::format("{} ({} bytes)", artifact->filename().string(), outcome.sizeBytes));
        }
    } else {
        advance(s.id, SessionStatus::Offloading);
        if (options_.routing.forceOffload &&
            outcome.sizeBytes <= options_.routing.inlineThresholdBytes) {
            reporter.notice("Uploading to the file host as configured...");
        } else {
            reporter.notice(fmt::format(
                "File too large ({}), uploading to the file host...",
                progress::formatSize(static_cast<double>(outcome.sizeBytes))));
        }
        auto uploaded = co_await deps_.uploader.upload(*artifact, reporter, &outcome.attempts);
        if (!uploaded) {
            outcome.status = SessionStatus::Failed;
            outcome.error = wrap(ErrorCode::UploadError, uploaded.error());
        } else {
            outcome.status = SessionStatus::Complete;
            outcome.upload = std::move(uploaded).value();
            audit(AuditEvent::Offloaded, s,
                  fmt::format("{} -> {}", artifact->filename().string(),
                              outcome.upload->downloadPage));
        }
    }
}

} // namespace ferry::pipeline
