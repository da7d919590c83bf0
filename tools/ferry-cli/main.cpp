#include <ferry/downloader/downloader.hpp>
#include <ferry/pipeline/pipeline_config.h>
#include <ferry/pipeline/pipeline_coordinator.h>
#include <ferry/session/session_registry.h>
#include <ferry/uploader/uploader.hpp>

#include <spdlog/sinks/rotating_file_sink.h>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/spdlog.h>
#include <CLI/CLI.hpp>

#include <boost/asio/co_spawn.hpp>
#include <boost/asio/io_context.hpp>

#include <cstdlib>
#include <exception>
#include <filesystem>
#include <iostream>
#include <optional>
#include <string>
#include <vector>
#include <memory>

namespace {

constexpr int kExitComplete = 0;
constexpr int kExitFailed = 1;
constexpr int kExitUsage = 2;

// Status updates go to stdout, one block per update.
class ConsoleStatusSink final : public ferry::progress::IStatusSink {
public:
    void send(const std::string& correlation, const std::string& text) override {
        std::cout << "[" << correlation << "] " << text << "\n" << std::flush;
    }
};

// "Inline" delivery for a terminal: copy the artifact into the outbox directory.
class OutboxDelivery final : public ferry::pipeline::IInlineDelivery {
public:
    explicit OutboxDelivery(std::filesystem::path outbox) : outbox_(std::move(outbox)) {}

    boost::asio::awaitable<ferry::Result<void>>
    deliver(ferry::pipeline::DeliveryRequest request) override {
        std::error_code ec;
        std::filesystem::create_directories(outbox_, ec);
        if (ec) {
            co_return ferry::Error{ferry::ErrorCode::IoError,
                                   "cannot create outbox " + outbox_.string() + ": " +
                                       ec.message()};
        }
        const auto target = outbox_ / request.path.filename();
        std::filesystem::copy_file(request.path, target,
                                   std::filesystem::copy_options::overwrite_existing, ec);
        if (ec) {
            co_return ferry::Error{ferry::ErrorCode::IoError,
                                   "cannot copy to " + target.string() + ": " + ec.message()};
        }
        spdlog::info("[Outbox] {} -> {}", request.sessionId, target.string());
        co_return ferry::Result<void>();
    }

private:
    std::filesystem::path outbox_;
};

class SpdlogAuditLog final : public ferry::pipeline::IAuditLog {
public:
    explicit SpdlogAuditLog(std::shared_ptr<spdlog::logger> logger) : logger_(std::move(logger)) {}

    void record(const ferry::pipeline::AuditRecord& r) override {
        logger_->info("{} session={} owner={} {}", ferry::pipeline::toString(r.event),
                      r.sessionId, r.owner.empty() ? "-" : r.owner, r.detail);
    }

private:
    std::shared_ptr<spdlog::logger> logger_;
};

void setupLogging(const ferry::config::LogSettings& log) {
    std::vector<spdlog::sink_ptr> sinks;
    sinks.push_back(std::make_shared<spdlog::sinks::stderr_color_sink_mt>());
    if (!log.file.empty()) {
        std::error_code ec;
        if (log.file.has_parent_path()) {
            std::filesystem::create_directories(log.file.parent_path(), ec);
        }
        try {
            const size_t max_size = 5 * 1024 * 1024; // 5MB per file
            const size_t max_files = 3;
            sinks.push_back(std::make_shared<spdlog::sinks::rotating_file_sink_mt>(
                log.file.string(), max_size, max_files));
        } catch (const spdlog::spdlog_ex& e) {
            std::cerr << "ferry: log file disabled: " << e.what() << "\n";
        }
    }

    auto logger = std::make_shared<spdlog::logger>("ferry", sinks.begin(), sinks.end());
    spdlog::set_default_logger(logger);

    auto audit = std::make_shared<spdlog::logger>("audit", sinks.begin(), sinks.end());
    spdlog::register_logger(audit);

    const auto level = spdlog::level::from_str(log.level);
    spdlog::set_level(level);
    audit->set_level(spdlog::level::info);
    spdlog::flush_on(spdlog::level::warn);
}

int exitCodeFor(const ferry::Error& err) {
    switch (err.code) {
        case ferry::ErrorCode::ValidationError:
        case ferry::ErrorCode::SelectionError:
        case ferry::ErrorCode::SessionExpired:
        case ferry::ErrorCode::AlreadyExists:
        case ferry::ErrorCode::InvalidArgument:
            return kExitUsage;
        default:
            return kExitFailed;
    }
}

} // namespace

int main(int argc, char* argv[]) {
    CLI::App app{"ferry - fetch media and hand it over, offloading large files"};

    std::string url;
    std::string kind;
    std::string quality;
    std::string container;
    std::string selectKey;
    std::string configPath;
    std::string logLevel;
    std::string outbox = "downloads/outbox";
    std::string owner;
    bool forceOffload = false;

    app.add_option("url", url, "Source URL (YouTube watch or youtu.be link)")->required();
    app.add_option("--kind", kind, "Media kind to fetch")
        ->check(CLI::IsMember({"video", "audio"}));
    app.add_option("--quality", quality, "Video quality (720p) or audio format (mp3, wav)");
    app.add_option("--container", container, "Video container (mp4, webm)");
    app.add_option("--select", selectKey, "Selection key as printed in the menu");
    app.add_flag("--force-offload", forceOffload, "Always upload to the file host");
    app.add_option("--outbox", outbox, "Directory receiving inline deliveries");
    app.add_option("--owner", owner, "Requester recorded in the audit trail");
    app.add_option("--config", configPath, "Configuration file path");
    app.add_option("--log-level", logLevel, "Log level (trace/debug/info/warn/error)")
        ->check(CLI::IsMember({"trace", "debug", "info", "warn", "error", "critical", "off"}));

    CLI11_PARSE(app, argc, argv);

    ferry::config::CommandLineOverrides overrides;
    if (!logLevel.empty()) {
        overrides.logLevel = logLevel;
    }
    if (forceOffload) {
        overrides.forceOffload = true;
    }

    auto loaded = ferry::config::loadPipelineConfig(configPath, overrides);
    if (!loaded) {
        std::cerr << "ferry: " << loaded.error().message << "\n";
        return kExitUsage;
    }
    const auto cfg = loaded.value();
    if (auto valid = ferry::config::validate(cfg); !valid) {
        std::cerr << "ferry: invalid configuration: " << valid.error().message << "\n";
        return kExitUsage;
    }

    setupLogging(cfg.log);

    if (selectKey.empty() && (!kind.empty() || !quality.empty())) {
        if (kind.empty() || quality.empty()) {
            std::cerr << "ferry: --kind and --quality go together\n";
            return kExitUsage;
        }
    }
    if (owner.empty()) {
        if (const char* user = std::getenv("USER")) {
            owner = user;
        }
    }

    // Collaborators
    ferry::session::SessionRegistry registry(
        ferry::session::RegistryOptions{cfg.session.ttl, {}});

    ferry::downloader::DownloadOptions downloadOptions;
    downloadOptions.maxConcurrent = cfg.download.maxConcurrent;
    downloadOptions.workDir = cfg.download.workDir;
    downloadOptions.handoff.handoffTimeout = cfg.download.progressHandoff;
    std::shared_ptr<ferry::downloader::IMediaExtractor> extractor =
        ferry::downloader::makeYtDlpExtractor(
            ferry::downloader::ExtractorConfig{cfg.download.extractor, cfg.download.cookiesFile});
    ferry::downloader::DownloadOrchestrator downloader(extractor, downloadOptions);

    ferry::uploader::UploadOptions uploadOptions;
    uploadOptions.endpoints = cfg.upload.endpoints;
    uploadOptions.uploadPath = cfg.upload.uploadPath;
    uploadOptions.apiToken = cfg.upload.apiToken;
    uploadOptions.probeTimeout = cfg.upload.probeTimeout;
    uploadOptions.attemptTimeout = cfg.upload.attemptTimeout;
    uploadOptions.chunkSizeBytes = cfg.upload.chunkSizeBytes;
    uploadOptions.retry = ferry::uploader::RetryPolicy{cfg.upload.maxAttempts,
                                                       cfg.upload.initialBackoff,
                                                       cfg.upload.backoffMultiplier,
                                                       cfg.upload.maxBackoff};
    ferry::uploader::UploadOrchestrator uploader(ferry::uploader::makeCurlTransport(),
                                                 uploadOptions);

    ConsoleStatusSink sink;
    OutboxDelivery delivery(outbox);
    SpdlogAuditLog audit(spdlog::get("audit"));

    ferry::pipeline::CoordinatorOptions coordinatorOptions;
    coordinatorOptions.routing.inlineThresholdBytes = cfg.inlineThresholdBytes();
    coordinatorOptions.routing.forceOffload = cfg.policy.forceOffload;
    coordinatorOptions.progress.minInterval = cfg.progress.minInterval;
    coordinatorOptions.progress.minPercentDelta = cfg.progress.minPercentDelta;
    coordinatorOptions.progress.minBytesDelta = cfg.progress.minBytesDelta;

    ferry::pipeline::PipelineCoordinator coordinator(
        ferry::pipeline::CoordinatorDeps{registry, downloader, uploader, sink, delivery, audit},
        coordinatorOptions);

    boost::asio::io_context io;
    int exitCode = kExitFailed;

    auto run = [&]() -> boost::asio::awaitable<int> {
        auto resolved = co_await coordinator.submit(url, owner, "cli");
        if (!resolved) {
            std::cerr << "ferry: " << resolved.error().message << "\n";
            co_return exitCodeFor(resolved.error());
        }
        const auto& request = resolved.value();

        std::string key = selectKey;
        if (key.empty() && !kind.empty()) {
            ferry::media::SelectionKey sk;
            sk.kind =
                kind == "audio" ? ferry::media::MediaKind::Audio : ferry::media::MediaKind::Video;
            sk.quality = quality;
            sk.container = sk.kind == ferry::media::MediaKind::Audio
                               ? std::string(ferry::media::kAnyContainer)
                               : (container.empty() ? std::string("mp4") : container);
            sk.sessionId = request.sessionId;
            key = sk.encode();
        }

        if (key.empty()) {
            std::cout << "Title: " << request.title << "\n";
            std::cout << "Uploader: " << request.uploader << "\n";
            for (const auto& entry : coordinator.menuFor(request)) {
                std::cout << "  " << entry.label << "\t--select " << entry.selectionKey << "\n";
            }
            co_return kExitComplete;
        }

        auto outcome = co_await coordinator.select(key);
        if (!outcome) {
            std::cerr << "ferry: " << outcome.error().message << "\n";
            co_return exitCodeFor(outcome.error());
        }
        co_return outcome.value().status == ferry::session::SessionStatus::Complete
            ? kExitComplete
            : kExitFailed;
    };

    boost::asio::co_spawn(io, run(), [&](std::exception_ptr ep, int code) {
        if (ep) {
            try {
                std::rethrow_exception(ep);
            } catch (const std::exception& e) {
                spdlog::critical("ferry aborted: {}", e.what());
            }
            exitCode = kExitFailed;
            return;
        }
        exitCode = code;
    });
    io.run();

    spdlog::shutdown();
    return exitCode;
}
