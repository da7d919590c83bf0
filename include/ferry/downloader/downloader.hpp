#pragma once

/*
 * ferry downloader - public types and the download orchestrator (C++20)
 *
 * The orchestrator resolves a source into a format catalog and fetches one variant into
 * the work directory. Extraction itself is delegated to an IMediaExtractor whose calls
 * block; they run on a bounded worker pool and report progress back to the scheduler
 * through a bounded channel.
 */

#include <ferry/core/async_utils.hpp>
#include <ferry/core/types.h>
#include <ferry/media/format_catalog.h>
#include <ferry/progress/progress_reporter.h>

#include <boost/asio/awaitable.hpp>
#include <boost/asio/thread_pool.hpp>

#include <atomic>
#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <functional>
#include <memory>
#include <optional>
#include <string>

namespace ferry::downloader {

/**
 * Progress of a running fetch, produced on a worker thread.
 */
struct FetchProgress {
    std::uint64_t bytes{0};
    std::optional<std::uint64_t> total;
    std::optional<double> bytesPerSecond;
    SteadyPoint timestamp{}; // measurement time; left default when the producer has none
};

using ProgressCallback = std::function<void(const FetchProgress&)>;

struct FetchRequest {
    std::string uri;
    SessionId sessionId;
    media::FormatVariant variant;
    std::filesystem::path workDir;
};

struct FetchResult {
    std::filesystem::path path;
    std::string title;
    std::uint64_t sizeBytes{0};
};

struct ResolvedMedia {
    media::MediaInfo info;
    media::FormatCatalog catalog;
};

/**
 * Blocking media backend. Both calls run on a worker thread.
 *
 * Errors: NotFound (no matching variant), NetworkError, ExtractionFailure.
 */
class IMediaExtractor {
public:
    virtual ~IMediaExtractor() = default;
    virtual Result<media::MediaInfo> probe(const std::string& uri) = 0;
    virtual Result<FetchResult> fetch(const FetchRequest& request,
                                      const ProgressCallback& onProgress) = 0;
};

struct ExtractorConfig {
    std::string executable{"yt-dlp"};
    std::filesystem::path cookiesFile; // empty = none
};

// Drives the yt-dlp executable.
std::unique_ptr<IMediaExtractor> makeYtDlpExtractor(ExtractorConfig config);

struct DownloadOptions {
    std::size_t maxConcurrent{3};
    std::filesystem::path workDir{"downloads/temp"};
    async::HandoffOptions handoff{};
};

inline constexpr const char* kDownloadPhase = "Download";

/**
 * Runs extractor calls on a pool of `maxConcurrent` threads; excess requests queue.
 * No internal retry.
 */
class DownloadOrchestrator {
public:
    DownloadOrchestrator(std::shared_ptr<IMediaExtractor> extractor, DownloadOptions options);
    ~DownloadOrchestrator();

    DownloadOrchestrator(const DownloadOrchestrator&) = delete;
    DownloadOrchestrator& operator=(const DownloadOrchestrator&) = delete;

    // Metadata and catalog of a source. ExtractionFailure on malformed metadata.
    boost::asio::awaitable<Result<ResolvedMedia>> resolve(std::string uri);

    /**
     * Fetches one variant. Progress goes to `reporter` (which must outlive the call);
     * a terminal "complete" event is reported on success. The returned file exists and
     * is non-empty, otherwise ExtractionFailure.
     */
    boost::asio::awaitable<Result<FetchResult>>
    fetch(std::string uri, SessionId sessionId, media::FormatVariant variant,
          progress::ProgressReporter& reporter);

    // Progress events lost to back-pressure since construction.
    std::uint64_t droppedEvents() const { return dropped_.load(std::memory_order_relaxed); }

    const DownloadOptions& options() const { return options_; }

private:
    std::shared_ptr<IMediaExtractor> extractor_;
    DownloadOptions options_;
    boost::asio::thread_pool pool_;
    std::atomic<std::uint64_t> dropped_{0};
};

} // namespace ferry::downloader
