#include <spdlog/spdlog.h>
#include <ferry/downloader/downloader.hpp>

#include <system_error>

namespace ferry::downloader {

namespace {

struct NoEvent {};

} // namespace

DownloadOrchestrator::DownloadOrchestrator(std::shared_ptr<IMediaExtractor> extractor,
                                           DownloadOptions options)
    : extractor_(std::move(extractor)), options_(std::move(options)),
      pool_(options_.maxConcurrent == 0 ? 1 : options_.maxConcurrent) {}

DownloadOrchestrator::~DownloadOrchestrator() {
    pool_.join();
}

boost::asio::awaitable<Result<ResolvedMedia>> DownloadOrchestrator::resolve(std::string uri) {
    auto extractor = extractor_;
    auto info = co_await async::runBlocking<media::MediaInfo, NoEvent>(
        pool_,
        [extractor, uri](const async::EventEmitter<NoEvent>&) { return extractor->probe(uri); },
        [](const NoEvent&) {}, options_.handoff);

    if (!info) {
        auto err = info.error();
        if (err.code == ErrorCode::InvalidData) {
            err.code = ErrorCode::ExtractionFailure;
        }
        spdlog::warn("[Download] resolve failed for {}: {}", uri, err.message);
        co_return err;
    }

    ResolvedMedia resolved;
    resolved.info = std::move(info).value();
    if (resolved.info.title.empty()) {
        resolved.info.title = media::kUnknownTitle;
    }
    resolved.catalog = media::buildCatalog(resolved.info.formats);
    spdlog::debug("[Download] resolved '{}' with {} variant group(s)", resolved.info.title,
                  resolved.catalog.size());
    co_return resolved;
}

boost::asio::awaitable<Result<FetchResult>>
DownloadOrchestrator::fetch(std::string uri, SessionId sessionId, media::FormatVariant variant,
                            progress::ProgressReporter& reporter) {
    std::error_code ec;
    std::filesystem::create_directories(options_.workDir, ec);
    if (ec) {
        co_return Error{ErrorCode::IoError, "cannot create work dir " +
                                                options_.workDir.string() + ": " + ec.message()};
    }

    FetchRequest request{std::move(uri), std::move(sessionId), std::move(variant),
                         options_.workDir};
    spdlog::info("[Download] {} {} {}/{}", request.sessionId, media::toString(request.variant.kind),
                 request.variant.quality, request.variant.container);

    reporter.beginPhase(kDownloadPhase);

    auto extractor = extractor_;
    std::uint64_t lost = 0;
    auto result = co_await async::runBlocking<FetchResult, FetchProgress>(
        pool_,
        [extractor, request](const async::EventEmitter<FetchProgress>& emitter) {
            return extractor->fetch(request,
                                    [&emitter](const FetchProgress& p) { emitter.emit(p); });
        },
        [&reporter](const FetchProgress& p) {
            progress::ProgressSample sample;
            sample.timestamp = p.timestamp;
            sample.bytes = p.bytes;
            sample.total = p.total;
            sample.bytesPerSecond = p.bytesPerSecond;
            reporter.report(kDownloadPhase, sample);
        },
        options_.handoff, &lost);
    dropped_.fetch_add(lost, std::memory_order_relaxed);

    if (!result) {
        spdlog::warn("[Download] {} failed: {}", request.sessionId, result.error().message);
        co_return result.error();
    }

    auto fetched = std::move(result).value();
    const auto size = std::filesystem::file_size(fetched.path, ec);
    if (ec || !std::filesystem::is_regular_file(fetched.path, ec)) {
        co_return Error{ErrorCode::ExtractionFailure,
                        "download reported success but " + fetched.path.string() +
                            " does not exist"};
    }
    if (size == 0) {
        std::filesystem::remove(fetched.path, ec);
        co_return Error{ErrorCode::ExtractionFailure,
                        "download produced an empty file: " + fetched.path.string()};
    }
    fetched.sizeBytes = size;
    if (fetched.title.empty()) {
        fetched.title = media::kUnknownTitle;
    }

    progress::ProgressEvent done;
    done.phase = kDownloadPhase;
    done.bytes = size;
    done.total = size;
    done.terminal = true;
    reporter.report(done);

    spdlog::info("[Download] {} finished: {} ({} bytes)", request.sessionId,
                 fetched.path.string(), size);
    co_return fetched;
}

} // namespace ferry::downloader
