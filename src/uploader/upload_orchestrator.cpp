#include <spdlog/spdlog.h>
#include <ferry/uploader/uploader.hpp>

#include <boost/asio/as_tuple.hpp>
#include <boost/asio/co_spawn.hpp>
#include <boost/asio/detached.hpp>
#include <boost/asio/experimental/channel.hpp>
#include <boost/asio/this_coro.hpp>
#include <boost/asio/use_awaitable.hpp>

#include <algorithm>
#include <cmath>
#include <system_error>

namespace ferry::uploader {

namespace {

bool isAcceptableStatus(long status) {
    return status >= 200 && status < 500;
}

// Errors that will not go away by trying again.
bool isFatal(const Error& err) {
    return err.code == ErrorCode::FileNotFound || err.code == ErrorCode::InvalidArgument ||
           err.code == ErrorCode::IoError;
}

} // namespace

std::chrono::milliseconds backoffFor(const RetryPolicy& policy, int failedAttempt) {
    if (failedAttempt < 1) {
        failedAttempt = 1;
    }
    const double base = static_cast<double>(policy.initialBackoff.count());
    const double factor = std::pow(policy.multiplier, failedAttempt - 1);
    const double capped = std::min(base * factor, static_cast<double>(policy.maxBackoff.count()));
    return std::chrono::milliseconds(static_cast<std::int64_t>(capped));
}

UploadOrchestrator::UploadOrchestrator(std::shared_ptr<IHttpTransport> transport,
                                       UploadOptions options, async::DelayFn delay)
    : transport_(std::move(transport)), options_(std::move(options)), delay_(std::move(delay)) {
    if (!delay_) {
        delay_ = async::steadyDelay();
    }
}

boost::asio::awaitable<std::string> UploadOrchestrator::selectEndpoint() {
    const auto& endpoints = options_.endpoints;
    if (endpoints.empty()) {
        co_return std::string{};
    }
    if (endpoints.size() == 1) {
        co_return endpoints.front();
    }

    using ProbeChannel =
        boost::asio::experimental::channel<void(boost::system::error_code, std::size_t, bool)>;

    auto ex = co_await boost::asio::this_coro::executor;
    // One slot per probe so late answers never block.
    auto results = std::make_shared<ProbeChannel>(ex, endpoints.size());
    const auto timeout = options_.probeTimeout;

    for (std::size_t i = 0; i < endpoints.size(); ++i) {
        boost::asio::co_spawn(
            ex,
            [transport = transport_, results, url = endpoints[i], timeout,
             i]() -> boost::asio::awaitable<void> {
                auto status = co_await async::awaitWithTimeout<long>(
                    [&]() { return transport->probe(url, timeout); }, timeout);
                const bool ok = status && isAcceptableStatus(status.value());
                if (!ok) {
                    spdlog::debug("[Upload] probe {} failed: {}", url,
                                  status ? "HTTP " + std::to_string(status.value())
                                         : status.error().message);
                }
                results->try_send(boost::system::error_code{}, i, ok);
            },
            boost::asio::detached);
    }

    for (std::size_t received = 0; received < endpoints.size(); ++received) {
        auto [ec, index, ok] =
            co_await results->async_receive(boost::asio::as_tuple(boost::asio::use_awaitable));
        if (ec) {
            break;
        }
        if (ok) {
            spdlog::debug("[Upload] selected {}", endpoints[index]);
            co_return endpoints[index];
        }
    }

    spdlog::warn("[Upload] no upload host answered the probe, using {}", endpoints.front());
    co_return endpoints.front();
}

boost::asio::awaitable<Result<UploadResult>>
UploadOrchestrator::attemptOnce(std::string endpoint, std::filesystem::path file,
                                progress::ProgressReporter& reporter) {
    MultipartUpload request;
    request.url = endpoint + options_.uploadPath;
    request.file = std::move(file);
    request.bearerToken = options_.apiToken;
    request.chunkSizeBytes = options_.chunkSizeBytes;
    request.timeout = options_.attemptTimeout;

    const auto started = std::chrono::steady_clock::now();
    // Bytes shown never go back within one attempt, even when the transport rewinds.
    std::uint64_t highWater = 0;
    auto response = co_await transport_->postMultipart(
        std::move(request),
        [&reporter, &highWater, started](std::uint64_t sent, std::uint64_t total) {
            highWater = std::max(highWater, sent);
            progress::ProgressEvent ev;
            ev.phase = kUploadPhase;
            ev.bytes = highWater;
            ev.total = total;
            const auto elapsed =
                std::chrono::duration<double>(std::chrono::steady_clock::now() - started).count();
            if (elapsed > 0.0) {
                ev.bytesPerSecond = static_cast<double>(highWater) / elapsed;
            }
            reporter.report(ev);
        });
    if (!response) {
        co_return response.error();
    }

    auto parsed = parseUploadResponse(response.value());
    if (!parsed) {
        co_return parsed.error();
    }
    auto result = std::move(parsed).value();
    result.endpoint = std::move(endpoint);
    co_return result;
}

boost::asio::awaitable<Result<UploadResult>>
UploadOrchestrator::upload(std::filesystem::path file, progress::ProgressReporter& reporter,
                           std::vector<TransferAttempt>* history) {
    std::error_code ec;
    if (!std::filesystem::is_regular_file(file, ec)) {
        co_return Error{ErrorCode::FileNotFound, "artifact not found: " + file.string()};
    }
    const auto size = std::filesystem::file_size(file, ec);
    if (ec) {
        co_return Error{ErrorCode::FileNotFound,
                        "cannot stat artifact " + file.string() + ": " + ec.message()};
    }
    if (size == 0) {
        co_return Error{ErrorCode::InvalidArgument, "artifact is empty: " + file.string()};
    }

    const int maxAttempts = std::max(1, options_.retry.maxAttempts);
    Error lastError{ErrorCode::UploadError, "no attempt made"};

    for (int attempt = 1; attempt <= maxAttempts; ++attempt) {
        auto endpoint = co_await selectEndpoint();
        reporter.beginPhase(kUploadPhase);
        spdlog::info("[Upload] attempt {}/{} to {} ({} bytes)", attempt, maxAttempts, endpoint,
                     size);

        auto result = co_await async::awaitWithTimeout<UploadResult>(
            [&]() { return attemptOnce(endpoint, file, reporter); }, options_.attemptTimeout);

        if (result) {
            if (history) {
                history->push_back({attempt, endpoint, AttemptOutcome::Success, {}});
            }
            auto out = std::move(result).value();
            out.attempts = attempt;

            progress::ProgressEvent done;
            done.phase = kUploadPhase;
            done.bytes = size;
            done.total = size;
            done.terminal = true;
            reporter.report(done);

            spdlog::info("[Upload] {} uploaded to {}", file.filename().string(),
                         out.downloadPage);
            co_return out;
        }

        lastError = result.error();
        const bool fatal = isFatal(lastError);
        if (history) {
            history->push_back({attempt, endpoint,
                                fatal ? AttemptOutcome::FatalFailure
                                      : AttemptOutcome::RetryableFailure,
                                lastError.message});
        }
        if (fatal) {
            spdlog::error("[Upload] attempt {} failed permanently: {}", attempt,
                          lastError.message);
            co_return Error{ErrorCode::UploadError, lastError.message};
        }
        if (attempt < maxAttempts) {
            const auto wait = backoffFor(options_.retry, attempt);
            spdlog::warn("[Upload] attempt {} failed ({}), retrying in {} ms", attempt,
                         lastError.message, wait.count());
            co_await delay_(wait);
        } else {
            spdlog::warn("[Upload] attempt {} failed ({})", attempt, lastError.message);
        }
    }

    co_return Error{ErrorCode::RetryExhausted, "upload failed after " +
                                                   std::to_string(maxAttempts) +
                                                   " attempt(s): " + lastError.message};
}

} // namespace ferry::uploader
