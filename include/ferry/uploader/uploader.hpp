#pragma once

/*
 * ferry uploader - failover object-store client (C++20)
 *
 * Relays a local artifact to one of several upload hosts. Hosts are probed concurrently
 * before every attempt; the artifact is streamed as a multipart POST in fixed-size chunks;
 * failed attempts are retried with exponential backoff.
 */

#include <ferry/core/async_utils.hpp>
#include <ferry/core/types.h>
#include <ferry/progress/progress_reporter.h>

#include <boost/asio/awaitable.hpp>

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <functional>
#include <memory>
#include <string>
#include <vector>

namespace ferry::uploader {

/**
 * Retry/backoff policy.
 */
struct RetryPolicy {
    int maxAttempts{3};
    std::chrono::milliseconds initialBackoff{1000};
    double multiplier{2.0};
    std::chrono::milliseconds maxBackoff{30000};
};

// Delay after the n-th failed attempt (n >= 1): initial * multiplier^(n-1), capped.
std::chrono::milliseconds backoffFor(const RetryPolicy& policy, int failedAttempt);

struct UploadOptions {
    std::vector<std::string> endpoints{"https://upload.gofile.io"};
    std::string uploadPath{"/uploadfile"};
    std::string apiToken; // empty = anonymous
    std::chrono::milliseconds probeTimeout{3000};
    std::chrono::milliseconds attemptTimeout{600000};
    std::size_t chunkSizeBytes{1 * MiB};
    RetryPolicy retry{};
};

enum class AttemptOutcome { Success, RetryableFailure, FatalFailure };

constexpr const char* toString(AttemptOutcome outcome) {
    switch (outcome) {
        case AttemptOutcome::Success: return "success";
        case AttemptOutcome::RetryableFailure: return "retryable";
        case AttemptOutcome::FatalFailure: return "fatal";
    }
    return "unknown";
}

struct TransferAttempt {
    int index{0}; // 1-based
    std::string endpoint;
    AttemptOutcome outcome{AttemptOutcome::RetryableFailure};
    std::string error;
};

struct UploadResult {
    std::string downloadPage;
    std::string directLink;
    std::string fileId;
    std::string endpoint;
    int attempts{0};
};

struct HttpResponse {
    long status{0};
    std::string body;
};

struct MultipartUpload {
    std::string url;
    std::filesystem::path file;
    std::string fieldName{"file"};
    std::string bearerToken;
    std::size_t chunkSizeBytes{1 * MiB};
    std::chrono::milliseconds timeout{600000};
};

// (bytes sent so far, total bytes); invoked on the awaiting executor.
using ChunkCallback = std::function<void(std::uint64_t, std::uint64_t)>;

/**
 * HTTP client used by the orchestrator. Calls never block the awaiting executor.
 *
 * Errors: NetworkError, Timeout, IoError (local file could not be read).
 */
class IHttpTransport {
public:
    virtual ~IHttpTransport() = default;

    // Response status of a lightweight request to `url`.
    virtual boost::asio::awaitable<Result<long>> probe(std::string url,
                                                       std::chrono::milliseconds timeout) = 0;

    virtual boost::asio::awaitable<Result<HttpResponse>> postMultipart(MultipartUpload request,
                                                                       ChunkCallback onChunk) = 0;
};

// libcurl transport: every request joins one curl multi handle driven by a dedicated
// network thread, so probes and uploads never queue behind each other.
std::shared_ptr<IHttpTransport> makeCurlTransport();

// {"status":"ok","data":{"downloadPage":..., "directLink":..., "id"|"fileId":...}}
// UploadError for non-200 responses, non-"ok" status, bad JSON or a missing downloadPage.
Result<UploadResult> parseUploadResponse(const HttpResponse& response);

inline constexpr const char* kUploadPhase = "Upload";

class UploadOrchestrator {
public:
    UploadOrchestrator(std::shared_ptr<IHttpTransport> transport, UploadOptions options,
                       async::DelayFn delay = async::steadyDelay());

    /**
     * Probes all endpoints concurrently and returns the first one answering with a status in
     * [200, 500). Does not wait for the remaining probes. Falls back to the first listed
     * endpoint when none answers; never fails.
     */
    boost::asio::awaitable<std::string> selectEndpoint();

    /**
     * Uploads `file`, retrying select-and-transfer up to retry.maxAttempts times.
     *
     * Fast-fails without consuming an attempt: FileNotFound (missing), InvalidArgument (empty).
     * Exhausted retries: RetryExhausted wrapping the last attempt's error.
     * `history` (optional) receives one TransferAttempt per attempt.
     */
    boost::asio::awaitable<Result<UploadResult>>
    upload(std::filesystem::path file, progress::ProgressReporter& reporter,
           std::vector<TransferAttempt>* history = nullptr);

    const UploadOptions& options() const { return options_; }

private:
    boost::asio::awaitable<Result<UploadResult>>
    attemptOnce(std::string endpoint, std::filesystem::path file,
                progress::ProgressReporter& reporter);

    std::shared_ptr<IHttpTransport> transport_;
    UploadOptions options_;
    async::DelayFn delay_;
};

} // namespace ferry::uploader
