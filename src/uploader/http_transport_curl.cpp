/*
 * http_transport_curl.cpp
 *
 * libcurl transport for the upload orchestrator.
 * - One worker thread drives a curl multi handle; probes and uploads are added to it as they
 *   arrive, so any number of requests run concurrently and none waits behind another.
 * - Results and per-chunk progress are relayed back to the awaiting executor through a
 *   bounded channel. A caller that stops waiting (timeout) marks the transfer abandoned and
 *   curl aborts it from the progress callback.
 * - Multipart bodies are streamed from disk with a read callback, one chunk per read.
 * - Every curl resource and the file handle are owned by RAII holders.
 */

#include <spdlog/spdlog.h>
#include <curl/curl.h>
#include <ferry/uploader/uploader.hpp>

#include <boost/asio/as_tuple.hpp>
#include <boost/asio/co_spawn.hpp>
#include <boost/asio/detached.hpp>
#include <boost/asio/experimental/channel.hpp>
#include <boost/asio/this_coro.hpp>
#include <boost/asio/use_awaitable.hpp>

#include <algorithm>
#include <atomic>
#include <cstdio>
#include <deque>
#include <filesystem>
#include <map>
#include <memory>
#include <mutex>
#include <string_view>
#include <thread>
#include <variant>

namespace ferry::uploader {

namespace {

// Map CURLcode to Error
Error makeCurlError(CURLcode code, std::string_view where) {
    Error err;
    err.message = std::string(where) + ": " + curl_easy_strerror(code);
    switch (code) {
        case CURLE_OK:
            err.code = ErrorCode::Success;
            break;
        case CURLE_OPERATION_TIMEDOUT:
            err.code = ErrorCode::Timeout;
            break;
        case CURLE_READ_ERROR:
            err.code = ErrorCode::IoError;
            break;
        case CURLE_COULDNT_RESOLVE_HOST:
        case CURLE_COULDNT_CONNECT:
        case CURLE_RECV_ERROR:
        case CURLE_SEND_ERROR:
        case CURLE_GOT_NOTHING:
        case CURLE_SSL_CONNECT_ERROR:
        case CURLE_PEER_FAILED_VERIFICATION:
            err.code = ErrorCode::NetworkError;
            break;
        default:
            err.code = ErrorCode::NetworkError;
            break;
    }
    return err;
}

void ensureCurlGlobalInit() {
    static std::once_flag once;
    std::call_once(once, [] { curl_global_init(CURL_GLOBAL_DEFAULT); });
}

struct CurlEasyDeleter {
    void operator()(CURL* h) const {
        if (h)
            curl_easy_cleanup(h);
    }
};
struct CurlMimeDeleter {
    void operator()(curl_mime* m) const {
        if (m)
            curl_mime_free(m);
    }
};
struct CurlSlistDeleter {
    void operator()(curl_slist* l) const {
        if (l)
            curl_slist_free_all(l);
    }
};
struct FileCloser {
    void operator()(FILE* f) const {
        if (f)
            std::fclose(f);
    }
};

using CurlEasy = std::unique_ptr<CURL, CurlEasyDeleter>;
using CurlMime = std::unique_ptr<curl_mime, CurlMimeDeleter>;
using CurlSlist = std::unique_ptr<curl_slist, CurlSlistDeleter>;
using FileHandle = std::unique_ptr<FILE, FileCloser>;

struct ChunkEvent {
    std::uint64_t sent{0};
    std::uint64_t total{0};
};

// Chunk progress, then exactly one final code. Event first so the message stays default
// constructible for the channel.
using Message = std::variant<ChunkEvent, CURLcode>;
using Channel = boost::asio::experimental::basic_channel<
    boost::asio::any_io_executor, boost::asio::experimental::channel_traits<std::mutex>,
    void(boost::system::error_code, Message)>;

constexpr std::size_t kChannelDepth = 64;

/**
 * One easy handle in flight. Shared by the awaiting coroutine and the multi worker;
 * curl callbacks and done() run on the worker thread.
 */
struct Transfer {
    virtual ~Transfer() = default;

    // Progress is best effort: dropped when the awaiting side is behind.
    void progress(const ChunkEvent& ev) {
        channel->try_send(boost::system::error_code{}, Message{ev});
    }

    // Nobody is waiting on an abandoned transfer; its executor may already be gone.
    void done(CURLcode rc) {
        if (abandoned.load(std::memory_order_relaxed)) {
            return;
        }
        boost::asio::co_spawn(
            channel->get_executor(),
            [ch = channel, rc]() -> boost::asio::awaitable<void> {
                co_await ch->async_send(boost::system::error_code{}, Message{rc},
                                        boost::asio::as_tuple(boost::asio::use_awaitable));
            },
            boost::asio::detached);
    }

    CurlEasy easy;
    std::shared_ptr<Channel> channel;
    std::atomic<bool> abandoned{false};
};

// Response body sink
size_t write_cb(char* ptr, size_t size, size_t nmemb, void* userdata) {
    const size_t total = size * nmemb;
    if (userdata == nullptr)
        return 0;
    static_cast<std::string*>(userdata)->append(ptr, total);
    return total;
}

// Discard bodies of probe responses
size_t discard_cb(char*, size_t size, size_t nmemb, void*) {
    return size * nmemb;
}

// Non-zero aborts the transfer with CURLE_ABORTED_BY_CALLBACK.
int xferinfo_cb(void* userdata, curl_off_t, curl_off_t, curl_off_t, curl_off_t) {
    return static_cast<Transfer*>(userdata)->abandoned.load(std::memory_order_relaxed) ? 1 : 0;
}

struct ReadContext {
    FILE* file{nullptr};
    std::size_t chunkSize{0};
    std::uint64_t position{0};
    // Largest position reached; a rewind never lowers what is reported.
    std::uint64_t highWater{0};
    std::uint64_t total{0};
    Transfer* owner{nullptr};
};

size_t read_cb(char* buffer, size_t size, size_t nitems, void* userdata) {
    auto* ctx = static_cast<ReadContext*>(userdata);
    const size_t want = std::min(size * nitems, ctx->chunkSize);
    const size_t got = std::fread(buffer, 1, want, ctx->file);
    if (got == 0 && std::ferror(ctx->file)) {
        return CURL_READFUNC_ABORT;
    }
    ctx->position += got;
    if (got > 0 && ctx->position > ctx->highWater) {
        ctx->highWater = ctx->position;
        ctx->owner->progress(ChunkEvent{ctx->highWater, ctx->total});
    }
    return got;
}

int seek_cb(void* userdata, curl_off_t offset, int origin) {
    auto* ctx = static_cast<ReadContext*>(userdata);
    if (origin != SEEK_SET || std::fseek(ctx->file, static_cast<long>(offset), SEEK_SET) != 0) {
        return CURL_SEEKFUNC_CANTSEEK;
    }
    ctx->position = static_cast<std::uint64_t>(offset);
    return CURL_SEEKFUNC_OK;
}

struct UploadTransfer : Transfer {
    // The easy handle still references the mime parts and headers; release it first.
    ~UploadTransfer() override { easy.reset(); }

    FileHandle file;
    CurlMime mime;
    CurlSlist headers;
    ReadContext read;
    HttpResponse response;
};

void configure_common(Transfer& t, const std::string& url, std::chrono::milliseconds timeout) {
    CURL* h = t.easy.get();
    curl_easy_setopt(h, CURLOPT_URL, url.c_str());
    curl_easy_setopt(h, CURLOPT_NOSIGNAL, 1L);
    curl_easy_setopt(h, CURLOPT_FOLLOWLOCATION, 1L);
    curl_easy_setopt(h, CURLOPT_MAXREDIRS, 5L);
    curl_easy_setopt(h, CURLOPT_TIMEOUT_MS, static_cast<long>(timeout.count()));
    curl_easy_setopt(h, CURLOPT_USERAGENT, "ferry/1.0");
    curl_easy_setopt(h, CURLOPT_NOPROGRESS, 0L);
    curl_easy_setopt(h, CURLOPT_XFERINFOFUNCTION, &xferinfo_cb);
    curl_easy_setopt(h, CURLOPT_XFERINFODATA, &t);
}

/**
 * Drives every transfer on one curl multi handle from a dedicated thread.
 * Requests are picked up on the next loop turn; curl_multi_wakeup interrupts the poll.
 */
class CurlMultiWorker {
public:
    CurlMultiWorker() {
        ensureCurlGlobalInit();
        multi_ = curl_multi_init();
        if (multi_) {
            thread_ = std::thread([this] { run(); });
        } else {
            spdlog::error("[curl] curl_multi_init failed, uploads are unavailable");
        }
    }

    ~CurlMultiWorker() {
        {
            std::lock_guard<std::mutex> lock(mutex_);
            quit_ = true;
        }
        if (multi_) {
            curl_multi_wakeup(multi_);
        }
        if (thread_.joinable()) {
            thread_.join();
        }
        if (multi_) {
            curl_multi_cleanup(multi_);
        }
    }

    CurlMultiWorker(const CurlMultiWorker&) = delete;
    CurlMultiWorker& operator=(const CurlMultiWorker&) = delete;

    Result<void> enqueue(std::shared_ptr<Transfer> transfer) {
        {
            std::lock_guard<std::mutex> lock(mutex_);
            if (quit_ || !multi_) {
                return Error{ErrorCode::InternalError, "curl worker is not running"};
            }
            incoming_.push_back(std::move(transfer));
        }
        curl_multi_wakeup(multi_);
        return Result<void>();
    }

    void wakeup() {
        if (multi_) {
            curl_multi_wakeup(multi_);
        }
    }

private:
    void run() {
        std::map<CURL*, std::shared_ptr<Transfer>> active;
        bool quit = false;

        while (!quit) {
            int running = 0;
            CURLMcode mc = curl_multi_perform(multi_, &running);
            if (mc != CURLM_OK) {
                spdlog::error("[curl] curl_multi_perform: {}", curl_multi_strerror(mc));
                break;
            }

            CURLMsg* msg = nullptr;
            int left = 0;
            while ((msg = curl_multi_info_read(multi_, &left))) {
                if (msg->msg != CURLMSG_DONE) {
                    continue;
                }
                const CURLcode rc = msg->data.result;
                auto it = active.find(msg->easy_handle);
                if (it == active.end()) {
                    continue;
                }
                auto transfer = std::move(it->second);
                active.erase(it);
                curl_multi_remove_handle(multi_, transfer->easy.get());
                transfer->done(rc);
            }

            // Wakes at least once a second so abandoned transfers are noticed.
            mc = curl_multi_poll(multi_, nullptr, 0, 1000, nullptr);
            if (mc != CURLM_OK) {
                spdlog::error("[curl] curl_multi_poll: {}", curl_multi_strerror(mc));
                break;
            }

            std::deque<std::shared_ptr<Transfer>> incoming;
            {
                std::lock_guard<std::mutex> lock(mutex_);
                incoming.swap(incoming_);
                quit = quit_;
            }
            for (auto& transfer : incoming) {
                CURL* h = transfer->easy.get();
                if (curl_multi_add_handle(multi_, h) != CURLM_OK) {
                    transfer->done(CURLE_FAILED_INIT);
                    continue;
                }
                active.emplace(h, std::move(transfer));
            }
        }

        for (auto& [h, transfer] : active) {
            curl_multi_remove_handle(multi_, h);
            transfer->done(CURLE_ABORTED_BY_CALLBACK);
        }
        std::deque<std::shared_ptr<Transfer>> rest;
        {
            std::lock_guard<std::mutex> lock(mutex_);
            rest.swap(incoming_);
            quit_ = true;
        }
        for (auto& transfer : rest) {
            transfer->done(CURLE_ABORTED_BY_CALLBACK);
        }
        spdlog::debug("[curl] worker stopped");
    }

    CURLM* multi_{nullptr};
    std::thread thread_;
    std::mutex mutex_;
    std::deque<std::shared_ptr<Transfer>> incoming_;
    bool quit_{false};
};

// Marks the transfer abandoned when the awaiting coroutine leaves early (timeout) and closes
// the channel so a late final code has nowhere to wait.
struct AbandonGuard {
    std::shared_ptr<Transfer> transfer;
    CurlMultiWorker& worker;

    ~AbandonGuard() {
        transfer->abandoned.store(true, std::memory_order_relaxed);
        transfer->channel->close();
        worker.wakeup();
    }
};

using ChunkHandler = std::function<void(const ChunkEvent&)>;

boost::asio::awaitable<Result<void>> perform(CurlMultiWorker& worker,
                                             std::shared_ptr<Transfer> transfer,
                                             std::string where, ChunkHandler onChunk) {
    auto ex = co_await boost::asio::this_coro::executor;
    transfer->channel = std::make_shared<Channel>(ex, kChannelDepth);
    AbandonGuard guard{transfer, worker};

    if (auto queued = worker.enqueue(transfer); !queued) {
        co_return queued.error();
    }

    for (;;) {
        auto [ec, msg] = co_await transfer->channel->async_receive(
            boost::asio::as_tuple(boost::asio::use_awaitable));
        if (ec) {
            co_return Error{ErrorCode::InternalError, where + ": " + ec.message()};
        }
        if (msg.index() == 0) {
            if (onChunk) {
                onChunk(std::get<0>(msg));
            }
            continue;
        }
        const CURLcode rc = std::get<1>(msg);
        if (rc != CURLE_OK) {
            co_return makeCurlError(rc, where);
        }
        co_return Result<void>();
    }
}

class CurlTransport final : public IHttpTransport {
public:
    boost::asio::awaitable<Result<long>> probe(std::string url,
                                               std::chrono::milliseconds timeout) override {
        auto transfer = std::make_shared<Transfer>();
        transfer->easy.reset(curl_easy_init());
        if (!transfer->easy) {
            co_return Error{ErrorCode::InternalError, "curl_easy_init failed"};
        }
        configure_common(*transfer, url, timeout);
        curl_easy_setopt(transfer->easy.get(), CURLOPT_NOBODY, 1L);
        curl_easy_setopt(transfer->easy.get(), CURLOPT_WRITEFUNCTION, &discard_cb);

        auto done = co_await perform(worker_, transfer, "probe " + url, {});
        if (!done) {
            spdlog::debug("[curl] probe {} failed: {}", url, done.error().message);
            co_return done.error();
        }
        long status = 0;
        curl_easy_getinfo(transfer->easy.get(), CURLINFO_RESPONSE_CODE, &status);
        co_return status;
    }

    boost::asio::awaitable<Result<HttpResponse>> postMultipart(MultipartUpload req,
                                                               ChunkCallback onChunk) override {
        std::error_code ec;
        const auto size = std::filesystem::file_size(req.file, ec);
        if (ec) {
            co_return Error{ErrorCode::FileNotFound, req.file.string() + ": " + ec.message()};
        }

        auto transfer = std::make_shared<UploadTransfer>();
        transfer->file.reset(std::fopen(req.file.c_str(), "rb"));
        if (!transfer->file) {
            co_return Error{ErrorCode::IoError, "cannot open " + req.file.string()};
        }
        transfer->easy.reset(curl_easy_init());
        if (!transfer->easy) {
            co_return Error{ErrorCode::InternalError, "curl_easy_init failed"};
        }
        CURL* h = transfer->easy.get();
        configure_common(*transfer, req.url, req.timeout);

        // Within libcurl's accepted range for upload buffers (16 KiB .. 2 MiB).
        const std::size_t chunk = std::clamp<std::size_t>(req.chunkSizeBytes, 16 * KiB, 2 * MiB);
        transfer->read = ReadContext{transfer->file.get(), chunk, 0, 0, size, transfer.get()};

        transfer->mime.reset(curl_mime_init(h));
        if (!transfer->mime) {
            co_return Error{ErrorCode::InternalError, "curl_mime_init failed"};
        }
        curl_mimepart* part = curl_mime_addpart(transfer->mime.get());
        curl_mime_name(part, req.fieldName.c_str());
        curl_mime_filename(part, req.file.filename().string().c_str());
        curl_mime_type(part, "application/octet-stream");
        curl_mime_data_cb(part, static_cast<curl_off_t>(size), &read_cb, &seek_cb, nullptr,
                          &transfer->read);
        curl_easy_setopt(h, CURLOPT_MIMEPOST, transfer->mime.get());
        curl_easy_setopt(h, CURLOPT_UPLOAD_BUFFERSIZE, static_cast<long>(chunk));

        if (!req.bearerToken.empty()) {
            const std::string auth = "Authorization: Bearer " + req.bearerToken;
            transfer->headers.reset(curl_slist_append(nullptr, auth.c_str()));
            curl_easy_setopt(h, CURLOPT_HTTPHEADER, transfer->headers.get());
        }

        curl_easy_setopt(h, CURLOPT_WRITEFUNCTION, &write_cb);
        curl_easy_setopt(h, CURLOPT_WRITEDATA, &transfer->response.body);

        auto done = co_await perform(worker_, transfer, "upload " + req.url,
                                     [&onChunk](const ChunkEvent& ev) {
                                         if (onChunk) {
                                             onChunk(ev.sent, ev.total);
                                         }
                                     });
        if (!done) {
            spdlog::debug("[curl] upload to {} failed: {}", req.url, done.error().message);
            co_return done.error();
        }
        curl_easy_getinfo(h, CURLINFO_RESPONSE_CODE, &transfer->response.status);
        spdlog::debug("[curl] upload to {} returned HTTP {}", req.url, transfer->response.status);
        co_return std::move(transfer->response);
    }

private:
    CurlMultiWorker worker_;
};

} // namespace

std::shared_ptr<IHttpTransport> makeCurlTransport() {
    return std::make_shared<CurlTransport>();
}

} // namespace ferry::uploader
