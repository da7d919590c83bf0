#pragma once

#include <ferry/core/types.h>

#include <spdlog/spdlog.h>
#include <boost/asio/as_tuple.hpp>
#include <boost/asio/awaitable.hpp>
#include <boost/asio/co_spawn.hpp>
#include <boost/asio/detached.hpp>
#include <boost/asio/experimental/awaitable_operators.hpp>
#include <boost/asio/experimental/channel.hpp>
#include <boost/asio/post.hpp>
#include <boost/asio/steady_timer.hpp>
#include <boost/asio/this_coro.hpp>
#include <boost/asio/thread_pool.hpp>
#include <boost/asio/use_awaitable.hpp>

#include <atomic>
#include <chrono>
#include <cstddef>
#include <cstdint>
#include <exception>
#include <functional>
#include <memory>
#include <mutex>
#include <string>
#include <thread>
#include <utility>
#include <variant>

namespace ferry::async {

// Injectable delay source. Production code waits on a steady_timer; tests substitute a
// recorder that completes immediately.
using DelayFn = std::function<boost::asio::awaitable<void>(std::chrono::milliseconds)>;

inline DelayFn steadyDelay() {
    return [](std::chrono::milliseconds delay) -> boost::asio::awaitable<void> {
        auto ex = co_await boost::asio::this_coro::executor;
        boost::asio::steady_timer timer(ex);
        timer.expires_after(delay);
        co_await timer.async_wait(boost::asio::use_awaitable);
    };
}

// awaitWithTimeout: runs an awaitable that returns ferry::Result<T> with a timeout.
// Fn must return boost::asio::awaitable<ferry::Result<T>>.
template <typename T, typename Fn>
boost::asio::awaitable<Result<T>> awaitWithTimeout(Fn&& fn, std::chrono::milliseconds timeout) {
    using namespace boost::asio::experimental::awaitable_operators;
    auto ex = co_await boost::asio::this_coro::executor;
    boost::asio::steady_timer timer(ex);
    timer.expires_after(timeout);
    auto which = co_await (fn() || timer.async_wait(boost::asio::use_awaitable));
    if (which.index() == 1) {
        co_return Error{ErrorCode::Timeout,
                        "timed out after " + std::to_string(timeout.count()) + " ms"};
    }
    co_return std::move(std::get<0>(which));
}

struct HandoffOptions {
    std::size_t queueDepth{64};
    // How long a worker may wait for room in the queue before an event is dropped.
    std::chrono::milliseconds handoffTimeout{100};
};

/**
 * Thread-safe emitter handed to blocking jobs. emit() never blocks longer than the
 * configured handoff timeout; events that cannot be queued in time are dropped.
 */
template <typename Event> class EventEmitter {
public:
    using TrySend = std::function<bool(const Event&)>;

    EventEmitter(TrySend trySend, std::chrono::milliseconds handoffTimeout,
                 std::shared_ptr<std::atomic<std::uint64_t>> dropped)
        : trySend_(std::move(trySend)), handoffTimeout_(handoffTimeout),
          dropped_(std::move(dropped)) {}

    bool emit(const Event& event) const {
        const auto deadline = std::chrono::steady_clock::now() + handoffTimeout_;
        while (!trySend_(event)) {
            if (std::chrono::steady_clock::now() >= deadline) {
                dropped_->fetch_add(1, std::memory_order_relaxed);
                return false;
            }
            std::this_thread::sleep_for(std::chrono::milliseconds(2));
        }
        return true;
    }

    std::uint64_t dropped() const { return dropped_->load(std::memory_order_relaxed); }

private:
    TrySend trySend_;
    std::chrono::milliseconds handoffTimeout_;
    std::shared_ptr<std::atomic<std::uint64_t>> dropped_;
};

/**
 * runBlocking: executes a blocking job on a bounded thread pool without blocking the
 * calling coroutine's executor.
 *
 * - Job signature: Result<T>(const EventEmitter<Event>&), invoked on a pool thread.
 * - Intermediate events are relayed through a bounded channel and passed to onEvent on
 *   the awaiting executor, in the order the job emitted them.
 * - The final Result<T> is always delivered; exceptions escaping the job become
 *   ErrorCode::InternalError.
 * - droppedOut (optional) receives the number of events lost to back-pressure.
 */
template <typename T, typename Event, typename Job, typename OnEvent>
boost::asio::awaitable<Result<T>> runBlocking(boost::asio::thread_pool& pool, Job job,
                                              OnEvent onEvent, HandoffOptions options = {},
                                              std::uint64_t* droppedOut = nullptr) {
    // Event first so the message stays default constructible for the channel.
    using Message = std::variant<Event, Result<T>>;
    using Channel = boost::asio::experimental::basic_channel<
        boost::asio::any_io_executor, boost::asio::experimental::channel_traits<std::mutex>,
        void(boost::system::error_code, Message)>;

    auto ex = co_await boost::asio::this_coro::executor;
    auto channel = std::make_shared<Channel>(ex, options.queueDepth);
    auto dropped = std::make_shared<std::atomic<std::uint64_t>>(0);

    EventEmitter<Event> emitter(
        [channel](const Event& event) {
            return channel->try_send(boost::system::error_code{},
                                     Message{std::in_place_index<0>, event});
        },
        options.handoffTimeout, dropped);

    boost::asio::post(pool, [channel, emitter, job = std::move(job)]() mutable {
        Message final{std::in_place_index<1>,
                      Result<T>{Error{ErrorCode::InternalError, "job produced no result"}}};
        try {
            final = Message{std::in_place_index<1>, job(emitter)};
        } catch (const std::exception& e) {
            final = Message{std::in_place_index<1>,
                            Result<T>{Error{ErrorCode::InternalError, e.what()}}};
        } catch (...) {
            final = Message{std::in_place_index<1>,
                            Result<T>{Error{ErrorCode::InternalError, "unknown exception"}}};
        }
        // The final result must not be dropped: wait for room on the channel's executor.
        boost::asio::co_spawn(
            channel->get_executor(),
            [channel, msg = std::move(final)]() mutable -> boost::asio::awaitable<void> {
                co_await channel->async_send(boost::system::error_code{}, std::move(msg),
                                             boost::asio::as_tuple(boost::asio::use_awaitable));
            },
            boost::asio::detached);
    });

    for (;;) {
        auto [ec, msg] =
            co_await channel->async_receive(boost::asio::as_tuple(boost::asio::use_awaitable));
        if (ec) {
            co_return Error{ErrorCode::InternalError, "handoff channel closed: " + ec.message()};
        }
        if (msg.index() == 0) {
            onEvent(std::get<0>(msg));
            continue;
        }
        const auto lost = dropped->load(std::memory_order_relaxed);
        if (lost > 0) {
            spdlog::debug("[Handoff] dropped {} event(s) under back-pressure", lost);
        }
        if (droppedOut) {
            *droppedOut = lost;
        }
        co_return std::move(std::get<1>(msg));
    }
}

} // namespace ferry::async
