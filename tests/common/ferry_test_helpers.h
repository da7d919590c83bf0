#pragma once

#include <ferry/core/async_utils.hpp>
#include <ferry/core/types.h>
#include <ferry/progress/progress_reporter.h>

#include <boost/asio/co_spawn.hpp>
#include <boost/asio/executor_work_guard.hpp>
#include <boost/asio/io_context.hpp>
#include <boost/asio/use_future.hpp>

#include <chrono>
#include <filesystem>
#include <fstream>
#include <functional>
#include <mutex>
#include <optional>
#include <random>
#include <stdexcept>
#include <string>
#include <thread>
#include <utility>
#include <vector>

namespace ferry::test {

namespace fs = std::filesystem;

// Minimal helper to generate a unique temporary directory for tests
inline fs::path make_temp_dir(const std::string& prefix = "ferry-test-") {
    auto base = fs::temp_directory_path();
    std::random_device rd;
    std::mt19937_64 gen(rd());
    std::uniform_int_distribution<unsigned long long> dist;
    fs::path dir;
    for (int i = 0; i < 5; ++i) {
        dir = base / (prefix + std::to_string(dist(gen)));
        if (!fs::exists(dir)) {
            fs::create_directories(dir);
            break;
        }
    }
    return dir;
}

inline fs::path write_file(const fs::path& path, std::size_t bytes, char fill = 'x') {
    std::ofstream out(path, std::ios::binary);
    std::string block(bytes, fill);
    out.write(block.data(), static_cast<std::streamsize>(block.size()));
    return path;
}

/**
 * io_context running on its own thread; run() blocks the test until the coroutine is done.
 */
class IoRunner {
public:
    IoRunner() : guard_(boost::asio::make_work_guard(io_)), thread_([this] { io_.run(); }) {}

    ~IoRunner() {
        guard_.reset();
        io_.stop();
        if (thread_.joinable()) {
            thread_.join();
        }
    }

    template <typename T> T run(boost::asio::awaitable<T> aw) {
        auto fut = boost::asio::co_spawn(io_, std::move(aw), boost::asio::use_future);
        return fut.get();
    }

    boost::asio::io_context& io() { return io_; }

private:
    boost::asio::io_context io_;
    boost::asio::executor_work_guard<boost::asio::io_context::executor_type> guard_;
    std::thread thread_;
};

// Clock the test advances by hand.
class ManualClock {
public:
    SteadyPoint now() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return now_;
    }
    void advance(std::chrono::milliseconds d) {
        std::lock_guard<std::mutex> lock(mutex_);
        now_ += d;
    }
    std::function<SteadyPoint()> fn() {
        return [this] { return now(); };
    }

private:
    mutable std::mutex mutex_;
    SteadyPoint now_{std::chrono::steady_clock::time_point{} + std::chrono::hours(1)};
};

class RecordingSink : public progress::IStatusSink {
public:
    void send(const std::string& correlation, const std::string& text) override {
        std::lock_guard<std::mutex> lock(mutex_);
        if (failNext_) {
            failNext_ = false;
            throw std::runtime_error("status channel unavailable");
        }
        if (throwCode_) {
            const int code = *throwCode_;
            if (--throwsLeft_ <= 0) {
                throwCode_.reset();
            }
            throw code;
        }
        messages_.emplace_back(correlation, text);
    }

    void failNextSend() {
        std::lock_guard<std::mutex> lock(mutex_);
        failNext_ = true;
    }

    // Next `count` sends throw a bare int instead of a std::exception.
    void throwOnSend(int code, int count = 1) {
        std::lock_guard<std::mutex> lock(mutex_);
        throwCode_ = code;
        throwsLeft_ = count;
    }

    std::vector<std::pair<std::string, std::string>> messages() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return messages_;
    }

    std::vector<std::string> texts() const {
        std::lock_guard<std::mutex> lock(mutex_);
        std::vector<std::string> out;
        for (const auto& [c, t] : messages_) {
            out.push_back(t);
        }
        return out;
    }

private:
    mutable std::mutex mutex_;
    bool failNext_{false};
    std::optional<int> throwCode_;
    int throwsLeft_{0};
    std::vector<std::pair<std::string, std::string>> messages_;
};

// Delay source that completes immediately and remembers what was asked for.
struct RecordedDelays {
    std::vector<std::chrono::milliseconds> delays;

    async::DelayFn fn() {
        return [this](std::chrono::milliseconds d) -> boost::asio::awaitable<void> {
            delays.push_back(d);
            co_return;
        };
    }
};

} // namespace ferry::test
