#pragma once

#include <ferry/core/types.h>

#include <chrono>
#include <cstdint>
#include <functional>
#include <optional>
#include <string>
#include <utility>

namespace ferry::progress {

/**
 * One raw measurement from a transfer. Within one attempt `bytes` never decreases.
 */
struct ProgressSample {
    SteadyPoint timestamp{}; // when measured; default-constructed = stamp on arrival
    std::uint64_t bytes{0};
    std::optional<std::uint64_t> total; // absent or 0 = unknown
    std::optional<double> bytesPerSecond;
};

/**
 * Event handed to the reporter: a sample tagged with its phase label.
 * `terminal` marks the end of a phase ("download finished") and is always emitted.
 */
struct ProgressEvent {
    std::string phase;
    std::uint64_t bytes{0};
    std::optional<std::uint64_t> total;
    std::optional<double> bytesPerSecond;
    bool terminal{false};
    std::optional<SteadyPoint> timestamp; // empty = reporter clock
};

/**
 * External status channel (a chat message edited in place, a console line, ...).
 * Fire-and-forget: implementations may throw anything, the reporter drops the update.
 */
class IStatusSink {
public:
    virtual ~IStatusSink() = default;
    virtual void send(const std::string& correlation, const std::string& text) = 0;
};

/**
 * Throttling state of one status channel.
 */
struct RateLimiterState {
    std::optional<SteadyPoint> lastEmitted;
    std::optional<double> lastPercent;
    std::uint64_t lastBytes{0};
};

struct ReporterOptions {
    std::chrono::milliseconds minInterval{2000};
    double minPercentDelta{10.0};
    std::uint64_t minBytesDelta{2 * MiB};
    std::function<SteadyPoint()> clock; // empty = steady_clock::now
};

/**
 * Throttled formatter in front of an IStatusSink.
 *
 * A non-terminal event is forwarded only if at least minInterval elapsed since the last
 * emission and the percentage (or byte count, when the total is unknown) moved by at least
 * the configured delta. The first event after beginPhase() and every terminal event are
 * always forwarded. Emitted percentages never decrease within a phase.
 *
 * Not thread-safe: lives on the scheduler thread together with its session.
 */
class ProgressReporter {
public:
    ProgressReporter(IStatusSink& sink, std::string correlation, ReporterOptions options = {});

    // Returns true when the event reached the sink.
    bool report(const ProgressEvent& event);
    bool report(const std::string& phase, const ProgressSample& sample, bool terminal = false);

    // Unthrottled free-form message.
    void notice(const std::string& text);

    // Resets the throttling baseline; used when a new phase or a retry attempt starts.
    void beginPhase(const std::string& phase);

    // Prefix prepended to every message ("Title: ...\nStatus:\n").
    void setHeader(std::string header) { header_ = std::move(header); }

    const RateLimiterState& state() const { return state_; }
    const std::string& phase() const { return phase_; }
    std::uint64_t emitted() const { return emitted_; }
    std::uint64_t suppressed() const { return suppressed_; }
    std::uint64_t sinkFailures() const { return sinkFailures_; }

private:
    SteadyPoint now() const;
    bool deliver(const std::string& text);

    IStatusSink& sink_;
    std::string correlation_;
    ReporterOptions options_;
    RateLimiterState state_;
    std::string phase_;
    std::string header_;
    std::uint64_t emitted_{0};
    std::uint64_t suppressed_{0};
    std::uint64_t sinkFailures_{0};
};

// 1024-based human readable size: "512.0B", "12.3MB".
std::string formatSize(double bytes);

// "42s", "3m 5s", "1h 2m".
std::string formatDuration(double seconds);

// Status block for one event. `percent` is only used when the total is known.
std::string formatStatus(const ProgressEvent& event, std::optional<double> percent);

} // namespace ferry::progress
