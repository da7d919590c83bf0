#include <spdlog/spdlog.h>
#include <ferry/progress/progress_reporter.h>

#include <fmt/format.h>

#include <algorithm>
#include <cmath>
#include <exception>

namespace ferry::progress {

namespace {

bool knownTotal(const std::optional<std::uint64_t>& total) {
    return total.has_value() && *total > 0;
}

} // namespace

std::string formatSize(double bytes) {
    static constexpr const char* kUnits[] = {"B", "KB", "MB", "GB"};
    for (const char* unit : kUnits) {
        if (bytes < 1024.0) {
            return fmt::format("{:.1f}{}", bytes, unit);
        }
        bytes /= 1024.0;
    }
    return fmt::format("{:.1f}TB", bytes);
}

std::string formatDuration(double seconds) {
    if (!(seconds > 0.0)) {
        return "0s";
    }
    auto total = static_cast<std::uint64_t>(std::llround(seconds));
    if (total < 60) {
        return fmt::format("{}s", total);
    }
    if (total < 3600) {
        return fmt::format("{}m {}s", total / 60, total % 60);
    }
    return fmt::format("{}h {}m", total / 3600, (total % 3600) / 60);
}

std::string formatStatus(const ProgressEvent& event, std::optional<double> percent) {
    if (event.terminal) {
        if (knownTotal(event.total)) {
            return fmt::format("{} complete ({})", event.phase,
                               formatSize(static_cast<double>(*event.total)));
        }
        return fmt::format("{} complete ({})", event.phase,
                           formatSize(static_cast<double>(event.bytes)));
    }
    if (!knownTotal(event.total) || !percent) {
        return fmt::format("{}... {}", event.phase, formatSize(static_cast<double>(event.bytes)));
    }

    const double rate = event.bytesPerSecond.value_or(0.0);
    const auto total = *event.total;
    const auto remaining = total > event.bytes ? total - event.bytes : 0;
    const double eta = rate > 0.0 ? static_cast<double>(remaining) / rate : 0.0;

    return fmt::format("{}: {:.1f}%\nSize: {}/{}\nSpeed: {}/s\nETA: {}", event.phase, *percent,
                       formatSize(static_cast<double>(event.bytes)),
                       formatSize(static_cast<double>(total)), formatSize(rate),
                       formatDuration(eta));
}

ProgressReporter::ProgressReporter(IStatusSink& sink, std::string correlation,
                                   ReporterOptions options)
    : sink_(sink), correlation_(std::move(correlation)), options_(std::move(options)) {}

SteadyPoint ProgressReporter::now() const {
    return options_.clock ? options_.clock() : std::chrono::steady_clock::now();
}

void ProgressReporter::beginPhase(const std::string& phase) {
    phase_ = phase;
    state_ = RateLimiterState{};
}

bool ProgressReporter::report(const std::string& phase, const ProgressSample& sample,
                              bool terminal) {
    ProgressEvent event;
    event.phase = phase;
    event.bytes = sample.bytes;
    event.total = sample.total;
    event.bytesPerSecond = sample.bytesPerSecond;
    event.terminal = terminal;
    if (sample.timestamp != SteadyPoint{}) {
        event.timestamp = sample.timestamp;
    }
    return report(event);
}

bool ProgressReporter::report(const ProgressEvent& event) {
    if (event.phase != phase_) {
        beginPhase(event.phase);
    }

    const auto ts = event.timestamp.value_or(now());
    std::optional<double> percent;
    if (knownTotal(event.total)) {
        double raw = 100.0 * static_cast<double>(event.bytes) / static_cast<double>(*event.total);
        raw = std::clamp(raw, 0.0, 100.0);
        percent = state_.lastPercent ? std::max(raw, *state_.lastPercent) : raw;
    }

    if (!event.terminal && state_.lastEmitted) {
        const bool intervalOk = ts - *state_.lastEmitted >= options_.minInterval;
        bool deltaOk = false;
        if (percent) {
            const double base = state_.lastPercent.value_or(0.0);
            deltaOk = *percent - base >= options_.minPercentDelta;
        } else {
            deltaOk = event.bytes >= state_.lastBytes &&
                      event.bytes - state_.lastBytes >= options_.minBytesDelta;
        }
        if (!intervalOk || !deltaOk) {
            ++suppressed_;
            return false;
        }
    }

    state_.lastEmitted = ts;
    state_.lastBytes = event.bytes;
    if (percent) {
        state_.lastPercent = percent;
    }
    return deliver(formatStatus(event, percent));
}

void ProgressReporter::notice(const std::string& text) {
    deliver(text);
}

bool ProgressReporter::deliver(const std::string& text) {
    try {
        sink_.send(correlation_, header_ + text);
        ++emitted_;
        return true;
    } catch (const std::exception& e) {
        ++sinkFailures_;
        spdlog::debug("[Progress] status update for {} dropped: {}", correlation_, e.what());
    } catch (...) {
        ++sinkFailures_;
        spdlog::debug("[Progress] status update for {} dropped: unknown error", correlation_);
    }
    return false;
}

} // namespace ferry::progress
