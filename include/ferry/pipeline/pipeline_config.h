#pragma once

#include <ferry/core/types.h>

#include <chrono>
#include <cstdint>
#include <filesystem>
#include <optional>
#include <string>
#include <vector>

namespace ferry::config {

struct DownloadSettings {
    std::size_t maxConcurrent = 3;
    std::filesystem::path workDir = "downloads/temp";
    std::filesystem::path cookiesFile;
    std::string extractor = "yt-dlp";
    std::chrono::milliseconds progressHandoff{100};
};

struct PolicySettings {
    std::uint64_t maxInlineMb = 2048;
    bool forceOffload = false;
};

struct SessionSettings {
    std::chrono::seconds ttl{900};
};

struct ProgressSettings {
    std::chrono::milliseconds minInterval{2000};
    double minPercentDelta = 10.0;
    std::uint64_t minBytesDelta = 2 * MiB;
};

struct UploadSettings {
    std::vector<std::string> endpoints{"https://upload.gofile.io"};
    std::string uploadPath = "/uploadfile";
    std::string apiToken;
    std::chrono::milliseconds probeTimeout{3000};
    std::chrono::milliseconds attemptTimeout{600000};
    int maxAttempts = 3;
    std::chrono::milliseconds initialBackoff{1000};
    double backoffMultiplier = 2.0;
    std::chrono::milliseconds maxBackoff{30000};
    std::size_t chunkSizeBytes = 1 * MiB;
};

struct LogSettings {
    std::string level = "info";
    std::filesystem::path file;
};

struct PipelineConfig {
    DownloadSettings download;
    PolicySettings policy;
    SessionSettings session;
    ProgressSettings progress;
    UploadSettings upload;
    LogSettings log;

    std::uint64_t inlineThresholdBytes() const { return policy.maxInlineMb * MiB; }
};

// Values given on the command line; unset fields leave the lower layers alone.
struct CommandLineOverrides {
    std::optional<std::string> logLevel;
    std::optional<bool> forceOffload;
    std::optional<std::filesystem::path> workDir;
};

// Applies "[section] key = value" pairs from a parsed config file on top of cfg.
// Unparsable values keep the previous setting and log a warning.
Result<void> applyFileSettings(PipelineConfig& cfg, const std::filesystem::path& path);

// Applies FERRY_* environment overrides on top of cfg.
void applyEnvironment(PipelineConfig& cfg);

// Builds the effective configuration: defaults < config file < environment < command line.
// A missing config file is not an error; an unreadable explicit --config path is.
Result<PipelineConfig> loadPipelineConfig(const std::string& configPathOverride = "",
                                          const CommandLineOverrides& cli = {});

// Rejects settings the pipeline cannot run with.
Result<void> validate(const PipelineConfig& cfg);

} // namespace ferry::config
