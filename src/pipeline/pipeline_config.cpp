#include <spdlog/spdlog.h>
#include <ferry/config/config_helpers.h>
#include <ferry/pipeline/pipeline_config.h>

#include <system_error>

namespace ferry::config {

namespace {

template <typename T>
void setCount(T& target, const std::string& raw, const char* key) {
    if (auto v = parse_integer(raw); v && *v >= 0) {
        target = static_cast<T>(*v);
    } else {
        spdlog::warn("[Config] ignoring invalid value '{}' for {}", raw, key);
    }
}

void setMillis(std::chrono::milliseconds& target, const std::string& raw, const char* key) {
    if (auto v = parse_integer(raw); v && *v >= 0) {
        target = std::chrono::milliseconds(*v);
    } else {
        spdlog::warn("[Config] ignoring invalid value '{}' for {}", raw, key);
    }
}

void setDouble(double& target, const std::string& raw, const char* key) {
    if (auto v = parse_double(raw); v && *v >= 0.0) {
        target = *v;
    } else {
        spdlog::warn("[Config] ignoring invalid value '{}' for {}", raw, key);
    }
}

void setBool(bool& target, const std::string& raw, const char* key) {
    if (auto v = parse_bool(raw)) {
        target = *v;
    } else {
        spdlog::warn("[Config] ignoring invalid value '{}' for {}", raw, key);
    }
}

} // namespace

Result<void> applyFileSettings(PipelineConfig& cfg, const std::filesystem::path& path) {
    auto parsed = parse_toml_file(path);
    if (!parsed) {
        return parsed.error();
    }

    for (const auto& [section, values] : parsed.value()) {
        for (const auto& [key, raw] : values) {
            const std::string full = section.empty() ? key : section + "." + key;

            if (section == "download") {
                if (key == "max_concurrent") {
                    setCount(cfg.download.maxConcurrent, raw, "download.max_concurrent");
                } else if (key == "work_dir") {
                    cfg.download.workDir = expand_tilde(raw);
                } else if (key == "cookies_file") {
                    cfg.download.cookiesFile = raw.empty() ? std::filesystem::path{}
                                                           : expand_tilde(raw);
                } else if (key == "extractor") {
                    cfg.download.extractor = raw;
                } else if (key == "progress_handoff_ms") {
                    setMillis(cfg.download.progressHandoff, raw, "download.progress_handoff_ms");
                } else {
                    spdlog::debug("[Config] unknown key {}", full);
                }
            } else if (section == "policy") {
                if (key == "max_inline_mb") {
                    setCount(cfg.policy.maxInlineMb, raw, "policy.max_inline_mb");
                } else if (key == "force_offload") {
                    setBool(cfg.policy.forceOffload, raw, "policy.force_offload");
                } else {
                    spdlog::debug("[Config] unknown key {}", full);
                }
            } else if (section == "session") {
                if (key == "ttl_seconds") {
                    if (auto v = parse_integer(raw); v && *v >= 0) {
                        cfg.session.ttl = std::chrono::seconds(*v);
                    } else {
                        spdlog::warn("[Config] ignoring invalid value '{}' for {}", raw, full);
                    }
                } else {
                    spdlog::debug("[Config] unknown key {}", full);
                }
            } else if (section == "progress") {
                if (key == "min_interval_ms") {
                    setMillis(cfg.progress.minInterval, raw, "progress.min_interval_ms");
                } else if (key == "min_percent_delta") {
                    setDouble(cfg.progress.minPercentDelta, raw, "progress.min_percent_delta");
                } else if (key == "min_bytes_delta") {
                    setCount(cfg.progress.minBytesDelta, raw, "progress.min_bytes_delta");
                } else {
                    spdlog::debug("[Config] unknown key {}", full);
                }
            } else if (section == "upload") {
                auto& up = cfg.upload;
                if (key == "endpoints") {
                    up.endpoints = parse_list(raw);
                } else if (key == "upload_path") {
                    up.uploadPath = raw;
                } else if (key == "api_token") {
                    up.apiToken = raw;
                } else if (key == "probe_timeout_ms") {
                    setMillis(up.probeTimeout, raw, "upload.probe_timeout_ms");
                } else if (key == "attempt_timeout_ms") {
                    setMillis(up.attemptTimeout, raw, "upload.attempt_timeout_ms");
                } else if (key == "max_attempts") {
                    setCount(up.maxAttempts, raw, "upload.max_attempts");
                } else if (key == "initial_backoff_ms") {
                    setMillis(up.initialBackoff, raw, "upload.initial_backoff_ms");
                } else if (key == "backoff_multiplier") {
                    setDouble(up.backoffMultiplier, raw, "upload.backoff_multiplier");
                } else if (key == "max_backoff_ms") {
                    setMillis(up.maxBackoff, raw, "upload.max_backoff_ms");
                } else if (key == "chunk_size_bytes") {
                    setCount(up.chunkSizeBytes, raw, "upload.chunk_size_bytes");
                } else {
                    spdlog::debug("[Config] unknown key {}", full);
                }
            } else if (section == "log") {
                if (key == "level") {
                    cfg.log.level = raw;
                } else if (key == "file") {
                    cfg.log.file = raw.empty() ? std::filesystem::path{} : expand_tilde(raw);
                } else {
                    spdlog::debug("[Config] unknown key {}", full);
                }
            } else {
                spdlog::debug("[Config] unknown key {}", full);
            }
        }
    }
    return Result<void>();
}

void applyEnvironment(PipelineConfig& cfg) {
    if (auto v = env_value("FERRY_MAX_CONCURRENT_DOWNLOADS")) {
        setCount(cfg.download.maxConcurrent, *v, "FERRY_MAX_CONCURRENT_DOWNLOADS");
    }
    if (auto v = env_value("FERRY_DOWNLOAD_PATH")) {
        cfg.download.workDir = expand_tilde(*v);
    }
    if (auto v = env_value("FERRY_COOKIES_FILE")) {
        cfg.download.cookiesFile = expand_tilde(*v);
    }
    if (auto v = env_value("FERRY_EXTRACTOR")) {
        cfg.download.extractor = *v;
    }
    if (auto v = env_value("FERRY_MAX_DOWNLOAD_SIZE")) {
        setCount(cfg.policy.maxInlineMb, *v, "FERRY_MAX_DOWNLOAD_SIZE");
    }
    if (auto v = env_value("FERRY_FORCE_OFFLOAD")) {
        setBool(cfg.policy.forceOffload, *v, "FERRY_FORCE_OFFLOAD");
    }
    if (auto v = env_value("FERRY_UPLOAD_ENDPOINTS")) {
        cfg.upload.endpoints = parse_list(*v);
    }
    if (auto v = env_value("FERRY_GOFILE_API_KEY")) {
        cfg.upload.apiToken = *v;
    }
    if (auto v = env_value("FERRY_LOG_LEVEL")) {
        cfg.log.level = *v;
    }
}

Result<PipelineConfig> loadPipelineConfig(const std::string& configPathOverride,
                                          const CommandLineOverrides& cli) {
    PipelineConfig cfg;

    const auto path = get_config_path(configPathOverride);
    std::error_code ec;
    if (std::filesystem::exists(path, ec)) {
        if (auto r = applyFileSettings(cfg, path); !r) {
            return r.error();
        }
        spdlog::debug("[Config] loaded {}", path.string());
    } else if (!configPathOverride.empty()) {
        return Error{ErrorCode::FileNotFound, "Config file not found: " + path.string()};
    }

    applyEnvironment(cfg);

    if (cli.logLevel) {
        cfg.log.level = *cli.logLevel;
    }
    if (cli.forceOffload) {
        cfg.policy.forceOffload = *cli.forceOffload;
    }
    if (cli.workDir) {
        cfg.download.workDir = *cli.workDir;
    }
    return cfg;
}

Result<void> validate(const PipelineConfig& cfg) {
    if (cfg.download.maxConcurrent == 0) {
        return Error{ErrorCode::InvalidArgument, "download.max_concurrent must be at least 1"};
    }
    if (cfg.download.workDir.empty()) {
        return Error{ErrorCode::InvalidArgument, "download.work_dir must not be empty"};
    }
    if (cfg.download.extractor.empty()) {
        return Error{ErrorCode::InvalidArgument, "download.extractor must not be empty"};
    }
    if (cfg.upload.endpoints.empty()) {
        return Error{ErrorCode::InvalidArgument, "upload.endpoints must list at least one host"};
    }
    if (cfg.upload.maxAttempts <= 0) {
        return Error{ErrorCode::InvalidArgument, "upload.max_attempts must be at least 1"};
    }
    if (cfg.upload.chunkSizeBytes == 0) {
        return Error{ErrorCode::InvalidArgument, "upload.chunk_size_bytes must be non-zero"};
    }
    if (cfg.upload.backoffMultiplier < 1.0) {
        return Error{ErrorCode::InvalidArgument, "upload.backoff_multiplier must be >= 1.0"};
    }
    if (cfg.progress.minPercentDelta > 100.0) {
        return Error{ErrorCode::InvalidArgument, "progress.min_percent_delta must be <= 100"};
    }
    return Result<void>();
}

} // namespace ferry::config
