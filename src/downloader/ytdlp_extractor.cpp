#include <spdlog/spdlog.h>
#include <ferry/downloader/downloader.hpp>

#include <sys/wait.h>

#include <algorithm>
#include <chrono>
#include <cstdio>
#include <cstdlib>
#include <memory>
#include <sstream>
#include <string_view>
#include <vector>

namespace ferry::downloader {

namespace {

constexpr std::string_view kProgressTag = "[ferry-progress] ";
constexpr std::string_view kFileTag = "[ferry-file] ";
constexpr std::string_view kTitleTag = "[ferry-title] ";

std::string shellQuote(const std::string& s) {
    std::string out = "'";
    for (char c : s) {
        if (c == '\'') {
            out += "'\\''";
        } else {
            out += c;
        }
    }
    out += "'";
    return out;
}

bool startsWith(std::string_view s, std::string_view prefix) {
    return s.size() >= prefix.size() && s.substr(0, prefix.size()) == prefix;
}

void chomp(std::string& line) {
    while (!line.empty() && (line.back() == '\n' || line.back() == '\r')) {
        line.pop_back();
    }
}

// yt-dlp prints "NA" for missing fields.
std::optional<double> parseField(const std::string& token) {
    if (token.empty() || token == "NA" || token == "None") {
        return std::nullopt;
    }
    char* end = nullptr;
    double v = std::strtod(token.c_str(), &end);
    if (end == token.c_str() || v < 0.0) {
        return std::nullopt;
    }
    return v;
}

ErrorCode classifyFailure(const std::string& output) {
    if (output.find("Requested format is not available") != std::string::npos ||
        output.find("No video formats found") != std::string::npos) {
        return ErrorCode::NotFound;
    }
    static const char* kNetworkMarkers[] = {"HTTP Error",        "Unable to download",
                                            "Connection refused", "timed out",
                                            "Temporary failure",  "Network is unreachable",
                                            "getaddrinfo"};
    for (const char* marker : kNetworkMarkers) {
        if (output.find(marker) != std::string::npos) {
            return ErrorCode::NetworkError;
        }
    }
    return ErrorCode::ExtractionFailure;
}

// Last "ERROR:" line, or the tail of the output.
std::string summarizeFailure(const std::vector<std::string>& errors, const std::string& tail) {
    if (!errors.empty()) {
        return errors.back();
    }
    if (tail.empty()) {
        return "extractor exited without output";
    }
    return tail;
}

struct PipeCloser {
    int* status;
    void operator()(FILE* f) const {
        if (f) {
            int rc = pclose(f);
            if (status) {
                *status = rc;
            }
        }
    }
};

class YtDlpExtractor final : public IMediaExtractor {
public:
    explicit YtDlpExtractor(ExtractorConfig config) : config_(std::move(config)) {}

    Result<media::MediaInfo> probe(const std::string& uri) override {
        std::ostringstream cmd;
        cmd << shellQuote(config_.executable) << " -J --no-playlist --no-warnings"
            << cookiesArg() << " -- " << shellQuote(uri) << " 2>&1";

        std::string json;
        std::vector<std::string> errors;
        std::string lastLine;
        int status = -1;
        {
            std::unique_ptr<FILE, PipeCloser> pipe(popen(cmd.str().c_str(), "r"),
                                                   PipeCloser{&status});
            if (!pipe) {
                return Error{ErrorCode::ExtractionFailure,
                             "failed to launch " + config_.executable};
            }
            std::string line;
            char buffer[4096];
            while (fgets(buffer, sizeof(buffer), pipe.get())) {
                line += buffer;
                if (line.empty() || line.back() != '\n') {
                    continue; // long JSON line, keep reading
                }
                chomp(line);
                if (!line.empty() && line.front() == '{') {
                    json = line;
                } else if (startsWith(line, "ERROR:")) {
                    errors.push_back(line);
                } else if (!line.empty()) {
                    lastLine = line;
                }
                line.clear();
            }
            if (!line.empty() && line.front() == '{') {
                json = line;
            }
        }

        if (json.empty() || !WIFEXITED(status) || WEXITSTATUS(status) != 0) {
            std::string all;
            for (const auto& e : errors) {
                all += e + "\n";
            }
            all += lastLine;
            const auto code = json.empty() ? classifyFailure(all) : ErrorCode::ExtractionFailure;
            return Error{code, summarizeFailure(errors, lastLine)};
        }

        auto info = media::parseMediaInfo(json);
        if (!info) {
            return Error{ErrorCode::ExtractionFailure, info.error().message};
        }
        return info;
    }

    Result<FetchResult> fetch(const FetchRequest& request,
                              const ProgressCallback& onProgress) override {
        const auto& v = request.variant;
        const auto outputTemplate =
            (request.workDir / ("%(title).120B [" + request.sessionId + "-" + v.quality +
                                "].%(ext)s"))
                .string();

        std::ostringstream cmd;
        cmd << shellQuote(config_.executable) << " --no-playlist --no-warnings --newline"
            << " --progress --progress-template "
            << shellQuote(std::string("download:") + std::string(kProgressTag) +
                          "%(progress.downloaded_bytes)s %(progress.total_bytes)s "
                          "%(progress.total_bytes_estimate)s %(progress.speed)s")
            << " --print " << shellQuote(std::string("after_move:") + std::string(kFileTag) +
                                         "%(filepath)s")
            << " --print " << shellQuote(std::string("after_move:") + std::string(kTitleTag) +
                                         "%(title)s")
            << " -o " << shellQuote(outputTemplate) << cookiesArg();

        if (v.kind == media::MediaKind::Audio) {
            cmd << " -f " << shellQuote(media::kBestAudioSelector)
                << " -x --audio-format " << shellQuote(v.container) << " --audio-quality 192K";
        } else {
            const int h = v.height();
            std::string selector;
            if (!v.formatId.empty()) {
                selector = v.formatId + "/";
            }
            selector += "bestvideo[height<=" + std::to_string(h) + "]+bestaudio/best[height<=" +
                        std::to_string(h) + "]";
            cmd << " -f " << shellQuote(selector);
            if (!v.container.empty()) {
                cmd << " --merge-output-format " << shellQuote(v.container);
            }
        }
        cmd << " -- " << shellQuote(request.uri) << " 2>&1";

        spdlog::debug("[Download] exec: {}", cmd.str());

        FetchResult result;
        std::vector<std::string> errors;
        std::string lastLine;
        int status = -1;

        // Separate streams (video, then audio) each restart at zero; keep the total monotone.
        std::uint64_t base = 0;
        std::uint64_t lastBytes = 0;
        std::uint64_t lastTotal = 0;
        {
            std::unique_ptr<FILE, PipeCloser> pipe(popen(cmd.str().c_str(), "r"),
                                                   PipeCloser{&status});
            if (!pipe) {
                return Error{ErrorCode::ExtractionFailure,
                             "failed to launch " + config_.executable};
            }
            char buffer[4096];
            while (fgets(buffer, sizeof(buffer), pipe.get())) {
                std::string line(buffer);
                chomp(line);
                if (startsWith(line, kProgressTag)) {
                    std::istringstream fields(line.substr(kProgressTag.size()));
                    std::string done, total, estimate, speed;
                    fields >> done >> total >> estimate >> speed;
                    auto doneV = parseField(done);
                    if (!doneV) {
                        continue;
                    }
                    auto bytes = static_cast<std::uint64_t>(*doneV);
                    auto totalV = parseField(total);
                    if (!totalV) {
                        totalV = parseField(estimate);
                    }
                    if (bytes < lastBytes) {
                        base += std::max(lastBytes, lastTotal);
                    }
                    lastBytes = bytes;
                    lastTotal = totalV ? static_cast<std::uint64_t>(*totalV) : 0;

                    FetchProgress p;
                    p.timestamp = std::chrono::steady_clock::now();
                    p.bytes = base + bytes;
                    if (totalV && *totalV > 0) {
                        p.total = base + lastTotal;
                    }
                    p.bytesPerSecond = parseField(speed);
                    if (onProgress) {
                        onProgress(p);
                    }
                } else if (startsWith(line, kFileTag)) {
                    result.path = line.substr(kFileTag.size());
                } else if (startsWith(line, kTitleTag)) {
                    result.title = line.substr(kTitleTag.size());
                } else if (startsWith(line, "ERROR:")) {
                    errors.push_back(line);
                } else if (!line.empty()) {
                    lastLine = line;
                }
            }
        }

        if (!WIFEXITED(status) || WEXITSTATUS(status) != 0) {
            std::string all;
            for (const auto& e : errors) {
                all += e + "\n";
            }
            all += lastLine;
            return Error{classifyFailure(all), summarizeFailure(errors, lastLine)};
        }
        if (result.path.empty()) {
            return Error{ErrorCode::ExtractionFailure, "extractor did not report an output file"};
        }
        return result;
    }

private:
    std::string cookiesArg() const {
        if (config_.cookiesFile.empty()) {
            return {};
        }
        return " --cookies " + shellQuote(config_.cookiesFile.string());
    }

    ExtractorConfig config_;
};

} // namespace

std::unique_ptr<IMediaExtractor> makeYtDlpExtractor(ExtractorConfig config) {
    return std::make_unique<YtDlpExtractor>(std::move(config));
}

} // namespace ferry::downloader
