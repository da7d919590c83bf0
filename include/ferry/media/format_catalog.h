#pragma once

#include <ferry/core/types.h>

#include <compare>
#include <cstdint>
#include <map>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace ferry::media {

enum class MediaKind { Video, Audio };

constexpr const char* toString(MediaKind kind) {
    return kind == MediaKind::Audio ? "audio" : "video";
}

// Short form used inside selection keys ("v" / "a").
constexpr const char* toKeyTag(MediaKind kind) {
    return kind == MediaKind::Audio ? "a" : "v";
}

inline const std::vector<std::string> kSupportedVideoQualities = {
    "144p", "240p", "360p", "480p", "720p", "1080p", "1440p", "2160p"};
inline const std::vector<std::string> kSupportedAudioFormats = {"mp3", "wav"};

// Backend selector used for audio extraction.
inline constexpr const char* kBestAudioSelector = "bestaudio/best";

/**
 * A selectable quality/container/codec combination. Immutable once bound to a session.
 */
struct FormatVariant {
    MediaKind kind{MediaKind::Video};
    std::string quality;   // "720p", or the audio format ("mp3")
    std::string container; // file extension
    std::string videoCodec;
    std::string audioCodec;
    std::optional<double> bitrateKbps;
    std::optional<std::uint64_t> sizeEstimate;
    std::string formatId;

    // Pixel height for video qualities ("720p" -> 720), 0 otherwise.
    int height() const;
};

struct VariantKey {
    MediaKind kind{MediaKind::Video};
    std::string quality;
    std::string container;

    auto operator<=>(const VariantKey&) const = default;
    bool operator==(const VariantKey&) const = default;
};

/**
 * One format entry as reported by the extractor, before filtering.
 */
struct RawFormat {
    std::string formatId;
    std::string ext;
    std::string vcodec;
    std::string acodec;
    std::optional<int> height;
    std::optional<double> tbr;
    std::optional<std::uint64_t> filesize;
};

/**
 * Typed table (kind, quality, container) -> ranked variants, best first
 * (higher bitrate, then larger size).
 */
class FormatCatalog {
public:
    void add(FormatVariant variant);

    const std::vector<FormatVariant>* find(const VariantKey& key) const;
    std::optional<FormatVariant> best(const VariantKey& key) const;

    // Audio formats in insertion order of kSupportedAudioFormats; video qualities by height.
    std::vector<std::string> qualities(MediaKind kind) const;
    std::vector<std::string> containers(MediaKind kind, const std::string& quality) const;

    bool empty() const { return table_.empty(); }
    std::size_t size() const { return table_.size(); }

private:
    std::map<VariantKey, std::vector<FormatVariant>> table_;
};

/**
 * Keeps combined audio+video formats whose height is one of kSupportedVideoQualities and
 * adds one bestaudio entry per supported audio format.
 */
FormatCatalog buildCatalog(const std::vector<RawFormat>& formats);

/**
 * Metadata of one source as reported by the extractor.
 */
struct MediaInfo {
    std::string title;
    std::string uploader;
    std::string thumbnail;
    std::string description;
    std::optional<double> durationSeconds;
    std::optional<std::uint64_t> viewCount;
    std::vector<RawFormat> formats;
};

inline constexpr const char* kUnknownTitle = "Unknown Title";

// Parses extractor JSON (yt-dlp -J). InvalidData when the document is malformed.
Result<MediaInfo> parseMediaInfo(std::string_view json);

} // namespace ferry::media
