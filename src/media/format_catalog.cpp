#include <nlohmann/json.hpp>
#include <ferry/media/format_catalog.h>

#include <algorithm>
#include <charconv>

namespace ferry::media {

using json = nlohmann::json;

namespace {

bool ranksBefore(const FormatVariant& a, const FormatVariant& b) {
    const double ab = a.bitrateKbps.value_or(0.0);
    const double bb = b.bitrateKbps.value_or(0.0);
    if (ab != bb) {
        return ab > bb;
    }
    return a.sizeEstimate.value_or(0) > b.sizeEstimate.value_or(0);
}

int heightOf(const std::string& quality) {
    if (quality.size() < 2 || quality.back() != 'p') {
        return 0;
    }
    int h = 0;
    auto [ptr, ec] = std::from_chars(quality.data(), quality.data() + quality.size() - 1, h);
    if (ec != std::errc() || ptr != quality.data() + quality.size() - 1) {
        return 0;
    }
    return h;
}

std::string stringOr(const json& j, const char* key, const std::string& fallback = {}) {
    auto it = j.find(key);
    if (it == j.end() || !it->is_string()) {
        return fallback;
    }
    return it->get<std::string>();
}

template <typename T> std::optional<T> numberOf(const json& j, const char* key) {
    auto it = j.find(key);
    if (it == j.end() || !it->is_number()) {
        return std::nullopt;
    }
    return it->get<T>();
}

} // namespace

int FormatVariant::height() const {
    return kind == MediaKind::Video ? heightOf(quality) : 0;
}

void FormatCatalog::add(FormatVariant variant) {
    VariantKey key{variant.kind, variant.quality, variant.container};
    auto& ranked = table_[key];
    auto pos = std::upper_bound(ranked.begin(), ranked.end(), variant, ranksBefore);
    ranked.insert(pos, std::move(variant));
}

const std::vector<FormatVariant>* FormatCatalog::find(const VariantKey& key) const {
    auto it = table_.find(key);
    return it == table_.end() ? nullptr : &it->second;
}

std::optional<FormatVariant> FormatCatalog::best(const VariantKey& key) const {
    const auto* ranked = find(key);
    if (!ranked || ranked->empty()) {
        return std::nullopt;
    }
    return ranked->front();
}

std::vector<std::string> FormatCatalog::qualities(MediaKind kind) const {
    std::vector<std::string> out;
    for (const auto& [key, ranked] : table_) {
        if (key.kind == kind && std::find(out.begin(), out.end(), key.quality) == out.end()) {
            out.push_back(key.quality);
        }
    }
    if (kind == MediaKind::Video) {
        std::stable_sort(out.begin(), out.end(), [](const std::string& a, const std::string& b) {
            return heightOf(a) < heightOf(b);
        });
    } else {
        auto rank = [](const std::string& q) {
            auto it = std::find(kSupportedAudioFormats.begin(), kSupportedAudioFormats.end(), q);
            return std::distance(kSupportedAudioFormats.begin(), it);
        };
        std::stable_sort(out.begin(), out.end(),
                         [&](const std::string& a, const std::string& b) { return rank(a) < rank(b); });
    }
    return out;
}

std::vector<std::string> FormatCatalog::containers(MediaKind kind,
                                                   const std::string& quality) const {
    std::vector<std::string> out;
    for (const auto& [key, ranked] : table_) {
        if (key.kind == kind && key.quality == quality) {
            out.push_back(key.container);
        }
    }
    // map order already sorts containers alphabetically
    return out;
}

FormatCatalog buildCatalog(const std::vector<RawFormat>& formats) {
    FormatCatalog catalog;
    for (const auto& f : formats) {
        // Combined streams only; "none" marks a missing track.
        if (f.vcodec == "none" || f.acodec == "none") {
            continue;
        }
        if (!f.height || *f.height <= 0) {
            continue;
        }
        std::string quality = std::to_string(*f.height) + "p";
        if (std::find(kSupportedVideoQualities.begin(), kSupportedVideoQualities.end(), quality) ==
            kSupportedVideoQualities.end()) {
            continue;
        }
        FormatVariant v;
        v.kind = MediaKind::Video;
        v.quality = std::move(quality);
        v.container = f.ext.empty() ? "mp4" : f.ext;
        v.videoCodec = f.vcodec;
        v.audioCodec = f.acodec;
        v.bitrateKbps = f.tbr;
        v.sizeEstimate = f.filesize;
        v.formatId = f.formatId;
        catalog.add(std::move(v));
    }

    for (const auto& audio : kSupportedAudioFormats) {
        FormatVariant v;
        v.kind = MediaKind::Audio;
        v.quality = audio;
        v.container = audio;
        v.bitrateKbps = 192.0;
        v.formatId = kBestAudioSelector;
        catalog.add(std::move(v));
    }
    return catalog;
}

Result<MediaInfo> parseMediaInfo(std::string_view text) {
    json doc;
    try {
        doc = json::parse(text);
    } catch (const json::parse_error& e) {
        return Error{ErrorCode::InvalidData, std::string("malformed metadata: ") + e.what()};
    }
    if (!doc.is_object()) {
        return Error{ErrorCode::InvalidData, "malformed metadata: expected an object"};
    }

    MediaInfo info;
    info.title = stringOr(doc, "title");
    if (info.title.empty()) {
        info.title = kUnknownTitle;
    }
    info.uploader = stringOr(doc, "uploader", "Unknown");
    info.thumbnail = stringOr(doc, "thumbnail");
    info.description = stringOr(doc, "description");
    info.durationSeconds = numberOf<double>(doc, "duration");
    info.viewCount = numberOf<std::uint64_t>(doc, "view_count");

    if (auto it = doc.find("formats"); it != doc.end() && it->is_array()) {
        for (const auto& f : *it) {
            if (!f.is_object()) {
                continue;
            }
            RawFormat raw;
            raw.formatId = stringOr(f, "format_id");
            if (raw.formatId.empty()) {
                continue;
            }
            raw.ext = stringOr(f, "ext", "mp4");
            raw.vcodec = stringOr(f, "vcodec");
            raw.acodec = stringOr(f, "acodec");
            raw.height = numberOf<int>(f, "height");
            raw.tbr = numberOf<double>(f, "tbr");
            raw.filesize = numberOf<std::uint64_t>(f, "filesize");
            if (!raw.filesize) {
                raw.filesize = numberOf<std::uint64_t>(f, "filesize_approx");
            }
            info.formats.push_back(std::move(raw));
        }
    }
    return info;
}

} // namespace ferry::media
