#include <ferry/media/selection_key.h>

#include <vector>

namespace ferry::media {

namespace {

std::vector<std::string> splitFields(std::string_view token) {
    std::vector<std::string> fields;
    std::size_t start = 0;
    for (;;) {
        auto pos = token.find(kSelectionKeySeparator, start);
        fields.emplace_back(token.substr(start, pos == std::string_view::npos ? pos : pos - start));
        if (pos == std::string_view::npos) {
            break;
        }
        start = pos + 1;
    }
    return fields;
}

} // namespace

VariantKey SelectionKey::variantKey() const {
    if (kind == MediaKind::Audio && (container.empty() || container == kAnyContainer)) {
        return VariantKey{kind, quality, quality};
    }
    return VariantKey{kind, quality, container};
}

std::string SelectionKey::encode() const {
    std::string out = toKeyTag(kind);
    out += kSelectionKeySeparator;
    out += quality;
    out += kSelectionKeySeparator;
    out += container.empty() ? std::string(kAnyContainer) : container;
    out += kSelectionKeySeparator;
    out += sessionId;
    return out;
}

Result<SelectionKey> parseSelectionKey(std::string_view token) {
    auto fields = splitFields(token);
    if (fields.size() != 4) {
        return Error{ErrorCode::ValidationError,
                     "selection key must have 4 fields, got " + std::to_string(fields.size())};
    }
    for (const auto& f : fields) {
        if (f.empty()) {
            return Error{ErrorCode::ValidationError, "selection key has an empty field"};
        }
    }

    SelectionKey key;
    if (fields[0] == "v" || fields[0] == "video") {
        key.kind = MediaKind::Video;
    } else if (fields[0] == "a" || fields[0] == "audio") {
        key.kind = MediaKind::Audio;
    } else {
        return Error{ErrorCode::ValidationError, "unknown media kind '" + fields[0] + "'"};
    }
    key.quality = std::move(fields[1]);
    key.container = std::move(fields[2]);
    key.sessionId = std::move(fields[3]);
    return key;
}

SelectionKey makeSelectionKey(const FormatVariant& variant, const SessionId& sessionId) {
    SelectionKey key;
    key.kind = variant.kind;
    key.quality = variant.quality;
    key.container = variant.kind == MediaKind::Audio ? kAnyContainer : variant.container;
    key.sessionId = sessionId;
    return key;
}

Result<FormatVariant> resolveVariant(const FormatCatalog& catalog, const SelectionKey& key) {
    const auto vk = key.variantKey();
    if (auto v = catalog.best(vk)) {
        return *v;
    }
    return Error{ErrorCode::SelectionError, std::string("no ") + toString(key.kind) +
                                                " variant " + vk.quality + "/" + vk.container};
}

} // namespace ferry::media
