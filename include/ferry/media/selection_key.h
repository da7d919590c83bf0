#pragma once

#include <ferry/core/types.h>
#include <ferry/media/format_catalog.h>

#include <string>
#include <string_view>

namespace ferry::media {

inline constexpr char kSelectionKeySeparator = '_';
// Audio keys carry no container of their own.
inline constexpr const char* kAnyContainer = "none";

/**
 * Opaque menu token `kind_quality_container_sessionid`, e.g. "v_720p_webm_dQw4w9WgXcQ" or
 * "a_mp3_none_dQw4w9WgXcQ".
 */
struct SelectionKey {
    MediaKind kind{MediaKind::Video};
    std::string quality;
    std::string container;
    SessionId sessionId;

    // Catalog lookup key; the audio wildcard container resolves to the quality's own.
    VariantKey variantKey() const;
    std::string encode() const;
};

// Exactly four non-empty fields and a known kind ("v"/"video", "a"/"audio"),
// otherwise ValidationError.
Result<SelectionKey> parseSelectionKey(std::string_view token);

SelectionKey makeSelectionKey(const FormatVariant& variant, const SessionId& sessionId);

// SelectionError when the catalog has no variant for the key.
Result<FormatVariant> resolveVariant(const FormatCatalog& catalog, const SelectionKey& key);

} // namespace ferry::media
