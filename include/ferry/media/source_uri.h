#pragma once

#include <ferry/core/types.h>

#include <optional>
#include <string>
#include <string_view>

namespace ferry::media {

// Accepts http(s)://[www.]youtube.com/watch?v=<id> and http(s)://youtu.be/<id>
// (anything may follow the id, e.g. "&t=30").
bool isAcceptedUri(std::string_view uri);

// ValidationError when the uri is not accepted; otherwise the trimmed uri.
Result<std::string> validateUri(std::string_view uri);

// Video id taken from the uri, if it has one made of [A-Za-z0-9-] only.
std::optional<std::string> extractVideoId(std::string_view uri);

// First 10 hex characters of SHA-256(uri).
Result<std::string> fingerprint(std::string_view uri);

// Stable request fingerprint: the video id, falling back to fingerprint(uri).
// Never contains '_' so it can be embedded in a selection key.
Result<SessionId> sessionIdFor(std::string_view uri);

} // namespace ferry::media
