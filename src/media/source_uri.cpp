#include <ferry/media/source_uri.h>

#include <openssl/evp.h>

#include <array>
#include <cctype>
#include <regex>

namespace ferry::media {

namespace {

const std::regex& acceptedPattern() {
    static const std::regex re(R"(^https?://(?:www\.)?(?:youtube\.com/watch\?v=|youtu\.be/)[\w-]+)",
                               std::regex::ECMAScript | std::regex::optimize);
    return re;
}

// Simple RAII wrapper for EVP_MD_CTX
struct EvpMdCtx {
    EVP_MD_CTX* ctx{nullptr};
    EvpMdCtx() : ctx(EVP_MD_CTX_new()) {}
    ~EvpMdCtx() {
        if (ctx)
            EVP_MD_CTX_free(ctx);
    }
    EvpMdCtx(const EvpMdCtx&) = delete;
    EvpMdCtx& operator=(const EvpMdCtx&) = delete;
};

std::string_view trimView(std::string_view s) {
    while (!s.empty() && std::isspace(static_cast<unsigned char>(s.front())))
        s.remove_prefix(1);
    while (!s.empty() && std::isspace(static_cast<unsigned char>(s.back())))
        s.remove_suffix(1);
    return s;
}

bool isIdChar(char c) {
    return std::isalnum(static_cast<unsigned char>(c)) || c == '-';
}

} // namespace

bool isAcceptedUri(std::string_view uri) {
    const std::string s(trimView(uri));
    return std::regex_search(s, acceptedPattern());
}

Result<std::string> validateUri(std::string_view uri) {
    auto trimmed = trimView(uri);
    if (trimmed.empty()) {
        return Error{ErrorCode::ValidationError, "empty source uri"};
    }
    if (!isAcceptedUri(trimmed)) {
        return Error{ErrorCode::ValidationError,
                     "unsupported source uri: " + std::string(trimmed)};
    }
    return std::string(trimmed);
}

std::optional<std::string> extractVideoId(std::string_view uri) {
    const std::string s(trimView(uri));
    std::smatch m;
    static const std::regex idPattern(
        R"(^https?://(?:www\.)?(?:youtube\.com/watch\?(?:[^#]*&)?v=|youtu\.be/)([^&?#/]+))");
    if (!std::regex_search(s, m, idPattern)) {
        return std::nullopt;
    }
    std::string id = m[1].str();
    if (id.empty()) {
        return std::nullopt;
    }
    for (char c : id) {
        if (!isIdChar(c)) {
            return std::nullopt;
        }
    }
    return id;
}

Result<std::string> fingerprint(std::string_view uri) {
    static constexpr char kHex[] = "0123456789abcdef";
    std::array<unsigned char, EVP_MAX_MD_SIZE> md{};
    unsigned int mdLen = 0;

    EvpMdCtx ctx;
    if (!ctx.ctx || EVP_DigestInit_ex(ctx.ctx, EVP_sha256(), nullptr) != 1 ||
        EVP_DigestUpdate(ctx.ctx, uri.data(), uri.size()) != 1 ||
        EVP_DigestFinal_ex(ctx.ctx, md.data(), &mdLen) != 1) {
        return Error{ErrorCode::InternalError, "SHA-256 digest failed"};
    }

    std::string hex;
    hex.reserve(10);
    for (unsigned int i = 0; i < mdLen && hex.size() < 10; ++i) {
        hex.push_back(kHex[md[i] >> 4]);
        hex.push_back(kHex[md[i] & 0x0f]);
    }
    return hex;
}

Result<SessionId> sessionIdFor(std::string_view uri) {
    if (auto id = extractVideoId(uri)) {
        return *id;
    }
    return fingerprint(trimView(uri));
}

} // namespace ferry::media
