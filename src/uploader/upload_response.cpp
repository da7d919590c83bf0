#include <nlohmann/json.hpp>
#include <ferry/uploader/uploader.hpp>

namespace ferry::uploader {

using json = nlohmann::json;

namespace {

std::string stringField(const json& obj, const char* key) {
    auto it = obj.find(key);
    if (it == obj.end() || !it->is_string()) {
        return {};
    }
    return it->get<std::string>();
}

} // namespace

Result<UploadResult> parseUploadResponse(const HttpResponse& response) {
    if (response.status != 200) {
        return Error{ErrorCode::UploadError,
                     "upload host answered HTTP " + std::to_string(response.status)};
    }

    json doc;
    try {
        doc = json::parse(response.body);
    } catch (const json::parse_error& e) {
        return Error{ErrorCode::UploadError, std::string("unparsable upload response: ") + e.what()};
    }
    if (!doc.is_object()) {
        return Error{ErrorCode::UploadError, "unexpected upload response"};
    }

    const auto status = stringField(doc, "status");
    if (status != "ok") {
        return Error{ErrorCode::UploadError,
                     "upload rejected: " + (status.empty() ? std::string("no status") : status)};
    }

    auto data = doc.find("data");
    if (data == doc.end() || !data->is_object()) {
        return Error{ErrorCode::UploadError, "upload response carries no data"};
    }

    UploadResult result;
    result.downloadPage = stringField(*data, "downloadPage");
    if (result.downloadPage.empty()) {
        return Error{ErrorCode::UploadError, "upload response carries no downloadPage"};
    }
    result.directLink = stringField(*data, "directLink");
    result.fileId = stringField(*data, "id");
    if (result.fileId.empty()) {
        result.fileId = stringField(*data, "fileId");
    }
    return result;
}

} // namespace ferry::uploader
