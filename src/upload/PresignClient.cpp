#include "upload/PresignClient.hpp"
#include "upload/errors.hpp"
#include "http/Client.hpp"
#include "util/httpHelpers.hpp"
#include "logging/LogRegistry.hpp"

#include <fmt/core.h>
#include <nlohmann/json.hpp>

using namespace cn::upload;
using namespace cn::upload::model;
using namespace cn::logging;
using json = nlohmann::json;

namespace {

constexpr size_t MAX_BODY_IN_MESSAGE = 512;

std::string excerpt(const std::string& body) {
    if (body.size() <= MAX_BODY_IN_MESSAGE) return body;
    return body.substr(0, MAX_BODY_IN_MESSAGE) + "...";
}

json parseBody(const cn::http::Response& resp, const std::string_view what) {
    auto j = json::parse(resp.body, nullptr, /*allow_exceptions=*/false);
    if (j.is_discarded())
        throw PresignError(fmt::format("{} returned a body that is not JSON: {}", what, excerpt(resp.body)), resp.status);
    return j;
}

template <typename T>
T decode(const json& j, const std::string_view what) {
    try {
        return j.get<T>();
    } catch (const json::exception& e) {
        throw PresignError(fmt::format("{} returned a malformed body: {}", what, e.what()));
    } catch (const PresignError& e) {
        throw PresignError(fmt::format("{} returned a malformed body: {}", what, e.what()));
    }
}

}

PresignClient::PresignClient(std::shared_ptr<http::Client> client, std::string baseUrl)
    : client_(std::move(client)), baseUrl_(std::move(baseUrl)) {
    if (!client_) throw std::invalid_argument("PresignClient requires an HTTP client");
}

PresignedTarget PresignClient::presignSimple(const std::string& filename,
                                             const std::string& contentType,
                                             const std::string& folder) const {
    const json body = {{"filename", filename}, {"content_type", contentType}, {"folder", folder}};
    auto target = decode<PresignedTarget>(postJson(PRESIGN_PATH, body, "presign"), "presign");

    LogRegistry::upload()->debug("[PresignClient] presigned {} -> key={} ({} required headers)",
                                 filename, target.objectKey, target.requiredHeaders.size());
    return target;
}

MultipartSession PresignClient::presignMultipartStart(const std::string& filename,
                                                      const std::string& contentType,
                                                      const std::string& folder) const {
    const json body = {{"filename", filename}, {"content_type", contentType}, {"folder", folder}};
    auto session = decode<MultipartSession>(postJson(MULTIPART_START_PATH, body, "multipart start"),
                                            "multipart start");

    LogRegistry::upload()->debug("[PresignClient] multipart session started: key={} uploadId={} partSize={}",
                                 session.objectKey, session.uploadId, session.partSizeBytes);
    return session;
}

PartTarget PresignClient::presignMultipartPart(const MultipartSession& session, const unsigned int partNumber) const {
    const json body = {{"key", session.objectKey}, {"upload_id", session.uploadId}, {"part_number", partNumber}};
    const auto what = fmt::format("part-url for part {}", partNumber);
    return decode<PartTarget>(postJson(MULTIPART_PART_URL_PATH, body, what), what);
}

CompletedUpload PresignClient::completeMultipart(const MultipartSession& session,
                                                 const std::vector<PartResult>& parts) const {
    const json body = {{"key", session.objectKey}, {"upload_id", session.uploadId}, {"parts", parts}};
    return decode<CompletedUpload>(postJson(MULTIPART_COMPLETE_PATH, body, "multipart complete"),
                                   "multipart complete");
}

ObjectHead PresignClient::headObject(const std::string& key) const {
    const auto path = fmt::format("{}?key={}", HEAD_PATH, util::escapeQueryValue(key));
    return decode<ObjectHead>(getJson(path, "head"), "head");
}

json PresignClient::postJson(const std::string& path, const json& body, const std::string_view what) const {
    http::Request req;
    req.method = http::Method::Post;
    req.url = util::joinUrl(baseUrl_, path);
    req.headers = {{"Content-Type", "application/json"}, {"Accept", "application/json"}};
    req.body = body.dump();

    const auto resp = client_->perform(req);

    if (!resp.transportError.empty()) {
        LogRegistry::upload()->error("[PresignClient] {} request failed: {}", what, resp.transportError);
        throw PresignError(fmt::format("{} request failed: {}", what, resp.transportError));
    }

    if (!resp.ok()) {
        LogRegistry::upload()->error("[PresignClient] {} rejected: HTTP={} Response:\n{}", what, resp.status, resp.body);
        throw PresignError(fmt::format("{} failed (HTTP {}): {}", what, resp.status, excerpt(resp.body)), resp.status);
    }

    return parseBody(resp, what);
}

json PresignClient::getJson(const std::string& pathAndQuery, const std::string_view what) const {
    http::Request req;
    req.method = http::Method::Get;
    req.url = util::joinUrl(baseUrl_, pathAndQuery);
    req.headers = {{"Accept", "application/json"}};

    const auto resp = client_->perform(req);

    if (!resp.transportError.empty())
        throw PresignError(fmt::format("{} request failed: {}", what, resp.transportError));
    if (!resp.ok())
        throw PresignError(fmt::format("{} failed (HTTP {}): {}", what, resp.status, excerpt(resp.body)), resp.status);

    return parseBody(resp, what);
}
