#pragma once

#include "upload/model/PresignedTarget.hpp"
#include "upload/model/MultipartSession.hpp"
#include "upload/model/PartResult.hpp"
#include "upload/model/ObjectHead.hpp"

#include <memory>
#include <string>
#include <string_view>
#include <vector>
#include <nlohmann/json_fwd.hpp>

namespace cn::http { class Client; }

namespace cn::upload {

// Backend round trips for upload credentials. Every call is a single blocking
// request with no retry; any rejection, transport failure or schema mismatch
// surfaces as PresignError.
class PresignClient {
public:
    static constexpr const auto* PRESIGN_PATH = "/uploads/presign";
    static constexpr const auto* MULTIPART_START_PATH = "/uploads/multipart/start";
    static constexpr const auto* MULTIPART_PART_URL_PATH = "/uploads/multipart/part-url";
    static constexpr const auto* MULTIPART_COMPLETE_PATH = "/uploads/multipart/complete";
    static constexpr const auto* HEAD_PATH = "/uploads/debug/head";

    PresignClient(std::shared_ptr<http::Client> client, std::string baseUrl);

    [[nodiscard]] model::PresignedTarget presignSimple(const std::string& filename,
                                                       const std::string& contentType,
                                                       const std::string& folder) const;

    [[nodiscard]] model::MultipartSession presignMultipartStart(const std::string& filename,
                                                                const std::string& contentType,
                                                                const std::string& folder) const;

    [[nodiscard]] model::PartTarget presignMultipartPart(const model::MultipartSession& session,
                                                         unsigned int partNumber) const;

    // Parts must already be in ascending PartNumber order; they are sent as given.
    [[nodiscard]] model::CompletedUpload completeMultipart(const model::MultipartSession& session,
                                                           const std::vector<model::PartResult>& parts) const;

    [[nodiscard]] model::ObjectHead headObject(const std::string& key) const;

private:
    std::shared_ptr<http::Client> client_;
    std::string baseUrl_;

    nlohmann::json postJson(const std::string& path, const nlohmann::json& body, std::string_view what) const;
    nlohmann::json getJson(const std::string& pathAndQuery, std::string_view what) const;
};

}
