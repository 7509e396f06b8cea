#include <gtest/gtest.h>
#include "upload/model/PartResult.hpp"
#include "upload/model/UploadProgress.hpp"
#include "upload/model/UploadResult.hpp"
#include "upload/model/ObjectHead.hpp"
#include "upload/errors.hpp"

#include <nlohmann/json.hpp>

using namespace cn::upload;
using namespace cn::upload::model;

TEST(PartResultTest, ContiguityCheck) {
    EXPECT_TRUE(isContiguousFromOne({}));
    EXPECT_TRUE(isContiguousFromOne({{1, "a"}, {2, "b"}, {3, "c"}}));
    EXPECT_FALSE(isContiguousFromOne({{2, "a"}}));
    EXPECT_FALSE(isContiguousFromOne({{1, "a"}, {3, "c"}}));
    EXPECT_FALSE(isContiguousFromOne({{2, "b"}, {1, "a"}}));
    EXPECT_FALSE(isContiguousFromOne({{1, "a"}, {1, "a"}}));
}

TEST(PartResultTest, SerialisesWithBackendFieldNames) {
    const nlohmann::json j = PartResult{7, "d41d8cd98f00b204e9800998ecf8427e"};
    EXPECT_EQ(j, nlohmann::json({{"ETag", "d41d8cd98f00b204e9800998ecf8427e"}, {"PartNumber", 7}}));
}

TEST(UploadProgressTest, DescribesPhase) {
    EXPECT_EQ(to_string(UploadProgress{0.5, Phase::PartN, 2, 4}), "Part 2/4 uploading (50%)");
    EXPECT_EQ(to_string(UploadProgress{0.999, Phase::Uploading, 0, 0}), "Uploading (99%)");
    EXPECT_EQ(to_string(UploadProgress{1.0, Phase::Done, 0, 0}), "Done (100%)");
}

TEST(UploadResultTest, FailureDescriptionCarriesStageAndStatus) {
    UploadFailure f;
    f.kind = ErrorKind::TransferError;
    f.stage = State::PartUpload;
    f.message = "Storage PUT failed (HTTP 500)";
    f.httpStatus = 500;
    f.partNumber = 3;
    const UploadResult r{f};

    EXPECT_FALSE(r.ok());
    EXPECT_EQ(to_string(r), "TransferError at PartUpload (part 3) HTTP 500: Storage PUT failed (HTTP 500)");
}

TEST(UploadResultTest, SuccessDescription) {
    UploadSuccess s;
    s.objectKey = "raw/abc_a.mp3";
    s.mode = TransferMode::Simple;
    s.sizeBytes = 10;
    s.partCount = 1;
    const UploadResult r{s};

    ASSERT_TRUE(r.ok());
    EXPECT_EQ(to_string(r), "Uploaded (simple, 10 bytes, 1 part) key=raw/abc_a.mp3 public_url=<none>");
}

TEST(ObjectHeadTest, DecodesHeadResponse) {
    const auto h = nlohmann::json::parse(R"({"ok":true,"size":52428800,"etag":"\"abc-4\"","content_type":null})")
                       .get<ObjectHead>();
    EXPECT_EQ(h.sizeBytes, 52428800u);
    EXPECT_EQ(h.eTag, "abc-4");
    EXPECT_FALSE(h.contentType);
}

TEST(ObjectHeadTest, MissingSizeIsPresignError) {
    EXPECT_THROW(nlohmann::json::parse(R"({"ok":true,"etag":"x"})").get<ObjectHead>(), PresignError);
}
