#pragma once

#include <cstdint>
#include <filesystem>
#include <string>

namespace cn::upload::model {

struct UploadRequest {
    static constexpr const auto* DEFAULT_FOLDER = "raw";

    std::filesystem::path sourcePath;
    std::string filename;
    std::string contentType;     // derived from filename, never user supplied
    uint64_t sizeBytes{0};
    std::string destinationFolder{DEFAULT_FOLDER};

    // Stats the file and derives filename, content type and size. Throws IoError
    // when the path does not name a readable regular file.
    static UploadRequest fromFile(const std::filesystem::path& path, std::string folder = DEFAULT_FOLDER);
};

}
