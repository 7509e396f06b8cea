#include "upload/model/UploadRequest.hpp"
#include "upload/MimeResolver.hpp"
#include "upload/errors.hpp"

#include <fmt/core.h>
#include <system_error>

using namespace cn::upload;
using namespace cn::upload::model;

namespace fs = std::filesystem;

UploadRequest UploadRequest::fromFile(const fs::path& path, std::string folder) {
    std::error_code ec;
    const auto status = fs::status(path, ec);
    if (ec || !fs::exists(status))
        throw IoError(fmt::format("Local file does not exist: {}", path.string()));
    if (!fs::is_regular_file(status))
        throw IoError(fmt::format("Not a regular file: {}", path.string()));

    const auto size = fs::file_size(path, ec);
    if (ec) throw IoError(fmt::format("Cannot read file size of {}: {}", path.string(), ec.message()));

    UploadRequest req;
    req.sourcePath = path;
    req.filename = path.filename().string();
    req.contentType = MimeResolver::resolve(req.filename);
    req.sizeBytes = static_cast<uint64_t>(size);
    req.destinationFolder = folder.empty() ? DEFAULT_FOLDER : std::move(folder);
    return req;
}
