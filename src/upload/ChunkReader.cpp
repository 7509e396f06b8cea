#include "upload/ChunkReader.hpp"
#include "upload/errors.hpp"
#include "logging/LogRegistry.hpp"

#include <algorithm>
#include <fmt/core.h>

using namespace cn::upload;
using namespace cn::logging;

ChunkReader::ChunkReader(const std::filesystem::path& path, const uint64_t totalSize, const uint64_t partSize)
    : path_(path), in_(path, std::ios::binary), totalSize_(totalSize), partSize_(partSize) {
    if (partSize_ == 0) throw std::invalid_argument("ChunkReader part size must be at least 1 byte");
    if (!in_) throw IoError("Cannot open file for reading: " + path.string());
}

unsigned int ChunkReader::partCount() const {
    return static_cast<unsigned int>((totalSize_ + partSize_ - 1) / partSize_);
}

std::optional<Chunk> ChunkReader::next() {
    if (done()) {
        ensureNoTrailingBytes();
        return std::nullopt;
    }

    const uint64_t len = std::min(partSize_, totalSize_ - offset_);

    Chunk chunk;
    chunk.partNumber = nextPart_;
    chunk.offset = offset_;
    chunk.bytes.resize(static_cast<size_t>(len));

    in_.read(chunk.bytes.data(), static_cast<std::streamsize>(len));
    const auto got = static_cast<uint64_t>(in_.gcount());
    if (got != len) {
        LogRegistry::io()->error("[ChunkReader] short read on {} at offset {}: wanted {} got {}",
                                 path_.string(), offset_, len, got);
        throw IoError(fmt::format("File {} changed length during upload: expected {} bytes, read ended at {}",
                                  path_.string(), totalSize_, offset_ + got));
    }

    offset_ += len;
    ++nextPart_;

    if (done()) ensureNoTrailingBytes();
    return chunk;
}

void ChunkReader::ensureNoTrailingBytes() {
    if (tailChecked_) return;
    tailChecked_ = true;

    if (in_.peek() != std::ifstream::traits_type::eof()) {
        LogRegistry::io()->error("[ChunkReader] {} grew past its expected {} bytes", path_.string(), totalSize_);
        throw IoError(fmt::format("File {} changed length during upload: more than {} bytes present",
                                  path_.string(), totalSize_));
    }
}
