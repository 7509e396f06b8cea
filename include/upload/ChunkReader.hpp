#pragma once

#include <cstdint>
#include <filesystem>
#include <fstream>
#include <optional>
#include <string>

namespace cn::upload {

struct Chunk {
    unsigned int partNumber{0};   // 1-based
    uint64_t offset{0};
    std::string bytes;
};

// Forward-only slicing of a file into partSize ranges. The file is held open for
// the reader's lifetime and only one chunk's bytes are buffered per next() call.
class ChunkReader {
public:
    ChunkReader(const std::filesystem::path& path, uint64_t totalSize, uint64_t partSize);

    ChunkReader(const ChunkReader&) = delete;
    ChunkReader& operator=(const ChunkReader&) = delete;

    // Returns the next chunk, or nullopt once totalSize bytes have been produced.
    // Throws IoError when the file is shorter or longer than totalSize.
    [[nodiscard]] std::optional<Chunk> next();

    [[nodiscard]] uint64_t offset() const { return offset_; }
    [[nodiscard]] uint64_t totalSize() const { return totalSize_; }
    [[nodiscard]] uint64_t partSize() const { return partSize_; }
    [[nodiscard]] unsigned int partCount() const;
    [[nodiscard]] bool done() const { return offset_ >= totalSize_; }

private:
    std::filesystem::path path_;
    std::ifstream in_;
    uint64_t totalSize_;
    uint64_t partSize_;
    uint64_t offset_{0};
    unsigned int nextPart_{1};
    bool tailChecked_{false};

    void ensureNoTrailingBytes();
};

}
