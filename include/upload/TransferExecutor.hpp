#pragma once

#include <cstdint>
#include <functional>
#include <map>
#include <memory>
#include <optional>
#include <string>

namespace cn::http { class Client; }

namespace cn::upload {

struct PutResult {
    long httpStatus{0};
    std::optional<std::string> eTag;   // quotes stripped
};

// Performs storage PUTs of in-memory buffers against presigned URLs.
class TransferExecutor {
public:
    // (bytesSent, bytesTotal) for the current buffer; total is never <= 0
    using ByteProgressFn = std::function<void(uint64_t, uint64_t)>;

    explicit TransferExecutor(std::shared_ptr<http::Client> client);

    // Takes ownership of the buffer for the duration of the PUT and sends it with an
    // explicit Content-Length on top of the supplied headers.
    // Throws TransferError on transport failure, non-2xx status, or (requireETag)
    // a response without an ETag.
    PutResult putBytes(const std::string& url,
                       std::string bytes,
                       const std::map<std::string, std::string>& headers,
                       const ByteProgressFn& onProgress = {},
                       bool requireETag = false) const;

private:
    std::shared_ptr<http::Client> client_;
};

}
