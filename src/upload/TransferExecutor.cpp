#include "upload/TransferExecutor.hpp"
#include "upload/errors.hpp"
#include "http/Client.hpp"
#include "util/httpHelpers.hpp"
#include "logging/LogRegistry.hpp"

#include <algorithm>
#include <fmt/core.h>

using namespace cn::upload;
using namespace cn::logging;

TransferExecutor::TransferExecutor(std::shared_ptr<http::Client> client) : client_(std::move(client)) {
    if (!client_) throw std::invalid_argument("TransferExecutor requires an HTTP client");
}

PutResult TransferExecutor::putBytes(const std::string& url,
                                     std::string bytes,
                                     const std::map<std::string, std::string>& headers,
                                     const ByteProgressFn& onProgress,
                                     const bool requireETag) const {
    const auto size = static_cast<uint64_t>(bytes.size());

    http::Request req;
    req.method = http::Method::Put;
    req.url = url;
    req.body = std::move(bytes);

    // Backend-supplied headers go first; a caller-provided Content-Length is
    // replaced so it always matches the buffer.
    for (const auto& [k, v] : headers)
        if (!util::iequals(k, "Content-Length")) req.headers[k] = v;
    req.headers["Content-Length"] = std::to_string(size);

    if (onProgress) {
        req.onUploadProgress = [&onProgress, size](const int64_t sent, const int64_t total) {
            const uint64_t denom = total > 0 ? static_cast<uint64_t>(total) : size;
            if (denom == 0) return;
            onProgress(std::min(static_cast<uint64_t>(std::max<int64_t>(sent, 0)), denom), denom);
        };
    }

    const auto resp = client_->perform(req);

    if (!resp.transportError.empty()) {
        LogRegistry::upload()->error("[TransferExecutor] PUT of {} bytes failed: {}", size, resp.transportError);
        throw TransferError(fmt::format("Storage PUT failed: {}", resp.transportError), 0, "");
    }

    if (!resp.ok()) {
        LogRegistry::upload()->error("[TransferExecutor] PUT of {} bytes rejected: HTTP={} Response:\n{}",
                                     size, resp.status, resp.body);
        throw TransferError(fmt::format("Storage PUT failed (HTTP {})", resp.status), resp.status, resp.body);
    }

    PutResult out;
    out.httpStatus = resp.status;

    if (const auto etag = resp.header("ETag")) {
        auto stripped = util::stripQuotes(*etag);
        util::trimInPlace(stripped);
        if (!stripped.empty()) out.eTag = std::move(stripped);
    }

    if (requireETag && !out.eTag)
        throw TransferError("Storage PUT succeeded but the response carried no ETag", resp.status, resp.body);

    return out;
}
