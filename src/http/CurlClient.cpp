#include "http/CurlClient.hpp"
#include "util/curlWrappers.hpp"
#include "util/httpHelpers.hpp"
#include "logging/LogRegistry.hpp"

#include <curl/curl.h>
#include <fmt/core.h>

using namespace cn::http;
using namespace cn::util;
using namespace cn::logging;

namespace {

int xferInfo(void* clientp, curl_off_t, curl_off_t, const curl_off_t ultotal, const curl_off_t ulnow) {
    const auto* fn = static_cast<const ProgressFn*>(clientp);
    try {
        (*fn)(static_cast<int64_t>(ulnow), static_cast<int64_t>(ultotal));
    } catch (const std::exception& e) {
        LogRegistry::http()->error("[CurlClient] progress callback threw, aborting transfer: {}", e.what());
        return 1;
    }
    return 0;
}

}

CurlClient::CurlClient(const std::chrono::seconds connectTimeout) : connectTimeout_(connectTimeout) {
    ensureCurlGlobalInit();
}

Response CurlClient::perform(const Request& req) {
    CurlEasy h;
    SList hdrs;

    bool hasContentType = false;
    for (const auto& [k, v] : req.headers) {
        if (iequals(k, "Content-Type")) hasContentType = true;
        hdrs.add(fmt::format("{}: {}", k, v));
    }

    // curl labels POSTFIELDS bodies as form data unless told otherwise
    if (!hasContentType && req.method != Method::Get) hdrs.add("Content-Type:");
    hdrs.add("Expect:");

    std::string bodyBuf, hdrBuf;
    char errBuf[CURL_ERROR_SIZE] = {0};

    curl_easy_setopt(h, CURLOPT_URL, req.url.c_str());
    curl_easy_setopt(h, CURLOPT_HTTPHEADER, hdrs.get());
    curl_easy_setopt(h, CURLOPT_CONNECTTIMEOUT_MS, static_cast<long>(
        std::chrono::duration_cast<std::chrono::milliseconds>(connectTimeout_).count()));
    curl_easy_setopt(h, CURLOPT_ERRORBUFFER, errBuf);
    curl_easy_setopt(h, CURLOPT_WRITEFUNCTION, writeToString);
    curl_easy_setopt(h, CURLOPT_WRITEDATA, &bodyBuf);
    curl_easy_setopt(h, CURLOPT_HEADERFUNCTION, writeToString);
    curl_easy_setopt(h, CURLOPT_HEADERDATA, &hdrBuf);

    switch (req.method) {
        case Method::Get:
            curl_easy_setopt(h, CURLOPT_HTTPGET, 1L);
            break;
        case Method::Post:
            curl_easy_setopt(h, CURLOPT_POST, 1L);
            curl_easy_setopt(h, CURLOPT_POSTFIELDS, req.body.data());
            curl_easy_setopt(h, CURLOPT_POSTFIELDSIZE_LARGE, static_cast<curl_off_t>(req.body.size()));
            break;
        case Method::Put:
            curl_easy_setopt(h, CURLOPT_CUSTOMREQUEST, "PUT");
            curl_easy_setopt(h, CURLOPT_POSTFIELDS, req.body.data());
            curl_easy_setopt(h, CURLOPT_POSTFIELDSIZE_LARGE, static_cast<curl_off_t>(req.body.size()));
            break;
    }

    if (req.onUploadProgress) {
        curl_easy_setopt(h, CURLOPT_NOPROGRESS, 0L);
        curl_easy_setopt(h, CURLOPT_XFERINFOFUNCTION, xferInfo);
        curl_easy_setopt(h, CURLOPT_XFERINFODATA, const_cast<ProgressFn*>(&req.onUploadProgress));
    }

    Response r;
    const CURLcode res = curl_easy_perform(h);
    if (res != CURLE_OK) {
        r.transportError = errBuf[0] ? fmt::format("{} ({})", curl_easy_strerror(res), errBuf)
                                     : std::string(curl_easy_strerror(res));
        LogRegistry::http()->warn("[CurlClient] {} {} failed: CURL={} {}",
                                  to_string(req.method), req.url, static_cast<int>(res), r.transportError);
        return r;
    }

    curl_easy_getinfo(h, CURLINFO_RESPONSE_CODE, &r.status);
    r.body.swap(bodyBuf);
    r.headers = parseHeaderBlock(hdrBuf);

    LogRegistry::http()->debug("[CurlClient] {} {} -> HTTP {} ({} bytes sent, {} bytes received)",
                               to_string(req.method), req.url, r.status, req.body.size(), r.body.size());
    return r;
}
