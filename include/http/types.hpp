#pragma once

#include <cstdint>
#include <functional>
#include <map>
#include <optional>
#include <string>

namespace cn::http {

enum class Method { Get, Post, Put };

std::string to_string(Method m);

using Headers = std::map<std::string, std::string>;

// (bytesSent, bytesTotal); total may be <= 0 when the transport does not know it yet
using ProgressFn = std::function<void(int64_t, int64_t)>;

struct Request {
    Method method = Method::Get;
    std::string url;
    Headers headers;
    std::string body;
    ProgressFn onUploadProgress;
};

struct Response {
    std::string transportError;  // empty unless the request never produced an HTTP status
    long status = 0;
    std::string body;
    Headers headers;             // keys lowercased

    [[nodiscard]] bool ok() const { return transportError.empty() && status / 100 == 2; }

    [[nodiscard]] std::optional<std::string> header(const std::string& name) const;
};

}
