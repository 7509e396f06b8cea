#include "util/httpHelpers.hpp"
#include "util/curlWrappers.hpp"

#include <algorithm>
#include <cctype>
#include <mutex>
#include <curl/curl.h>

namespace cn::util {

void ensureCurlGlobalInit() {
    static std::once_flag once;
    std::call_once(once, [] { curl_global_init(CURL_GLOBAL_DEFAULT); });
}

size_t writeToString(const char* ptr, const size_t size, const size_t nmemb, void* userdata) {
    auto* out = static_cast<std::string*>(userdata);
    out->append(ptr, size * nmemb);
    return size * nmemb;
}

std::map<std::string, std::string> parseHeaderBlock(const std::string_view raw) {
    std::map<std::string, std::string> headers;

    size_t pos = 0;
    while (pos < raw.size()) {
        auto end = raw.find('\n', pos);
        if (end == std::string_view::npos) end = raw.size();
        std::string_view line = raw.substr(pos, end - pos);
        pos = end + 1;

        if (!line.empty() && line.back() == '\r') line.remove_suffix(1);
        if (line.empty() || line.starts_with("HTTP/")) continue;

        const auto colon = line.find(':');
        if (colon == std::string_view::npos) continue;

        std::string name(line.substr(0, colon));
        std::string value(line.substr(colon + 1));
        trimInPlace(name);
        trimInPlace(value);
        if (name.empty()) continue;

        headers[toLower(name)] = std::move(value);
    }

    return headers;
}

std::string toLower(const std::string_view s) {
    std::string out(s);
    std::ranges::transform(out, out.begin(), [](const unsigned char c) { return std::tolower(c); });
    return out;
}

bool iequals(const std::string_view a, const std::string_view b) {
    return a.size() == b.size() && std::ranges::equal(a, b, [](const unsigned char x, const unsigned char y) {
        return std::tolower(x) == std::tolower(y);
    });
}

bool iendsWith(const std::string_view s, const std::string_view suffix) {
    if (suffix.size() > s.size()) return false;
    return iequals(s.substr(s.size() - suffix.size()), suffix);
}

std::string stripQuotes(const std::string_view s) {
    std::string out;
    out.reserve(s.size());
    for (const char c : s) if (c != '"') out.push_back(c);
    return out;
}

void trimInPlace(std::string& s) {
    // Trim start
    s.erase(s.begin(), std::ranges::find_if(s.begin(), s.end(), [](const unsigned char ch) {
        return !std::isspace(ch);
    }));

    // Trim end
    s.erase(std::find_if(s.rbegin(), s.rend(), [](const unsigned char ch) {
        return !std::isspace(ch);
    }).base(), s.end());
}

std::string escapeQueryValue(const std::string_view value) {
    ensureCurlGlobalInit();
    CurlEasy tmpHandle;
    char* esc = curl_easy_escape(tmpHandle, value.data(), static_cast<int>(value.size()));
    if (!esc) throw std::runtime_error("curl_easy_escape failed");
    std::string out(esc);
    curl_free(esc);
    return out;
}

std::string joinUrl(const std::string_view base, const std::string_view path) {
    std::string out(base);
    while (!out.empty() && out.back() == '/') out.pop_back();
    if (!path.empty() && path.front() != '/') out.push_back('/');
    out.append(path);
    return out;
}

}
