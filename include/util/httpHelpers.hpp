#pragma once

#include <map>
#include <string>
#include <string_view>

namespace cn::util {

void ensureCurlGlobalInit();

size_t writeToString(const char* ptr, size_t size, size_t nmemb, void* userdata);

// Parses a raw response header block ("Name: value\r\n"...) into a map keyed by
// lowercased header name. Status lines are skipped; when redirects produced
// several blocks, the last occurrence of a header wins.
std::map<std::string, std::string> parseHeaderBlock(std::string_view raw);

[[nodiscard]] std::string toLower(std::string_view s);
[[nodiscard]] bool iequals(std::string_view a, std::string_view b);
[[nodiscard]] bool iendsWith(std::string_view s, std::string_view suffix);
[[nodiscard]] std::string stripQuotes(std::string_view s);
void trimInPlace(std::string& s);

// Percent-encodes a single query-string value (RFC 3986 unreserved set kept).
[[nodiscard]] std::string escapeQueryValue(std::string_view value);

// Joins a base URL and an absolute path without doubling the slash.
[[nodiscard]] std::string joinUrl(std::string_view base, std::string_view path);

}
