#include "upload/MimeResolver.hpp"
#include "util/httpHelpers.hpp"

#include <array>
#include <utility>

using namespace cn::upload;

namespace {

constexpr std::array<std::pair<std::string_view, std::string_view>, 4> MEDIA_TYPES{{
    {".mp3", "audio/mpeg"},
    {".m4a", "audio/mp4"},
    {".wav", "audio/wav"},
    {".mp4", "video/mp4"},
}};

}

std::string MimeResolver::resolve(const std::string_view filename) {
    for (const auto& [suffix, type] : MEDIA_TYPES)
        if (util::iendsWith(filename, suffix)) return std::string(type);
    return FALLBACK;
}

bool MimeResolver::isSupported(const std::string_view filename) {
    for (const auto& [suffix, type] : MEDIA_TYPES)
        if (util::iendsWith(filename, suffix)) return true;
    return false;
}
