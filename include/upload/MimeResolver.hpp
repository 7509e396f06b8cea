#pragma once

#include <string>
#include <string_view>

namespace cn::upload {

struct MimeResolver {
    static constexpr const auto* FALLBACK = "application/octet-stream";

    // Case-insensitive suffix lookup over the supported media table; anything else
    // resolves to FALLBACK.
    [[nodiscard]] static std::string resolve(std::string_view filename);

    // Whether the backend accepts this file type (.mp3, .m4a, .wav, .mp4).
    [[nodiscard]] static bool isSupported(std::string_view filename);
};

}
