#pragma once
#include <chrono>
#include <string>

namespace file_forge {

// Process configuration, filled from the global CLI flags and handed to
// converters and runners at construction time.
struct ForgeConfig {
    int convertQuality  = 95;     // image convert / video convert default
    int compressQuality = 85;     // image compress default
    int pngCompression  = 3;      // OpenCV default deflate level

    std::string pageSeparator = "\f";   // between PDF pages in text output

    std::string ffmpegPath   = "ffmpeg";
    std::string ffmpegPreset = "veryslow";

    unsigned                  jobs = 1;        // batch workers, 1 → sequential
    std::chrono::milliseconds timeout{0};      // per request, 0 → none
    bool                      verbose = false;
};

// --timeout value → per-request limit, rounded up to whole milliseconds so a
// positive value never turns into "no limit"; throws ForgeError(InvalidOption)
// unless seconds is finite and positive
std::chrono::milliseconds timeoutFromSeconds(double seconds);

} // namespace file_forge
