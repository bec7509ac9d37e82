#pragma once
#include "FileKind.hpp"

#include <cstdint>
#include <string>
#include <utility>
#include <vector>

namespace file_forge {

class Dispatcher;

struct FileInfo {
    std::string    name;
    std::string    absolutePath;
    std::uintmax_t size = 0;
    std::string    extension;
    FileKind       kind = FileKind::Unknown;

    // kind-specific details in display order, e.g. {"Dimensions", "1600 x 1200 pixels"}
    std::vector<std::pair<std::string, std::string>> details;
};

// throws ForgeError(IoError) when the path is missing or not a regular file
FileInfo describeFile(const std::string& path, const Dispatcher& dispatcher);

// "1.50 KB"
std::string readableSize(std::uintmax_t bytes);

} // namespace file_forge
