#pragma once
#include "Converter.hpp"

#include <cstddef>
#include <cstdint>
#include <string>
#include <vector>

namespace file_forge {

class FileReader {
public:
    // all three throw ForgeError(IoError) when the file cannot be read
    static std::vector<char> readAll(const std::string& path);
    static std::vector<char> readHead(const std::string& path, std::size_t maxBytes);
    static std::string readText(const std::string& path);
};

// Write-then-rename. The temp file lives in the target's directory under a
// random name that keeps the target extension; it is renamed onto the final
// path by commit() and removed by the destructor otherwise.
class AtomicFile {
public:
    explicit AtomicFile(const std::string& finalPath);
    ~AtomicFile();

    AtomicFile(const AtomicFile&)            = delete;
    AtomicFile& operator=(const AtomicFile&) = delete;

    const std::string& tempPath() const { return tempPath_; }
    const std::string& finalPath() const { return finalPath_; }

    // replaces the temp file content
    void write(const void* data, std::size_t size);
    void write(const std::string& data) { write(data.data(), data.size()); }
    void write(const std::vector<unsigned char>& data) { write(data.data(), data.size()); }

    // publish; throws ForgeError(Timeout) if the conversion was cancelled
    // first, ForgeError(IoError) if the temp file is missing or the rename fails
    std::uintmax_t commit(const ConversionContext& ctx);

private:
    std::string finalPath_;
    std::string tempPath_;
    bool        committed_ = false;
};

class FileWriter {
public:
    static std::uintmax_t writeAll(const std::string&       path,
                                   const std::string&       data,
                                   const ConversionContext& ctx);
};

} // namespace file_forge
