#include "file_forge/FileStream.hpp"
#include "file_forge/ForgeError.hpp"

#include <cerrno>
#include <cstring>
#include <filesystem>
#include <fstream>
#include <iterator>
#include <random>
#include <sstream>

namespace file_forge {

namespace fs = std::filesystem;

static std::string randomSuffix()
{
    thread_local std::mt19937_64 rng{std::random_device{}()};
    std::ostringstream ss;
    ss << std::hex << rng();
    return ss.str();
}

static std::ifstream openForRead(const std::string& path)
{
    std::error_code ec;
    if (!fs::is_regular_file(path, ec))
        throw ForgeError(ErrorKind::IoError, "File '" + path + "' not found");
    std::ifstream in(path, std::ios::binary);
    if (!in)
        throw ForgeError(ErrorKind::IoError,
                         "cannot open '" + path + "': " + std::strerror(errno));
    return in;
}

// ─────────────────────── FileReader ────────────────────────────────────────
std::vector<char> FileReader::readAll(const std::string& path)
{
    std::ifstream in = openForRead(path);
    std::vector<char> data((std::istreambuf_iterator<char>(in)), {});
    if (in.bad())
        throw ForgeError(ErrorKind::IoError, "read error on '" + path + "'");
    return data;
}

std::vector<char> FileReader::readHead(const std::string& path, std::size_t maxBytes)
{
    std::ifstream in = openForRead(path);
    std::vector<char> data(maxBytes);
    in.read(data.data(), static_cast<std::streamsize>(maxBytes));
    if (in.bad())
        throw ForgeError(ErrorKind::IoError, "read error on '" + path + "'");
    data.resize(static_cast<std::size_t>(in.gcount()));
    return data;
}

std::string FileReader::readText(const std::string& path)
{
    auto data = readAll(path);
    return std::string(data.begin(), data.end());
}

// ─────────────────────── AtomicFile ────────────────────────────────────────
AtomicFile::AtomicFile(const std::string& finalPath)
    : finalPath_(finalPath)
{
    const fs::path p(finalPath);
    const std::string name = "." + p.stem().string() + ".ff-" + randomSuffix()
                           + p.extension().string();
    tempPath_ = (p.parent_path() / name).string();
}

AtomicFile::~AtomicFile()
{
    if (committed_) return;
    std::error_code ec;
    fs::remove(tempPath_, ec);   // nothing to do if it was never created
}

void AtomicFile::write(const void* data, std::size_t size)
{
    std::ofstream out(tempPath_, std::ios::binary | std::ios::trunc);
    if (!out)
        throw ForgeError(ErrorKind::IoError,
                         "cannot create '" + tempPath_ + "': " + std::strerror(errno));
    out.write(static_cast<const char*>(data), static_cast<std::streamsize>(size));
    out.flush();
    if (!out)
        throw ForgeError(ErrorKind::IoError, "write error on '" + tempPath_ + "'");
}

std::uintmax_t AtomicFile::commit(const ConversionContext& ctx)
{
    if (!ctx.beginCommit())
        throw ForgeError(ErrorKind::Timeout, "conversion cancelled before writing " + finalPath_);

    std::error_code ec;
    if (!fs::is_regular_file(tempPath_, ec))
        throw ForgeError(ErrorKind::IoError, "no output was produced for " + finalPath_);

    fs::rename(tempPath_, finalPath_, ec);
    if (ec)
        throw ForgeError(ErrorKind::IoError,
                         "cannot move output into place at " + finalPath_ + ": " + ec.message());
    committed_ = true;

    const auto size = fs::file_size(finalPath_, ec);
    return ec ? 0 : size;
}

// ─────────────────────── FileWriter ────────────────────────────────────────
std::uintmax_t FileWriter::writeAll(const std::string&       path,
                                    const std::string&       data,
                                    const ConversionContext& ctx)
{
    AtomicFile file(path);
    file.write(data);
    return file.commit(ctx);
}

} // namespace file_forge
