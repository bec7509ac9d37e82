#include "file_forge/FileInfo.hpp"
#include "file_forge/Dispatcher.hpp"
#include "file_forge/DocxTextConverter.hpp"
#include "file_forge/FileStream.hpp"
#include "file_forge/ForgeError.hpp"
#include "file_forge/PdfPagesConverter.hpp"

#include <opencv2/core.hpp>
#include <opencv2/imgcodecs.hpp>

#include <algorithm>
#include <cctype>
#include <filesystem>
#include <iomanip>
#include <sstream>

namespace file_forge {

namespace fs = std::filesystem;

std::string readableSize(std::uintmax_t bytes)
{
    static const char* units[] = {"B", "KB", "MB", "GB", "TB"};
    double size = static_cast<double>(bytes);
    for (const char* unit : units) {
        if (size < 1024.0) {
            std::ostringstream ss;
            ss << std::fixed << std::setprecision(2) << size << ' ' << unit;
            return ss.str();
        }
        size /= 1024.0;
    }
    std::ostringstream ss;
    ss << std::fixed << std::setprecision(2) << size << " PB";
    return ss.str();
}

static const char* depthName(int depth)
{
    switch (depth) {
    case CV_8U:  case CV_8S:  return "8-bit";
    case CV_16U: case CV_16S: return "16-bit";
    case CV_32F:              return "32-bit float";
    case CV_64F:              return "64-bit float";
    default:                  return "32-bit";
    }
}

static const char* modeName(int channels)
{
    switch (channels) {
    case 1:  return "L";
    case 2:  return "LA";
    case 3:  return "RGB";
    case 4:  return "RGBA";
    default: return "unknown";
    }
}

static void imageDetails(const std::string& path, FileInfo& info)
{
    const cv::Mat img = cv::imread(path, cv::IMREAD_UNCHANGED);
    if (img.empty()) {
        info.details.emplace_back("Dimensions", "unreadable");
        return;
    }
    info.details.emplace_back("Dimensions", std::to_string(img.cols) + " x "
                                            + std::to_string(img.rows) + " pixels");
    std::string format = normalizeFormat(info.extension);
    std::transform(format.begin(), format.end(), format.begin(),
                   [](unsigned char c) { return static_cast<char>(std::toupper(c)); });
    info.details.emplace_back("Format", format.empty() ? "?" : format);
    info.details.emplace_back("Mode", modeName(img.channels()));
    info.details.emplace_back("Depth", depthName(img.depth()));
}

static void textDetails(const std::string& path, FileInfo& info)
{
    const std::string text = FileReader::readText(path);
    std::size_t lines = std::count(text.begin(), text.end(), '\n');
    if (!text.empty() && text.back() != '\n') ++lines;
    info.details.emplace_back("Lines", std::to_string(lines));
}

FileInfo describeFile(const std::string& path, const Dispatcher& dispatcher)
{
    std::error_code ec;
    if (!fs::exists(path, ec))
        throw ForgeError(ErrorKind::IoError, "File '" + path + "' not found");
    if (!fs::is_regular_file(path, ec))
        throw ForgeError(ErrorKind::IoError, "'" + path + "' is not a file");

    FileInfo info;
    const fs::path p(path);
    info.name         = p.filename().string();
    info.absolutePath = fs::absolute(p).string();
    info.size         = fs::file_size(p);
    info.extension    = p.extension().string();

    try {
        info.kind = dispatcher.resolve(path);
    } catch (const ForgeError& e) {
        if (e.kind() != ErrorKind::UnrecognizedFileKind) throw;
        info.kind = FileKind::Unknown;
    }

    // details are best effort: a damaged file still gets its basic facts
    try {
        switch (info.kind) {
        case FileKind::ImageRaster:
            imageDetails(path, info);
            break;
        case FileKind::PdfDocument:
            info.details.emplace_back("Pages", std::to_string(pdfPageCount(path)));
            break;
        case FileKind::DocxDocument:
            info.details.emplace_back("Paragraphs", std::to_string(readDocxParagraphs(path).size()));
            break;
        case FileKind::PlainText:
            textDetails(path, info);
            break;
        case FileKind::VideoContainer:
        case FileKind::Unknown:
            break;
        }
    } catch (const std::exception& e) {
        info.details.emplace_back("Details", std::string("unavailable: ") + e.what());
    }
    return info;
}

} // namespace file_forge
