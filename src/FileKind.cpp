#include "file_forge/FileKind.hpp"
#include "file_forge/ForgeError.hpp"

#include <algorithm>
#include <cctype>
#include <cstring>
#include <unordered_map>

namespace file_forge {

const char* toString(FileKind kind)
{
    switch (kind) {
    case FileKind::ImageRaster:    return "ImageRaster";
    case FileKind::PdfDocument:    return "PdfDocument";
    case FileKind::DocxDocument:   return "DocxDocument";
    case FileKind::PlainText:      return "PlainText";
    case FileKind::VideoContainer: return "VideoContainer";
    case FileKind::Unknown:        break;
    }
    return "Unknown";
}

const char* toString(ErrorKind kind)
{
    switch (kind) {
    case ErrorKind::UnrecognizedFileKind:  return "UnrecognizedFileKind";
    case ErrorKind::UnsupportedConversion: return "UnsupportedConversion";
    case ErrorKind::InvalidOption:         return "InvalidOption";
    case ErrorKind::ConversionFailed:      return "ConversionFailed";
    case ErrorKind::Timeout:               return "Timeout";
    case ErrorKind::IoError:               return "IoError";
    }
    return "ConversionFailed";
}

std::string normalizeFormat(const std::string& format)
{
    std::string f = format;
    f.erase(std::remove(f.begin(), f.end(), '.'), f.end());
    std::transform(f.begin(), f.end(), f.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return f;
}

FileKind kindFromExtension(const std::string& ext)
{
    // raster formats OpenCV's imgcodecs can read and write
    static const std::unordered_map<std::string, FileKind> table {
        {"jpg",  FileKind::ImageRaster}, {"jpeg", FileKind::ImageRaster},
        {"jpe",  FileKind::ImageRaster}, {"png",  FileKind::ImageRaster},
        {"webp", FileKind::ImageRaster}, {"bmp",  FileKind::ImageRaster},
        {"tif",  FileKind::ImageRaster}, {"tiff", FileKind::ImageRaster},
        {"gif",  FileKind::ImageRaster}, {"pbm",  FileKind::ImageRaster},
        {"pgm",  FileKind::ImageRaster}, {"ppm",  FileKind::ImageRaster},
        {"pdf",  FileKind::PdfDocument},
        {"docx", FileKind::DocxDocument},
        {"txt",  FileKind::PlainText},   {"text", FileKind::PlainText},
        {"mp4",  FileKind::VideoContainer}, {"mov",  FileKind::VideoContainer},
        {"mkv",  FileKind::VideoContainer}, {"webm", FileKind::VideoContainer},
        {"avi",  FileKind::VideoContainer}, {"m4v",  FileKind::VideoContainer},
    };
    auto it = table.find(normalizeFormat(ext));
    return it == table.end() ? FileKind::Unknown : it->second;
}

bool isLossyImageFormat(const std::string& format)
{
    const std::string f = normalizeFormat(format);
    return f == "jpg" || f == "jpeg" || f == "jpe" || f == "webp";
}

// ─────────────────────── content sniffing ──────────────────────────────────
static bool hasMagic(const std::vector<char>& head, const char* magic, std::size_t len,
                     std::size_t offset = 0)
{
    return head.size() >= offset + len && std::memcmp(head.data() + offset, magic, len) == 0;
}

static bool containsWithin(const std::vector<char>& head, const char* needle, std::size_t limit)
{
    const std::size_t n   = std::strlen(needle);
    const std::size_t end = std::min(head.size(), limit);
    for (std::size_t i = 0; i + n <= end; ++i)
        if (std::memcmp(head.data() + i, needle, n) == 0) return true;
    return false;
}

// No NUL bytes, well-formed UTF-8, at most 5% control characters. A multi-byte
// sequence cut off by the end of the sample is tolerated.
bool looksLikeText(const std::vector<char>& head)
{
    std::size_t suspicious = 0;
    for (std::size_t i = 0; i < head.size(); ++i) {
        const auto c = static_cast<unsigned char>(head[i]);
        if (c == 0) return false;
        if (c < 0x80) {
            if (c < 0x20 && c != '\t' && c != '\n' && c != '\r' && c != '\f' && c != 0x1b)
                ++suspicious;
            continue;
        }
        std::size_t extra = (c & 0xE0) == 0xC0 ? 1 : (c & 0xF0) == 0xE0 ? 2 : (c & 0xF8) == 0xF0 ? 3 : 0;
        if (extra == 0) return false;
        for (std::size_t k = 1; k <= extra; ++k) {
            if (i + k >= head.size()) return true;
            if ((static_cast<unsigned char>(head[i + k]) & 0xC0) != 0x80) return false;
        }
        i += extra;
    }
    return suspicious * 20 <= head.size();
}

FileKind sniffMagic(const std::vector<char>& head)
{
    if (hasMagic(head, "\x89PNG\r\n\x1a\n", 8) || hasMagic(head, "\xFF\xD8\xFF", 3)
        || hasMagic(head, "GIF87a", 6) || hasMagic(head, "GIF89a", 6)
        || hasMagic(head, "II*\0", 4) || hasMagic(head, "MM\0*", 4)
        || (hasMagic(head, "RIFF", 4) && hasMagic(head, "WEBP", 4, 8))
        || (hasMagic(head, "BM", 2) && hasMagic(head, "\0\0\0\0", 4, 6)))
        return FileKind::ImageRaster;

    if (head.size() >= 3 && head[0] == 'P' && head[1] >= '1' && head[1] <= '6'
        && std::isspace(static_cast<unsigned char>(head[2])))
        return FileKind::ImageRaster;

    if (containsWithin(head, "%PDF-", 1024))
        return FileKind::PdfDocument;

    if (hasMagic(head, "\x1A\x45\xDF\xA3", 4)
        || (hasMagic(head, "RIFF", 4) && hasMagic(head, "AVI ", 4, 8)))
        return FileKind::VideoContainer;

    if (hasMagic(head, "ftyp", 4, 4)) {
        // HEIF/AVIF stills share the ISO-BMFF box layout
        for (const char* still : {"heic", "heix", "avif", "mif1"})
            if (hasMagic(head, still, 4, 8)) return FileKind::Unknown;
        return FileKind::VideoContainer;
    }
    return FileKind::Unknown;
}

bool isZipMagic(const std::vector<char>& head)
{
    return hasMagic(head, "PK\x03\x04", 4);
}

} // namespace file_forge
