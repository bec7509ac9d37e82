#pragma once
#include <string>
#include <vector>

namespace file_forge {

enum class FileKind {
    ImageRaster,
    PdfDocument,
    DocxDocument,
    PlainText,
    VideoContainer,
    Unknown
};

const char* toString(FileKind kind);

// "PNG", ".png" and "png" are all accepted; unknown extensions map to Unknown
FileKind kindFromExtension(const std::string& ext);

// lower-case, no leading dot
std::string normalizeFormat(const std::string& format);

bool isLossyImageFormat(const std::string& format);

// Magic-byte classification of a file's leading bytes. ZIP containers come
// back as Unknown: telling DOCX apart needs the archive directory.
FileKind sniffMagic(const std::vector<char>& head);
bool isZipMagic(const std::vector<char>& head);

// no NUL bytes, valid UTF-8, few control characters
bool looksLikeText(const std::vector<char>& head);

} // namespace file_forge
