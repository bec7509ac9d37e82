/*============================================================================
  DocxTextConverter.cpp  –  part of file-forge
  --------------------------------------------------------------------------
  DOCX ⇄ plain text. A DOCX file is a ZIP package (libzip) whose body lives
  in word/document.xml (pugixml). Mapping is one paragraph ⇄ one line:
    * DOCX → TXT: every w:p in document order becomes a line, empty
      paragraphs included; w:tab → '\t', w:br / w:cr → ' '.
    * TXT → DOCX: every line becomes a w:p; tabs become w:tab.
  Archive timestamps are fixed, so the same text always yields the same bytes.
============================================================================*/

#include "file_forge/DocxTextConverter.hpp"
#include "file_forge/FileStream.hpp"
#include "file_forge/ForgeError.hpp"

#include <pugixml.hpp>
#include <zip.h>

#include <cstring>
#include <ctime>
#include <memory>
#include <sstream>
#include <stdexcept>

namespace file_forge {

static constexpr zip_uint64_t kMaxPartSize  = 100 * 1024 * 1024;
static constexpr std::time_t  kPackageMTime = 1262304000;   // 2010-01-01

static const char* kContentTypes =
    "<?xml version=\"1.0\" encoding=\"UTF-8\" standalone=\"yes\"?>\n"
    "<Types xmlns=\"http://schemas.openxmlformats.org/package/2006/content-types\">"
    "<Default Extension=\"rels\" ContentType=\"application/vnd.openxmlformats-package.relationships+xml\"/>"
    "<Default Extension=\"xml\" ContentType=\"application/xml\"/>"
    "<Override PartName=\"/word/document.xml\" "
    "ContentType=\"application/vnd.openxmlformats-officedocument.wordprocessingml.document.main+xml\"/>"
    "</Types>";

static const char* kPackageRels =
    "<?xml version=\"1.0\" encoding=\"UTF-8\" standalone=\"yes\"?>\n"
    "<Relationships xmlns=\"http://schemas.openxmlformats.org/package/2006/relationships\">"
    "<Relationship Id=\"rId1\" "
    "Type=\"http://schemas.openxmlformats.org/officeDocument/2006/relationships/officeDocument\" "
    "Target=\"word/document.xml\"/>"
    "</Relationships>";

static const char* kWordNs = "http://schemas.openxmlformats.org/wordprocessingml/2006/main";

// ─────────────────────── zip helpers ───────────────────────────────────────
struct ZipDiscard {
    void operator()(zip_t* z) const { zip_discard(z); }
};
using ZipPtr = std::unique_ptr<zip_t, ZipDiscard>;

static std::string zipErrorString(int code)
{
    zip_error_t error;
    zip_error_init_with_code(&error, code);
    std::string msg = zip_error_strerror(&error);
    zip_error_fini(&error);
    return msg;
}

static ZipPtr openZipForRead(const std::string& path)
{
    int code = 0;
    zip_t* archive = zip_open(path.c_str(), ZIP_RDONLY, &code);
    if (!archive)
        throw std::runtime_error("cannot open " + path + " as ZIP: " + zipErrorString(code));
    return ZipPtr(archive);
}

static std::string readEntry(zip_t* archive, const std::string& entry, const std::string& path)
{
    zip_stat_t st;
    zip_stat_init(&st);
    if (zip_stat(archive, entry.c_str(), 0, &st) != 0)
        throw std::runtime_error(path + " has no " + entry + " (not a DOCX document?)");
    if (!(st.valid & ZIP_STAT_SIZE) || st.size > kMaxPartSize)
        throw std::runtime_error(entry + " in " + path + " is too large");

    zip_file_t* handle = zip_fopen(archive, entry.c_str(), 0);
    if (!handle)
        throw std::runtime_error("cannot open " + entry + " in " + path + ": " + zip_strerror(archive));

    std::string contents(st.size, '\0');
    const zip_int64_t got = zip_fread(handle, &contents[0], st.size);
    zip_fclose(handle);
    if (got < 0 || static_cast<zip_uint64_t>(got) != st.size)
        throw std::runtime_error("short read of " + entry + " in " + path);
    return contents;
}

bool isDocxPackage(const std::string& path)
{
    int code = 0;
    ZipPtr archive(zip_open(path.c_str(), ZIP_RDONLY, &code));
    return archive && zip_name_locate(archive.get(), "word/document.xml", 0) >= 0;
}

// ─────────────────────── DOCX → paragraphs ─────────────────────────────────
static const char* localName(pugi::xml_node node)
{
    const char* name  = node.name();
    const char* colon = std::strrchr(name, ':');
    return colon ? colon + 1 : name;
}

static void runText(pugi::xml_node node, std::string& out)
{
    for (pugi::xml_node child : node.children()) {
        const std::string name = localName(child);
        if (name == "p" || name == "pPr" || name == "rPr") continue;   // nested w:p is its own line
        if (name == "t")   { out += child.child_value(); continue; }
        if (name == "tab") { out += '\t'; continue; }
        if (name == "br" || name == "cr") { out += ' '; continue; }
        runText(child, out);
    }
}

static void collectParagraphs(pugi::xml_node node, std::vector<std::string>& out)
{
    for (pugi::xml_node child : node.children()) {
        if (std::strcmp(localName(child), "p") == 0) {
            std::string text;
            runText(child, text);
            out.push_back(std::move(text));
        }
        collectParagraphs(child, out);
    }
}

std::vector<std::string> readDocxParagraphs(const std::string& path)
{
    ZipPtr archive = openZipForRead(path);
    const std::string xml = readEntry(archive.get(), "word/document.xml", path);

    pugi::xml_document doc;
    const pugi::xml_parse_result parsed = doc.load_buffer(xml.data(), xml.size());
    if (!parsed)
        throw std::runtime_error("cannot parse word/document.xml in " + path + ": "
                                 + parsed.description());

    std::vector<std::string> paragraphs;
    collectParagraphs(doc.document_element(), paragraphs);
    return paragraphs;
}

bool DocxTextConverter::probe(const std::vector<char>& head) const
{
    return isZipMagic(head);
}

ConversionResult DocxTextConverter::convert(const std::string&       inPath,
                                            const std::string&       outPath,
                                            const Options&,
                                            const ConversionContext& ctx)
{
    ConversionResult result;
    result.outputPath = outPath;

    const auto paragraphs = readDocxParagraphs(inPath);
    ctx.checkpoint();

    std::string text;
    for (const auto& p : paragraphs) {
        text += p;
        text += '\n';
    }
    result.bytesWritten = FileWriter::writeAll(outPath, text, ctx);
    return result;
}

// ─────────────────────── lines → DOCX ──────────────────────────────────────
// CR of CRLF and a leading BOM are dropped; a final newline does not open
// another paragraph
static std::vector<std::string> splitLines(std::string text)
{
    if (text.compare(0, 3, "\xEF\xBB\xBF") == 0) text.erase(0, 3);

    std::vector<std::string> lines;
    std::size_t start = 0;
    while (start < text.size()) {
        std::size_t end = text.find('\n', start);
        if (end == std::string::npos) end = text.size();
        std::string line = text.substr(start, end - start);
        if (!line.empty() && line.back() == '\r') line.pop_back();
        lines.push_back(std::move(line));
        start = end + 1;
    }
    return lines;
}

// XML 1.0 forbids most C0 controls; returns how many were removed
static std::size_t stripControls(std::string& s)
{
    std::size_t removed = 0;
    std::string clean;
    clean.reserve(s.size());
    for (char c : s) {
        const auto u = static_cast<unsigned char>(c);
        if (u < 0x20 && c != '\t') { ++removed; continue; }
        clean += c;
    }
    s.swap(clean);
    return removed;
}

static std::string documentXml(const std::vector<std::string>& lines, std::size_t& removed)
{
    pugi::xml_document xml;
    pugi::xml_node decl = xml.append_child(pugi::node_declaration);
    decl.append_attribute("version")    = "1.0";
    decl.append_attribute("encoding")   = "UTF-8";
    decl.append_attribute("standalone") = "yes";

    pugi::xml_node document = xml.append_child("w:document");
    document.append_attribute("xmlns:w") = kWordNs;
    pugi::xml_node body = document.append_child("w:body");

    for (std::string line : lines) {
        removed += stripControls(line);
        pugi::xml_node para = body.append_child("w:p");
        if (line.empty()) continue;

        pugi::xml_node run = para.append_child("w:r");
        std::size_t start = 0;
        for (;;) {
            const std::size_t tab = line.find('\t', start);
            const std::string seg = line.substr(start, tab == std::string::npos ? std::string::npos : tab - start);
            if (!seg.empty()) {
                pugi::xml_node t = run.append_child("w:t");
                t.append_attribute("xml:space") = "preserve";
                t.text().set(seg.c_str());
            }
            if (tab == std::string::npos) break;
            run.append_child("w:tab");
            start = tab + 1;
        }
    }

    std::ostringstream out;
    xml.save(out, "", pugi::format_raw, pugi::encoding_utf8);
    return out.str();
}

// parts must outlive zip_close(): libzip reads the buffers only then
static void writePackage(const std::string& target,
                         const std::vector<std::pair<std::string, std::string>>& parts)
{
    int code = 0;
    zip_t* archive = zip_open(target.c_str(), ZIP_CREATE | ZIP_TRUNCATE, &code);
    if (!archive)
        throw ForgeError(ErrorKind::IoError, "cannot create " + target + ": " + zipErrorString(code));

    for (const auto& [name, data] : parts) {
        zip_source_t* source = zip_source_buffer(archive, data.data(), data.size(), 0);
        zip_int64_t index = source ? zip_file_add(archive, name.c_str(), source, ZIP_FL_ENC_UTF_8) : -1;
        if (index < 0 && source) zip_source_free(source);   // still ours when the add failed

        if (index < 0 || zip_file_set_mtime(archive, static_cast<zip_uint64_t>(index), kPackageMTime, 0) < 0) {
            const std::string msg = zip_strerror(archive);
            zip_discard(archive);
            throw std::runtime_error("cannot add " + name + " to " + target + ": " + msg);
        }
    }

    if (zip_close(archive) != 0) {
        const std::string msg = zip_strerror(archive);
        zip_discard(archive);
        throw ForgeError(ErrorKind::IoError, "cannot write " + target + ": " + msg);
    }
}

bool TextDocxConverter::probe(const std::vector<char>& head) const
{
    return looksLikeText(head);
}

ConversionResult TextDocxConverter::convert(const std::string&       inPath,
                                            const std::string&       outPath,
                                            const Options&,
                                            const ConversionContext& ctx)
{
    ConversionResult result;
    result.outputPath = outPath;

    const auto lines = splitLines(FileReader::readText(inPath));
    std::size_t removed = 0;
    const std::vector<std::pair<std::string, std::string>> parts {
        {"[Content_Types].xml", kContentTypes},
        {"_rels/.rels",         kPackageRels},
        {"word/document.xml",   documentXml(lines, removed)},
    };
    if (removed)
        result.warnings.push_back("dropped " + std::to_string(removed)
                                  + " control character(s) that DOCX cannot hold");
    ctx.checkpoint();

    AtomicFile file(outPath);
    writePackage(file.tempPath(), parts);
    result.bytesWritten = file.commit(ctx);
    return result;
}

} // namespace file_forge
