#include "file_forge/PdfTextConverter.hpp"
#include "file_forge/FileStream.hpp"
#include "file_forge/ForgeError.hpp"
#include "MuPdfSupport.hpp"

#include <stdexcept>

namespace file_forge {

bool PdfTextConverter::probe(const std::vector<char>& head) const
{
    return sniffMagic(head) == FileKind::PdfDocument;
}

// text of one page; an unreadable page yields an empty string and a warning
static std::string pageText(fz_context* fz, fz_document* doc, int pageIdx,
                            std::vector<std::string>& warnings)
{
    fz_stext_page* stext = nullptr;
    fz_buffer*     buffer = nullptr;
    std::string    text;
    std::string    error;
    bool           failed = false;

    fz_var(stext);
    fz_var(buffer);
    fz_try(fz) {
        stext  = fz_new_stext_page_from_page_number(fz, doc, pageIdx, nullptr);
        buffer = fz_new_buffer_from_stext_page(fz, stext);
        unsigned char* data = nullptr;
        const size_t   len  = fz_buffer_storage(fz, buffer, &data);
        text.assign(reinterpret_cast<const char*>(data), len);
    }
    fz_always(fz) {
        fz_drop_buffer(fz, buffer);
        fz_drop_stext_page(fz, stext);
    }
    fz_catch(fz) {
        failed = true;
        error  = fz_caught_message(fz);
    }

    if (failed) {
        warnings.push_back("page " + std::to_string(pageIdx + 1) + ": " + error);
        return {};
    }

    // stext ends every block with a newline; the page marker separates pages
    while (!text.empty() && (text.back() == '\n' || text.back() == ' '))
        text.pop_back();
    return text;
}

ConversionResult PdfTextConverter::convert(const std::string&       inPath,
                                           const std::string&       outPath,
                                           const Options&,
                                           const ConversionContext& ctx)
{
    ConversionResult result;
    result.outputPath = outPath;

    MuPdfContext mu;
    fz_context* fz = mu.get();
    FzDocumentPtr doc = openDocument(fz, inPath);

    int pages = 0;
    bool counted = false;
    std::string error;
    fz_try(fz) { pages = fz_count_pages(fz, doc.get()); counted = true; }
    fz_catch(fz) { error = fz_caught_message(fz); }
    if (!counted)
        throw std::runtime_error("cannot count pages of " + inPath + ": " + error);

    // one segment per page, empty pages included
    std::string out;
    for (int i = 0; i < pages; ++i) {
        ctx.checkpoint();
        if (i > 0) out += config_.pageSeparator;
        out += pageText(fz, doc.get(), i, result.warnings);
    }
    out += '\n';

    result.bytesWritten = FileWriter::writeAll(outPath, out, ctx);
    return result;
}

} // namespace file_forge
