#include "file_forge/PdfPagesConverter.hpp"
#include "file_forge/FileStream.hpp"
#include "file_forge/ForgeError.hpp"
#include "MuPdfSupport.hpp"

#include <chrono>
#include <sstream>
#include <stdexcept>

namespace file_forge {

// ─────────────────────── page lists ────────────────────────────────────────
static int pageNumber(const std::string& token, int pageCount)
{
    std::size_t pos = 0;
    long long n = 0;
    try {
        n = std::stoll(token, &pos);
    } catch (const std::exception&) {
        pos = 0;
    }
    if (pos == 0 || pos != token.size())
        throw ForgeError(ErrorKind::InvalidOption, "option 'pages': '" + token + "' is not a page number");
    if (n < 1 || n > pageCount)
        throw ForgeError(ErrorKind::InvalidOption,
                         "option 'pages': page " + token + " is out of range (1-"
                         + std::to_string(pageCount) + ")");
    return static_cast<int>(n);
}

std::vector<int> parsePageList(const std::string& list, int pageCount)
{
    std::vector<int> pages;
    std::stringstream ss(list);
    std::string item;
    while (std::getline(ss, item, ',')) {
        const auto dash = item.find('-');
        if (dash == std::string::npos) {
            pages.push_back(pageNumber(item, pageCount));
            continue;
        }
        const int first = pageNumber(item.substr(0, dash), pageCount);
        const std::string tail = item.substr(dash + 1);
        const int last = tail.empty() ? pageCount : pageNumber(tail, pageCount);
        if (last < first)
            throw ForgeError(ErrorKind::InvalidOption,
                             "option 'pages': range " + item + " runs backwards");
        for (int p = first; p <= last; ++p)
            pages.push_back(p);
    }
    if (pages.empty())
        throw ForgeError(ErrorKind::InvalidOption, "option 'pages' selects no pages");
    return pages;
}

// ─────────────────────── MuPDF helpers ─────────────────────────────────────
static int countPages(fz_context* fz, pdf_document* doc, const std::string& path)
{
    int pages = -1;
    std::string error;
    fz_try(fz) { pages = pdf_count_pages(fz, doc); }
    fz_catch(fz) { error = fz_caught_message(fz); }
    if (pages < 0)
        throw std::runtime_error("cannot count pages of " + path + ": " + error);
    return pages;
}

using PageSource = std::pair<pdf_document*, std::vector<int>>;   // 1-based pages

// grafts the pages into a fresh document and saves it to `target`
static void writePages(fz_context* fz, const std::vector<PageSource>& sources,
                       const std::string& target)
{
    pdf_document*  dst = nullptr;
    pdf_graft_map* map = nullptr;
    std::string    error;
    bool           failed = false;

    fz_var(dst);
    fz_var(map);
    fz_try(fz) {
        dst = pdf_create_document(fz);
        for (const auto& [src, pages] : sources) {
            map = pdf_new_graft_map(fz, dst);
            for (int p : pages)
                pdf_graft_mapped_page(fz, map, -1, src, p - 1);
            pdf_drop_graft_map(fz, map);
            map = nullptr;
        }
        pdf_write_options wopts = pdf_default_write_options;
        wopts.do_garbage = 1;
        pdf_save_document(fz, dst, target.c_str(), &wopts);
    }
    fz_always(fz) {
        pdf_drop_graft_map(fz, map);
        pdf_drop_document(fz, dst);
    }
    fz_catch(fz) {
        failed = true;
        error  = fz_caught_message(fz);
    }
    if (failed)
        throw std::runtime_error("cannot write " + target + ": " + error);
}

// ─────────────────────── IConverter ────────────────────────────────────────
std::vector<OptionRule> PdfPagesConverter::optionRules() const
{
    return {{"pages", OptionRule::Type::PageList}};
}

bool PdfPagesConverter::probe(const std::vector<char>& head) const
{
    return sniffMagic(head) == FileKind::PdfDocument;
}

ConversionResult PdfPagesConverter::convert(const std::string&       inPath,
                                            const std::string&       outPath,
                                            const Options&           opts,
                                            const ConversionContext& ctx)
{
    ConversionResult result;
    result.outputPath = outPath;

    MuPdfContext mu;
    fz_context* fz = mu.get();
    PdfDocumentPtr src = openPdf(fz, inPath);

    const int pageCount = countPages(fz, src.get(), inPath);
    if (pageCount == 0)
        throw std::runtime_error(inPath + " has no pages");

    // no "pages" option → a full copy, same as "1-"
    const std::vector<int> pages = parsePageList(opts.str("pages", "1-"), pageCount);
    ctx.checkpoint();

    AtomicFile file(outPath);
    writePages(fz, {{src.get(), pages}}, file.tempPath());
    ctx.checkpoint();
    result.bytesWritten = file.commit(ctx);
    return result;
}

// ─────────────────────── merge ─────────────────────────────────────────────
ConversionResult mergePdfs(const std::vector<std::string>& inputPaths,
                           const std::string&              outputPath,
                           const ConversionContext&        ctx)
{
    if (inputPaths.empty())
        throw ForgeError(ErrorKind::InvalidOption, "nothing to merge");

    const auto started = std::chrono::steady_clock::now();
    ConversionResult result;
    result.outputPath = outputPath;

    MuPdfContext mu;
    fz_context* fz = mu.get();

    std::vector<PdfDocumentPtr> docs;
    std::vector<PageSource>     sources;
    for (const auto& path : inputPaths) {
        if (FileReader::readHead(path, 1024).empty())
            throw ForgeError(ErrorKind::IoError, path + " is empty");
        docs.push_back(openPdf(fz, path));
        const int count = countPages(fz, docs.back().get(), path);
        if (count == 0)
            result.warnings.push_back(path + " has no pages");
        std::vector<int> all(count);
        for (int i = 0; i < count; ++i) all[i] = i + 1;
        sources.emplace_back(docs.back().get(), std::move(all));
        ctx.checkpoint();
    }

    AtomicFile file(outputPath);
    writePages(fz, sources, file.tempPath());
    result.bytesWritten = file.commit(ctx);
    result.elapsed = std::chrono::duration_cast<std::chrono::milliseconds>(
        std::chrono::steady_clock::now() - started);
    return result;
}

int pdfPageCount(const std::string& path)
{
    MuPdfContext mu;
    PdfDocumentPtr doc = openPdf(mu.get(), path);
    return countPages(mu.get(), doc.get(), path);
}

} // namespace file_forge
