#pragma once
#include "Converter.hpp"
#include "ForgeConfig.hpp"

#include <string>
#include <utility>
#include <vector>

namespace file_forge {

// PDF → PDF holding the pages named by the "pages" option (1-based)
class PdfPagesConverter final : public IConverter {
public:
    explicit PdfPagesConverter(ForgeConfig config) : config_(std::move(config)) {}

    const char* name() const override { return "pdf_pages"; }
    FileKind sourceKind() const override { return FileKind::PdfDocument; }
    FileKind targetKind() const override { return FileKind::PdfDocument; }

    std::vector<OptionRule> optionRules() const override;
    bool probe(const std::vector<char>& head) const override;

    ConversionResult convert(const std::string&       inputPath,
                             const std::string&       outputPath,
                             const Options&           opts,
                             const ConversionContext& ctx) override;

private:
    ForgeConfig config_;
};

// "3", "2-5", "1,4,7-9" → 1-based page numbers in the given order.
// A missing end ("4-") runs to pageCount. Any page outside 1..pageCount
// throws ForgeError(InvalidOption) naming the page and the valid range.
std::vector<int> parsePageList(const std::string& list, int pageCount);

// all pages of every input, in order, into one atomically written output
ConversionResult mergePdfs(const std::vector<std::string>& inputPaths,
                           const std::string&              outputPath,
                           const ConversionContext&        ctx = ConversionContext{});

int pdfPageCount(const std::string& path);

} // namespace file_forge
