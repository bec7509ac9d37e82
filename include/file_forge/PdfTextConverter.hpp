#pragma once
#include "Converter.hpp"
#include "ForgeConfig.hpp"

#include <utility>

namespace file_forge {

class PdfTextConverter final : public IConverter {
public:
    explicit PdfTextConverter(ForgeConfig config) : config_(std::move(config)) {}

    const char* name() const override { return "pdf2txt"; }
    FileKind sourceKind() const override { return FileKind::PdfDocument; }
    FileKind targetKind() const override { return FileKind::PlainText; }

    bool probe(const std::vector<char>& head) const override;

    ConversionResult convert(const std::string&       inputPath,
                             const std::string&       outputPath,
                             const Options&           opts,
                             const ConversionContext& ctx) override;

private:
    ForgeConfig config_;
};

} // namespace file_forge
