#pragma once
#include "Converter.hpp"
#include "ForgeConfig.hpp"

#include <string>
#include <utility>
#include <vector>

namespace file_forge {

// DOCX → TXT, one paragraph per line
class DocxTextConverter final : public IConverter {
public:
    explicit DocxTextConverter(ForgeConfig config) : config_(std::move(config)) {}

    const char* name() const override { return "docx2txt"; }
    FileKind sourceKind() const override { return FileKind::DocxDocument; }
    FileKind targetKind() const override { return FileKind::PlainText; }

    bool probe(const std::vector<char>& head) const override;

    ConversionResult convert(const std::string&       inputPath,
                             const std::string&       outputPath,
                             const Options&           opts,
                             const ConversionContext& ctx) override;

private:
    ForgeConfig config_;
};

// TXT → DOCX, one line per paragraph
class TextDocxConverter final : public IConverter {
public:
    explicit TextDocxConverter(ForgeConfig config) : config_(std::move(config)) {}

    const char* name() const override { return "txt2docx"; }
    FileKind sourceKind() const override { return FileKind::PlainText; }
    FileKind targetKind() const override { return FileKind::DocxDocument; }

    bool probe(const std::vector<char>& head) const override;

    ConversionResult convert(const std::string&       inputPath,
                             const std::string&       outputPath,
                             const Options&           opts,
                             const ConversionContext& ctx) override;

private:
    ForgeConfig config_;
};

// paragraph texts of word/document.xml in document order
std::vector<std::string> readDocxParagraphs(const std::string& path);

// true for a ZIP package that holds word/document.xml
bool isDocxPackage(const std::string& path);

} // namespace file_forge
