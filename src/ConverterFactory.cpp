#include "file_forge/ConverterFactory.hpp"
#include "file_forge/DocxTextConverter.hpp"
#include "file_forge/ImageConverter.hpp"
#include "file_forge/PdfPagesConverter.hpp"
#include "file_forge/PdfTextConverter.hpp"
#include "file_forge/VideoConverter.hpp"
#include <stdexcept>

namespace file_forge {

std::unique_ptr<IConverter> ConverterFactory::create(const std::string& id,
                                                     const ForgeConfig& config)
{
    if (id == "image")     return std::make_unique<ImageConverter>(config);
    if (id == "pdf2txt")   return std::make_unique<PdfTextConverter>(config);
    if (id == "pdf_pages") return std::make_unique<PdfPagesConverter>(config);
    if (id == "docx2txt")  return std::make_unique<DocxTextConverter>(config);
    if (id == "txt2docx")  return std::make_unique<TextDocxConverter>(config);
    if (id == "video")     return std::make_unique<VideoConverter>(config);
    throw std::invalid_argument("Unknown converter: " + id);
}

std::shared_ptr<const ConverterRegistry> ConverterFactory::createRegistry(const ForgeConfig& config)
{
    auto registry = std::make_shared<ConverterRegistry>();
    for (const char* id : {"image", "pdf2txt", "pdf_pages", "docx2txt", "txt2docx", "video"})
        registry->add(create(id, config));
    registry->freeze();
    return registry;
}

} // namespace file_forge
