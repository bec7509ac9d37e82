#pragma once
#include "Converter.hpp"
#include "ForgeConfig.hpp"

#include <utility>

namespace file_forge {

// Raster → raster through OpenCV: re-encode, resize, rotate, compress
class ImageConverter final : public IConverter {
public:
    explicit ImageConverter(ForgeConfig config) : config_(std::move(config)) {}

    const char* name() const override { return "image"; }
    FileKind sourceKind() const override { return FileKind::ImageRaster; }
    FileKind targetKind() const override { return FileKind::ImageRaster; }

    std::vector<OptionRule> optionRules() const override;
    bool probe(const std::vector<char>& head) const override;

    ConversionResult convert(const std::string&       inputPath,
                             const std::string&       outputPath,
                             const Options&           opts,
                             const ConversionContext& ctx) override;

private:
    ForgeConfig config_;
};

struct ImageSize { int width = 0; int height = 0; };

// new size for the max_width / max_height / maintain_aspect options;
// throws ForgeError(InvalidOption) when aspect is not kept and a side is missing
ImageSize targetSize(ImageSize source, int maxWidth, int maxHeight, bool maintainAspect);

} // namespace file_forge
