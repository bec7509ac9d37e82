#pragma once
#include "Converter.hpp"
#include "ForgeConfig.hpp"

#include <string>
#include <utility>
#include <vector>

namespace file_forge {

// Video container → video container by running the ffmpeg CLI
class VideoConverter final : public IConverter {
public:
    explicit VideoConverter(ForgeConfig config) : config_(std::move(config)) {}

    const char* name() const override { return "video"; }
    FileKind sourceKind() const override { return FileKind::VideoContainer; }
    FileKind targetKind() const override { return FileKind::VideoContainer; }

    std::vector<OptionRule> optionRules() const override;
    bool probe(const std::vector<char>& head) const override;

    ConversionResult convert(const std::string&       inputPath,
                             const std::string&       outputPath,
                             const Options&           opts,
                             const ConversionContext& ctx) override;

    // argv for one conversion; argv[0] is the configured ffmpeg
    std::vector<std::string> arguments(const std::string& inputPath,
                                       const std::string& outputPath,
                                       int                quality) const;

    // the same, shell-quoted, for messages
    std::string commandLine(const std::string& inputPath,
                            const std::string& outputPath,
                            int                quality) const;

private:
    ForgeConfig config_;
};

// quality 1..100 → x264 CRF 51..18
int qualityToCrf(int quality);

} // namespace file_forge
