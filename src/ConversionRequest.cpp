#include "file_forge/ConversionRequest.hpp"

#include <filesystem>
#include <stdexcept>

namespace file_forge {

ConversionRequest::ConversionRequest(std::string inputPath,
                                     FileKind    inputKind,
                                     std::string targetFormat,
                                     Options     options,
                                     std::string outputPath,
                                     std::string outputSuffix)
    : inputPath_(std::move(inputPath)),
      inputKind_(inputKind),
      targetKind_(kindFromExtension(targetFormat)),
      targetFormat_(normalizeFormat(targetFormat)),
      options_(std::move(options)),
      outputPath_(std::move(outputPath)),
      outputSuffix_(std::move(outputSuffix))
{
}

std::string ConversionRequest::outputPath() const
{
    if (!outputPath_.empty()) return outputPath_;

    const std::filesystem::path in(inputPath_);
    std::filesystem::path out = in.parent_path()
                              / (in.stem().string() + outputSuffix_ + "." + targetFormat_);
    return out.string();
}

ConversionOutcome ConversionOutcome::success(ConversionResult result)
{
    return ConversionOutcome(std::move(result));
}

ConversionOutcome ConversionOutcome::failure(ErrorKind kind, std::string message,
                                             ConversionRequest request)
{
    return ConversionOutcome(ConversionFailure{kind, std::move(message), std::move(request)});
}

const ConversionResult& ConversionOutcome::result() const
{
    if (!ok()) throw std::logic_error("outcome is a failure: " + failure().message);
    return std::get<ConversionResult>(value_);
}

const ConversionFailure& ConversionOutcome::failure() const
{
    if (ok()) throw std::logic_error("outcome is a success");
    return std::get<ConversionFailure>(value_);
}

} // namespace file_forge
