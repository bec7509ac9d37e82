#pragma once
#include "Converter.hpp"
#include "FileKind.hpp"
#include "ForgeError.hpp"

#include <optional>
#include <string>
#include <variant>

namespace file_forge {

// One requested conversion. Immutable once built.
class ConversionRequest {
public:
    ConversionRequest(std::string inputPath,
                      FileKind    inputKind,
                      std::string targetFormat,
                      Options     options      = {},
                      std::string outputPath   = {},
                      std::string outputSuffix = {});

    const std::string& inputPath() const { return inputPath_; }
    FileKind inputKind() const { return inputKind_; }
    FileKind targetKind() const { return targetKind_; }
    const std::string& targetFormat() const { return targetFormat_; }
    const Options& options() const { return options_; }

    // explicit -o path, or <dir>/<stem><suffix>.<format> next to the input
    std::string outputPath() const;

private:
    std::string inputPath_;
    FileKind    inputKind_;
    FileKind    targetKind_;
    std::string targetFormat_;
    Options     options_;
    std::string outputPath_;
    std::string outputSuffix_;
};

struct ConversionFailure {
    ErrorKind         kind;
    std::string       message;
    ConversionRequest request;
};

class ConversionOutcome {
public:
    static ConversionOutcome success(ConversionResult result);
    static ConversionOutcome failure(ErrorKind kind, std::string message, ConversionRequest request);

    bool ok() const { return std::holds_alternative<ConversionResult>(value_); }
    const ConversionResult& result() const;    // throws std::logic_error on a failure
    const ConversionFailure& failure() const;  // throws std::logic_error on a success

private:
    explicit ConversionOutcome(std::variant<ConversionResult, ConversionFailure> v)
        : value_(std::move(v)) {}

    std::variant<ConversionResult, ConversionFailure> value_;
};

} // namespace file_forge
