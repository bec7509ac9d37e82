#pragma once
#include <stdexcept>
#include <string>

namespace file_forge {

enum class ErrorKind {
    UnrecognizedFileKind,
    UnsupportedConversion,
    InvalidOption,
    ConversionFailed,
    Timeout,
    IoError
};

const char* toString(ErrorKind kind);

// Classified failure thrown inside the library. The dispatcher turns it
// into a Failure outcome; it never reaches the caller of execute().
class ForgeError : public std::runtime_error {
public:
    ForgeError(ErrorKind kind, const std::string& message)
        : std::runtime_error(message), kind_(kind) {}

    ErrorKind kind() const noexcept { return kind_; }

private:
    ErrorKind kind_;
};

// Registration after ConverterRegistry::freeze()
class RegistryFrozen : public std::logic_error {
public:
    using std::logic_error::logic_error;
};

} // namespace file_forge
