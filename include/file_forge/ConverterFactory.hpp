#pragma once
#include "Converter.hpp"
#include "ConverterRegistry.hpp"
#include "ForgeConfig.hpp"
#include <memory>
#include <string>

namespace file_forge {

class ConverterFactory {
public:
    // создаёт нужный конвертер по ключу, например "pdf2txt"
    static std::unique_ptr<IConverter> create(const std::string& converterId,
                                              const ForgeConfig& config);

    // every built-in converter, registered and frozen
    static std::shared_ptr<const ConverterRegistry> createRegistry(const ForgeConfig& config);
};

} // namespace file_forge
