#include "file_forge/ConverterRegistry.hpp"
#include "file_forge/ForgeError.hpp"

#include <stdexcept>

namespace file_forge {

void ConverterRegistry::add(std::shared_ptr<IConverter> converter)
{
    if (!converter)
        throw std::invalid_argument("null converter");
    if (frozen_)
        throw RegistryFrozen(std::string("cannot register '") + converter->name()
                             + "' after the registry was frozen");

    entries_[{converter->sourceKind(), converter->targetKind()}] = std::move(converter);
}

std::shared_ptr<IConverter> ConverterRegistry::lookup(FileKind source, FileKind target) const
{
    auto it = entries_.find({source, target});
    return it == entries_.end() ? nullptr : it->second;
}

std::vector<ConverterRegistry::Key> ConverterRegistry::pairs() const
{
    std::vector<Key> keys;
    keys.reserve(entries_.size());
    for (const auto& [key, conv] : entries_)
        keys.push_back(key);
    return keys;
}

} // namespace file_forge
