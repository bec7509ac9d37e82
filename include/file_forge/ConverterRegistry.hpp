#pragma once
#include "Converter.hpp"
#include "FileKind.hpp"

#include <map>
#include <memory>
#include <utility>
#include <vector>

namespace file_forge {

// (source kind, target kind) → converter.
// Populated single-threaded at startup, then frozen; once frozen it is
// read-only and safe to share between batch workers without locking.
class ConverterRegistry {
public:
    using Key = std::pair<FileKind, FileKind>;

    // last registration for a pair wins; throws RegistryFrozen after freeze()
    void add(std::shared_ptr<IConverter> converter);

    std::shared_ptr<IConverter> lookup(FileKind source, FileKind target) const;

    void freeze() { frozen_ = true; }
    bool frozen() const { return frozen_; }

    std::vector<Key> pairs() const;

private:
    std::map<Key, std::shared_ptr<IConverter>> entries_;
    bool frozen_ = false;
};

} // namespace file_forge
