#pragma once
#include "FileKind.hpp"

#include <atomic>
#include <chrono>
#include <cstdint>
#include <memory>
#include <optional>
#include <string>
#include <unordered_map>
#include <vector>

namespace file_forge {

struct Options {
    std::unordered_map<std::string, std::string> params;

    bool has(const std::string& key) const { return params.count(key) != 0; }
    std::string str(const std::string& key, const std::string& def = {}) const;
    int         integer(const std::string& key, int def) const;
    double      real(const std::string& key, double def) const;
    bool        flag(const std::string& key, bool def) const;
};

// Declared constraint for one accepted option key
struct OptionRule {
    enum class Type { Integer, Real, Bool, PageList };

    std::string key;
    Type        type = Type::Integer;
    double      min  = 0;
    double      max  = 0;     // min == max → unbounded

    // empty when the value is acceptable, otherwise a message naming the key
    std::optional<std::string> check(const std::string& value) const;
};

struct ConversionResult {
    std::string               outputPath;
    std::uintmax_t            bytesWritten = 0;
    std::chrono::milliseconds elapsed{0};
    std::vector<std::string>  warnings;
};

// Shared between the dispatcher and a running conversion. Running ends
// either in Cancelled (the dispatcher gave up) or in Committed (the output
// is being published); whichever comes first wins.
class ConversionContext {
public:
    ConversionContext() : state_(std::make_shared<std::atomic<int>>(Running)) {}

    // false when the conversion already started publishing its output
    bool cancel() const;
    bool cancelled() const { return state_->load() == Cancelled; }

    // throws ForgeError(Timeout) once cancelled
    void checkpoint() const;

    // false when cancelled; after true, cancel() has no effect
    bool beginCommit() const;

private:
    enum State : int { Running, Cancelled, Committed };
    std::shared_ptr<std::atomic<int>> state_;
};

class IConverter {
public:
    virtual ~IConverter() = default;

    virtual const char* name() const = 0;
    virtual FileKind sourceKind() const = 0;
    virtual FileKind targetKind() const = 0;

    // accepted keys; anything else is rejected before convert() runs
    virtual std::vector<OptionRule> optionRules() const { return {}; }

    // does the leading content of the input look readable by this converter?
    virtual bool probe(const std::vector<char>& head) const = 0;

    // inputPath → outputPath, с опциями
    virtual ConversionResult convert(const std::string&       inputPath,
                                     const std::string&       outputPath,
                                     const Options&           opts,
                                     const ConversionContext& ctx) = 0;
};

} // namespace file_forge
