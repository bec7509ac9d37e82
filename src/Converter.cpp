#include "file_forge/Converter.hpp"
#include "file_forge/ForgeError.hpp"

#include <algorithm>
#include <cctype>
#include <cmath>
#include <sstream>

namespace file_forge {

// ─────────────────────── value parsing ─────────────────────────────────────
static bool parseInt(const std::string& s, long long& out)
{
    try {
        std::size_t pos = 0;
        out = std::stoll(s, &pos);
        return pos == s.size();
    } catch (const std::exception&) {
        return false;
    }
}

static bool parseReal(const std::string& s, double& out)
{
    try {
        std::size_t pos = 0;
        out = std::stod(s, &pos);
        return pos == s.size() && std::isfinite(out);
    } catch (const std::exception&) {
        return false;
    }
}

static bool parseBool(const std::string& s, bool& out)
{
    std::string v = s;
    std::transform(v.begin(), v.end(), v.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    if (v == "true" || v == "1" || v == "yes" || v == "on")  { out = true;  return true; }
    if (v == "false" || v == "0" || v == "no" || v == "off") { out = false; return true; }
    return false;
}

// "1,3,5-7,9-": syntax only, page count is checked by the converter
static bool wellFormedPageList(const std::string& s)
{
    if (s.empty()) return false;
    std::stringstream ss(s);
    std::string item;
    while (std::getline(ss, item, ',')) {
        if (item.empty()) return false;
        auto dash = item.find('-');
        long long a = 0, b = 0;
        if (dash == std::string::npos) {
            if (!parseInt(item, a) || a < 1) return false;
            continue;
        }
        if (!parseInt(item.substr(0, dash), a) || a < 1) return false;
        const std::string tail = item.substr(dash + 1);
        if (tail.empty()) continue;
        if (!parseInt(tail, b) || b < a) return false;
    }
    return s.back() != ',';
}

// ─────────────────────── Options ───────────────────────────────────────────
std::string Options::str(const std::string& key, const std::string& def) const
{
    auto it = params.find(key);
    return it == params.end() ? def : it->second;
}

int Options::integer(const std::string& key, int def) const
{
    auto it = params.find(key);
    if (it == params.end()) return def;
    long long v = 0;
    if (!parseInt(it->second, v))
        throw ForgeError(ErrorKind::InvalidOption,
                         "option '" + key + "' expects an integer, got '" + it->second + "'");
    return static_cast<int>(v);
}

double Options::real(const std::string& key, double def) const
{
    auto it = params.find(key);
    if (it == params.end()) return def;
    double v = 0;
    if (!parseReal(it->second, v))
        throw ForgeError(ErrorKind::InvalidOption,
                         "option '" + key + "' expects a number, got '" + it->second + "'");
    return v;
}

bool Options::flag(const std::string& key, bool def) const
{
    auto it = params.find(key);
    if (it == params.end()) return def;
    bool v = false;
    if (!parseBool(it->second, v))
        throw ForgeError(ErrorKind::InvalidOption,
                         "option '" + key + "' expects true or false, got '" + it->second + "'");
    return v;
}

// ─────────────────────── OptionRule ────────────────────────────────────────
std::optional<std::string> OptionRule::check(const std::string& value) const
{
    const bool bounded = min != max;
    std::ostringstream range;
    range << " (allowed " << min << "-" << max << ")";

    switch (type) {
    case Type::Integer: {
        long long v = 0;
        if (!parseInt(value, v))
            return "option '" + key + "' expects an integer, got '" + value + "'";
        if (bounded && (v < min || v > max))
            return "option '" + key + "' is out of range: " + value + range.str();
        return std::nullopt;
    }
    case Type::Real: {
        double v = 0;
        if (!parseReal(value, v))
            return "option '" + key + "' expects a number, got '" + value + "'";
        if (bounded && (v < min || v > max))
            return "option '" + key + "' is out of range: " + value + range.str();
        return std::nullopt;
    }
    case Type::Bool: {
        bool v = false;
        if (!parseBool(value, v))
            return "option '" + key + "' expects true or false, got '" + value + "'";
        return std::nullopt;
    }
    case Type::PageList:
        if (!wellFormedPageList(value))
            return "option '" + key + "' expects 1-based pages like 2-4 or 1,3,5, got '" + value + "'";
        return std::nullopt;
    }
    return std::nullopt;
}

// ─────────────────────── ConversionContext ─────────────────────────────────
bool ConversionContext::cancel() const
{
    int expected = Running;
    if (state_->compare_exchange_strong(expected, Cancelled))
        return true;
    return expected == Cancelled;
}

void ConversionContext::checkpoint() const
{
    if (cancelled())
        throw ForgeError(ErrorKind::Timeout, "conversion cancelled");
}

bool ConversionContext::beginCommit() const
{
    int expected = Running;
    return state_->compare_exchange_strong(expected, Committed);
}

} // namespace file_forge
