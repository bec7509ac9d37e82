#include "file_forge/ForgeConfig.hpp"
#include "file_forge/ForgeError.hpp"

#include <cmath>

namespace file_forge {

std::chrono::milliseconds timeoutFromSeconds(double seconds)
{
    // upper bound keeps the cast below in range (about a year)
    if (!std::isfinite(seconds) || seconds <= 0 || seconds > 3.0e7)
        throw ForgeError(ErrorKind::InvalidOption, "timeout must be a positive number of seconds");
    return std::chrono::milliseconds(static_cast<long long>(std::ceil(seconds * 1000)));
}

} // namespace file_forge
