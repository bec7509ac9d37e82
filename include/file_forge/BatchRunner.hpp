#pragma once
#include "ConversionRequest.hpp"
#include "Dispatcher.hpp"

#include <chrono>
#include <vector>

namespace file_forge {

// Runs a list of requests through one dispatcher. outcome[i] always belongs
// to request[i], whatever order the workers finish in.
class BatchRunner {
    Dispatcher&               dispatcher_;
    unsigned                  jobs_;
    std::chrono::milliseconds timeout_;
public:
    BatchRunner(Dispatcher& dispatcher,
                unsigned jobs = 1,
                std::chrono::milliseconds timeout = std::chrono::milliseconds{0})
        : dispatcher_(dispatcher), jobs_(jobs ? jobs : 1), timeout_(timeout) {}

    std::vector<ConversionOutcome> run(const std::vector<ConversionRequest>& requests);
};

} // namespace file_forge
