#include "file_forge/BatchRunner.hpp"

#include <algorithm>
#include <atomic>
#include <optional>
#include <thread>

namespace file_forge {

std::vector<ConversionOutcome> BatchRunner::run(const std::vector<ConversionRequest>& requests)
{
    std::vector<std::optional<ConversionOutcome>> slots(requests.size());
    const unsigned workers = static_cast<unsigned>(
        std::min<std::size_t>(jobs_, std::max<std::size_t>(requests.size(), 1)));

    dispatcher_.log().line("batch", std::to_string(requests.size()) + " request(s), "
                                    + std::to_string(workers) + " worker(s)");

    // запускаем: каждый воркер забирает следующий индекс, пишет только в свой слот
    std::atomic<std::size_t> next{0};
    auto work = [&] {
        for (std::size_t i = next++; i < requests.size(); i = next++)
            slots[i] = dispatcher_.execute(requests[i], timeout_);
    };

    if (workers <= 1) {
        work();
    } else {
        std::vector<std::thread> pool;
        pool.reserve(workers);
        for (unsigned w = 0; w < workers; ++w)
            pool.emplace_back(work);
        for (auto& t : pool) t.join();
    }

    std::vector<ConversionOutcome> outcomes;
    outcomes.reserve(requests.size());
    for (auto& slot : slots)
        outcomes.push_back(std::move(*slot));   // execute() always yields one

    std::size_t failed = std::count_if(outcomes.begin(), outcomes.end(),
                                       [](const ConversionOutcome& o) { return !o.ok(); });
    dispatcher_.log().line("batch", "done: " + std::to_string(outcomes.size() - failed)
                                    + " succeeded, " + std::to_string(failed) + " failed");
    return outcomes;
}

} // namespace file_forge
