#include "backtest/BacktestBatch.h"
#include "common/Logger.h"

#include <algorithm>
#include <atomic>
#include <exception>
#include <thread>

namespace crosstrade {
namespace backtest {

std::vector<BacktestOutcome> BacktestBatch::runParallel(
    const std::vector<BacktestRequest>& requests,
    const core::IMarketDataProvider& provider,
    unsigned int max_threads
) {
    std::vector<BacktestOutcome> outcomes(requests.size());
    if (requests.empty()) {
        return outcomes;
    }

    unsigned int workers = max_threads;
    if (workers == 0) {
        workers = std::max(1u, std::thread::hardware_concurrency());
    }
    workers = std::min<unsigned int>(workers, static_cast<unsigned int>(requests.size()));

    std::atomic<size_t> next_index{0};
    const BacktestEngine engine{};

    auto worker = [&]() {
        while (true) {
            const size_t idx = next_index.fetch_add(1);
            if (idx >= requests.size()) {
                return;
            }

            BacktestOutcome& outcome = outcomes[idx];
            outcome.request = requests[idx];
            try {
                outcome.result = engine.run(requests[idx], provider);
            } catch (const std::exception& e) {
                outcome.error = e.what();
                LOG_WARN("Batch backtest #{} ({}) failed: {}", idx, requests[idx].symbol, e.what());
            }
        }
    };

    std::vector<std::thread> threads;
    threads.reserve(workers);
    for (unsigned int i = 0; i < workers; ++i) {
        threads.emplace_back(worker);
    }
    for (auto& t : threads) {
        t.join();
    }

    const auto failed = std::count_if(outcomes.begin(), outcomes.end(),
                                      [](const BacktestOutcome& o) { return !o.ok(); });
    LOG_INFO("Batch finished: {} runs, {} failed, {} threads", outcomes.size(), failed, workers);
    return outcomes;
}

} // namespace backtest
} // namespace crosstrade
