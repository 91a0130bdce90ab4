#include "sweep/sweep_scheduler.hpp"

#include <algorithm>
#include <atomic>
#include <exception>
#include <iostream>
#include <mutex>
#include <system_error>
#include <thread>
#include <utility>

namespace sweep {

std::size_t defaultWorkerCount() {
    const auto n = std::thread::hardware_concurrency();
    return n == 0 ? 1 : static_cast<std::size_t>(n);
}

SweepScheduler::SweepScheduler(SchedulerOptions options)
    : options_(options) {}

ExecutionMode SweepScheduler::modeFor(const IEvaluator& evaluator) const {
    if (options_.workers <= 1 || !evaluator.reentrant()) {
        return ExecutionMode::Sequential;
    }
    return ExecutionMode::Parallel;
}

SweepResult SweepScheduler::evaluateOne(const Combination& combination, IEvaluator& evaluator) const {
    SweepResult result;
    result.combination = combination;

    const auto start = std::chrono::steady_clock::now();
    try {
        result.output = evaluator.evaluate(combination);
        result.status = ResultStatus::Success;
    } catch (const std::exception& e) {
        result.status = ResultStatus::Failure;
        result.output = nullptr;
        result.error  = e.what();
        return result;
    }

    if (options_.timeout.count() > 0) {
        const auto elapsed =
            std::chrono::duration_cast<std::chrono::milliseconds>(std::chrono::steady_clock::now() - start);
        if (elapsed > options_.timeout) {
            result.status = ResultStatus::Failure;
            result.output = nullptr;
            result.error  = "evaluation exceeded timeout of " + std::to_string(options_.timeout.count()) + " ms";
        }
    }
    return result;
}

ResultSet SweepScheduler::run(const std::vector<Combination>& combinations, IEvaluator& evaluator,
                              const CancellationToken* cancel) const {
    const auto total = combinations.size();
    if (total == 0) {
        return ResultSet(SweepStatus::Empty);
    }

    std::mutex  reportMutex;
    std::size_t done = 0;

    // Progress and failure logging share one lock so lines never interleave.
    const auto report = [&](const SweepResult& r) {
        std::lock_guard<std::mutex> lock(reportMutex);
        ++done;
        if (!r.ok() && options_.logFailures) {
            std::cerr << "[FAIL] " << r.combination.toString() << ": " << r.error << std::endl;
        }
        if (progressCallback_) {
            progressCallback_(done, total);
        }
    };

    const auto isCancelled = [cancel] { return cancel != nullptr && cancel->cancelled(); };

    std::vector<std::pair<std::size_t, SweepResult>> collected;
    collected.reserve(total);

    if (modeFor(evaluator) == ExecutionMode::Sequential) {
        if (options_.workers > 1) {
            std::clog << "Evaluator is not reentrant, dispatching sequentially." << std::endl;
        }

        for (std::size_t i = 0; i < total && !isCancelled(); ++i) {
            auto r = evaluateOne(combinations[i], evaluator);
            report(r);
            collected.emplace_back(i, std::move(r));
        }
    } else {
        const auto workers = std::min(options_.workers, total);

        // Shared cursor: every index is claimed by exactly one worker.
        std::atomic<std::size_t> next{0};
        std::atomic<bool>        stopped{false};

        // Each worker appends to its own partition; merged after join.
        std::vector<std::vector<std::pair<std::size_t, SweepResult>>> partitions(workers);
        std::vector<std::exception_ptr>                               errors(workers);

        {
            ThreadGroup pool;
            try {
                for (std::size_t w = 0; w < workers; ++w) {
                    pool.spawn([&, w] {
                        try {
                            while (!stopped.load() && !isCancelled()) {
                                const auto i = next.fetch_add(1);
                                if (i >= total) {
                                    break;
                                }
                                auto r = evaluateOne(combinations[i], evaluator);
                                report(r);
                                partitions[w].emplace_back(i, std::move(r));
                            }
                        } catch (...) {
                            // Not a std::exception: hand it to the caller after join.
                            errors[w] = std::current_exception();
                        }
                    });
                }
            } catch (const std::system_error& e) {
                // Stop the workers already running; the pool joins them on unwind.
                stopped.store(true);
                std::cerr << "[FAIL] Cannot start worker " << pool.size() + 1 << " of " << workers << ": "
                          << e.what() << std::endl;
                throw;
            }
        }
        for (const auto& e : errors) {
            if (e) {
                std::rethrow_exception(e);
            }
        }

        for (auto& part : partitions) {
            for (auto& entry : part) {
                collected.push_back(std::move(entry));
            }
        }
        std::sort(collected.begin(), collected.end(),
                  [](const auto& a, const auto& b) { return a.first < b.first; });
    }

    ResultSet results(collected.size() == total ? SweepStatus::Complete : SweepStatus::Incomplete);
    for (auto& entry : collected) {
        results.add(std::move(entry.second));
    }
    return results;
}

}  // namespace sweep
