#pragma once

#include <atomic>
#include <chrono>
#include <cstddef>
#include <functional>
#include <thread>
#include <utility>
#include <vector>

#include "sweep/combination.hpp"
#include "sweep/evaluator.hpp"
#include "sweep/result_set.hpp"

namespace sweep {

/**
 * @brief Cooperative cancellation flag, checked between dispatches.
 *
 * cancel() is a lock-free atomic store and may be called from a signal
 * handler.
 */
class CancellationToken {
   public:
    void cancel() noexcept {
        cancelled_.store(true, std::memory_order_relaxed);
    }

    [[nodiscard]] bool cancelled() const noexcept {
        return cancelled_.load(std::memory_order_relaxed);
    }

   private:
    std::atomic<bool> cancelled_{false};
};

/**
 * @brief Owns a set of threads and joins them on destruction, so a worker
 *        that fails to start never leaves its siblings joinable.
 */
class ThreadGroup {
   public:
    ThreadGroup() = default;
    ~ThreadGroup() {
        join();
    }

    ThreadGroup(const ThreadGroup&) = delete;
    ThreadGroup& operator=(const ThreadGroup&) = delete;

    /**
     * @throws std::system_error if the thread cannot be started; threads
     *         started earlier keep running.
     */
    template <typename F>
    void spawn(F&& f) {
        threads_.emplace_back(std::forward<F>(f));
    }

    void join() {
        for (auto& t : threads_) {
            if (t.joinable()) {
                t.join();
            }
        }
    }

    [[nodiscard]] std::size_t size() const {
        return threads_.size();
    }

   private:
    std::vector<std::thread> threads_;
};

enum class ExecutionMode
{
    Sequential,
    Parallel,
};

struct SchedulerOptions {
    // 0 or 1 = sequential, >= 2 = worker pool of that size.
    std::size_t workers = 1;

    // Per-evaluation ceiling; zero disables it.
    std::chrono::milliseconds timeout{0};

    // Report failed evaluations on std::cerr.
    bool logFailures = true;
};

/**
 * @brief Number of hardware threads, or 1 if it cannot be determined.
 */
[[nodiscard]] std::size_t defaultWorkerCount();

/**
 * @brief Dispatches every combination to an evaluator exactly once.
 *
 * A throwing evaluation becomes a failed row and never aborts the sweep.
 * Results come back in input order whatever the execution mode.
 */
class SweepScheduler {
   public:
    using ProgressCallback = std::function<void(std::size_t done, std::size_t total)>;

    explicit SweepScheduler(SchedulerOptions options = {});

    /**
     * @brief Called after each finished evaluation (serialized, never concurrently).
     */
    void setProgressCallback(ProgressCallback cb) {
        progressCallback_ = std::move(cb);
    }

    /**
     * @brief Mode used for an evaluator, after the reentrancy fallback.
     */
    [[nodiscard]] ExecutionMode modeFor(const IEvaluator& evaluator) const;

    /**
     * @brief Evaluate all combinations.
     *
     * @param combinations Ordered, duplicate-free combinations.
     * @param evaluator    Scoring function.
     * @param cancel       Optional cancellation token; once set no new
     *                     combination is dispatched and the result set is
     *                     marked Incomplete.
     * @return Status Empty for no input, Incomplete when cancelled before
     *         every combination was dispatched, Complete otherwise.
     */
    [[nodiscard]] ResultSet run(const std::vector<Combination>& combinations, IEvaluator& evaluator,
                                const CancellationToken* cancel = nullptr) const;

   private:
    SchedulerOptions options_;
    ProgressCallback progressCallback_;

    [[nodiscard]] SweepResult evaluateOne(const Combination& combination, IEvaluator& evaluator) const;
};

}  // namespace sweep
