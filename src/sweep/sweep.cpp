#include "sweep/sweep.hpp"

#include <iostream>

namespace sweep {

Sweep::Sweep(const SweepConfig& config)
    : config_(config)
    , constraints_(space_) {
    for (const auto& d : config_.distributions) {
        space_.declare(d.label, d.target, d.values);
    }
    for (const auto& c : config_.constraints) {
        constraints_.declareConstraint(c.label, c.left, c.right, c.op);
    }
    identity_ = makeIdentity(config_.strategy, config_.evaluatorKey, space_, constraints_, config_.sampling);
}

std::vector<Combination> Sweep::combinations() const {
    const CombinationGenerator generator(space_, constraints_);
    return generator.generate(config_.sampling);
}

std::optional<SweepReport> Sweep::cached(IResultStore& store) const {
    auto stored = store.load(identity_);
    if (!stored) {
        return std::nullopt;
    }

    std::clog << "[OK] Reusing stored results for sweep " << identity_.digest << " (" << stored->size() << " rows)"
              << std::endl;

    SweepReport report;
    report.results      = std::move(*stored);
    report.fromCache    = true;
    report.combinations = report.results.size();
    return report;
}

SweepReport Sweep::run(IEvaluator& evaluator, IResultStore* store, const CancellationToken* cancel) const {
    if (store != nullptr) {
        if (auto hit = cached(*store)) {
            return std::move(*hit);
        }
    }

    SweepReport report;

    const CombinationGenerator generator(space_, constraints_);
    const auto                 full       = generator.generate();
    const auto                 candidates = CombinationGenerator::sample(full, config_.sampling.count,
                                                                         config_.sampling.seed);

    std::clog << "Sweep " << identity_.digest << ": " << generator.fullProductSize() << " in product, "
              << full.size() << " valid, " << candidates.size() << " to evaluate" << std::endl;

    SweepScheduler scheduler(config_.execution);
    if (progressCallback_) {
        scheduler.setProgressCallback(progressCallback_);
    }

    report.combinations = candidates.size();
    report.results      = scheduler.run(candidates, evaluator, cancel);

    if (report.results.status() == SweepStatus::Empty) {
        std::clog << "[WARN] No combination satisfies the constraints, nothing to evaluate." << std::endl;
    }

    if (store != nullptr && report.results.status() != SweepStatus::Incomplete) {
        store->save(identity_, report.results);
    }
    return report;
}

}  // namespace sweep
