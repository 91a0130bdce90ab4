#pragma once

#include <cstddef>
#include <map>
#include <string>
#include <vector>

#include <nlohmann/json.hpp>

#include "sweep/combination.hpp"

namespace sweep {

enum class ResultStatus
{
    Success,
    Failure,
};

enum class SweepStatus
{
    Complete,    // every combination produced a success or failure row
    Incomplete,  // cancelled before every combination was dispatched
    Empty,       // nothing survived generation; nothing was evaluated
};

[[nodiscard]] std::string toString(ResultStatus status);
[[nodiscard]] std::string toString(SweepStatus status);

/**
 * @brief Outcome of evaluating one combination.
 */
struct SweepResult {
    Combination    combination;
    ResultStatus   status = ResultStatus::Success;
    nlohmann::json output;  // evaluator output, null on failure
    std::string    error;   // failure detail, empty on success

    [[nodiscard]] bool ok() const {
        return status == ResultStatus::Success;
    }
};

bool operator==(const SweepResult& a, const SweepResult& b);

/**
 * @brief Per-combination results in generation order, with lookup by combination.
 */
class ResultSet {
   public:
    ResultSet() = default;
    explicit ResultSet(SweepStatus status)
        : status_(status) {}

    /**
     * @brief Append a result.
     * @throws std::invalid_argument if the combination is already present.
     */
    void add(SweepResult result);

    /**
     * @return The result for a combination, or nullptr if it was not evaluated.
     */
    [[nodiscard]] const SweepResult* find(const Combination& combination) const;

    [[nodiscard]] const std::vector<SweepResult>& results() const {
        return results_;
    }

    [[nodiscard]] std::size_t size() const {
        return results_.size();
    }

    [[nodiscard]] bool empty() const {
        return results_.empty();
    }

    [[nodiscard]] std::size_t successCount() const;
    [[nodiscard]] std::size_t failureCount() const;

    [[nodiscard]] SweepStatus status() const {
        return status_;
    }

    void setStatus(SweepStatus status) {
        status_ = status;
    }

    [[nodiscard]] std::vector<SweepResult>::const_iterator begin() const {
        return results_.begin();
    }

    [[nodiscard]] std::vector<SweepResult>::const_iterator end() const {
        return results_.end();
    }

    [[nodiscard]] nlohmann::json toJson() const;

    /**
     * @throws ConfigurationError if the document is not a result set.
     */
    [[nodiscard]] static ResultSet fromJson(const nlohmann::json& doc);

    friend bool operator==(const ResultSet& a, const ResultSet& b);

   private:
    std::vector<SweepResult>           results_;
    std::map<Combination, std::size_t> index_;
    SweepStatus                        status_ = SweepStatus::Complete;
};

inline bool operator!=(const ResultSet& a, const ResultSet& b) {
    return !(a == b);
}

}  // namespace sweep
