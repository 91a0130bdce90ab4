#include "sweep/result_set.hpp"

#include <algorithm>
#include <stdexcept>

#include "sweep/errors.hpp"

namespace sweep {

namespace {

SweepStatus sweepStatusFromString(const std::string& name) {
    if (name == "complete") {
        return SweepStatus::Complete;
    }
    if (name == "incomplete") {
        return SweepStatus::Incomplete;
    }
    if (name == "empty") {
        return SweepStatus::Empty;
    }
    throw ConfigurationError("unknown sweep status '" + name + "'");
}

}  // namespace

std::string toString(ResultStatus status) {
    return status == ResultStatus::Success ? "success" : "failure";
}

std::string toString(SweepStatus status) {
    switch (status) {
        case SweepStatus::Complete:
            return "complete";
        case SweepStatus::Incomplete:
            return "incomplete";
        case SweepStatus::Empty:
            return "empty";
    }
    return "complete";
}

bool operator==(const SweepResult& a, const SweepResult& b) {
    return a.combination == b.combination && a.status == b.status && a.output == b.output && a.error == b.error;
}

void ResultSet::add(SweepResult result) {
    if (index_.count(result.combination) > 0) {
        throw std::invalid_argument("duplicate result for " + result.combination.toString());
    }
    index_.emplace(result.combination, results_.size());
    results_.push_back(std::move(result));
}

const SweepResult* ResultSet::find(const Combination& combination) const {
    const auto it = index_.find(combination);
    if (it == index_.end()) {
        return nullptr;
    }
    return &results_[it->second];
}

std::size_t ResultSet::successCount() const {
    return static_cast<std::size_t>(
        std::count_if(results_.begin(), results_.end(), [](const SweepResult& r) { return r.ok(); }));
}

std::size_t ResultSet::failureCount() const {
    return results_.size() - successCount();
}

nlohmann::json ResultSet::toJson() const {
    nlohmann::json doc;
    doc["status"]  = toString(status_);
    doc["results"] = nlohmann::json::array();

    for (const auto& r : results_) {
        nlohmann::json row;
        row["params"] = r.combination.toJson();
        row["status"] = toString(r.status);
        row["output"] = r.output;
        row["error"]  = r.error;
        doc["results"].push_back(std::move(row));
    }
    return doc;
}

ResultSet ResultSet::fromJson(const nlohmann::json& doc) {
    if (!doc.is_object() || !doc.contains("results") || !doc["results"].is_array()) {
        throw ConfigurationError("result set document has no 'results' list");
    }

    ResultSet set(sweepStatusFromString(doc.value("status", "complete")));
    for (const auto& row : doc["results"]) {
        if (!row.is_object() || !row.contains("params")) {
            throw ConfigurationError("malformed result row " + row.dump());
        }

        SweepResult r;
        r.combination = Combination::fromJson(row["params"]);
        r.status      = row.value("status", "success") == "success" ? ResultStatus::Success : ResultStatus::Failure;
        r.output      = row.contains("output") ? row.at("output") : nlohmann::json();
        r.error       = row.value("error", "");
        set.add(std::move(r));
    }
    return set;
}

bool operator==(const ResultSet& a, const ResultSet& b) {
    return a.status_ == b.status_ && a.results_ == b.results_;
}

}  // namespace sweep
