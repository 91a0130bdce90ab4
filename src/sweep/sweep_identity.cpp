#include "sweep/sweep_identity.hpp"

#include <cctype>
#include <cstdint>
#include <cstdio>

namespace sweep {

std::string SweepIdentity::stem() const {
    std::string name;
    name.reserve(strategy.size());
    for (const char ch : strategy) {
        const auto c = static_cast<unsigned char>(ch);
        name += (std::isalnum(c) || ch == '_' || ch == '-') ? ch : '_';
    }
    if (name.empty()) {
        name = "sweep";
    }
    return name + "-" + digest;
}

std::string fnv1aHex(const std::string& data) {
    std::uint64_t hash = 0xcbf29ce484222325ULL;
    for (const char ch : data) {
        hash ^= static_cast<unsigned char>(ch);
        hash *= 0x100000001b3ULL;
    }

    char buf[17];
    std::snprintf(buf, sizeof(buf), "%016llx", static_cast<unsigned long long>(hash));
    return std::string(buf);
}

SweepIdentity makeIdentity(const std::string& strategy, const nlohmann::json& evaluatorKey,
                           const ParameterSpace& space, const ConstraintSet& constraints,
                           const SamplingOptions& sampling) {
    nlohmann::json key;
    key["strategy"]  = strategy;
    key["evaluator"] = evaluatorKey;

    key["distributions"] = nlohmann::json::array();
    for (const auto& dist : space.distributions()) {
        nlohmann::json values = nlohmann::json::array();
        for (const auto& v : dist.values) {
            values.push_back(toJson(v));
        }
        key["distributions"].push_back({
            {"label", dist.label},
            {"target", toString(dist.target)},
            {"values", values},
        });
    }

    key["constraints"] = nlohmann::json::array();
    for (const auto& c : constraints.constraints()) {
        key["constraints"].push_back({
            {"label", c.label},
            {"left", c.left},
            {"right", c.right},
            {"op", toString(c.relation)},
        });
    }

    key["sampling"] = {
        {"count", sampling.count},
        {"seed", sampling.seed},
    };

    SweepIdentity identity;
    identity.strategy = strategy;
    identity.digest   = fnv1aHex(key.dump());
    identity.key      = std::move(key);
    return identity;
}

}  // namespace sweep
