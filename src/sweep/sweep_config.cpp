#include "sweep/sweep_config.hpp"

#include <fstream>
#include <string>

#include "sweep/errors.hpp"
#include "sweep/parameter_space.hpp"

namespace sweep {

namespace {

std::vector<ParamValue> parseValues(const std::string& label, const nlohmann::json& dist) {
    if (dist.contains("values")) {
        const auto& values = dist["values"];
        if (!values.is_array()) {
            throw ConfigurationError("distribution '" + label + "': 'values' must be a list");
        }
        std::vector<ParamValue> out;
        out.reserve(values.size());
        for (const auto& v : values) {
            out.push_back(paramValueFromJson(v));
        }
        return out;
    }

    if (dist.contains("range")) {
        const auto& range = dist["range"];
        if (!range.is_object() || !range.contains("start") || !range.contains("stop")) {
            throw ConfigurationError("distribution '" + label + "': 'range' needs 'start' and 'stop'");
        }
        return integerRange(range["start"].get<long long>(), range["stop"].get<long long>(),
                            range.value("step", 1LL));
    }

    throw ConfigurationError("distribution '" + label + "' has neither 'values' nor 'range'");
}

// Counts are read signed so that a negative entry is reported, not wrapped.
std::size_t nonNegative(const nlohmann::json& doc, const nlohmann::json::json_pointer& ptr, std::size_t fallback) {
    if (!doc.contains(ptr)) {
        return fallback;
    }
    const auto& value = doc[ptr];
    if (value.is_number_unsigned()) {
        return value.get<std::size_t>();
    }
    const auto n = value.get<long long>();
    if (n < 0) {
        throw ConfigurationError("'" + ptr.to_string() + "' must not be negative, got " + std::to_string(n));
    }
    return static_cast<std::size_t>(n);
}

}  // namespace

SweepConfig parseSweepConfig(const nlohmann::json& doc) {
    if (!doc.is_object()) {
        throw ConfigurationError("sweep config must be a JSON object");
    }

    SweepConfig cfg;

    try {
        cfg.strategy = doc.value("strategy", cfg.strategy);

        if (doc.contains("data")) {
            cfg.evaluatorKey["data"] = doc["data"];
        }
        if (doc.contains("backtest")) {
            cfg.evaluatorKey["backtest"] = doc["backtest"];
        }

        if (!doc.contains("distributions") || !doc["distributions"].is_array()) {
            throw ConfigurationError("'distributions' list is missing");
        }
        for (const auto& d : doc["distributions"]) {
            DistributionSpec spec;
            spec.label  = d.at("label").get<std::string>();
            spec.target = bindingTargetFromString(d.value("target", "none"));
            spec.values = parseValues(spec.label, d);
            cfg.distributions.push_back(std::move(spec));
        }

        const auto constraints = doc.contains("constraints") ? doc["constraints"] : nlohmann::json::array();
        if (!constraints.is_array()) {
            throw ConfigurationError("'constraints' must be a list");
        }
        for (const auto& c : constraints) {
            ConstraintSpec spec;
            spec.left  = c.at("left").get<std::string>();
            spec.right = c.at("right").get<std::string>();
            spec.op    = c.at("op").get<std::string>();
            spec.label = c.value("label", spec.left + spec.op + spec.right);
            cfg.constraints.push_back(std::move(spec));
        }

        cfg.sampling.count = nonNegative(doc, "/sampling/count"_json_pointer, 0);
        cfg.sampling.seed  = doc.value("/sampling/seed"_json_pointer, kDefaultSeed);

        cfg.execution.workers     = nonNegative(doc, "/execution/workers"_json_pointer, defaultWorkerCount());
        cfg.execution.timeout     = std::chrono::milliseconds(
            static_cast<long long>(nonNegative(doc, "/execution/timeout_ms"_json_pointer, 0)));
        cfg.execution.logFailures = doc.value("/execution/log_failures"_json_pointer, true);
    } catch (const nlohmann::json::exception& e) {
        throw ConfigurationError(e.what());
    }

    return cfg;
}

nlohmann::json readConfigFile(const std::string& path) {
    std::ifstream f(path);
    if (!f.is_open()) {
        throw ConfigurationError("cannot open " + path);
    }

    try {
        return nlohmann::json::parse(f);
    } catch (const nlohmann::json::parse_error& e) {
        throw ConfigurationError(path + ": " + e.what());
    }
}

}  // namespace sweep
