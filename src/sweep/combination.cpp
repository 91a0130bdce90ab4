#include "sweep/combination.hpp"

#include <algorithm>
#include <stdexcept>

#include "sweep/errors.hpp"

namespace sweep {

namespace {

// Orders two values of possibly different comparability classes; numbers
// sort before strings so that the ordering stays total.
int compareEntries(const ParamValue& a, const ParamValue& b) {
    if (!comparable(a, b)) {
        return isNumeric(a) ? -1 : 1;
    }
    return compareValues(a, b);
}

}  // namespace

Combination::Combination(std::vector<Entry> entries)
    : entries_(std::move(entries)) {}

const ParamValue& Combination::at(const std::string& label) const {
    for (const auto& [name, value] : entries_) {
        if (name == label) {
            return value;
        }
    }
    throw std::out_of_range("combination has no parameter '" + label + "'");
}

bool Combination::contains(const std::string& label) const {
    for (const auto& entry : entries_) {
        if (entry.first == label) {
            return true;
        }
    }
    return false;
}

std::string Combination::toString() const {
    std::string out;
    for (const auto& [name, value] : entries_) {
        if (!out.empty()) {
            out += ',';
        }
        out += name + "=" + sweep::toString(value);
    }
    return out;
}

nlohmann::json Combination::toJson() const {
    auto doc = nlohmann::json::array();
    for (const auto& [name, value] : entries_) {
        doc.push_back(nlohmann::json::array({name, sweep::toJson(value)}));
    }
    return doc;
}

Combination Combination::fromJson(const nlohmann::json& doc) {
    if (!doc.is_array()) {
        throw ConfigurationError("combination must be a list of [label, value] pairs");
    }

    std::vector<Entry> entries;
    entries.reserve(doc.size());
    for (const auto& pair : doc) {
        if (!pair.is_array() || pair.size() != 2 || !pair[0].is_string()) {
            throw ConfigurationError("malformed combination entry " + pair.dump());
        }
        entries.emplace_back(pair[0].get<std::string>(), paramValueFromJson(pair[1]));
    }
    return Combination(std::move(entries));
}

bool operator==(const Combination& a, const Combination& b) {
    if (a.entries_.size() != b.entries_.size()) {
        return false;
    }
    for (std::size_t i = 0; i < a.entries_.size(); ++i) {
        if (a.entries_[i].first != b.entries_[i].first
            || compareEntries(a.entries_[i].second, b.entries_[i].second) != 0) {
            return false;
        }
    }
    return true;
}

bool operator<(const Combination& a, const Combination& b) {
    const auto n = std::min(a.entries_.size(), b.entries_.size());
    for (std::size_t i = 0; i < n; ++i) {
        const int byLabel = a.entries_[i].first.compare(b.entries_[i].first);
        if (byLabel != 0) {
            return byLabel < 0;
        }
        const int byValue = compareEntries(a.entries_[i].second, b.entries_[i].second);
        if (byValue != 0) {
            return byValue < 0;
        }
    }
    return a.entries_.size() < b.entries_.size();
}

}  // namespace sweep
