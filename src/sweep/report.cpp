#include "sweep/report.hpp"

#include <filesystem>
#include <fstream>
#include <iostream>
#include <set>
#include <vector>

namespace sweep {

namespace {

std::string csvField(const std::string& raw) {
    if (raw.find_first_of(",\"\n") == std::string::npos) {
        return raw;
    }
    std::string quoted = "\"";
    for (const char ch : raw) {
        if (ch == '"') {
            quoted += '"';
        }
        quoted += ch;
    }
    return quoted + "\"";
}

std::string scalarText(const nlohmann::json& value) {
    if (value.is_string()) {
        return value.get<std::string>();
    }
    if (value.is_null()) {
        return "";
    }
    return value.dump();
}

}  // namespace

bool writeCsv(const std::string& path, const ResultSet& results) {
    const auto parent = std::filesystem::path(path).parent_path();
    if (!parent.empty()) {
        std::error_code ec;
        std::filesystem::create_directories(parent, ec);
        if (ec) {
            std::cerr << "Error: Cannot create " << parent.string() << ": " << ec.message() << std::endl;
            return false;
        }
    }

    std::ofstream out(path);
    if (!out.is_open()) {
        std::cerr << "Error: Cannot open: " << path << std::endl;
        return false;
    }

    std::vector<std::string> params;
    std::set<std::string>    fields;
    for (const auto& r : results) {
        if (params.empty()) {
            for (const auto& entry : r.combination.entries()) {
                params.push_back(entry.first);
            }
        }
        if (r.output.is_object()) {
            for (const auto& [key, value] : r.output.items()) {
                if (value.is_primitive()) {
                    fields.insert(key);
                }
            }
        }
    }

    for (const auto& p : params) {
        out << csvField(p) << ',';
    }
    out << "status";
    for (const auto& f : fields) {
        out << ',' << csvField(f);
    }
    out << ",error\n";

    for (const auto& r : results) {
        for (const auto& entry : r.combination.entries()) {
            out << csvField(toString(entry.second)) << ',';
        }
        out << toString(r.status);
        for (const auto& f : fields) {
            out << ',';
            if (r.output.is_object() && r.output.contains(f)) {
                out << csvField(scalarText(r.output[f]));
            }
        }
        out << ',' << csvField(r.error) << '\n';
    }

    out.flush();
    return static_cast<bool>(out);
}

}  // namespace sweep
