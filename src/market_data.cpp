#include "market_data.hpp"

#include <cstdio>
#include <ctime>
#include <fstream>
#include <iostream>
#include <sstream>
#include <vector>

#include <curl/curl.h>
#include <nlohmann/json.hpp>

namespace {

double numberOr(const nlohmann::json& series, std::size_t i, double fallback) {
    if (!series.is_array() || i >= series.size() || !series[i].is_number()) {
        return fallback;
    }
    return series[i].get<double>();
}

std::vector<std::string> splitCsvLine(const std::string& line) {
    std::vector<std::string> cells;
    std::stringstream        ss(line);
    std::string              cell;
    while (std::getline(ss, cell, ',')) {
        if (!cell.empty() && cell.back() == '\r') {
            cell.pop_back();
        }
        cells.push_back(cell);
    }
    return cells;
}

}  // namespace

void MarketData::init() {
    curl_global_init(CURL_GLOBAL_DEFAULT);
}

void MarketData::close() {
    curl_global_cleanup();
}

int64_t MarketData::toUnixTime(const std::string& date) {
    int y = 0;
    int m = 0;
    int d = 0;
    if (date.size() != 10 || std::sscanf(date.c_str(), "%4d-%2d-%2d", &y, &m, &d) != 3) {
        return -1;
    }
    if (m < 1 || m > 12 || d < 1 || d > 31) {
        return -1;
    }

    std::tm tm{};
    tm.tm_year = y - 1900;
    tm.tm_mon  = m - 1;
    tm.tm_mday = d;
    return static_cast<int64_t>(timegm(&tm));
}

std::shared_ptr<StockInfo> MarketData::fetch(const std::string& ticker, const std::string& startDate,
                                             const std::string& endDate, const std::string& interval) {
    const auto period1 = toUnixTime(startDate);
    const auto period2 = toUnixTime(endDate);
    if (period1 < 0 || period2 < 0) {
        std::cerr << "Invalid date range: " << startDate << " ~ " << endDate << std::endl;
        return nullptr;
    }

    const auto body = fetchUrl(std::string(url_base_) + ticker + "?period1=" + std::to_string(period1)
                               + "&period2=" + std::to_string(period2) + "&interval=" + interval);
    if (body.empty()) {
        return nullptr;
    }
    return parseChart(ticker, body);
}

std::shared_ptr<StockInfo> MarketData::parseChart(const std::string& ticker, const std::string& body) {
    try {
        const auto parsed = nlohmann::json::parse(body);
        if (!parsed.contains("chart") || !parsed["chart"].contains("result") || parsed["chart"]["result"].is_null()
            || parsed["chart"]["result"].empty()) {
            return nullptr;
        }

        const auto& result = parsed["chart"]["result"][0];

        auto data    = std::make_shared<StockInfo>();
        data->ticker = ticker;

        /**
         * @note CURRENCY
         * @example "USD", "KRW", etc.
         */
        if (result.contains("meta") && result["meta"].contains("currency")
            && result["meta"]["currency"].is_string()) {
            data->currency = result["meta"]["currency"].get<std::string>();
        }

        if (!result.contains("timestamp") || !result.contains("indicators")
            || !result["indicators"].contains("quote")) {
            return data;
        }

        const auto& stamps = result["timestamp"];
        const auto& quote  = result["indicators"]["quote"][0];

        const nlohmann::json none;
        const auto column = [&quote, &none](const char* key) -> const nlohmann::json& {
            return quote.contains(key) ? quote[key] : none;
        };
        const auto& opens   = column("open");
        const auto& highs   = column("high");
        const auto& lows    = column("low");
        const auto& closes  = column("close");
        const auto& volumes = column("volume");

        /**
         * @note QUOTE
         * Yahoo reports missing bars as null in every series; those bars are dropped.
         */
        for (std::size_t i = 0; i < stamps.size(); ++i) {
            const double close = numberOr(closes, i, -1.0);
            if (close <= 0.0) {
                continue;
            }
            data->timestamps.push_back(stamps[i].get<int64_t>());
            data->close.push_back(close);
            data->open.push_back(numberOr(opens, i, close));
            data->high.push_back(numberOr(highs, i, close));
            data->low.push_back(numberOr(lows, i, close));
            data->volume.push_back(static_cast<int64_t>(numberOr(volumes, i, 0.0)));
        }

        return data;
    } catch (const nlohmann::json::exception& e) {
        std::cerr << ticker << ": " << e.what() << std::endl;
        return nullptr;
    }
}

std::shared_ptr<StockInfo> MarketData::loadCsv(const std::string& path) {
    std::ifstream f(path);
    if (!f.is_open()) {
        std::cerr << "Error: Cannot open: " << path << std::endl;
        return nullptr;
    }

    auto data = std::make_shared<StockInfo>();

    const auto slash = path.find_last_of('/');
    const auto stem  = path.substr(slash == std::string::npos ? 0 : slash + 1);
    data->ticker     = stem.substr(0, stem.find_last_of('.'));

    std::string line;
    std::size_t lineNo = 0;
    while (std::getline(f, line)) {
        ++lineNo;
        if (lineNo == 1 || line.empty()) {
            continue;
        }

        const auto cells = splitCsvLine(line);
        if (cells.size() < 5) {
            std::cerr << "[WARN] " << path << ":" << lineNo << " has " << cells.size() << " columns, skipped"
                      << std::endl;
            continue;
        }

        try {
            int64_t ts = toUnixTime(cells[0]);
            if (ts < 0) {
                ts = std::stoll(cells[0]);
            }
            const double close = std::stod(cells[4]);
            if (close <= 0.0) {
                continue;
            }

            data->timestamps.push_back(ts);
            data->open.push_back(std::stod(cells[1]));
            data->high.push_back(std::stod(cells[2]));
            data->low.push_back(std::stod(cells[3]));
            data->close.push_back(close);
            data->volume.push_back(cells.size() > 5 ? std::stoll(cells[5]) : 0);
        } catch (const std::exception& e) {
            std::cerr << "[WARN] " << path << ":" << lineNo << " " << e.what() << ", skipped" << std::endl;
        }
    }

    if (data->empty()) {
        std::cerr << "Error: No price rows in " << path << std::endl;
        return nullptr;
    }
    return data;
}

std::string MarketData::fetchUrl(const std::string& url) {
    CURL*    curl = nullptr;
    CURLcode res  = CURLE_OK;

    std::string buffer("");

    curl = curl_easy_init();
    if (curl) {
        curl_easy_setopt(curl, CURLOPT_URL, url.c_str());
        curl_easy_setopt(curl, CURLOPT_WRITEFUNCTION, write);
        curl_easy_setopt(curl, CURLOPT_WRITEDATA, &buffer);
        curl_easy_setopt(curl, CURLOPT_FOLLOWLOCATION, 1L);
        curl_easy_setopt(curl, CURLOPT_USERAGENT,
                         "Mozilla/5.0 (Windows NT 10.0; Win64; x64) AppleWebKit/537.36 (KHTML, like Gecko) "
                         "Chrome/58.0.3029.110 Safari/537.3");

        res = curl_easy_perform(curl);
        if (res != CURLE_OK) {
            std::cerr << "curl_easy_perform() failed: " << curl_easy_strerror(res) << std::endl;
            buffer.clear();
        }
        curl_easy_cleanup(curl);
    }
    return buffer;
}

std::size_t MarketData::write(void* contents, std::size_t size, std::size_t nmemb, void* userp) {
    static_cast<std::string*>(userp)->append(static_cast<const char*>(contents), size * nmemb);
    return size * nmemb;
}
