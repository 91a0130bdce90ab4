#pragma once

#include <cstddef>
#include <cstdint>
#include <memory>
#include <string>
#include <string_view>

#include "stock_info.hpp"

/**
 * @brief Price history sources: Yahoo Finance over HTTP, or a local CSV file.
 *
 * Failures are reported on std::cerr and returned as nullptr.
 */
class MarketData {
   public:
    /**
     * @brief Global libcurl setup; call once before fetch(), pair with close().
     */
    static void init();
    static void close();

    MarketData()  = delete;
    ~MarketData() = delete;

    MarketData(const MarketData& other) = delete;
    MarketData(MarketData&& other)      = delete;

    MarketData& operator=(const MarketData& other) = delete;
    MarketData& operator=(MarketData&& other) = delete;

    /**
     * @brief Fetch historical prices with date range.
     * @param ticker    Stock ticker (e.g., "SPY")
     * @param startDate Start date (YYYY-MM-DD), inclusive
     * @param endDate   End date (YYYY-MM-DD), exclusive
     * @param interval  Data interval (e.g., "1d", "1wk", "1mo")
     * @return StockInfo, or nullptr on network or parse failure
     */
    [[nodiscard]] static std::shared_ptr<StockInfo> fetch(const std::string& ticker, const std::string& startDate,
                                                          const std::string& endDate,
                                                          const std::string& interval = "1d");

    /**
     * @brief Load "date,open,high,low,close,volume" rows (header line required).
     *
     * date is YYYY-MM-DD or unix seconds. Rows with a missing or non-positive
     * close are skipped.
     *
     * @return StockInfo, or nullptr if the file cannot be read or has no rows
     */
    [[nodiscard]] static std::shared_ptr<StockInfo> loadCsv(const std::string& path);

    /**
     * @brief Parse the Yahoo chart API document.
     *        Bars with a null close are dropped.
     * @return StockInfo, or nullptr if the document has no chart result
     */
    [[nodiscard]] static std::shared_ptr<StockInfo> parseChart(const std::string& ticker, const std::string& body);

    /**
     * @brief YYYY-MM-DD (UTC midnight) to unix seconds; -1 if malformed.
     */
    [[nodiscard]] static int64_t toUnixTime(const std::string& date);

   private:
    static constexpr std::string_view url_base_ = "https://query1.finance.yahoo.com/v8/finance/chart/";

    [[nodiscard]] static std::string fetchUrl(const std::string& url);

    static std::size_t write(void* contents, std::size_t size, std::size_t nmemb, void* userp);
};
