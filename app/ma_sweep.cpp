#include <algorithm>
#include <csignal>
#include <functional>
#include <iomanip>
#include <iostream>
#include <memory>
#include <string>
#include <utility>
#include <vector>

#include <unistd.h>

#include <nlohmann/json.hpp>

#include "backtest/strategy_evaluator.hpp"
#include "market_data.hpp"
#include "sweep/errors.hpp"
#include "sweep/report.hpp"
#include "sweep/result_store.hpp"
#include "sweep/sweep.hpp"

struct Defer {
    std::function<void()> f;
    explicit Defer(std::function<void()> f)
        : f(std::move(f)) {}
    ~Defer() {
        if (f) {
            f();
        }
    }
};

/**
 * @brief Resolve a path relative to the project root.
 *        e.g., if exe is /foo/build/app/ma_sweep,
 *        resolveFromExe("config/x.json") → /foo/config/x.json
 */
static std::string resolveFromExe(const std::string& relativePath) {
    char    buf[4096];
    ssize_t len = readlink("/proc/self/exe", buf, sizeof(buf) - 1);
    if (len <= 0) {
        return relativePath;  // fallback
    }
    buf[len] = '\0';
    std::string exePath(buf);

    // Walk up from exe dir to project root (exe is in build/app/)
    for (int i = 0; i < 3; ++i) {
        auto pos = exePath.rfind('/');
        if (pos == std::string::npos) {
            return relativePath;
        }
        exePath = exePath.substr(0, pos);
    }
    return exePath + "/" + relativePath;
}

static sweep::CancellationToken g_cancel;

extern "C" void onInterrupt(int /* signum */) {
    g_cancel.cancel();
}

/**
 * @brief Load prices from "data.csv" or fetch "data.ticker" from Yahoo Finance.
 */
static std::shared_ptr<StockInfo> loadPrices(const nlohmann::json& doc) {
    if (!doc.contains("data") || !doc["data"].is_object()) {
        std::cerr << "Error: config has no 'data' section." << std::endl;
        return nullptr;
    }
    const auto& data = doc["data"];

    if (data.contains("csv")) {
        const auto path = data["csv"].get<std::string>();
        std::cerr << "Loading prices from " << path << "..." << std::endl;
        return MarketData::loadCsv(path);
    }

    const auto ticker   = data.value("ticker", std::string("SPY"));
    const auto start    = data.value("start", std::string("2019-01-01"));
    const auto end      = data.value("end", std::string("2024-01-01"));
    const auto interval = data.value("interval", std::string("1d"));

    MarketData::init();
    Defer _cleanup([] { MarketData::close(); });

    std::cerr << "Fetching " << ticker << " (" << start << " ~ " << end << ", " << interval << ")..." << std::endl;
    return MarketData::fetch(ticker, start, end, interval);
}

static double scoreOf(const sweep::SweepResult& r) {
    return r.output.value("score", 0.0);
}

static void printRanking(const sweep::ResultSet& results, std::size_t top) {
    std::vector<const sweep::SweepResult*> rows;
    for (const auto& r : results) {
        if (r.ok()) {
            rows.push_back(&r);
        }
    }
    std::stable_sort(rows.begin(), rows.end(),
                     [](const sweep::SweepResult* a, const sweep::SweepResult* b) { return scoreOf(*a) > scoreOf(*b); });
    if (top > 0 && rows.size() > top) {
        rows.resize(top);
    }

    const int paramsW = 30;

    std::clog << std::endl;
    std::clog << "=== Ranking (" << results.successCount() << " ok, " << results.failureCount() << " failed, "
              << sweep::toString(results.status()) << ") ===" << std::endl;
    std::clog << std::endl;

    // clang-format off
    std::clog << std::left
        << std::setw(6) << "Rank"
        << std::setw(paramsW) << "Parameters"
        << std::right
        << std::setw(12) << "Return"
        << std::setw(10) << "Sharpe"
        << std::setw(10) << "MaxDD"
        << std::setw(8) << "Trades"
        << std::setw(10) << "Score"
        << std::endl;
    // clang-format on
    std::clog << std::string(86, '-') << std::endl;

    for (std::size_t i = 0; i < rows.size(); ++i) {
        const auto& out = rows[i]->output;
        // clang-format off
        std::clog << std::left
            << std::setw(6) << ("#" + std::to_string(i + 1))
            << std::setw(paramsW) << rows[i]->combination.toString()
            << std::right << std::fixed
            << std::setprecision(2) << std::setw(11) << out.value("total_return_pct", 0.0) << "%"
            << std::setprecision(2) << std::setw(10) << out.value("sharpe_ratio", 0.0)
            << std::setprecision(1) << std::setw(9) << out.value("max_drawdown_pct", 0.0) << "%"
            << std::setw(8) << out.value("trades", 0)
            << std::setprecision(1) << std::setw(10) << out.value("score", 0.0)
            << std::endl;
        // clang-format on
    }
    std::clog << std::endl;
}

int main(int argc, char* argv[]) {
    std::string configPath = resolveFromExe("config/ma_sweep.json");
    if (argc > 1) {
        configPath = argv[1];
    }

    /* ---- Load sweep config ---- */
    nlohmann::json     doc;
    sweep::SweepConfig cfg;
    BacktestSettings   settings;
    try {
        doc = sweep::readConfigFile(configPath);
        cfg = sweep::parseSweepConfig(doc);

        settings.initialCapital = doc.value("/backtest/initial_capital"_json_pointer, settings.initialCapital);
        settings.commissionPct  = doc.value("/backtest/commission_pct"_json_pointer, settings.commissionPct);
    } catch (const std::exception& e) {
        std::cerr << "Error: " << e.what() << std::endl;
        return 1;
    }
    if (settings.initialCapital <= 0.0 || settings.commissionPct < 0.0 || settings.commissionPct >= 1.0) {
        std::cerr << "Error: initial_capital must be positive and commission_pct in [0, 1)." << std::endl;
        return 1;
    }

    /* ---- Declare the sweep before spending anything on data ---- */
    std::unique_ptr<sweep::Sweep> runner;
    try {
        runner = std::make_unique<sweep::Sweep>(cfg);
    } catch (const sweep::ConfigurationError& e) {
        std::cerr << "Error: " << e.what() << std::endl;
        return 1;
    }

    sweep::FileResultStore store(doc.value("/store/directory"_json_pointer, std::string("results")));

    /* ---- A stored sweep needs no data and no evaluator ---- */
    sweep::SweepReport report;
    try {
        if (auto hit = runner->cached(store)) {
            report = std::move(*hit);
        }
    } catch (const sweep::PersistenceError& e) {
        std::cerr << "Error: " << e.what() << std::endl;
        return 1;
    }

    if (!report.fromCache) {
        const auto prices = loadPrices(doc);
        if (!prices || prices->empty()) {
            std::cerr << "Error: No price data available." << std::endl;
            return 1;
        }
        std::cerr << "  [OK] " << prices->ticker << " (" << prices->size() << " bars)" << std::endl;

        std::unique_ptr<StrategyEvaluator> evaluator;
        try {
            evaluator = std::make_unique<StrategyEvaluator>(cfg.strategy, runner->space(), prices, settings);
        } catch (const sweep::ConfigurationError& e) {
            std::cerr << "Error: " << e.what() << std::endl;
            return 1;
        }

        /* ---- Run ---- */
        std::signal(SIGINT, onInterrupt);
        std::signal(SIGTERM, onInterrupt);

        runner->setProgressCallback([](std::size_t done, std::size_t total) {
            const auto step = total < 10 ? 1 : total / 10;
            if (done % step == 0 || done == total) {
                std::clog << "  " << done << "/" << total << " evaluated" << std::endl;
            }
        });

        try {
            report = runner->run(*evaluator, &store, &g_cancel);
        } catch (const sweep::PersistenceError& e) {
            std::cerr << "Error: " << e.what() << std::endl;
            return 1;
        }
    }

    /* =============== OUTPUT =============== */

    if (report.results.status() == sweep::SweepStatus::Empty) {
        std::clog << "No parameter combination satisfies the constraints." << std::endl;
        return 0;
    }

    printRanking(report.results, doc.value("/report/top"_json_pointer, std::size_t{10}));

    const auto csvPath = doc.value("/report/csv"_json_pointer, std::string());
    if (!csvPath.empty()) {
        if (!sweep::writeCsv(csvPath, report.results)) {
            return 1;
        }
        std::clog << "Report written: " << csvPath << std::endl;
    }

    if (report.results.status() == sweep::SweepStatus::Incomplete) {
        std::cerr << "Sweep cancelled after " << report.results.size() << " of " << report.combinations
                  << " combinations; partial results were not cached." << std::endl;
        return 2;
    }
    return 0;
}
