#include "sweep/report.hpp"

#include <gtest/gtest.h>

#include <fstream>
#include <sstream>
#include <string>
#include <vector>

#include "fixtures.hpp"

namespace sweep {
namespace {

using testing_support::TempDir;

std::string slurp(const std::string& path) {
    std::ifstream     in(path);
    std::stringstream buffer;
    buffer << in.rdbuf();
    return buffer.str();
}

TEST(ReportTest, WritesOneRowPerResult) {
    ResultSet results;

    SweepResult ok;
    ok.combination = Combination(std::vector<Combination::Entry>{{"fast", 5LL}, {"slow", 20LL}});
    ok.output      = {{"score", 61.5}, {"trades", 4}, {"strategy", "a,b"}, {"equity", {1.0, 2.0}}};
    results.add(ok);

    SweepResult bad;
    bad.combination = Combination(std::vector<Combination::Entry>{{"fast", 10LL}, {"slow", 20LL}});
    bad.status      = ResultStatus::Failure;
    bad.error       = "not enough data";
    results.add(bad);

    TempDir    dir("report");
    const auto path = (dir.path() / "nested" / "out.csv").string();
    ASSERT_TRUE(writeCsv(path, results));

    EXPECT_EQ(slurp(path),
              "fast,slow,status,score,strategy,trades,error\n"
              "5,20,success,61.5,\"a,b\",4,\n"
              "10,20,failure,,,,not enough data\n");
}

TEST(ReportTest, UnwritablePathReturnsFalse) {
    TempDir    dir("report_blocked");
    const auto blocker = (dir.path() / "file").string();
    {
        std::ofstream out(blocker);
        out << "x";
    }
    EXPECT_FALSE(writeCsv(blocker + "/out.csv", ResultSet()));
}

}  // namespace
}  // namespace sweep
