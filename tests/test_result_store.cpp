#include "sweep/result_store.hpp"

#include <gtest/gtest.h>

#include <filesystem>
#include <fstream>
#include <iterator>
#include <string>

#include "fixtures.hpp"
#include "sweep/errors.hpp"
#include "sweep/sweep_identity.hpp"

namespace sweep {
namespace {

using testing_support::TempDir;

SweepIdentity identityFor(const std::string& ticker) {
    ParameterSpace space;
    space.declare("fast", BindingTarget::FastWindow, {5LL, 10LL});
    space.declare("slow", BindingTarget::SlowWindow, {20LL});
    ConstraintSet constraints(space);
    constraints.declareConstraint("fast_below_slow", "fast", "slow", "<");

    const nlohmann::json key = {{"data", {{"ticker", ticker}}}};
    return makeIdentity("ma_crossover", key, space, constraints, SamplingOptions{});
}

ResultSet sampleResults() {
    ResultSet results;

    SweepResult ok;
    ok.combination = Combination(std::vector<Combination::Entry>{{"fast", 5LL}, {"slow", 20LL}});
    ok.output      = {{"score", 61.5}, {"trades", 4}};
    results.add(ok);

    SweepResult bad;
    bad.combination = Combination(std::vector<Combination::Entry>{{"fast", 10LL}, {"slow", 20LL}});
    bad.status      = ResultStatus::Failure;
    bad.error       = "not enough data";
    results.add(bad);

    return results;
}

TEST(SweepIdentityTest, DigestFollowsDeclarations) {
    const auto spy = identityFor("SPY");
    EXPECT_EQ(spy, identityFor("SPY"));
    EXPECT_EQ(spy.digest.size(), 16U);
    EXPECT_EQ(spy.stem(), "ma_crossover-" + spy.digest);

    const auto qqq = identityFor("QQQ");
    EXPECT_NE(spy.digest, qqq.digest);
}

TEST(SweepIdentityTest, Fnv1aKnownValues) {
    EXPECT_EQ(fnv1aHex(""), "cbf29ce484222325");
    EXPECT_EQ(fnv1aHex("a"), "af63dc4c8601ec8c");
}

TEST(ResultSetTest, RejectsDuplicateCombination) {
    auto        results = sampleResults();
    SweepResult again;
    again.combination = results.results().front().combination;
    EXPECT_THROW(results.add(again), std::invalid_argument);
    EXPECT_EQ(results.size(), 2U);
}

TEST(ResultSetTest, JsonPreservesRowsAndStatus) {
    const auto results = sampleResults();
    const auto doc     = results.toJson();

    EXPECT_EQ(doc["status"], "complete");
    ASSERT_EQ(doc["results"].size(), 2U);
    EXPECT_EQ(doc["results"][1]["status"], "failure");

    EXPECT_EQ(ResultSet::fromJson(doc), results);
    EXPECT_THROW((void)ResultSet::fromJson(nlohmann::json::array()), ConfigurationError);
}

TEST(FileResultStoreTest, MissingEntryLoadsNothing) {
    TempDir         dir("store_missing");
    FileResultStore store(dir.str());
    EXPECT_FALSE(store.load(identityFor("SPY")).has_value());
}

TEST(FileResultStoreTest, SaveThenLoad) {
    TempDir         dir("store_roundtrip");
    FileResultStore store((dir.path() / "nested").string());
    const auto      identity = identityFor("SPY");
    const auto      results  = sampleResults();

    store.save(identity, results);
    EXPECT_TRUE(std::filesystem::exists(store.pathFor(identity)));

    const auto loaded = store.load(identity);
    ASSERT_TRUE(loaded.has_value());
    EXPECT_EQ(*loaded, results);

    // No temporary files remain next to the entry.
    std::size_t files = 0;
    for (const auto& entry : std::filesystem::directory_iterator(dir.path() / "nested")) {
        (void)entry;
        ++files;
    }
    EXPECT_EQ(files, 1U);
}

TEST(FileResultStoreTest, SaveReplacesPreviousEntry) {
    TempDir         dir("store_replace");
    FileResultStore store(dir.str());
    const auto      identity = identityFor("SPY");

    store.save(identity, ResultSet(SweepStatus::Empty));
    store.save(identity, sampleResults());

    const auto loaded = store.load(identity);
    ASSERT_TRUE(loaded.has_value());
    EXPECT_EQ(loaded->size(), 2U);
    EXPECT_EQ(loaded->status(), SweepStatus::Complete);
}

TEST(FileResultStoreTest, ForeignIdentityIsIgnored) {
    TempDir         dir("store_foreign");
    FileResultStore store(dir.str());
    const auto      spy = identityFor("SPY");
    store.save(spy, sampleResults());

    // Same file name, different sweep.
    auto impostor   = identityFor("QQQ");
    impostor.digest = spy.digest;
    EXPECT_EQ(store.pathFor(impostor), store.pathFor(spy));
    EXPECT_FALSE(store.load(impostor).has_value());
}

TEST(FileResultStoreTest, MalformedEntryIsPersistenceError) {
    TempDir         dir("store_malformed");
    FileResultStore store(dir.str());
    const auto      identity = identityFor("SPY");

    {
        std::ofstream out(store.pathFor(identity));
        out << "{ \"identity\": ";
    }
    EXPECT_THROW((void)store.load(identity), PersistenceError);
}

TEST(FileResultStoreTest, UnusableDirectoryIsPersistenceError) {
    TempDir    dir("store_blocked");
    const auto blocker = dir.path() / "blocker";
    {
        std::ofstream out(blocker.string());
        out << "not a directory";
    }

    FileResultStore store(blocker.string());
    EXPECT_THROW(store.save(identityFor("SPY"), sampleResults()), PersistenceError);
}

TEST(FileResultStoreTest, FailedSaveLeavesNoTemporaryFiles) {
    TempDir         dir("store_failed");
    FileResultStore store(dir.str());
    const auto      identity = identityFor("SPY");

    // A non-empty directory at the entry path makes the final rename fail.
    std::filesystem::create_directories(std::filesystem::path(store.pathFor(identity)) / "occupied");
    EXPECT_THROW(store.save(identity, sampleResults()), PersistenceError);

    std::size_t files = 0;
    for (const auto& entry : std::filesystem::directory_iterator(dir.path())) {
        EXPECT_TRUE(entry.is_directory()) << entry.path();
        ++files;
    }
    EXPECT_EQ(files, 1U);
}

TEST(WriteFileAtomicallyTest, ReplacesContentsWithoutLeftovers) {
    TempDir    dir("atomic_write");
    const auto path = (dir.path() / "entry.json").string();

    writeFileAtomically(path, "first\n");
    writeFileAtomically(path, "second\n");

    std::ifstream in(path);
    std::string   text((std::istreambuf_iterator<char>(in)), std::istreambuf_iterator<char>());
    EXPECT_EQ(text, "second\n");

    std::size_t files = 0;
    for (const auto& entry : std::filesystem::directory_iterator(dir.path())) {
        EXPECT_EQ(entry.path().filename().string(), "entry.json");
        ++files;
    }
    EXPECT_EQ(files, 1U);
}

TEST(WriteFileAtomicallyTest, MissingDirectoryIsPersistenceError) {
    TempDir    dir("atomic_missing");
    const auto path = (dir.path() / "absent" / "entry.json").string();

    EXPECT_THROW(writeFileAtomically(path, "x"), PersistenceError);
    EXPECT_FALSE(std::filesystem::exists(path));
}

TEST(FileResultStoreTest, InvalidUtf8IsStoredWithReplacementCharacter) {
    TempDir         dir("store_utf8");
    FileResultStore store(dir.str());
    const auto      identity = identityFor("SPY");

    ResultSet   results;
    SweepResult bad;
    bad.combination = Combination(std::vector<Combination::Entry>{{"fast", 5LL}, {"slow", 20LL}});
    bad.status      = ResultStatus::Failure;
    bad.error       = "bad \xff byte";
    results.add(bad);

    ASSERT_NO_THROW(store.save(identity, results));

    const auto loaded = store.load(identity);
    ASSERT_TRUE(loaded.has_value());
    ASSERT_EQ(loaded->size(), 1U);
    EXPECT_EQ(loaded->results()[0].error, "bad \xEF\xBF\xBD byte");
}

}  // namespace
}  // namespace sweep
