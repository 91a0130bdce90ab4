#include "sweep/constraint_set.hpp"

#include <gtest/gtest.h>

#include <string>

#include "sweep/errors.hpp"

namespace sweep {
namespace {

class ConstraintSetTest: public ::testing::Test {
   protected:
    void SetUp() override {
        space.declare("fast", BindingTarget::FastWindow, {1LL, 2LL, 3LL});
        space.declare("slow", BindingTarget::SlowWindow, {2LL, 3LL});
        space.declare("kind", BindingTarget::AverageKind, {std::string("sma"), std::string("ema")});
    }

    ParameterSpace space;
};

Combination combo(long long fast, long long slow, const std::string& kind = "sma") {
    return Combination({{"fast", fast}, {"slow", slow}, {"kind", kind}});
}

TEST(RelationTest, ParsesOperators) {
    EXPECT_EQ(relationFromString("<"), Relation::Less);
    EXPECT_EQ(relationFromString("<="), Relation::LessEqual);
    EXPECT_EQ(relationFromString(">"), Relation::Greater);
    EXPECT_EQ(relationFromString(">="), Relation::GreaterEqual);
    EXPECT_EQ(relationFromString("="), Relation::Equal);
    EXPECT_EQ(relationFromString("=="), Relation::Equal);
    EXPECT_THROW((void)relationFromString("!="), ConfigurationError);
    EXPECT_THROW((void)relationFromString(""), ConfigurationError);
}

TEST(RelationTest, Holds) {
    EXPECT_TRUE(holds(Relation::Less, 1LL, 2LL));
    EXPECT_FALSE(holds(Relation::Less, 2LL, 2LL));
    EXPECT_TRUE(holds(Relation::LessEqual, 2LL, 2LL));
    EXPECT_TRUE(holds(Relation::Greater, 3.5, 3LL));
    EXPECT_TRUE(holds(Relation::GreaterEqual, 3LL, 3.0));
    EXPECT_TRUE(holds(Relation::Equal, std::string("ema"), std::string("ema")));
}

TEST_F(ConstraintSetTest, EmptySetAcceptsEverything) {
    ConstraintSet constraints(space);
    EXPECT_TRUE(constraints.empty());
    EXPECT_TRUE(constraints.isSatisfied(combo(3, 2)));
}

TEST_F(ConstraintSetTest, ConjunctionOfConstraints) {
    ConstraintSet constraints(space);
    constraints.declareConstraint("fast_below_slow", "fast", "slow", "<");
    constraints.declareConstraint("slow_at_least_fast_plus", "slow", "fast", Relation::Greater);

    ASSERT_EQ(constraints.size(), 2U);
    EXPECT_TRUE(constraints.isSatisfied(combo(1, 2)));
    EXPECT_FALSE(constraints.isSatisfied(combo(2, 2)));
    EXPECT_FALSE(constraints.isSatisfied(combo(3, 2)));
}

TEST_F(ConstraintSetTest, RecordsDeclarationPositions) {
    ConstraintSet constraints(space);
    const auto&   c = constraints.declareConstraint("kind_vs_kind", "kind", "kind", "=");
    EXPECT_EQ(c.leftIndex, 2U);
    EXPECT_EQ(c.rightIndex, 2U);
    EXPECT_EQ(c.decidableAt(), 2U);

    const auto& d = constraints.declareConstraint("slow_gt_fast", "slow", "fast", ">");
    EXPECT_EQ(d.decidableAt(), 1U);
}

TEST_F(ConstraintSetTest, RejectsUnknownDistributions) {
    ConstraintSet constraints(space);
    EXPECT_THROW(constraints.declareConstraint("c", "fast", "volume", "<"), ConfigurationError);
    EXPECT_THROW(constraints.declareConstraint("c", "volume", "fast", "<"), ConfigurationError);
    EXPECT_TRUE(constraints.empty());
}

TEST_F(ConstraintSetTest, RejectsBadDeclarations) {
    ConstraintSet constraints(space);
    constraints.declareConstraint("c", "fast", "slow", "<");

    EXPECT_THROW(constraints.declareConstraint("c", "fast", "slow", "<="), ConfigurationError);
    EXPECT_THROW(constraints.declareConstraint("", "fast", "slow", "<"), ConfigurationError);
    EXPECT_THROW(constraints.declareConstraint("d", "fast", "slow", "<>"), ConfigurationError);
    EXPECT_THROW(constraints.declareConstraint("e", "fast", "kind", "<"), ConfigurationError);
    EXPECT_EQ(constraints.size(), 1U);
}

TEST_F(ConstraintSetTest, PrefixCheckOnlyAppliesDecidableConstraints) {
    ConstraintSet constraints(space);
    constraints.declareConstraint("fast_below_slow", "fast", "slow", "<");

    const ParamValue fast = 3LL;
    const ParamValue slow = 2LL;

    std::vector<const ParamValue*> bound = {&fast, nullptr, nullptr};
    EXPECT_TRUE(constraints.isSatisfiedPrefix(bound, 0));

    bound[1] = &slow;
    EXPECT_FALSE(constraints.isSatisfiedPrefix(bound, 1));
}

}  // namespace
}  // namespace sweep
