// LevelForge Generation Tests
// rng_test.cpp - Seeded random stream

#include <gtest/gtest.h>

#include <levelforge/gen/rng.hpp>

#include <array>
#include <set>
#include <string>

namespace levelforge::gen {
namespace {

class RngTest : public ::testing::Test {};

// Test: Same seed produces the same sequence
TEST_F(RngTest, Deterministic) {
    Rng a(42);
    Rng b(42);
    for (int i = 0; i < 1000; ++i) {
        ASSERT_DOUBLE_EQ(a.next(), b.next()) << "Diverged at draw " << i;
    }
}

TEST_F(RngTest, DifferentSeedsDiverge) {
    Rng a(1);
    Rng b(2);
    int same = 0;
    for (int i = 0; i < 100; ++i) {
        if (a.next() == b.next()) {
            ++same;
        }
    }
    EXPECT_LT(same, 5);
}

TEST_F(RngTest, NextInUnitInterval) {
    Rng rng(7);
    for (int i = 0; i < 10000; ++i) {
        double value = rng.next();
        ASSERT_GE(value, 0.0);
        ASSERT_LT(value, 1.0);
    }
}

TEST_F(RngTest, BelowAndRangeBounds) {
    Rng rng(99);
    std::set<int32_t> seen;
    for (int i = 0; i < 2000; ++i) {
        int32_t value = rng.range(5, 11);
        ASSERT_GE(value, 5);
        ASSERT_LE(value, 11);
        seen.insert(value);

        int32_t small = rng.below(4);
        ASSERT_GE(small, 0);
        ASSERT_LT(small, 4);
    }
    // Both ends are reachable
    EXPECT_EQ(seen.size(), 7u);
}

// Test: Degenerate bounds return without consuming the stream
TEST_F(RngTest, DegenerateBounds) {
    Rng a(5);
    Rng b(5);
    EXPECT_EQ(a.below(0), 0);
    EXPECT_EQ(a.below(-3), 0);
    EXPECT_EQ(a.range(4, 2), 4);
    EXPECT_DOUBLE_EQ(a.next(), b.next());
}

TEST_F(RngTest, ChanceExtremes) {
    Rng rng(3);
    for (int i = 0; i < 100; ++i) {
        EXPECT_FALSE(rng.chance(0.0));
        EXPECT_TRUE(rng.chance(1.0));
    }
}

TEST_F(RngTest, PickFromArray) {
    constexpr std::array<const char*, 3> names = {"goblin", "orc", "rat"};
    Rng rng(11);
    std::set<std::string> picked;
    for (int i = 0; i < 200; ++i) {
        picked.insert(rng.pick(names));
    }
    EXPECT_EQ(picked.size(), names.size());
}

TEST_F(RngTest, MovePreservesStream) {
    Rng a(123);
    Rng reference(123);
    (void)a.next();
    (void)reference.next();

    Rng moved(std::move(a));
    EXPECT_EQ(moved.seed(), 123u);
    EXPECT_DOUBLE_EQ(moved.next(), reference.next());
}

}  // namespace
}  // namespace levelforge::gen
