#include "test.hpp"

#include <vector>

#include "lc/core/util/Random.hpp"

TEST(Random, SameSeedSameSequence)
{
    lc::Random a(1234);
    lc::Random b(1234);
    for (int i = 0; i < 100; ++i) {
        EXPECT_EQ(a.randInt(1000), b.randInt(1000));
    }
}

TEST(Random, DifferentSeedsDiverge)
{
    lc::Random a(1);
    lc::Random b(2);
    int same = 0;
    for (int i = 0; i < 64; ++i) {
        if (a.randInt(1u << 20) == b.randInt(1u << 20)) ++same;
    }
    EXPECT_LT(same, 4);
}

TEST(Random, ZeroSeedIsUsable)
{
    lc::Random a(0);
    lc::Random b(1);
    // zero is remapped to 1
    EXPECT_EQ(a.randInt(1000000), b.randInt(1000000));
}

TEST(Random, RandIntStaysInRangeAndCoversIt)
{
    lc::Random rng(99);
    std::vector<int> hits(7, 0);
    for (int i = 0; i < 7000; ++i) {
        size_t v = rng.randInt(7);
        ASSERT_TRUE(v < 7);
        ++hits[v];
    }
    for (int h : hits) {
        EXPECT_GT(h, 700);
    }
}

TEST(Random, RandIntOfZeroIsZero)
{
    lc::Random rng(5);
    EXPECT_EQ(rng.randInt(0), size_t(0));
}

TEST(Random, RandDoubleInUnitInterval)
{
    lc::Random rng(7);
    for (int i = 0; i < 1000; ++i) {
        double v = rng.randDouble();
        EXPECT_GE(v, 0.0);
        EXPECT_LT(v, 1.0);
    }
    double w = rng.randDouble(-2.0, -1.0);
    EXPECT_GE(w, -2.0);
    EXPECT_LT(w, -1.0);
}
