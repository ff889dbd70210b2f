#include <gtest/gtest.h>

#include "dt/session/tuning.hpp"

namespace dt {
namespace {

using session::tuning;

TEST(TuningTest, FreshStartsAtNeutral) {
    auto t = tuning::fresh("chill lo-fi beats");
    EXPECT_EQ(t.description, "chill lo-fi beats");
    EXPECT_EQ(t.energy, 0);
    ASSERT_EQ(t.directions.size(), 1u);
    EXPECT_EQ(t.directions[0], "chill lo-fi beats");
}

TEST(TuningTest, TuneAppendsDirection) {
    auto t = tuning::fresh("chill lo-fi beats");
    t.tune("more jazzy");

    EXPECT_EQ(t.description, "more jazzy");
    ASSERT_EQ(t.directions.size(), 2u);
    EXPECT_EQ(t.directions[1], "more jazzy");
}

TEST(TuningTest, DialUpThenDownRestores) {
    for (int start = session::min_energy; start < session::max_energy; ++start) {
        tuning t;
        t.energy = start;
        t.dial(+1);
        t.dial(-1);
        EXPECT_EQ(t.energy, start);
    }
}

TEST(TuningTest, DialStaysInBounds) {
    tuning t;
    for (int i = 0; i < 5; ++i) {
        t.dial(+1);
    }
    EXPECT_EQ(t.energy, session::max_energy);

    for (int i = 0; i < 10; ++i) {
        t.dial(-1);
    }
    EXPECT_EQ(t.energy, session::min_energy);
    EXPECT_EQ(t.dial(-1), session::min_energy);
}

TEST(TuningTest, RadioQueryCarriesEnergyModifier) {
    EXPECT_EQ(session::build_radio_query("lo-fi", 0), "lo-fi");
    EXPECT_EQ(session::build_radio_query("lo-fi", 1), "lo-fi upbeat energetic");
    EXPECT_EQ(session::build_radio_query("lo-fi", -2), "lo-fi slow ambient calm relaxing");
    EXPECT_EQ(session::build_radio_query("lo-fi", 2), "lo-fi hype intense bangers high energy");
}

TEST(TuningTest, Equality) {
    auto a = tuning::fresh("x");
    auto b = tuning::fresh("x");
    EXPECT_EQ(a, b);
    b.dial(1);
    EXPECT_NE(a, b);
}

}  // namespace
}  // namespace dt
