#include <gtest/gtest.h>

#include <memory>

#include "dt/session/controller.hpp"
#include "dt/stations/preset_store.hpp"
#include "dt/stations/station_ops.hpp"
#include "test_helpers/fake_catalog.h"
#include "test_helpers/fake_driver.h"

namespace dt {
namespace {

using session::errc;
using session::mode;
using session::session_controller;
using test::make_track;

const dpp::snowflake kGuild = 77;

class StationOpsTest : public ::testing::Test {
protected:
    test::fake_catalog                  catalog;
    test::fake_driver                   driver;
    stations::preset_store              store{"", null_sink()};
    std::unique_ptr<session_controller> session;

    void SetUp() override {
        for (int i = 0; i < 10; ++i) {
            catalog.pool.push_back(make_track("r" + std::to_string(i), "Radio Song " + std::to_string(i)));
        }
        session::collaborators deps{catalog, driver, null_sink(), {}, {}, {}};
        session = std::make_unique<session_controller>(kGuild, deps);
    }
};

TEST_F(StationOpsTest, SaveNeedsRadio) {
    auto r = stations::save_station(*session, store, kGuild, "study");
    EXPECT_EQ(r.code, errc::not_in_radio);
    EXPECT_TRUE(store.list(kGuild).empty());
}

TEST_F(StationOpsTest, LoadMissingStation) {
    auto r = stations::load_station(*session, store, kGuild, "nothing");
    EXPECT_EQ(r.code, errc::preset_not_found);
    EXPECT_EQ(session->current_mode(), mode::idle);
}

TEST_F(StationOpsTest, LoadWhileBusyIsModeConflict) {
    store.save(kGuild, "study", session::tuning::fresh("lo-fi"));
    ASSERT_TRUE(session->start_autoplay("Some Artist").ok());

    EXPECT_EQ(stations::load_station(*session, store, kGuild, "study").code, errc::mode_conflict);
    EXPECT_EQ(session->current_mode(), mode::autoplay);
}

TEST_F(StationOpsTest, DeleteTwice) {
    store.save(kGuild, "study", session::tuning::fresh("lo-fi"));

    EXPECT_TRUE(stations::delete_station(store, kGuild, "Study").ok());
    EXPECT_EQ(stations::delete_station(store, kGuild, "study").code, errc::preset_not_found);
}

TEST_F(StationOpsTest, TuneSaveStopLoadRoundTrip) {
    ASSERT_TRUE(session->start_radio("chill lo-fi beats").ok());
    ASSERT_TRUE(session->dial(+1).ok());
    ASSERT_TRUE(session->tune("more jazzy").ok());

    const auto before_static = session->current_track()->id;
    ASSERT_TRUE(session->apply_static().ok());
    EXPECT_NE(session->current_track()->id, before_static);

    ASSERT_TRUE(stations::save_station(*session, store, kGuild, "Study").ok());
    const auto saved = session->tuning_snapshot();
    ASSERT_TRUE(saved.has_value());

    ASSERT_TRUE(session->stop_radio().ok());
    EXPECT_EQ(session->current_mode(), mode::idle);

    ASSERT_TRUE(stations::load_station(*session, store, kGuild, "study").ok());
    EXPECT_EQ(session->current_mode(), mode::radio);

    const auto restored = session->tuning_snapshot();
    ASSERT_TRUE(restored.has_value());
    EXPECT_EQ(restored->description, "more jazzy");
    EXPECT_EQ(restored->energy, 1);
    EXPECT_EQ(restored->directions, (std::vector<std::string>{"chill lo-fi beats", "more jazzy"}));
    EXPECT_EQ(*restored, *saved);

    // A loaded station starts a fresh history.
    EXPECT_EQ(session->history().size(), 1u);
    EXPECT_EQ(session->signal()->elapsed_tracks, 1u);
}

}  // namespace
}  // namespace dt
