#include <gtest/gtest.h>

#include <chrono>
#include <memory>
#include <set>
#include <vector>

#include "dt/session/controller.hpp"
#include "test_helpers/fake_catalog.h"
#include "test_helpers/fake_driver.h"

namespace dt {
namespace {

using session::errc;
using session::mode;
using session::notice_kind;
using session::session_clock;
using session::session_controller;
using test::make_track;

const dpp::snowflake kGuild = 1234;

class ControllerTest : public ::testing::Test {
protected:
    test::fake_catalog                   catalog;
    test::fake_driver                    driver;
    std::vector<session::session_notice> notices;
    session_clock::time_point            now = session_clock::time_point{} + std::chrono::hours(1000);
    std::uint64_t                        generation = 0;

    std::unique_ptr<session_controller> session;

    void SetUp() override {
        session::collaborators deps{
            catalog,
            driver,
            null_sink(),
            [this](const session::session_notice& n) { notices.push_back(n); },
            [this] { return now; },
            [this] { return generation; },
        };
        session = std::make_unique<session_controller>(kGuild, deps);
    }

    void finish_current() {
        ASSERT_TRUE(session->current_track().has_value());
        session->on_track_finished(session->current_track()->id);
    }

    std::string current_id() const {
        return session->current_track() ? session->current_track()->id : std::string();
    }

    void fill_pool(int n) {
        catalog.pool.clear();
        for (int i = 0; i < n; ++i) {
            const auto id = "r" + std::to_string(i);
            catalog.pool.push_back(make_track(id, "Radio Song " + std::to_string(i)));
        }
    }
};

// ---------- Manual queue ----------

TEST_F(ControllerTest, PlayStartsImmediatelyWhenIdle) {
    catalog.answer_search("alpha", {make_track("a", "Alpha")});

    auto r = session->play("alpha");
    EXPECT_TRUE(r.ok()) << r.message;
    EXPECT_EQ(session->current_mode(), mode::manual);
    EXPECT_EQ(current_id(), "a");
    ASSERT_EQ(driver.started.size(), 1u);
    EXPECT_EQ(driver.started[0], "a");
}

TEST_F(ControllerTest, PlaylistQueuesTheRest) {
    catalog.answer_search("list", {make_track("a", "Alpha"), make_track("b", "Bravo"), make_track("c", "Charlie")});

    ASSERT_TRUE(session->play("list").ok());
    EXPECT_EQ(current_id(), "a");
    EXPECT_EQ(session->queued(), 2u);
}

TEST_F(ControllerTest, QueuePlaysInRequestOrder) {
    catalog.answer_search("alpha", {make_track("a", "Alpha")});
    catalog.answer_search("bravo", {make_track("b", "Bravo")});
    catalog.answer_search("charlie", {make_track("c", "Charlie")});

    ASSERT_TRUE(session->play("alpha").ok());
    ASSERT_TRUE(session->play("bravo").ok());
    ASSERT_TRUE(session->play("charlie").ok());
    EXPECT_EQ(session->queued(), 2u);

    finish_current();
    EXPECT_EQ(current_id(), "b");
    finish_current();
    EXPECT_EQ(current_id(), "c");
    finish_current();

    EXPECT_EQ(session->current_mode(), mode::idle);
    EXPECT_FALSE(session->current_track().has_value());
    EXPECT_EQ(driver.started, (std::vector<std::string>{"a", "b", "c"}));
    ASSERT_FALSE(notices.empty());
    EXPECT_EQ(notices.back().kind, notice_kind::session_ended);
}

TEST_F(ControllerTest, PlayWithNoResults) {
    auto r = session->play("nothing matches this");
    EXPECT_EQ(r.code, errc::not_found);
    EXPECT_EQ(session->current_mode(), mode::idle);
    EXPECT_TRUE(driver.started.empty());
}

TEST_F(ControllerTest, PlayWhenCatalogIsDown) {
    catalog.unavailable = true;
    auto r = session->play("alpha");
    EXPECT_EQ(r.code, errc::catalog_unavailable);
    EXPECT_EQ(session->current_mode(), mode::idle);
}

TEST_F(ControllerTest, SkipAdvancesQueue) {
    catalog.answer_search("list", {make_track("a", "Alpha"), make_track("b", "Bravo")});
    ASSERT_TRUE(session->play("list").ok());

    EXPECT_TRUE(session->skip().ok());
    EXPECT_EQ(current_id(), "b");
    EXPECT_EQ(session->queued(), 0u);
}

TEST_F(ControllerTest, SkipOnEmptyQueueStopsPlayback) {
    catalog.answer_search("alpha", {make_track("a", "Alpha")});
    ASSERT_TRUE(session->play("alpha").ok());

    auto r = session->skip();
    EXPECT_EQ(r.code, errc::empty_queue);
    EXPECT_EQ(session->current_mode(), mode::idle);
    EXPECT_FALSE(session->current_track().has_value());
    EXPECT_EQ(driver.halts, 1);
}

TEST_F(ControllerTest, SkipWhenIdle) {
    EXPECT_EQ(session->skip().code, errc::not_playing);
}

TEST_F(ControllerTest, PauseAndResume) {
    EXPECT_EQ(session->pause().code, errc::not_playing);

    catalog.answer_search("alpha", {make_track("a", "Alpha")});
    ASSERT_TRUE(session->play("alpha").ok());

    EXPECT_TRUE(session->pause().ok());
    EXPECT_TRUE(session->paused());
    EXPECT_TRUE(session->resume().ok());
    EXPECT_FALSE(session->paused());
    EXPECT_EQ(driver.pauses, 1);
    EXPECT_EQ(driver.resumes, 1);
}

TEST_F(ControllerTest, RefusedPauseKeepsState) {
    catalog.answer_search("alpha", {make_track("a", "Alpha")});
    ASSERT_TRUE(session->play("alpha").ok());
    driver.accept_pause = false;

    EXPECT_EQ(session->pause().code, errc::playback_failure);
    EXPECT_FALSE(session->paused());
}

TEST_F(ControllerTest, ViewQueueIsLimited) {
    std::vector<catalog::track> tracks;
    for (int i = 0; i < 15; ++i) {
        tracks.push_back(make_track("t" + std::to_string(i), "Track " + std::to_string(i)));
    }
    catalog.answer_search("many", tracks);
    ASSERT_TRUE(session->play("many").ok());

    auto view = session->view_queue(10);
    ASSERT_TRUE(view.now_playing.has_value());
    EXPECT_EQ(view.now_playing->id, "t0");
    EXPECT_EQ(view.up_next.size(), 10u);
    EXPECT_EQ(view.up_next.front().id, "t1");
    EXPECT_EQ(view.total, 14u);
    EXPECT_EQ(session->queued(), 14u);
}

TEST_F(ControllerTest, StopClearsEverything) {
    catalog.answer_search("list", {make_track("a", "Alpha"), make_track("b", "Bravo")});
    ASSERT_TRUE(session->play("list").ok());

    EXPECT_TRUE(session->stop().ok());
    EXPECT_EQ(session->current_mode(), mode::idle);
    EXPECT_EQ(session->queued(), 0u);
    EXPECT_TRUE(session->history().empty());
    EXPECT_EQ(driver.halts, 1);
}

// ---------- Mode conflicts ----------

TEST_F(ControllerTest, ModesExcludeEachOther) {
    fill_pool(5);
    ASSERT_TRUE(session->start_radio("chill lo-fi beats").ok());

    catalog.answer_search("alpha", {make_track("a", "Alpha")});
    EXPECT_EQ(session->play("alpha").code, errc::mode_conflict);
    EXPECT_EQ(session->start_autoplay("Artist").code, errc::mode_conflict);
    EXPECT_EQ(session->start_radio("something else").code, errc::mode_conflict);
    EXPECT_EQ(session->stop_autoplay().code, errc::not_in_autoplay);
    EXPECT_EQ(session->current_mode(), mode::radio);
}

TEST_F(ControllerTest, RadioCommandsNeedRadio) {
    EXPECT_EQ(session->tune("jazz").code, errc::not_in_radio);
    EXPECT_EQ(session->dial(1).code, errc::not_in_radio);
    EXPECT_EQ(session->apply_static().code, errc::not_in_radio);
    EXPECT_EQ(session->stop_radio().code, errc::not_in_radio);
    EXPECT_FALSE(session->signal().has_value());
    EXPECT_FALSE(session->tuning_snapshot().has_value());
}

TEST_F(ControllerTest, RadioRefusedWhileQueuePlays) {
    catalog.answer_search("alpha", {make_track("a", "Alpha")});
    ASSERT_TRUE(session->play("alpha").ok());
    fill_pool(3);

    EXPECT_EQ(session->start_radio("lo-fi").code, errc::mode_conflict);
    EXPECT_EQ(session->current_mode(), mode::manual);
    EXPECT_EQ(current_id(), "a");
}

// ---------- Radio ----------

TEST_F(ControllerTest, RadioStartsFromDescription) {
    fill_pool(3);
    auto r = session->start_radio("chill lo-fi beats");
    EXPECT_TRUE(r.ok()) << r.message;
    EXPECT_EQ(session->current_mode(), mode::radio);
    EXPECT_EQ(current_id(), "r0");

    ASSERT_EQ(catalog.requests.size(), 1u);
    EXPECT_EQ(catalog.requests[0].description, "chill lo-fi beats");
    EXPECT_EQ(catalog.requests[0].energy, 0);
    EXPECT_FALSE(catalog.requests[0].seed.has_value());

    auto signal = session->signal();
    ASSERT_TRUE(signal.has_value());
    EXPECT_EQ(signal->description, "chill lo-fi beats");
    EXPECT_EQ(signal->elapsed_tracks, 1u);
    EXPECT_EQ(signal->direction_count, 1u);
}

TEST_F(ControllerTest, RadioNeverReplaysHistory) {
    fill_pool(4);
    // Re-upload of r1 under another id.
    catalog.pool.insert(catalog.pool.begin() + 2, make_track("r1-copy", "Radio Song 1 (Official Video)"));

    ASSERT_TRUE(session->start_radio("lo-fi").ok());
    for (int i = 0; i < 3; ++i) {
        finish_current();
    }

    EXPECT_EQ(driver.started, (std::vector<std::string>{"r0", "r1", "r2", "r3"}));

    // Nothing new left: radio keeps its tuning but stops playing.
    finish_current();
    EXPECT_EQ(session->current_mode(), mode::radio);
    EXPECT_FALSE(session->current_track().has_value());
    EXPECT_EQ(driver.started.size(), 4u);
    ASSERT_FALSE(notices.empty());
    EXPECT_EQ(notices.back().kind, notice_kind::selection_failed);
    EXPECT_TRUE(catalog.requests.back().widened);
}

TEST_F(ControllerTest, TuneRestartsSilentRadio) {
    fill_pool(1);
    ASSERT_TRUE(session->start_radio("lo-fi").ok());
    finish_current();
    ASSERT_FALSE(session->current_track().has_value());

    catalog.pool.push_back(make_track("jazz", "Smooth Jazz Song"));
    auto r = session->tune("jazz");
    EXPECT_TRUE(r.ok()) << r.message;
    EXPECT_EQ(current_id(), "jazz");
    EXPECT_EQ(session->signal()->description, "jazz");
    EXPECT_EQ(session->signal()->elapsed_tracks, 2u);
}

TEST_F(ControllerTest, FailedRestartKeepsOldTuning) {
    fill_pool(1);
    ASSERT_TRUE(session->start_radio("lo-fi").ok());
    finish_current();

    catalog.unavailable = true;
    EXPECT_EQ(session->tune("jazz").code, errc::catalog_unavailable);
    EXPECT_EQ(session->signal()->description, "lo-fi");
    EXPECT_EQ(session->signal()->direction_count, 1u);
}

TEST_F(ControllerTest, RadioFiltersNonSongs) {
    catalog.pool = {
        make_track("long", "Lo-fi 1 hour mix", 3600000),
        make_track("talk", "Producer interview"),
        make_track("song", "Actual Song"),
    };

    ASSERT_TRUE(session->start_radio("lo-fi").ok());
    EXPECT_EQ(current_id(), "song");
}

TEST_F(ControllerTest, RadioSeedsWithCurrentTrack) {
    fill_pool(4);
    ASSERT_TRUE(session->start_radio("lo-fi").ok());
    finish_current();

    ASSERT_EQ(catalog.requests.size(), 2u);
    ASSERT_TRUE(catalog.requests[1].seed.has_value());
    EXPECT_EQ(*catalog.requests[1].seed, "r0");
}

TEST_F(ControllerTest, TuneDropsSeedForNextSelection) {
    fill_pool(4);
    ASSERT_TRUE(session->start_radio("lo-fi").ok());
    ASSERT_TRUE(session->tune("more jazzy").ok());
    finish_current();

    const auto& request = catalog.requests.back();
    EXPECT_EQ(request.description, "more jazzy");
    EXPECT_FALSE(request.seed.has_value());

    // Seeding resumes once a track from the new direction plays.
    finish_current();
    ASSERT_TRUE(catalog.requests.back().seed.has_value());
}

TEST_F(ControllerTest, DialChangesEnergyWithinBounds) {
    fill_pool(4);
    ASSERT_TRUE(session->start_radio("lo-fi").ok());

    for (int i = 0; i < 4; ++i) {
        EXPECT_TRUE(session->dial(+1).ok());
    }
    EXPECT_EQ(session->signal()->energy, session::max_energy);

    EXPECT_TRUE(session->dial(-1).ok());
    EXPECT_EQ(session->signal()->energy, session::max_energy - 1);

    finish_current();
    EXPECT_EQ(catalog.requests.back().energy, session::max_energy - 1);
}

TEST_F(ControllerTest, StaticSkipsAndAvoidsCurrent) {
    fill_pool(4);
    ASSERT_TRUE(session->start_radio("lo-fi").ok());
    const auto skipped = current_id();

    auto r = session->apply_static();
    EXPECT_TRUE(r.ok()) << r.message;
    EXPECT_NE(current_id(), skipped);

    const auto& request = catalog.requests.back();
    EXPECT_EQ(request.avoid.count(skipped), 1u);
    EXPECT_FALSE(request.seed.has_value());

    // The avoid set only applies to that one selection.
    finish_current();
    EXPECT_TRUE(catalog.requests.back().avoid.empty());
}

TEST_F(ControllerTest, StaticAlsoSkipsReuploadOfAvoidedTrack) {
    fill_pool(1);
    ASSERT_TRUE(session->start_radio("lo-fi").ok());
    ASSERT_EQ(current_id(), "r0");

    catalog.pool = {make_track("r0-again", "Radio Song 0 (Official Video)"), make_track("r1", "Radio Song 1")};
    ASSERT_TRUE(session->apply_static().ok());
    EXPECT_EQ(current_id(), "r1");
    EXPECT_EQ(catalog.requests.back().avoid, (std::set<std::string>{"r0"}));
}

TEST_F(ControllerTest, FailedStaticLeavesRadioUntouched) {
    fill_pool(4);
    ASSERT_TRUE(session->start_radio("lo-fi").ok());
    const auto playing = current_id();
    catalog.unavailable = true;

    EXPECT_EQ(session->apply_static().code, errc::catalog_unavailable);
    EXPECT_EQ(current_id(), playing);
    EXPECT_EQ(session->signal()->elapsed_tracks, 1u);
    EXPECT_EQ(session->history().size(), 1u);
}

TEST_F(ControllerTest, RadioStartFailureStaysIdle) {
    catalog.unavailable = true;
    EXPECT_EQ(session->start_radio("lo-fi").code, errc::catalog_unavailable);
    EXPECT_EQ(session->current_mode(), mode::idle);
    EXPECT_FALSE(session->tuning_snapshot().has_value());

    catalog.unavailable = false;
    EXPECT_EQ(session->start_radio("lo-fi").code, errc::no_new_candidates);
    EXPECT_EQ(session->current_mode(), mode::idle);
}

TEST_F(ControllerTest, StopRadioReturnsToIdle) {
    fill_pool(3);
    ASSERT_TRUE(session->start_radio("lo-fi").ok());

    EXPECT_TRUE(session->stop_radio().ok());
    EXPECT_EQ(session->current_mode(), mode::idle);
    EXPECT_FALSE(session->tuning_snapshot().has_value());
    EXPECT_TRUE(session->history().empty());
}

TEST_F(ControllerTest, RadioEndsAfterWindow) {
    fill_pool(10);
    ASSERT_TRUE(session->start_radio("lo-fi").ok());

    now += std::chrono::minutes(119);
    finish_current();
    EXPECT_EQ(session->current_mode(), mode::radio);
    EXPECT_EQ(current_id(), "r1");
    ASSERT_TRUE(session->signal().has_value());
    EXPECT_EQ(session->signal()->remaining, std::chrono::minutes(1));

    now += std::chrono::minutes(2);
    finish_current();
    EXPECT_EQ(session->current_mode(), mode::idle);
    EXPECT_EQ(driver.started.size(), 2u);
    ASSERT_FALSE(notices.empty());
    EXPECT_EQ(notices.back().kind, notice_kind::session_ended);
    EXPECT_EQ(notices.back().text, "Radio ended after 2 hours. Played 2 tracks.");
}

TEST_F(ControllerTest, LoadStationRestoresTuning) {
    fill_pool(3);
    auto saved = session::tuning::fresh("chill lo-fi beats");
    saved.dial(1);
    saved.tune("more jazzy");

    ASSERT_TRUE(session->load_station(saved).ok());
    EXPECT_EQ(*session->tuning_snapshot(), saved);
    EXPECT_EQ(catalog.requests.back().description, "more jazzy");
    EXPECT_EQ(catalog.requests.back().energy, 1);
}

// ---------- Autoplay ----------

TEST_F(ControllerTest, AutoplaySteersByArtist) {
    fill_pool(4);
    ASSERT_TRUE(session->start_autoplay("Some Artist").ok());

    EXPECT_EQ(session->current_mode(), mode::autoplay);
    EXPECT_EQ(catalog.requests.back().focus, catalog::steering_focus::artist);
    EXPECT_EQ(catalog.requests.back().description, "Some Artist");
}

TEST_F(ControllerTest, AutoplayEndsAfterWindow) {
    fill_pool(10);
    ASSERT_TRUE(session->start_autoplay("Some Artist").ok());

    now += std::chrono::minutes(30);
    finish_current();
    EXPECT_EQ(session->current_mode(), mode::autoplay);
    EXPECT_EQ(current_id(), "r1");

    auto status = session->autoplay_status();
    ASSERT_TRUE(status.has_value());
    EXPECT_EQ(status->remaining, std::chrono::minutes(90));
    EXPECT_EQ(status->elapsed_songs, 2u);

    now += std::chrono::minutes(91);
    finish_current();
    EXPECT_EQ(session->current_mode(), mode::idle);
    EXPECT_FALSE(session->current_track().has_value());
    EXPECT_EQ(driver.started.size(), 2u);
    ASSERT_FALSE(notices.empty());
    EXPECT_EQ(notices.back().kind, notice_kind::session_ended);
}

TEST_F(ControllerTest, AutoplayRunsOutOfSongs) {
    fill_pool(1);
    ASSERT_TRUE(session->start_autoplay("Some Artist").ok());

    finish_current();
    EXPECT_EQ(session->current_mode(), mode::idle);
    EXPECT_EQ(notices.back().kind, notice_kind::session_ended);
}

TEST_F(ControllerTest, StopAutoplay) {
    fill_pool(3);
    EXPECT_EQ(session->stop_autoplay().code, errc::not_in_autoplay);
    ASSERT_TRUE(session->start_autoplay("Some Artist").ok());

    EXPECT_TRUE(session->stop_autoplay().ok());
    EXPECT_EQ(session->current_mode(), mode::idle);
    EXPECT_FALSE(session->autoplay_status().has_value());
}

TEST_F(ControllerTest, AutoplayCountsOnlySongsThatPlayed) {
    fill_pool(4);
    driver.refuse = {"r0"};
    ASSERT_TRUE(session->start_autoplay("Some Artist").ok());
    EXPECT_EQ(current_id(), "r1");
    EXPECT_EQ(session->history().size(), 2u);

    auto r = session->stop_autoplay();
    EXPECT_EQ(r.message, "Autoplay stopped. Played 1 unique songs.");
}

TEST_F(ControllerTest, AutoplayWindowReportsSongsThatPlayed) {
    fill_pool(4);
    driver.refuse = {"r0"};
    ASSERT_TRUE(session->start_autoplay("Some Artist").ok());

    now += std::chrono::hours(3);
    finish_current();
    ASSERT_FALSE(notices.empty());
    EXPECT_EQ(notices.back().text, "Autoplay ended after 2 hours. Played 1 unique songs.");
}

// ---------- Driver events ----------

TEST_F(ControllerTest, StaleEventsAreIgnored) {
    catalog.answer_search("list", {make_track("a", "Alpha"), make_track("b", "Bravo")});
    ASSERT_TRUE(session->play("list").ok());

    session->on_track_finished("somethingelse");
    session->on_track_error("b", "not even playing");
    EXPECT_EQ(current_id(), "a");
    EXPECT_EQ(session->queued(), 1u);
}

TEST_F(ControllerTest, RepeatedErrorsStopTheSession) {
    fill_pool(6);
    ASSERT_TRUE(session->start_radio("lo-fi").ok());

    session->on_track_error(current_id(), "decode failed");
    EXPECT_EQ(session->current_mode(), mode::radio);
    session->on_track_error(current_id(), "decode failed");
    EXPECT_EQ(session->current_mode(), mode::radio);
    session->on_track_error(current_id(), "decode failed");

    EXPECT_EQ(session->current_mode(), mode::idle);
    EXPECT_EQ(notices.back().kind, notice_kind::playback_failed);
}

TEST_F(ControllerTest, FinishResetsErrorStreak) {
    fill_pool(8);
    ASSERT_TRUE(session->start_radio("lo-fi").ok());

    session->on_track_error(current_id(), "decode failed");
    session->on_track_error(current_id(), "decode failed");
    finish_current();
    session->on_track_error(current_id(), "decode failed");
    session->on_track_error(current_id(), "decode failed");

    EXPECT_EQ(session->current_mode(), mode::radio);
}

TEST_F(ControllerTest, RefusedTracksAreSkipped) {
    fill_pool(4);
    driver.refuse = {"r0"};

    ASSERT_TRUE(session->start_radio("lo-fi").ok());
    EXPECT_EQ(current_id(), "r1");
    EXPECT_EQ(driver.attempts, (std::vector<std::string>{"r0", "r1"}));
}

TEST_F(ControllerTest, PlayerRefusingEverythingFails) {
    fill_pool(5);
    driver.refuse = {"r0", "r1", "r2", "r3", "r4"};

    EXPECT_EQ(session->start_radio("lo-fi").code, errc::playback_failure);
    EXPECT_EQ(session->current_mode(), mode::idle);
    EXPECT_EQ(driver.attempts.size(), 3u);
}

// ---------- Cancellation ----------

TEST_F(ControllerTest, SupersededSelectionIsDiscarded) {
    fill_pool(3);
    catalog.during_call = [this] { ++generation; };

    EXPECT_EQ(session->start_radio("lo-fi").code, errc::superseded);
    EXPECT_EQ(session->current_mode(), mode::idle);
    EXPECT_TRUE(driver.started.empty());
}

TEST_F(ControllerTest, SupersededSkipKeepsCurrentTrack) {
    fill_pool(3);
    ASSERT_TRUE(session->start_radio("lo-fi").ok());
    catalog.during_call = [this] { ++generation; };

    EXPECT_EQ(session->skip().code, errc::superseded);
    EXPECT_EQ(current_id(), "r0");
    EXPECT_EQ(session->signal()->elapsed_tracks, 1u);
    EXPECT_FALSE(session->interrupted());
}

TEST_F(ControllerTest, StopRadioWhileRadioIsStarting) {
    fill_pool(3);
    catalog.during_call = [this] { ++generation; };
    ASSERT_EQ(session->start_radio("lo-fi").code, errc::superseded);
    catalog.during_call = nullptr;

    auto r = session->stop_radio();
    EXPECT_TRUE(r.ok()) << r.message;
    EXPECT_EQ(r.message, "Radio stopped before the first track started.");
    EXPECT_EQ(session->current_mode(), mode::idle);

    EXPECT_EQ(session->stop_radio().code, errc::not_in_radio);
}

TEST_F(ControllerTest, OtherStopCancelsStartingAutoplay) {
    fill_pool(3);
    catalog.during_call = [this] { ++generation; };
    ASSERT_EQ(session->start_autoplay("Some Artist").code, errc::superseded);
    catalog.during_call = nullptr;

    auto r = session->stop_radio();
    EXPECT_TRUE(r.ok());
    EXPECT_EQ(r.message, "Cancelled starting autoplay.");
    EXPECT_EQ(session->stop_autoplay().code, errc::not_in_autoplay);
}

TEST_F(ControllerTest, InterruptedAdvanceResumes) {
    fill_pool(3);
    ASSERT_TRUE(session->start_radio("lo-fi").ok());
    catalog.during_call = [this] { ++generation; };

    finish_current();
    EXPECT_TRUE(session->interrupted());
    EXPECT_EQ(current_id(), "r0");
    EXPECT_EQ(driver.started.size(), 1u);

    catalog.during_call = nullptr;
    session->resume_interrupted();
    EXPECT_FALSE(session->interrupted());
    EXPECT_EQ(current_id(), "r1");
    EXPECT_EQ(session->current_mode(), mode::radio);
}

TEST_F(ControllerTest, StopDropsInterruptedAdvance) {
    fill_pool(3);
    ASSERT_TRUE(session->start_autoplay("Some Artist").ok());
    catalog.during_call = [this] { ++generation; };
    finish_current();
    ASSERT_TRUE(session->interrupted());
    catalog.during_call = nullptr;

    EXPECT_TRUE(session->stop_autoplay().ok());
    session->resume_interrupted();
    EXPECT_EQ(session->current_mode(), mode::idle);
    EXPECT_EQ(driver.started.size(), 1u);
}

}  // namespace
}  // namespace dt
