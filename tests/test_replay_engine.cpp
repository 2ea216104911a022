#include "control/interceptor.hpp"
#include "coordinate/enu_frame.hpp"
#include "physics/rigid_body.hpp"
#include "physics/vec3_ops.hpp"
#include "replay/agent_replayer.hpp"
#include "replay/replay_engine.hpp"

#include <gtest/gtest.h>
#include <algorithm>
#include <cmath>
#include <limits>
#include <random>
#include <stdexcept>

using namespace pursuit;
using namespace pursuit::replay;

namespace {

/**
 * Eleven frames at 10 Hz. The missile flies north at 50 m/s from
 * ENU (100, 200, 50); threat_0 flies east at 20 m/s 400 m east of it.
 */
Episode straight_episode(double missile_speed = 50.0, int n = 11) {
    Episode ep;
    ep.header.episode_id = "ep_test";
    ep.dt_nominal = 0.1;
    for (int i = 0; i < n; i++) {
        EpisodeFrame f;
        f.t = i * 0.1;

        AgentState m;
        m.position = Vec3{100.0, 200.0 + missile_speed * f.t, 50.0};
        m.velocity = Vec3{0.0, missile_speed, 0.0};
        m.has_velocity = true;
        f.agents["missile"] = m;

        AgentState th;
        th.position = Vec3{500.0 + 20.0 * f.t, 200.0, 50.0};
        th.velocity = Vec3{20.0, 0.0, 0.0};
        th.has_velocity = true;
        if (i == n - 1) th.status = AgentStatus::Destroyed;
        f.agents["threat_0"] = th;

        ep.frames.push_back(f);
    }
    return ep;
}

ReplayConfig no_cruise() {
    ReplayConfig cfg;
    cfg.cruise.enabled = false;
    return cfg;
}

Vec3 forward_of(const Quat& q) {
    return quat_rotate(q, Vec3{0, 0, 1});
}

/// Engine with the two recorded agents attached as kinematic bodies
class ReplayEngineTest : public ::testing::Test {
protected:
    SimpleRigidBody missile_body{Pose{}, 50.0};
    SimpleRigidBody threat_body{Pose{}, 200.0};
    AgentReplayer missile{"missile", missile_body};
    AgentReplayer threat{"threat_0", threat_body};

    void attach(ReplayEngine& engine) {
        engine.attach_agent(missile);
        engine.attach_agent(threat);
    }

    /// Run through the freeze window into Replay
    void enter_replay(ReplayEngine& engine) {
        for (int i = 0; i < 10 && engine.phase() != ReplayPhase::Replay; i++) {
            engine.tick();
        }
        ASSERT_EQ(engine.phase(), ReplayPhase::Replay);
    }
};

}  // namespace

// ═══════════════════════════════════════════════════════════════
// Static helpers
// ═══════════════════════════════════════════════════════════════

TEST(ReplayEngineStatic, FindBracket) {
    std::vector<EpisodeFrame> frames(3);
    frames[0].t = 0.0;
    frames[1].t = 1.0;
    frames[2].t = 2.0;

    EXPECT_EQ(ReplayEngine::find_bracket(frames, -1.0), 0u);
    EXPECT_EQ(ReplayEngine::find_bracket(frames, 0.0), 0u);
    EXPECT_EQ(ReplayEngine::find_bracket(frames, 0.5), 0u);
    EXPECT_EQ(ReplayEngine::find_bracket(frames, 1.0), 1u);
    EXPECT_EQ(ReplayEngine::find_bracket(frames, 1.5), 1u);
    EXPECT_EQ(ReplayEngine::find_bracket(frames, 2.0), 1u);
    EXPECT_EQ(ReplayEngine::find_bracket(frames, 9.0), 1u);
    EXPECT_EQ(ReplayEngine::find_bracket({}, 1.0), 0u);
}

TEST(ReplayEngineStatic, FindBracketOverIrregularTimeline) {
    std::mt19937 rng(7);
    std::uniform_real_distribution<double> gap(0.001, 0.05);
    const size_t n = 2000;
    std::vector<EpisodeFrame> frames(n);
    for (size_t i = 1; i < n; i++) frames[i].t = frames[i - 1].t + gap(rng);

    auto check = [&](double t) {
        size_t i = ReplayEngine::find_bracket(frames, t);
        ASSERT_LE(i, n - 2);
        if (t < frames.front().t) {
            EXPECT_EQ(i, 0u);
        } else if (t >= frames.back().t) {
            EXPECT_EQ(i, n - 2);
        } else {
            EXPECT_LE(frames[i].t, t) << "t=" << t;
            EXPECT_LT(t, frames[i + 1].t) << "t=" << t;
        }
    };

    std::uniform_real_distribution<double> query(-1.0, frames.back().t + 1.0);
    for (int k = 0; k < 5000; k++) check(query(rng));
    for (const EpisodeFrame& f : frames) check(f.t);
}

TEST(ReplayEngineStatic, CursorMatchesBracketAtAnySpeed) {
    std::mt19937 rng(11);
    std::uniform_real_distribution<double> gap(0.002, 0.04);
    Episode ep;
    ep.dt_nominal = 0.01;
    double t = 0.0;
    for (int i = 0; i < 2000; i++) {
        EpisodeFrame f;
        f.t = t;
        AgentState s;
        s.position = Vec3{0.0, t, 100.0};
        f.agents["missile"] = s;
        ep.frames.push_back(f);
        t += gap(rng);
    }

    ReplayConfig cfg = no_cruise();
    cfg.freeze_ticks = 0;
    ReplayEngine engine(cfg);
    engine.load(ep);
    engine.tick();
    ASSERT_EQ(engine.phase(), ReplayPhase::Replay);
    engine.set_paused(false);

    std::uniform_real_distribution<double> speed(0.1, 10.0);
    for (int k = 0; k < 100000 && engine.time() < engine.end_time(); k++) {
        engine.set_play_speed(speed(rng));
        engine.tick();
        ASSERT_EQ(engine.cursor(), ReplayEngine::find_bracket(engine.episode().frames, engine.time()))
            << "t=" << engine.time();
    }
    EXPECT_DOUBLE_EQ(engine.time(), engine.end_time());
    EXPECT_EQ(engine.cursor(), ep.frames.size() - 2);
}

TEST(ReplayEngineStatic, InterpolationAlpha) {
    EXPECT_DOUBLE_EQ(ReplayEngine::interpolation_alpha(0.0, 1.0, 0.25), 0.25);
    EXPECT_DOUBLE_EQ(ReplayEngine::interpolation_alpha(0.0, 1.0, 2.0), 1.0);
    EXPECT_DOUBLE_EQ(ReplayEngine::interpolation_alpha(0.0, 1.0, -1.0), 0.0);
    EXPECT_DOUBLE_EQ(ReplayEngine::interpolation_alpha(1.0, 1.0, 1.0), 0.0);
}

TEST(ReplayEngineStatic, EmptyEpisodeThrows) {
    ReplayEngine engine;
    EXPECT_THROW(engine.load(Episode{}), std::runtime_error);
    EXPECT_FALSE(engine.loaded());
    EXPECT_EQ(engine.current_frame(), nullptr);
}

// ═══════════════════════════════════════════════════════════════
// Loading and anchoring
// ═══════════════════════════════════════════════════════════════

TEST_F(ReplayEngineTest, AnchorsOnMissileAndUsesHeaderDt) {
    ReplayEngine engine(no_cruise());
    attach(engine);
    engine.load(straight_episode());

    EXPECT_TRUE(engine.loaded());
    EXPECT_TRUE(engine.paused());
    EXPECT_DOUBLE_EQ(engine.dt(), 0.1);
    EXPECT_DOUBLE_EQ(engine.enu_offset().x, 100.0);
    EXPECT_DOUBLE_EQ(engine.enu_offset().y, 200.0);
    EXPECT_DOUBLE_EQ(engine.enu_offset().z, 50.0);

    // Spawned at the first recorded pose, anchored
    EXPECT_NEAR(missile_body.pose().position.norm(), 0.0, 1e-12);
    EXPECT_NEAR(threat_body.pose().position.x, 400.0, 1e-12);
    EXPECT_NEAR(threat_body.pose().position.y, 0.0, 1e-12);
    EXPECT_TRUE(engine.is_spawned("missile"));
    EXPECT_TRUE(engine.is_spawned("threat_0"));
}

TEST_F(ReplayEngineTest, AnchorOptions) {
    ReplayConfig cfg = no_cruise();
    cfg.anchor.additional_enu_offset = Vec3{1.0, 2.0, 3.0};
    cfg.anchor.world_add = Vec3{0.0, 10.0, 0.0};
    ReplayEngine engine(cfg);
    engine.load(straight_episode());

    EXPECT_DOUBLE_EQ(engine.enu_offset().x, 101.0);
    Vec3 w = engine.to_world(Vec3{101.0, 202.0, 53.0});
    EXPECT_NEAR(w.x, 0.0, 1e-12);
    EXPECT_NEAR(w.y, 10.0, 1e-12);
    EXPECT_NEAR(w.z, 0.0, 1e-12);

    ReplayConfig raw = no_cruise();
    raw.anchor.use_first_agent_as_origin = false;
    ReplayEngine unanchored(raw);
    unanchored.load(straight_episode());
    EXPECT_EQ(unanchored.enu_offset().norm(), 0.0);
}

TEST_F(ReplayEngineTest, AutoOriginFallsBackToFirstAgent) {
    Episode ep;
    EpisodeFrame f;
    AgentState a;
    a.position = Vec3{7.0, 8.0, 9.0};
    f.agents["alpha"] = a;
    AgentState b;
    b.position = Vec3{-1.0, -1.0, -1.0};
    f.agents["bravo"] = b;
    ep.frames.push_back(f);

    ReplayEngine engine(no_cruise());
    engine.load(ep);
    EXPECT_DOUBLE_EQ(engine.enu_offset().x, 7.0);
    EXPECT_DOUBLE_EQ(engine.enu_offset().z, 9.0);
}

TEST_F(ReplayEngineTest, FallsBackToDefaultDt) {
    ReplayConfig cfg = no_cruise();
    cfg.match_header_dt = false;
    cfg.default_dt = 0.05;
    ReplayEngine engine(cfg);
    engine.load(straight_episode());
    EXPECT_DOUBLE_EQ(engine.dt(), 0.05);
}

// ═══════════════════════════════════════════════════════════════
// Phases and clock
// ═══════════════════════════════════════════════════════════════

TEST_F(ReplayEngineTest, FreezeHoldsFirstPoseForConfiguredTicks) {
    ReplayConfig cfg = no_cruise();
    cfg.freeze_ticks = 2;
    cfg.auto_play = true;
    ReplayEngine engine(cfg);
    attach(engine);
    engine.load(straight_episode());

    EXPECT_EQ(engine.phase(), ReplayPhase::Freeze);
    engine.tick();
    EXPECT_EQ(engine.phase(), ReplayPhase::Freeze);
    EXPECT_TRUE(threat.is_frozen());
    EXPECT_NEAR(threat_body.pose().position.x, 400.0, 1e-12);
    EXPECT_DOUBLE_EQ(engine.time(), 0.0);

    engine.tick();
    EXPECT_EQ(engine.phase(), ReplayPhase::Replay);
    EXPECT_FALSE(threat.is_frozen());
    EXPECT_DOUBLE_EQ(engine.time(), 0.0);
}

TEST_F(ReplayEngineTest, PausedClockStandsStill) {
    ReplayEngine engine(no_cruise());
    attach(engine);
    engine.load(straight_episode());
    enter_replay(engine);

    engine.tick();
    engine.tick();
    EXPECT_DOUBLE_EQ(engine.time(), 0.0);
    EXPECT_EQ(engine.cursor(), 0u);
}

TEST_F(ReplayEngineTest, PlaysToTheEndAndClamps) {
    ReplayEngine engine(no_cruise());
    attach(engine);
    engine.load(straight_episode());
    enter_replay(engine);
    engine.set_paused(false);

    engine.tick();
    EXPECT_NEAR(engine.time(), 0.1, 1e-12);

    int ticks = 1;
    while (!engine.finished() && ticks < 100) {
        engine.tick();
        ticks++;
    }
    EXPECT_TRUE(engine.finished());
    EXPECT_LE(ticks, 11);
    EXPECT_DOUBLE_EQ(engine.time(), engine.end_time());
    EXPECT_EQ(engine.cursor(), 9u);

    engine.tick();
    EXPECT_DOUBLE_EQ(engine.time(), engine.end_time());
    EXPECT_NEAR(missile_body.pose().position.z, 50.0, 1e-9);
}

TEST_F(ReplayEngineTest, PlaySpeedScalesAndClamps) {
    ReplayEngine engine(no_cruise());
    attach(engine);
    engine.load(straight_episode());
    enter_replay(engine);

    engine.set_play_speed(100.0);
    EXPECT_DOUBLE_EQ(engine.play_speed(), ReplayEngine::MAX_PLAY_SPEED);
    engine.set_play_speed(0.0);
    EXPECT_DOUBLE_EQ(engine.play_speed(), ReplayEngine::MIN_PLAY_SPEED);
    engine.set_play_speed(std::numeric_limits<double>::quiet_NaN());
    EXPECT_DOUBLE_EQ(engine.play_speed(), ReplayEngine::MIN_PLAY_SPEED);

    engine.set_play_speed(2.0);
    engine.set_paused(false);
    engine.tick();
    EXPECT_NEAR(engine.time(), 0.2, 1e-12);
    EXPECT_EQ(engine.cursor(), 2u);
}

TEST_F(ReplayEngineTest, StepsOnlyInReplayAndPause) {
    ReplayEngine engine(no_cruise());
    attach(engine);
    engine.load(straight_episode());
    EXPECT_FALSE(engine.step_forward());

    enter_replay(engine);
    engine.set_paused(false);
    ASSERT_TRUE(engine.step_forward());
    EXPECT_TRUE(engine.paused());
    EXPECT_NEAR(engine.time(), 0.1, 1e-12);
    EXPECT_NEAR(missile_body.pose().position.z, 5.0, 1e-9);

    ASSERT_TRUE(engine.step_backward());
    EXPECT_DOUBLE_EQ(engine.time(), 0.0);
    ASSERT_TRUE(engine.step_backward());
    EXPECT_DOUBLE_EQ(engine.time(), 0.0);
}

TEST_F(ReplayEngineTest, SeekEndsStartSequenceAndClamps) {
    ReplayEngine engine(no_cruise());
    attach(engine);
    engine.load(straight_episode());
    ASSERT_EQ(engine.phase(), ReplayPhase::Freeze);

    engine.seek(0.55);
    EXPECT_EQ(engine.phase(), ReplayPhase::Replay);
    EXPECT_DOUBLE_EQ(engine.time(), 0.55);
    EXPECT_EQ(engine.cursor(), 5u);
    EXPECT_NEAR(missile_body.pose().position.z, 27.5, 1e-6);
    EXPECT_NEAR(threat_body.pose().position.x, 411.0, 1e-6);

    engine.seek(50.0);
    EXPECT_DOUBLE_EQ(engine.time(), engine.end_time());
    EXPECT_TRUE(engine.finished());

    engine.seek(-3.0);
    EXPECT_DOUBLE_EQ(engine.time(), engine.start_time());
    EXPECT_EQ(engine.cursor(), 0u);
}

TEST_F(ReplayEngineTest, RestartReturnsToStart) {
    ReplayEngine engine(no_cruise());
    attach(engine);
    engine.load(straight_episode());
    engine.seek(0.7);
    engine.set_paused(false);

    engine.restart();
    EXPECT_EQ(engine.phase(), ReplayPhase::Freeze);
    EXPECT_DOUBLE_EQ(engine.time(), 0.0);
    EXPECT_TRUE(engine.paused());
    EXPECT_NEAR(missile_body.pose().position.norm(), 0.0, 1e-12);
}

// ═══════════════════════════════════════════════════════════════
// Agents
// ═══════════════════════════════════════════════════════════════

TEST_F(ReplayEngineTest, KinematicAgentsFaceTravelAndEstimateVelocity) {
    ReplayEngine engine(no_cruise());
    attach(engine);
    engine.load(straight_episode());
    enter_replay(engine);
    engine.set_paused(false);

    engine.tick();
    engine.tick();

    EXPECT_NEAR(missile_body.velocity().z, 50.0, 1e-6);
    EXPECT_NEAR(threat_body.velocity().x, 20.0, 1e-6);
    EXPECT_NEAR(forward_of(missile_body.pose().orientation).z, 1.0, 1e-9);
    EXPECT_NEAR(forward_of(threat_body.pose().orientation).x, 1.0, 1e-9);
}

TEST_F(ReplayEngineTest, RecordedOrientationOption) {
    Episode ep = straight_episode();
    for (auto& f : ep.frames) {
        f.agents["threat_0"].orientation = Quat::Identity();
        f.agents["threat_0"].has_orientation = true;
    }

    ReplayConfig cfg = no_cruise();
    cfg.orientation_source = OrientationSource::RecordedSlerp;
    ReplayEngine engine(cfg);
    attach(engine);
    engine.load(ep);
    engine.seek(0.35);

    // Identity attitude despite eastward travel
    EXPECT_NEAR(forward_of(threat_body.pose().orientation).z, 1.0, 1e-9);
    EXPECT_NEAR(forward_of(missile_body.pose().orientation).z, 1.0, 1e-9);
}

TEST_F(ReplayEngineTest, AgentWithoutRecordIsNotSpawned) {
    SimpleRigidBody ghost_body(Pose{{1, 2, 3}, Quat::Identity()}, 10.0);
    AgentReplayer ghost("ghost", ghost_body);

    ReplayEngine engine(no_cruise());
    attach(engine);
    engine.attach_agent(ghost);
    engine.load(straight_episode());
    enter_replay(engine);
    engine.seek(0.5);

    EXPECT_FALSE(engine.is_spawned("ghost"));
    EXPECT_DOUBLE_EQ(ghost_body.pose().position.x, 1.0);
    EXPECT_DOUBLE_EQ(ghost_body.pose().position.z, 3.0);
}

TEST(ReplayEngineCommand, SeedsVelocityAndFliesRecordedAction) {
    Episode ep = straight_episode();
    for (auto& f : ep.frames) {
        AgentState s;
        s.position = Vec3{100.0, 200.0 + 60.0 * f.t, 50.0};
        s.velocity = Vec3{0.0, 60.0, 0.0};
        s.has_velocity = true;
        s.action = {0.0, 0.0, 0.0, 0.5, 0.0, 0.0};
        f.agents["interceptor_0"] = s;
    }

    SimpleRigidBody body(Pose{}, 50.0);
    control::Interceptor airframe(body, control::InterceptorParams{});
    AgentReplayer interceptor("interceptor_0", body, &airframe);

    ReplayConfig cfg = no_cruise();
    cfg.freeze_ticks = 0;
    ReplayEngine engine(cfg);
    engine.attach_agent(interceptor);
    engine.load(ep);

    engine.tick();
    ASSERT_EQ(engine.phase(), ReplayPhase::Replay);
    EXPECT_EQ(interceptor.mode(), AgentMode::CommandDriven);
    EXPECT_FALSE(body.is_kinematic());
    EXPECT_NEAR(body.velocity().z, 60.0, 1e-12);

    // Paused: no elapsed time, no action flown
    engine.tick();
    EXPECT_EQ(airframe.time_of_flight(), 0.0);

    engine.set_paused(false);
    engine.tick();
    EXPECT_NEAR(airframe.time_of_flight(), 0.1, 1e-12);
    EXPECT_TRUE(airframe.arbiter().is_external());
    EXPECT_DOUBLE_EQ(airframe.arbiter().throttle(), 0.5);
}

TEST(ReplayEngineCommand, ExactTimestampFliesThatFramesAction) {
    const double throttles[] = {0.1, 0.6, 0.9, 0.3};
    Episode ep;
    ep.dt_nominal = 0.5;
    for (int i = 0; i < 4; i++) {
        EpisodeFrame f;
        f.t = 0.5 * i;
        AgentState s;
        s.position = Vec3{0.0, 10.0 * f.t, 100.0};
        s.velocity = Vec3{0.0, 10.0, 0.0};
        s.has_velocity = true;
        s.action = {0.0, 0.0, 0.0, throttles[i], 0.0, 0.0};
        f.agents["interceptor_0"] = s;
        ep.frames.push_back(f);
    }

    SimpleRigidBody body(Pose{}, 50.0);
    control::Interceptor airframe(body, control::InterceptorParams{});
    AgentReplayer interceptor("interceptor_0", body, &airframe);

    ReplayConfig cfg = no_cruise();
    cfg.freeze_ticks = 0;
    ReplayEngine engine(cfg);
    engine.attach_agent(interceptor);
    engine.load(ep);
    engine.tick();
    ASSERT_EQ(engine.phase(), ReplayPhase::Replay);
    engine.set_paused(false);

    for (int i = 1; i < 4; i++) {
        engine.tick();
        EXPECT_DOUBLE_EQ(engine.time(), 0.5 * i);
        EXPECT_EQ(engine.cursor(), static_cast<size_t>(std::min(i, 2)));
        EXPECT_DOUBLE_EQ(airframe.arbiter().throttle(), throttles[i]) << "tick " << i;
    }
}

// ═══════════════════════════════════════════════════════════════
// Cruise-in
// ═══════════════════════════════════════════════════════════════

TEST_F(ReplayEngineTest, CruiseInFliesMissileIntoFirstPosition) {
    ReplayEngine engine;
    attach(engine);
    engine.load(straight_episode());

    ASSERT_EQ(engine.phase(), ReplayPhase::CruiseIn);
    EXPECT_EQ(engine.cruise_agent(), "missile");
    EXPECT_TRUE(engine.is_spawned("missile"));
    EXPECT_FALSE(engine.is_spawned("threat_0"));
    EXPECT_TRUE(threat.is_frozen());

    // 50 m/s * 4 s * 1.5 back along the recorded heading
    EXPECT_NEAR(missile_body.pose().position.z, -300.0, 1e-6);
    EXPECT_NEAR(missile_body.velocity().z, 75.0, 1e-6);

    engine.tick();
    EXPECT_NEAR(missile_body.pose().position.z, -300.0, 1e-6);

    engine.set_paused(false);
    for (int i = 0; i < 20; i++) engine.tick();
    EXPECT_EQ(engine.phase(), ReplayPhase::CruiseIn);
    EXPECT_NEAR(missile_body.pose().position.z, -150.0, 1e-6);

    int ticks = 20;
    while (engine.phase() == ReplayPhase::CruiseIn && ticks < 100) {
        engine.tick();
        ticks++;
    }
    EXPECT_GE(ticks, 40);
    EXPECT_LE(ticks, 41);
    EXPECT_EQ(engine.phase(), ReplayPhase::Freeze);
    EXPECT_TRUE(engine.is_spawned("threat_0"));
    EXPECT_NEAR(missile_body.pose().position.norm(), 0.0, 1e-9);
    EXPECT_DOUBLE_EQ(engine.time(), 0.0);
}

TEST_F(ReplayEngineTest, CruiseInSkippedForSlowAgent) {
    ReplayEngine engine;
    attach(engine);
    engine.load(straight_episode(5.0));
    EXPECT_EQ(engine.phase(), ReplayPhase::Freeze);
    EXPECT_TRUE(engine.is_spawned("threat_0"));
}

TEST_F(ReplayEngineTest, CruiseInSkippedWithoutCandidate) {
    Episode ep = straight_episode();
    for (auto& f : ep.frames) {
        f.agents["red"] = f.agents["missile"];
        f.agents.erase("missile");
        f.agents.erase("threat_0");
    }
    ReplayEngine engine;
    engine.load(ep);
    EXPECT_EQ(engine.phase(), ReplayPhase::Freeze);
    EXPECT_TRUE(engine.cruise_agent().empty());
}

// ═══════════════════════════════════════════════════════════════
// Sampling and determinism
// ═══════════════════════════════════════════════════════════════

TEST(ReplayEngineSample, InterpolatesAndClamps) {
    ReplayEngine engine(no_cruise());
    engine.load(straight_episode());

    auto s = engine.sample("missile", 0.25);
    ASSERT_TRUE(s.has_value());
    EXPECT_NEAR(s->pose.position.z, 12.5, 1e-9);
    EXPECT_NEAR(s->velocity.z, 50.0, 1e-9);
    EXPECT_EQ(s->status, AgentStatus::Active);

    auto first = engine.sample("threat_0", 0.0);
    ASSERT_TRUE(first.has_value());
    EXPECT_NEAR(first->pose.position.x, 400.0, 1e-9);

    auto last = engine.sample("threat_0", 99.0);
    ASSERT_TRUE(last.has_value());
    EXPECT_NEAR(last->pose.position.x, 420.0, 1e-9);
    EXPECT_EQ(last->status, AgentStatus::Destroyed);

    EXPECT_FALSE(engine.sample("nobody", 0.5).has_value());
    EXPECT_FALSE(engine.sample("missile", std::nan("")).has_value());
}

TEST(ReplayEngineSample, SameInputsSameTrajectory) {
    auto run = []() {
        SimpleRigidBody body(Pose{}, 200.0);
        AgentReplayer threat("threat_0", body);
        ReplayConfig cfg;
        cfg.auto_play = true;
        ReplayEngine engine(cfg);
        engine.attach_agent(threat);
        engine.load(straight_episode());
        for (int i = 0; i < 60; i++) engine.tick();
        return body.pose().position;
    };
    Vec3 a = run();
    Vec3 b = run();
    EXPECT_EQ(a.x, b.x);
    EXPECT_EQ(a.y, b.y);
    EXPECT_EQ(a.z, b.z);
}
