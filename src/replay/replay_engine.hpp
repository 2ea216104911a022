/**
 * ReplayEngine — deterministic, time-indexed playback of a loaded Episode.
 *
 * One fixed step per tick(). The clock advances by dt * play_speed unless
 * paused and clamps at the last timestamp; the frame cursor moves forward
 * incrementally, seeks use binary search. Each attached agent is driven
 * through its AgentReplayer:
 *
 *   Kinematic      position lerped in ENU between the bracketing frames,
 *                  anchored, mapped to the internal frame; orientation from
 *                  the direction of travel (or a slerp of recorded attitudes)
 *   CommandDriven  the bracketing frame's action is flown through the
 *                  airframe; the caller steps the rigid bodies
 *
 * Phases after load()/restart():
 *
 *   CruiseIn  the cruise agent flies a straight line into its first
 *             recorded position; every other agent waits unspawned
 *   Freeze    all agents held at their first-frame pose for freeze_ticks
 *   Replay    normal playback
 *
 * Usage:
 *   ReplayEngine engine(config);
 *   engine.attach_agent(interceptor_replayer);
 *   engine.attach_agent(threat_replayer);
 *   engine.load(EpisodeStore::parse(path));
 *   engine.set_paused(false);
 *   while (!engine.finished()) { engine.tick(); world.step(engine.dt()); }
 */

#ifndef PURSUIT_REPLAY_ENGINE_HPP
#define PURSUIT_REPLAY_ENGINE_HPP

#include "replay/agent_replayer.hpp"
#include "replay/episode_types.hpp"
#include <map>
#include <optional>
#include <set>
#include <string>
#include <vector>

namespace pursuit::replay {

enum class ReplayPhase {
    Idle,
    CruiseIn,
    Freeze,
    Replay
};

inline const char* phase_to_string(ReplayPhase p) {
    switch (p) {
        case ReplayPhase::Idle:     return "idle";
        case ReplayPhase::CruiseIn: return "cruise_in";
        case ReplayPhase::Freeze:   return "freeze";
        case ReplayPhase::Replay:   return "replay";
        default:                    return "";
    }
}

enum class OrientationSource {
    TravelDirection,
    RecordedSlerp
};

inline OrientationSource string_to_orientation_source(const std::string& s) {
    if (s == "recorded" || s == "recorded_slerp") return OrientationSource::RecordedSlerp;
    return OrientationSource::TravelDirection;
}

/// "auto" picks the first of these present in the first frame
constexpr const char* AUTO_AGENT_CANDIDATES[] = {"missile", "threat_0"};

struct CruiseInConfig {
    bool enabled = true;
    double duration_s = 4.0;
    double distance_multiplier = 1.5;
    double play_speed = 1.0;
    int velocity_sample_frames = 10;
    double min_speed = 10.0;          // m/s; slower agents skip cruise-in
    std::string agent = "auto";
};

struct AnchorConfig {
    bool use_first_agent_as_origin = true;
    std::string origin_agent = "auto";
    Vec3 additional_enu_offset;       // subtracted with the origin, ENU
    Vec3 world_add;                   // added after mapping, internal frame
};

struct ReplayConfig {
    double play_speed = 1.0;
    bool auto_play = false;
    double default_dt = 0.01;
    bool match_header_dt = true;
    int freeze_ticks = 2;
    CruiseInConfig cruise;
    AnchorConfig anchor;
    OrientationSource orientation_source = OrientationSource::TravelDirection;

    /// Agents not listed replay kinematically
    std::map<std::string, AgentMode> agent_modes = {
        {"interceptor", AgentMode::CommandDriven},
        {"interceptor_0", AgentMode::CommandDriven}
    };

    AgentMode mode_for(const std::string& id) const {
        auto it = agent_modes.find(id);
        return it == agent_modes.end() ? AgentMode::Kinematic : it->second;
    }
};

/// Interpolated agent state, internal frame
struct AgentSample {
    Pose pose;
    Vec3 velocity;
    AgentStatus status = AgentStatus::Active;
};

class ReplayEngine {
public:
    static constexpr double MIN_PLAY_SPEED = 0.1;
    static constexpr double MAX_PLAY_SPEED = 10.0;

    explicit ReplayEngine(const ReplayConfig& config = ReplayConfig{});

    /// Agents are borrowed; attach before load() or call restart() after
    void attach_agent(AgentReplayer& agent);

    /// @throws std::runtime_error if the episode has no frames
    void load(Episode episode);
    bool loaded() const { return phase_ != ReplayPhase::Idle; }

    void tick();

    void set_paused(bool paused) { paused_ = paused; }
    void toggle_pause() { paused_ = !paused_; }
    bool paused() const { return paused_; }

    /// Clamped to [0.1, 10]; non-finite ignored
    void set_play_speed(double speed);
    double play_speed() const { return speed_; }

    /// Pause and move one dt (Replay phase only); false otherwise
    bool step_forward();
    bool step_backward();

    /// Back to the start sequence (cruise-in if enabled); pause per auto_play
    void restart();

    /// Jump to t (clamped); ends cruise-in / freeze
    void seek(double t);

    double time() const { return t_; }
    size_t cursor() const { return idx_; }
    ReplayPhase phase() const { return phase_; }
    double dt() const { return dt_; }
    bool finished() const;

    double start_time() const;
    double end_time() const;
    const Episode& episode() const { return episode_; }
    const EpisodeFrame* current_frame() const;

    bool is_spawned(const std::string& id) const { return spawned_.count(id) > 0; }
    const std::string& cruise_agent() const { return cruise_agent_; }
    const Vec3& enu_offset() const { return enu_offset_; }

    /// Anchored ENU position -> internal frame
    Vec3 to_world(const Vec3& enu) const;

    /// Interpolated state of one agent at time t (clamped); nullopt if never recorded
    std::optional<AgentSample> sample(const std::string& id, double t) const;

    /// Index i with frames[i].t <= t < frames[i+1].t, clamped to [0, n-2]
    static size_t find_bracket(const std::vector<EpisodeFrame>& frames, double t);

    /// clamp01((t - ta) / max(1e-6, tb - ta))
    static double interpolation_alpha(double ta, double tb, double t);

private:
    void begin();
    bool setup_cruise();
    void update_cruise();
    void spawn_all();
    void enter_replay();
    void advance_cursor();
    void snap(double elapsed);
    void apply_agents(double elapsed);

    std::string resolve_agent(const std::string& requested) const;
    std::optional<Pose> first_pose(const std::string& id) const;
    std::optional<Pose> pose_between(const std::string& id, const EpisodeFrame& a,
                                     const EpisodeFrame& b, double alpha,
                                     const Quat* fallback) const;

    ReplayConfig config_;
    Episode episode_;
    std::vector<AgentReplayer*> agents_;

    ReplayPhase phase_ = ReplayPhase::Idle;
    double dt_ = 0.01;
    double t_ = 0.0;
    size_t idx_ = 0;
    bool paused_ = true;
    double speed_ = 1.0;
    int freeze_left_ = 0;

    Vec3 enu_offset_;
    std::set<std::string> spawned_;
    std::map<std::string, Quat> last_rotation_;

    // Cruise-in
    std::string cruise_agent_;
    Vec3 cruise_start_enu_;
    Vec3 cruise_end_enu_;
    Vec3 cruise_velocity_;   // internal frame
    double cruise_time_ = 0.0;
};

} // namespace pursuit::replay

#endif // PURSUIT_REPLAY_ENGINE_HPP
