/**
 * Configuration — typed settings for both executables, with an optional
 * JSON file layered over the in-class defaults.
 *
 * Every key is optional. A missing or mistyped value keeps its default.
 *
 *   {
 *     "simulation":  {"dt", "max_time_s", "gravity_enu": [e,n,u]},
 *     "interceptor": {"mass_kg", "inertia": [Ixx,Iyy,Izz], "position_enu",
 *                     "velocity_enu", "heading_enu", "fuel_kg", "mass_flow_kg_s",
 *                     "thrust_curve": [[t,N],..] | null, "thrust_along_forward",
 *                     "max_torque": [x,y,z],
 *                     "seeker": {"half_fov_deg","max_range_m","max_track_rate_deg_s"},
 *                     "pronav": {"time_to_align","min_angle_deg"},
 *                     "gains":  {"kp":[..],"ki":[..],"kd":[..]},
 *                     "arbiter":{"rate_gain","max_rate_rad","min_thrust_floor"},
 *                     "fuse":   {"blast_radius_m","arm_time_s"}},
 *     "threat":      {"mass_kg", "position_enu", "aim_point_enu", "speed_mps"},
 *     "replay":      {"play_speed", "auto_play", "default_dt", "match_header_dt",
 *                     "freeze_ticks", "orientation_source", "expected_agents",
 *                     "agent_modes": {"id": "command"|"kinematic"},
 *                     "cruise_in": {...}, "anchor": {...}},
 *     "policy":      {"socket", "poll_hz", "timeout_ms", "health_retry_s",
 *                     "stale_after_s", "thrust_decay_per_tick"},
 *     "output":      {"sample_interval"}
 *   }
 */

#ifndef PURSUIT_SIM_CONFIG_HPP
#define PURSUIT_SIM_CONFIG_HPP

#include "control/interceptor.hpp"
#include "io/json_reader.hpp"
#include "net/command_channel.hpp"
#include "physics/rigid_body.hpp"
#include "replay/episode_store.hpp"
#include "replay/replay_engine.hpp"
#include <string>

namespace pursuit {

/// Closed-loop engagement; vectors ENU
struct EngagementConfig {
    double dt = 0.01;
    double max_time_s = 30.0;
    Vec3 gravity_enu;

    control::InterceptorParams interceptor;
    double interceptor_mass_kg = 50.0;
    Inertia interceptor_inertia{5.0, 5.0, 1.0};
    Vec3 interceptor_position_enu;
    Vec3 interceptor_velocity_enu{0.0, 60.0, 0.0};
    Vec3 interceptor_heading_enu{0.0, 1.0, 0.0};

    double threat_mass_kg = 200.0;
    Vec3 threat_position_enu{40.0, 900.0, 60.0};
    Vec3 threat_aim_point_enu;
    double threat_speed_mps = 50.0;
};

struct PolicyConfig {
    std::string socket_path;          // empty: no external policy
    net::ChannelConfig channel;
};

struct SimConfig {
    EngagementConfig engagement;
    replay::ReplayConfig replay;
    replay::EpisodeLoadOptions episode;
    PolicyConfig policy;
    double sample_interval = 0.1;     // trajectory output [s]
};

class ConfigParser {
public:
    static SimConfig parse(const JsonValue& root);

    /// @throws std::runtime_error if the file cannot be read or parsed
    static SimConfig parse_file(const std::string& path);
};

} // namespace pursuit

#endif // PURSUIT_SIM_CONFIG_HPP
