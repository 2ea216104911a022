#include "config/sim_config.hpp"
#include <algorithm>

namespace pursuit {

// Keeps `out` unchanged unless the member is a 3-number array
static void read_vec3(const JsonValue& v, Vec3& out) {
    Vec3 tmp;
    if (v.get_vec3(tmp)) out = tmp;
}

static void parse_interceptor(const JsonValue& def, EngagementConfig& cfg) {
    if (!def.is_object()) return;
    control::InterceptorParams& p = cfg.interceptor;

    cfg.interceptor_mass_kg = def["mass_kg"].get_number(cfg.interceptor_mass_kg);
    Vec3 inertia{cfg.interceptor_inertia.Ixx, cfg.interceptor_inertia.Iyy, cfg.interceptor_inertia.Izz};
    read_vec3(def["inertia"], inertia);
    cfg.interceptor_inertia = Inertia{inertia.x, inertia.y, inertia.z};

    read_vec3(def["position_enu"], cfg.interceptor_position_enu);
    read_vec3(def["velocity_enu"], cfg.interceptor_velocity_enu);
    read_vec3(def["heading_enu"], cfg.interceptor_heading_enu);

    // ── Propulsion ──
    p.fuel.fuel_kg = def["fuel_kg"].get_number(p.fuel.fuel_kg);
    p.fuel.mass_flow_kg_s = def["mass_flow_kg_s"].get_number(p.fuel.mass_flow_kg_s);
    p.thrust_along_forward = def["thrust_along_forward"].get_bool(p.thrust_along_forward);

    const auto& curve = def["thrust_curve"];
    if (def.has("thrust_curve") && curve.is_null()) {
        p.thrust_curve.reset();
    } else if (curve.is_array()) {
        std::vector<control::ThrustCurve::Key> keys;
        for (size_t i = 0; i < curve.size(); i++) {
            std::vector<double> kv;
            if (curve[i].get_numbers(kv, 2)) keys.push_back({kv[0], kv[1]});
        }
        if (!keys.empty()) p.thrust_curve = control::ThrustCurve(std::move(keys));
    }

    read_vec3(def["max_torque"], p.max_torque);

    // ── Sensing and guidance ──
    const auto& seeker = def["seeker"];
    p.seeker.half_fov_deg = seeker["half_fov_deg"].get_number(p.seeker.half_fov_deg);
    p.seeker.max_range = seeker["max_range_m"].get_number(p.seeker.max_range);
    p.seeker.max_track_rate_deg_s = seeker["max_track_rate_deg_s"].get_number(p.seeker.max_track_rate_deg_s);

    const auto& pronav = def["pronav"];
    p.pronav.time_to_align = pronav["time_to_align"].get_number(p.pronav.time_to_align);
    p.pronav.min_angle_deg = pronav["min_angle_deg"].get_number(p.pronav.min_angle_deg);

    const auto& gains = def["gains"];
    read_vec3(gains["kp"], p.gains.kp);
    read_vec3(gains["ki"], p.gains.ki);
    read_vec3(gains["kd"], p.gains.kd);

    const auto& arb = def["arbiter"];
    p.arbiter.rate_gain = arb["rate_gain"].get_number(p.arbiter.rate_gain);
    p.arbiter.max_rate_rad = arb["max_rate_rad"].get_number(p.arbiter.max_rate_rad);
    p.arbiter.min_thrust_floor = arb["min_thrust_floor"].get_number(p.arbiter.min_thrust_floor);

    const auto& fuse = def["fuse"];
    p.fuse.blast_radius = fuse["blast_radius_m"].get_number(p.fuse.blast_radius);
    p.fuse.arm_time_s = fuse["arm_time_s"].get_number(p.fuse.arm_time_s);
}

static void parse_replay(const JsonValue& def, SimConfig& cfg) {
    if (!def.is_object()) return;
    replay::ReplayConfig& r = cfg.replay;

    r.play_speed = def["play_speed"].get_number(r.play_speed);
    r.auto_play = def["auto_play"].get_bool(r.auto_play);
    r.default_dt = def["default_dt"].get_number(r.default_dt);
    r.match_header_dt = def["match_header_dt"].get_bool(r.match_header_dt);
    r.freeze_ticks = def["freeze_ticks"].get_int(r.freeze_ticks);
    if (def["orientation_source"].is_string()) {
        r.orientation_source = replay::string_to_orientation_source(def["orientation_source"].as_string());
    }

    const auto& modes = def["agent_modes"];
    if (modes.is_object()) {
        r.agent_modes.clear();
        for (const auto& [id, mode] : modes.as_object()) {
            r.agent_modes[id] = replay::string_to_agent_mode(mode.get_string("kinematic"));
        }
    }

    const auto& expected = def["expected_agents"];
    if (expected.is_array()) {
        cfg.episode.expected_agents.clear();
        for (size_t i = 0; i < expected.size(); i++) {
            if (expected[i].is_string()) cfg.episode.expected_agents.push_back(expected[i].as_string());
        }
    }

    const auto& cruise = def["cruise_in"];
    r.cruise.enabled = cruise["enabled"].get_bool(r.cruise.enabled);
    r.cruise.duration_s = cruise["duration_s"].get_number(r.cruise.duration_s);
    r.cruise.distance_multiplier = cruise["distance_multiplier"].get_number(r.cruise.distance_multiplier);
    r.cruise.play_speed = cruise["play_speed"].get_number(r.cruise.play_speed);
    r.cruise.velocity_sample_frames = cruise["velocity_sample_frames"].get_int(r.cruise.velocity_sample_frames);
    r.cruise.min_speed = cruise["min_speed"].get_number(r.cruise.min_speed);
    r.cruise.agent = cruise["agent"].get_string(r.cruise.agent);

    const auto& anchor = def["anchor"];
    r.anchor.use_first_agent_as_origin = anchor["use_first_agent_as_origin"].get_bool(r.anchor.use_first_agent_as_origin);
    r.anchor.origin_agent = anchor["origin_agent"].get_string(r.anchor.origin_agent);
    read_vec3(anchor["additional_enu_offset"], r.anchor.additional_enu_offset);
    read_vec3(anchor["world_add"], r.anchor.world_add);
}

SimConfig ConfigParser::parse(const JsonValue& root) {
    SimConfig cfg;

    const auto& sim = root["simulation"];
    EngagementConfig& eng = cfg.engagement;
    eng.dt = sim["dt"].get_number(eng.dt);
    eng.max_time_s = sim["max_time_s"].get_number(eng.max_time_s);
    read_vec3(sim["gravity_enu"], eng.gravity_enu);

    parse_interceptor(root["interceptor"], eng);

    const auto& threat = root["threat"];
    eng.threat_mass_kg = threat["mass_kg"].get_number(eng.threat_mass_kg);
    read_vec3(threat["position_enu"], eng.threat_position_enu);
    read_vec3(threat["aim_point_enu"], eng.threat_aim_point_enu);
    eng.threat_speed_mps = threat["speed_mps"].get_number(eng.threat_speed_mps);

    parse_replay(root["replay"], cfg);

    const auto& policy = root["policy"];
    net::ChannelConfig& ch = cfg.policy.channel;
    cfg.policy.socket_path = policy["socket"].get_string(cfg.policy.socket_path);
    ch.poll_hz = policy["poll_hz"].get_number(ch.poll_hz);
    ch.timeout_ms = policy["timeout_ms"].get_int(ch.timeout_ms);
    ch.health_retry_s = policy["health_retry_s"].get_number(ch.health_retry_s);
    ch.stale_after_s = policy["stale_after_s"].get_number(ch.stale_after_s);
    ch.thrust_decay_per_tick = policy["thrust_decay_per_tick"].get_number(ch.thrust_decay_per_tick);

    cfg.sample_interval = root["output"]["sample_interval"].get_number(cfg.sample_interval);

    // Values that would stall the loops
    if (!(eng.dt > 0.0)) eng.dt = 0.01;
    eng.interceptor.dt = eng.dt;
    if (!(cfg.replay.default_dt > 0.0)) cfg.replay.default_dt = 0.01;
    cfg.episode.default_dt = cfg.replay.default_dt;
    cfg.sample_interval = std::max(0.0, cfg.sample_interval);
    return cfg;
}

SimConfig ConfigParser::parse_file(const std::string& path) {
    JsonValue root = JsonReader::parse_file(path);
    if (!root.is_object()) {
        throw std::runtime_error("Config root must be an object: " + path);
    }
    return parse(root);
}

} // namespace pursuit
