/**
 * Episode data model — one canonical in-memory form for every recorded
 * episode schema. All vectors are ENU as recorded; orientation is the
 * recorded world->body quaternion [w, x, y, z], already sanitized.
 */

#ifndef PURSUIT_EPISODE_TYPES_HPP
#define PURSUIT_EPISODE_TYPES_HPP

#include "core/state_vector.hpp"
#include <ctime>
#include <map>
#include <optional>
#include <string>
#include <vector>

namespace pursuit::replay {

enum class AgentStatus {
    Active,
    Destroyed,
    Finished
};

inline const char* status_to_string(AgentStatus s) {
    switch (s) {
        case AgentStatus::Active:    return "active";
        case AgentStatus::Destroyed: return "destroyed";
        case AgentStatus::Finished:  return "finished";
        default:                     return "";
    }
}

inline AgentStatus string_to_status(const std::string& s) {
    if (s == "destroyed") return AgentStatus::Destroyed;
    if (s == "finished")  return AgentStatus::Finished;
    return AgentStatus::Active;
}

// Action vector layout
constexpr size_t ACTION_PITCH_RATE = 0;
constexpr size_t ACTION_YAW_RATE   = 1;
constexpr size_t ACTION_ROLL_RATE  = 2;
constexpr size_t ACTION_THROTTLE   = 3;
constexpr size_t ACTION_SIZE       = 6;
constexpr size_t ACTION_MIN_USABLE = 4;

struct AgentState {
    Vec3 position;
    Vec3 velocity;
    Quat orientation;            // world->body, ENU
    Vec3 angular_velocity;
    AgentStatus status = AgentStatus::Active;
    std::vector<double> action;  // empty when not recorded
    std::optional<double> fuel_kg;

    bool has_orientation = false;
    bool has_velocity = false;

    bool has_usable_action() const { return action.size() >= ACTION_MIN_USABLE; }
};

// ── Radar sub-frame ──

struct OnboardRadar {
    bool detected = false;
    double range_to_target = 0.0;
    double beam_angle_to_target_deg = 0.0;
    double half_beam_width_deg = 0.0;
    Vec3 forward_vector;
    bool in_beam = false;
    std::string detection_reason;
};

struct GroundRadar {
    bool enabled = false;
    bool detected = false;
    double range_to_target = 0.0;
    double elevation_deg = 0.0;
};

struct RadarFusion {
    bool both_detected = false;
    bool any_detected = false;
    double fusion_confidence = 0.0;
};

struct RadarFrame {
    OnboardRadar onboard;
    GroundRadar ground;
    RadarFusion fusion;
};

struct EpisodeFrame {
    double t = 0.0;   // seconds from episode start
    std::map<std::string, AgentState> agents;
    std::optional<RadarFrame> radar;

    const AgentState* find(const std::string& id) const {
        auto it = agents.find(id);
        return it == agents.end() ? nullptr : &it->second;
    }
};

// ── Header / footer ──

struct InterceptorSceneConfig {
    double mass_kg = 0.0;
    Vec3 max_torque;
    double sensor_fov_deg = 0.0;
    double max_thrust_n = 0.0;
};

struct ThreatSceneConfig {
    std::string type;
    double mass_kg = 0.0;
    Vec3 aim_point;
};

struct EpisodeHeader {
    std::string episode_id = "unknown";
    std::string start_time;
    std::optional<double> dt_nominal;
    std::optional<int> seed;
    std::string coord_frame;
    std::string scenario;
    std::optional<InterceptorSceneConfig> interceptor;
    std::optional<ThreatSceneConfig> threat;
};

struct EpisodeMetrics {
    double total_reward = 0.0;
    int steps = 0;
    double final_distance = 0.0;
    double fuel_used = 0.0;
    bool volley_mode = false;
    int missiles_intercepted = 0;
};

struct EpisodeFooter {
    std::string episode_id;
    std::string end_time;
    double duration = 0.0;
    std::string outcome = "unknown";
    std::string notes;
    EpisodeMetrics metrics;
};

struct Episode {
    EpisodeHeader header;
    std::vector<EpisodeFrame> frames;
    std::optional<EpisodeFooter> footer;
    double dt_nominal = 0.01;

    // Load diagnostics
    int skipped_lines = 0;
    int sanitized_quaternions = 0;
    int dropped_frames = 0;

    bool has_radar() const {
        for (const auto& f : frames) {
            if (f.radar) return true;
        }
        return false;
    }
};

/// Directory-listing summary; frame bodies are never decoded
struct EpisodeMetadata {
    std::string file_path;
    std::string file_name;
    std::time_t file_modified = 0;

    std::string episode_id = "unknown";
    std::string start_time;
    std::string outcome = "unknown";
    double duration = 0.0;
    int steps = 0;
    double final_distance = 0.0;
    double total_reward = 0.0;
    double fuel_used = 0.0;
    bool volley_mode = false;
    int missiles_intercepted = 0;
    bool has_footer = false;
    bool has_radar_data = false;
};

} // namespace pursuit::replay

#endif // PURSUIT_EPISODE_TYPES_HPP
