#include "replay/episode_recorder.hpp"
#include "io/json_writer.hpp"

namespace pursuit::replay {

void EpisodeRecorder::write_header(const EpisodeHeader& header) {
    JsonWriter w(out_, JsonLayout::Line);
    w.begin_object();
    w.kv("type", "header");
    w.kv("episode_id", header.episode_id);
    w.kv("start_time", header.start_time);
    if (header.dt_nominal) w.kv("dt_nominal", *header.dt_nominal);
    if (header.seed) w.kv("seed", *header.seed);
    if (!header.coord_frame.empty()) w.kv("coord_frame", header.coord_frame);
    if (!header.scenario.empty()) w.kv("scenario", header.scenario);

    if (header.interceptor || header.threat) {
        w.key("scene").begin_object();
        if (header.interceptor) {
            const auto& ic = *header.interceptor;
            w.key("interceptor_0").begin_object();
            w.kv("mass_kg", ic.mass_kg);
            w.kv("max_torque", ic.max_torque);
            w.kv("sensor_fov_deg", ic.sensor_fov_deg);
            w.kv("max_thrust_n", ic.max_thrust_n);
            w.end_object();
        }
        if (header.threat) {
            const auto& tc = *header.threat;
            w.key("threat_0").begin_object();
            w.kv("type", tc.type);
            w.kv("mass_kg", tc.mass_kg);
            w.kv("aim_point", tc.aim_point);
            w.end_object();
        }
        w.end_object();
    }
    w.end_object();
    out_ << "\n";
    lines_++;
}

void EpisodeRecorder::write_state(double t, const std::string& entity_id, const AgentState& state) {
    JsonWriter w(out_, JsonLayout::Line);
    w.begin_object();
    w.kv("type", "state");
    w.kv("timestamp", t);
    w.kv("entity_id", entity_id);

    w.key("state").begin_object();
    w.kv("position", state.position);
    if (state.has_velocity) w.kv("velocity", state.velocity);
    if (state.has_orientation) w.kv("orientation", state.orientation);
    w.kv("angular_velocity", state.angular_velocity);
    if (state.fuel_kg) w.kv("fuel", *state.fuel_kg);
    if (!state.action.empty()) {
        w.key("action").begin_array();
        for (double a : state.action) w.value(a);
        w.end_array();
    }
    w.kv("status", status_to_string(state.status));
    w.end_object();

    w.end_object();
    out_ << "\n";
    lines_++;
}

void EpisodeRecorder::write_radar(double t, const RadarFrame& radar) {
    JsonWriter w(out_, JsonLayout::Line);
    w.begin_object();
    w.kv("type", "state");
    w.kv("timestamp", t);
    w.kv("entity_id", "radar");

    w.key("state").begin_object();
    w.key("onboard").begin_object();
    w.kv("detected", radar.onboard.detected);
    w.kv("range_to_target", radar.onboard.range_to_target);
    w.kv("beam_angle_to_target_deg", radar.onboard.beam_angle_to_target_deg);
    w.kv("half_beam_width_deg", radar.onboard.half_beam_width_deg);
    w.kv("forward_vector", radar.onboard.forward_vector);
    w.kv("in_beam", radar.onboard.in_beam);
    w.kv("detection_reason", radar.onboard.detection_reason);
    w.end_object();

    w.key("ground").begin_object();
    w.kv("enabled", radar.ground.enabled);
    w.kv("detected", radar.ground.detected);
    w.kv("range_to_target", radar.ground.range_to_target);
    w.kv("elevation_deg", radar.ground.elevation_deg);
    w.end_object();

    w.key("fusion").begin_object();
    w.kv("both_detected", radar.fusion.both_detected);
    w.kv("any_detected", radar.fusion.any_detected);
    w.kv("fusion_confidence", radar.fusion.fusion_confidence);
    w.end_object();
    w.end_object();

    w.end_object();
    out_ << "\n";
    lines_++;
}

void EpisodeRecorder::write_footer(const EpisodeFooter& footer) {
    JsonWriter w(out_, JsonLayout::Line);
    w.begin_object();
    w.kv("type", "footer");
    w.kv("episode_id", footer.episode_id);
    w.kv("end_time", footer.end_time);
    w.kv("duration", footer.duration);
    w.kv("outcome", footer.outcome);

    const EpisodeMetrics& m = footer.metrics;
    w.key("metrics").begin_object();
    w.kv("total_reward", m.total_reward);
    w.kv("steps", m.steps);
    w.kv("final_distance", m.final_distance);
    w.kv("fuel_used", m.fuel_used);
    w.kv("volley_mode", m.volley_mode);
    w.kv("missiles_intercepted", m.missiles_intercepted);
    w.end_object();

    w.end_object();
    out_ << "\n";
    lines_++;
}

} // namespace pursuit::replay
