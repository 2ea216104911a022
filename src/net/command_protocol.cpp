#include "net/command_protocol.hpp"
#include "coordinate/enu_frame.hpp"
#include "io/json_reader.hpp"
#include "io/json_writer.hpp"
#include "physics/vec3_ops.hpp"

#include <algorithm>
#include <cmath>
#include <sstream>

namespace pursuit::net {

static void set_error(std::string* error, const std::string& msg) {
    if (error) *error = msg;
}

GuidanceObservation CommandProtocol::compute_guidance(const Vec3& blue_pos, const Vec3& blue_vel,
                                                      const Vec3& red_pos, const Vec3& red_vel) {
    GuidanceObservation g;
    Vec3 r = red_pos - blue_pos;
    Vec3 rel_v = red_vel - blue_vel;

    g.range_m = r.norm();
    if (g.range_m >= 1e-6) {
        g.los_unit = r / g.range_m;
    }

    double r2 = r.squared_norm();
    if (r2 > 1e-6) {
        g.los_rate_radps = cross(r, rel_v) / r2;
    }

    g.closing_speed_mps = -dot(g.los_unit, rel_v);
    return g;
}

CommandRequest CommandProtocol::build_request(const RequestContext& ctx,
                                              const RigidBody& blue, double fuel_frac,
                                              const RigidBody& red) {
    CommandRequest req;
    req.context = ctx;

    Pose bp = blue.pose();
    req.blue.pos_m = EnuFrame::to_external(bp.position);
    req.blue.vel_mps = EnuFrame::to_external(blue.velocity());
    auto bq = EnuFrame::internal_rotation_to_enu_wxyz(bp.orientation);
    req.blue.quat_wxyz = Quat{bq[0], bq[1], bq[2], bq[3]};
    req.blue.ang_vel_radps = EnuFrame::to_external(blue.angular_velocity());
    req.blue.fuel_frac = std::clamp(EnuFrame::sanitize(fuel_frac), 0.0, 1.0);

    Pose rp = red.pose();
    req.red.pos_m = EnuFrame::to_external(rp.position);
    req.red.vel_mps = EnuFrame::to_external(red.velocity());
    auto rq = EnuFrame::internal_rotation_to_enu_wxyz(rp.orientation);
    req.red.quat_wxyz = Quat{rq[0], rq[1], rq[2], rq[3]};

    req.guidance = compute_guidance(req.blue.pos_m, req.blue.vel_mps,
                                    req.red.pos_m, req.red.vel_mps);
    req.guidance.fov_ok = ctx.fov_ok;
    req.guidance.g_limit_ok = ctx.g_limit_ok;
    return req;
}

// ── Serialization ──

static void write_vec(JsonWriter& w, const std::string& key, const Vec3& v) {
    w.kv(key, EnuFrame::sanitize(v));
}

static void write_quat(JsonWriter& w, const std::string& key, const Quat& q) {
    w.kv(key, EnuFrame::sanitize(q));
}

std::string CommandProtocol::serialize(const CommandRequest& req) {
    std::ostringstream oss;
    JsonWriter w(oss, JsonLayout::Line);
    const RequestContext& c = req.context;

    w.begin_object();

    w.key("meta").begin_object();
    w.kv("episode_id", c.episode_id);
    w.kv("t", EnuFrame::sanitize(c.t));
    w.kv("dt", EnuFrame::sanitize(c.dt));
    w.kv("sim_tick", c.sim_tick);
    w.end_object();

    w.key("frames").begin_object();
    w.kv("frame", "ENU");
    w.end_object();

    w.key("blue").begin_object();
    write_vec(w, "pos_m", req.blue.pos_m);
    write_vec(w, "vel_mps", req.blue.vel_mps);
    write_quat(w, "quat_wxyz", req.blue.quat_wxyz);
    write_vec(w, "ang_vel_radps", req.blue.ang_vel_radps);
    w.kv("fuel_frac", EnuFrame::sanitize(req.blue.fuel_frac));
    w.end_object();

    w.key("red").begin_object();
    write_vec(w, "pos_m", req.red.pos_m);
    write_vec(w, "vel_mps", req.red.vel_mps);
    write_quat(w, "quat_wxyz", req.red.quat_wxyz);
    w.end_object();

    const GuidanceObservation& g = req.guidance;
    w.key("guidance").begin_object();
    write_vec(w, "los_unit", g.los_unit);
    write_vec(w, "los_rate_radps", g.los_rate_radps);
    w.kv("range_m", EnuFrame::sanitize(g.range_m));
    w.kv("closing_speed_mps", EnuFrame::sanitize(g.closing_speed_mps));
    w.kv("fov_ok", g.fov_ok);
    w.kv("g_limit_ok", g.g_limit_ok);
    w.end_object();

    w.key("env").begin_object();
    write_vec(w, "wind_mps", c.wind_mps);
    w.kv("noise_std", EnuFrame::sanitize(c.noise_std));
    w.kv("episode_step", c.episode_step);
    w.kv("max_steps", c.max_steps);
    w.end_object();

    w.key("normalization").begin_object();
    w.kv("obs_version", c.obs_version);
    w.kv("vecnorm_stats_id", c.vecnorm_stats_id);
    w.end_object();

    w.end_object();
    return oss.str();
}

std::string CommandProtocol::health_request() {
    return "{\"type\":\"health\"}";
}

bool CommandProtocol::is_health_ok(const std::string& reply) {
    try {
        return JsonReader::parse(reply)["status"].get_string("") == "ok";
    } catch (const std::runtime_error&) {
        return false;
    }
}

// ── Decoding ──

static bool read_finite(const JsonValue& v, double& out) {
    if (!v.is_number() || !std::isfinite(v.as_number())) return false;
    out = v.as_number();
    return true;
}

std::optional<ExternalCommand> CommandProtocol::decode_response(const std::string& reply,
                                                                std::string* error) {
    JsonValue root;
    try {
        root = JsonReader::parse(reply);
    } catch (const std::runtime_error& e) {
        set_error(error, std::string("unparseable response: ") + e.what());
        return std::nullopt;
    }
    if (!root.is_object()) {
        set_error(error, "response is not an object");
        return std::nullopt;
    }

    // Nested form first, flat form as fallback
    const JsonValue* body = &root;
    const char* rate_key = "rate_cmd";
    if (root["action"].is_object()) {
        body = &root["action"];
        rate_key = "rate_cmd_radps";
    }

    ExternalCommand cmd;
    if (!read_finite((*body)["thrust_cmd"], cmd.thrust)) {
        set_error(error, "thrust_cmd missing or non-finite");
        return std::nullopt;
    }

    if (!(*body)[rate_key].get_xyz(cmd.rate_cmd_radps) || !is_finite(cmd.rate_cmd_radps)) {
        set_error(error, std::string(rate_key) + " missing, partial or non-finite");
        return std::nullopt;
    }

    cmd.thrust = std::clamp(cmd.thrust, 0.0, 1.0);
    return cmd;
}

} // namespace pursuit::net
