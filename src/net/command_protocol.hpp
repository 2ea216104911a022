/**
 * Command protocol — JSON observation request / control response exchanged
 * with an external policy process.
 *
 * Request (one compact JSON object, ENU frame):
 *   meta          {episode_id, t, dt, sim_tick}
 *   frames        {frame: "ENU"}
 *   blue          {pos_m, vel_mps, quat_wxyz, ang_vel_radps, fuel_frac}
 *   red           {pos_m, vel_mps, quat_wxyz}
 *   guidance      {los_unit, los_rate_radps, range_m, closing_speed_mps,
 *                  fov_ok, g_limit_ok}
 *   env           {wind_mps, noise_std, episode_step, max_steps}
 *   normalization {obs_version, vecnorm_stats_id}
 *
 * Response:
 *   {"action": {"thrust_cmd": t, "rate_cmd_radps": {"x":..,"y":..,"z":..}}}
 * or the flat form {"thrust_cmd": t, "rate_cmd": {"x":..,"y":..,"z":..}}.
 * Rate axes are body pitch (x), yaw (y), roll (z). A response with any
 * field missing or non-finite is rejected as a whole.
 *
 * Health check: {"type":"health"} answered by {"status":"ok"}.
 */

#ifndef PURSUIT_COMMAND_PROTOCOL_HPP
#define PURSUIT_COMMAND_PROTOCOL_HPP

#include "physics/rigid_body.hpp"
#include <optional>
#include <string>

namespace pursuit::net {

struct BlueObservation {
    Vec3 pos_m;
    Vec3 vel_mps;
    Quat quat_wxyz;
    Vec3 ang_vel_radps;
    double fuel_frac = 1.0;
};

struct RedObservation {
    Vec3 pos_m;
    Vec3 vel_mps;
    Quat quat_wxyz;
};

struct GuidanceObservation {
    Vec3 los_unit{1.0, 0.0, 0.0};
    Vec3 los_rate_radps;
    double range_m = 0.0;
    double closing_speed_mps = 0.0;
    bool fov_ok = true;
    bool g_limit_ok = true;
};

/// Everything the request carries besides the two body states
struct RequestContext {
    std::string episode_id = "live";
    double t = 0.0;
    double dt = 0.01;
    long long sim_tick = 0;
    long long episode_step = 0;
    long long max_steps = 9999;
    Vec3 wind_mps;
    double noise_std = 0.01;
    std::string obs_version = "obs_v1.0";
    std::string vecnorm_stats_id;
    bool fov_ok = true;
    bool g_limit_ok = true;
};

/// All vectors ENU
struct CommandRequest {
    RequestContext context;
    BlueObservation blue;
    RedObservation red;
    GuidanceObservation guidance;
};

struct ExternalCommand {
    double thrust = 0.0;       // [0, 1]
    Vec3 rate_cmd_radps;       // body x = pitch, y = yaw, z = roll
};

class CommandProtocol {
public:
    /**
     * @brief Line-of-sight quantities from relative ENU state
     *
     * los_unit defaults to (1, 0, 0) when the bodies coincide; the LOS rate
     * (r x v_rel) / |r|^2 is zero when |r|^2 <= 1e-6.
     */
    static GuidanceObservation compute_guidance(const Vec3& blue_pos, const Vec3& blue_vel,
                                                const Vec3& red_pos, const Vec3& red_vel);

    /// Snapshot two internal-frame bodies into an ENU request
    static CommandRequest build_request(const RequestContext& ctx,
                                        const RigidBody& blue, double fuel_frac,
                                        const RigidBody& red);

    /// Compact single-line JSON; non-finite numbers written as 0
    static std::string serialize(const CommandRequest& req);

    static std::string health_request();
    static bool is_health_ok(const std::string& reply);

    /// nullopt on any malformed, partial or non-finite reply; reason in *error
    static std::optional<ExternalCommand> decode_response(const std::string& reply,
                                                          std::string* error = nullptr);
};

} // namespace pursuit::net

#endif // PURSUIT_COMMAND_PROTOCOL_HPP
