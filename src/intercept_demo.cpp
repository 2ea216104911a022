/**
 * intercept_demo — Closed-loop interceptor vs. a straight-line threat.
 *
 * The interceptor flies the full control pipeline (seeker, proportional
 * navigation, arbiter, PID rate loop, actuator, motor, fuse). With
 * --policy-socket an external policy process takes over through the
 * command channel once it answers the health check; autonomous guidance
 * resumes only if it never does.
 *
 * Optionally records the run as an episode JSONL file that replay_tool
 * can play back, and writes a sampled trajectory JSON.
 *
 * Usage:
 *   intercept_demo [--config <path>] [--max-time T] [--dt D]
 *                  [--policy-socket <path>] [--record <jsonl>]
 *                  [--output <json>] [--episode-id ID] [--verbose]
 */

#include "config/sim_config.hpp"
#include "control/interceptor.hpp"
#include "control/threat_motion.hpp"
#include "coordinate/enu_frame.hpp"
#include "net/command_channel.hpp"
#include "net/ipc_socket.hpp"
#include "physics/rigid_body.hpp"
#include "physics/vec3_ops.hpp"
#include "replay/episode_recorder.hpp"
#include "replay/trajectory_writer.hpp"

#include <algorithm>
#include <chrono>
#include <cmath>
#include <ctime>
#include <fstream>
#include <iomanip>
#include <iostream>
#include <memory>
#include <string>

using namespace pursuit;

namespace {

const char* INTERCEPTOR_ID = "interceptor_0";
const char* THREAT_ID = "threat_0";

struct DemoOptions {
    std::string config_path;
    std::string policy_socket;
    std::string record_path;
    std::string output_path;
    std::string episode_id;
    double max_time = -1.0;   // < 0: from config
    double dt = -1.0;         // < 0: from config
    bool verbose = false;
};

void print_usage(const char* prog) {
    std::cerr << "Usage: " << prog << " [options]\n"
              << "\n"
              << "Options:\n"
              << "  --config <path>         JSON config file\n"
              << "  --max-time T            Engagement time limit [s]\n"
              << "  --dt D                  Control timestep [s]\n"
              << "  --policy-socket <path>  External policy Unix socket\n"
              << "  --record <path>         Write the run as an episode JSONL file\n"
              << "  --output <path>         Trajectory JSON output\n"
              << "  --episode-id ID         Episode id for the recording\n"
              << "  --verbose               Progress to stderr\n"
              << "  --help                  Show this message\n";
}

std::string utc_timestamp() {
    std::time_t now = std::time(nullptr);
    std::tm tm_utc{};
    gmtime_r(&now, &tm_utc);
    char buf[32];
    std::strftime(buf, sizeof(buf), "%Y-%m-%dT%H:%M:%SZ", &tm_utc);
    return buf;
}

double peak_thrust(const control::InterceptorParams& p) {
    double peak = 0.0;
    if (p.thrust_curve) {
        for (const auto& k : p.thrust_curve->keys()) peak = std::max(peak, k.newtons);
    }
    return peak;
}

/// Body state as a recorded episode entry (ENU, world->body attitude)
replay::AgentState snapshot(const RigidBody& body, replay::AgentStatus status) {
    replay::AgentState s;
    Pose pose = body.pose();
    s.position = EnuFrame::to_external(pose.position);
    s.velocity = EnuFrame::to_external(body.velocity());
    s.angular_velocity = EnuFrame::to_external(body.angular_velocity());

    auto q = EnuFrame::internal_rotation_to_enu_wxyz(pose.orientation);
    s.orientation = quat_conjugate(Quat{q[0], q[1], q[2], q[3]});
    s.has_orientation = true;
    s.has_velocity = true;
    s.status = status;
    return s;
}

int run_demo(const DemoOptions& opts) {
    SimConfig config;
    if (!opts.config_path.empty()) {
        config = ConfigParser::parse_file(opts.config_path);
    }
    EngagementConfig& eng = config.engagement;
    if (opts.dt > 0.0) {
        eng.dt = opts.dt;
        eng.interceptor.dt = opts.dt;
    }
    if (opts.max_time > 0.0) eng.max_time_s = opts.max_time;
    if (!opts.policy_socket.empty()) config.policy.socket_path = opts.policy_socket;

    const double dt = eng.dt;
    std::string episode_id = opts.episode_id.empty() ? "intercept_" + std::to_string(std::time(nullptr))
                                                     : opts.episode_id;

    // ── Bodies ──
    Vec3 heading = EnuFrame::to_internal(eng.interceptor_heading_enu);
    if (heading.squared_norm() == 0.0) heading = Vec3{0, 0, 1};

    SimpleRigidBody missile_body(
        Pose{EnuFrame::to_internal(eng.interceptor_position_enu), EnuFrame::look_rotation(heading)},
        eng.interceptor_mass_kg, eng.interceptor_inertia);
    missile_body.set_velocity(EnuFrame::to_internal(eng.interceptor_velocity_enu));
    missile_body.set_gravity(EnuFrame::to_internal(eng.gravity_enu));

    Vec3 threat_start = EnuFrame::to_internal(eng.threat_position_enu);
    Vec3 aim_point = EnuFrame::to_internal(eng.threat_aim_point_enu);
    SimpleRigidBody threat_body(Pose{threat_start, EnuFrame::look_rotation(aim_point - threat_start)},
                                eng.threat_mass_kg);

    control::Interceptor missile(missile_body, eng.interceptor);
    missile.set_target(&threat_body);
    control::ThreatMotion threat(threat_body, control::ThreatParams{aim_point, eng.threat_speed_mps});

    // ── External policy ──
    std::unique_ptr<net::UnixSocketTransport> transport;
    std::unique_ptr<net::CommandChannel> channel;
    if (!config.policy.socket_path.empty()) {
        transport = std::make_unique<net::UnixSocketTransport>(config.policy.socket_path);
        channel = std::make_unique<net::CommandChannel>(*transport, config.policy.channel);
        channel->start();
        std::cerr << "[intercept_demo] Policy channel on " << config.policy.socket_path << "\n";
    }

    // ── Outputs ──
    std::ofstream record_file;
    std::unique_ptr<replay::EpisodeRecorder> recorder;
    if (!opts.record_path.empty()) {
        record_file.open(opts.record_path);
        if (!record_file.is_open()) {
            std::cerr << "Error: cannot open record file: " << opts.record_path << "\n";
            if (channel) channel->stop();
            return 1;
        }
        recorder = std::make_unique<replay::EpisodeRecorder>(record_file);

        replay::EpisodeHeader header;
        header.episode_id = episode_id;
        header.start_time = utc_timestamp();
        header.dt_nominal = dt;
        header.coord_frame = "ENU";
        header.scenario = "single_intercept";
        replay::InterceptorSceneConfig ic;
        ic.mass_kg = eng.interceptor_mass_kg;
        ic.max_torque = eng.interceptor.max_torque;
        ic.sensor_fov_deg = 2.0 * eng.interceptor.seeker.half_fov_deg;
        ic.max_thrust_n = peak_thrust(eng.interceptor);
        header.interceptor = ic;
        header.threat = replay::ThreatSceneConfig{"straight_line", eng.threat_mass_kg, eng.threat_aim_point_enu};
        recorder->write_header(header);
    }

    replay::TrajectoryWriter writer;
    writer.init({{INTERCEPTOR_ID, &missile_body}, {THREAT_ID, &threat_body}}, config.sample_interval);
    writer.record_event({0.0, "SPAWN", INTERCEPTOR_ID, "", missile_body.pose().position});
    writer.record_event({0.0, "SPAWN", THREAT_ID, "", threat_body.pose().position});

    if (opts.verbose) {
        std::cerr << "=== Intercept ===\n"
                  << "Timestep: " << dt << "s, limit " << eng.max_time_s << "s\n"
                  << "Initial range: " << distance(missile_body.pose().position, threat_start) << " m\n"
                  << "Guidance: " << (channel ? "external policy" : "pronav") << "\n\n";
    }

    auto t_start = std::chrono::high_resolution_clock::now();

    std::string outcome = "timeout";
    double t = 0.0;
    long long step = 0;
    const long long max_steps = static_cast<long long>(std::ceil(eng.max_time_s / dt));
    double initial_fuel = missile.fuel().remaining_kg();
    bool policy_announced = false;

    writer.sample(t);

    while (step < max_steps) {
        if (channel) {
            net::RequestContext ctx;
            ctx.episode_id = episode_id;
            ctx.t = t;
            ctx.dt = dt;
            ctx.sim_tick = step;
            ctx.episode_step = step;
            ctx.max_steps = max_steps;
            ctx.fov_ok = missile.seeker().has_lock();
            channel->submit(net::CommandProtocol::build_request(ctx, missile_body,
                                                                missile.fuel().fraction(), threat_body));
            if (auto cmd = channel->resolve(dt)) {
                missile.arbiter().activate_external(cmd->thrust, cmd->rate_cmd_radps);
                if (!policy_announced) {
                    std::cerr << "[intercept_demo] t=" << t << "s external policy in control\n";
                    policy_announced = true;
                }
            }
        }

        missile.tick(dt);
        threat.update(dt);
        missile_body.step(dt);
        threat_body.step(dt);
        t += dt;
        step++;

        bool hit = missile.fuse().detonated();
        bool leaked = !hit && threat.arrived();

        if (recorder) {
            replay::AgentState ms = snapshot(missile_body, hit ? replay::AgentStatus::Destroyed
                                                               : replay::AgentStatus::Active);
            const Vec3& rate = missile.arbiter().last_rate_command();
            ms.action = {rate.x, rate.y, rate.z, missile.arbiter().throttle(), 0.0, 0.0};
            ms.fuel_kg = missile.fuel().remaining_kg();
            recorder->write_state(t, INTERCEPTOR_ID, ms);

            replay::AgentStatus ts = hit ? replay::AgentStatus::Destroyed
                                 : leaked ? replay::AgentStatus::Finished : replay::AgentStatus::Active;
            recorder->write_state(t, THREAT_ID, snapshot(threat_body, ts));
        }

        writer.sample(t);

        if (hit) {
            outcome = "intercept";
            writer.record_event({t, "DETONATION", INTERCEPTOR_ID, "", missile_body.pose().position});
            writer.record_end(INTERCEPTOR_ID, t);
            writer.record_end(THREAT_ID, t);
            break;
        }
        if (leaked) {
            outcome = "threat_reached_target";
            writer.record_event({t, "STATUS", THREAT_ID, "finished", threat_body.pose().position});
            writer.record_end(THREAT_ID, t);
            break;
        }

        if (opts.verbose && step % static_cast<long long>(std::max(1.0, 1.0 / dt)) == 0) {
            std::cerr << "[intercept_demo] t=" << std::fixed << std::setprecision(2) << t
                      << "s range " << distance(missile_body.pose().position, threat_body.pose().position)
                      << " m, fuel " << missile.fuel().remaining_kg() << " kg, "
                      << (missile.seeker().has_lock() ? "locked" : "searching") << "\n";
            std::cerr.unsetf(std::ios::fixed);
        }
    }

    if (channel) channel->stop();

    auto t_end = std::chrono::high_resolution_clock::now();
    double elapsed = std::chrono::duration<double>(t_end - t_start).count();

    double final_distance = distance(missile_body.pose().position, threat_body.pose().position);
    double fuel_used = initial_fuel - missile.fuel().remaining_kg();

    if (recorder) {
        replay::EpisodeFooter footer;
        footer.episode_id = episode_id;
        footer.end_time = utc_timestamp();
        footer.duration = t;
        footer.outcome = outcome;
        footer.metrics.steps = static_cast<int>(step);
        footer.metrics.final_distance = final_distance;
        footer.metrics.fuel_used = fuel_used;
        footer.metrics.missiles_intercepted = outcome == "intercept" ? 1 : 0;
        recorder->write_footer(footer);
        std::cerr << "[intercept_demo] Recorded " << recorder->lines_written()
                  << " lines to " << opts.record_path << "\n";
    }

    std::cout << "Outcome: " << outcome << " at t=" << t << "s (" << step << " steps, "
              << elapsed << "s wall)\n"
              << "  closest approach " << missile.fuse().closest_approach() << " m, final range "
              << final_distance << " m\n"
              << "  fuel used " << fuel_used << " kg, guidance "
              << control::command_source_to_string(missile.arbiter().source()) << "\n";

    if (!opts.output_path.empty()) {
        std::ofstream out(opts.output_path);
        if (!out.is_open()) {
            std::cerr << "Error: cannot open output file: " << opts.output_path << "\n";
            return 1;
        }
        writer.write_json(out, replay::TrajectoryInfo{episode_id, "simulation", outcome, dt});
        if (opts.verbose) std::cerr << "Trajectory written to: " << opts.output_path << "\n";
    }
    return 0;
}

}  // namespace

int main(int argc, char* argv[]) {
    DemoOptions opts;

    for (int i = 1; i < argc; i++) {
        std::string arg = argv[i];

        try {
            if (arg == "--help" || arg == "-h") {
                print_usage(argv[0]);
                return 0;
            } else if (arg == "--config" && i + 1 < argc) {
                opts.config_path = argv[++i];
            } else if (arg == "--max-time" && i + 1 < argc) {
                opts.max_time = std::stod(argv[++i]);
            } else if (arg == "--dt" && i + 1 < argc) {
                opts.dt = std::stod(argv[++i]);
            } else if (arg == "--policy-socket" && i + 1 < argc) {
                opts.policy_socket = argv[++i];
            } else if (arg == "--record" && i + 1 < argc) {
                opts.record_path = argv[++i];
            } else if (arg == "--output" && i + 1 < argc) {
                opts.output_path = argv[++i];
            } else if (arg == "--episode-id" && i + 1 < argc) {
                opts.episode_id = argv[++i];
            } else if (arg == "--verbose" || arg == "-v") {
                opts.verbose = true;
            } else {
                std::cerr << "Unknown argument: " << arg << "\n";
                print_usage(argv[0]);
                return 1;
            }
        } catch (const std::logic_error&) {
            std::cerr << "Invalid value for " << arg << "\n";
            return 1;
        }
    }

    try {
        return run_demo(opts);
    } catch (const std::runtime_error& e) {
        std::cerr << "Error: " << e.what() << "\n";
        return 1;
    }
}
