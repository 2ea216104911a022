/**
 * replay_tool — Headless episode replay and listing.
 *
 * Replays a recorded episode through the ReplayEngine: kinematic agents are
 * posed from the recording, command-driven agents fly their recorded
 * actions through a full interceptor pipeline. Optionally writes the
 * sampled trajectory JSON and reports how far command-driven agents
 * drifted from the recording.
 *
 * Usage:
 *   replay_tool --episode <path> [--config <path>] [--speed S] [--seek T]
 *               [--no-cruise] [--kinematic-all] [--recorded-orientation]
 *               [--output <path>] [--sample-interval I] [--verbose]
 *   replay_tool --list <dir>
 */

#include "config/sim_config.hpp"
#include "control/interceptor.hpp"
#include "physics/rigid_body.hpp"
#include "physics/vec3_ops.hpp"
#include "replay/agent_replayer.hpp"
#include "replay/episode_store.hpp"
#include "replay/replay_engine.hpp"
#include "replay/trajectory_writer.hpp"

#include <algorithm>
#include <chrono>
#include <cmath>
#include <fstream>
#include <iomanip>
#include <iostream>
#include <memory>
#include <string>
#include <vector>

using namespace pursuit;

namespace {

struct ToolOptions {
    std::string episode_path;
    std::string list_dir;
    std::string config_path;
    std::string output_path;
    double speed = -1.0;            // < 0: from config
    double seek_time = -1.0;        // < 0: no seek
    double sample_interval = -1.0;  // < 0: from config
    bool no_cruise = false;
    bool kinematic_all = false;
    bool recorded_orientation = false;
    bool verbose = false;
};

/// One replayed agent and everything it owns
struct ReplayedAgent {
    std::unique_ptr<SimpleRigidBody> body;
    std::unique_ptr<control::Interceptor> airframe;
    std::unique_ptr<replay::AgentReplayer> replayer;
    replay::AgentStatus last_status = replay::AgentStatus::Active;
    bool detonation_logged = false;
};

void print_usage(const char* prog) {
    std::cerr << "Usage: " << prog << " --episode <path> [options]\n"
              << "       " << prog << " --list <dir>\n"
              << "\n"
              << "Options:\n"
              << "  --episode <path>        Episode JSONL file\n"
              << "  --list <dir>            List episodes in a directory, newest first\n"
              << "  --config <path>         JSON config file\n"
              << "  --speed S               Play speed, clamped to [0.1, 10]\n"
              << "  --seek T                Start playback at episode time T\n"
              << "  --no-cruise             Skip the cruise-in approach\n"
              << "  --kinematic-all         Replay every agent kinematically\n"
              << "  --recorded-orientation  Slerp recorded attitudes instead of facing travel\n"
              << "  --output <path>         Trajectory JSON output\n"
              << "  --sample-interval I     Seconds between trajectory samples\n"
              << "  --verbose               Progress to stderr\n"
              << "  --help                  Show this message\n";
}

int list_episodes(const std::string& dir) {
    auto listing = replay::EpisodeStore::scan_directory(dir);
    if (listing.empty()) {
        std::cerr << "No episodes in " << dir << "\n";
        return 0;
    }

    std::cout << std::left << std::setw(32) << "file"
              << std::setw(24) << "episode"
              << std::setw(12) << "outcome"
              << std::right << std::setw(10) << "duration"
              << std::setw(8) << "steps"
              << std::setw(10) << "final_m"
              << "  radar\n";
    for (const auto& m : listing) {
        std::cout << std::left << std::setw(32) << m.file_name
                  << std::setw(24) << m.episode_id
                  << std::setw(12) << (m.has_footer ? m.outcome : "(running)")
                  << std::right << std::fixed << std::setprecision(2)
                  << std::setw(10) << m.duration
                  << std::setw(8) << m.steps
                  << std::setw(10) << m.final_distance
                  << "  " << (m.has_radar_data ? "yes" : "no") << "\n";
    }
    return 0;
}

control::InterceptorParams airframe_params(const SimConfig& config,
                                           const replay::EpisodeHeader& header,
                                           double dt) {
    control::InterceptorParams p = config.engagement.interceptor;
    p.dt = dt;
    if (header.interceptor) {
        const auto& scene = *header.interceptor;
        if (scene.max_torque.norm() > 0.0) p.max_torque = scene.max_torque;
        if (scene.sensor_fov_deg > 0.0) p.seeker.half_fov_deg = 0.5 * scene.sensor_fov_deg;
    }
    return p;
}

int run_replay(const ToolOptions& opts) {
    SimConfig config;
    if (!opts.config_path.empty()) {
        config = ConfigParser::parse_file(opts.config_path);
    }
    if (opts.speed > 0.0) config.replay.play_speed = opts.speed;
    if (opts.no_cruise) config.replay.cruise.enabled = false;
    if (opts.kinematic_all) config.replay.agent_modes.clear();
    if (opts.recorded_orientation) {
        config.replay.orientation_source = replay::OrientationSource::RecordedSlerp;
    }
    double sample_interval = opts.sample_interval >= 0.0 ? opts.sample_interval
                                                         : config.sample_interval;
    config.episode.verbose = opts.verbose;

    replay::Episode episode = replay::EpisodeStore::parse(opts.episode_path, config.episode);
    const replay::EpisodeFrame& first = episode.frames.front();

    double dt = (config.replay.match_header_dt && episode.dt_nominal > 0.0)
                    ? episode.dt_nominal : config.replay.default_dt;

    // ── Build one body per recorded agent ──
    std::vector<ReplayedAgent> agents;
    for (const auto& [id, state] : first.agents) {
        ReplayedAgent a;
        double mass = config.engagement.interceptor_mass_kg;
        if (id.rfind("threat", 0) == 0) mass = config.engagement.threat_mass_kg;
        if (episode.header.interceptor && config.replay.mode_for(id) == replay::AgentMode::CommandDriven &&
            episode.header.interceptor->mass_kg > 0.0) {
            mass = episode.header.interceptor->mass_kg;
        }

        a.body = std::make_unique<SimpleRigidBody>(Pose{}, mass, config.engagement.interceptor_inertia);
        if (config.replay.mode_for(id) == replay::AgentMode::CommandDriven) {
            a.airframe = std::make_unique<control::Interceptor>(
                *a.body, airframe_params(config, episode.header, dt));
        }
        a.replayer = std::make_unique<replay::AgentReplayer>(id, *a.body, a.airframe.get());
        a.last_status = state.status;
        agents.push_back(std::move(a));
    }

    // Each airframe pursues the first agent that is not itself command driven
    const RigidBody* target = nullptr;
    for (const auto& a : agents) {
        if (!a.airframe) { target = a.body.get(); break; }
    }
    for (auto& a : agents) {
        if (a.airframe) a.airframe->set_target(target);
    }

    replay::ReplayEngine engine(config.replay);
    for (auto& a : agents) engine.attach_agent(*a.replayer);

    std::string episode_id = episode.header.episode_id;
    std::string outcome = episode.footer ? episode.footer->outcome : "unknown";
    engine.load(std::move(episode));

    replay::TrajectoryWriter writer;
    replay::TrajectoryWriter::BodyList bodies;
    for (const auto& a : agents) bodies.emplace_back(a.replayer->id(), a.body.get());
    writer.init(bodies, sample_interval);

    if (opts.seek_time >= 0.0) engine.seek(opts.seek_time);
    engine.set_paused(false);

    if (opts.verbose) {
        std::cerr << "=== Replay ===\n"
                  << "Episode: " << episode_id << " (" << engine.episode().frames.size() << " frames)\n"
                  << "Span: " << engine.start_time() << "s -> " << engine.end_time() << "s\n"
                  << "Agents: " << agents.size() << "\n"
                  << "Cruise agent: " << (engine.cruise_agent().empty() ? "-" : engine.cruise_agent()) << "\n"
                  << "Timestep: " << engine.dt() << "s, speed " << engine.play_speed() << "x\n\n";
    }

    // Tick cap: cruise + freeze + playback, with headroom
    double playback = (engine.end_time() - engine.start_time()) / (engine.dt() * engine.play_speed());
    double cruise = config.replay.cruise.enabled
        ? config.replay.cruise.duration_s / (engine.dt() * std::max(1e-3, config.replay.cruise.play_speed))
        : 0.0;
    long long max_ticks = static_cast<long long>(2.0 * (playback + cruise)) + config.replay.freeze_ticks + 100;

    auto t_start = std::chrono::high_resolution_clock::now();

    double sim_time = 0.0;
    long long ticks = 0;
    replay::ReplayPhase last_phase = engine.phase();
    while (!engine.finished() && ticks < max_ticks) {
        engine.tick();
        for (auto& a : agents) a.body->step(engine.dt());
        sim_time += engine.dt();
        ticks++;

        if (engine.phase() != last_phase) {
            if (engine.phase() == replay::ReplayPhase::Replay) {
                for (const auto& a : agents) {
                    writer.record_event({sim_time, "SPAWN", a.replayer->id(),
                                         replay::agent_mode_to_string(a.replayer->mode()),
                                         a.body->pose().position});
                }
            }
            if (opts.verbose) {
                std::cerr << "[replay_tool] t=" << engine.time() << "s phase "
                          << replay::phase_to_string(engine.phase()) << "\n";
            }
            last_phase = engine.phase();
        }

        if (const replay::EpisodeFrame* frame = engine.current_frame()) {
            for (auto& a : agents) {
                const replay::AgentState* s = frame->find(a.replayer->id());
                if (!s || s->status == a.last_status) continue;
                writer.record_event({sim_time, "STATUS", a.replayer->id(),
                                     replay::status_to_string(s->status), a.body->pose().position});
                if (s->status != replay::AgentStatus::Active) writer.record_end(a.replayer->id(), sim_time);
                a.last_status = s->status;
            }
        }

        for (auto& a : agents) {
            if (a.airframe && a.airframe->fuse().detonated() && !a.detonation_logged) {
                a.detonation_logged = true;
                writer.record_event({sim_time, "DETONATION", a.replayer->id(), "",
                                     a.body->pose().position});
                writer.record_end(a.replayer->id(), sim_time);
                a.airframe->set_target(nullptr);
            }
        }

        writer.sample(sim_time);
    }

    auto t_end = std::chrono::high_resolution_clock::now();
    double elapsed = std::chrono::duration<double>(t_end - t_start).count();

    if (!engine.finished()) {
        std::cerr << "[replay_tool] Stopped after " << ticks << " ticks before the last frame\n";
    }

    // ── Report ──
    std::cout << "Episode " << episode_id << ": outcome " << outcome
              << ", replayed " << ticks << " ticks in " << elapsed << "s\n";
    for (const auto& a : agents) {
        const std::string& id = a.replayer->id();
        std::cout << "  " << id << " [" << replay::agent_mode_to_string(a.replayer->mode()) << "]";
        if (auto recorded = engine.sample(id, engine.time())) {
            double drift = distance(recorded->pose.position, a.body->pose().position);
            std::cout << " drift " << std::fixed << std::setprecision(3) << drift << " m";
            std::cout.unsetf(std::ios::fixed);
        }
        if (a.airframe) {
            std::cout << ", fuel " << a.airframe->fuel().remaining_kg() << " kg";
            if (a.airframe->fuse().detonated()) std::cout << ", detonated";
        }
        std::cout << "\n";
    }

    if (!opts.output_path.empty()) {
        std::ofstream out(opts.output_path);
        if (!out.is_open()) {
            std::cerr << "Error: cannot open output file: " << opts.output_path << "\n";
            return 1;
        }
        writer.write_json(out, replay::TrajectoryInfo{episode_id, "replay", outcome, engine.dt()});
        if (opts.verbose) std::cerr << "Trajectory written to: " << opts.output_path << "\n";
    }
    return 0;
}

}  // namespace

int main(int argc, char* argv[]) {
    ToolOptions opts;

    for (int i = 1; i < argc; i++) {
        std::string arg = argv[i];

        try {
            if (arg == "--help" || arg == "-h") {
                print_usage(argv[0]);
                return 0;
            } else if (arg == "--episode" && i + 1 < argc) {
                opts.episode_path = argv[++i];
            } else if (arg == "--list" && i + 1 < argc) {
                opts.list_dir = argv[++i];
            } else if (arg == "--config" && i + 1 < argc) {
                opts.config_path = argv[++i];
            } else if (arg == "--output" && i + 1 < argc) {
                opts.output_path = argv[++i];
            } else if (arg == "--speed" && i + 1 < argc) {
                opts.speed = std::stod(argv[++i]);
            } else if (arg == "--seek" && i + 1 < argc) {
                opts.seek_time = std::stod(argv[++i]);
            } else if (arg == "--sample-interval" && i + 1 < argc) {
                opts.sample_interval = std::stod(argv[++i]);
            } else if (arg == "--no-cruise") {
                opts.no_cruise = true;
            } else if (arg == "--kinematic-all") {
                opts.kinematic_all = true;
            } else if (arg == "--recorded-orientation") {
                opts.recorded_orientation = true;
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

    if (!opts.list_dir.empty()) {
        return list_episodes(opts.list_dir);
    }

    if (opts.episode_path.empty()) {
        std::cerr << "Error: --episode or --list is required\n\n";
        print_usage(argv[0]);
        return 1;
    }

    try {
        return run_replay(opts);
    } catch (const replay::EpisodeLoadError& e) {
        std::cerr << "Error loading episode: " << e.what() << "\n";
        return 1;
    } catch (const std::runtime_error& e) {
        std::cerr << "Error: " << e.what() << "\n";
        return 1;
    }
}
