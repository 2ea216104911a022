#include "replay/episode_store.hpp"
#include "coordinate/enu_frame.hpp"
#include "io/json_reader.hpp"
#include "physics/vec3_ops.hpp"

#include <sys/stat.h>
#include <algorithm>
#include <cmath>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <map>
#include <utility>

namespace pursuit::replay {

static constexpr size_t DT_SAMPLE_FRAMES = 10;
static const char* const RADAR_ENTITY = "radar";

// ═══════════════════════════════════════════════════════════════
// Field adapters
// ═══════════════════════════════════════════════════════════════

namespace {

/// Key names of a per-agent state object, per layout
struct StateKeys {
    const char* position;
    const char* velocity;
    const char* orientation;
    const char* angular_velocity;
    const char* fuel;
    const char* action;
};

constexpr StateKeys RECORD_KEYS{"position", "velocity", "orientation", "angular_velocity", "fuel", "action"};
constexpr StateKeys TIMESTEP_KEYS{"p", "v", "q", "w", "fuel_kg", "u"};

std::string trim(const std::string& s) {
    size_t b = s.find_first_not_of(" \t\r\n");
    if (b == std::string::npos) return "";
    size_t e = s.find_last_not_of(" \t\r\n");
    return s.substr(b, e - b + 1);
}

// Recorders disagree on whether timestamps are strings or numbers
std::string string_or_number(const JsonValue& v) {
    if (v.is_string()) return v.as_string();
    if (v.is_number()) return std::to_string(v.as_number());
    return "";
}

bool read_agent_state(const JsonValue& s, const StateKeys& keys, AgentState& out,
                      int& sanitized_count) {
    if (!s[keys.position].get_vec3(out.position) || !is_finite(out.position)) return false;

    out.has_velocity = s[keys.velocity].get_vec3(out.velocity);
    out.velocity = EnuFrame::sanitize(out.velocity);

    s[keys.angular_velocity].get_vec3(out.angular_velocity);
    out.angular_velocity = EnuFrame::sanitize(out.angular_velocity);

    std::vector<double> q;
    if (s[keys.orientation].get_numbers(q, 4)) {
        Quat raw{q[0], q[1], q[2], q[3]};
        if (EnuFrame::is_degenerate(raw)) sanitized_count++;
        out.orientation = EnuFrame::sanitize(raw);
        out.has_orientation = true;
    }

    if (s[keys.action].get_numbers(out.action)) {
        for (double& a : out.action) a = EnuFrame::sanitize(a);
    }

    const auto& fuel = s[keys.fuel];
    if (fuel.is_number() && std::isfinite(fuel.as_number())) {
        out.fuel_kg = std::max(0.0, fuel.as_number());
    }

    out.status = string_to_status(s["status"].get_string("active"));
    return true;
}

RadarFrame read_radar(const JsonValue& s) {
    RadarFrame r;

    const auto& on = s["onboard"];
    r.onboard.detected = on["detected"].get_bool(false);
    r.onboard.range_to_target = on["range_to_target"].get_number(0.0);
    r.onboard.beam_angle_to_target_deg = on["beam_angle_to_target_deg"].get_number(0.0);
    r.onboard.half_beam_width_deg = on["half_beam_width_deg"].get_number(0.0);
    on["forward_vector"].get_vec3(r.onboard.forward_vector);
    r.onboard.in_beam = on["in_beam"].get_bool(false);
    r.onboard.detection_reason = on["detection_reason"].get_string("");

    const auto& gr = s["ground"];
    r.ground.enabled = gr["enabled"].get_bool(false);
    r.ground.detected = gr["detected"].get_bool(false);
    r.ground.range_to_target = gr["range_to_target"].get_number(0.0);
    r.ground.elevation_deg = gr["elevation_deg"].get_number(0.0);

    const auto& fu = s["fusion"];
    if (fu.is_object()) {
        r.fusion.both_detected = fu["both_detected"].get_bool(false);
        r.fusion.any_detected = fu["any_detected"].get_bool(false);
        r.fusion.fusion_confidence = fu["fusion_confidence"].get_number(0.0);
    } else {
        r.fusion.both_detected = r.onboard.detected && r.ground.detected;
        r.fusion.any_detected = r.onboard.detected || r.ground.detected;
    }
    return r;
}

void read_scene(const JsonValue& scene, EpisodeHeader& h) {
    const auto& ic = scene["interceptor_0"];
    if (ic.is_object()) {
        InterceptorSceneConfig cfg;
        cfg.mass_kg = ic["mass_kg"].get_number(0.0);
        ic["max_torque"].get_vec3(cfg.max_torque);
        cfg.sensor_fov_deg = ic["sensor_fov_deg"].get_number(0.0);
        cfg.max_thrust_n = ic["max_thrust_n"].get_number(0.0);
        h.interceptor = cfg;
    }

    const auto& tc = scene["threat_0"];
    if (tc.is_object()) {
        ThreatSceneConfig cfg;
        cfg.type = tc["type"].get_string("");
        cfg.mass_kg = tc["mass_kg"].get_number(0.0);
        tc["aim_point"].get_vec3(cfg.aim_point);
        h.threat = cfg;
    }
}

// ── Record layout ──

void adapt_record_header(const JsonValue& rec, EpisodeHeader& h) {
    h.episode_id = rec["episode_id"].get_string(h.episode_id);
    h.start_time = string_or_number(rec["start_time"]);

    double dt = rec["dt_nominal"].get_number(0.0);
    if (dt > 0.0) h.dt_nominal = dt;
    if (rec["seed"].is_number()) h.seed = rec["seed"].get_int();
    h.coord_frame = rec["coord_frame"].get_string("");
    h.scenario = rec["scenario"].get_string("");

    read_scene(rec["scene"], h);
}

EpisodeFooter adapt_record_footer(const JsonValue& rec) {
    EpisodeFooter f;
    f.episode_id = rec["episode_id"].get_string("");
    f.end_time = string_or_number(rec["end_time"]);
    f.duration = rec["duration"].get_number(0.0);
    f.outcome = rec["outcome"].get_string("unknown");

    const auto& m = rec["metrics"];
    f.metrics.total_reward = m["total_reward"].get_number(0.0);
    f.metrics.steps = m["steps"].get_int(0);
    f.metrics.final_distance = m["final_distance"].get_number(0.0);
    f.metrics.fuel_used = m["fuel_used"].get_number(0.0);
    f.metrics.volley_mode = m["volley_mode"].get_bool(false);
    f.metrics.missiles_intercepted = m["missiles_intercepted"].get_int(0);
    return f;
}

// ── Timestep layout ──

void adapt_timestep_header(const JsonValue& rec, EpisodeHeader& h) {
    const auto& meta = rec["meta"];
    h.episode_id = meta["ep_id"].get_string(h.episode_id);
    if (meta["seed"].is_number()) h.seed = meta["seed"].get_int();
    h.coord_frame = meta["coord_frame"].get_string("");
    h.scenario = meta["scenario"].get_string("");

    double dt = meta["dt_nominal"].get_number(0.0);
    if (dt > 0.0) h.dt_nominal = dt;

    read_scene(rec["scene"], h);
}

bool adapt_timestep_frame(const JsonValue& rec, EpisodeFrame& frame, int& sanitized_count) {
    const auto& t = rec["t"];
    if (!t.is_number() || !std::isfinite(t.as_number())) return false;

    const auto& agents = rec["agents"];
    if (!agents.is_object() || agents.size() == 0) return false;

    frame.t = t.as_number();
    for (const auto& [id, state] : agents.as_object()) {
        AgentState a;
        if (!read_agent_state(state, TIMESTEP_KEYS, a, sanitized_count)) return false;
        frame.agents.emplace(id, std::move(a));
    }
    return true;
}

EpisodeFooter adapt_summary(const JsonValue& rec) {
    const auto& s = rec["summary"];
    EpisodeFooter f;
    f.outcome = s["outcome"].get_string("unknown");
    f.duration = s["episode_duration"].get_number(rec["t"].get_number(0.0));
    f.notes = s["notes"].get_string("");
    return f;
}

}  // anonymous namespace

// ═══════════════════════════════════════════════════════════════
// Full load
// ═══════════════════════════════════════════════════════════════

long long EpisodeStore::timestamp_key(double t) {
    return std::llround(t * 1000.0);
}

double EpisodeStore::estimate_dt(const std::vector<EpisodeFrame>& frames, double fallback) {
    if (frames.size() < 2) return fallback;

    size_t count = std::min(DT_SAMPLE_FRAMES, frames.size());
    double sum = 0.0;
    for (size_t i = 1; i < count; i++) {
        sum += frames[i].t - frames[i - 1].t;
    }
    double dt = sum / static_cast<double>(count - 1);
    return dt > 0.0 ? dt : fallback;
}

Episode EpisodeStore::parse(const std::string& path, const EpisodeLoadOptions& options) {
    std::ifstream file(path);
    if (!file.is_open()) {
        throw EpisodeLoadError("Episode file not found: " + path);
    }
    return parse_stream(file, std::filesystem::path(path).filename().string(), options);
}

Episode EpisodeStore::parse_stream(std::istream& in, const std::string& source_name,
                                   const EpisodeLoadOptions& options) {
    Episode ep;

    // Record layout accumulators, keyed by millisecond bucket
    std::map<long long, EpisodeFrame> groups;
    std::map<long long, RadarFrame> radar;
    std::vector<std::string> seen_entities;

    std::vector<EpisodeFrame> frames;

    std::string line;
    int line_no = 0;
    while (std::getline(in, line)) {
        line_no++;
        std::string text = trim(line);
        if (text.empty()) continue;

        JsonValue rec;
        try {
            rec = JsonReader::parse(text);
        } catch (const std::runtime_error& e) {
            ep.skipped_lines++;
            if (options.verbose) {
                std::cerr << "[EpisodeStore] " << source_name << ":" << line_no
                          << " skipped: " << e.what() << "\n";
            }
            continue;
        }
        if (!rec.is_object()) {
            ep.skipped_lines++;
            continue;
        }

        const auto& type = rec["type"];
        if (type.is_string()) {
            const std::string& kind = type.as_string();

            if (kind == "header") {
                adapt_record_header(rec, ep.header);

            } else if (kind == "state") {
                const auto& ts = rec["timestamp"];
                std::string id = rec["entity_id"].get_string("");
                const auto& state = rec["state"];
                if (!ts.is_number() || !std::isfinite(ts.as_number()) ||
                    id.empty() || !state.is_object()) {
                    ep.skipped_lines++;
                    continue;
                }

                long long key = timestamp_key(ts.as_number());
                if (id == RADAR_ENTITY) {
                    radar[key] = read_radar(state);
                    continue;
                }

                AgentState agent;
                if (!read_agent_state(state, RECORD_KEYS, agent, ep.sanitized_quaternions)) {
                    ep.skipped_lines++;
                    continue;
                }

                auto& frame = groups[key];
                frame.t = static_cast<double>(key) / 1000.0;
                frame.agents.emplace(id, std::move(agent));   // first record wins

                if (std::find(seen_entities.begin(), seen_entities.end(), id) == seen_entities.end()) {
                    seen_entities.push_back(id);
                }

            } else if (kind == "footer") {
                ep.footer = adapt_record_footer(rec);
                break;

            } else {
                ep.skipped_lines++;
            }

        } else if (rec.has("agents")) {
            EpisodeFrame frame;
            if (adapt_timestep_frame(rec, frame, ep.sanitized_quaternions)) {
                frames.push_back(std::move(frame));
            } else {
                ep.skipped_lines++;
            }

        } else if (rec.has("meta")) {
            adapt_timestep_header(rec, ep.header);

        } else if (rec.has("summary")) {
            ep.footer = adapt_summary(rec);
            break;

        } else {
            ep.skipped_lines++;
        }
    }

    // ── Merge record-layout groups ──
    const std::vector<std::string>& expected =
        options.expected_agents.empty() ? seen_entities : options.expected_agents;

    for (auto& [key, frame] : groups) {
        bool complete = std::all_of(expected.begin(), expected.end(),
            [&frame](const std::string& id) { return frame.agents.count(id) > 0; });
        if (!complete) {
            ep.dropped_frames++;
            continue;
        }
        auto r = radar.find(key);
        if (r != radar.end()) frame.radar = r->second;
        frames.push_back(std::move(frame));
    }

    // ── Enforce strictly increasing time ──
    std::stable_sort(frames.begin(), frames.end(),
                     [](const EpisodeFrame& a, const EpisodeFrame& b) { return a.t < b.t; });
    for (auto& f : frames) {
        if (!ep.frames.empty() && f.t <= ep.frames.back().t) {
            ep.dropped_frames++;
            continue;
        }
        ep.frames.push_back(std::move(f));
    }

    if (ep.frames.empty()) {
        throw EpisodeLoadError("Episode has no frames: " + source_name);
    }

    ep.dt_nominal = ep.header.dt_nominal ? *ep.header.dt_nominal
                                         : estimate_dt(ep.frames, options.default_dt);

    // Data-quality warnings are always reported
    if (ep.skipped_lines > 0) {
        std::cerr << "[EpisodeStore] " << source_name << ": skipped "
                  << ep.skipped_lines << " malformed line(s)\n";
    }
    if (ep.sanitized_quaternions > 0) {
        std::cerr << "[EpisodeStore] " << source_name << ": replaced "
                  << ep.sanitized_quaternions << " degenerate quaternion(s) with identity\n";
    }
    if (ep.frames.size() < 2) {
        std::cerr << "[EpisodeStore] " << source_name << ": only "
                  << ep.frames.size() << " frame(s) loaded\n";
    }

    if (options.verbose) {
        std::cerr << "[EpisodeStore] Loaded '" << source_name << "'"
                  << " ep_id=" << ep.header.episode_id
                  << " frames=" << ep.frames.size()
                  << " dropped=" << ep.dropped_frames
                  << " dt_nominal=" << ep.dt_nominal << "s"
                  << " outcome=" << (ep.footer ? ep.footer->outcome : "unknown") << "\n";
    }

    return ep;
}

// ═══════════════════════════════════════════════════════════════
// Metadata-only
// ═══════════════════════════════════════════════════════════════

static bool is_radar_line(const std::string& line) {
    return line.find("\"entity_id\":\"radar\"") != std::string::npos ||
           line.find("\"entity_id\": \"radar\"") != std::string::npos;
}

/**
 * Footer record of either layout. The substring test only skips lines that
 * cannot be footers; a candidate is parsed and its record type confirmed,
 * so a state line that merely mentions "footer" is not taken.
 */
static std::optional<JsonValue> footer_record(const std::string& line) {
    if (line.find("\"footer\"") == std::string::npos &&
        line.find("\"summary\"") == std::string::npos) {
        return std::nullopt;
    }
    try {
        JsonValue rec = JsonReader::parse(trim(line));
        const JsonValue& type = rec["type"];
        if (type.is_string() ? type.as_string() == "footer" : rec["summary"].is_object()) {
            return rec;
        }
    } catch (const std::runtime_error&) {
        // Malformed line: not a footer
    }
    return std::nullopt;
}

std::optional<EpisodeMetadata> EpisodeStore::parse_metadata_only(const std::string& path) {
    std::ifstream file(path);
    if (!file.is_open()) {
        std::cerr << "[EpisodeStore] File not found: " << path << "\n";
        return std::nullopt;
    }

    EpisodeMetadata meta;
    meta.file_path = path;
    meta.file_name = std::filesystem::path(path).filename().string();

    struct stat st;
    if (::stat(path.c_str(), &st) == 0) {
        meta.file_modified = st.st_mtime;
    }

    std::string line;
    if (std::getline(file, line)) {
        try {
            JsonValue rec = JsonReader::parse(trim(line));
            const JsonValue& type = rec["type"];
            EpisodeHeader h;
            if (type.is_string() && type.as_string() == "header") {
                adapt_record_header(rec, h);
            } else if (!type.is_string() && rec["meta"].is_object()) {
                adapt_timestep_header(rec, h);
            }
            meta.episode_id = h.episode_id;
            meta.start_time = h.start_time;
        } catch (const std::runtime_error& e) {
            std::cerr << "[EpisodeStore] " << meta.file_name << ": bad header: " << e.what() << "\n";
        }
        if (is_radar_line(line)) meta.has_radar_data = true;
    }

    // Footer may repeat; the last one wins
    std::optional<JsonValue> last_footer;
    while (std::getline(file, line)) {
        if (auto rec = footer_record(line)) last_footer = std::move(rec);
        if (!meta.has_radar_data && is_radar_line(line)) {
            meta.has_radar_data = true;
        }
    }

    if (last_footer) {
        const JsonValue& rec = *last_footer;
        EpisodeFooter f = rec.has("summary") ? adapt_summary(rec) : adapt_record_footer(rec);
        meta.has_footer = true;
        meta.outcome = f.outcome;
        meta.duration = f.duration;
        meta.steps = f.metrics.steps;
        meta.final_distance = f.metrics.final_distance;
        meta.total_reward = f.metrics.total_reward;
        meta.fuel_used = f.metrics.fuel_used;
        meta.volley_mode = f.metrics.volley_mode;
        meta.missiles_intercepted = f.metrics.missiles_intercepted;
    }

    return meta;
}

std::vector<EpisodeMetadata> EpisodeStore::scan_directory(const std::string& dir) {
    namespace fs = std::filesystem;
    std::vector<EpisodeMetadata> results;

    std::error_code ec;
    if (!fs::is_directory(dir, ec)) {
        std::cerr << "[EpisodeStore] Directory not found: " << dir << "\n";
        return results;
    }

    for (const auto& entry : fs::directory_iterator(dir, ec)) {
        if (!entry.is_regular_file(ec)) continue;
        if (entry.path().extension() != ".jsonl") continue;

        auto meta = parse_metadata_only(entry.path().string());
        if (meta) results.push_back(std::move(*meta));
    }
    if (ec) {
        std::cerr << "[EpisodeStore] Error scanning " << dir << ": " << ec.message() << "\n";
    }

    // Newest first; name breaks ties
    std::sort(results.begin(), results.end(),
              [](const EpisodeMetadata& a, const EpisodeMetadata& b) {
                  if (a.file_modified != b.file_modified) return a.file_modified > b.file_modified;
                  return a.file_name < b.file_name;
              });
    return results;
}

} // namespace pursuit::replay
