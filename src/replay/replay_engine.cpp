#include "replay/replay_engine.hpp"
#include "coordinate/enu_frame.hpp"
#include "physics/vec3_ops.hpp"

#include <algorithm>
#include <cmath>
#include <iostream>
#include <stdexcept>

namespace pursuit::replay {

static constexpr double MIN_CRUISE_SPAN_S = 0.001;
static constexpr double MIN_TRAVEL_M = 1e-6;

ReplayEngine::ReplayEngine(const ReplayConfig& config)
    : config_(config),
      paused_(!config.auto_play) {
    set_play_speed(config.play_speed);
}

void ReplayEngine::attach_agent(AgentReplayer& agent) {
    agents_.push_back(&agent);
}

void ReplayEngine::set_play_speed(double speed) {
    if (!std::isfinite(speed)) return;
    speed_ = std::clamp(speed, MIN_PLAY_SPEED, MAX_PLAY_SPEED);
}

// ═══════════════════════════════════════════════════════════════
// Loading and start sequence
// ═══════════════════════════════════════════════════════════════

void ReplayEngine::load(Episode episode) {
    if (episode.frames.empty()) {
        throw std::runtime_error("ReplayEngine: episode has no frames");
    }
    episode_ = std::move(episode);

    dt_ = (config_.match_header_dt && episode_.dt_nominal > 0.0) ? episode_.dt_nominal
                                                                 : config_.default_dt;
    if (!(dt_ > 0.0)) dt_ = 0.01;

    // ── Anchor ──
    const EpisodeFrame& first = episode_.frames.front();
    enu_offset_ = config_.anchor.additional_enu_offset;
    if (config_.anchor.use_first_agent_as_origin) {
        std::string origin = resolve_agent(config_.anchor.origin_agent);
        if (origin.empty() && config_.anchor.origin_agent == "auto" && !first.agents.empty()) {
            origin = first.agents.begin()->first;
        }
        if (const AgentState* s = first.find(origin)) {
            enu_offset_ += s->position;
        }
    }

    for (const AgentReplayer* agent : agents_) {
        if (!first_pose(agent->id())) {
            std::cerr << "[ReplayEngine] Agent '" << agent->id()
                      << "' has no recorded states; left in place\n";
        }
    }

    std::cerr << "[ReplayEngine] Loaded episode " << episode_.header.episode_id
              << ": " << episode_.frames.size() << " frames, "
              << start_time() << "s -> " << end_time() << "s, dt=" << dt_ << "s\n";

    begin();
    paused_ = !config_.auto_play;
}

void ReplayEngine::restart() {
    if (phase_ == ReplayPhase::Idle) return;
    begin();
    paused_ = !config_.auto_play;
}

void ReplayEngine::begin() {
    spawned_.clear();
    last_rotation_.clear();
    t_ = start_time();
    idx_ = 0;
    freeze_left_ = 0;
    cruise_time_ = 0.0;

    if (!config_.cruise.enabled || !setup_cruise()) {
        spawn_all();
        return;
    }

    phase_ = ReplayPhase::CruiseIn;
    Pose start{to_world(cruise_start_enu_),
               EnuFrame::look_rotation(EnuFrame::to_internal(cruise_end_enu_ - cruise_start_enu_))};

    for (AgentReplayer* agent : agents_) {
        agent->configure(AgentMode::Kinematic);
        if (agent->id() == cruise_agent_) {
            spawned_.insert(agent->id());
            agent->set_frozen(false);
            agent->force_pose(start);
            agent->body().set_velocity(cruise_velocity_);
        } else {
            agent->set_frozen(true);
            if (auto p = first_pose(agent->id())) agent->force_pose(*p);
        }
    }
}

bool ReplayEngine::setup_cruise() {
    const CruiseInConfig& cfg = config_.cruise;
    const auto& frames = episode_.frames;

    cruise_agent_ = resolve_agent(cfg.agent);
    if (cruise_agent_.empty()) {
        std::cerr << "[ReplayEngine] Cruise-in disabled: no cruise agent in first frame\n";
        return false;
    }
    if (frames.size() < 2 || !(cfg.duration_s > 0.0)) return false;

    size_t k = std::min(static_cast<size_t>(std::max(2, cfg.velocity_sample_frames)), frames.size());
    const AgentState* a = frames[0].find(cruise_agent_);
    const AgentState* b = frames[k - 1].find(cruise_agent_);
    if (!a || !b) return false;

    double span = frames[k - 1].t - frames[0].t;
    if (span < MIN_CRUISE_SPAN_S) return false;

    Vec3 v = (b->position - a->position) / span;
    double speed = v.norm();
    if (speed < cfg.min_speed) {
        std::cerr << "[ReplayEngine] Cruise-in disabled: " << cruise_agent_
                  << " speed " << speed << " m/s below " << cfg.min_speed << " m/s\n";
        return false;
    }

    Vec3 dir = v / speed;
    double distance = speed * cfg.duration_s * cfg.distance_multiplier;
    cruise_end_enu_ = a->position;
    cruise_start_enu_ = a->position - dir * distance;
    cruise_velocity_ = EnuFrame::to_internal(dir) * (distance / cfg.duration_s);

    std::cerr << "[ReplayEngine] Cruise-in: " << cruise_agent_ << " over "
              << distance << " m in " << cfg.duration_s << " s\n";
    return true;
}

void ReplayEngine::update_cruise() {
    const double duration = config_.cruise.duration_s;
    if (!paused_) cruise_time_ += dt_ * config_.cruise.play_speed;

    double alpha = std::clamp(cruise_time_ / duration, 0.0, 1.0);
    Pose pose{to_world(lerp(cruise_start_enu_, cruise_end_enu_, alpha)),
              EnuFrame::look_rotation(EnuFrame::to_internal(cruise_end_enu_ - cruise_start_enu_))};

    for (AgentReplayer* agent : agents_) {
        if (agent->id() != cruise_agent_) continue;
        agent->force_pose(pose);
        agent->body().set_velocity(cruise_velocity_);
    }

    if (alpha >= 1.0) {
        t_ = start_time();
        idx_ = 0;
        spawn_all();
    }
}

void ReplayEngine::spawn_all() {
    phase_ = ReplayPhase::Freeze;
    freeze_left_ = std::max(0, config_.freeze_ticks);

    for (AgentReplayer* agent : agents_) {
        auto p = first_pose(agent->id());
        if (!p) continue;
        spawned_.insert(agent->id());
        agent->configure(AgentMode::Kinematic);
        agent->set_frozen(true);
        agent->force_pose(*p);
        last_rotation_[agent->id()] = p->orientation;
    }
}

void ReplayEngine::enter_replay() {
    phase_ = ReplayPhase::Replay;
    freeze_left_ = 0;

    const EpisodeFrame& frame = episode_.frames[idx_];
    for (AgentReplayer* agent : agents_) {
        if (!first_pose(agent->id())) continue;
        spawned_.insert(agent->id());
        agent->set_frozen(false);

        AgentMode mode = config_.mode_for(agent->id());
        if (!agent->configure(mode) || mode != AgentMode::CommandDriven) continue;

        // Seed the free body with the recorded velocity
        const AgentState* s = frame.find(agent->id());
        if (s && s->has_velocity) {
            agent->body().set_velocity(EnuFrame::to_internal(s->velocity));
        }
    }
}

// ═══════════════════════════════════════════════════════════════
// Clock
// ═══════════════════════════════════════════════════════════════

void ReplayEngine::tick() {
    switch (phase_) {
        case ReplayPhase::Idle:
            return;

        case ReplayPhase::CruiseIn:
            update_cruise();
            return;

        case ReplayPhase::Freeze:
            if (freeze_left_ > 0) {
                freeze_left_--;
                for (AgentReplayer* agent : agents_) {
                    if (!is_spawned(agent->id())) continue;
                    if (auto p = first_pose(agent->id())) agent->force_pose(*p);
                }
            }
            if (freeze_left_ == 0) enter_replay();
            return;

        case ReplayPhase::Replay:
            break;
    }

    double prev = t_;
    if (!paused_) t_ += dt_ * speed_;
    advance_cursor();
    apply_agents(t_ - prev);
}

void ReplayEngine::advance_cursor() {
    const auto& frames = episode_.frames;
    const size_t n = frames.size();

    if (t_ >= frames.back().t) {
        t_ = frames.back().t;
        idx_ = n >= 2 ? n - 2 : 0;
    }
    // frames[idx_].t <= t_ < frames[idx_ + 1].t, idx_ capped at n - 2
    while (idx_ + 2 < n && frames[idx_ + 1].t <= t_) idx_++;
}

bool ReplayEngine::step_forward() {
    if (phase_ != ReplayPhase::Replay) return false;
    paused_ = true;
    double prev = t_;
    t_ = std::min(t_ + dt_, end_time());
    snap(t_ - prev);
    return true;
}

bool ReplayEngine::step_backward() {
    if (phase_ != ReplayPhase::Replay) return false;
    paused_ = true;
    double prev = t_;
    t_ = std::max(start_time(), t_ - dt_);
    snap(t_ - prev);
    return true;
}

void ReplayEngine::seek(double t) {
    if (phase_ == ReplayPhase::Idle || !std::isfinite(t)) return;
    if (phase_ != ReplayPhase::Replay) enter_replay();

    t_ = std::clamp(t, start_time(), end_time());
    snap(0.0);
}

void ReplayEngine::snap(double elapsed) {
    idx_ = find_bracket(episode_.frames, t_);
    apply_agents(elapsed);
}

void ReplayEngine::apply_agents(double elapsed) {
    const auto& frames = episode_.frames;
    const EpisodeFrame& a = frames[idx_];
    const EpisodeFrame& b = idx_ + 1 < frames.size() ? frames[idx_ + 1] : a;
    double alpha = interpolation_alpha(a.t, b.t, t_);

    for (AgentReplayer* agent : agents_) {
        const std::string& id = agent->id();
        if (!is_spawned(id) || agent->is_frozen()) continue;

        if (agent->mode() == AgentMode::Kinematic) {
            auto it = last_rotation_.find(id);
            auto pose = pose_between(id, a, b, alpha, it == last_rotation_.end() ? nullptr : &it->second);
            if (!pose) continue;
            last_rotation_[id] = pose->orientation;
            agent->apply_kinematic(*pose, elapsed);
            continue;
        }

        // Command driven: only while time moves forward
        if (!(elapsed > 0.0)) continue;
        const AgentState* sa = a.find(id);
        const AgentState* sb = b.find(id);
        // Clock on the last frame: its action is the latest one
        if (alpha >= 1.0 && sb && sb->has_usable_action()) sa = sb;
        if (sa && sa->has_usable_action()) {
            agent->apply_action(sa->action, dt_);
        } else if (sb) {
            agent->apply_action(sb->action, dt_);
        } else {
            agent->apply_action({}, dt_);
        }
    }
}

// ═══════════════════════════════════════════════════════════════
// Sampling
// ═══════════════════════════════════════════════════════════════

double ReplayEngine::start_time() const {
    return episode_.frames.empty() ? 0.0 : episode_.frames.front().t;
}

double ReplayEngine::end_time() const {
    return episode_.frames.empty() ? 0.0 : episode_.frames.back().t;
}

bool ReplayEngine::finished() const {
    return phase_ == ReplayPhase::Replay && t_ >= end_time();
}

const EpisodeFrame* ReplayEngine::current_frame() const {
    if (phase_ == ReplayPhase::Idle || episode_.frames.empty()) return nullptr;
    return &episode_.frames[idx_];
}

Vec3 ReplayEngine::to_world(const Vec3& enu) const {
    return EnuFrame::to_internal(enu - enu_offset_) + config_.anchor.world_add;
}

std::string ReplayEngine::resolve_agent(const std::string& requested) const {
    if (episode_.frames.empty()) return "";
    const EpisodeFrame& first = episode_.frames.front();

    if (requested != "auto") {
        return first.find(requested) ? requested : "";
    }
    for (const char* candidate : AUTO_AGENT_CANDIDATES) {
        if (first.find(candidate)) return candidate;
    }
    return "";
}

std::optional<Pose> ReplayEngine::first_pose(const std::string& id) const {
    const auto& frames = episode_.frames;
    for (size_t i = 0; i < frames.size(); i++) {
        if (!frames[i].find(id)) continue;
        size_t j = std::min(i + 1, frames.size() - 1);
        return pose_between(id, frames[i], frames[j], 0.0, nullptr);
    }
    return std::nullopt;
}

std::optional<Pose> ReplayEngine::pose_between(const std::string& id, const EpisodeFrame& a,
                                               const EpisodeFrame& b, double alpha,
                                               const Quat* fallback) const {
    const AgentState* sa = a.find(id);
    const AgentState* sb = b.find(id);
    if (!sa && !sb) return std::nullopt;
    if (!sa) sa = sb;
    if (!sb) sb = sa;

    Pose pose;
    pose.position = to_world(lerp(sa->position, sb->position, alpha));

    if (config_.orientation_source == OrientationSource::RecordedSlerp &&
        sa->has_orientation && sb->has_orientation) {
        const Quat& qa = sa->orientation;
        const Quat& qb = sb->orientation;
        pose.orientation = quat_slerp(
            EnuFrame::world_to_body_to_internal_rotation(qa.w, qa.x, qa.y, qa.z),
            EnuFrame::world_to_body_to_internal_rotation(qb.w, qb.x, qb.y, qb.z),
            alpha);
        return pose;
    }

    Vec3 travel = EnuFrame::to_internal(sb->position - sa->position);
    if (travel.norm() > MIN_TRAVEL_M) {
        pose.orientation = EnuFrame::look_rotation(travel);
    } else if (fallback) {
        pose.orientation = *fallback;
    } else if (sa->has_orientation) {
        const Quat& q = sa->orientation;
        pose.orientation = EnuFrame::world_to_body_to_internal_rotation(q.w, q.x, q.y, q.z);
    } else {
        pose.orientation = Quat::Identity();
    }
    return pose;
}

std::optional<AgentSample> ReplayEngine::sample(const std::string& id, double t) const {
    const auto& frames = episode_.frames;
    if (frames.empty() || !std::isfinite(t)) return std::nullopt;

    t = std::clamp(t, start_time(), end_time());
    size_t i = find_bracket(frames, t);
    const EpisodeFrame& a = frames[i];
    const EpisodeFrame& b = i + 1 < frames.size() ? frames[i + 1] : a;
    double alpha = interpolation_alpha(a.t, b.t, t);

    auto pose = pose_between(id, a, b, alpha, nullptr);
    if (!pose) return std::nullopt;

    const AgentState* sa = a.find(id);
    const AgentState* sb = b.find(id);
    if (!sa) sa = sb;
    if (!sb) sb = sa;

    AgentSample s;
    s.pose = *pose;
    s.velocity = EnuFrame::to_internal(lerp(sa->velocity, sb->velocity, alpha));
    s.status = alpha < 1.0 ? sa->status : sb->status;
    return s;
}

size_t ReplayEngine::find_bracket(const std::vector<EpisodeFrame>& frames, double t) {
    if (frames.empty()) return 0;
    if (frames.size() < 2) return 0;
    auto it = std::upper_bound(frames.begin(), frames.end(), t,
                               [](double v, const EpisodeFrame& f) { return v < f.t; });
    size_t j = static_cast<size_t>(it - frames.begin());
    if (j == 0) return 0;
    return std::min(j - 1, frames.size() - 2);
}

double ReplayEngine::interpolation_alpha(double ta, double tb, double t) {
    double span = std::max(1e-6, tb - ta);
    return std::clamp((t - ta) / span, 0.0, 1.0);
}

} // namespace pursuit::replay
