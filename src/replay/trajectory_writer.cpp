#include "replay/trajectory_writer.hpp"
#include "coordinate/enu_frame.hpp"
#include "io/json_writer.hpp"
#include <algorithm>

namespace pursuit::replay {

void TrajectoryWriter::init(const BodyList& bodies, double sample_interval) {
    sample_interval_ = std::max(sample_interval, 0.0);
    next_sample_time_ = 0.0;
    first_sample_ = true;
    sample_times_.clear();

    bodies_ = bodies;
    size_t n = bodies_.size();
    poses_.assign(n, {});
    end_times_.assign(n, -1.0);
    id_to_index_.clear();

    for (size_t i = 0; i < n; i++) {
        id_to_index_[bodies_[i].first] = i;
    }

    events_.clear();
}

bool TrajectoryWriter::sample(double t) {
    if (!first_sample_ && t < next_sample_time_) return false;
    first_sample_ = false;

    sample_times_.push_back(t);
    for (size_t i = 0; i < bodies_.size(); i++) {
        bool ended = end_times_[i] >= 0.0 && t > end_times_[i];
        if (ended && !poses_[i].empty()) {
            // Hold the last recorded pose
            poses_[i].push_back(poses_[i].back());
        } else {
            poses_[i].push_back(bodies_[i].second->pose());
        }
    }

    next_sample_time_ = t + sample_interval_;
    return true;
}

void TrajectoryWriter::record_end(const std::string& id, double time) {
    auto it = id_to_index_.find(id);
    if (it != id_to_index_.end() && end_times_[it->second] < 0.0) {
        end_times_[it->second] = time;
    }
}

void TrajectoryWriter::record_event(const TrajectoryEvent& evt) {
    events_.push_back(evt);
}

void TrajectoryWriter::write_json(std::ostream& out, const TrajectoryInfo& info) const {
    JsonWriter w(out);

    w.begin_object();
    w.kv("format", "trajectory_v1");
    w.kv("frame", "ENU");

    // ── run ──
    w.key("run").begin_object();
    w.kv("episodeId", info.episode_id);
    w.kv("source", info.source);
    w.kv("outcome", info.outcome);
    w.kv("dt", info.dt);
    w.end_object();

    // ── timeline ──
    w.key("timeline").begin_object();
    w.kv("endTime", sample_times_.empty() ? 0.0 : sample_times_.back());
    w.kv("sampleInterval", sample_interval_);
    w.key("sampleTimes").begin_array();
    for (double t : sample_times_) {
        w.value(t);
    }
    w.end_array();
    w.end_object();

    // ── agents ──
    w.key("agents").begin_array();
    for (size_t i = 0; i < bodies_.size(); i++) {
        w.begin_object();
        w.kv("id", bodies_[i].first);

        if (end_times_[i] < 0.0) {
            w.key("endTime").null_value();
        } else {
            w.kv("endTime", end_times_[i]);
        }

        w.key("positions").begin_array();
        for (const auto& p : poses_[i]) {
            w.value(EnuFrame::to_external(p.position));
        }
        w.end_array();

        w.key("orientations").begin_array();
        for (const auto& p : poses_[i]) {
            w.value(EnuFrame::internal_rotation_to_enu_wxyz(p.orientation));
        }
        w.end_array();

        w.end_object();
    }
    w.end_array();

    // ── events ──
    auto sorted = events_;
    std::stable_sort(sorted.begin(), sorted.end(),
                     [](const TrajectoryEvent& a, const TrajectoryEvent& b) {
                         return a.time < b.time;
                     });

    w.key("events").begin_array();
    for (const auto& evt : sorted) {
        w.begin_object();
        w.kv("time", evt.time);
        w.kv("type", evt.type);
        w.kv("agentId", evt.agent_id);
        if (!evt.detail.empty()) w.kv("detail", evt.detail);
        w.kv("position", EnuFrame::to_external(evt.position));
        w.end_object();
    }
    w.end_array();

    // ── summary ──
    int ended = static_cast<int>(std::count_if(end_times_.begin(), end_times_.end(),
                                               [](double t) { return t >= 0.0; }));
    w.key("summary").begin_object();
    w.kv("agents", static_cast<int>(bodies_.size()));
    w.kv("ended", ended);
    w.kv("samples", static_cast<int>(sample_times_.size()));
    w.kv("events", static_cast<int>(events_.size()));
    w.end_object();

    w.end_object();
    out << "\n";
}

} // namespace pursuit::replay
