/**
 * TrajectoryWriter — collects body poses at a fixed interval and writes
 * a trajectory JSON file for offline plotting or comparison runs.
 *
 * Bodies are registered once with init(); sample() is called every tick and
 * records only when the sample interval has elapsed. Positions and
 * orientations are written back in ENU ([x, y, z] and [w, x, y, z]).
 */

#ifndef PURSUIT_TRAJECTORY_WRITER_HPP
#define PURSUIT_TRAJECTORY_WRITER_HPP

#include "physics/rigid_body.hpp"
#include <ostream>
#include <string>
#include <unordered_map>
#include <utility>
#include <vector>

namespace pursuit::replay {

struct TrajectoryEvent {
    double time = 0.0;
    std::string type;        // "SPAWN", "DETONATION", "STATUS", ...
    std::string agent_id;
    std::string detail;
    Vec3 position;           // internal frame at event time
};

/// Run description written alongside the samples
struct TrajectoryInfo {
    std::string episode_id;
    std::string source;      // "replay" or "simulation"
    std::string outcome;
    double dt = 0.0;
};

class TrajectoryWriter {
public:
    using BodyList = std::vector<std::pair<std::string, const RigidBody*>>;

    TrajectoryWriter() = default;

    /// Must be called before sample(); bodies are borrowed
    void init(const BodyList& bodies, double sample_interval);

    /// Record every body if t has reached the next sample time
    bool sample(double t);

    /// Positions stop being recorded for this agent after `time`
    void record_end(const std::string& id, double time);

    void record_event(const TrajectoryEvent& evt);

    void write_json(std::ostream& out, const TrajectoryInfo& info) const;

    size_t sample_count() const { return sample_times_.size(); }

private:
    double sample_interval_ = 0.1;
    double next_sample_time_ = 0.0;
    bool first_sample_ = true;
    std::vector<double> sample_times_;

    BodyList bodies_;
    std::vector<std::vector<Pose>> poses_;
    std::vector<double> end_times_;                 // -1 if active at end
    std::unordered_map<std::string, size_t> id_to_index_;

    std::vector<TrajectoryEvent> events_;
};

} // namespace pursuit::replay

#endif // PURSUIT_TRAJECTORY_WRITER_HPP
