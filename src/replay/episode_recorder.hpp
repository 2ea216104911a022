/**
 * EpisodeRecorder — writes an episode in the record layout read by
 * EpisodeStore: one header line, one state line per agent per tick, one
 * footer line. Each line is a compact JSON object.
 *
 * Usage:
 *   std::ofstream f("runs/ep_0001.jsonl");
 *   EpisodeRecorder rec(f);
 *   rec.write_header(header);
 *   rec.write_state(t, "interceptor_0", state);
 *   rec.write_footer(footer);
 */

#ifndef PURSUIT_EPISODE_RECORDER_HPP
#define PURSUIT_EPISODE_RECORDER_HPP

#include "replay/episode_types.hpp"
#include <ostream>
#include <string>

namespace pursuit::replay {

class EpisodeRecorder {
public:
    explicit EpisodeRecorder(std::ostream& out) : out_(out) {}

    void write_header(const EpisodeHeader& header);
    void write_state(double t, const std::string& entity_id, const AgentState& state);
    void write_radar(double t, const RadarFrame& radar);
    void write_footer(const EpisodeFooter& footer);

    int lines_written() const { return lines_; }

private:
    std::ostream& out_;
    int lines_ = 0;
};

} // namespace pursuit::replay

#endif // PURSUIT_EPISODE_RECORDER_HPP
