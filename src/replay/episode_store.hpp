/**
 * EpisodeStore — load recorded episodes (newline-delimited JSON).
 *
 * Two historical layouts are accepted and adapted into the same Episode:
 *
 *   record layout    {"type":"header"|"state"|"footer", ...}
 *                    one line per entity per timestamp; lines sharing a
 *                    timestamp (rounded to 1 ms) merge into one frame once
 *                    every expected agent is present. Reading stops at the
 *                    first footer. Entity "radar" carries the radar sub-frame.
 *
 *   timestep layout  {"t":..,"meta":{..},"scene":{..}}    header
 *                    {"t":..,"agents":{"id":{p,q,v,w,..}}} one frame per line
 *                    {"t":..,"summary":{..}}              footer
 *
 * Malformed lines are skipped and counted. A missing file or an episode
 * without frames throws EpisodeLoadError.
 *
 * Usage:
 *   Episode ep = EpisodeStore::parse("runs/ep_0001.jsonl");
 *   auto listing = EpisodeStore::scan_directory("runs");
 */

#ifndef PURSUIT_EPISODE_STORE_HPP
#define PURSUIT_EPISODE_STORE_HPP

#include "replay/episode_types.hpp"
#include <istream>
#include <optional>
#include <stdexcept>
#include <string>
#include <vector>

namespace pursuit::replay {

class EpisodeLoadError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

struct EpisodeLoadOptions {
    /// Agents that must all be present for a record-layout frame to be kept.
    /// Empty: every non-radar entity seen in the file.
    std::vector<std::string> expected_agents;
    double default_dt = 0.01;
    bool verbose = false;
};

class EpisodeStore {
public:
    /// @throws EpisodeLoadError if the file is missing/unreadable or has no frames
    static Episode parse(const std::string& path,
                         const EpisodeLoadOptions& options = EpisodeLoadOptions{});

    /// @throws EpisodeLoadError if the stream yields no frames
    static Episode parse_stream(std::istream& in, const std::string& source_name,
                                const EpisodeLoadOptions& options = EpisodeLoadOptions{});

    /**
     * Header (first line) + last footer + radar presence, without decoding
     * frame bodies. Returns nullopt if the file cannot be opened.
     */
    static std::optional<EpisodeMetadata> parse_metadata_only(const std::string& path);

    /// Metadata for every *.jsonl in dir, newest first; missing dir -> empty
    static std::vector<EpisodeMetadata> scan_directory(const std::string& dir);

    /// Mean delta over the first (up to) 10 frames; fallback with < 2 frames
    static double estimate_dt(const std::vector<EpisodeFrame>& frames, double fallback);

    /// Millisecond bucket used to merge per-entity records
    static long long timestamp_key(double t);
};

} // namespace pursuit::replay

#endif // PURSUIT_EPISODE_STORE_HPP
