/**
 * CommandChannel — asynchronous external command source.
 *
 * A worker thread waits until the transport answers a health check, then
 * polls the policy at poll_hz with the latest observation submitted by the
 * tick thread. Decoded commands land in a LatestCommandSlot. The tick thread
 * calls resolve() once per tick:
 *
 *   fresh command    applied as-is
 *   failure / stale  throttle decays toward 0 by thrust_decay_per_tick,
 *                    last rate held
 *
 * Usage:
 *   UnixSocketTransport transport("/tmp/policy.sock");
 *   CommandChannel channel(transport, ChannelConfig{});
 *   channel.start();
 *   channel.submit(CommandProtocol::build_request(ctx, blue, fuel, red));
 *   if (auto cmd = channel.resolve(dt)) arbiter.activate_external(cmd->thrust, cmd->rate_cmd_radps);
 *   channel.stop();
 */

#ifndef PURSUIT_COMMAND_CHANNEL_HPP
#define PURSUIT_COMMAND_CHANNEL_HPP

#include "net/command_protocol.hpp"
#include "net/command_transport.hpp"
#include <atomic>
#include <condition_variable>
#include <cstdint>
#include <mutex>
#include <optional>
#include <string>
#include <thread>

namespace pursuit::net {

struct ChannelConfig {
    double poll_hz = 2.0;
    int timeout_ms = 2000;
    double health_retry_s = 0.5;
    double stale_after_s = 1.0;
    double thrust_decay_per_tick = 0.25;
};

/**
 * @brief Mutex-guarded single value with a sequence number
 *
 * Writers replace the value; readers take a consistent snapshot.
 */
class LatestCommandSlot {
public:
    struct Snapshot {
        std::optional<ExternalCommand> command;
        uint64_t sequence = 0;     // bumped on every successful publish
        uint64_t failures = 0;
        bool last_failed = false;
    };

    void publish(const ExternalCommand& cmd);
    void publish_failure();
    Snapshot snapshot() const;

private:
    mutable std::mutex mutex_;
    Snapshot value_;
};

class CommandChannel {
public:
    CommandChannel(CommandTransport& transport, const ChannelConfig& config = ChannelConfig{});
    ~CommandChannel();

    CommandChannel(const CommandChannel&) = delete;
    CommandChannel& operator=(const CommandChannel&) = delete;

    void start();

    /// Joins the worker; safe to call twice
    void stop();

    bool running() const { return running_; }
    bool healthy() const { return healthy_; }

    /// Observation sent on the next poll
    void submit(const CommandRequest& request);

    /**
     * @brief Command to apply this tick
     *
     * nullopt until the first command arrives. Afterwards always a value:
     * the newest command while fresh, otherwise the decayed hold.
     */
    std::optional<ExternalCommand> resolve(double dt);

    /// Throttle stepped toward 0 by `step`, rate unchanged
    static ExternalCommand decay(const ExternalCommand& last, double step);

    const LatestCommandSlot& slot() const { return slot_; }

private:
    void run();

    /// false if stop() was requested during the wait
    bool wait_for(double seconds);

    CommandTransport& transport_;
    ChannelConfig config_;
    LatestCommandSlot slot_;

    std::thread worker_;
    std::atomic<bool> running_{false};
    std::atomic<bool> healthy_{false};
    std::mutex mutex_;
    std::condition_variable cv_;
    std::string pending_request_;

    // Tick-thread state
    uint64_t last_sequence_ = 0;
    double age_s_ = 0.0;
    std::optional<ExternalCommand> applied_;
};

} // namespace pursuit::net

#endif // PURSUIT_COMMAND_CHANNEL_HPP
