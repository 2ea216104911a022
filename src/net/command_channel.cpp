#include "net/command_channel.hpp"

#include <algorithm>
#include <chrono>
#include <iostream>

namespace pursuit::net {

// ── LatestCommandSlot ──

void LatestCommandSlot::publish(const ExternalCommand& cmd) {
    std::lock_guard<std::mutex> lock(mutex_);
    value_.command = cmd;
    value_.sequence++;
    value_.last_failed = false;
}

void LatestCommandSlot::publish_failure() {
    std::lock_guard<std::mutex> lock(mutex_);
    value_.failures++;
    value_.last_failed = true;
}

LatestCommandSlot::Snapshot LatestCommandSlot::snapshot() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return value_;
}

// ── CommandChannel ──

CommandChannel::CommandChannel(CommandTransport& transport, const ChannelConfig& config)
    : transport_(transport), config_(config) {}

CommandChannel::~CommandChannel() {
    stop();
}

void CommandChannel::start() {
    if (running_) return;
    running_ = true;
    healthy_ = false;
    worker_ = std::thread(&CommandChannel::run, this);
}

void CommandChannel::stop() {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        running_ = false;
    }
    cv_.notify_all();
    if (worker_.joinable()) worker_.join();
}

void CommandChannel::submit(const CommandRequest& request) {
    std::string payload = CommandProtocol::serialize(request);
    std::lock_guard<std::mutex> lock(mutex_);
    pending_request_ = std::move(payload);
}

bool CommandChannel::wait_for(double seconds) {
    std::unique_lock<std::mutex> lock(mutex_);
    auto timeout = std::chrono::duration<double>(std::max(seconds, 0.0));
    cv_.wait_for(lock, timeout, [this] { return !running_; });
    return running_;
}

void CommandChannel::run() {
    const double period = config_.poll_hz > 0.0 ? 1.0 / config_.poll_hz : 0.5;

    while (running_) {
        if (!healthy_) {
            auto reply = transport_.request(CommandProtocol::health_request(), config_.timeout_ms);
            if (reply && CommandProtocol::is_health_ok(*reply)) {
                healthy_ = true;
                std::cerr << "[CommandChannel] Policy healthy\n";
            } else {
                if (!wait_for(config_.health_retry_s)) break;
                continue;
            }
        }

        std::string payload;
        {
            std::lock_guard<std::mutex> lock(mutex_);
            payload = pending_request_;
        }

        if (!payload.empty()) {
            auto reply = transport_.request(payload, config_.timeout_ms);
            if (!reply) {
                slot_.publish_failure();
                healthy_ = false;
                transport_.reset();
                std::cerr << "[CommandChannel] No reply; waiting for health\n";
            } else {
                std::string error;
                auto cmd = CommandProtocol::decode_response(*reply, &error);
                if (cmd) {
                    slot_.publish(*cmd);
                } else {
                    slot_.publish_failure();
                    std::cerr << "[CommandChannel] Rejected reply: " << error << "\n";
                }
            }
        }

        if (!wait_for(period)) break;
    }
}

ExternalCommand CommandChannel::decay(const ExternalCommand& last, double step) {
    ExternalCommand out = last;
    out.thrust = std::max(0.0, last.thrust - std::max(0.0, step));
    return out;
}

std::optional<ExternalCommand> CommandChannel::resolve(double dt) {
    LatestCommandSlot::Snapshot snap = slot_.snapshot();

    if (snap.sequence != last_sequence_ && snap.command) {
        last_sequence_ = snap.sequence;
        age_s_ = 0.0;
        applied_ = snap.command;
        return applied_;
    }

    if (!applied_) return std::nullopt;

    if (dt > 0.0) age_s_ += dt;
    bool stale = snap.last_failed || age_s_ > config_.stale_after_s;
    if (stale) {
        applied_ = decay(*applied_, config_.thrust_decay_per_tick);
    }
    return applied_;
}

} // namespace pursuit::net
