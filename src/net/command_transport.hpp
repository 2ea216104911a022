#ifndef PURSUIT_COMMAND_TRANSPORT_HPP
#define PURSUIT_COMMAND_TRANSPORT_HPP

#include <optional>
#include <string>

namespace pursuit::net {

/**
 * @brief Request/reply link to the external policy process
 *
 * Called only from the CommandChannel worker thread.
 */
class CommandTransport {
public:
    virtual ~CommandTransport() = default;

    /// Send one payload and wait for its reply; nullopt on failure or timeout
    virtual std::optional<std::string> request(const std::string& payload, int timeout_ms) = 0;

    /// Drop any connection; the next request reconnects
    virtual void reset() {}
};

} // namespace pursuit::net

#endif // PURSUIT_COMMAND_TRANSPORT_HPP
