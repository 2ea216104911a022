#ifndef PURSUIT_IPC_SOCKET_HPP
#define PURSUIT_IPC_SOCKET_HPP

#include "net/command_transport.hpp"
#include <optional>
#include <string>

namespace pursuit::net {

/**
 * @brief Unix domain stream socket carrying length-prefixed JSON frames
 *
 * Frame: [4-byte big-endian length][payload]. Payloads over 10 MB are
 * refused. Move-only; the descriptor is closed on destruction and a
 * listening socket removes its path.
 */
class IPCSocket {
public:
    IPCSocket();
    ~IPCSocket();

    IPCSocket(IPCSocket&& other) noexcept;
    IPCSocket& operator=(IPCSocket&& other) noexcept;
    IPCSocket(const IPCSocket&) = delete;
    IPCSocket& operator=(const IPCSocket&) = delete;

    /// @throws std::runtime_error on socket/bind/listen failure
    static IPCSocket listen(const std::string& socket_path);

    /// @throws std::runtime_error if nothing is listening at the path
    static IPCSocket connect(const std::string& socket_path);

    /// Blocking accept; @throws std::runtime_error
    IPCSocket accept();

    /// Takes ownership of an open stream descriptor
    static IPCSocket adopt(int fd);

    bool send(const std::string& payload);

    /// Blocking; @throws std::runtime_error when the peer closes mid-frame
    std::string receive();

    /// nullopt on timeout, hang-up or a broken frame; the timeout bounds the whole frame
    std::optional<std::string> receive_timeout(int timeout_ms);

    void close();
    bool is_connected() const;

private:
    explicit IPCSocket(int fd);

    int fd_ = -1;
    bool is_server_ = false;
    std::string socket_path_;
};

/// CommandTransport over an IPCSocket client, reconnecting lazily
class UnixSocketTransport : public CommandTransport {
public:
    explicit UnixSocketTransport(std::string socket_path);

    std::optional<std::string> request(const std::string& payload, int timeout_ms) override;
    void reset() override { socket_.close(); }

    const std::string& path() const { return socket_path_; }

private:
    std::string socket_path_;
    IPCSocket socket_;
};

} // namespace pursuit::net

#endif // PURSUIT_IPC_SOCKET_HPP
