#include "net/ipc_socket.hpp"

#include <sys/socket.h>
#include <sys/un.h>
#include <unistd.h>
#include <poll.h>
#include <cerrno>
#include <chrono>
#include <cstdint>
#include <cstring>
#include <iostream>
#include <stdexcept>
#include <utility>

namespace pursuit::net {

static constexpr uint32_t MAX_FRAME_BYTES = 10 * 1024 * 1024;

static std::string sys_error(const std::string& what) {
    return what + ": " + std::strerror(errno);
}

static sockaddr_un make_address(const std::string& socket_path) {
    if (socket_path.size() >= sizeof(sockaddr_un::sun_path)) {
        throw std::runtime_error("Socket path too long: " + socket_path);
    }
    sockaddr_un addr;
    std::memset(&addr, 0, sizeof(addr));
    addr.sun_family = AF_UNIX;
    std::strncpy(addr.sun_path, socket_path.c_str(), sizeof(addr.sun_path) - 1);
    return addr;
}

// Wraps the descriptor before any further call so every failure path closes it
static IPCSocket open_stream(int& fd) {
    fd = ::socket(AF_UNIX, SOCK_STREAM, 0);
    if (fd < 0) throw std::runtime_error(sys_error("socket()"));
    return IPCSocket::adopt(fd);
}

// ── Lifetime ──

IPCSocket::IPCSocket() = default;

IPCSocket::IPCSocket(int fd) : fd_(fd) {}

IPCSocket IPCSocket::adopt(int fd) {
    return IPCSocket(fd);
}

IPCSocket::~IPCSocket() {
    close();
}

IPCSocket::IPCSocket(IPCSocket&& other) noexcept
    : fd_(other.fd_), is_server_(other.is_server_), socket_path_(std::move(other.socket_path_)) {
    other.fd_ = -1;
    other.is_server_ = false;
}

IPCSocket& IPCSocket::operator=(IPCSocket&& other) noexcept {
    if (this != &other) {
        close();
        std::swap(fd_, other.fd_);
        std::swap(is_server_, other.is_server_);
        socket_path_.swap(other.socket_path_);
    }
    return *this;
}

// ── Endpoints ──

IPCSocket IPCSocket::listen(const std::string& socket_path) {
    const sockaddr_un addr = make_address(socket_path);
    ::unlink(socket_path.c_str());

    int fd = -1;
    IPCSocket server = open_stream(fd);
    if (::bind(fd, reinterpret_cast<const sockaddr*>(&addr), sizeof(addr)) < 0) {
        throw std::runtime_error(sys_error("bind " + socket_path));
    }
    // Path is ours from here; close() unlinks it
    server.is_server_ = true;
    server.socket_path_ = socket_path;
    if (::listen(fd, 4) < 0) {
        throw std::runtime_error(sys_error("listen " + socket_path));
    }
    return server;
}

IPCSocket IPCSocket::connect(const std::string& socket_path) {
    const sockaddr_un addr = make_address(socket_path);

    int fd = -1;
    IPCSocket client = open_stream(fd);
    if (::connect(fd, reinterpret_cast<const sockaddr*>(&addr), sizeof(addr)) < 0) {
        throw std::runtime_error(sys_error("connect " + socket_path));
    }
    return client;
}

IPCSocket IPCSocket::accept() {
    if (!is_server_ || fd_ < 0) {
        throw std::runtime_error("accept() on a socket that is not listening");
    }
    int peer = -1;
    do {
        peer = ::accept(fd_, nullptr, nullptr);
    } while (peer < 0 && errno == EINTR);
    if (peer < 0) throw std::runtime_error(sys_error("accept " + socket_path_));
    return IPCSocket(peer);
}

// ── Frame protocol: [4-byte big-endian length][payload] ──

bool IPCSocket::send(const std::string& payload) {
    if (fd_ < 0 || payload.size() > MAX_FRAME_BYTES) return false;

    uint32_t len = static_cast<uint32_t>(payload.size());
    std::string frame(4, '\0');
    frame[0] = static_cast<char>((len >> 24) & 0xFF);
    frame[1] = static_cast<char>((len >> 16) & 0xFF);
    frame[2] = static_cast<char>((len >> 8)  & 0xFF);
    frame[3] = static_cast<char>((len)       & 0xFF);
    frame += payload;

    size_t total = 0;
    while (total < frame.size()) {
        // MSG_NOSIGNAL: a vanished peer is an error return, not SIGPIPE
        ssize_t n = ::send(fd_, frame.data() + total, frame.size() - total, MSG_NOSIGNAL);
        if (n < 0 && errno == EINTR) continue;
        if (n <= 0) return false;
        total += static_cast<size_t>(n);
    }
    return true;
}

using Deadline = std::optional<std::chrono::steady_clock::time_point>;

// Waits for readability before each read when a deadline is set
static void read_exact(int fd, char* buf, size_t count, const char* what, const Deadline& deadline) {
    size_t total = 0;
    while (total < count) {
        if (deadline) {
            auto left = std::chrono::duration_cast<std::chrono::milliseconds>(
                *deadline - std::chrono::steady_clock::now()).count();
            pollfd pfd{fd, POLLIN, 0};
            int ret = left > 0 ? ::poll(&pfd, 1, static_cast<int>(left)) : 0;
            if (ret < 0 && errno == EINTR) continue;
            if (ret < 0) throw std::runtime_error(sys_error(std::string("poll while reading ") + what));
            if (ret == 0) throw std::runtime_error(std::string("Timed out reading ") + what);
        }
        ssize_t n = ::read(fd, buf + total, count - total);
        if (n < 0 && errno == EINTR) continue;
        if (n <= 0) {
            throw std::runtime_error(std::string("Connection closed while reading ") + what);
        }
        total += static_cast<size_t>(n);
    }
}

static std::string read_frame(int fd, const Deadline& deadline) {
    unsigned char header[4];
    read_exact(fd, reinterpret_cast<char*>(header), 4, "header", deadline);

    uint32_t len = (static_cast<uint32_t>(header[0]) << 24) |
                   (static_cast<uint32_t>(header[1]) << 16) |
                   (static_cast<uint32_t>(header[2]) << 8)  |
                   (static_cast<uint32_t>(header[3]));

    if (len == 0) return "";
    if (len > MAX_FRAME_BYTES) {
        throw std::runtime_error("Message too large: " + std::to_string(len) + " bytes");
    }

    std::string data(len, '\0');
    read_exact(fd, &data[0], len, "payload", deadline);
    return data;
}

std::string IPCSocket::receive() {
    if (fd_ < 0) {
        throw std::runtime_error("Cannot receive on closed socket");
    }
    return read_frame(fd_, std::nullopt);
}

std::optional<std::string> IPCSocket::receive_timeout(int timeout_ms) {
    if (fd_ < 0) return std::nullopt;

    Deadline deadline;
    if (timeout_ms >= 0) {
        deadline = std::chrono::steady_clock::now() + std::chrono::milliseconds(timeout_ms);
    }

    pollfd pfd;
    pfd.fd = fd_;
    pfd.events = POLLIN;
    pfd.revents = 0;

    int ret = ::poll(&pfd, 1, timeout_ms);
    if (ret <= 0) return std::nullopt;
    if (!(pfd.revents & POLLIN)) return std::nullopt;

    // The whole frame shares the timeout; a partial frame leaves the stream unusable
    try {
        return read_frame(fd_, deadline);
    } catch (const std::runtime_error& e) {
        std::cerr << "[IPCSocket] " << e.what() << "\n";
        close();
        return std::nullopt;
    }
}

void IPCSocket::close() {
    if (fd_ >= 0) {
        ::close(fd_);
        fd_ = -1;
    }
    if (is_server_ && !socket_path_.empty()) {
        ::unlink(socket_path_.c_str());
        socket_path_.clear();
        is_server_ = false;
    }
}

bool IPCSocket::is_connected() const {
    return fd_ >= 0;
}

// ── UnixSocketTransport ──

UnixSocketTransport::UnixSocketTransport(std::string socket_path)
    : socket_path_(std::move(socket_path)) {}

std::optional<std::string> UnixSocketTransport::request(const std::string& payload, int timeout_ms) {
    if (!socket_.is_connected()) {
        try {
            socket_ = IPCSocket::connect(socket_path_);
        } catch (const std::runtime_error&) {
            // Policy process not up yet; the channel retries
            return std::nullopt;
        }
    }

    if (!socket_.send(payload)) {
        socket_.close();
        return std::nullopt;
    }

    auto reply = socket_.receive_timeout(timeout_ms);
    if (!reply) {
        // A late reply must not pair with the next request
        socket_.close();
    }
    return reply;
}

} // namespace pursuit::net
