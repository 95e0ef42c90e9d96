#pragma once

#include <atomic>
#include <cerrno>
#include <cstdint>
#include <functional>
#include <stdexcept>
#include <string>
#include <thread>

#include <arpa/inet.h>
#include <netinet/in.h>
#include <sys/socket.h>
#include <unistd.h>

namespace streamdrop::test {

struct RawRequest {
    std::string method;
    std::string path;
    std::string head;   // request line and headers, as received

    // Start offset of a "Range: bytes=N-" header, or 0 when absent.
    [[nodiscard]] std::uint64_t rangeStart() const {
        const auto pos = head.find("Range: bytes=");
        if (pos == std::string::npos) {
            return 0;
        }
        return std::stoull(head.substr(pos + 13));
    }

    [[nodiscard]] bool hasRange() const { return head.find("Range: bytes=") != std::string::npos; }
};

// Single-threaded HTTP/1.1 server on 127.0.0.1. Serves one request per
// connection: the handler returns the raw bytes to send and the connection is
// closed right after, so a response shorter than its Content-Length reaches
// the client as a dropped connection.
class LoopbackServer {
public:
    using Handler = std::function<std::string(const RawRequest&)>;

    explicit LoopbackServer(Handler handler) : handler_(std::move(handler)) {
        listen_fd_ = ::socket(AF_INET, SOCK_STREAM, 0);
        if (listen_fd_ < 0) {
            throw std::runtime_error("Socket creation failed");
        }

        int opt = 1;
        ::setsockopt(listen_fd_, SOL_SOCKET, SO_REUSEADDR, &opt, sizeof(opt));

        sockaddr_in addr{};
        addr.sin_family = AF_INET;
        addr.sin_addr.s_addr = htonl(INADDR_LOOPBACK);
        addr.sin_port = 0;
        if (::bind(listen_fd_, reinterpret_cast<sockaddr*>(&addr), sizeof(addr)) < 0 ||
            ::listen(listen_fd_, 16) < 0) {
            ::close(listen_fd_);
            throw std::runtime_error("Bind/listen failed");
        }

        socklen_t len = sizeof(addr);
        ::getsockname(listen_fd_, reinterpret_cast<sockaddr*>(&addr), &len);
        port_ = ntohs(addr.sin_port);

        thread_ = std::thread([this] { serve(); });
    }

    ~LoopbackServer() {
        stopping_ = true;
        ::shutdown(listen_fd_, SHUT_RDWR);
        ::close(listen_fd_);
        if (thread_.joinable()) {
            thread_.join();
        }
    }

    LoopbackServer(const LoopbackServer&) = delete;
    LoopbackServer& operator=(const LoopbackServer&) = delete;

    [[nodiscard]] std::string url(const std::string& path) const {
        return "http://127.0.0.1:" + std::to_string(port_) + path;
    }

    [[nodiscard]] int requests() const { return requests_.load(); }

private:
    void serve() {
        while (!stopping_) {
            const int client = ::accept(listen_fd_, nullptr, nullptr);
            if (client < 0) {
                if (errno == EINTR && !stopping_) {
                    continue;
                }
                return;
            }
            handle(client);
            ::close(client);
        }
    }

    void handle(int client) {
        std::string head;
        char chunk[1024];
        while (head.find("\r\n\r\n") == std::string::npos) {
            const ssize_t got = ::recv(client, chunk, sizeof(chunk), 0);
            if (got <= 0) {
                return;
            }
            head.append(chunk, static_cast<std::size_t>(got));
        }

        RawRequest request;
        request.head = head;
        const auto first_space = head.find(' ');
        const auto second_space = head.find(' ', first_space + 1);
        request.method = head.substr(0, first_space);
        request.path = head.substr(first_space + 1, second_space - first_space - 1);
        ++requests_;

        const std::string response = handler_(request);
        std::size_t sent = 0;
        while (sent < response.size()) {
            const ssize_t n = ::send(client, response.data() + sent, response.size() - sent, MSG_NOSIGNAL);
            if (n <= 0) {
                return;
            }
            sent += static_cast<std::size_t>(n);
        }
    }

    Handler handler_;
    int listen_fd_{-1};
    std::uint16_t port_{0};
    std::atomic<bool> stopping_{false};
    std::atomic<int> requests_{0};
    std::thread thread_;
};

// Builds a response head; `body` may be shorter than `content_length` to
// simulate a connection that drops mid-body.
inline std::string httpResponse(int status, const std::string& reason, const std::string& extra_headers,
                                std::size_t content_length, const std::string& body) {
    return "HTTP/1.1 " + std::to_string(status) + " " + reason + "\r\n" +
           "Content-Length: " + std::to_string(content_length) + "\r\n" +
           "Connection: close\r\n" + extra_headers + "\r\n" + body;
}

} // namespace streamdrop::test
