#ifndef TRANSFER_METER_LOOPBACK_SERVER_HPP
#define TRANSFER_METER_LOOPBACK_SERVER_HPP

#pragma once

#include <arpa/inet.h>
#include <netinet/in.h>
#include <poll.h>
#include <sys/socket.h>
#include <unistd.h>

#include <atomic>
#include <cctype>
#include <cstdlib>
#include <mutex>
#include <stdexcept>
#include <string>
#include <thread>
#include <vector>

namespace test_support {
    // One-connection-at-a-time HTTP server on 127.0.0.1. Every request gets the same raw
    // response bytes, then the connection is closed.
    class LoopbackServer {
       public:
        static constexpr int POLL_MS = 50;

        explicit LoopbackServer(std::string response) : response_(std::move(response)) {
            listen_fd_ = ::socket(AF_INET, SOCK_STREAM, 0);
            if (listen_fd_ < 0) {
                throw std::runtime_error("socket failed");
            }

            sockaddr_in addr{};
            addr.sin_family = AF_INET;
            addr.sin_addr.s_addr = htonl(INADDR_LOOPBACK);
            addr.sin_port = 0;
            socklen_t len = sizeof(addr);
            if (::bind(listen_fd_, reinterpret_cast<sockaddr*>(&addr), sizeof(addr)) != 0 || ::listen(listen_fd_, 8) != 0 ||
                ::getsockname(listen_fd_, reinterpret_cast<sockaddr*>(&addr), &len) != 0) {
                ::close(listen_fd_);
                throw std::runtime_error("failed to listen on loopback");
            }
            port_ = ntohs(addr.sin_port);

            thread_ = std::thread([this]() { serve(); });
        }

        ~LoopbackServer() {
            stop_ = true;
            thread_.join();
            ::close(listen_fd_);
        }

        LoopbackServer(const LoopbackServer&) = delete;
        LoopbackServer& operator=(const LoopbackServer&) = delete;
        LoopbackServer(LoopbackServer&&) = delete;
        LoopbackServer& operator=(LoopbackServer&&) = delete;

        [[nodiscard]] std::string url(const std::string& path) const { return "http://127.0.0.1:" + std::to_string(port_) + path; }

        // Raw bytes of every request received so far, head and body.
        std::vector<std::string> requests() const {
            const std::lock_guard<std::mutex> lock(mutex_);
            return requests_;
        }

        // A port with nothing listening on it.
        static int unused_port() {
            const int fd = ::socket(AF_INET, SOCK_STREAM, 0);
            sockaddr_in addr{};
            addr.sin_family = AF_INET;
            addr.sin_addr.s_addr = htonl(INADDR_LOOPBACK);
            socklen_t len = sizeof(addr);
            ::bind(fd, reinterpret_cast<sockaddr*>(&addr), sizeof(addr));
            ::getsockname(fd, reinterpret_cast<sockaddr*>(&addr), &len);
            ::close(fd);
            return ntohs(addr.sin_port);
        }

       private:
        void serve() {
            while (!stop_) {
                pollfd pfd{.fd = listen_fd_, .events = POLLIN, .revents = 0};
                if (::poll(&pfd, 1, POLL_MS) <= 0) {
                    continue;
                }

                const int conn = ::accept(listen_fd_, nullptr, nullptr);
                if (conn < 0) {
                    continue;
                }

                std::string request = read_request(conn);
                {
                    const std::lock_guard<std::mutex> lock(mutex_);
                    requests_.push_back(std::move(request));
                }
                write_all(conn, response_);
                ::shutdown(conn, SHUT_RDWR);
                ::close(conn);
            }
        }

        static std::string read_request(int conn) {
            std::string data;
            char chunk[4096];
            size_t body_needed = std::string::npos;

            while (true) {
                const auto head_end = data.find("\r\n\r\n");
                if (head_end != std::string::npos && body_needed == std::string::npos) {
                    body_needed = head_end + 4 + content_length(data.substr(0, head_end));
                }
                if (body_needed != std::string::npos && data.size() >= body_needed) {
                    return data;
                }

                const ssize_t n = ::recv(conn, chunk, sizeof(chunk), 0);
                if (n <= 0) {
                    return data;
                }
                data.append(chunk, static_cast<size_t>(n));
            }
        }

        static size_t content_length(const std::string& head) {
            const std::string key = "\r\ncontent-length:";
            std::string lower = head;
            for (auto& c : lower) {
                c = static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
            }
            const auto pos = lower.find(key);
            return pos == std::string::npos ? 0 : std::strtoul(head.c_str() + pos + key.size(), nullptr, 10);
        }

        static void write_all(int conn, const std::string& data) {
            size_t sent = 0;
            while (sent < data.size()) {
                const ssize_t n = ::send(conn, data.data() + sent, data.size() - sent, MSG_NOSIGNAL);
                if (n <= 0) {
                    return;
                }
                sent += static_cast<size_t>(n);
            }
        }

        std::string response_;
        int listen_fd_ = -1;
        int port_ = 0;
        std::atomic<bool> stop_{false};
        std::thread thread_;

        mutable std::mutex mutex_;
        std::vector<std::string> requests_;
    };
}  // namespace test_support

#endif
