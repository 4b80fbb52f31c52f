// Copyright (c) 2021 MIT Digital Currency Initiative,
//                    Federal Reserve Bank of Boston
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#include "tcp_socket.hpp"

#include <array>
#include <cerrno>
#include <csignal>
#include <cstring>
#include <fcntl.h>
#include <limits>
#include <memory>
#include <netdb.h>
#include <netinet/tcp.h>
#include <poll.h>
#include <sys/socket.h>
#include <unistd.h>
#include <vector>

namespace mintnet::network {
    namespace {
        /// Largest packet accepted from a peer.
        constexpr uint64_t max_packet_size = 64UL * 1024UL * 1024UL;

        /// Longest deadline tracked. steady_clock counts nanoseconds in 64
        /// bits, so longer timeouts are treated as no deadline.
        constexpr auto max_timeout = std::chrono::hours(24 * 365 * 100);

        auto resolve(const endpoint_t& ep) -> std::shared_ptr<addrinfo> {
            addrinfo hints{};
            hints.ai_family = AF_UNSPEC;
            hints.ai_socktype = SOCK_STREAM;
            addrinfo* res0{};
            auto port_str = std::to_string(ep.second);
            if(getaddrinfo(ep.first.c_str(), port_str.c_str(), &hints, &res0)
               != 0) {
                return nullptr;
            }
            return {res0, [](addrinfo* p) {
                        freeaddrinfo(p);
                    }};
        }

        auto set_nonblocking(int fd) -> bool {
            auto flags = fcntl(fd, F_GETFL, 0);
            return flags != -1 && fcntl(fd, F_SETFL, flags | O_NONBLOCK) != -1;
        }
    }

    deadline::deadline(std::chrono::milliseconds timeout) {
        if(timeout == std::chrono::milliseconds::zero()
           || timeout > max_timeout) {
            return;
        }
        m_at = std::chrono::steady_clock::now() + timeout;
    }

    auto deadline::expired() const -> bool {
        return m_at.has_value() && std::chrono::steady_clock::now() >= *m_at;
    }

    auto deadline::poll_timeout() const -> int {
        if(!m_at.has_value()) {
            return -1;
        }
        auto left = std::chrono::ceil<std::chrono::milliseconds>(
            *m_at - std::chrono::steady_clock::now());
        if(left.count() <= 0) {
            return 0;
        }
        if(left.count() > std::numeric_limits<int>::max()) {
            return std::numeric_limits<int>::max();
        }
        return static_cast<int>(left.count());
    }

    tcp_socket::tcp_socket() {
        // Writing to a socket the peer has closed must fail the write, not
        // kill the process.
        static std::atomic_flag sigpipe_ignored = ATOMIC_FLAG_INIT;
        if(!sigpipe_ignored.test_and_set()) {
            std::signal(SIGPIPE, SIG_IGN);
        }
    }

    tcp_socket::~tcp_socket() {
        disconnect();
    }

    auto tcp_socket::connect(const endpoint_t& ep, const deadline& dl)
        -> io_result {
        disconnect();
        auto res0 = resolve(ep);
        if(!res0) {
            return io_result::error;
        }

        for(auto* res = res0.get(); res != nullptr; res = res->ai_next) {
            m_sock_fd = ::socket(res->ai_family,
                                 res->ai_socktype,
                                 res->ai_protocol);
            if(m_sock_fd == -1) {
                continue;
            }
            if(!set_nonblocking(m_sock_fd)) {
                disconnect();
                continue;
            }

            if(::connect(m_sock_fd, res->ai_addr, res->ai_addrlen) != 0) {
                if(errno != EINPROGRESS && errno != EINTR) {
                    disconnect();
                    continue;
                }
                auto ready = wait_for(POLLOUT, dl);
                if(ready == io_result::timeout) {
                    disconnect();
                    return io_result::timeout;
                }
                int err{};
                socklen_t err_len = sizeof(err);
                if(ready != io_result::ok
                   || getsockopt(m_sock_fd, SOL_SOCKET, SO_ERROR, &err, &err_len)
                          != 0
                   || err != 0) {
                    disconnect();
                    continue;
                }
            }

            static constexpr int one = 1;
            setsockopt(m_sock_fd, IPPROTO_TCP, TCP_NODELAY, &one, sizeof(one));
            m_connected = true;
            return io_result::ok;
        }

        return io_result::error;
    }

    void tcp_socket::disconnect() {
        m_connected = false;
        if(m_sock_fd != -1) {
            shutdown(m_sock_fd, SHUT_RDWR);
            close(m_sock_fd);
            m_sock_fd = -1;
        }
    }

    auto tcp_socket::send(const buffer& pkt, const deadline& dl) const
        -> io_result {
        const auto sz_val = static_cast<uint64_t>(pkt.size());
        auto framed = buffer();
        framed.append(&sz_val, sizeof(sz_val));
        framed.append(pkt.data(), pkt.size());

        size_t total_written = 0;
        while(total_written != framed.size()) {
            auto n = write(m_sock_fd,
                           framed.data_at(total_written),
                           framed.size() - total_written);
            if(n > 0) {
                total_written += static_cast<size_t>(n);
                continue;
            }
            if(n < 0 && errno == EINTR) {
                continue;
            }
            if(n < 0 && (errno == EAGAIN || errno == EWOULDBLOCK)) {
                auto ready = wait_for(POLLOUT, dl);
                if(ready != io_result::ok) {
                    return ready;
                }
                continue;
            }
            return io_result::error;
        }

        return io_result::ok;
    }

    auto tcp_socket::receive(buffer& pkt, const deadline& dl) const
        -> io_result {
        std::array<std::byte, sizeof(uint64_t)> sz_buf{};
        auto res = read_exact(sz_buf.data(), sz_buf.size(), dl);
        if(res != io_result::ok) {
            return res;
        }

        uint64_t pkt_sz{};
        std::memcpy(&pkt_sz, sz_buf.data(), sizeof(pkt_sz));
        if(pkt_sz > max_packet_size) {
            return io_result::error;
        }

        auto buf = std::vector<std::byte>(static_cast<size_t>(pkt_sz));
        res = read_exact(buf.data(), buf.size(), dl);
        if(res != io_result::ok) {
            return res;
        }

        pkt.clear();
        pkt.append(buf.data(), buf.size());
        return io_result::ok;
    }

    auto tcp_socket::read_exact(std::byte* dst,
                                size_t len,
                                const deadline& dl) const -> io_result {
        size_t total_read{0};
        while(total_read != len) {
            auto n = read(m_sock_fd, dst + total_read, len - total_read);
            if(n > 0) {
                total_read += static_cast<size_t>(n);
                continue;
            }
            if(n < 0 && errno == EINTR) {
                continue;
            }
            if(n < 0 && (errno == EAGAIN || errno == EWOULDBLOCK)) {
                auto ready = wait_for(POLLIN, dl);
                if(ready != io_result::ok) {
                    return ready;
                }
                continue;
            }
            return io_result::error;
        }
        return io_result::ok;
    }

    auto tcp_socket::wait_for(short events, const deadline& dl) const
        -> io_result {
        if(m_sock_fd == -1) {
            return io_result::error;
        }

        pollfd pfd{};
        pfd.fd = m_sock_fd;
        pfd.events = events;
        while(true) {
            pfd.revents = 0;
            const auto ret = ::poll(&pfd, 1, dl.poll_timeout());
            if(ret < 0 && errno == EINTR) {
                continue;
            }
            if(ret < 0) {
                return io_result::error;
            }
            if(ret == 0) {
                if(dl.expired()) {
                    return io_result::timeout;
                }
                continue;
            }
            // A hangup with data still pending is reported by the next
            // read() once the data is consumed.
            if((pfd.revents & events) != 0
               || ((events & POLLIN) != 0 && (pfd.revents & POLLHUP) != 0)) {
                return io_result::ok;
            }
            return io_result::error;
        }
    }

    auto tcp_socket::connected() const -> bool {
        return m_connected;
    }
}
