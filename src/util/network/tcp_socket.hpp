// Copyright (c) 2021 MIT Digital Currency Initiative,
//                    Federal Reserve Bank of Boston
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#ifndef MINTNET_SRC_NETWORK_TCP_SOCKET_H_
#define MINTNET_SRC_NETWORK_TCP_SOCKET_H_

#include "endpoint.hpp"
#include "util/common/buffer.hpp"

#include <atomic>
#include <chrono>
#include <cstddef>
#include <optional>

namespace mintnet::network {
    /// Outcome of a socket operation bounded by a deadline.
    enum class io_result {
        /// The operation completed.
        ok,
        /// The deadline passed before the operation completed.
        timeout,
        /// The connection failed or was closed by the peer.
        error
    };

    /// Point in time by which a socket operation must complete.
    class deadline {
      public:
        /// Constructor.
        /// \param timeout time from now until the deadline. Zero, or a
        ///                timeout too long to represent, never expires.
        explicit deadline(std::chrono::milliseconds timeout);

        /// Returns true if the deadline has passed.
        [[nodiscard]] auto expired() const -> bool;

        /// Returns the time left in the form poll() accepts: -1 for no
        /// deadline, otherwise the remaining milliseconds rounded up and
        /// capped at INT_MAX.
        [[nodiscard]] auto poll_timeout() const -> int;

      private:
        std::optional<std::chrono::steady_clock::time_point> m_at;
    };

    /// \brief Wrapper for a TCP socket.
    ///
    /// Manages a raw UNIX TCP socket. Handles sending and receiving discrete
    /// packets by providing a protocol for determining packet boundaries.
    /// Sends the size of the packet before the packet data. When receiving,
    /// reads the packet size and returns a discrete packet once the expected
    /// size is read in full. The socket is non-blocking; every operation
    /// waits for readiness with poll() and gives up at its deadline.
    class tcp_socket {
      public:
        /// Constructs an empty, unconnected TCP socket.
        tcp_socket();

        ~tcp_socket();

        tcp_socket(const tcp_socket&) = delete;
        auto operator=(const tcp_socket&) -> tcp_socket& = delete;

        tcp_socket(tcp_socket&&) = delete;
        auto operator=(tcp_socket&&) -> tcp_socket& = delete;

        /// Attempts to connect to the given endpoint, trying each address
        /// the endpoint resolves to until one accepts.
        /// \param ep the endpoint to which this socket should connect.
        /// \param dl deadline for the whole connection attempt.
        /// \return ok if the socket connected, timeout if the deadline passed
        ///         first, error if no address accepted the connection.
        auto connect(const endpoint_t& ep, const deadline& dl) -> io_result;

        /// Sends the given packet to the remote host.
        /// \param pkt the packet to send.
        /// \param dl deadline for writing the whole packet.
        /// \return ok if the packet was written in full.
        [[nodiscard]] auto send(const buffer& pkt, const deadline& dl) const
            -> io_result;

        /// Receives a packet from the remote host. Waits until a full
        /// packet is read, the deadline passes or an error occurs.
        /// \param pkt the packet to receive into.
        /// \param dl deadline for reading the whole packet.
        /// \return ok if a packet was received in full.
        [[nodiscard]] auto receive(buffer& pkt, const deadline& dl) const
            -> io_result;

        /// Closes the connection with the remote host.
        void disconnect();

        /// Returns whether the socket successfully connected to an
        /// endpoint.
        /// \return true if connect() succeeded. False if connect() has not
        ///         yet been called, the connect() call failed, or following a
        ///         disconnect() call.
        [[nodiscard]] auto connected() const -> bool;

      private:
        int m_sock_fd{-1};
        std::atomic_bool m_connected{false};

        [[nodiscard]] auto wait_for(short events, const deadline& dl) const
            -> io_result;

        [[nodiscard]] auto read_exact(std::byte* dst,
                                      size_t len,
                                      const deadline& dl) const -> io_result;
    };
}

#endif // MINTNET_SRC_NETWORK_TCP_SOCKET_H_
