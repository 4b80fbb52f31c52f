// Copyright (c) 2021 MIT Digital Currency Initiative,
//                    Federal Reserve Bank of Boston
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#ifndef MINTNET_SRC_RPC_TCP_CLIENT_H_
#define MINTNET_SRC_RPC_TCP_CLIENT_H_

#include "client.hpp"
#include "util/network/tcp_socket.hpp"

#include <mutex>
#include <string>

namespace mintnet::rpc {
    /// Implements an RPC client over a single TCP connection. Connects on
    /// the first call and reconnects after any failure. Calls are
    /// serialized: one request is in flight at a time. The call timeout
    /// bounds connecting, sending and receiving together.
    /// \tparam Request type for requests.
    /// \tparam Response type for responses.
    template<typename Request, typename Response>
    class tcp_client : public client<Request, Response> {
      public:
        /// Constructor.
        /// \param server_endpoint RPC server endpoint to which to connect.
        explicit tcp_client(network::endpoint_t server_endpoint)
            : m_server_endpoint(std::move(server_endpoint)) {}

        tcp_client(tcp_client&&) = delete;
        auto operator=(tcp_client&&) -> tcp_client& = delete;
        tcp_client(const tcp_client&) = delete;
        auto operator=(const tcp_client&) -> tcp_client& = delete;

        ~tcp_client() override = default;

        /// Returns the endpoint this client sends requests to.
        [[nodiscard]] auto endpoint() const -> const network::endpoint_t& {
            return m_server_endpoint;
        }

      private:
        network::endpoint_t m_server_endpoint;
        std::mutex m_sock_mut;
        network::tcp_socket m_sock;

        [[nodiscard]] auto describe_endpoint() const -> std::string {
            return m_server_endpoint.first + ":"
                 + std::to_string(m_server_endpoint.second);
        }

        /// Drops the connection and classifies a failed socket operation.
        /// The connection is dropped after a timeout too, so a late reply
        /// cannot be read as the answer to the next request.
        auto fail(network::io_result res,
                  const std::string& what,
                  std::chrono::milliseconds timeout) -> call_error {
            m_sock.disconnect();
            if(res == network::io_result::timeout) {
                return call_error{call_error_code::timeout,
                                  what + " " + describe_endpoint()
                                      + " timed out after "
                                      + std::to_string(timeout.count())
                                      + "ms"};
            }
            return call_error{call_error_code::disconnected,
                              what + " " + describe_endpoint() + " failed"};
        }

        auto call_raw(mintnet::buffer request_buf,
                      request_id_type /* request_id */,
                      std::chrono::milliseconds timeout)
            -> std::variant<mintnet::buffer, call_error> override {
            const auto dl = network::deadline(timeout);
            std::unique_lock<std::mutex> l(m_sock_mut);
            if(!m_sock.connected()) {
                auto res = m_sock.connect(m_server_endpoint, dl);
                if(res != network::io_result::ok) {
                    return fail(res, "connecting to", timeout);
                }
            }

            auto res = m_sock.send(request_buf, dl);
            if(res != network::io_result::ok) {
                return fail(res, "sending request to", timeout);
            }

            auto response_buf = mintnet::buffer();
            res = m_sock.receive(response_buf, dl);
            if(res != network::io_result::ok) {
                return fail(res, "waiting for response from", timeout);
            }

            return response_buf;
        }
    };
}

#endif // MINTNET_SRC_RPC_TCP_CLIENT_H_
