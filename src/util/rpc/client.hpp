// Copyright (c) 2021 MIT Digital Currency Initiative,
//                    Federal Reserve Bank of Boston
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#ifndef MINTNET_SRC_RPC_CLIENT_H_
#define MINTNET_SRC_RPC_CLIENT_H_

#include "format.hpp"
#include "messages.hpp"
#include "util/serialization/util.hpp"

#include <atomic>
#include <chrono>
#include <string>
#include <variant>

namespace mintnet::rpc {
    /// Reasons a call can fail below the application layer.
    enum class call_error_code {
        /// No response arrived before the deadline.
        timeout,
        /// The connection could not be established or was lost.
        disconnected,
        /// The response could not be decoded or did not match the request.
        malformed_response,
        /// The server received the request but failed to execute it.
        server_error
    };

    /// Transport-level failure of a single call.
    struct call_error {
        call_error_code m_code{};
        /// Human-readable detail, such as the server's error text.
        std::string m_what;
    };

    /// Returns a short name for the error code.
    inline auto to_string(call_error_code code) -> std::string {
        switch(code) {
            case call_error_code::timeout:
                return "timeout";
            case call_error_code::disconnected:
                return "disconnected";
            case call_error_code::malformed_response:
                return "malformed response";
            case call_error_code::server_error:
                return "server error";
        }
        return "unknown";
    }

    /// Generic RPC client. Handles serialization of requests and responses
    /// combined with a message header. Subclass to define actual remote
    /// communication logic.
    /// \tparam Request type for requests.
    /// \tparam Response type for responses.
    template<typename Request, typename Response>
    class client {
      public:
        client() = default;
        client(client&&) noexcept = delete;
        auto operator=(client&&) noexcept -> client& = delete;
        client(const client&) = delete;
        auto operator=(const client&) -> client& = delete;

        virtual ~client() = default;

        using request_type = request<Request>;
        using response_type = response<Response>;
        /// Response payload, or the reason the call failed.
        using result_type = std::variant<Response, call_error>;

        /// Issues the given request with an optional timeout, then waits for
        /// and returns the response. Serializes the request data, calls
        /// call_raw() to transmit the data and get a response, and returns the
        /// deserialized response. Thread safe.
        /// \param request_payload payload for the RPC.
        /// \param timeout optional timeout in milliseconds. Zero indicates the
        ///                call should not timeout.
        /// \return response payload from the RPC, or the error that prevented
        ///         the call from producing one.
        [[nodiscard]] auto call(Request request_payload,
                                std::chrono::milliseconds timeout
                                = std::chrono::milliseconds::zero())
            -> result_type {
            auto request_id = m_current_request_id++;
            auto req = request_type{{request_id}, std::move(request_payload)};
            auto raw = call_raw(make_buffer(req), request_id, timeout);
            if(auto* err = std::get_if<call_error>(&raw)) {
                return std::move(*err);
            }

            auto& response_buf = std::get<buffer>(raw);
            auto resp = from_buffer_exact<response_type>(response_buf);
            if(!resp.has_value()) {
                return call_error{call_error_code::malformed_response,
                                  "undecodable response to request "
                                      + std::to_string(request_id)};
            }
            if(resp->m_header.m_request_id != request_id) {
                return call_error{
                    call_error_code::malformed_response,
                    "response id "
                        + std::to_string(resp->m_header.m_request_id)
                        + " does not match request id "
                        + std::to_string(request_id)};
            }
            if(!resp->m_payload.has_value()) {
                return call_error{call_error_code::server_error,
                                  std::move(resp->m_error)};
            }
            return std::move(resp->m_payload.value());
        }

      private:
        std::atomic<uint64_t> m_current_request_id{};

        /// Subclasses must override this function to define the logic for
        /// call() to transmit a serialized RPC request and wait for a
        /// serialized response with an optional timeout.
        /// \param request_buf serialized request object.
        /// \param request_id identifier to match requests with responses.
        /// \param timeout timeout in milliseconds. Zero indicates the
        ///                call should not timeout.
        /// \return serialized response, or the transport error that
        ///         prevented one from arriving.
        virtual auto call_raw(mintnet::buffer request_buf,
                              request_id_type request_id,
                              std::chrono::milliseconds timeout)
            -> std::variant<mintnet::buffer, call_error> = 0;
    };
}

#endif // MINTNET_SRC_RPC_CLIENT_H_
