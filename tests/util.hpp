// Copyright (c) 2021 MIT Digital Currency Initiative,
//                    Federal Reserve Bank of Boston
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#ifndef MINTNET_TESTS_UTIL_H_
#define MINTNET_TESTS_UTIL_H_

#include "comm/call.hpp"
#include "ledger/format.hpp"
#include "ledger/with_signature.hpp"
#include "util/common/keys.hpp"
#include "util/common/logging.hpp"
#include "util/rpc/format.hpp"
#include "util/serialization/util.hpp"

#include <deque>
#include <gtest/gtest.h>
#include <memory>
#include <mutex>
#include <variant>
#include <vector>

namespace mintnet::test {
    /// A secp256k1 key pair.
    struct keypair {
        privkey_t m_sk{};
        pubkey_t m_pk{};

        /// Returns the address owned by the key pair.
        [[nodiscard]] auto addr() const -> ledger::address;
    };

    /// Derives a key pair from a private key filled with the given byte.
    /// \param seed byte to fill the private key with. Must be non-zero.
    auto make_keypair(unsigned char seed) -> keypair;

    /// Returns a log that discards everything below error level.
    auto make_log() -> std::shared_ptr<logging::log>;

    /// Returns a transaction spending one input to the given address.
    auto simple_tx(const ledger::address& to, uint64_t value) -> ledger::transaction;

    /// Requests a scripted transport received and the replies it should
    /// give, in order. Shared between a test and the transports it hands to
    /// a client.
    /// \tparam Request request type of the role under test.
    template<typename Request>
    struct script {
        /// A payload to answer with, or a transport failure. A
        /// server_error is delivered as a response without payload.
        using reply = std::variant<buffer, rpc::call_error>;

        std::mutex m_mut;
        /// Decoded requests in arrival order.
        std::vector<Request> m_requests;
        /// Replies still to be given.
        std::deque<reply> m_replies;
        /// Endpoints transports were created for.
        std::vector<network::endpoint_t> m_endpoints;

        /// Queues a payload reply.
        template<typename T>
        void reply_with(const T& value) {
            std::unique_lock<std::mutex> l(m_mut);
            m_replies.emplace_back(make_buffer(value));
        }

        /// Queues a transport failure.
        void fail_with(rpc::call_error_code code, std::string what = "") {
            std::unique_lock<std::mutex> l(m_mut);
            m_replies.emplace_back(rpc::call_error{code, std::move(what)});
        }

        [[nodiscard]] auto request_count() -> size_t {
            std::unique_lock<std::mutex> l(m_mut);
            return m_requests.size();
        }
    };

    /// \brief In-memory transport replaying a \ref script.
    ///
    /// Decodes each request as the server would, records it, and answers
    /// with the next scripted reply wrapped in a response carrying the
    /// request's ID. Fails with a disconnection when the script runs out.
    template<typename Request>
    class scripted_transport : public rpc::client<Request, buffer> {
      public:
        explicit scripted_transport(std::shared_ptr<script<Request>> s)
            : m_script(std::move(s)) {}

      private:
        std::shared_ptr<script<Request>> m_script;

        auto call_raw(buffer request_buf,
                      rpc::request_id_type request_id,
                      std::chrono::milliseconds /* timeout */)
            -> std::variant<buffer, rpc::call_error> override {
            auto req = from_buffer_exact<rpc::request<Request>>(request_buf);
            EXPECT_TRUE(req.has_value());

            std::unique_lock<std::mutex> l(m_script->m_mut);
            if(req.has_value()) {
                EXPECT_EQ(req->m_header.m_request_id, request_id);
                m_script->m_requests.push_back(std::move(req->m_payload));
            }
            if(m_script->m_replies.empty()) {
                return rpc::call_error{rpc::call_error_code::disconnected,
                                       "script exhausted"};
            }
            auto next = std::move(m_script->m_replies.front());
            m_script->m_replies.pop_front();

            auto resp = rpc::response<buffer>{{request_id}, std::nullopt, ""};
            if(auto* err = std::get_if<rpc::call_error>(&next)) {
                if(err->m_code != rpc::call_error_code::server_error) {
                    return *err;
                }
                resp.m_error = err->m_what;
            } else {
                resp.m_payload = std::move(std::get<buffer>(next));
            }
            return make_buffer(resp);
        }
    };

    /// Returns a factory that creates scripted transports sharing s and
    /// records each endpoint it is asked for.
    template<typename Request>
    auto scripted_factory(std::shared_ptr<script<Request>> s) {
        return [s](const network::endpoint_t& ep)
                   -> std::unique_ptr<comm::transport<Request>> {
            {
                std::unique_lock<std::mutex> l(s->m_mut);
                s->m_endpoints.push_back(ep);
            }
            return std::make_unique<scripted_transport<Request>>(s);
        };
    }

    /// Signs an either with the given key, as the bank and notary sign
    /// their responses.
    template<typename T>
    auto sign_reply(const keypair& signer, comm::either<T> value)
        -> ledger::with_signature<comm::either<T>> {
        auto ctx = make_secp_context();
        auto ws = ledger::make_with_signature(ctx.get(),
                                              signer.m_sk,
                                              std::move(value));
        EXPECT_TRUE(ws.has_value());
        return ws.value();
    }

    /// Returns the right side of an either holding a T.
    template<typename T>
    auto right(T value) -> comm::either<T> {
        return comm::either<T>(std::in_place_index<1>, std::move(value));
    }

    /// Returns the left side of an either holding a T.
    template<typename T>
    auto left(std::string reason) -> comm::either<T> {
        return comm::either<T>(std::in_place_index<0>, std::move(reason));
    }
}

#endif // MINTNET_TESTS_UTIL_H_
