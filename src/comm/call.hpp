// Copyright (c) 2021 MIT Digital Currency Initiative,
//                    Federal Reserve Bank of Boston
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

/**
 * \file call.hpp
 * Single combinator through which every role client issues remote calls.
 */

#ifndef MINTNET_SRC_COMM_CALL_H_
#define MINTNET_SRC_COMM_CALL_H_

#include "error.hpp"
#include "ledger/with_signature.hpp"
#include "util/common/logging.hpp"
#include "util/rpc/client.hpp"
#include "util/serialization/util.hpp"

#include <chrono>
#include <memory>
#include <optional>
#include <string>
#include <type_traits>
#include <variant>

namespace mintnet::comm {
    /// Application-level outcome of a remote method: error text on the
    /// left, the value on the right.
    template<typename T>
    using either = std::variant<std::string, T>;

    /// Transport shared by all role clients. Responses are left encoded so
    /// that the combinator decides which type to decode them as.
    template<typename Request>
    using transport = rpc::client<Request, buffer>;

    /// Text prepended to the left side of an unwrapped either.
    static constexpr auto caller_side_prefix
        = "Error on caller side has occurred: ";

    /// Result is the value itself.
    struct plain {
        template<typename T>
        using wire_type = T;
    };

    /// Result is an either; the left side becomes a method error.
    struct unwrap_either {
        template<typename T>
        using wire_type = either<T>;
    };

    /// Result is an either signed by an authority. The signature is checked
    /// before the either is unwrapped.
    struct signed_either {
        template<typename T>
        using wire_type = ledger::with_signature<either<T>>;
    };

    /// A party whose signature on responses is checked.
    struct authority {
        /// Name reported in bad signature errors, e.g. "bank".
        std::string m_name;
        /// Key the party signs its responses with.
        pubkey_t m_key{};
    };

    /// Per-client settings applied to every call.
    struct call_context {
        /// Log receiving failed calls.
        std::shared_ptr<logging::log> m_log;
        /// Deadline for each call. Zero waits forever.
        std::chrono::milliseconds m_timeout{};
        /// Signer of responses, required by \ref signed_either.
        std::optional<authority> m_authority;
    };

    /// \brief Issues a request and checks the response.
    ///
    /// Applies in order: translation of transport failures, exact decoding
    /// of the response as the policy's wire type, signature verification
    /// against the context's authority, and unwrapping of the either. The
    /// first failing step decides the error, which is logged at error level
    /// and returned.
    /// \tparam T type of the value the remote method returns.
    /// \tparam Policy one of \ref plain, \ref unwrap_either or
    ///                \ref signed_either.
    /// \param t transport to the remote node.
    /// \param req request to send.
    /// \param ctx settings for this call.
    /// \return the value, or the reason the call failed.
    template<typename T, typename Policy, typename Request>
    auto call(transport<Request>& t, Request req, const call_context& ctx)
        -> result<T> {
        auto fail = [&](communication_error err) -> result<T> {
            ctx.m_log->error(to_string(err));
            return result<T>(std::in_place_index<1>, std::move(err));
        };

        auto res = t.call(std::move(req), ctx.m_timeout);
        if(auto* err = std::get_if<rpc::call_error>(&res)) {
            return fail(translate(*err));
        }

        using wire_type = typename Policy::template wire_type<T>;
        auto& payload = std::get<buffer>(res);
        auto decoded = from_buffer_exact<wire_type>(payload);
        if(!decoded.has_value()) {
            return fail(protocol_error("result type mismatch in "
                                       + std::to_string(payload.size())
                                       + " byte response"));
        }

        if constexpr(std::is_same_v<Policy, plain>) {
            return result<T>(std::in_place_index<0>,
                             std::move(decoded.value()));
        } else {
            if constexpr(std::is_same_v<Policy, signed_either>) {
                if(!ctx.m_authority.has_value()) {
                    return fail(bad_signature("unconfigured authority"));
                }
                if(!ledger::verify_with_signature(ctx.m_authority->m_key,
                                                  decoded.value())) {
                    return fail(bad_signature(ctx.m_authority->m_name));
                }
            }

            either<T>* inner{};
            if constexpr(std::is_same_v<Policy, signed_either>) {
                inner = &decoded->m_value;
            } else {
                inner = &decoded.value();
            }
            if(auto* left = std::get_if<0>(inner)) {
                return fail(method_error(caller_side_prefix + *left));
            }
            return result<T>(std::in_place_index<0>,
                             std::move(std::get<1>(*inner)));
        }
    }

    /// Collapses a call returning nothing into a status.
    inline auto to_status(result<std::monostate> res) -> status {
        if(auto* err = std::get_if<communication_error>(&res)) {
            return std::move(*err);
        }
        return std::nullopt;
    }
}

#endif // MINTNET_SRC_COMM_CALL_H_
