// Copyright (c) 2021 MIT Digital Currency Initiative,
//                    Federal Reserve Bank of Boston
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

/**
 * \file error.hpp
 * Failures of remote calls between the bank, mintettes, the notary and
 * explorers, and their translation from transport errors.
 */

#ifndef MINTNET_SRC_COMM_ERROR_H_
#define MINTNET_SRC_COMM_ERROR_H_

#include "util/rpc/client.hpp"

#include <optional>
#include <string>
#include <variant>

namespace mintnet::comm {
    /// Kind of a remote call failure.
    enum class error_code : uint8_t {
        /// A message was malformed or the result had an unexpected type.
        protocol,
        /// No response arrived in time.
        timeout,
        /// The remote method, or a local precondition of the call, failed.
        method,
        /// A response that must be signed carried a bad signature. The
        /// message names the authority that should have signed it.
        bad_signature
    };

    /// Failure of a remote call.
    struct communication_error {
        error_code m_code{};
        std::string m_message;

        auto operator==(const communication_error& rhs) const -> bool;
    };

    /// Value returned by a remote call, or the reason the call failed.
    /// \tparam T type of the value.
    template<typename T>
    using result = std::variant<T, communication_error>;

    /// Outcome of a remote call that returns nothing: std::nullopt on
    /// success.
    using status = std::optional<communication_error>;

    auto protocol_error(std::string message) -> communication_error;
    auto timeout_error(std::string message) -> communication_error;
    auto method_error(std::string message) -> communication_error;
    /// \param signer name of the authority whose signature failed.
    auto bad_signature(std::string signer) -> communication_error;

    /// Maps a transport failure to a communication error. Timeouts and lost
    /// connections become timeout errors, undecodable responses become
    /// protocol errors and server-side failures become method errors.
    /// \param err transport failure.
    /// \return equivalent communication error.
    auto translate(const rpc::call_error& err) -> communication_error;

    /// Renders the error for logs and user output.
    auto to_string(const communication_error& err) -> std::string;
}

#endif // MINTNET_SRC_COMM_ERROR_H_
