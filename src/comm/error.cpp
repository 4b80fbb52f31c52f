// Copyright (c) 2021 MIT Digital Currency Initiative,
//                    Federal Reserve Bank of Boston
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#include "error.hpp"

namespace mintnet::comm {
    auto communication_error::operator==(const communication_error& rhs) const
        -> bool {
        return m_code == rhs.m_code && m_message == rhs.m_message;
    }

    auto protocol_error(std::string message) -> communication_error {
        return {error_code::protocol, std::move(message)};
    }

    auto timeout_error(std::string message) -> communication_error {
        return {error_code::timeout, std::move(message)};
    }

    auto method_error(std::string message) -> communication_error {
        return {error_code::method, std::move(message)};
    }

    auto bad_signature(std::string signer) -> communication_error {
        return {error_code::bad_signature, std::move(signer)};
    }

    auto translate(const rpc::call_error& err) -> communication_error {
        switch(err.m_code) {
            case rpc::call_error_code::timeout:
            case rpc::call_error_code::disconnected:
                return timeout_error(err.m_what);
            case rpc::call_error_code::malformed_response:
                return protocol_error(err.m_what);
            case rpc::call_error_code::server_error:
                return method_error(err.m_what);
        }
        return protocol_error(err.m_what);
    }

    auto to_string(const communication_error& err) -> std::string {
        switch(err.m_code) {
            case error_code::protocol:
                return "internal error: " + err.m_message;
            case error_code::timeout:
                return "timeout error: " + err.m_message;
            case error_code::method:
                return "method error: " + err.m_message;
            case error_code::bad_signature:
                return err.m_message + " has provided a bad signature";
        }
        return err.m_message;
    }
}
