// Copyright (c) 2021 MIT Digital Currency Initiative,
//                    Federal Reserve Bank of Boston
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#include "primitives.hpp"

#include "format.hpp"
#include "with_signature.hpp"

#include <sstream>
#include <tuple>

namespace mintnet::ledger {
    auto address::operator==(const address& rhs) const -> bool {
        return m_key == rhs.m_key;
    }

    auto address::operator!=(const address& rhs) const -> bool {
        return !(*this == rhs);
    }

    auto address::operator<(const address& rhs) const -> bool {
        return m_key < rhs.m_key;
    }

    auto coin::operator==(const coin& rhs) const -> bool {
        return std::tie(m_color, m_value) == std::tie(rhs.m_color, rhs.m_value);
    }

    auto coin::operator!=(const coin& rhs) const -> bool {
        return !(*this == rhs);
    }

    auto coin::operator<(const coin& rhs) const -> bool {
        return std::tie(m_color, m_value) < std::tie(rhs.m_color, rhs.m_value);
    }

    auto addr_id::operator==(const addr_id& rhs) const -> bool {
        return std::tie(m_tx_id, m_index, m_coin)
            == std::tie(rhs.m_tx_id, rhs.m_index, rhs.m_coin);
    }

    auto addr_id::operator!=(const addr_id& rhs) const -> bool {
        return !(*this == rhs);
    }

    auto addr_id::operator<(const addr_id& rhs) const -> bool {
        return std::tie(m_tx_id, m_index, m_coin)
             < std::tie(rhs.m_tx_id, rhs.m_index, rhs.m_coin);
    }

    auto transaction::operator==(const transaction& rhs) const -> bool {
        return m_inputs == rhs.m_inputs && m_outputs == rhs.m_outputs;
    }

    auto transaction::operator!=(const transaction& rhs) const -> bool {
        return !(*this == rhs);
    }

    auto tx_id(const transaction& tx) -> transaction_id {
        return signing_hash(tx);
    }

    auto sign_transaction(secp256k1_context* ctx,
                          const privkey_t& sk,
                          const transaction& tx)
        -> std::optional<signature_t> {
        return sign_value(ctx, sk, tx);
    }

    auto validate_signature(const signature_t& sig,
                            const address& addr,
                            const transaction& tx) -> bool {
        return verify_value(addr.m_key, tx, sig);
    }

    auto to_string(const address& addr) -> std::string {
        return to_hex(addr.m_key.data(), addr.m_key.size());
    }

    auto to_string(const coin& c) -> std::string {
        std::stringstream ss;
        ss << c.m_value << " (color " << c.m_color << ")";
        return ss.str();
    }

    auto to_string(const addr_id& id) -> std::string {
        std::stringstream ss;
        ss << mintnet::to_string(id.m_tx_id) << ":" << id.m_index << " "
           << to_string(id.m_coin);
        return ss.str();
    }

    auto to_string(const transaction& tx) -> std::string {
        std::stringstream ss;
        ss << "tx " << mintnet::to_string(tx_id(tx)) << " {inputs: [";
        for(size_t i = 0; i < tx.m_inputs.size(); i++) {
            ss << (i == 0 ? "" : ", ") << to_string(tx.m_inputs[i]);
        }
        ss << "], outputs: [";
        for(size_t i = 0; i < tx.m_outputs.size(); i++) {
            const auto& [addr, c] = tx.m_outputs[i];
            ss << (i == 0 ? "" : ", ") << to_string(addr) << " <- "
               << to_string(c);
        }
        ss << "]}";
        return ss.str();
    }
}
