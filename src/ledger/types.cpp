// Copyright (c) 2021 MIT Digital Currency Initiative,
//                    Federal Reserve Bank of Boston
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#include "types.hpp"

#include "util/common/variant_overloaded.hpp"

#include <sstream>
#include <tuple>

namespace mintnet::ledger {
    auto mintette::operator==(const mintette& rhs) const -> bool {
        return m_host == rhs.m_host && m_port == rhs.m_port;
    }

    auto mintette::endpoint() const -> network::endpoint_t {
        return {m_host, m_port};
    }

    auto explorer::operator==(const explorer& rhs) const -> bool {
        return std::tie(m_host, m_port, m_key)
            == std::tie(rhs.m_host, rhs.m_port, rhs.m_key);
    }

    auto explorer::endpoint() const -> network::endpoint_t {
        return {m_host, m_port};
    }

    auto hblock::operator==(const hblock& rhs) const -> bool {
        return std::tie(m_hash, m_transactions, m_signature, m_dpk, m_addresses)
            == std::tie(rhs.m_hash,
                        rhs.m_transactions,
                        rhs.m_signature,
                        rhs.m_dpk,
                        rhs.m_addresses);
    }

    auto hblock_metadata::operator==(const hblock_metadata& rhs) const
        -> bool {
        return m_timestamp == rhs.m_timestamp;
    }

    auto check_confirmation::operator==(const check_confirmation& rhs) const
        -> bool {
        return std::tie(m_mintette_key, m_addr_id, m_signature, m_head, m_period)
            == std::tie(rhs.m_mintette_key,
                        rhs.m_addr_id,
                        rhs.m_signature,
                        rhs.m_head,
                        rhs.m_period);
    }

    auto commit_acknowledgment::operator==(
        const commit_acknowledgment& rhs) const -> bool {
        return std::tie(m_mintette_key, m_signature, m_head)
            == std::tie(rhs.m_mintette_key, rhs.m_signature, rhs.m_head);
    }

    auto query_entry::operator==(const query_entry& rhs) const -> bool {
        return m_tx == rhs.m_tx;
    }

    auto commit_entry::operator==(const commit_entry& rhs) const -> bool {
        return m_tx == rhs.m_tx && m_confirmations == rhs.m_confirmations;
    }

    auto close_epoch_entry::operator==(const close_epoch_entry& rhs) const
        -> bool {
        return m_block_hash == rhs.m_block_hash;
    }

    auto lblock::operator==(const lblock& rhs) const -> bool {
        return std::tie(m_hash, m_transactions, m_signature, m_head_hash)
            == std::tie(rhs.m_hash,
                        rhs.m_transactions,
                        rhs.m_signature,
                        rhs.m_head_hash);
    }

    auto period_result::operator==(const period_result& rhs) const -> bool {
        return std::tie(m_period, m_blocks, m_log)
            == std::tie(rhs.m_period, rhs.m_blocks, rhs.m_log);
    }

    auto new_period_data::operator==(const new_period_data& rhs) const
        -> bool {
        return std::tie(m_period, m_mintettes, m_last_hblock, m_dpk)
            == std::tie(rhs.m_period,
                        rhs.m_mintettes,
                        rhs.m_last_hblock,
                        rhs.m_dpk);
    }

    auto add_mintette::operator==(const add_mintette& rhs) const -> bool {
        return m_mintette == rhs.m_mintette && m_key == rhs.m_key;
    }

    auto remove_mintette::operator==(const remove_mintette& rhs) const
        -> bool {
        return m_host == rhs.m_host && m_port == rhs.m_port;
    }

    auto add_explorer::operator==(const add_explorer& rhs) const -> bool {
        return m_explorer == rhs.m_explorer && m_period == rhs.m_period;
    }

    auto remove_explorer::operator==(const remove_explorer& rhs) const
        -> bool {
        return m_host == rhs.m_host && m_port == rhs.m_port;
    }

    auto to_string(const mintette& m) -> std::string {
        return "Mintette (" + m.m_host + ":" + std::to_string(m.m_port) + ")";
    }

    auto to_string(const explorer& e) -> std::string {
        return "Explorer (" + e.m_host + ":" + std::to_string(e.m_port)
             + ", key " + to_hex(e.m_key.data(), e.m_key.size()) + ")";
    }

    auto to_string(const hblock& blk) -> std::string {
        std::stringstream ss;
        ss << "HBlock {hash: " << mintnet::to_string(blk.m_hash)
           << ", transactions: " << blk.m_transactions.size()
           << ", dpk: " << blk.m_dpk.size()
           << ", addresses: " << blk.m_addresses.size() << "}";
        return ss.str();
    }

    auto to_string(const check_confirmation& cc) -> std::string {
        std::stringstream ss;
        ss << "CheckConfirmation {key: "
           << to_hex(cc.m_mintette_key.data(), cc.m_mintette_key.size())
           << ", addrid: " << to_string(cc.m_addr_id)
           << ", head: " << mintnet::to_string(cc.m_head)
           << ", period: " << cc.m_period << "}";
        return ss.str();
    }

    auto to_string(const commit_acknowledgment& ack) -> std::string {
        std::stringstream ss;
        ss << "CommitAcknowledgment {key: "
           << to_hex(ack.m_mintette_key.data(), ack.m_mintette_key.size())
           << ", head: " << mintnet::to_string(ack.m_head) << "}";
        return ss.str();
    }

    auto to_string(const action_log_entry& entry) -> std::string {
        return std::visit(
            overloaded{
                [](const query_entry& e) -> std::string {
                    return "Query (" + mintnet::to_string(tx_id(e.m_tx))
                         + ")";
                },
                [](const commit_entry& e) -> std::string {
                    return "Commit (" + mintnet::to_string(tx_id(e.m_tx))
                         + ", " + std::to_string(e.m_confirmations.size())
                         + " confirmations)";
                },
                [](const close_epoch_entry& e) -> std::string {
                    return "CloseEpoch ("
                         + mintnet::to_string(e.m_block_hash) + ")";
                }},
            entry);
    }

    auto to_string(const lblock& blk) -> std::string {
        std::stringstream ss;
        ss << "LBlock {hash: " << mintnet::to_string(blk.m_hash)
           << ", transactions: " << blk.m_transactions.size()
           << ", head: " << mintnet::to_string(blk.m_head_hash) << "}";
        return ss.str();
    }

    auto to_string(const period_result& res) -> std::string {
        std::stringstream ss;
        ss << "PeriodResult {period: " << res.m_period << ", blocks: [";
        for(size_t i = 0; i < res.m_blocks.size(); i++) {
            ss << (i == 0 ? "" : ", ") << to_string(res.m_blocks[i]);
        }
        ss << "], log entries: " << res.m_log.size() << "}";
        return ss.str();
    }

    auto to_string(const new_period_data& npd) -> std::string {
        std::stringstream ss;
        ss << "NewPeriodData {period: " << npd.m_period << ", mintettes: [";
        for(size_t i = 0; i < npd.m_mintettes.size(); i++) {
            ss << (i == 0 ? "" : ", ") << to_string(npd.m_mintettes[i]);
        }
        ss << "], last block: " << to_string(npd.m_last_hblock)
           << ", dpk: " << npd.m_dpk.size() << "}";
        return ss.str();
    }

    auto to_string(const control_command& cmd) -> std::string {
        return std::visit(
            overloaded{[](const add_mintette& c) -> std::string {
                           return "AddMintette " + to_string(c.m_mintette);
                       },
                       [](const remove_mintette& c) -> std::string {
                           return "RemoveMintette " + c.m_host + ":"
                                + std::to_string(c.m_port);
                       },
                       [](const add_explorer& c) -> std::string {
                           return "AddExplorer " + to_string(c.m_explorer)
                                + " from period "
                                + std::to_string(c.m_period);
                       },
                       [](const remove_explorer& c) -> std::string {
                           return "RemoveExplorer " + c.m_host + ":"
                                + std::to_string(c.m_port);
                       }},
            cmd);
    }
}
