// Copyright (c) 2021 MIT Digital Currency Initiative,
//                    Federal Reserve Bank of Boston
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

/**
 * \file types.hpp
 * Records exchanged between the bank, mintettes, the notary and explorers.
 */

#ifndef MINTNET_SRC_LEDGER_TYPES_H_
#define MINTNET_SRC_LEDGER_TYPES_H_

#include "primitives.hpp"
#include "strategy.hpp"
#include "util/network/endpoint.hpp"

#include <map>
#include <string>
#include <variant>
#include <vector>

namespace mintnet::ledger {
    /// Sequence number of a period. Also the height of the block the bank
    /// produces at the end of the period.
    using period_id = uint64_t;

    /// Index of a mintette in the bank's current roster.
    using mintette_id = uint64_t;

    /// Network location of a mintette.
    struct mintette {
        std::string m_host;
        uint16_t m_port{0};

        auto operator==(const mintette& rhs) const -> bool;

        /// Returns the RPC endpoint of the mintette.
        [[nodiscard]] auto endpoint() const -> network::endpoint_t;
    };

    /// Mintettes ordered by their ID.
    using mintettes = std::vector<mintette>;

    /// Network location and key of an explorer.
    struct explorer {
        std::string m_host;
        uint16_t m_port{0};
        /// Key the explorer signs its responses with.
        pubkey_t m_key{};

        auto operator==(const explorer& rhs) const -> bool;

        /// Returns the RPC endpoint of the explorer.
        [[nodiscard]] auto endpoint() const -> network::endpoint_t;
    };

    using explorers = std::vector<explorer>;

    /// Mintette keys for a period, each signed by the bank.
    using dpk = std::vector<std::pair<pubkey_t, signature_t>>;

    /// \brief Higher-level block produced by the bank at the end of a
    ///        period.
    struct hblock {
        /// Hash of the block contents chained to the previous block.
        hash_t m_hash{};
        /// Transactions merged from the mintettes' lower-level blocks.
        std::vector<transaction> m_transactions;
        /// Bank's signature over m_hash.
        signature_t m_signature{};
        /// Mintette keys valid in the next period.
        dpk m_dpk;
        /// Spending policies registered during the period.
        strategy::address_strategy_map m_addresses;

        auto operator==(const hblock& rhs) const -> bool;
    };

    /// Extra information stored alongside an hblock.
    struct hblock_metadata {
        /// Block creation time, seconds since the epoch.
        uint64_t m_timestamp{0};

        auto operator==(const hblock_metadata& rhs) const -> bool;
    };

    /// A value paired with metadata that is not part of its identity.
    template<typename T, typename M>
    struct with_metadata {
        T m_value{};
        M m_metadata{};

        auto operator==(const with_metadata& rhs) const -> bool {
            return m_value == rhs.m_value && m_metadata == rhs.m_metadata;
        }
    };

    /// \brief Mintette's promise that an input is unspent.
    ///
    /// Issued by a mintette in response to a double-spend check and
    /// presented back when the transaction is committed.
    struct check_confirmation {
        /// Key of the confirming mintette.
        pubkey_t m_mintette_key{};
        /// The confirmed input.
        addr_id m_addr_id{};
        /// Mintette's signature over the transaction and input.
        signature_t m_signature{};
        /// Head of the mintette's action log after the check.
        hash_t m_head{};
        /// Period the confirmation belongs to.
        period_id m_period{0};

        auto operator==(const check_confirmation& rhs) const -> bool;
    };

    /// Confirmations collected for a transaction, keyed by the confirming
    /// mintette and the input it confirmed.
    using check_confirmations
        = std::map<std::pair<mintette_id, addr_id>, check_confirmation>;

    /// Mintette's acknowledgment that a transaction was committed.
    struct commit_acknowledgment {
        pubkey_t m_mintette_key{};
        signature_t m_signature{};
        /// Head of the mintette's action log after the commit.
        hash_t m_head{};

        auto operator==(const commit_acknowledgment& rhs) const -> bool;
    };

    /// A double-spend check was answered.
    struct query_entry {
        transaction m_tx;

        auto operator==(const query_entry& rhs) const -> bool;
    };

    /// A transaction was committed.
    struct commit_entry {
        transaction m_tx;
        check_confirmations m_confirmations;

        auto operator==(const commit_entry& rhs) const -> bool;
    };

    /// A lower-level block was closed.
    struct close_epoch_entry {
        /// Hash of the closed block.
        hash_t m_block_hash{};

        auto operator==(const close_epoch_entry& rhs) const -> bool;
    };

    using action_log_entry
        = std::variant<query_entry, commit_entry, close_epoch_entry>;

    /// Mintette action log: entries paired with the chained hash up to and
    /// including the entry.
    using action_log = std::vector<std::pair<action_log_entry, hash_t>>;

    /// Lower-level block produced by a mintette during a period.
    struct lblock {
        hash_t m_hash{};
        std::vector<transaction> m_transactions;
        /// Mintette's signature over m_hash.
        signature_t m_signature{};
        /// Head of the action log when the block was closed.
        hash_t m_head_hash{};

        auto operator==(const lblock& rhs) const -> bool;
    };

    /// What a mintette reports to the bank when a period ends.
    struct period_result {
        period_id m_period{0};
        std::vector<lblock> m_blocks;
        action_log m_log;

        auto operator==(const period_result& rhs) const -> bool;
    };

    /// Unspent outputs held by a mintette, with their owners.
    using utxo = std::map<addr_id, address>;

    /// What the bank sends a mintette when a new period starts.
    struct new_period_data {
        /// ID of the starting period.
        period_id m_period{0};
        /// Roster for the starting period.
        mintettes m_mintettes;
        /// The block that closed the previous period.
        hblock m_last_hblock;
        /// Mintette keys for the starting period.
        dpk m_dpk;

        auto operator==(const new_period_data& rhs) const -> bool;
    };

    /// Registers a mintette with its key.
    struct add_mintette {
        mintette m_mintette;
        pubkey_t m_key{};

        auto operator==(const add_mintette& rhs) const -> bool;
    };

    /// Removes the mintette at the given location.
    struct remove_mintette {
        std::string m_host;
        uint16_t m_port{0};

        auto operator==(const remove_mintette& rhs) const -> bool;
    };

    /// Registers an explorer that expects blocks from the given period.
    struct add_explorer {
        explorer m_explorer;
        period_id m_period{0};

        auto operator==(const add_explorer& rhs) const -> bool;
    };

    /// Removes the explorer at the given location.
    struct remove_explorer {
        std::string m_host;
        uint16_t m_port{0};

        auto operator==(const remove_explorer& rhs) const -> bool;
    };

    /// Roster change requested from the bank's local control interface.
    using control_command = std::variant<add_mintette,
                                         remove_mintette,
                                         add_explorer,
                                         remove_explorer>;

    auto to_string(const mintette& m) -> std::string;
    auto to_string(const explorer& e) -> std::string;
    auto to_string(const hblock& blk) -> std::string;
    auto to_string(const check_confirmation& cc) -> std::string;
    auto to_string(const commit_acknowledgment& ack) -> std::string;
    auto to_string(const action_log_entry& entry) -> std::string;
    auto to_string(const lblock& blk) -> std::string;
    auto to_string(const period_result& res) -> std::string;
    auto to_string(const new_period_data& npd) -> std::string;
    auto to_string(const control_command& cmd) -> std::string;
}

#endif // MINTNET_SRC_LEDGER_TYPES_H_
