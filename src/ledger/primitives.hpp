// Copyright (c) 2021 MIT Digital Currency Initiative,
//                    Federal Reserve Bank of Boston
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#ifndef MINTNET_SRC_LEDGER_PRIMITIVES_H_
#define MINTNET_SRC_LEDGER_PRIMITIVES_H_

#include "util/common/hash.hpp"
#include "util/common/keys.hpp"

#include <cstdint>
#include <optional>
#include <string>
#include <utility>
#include <vector>

namespace mintnet::ledger {
    /// \brief Public identifier of a fund-holding entity.
    ///
    /// Wraps the x-only public key whose owner can spend funds sent to it.
    /// Compared and ordered by key bytes.
    struct address {
        /// The owner's public key.
        pubkey_t m_key{};

        auto operator==(const address& rhs) const -> bool;
        auto operator!=(const address& rhs) const -> bool;
        auto operator<(const address& rhs) const -> bool;
    };

    /// Currency color.
    using color_t = uint32_t;

    /// \brief An amount of a single currency color.
    struct coin {
        /// Color of the currency. Zero is the bank's base currency.
        color_t m_color{0};
        /// Amount in atomic units.
        uint64_t m_value{0};

        auto operator==(const coin& rhs) const -> bool;
        auto operator!=(const coin& rhs) const -> bool;
        auto operator<(const coin& rhs) const -> bool;
    };

    /// Identifier of a transaction: SHA256 of its serialized form.
    using transaction_id = hash_t;

    /// \brief Identifies one unspent output.
    ///
    /// The transaction that created the output, the output's index and the
    /// coin it holds.
    struct addr_id {
        /// ID of the creating transaction.
        transaction_id m_tx_id{};
        /// Index of the output in the creating transaction.
        uint64_t m_index{0};
        /// Coin held by the output.
        coin m_coin{};

        auto operator==(const addr_id& rhs) const -> bool;
        auto operator!=(const addr_id& rhs) const -> bool;
        auto operator<(const addr_id& rhs) const -> bool;
    };

    /// \brief A transfer of coins.
    ///
    /// Spends a list of outputs and creates new ones. Immutable once built;
    /// its identity is \ref tx_id.
    struct transaction {
        /// Outputs being spent.
        std::vector<addr_id> m_inputs{};
        /// New outputs: recipient and amount.
        std::vector<std::pair<address, coin>> m_outputs{};

        auto operator==(const transaction& rhs) const -> bool;
        auto operator!=(const transaction& rhs) const -> bool;
    };

    /// A party's signature over a transaction, tagged with the party's
    /// address.
    using signed_by = std::pair<address, signature_t>;

    /// Calculates the unique ID of a transaction.
    /// \param tx transaction to hash.
    /// \return SHA256 of the serialized transaction.
    auto tx_id(const transaction& tx) -> transaction_id;

    /// Signs a transaction.
    /// \param ctx secp256k1 context.
    /// \param sk the signer's private key.
    /// \param tx transaction to sign.
    /// \return the signature, or std::nullopt if the key is invalid.
    auto sign_transaction(secp256k1_context* ctx,
                          const privkey_t& sk,
                          const transaction& tx) -> std::optional<signature_t>;

    /// Checks that sig is a signature by addr over tx.
    auto validate_signature(const signature_t& sig,
                            const address& addr,
                            const transaction& tx) -> bool;

    auto to_string(const address& addr) -> std::string;
    auto to_string(const coin& c) -> std::string;
    auto to_string(const addr_id& id) -> std::string;
    auto to_string(const transaction& tx) -> std::string;
}

#endif // MINTNET_SRC_LEDGER_PRIMITIVES_H_
