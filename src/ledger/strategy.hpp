// Copyright (c) 2021 MIT Digital Currency Initiative,
//                    Federal Reserve Bank of Boston
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

/**
 * \file strategy.hpp
 * Spending policies for addresses and the negotiation state of
 * multisignature address allocation.
 */

#ifndef MINTNET_SRC_LEDGER_STRATEGY_H_
#define MINTNET_SRC_LEDGER_STRATEGY_H_

#include "primitives.hpp"

#include <map>
#include <optional>
#include <set>
#include <string>
#include <variant>
#include <vector>

namespace mintnet::strategy {
    /// Address used as the target of a multisignature allocation.
    using ms_address = ledger::address;

    /// The owning address alone must sign.
    struct default_strategy {
        auto operator==(const default_strategy& rhs) const -> bool;
    };

    /// \brief At least m distinct members of a party set must sign.
    ///
    /// Construction does not enforce 0 < m <= |parties|. Use
    /// \ref check_tx_strategy before registering a strategy.
    struct m_of_n_strategy {
        /// Number of distinct signers required.
        uint64_t m_required{0};
        /// Addresses whose signatures count towards the quorum.
        std::set<ledger::address> m_parties{};

        auto operator==(const m_of_n_strategy& rhs) const -> bool;
    };

    /// Spending policy of an address.
    using tx_strategy = std::variant<default_strategy, m_of_n_strategy>;

    /// Spending policies keyed by the address they govern.
    using address_strategy_map = std::map<ledger::address, tx_strategy>;

    /// An infrastructure party trusted by the users of a multisig address.
    struct trust_alloc {
        ledger::address m_address{};

        auto operator==(const trust_alloc& rhs) const -> bool;
        auto operator<(const trust_alloc& rhs) const -> bool;
    };

    /// An ordinary user taking part in a multisig address.
    struct user_alloc {
        ledger::address m_address{};

        auto operator==(const user_alloc& rhs) const -> bool;
        auto operator<(const user_alloc& rhs) const -> bool;
    };

    /// \brief A party of a pending multisig allocation.
    ///
    /// Ordered by tag first (trust before user), then by address.
    using allocation_address = std::variant<trust_alloc, user_alloc>;

    /// Identity of a trust party sending an allocation request. The hot key
    /// signs requests so that the cold party key can stay offline.
    struct trust_party {
        /// Address the party takes part with.
        ledger::address m_party_address{};
        /// Key that signs the party's allocation requests.
        pubkey_t m_hot_trust_key{};

        auto operator==(const trust_party& rhs) const -> bool;
    };

    /// Identity of a user party sending an allocation request.
    struct user_party {
        /// Address the party takes part with.
        ledger::address m_party_address{};

        auto operator==(const user_party& rhs) const -> bool;
    };

    /// Identity presented when requesting an allocation.
    using party_address = std::variant<trust_party, user_party>;

    /// \brief Policy of a multisig address under negotiation.
    struct allocation_strategy {
        /// Number of signatures the resulting address will require.
        uint64_t m_sig_number{0};
        /// Every party of the address.
        std::set<allocation_address> m_all_parties{};

        auto operator==(const allocation_strategy& rhs) const -> bool;
    };

    /// \brief Progress of a pending allocation.
    ///
    /// Records which parties have confirmed and the address each confirmed
    /// with. Owned and updated by the notary.
    struct allocation_info {
        allocation_strategy m_strategy{};
        std::map<allocation_address, ledger::address>
            m_current_confirmations{};

        auto operator==(const allocation_info& rhs) const -> bool;
    };

    /// Returns the underlying address of an allocation party.
    auto address_of(const allocation_address& alloc) -> const ledger::address&;

    /// Returns the party address of a requesting party.
    auto party_address_of(const party_address& party)
        -> const ledger::address&;

    /// \brief Derives the spending policy of an allocated multisig address.
    ///
    /// Tags are dropped. A trust and a user party sharing one address
    /// collapse to a single quorum member.
    /// \param alloc negotiated allocation strategy.
    /// \return m-of-n strategy over the parties' addresses.
    auto allocate_tx_from_alloc(const allocation_strategy& alloc)
        -> tx_strategy;

    /// Projects a requesting party to its allocation identity, dropping the
    /// hot key. Trust parties map to \ref trust_alloc and user parties to
    /// \ref user_alloc.
    auto party_to_allocation(const party_address& party)
        -> allocation_address;

    /// \brief Checks whether collected signatures authorize a transaction.
    ///
    /// For \ref default_strategy, owner must have a valid signature in sigs;
    /// signatures by anyone else never count. For \ref m_of_n_strategy, the
    /// number of distinct parties with at least one valid signature in sigs
    /// must reach m. Signers outside the party set are ignored and
    /// duplicate signatures count once. m == 0 is satisfied by any input.
    /// \param strategy policy of the spent address.
    /// \param owner the spent address.
    /// \param sigs signatures collected so far.
    /// \param tx the transaction being authorized.
    /// \return true if the transaction may be sent.
    auto is_strategy_completed(const tx_strategy& strategy,
                               const ledger::address& owner,
                               const std::vector<ledger::signed_by>& sigs,
                               const ledger::transaction& tx) -> bool;

    /// Checks that a strategy can be satisfied and is not vacuous.
    /// \param strategy strategy to check.
    /// \return std::nullopt if valid, otherwise a description of the
    ///         problem.
    auto check_tx_strategy(const tx_strategy& strategy)
        -> std::optional<std::string>;

    /// Checks that an allocation strategy yields a valid m-of-n strategy:
    /// the signature count is positive and no larger than the number of
    /// distinct underlying addresses.
    /// \param alloc strategy to check.
    /// \return std::nullopt if valid, otherwise a description of the
    ///         problem.
    auto check_allocation_strategy(const allocation_strategy& alloc)
        -> std::optional<std::string>;

    auto to_string(const tx_strategy& strategy) -> std::string;
    auto to_string(const allocation_address& alloc) -> std::string;
    auto to_string(const party_address& party) -> std::string;
    auto to_string(const allocation_strategy& alloc) -> std::string;
    auto to_string(const allocation_info& info) -> std::string;
}

#endif // MINTNET_SRC_LEDGER_STRATEGY_H_
