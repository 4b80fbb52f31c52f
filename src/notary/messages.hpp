// Copyright (c) 2021 MIT Digital Currency Initiative,
//                    Federal Reserve Bank of Boston
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#ifndef MINTNET_SRC_NOTARY_MESSAGES_H_
#define MINTNET_SRC_NOTARY_MESSAGES_H_

#include "ledger/types.hpp"
#include "ledger/with_signature.hpp"

#include <optional>
#include <utility>
#include <variant>
#include <vector>

namespace mintnet::notary {
    /// Hot key of a trust party certified by its master key.
    using master_check = std::pair<pubkey_t, signature_t>;

    /// Confirms a party's participation in a multisig address.
    struct allocate_multisig_request {
        /// Address being allocated.
        strategy::ms_address m_ms_address;
        /// Party sending the request.
        strategy::party_address m_party;
        /// Policy of the address as the party sees it.
        strategy::allocation_strategy m_strategy;
        /// Party's signature over (m_ms_address, m_strategy).
        signature_t m_signature{};
        /// Certificate of the hot key, for trust parties.
        std::optional<master_check> m_master_check;
    };

    /// Hblocks the notary missed, signed by the bank.
    struct announce_new_periods_request {
        ledger::with_signature<
            std::pair<ledger::period_id, std::vector<ledger::hblock>>>
            m_blocks;
    };

    /// Requests the last period the notary knows of.
    struct get_period_request {};

    /// Requests the signatures collected for a transaction spending from
    /// an address.
    struct get_signatures_request {
        ledger::transaction m_tx;
        ledger::address m_address;
    };

    /// Requests transactions waiting for signatures from any of the given
    /// addresses.
    struct poll_pending_request {
        std::vector<ledger::address> m_addresses;
    };

    /// Adds a party's signature to a transaction spending from an address.
    struct publish_tx_request {
        ledger::transaction m_tx;
        ledger::address m_address;
        ledger::signed_by m_signature;
    };

    /// Requests multisig addresses whose allocation is complete.
    struct query_complete_ms_request {};

    /// Requests pending allocations a party takes part in.
    struct query_my_allocations_request {
        strategy::allocation_address m_party;
    };

    /// Drops completed multisig addresses from the notary. The list is
    /// signed with the bank's key.
    struct remove_complete_ms_request {
        std::vector<ledger::address> m_addresses;
        signature_t m_signature{};
    };

    /// Request to the notary.
    using request = std::variant<allocate_multisig_request,
                                 announce_new_periods_request,
                                 get_period_request,
                                 get_signatures_request,
                                 poll_pending_request,
                                 publish_tx_request,
                                 query_complete_ms_request,
                                 query_my_allocations_request,
                                 remove_complete_ms_request>;
}

#endif // MINTNET_SRC_NOTARY_MESSAGES_H_
