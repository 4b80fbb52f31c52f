// Copyright (c) 2021 MIT Digital Currency Initiative,
//                    Federal Reserve Bank of Boston
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#ifndef MINTNET_SRC_BANK_MESSAGES_H_
#define MINTNET_SRC_BANK_MESSAGES_H_

#include "ledger/types.hpp"
#include "ledger/with_signature.hpp"

#include <variant>
#include <vector>

namespace mintnet::bank {
    /// Roster change signed with the bank's key.
    struct control_request {
        ledger::with_signature<ledger::control_command> m_command;
    };

    /// Requests the spending policies of all registered addresses.
    struct get_addresses_request {};

    /// Requests the hblocks at the given heights. Heights the bank does
    /// not have yet are skipped in the response.
    struct get_hblocks_request {
        std::vector<ledger::period_id> m_heights;
    };

    /// Requests the height of the blockchain.
    struct get_blockchain_height_request {};

    /// Requests the active explorers.
    struct get_explorers_request {};

    /// Requests the current mintette roster.
    struct get_mintettes_request {};

    /// Requests the statistics ID of the current run.
    struct get_statistics_id_request {};

    /// Request to the bank.
    using request = std::variant<control_request,
                                 get_addresses_request,
                                 get_hblocks_request,
                                 get_blockchain_height_request,
                                 get_explorers_request,
                                 get_mintettes_request,
                                 get_statistics_id_request>;
}

#endif // MINTNET_SRC_BANK_MESSAGES_H_
