// Copyright (c) 2021 MIT Digital Currency Initiative,
//                    Federal Reserve Bank of Boston
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#ifndef MINTNET_SRC_EXPLORER_MESSAGES_H_
#define MINTNET_SRC_EXPLORER_MESSAGES_H_

#include "ledger/types.hpp"
#include "ledger/with_signature.hpp"

#include <utility>
#include <variant>

namespace mintnet::explorer {
    /// Hblock with its metadata.
    using block_with_metadata
        = ledger::with_metadata<ledger::hblock, ledger::hblock_metadata>;

    /// Delivers the block of a period. Signed by the bank.
    struct new_block_request {
        ledger::with_signature<std::pair<ledger::period_id, block_with_metadata>>
            m_block;
    };

    /// Looks up a committed transaction.
    struct get_transaction_request {
        ledger::transaction_id m_tx_id{};
    };

    /// Request to an explorer.
    using request = std::variant<new_block_request, get_transaction_request>;
}

#endif // MINTNET_SRC_EXPLORER_MESSAGES_H_
