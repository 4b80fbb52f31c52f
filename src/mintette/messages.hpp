// Copyright (c) 2021 MIT Digital Currency Initiative,
//                    Federal Reserve Bank of Boston
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#ifndef MINTNET_SRC_MINTETTE_MESSAGES_H_
#define MINTNET_SRC_MINTETTE_MESSAGES_H_

#include "ledger/types.hpp"
#include "ledger/with_signature.hpp"

#include <map>
#include <variant>
#include <vector>

namespace mintnet::mintette {
    /// Starts a new period. Signed by the bank.
    struct announce_new_period_request {
        ledger::with_signature<ledger::new_period_data> m_data;
    };

    /// Asks the mintette to confirm that one input of a transaction is
    /// unspent and correctly signed.
    struct check_tx_request {
        ledger::transaction m_tx;
        ledger::addr_id m_input;
        std::vector<ledger::signed_by> m_signatures;
    };

    /// Asks the mintette to confirm several inputs of a transaction at once.
    struct check_tx_batch_request {
        ledger::transaction m_tx;
        /// Signatures collected for each input to check.
        std::map<ledger::addr_id, std::vector<ledger::signed_by>>
            m_signatures;
    };

    /// Commits a transaction whose inputs have been confirmed.
    struct commit_tx_request {
        ledger::transaction m_tx;
        ledger::check_confirmations m_confirmations;
    };

    /// Ends the given period. Signed by the bank.
    struct period_finished_request {
        ledger::with_signature<ledger::period_id> m_period;
    };

    /// Requests the period the mintette is in.
    struct get_period_request {};

    /// Diagnostic: requests the action log of a period.
    struct get_logs_request {
        ledger::period_id m_period{0};
    };

    /// Diagnostic: requests the mintette's unspent outputs.
    struct get_utxo_request {};

    /// Request to a mintette.
    using request = std::variant<announce_new_period_request,
                                 check_tx_request,
                                 check_tx_batch_request,
                                 commit_tx_request,
                                 period_finished_request,
                                 get_period_request,
                                 get_logs_request,
                                 get_utxo_request>;
}

#endif // MINTNET_SRC_MINTETTE_MESSAGES_H_
