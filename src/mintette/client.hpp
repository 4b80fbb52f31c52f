// Copyright (c) 2021 MIT Digital Currency Initiative,
//                    Federal Reserve Bank of Boston
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#ifndef MINTNET_SRC_MINTETTE_CLIENT_H_
#define MINTNET_SRC_MINTETTE_CLIENT_H_

#include "comm/call.hpp"
#include "comm/transport_pool.hpp"
#include "messages.hpp"

#include <map>
#include <memory>
#include <optional>

namespace mintnet::mintette {
    /// \brief Client for the RPC interfaces of mintettes.
    ///
    /// Mintette responses are not signed. Each call names the mintette it
    /// goes to; one transport per mintette endpoint is created on first use
    /// and reused by later calls.
    class client {
      public:
        using transport_factory
            = comm::transport_pool<request>::factory_type;

        /// Constructor.
        /// \param factory creates the transport for each mintette.
        /// \param log log instance.
        /// \param timeout deadline for each call. Zero waits forever.
        client(transport_factory factory,
               std::shared_ptr<logging::log> log,
               std::chrono::milliseconds timeout
               = std::chrono::milliseconds::zero());

        /// Constructor. Connects to mintettes over TCP.
        /// \param log log instance.
        /// \param timeout deadline for each call.
        explicit client(std::shared_ptr<logging::log> log,
                        std::chrono::milliseconds timeout
                        = std::chrono::milliseconds::zero());

        ~client() = default;

        client() = delete;
        client(const client&) = delete;
        auto operator=(const client&) -> client& = delete;
        client(client&&) = delete;
        auto operator=(client&&) -> client& = delete;

        /// Announces the start of a period. The period data is signed with
        /// the bank's key.
        /// \param m target mintette.
        /// \param bank_sk bank signing key.
        /// \param npd data of the new period.
        /// \return std::nullopt if the mintette accepted the period.
        auto announce_new_period(const ledger::mintette& m,
                                 const privkey_t& bank_sk,
                                 const ledger::new_period_data& npd)
            -> comm::status;

        /// \brief Asks a mintette to confirm one input of a transaction.
        ///
        /// A rejection by the mintette is not a call failure: it is returned
        /// as the left side of the either and logged at error level.
        /// \param m target mintette.
        /// \param tx transaction spending the input.
        /// \param input the input to confirm.
        /// \param sigs signatures authorizing the spend.
        /// \return rejection reason or confirmation.
        auto check_not_double_spent(const ledger::mintette& m,
                                    const ledger::transaction& tx,
                                    const ledger::addr_id& input,
                                    const std::vector<ledger::signed_by>& sigs)
            -> comm::result<comm::either<ledger::check_confirmation>>;

        /// \brief Asks a mintette to confirm several inputs of a transaction.
        ///
        /// Each input succeeds or fails on its own: a rejected input is a
        /// left value in the returned map, not a failure of the call.
        /// \param m target mintette.
        /// \param tx transaction spending the inputs.
        /// \param sigs signatures for each input to confirm.
        /// \return outcome per input.
        auto check_not_double_spent_batch(
            const ledger::mintette& m,
            const ledger::transaction& tx,
            const std::map<ledger::addr_id, std::vector<ledger::signed_by>>&
                sigs)
            -> comm::result<std::map<ledger::addr_id,
                                     comm::either<ledger::check_confirmation>>>;

        /// Commits a transaction. A rejection is returned as the left side
        /// of the either and logged at error level.
        /// \param m target mintette.
        /// \param tx transaction to commit.
        /// \param confirmations confirmations for the transaction's inputs.
        /// \return rejection reason or acknowledgment.
        auto commit_tx(const ledger::mintette& m,
                       const ledger::transaction& tx,
                       const ledger::check_confirmations& confirmations)
            -> comm::result<comm::either<ledger::commit_acknowledgment>>;

        /// Ends a period. The period ID is signed with the bank's key.
        /// \param m target mintette.
        /// \param bank_sk bank signing key.
        /// \param period the period that ended.
        /// \return blocks and action log the mintette produced.
        auto send_period_finished(const ledger::mintette& m,
                                  const privkey_t& bank_sk,
                                  ledger::period_id period)
            -> comm::result<ledger::period_result>;

        /// Returns the period the mintette is in, or std::nullopt if it
        /// has not started one.
        auto get_mintette_period(const ledger::mintette& m)
            -> comm::result<std::optional<ledger::period_id>>;

        /// Returns the action log of a mintette for a period.
        /// \param roster mintettes in ID order.
        /// \param id index of the mintette in roster.
        /// \param period period of the log.
        /// \return the log, or std::nullopt if the mintette does not have
        ///         one for the period. Fails with a method error, without
        ///         contacting anyone, if roster has no mintette at id.
        auto get_mintette_logs(const ledger::mintettes& roster,
                               ledger::mintette_id id,
                               ledger::period_id period)
            -> comm::result<std::optional<ledger::action_log>>;

        /// Returns the unspent outputs held by a mintette.
        /// \see get_mintette_logs for roster lookup.
        auto get_mintette_utxo(const ledger::mintettes& roster,
                               ledger::mintette_id id)
            -> comm::result<ledger::utxo>;

      private:
        comm::transport_pool<request> m_transports;
        std::shared_ptr<logging::log> m_log;
        comm::call_context m_ctx;
        secp_context_ptr m_secp{make_secp_context()};

        auto lookup(const ledger::mintettes& roster, ledger::mintette_id id)
            -> comm::result<ledger::mintette>;

        template<typename T, typename Policy>
        auto call(const ledger::mintette& m, request req) -> comm::result<T> {
            return comm::call<T, Policy>(m_transports.get(m.endpoint()),
                                         std::move(req),
                                         m_ctx);
        }
    };
}

#endif // MINTNET_SRC_MINTETTE_CLIENT_H_
