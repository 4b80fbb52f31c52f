// Copyright (c) 2021 MIT Digital Currency Initiative,
//                    Federal Reserve Bank of Boston
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#ifndef MINTNET_SRC_NOTARY_CLIENT_H_
#define MINTNET_SRC_NOTARY_CLIENT_H_

#include "comm/call.hpp"
#include "messages.hpp"
#include "util/common/config.hpp"

#include <memory>
#include <optional>

namespace mintnet::notary {
    /// Signs the pair (ms_addr, alloc) as required by
    /// \ref client::allocate_multisignature_address.
    /// \param ctx secp256k1 context.
    /// \param sk key of the requesting party.
    /// \param ms_addr address being allocated.
    /// \param alloc policy of the address.
    /// \return the signature, or std::nullopt if the key is invalid.
    auto sign_allocation(secp256k1_context* ctx,
                         const privkey_t& sk,
                         const strategy::ms_address& ms_addr,
                         const strategy::allocation_strategy& alloc)
        -> std::optional<signature_t>;

    /// \brief Client for the notary's RPC interface.
    ///
    /// Read-only queries must be answered with responses signed by the
    /// notary's key. Every method of the notary can report an error of its
    /// own, which becomes a method error.
    class client {
      public:
        /// Constructor.
        /// \param transport RPC client connected to the notary.
        /// \param notary_key key the notary signs its responses with.
        /// \param log log instance.
        /// \param timeout deadline for each call. Zero waits forever.
        client(std::unique_ptr<comm::transport<request>> transport,
               const pubkey_t& notary_key,
               std::shared_ptr<logging::log> log,
               std::chrono::milliseconds timeout
               = std::chrono::milliseconds::zero());

        /// Constructor. Connects to the configured notary endpoint over
        /// TCP.
        /// \param opts configuration options.
        /// \param log log instance.
        client(const config::options& opts, std::shared_ptr<logging::log> log);

        ~client() = default;

        client() = delete;
        client(const client&) = delete;
        auto operator=(const client&) -> client& = delete;
        client(client&&) = delete;
        auto operator=(client&&) -> client& = delete;

        /// \brief Confirms a party's participation in a multisig address.
        ///
        /// The allocation strategy is checked before anything is sent: a
        /// strategy that requires no signatures, or more signatures than it
        /// has distinct parties, fails with a method error.
        /// \param ms_addr address being allocated.
        /// \param party party sending the request.
        /// \param alloc policy of the address.
        /// \param signature party's signature from \ref sign_allocation.
        /// \param check certificate of a trust party's hot key.
        /// \return std::nullopt if the notary recorded the confirmation.
        auto allocate_multisignature_address(
            const strategy::ms_address& ms_addr,
            const strategy::party_address& party,
            const strategy::allocation_strategy& alloc,
            const signature_t& signature,
            const std::optional<master_check>& check) -> comm::status;

        /// Sends the notary the hblocks it has not seen. The list is signed
        /// with the bank's key.
        /// \param bank_sk bank signing key.
        /// \param last_period ID of the latest period.
        /// \param blocks hblocks produced since the notary's period.
        /// \return std::nullopt if the notary accepted the blocks.
        auto announce_new_periods_to_notary(
            const privkey_t& bank_sk,
            ledger::period_id last_period,
            const std::vector<ledger::hblock>& blocks) -> comm::status;

        /// Returns the last period the notary knows of.
        auto get_notary_period() -> comm::result<ledger::period_id>;

        /// Returns the signatures collected for a transaction spending from
        /// the given address.
        auto get_tx_signatures(const ledger::transaction& tx,
                               const ledger::address& addr)
            -> comm::result<std::vector<ledger::signed_by>>;

        /// Returns transactions waiting for a signature from any of the
        /// given addresses.
        auto poll_pending_transactions(
            const std::vector<ledger::address>& addresses)
            -> comm::result<std::vector<ledger::transaction>>;

        /// Publishes a party's signature for a transaction.
        /// \param tx transaction to sign.
        /// \param addr address the transaction spends from.
        /// \param sig party's address and signature over tx.
        /// \return signatures of all parties that have signed so far.
        auto publish_tx_to_notary(const ledger::transaction& tx,
                                  const ledger::address& addr,
                                  const ledger::signed_by& sig)
            -> comm::result<std::vector<ledger::signed_by>>;

        /// Returns multisig addresses whose allocation is complete, with
        /// their spending policies.
        auto query_notary_complete_ms_addresses() -> comm::result<
            std::vector<std::pair<ledger::address, strategy::tx_strategy>>>;

        /// Returns pending allocations the given party takes part in.
        auto query_notary_my_ms_allocations(
            const strategy::allocation_address& party)
            -> comm::result<std::vector<
                std::pair<strategy::ms_address, strategy::allocation_info>>>;

        /// Drops completed multisig addresses from the notary.
        /// \param addresses addresses to drop.
        /// \param signature bank's signature over addresses.
        /// \return std::nullopt if the notary dropped them.
        auto remove_notary_complete_ms_addresses(
            const std::vector<ledger::address>& addresses,
            const signature_t& signature) -> comm::status;

      private:
        std::unique_ptr<comm::transport<request>> m_transport;
        std::shared_ptr<logging::log> m_log;
        comm::call_context m_ctx;
        secp_context_ptr m_secp{make_secp_context()};

        template<typename T, typename Policy>
        auto call(request req) -> comm::result<T> {
            return comm::call<T, Policy>(*m_transport, std::move(req), m_ctx);
        }
    };
}

#endif // MINTNET_SRC_NOTARY_CLIENT_H_
