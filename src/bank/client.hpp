// Copyright (c) 2021 MIT Digital Currency Initiative,
//                    Federal Reserve Bank of Boston
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#ifndef MINTNET_SRC_BANK_CLIENT_H_
#define MINTNET_SRC_BANK_CLIENT_H_

#include "comm/call.hpp"
#include "messages.hpp"
#include "util/common/config.hpp"

#include <memory>
#include <optional>

namespace mintnet::bank {
    /// \brief Client for the bank's RPC interface.
    ///
    /// Every response apart from control acknowledgments must be signed with
    /// the bank's key. A response with a bad signature fails the call with
    /// a bad signature error naming "bank" and its payload is discarded.
    class client {
      public:
        /// Largest number of heights requested by one get_blocks_by_height
        /// call.
        static constexpr uint64_t max_hblocks_per_request = 1024;

        /// Constructor.
        /// \param transport RPC client connected to the bank.
        /// \param bank_key key the bank signs its responses with.
        /// \param log log instance.
        /// \param timeout deadline for each call. Zero waits forever.
        client(std::unique_ptr<comm::transport<request>> transport,
               const pubkey_t& bank_key,
               std::shared_ptr<logging::log> log,
               std::chrono::milliseconds timeout
               = std::chrono::milliseconds::zero());

        /// Constructor. Connects to the configured bank endpoint over TCP.
        /// \param opts configuration options.
        /// \param log log instance.
        client(const config::options& opts, std::shared_ptr<logging::log> log);

        ~client() = default;

        client() = delete;
        client(const client&) = delete;
        auto operator=(const client&) -> client& = delete;
        client(client&&) = delete;
        auto operator=(client&&) -> client& = delete;

        /// Signs a roster change with the bank's key and sends it to the
        /// bank's local control interface.
        /// \param bank_sk bank signing key.
        /// \param command roster change.
        /// \return std::nullopt if the bank applied the change.
        auto send_local_control_request(const privkey_t& bank_sk,
                                        const ledger::control_command& command)
            -> comm::status;

        /// Returns the spending policies of all registered addresses.
        auto get_addresses() -> comm::result<strategy::address_strategy_map>;

        /// Returns the hblock at the given height.
        /// \param height period ID of the block.
        /// \return the block, or std::nullopt if the bank has no block at
        ///         that height yet.
        auto get_block_by_height(ledger::period_id height)
            -> comm::result<std::optional<ledger::hblock>>;

        /// Returns the number of periods the bank has completed.
        auto get_blockchain_height() -> comm::result<ledger::period_id>;

        /// Returns the hblocks in the inclusive height range [from, to].
        /// Heights the bank does not have are missing from the result. No
        /// heights are requested if from > to. At most
        /// max_hblocks_per_request heights starting at from are requested;
        /// the rest of a wider range is left for a later call.
        auto get_blocks_by_height(ledger::period_id from, ledger::period_id to)
            -> comm::result<std::vector<ledger::hblock>>;

        /// Returns the active explorers.
        auto get_explorers() -> comm::result<ledger::explorers>;

        /// Returns the block at height zero.
        auto get_genesis_block() -> comm::result<std::optional<ledger::hblock>>;

        /// Returns the current mintette roster.
        auto get_mintettes() -> comm::result<ledger::mintettes>;

        /// Returns the statistics ID of the bank's current run.
        auto get_statistics_id() -> comm::result<int64_t>;

      private:
        std::unique_ptr<comm::transport<request>> m_transport;
        std::shared_ptr<logging::log> m_log;
        comm::call_context m_ctx;
        secp_context_ptr m_secp{make_secp_context()};

        template<typename T>
        auto signed_call(request req) -> comm::result<T> {
            return comm::call<T, comm::signed_either>(*m_transport,
                                                      std::move(req),
                                                      m_ctx);
        }
    };
}

#endif // MINTNET_SRC_BANK_CLIENT_H_
