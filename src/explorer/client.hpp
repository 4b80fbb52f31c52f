// Copyright (c) 2021 MIT Digital Currency Initiative,
//                    Federal Reserve Bank of Boston
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#ifndef MINTNET_SRC_EXPLORER_CLIENT_H_
#define MINTNET_SRC_EXPLORER_CLIENT_H_

#include "comm/call.hpp"
#include "comm/transport_pool.hpp"
#include "messages.hpp"
#include "util/common/random_source.hpp"

#include <memory>
#include <optional>
#include <random>
#include <type_traits>

namespace mintnet::explorer {
    /// Client for the RPC interfaces of explorers.
    class client {
      public:
        using transport_factory
            = comm::transport_pool<request>::factory_type;

        /// Constructor.
        /// \param factory creates the transport for each explorer.
        /// \param rng source used to pick explorers in \ref ask_explorer.
        /// \param log log instance.
        /// \param timeout deadline for each call. Zero waits forever.
        client(transport_factory factory,
               std::unique_ptr<random_source> rng,
               std::shared_ptr<logging::log> log,
               std::chrono::milliseconds timeout
               = std::chrono::milliseconds::zero());

        /// Constructor. Connects to explorers over TCP and picks them
        /// using the system entropy source.
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

        /// Delivers the block of a period. The period ID and block are
        /// signed with the bank's key.
        /// \param e target explorer.
        /// \param bank_sk bank signing key.
        /// \param period period the block closes.
        /// \param blk block with its metadata.
        /// \return period ID the explorer reports after processing the
        ///         block.
        auto announce_new_block(const ledger::explorer& e,
                                const privkey_t& bank_sk,
                                ledger::period_id period,
                                const block_with_metadata& blk)
            -> comm::result<ledger::period_id>;

        /// Looks up a committed transaction.
        /// \param e explorer to ask.
        /// \param id ID of the transaction.
        /// \return the transaction, or std::nullopt if the explorer does not
        ///         know it.
        auto get_transaction_by_id(const ledger::explorer& e,
                                   const ledger::transaction_id& id)
            -> comm::result<std::optional<ledger::transaction>>;

        /// \brief Runs a query against one explorer picked uniformly at
        ///        random from the roster.
        ///
        /// A failed query is returned as is; other explorers are not tried.
        /// \param roster active explorers.
        /// \param query callable taking the chosen explorer and returning a
        ///              comm::result.
        /// \return the query's result, or a method error if roster is empty.
        template<typename Query>
        auto ask_explorer(const ledger::explorers& roster, Query&& query)
            -> std::invoke_result_t<Query, const ledger::explorer&> {
            using result_type
                = std::invoke_result_t<Query, const ledger::explorer&>;
            if(roster.empty()) {
                auto err = comm::method_error("There are no active explorers");
                m_log->error(comm::to_string(err));
                return result_type(std::in_place_index<1>, std::move(err));
            }
            auto dist = std::uniform_int_distribution<size_t>(
                0,
                roster.size() - 1);
            const auto& chosen = roster[dist(*m_rng)];
            m_log->debug("Asking", ledger::to_string(chosen));
            return std::forward<Query>(query)(chosen);
        }

      private:
        comm::transport_pool<request> m_transports;
        std::unique_ptr<random_source> m_rng;
        std::shared_ptr<logging::log> m_log;
        comm::call_context m_ctx;
        secp_context_ptr m_secp{make_secp_context()};
    };
}

#endif // MINTNET_SRC_EXPLORER_CLIENT_H_
