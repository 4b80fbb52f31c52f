// Copyright (c) 2021 MIT Digital Currency Initiative,
//                    Federal Reserve Bank of Boston
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#include "client.hpp"

#include "format.hpp"
#include "util/common/config.hpp"

namespace mintnet::explorer {
    client::client(transport_factory factory,
                   std::unique_ptr<random_source> rng,
                   std::shared_ptr<logging::log> log,
                   std::chrono::milliseconds timeout)
        : m_transports(std::move(factory)),
          m_rng(std::move(rng)),
          m_log(std::move(log)),
          m_ctx{m_log, timeout, std::nullopt} {}

    client::client(std::shared_ptr<logging::log> log,
                   std::chrono::milliseconds timeout)
        : m_rng(std::make_unique<random_source>(config::random_source)),
          m_log(std::move(log)),
          m_ctx{m_log, timeout, std::nullopt} {}

    auto client::announce_new_block(const ledger::explorer& e,
                                    const privkey_t& bank_sk,
                                    ledger::period_id period,
                                    const block_with_metadata& blk)
        -> comm::result<ledger::period_id> {
        m_log->debug("Announcing new (",
                     period,
                     "-th) block to",
                     ledger::to_string(e));
        auto signed_block
            = ledger::make_with_signature(m_secp.get(),
                                          bank_sk,
                                          std::make_pair(period, blk));
        if(!signed_block.has_value()) {
            auto err = comm::method_error("invalid bank signing key");
            m_log->error(comm::to_string(err));
            return err;
        }
        auto res = comm::call<ledger::period_id, comm::plain>(
            m_transports.get(e.endpoint()),
            request{new_block_request{std::move(signed_block.value())}},
            m_ctx);
        if(auto* reported = std::get_if<0>(&res)) {
            m_log->debug("Received periodId",
                         *reported,
                         "from",
                         ledger::to_string(e));
        }
        return res;
    }

    auto client::get_transaction_by_id(const ledger::explorer& e,
                                       const ledger::transaction_id& id)
        -> comm::result<std::optional<ledger::transaction>> {
        m_log->debug("Getting transaction by id", mintnet::to_string(id));
        auto res = comm::call<std::optional<ledger::transaction>, comm::plain>(
            m_transports.get(e.endpoint()),
            request{get_transaction_request{id}},
            m_ctx);
        if(auto* tx = std::get_if<0>(&res)) {
            if(tx->has_value()) {
                m_log->debug("Successfully got transaction by id",
                             mintnet::to_string(id),
                             ":",
                             ledger::to_string(tx->value()));
            } else {
                m_log->debug("Explorer does not know transaction",
                             mintnet::to_string(id));
            }
        }
        return res;
    }
}
