// Copyright (c) 2021 MIT Digital Currency Initiative,
//                    Federal Reserve Bank of Boston
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#include "client.hpp"

#include "format.hpp"
#include "util/rpc/tcp_client.hpp"

namespace mintnet::notary {
    auto sign_allocation(secp256k1_context* ctx,
                         const privkey_t& sk,
                         const strategy::ms_address& ms_addr,
                         const strategy::allocation_strategy& alloc)
        -> std::optional<signature_t> {
        return ledger::sign_value(ctx, sk, std::make_pair(ms_addr, alloc));
    }

    client::client(std::unique_ptr<comm::transport<request>> transport,
                   const pubkey_t& notary_key,
                   std::shared_ptr<logging::log> log,
                   std::chrono::milliseconds timeout)
        : m_transport(std::move(transport)),
          m_log(std::move(log)),
          m_ctx{m_log, timeout, comm::authority{"notary", notary_key}} {}

    client::client(const config::options& opts,
                   std::shared_ptr<logging::log> log)
        : client(std::make_unique<rpc::tcp_client<request, buffer>>(
                     opts.m_notary_endpoint),
                 opts.m_notary_public_key,
                 std::move(log),
                 opts.m_rpc_timeout) {}

    auto client::allocate_multisignature_address(
        const strategy::ms_address& ms_addr,
        const strategy::party_address& party,
        const strategy::allocation_strategy& alloc,
        const signature_t& signature,
        const std::optional<master_check>& check) -> comm::status {
        m_log->debug("Allocate new ms address:",
                     ledger::to_string(ms_addr),
                     ", from party address:",
                     strategy::to_string(party),
                     ", allocation strategy:",
                     strategy::to_string(alloc),
                     ", certificate:",
                     check.has_value() ? "present" : "absent");
        if(auto problem = strategy::check_allocation_strategy(alloc)) {
            auto err = comm::method_error("invalid allocation strategy: "
                                          + problem.value());
            m_log->error(comm::to_string(err));
            return err;
        }
        return comm::to_status(call<std::monostate, comm::unwrap_either>(
            allocate_multisig_request{ms_addr, party, alloc, signature, check}));
    }

    auto client::announce_new_periods_to_notary(
        const privkey_t& bank_sk,
        ledger::period_id last_period,
        const std::vector<ledger::hblock>& blocks) -> comm::status {
        m_log->debug("Announce new periods to Notary,",
                     blocks.size(),
                     "hblocks, latest periodId",
                     last_period);
        auto signed_blocks
            = ledger::make_with_signature(m_secp.get(),
                                          bank_sk,
                                          std::make_pair(last_period, blocks));
        if(!signed_blocks.has_value()) {
            auto err = comm::method_error("invalid bank signing key");
            m_log->error(comm::to_string(err));
            return err;
        }
        return comm::to_status(call<std::monostate, comm::unwrap_either>(
            announce_new_periods_request{std::move(signed_blocks.value())}));
    }

    auto client::get_notary_period() -> comm::result<ledger::period_id> {
        m_log->debug("Getting period of Notary");
        auto res = call<ledger::period_id, comm::signed_either>(
            get_period_request{});
        if(auto* period = std::get_if<0>(&res)) {
            m_log->debug("Notary's last period is", *period);
        }
        return res;
    }

    auto client::get_tx_signatures(const ledger::transaction& tx,
                                   const ledger::address& addr)
        -> comm::result<std::vector<ledger::signed_by>> {
        m_log->debug("Getting signatures for tx",
                     mintnet::to_string(ledger::tx_id(tx)),
                     ", addr",
                     ledger::to_string(addr));
        auto res = call<std::vector<ledger::signed_by>, comm::signed_either>(
            get_signatures_request{tx, addr});
        if(auto* sigs = std::get_if<0>(&res)) {
            m_log->debug("Received", sigs->size(), "signatures from Notary");
        }
        return res;
    }

    auto client::poll_pending_transactions(
        const std::vector<ledger::address>& addresses)
        -> comm::result<std::vector<ledger::transaction>> {
        m_log->debug("Polling transactions to sign for",
                     addresses.size(),
                     "addresses");
        auto res = call<std::vector<ledger::transaction>, comm::signed_either>(
            poll_pending_request{addresses});
        if(auto* txs = std::get_if<0>(&res)) {
            m_log->debug("Received", txs->size(), "transactions to sign");
        }
        return res;
    }

    auto client::publish_tx_to_notary(const ledger::transaction& tx,
                                      const ledger::address& addr,
                                      const ledger::signed_by& sig)
        -> comm::result<std::vector<ledger::signed_by>> {
        m_log->debug("Sending tx",
                     mintnet::to_string(ledger::tx_id(tx)),
                     "signed by",
                     ledger::to_string(sig.first),
                     "to Notary");
        auto res = call<std::vector<ledger::signed_by>, comm::signed_either>(
            publish_tx_request{tx, addr, sig});
        if(auto* sigs = std::get_if<0>(&res)) {
            m_log->debug("Received", sigs->size(), "signatures from Notary");
        }
        return res;
    }

    auto client::query_notary_complete_ms_addresses() -> comm::result<
        std::vector<std::pair<ledger::address, strategy::tx_strategy>>> {
        m_log->debug("Querying Notary complete MS addresses");
        return call<
            std::vector<std::pair<ledger::address, strategy::tx_strategy>>,
            comm::signed_either>(query_complete_ms_request{});
    }

    auto client::query_notary_my_ms_allocations(
        const strategy::allocation_address& party)
        -> comm::result<std::vector<
            std::pair<strategy::ms_address, strategy::allocation_info>>> {
        m_log->debug("Calling Notary for MS addresses of",
                     strategy::to_string(party));
        auto res = call<std::vector<std::pair<strategy::ms_address,
                                              strategy::allocation_info>>,
                        comm::signed_either>(
            query_my_allocations_request{party});
        if(auto* allocs = std::get_if<0>(&res)) {
            for(const auto& [addr, info] : *allocs) {
                m_log->debug("Retrieved from Notary:",
                             ledger::to_string(addr),
                             "->",
                             strategy::to_string(info));
            }
        }
        return res;
    }

    auto client::remove_notary_complete_ms_addresses(
        const std::vector<ledger::address>& addresses,
        const signature_t& signature) -> comm::status {
        m_log->debug("Removing",
                     addresses.size(),
                     "Notary complete MS addresses");
        return comm::to_status(call<std::monostate, comm::unwrap_either>(
            remove_complete_ms_request{addresses, signature}));
    }
}
