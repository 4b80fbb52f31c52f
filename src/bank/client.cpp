// Copyright (c) 2021 MIT Digital Currency Initiative,
//                    Federal Reserve Bank of Boston
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#include "client.hpp"

#include "format.hpp"
#include "util/rpc/tcp_client.hpp"


namespace mintnet::bank {
    client::client(std::unique_ptr<comm::transport<request>> transport,
                   const pubkey_t& bank_key,
                   std::shared_ptr<logging::log> log,
                   std::chrono::milliseconds timeout)
        : m_transport(std::move(transport)),
          m_log(std::move(log)),
          m_ctx{m_log, timeout, comm::authority{"bank", bank_key}} {}

    client::client(const config::options& opts,
                   std::shared_ptr<logging::log> log)
        : client(std::make_unique<rpc::tcp_client<request, buffer>>(
                     opts.m_bank_endpoint),
                 opts.m_bank_public_key,
                 std::move(log),
                 opts.m_rpc_timeout) {}

    auto client::send_local_control_request(
        const privkey_t& bank_sk,
        const ledger::control_command& command) -> comm::status {
        m_log->debug("Sending control request to bank:",
                     ledger::to_string(command));
        auto signed_cmd
            = ledger::make_with_signature(m_secp.get(), bank_sk, command);
        if(!signed_cmd.has_value()) {
            auto err = comm::method_error("invalid bank signing key");
            m_log->error(comm::to_string(err));
            return err;
        }
        auto res = comm::to_status(
            comm::call<std::monostate, comm::unwrap_either>(
                *m_transport,
                request{control_request{std::move(signed_cmd.value())}},
                m_ctx));
        if(!res.has_value()) {
            m_log->debug("Sent control request successfully");
        }
        return res;
    }

    auto client::get_addresses()
        -> comm::result<strategy::address_strategy_map> {
        m_log->debug("Getting list of addresses");
        auto res = signed_call<strategy::address_strategy_map>(
            get_addresses_request{});
        if(auto* addrs = std::get_if<0>(&res)) {
            m_log->debug("Successfully got list of addresses,",
                         addrs->size(),
                         "entries");
        }
        return res;
    }

    auto client::get_block_by_height(ledger::period_id height)
        -> comm::result<std::optional<ledger::hblock>> {
        m_log->debug("Getting block with height", height);
        auto res = signed_call<std::vector<ledger::hblock>>(
            get_hblocks_request{{height}});
        if(auto* err = std::get_if<1>(&res)) {
            return std::move(*err);
        }
        auto& blocks = std::get<0>(res);
        if(blocks.empty()) {
            m_log->debug("Bank has no block with height", height);
            return std::optional<ledger::hblock>();
        }
        m_log->debug("Successfully got block with height",
                     height,
                     ":",
                     ledger::to_string(blocks.front()));
        return std::optional<ledger::hblock>(std::move(blocks.front()));
    }

    auto client::get_blockchain_height() -> comm::result<ledger::period_id> {
        m_log->debug("Getting blockchain height");
        auto res
            = signed_call<ledger::period_id>(get_blockchain_height_request{});
        if(auto* height = std::get_if<0>(&res)) {
            m_log->debug("Blockchain height is", *height);
        }
        return res;
    }

    auto client::get_blocks_by_height(ledger::period_id from,
                                      ledger::period_id to)
        -> comm::result<std::vector<ledger::hblock>> {
        m_log->debug("Getting higher-level blocks between", from, "and", to);
        auto heights = std::vector<ledger::period_id>();
        if(from <= to) {
            auto last = to;
            if(to - from >= max_hblocks_per_request) {
                last = from + (max_hblocks_per_request - 1);
                m_log->warn("Range between",
                            from,
                            "and",
                            to,
                            "is too wide, requesting up to",
                            last);
            }
            heights.reserve(static_cast<size_t>(last - from + 1));
            for(auto h = from;; h++) {
                heights.push_back(h);
                if(h == last) {
                    break;
                }
            }
        }
        auto res = signed_call<std::vector<ledger::hblock>>(
            get_hblocks_request{std::move(heights)});
        if(auto* blocks = std::get_if<0>(&res)) {
            m_log->debug("Got",
                         blocks->size(),
                         "higher-level blocks between",
                         from,
                         "and",
                         to);
        }
        return res;
    }

    auto client::get_explorers() -> comm::result<ledger::explorers> {
        m_log->debug("Getting list of explorers");
        auto res = signed_call<ledger::explorers>(get_explorers_request{});
        if(auto* explorers = std::get_if<0>(&res)) {
            m_log->debug("Successfully got list of explorers,",
                         explorers->size(),
                         "active");
        }
        return res;
    }

    auto client::get_genesis_block()
        -> comm::result<std::optional<ledger::hblock>> {
        return get_block_by_height(0);
    }

    auto client::get_mintettes() -> comm::result<ledger::mintettes> {
        m_log->debug("Getting list of mintettes");
        auto res = signed_call<ledger::mintettes>(get_mintettes_request{});
        if(auto* mintettes = std::get_if<0>(&res)) {
            m_log->debug("Successfully got list of mintettes,",
                         mintettes->size(),
                         "active");
        }
        return res;
    }

    auto client::get_statistics_id() -> comm::result<int64_t> {
        m_log->debug("Getting statistics id");
        auto res = signed_call<int64_t>(get_statistics_id_request{});
        if(auto* id = std::get_if<0>(&res)) {
            m_log->debug("Statistics id is", *id);
        }
        return res;
    }
}
