// Copyright (c) 2021 MIT Digital Currency Initiative,
//                    Federal Reserve Bank of Boston
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#include "client.hpp"

#include "format.hpp"

namespace mintnet::mintette {
    client::client(transport_factory factory,
                   std::shared_ptr<logging::log> log,
                   std::chrono::milliseconds timeout)
        : m_transports(std::move(factory)),
          m_log(std::move(log)),
          m_ctx{m_log, timeout, std::nullopt} {}

    client::client(std::shared_ptr<logging::log> log,
                   std::chrono::milliseconds timeout)
        : m_log(std::move(log)),
          m_ctx{m_log, timeout, std::nullopt} {}

    auto client::lookup(const ledger::mintettes& roster,
                        ledger::mintette_id id)
        -> comm::result<ledger::mintette> {
        if(id >= roster.size()) {
            auto msg = "Mintette with index " + std::to_string(id)
                     + " doesn't exist";
            m_log->warn(msg);
            return comm::method_error(std::move(msg));
        }
        return roster[id];
    }

    auto client::announce_new_period(const ledger::mintette& m,
                                     const privkey_t& bank_sk,
                                     const ledger::new_period_data& npd)
        -> comm::status {
        m_log->debug("Announce new period to",
                     ledger::to_string(m),
                     ", new period data",
                     ledger::to_string(npd));
        auto signed_npd
            = ledger::make_with_signature(m_secp.get(), bank_sk, npd);
        if(!signed_npd.has_value()) {
            auto err = comm::method_error("invalid bank signing key");
            m_log->error(comm::to_string(err));
            return err;
        }
        return comm::to_status(call<std::monostate, comm::unwrap_either>(
            m,
            announce_new_period_request{std::move(signed_npd.value())}));
    }

    auto client::check_not_double_spent(
        const ledger::mintette& m,
        const ledger::transaction& tx,
        const ledger::addr_id& input,
        const std::vector<ledger::signed_by>& sigs)
        -> comm::result<comm::either<ledger::check_confirmation>> {
        m_log->debug("Checking addrid (",
                     ledger::to_string(input),
                     ") from transaction:",
                     ledger::to_string(tx));
        auto res = call<comm::either<ledger::check_confirmation>, comm::plain>(
            m,
            check_tx_request{tx, input, sigs});
        if(auto* outcome = std::get_if<0>(&res)) {
            if(auto* reason = std::get_if<std::string>(outcome)) {
                m_log->error("Checking double spending failed:", *reason);
            } else {
                m_log->debug("Confirmed addrid (",
                             ledger::to_string(input),
                             "):",
                             ledger::to_string(std::get<1>(*outcome)));
            }
        }
        return res;
    }

    auto client::check_not_double_spent_batch(
        const ledger::mintette& m,
        const ledger::transaction& tx,
        const std::map<ledger::addr_id, std::vector<ledger::signed_by>>& sigs)
        -> comm::result<std::map<ledger::addr_id,
                                 comm::either<ledger::check_confirmation>>> {
        m_log->debug("Checking",
                     sigs.size(),
                     "addrids from transaction:",
                     ledger::to_string(tx));
        auto res = call<std::map<ledger::addr_id,
                                 comm::either<ledger::check_confirmation>>,
                        comm::unwrap_either>(m,
                                             check_tx_batch_request{tx, sigs});
        if(auto* outcomes = std::get_if<0>(&res)) {
            for(const auto& [input, outcome] : *outcomes) {
                if(auto* reason = std::get_if<std::string>(&outcome)) {
                    m_log->error("Checking addrid (",
                                 ledger::to_string(input),
                                 ") failed:",
                                 *reason);
                }
            }
            m_log->debug("Received",
                         outcomes->size(),
                         "check results for transaction",
                         mintnet::to_string(ledger::tx_id(tx)));
        }
        return res;
    }

    auto client::commit_tx(const ledger::mintette& m,
                           const ledger::transaction& tx,
                           const ledger::check_confirmations& confirmations)
        -> comm::result<comm::either<ledger::commit_acknowledgment>> {
        m_log->debug("Commit transaction", ledger::to_string(tx));
        auto res
            = call<comm::either<ledger::commit_acknowledgment>, comm::plain>(
                m,
                commit_tx_request{tx, confirmations});
        if(auto* outcome = std::get_if<0>(&res)) {
            if(auto* reason = std::get_if<std::string>(outcome)) {
                m_log->error("Commit tx failed:", *reason);
            } else {
                m_log->debug("Successfully committed transaction",
                             mintnet::to_string(ledger::tx_id(tx)));
            }
        }
        return res;
    }

    auto client::send_period_finished(const ledger::mintette& m,
                                      const privkey_t& bank_sk,
                                      ledger::period_id period)
        -> comm::result<ledger::period_result> {
        m_log->debug("Send period",
                     period,
                     "finished to",
                     ledger::to_string(m));
        auto signed_period
            = ledger::make_with_signature(m_secp.get(), bank_sk, period);
        if(!signed_period.has_value()) {
            auto err = comm::method_error("invalid bank signing key");
            m_log->error(comm::to_string(err));
            return err;
        }
        auto res = call<ledger::period_result, comm::unwrap_either>(
            m,
            period_finished_request{signed_period.value()});
        if(auto* pr = std::get_if<0>(&res)) {
            m_log->debug("Received period result from",
                         ledger::to_string(m),
                         ":",
                         ledger::to_string(*pr));
        }
        return res;
    }

    auto client::get_mintette_period(const ledger::mintette& m)
        -> comm::result<std::optional<ledger::period_id>> {
        m_log->debug("Getting mintette period from", ledger::to_string(m));
        auto res = call<std::optional<ledger::period_id>, comm::unwrap_either>(
            m,
            get_period_request{});
        if(auto* period = std::get_if<0>(&res)) {
            if(period->has_value()) {
                m_log->debug("Successfully got the period:",
                             period->value());
            } else {
                m_log->error("getMintettePeriod failed for",
                             ledger::to_string(m));
            }
        }
        return res;
    }

    auto client::get_mintette_logs(const ledger::mintettes& roster,
                                   ledger::mintette_id id,
                                   ledger::period_id period)
        -> comm::result<std::optional<ledger::action_log>> {
        auto target = lookup(roster, id);
        if(auto* err = std::get_if<1>(&target)) {
            return std::move(*err);
        }
        m_log->debug("Getting logs of mintette",
                     id,
                     "with period id",
                     period);
        auto res = call<std::optional<ledger::action_log>, comm::unwrap_either>(
            std::get<0>(target),
            get_logs_request{period});
        if(auto* logs = std::get_if<0>(&res)) {
            if(logs->has_value()) {
                m_log->debug("Successfully got",
                             logs->value().size(),
                             "log entries for period id",
                             period);
            } else {
                m_log->warn("Getting logs of mintette",
                            id,
                            "with period id",
                            period,
                            "failed");
            }
        }
        return res;
    }

    auto client::get_mintette_utxo(const ledger::mintettes& roster,
                                   ledger::mintette_id id)
        -> comm::result<ledger::utxo> {
        auto target = lookup(roster, id);
        if(auto* err = std::get_if<1>(&target)) {
            return std::move(*err);
        }
        m_log->debug("Getting utxo of mintette", id);
        auto res = call<ledger::utxo, comm::unwrap_either>(std::get<0>(target),
                                                           get_utxo_request{});
        if(auto* utxo = std::get_if<0>(&res)) {
            m_log->debug("Current utxo has", utxo->size(), "entries");
        }
        return res;
    }
}
