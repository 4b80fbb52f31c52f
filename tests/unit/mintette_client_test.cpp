// Copyright (c) 2021 MIT Digital Currency Initiative,
//                    Federal Reserve Bank of Boston
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#include "mintette/client.hpp"
#include "mintette/format.hpp"
#include "util.hpp"

#include <gtest/gtest.h>

class mintette_client_test : public ::testing::Test {
  protected:
    void SetUp() override {
        m_client = std::make_unique<mintnet::mintette::client>(
            mintnet::test::scripted_factory(m_script),
            mintnet::test::make_log());

        m_tx = mintnet::test::simple_tx(m_user.addr(), 10);
        m_input = m_tx.m_inputs.front();

        m_confirmation.m_mintette_key = m_mintette_key.m_pk;
        m_confirmation.m_addr_id = m_input;
        m_confirmation.m_head.fill(0x42);
        m_confirmation.m_period = 3;
    }

    using outcome = mintnet::comm::either<mintnet::ledger::check_confirmation>;

    mintnet::test::keypair m_bank{mintnet::test::make_keypair(1)};
    mintnet::test::keypair m_user{mintnet::test::make_keypair(2)};
    mintnet::test::keypair m_mintette_key{mintnet::test::make_keypair(3)};
    std::shared_ptr<mintnet::test::script<mintnet::mintette::request>>
        m_script{std::make_shared<
            mintnet::test::script<mintnet::mintette::request>>()};
    std::unique_ptr<mintnet::mintette::client> m_client;

    mintnet::ledger::mintettes m_roster{{"127.0.0.1", 5555},
                                        {"127.0.0.1", 5556},
                                        {"127.0.0.1", 5557}};
    mintnet::ledger::transaction m_tx;
    mintnet::ledger::addr_id m_input;
    mintnet::ledger::check_confirmation m_confirmation;
};

TEST_F(mintette_client_test, unknown_mintette_index) {
    auto res = m_client->get_mintette_logs(m_roster, 5, 0);
    ASSERT_EQ(res.index(), 1UL);
    ASSERT_EQ(std::get<1>(res),
              mintnet::comm::method_error("Mintette with index 5 doesn't exist"));

    auto utxo = m_client->get_mintette_utxo(m_roster, 3);
    ASSERT_EQ(utxo.index(), 1UL);
    ASSERT_EQ(std::get<1>(utxo).m_code, mintnet::comm::error_code::method);

    ASSERT_EQ(m_script->request_count(), 0UL);
    ASSERT_TRUE(m_script->m_endpoints.empty());
}

TEST_F(mintette_client_test, get_mintette_logs) {
    auto log = mintnet::ledger::action_log{
        {mintnet::ledger::query_entry{m_tx}, mintnet::hash_t{}}};
    m_script->reply_with(mintnet::test::right(
        std::optional<mintnet::ledger::action_log>(log)));

    auto res = m_client->get_mintette_logs(m_roster, 1, 2);
    ASSERT_EQ(res.index(), 0UL);
    ASSERT_TRUE(std::get<0>(res).has_value());
    ASSERT_EQ(std::get<0>(res).value(), log);

    ASSERT_EQ(m_script->m_endpoints.size(), 1UL);
    ASSERT_EQ(m_script->m_endpoints.front(), m_roster[1].endpoint());
    auto& req = std::get<mintnet::mintette::get_logs_request>(
        m_script->m_requests.front());
    ASSERT_EQ(req.m_period, 2UL);
}

TEST_F(mintette_client_test, transports_are_reused) {
    auto utxo = mintnet::ledger::utxo{{m_input, m_user.addr()}};
    m_script->reply_with(mintnet::test::right(utxo));
    m_script->reply_with(mintnet::test::right(utxo));
    m_script->reply_with(mintnet::test::right(utxo));

    ASSERT_EQ(m_client->get_mintette_utxo(m_roster, 0).index(), 0UL);
    ASSERT_EQ(m_client->get_mintette_utxo(m_roster, 0).index(), 0UL);
    ASSERT_EQ(m_client->get_mintette_utxo(m_roster, 2).index(), 0UL);

    ASSERT_EQ(m_script->request_count(), 3UL);
    auto expected = std::vector<mintnet::network::endpoint_t>{
        m_roster[0].endpoint(),
        m_roster[2].endpoint()};
    ASSERT_EQ(m_script->m_endpoints, expected);
}

TEST_F(mintette_client_test, check_not_double_spent) {
    m_script->reply_with(outcome(std::in_place_index<1>, m_confirmation));
    m_script->reply_with(outcome(std::in_place_index<0>, "already spent"));

    auto sigs = std::vector<mintnet::ledger::signed_by>{
        {m_user.addr(), mintnet::signature_t{}}};

    auto ok = m_client->check_not_double_spent(m_roster[0], m_tx, m_input, sigs);
    ASSERT_EQ(ok.index(), 0UL);
    ASSERT_EQ(std::get<1>(std::get<0>(ok)), m_confirmation);

    auto rejected
        = m_client->check_not_double_spent(m_roster[0], m_tx, m_input, sigs);
    ASSERT_EQ(rejected.index(), 0UL);
    ASSERT_EQ(std::get<0>(std::get<0>(rejected)), "already spent");

    auto& req = std::get<mintnet::mintette::check_tx_request>(
        m_script->m_requests.front());
    ASSERT_EQ(req.m_tx, m_tx);
    ASSERT_EQ(req.m_input, m_input);
    ASSERT_EQ(req.m_signatures, sigs);
}

TEST_F(mintette_client_test, check_not_double_spent_batch) {
    auto inputs = std::vector<mintnet::ledger::addr_id>(3, m_input);
    inputs[1].m_index = 1;
    inputs[2].m_index = 2;

    auto outcomes = std::map<mintnet::ledger::addr_id, outcome>();
    auto sigs
        = std::map<mintnet::ledger::addr_id,
                   std::vector<mintnet::ledger::signed_by>>();
    for(const auto& in : inputs) {
        auto cc = m_confirmation;
        cc.m_addr_id = in;
        outcomes.emplace(in, outcome(std::in_place_index<1>, cc));
        sigs[in].emplace_back(m_user.addr(), mintnet::signature_t{});
    }
    outcomes[inputs[1]] = outcome(std::in_place_index<0>, "bad signature");
    m_script->reply_with(mintnet::test::right(outcomes));

    auto res = m_client->check_not_double_spent_batch(m_roster[1], m_tx, sigs);
    ASSERT_EQ(res.index(), 0UL);
    auto& got = std::get<0>(res);
    ASSERT_EQ(got.size(), 3UL);
    ASSERT_EQ(got.at(inputs[0]).index(), 1UL);
    ASSERT_EQ(std::get<0>(got.at(inputs[1])), "bad signature");
    ASSERT_EQ(got.at(inputs[2]).index(), 1UL);

    auto& req = std::get<mintnet::mintette::check_tx_batch_request>(
        m_script->m_requests.front());
    ASSERT_EQ(req.m_signatures, sigs);
}

TEST_F(mintette_client_test, commit_tx) {
    auto ack = mintnet::ledger::commit_acknowledgment{m_mintette_key.m_pk,
                                                      mintnet::signature_t{},
                                                      m_confirmation.m_head};
    using ack_outcome
        = mintnet::comm::either<mintnet::ledger::commit_acknowledgment>;
    m_script->reply_with(ack_outcome(std::in_place_index<1>, ack));

    auto confirmations = mintnet::ledger::check_confirmations{
        {{0, m_input}, m_confirmation}};
    auto res = m_client->commit_tx(m_roster[2], m_tx, confirmations);
    ASSERT_EQ(res.index(), 0UL);
    ASSERT_EQ(std::get<1>(std::get<0>(res)), ack);

    auto& req = std::get<mintnet::mintette::commit_tx_request>(
        m_script->m_requests.front());
    ASSERT_EQ(req.m_confirmations, confirmations);
}

TEST_F(mintette_client_test, announce_new_period_is_bank_signed) {
    m_script->reply_with(mintnet::test::right(std::monostate{}));

    auto npd = mintnet::ledger::new_period_data();
    npd.m_period = 4;
    npd.m_mintettes = m_roster;
    auto res = m_client->announce_new_period(m_roster[0], m_bank.m_sk, npd);
    ASSERT_FALSE(res.has_value());

    auto& req = std::get<mintnet::mintette::announce_new_period_request>(
        m_script->m_requests.front());
    ASSERT_EQ(req.m_data.m_value, npd);
    ASSERT_TRUE(
        mintnet::ledger::verify_with_signature(m_bank.m_pk, req.m_data));
}

TEST_F(mintette_client_test, send_period_finished) {
    auto result = mintnet::ledger::period_result();
    result.m_period = 4;
    result.m_log.emplace_back(mintnet::ledger::close_epoch_entry{},
                              mintnet::hash_t{});
    m_script->reply_with(mintnet::test::right(result));
    m_script->reply_with(
        mintnet::test::left<mintnet::ledger::period_result>("wrong period"));

    auto res = m_client->send_period_finished(m_roster[0], m_bank.m_sk, 4);
    ASSERT_EQ(res.index(), 0UL);
    ASSERT_EQ(std::get<0>(res), result);

    auto& req = std::get<mintnet::mintette::period_finished_request>(
        m_script->m_requests.front());
    ASSERT_EQ(req.m_period.m_value, 4UL);
    ASSERT_TRUE(
        mintnet::ledger::verify_with_signature(m_bank.m_pk, req.m_period));

    auto failed = m_client->send_period_finished(m_roster[0], m_bank.m_sk, 5);
    ASSERT_EQ(failed.index(), 1UL);
    ASSERT_EQ(std::get<1>(failed),
              mintnet::comm::method_error(
                  "Error on caller side has occurred: wrong period"));
}

TEST_F(mintette_client_test, get_mintette_period) {
    m_script->reply_with(
        mintnet::test::right(std::optional<mintnet::ledger::period_id>(8)));
    m_script->reply_with(
        mintnet::test::right(std::optional<mintnet::ledger::period_id>()));

    auto started = m_client->get_mintette_period(m_roster[0]);
    ASSERT_EQ(std::get<0>(started), 8UL);
    auto idle = m_client->get_mintette_period(m_roster[0]);
    ASSERT_FALSE(std::get<0>(idle).has_value());
}

TEST_F(mintette_client_test, mintette_timeout) {
    m_script->fail_with(mintnet::rpc::call_error_code::timeout, "no reply");
    auto res = m_client->get_mintette_period(m_roster[0]);
    ASSERT_EQ(res.index(), 1UL);
    ASSERT_EQ(std::get<1>(res), mintnet::comm::timeout_error("no reply"));
}
