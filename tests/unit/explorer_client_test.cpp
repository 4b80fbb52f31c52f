// Copyright (c) 2021 MIT Digital Currency Initiative,
//                    Federal Reserve Bank of Boston
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#include "explorer/client.hpp"
#include "explorer/format.hpp"
#include "util.hpp"

#include <gtest/gtest.h>
#include <set>

class explorer_client_test : public ::testing::Test {
  protected:
    void SetUp() override {
        m_client = make_client(m_script);
        m_tx = mintnet::test::simple_tx(m_bank.addr(), 3);
    }

    static auto make_client(
        std::shared_ptr<mintnet::test::script<mintnet::explorer::request>> s)
        -> std::unique_ptr<mintnet::explorer::client> {
        auto seed = mintnet::hash_t{};
        seed.fill(0x3c);
        return std::make_unique<mintnet::explorer::client>(
            mintnet::test::scripted_factory(std::move(s)),
            std::make_unique<mintnet::random_source>(seed),
            mintnet::test::make_log());
    }

    using lookup_result
        = mintnet::comm::result<std::optional<mintnet::ledger::transaction>>;

    auto lookup(const mintnet::ledger::explorers& roster) -> lookup_result {
        return m_client->ask_explorer(
            roster,
            [&](const mintnet::ledger::explorer& e) {
                return m_client->get_transaction_by_id(
                    e,
                    mintnet::ledger::tx_id(m_tx));
            });
    }

    mintnet::test::keypair m_bank{mintnet::test::make_keypair(1)};
    mintnet::test::keypair m_explorer_key{mintnet::test::make_keypair(2)};
    std::shared_ptr<mintnet::test::script<mintnet::explorer::request>>
        m_script{std::make_shared<
            mintnet::test::script<mintnet::explorer::request>>()};
    std::unique_ptr<mintnet::explorer::client> m_client;
    mintnet::ledger::transaction m_tx;
    mintnet::ledger::explorers m_roster{
        {"127.0.0.1", 7001, m_explorer_key.m_pk},
        {"127.0.0.1", 7002, m_explorer_key.m_pk},
        {"127.0.0.1", 7003, m_explorer_key.m_pk}};
};

TEST_F(explorer_client_test, no_active_explorers) {
    auto res = lookup({});
    ASSERT_EQ(res.index(), 1UL);
    ASSERT_EQ(std::get<1>(res),
              mintnet::comm::method_error("There are no active explorers"));
    ASSERT_EQ(m_script->request_count(), 0UL);
    ASSERT_TRUE(m_script->m_endpoints.empty());
}

TEST_F(explorer_client_test, get_transaction_by_id) {
    m_script->reply_with(std::optional<mintnet::ledger::transaction>(m_tx));
    m_script->reply_with(std::optional<mintnet::ledger::transaction>());

    auto found = m_client->get_transaction_by_id(m_roster[0],
                                                 mintnet::ledger::tx_id(m_tx));
    ASSERT_EQ(found.index(), 0UL);
    ASSERT_EQ(std::get<0>(found), m_tx);

    auto missing
        = m_client->get_transaction_by_id(m_roster[0], mintnet::hash_t{});
    ASSERT_EQ(missing.index(), 0UL);
    ASSERT_FALSE(std::get<0>(missing).has_value());

    auto& req = std::get<mintnet::explorer::get_transaction_request>(
        m_script->m_requests.front());
    ASSERT_EQ(req.m_tx_id, mintnet::ledger::tx_id(m_tx));
}

TEST_F(explorer_client_test, ask_explorer_picks_from_roster) {
    constexpr auto n_queries = 100;
    for(auto i = 0; i < n_queries; i++) {
        m_script->reply_with(
            std::optional<mintnet::ledger::transaction>(m_tx));
    }
    auto picked = std::set<uint16_t>();
    for(auto i = 0; i < n_queries; i++) {
        auto res = lookup(m_roster);
        ASSERT_EQ(res.index(), 0UL);
    }
    for(const auto& ep : m_script->m_endpoints) {
        picked.insert(ep.second);
    }
    ASSERT_EQ(m_script->request_count(),
              static_cast<size_t>(n_queries));
    ASSERT_EQ(picked, (std::set<uint16_t>{7001, 7002, 7003}));
}

TEST_F(explorer_client_test, ask_explorer_is_reproducible_from_seed) {
    auto other_script
        = std::make_shared<mintnet::test::script<mintnet::explorer::request>>();
    auto other = make_client(other_script);
    for(auto i = 0; i < 10; i++) {
        auto roster = m_roster;
        roster.push_back({"127.0.0.1",
                          static_cast<uint16_t>(7100 + i),
                          m_explorer_key.m_pk});
        m_script->reply_with(std::optional<mintnet::ledger::transaction>());
        other_script->reply_with(
            std::optional<mintnet::ledger::transaction>());
        auto query = [](mintnet::explorer::client& c) {
            return [&c](const mintnet::ledger::explorer& e) {
                return c.get_transaction_by_id(e, mintnet::hash_t{});
            };
        };
        ASSERT_EQ(m_client->ask_explorer(roster, query(*m_client)).index(),
                  0UL);
        ASSERT_EQ(other->ask_explorer(roster, query(*other)).index(), 0UL);
    }
    ASSERT_EQ(m_script->m_endpoints, other_script->m_endpoints);
}

TEST_F(explorer_client_test, failed_query_is_not_retried) {
    m_script->fail_with(mintnet::rpc::call_error_code::disconnected,
                        "connection refused");
    auto res = lookup(m_roster);
    ASSERT_EQ(res.index(), 1UL);
    ASSERT_EQ(std::get<1>(res).m_code, mintnet::comm::error_code::timeout);
    ASSERT_EQ(m_script->request_count(), 1UL);
}

TEST_F(explorer_client_test, announce_new_block_is_bank_signed) {
    m_script->reply_with(mintnet::ledger::period_id{9});

    auto blk = mintnet::explorer::block_with_metadata();
    blk.m_value.m_hash.fill(0x21);
    blk.m_value.m_transactions.push_back(m_tx);
    blk.m_metadata.m_timestamp = 1600000000;

    auto res = m_client->announce_new_block(m_roster[1], m_bank.m_sk, 9, blk);
    ASSERT_EQ(res.index(), 0UL);
    ASSERT_EQ(std::get<0>(res), 9UL);

    ASSERT_EQ(m_script->m_endpoints.front(), m_roster[1].endpoint());
    auto& req = std::get<mintnet::explorer::new_block_request>(
        m_script->m_requests.front());
    ASSERT_EQ(req.m_block.m_value.first, 9UL);
    ASSERT_EQ(req.m_block.m_value.second, blk);
    ASSERT_TRUE(
        mintnet::ledger::verify_with_signature(m_bank.m_pk, req.m_block));
}
