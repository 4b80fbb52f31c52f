// Copyright (c) 2021 MIT Digital Currency Initiative,
//                    Federal Reserve Bank of Boston
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#include "comm/call.hpp"
#include "util.hpp"

#include <gtest/gtest.h>

class call_test : public ::testing::Test {
  protected:
    using request = uint64_t;

    void SetUp() override {
        m_ctx.m_log = mintnet::test::make_log();
        m_ctx.m_authority = mintnet::comm::authority{"bank", m_bank.m_pk};
    }

    template<typename T, typename Policy>
    auto call() -> mintnet::comm::result<T> {
        return mintnet::comm::call<T, Policy>(m_transport, request{1}, m_ctx);
    }

    template<typename T>
    static auto error_of(const mintnet::comm::result<T>& res)
        -> mintnet::comm::communication_error {
        EXPECT_EQ(res.index(), 1UL);
        return std::get<1>(res);
    }

    std::shared_ptr<mintnet::test::script<request>> m_script{
        std::make_shared<mintnet::test::script<request>>()};
    mintnet::test::scripted_transport<request> m_transport{m_script};
    mintnet::comm::call_context m_ctx;
    mintnet::test::keypair m_bank{mintnet::test::make_keypair(1)};
    mintnet::test::keypair m_mallory{mintnet::test::make_keypair(2)};
};

TEST_F(call_test, plain_value) {
    m_script->reply_with(uint64_t{99});
    auto res = call<uint64_t, mintnet::comm::plain>();
    ASSERT_EQ(std::get<0>(res), 99UL);
    ASSERT_EQ(m_script->request_count(), 1UL);
    ASSERT_EQ(m_script->m_requests.front(), 1UL);
}

TEST_F(call_test, transport_errors_are_translated) {
    m_script->fail_with(mintnet::rpc::call_error_code::timeout, "slow");
    m_script->fail_with(mintnet::rpc::call_error_code::disconnected, "gone");
    m_script->fail_with(mintnet::rpc::call_error_code::malformed_response,
                        "junk");
    m_script->fail_with(mintnet::rpc::call_error_code::server_error,
                        "handler threw");

    auto timeout = error_of(call<uint64_t, mintnet::comm::plain>());
    ASSERT_EQ(timeout.m_code, mintnet::comm::error_code::timeout);
    ASSERT_EQ(timeout.m_message, "slow");

    auto disconnected = error_of(call<uint64_t, mintnet::comm::plain>());
    ASSERT_EQ(disconnected.m_code, mintnet::comm::error_code::timeout);

    auto malformed = error_of(call<uint64_t, mintnet::comm::plain>());
    ASSERT_EQ(malformed.m_code, mintnet::comm::error_code::protocol);

    auto server = error_of(call<uint64_t, mintnet::comm::plain>());
    ASSERT_EQ(server.m_code, mintnet::comm::error_code::method);
    ASSERT_EQ(server.m_message, "handler threw");
}

TEST_F(call_test, result_type_mismatch_is_protocol_error) {
    m_script->reply_with(std::string("not a number"));
    auto err = error_of(call<uint64_t, mintnet::comm::plain>());
    ASSERT_EQ(err.m_code, mintnet::comm::error_code::protocol);

    m_script->reply_with(uint8_t{1});
    err = error_of(call<uint64_t, mintnet::comm::plain>());
    ASSERT_EQ(err.m_code, mintnet::comm::error_code::protocol);
}

TEST_F(call_test, unwrap_either) {
    m_script->reply_with(mintnet::test::right<uint64_t>(7));
    m_script->reply_with(mintnet::test::left<uint64_t>("no such period"));

    auto ok = call<uint64_t, mintnet::comm::unwrap_either>();
    ASSERT_EQ(std::get<0>(ok), 7UL);

    auto err = error_of(call<uint64_t, mintnet::comm::unwrap_either>());
    ASSERT_EQ(err.m_code, mintnet::comm::error_code::method);
    ASSERT_EQ(err.m_message,
              "Error on caller side has occurred: no such period");
}

TEST_F(call_test, signed_either_verifies_authority) {
    m_script->reply_with(
        mintnet::test::sign_reply(m_bank, mintnet::test::right<uint64_t>(3)));
    m_script->reply_with(
        mintnet::test::sign_reply(m_mallory,
                                  mintnet::test::right<uint64_t>(3)));

    auto ok = call<uint64_t, mintnet::comm::signed_either>();
    ASSERT_EQ(std::get<0>(ok), 3UL);

    auto err = error_of(call<uint64_t, mintnet::comm::signed_either>());
    ASSERT_EQ(err, mintnet::comm::bad_signature("bank"));
    ASSERT_EQ(mintnet::comm::to_string(err),
              "bank has provided a bad signature");
}

TEST_F(call_test, signature_checked_before_either) {
    m_script->reply_with(
        mintnet::test::sign_reply(m_mallory,
                                  mintnet::test::left<uint64_t>("denied")));
    auto err = error_of(call<uint64_t, mintnet::comm::signed_either>());
    ASSERT_EQ(err.m_code, mintnet::comm::error_code::bad_signature);

    m_script->reply_with(
        mintnet::test::sign_reply(m_bank,
                                  mintnet::test::left<uint64_t>("denied")));
    err = error_of(call<uint64_t, mintnet::comm::signed_either>());
    ASSERT_EQ(err.m_code, mintnet::comm::error_code::method);
}

TEST_F(call_test, signed_either_without_authority) {
    m_ctx.m_authority.reset();
    m_script->reply_with(
        mintnet::test::sign_reply(m_bank, mintnet::test::right<uint64_t>(3)));
    auto err = error_of(call<uint64_t, mintnet::comm::signed_either>());
    ASSERT_EQ(err.m_code, mintnet::comm::error_code::bad_signature);
}

TEST_F(call_test, unsigned_reply_to_signed_call) {
    m_script->reply_with(mintnet::test::right<uint64_t>(3));
    auto err = error_of(call<uint64_t, mintnet::comm::signed_either>());
    ASSERT_EQ(err.m_code, mintnet::comm::error_code::protocol);
}

TEST_F(call_test, to_status) {
    m_script->reply_with(mintnet::test::right(std::monostate{}));
    m_script->reply_with(mintnet::test::left<std::monostate>("full"));

    auto ok = mintnet::comm::to_status(
        call<std::monostate, mintnet::comm::unwrap_either>());
    ASSERT_FALSE(ok.has_value());

    auto failed = mintnet::comm::to_status(
        call<std::monostate, mintnet::comm::unwrap_either>());
    ASSERT_TRUE(failed.has_value());
    ASSERT_EQ(failed->m_code, mintnet::comm::error_code::method);
}

TEST(communication_error_test, renderings) {
    ASSERT_EQ(mintnet::comm::to_string(mintnet::comm::protocol_error("x")),
              "internal error: x");
    ASSERT_EQ(mintnet::comm::to_string(mintnet::comm::timeout_error("x")),
              "timeout error: x");
    ASSERT_EQ(mintnet::comm::to_string(mintnet::comm::method_error("x")),
              "method error: x");
    ASSERT_EQ(mintnet::comm::to_string(mintnet::comm::bad_signature("notary")),
              "notary has provided a bad signature");
}
