// Copyright (c) 2021 MIT Digital Currency Initiative,
//                    Federal Reserve Bank of Boston
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#include "ledger/format.hpp"
#include "ledger/with_signature.hpp"
#include "util.hpp"

#include <gtest/gtest.h>

class with_signature_test : public ::testing::Test {
  protected:
    mintnet::secp_context_ptr m_secp{mintnet::make_secp_context()};
    mintnet::test::keypair m_bank{mintnet::test::make_keypair(7)};
    mintnet::test::keypair m_other{mintnet::test::make_keypair(8)};
};

TEST_F(with_signature_test, round_trip) {
    auto tx = mintnet::test::simple_tx(m_other.addr(), 42);
    auto env = mintnet::ledger::make_with_signature(m_secp.get(),
                                                    m_bank.m_sk,
                                                    tx);
    ASSERT_TRUE(env.has_value());
    ASSERT_EQ(env->m_value, tx);
    ASSERT_TRUE(mintnet::ledger::verify_with_signature(m_bank.m_pk,
                                                       env.value()));
}

TEST_F(with_signature_test, wrong_key) {
    auto env = mintnet::ledger::make_with_signature(
        m_secp.get(),
        m_bank.m_sk,
        std::string("period 3 finished"));
    ASSERT_TRUE(env.has_value());
    ASSERT_FALSE(mintnet::ledger::verify_with_signature(m_other.m_pk,
                                                        env.value()));
}

TEST_F(with_signature_test, tampered_value) {
    auto env = mintnet::ledger::make_with_signature(
        m_secp.get(),
        m_bank.m_sk,
        std::vector<uint64_t>{1, 2, 3});
    ASSERT_TRUE(env.has_value());

    // Flip one bit of every byte of the encoded value in turn.
    auto encoded = mintnet::make_buffer(env.value());
    auto value_size = mintnet::serialized_size(env->m_value);
    for(size_t i = 0; i < value_size; i++) {
        auto copy = encoded;
        auto* byte = static_cast<unsigned char*>(copy.data_at(i));
        *byte ^= 0x01;
        auto decoded = mintnet::from_buffer_exact<
            mintnet::ledger::with_signature<std::vector<uint64_t>>>(copy);
        if(!decoded.has_value()) {
            // The length prefix no longer matches the buffer.
            continue;
        }
        ASSERT_FALSE(mintnet::ledger::verify_with_signature(m_bank.m_pk,
                                                            decoded.value()))
            << "byte " << i;
    }
}

TEST_F(with_signature_test, tampered_signature) {
    auto env = mintnet::ledger::make_with_signature(m_secp.get(),
                                                    m_bank.m_sk,
                                                    uint64_t{5});
    ASSERT_TRUE(env.has_value());
    env->m_signature[0] ^= 0x80;
    ASSERT_FALSE(mintnet::ledger::verify_with_signature(m_bank.m_pk,
                                                        env.value()));
}

TEST_F(with_signature_test, signing_is_deterministic) {
    auto first = mintnet::ledger::sign_value(m_secp.get(),
                                             m_bank.m_sk,
                                             std::string("abc"));
    auto second = mintnet::ledger::sign_value(m_secp.get(),
                                              m_bank.m_sk,
                                              std::string("abc"));
    ASSERT_TRUE(first.has_value());
    ASSERT_EQ(first, second);
}

TEST_F(with_signature_test, invalid_private_key) {
    auto zero = mintnet::privkey_t{};
    auto env = mintnet::ledger::make_with_signature(m_secp.get(),
                                                    zero,
                                                    uint64_t{5});
    ASSERT_FALSE(env.has_value());
}
