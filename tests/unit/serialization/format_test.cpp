// Copyright (c) 2021 MIT Digital Currency Initiative,
//                    Federal Reserve Bank of Boston
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#include "ledger/format.hpp"
#include "util.hpp"
#include "util/serialization/buffer_serializer.hpp"
#include "util/serialization/format.hpp"
#include "util/serialization/util.hpp"

#include <gtest/gtest.h>
#include <limits>

class format_test : public ::testing::Test {
  protected:
    format_test() : ser(buf), deser(buf) {}

    void SetUp() override {
        ser.reset();
        deser.reset();
    }

    mintnet::buffer buf;
    mintnet::buffer_serializer ser;
    mintnet::buffer_serializer deser;
};

TEST_F(format_test, inordinate_declared_lengths_are_handled) {
    // manually serialize a vector declaring an obscenely large size
    ser << std::numeric_limits<uint64_t>::max();
    ser << 12LLU;
    ser << 75LLU;
    ser << std::numeric_limits<uint64_t>::max();
    ser << 37LLU;

    EXPECT_TRUE(ser);

    std::vector<uint64_t> r0;
    deser >> r0;

    EXPECT_FALSE(deser);
    EXPECT_EQ(r0.size(), 4);
    EXPECT_EQ(r0.capacity(), 1024UL * 1024UL / sizeof(uint64_t));
}

TEST_F(format_test, inordinate_string_length_fails) {
    ser << std::numeric_limits<uint64_t>::max();
    ser << std::string("abc");

    std::string s;
    deser >> s;
    EXPECT_FALSE(deser);
}

TEST_F(format_test, invalid_variant_index_fails) {
    ser << uint8_t{3};
    ser << uint64_t{1};

    std::variant<uint64_t, std::string, bool> v;
    deser >> v;
    EXPECT_FALSE(deser);
}

TEST_F(format_test, duplicate_map_key_fails) {
    ser << uint64_t{2};
    ser << uint32_t{5} << uint8_t{1};
    ser << uint32_t{5} << uint8_t{2};

    std::map<uint32_t, uint8_t> m;
    deser >> m;
    EXPECT_FALSE(deser);
}

TEST_F(format_test, duplicate_set_item_fails) {
    ser << uint64_t{2} << uint16_t{9} << uint16_t{9};

    std::set<uint16_t> s;
    deser >> s;
    EXPECT_FALSE(deser);
}

TEST_F(format_test, invalid_state_is_sticky) {
    ser << uint8_t{1};
    uint64_t big{};
    deser >> big;
    EXPECT_FALSE(deser);

    uint8_t small{};
    deser >> small;
    EXPECT_FALSE(deser);
}

TEST_F(format_test, empty_types_take_no_space) {
    ser << std::monostate{};
    EXPECT_EQ(buf.size(), 0UL);
    EXPECT_EQ(mintnet::serialized_size(
                  std::variant<std::monostate, uint64_t>{}),
              1UL);
}

TEST_F(format_test, from_buffer_exact_rejects_trailing_bytes) {
    auto pkt = mintnet::make_buffer(std::make_pair(uint64_t{1}, uint8_t{2}));
    ASSERT_TRUE(mintnet::from_buffer<uint64_t>(pkt).has_value());
    ASSERT_FALSE(mintnet::from_buffer_exact<uint64_t>(pkt).has_value());

    auto exact
        = mintnet::from_buffer_exact<std::pair<uint64_t, uint8_t>>(pkt);
    ASSERT_TRUE(exact.has_value());
    ASSERT_EQ(exact->second, 2);
}

TEST_F(format_test, ledger_primitive_sizes) {
    auto kp = mintnet::test::make_keypair(1);
    EXPECT_EQ(mintnet::serialized_size(kp.addr()), mintnet::pubkey_len);
    EXPECT_EQ(mintnet::serialized_size(mintnet::ledger::coin{}),
              sizeof(uint32_t) + sizeof(uint64_t));
    EXPECT_EQ(mintnet::serialized_size(mintnet::ledger::addr_id{}),
              mintnet::hash_size + sizeof(uint64_t) + sizeof(uint32_t)
                  + sizeof(uint64_t));
}

TEST_F(format_test, tx_strategy_roundtrip) {
    auto a = mintnet::test::make_keypair(1).addr();
    auto b = mintnet::test::make_keypair(2).addr();
    auto strats = mintnet::strategy::address_strategy_map{
        {a, mintnet::strategy::default_strategy{}},
        {b, mintnet::strategy::m_of_n_strategy{1, {a, b}}}};
    ser << strats;
    ASSERT_TRUE(ser);

    mintnet::strategy::address_strategy_map out;
    deser >> out;
    ASSERT_TRUE(deser);
    ASSERT_TRUE(deser.end_of_buffer());
    ASSERT_EQ(out, strats);
}

TEST_F(format_test, hblock_roundtrip) {
    auto kp = mintnet::test::make_keypair(4);
    auto blk = mintnet::ledger::hblock();
    blk.m_hash.fill(0x11);
    blk.m_transactions.push_back(mintnet::test::simple_tx(kp.addr(), 3));
    blk.m_signature.fill(0x22);
    blk.m_dpk.emplace_back(kp.m_pk, mintnet::signature_t{});
    blk.m_addresses.emplace(kp.addr(), mintnet::strategy::default_strategy{});

    auto pkt = mintnet::make_buffer(blk);
    auto out = mintnet::from_buffer_exact<mintnet::ledger::hblock>(pkt);
    ASSERT_TRUE(out.has_value());
    ASSERT_EQ(out.value(), blk);
}

TEST_F(format_test, action_log_roundtrip) {
    auto kp = mintnet::test::make_keypair(5);
    auto tx = mintnet::test::simple_tx(kp.addr(), 8);
    auto head = mintnet::hash_t();
    head.fill(0x33);
    auto log = mintnet::ledger::action_log{
        {mintnet::ledger::query_entry{tx}, head},
        {mintnet::ledger::commit_entry{tx, {}}, head},
        {mintnet::ledger::close_epoch_entry{head}, head}};

    auto pkt = mintnet::make_buffer(log);
    auto out = mintnet::from_buffer_exact<mintnet::ledger::action_log>(pkt);
    ASSERT_TRUE(out.has_value());
    ASSERT_EQ(out.value(), log);
}
