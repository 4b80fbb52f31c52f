// Copyright (c) 2021 MIT Digital Currency Initiative,
//                    Federal Reserve Bank of Boston
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#include "util/common/buffer.hpp"

#include <cstring>
#include <gtest/gtest.h>

TEST(BufferTest, to_from_hex) {
    std::string data = "hello";

    auto buf = mintnet::buffer();
    buf.extend(data.size());
    std::memcpy(buf.data(), data.data(), data.size());
    auto hex = buf.to_hex();
    ASSERT_EQ(hex, "68656c6c6f");

    auto from = mintnet::buffer::from_hex(hex);
    ASSERT_EQ(from.value(), buf);
}

TEST(BufferTest, from_hex_upper_case) {
    auto from = mintnet::buffer::from_hex("ABcd");
    ASSERT_TRUE(from.has_value());
    ASSERT_EQ(from->to_hex(), "abcd");
}

TEST(BufferTest, from_hex_invalid_char) {
    auto from = mintnet::buffer::from_hex("ZZ11ff");
    ASSERT_FALSE(from.has_value());
}

TEST(BufferTest, from_hex_invalid_len) {
    auto from = mintnet::buffer::from_hex("11ffa");
    ASSERT_FALSE(from.has_value());
}

TEST(BufferTest, from_hex_empty) {
    auto from = mintnet::buffer::from_hex("");
    ASSERT_TRUE(from.has_value());
    ASSERT_TRUE(from->empty());
}

TEST(BufferTest, append_and_data_at) {
    auto buf = mintnet::buffer();
    const unsigned char first[] = {0x01, 0x02};
    const unsigned char second[] = {0x03};
    buf.append(first, sizeof(first));
    buf.append(second, sizeof(second));
    ASSERT_EQ(buf.size(), 3UL);
    ASSERT_EQ(*static_cast<const unsigned char*>(buf.data_at(2)), 0x03);
    ASSERT_EQ(buf.to_hex(), "010203");

    buf.clear();
    ASSERT_TRUE(buf.empty());
}
