// Copyright (c) 2021 MIT Digital Currency Initiative,
//                    Federal Reserve Bank of Boston
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#include "buffer.hpp"

#include <cstring>

namespace mintnet {
    void buffer::clear() {
        m_data.clear();
    }

    void buffer::append(const void* data, size_t len) {
        if(len == 0) {
            return;
        }
        const auto orig_size = m_data.size();
        m_data.resize(orig_size + len);
        std::memcpy(&m_data[orig_size], data, len);
    }

    auto buffer::size() const -> size_t {
        return m_data.size();
    }

    auto buffer::empty() const -> bool {
        return m_data.empty();
    }

    auto buffer::data() -> void* {
        return m_data.data();
    }

    auto buffer::data() const -> const void* {
        return m_data.data();
    }

    auto buffer::data_at(size_t offset) -> void* {
        return &m_data[offset];
    }

    auto buffer::data_at(size_t offset) const -> const void* {
        return &m_data[offset];
    }

    auto buffer::operator==(const buffer& other) const -> bool {
        return m_data == other.m_data;
    }

    auto buffer::operator!=(const buffer& other) const -> bool {
        return !(*this == other);
    }

    void buffer::extend(size_t len) {
        m_data.resize(m_data.size() + len);
    }

    auto buffer::c_ptr() const -> const unsigned char* {
        // NOLINTNEXTLINE(cppcoreguidelines-pro-type-reinterpret-cast)
        return reinterpret_cast<const unsigned char*>(m_data.data());
    }

    auto buffer::to_hex() const -> std::string {
        return mintnet::to_hex(c_ptr(), m_data.size());
    }

    auto buffer::from_hex(const std::string& hex) -> std::optional<buffer> {
        constexpr auto max_size = 102400;
        if((hex.size() % 2) != 0 || hex.size() > max_size) {
            return std::nullopt;
        }

        auto ret = buffer();
        ret.m_data.reserve(hex.size() / 2);
        for(size_t i = 0; i < hex.size(); i += 2) {
            auto hi = hex_digit(hex[i]);
            auto lo = hex_digit(hex[i + 1]);
            if(!hi || !lo) {
                return std::nullopt;
            }
            static constexpr auto nibble_bits = 4;
            ret.m_data.push_back(
                static_cast<std::byte>((*hi << nibble_bits) | *lo));
        }

        return ret;
    }

    auto to_hex(const unsigned char* data, size_t len) -> std::string {
        static constexpr auto digits = "0123456789abcdef";
        static constexpr auto nibble_bits = 4;
        static constexpr auto nibble_mask = 0x0f;
        auto ret = std::string();
        ret.reserve(len * 2);
        for(size_t i = 0; i < len; i++) {
            ret.push_back(digits[data[i] >> nibble_bits]);
            ret.push_back(digits[data[i] & nibble_mask]);
        }
        return ret;
    }

    auto hex_digit(char c) -> std::optional<unsigned char> {
        static constexpr auto alpha_offset = 10;
        if(c >= '0' && c <= '9') {
            return static_cast<unsigned char>(c - '0');
        }
        if(c >= 'a' && c <= 'f') {
            return static_cast<unsigned char>(c - 'a' + alpha_offset);
        }
        if(c >= 'A' && c <= 'F') {
            return static_cast<unsigned char>(c - 'A' + alpha_offset);
        }
        return std::nullopt;
    }
}
