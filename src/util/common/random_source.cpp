// Copyright (c) 2021 MIT Digital Currency Initiative,
//                    Federal Reserve Bank of Boston
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#include "random_source.hpp"

#include <cstring>
#include <fstream>

namespace mintnet {
    random_source::random_source(const std::string& source_file) {
        std::ifstream source(source_file, std::ios::in | std::ios::binary);
        std::array<char, std::tuple_size<hash_t>::value> dest{};
        source.read(dest.data(), dest.size());
        std::memcpy(m_seed.data(), dest.data(), dest.size());
    }

    random_source::random_source(const hash_t& seed) : m_seed(seed) {}

    auto random_source::operator()() -> result_type {
        std::unique_lock<std::mutex> l(m_mut);
        result_type ret{};
        std::array<unsigned char, sizeof(ret)> ret_arr{};
        for(auto& v : ret_arr) {
            if(m_buf.empty()) {
                auto h = hash_at_index(m_counter++);
                for(auto b : h) {
                    m_buf.push(b);
                }
            }
            v = m_buf.front();
            m_buf.pop();
        }
        std::memcpy(&ret, ret_arr.data(), ret_arr.size());
        return ret;
    }

    auto random_source::hash_at_index(uint64_t idx) const -> hash_t {
        auto buf = buffer();
        buf.append(m_seed.data(), m_seed.size());
        buf.append(&idx, sizeof(idx));
        return hash_data(buf);
    }
}
