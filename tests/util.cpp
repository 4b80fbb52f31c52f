// Copyright (c) 2021 MIT Digital Currency Initiative,
//                    Federal Reserve Bank of Boston
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#include "util.hpp"

namespace mintnet::test {
    auto keypair::addr() const -> ledger::address {
        return ledger::address{m_pk};
    }

    auto make_keypair(unsigned char seed) -> keypair {
        auto ret = keypair();
        ret.m_sk.fill(seed);
        auto ctx = make_secp_context();
        auto pk = pubkey_from_privkey(ret.m_sk, ctx.get());
        EXPECT_TRUE(pk.has_value());
        if(pk.has_value()) {
            ret.m_pk = pk.value();
        }
        return ret;
    }

    auto make_log() -> std::shared_ptr<logging::log> {
        return std::make_shared<logging::log>(logging::log_level::error);
    }

    auto simple_tx(const ledger::address& to, uint64_t value)
        -> ledger::transaction {
        auto tx = ledger::transaction();
        auto input = ledger::addr_id();
        input.m_tx_id.fill(0xab);
        input.m_index = 0;
        input.m_coin = ledger::coin{0, value};
        tx.m_inputs.push_back(input);
        tx.m_outputs.emplace_back(to, ledger::coin{0, value});
        return tx;
    }
}
