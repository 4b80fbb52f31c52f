// Copyright (c) 2021 MIT Digital Currency Initiative,
//                    Federal Reserve Bank of Boston
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#include "format.hpp"

namespace mintnet {
    auto operator<<(serializer& ser, const ledger::address& addr)
        -> serializer& {
        return ser << addr.m_key;
    }

    auto operator>>(serializer& deser, ledger::address& addr) -> serializer& {
        return deser >> addr.m_key;
    }

    auto operator<<(serializer& ser, const ledger::coin& c) -> serializer& {
        return ser << c.m_color << c.m_value;
    }

    auto operator>>(serializer& deser, ledger::coin& c) -> serializer& {
        return deser >> c.m_color >> c.m_value;
    }

    auto operator<<(serializer& ser, const ledger::addr_id& id)
        -> serializer& {
        return ser << id.m_tx_id << id.m_index << id.m_coin;
    }

    auto operator>>(serializer& deser, ledger::addr_id& id) -> serializer& {
        return deser >> id.m_tx_id >> id.m_index >> id.m_coin;
    }

    auto operator<<(serializer& ser, const ledger::transaction& tx)
        -> serializer& {
        return ser << tx.m_inputs << tx.m_outputs;
    }

    auto operator>>(serializer& deser, ledger::transaction& tx)
        -> serializer& {
        return deser >> tx.m_inputs >> tx.m_outputs;
    }

    auto operator<<(serializer& ser, const strategy::m_of_n_strategy& s)
        -> serializer& {
        return ser << s.m_required << s.m_parties;
    }

    auto operator>>(serializer& deser, strategy::m_of_n_strategy& s)
        -> serializer& {
        return deser >> s.m_required >> s.m_parties;
    }

    auto operator<<(serializer& ser, const strategy::trust_alloc& a)
        -> serializer& {
        return ser << a.m_address;
    }

    auto operator>>(serializer& deser, strategy::trust_alloc& a)
        -> serializer& {
        return deser >> a.m_address;
    }

    auto operator<<(serializer& ser, const strategy::user_alloc& a)
        -> serializer& {
        return ser << a.m_address;
    }

    auto operator>>(serializer& deser, strategy::user_alloc& a)
        -> serializer& {
        return deser >> a.m_address;
    }

    auto operator<<(serializer& ser, const strategy::trust_party& p)
        -> serializer& {
        return ser << p.m_party_address << p.m_hot_trust_key;
    }

    auto operator>>(serializer& deser, strategy::trust_party& p)
        -> serializer& {
        return deser >> p.m_party_address >> p.m_hot_trust_key;
    }

    auto operator<<(serializer& ser, const strategy::user_party& p)
        -> serializer& {
        return ser << p.m_party_address;
    }

    auto operator>>(serializer& deser, strategy::user_party& p)
        -> serializer& {
        return deser >> p.m_party_address;
    }

    auto operator<<(serializer& ser, const strategy::allocation_strategy& s)
        -> serializer& {
        return ser << s.m_sig_number << s.m_all_parties;
    }

    auto operator>>(serializer& deser, strategy::allocation_strategy& s)
        -> serializer& {
        return deser >> s.m_sig_number >> s.m_all_parties;
    }

    auto operator<<(serializer& ser, const strategy::allocation_info& info)
        -> serializer& {
        return ser << info.m_strategy << info.m_current_confirmations;
    }

    auto operator>>(serializer& deser, strategy::allocation_info& info)
        -> serializer& {
        return deser >> info.m_strategy >> info.m_current_confirmations;
    }

    auto operator<<(serializer& ser, const ledger::mintette& m)
        -> serializer& {
        return ser << m.m_host << m.m_port;
    }

    auto operator>>(serializer& deser, ledger::mintette& m) -> serializer& {
        return deser >> m.m_host >> m.m_port;
    }

    auto operator<<(serializer& ser, const ledger::explorer& e)
        -> serializer& {
        return ser << e.m_host << e.m_port << e.m_key;
    }

    auto operator>>(serializer& deser, ledger::explorer& e) -> serializer& {
        return deser >> e.m_host >> e.m_port >> e.m_key;
    }

    auto operator<<(serializer& ser, const ledger::hblock& blk)
        -> serializer& {
        return ser << blk.m_hash << blk.m_transactions << blk.m_signature
                   << blk.m_dpk << blk.m_addresses;
    }

    auto operator>>(serializer& deser, ledger::hblock& blk) -> serializer& {
        return deser >> blk.m_hash >> blk.m_transactions >> blk.m_signature
            >> blk.m_dpk >> blk.m_addresses;
    }

    auto operator<<(serializer& ser, const ledger::hblock_metadata& meta)
        -> serializer& {
        return ser << meta.m_timestamp;
    }

    auto operator>>(serializer& deser, ledger::hblock_metadata& meta)
        -> serializer& {
        return deser >> meta.m_timestamp;
    }

    auto operator<<(serializer& ser, const ledger::check_confirmation& cc)
        -> serializer& {
        return ser << cc.m_mintette_key << cc.m_addr_id << cc.m_signature
                   << cc.m_head << cc.m_period;
    }

    auto operator>>(serializer& deser, ledger::check_confirmation& cc)
        -> serializer& {
        return deser >> cc.m_mintette_key >> cc.m_addr_id >> cc.m_signature
            >> cc.m_head >> cc.m_period;
    }

    auto operator<<(serializer& ser, const ledger::commit_acknowledgment& ack)
        -> serializer& {
        return ser << ack.m_mintette_key << ack.m_signature << ack.m_head;
    }

    auto operator>>(serializer& deser, ledger::commit_acknowledgment& ack)
        -> serializer& {
        return deser >> ack.m_mintette_key >> ack.m_signature >> ack.m_head;
    }

    auto operator<<(serializer& ser, const ledger::query_entry& e)
        -> serializer& {
        return ser << e.m_tx;
    }

    auto operator>>(serializer& deser, ledger::query_entry& e)
        -> serializer& {
        return deser >> e.m_tx;
    }

    auto operator<<(serializer& ser, const ledger::commit_entry& e)
        -> serializer& {
        return ser << e.m_tx << e.m_confirmations;
    }

    auto operator>>(serializer& deser, ledger::commit_entry& e)
        -> serializer& {
        return deser >> e.m_tx >> e.m_confirmations;
    }

    auto operator<<(serializer& ser, const ledger::close_epoch_entry& e)
        -> serializer& {
        return ser << e.m_block_hash;
    }

    auto operator>>(serializer& deser, ledger::close_epoch_entry& e)
        -> serializer& {
        return deser >> e.m_block_hash;
    }

    auto operator<<(serializer& ser, const ledger::lblock& blk)
        -> serializer& {
        return ser << blk.m_hash << blk.m_transactions << blk.m_signature
                   << blk.m_head_hash;
    }

    auto operator>>(serializer& deser, ledger::lblock& blk) -> serializer& {
        return deser >> blk.m_hash >> blk.m_transactions >> blk.m_signature
            >> blk.m_head_hash;
    }

    auto operator<<(serializer& ser, const ledger::period_result& res)
        -> serializer& {
        return ser << res.m_period << res.m_blocks << res.m_log;
    }

    auto operator>>(serializer& deser, ledger::period_result& res)
        -> serializer& {
        return deser >> res.m_period >> res.m_blocks >> res.m_log;
    }

    auto operator<<(serializer& ser, const ledger::new_period_data& npd)
        -> serializer& {
        return ser << npd.m_period << npd.m_mintettes << npd.m_last_hblock
                   << npd.m_dpk;
    }

    auto operator>>(serializer& deser, ledger::new_period_data& npd)
        -> serializer& {
        return deser >> npd.m_period >> npd.m_mintettes >> npd.m_last_hblock
            >> npd.m_dpk;
    }

    auto operator<<(serializer& ser, const ledger::add_mintette& c)
        -> serializer& {
        return ser << c.m_mintette << c.m_key;
    }

    auto operator>>(serializer& deser, ledger::add_mintette& c)
        -> serializer& {
        return deser >> c.m_mintette >> c.m_key;
    }

    auto operator<<(serializer& ser, const ledger::remove_mintette& c)
        -> serializer& {
        return ser << c.m_host << c.m_port;
    }

    auto operator>>(serializer& deser, ledger::remove_mintette& c)
        -> serializer& {
        return deser >> c.m_host >> c.m_port;
    }

    auto operator<<(serializer& ser, const ledger::add_explorer& c)
        -> serializer& {
        return ser << c.m_explorer << c.m_period;
    }

    auto operator>>(serializer& deser, ledger::add_explorer& c)
        -> serializer& {
        return deser >> c.m_explorer >> c.m_period;
    }

    auto operator<<(serializer& ser, const ledger::remove_explorer& c)
        -> serializer& {
        return ser << c.m_host << c.m_port;
    }

    auto operator>>(serializer& deser, ledger::remove_explorer& c)
        -> serializer& {
        return deser >> c.m_host >> c.m_port;
    }
}
