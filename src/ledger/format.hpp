// Copyright (c) 2021 MIT Digital Currency Initiative,
//                    Federal Reserve Bank of Boston
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#ifndef MINTNET_SRC_LEDGER_FORMAT_H_
#define MINTNET_SRC_LEDGER_FORMAT_H_

#include "primitives.hpp"
#include "strategy.hpp"
#include "types.hpp"
#include "util/serialization/format.hpp"

namespace mintnet {
    auto operator<<(serializer& ser, const ledger::address& addr)
        -> serializer&;
    auto operator>>(serializer& deser, ledger::address& addr) -> serializer&;

    auto operator<<(serializer& ser, const ledger::coin& c) -> serializer&;
    auto operator>>(serializer& deser, ledger::coin& c) -> serializer&;

    auto operator<<(serializer& ser, const ledger::addr_id& id) -> serializer&;
    auto operator>>(serializer& deser, ledger::addr_id& id) -> serializer&;

    auto operator<<(serializer& ser, const ledger::transaction& tx)
        -> serializer&;
    auto operator>>(serializer& deser, ledger::transaction& tx)
        -> serializer&;

    auto operator<<(serializer& ser, const strategy::m_of_n_strategy& s)
        -> serializer&;
    auto operator>>(serializer& deser, strategy::m_of_n_strategy& s)
        -> serializer&;

    auto operator<<(serializer& ser, const strategy::trust_alloc& a)
        -> serializer&;
    auto operator>>(serializer& deser, strategy::trust_alloc& a)
        -> serializer&;

    auto operator<<(serializer& ser, const strategy::user_alloc& a)
        -> serializer&;
    auto operator>>(serializer& deser, strategy::user_alloc& a)
        -> serializer&;

    auto operator<<(serializer& ser, const strategy::trust_party& p)
        -> serializer&;
    auto operator>>(serializer& deser, strategy::trust_party& p)
        -> serializer&;

    auto operator<<(serializer& ser, const strategy::user_party& p)
        -> serializer&;
    auto operator>>(serializer& deser, strategy::user_party& p)
        -> serializer&;

    auto operator<<(serializer& ser, const strategy::allocation_strategy& s)
        -> serializer&;
    auto operator>>(serializer& deser, strategy::allocation_strategy& s)
        -> serializer&;

    auto operator<<(serializer& ser, const strategy::allocation_info& info)
        -> serializer&;
    auto operator>>(serializer& deser, strategy::allocation_info& info)
        -> serializer&;

    auto operator<<(serializer& ser, const ledger::mintette& m) -> serializer&;
    auto operator>>(serializer& deser, ledger::mintette& m) -> serializer&;

    auto operator<<(serializer& ser, const ledger::explorer& e) -> serializer&;
    auto operator>>(serializer& deser, ledger::explorer& e) -> serializer&;

    auto operator<<(serializer& ser, const ledger::hblock& blk)
        -> serializer&;
    auto operator>>(serializer& deser, ledger::hblock& blk) -> serializer&;

    auto operator<<(serializer& ser, const ledger::hblock_metadata& meta)
        -> serializer&;
    auto operator>>(serializer& deser, ledger::hblock_metadata& meta)
        -> serializer&;

    template<typename T, typename M>
    auto operator<<(serializer& ser, const ledger::with_metadata<T, M>& wm)
        -> serializer& {
        return ser << wm.m_value << wm.m_metadata;
    }

    template<typename T, typename M>
    auto operator>>(serializer& deser, ledger::with_metadata<T, M>& wm)
        -> serializer& {
        return deser >> wm.m_value >> wm.m_metadata;
    }

    auto operator<<(serializer& ser, const ledger::check_confirmation& cc)
        -> serializer&;
    auto operator>>(serializer& deser, ledger::check_confirmation& cc)
        -> serializer&;

    auto operator<<(serializer& ser, const ledger::commit_acknowledgment& ack)
        -> serializer&;
    auto operator>>(serializer& deser, ledger::commit_acknowledgment& ack)
        -> serializer&;

    auto operator<<(serializer& ser, const ledger::query_entry& e)
        -> serializer&;
    auto operator>>(serializer& deser, ledger::query_entry& e)
        -> serializer&;

    auto operator<<(serializer& ser, const ledger::commit_entry& e)
        -> serializer&;
    auto operator>>(serializer& deser, ledger::commit_entry& e)
        -> serializer&;

    auto operator<<(serializer& ser, const ledger::close_epoch_entry& e)
        -> serializer&;
    auto operator>>(serializer& deser, ledger::close_epoch_entry& e)
        -> serializer&;

    auto operator<<(serializer& ser, const ledger::lblock& blk)
        -> serializer&;
    auto operator>>(serializer& deser, ledger::lblock& blk) -> serializer&;

    auto operator<<(serializer& ser, const ledger::period_result& res)
        -> serializer&;
    auto operator>>(serializer& deser, ledger::period_result& res)
        -> serializer&;

    auto operator<<(serializer& ser, const ledger::new_period_data& npd)
        -> serializer&;
    auto operator>>(serializer& deser, ledger::new_period_data& npd)
        -> serializer&;

    auto operator<<(serializer& ser, const ledger::add_mintette& c)
        -> serializer&;
    auto operator>>(serializer& deser, ledger::add_mintette& c)
        -> serializer&;

    auto operator<<(serializer& ser, const ledger::remove_mintette& c)
        -> serializer&;
    auto operator>>(serializer& deser, ledger::remove_mintette& c)
        -> serializer&;

    auto operator<<(serializer& ser, const ledger::add_explorer& c)
        -> serializer&;
    auto operator>>(serializer& deser, ledger::add_explorer& c)
        -> serializer&;

    auto operator<<(serializer& ser, const ledger::remove_explorer& c)
        -> serializer&;
    auto operator>>(serializer& deser, ledger::remove_explorer& c)
        -> serializer&;
}

#endif // MINTNET_SRC_LEDGER_FORMAT_H_
