// Copyright (c) 2021 MIT Digital Currency Initiative,
//                    Federal Reserve Bank of Boston
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#include "format.hpp"

namespace mintnet {
    auto operator<<(serializer& ser,
                    const notary::allocate_multisig_request& req)
        -> serializer& {
        return ser << req.m_ms_address << req.m_party << req.m_strategy
                   << req.m_signature << req.m_master_check;
    }

    auto operator>>(serializer& deser, notary::allocate_multisig_request& req)
        -> serializer& {
        return deser >> req.m_ms_address >> req.m_party >> req.m_strategy
            >> req.m_signature >> req.m_master_check;
    }

    auto operator<<(serializer& ser,
                    const notary::announce_new_periods_request& req)
        -> serializer& {
        return ser << req.m_blocks;
    }

    auto operator>>(serializer& deser,
                    notary::announce_new_periods_request& req)
        -> serializer& {
        return deser >> req.m_blocks;
    }

    auto operator<<(serializer& ser, const notary::get_signatures_request& req)
        -> serializer& {
        return ser << req.m_tx << req.m_address;
    }

    auto operator>>(serializer& deser, notary::get_signatures_request& req)
        -> serializer& {
        return deser >> req.m_tx >> req.m_address;
    }

    auto operator<<(serializer& ser, const notary::poll_pending_request& req)
        -> serializer& {
        return ser << req.m_addresses;
    }

    auto operator>>(serializer& deser, notary::poll_pending_request& req)
        -> serializer& {
        return deser >> req.m_addresses;
    }

    auto operator<<(serializer& ser, const notary::publish_tx_request& req)
        -> serializer& {
        return ser << req.m_tx << req.m_address << req.m_signature;
    }

    auto operator>>(serializer& deser, notary::publish_tx_request& req)
        -> serializer& {
        return deser >> req.m_tx >> req.m_address >> req.m_signature;
    }

    auto operator<<(serializer& ser,
                    const notary::query_my_allocations_request& req)
        -> serializer& {
        return ser << req.m_party;
    }

    auto operator>>(serializer& deser,
                    notary::query_my_allocations_request& req)
        -> serializer& {
        return deser >> req.m_party;
    }

    auto operator<<(serializer& ser,
                    const notary::remove_complete_ms_request& req)
        -> serializer& {
        return ser << req.m_addresses << req.m_signature;
    }

    auto operator>>(serializer& deser,
                    notary::remove_complete_ms_request& req)
        -> serializer& {
        return deser >> req.m_addresses >> req.m_signature;
    }
}
