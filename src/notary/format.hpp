// Copyright (c) 2021 MIT Digital Currency Initiative,
//                    Federal Reserve Bank of Boston
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#ifndef MINTNET_SRC_NOTARY_FORMAT_H_
#define MINTNET_SRC_NOTARY_FORMAT_H_

#include "ledger/format.hpp"
#include "messages.hpp"

namespace mintnet {
    auto operator<<(serializer& ser,
                    const notary::allocate_multisig_request& req)
        -> serializer&;
    auto operator>>(serializer& deser, notary::allocate_multisig_request& req)
        -> serializer&;

    auto operator<<(serializer& ser,
                    const notary::announce_new_periods_request& req)
        -> serializer&;
    auto operator>>(serializer& deser,
                    notary::announce_new_periods_request& req)
        -> serializer&;

    auto operator<<(serializer& ser, const notary::get_signatures_request& req)
        -> serializer&;
    auto operator>>(serializer& deser, notary::get_signatures_request& req)
        -> serializer&;

    auto operator<<(serializer& ser, const notary::poll_pending_request& req)
        -> serializer&;
    auto operator>>(serializer& deser, notary::poll_pending_request& req)
        -> serializer&;

    auto operator<<(serializer& ser, const notary::publish_tx_request& req)
        -> serializer&;
    auto operator>>(serializer& deser, notary::publish_tx_request& req)
        -> serializer&;

    auto operator<<(serializer& ser,
                    const notary::query_my_allocations_request& req)
        -> serializer&;
    auto operator>>(serializer& deser,
                    notary::query_my_allocations_request& req)
        -> serializer&;

    auto operator<<(serializer& ser,
                    const notary::remove_complete_ms_request& req)
        -> serializer&;
    auto operator>>(serializer& deser,
                    notary::remove_complete_ms_request& req)
        -> serializer&;
}

#endif // MINTNET_SRC_NOTARY_FORMAT_H_
