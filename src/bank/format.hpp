// Copyright (c) 2021 MIT Digital Currency Initiative,
//                    Federal Reserve Bank of Boston
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#ifndef MINTNET_SRC_BANK_FORMAT_H_
#define MINTNET_SRC_BANK_FORMAT_H_

#include "ledger/format.hpp"
#include "messages.hpp"

namespace mintnet {
    auto operator<<(serializer& ser, const bank::control_request& req)
        -> serializer&;
    auto operator>>(serializer& deser, bank::control_request& req)
        -> serializer&;

    auto operator<<(serializer& ser, const bank::get_hblocks_request& req)
        -> serializer&;
    auto operator>>(serializer& deser, bank::get_hblocks_request& req)
        -> serializer&;
}

#endif // MINTNET_SRC_BANK_FORMAT_H_
