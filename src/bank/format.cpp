// Copyright (c) 2021 MIT Digital Currency Initiative,
//                    Federal Reserve Bank of Boston
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#include "format.hpp"

namespace mintnet {
    auto operator<<(serializer& ser, const bank::control_request& req)
        -> serializer& {
        return ser << req.m_command;
    }

    auto operator>>(serializer& deser, bank::control_request& req)
        -> serializer& {
        return deser >> req.m_command;
    }

    auto operator<<(serializer& ser, const bank::get_hblocks_request& req)
        -> serializer& {
        return ser << req.m_heights;
    }

    auto operator>>(serializer& deser, bank::get_hblocks_request& req)
        -> serializer& {
        return deser >> req.m_heights;
    }
}
