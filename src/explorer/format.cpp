// Copyright (c) 2021 MIT Digital Currency Initiative,
//                    Federal Reserve Bank of Boston
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#include "format.hpp"

namespace mintnet {
    auto operator<<(serializer& ser, const explorer::new_block_request& req)
        -> serializer& {
        return ser << req.m_block;
    }

    auto operator>>(serializer& deser, explorer::new_block_request& req)
        -> serializer& {
        return deser >> req.m_block;
    }

    auto operator<<(serializer& ser,
                    const explorer::get_transaction_request& req)
        -> serializer& {
        return ser << req.m_tx_id;
    }

    auto operator>>(serializer& deser, explorer::get_transaction_request& req)
        -> serializer& {
        return deser >> req.m_tx_id;
    }
}
