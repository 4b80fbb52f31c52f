// Copyright (c) 2021 MIT Digital Currency Initiative,
//                    Federal Reserve Bank of Boston
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#include "format.hpp"

namespace mintnet {
    auto operator<<(serializer& ser,
                    const mintette::announce_new_period_request& req)
        -> serializer& {
        return ser << req.m_data;
    }

    auto operator>>(serializer& deser,
                    mintette::announce_new_period_request& req)
        -> serializer& {
        return deser >> req.m_data;
    }

    auto operator<<(serializer& ser, const mintette::check_tx_request& req)
        -> serializer& {
        return ser << req.m_tx << req.m_input << req.m_signatures;
    }

    auto operator>>(serializer& deser, mintette::check_tx_request& req)
        -> serializer& {
        return deser >> req.m_tx >> req.m_input >> req.m_signatures;
    }

    auto operator<<(serializer& ser,
                    const mintette::check_tx_batch_request& req)
        -> serializer& {
        return ser << req.m_tx << req.m_signatures;
    }

    auto operator>>(serializer& deser, mintette::check_tx_batch_request& req)
        -> serializer& {
        return deser >> req.m_tx >> req.m_signatures;
    }

    auto operator<<(serializer& ser, const mintette::commit_tx_request& req)
        -> serializer& {
        return ser << req.m_tx << req.m_confirmations;
    }

    auto operator>>(serializer& deser, mintette::commit_tx_request& req)
        -> serializer& {
        return deser >> req.m_tx >> req.m_confirmations;
    }

    auto operator<<(serializer& ser,
                    const mintette::period_finished_request& req)
        -> serializer& {
        return ser << req.m_period;
    }

    auto operator>>(serializer& deser, mintette::period_finished_request& req)
        -> serializer& {
        return deser >> req.m_period;
    }

    auto operator<<(serializer& ser, const mintette::get_logs_request& req)
        -> serializer& {
        return ser << req.m_period;
    }

    auto operator>>(serializer& deser, mintette::get_logs_request& req)
        -> serializer& {
        return deser >> req.m_period;
    }
}
