// Copyright (c) 2021 MIT Digital Currency Initiative,
//                    Federal Reserve Bank of Boston
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#ifndef MINTNET_SRC_NETWORK_ENDPOINT_H_
#define MINTNET_SRC_NETWORK_ENDPOINT_H_

#include <string>
#include <utility>

namespace mintnet::network {
    /// An IP address or host name.
    using ip_address = std::string;
    /// Port number.
    using port_number_t = unsigned short;
    /// [host name, port number].
    using endpoint_t = std::pair<ip_address, port_number_t>;

    /// IP address for localhost.
    static const auto localhost = ip_address("127.0.0.1");
}

#endif // MINTNET_SRC_NETWORK_ENDPOINT_H_
