// Copyright (c) 2021 MIT Digital Currency Initiative,
//                    Federal Reserve Bank of Boston
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#ifndef MINTNET_SRC_COMM_TRANSPORT_POOL_H_
#define MINTNET_SRC_COMM_TRANSPORT_POOL_H_

#include "call.hpp"
#include "util/network/endpoint.hpp"
#include "util/rpc/tcp_client.hpp"

#include <functional>
#include <map>
#include <memory>
#include <mutex>

namespace mintnet::comm {
    /// Transports to a changing set of nodes of one role, keyed by
    /// endpoint. A transport is created on first use and kept for later
    /// calls to the same endpoint.
    /// \tparam Request request type of the role.
    template<typename Request>
    class transport_pool {
      public:
        /// Creates a transport connected to the given endpoint.
        using factory_type = std::function<std::unique_ptr<transport<Request>>(
            const network::endpoint_t&)>;

        /// Constructor.
        /// \param factory creates the transport for each endpoint.
        explicit transport_pool(factory_type factory)
            : m_factory(std::move(factory)) {}

        /// Constructor. Connects to nodes over TCP.
        transport_pool()
            : transport_pool([](const network::endpoint_t& ep)
                                 -> std::unique_ptr<transport<Request>> {
                  return std::make_unique<rpc::tcp_client<Request, buffer>>(
                      ep);
              }) {}

        /// Returns the transport to the given endpoint, creating it if
        /// needed. The reference stays valid for the pool's lifetime.
        auto get(const network::endpoint_t& ep) -> transport<Request>& {
            std::unique_lock<std::mutex> l(m_mut);
            auto it = m_transports.find(ep);
            if(it == m_transports.end()) {
                it = m_transports.emplace(ep, m_factory(ep)).first;
            }
            return *it->second;
        }

      private:
        factory_type m_factory;
        std::mutex m_mut;
        std::map<network::endpoint_t, std::unique_ptr<transport<Request>>>
            m_transports;
    };
}

#endif // MINTNET_SRC_COMM_TRANSPORT_POOL_H_
