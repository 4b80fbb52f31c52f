// Copyright (c) 2021 MIT Digital Currency Initiative,
//                    Federal Reserve Bank of Boston
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#include "strategy.hpp"

#include "util/common/variant_overloaded.hpp"

#include <algorithm>
#include <sstream>

namespace mintnet::strategy {
    namespace {
        auto has_valid_signature(const ledger::address& addr,
                                 const std::vector<ledger::signed_by>& sigs,
                                 const ledger::transaction& tx) -> bool {
            return std::any_of(sigs.begin(),
                               sigs.end(),
                               [&](const ledger::signed_by& s) {
                                   return s.first == addr
                                       && ledger::validate_signature(s.second,
                                                                     addr,
                                                                     tx);
                               });
        }

        template<typename Container>
        auto join(const Container& items) -> std::string {
            std::stringstream ss;
            ss << "[";
            auto first = true;
            for(const auto& item : items) {
                ss << (first ? "" : ", ") << ledger::to_string(item);
                first = false;
            }
            ss << "]";
            return ss.str();
        }
    }

    auto default_strategy::operator==(const default_strategy& /* rhs */) const
        -> bool {
        return true;
    }

    auto m_of_n_strategy::operator==(const m_of_n_strategy& rhs) const
        -> bool {
        return m_required == rhs.m_required && m_parties == rhs.m_parties;
    }

    auto trust_alloc::operator==(const trust_alloc& rhs) const -> bool {
        return m_address == rhs.m_address;
    }

    auto trust_alloc::operator<(const trust_alloc& rhs) const -> bool {
        return m_address < rhs.m_address;
    }

    auto user_alloc::operator==(const user_alloc& rhs) const -> bool {
        return m_address == rhs.m_address;
    }

    auto user_alloc::operator<(const user_alloc& rhs) const -> bool {
        return m_address < rhs.m_address;
    }

    auto trust_party::operator==(const trust_party& rhs) const -> bool {
        return m_party_address == rhs.m_party_address
            && m_hot_trust_key == rhs.m_hot_trust_key;
    }

    auto user_party::operator==(const user_party& rhs) const -> bool {
        return m_party_address == rhs.m_party_address;
    }

    auto allocation_strategy::operator==(const allocation_strategy& rhs) const
        -> bool {
        return m_sig_number == rhs.m_sig_number
            && m_all_parties == rhs.m_all_parties;
    }

    auto allocation_info::operator==(const allocation_info& rhs) const
        -> bool {
        return m_strategy == rhs.m_strategy
            && m_current_confirmations == rhs.m_current_confirmations;
    }

    auto address_of(const allocation_address& alloc)
        -> const ledger::address& {
        return std::visit(
            [](const auto& a) -> const ledger::address& {
                return a.m_address;
            },
            alloc);
    }

    auto party_address_of(const party_address& party)
        -> const ledger::address& {
        return std::visit(
            [](const auto& p) -> const ledger::address& {
                return p.m_party_address;
            },
            party);
    }

    auto allocate_tx_from_alloc(const allocation_strategy& alloc)
        -> tx_strategy {
        auto ret = m_of_n_strategy{alloc.m_sig_number, {}};
        for(const auto& party : alloc.m_all_parties) {
            ret.m_parties.insert(address_of(party));
        }
        return ret;
    }

    auto party_to_allocation(const party_address& party)
        -> allocation_address {
        return std::visit(overloaded{[](const trust_party& p)
                                         -> allocation_address {
                                         return trust_alloc{p.m_party_address};
                                     },
                                     [](const user_party& p)
                                         -> allocation_address {
                                         return user_alloc{p.m_party_address};
                                     }},
                          party);
    }

    auto is_strategy_completed(const tx_strategy& strategy,
                               const ledger::address& owner,
                               const std::vector<ledger::signed_by>& sigs,
                               const ledger::transaction& tx) -> bool {
        return std::visit(
            overloaded{[&](const default_strategy& /* s */) {
                           return has_valid_signature(owner, sigs, tx);
                       },
                       [&](const m_of_n_strategy& s) {
                           uint64_t signed_count = 0;
                           for(const auto& party : s.m_parties) {
                               if(has_valid_signature(party, sigs, tx)) {
                                   signed_count++;
                               }
                           }
                           return signed_count >= s.m_required;
                       }},
            strategy);
    }

    auto check_tx_strategy(const tx_strategy& strategy)
        -> std::optional<std::string> {
        return std::visit(
            overloaded{[](const default_strategy& /* s */)
                           -> std::optional<std::string> {
                           return std::nullopt;
                       },
                       [](const m_of_n_strategy& s)
                           -> std::optional<std::string> {
                           if(s.m_required == 0) {
                               return "m-of-n strategy requires at least one "
                                      "signature";
                           }
                           if(s.m_required > s.m_parties.size()) {
                               return "m-of-n strategy requires "
                                    + std::to_string(s.m_required)
                                    + " signatures but has only "
                                    + std::to_string(s.m_parties.size())
                                    + " parties";
                           }
                           return std::nullopt;
                       }},
            strategy);
    }

    auto check_allocation_strategy(const allocation_strategy& alloc)
        -> std::optional<std::string> {
        // Validate the strategy the allocation would produce, so trust and
        // user parties sharing an address are counted once.
        return check_tx_strategy(allocate_tx_from_alloc(alloc));
    }

    auto to_string(const tx_strategy& strategy) -> std::string {
        return std::visit(
            overloaded{[](const default_strategy& /* s */) -> std::string {
                           return "DefaultStrategy";
                       },
                       [](const m_of_n_strategy& s) -> std::string {
                           std::stringstream ss;
                           ss << "TxStrategy {m: " << s.m_required
                              << ", addresses: " << join(s.m_parties) << "}";
                           return ss.str();
                       }},
            strategy);
    }

    auto to_string(const allocation_address& alloc) -> std::string {
        return std::visit(
            overloaded{[](const trust_alloc& a) -> std::string {
                           return "TrustA : " + ledger::to_string(a.m_address);
                       },
                       [](const user_alloc& a) -> std::string {
                           return "UserA : " + ledger::to_string(a.m_address);
                       }},
            alloc);
    }

    auto to_string(const party_address& party) -> std::string {
        return std::visit(
            overloaded{[](const trust_party& p) -> std::string {
                           return "TrustP : party = "
                                + ledger::to_string(p.m_party_address)
                                + ", master = "
                                + to_hex(p.m_hot_trust_key.data(),
                                         p.m_hot_trust_key.size());
                       },
                       [](const user_party& p) -> std::string {
                           return "UserP  : "
                                + ledger::to_string(p.m_party_address);
                       }},
            party);
    }

    auto to_string(const allocation_strategy& alloc) -> std::string {
        std::stringstream ss;
        ss << "AllocationStrategy {sigNumber: " << alloc.m_sig_number
           << ", allParties: [";
        auto first = true;
        for(const auto& party : alloc.m_all_parties) {
            ss << (first ? "" : ", ") << to_string(party);
            first = false;
        }
        ss << "]}";
        return ss.str();
    }

    auto to_string(const allocation_info& info) -> std::string {
        std::stringstream ss;
        ss << "AllocationInfo {allocationStrategy: "
           << to_string(info.m_strategy) << ", currentConfirmations: [";
        auto first = true;
        for(const auto& [party, addr] : info.m_current_confirmations) {
            ss << (first ? "" : ", ") << to_string(party) << " -> "
               << ledger::to_string(addr);
            first = false;
        }
        ss << "]}";
        return ss.str();
    }
}
