// Copyright (c) 2021 MIT Digital Currency Initiative,
//                    Federal Reserve Bank of Boston
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#ifndef MINTNET_SRC_COMMON_VARIANT_OVERLOADED_H_
#define MINTNET_SRC_COMMON_VARIANT_OVERLOADED_H_

#include <array>
#include <cstddef>
#include <optional>
#include <utility>
#include <variant>

namespace mintnet {
    /// \brief Variant handler template
    ///
    /// Provides template structure for defining handlers for std::variant
    /// types in an std::visit function.
    ///
    /// Example:
    /// \code{.cpp}
    ///      std::variant<A, B> somevar = ...;
    ///      std::visit(overloaded{
    ///                     [&](const A&) {...},
    ///                     [&](const B&) {...}
    ///                 },
    ///                 somevar);
    /// \endcode
    ///
    /// \tparam Ts lambda overloads
    template<class... Ts>
    struct overloaded : Ts... {
        using Ts::operator()...;
    };

    template<class... Ts>
    overloaded(Ts...) -> overloaded<Ts...>;

    namespace detail {
        template<typename V, size_t... Is>
        auto expand_type_impl(size_t i, std::index_sequence<Is...> /* idx */)
            -> std::optional<V> {
            if(i >= sizeof...(Is)) {
                return std::nullopt;
            }
            static constexpr auto t = std::array{+[]() {
                return V{std::in_place_index<Is>};
            }...};
            return t[i]();
        }
    }

    /// \brief Default-constructs a std::variant from a template parameter pack
    ///
    /// Used when deserializing a variant from its alternative index. Works
    /// for variants that repeat an alternative type.
    ///
    /// \tparam Ts the template parameter pack containing the variant's
    ///         alternative types
    /// \param i the index of the alternative type for the variant to hold
    /// \return the default-constructed variant, or std::nullopt if the index
    ///         does not name an alternative.
    template<typename... Ts>
    [[nodiscard]] auto expand_type(size_t i)
        -> std::optional<std::variant<Ts...>> {
        static_assert((std::is_default_constructible_v<Ts> && ...));
        return detail::expand_type_impl<std::variant<Ts...>>(
            i,
            std::index_sequence_for<Ts...>{});
    }
}

#endif // MINTNET_SRC_COMMON_VARIANT_OVERLOADED_H_
