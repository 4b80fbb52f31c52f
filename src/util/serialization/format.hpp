// Copyright (c) 2021 MIT Digital Currency Initiative,
//                    Federal Reserve Bank of Boston
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#ifndef MINTNET_SRC_SERIALIZATION_FORMAT_H_
#define MINTNET_SRC_SERIALIZATION_FORMAT_H_

#include "serializer.hpp"
#include "util/common/buffer.hpp"
#include "util/common/config.hpp"
#include "util/common/variant_overloaded.hpp"

#include <algorithm>
#include <array>
#include <cstdint>
#include <limits>
#include <map>
#include <optional>
#include <set>
#include <string>
#include <variant>
#include <vector>

namespace mintnet {
    /// Serializes the std::byte as a std::uint8_t.
    auto operator<<(serializer& packet, std::byte b) -> serializer&;

    /// \brief Deserializes a single std::byte.
    ///
    /// Copies a single byte (`CHAR_BIT` bits) of data into `b`.
    ///
    /// \see \ref mintnet::operator<<(serializer&, std::byte)
    auto operator>>(serializer& packet, std::byte& b) -> serializer&;

    /// \brief Serializes a raw byte buffer.
    ///
    /// Writes the size of the buffer as a 64-bit uint, followed by the actual
    /// buffer data.
    auto operator<<(serializer& ser, const buffer& b) -> serializer&;

    /// \brief Deserializes a raw byte buffer.
    /// \see \ref mintnet::operator<<(serializer&, const buffer&)
    auto operator>>(serializer& deser, buffer& b) -> serializer&;

    /// \brief Serializes a string.
    ///
    /// Writes the length as a 64-bit uint, followed by the characters with
    /// no terminator.
    auto operator<<(serializer& ser, const std::string& s) -> serializer&;

    /// \brief Deserializes a string.
    /// \see \ref mintnet::operator<<(serializer&, const std::string&)
    auto operator>>(serializer& deser, std::string& s) -> serializer&;

    /// Serializes nothing if `T` is an empty type.
    /// \tparam T an empty type
    /// \param s the serializer (to which nothing will be written)
    template<typename T>
    auto operator<<(serializer& s, T /* t */) ->
        typename std::enable_if_t<std::is_empty_v<T>, serializer&> {
        return s;
    }

    /// Deserializes nothing if `T` is an empty type.
    /// \see \ref mintnet::operator<<(serializer&, T)
    template<typename T>
    auto operator>>(serializer& s, T& /* t */) ->
        typename std::enable_if_t<std::is_empty_v<T>, serializer&> {
        return s;
    }

    /// \brief Serializes the integral argument.
    ///
    /// Copies `sizeof(T)` bytes from `t` following machine endianness.
    ///
    /// \tparam T the integral type of the value to serialize
    /// \param t the value to serialize
    template<typename T>
    auto operator<<(serializer& s, T t) ->
        typename std::enable_if_t<std::is_integral_v<T> && !std::is_enum_v<T>,
                                  serializer&> {
        s.write(&t, sizeof(t));
        return s;
    }

    /// \brief Deserializes the integral argument.
    ///
    /// Writes `sizeof(T)` bytes into `t` following machine endianness.
    ///
    /// \see \ref mintnet::operator<<(serializer&, T)
    template<typename T>
    auto operator>>(serializer& s, T& t) ->
        typename std::enable_if_t<std::is_integral_v<T> && !std::is_enum_v<T>,
                                  serializer&> {
        s.read(&t, sizeof(t));
        return s;
    }

    /// Serializes an enum via its underlying type.
    template<typename T>
    auto operator<<(serializer& ser, T e) ->
        typename std::enable_if_t<std::is_enum_v<T>, serializer&> {
        return ser << static_cast<std::underlying_type_t<T>>(e);
    }

    /// Deserializes an enum.
    template<typename T>
    auto operator>>(serializer& deser, T& e) ->
        typename std::enable_if_t<std::is_enum_v<T>, serializer&> {
        std::underlying_type_t<T> val{};
        if(deser >> val) {
            e = static_cast<T>(val);
        }
        return deser;
    }

    /// Serializes the array of integral values in-order.
    ///
    /// \see \ref mintnet::operator<<(serializer&, T)
    ///
    /// \tparam T the underlying integral type
    /// \tparam len the length of the array to be serialized
    /// \param packet the serializer to receive the data
    /// \param arr the array of data to be serialized
    template<typename T, size_t len>
    auto operator<<(serializer& packet, const std::array<T, len>& arr) ->
        typename std::enable_if_t<std::is_integral_v<T>, serializer&> {
        packet.write(arr.data(), sizeof(T) * len);
        return packet;
    }

    /// Deserializes the array of integral values in-order.
    /// \see \ref mintnet::operator<<(serializer&, const std::array<T, len>&)
    template<typename T, size_t len>
    auto operator>>(serializer& packet, std::array<T, len>& arr) ->
        typename std::enable_if_t<std::is_integral_v<T>, serializer&> {
        packet.read(arr.data(), sizeof(T) * len);
        return packet;
    }

    // Container overloads call each other recursively (a vector of pairs of
    // maps), so all of them are declared before any is defined.
    template<typename T>
    auto operator<<(serializer& ser, const std::optional<T>& val)
        -> serializer&;
    template<typename T>
    auto operator>>(serializer& deser, std::optional<T>& val) -> serializer&;
    template<typename A, typename B>
    auto operator<<(serializer& ser, const std::pair<A, B>& p) -> serializer&;
    template<typename A, typename B>
    auto operator>>(serializer& deser, std::pair<A, B>& p) -> serializer&;
    template<typename T>
    auto operator<<(serializer& packet, const std::vector<T>& vec)
        -> serializer&;
    template<typename T>
    auto operator>>(serializer& packet, std::vector<T>& vec) -> serializer&;
    template<typename K, typename V, typename... Ts>
    auto operator<<(serializer& ser, const std::map<K, V, Ts...>& map)
        -> serializer&;
    template<typename K, typename V, typename... Ts>
    auto operator>>(serializer& deser, std::map<K, V, Ts...>& map)
        -> serializer&;
    template<typename K, typename... Ts>
    auto operator<<(serializer& ser, const std::set<K, Ts...>& set)
        -> serializer&;
    template<typename K, typename... Ts>
    auto operator>>(serializer& deser, std::set<K, Ts...>& set)
        -> serializer&;
    template<typename... Ts>
    auto operator<<(serializer& ser, const std::variant<Ts...>& var)
        -> serializer&;
    template<typename... Ts>
    auto operator>>(serializer& deser, std::variant<Ts...>& var)
        -> serializer&;

    /// Serializes `val.has_value()`, and if `val.has_value() == true`,
    /// serializes the value itself.
    template<typename T>
    auto operator<<(serializer& ser, const std::optional<T>& val)
        -> serializer& {
        auto has_value = val.has_value();
        ser << has_value;
        if(has_value) {
            ser << *val;
        }
        return ser;
    }

    /// Deserializes an optional value.
    /// \see \ref mintnet::operator<<(serializer&, const std::optional<T>&)
    template<typename T>
    auto operator>>(serializer& deser, std::optional<T>& val) -> serializer& {
        bool has_value{};
        if(!(deser >> has_value)) {
            return deser;
        }
        if(has_value) {
            auto opt_val = T();
            if(!(deser >> opt_val)) {
                return deser;
            }
            val = std::move(opt_val);
        } else {
            val = std::nullopt;
        }
        return deser;
    }

    /// Serializes a pair of values: first, then second.
    template<typename A, typename B>
    auto operator<<(serializer& ser, const std::pair<A, B>& p) -> serializer& {
        ser << p.first << p.second;
        return ser;
    }

    /// Deserializes a pair of values.
    /// \see \ref mintnet::operator<<(serializer&, const std::pair<A,B>&)
    template<typename A, typename B>
    auto operator>>(serializer& deser, std::pair<A, B>& p) -> serializer& {
        auto a = A();
        if(!(deser >> a)) {
            return deser;
        }
        auto b = B();
        if(!(deser >> b)) {
            return deser;
        }
        p = {std::move(a), std::move(b)};
        return deser;
    }

    /// Serializes the count of elements in the vector, and then each element
    /// in-order.
    template<typename T>
    auto operator<<(serializer& packet, const std::vector<T>& vec)
        -> serializer& {
        const auto len = static_cast<uint64_t>(vec.size());
        packet << len;
        for(const auto& elem : vec) {
            packet << elem;
        }
        return packet;
    }

    /// Deserializes a vector of elements. Reserves memory in bounded steps
    /// so that a forged length cannot force a large allocation.
    /// \see \ref mintnet::operator<<(serializer&, const std::vector<T>&)
    template<typename T>
    auto operator>>(serializer& packet, std::vector<T>& vec) -> serializer& {
        static_assert(sizeof(T) <= config::maximum_reservation,
                      "Vector element size too large");
        uint64_t len{};
        if(!(packet >> len)) {
            return packet;
        }

        vec.clear();
        uint64_t allocated = 0;
        while(allocated < len) {
            allocated = std::min(
                len,
                allocated + config::maximum_reservation / sizeof(T));
            vec.reserve(allocated);
            while(vec.size() < allocated) {
                T val{};
                if(!(packet >> val)) {
                    return packet;
                }
                vec.push_back(std::move(val));
            }
        }

        return packet;
    }

    /// Serializes the count of key-value pairs, and then each key and value
    /// in key order.
    template<typename K, typename V, typename... Ts>
    auto operator<<(serializer& ser, const std::map<K, V, Ts...>& map)
        -> serializer& {
        auto len = static_cast<uint64_t>(map.size());
        ser << len;
        for(const auto& [key, val] : map) {
            ser << key << val;
        }
        return ser;
    }

    /// Deserializes a map of key-value pairs. A repeated key makes the
    /// encoding non-canonical and fails deserialization.
    /// \see \ref mintnet::operator<<(serializer&, const std::map<K, V, Ts...>&)
    template<typename K, typename V, typename... Ts>
    auto operator>>(serializer& deser, std::map<K, V, Ts...>& map)
        -> serializer& {
        auto len = uint64_t();
        if(!(deser >> len)) {
            return deser;
        }
        map.clear();
        for(uint64_t i = 0; i < len; i++) {
            auto key = K();
            if(!(deser >> key)) {
                return deser;
            }
            auto val = V();
            if(!(deser >> val)) {
                return deser;
            }
            if(!map.emplace(std::move(key), std::move(val)).second) {
                deser.mark_invalid();
                return deser;
            }
        }
        return deser;
    }

    /// Serializes the count of items, and then each item in order.
    template<typename K, typename... Ts>
    auto operator<<(serializer& ser, const std::set<K, Ts...>& set)
        -> serializer& {
        auto len = static_cast<uint64_t>(set.size());
        ser << len;
        for(const auto& key : set) {
            ser << key;
        }
        return ser;
    }

    /// Deserializes a set of items. A repeated item fails deserialization.
    /// \see \ref mintnet::operator<<(serializer&, const std::set<K, Ts...>&)
    template<typename K, typename... Ts>
    auto operator>>(serializer& deser, std::set<K, Ts...>& set)
        -> serializer& {
        auto len = uint64_t();
        if(!(deser >> len)) {
            return deser;
        }
        set.clear();
        for(uint64_t i = 0; i < len; i++) {
            auto key = K();
            if(!(deser >> key)) {
                return deser;
            }
            if(!set.emplace(std::move(key)).second) {
                deser.mark_invalid();
                return deser;
            }
        }
        return deser;
    }

    /// Serializes the variant index of the value, and then the value itself.
    template<typename... Ts>
    auto operator<<(serializer& ser, const std::variant<Ts...>& var)
        -> serializer& {
        using S = uint8_t;
        static_assert(sizeof...(Ts) < std::numeric_limits<S>::max());
        auto idx = static_cast<S>(var.index());
        ser << idx;
        std::visit(
            [&](auto&& arg) {
                ser << arg;
            },
            var);
        return ser;
    }

    /// Deserializes a variant whose alternatives are default-constructible.
    /// An index outside the alternatives fails deserialization.
    /// \see \ref mintnet::operator<<(serializer&, const std::variant<Ts...>&)
    template<typename... Ts>
    auto operator>>(serializer& deser, std::variant<Ts...>& var)
        -> serializer& {
        using S = uint8_t;
        S idx{};
        if(!(deser >> idx)) {
            return deser;
        }
        auto expanded = expand_type<Ts...>(static_cast<size_t>(idx));
        if(!expanded.has_value()) {
            deser.mark_invalid();
            return deser;
        }
        var = std::move(expanded.value());
        std::visit(
            [&](auto&& arg) {
                deser >> arg;
            },
            var);
        return deser;
    }
}

#endif // MINTNET_SRC_SERIALIZATION_FORMAT_H_
