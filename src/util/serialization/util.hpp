// Copyright (c) 2021 MIT Digital Currency Initiative,
//                    Federal Reserve Bank of Boston
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#ifndef MINTNET_SRC_SERIALIZATION_UTIL_H_
#define MINTNET_SRC_SERIALIZATION_UTIL_H_

#include "buffer_serializer.hpp"
#include "size_serializer.hpp"

#include <optional>

namespace mintnet {
    /// Calculates the serialized size in bytes of the given object when
    /// serialized using \ref serializer. \see \ref size_serializer.
    /// \tparam T type of object.
    /// \param obj object to serialize.
    /// \return serialized size in bytes.
    template<typename T>
    auto serialized_size(const T& obj) -> size_t {
        auto ser = size_serializer();
        ser << obj;
        return ser.size();
    }

    /// Serialize object into mintnet::buffer using a
    /// mintnet::buffer_serializer.
    /// \tparam T type of object to serialize.
    /// \return a serialized buffer of the object.
    template<typename T>
    auto make_buffer(const T& obj) -> mintnet::buffer {
        auto pkt = mintnet::buffer();
        auto ser = mintnet::buffer_serializer(pkt);
        ser << obj;
        return pkt;
    }

    /// Deserialize object of given type from a mintnet::buffer.
    /// \tparam T type of object to deserialize from the buffer.
    /// \param buf buffer from which to deserialize the object.
    /// \return deserialized object, or std::nullopt if the deserialization
    ///         failed.
    template<typename T>
    auto from_buffer(mintnet::buffer& buf) -> std::optional<T> {
        auto deser = mintnet::buffer_serializer(buf);
        T ret{};
        if(!(deser >> ret)) {
            return std::nullopt;
        }
        return ret;
    }

    /// Deserialize object of given type from a mintnet::buffer, requiring
    /// the object to account for every byte in the buffer. Trailing bytes
    /// mean the buffer holds a different type than the one requested.
    /// \tparam T type of object to deserialize from the buffer.
    /// \param buf buffer from which to deserialize the object.
    /// \return deserialized object, or std::nullopt if deserialization
    ///         failed or left bytes unread.
    template<typename T>
    auto from_buffer_exact(mintnet::buffer& buf) -> std::optional<T> {
        auto deser = mintnet::buffer_serializer(buf);
        T ret{};
        if(!(deser >> ret) || !deser.end_of_buffer()) {
            return std::nullopt;
        }
        return ret;
    }
}

#endif // MINTNET_SRC_SERIALIZATION_UTIL_H_
