// Copyright (c) 2021 MIT Digital Currency Initiative,
//                    Federal Reserve Bank of Boston
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#ifndef MINTNET_SRC_COMMON_BUFFER_H_
#define MINTNET_SRC_COMMON_BUFFER_H_

#include <cstddef>
#include <optional>
#include <string>
#include <vector>

namespace mintnet {
    /// Byte container used for serialized messages and signed payloads.
    class buffer {
      public:
        buffer() = default;

        /// Returns the number of bytes contained in the buffer.
        /// \return the number of bytes.
        [[nodiscard]] auto size() const -> size_t;

        /// Indicates whether the buffer holds no bytes.
        [[nodiscard]] auto empty() const -> bool;

        /// Returns a raw pointer to the start of the buffer data.
        /// \return a pointer to the data.
        [[nodiscard]] auto data() -> void*;

        /// Returns a raw pointer to the start of the buffer data.
        /// \return a pointer to the data.
        [[nodiscard]] auto data() const -> const void*;

        /// Returns a raw pointer to the byte at the given offset.
        /// \param offset the byte offset into the buffer.
        /// \return a pointer to the data.
        [[nodiscard]] auto data_at(size_t offset) -> void*;

        /// Returns a raw pointer to the byte at the given offset.
        /// \param offset the byte offset into the buffer.
        /// \return a pointer to the data.
        [[nodiscard]] auto data_at(size_t offset) const -> const void*;

        /// Adds the given number of bytes from the given pointer to the end of
        /// the buffer.
        /// \param data pointer to the start of the data.
        /// \param len the number of bytes to read.
        void append(const void* data, size_t len);

        /// Removes any existing content in the buffer making its size 0.
        void clear();

        auto operator==(const buffer& other) const -> bool;
        auto operator!=(const buffer& other) const -> bool;

        /// Extends the size of the buffer by the given length. New bytes are
        /// zeroed.
        /// \param len the number of bytes to add.
        void extend(size_t len);

        /// Returns a pointer to the data, cast to an unsigned char*.
        /// \return unsigned char pointer.
        [[nodiscard]] auto c_ptr() const -> const unsigned char*;

        /// Creates a new buffer from the provided hex string.
        /// \param hex string-encoded hex representation of a buffer.
        /// \return a new buffer, or std::nullopt if the string is not valid
        ///         hex.
        static auto from_hex(const std::string& hex) -> std::optional<buffer>;

        /// Returns a lowercase hex representation of the buffer contents.
        /// \return a hex encoded string.
        [[nodiscard]] auto to_hex() const -> std::string;

      private:
        std::vector<std::byte> m_data{};
    };

    /// Encodes the given bytes as lowercase hex.
    /// \param data pointer to the first byte.
    /// \param len number of bytes to encode.
    /// \return hex string of length 2 * len.
    auto to_hex(const unsigned char* data, size_t len) -> std::string;

    /// Decodes a single hex digit.
    /// \param c character to decode.
    /// \return the digit's value, or std::nullopt if c is not a hex digit.
    auto hex_digit(char c) -> std::optional<unsigned char>;
}

#endif // MINTNET_SRC_COMMON_BUFFER_H_
