// Copyright (c) 2021 MIT Digital Currency Initiative,
//                    Federal Reserve Bank of Boston
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#include "format.hpp"

namespace mintnet {
    namespace {
        /// Reads `len` bytes in bounded chunks, appending each to `out`.
        template<typename Append>
        auto read_chunked(serializer& deser, uint64_t len, Append&& append)
            -> bool {
            auto chunk = std::vector<std::byte>();
            uint64_t total_read = 0;
            while(total_read < len) {
                const auto chunk_sz = static_cast<size_t>(
                    std::min(len - total_read, config::maximum_reservation));
                chunk.resize(chunk_sz);
                if(!deser.read(chunk.data(), chunk_sz)) {
                    return false;
                }
                append(chunk.data(), chunk_sz);
                total_read += chunk_sz;
            }
            return true;
        }
    }

    auto operator<<(serializer& packet, std::byte b) -> serializer& {
        packet << static_cast<uint8_t>(b);
        return packet;
    }

    auto operator>>(serializer& packet, std::byte& b) -> serializer& {
        uint8_t val{};
        if(packet >> val) {
            b = static_cast<std::byte>(val);
        }
        return packet;
    }

    auto operator<<(serializer& ser, const buffer& b) -> serializer& {
        ser << static_cast<uint64_t>(b.size());
        ser.write(b.data(), b.size());
        return ser;
    }

    auto operator>>(serializer& deser, buffer& b) -> serializer& {
        uint64_t len{};
        if(!(deser >> len)) {
            return deser;
        }
        b.clear();
        read_chunked(deser, len, [&](const std::byte* data, size_t sz) {
            b.append(data, sz);
        });
        return deser;
    }

    auto operator<<(serializer& ser, const std::string& s) -> serializer& {
        ser << static_cast<uint64_t>(s.size());
        ser.write(s.data(), s.size());
        return ser;
    }

    auto operator>>(serializer& deser, std::string& s) -> serializer& {
        uint64_t len{};
        if(!(deser >> len)) {
            return deser;
        }
        s.clear();
        read_chunked(deser, len, [&](const std::byte* data, size_t sz) {
            // NOLINTNEXTLINE(cppcoreguidelines-pro-type-reinterpret-cast)
            s.append(reinterpret_cast<const char*>(data), sz);
        });
        return deser;
    }
}
