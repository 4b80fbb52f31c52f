// Copyright (c) 2021 MIT Digital Currency Initiative,
//                    Federal Reserve Bank of Boston
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#include "hash.hpp"

#include <algorithm>
#include <memory>
#include <openssl/evp.h>

namespace mintnet {
    auto to_string(const hash_t& val) -> std::string {
        return to_hex(val.data(), val.size());
    }

    auto hash_from_hex(const std::string& val) -> std::optional<hash_t> {
        auto buf = buffer::from_hex(val);
        if(!buf.has_value() || buf->size() != hash_size) {
            return std::nullopt;
        }

        hash_t ret{};
        std::copy_n(buf->c_ptr(), ret.size(), ret.begin());
        return ret;
    }

    auto hash_data(const std::byte* data, size_t len) -> hash_t {
        auto ctx = std::unique_ptr<EVP_MD_CTX, decltype(&EVP_MD_CTX_free)>(
            EVP_MD_CTX_new(),
            &EVP_MD_CTX_free);
        hash_t ret{};
        unsigned int out_len{};
        // The digest calls only fail on allocation failure, in which case
        // the returned hash is all zeros and cannot match any signature.
        if(!ctx || EVP_DigestInit_ex(ctx.get(), EVP_sha256(), nullptr) != 1
           || EVP_DigestUpdate(ctx.get(), data, len) != 1
           || EVP_DigestFinal_ex(ctx.get(), ret.data(), &out_len) != 1) {
            ret.fill(0);
        }
        return ret;
    }

    auto hash_data(const buffer& buf) -> hash_t {
        return hash_data(static_cast<const std::byte*>(buf.data()),
                         buf.size());
    }
}
