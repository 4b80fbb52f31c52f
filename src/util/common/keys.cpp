// Copyright (c) 2021 MIT Digital Currency Initiative,
//                    Federal Reserve Bank of Boston
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#include "keys.hpp"

#include <secp256k1.h>
#include <secp256k1_extrakeys.h>
#include <secp256k1_schnorrsig.h>

namespace mintnet {
    auto make_secp_context() -> secp_context_ptr {
        return {secp256k1_context_create(SECP256K1_CONTEXT_NONE),
                &secp256k1_context_destroy};
    }

    auto pubkey_from_privkey(const privkey_t& privkey, secp256k1_context* ctx)
        -> std::optional<pubkey_t> {
        secp256k1_keypair keypair{};
        if(::secp256k1_keypair_create(ctx, &keypair, privkey.data()) != 1) {
            return std::nullopt;
        }

        secp256k1_xonly_pubkey xpub{};
        if(::secp256k1_keypair_xonly_pub(ctx, &xpub, nullptr, &keypair)
           != 1) {
            return std::nullopt;
        }

        pubkey_t pubkey{};
        if(::secp256k1_xonly_pubkey_serialize(ctx, pubkey.data(), &xpub)
           != 1) {
            return std::nullopt;
        }
        return pubkey;
    }

    auto sign_hash(secp256k1_context* ctx,
                   const privkey_t& privkey,
                   const hash_t& msg_hash) -> std::optional<signature_t> {
        secp256k1_keypair keypair{};
        if(::secp256k1_keypair_create(ctx, &keypair, privkey.data()) != 1) {
            return std::nullopt;
        }

        auto sig = signature_t();
        if(::secp256k1_schnorrsig_sign32(ctx,
                                         sig.data(),
                                         msg_hash.data(),
                                         &keypair,
                                         nullptr)
           != 1) {
            return std::nullopt;
        }
        return sig;
    }

    auto check_signature(const pubkey_t& pubkey,
                         const hash_t& msg_hash,
                         const signature_t& sig) -> bool {
        // Verification does not mutate the context so one instance is
        // shared by all callers.
        static const auto verify_ctx = make_secp_context();

        secp256k1_xonly_pubkey xpub{};
        if(::secp256k1_xonly_pubkey_parse(verify_ctx.get(),
                                          &xpub,
                                          pubkey.data())
           != 1) {
            return false;
        }

        return ::secp256k1_schnorrsig_verify(verify_ctx.get(),
                                             sig.data(),
                                             msg_hash.data(),
                                             msg_hash.size(),
                                             &xpub)
            == 1;
    }

    auto key_from_hex(const std::string& hex) -> std::optional<pubkey_t> {
        return hash_from_hex(hex);
    }
}
