// Copyright (c) 2021 MIT Digital Currency Initiative,
//                    Federal Reserve Bank of Boston
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#ifndef MINTNET_SRC_COMMON_KEYS_H_
#define MINTNET_SRC_COMMON_KEYS_H_

#include "hash.hpp"

#include <array>
#include <memory>
#include <optional>
#include <string>

struct secp256k1_context_struct;
using secp256k1_context = struct secp256k1_context_struct;

namespace mintnet {
    /// Size of public keys used throughout the system, in bytes.
    static constexpr size_t pubkey_len = 32;
    /// Size of signatures used throughout the system, in bytes.
    static constexpr size_t sig_len = 64;

    /// A private key of a public/private keypair.
    using privkey_t = std::array<unsigned char, pubkey_len>;
    /// An x-only public key of a public/private keypair.
    using pubkey_t = std::array<unsigned char, pubkey_len>;
    /// A BIP-340 Schnorr signature.
    using signature_t = std::array<unsigned char, sig_len>;

    using secp256k1_context_destroy_type = void (*)(secp256k1_context*);
    /// Owning handle to a secp256k1 context.
    using secp_context_ptr
        = std::unique_ptr<secp256k1_context, secp256k1_context_destroy_type>;

    /// Creates a new secp256k1 context suitable for signing and
    /// verification.
    /// \return owning pointer to the context.
    auto make_secp_context() -> secp_context_ptr;

    /// Generates a public key from the specified private key.
    /// \param privkey private key for which to generate the public key.
    /// \param ctx the secp context to use.
    /// \return the public key, or std::nullopt if the private key is not a
    ///         valid secp256k1 scalar.
    auto pubkey_from_privkey(const privkey_t& privkey, secp256k1_context* ctx)
        -> std::optional<pubkey_t>;

    /// Produces a Schnorr signature over a 32-byte message hash.
    /// \param ctx the secp context to use.
    /// \param privkey key with which to sign.
    /// \param msg_hash the message digest to sign.
    /// \return the signature, or std::nullopt if the key is invalid.
    auto sign_hash(secp256k1_context* ctx,
                   const privkey_t& privkey,
                   const hash_t& msg_hash) -> std::optional<signature_t>;

    /// Checks a Schnorr signature over a 32-byte message hash.
    /// \param pubkey x-only public key of the purported signer.
    /// \param msg_hash the message digest that was signed.
    /// \param sig signature to check.
    /// \return true if the key parses and the signature is valid.
    auto check_signature(const pubkey_t& pubkey,
                         const hash_t& msg_hash,
                         const signature_t& sig) -> bool;

    /// Parses a hex-encoded 32-byte key.
    /// \param hex 64 hex digits.
    /// \return the key bytes, or std::nullopt if the string is malformed.
    auto key_from_hex(const std::string& hex) -> std::optional<pubkey_t>;
}

#endif // MINTNET_SRC_COMMON_KEYS_H_
