// Copyright (c) 2021 MIT Digital Currency Initiative,
//                    Federal Reserve Bank of Boston
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

/**
 * \file with_signature.hpp
 * Signing and verification of values over their canonical serialization,
 * and the signed envelope used to authenticate bank and notary messages.
 */

#ifndef MINTNET_SRC_LEDGER_WITH_SIGNATURE_H_
#define MINTNET_SRC_LEDGER_WITH_SIGNATURE_H_

#include "util/common/hash.hpp"
#include "util/common/keys.hpp"
#include "util/serialization/format.hpp"
#include "util/serialization/util.hpp"

#include <optional>

namespace mintnet::ledger {
    /// Returns the digest that is signed for a value: SHA256 of its
    /// serialized form.
    /// \tparam T serializable type.
    /// \param value the value to digest.
    /// \return the signing digest.
    template<typename T>
    auto signing_hash(const T& value) -> hash_t {
        return hash_data(make_buffer(value));
    }

    /// Signs a value with the given key.
    /// \param ctx secp256k1 context.
    /// \param sk signing key.
    /// \param value value to sign.
    /// \return signature over signing_hash(value), or std::nullopt if the
    ///         key is not a valid secp256k1 key.
    template<typename T>
    auto sign_value(secp256k1_context* ctx, const privkey_t& sk, const T& value)
        -> std::optional<signature_t> {
        return sign_hash(ctx, sk, signing_hash(value));
    }

    /// Checks a signature over a value.
    /// \param pk public key of the purported signer.
    /// \param value the value that was signed.
    /// \param sig the signature.
    /// \return true if sig is a valid signature by pk over value.
    template<typename T>
    auto verify_value(const pubkey_t& pk, const T& value, const signature_t& sig)
        -> bool {
        return check_signature(pk, signing_hash(value), sig);
    }

    /// \brief A value paired with a signature over its serialized bytes.
    ///
    /// Built once by the signer and checked once by the receiver against
    /// the public key of the authority it expects to have signed it.
    /// \tparam T type of the enclosed value.
    template<typename T>
    struct with_signature {
        /// The signed value.
        T m_value{};
        /// Signature over the serialized value.
        signature_t m_signature{};

        auto operator==(const with_signature& rhs) const -> bool {
            return m_value == rhs.m_value && m_signature == rhs.m_signature;
        }
    };

    /// Signs a value and wraps it in an envelope.
    /// \param ctx secp256k1 context.
    /// \param sk signing key.
    /// \param value value to enclose.
    /// \return the envelope, or std::nullopt if the key is invalid.
    template<typename T>
    auto make_with_signature(secp256k1_context* ctx,
                             const privkey_t& sk,
                             T value) -> std::optional<with_signature<T>> {
        auto sig = sign_value(ctx, sk, value);
        if(!sig.has_value()) {
            return std::nullopt;
        }
        return with_signature<T>{std::move(value), sig.value()};
    }

    /// Checks that an envelope was signed by the given key.
    /// \param pk expected signer.
    /// \param envelope envelope to check.
    /// \return true if the signature is valid for the enclosed value.
    template<typename T>
    auto verify_with_signature(const pubkey_t& pk,
                               const with_signature<T>& envelope) -> bool {
        return verify_value(pk, envelope.m_value, envelope.m_signature);
    }
}

namespace mintnet {
    template<typename T>
    auto operator<<(serializer& ser, const ledger::with_signature<T>& ws)
        -> serializer& {
        return ser << ws.m_value << ws.m_signature;
    }

    template<typename T>
    auto operator>>(serializer& deser, ledger::with_signature<T>& ws)
        -> serializer& {
        return deser >> ws.m_value >> ws.m_signature;
    }
}

#endif // MINTNET_SRC_LEDGER_WITH_SIGNATURE_H_
