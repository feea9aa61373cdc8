/**
 * Copyright Soramitsu Co., Ltd. All Rights Reserved.
 * SPDX-License-Identifier: Apache-2.0
 */

#include "crypto/secp256k1/impl/secp256k1_provider_impl.hpp"

#include <openssl/rand.h>
#include <secp256k1_recovery.h>

#include "crypto/secp256k1/secp256k1_error.hpp"

namespace pc::crypto::secp256k1 {
  namespace {
    /// Ethereum adds 27 to the recovery id
    constexpr uint8_t kEthRecoveryOffset{27};
    /// attempts to draw a valid scalar before giving up
    constexpr int kGenerateAttempts{16};
  }  // namespace

  Secp256k1ProviderImpl::Secp256k1ProviderImpl()
      : context_(secp256k1_context_create(SECP256K1_CONTEXT_SIGN
                                          | SECP256K1_CONTEXT_VERIFY),
                 secp256k1_context_destroy) {}

  outcome::result<KeyPair> Secp256k1ProviderImpl::generate() const {
    PrivateKey private_key;
    for (int attempt = 0; attempt < kGenerateAttempts; ++attempt) {
      if (RAND_bytes(private_key.data(), static_cast<int>(private_key.size()))
          != 1) {
        return Secp256k1Error::kKeyGenerationFailed;
      }
      if (secp256k1_ec_seckey_verify(context_.get(), private_key.data())
          == 1) {
        OUTCOME_TRY(public_key, derive(private_key));
        return KeyPair{private_key, public_key};
      }
    }
    return Secp256k1Error::kKeyGenerationFailed;
  }

  outcome::result<PublicKey> Secp256k1ProviderImpl::derive(
      const PrivateKey &key) const {
    secp256k1_pubkey pubkey;

    if (!secp256k1_ec_pubkey_create(context_.get(), &pubkey, key.data())) {
      return Secp256k1Error::kKeyGenerationFailed;
    }

    PublicKey public_key;
    size_t outputlen = kPublicKeyUncompressedLength;
    if (!secp256k1_ec_pubkey_serialize(context_.get(),
                                       public_key.data(),
                                       &outputlen,
                                       &pubkey,
                                       SECP256K1_EC_UNCOMPRESSED)) {
      return Secp256k1Error::kPubkeySerializationError;
    }

    return public_key;
  }

  outcome::result<Signature> Secp256k1ProviderImpl::sign(
      const MessageHash &digest, const PrivateKey &key) const {
    secp256k1_ecdsa_recoverable_signature sig_struct;
    if (!secp256k1_ecdsa_sign_recoverable(context_.get(),
                                          &sig_struct,
                                          digest.data(),
                                          key.data(),
                                          secp256k1_nonce_function_rfc6979,
                                          nullptr)) {
      return Secp256k1Error::kCannotSignError;
    }
    Signature signature;
    int recid = 0;
    if (!secp256k1_ecdsa_recoverable_signature_serialize_compact(
            context_.get(), signature.data(), &recid, &sig_struct)) {
      return Secp256k1Error::kSignatureSerializationError;
    }
    signature[64] = static_cast<uint8_t>(recid);
    return signature;
  }

  outcome::result<PublicKey> Secp256k1ProviderImpl::recoverPublicKey(
      const MessageHash &digest, const Signature &signature) const {
    OUTCOME_TRY(recid, recoveryId(signature));

    secp256k1_ecdsa_recoverable_signature sig_rec;
    secp256k1_pubkey pubkey;

    if (!secp256k1_ecdsa_recoverable_signature_parse_compact(
            context_.get(), &sig_rec, signature.data(), recid)) {
      return Secp256k1Error::kSignatureParseError;
    }
    if (!secp256k1_ecdsa_recover(
            context_.get(), &pubkey, &sig_rec, digest.data())) {
      return Secp256k1Error::kRecoverError;
    }
    PublicKey pubkey_out;
    size_t outputlen = kPublicKeyUncompressedLength;
    if (!secp256k1_ec_pubkey_serialize(context_.get(),
                                       pubkey_out.data(),
                                       &outputlen,
                                       &pubkey,
                                       SECP256K1_EC_UNCOMPRESSED)) {
      return Secp256k1Error::kPubkeySerializationError;
    }

    return pubkey_out;
  }

  outcome::result<int> Secp256k1ProviderImpl::recoveryId(
      const Signature &signature) {
    auto v = signature[64];
    if (v >= kEthRecoveryOffset) {
      v -= kEthRecoveryOffset;
    }
    if (v > 3) {
      return Secp256k1Error::kSignatureParseError;
    }
    return static_cast<int>(v);
  }

}  // namespace pc::crypto::secp256k1
