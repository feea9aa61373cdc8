/**
 * Copyright Soramitsu Co., Ltd. All Rights Reserved.
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include "crypto/keccak/keccak.hpp"
#include "paych/state_digest.hpp"

namespace pc::paych {
  /**
   * Packs 32-byte words the way abi.encode lays out static types
   */
  class AbiEncoder {
   public:
    void putWord(const Hash256 &word) {
      append(bytes_, word);
    }

    void putAddress(const Address &address) {
      bytes_.insert(bytes_.end(), kWordSize - address.size(), 0);
      append(bytes_, address);
    }

    void putUint(uint64_t value) {
      BytesN<kWordSize> word{};
      for (size_t i = 0; i < sizeof(value); ++i) {
        word[kWordSize - 1 - i] = static_cast<uint8_t>(value >> (8 * i));
      }
      append(bytes_, word);
    }

    outcome::result<void> putUint(const primitives::BigInt &value) {
      BytesN<kWordSize> word{};
      if (!primitives::encodeUint256(value, word)) {
        return StateDigestError::kValueOutOfRange;
      }
      append(bytes_, word);
      return outcome::success();
    }

    Hash256 hash() const {
      return crypto::keccak::keccak256(bytes_);
    }

   private:
    static constexpr size_t kWordSize{32};

    Bytes bytes_;
  };
}  // namespace pc::paych
