/**
 * Copyright Soramitsu Co., Ltd. All Rights Reserved.
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include "common/blob.hpp"

namespace pc::crypto::keccak {
  using common::Hash256;

  /**
   * Incremental Keccak-256 (original Keccak padding, as used by Ethereum,
   * not the standardized SHA3-256)
   */
  struct Ctx {
    Ctx();
    void update(BytesIn in);
    /** Returns digest and resets context for a new message */
    Hash256 final();

   private:
    void absorb();

    std::array<uint64_t, 25> state{};
    std::array<uint8_t, 136> block{};
    size_t used{};
  };

  /**
   * @brief Get keccak-256 hash
   * @param to_hash - data to hash
   * @return hash
   */
  Hash256 keccak256(BytesIn to_hash);
}  // namespace pc::crypto::keccak
