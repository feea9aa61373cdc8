/**
 * Copyright Soramitsu Co., Ltd. All Rights Reserved.
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <cstdint>

#include "primitives/big_int.hpp"

namespace pc::primitives {
  using TokenAmount = BigInt;

  using Nonce = uint64_t;
}  // namespace pc::primitives
