/**
 * Copyright Soramitsu Co., Ltd. All Rights Reserved.
 * SPDX-License-Identifier: Apache-2.0
 */

#include "clock/impl/utc_clock_impl.hpp"

#include <algorithm>

namespace pc::clock {
  microseconds UTCClockImpl::nowMicro() const {
    const auto now = std::chrono::duration_cast<microseconds>(
                         std::chrono::system_clock::now().time_since_epoch())
                         .count();
    auto last = last_.load();
    while (now > last && !last_.compare_exchange_weak(last, now)) {
    }
    return microseconds{std::max(now, last)};
  }
}  // namespace pc::clock
