/**
 * Copyright Soramitsu Co., Ltd. All Rights Reserved.
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <atomic>

#include "clock/utc_clock.hpp"

namespace pc::clock {
  /**
   * System clock, clamped so that a wall clock step back is never observed
   */
  class UTCClockImpl : public UTCClock {
   public:
    microseconds nowMicro() const override;

   private:
    mutable std::atomic<microseconds::rep> last_{0};
  };
}  // namespace pc::clock
