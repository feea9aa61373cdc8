/**
 * Copyright Soramitsu Co., Ltd. All Rights Reserved.
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <chrono>

#include "common/outcome.hpp"

namespace pc::clock {
  enum class TimeError { kOverflow = 1 };

  using UnixTime = std::chrono::seconds;
  using std::chrono::microseconds;
  using Duration = std::chrono::seconds;

  /**
   * Adds duration to a point in time
   * @param time - point in time
   * @param duration - non-negative duration
   * @return sum or kOverflow if it is not representable
   */
  outcome::result<UnixTime> addDuration(UnixTime time, Duration duration);
}  // namespace pc::clock

OUTCOME_HPP_DECLARE_ERROR(pc::clock, TimeError);
