/**
 * Copyright Soramitsu Co., Ltd. All Rights Reserved.
 * SPDX-License-Identifier: Apache-2.0
 */

#include "clock/time.hpp"

#include <limits>

OUTCOME_CPP_DEFINE_CATEGORY(pc::clock, TimeError, e) {
  using pc::clock::TimeError;
  if (e == TimeError::kOverflow) {
    return "Time value overflow";
  }
  return "Unknown error";
}

namespace pc::clock {
  outcome::result<UnixTime> addDuration(UnixTime time, Duration duration) {
    constexpr auto kMax{std::numeric_limits<UnixTime::rep>::max()};
    if (duration.count() < 0 || time.count() > kMax - duration.count()) {
      return TimeError::kOverflow;
    }
    return time + duration;
  }
}  // namespace pc::clock
