/**
 * Copyright Soramitsu Co., Ltd. All Rights Reserved.
 * SPDX-License-Identifier: Apache-2.0
 */

#include "common/logger.hpp"

#include <atomic>
#include <mutex>
#include <spdlog/sinks/stdout_color_sinks.h>

namespace pc::common {
  namespace {
    constexpr auto kPattern{"%Y-%m-%d %T.%e %^%L%$ %n: %v"};

    std::atomic<spdlog::level::level_enum> default_level{spdlog::level::info};
    std::mutex create_mutex;
  }  // namespace

  Logger createLogger(const std::string &tag) {
    std::lock_guard lock{create_mutex};
    auto logger = spdlog::get(tag);
    if (logger == nullptr) {
      logger = spdlog::stdout_color_mt(tag);
      logger->set_pattern(kPattern);
      logger->set_level(default_level.load());
    }
    return logger;
  }

  void setLogLevel(spdlog::level::level_enum level) {
    default_level = level;
    spdlog::set_level(level);
  }
}  // namespace pc::common
