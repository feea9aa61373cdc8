/**
 * Copyright Soramitsu Co., Ltd. All Rights Reserved.
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <iosfwd>
#include <memory>

#include <spdlog/common.h>
#include <boost/program_options/options_description.hpp>

#include "clock/utc_clock.hpp"
#include "paych/channel_manager.hpp"
#include "paych/escrow_ledger.hpp"
#include "paych/impl/eip712_state_digest.hpp"

namespace pc::config {
  using boost::program_options::options_description;
  using clock::Duration;

  enum class ConfigError {
    kInvalidOption = 1,
    kInvalidChallengePeriod,
  };

  /** Wrapping of the state fingerprint that agents sign */
  enum class DigestScheme {
    kEip712,
    kEthMessage,
  };

  struct PaychConfig {
    spdlog::level::level_enum log_level{spdlog::level::info};
    DigestScheme digest{DigestScheme::kEip712};
    paych::Eip712Domain domain{"PaymentChannel", "1", 1, {}};
    /** Shortest challenge period channels may be opened with */
    Duration min_challenge_period{1};
  };

  spdlog::level::level_enum getLogLevel(char level);

  /**
   * Parses command line options: log-level, digest, domain.name,
   * domain.version, domain.chain-id, domain.verifying-contract,
   * min-challenge-period. Unset options keep defaults.
   */
  outcome::result<PaychConfig> readConfig(int argc, const char *const *argv);

  /**
   * Parses the same options from INI-style stream, domain options may be
   * grouped in [domain] section
   */
  outcome::result<PaychConfig> readConfig(std::istream &input);

  /**
   * Creates digest strategy selected by config
   */
  std::shared_ptr<paych::StateDigest> makeStateDigest(
      const PaychConfig &config);

  /**
   * Applies config log level and builds channel manager verifying secp256k1
   * signatures over the configured digest
   * @param config - parsed config
   * @param ledger - escrow holding deposits
   * @param clock - source of now for challenge deadlines
   */
  std::shared_ptr<paych::ChannelManager> makeChannelManager(
      const PaychConfig &config,
      std::shared_ptr<paych::EscrowLedger> ledger,
      std::shared_ptr<clock::UTCClock> clock);
}  // namespace pc::config

OUTCOME_HPP_DECLARE_ERROR(pc::config, ConfigError);
