/**
 * Copyright Soramitsu Co., Ltd. All Rights Reserved.
 * SPDX-License-Identifier: Apache-2.0
 */

#include "config/paych_config.hpp"

#include <boost/program_options.hpp>

#include "common/logger.hpp"
#include "config/validate_with.hpp"
#include "crypto/secp256k1/impl/secp256k1_provider_impl.hpp"
#include "paych/impl/channel_manager_impl.hpp"
#include "paych/impl/eth_message_state_digest.hpp"
#include "paych/impl/secp256k1_signature_verifier.hpp"

OUTCOME_CPP_DEFINE_CATEGORY(pc::config, ConfigError, e) {
  using E = pc::config::ConfigError;
  switch (e) {
    case E::kInvalidOption:
      return "Config: invalid option";
    case E::kInvalidChallengePeriod:
      return "Config: minimal challenge period must be positive";
  }
  return "Config: unknown error";
}

namespace pc::primitives::address {
  inline void validate(boost::any &out,
                       const std::vector<std::string> &values,
                       Address *,
                       long) {
    using namespace boost::program_options;
    check_first_occurrence(out);
    auto &value{get_single_string(values)};
    if (auto _address{Address::fromString(value)}) {
      out = _address.value();
      return;
    }
    boost::throw_exception(invalid_option_value{value});
  }
}  // namespace pc::primitives::address

namespace pc::config {
  namespace po = boost::program_options;

  PC_CONFIG_VALIDATE(DigestScheme) {
    validateWith(out, values, [](const std::string &value) {
      if (value == "eip712") {
        return DigestScheme::kEip712;
      }
      if (value == "eth-message") {
        return DigestScheme::kEthMessage;
      }
      throw std::invalid_argument{value};
    });
  }

  namespace {
    common::Logger logger() {
      static common::Logger logger = common::createLogger("config");
      return logger;
    }

    struct RawConfig {
      char log_level{'i'};
      DigestScheme digest{DigestScheme::kEip712};
      std::string domain_name;
      std::string domain_version;
      uint64_t domain_chain_id{};
      primitives::address::Address verifying_contract;
      int64_t min_challenge_period{};
    };

    options_description configOptions(RawConfig &raw) {
      const PaychConfig defaults;
      po::options_description desc("Payment channel options");
      auto option{desc.add_options()};
      option("log-level",
             po::value(&raw.log_level)->default_value('i'),
             "log level, [e,w,i,d,t]");
      option("digest",
             po::value(&raw.digest)->default_value(defaults.digest, "eip712"),
             "signed state wrapping, [eip712, eth-message]");
      option("domain.name",
             po::value(&raw.domain_name)->default_value(defaults.domain.name),
             "EIP-712 domain name");
      option("domain.version",
             po::value(&raw.domain_version)
                 ->default_value(defaults.domain.version),
             "EIP-712 domain version");
      option("domain.chain-id",
             po::value(&raw.domain_chain_id)
                 ->default_value(defaults.domain.chain_id),
             "EIP-712 domain chain id");
      option("domain.verifying-contract",
             po::value(&raw.verifying_contract),
             "EIP-712 domain verifying contract, 0x-prefixed hex address");
      option("min-challenge-period",
             po::value(&raw.min_challenge_period)
                 ->default_value(defaults.min_challenge_period.count()),
             "shortest challenge period accepted on open (seconds)");
      return desc;
    }

    outcome::result<PaychConfig> fromRaw(const RawConfig &raw) {
      if (raw.min_challenge_period <= 0) {
        return ConfigError::kInvalidChallengePeriod;
      }
      PaychConfig config;
      config.log_level = getLogLevel(raw.log_level);
      config.digest = raw.digest;
      config.domain = {raw.domain_name,
                       raw.domain_version,
                       raw.domain_chain_id,
                       raw.verifying_contract};
      config.min_challenge_period = Duration{raw.min_challenge_period};
      return config;
    }

    template <typename Parse>
    outcome::result<PaychConfig> read(const Parse &parse) {
      RawConfig raw;
      const auto desc{configOptions(raw)};
      try {
        po::variables_map vm;
        po::store(parse(desc), vm);
        po::notify(vm);
      } catch (const po::error &e) {
        logger()->error("cannot read config: {}", e.what());
        return ConfigError::kInvalidOption;
      }
      return fromRaw(raw);
    }
  }  // namespace

  spdlog::level::level_enum getLogLevel(char level) {
    switch (level) {
      case 'e':
        return spdlog::level::err;
      case 'w':
        return spdlog::level::warn;
      case 'd':
        return spdlog::level::debug;
      case 't':
        return spdlog::level::trace;
    }
    return spdlog::level::info;
  }

  outcome::result<PaychConfig> readConfig(int argc, const char *const *argv) {
    return read([&](const options_description &desc) {
      return po::parse_command_line(argc, argv, desc);
    });
  }

  outcome::result<PaychConfig> readConfig(std::istream &input) {
    return read([&](const options_description &desc) {
      return po::parse_config_file(input, desc);
    });
  }

  std::shared_ptr<paych::StateDigest> makeStateDigest(
      const PaychConfig &config) {
    switch (config.digest) {
      case DigestScheme::kEthMessage:
        return std::make_shared<paych::EthMessageStateDigest>();
      case DigestScheme::kEip712:
        break;
    }
    return std::make_shared<paych::Eip712StateDigest>(config.domain);
  }

  std::shared_ptr<paych::ChannelManager> makeChannelManager(
      const PaychConfig &config,
      std::shared_ptr<paych::EscrowLedger> ledger,
      std::shared_ptr<clock::UTCClock> clock) {
    common::setLogLevel(config.log_level);
    auto validator = std::make_shared<paych::StateValidator>(
        makeStateDigest(config),
        std::make_shared<paych::Secp256k1SignatureVerifier>(
            std::make_shared<crypto::secp256k1::Secp256k1ProviderImpl>()));
    return std::make_shared<paych::ChannelManagerImpl>(
        config.min_challenge_period,
        std::move(ledger),
        std::move(validator),
        std::move(clock));
  }
}  // namespace pc::config
