/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include "application/app_configuration.hpp"

#include <rapidjson/document.h>

#include <cstdio>
#include <functional>
#include <memory>

#include "log/logger.hpp"

#ifdef DECLARE_PROPERTY
#error DECLARE_PROPERTY already defined!
#endif  // DECLARE_PROPERTY
#define DECLARE_PROPERTY(T, N)                                                 \
 private:                                                                      \
  T N##_;                                                                      \
                                                                               \
 public:                                                                       \
  std::conditional<std::is_trivial<T>::value && (sizeof(T) <= sizeof(size_t)), \
                   T,                                                          \
                   const T &>::type                                            \
  N() const override {                                                         \
    return N##_;                                                               \
  }

namespace eraoracle::application {

  // clang-format off
  /**
   * Reads app configuration from multiple sources with the given priority:
   *
   *      COMMAND LINE ARGUMENTS          <- max priority
   *                V
   *      ENVIRONMENT VARIABLES
   *                V
   *        CONFIGURATION FILE
   *                V
   *          DEFAULT VALUES              <- low priority
   */
  // clang-format on

  class AppConfigurationImpl final : public AppConfiguration {
    using FilePtr = std::unique_ptr<std::FILE, decltype(&std::fclose)>;

   public:
    /// Reads environment variable by name, none if it is not set
    using EnvReader =
        std::function<std::optional<std::string>(const char *name)>;

    explicit AppConfigurationImpl(log::Logger logger);
    AppConfigurationImpl(log::Logger logger, EnvReader env);
    ~AppConfigurationImpl() override = default;

    AppConfigurationImpl(const AppConfigurationImpl &) = delete;
    AppConfigurationImpl &operator=(const AppConfigurationImpl &) = delete;

    [[nodiscard]] bool initializeFromArgs(int argc, const char **argv);

    const std::vector<std::string> &relayUrls() const override {
      return relay_urls_;
    }
    const std::vector<std::string> &paraUrls() const override {
      return para_urls_;
    }
    const std::optional<std::string> &signerUrl() const override {
      return signer_url_;
    }
    const primitives::EvmAddress &contractAddress() const override {
      return contract_address_;
    }
    const primitives::EvmAddress &oracleAccount() const override {
      return oracle_account_;
    }
    const std::filesystem::path &abiPath() const override {
      return abi_path_;
    }
    std::chrono::seconds eraDuration() const override {
      return std::chrono::seconds{era_duration_in_seconds_};
    }
    std::chrono::seconds timeout() const override {
      return std::chrono::seconds{timeout_};
    }
    std::chrono::seconds pollInterval() const override {
      return std::chrono::seconds{poll_interval_};
    }
    std::chrono::seconds eraDelayTolerance() const override {
      return std::chrono::seconds{era_delay_tolerance_};
    }
    std::chrono::seconds watchdogGrace() const override {
      return std::chrono::seconds{watchdog_grace_};
    }
    const std::vector<std::string> &log() const override {
      return logger_tuning_config_;
    }

   private:
    void parse_general_segment(const rapidjson::Value &val);
    void parse_relay_segment(const rapidjson::Value &val);
    void parse_parachain_segment(const rapidjson::Value &val);
    void parse_oracle_segment(const rapidjson::Value &val);

    /// Overrides values with the environment variables that are set
    bool read_environment();

    /// Checks values, removes invalid urls
    bool validate_config();

    bool read_config_from_file(const std::string &filepath);

    bool load_ms(const rapidjson::Value &val,
                 const char *name,
                 std::vector<std::string> &target);
    bool load_str(const rapidjson::Value &val,
                  const char *name,
                  std::string &target);
    bool load_bool(const rapidjson::Value &val, const char *name, bool &target);
    bool load_u32(const rapidjson::Value &val,
                  const char *name,
                  uint32_t &target);
    bool load_u64(const rapidjson::Value &val,
                  const char *name,
                  uint64_t &target);

    FilePtr open_file(const std::string &filepath);

    log::Logger logger_;
    EnvReader env_;

    std::vector<std::string> relay_urls_;
    std::vector<std::string> para_urls_;
    std::optional<std::string> signer_url_;
    std::string contract_address_str_;
    std::string oracle_account_str_;
    primitives::EvmAddress contract_address_;
    primitives::EvmAddress oracle_account_;
    std::filesystem::path abi_path_;
    uint32_t era_duration_in_seconds_;
    uint32_t timeout_;
    uint32_t poll_interval_;
    uint32_t era_delay_tolerance_;
    uint32_t watchdog_grace_;
    std::vector<std::string> logger_tuning_config_;

    DECLARE_PROPERTY(uint32_t, eraDurationInBlocks);
    DECLARE_PROPERTY(uint32_t, maxFailures);
    DECLARE_PROPERTY(uint64_t, gasLimit);
    DECLARE_PROPERTY(uint64_t, maxPriorityFeePerGas);
    DECLARE_PROPERTY(uint64_t, blocksToWait);
    DECLARE_PROPERTY(bool, debugMode);

   private:
    struct SegmentHandler {
      using Handler = std::function<void(const rapidjson::Value &)>;
      const char *segment_name;
      Handler handler;
    };

    // clang-format off
    std::vector<SegmentHandler> handlers_ = {
        SegmentHandler{"general",   std::bind(&AppConfigurationImpl::parse_general_segment, this, std::placeholders::_1)},
        SegmentHandler{"relay",     std::bind(&AppConfigurationImpl::parse_relay_segment, this, std::placeholders::_1)},
        SegmentHandler{"parachain", std::bind(&AppConfigurationImpl::parse_parachain_segment, this, std::placeholders::_1)},
        SegmentHandler{"oracle",    std::bind(&AppConfigurationImpl::parse_oracle_segment, this, std::placeholders::_1)},
    };
    // clang-format on
  };

}  // namespace eraoracle::application

#undef DECLARE_PROPERTY
