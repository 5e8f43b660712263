/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#include "application/impl/app_configuration_impl.hpp"

#include <array>
#include <charconv>
#include <cstdlib>
#include <iostream>

#include <rapidjson/error/en.h>
#include <rapidjson/filereadstream.h>
#include <boost/algorithm/string.hpp>
#include <boost/program_options.hpp>

#include "rpc/endpoint_url.hpp"

namespace {
  using eraoracle::primitives::EvmAddress;

  template <typename T, typename Func>
  void find_argument(boost::program_options::variables_map &vm,
                     const char *name,
                     Func &&f) {
    if (auto it = vm.find(name); it != vm.end()) {
      if (it->second.defaulted()) {
        return;
      }
      std::forward<Func>(f)(it->second.as<T>());
    }
  }

  std::optional<std::string> read_process_env(const char *name) {
    if (const char *value = std::getenv(name); value != nullptr) {
      return std::string{value};
    }
    return std::nullopt;
  }

  template <typename T>
  bool parse_number(std::string_view str, T &target) {
    T value{};
    auto [ptr, ec] =
        std::from_chars(str.data(), str.data() + str.size(), value);
    if (ec != std::errc{} or ptr != str.data() + str.size()) {
      return false;
    }
    target = value;
    return true;
  }

  bool parse_flag(std::string str, bool &target) {
    boost::algorithm::to_lower(str);
    if (str == "1" or str == "true" or str == "yes") {
      target = true;
      return true;
    }
    if (str == "0" or str == "false" or str == "no") {
      target = false;
      return true;
    }
    return false;
  }

  std::vector<std::string> split_urls(const std::string &str) {
    std::vector<std::string> parts;
    boost::algorithm::split(parts, str, boost::algorithm::is_any_of(", "));
    std::erase_if(parts, [](const std::string &part) { return part.empty(); });
    return parts;
  }

  outcome::result<EvmAddress> parse_address(
      const std::string &str) {
    if (str.starts_with("0x")) {
      return EvmAddress::fromHexWithPrefix(str);
    }
    return EvmAddress::fromHex(str);
  }

  const uint32_t def_era_duration_in_blocks = 14400;
  const uint32_t def_era_duration_in_seconds = 86400;
  const uint32_t def_timeout = 60;
  const uint32_t def_max_failures = 10;
  const uint32_t def_poll_interval = 180;
  const uint32_t def_era_delay_tolerance = 600;
  const uint32_t def_watchdog_grace = 60;
  const uint64_t def_gas_limit = 10000000;
  const uint64_t def_max_priority_fee = 0;
  const uint64_t def_blocks_to_wait = 2;
}  // namespace

namespace eraoracle::application {

  AppConfigurationImpl::AppConfigurationImpl(log::Logger logger)
      : AppConfigurationImpl(std::move(logger), read_process_env) {}

  AppConfigurationImpl::AppConfigurationImpl(log::Logger logger, EnvReader env)
      : logger_(std::move(logger)),
        env_(std::move(env)),
        era_duration_in_seconds_(def_era_duration_in_seconds),
        timeout_(def_timeout),
        poll_interval_(def_poll_interval),
        era_delay_tolerance_(def_era_delay_tolerance),
        watchdog_grace_(def_watchdog_grace),
        eraDurationInBlocks_(def_era_duration_in_blocks),
        maxFailures_(def_max_failures),
        gasLimit_(def_gas_limit),
        maxPriorityFeePerGas_(def_max_priority_fee),
        blocksToWait_(def_blocks_to_wait),
        debugMode_(false) {}

  AppConfigurationImpl::FilePtr AppConfigurationImpl::open_file(
      const std::string &filepath) {
    return AppConfigurationImpl::FilePtr(std::fopen(filepath.c_str(), "r"),
                                         &std::fclose);
  }

  bool AppConfigurationImpl::load_ms(const rapidjson::Value &val,
                                     const char *name,
                                     std::vector<std::string> &target) {
    auto m = val.FindMember(name);
    if (val.MemberEnd() == m or not m->value.IsArray()) {
      return false;
    }
    std::vector<std::string> values;
    for (auto &item : m->value.GetArray()) {
      if (not item.IsString()) {
        return false;
      }
      values.emplace_back(item.GetString(), item.GetStringLength());
    }
    target = std::move(values);
    return not target.empty();
  }

  bool AppConfigurationImpl::load_str(const rapidjson::Value &val,
                                      const char *name,
                                      std::string &target) {
    auto m = val.FindMember(name);
    if (val.MemberEnd() != m && m->value.IsString()) {
      target.assign(m->value.GetString(), m->value.GetStringLength());
      return true;
    }
    return false;
  }

  bool AppConfigurationImpl::load_bool(const rapidjson::Value &val,
                                       const char *name,
                                       bool &target) {
    auto m = val.FindMember(name);
    if (val.MemberEnd() != m && m->value.IsBool()) {
      target = m->value.GetBool();
      return true;
    }
    return false;
  }

  bool AppConfigurationImpl::load_u32(const rapidjson::Value &val,
                                      const char *name,
                                      uint32_t &target) {
    if (auto m = val.FindMember(name);
        val.MemberEnd() != m && m->value.IsUint()) {
      target = m->value.GetUint();
      return true;
    }
    return false;
  }

  bool AppConfigurationImpl::load_u64(const rapidjson::Value &val,
                                      const char *name,
                                      uint64_t &target) {
    if (auto m = val.FindMember(name);
        val.MemberEnd() != m && m->value.IsUint64()) {
      target = m->value.GetUint64();
      return true;
    }
    return false;
  }

  void AppConfigurationImpl::parse_general_segment(
      const rapidjson::Value &val) {
    load_ms(val, "log", logger_tuning_config_);
  }

  void AppConfigurationImpl::parse_relay_segment(const rapidjson::Value &val) {
    load_ms(val, "urls", relay_urls_);
    load_u32(val, "era-duration-blocks", eraDurationInBlocks_);
    load_u32(val, "era-duration-seconds", era_duration_in_seconds_);
  }

  void AppConfigurationImpl::parse_parachain_segment(
      const rapidjson::Value &val) {
    load_ms(val, "urls", para_urls_);
    std::string signer_url;
    if (load_str(val, "signer-url", signer_url)) {
      signer_url_ = std::move(signer_url);
    }
    load_str(val, "contract-address", contract_address_str_);
    load_str(val, "oracle-account", oracle_account_str_);
    std::string abi_path;
    if (load_str(val, "abi-path", abi_path)) {
      abi_path_ = abi_path;
    }
    load_u64(val, "gas-limit", gasLimit_);
    load_u64(val, "max-priority-fee", maxPriorityFeePerGas_);
    load_u64(val, "blocks-to-wait", blocksToWait_);
  }

  void AppConfigurationImpl::parse_oracle_segment(const rapidjson::Value &val) {
    load_u32(val, "timeout", timeout_);
    load_u32(val, "max-failures", maxFailures_);
    load_u32(val, "poll-interval", poll_interval_);
    load_u32(val, "era-delay-tolerance", era_delay_tolerance_);
    load_u32(val, "watchdog-grace", watchdog_grace_);
    load_bool(val, "debug", debugMode_);
  }

  bool AppConfigurationImpl::read_config_from_file(
      const std::string &filepath) {
    auto file = open_file(filepath);
    if (!file) {
      SL_ERROR(logger_,
               "Configuration file path is invalid: {}, "
               "please specify a valid path with -c option",
               filepath);
      return false;
    }

    using FileReadStream = rapidjson::FileReadStream;
    using Document = rapidjson::Document;

    std::array<char, 1024> buffer_size{};
    FileReadStream input_stream(
        file.get(), buffer_size.data(), buffer_size.size());

    Document document;
    document.ParseStream(input_stream);
    if (document.HasParseError()) {
      SL_ERROR(logger_,
               "Configuration file {} parse failed with error {}",
               filepath,
               GetParseError_En(document.GetParseError()));
      return false;
    }
    if (not document.IsObject()) {
      SL_ERROR(logger_, "Configuration file {} is not a json object", filepath);
      return false;
    }

    for (auto &handler : handlers_) {
      auto it = document.FindMember(handler.segment_name);
      if (document.MemberEnd() != it) {
        handler.handler(it->value);
      }
    }
    return true;
  }

  bool AppConfigurationImpl::read_environment() {
    bool valid = true;
    auto number = [&](const char *name, auto &target) {
      if (auto value = env_(name)) {
        if (not parse_number(*value, target)) {
          SL_ERROR(logger_, "Environment variable {} is not a number", name);
          valid = false;
        }
      }
    };
    auto string = [&](const char *name, std::string &target) {
      if (auto value = env_(name)) {
        target = std::move(*value);
      }
    };

    if (auto value = env_("WS_URL_RELAY")) {
      relay_urls_ = split_urls(*value);
    }
    if (auto value = env_("WS_URL_PARA")) {
      para_urls_ = split_urls(*value);
    }
    string("CONTRACT_ADDRESS", contract_address_str_);
    string("ORACLE_ACCOUNT", oracle_account_str_);
    if (auto value = env_("ABI_PATH")) {
      abi_path_ = *value;
    }
    number("ERA_DURATION_IN_BLOCKS", eraDurationInBlocks_);
    number("ERA_DURATION_IN_SECONDS", era_duration_in_seconds_);
    number("TIMEOUT", timeout_);
    number("MAX_NUMBER_OF_FAILURE_REQUESTS", maxFailures_);
    number("FREQUENCY_OF_REQUESTS", poll_interval_);
    number("ERA_DELAY_TIME", era_delay_tolerance_);
    number("GAS_LIMIT", gasLimit_);
    number("MAX_PRIORITY_FEE_PER_GAS", maxPriorityFeePerGas_);
    if (auto value = env_("DEBUG_MODE")) {
      if (not parse_flag(*value, debugMode_)) {
        SL_ERROR(logger_, "Environment variable DEBUG_MODE is not a flag");
        valid = false;
      }
    }
    if (auto value = env_("LOG_LEVEL_STDOUT")) {
      boost::algorithm::to_lower(*value);
      logger_tuning_config_.emplace_back(std::move(*value));
    }
    return valid;
  }

  bool AppConfigurationImpl::validate_config() {
    bool valid = true;

    if (eraDurationInBlocks_ == 0) {
      SL_ERROR(logger_,
               "Era duration in blocks is 0, "
               "please specify a valid value with --era-duration-blocks option");
      valid = false;
    }
    if (era_duration_in_seconds_ == 0) {
      SL_ERROR(
          logger_,
          "Era duration in seconds is 0, "
          "please specify a valid value with --era-duration-seconds option");
      valid = false;
    }
    if (poll_interval_ == 0) {
      SL_ERROR(logger_,
               "Poll interval is 0, "
               "please specify a valid value with --poll-interval option");
      valid = false;
    }
    if (timeout_ == 0) {
      SL_ERROR(logger_,
               "Timeout is 0, "
               "please specify a valid value with --timeout option");
      valid = false;
    }
    if (gasLimit_ == 0) {
      SL_ERROR(logger_,
               "Gas limit is 0, "
               "please specify a valid value with --gas-limit option");
      valid = false;
    }

    relay_urls_ = rpc::filterEndpointUrls(relay_urls_, logger_);
    if (relay_urls_.empty()) {
      SL_ERROR(logger_,
               "No valid relay chain url, "
               "please specify ws:// or wss:// urls with --relay-url option");
      valid = false;
    }
    para_urls_ = rpc::filterEndpointUrls(para_urls_, logger_);
    if (para_urls_.empty()) {
      SL_ERROR(logger_,
               "No valid parachain url, "
               "please specify ws:// or wss:// urls with --para-url option");
      valid = false;
    }
    if (signer_url_.has_value()) {
      if (auto res = rpc::parseEndpointUrl(*signer_url_); res.has_error()) {
        SL_ERROR(logger_,
                 "Signer url {} is invalid: {}",
                 *signer_url_,
                 res.error().message());
        valid = false;
      }
    }

    if (auto res = parse_address(contract_address_str_); res.has_value()) {
      contract_address_ = res.value();
    } else {
      SL_ERROR(logger_,
               "Contract address '{}' is invalid: {}, "
               "please specify 20 bytes hex with --contract-address option",
               contract_address_str_,
               res.error().message());
      valid = false;
    }
    if (auto res = parse_address(oracle_account_str_); res.has_value()) {
      oracle_account_ = res.value();
    } else {
      SL_ERROR(logger_,
               "Oracle account '{}' is invalid: {}, "
               "please specify 20 bytes hex with --oracle-account option",
               oracle_account_str_,
               res.error().message());
      valid = false;
    }

    std::error_code ec;
    if (abi_path_.empty() or not std::filesystem::is_regular_file(abi_path_, ec)) {
      SL_ERROR(logger_,
               "ABI file {} does not exist, "
               "please specify a valid path with --abi-path option",
               abi_path_.string());
      valid = false;
    }

    return valid;
  }

  bool AppConfigurationImpl::initializeFromArgs(int argc, const char **argv) {
    namespace po = boost::program_options;

    // clang-format off
    po::options_description desc("General options");
    desc.add_options()
        ("help,h", "show this help message")
        ("log,l", po::value<std::vector<std::string>>(),
          "Sets a custom logging filter. Syntax is `<target>=<level>`, e.g. -leraoracle=debug.\n"
          "Log levels (most to least verbose) are trace, debug, verbose, info, warn, error, critical, off. By default, all targets log `info`.\n"
          "The global log level can be set with -l<level>.")
        ("logcfg", po::value<std::string>(), "Path to a custom soralog yaml configuration")
        ("config-file,c", po::value<std::string>(), "Filepath to load configuration from.")
        ("debug", po::bool_switch(), "Build and dry-run reports without sending transactions")
        ;

    po::options_description relay_desc("Relay chain options");
    relay_desc.add_options()
        ("relay-url", po::value<std::vector<std::string>>()->multitoken(), "websocket urls of relay chain nodes")
        ("era-duration-blocks", po::value<uint32_t>(), "era duration in blocks")
        ("era-duration-seconds", po::value<uint32_t>(), "era duration in seconds")
        ;

    po::options_description para_desc("Parachain options");
    para_desc.add_options()
        ("para-url", po::value<std::vector<std::string>>()->multitoken(), "websocket urls of parachain nodes")
        ("signer-url", po::value<std::string>(), "websocket url of the node signing oracle transactions, the parachain connection is used by default")
        ("contract-address", po::value<std::string>(), "address of the oracle contract")
        ("oracle-account", po::value<std::string>(), "address of the oracle account")
        ("abi-path", po::value<std::string>(), "path to the json ABI of the oracle contract")
        ("gas-limit", po::value<uint64_t>(), "gas limit of report transactions")
        ("max-priority-fee", po::value<uint64_t>(), "max priority fee per gas of report transactions")
        ("blocks-to-wait", po::value<uint64_t>(), "blocks to wait after a successful report")
        ;

    po::options_description oracle_desc("Oracle options");
    oracle_desc.add_options()
        ("timeout", po::value<uint32_t>(), "timeout of rpc calls and pause between endpoint pool passes, seconds")
        ("max-failures", po::value<uint32_t>(), "failures after which an endpoint is avoided")
        ("poll-interval", po::value<uint32_t>(), "interval between active era polls, seconds")
        ("era-delay-tolerance", po::value<uint32_t>(), "allowed delay of era update, seconds")
        ("watchdog-grace", po::value<uint32_t>(), "pause before exit on delayed era update, seconds")
        ;
    // clang-format on

    desc.add(relay_desc).add(para_desc).add(oracle_desc);

    po::variables_map vm;
    try {
      po::store(po::parse_command_line(argc, argv, desc), vm);
      po::notify(vm);
    } catch (const std::exception &e) {
      std::cerr << "Error: " << e.what() << '\n'
                << "Try run with option '--help' for more information"
                << std::endl;
      return false;
    }

    if (vm.count("help") > 0) {
      std::cout << desc << std::endl;
      return false;
    }

    bool valid = true;
    find_argument<std::string>(vm, "config-file", [&](const std::string &path) {
      valid = read_config_from_file(path);
    });
    if (not valid or not read_environment()) {
      return false;
    }

    find_argument<std::vector<std::string>>(
        vm, "log", [&](const std::vector<std::string> &chunks) {
          logger_tuning_config_.insert(
              logger_tuning_config_.end(), chunks.begin(), chunks.end());
        });
    find_argument<std::vector<std::string>>(
        vm, "relay-url", [&](const std::vector<std::string> &urls) {
          relay_urls_ = urls;
        });
    find_argument<uint32_t>(vm, "era-duration-blocks", [&](uint32_t val) {
      eraDurationInBlocks_ = val;
    });
    find_argument<uint32_t>(vm, "era-duration-seconds", [&](uint32_t val) {
      era_duration_in_seconds_ = val;
    });
    find_argument<std::vector<std::string>>(
        vm, "para-url", [&](const std::vector<std::string> &urls) {
          para_urls_ = urls;
        });
    find_argument<std::string>(
        vm, "signer-url", [&](const std::string &url) { signer_url_ = url; });
    find_argument<std::string>(
        vm, "contract-address", [&](const std::string &val) {
          contract_address_str_ = val;
        });
    find_argument<std::string>(vm, "oracle-account", [&](const std::string &val) {
      oracle_account_str_ = val;
    });
    find_argument<std::string>(
        vm, "abi-path", [&](const std::string &val) { abi_path_ = val; });
    find_argument<uint64_t>(
        vm, "gas-limit", [&](uint64_t val) { gasLimit_ = val; });
    find_argument<uint64_t>(
        vm, "max-priority-fee", [&](uint64_t val) { maxPriorityFeePerGas_ = val; });
    find_argument<uint64_t>(
        vm, "blocks-to-wait", [&](uint64_t val) { blocksToWait_ = val; });
    find_argument<uint32_t>(
        vm, "timeout", [&](uint32_t val) { timeout_ = val; });
    find_argument<uint32_t>(
        vm, "max-failures", [&](uint32_t val) { maxFailures_ = val; });
    find_argument<uint32_t>(
        vm, "poll-interval", [&](uint32_t val) { poll_interval_ = val; });
    find_argument<uint32_t>(vm, "era-delay-tolerance", [&](uint32_t val) {
      era_delay_tolerance_ = val;
    });
    find_argument<uint32_t>(
        vm, "watchdog-grace", [&](uint32_t val) { watchdog_grace_ = val; });
    if (auto it = vm.find("debug"); it != vm.end() and it->second.as<bool>()) {
      debugMode_ = true;
    }

    // if something wrong with config print help message
    if (not validate_config()) {
      std::cout << desc << std::endl;
      return false;
    }
    return true;
  }

}  // namespace eraoracle::application
