/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#include "application/impl/collator_configuration_impl.hpp"

#include <array>
#include <iostream>
#include <limits>

#include <rapidjson/error/en.h>
#include <rapidjson/filereadstream.h>
#include <boost/assert.hpp>
#include <boost/program_options.hpp>

#include "application/configuration_error.hpp"
#include "parachain/collator/collator.hpp"

namespace {
  template <typename T, typename Func>
  void find_argument(boost::program_options::variables_map &vm,
                     const char *name,
                     Func &&f) {
    BOOST_ASSERT(nullptr != name);
    if (auto it = vm.find(name); it != vm.end()) {
      if (it->second.defaulted()) {
        return;
      }
      std::forward<Func>(f)(it->second.as<T>());
    }
  }

  const auto def_proposal_deadline =
      paracol::parachain::Collator::kDefaultProposalDeadline;
}  // namespace

namespace paracol::application {

  CollatorConfigurationImpl::CollatorConfigurationImpl(log::Logger logger)
      : logger_{std::move(logger)},
        proposal_deadline_{def_proposal_deadline} {
    BOOST_ASSERT(logger_);
  }

  CollatorConfigurationImpl::FilePtr CollatorConfigurationImpl::open_file(
      const std::string &filepath) {
    BOOST_ASSERT(!filepath.empty());
    return CollatorConfigurationImpl::FilePtr(
        std::fopen(filepath.c_str(), "r"), &std::fclose);
  }

  bool CollatorConfigurationImpl::load_str(const rapidjson::Value &val,
                                           const char *name,
                                           std::string &target) {
    auto m = val.FindMember(name);
    if (val.MemberEnd() != m && m->value.IsString()) {
      target.assign(m->value.GetString(), m->value.GetStringLength());
      return true;
    }
    return false;
  }

  bool CollatorConfigurationImpl::load_u32(const rapidjson::Value &val,
                                           const char *name,
                                           uint32_t &target) {
    if (auto m = val.FindMember(name);
        val.MemberEnd() != m && m->value.IsUint()) {
      target = m->value.GetUint();
      return true;
    }
    return false;
  }

  bool CollatorConfigurationImpl::load_ms(const rapidjson::Value &val,
                                          const char *name,
                                          std::vector<std::string> &target) {
    auto m = val.FindMember(name);
    if (val.MemberEnd() == m || not m->value.IsArray()) {
      return false;
    }
    for (auto &value : m->value.GetArray()) {
      if (value.IsString()) {
        target.emplace_back(value.GetString(), value.GetStringLength());
      }
    }
    return true;
  }

  void CollatorConfigurationImpl::set_collator_key(std::string_view hex) {
    auto key_res = crypto::Sr25519Seed::fromHexAnyPrefix(hex);
    if (key_res.has_error()) {
      SL_ERROR(logger_, "Collator key is malformed: {}", key_res.error());
      malformed_key_ = true;
      return;
    }
    collator_seed_ = key_res.value();
    malformed_key_ = false;
  }

  void CollatorConfigurationImpl::parse_collator_segment(
      const rapidjson::Value &val) {
    uint32_t para_id = 0;
    if (load_u32(val, "para-id", para_id)) {
      para_id_ = para_id;
    }

    std::string key;
    if (load_str(val, "collator-key", key)) {
      set_collator_key(key);
    }

    uint32_t deadline_ms = 0;
    if (load_u32(val, "proposal-deadline", deadline_ms)) {
      proposal_deadline_ = std::chrono::milliseconds(deadline_ms);
    }
  }

  void CollatorConfigurationImpl::parse_logging_segment(
      const rapidjson::Value &val) {
    std::string logcfg;
    if (load_str(val, "logcfg", logcfg)) {
      logConfigFile_ = std::move(logcfg);
    }
    load_ms(val, "log", log_);
  }

  outcome::result<void> CollatorConfigurationImpl::read_config_from_file(
      const std::string &filepath) {
    auto file = open_file(filepath);
    if (!file) {
      SL_ERROR(logger_,
               "Configuration file path is invalid: {}, "
               "please specify a valid path with -c option",
               filepath);
      return ConfigurationError::CONFIG_FILE_UNREADABLE;
    }

    using FileReadStream = rapidjson::FileReadStream;
    using Document = rapidjson::Document;

    std::array<char, 1024> buffer_size{};
    FileReadStream input_stream(
        file.get(), buffer_size.data(), buffer_size.size());

    Document document;
    document.ParseStream(input_stream);
    if (document.HasParseError() or not document.IsObject()) {
      SL_ERROR(logger_,
               "Configuration file {} parse failed with error {}",
               filepath,
               GetParseError_En(document.GetParseError()));
      return ConfigurationError::CONFIG_FILE_MALFORMED;
    }

    for (auto &handler : handlers_) {
      auto it = document.FindMember(handler.segment_name);
      if (document.MemberEnd() != it) {
        handler.handler(it->value);
      }
    }
    return outcome::success();
  }

  outcome::result<void> CollatorConfigurationImpl::validate_config() const {
    if (not para_id_.has_value()) {
      return ConfigurationError::MISSING_PARA_ID;
    }
    if (malformed_key_) {
      return ConfigurationError::MALFORMED_COLLATOR_KEY;
    }
    if (not collator_seed_.has_value()) {
      return ConfigurationError::MISSING_COLLATOR_KEY;
    }
    if (proposal_deadline_.count() == 0) {
      return ConfigurationError::ZERO_PROPOSAL_DEADLINE;
    }
    return outcome::success();
  }

  bool CollatorConfigurationImpl::initializeFromArgs(int argc,
                                                     const char **argv) {
    namespace po = boost::program_options;

    // clang-format off
    po::options_description desc("General options");
    desc.add_options()
        ("help,h", "show this help message")
        ("log,l", po::value<std::vector<std::string>>(),
          "Sets a custom logging filter. Syntax is `<target>=<level>`, e.g. -lparachain=debug.\n"
          "Log levels (most to least verbose) are trace, debug, verbose, info, warn, error, critical, off. By default, all targets log `info`.\n"
          "The global log level can be set with -l<level>.")
        ("logcfg", po::value<std::string>(), "Path to YAML logging configuration")
        ("config-file,c", po::value<std::string>(), "Filepath to load configuration from.")
        ;

    po::options_description collator_desc("Collator options");
    collator_desc.add_options()
        ("para-id", po::value<uint32_t>(), "Id of the parachain to collate for")
        ("collator-key", po::value<std::string>(), "Collator secret seed, 32 bytes in hex")
        ("proposal-deadline", po::value<uint32_t>()->default_value(static_cast<uint32_t>(def_proposal_deadline.count())),
          "Time in milliseconds the proposer is given to build a block")
        ;
    // clang-format on

    desc.add(collator_desc);

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

    bool file_ok = true;
    find_argument<std::string>(vm, "config-file", [&](const std::string &path) {
      file_ok = read_config_from_file(path).has_value();
    });
    if (not file_ok) {
      return false;
    }

    find_argument<std::vector<std::string>>(
        vm, "log", [&](const std::vector<std::string> &val) { log_ = val; });

    find_argument<std::string>(vm, "logcfg", [&](const std::string &val) {
      logConfigFile_ = val;
    });

    find_argument<uint32_t>(
        vm, "para-id", [&](uint32_t val) { para_id_ = val; });

    find_argument<std::string>(
        vm, "collator-key", [&](const std::string &val) {
          set_collator_key(val);
        });

    find_argument<uint32_t>(vm, "proposal-deadline", [&](uint32_t val) {
      proposal_deadline_ = std::chrono::milliseconds(val);
    });

    if (auto res = validate_config(); res.has_error()) {
      SL_ERROR(logger_, "Invalid configuration: {}", res.error());
      return false;
    }
    return true;
  }

}  // namespace paracol::application
