/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include "application/collator_configuration.hpp"

#define RAPIDJSON_NO_SIZETYPEDEFINE
namespace rapidjson {
  using SizeType = ::std::size_t;
}
#include <rapidjson/document.h>
#undef RAPIDJSON_NO_SIZETYPEDEFINE

#include <cstdio>
#include <functional>
#include <memory>

#include "log/logger.hpp"
#include "outcome/outcome.hpp"

#ifdef PARACOL_DECLARE_PROPERTY
#error PARACOL_DECLARE_PROPERTY already defined!
#endif  // PARACOL_DECLARE_PROPERTY
#define PARACOL_DECLARE_PROPERTY(T, N)                                         \
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

namespace paracol::application {

  // clang-format off
  /**
   * Reads collator configuration from multiple sources with the given
   * priority:
   *
   *      COMMAND LINE ARGUMENTS          <- max priority
   *                V
   *        CONFIGURATION FILE
   *                V
   *          DEFAULT VALUES              <- low priority
   */
  // clang-format on
  class CollatorConfigurationImpl final : public CollatorConfiguration {
    using FilePtr = std::unique_ptr<std::FILE, decltype(&std::fclose)>;

   public:
    explicit CollatorConfigurationImpl(log::Logger logger);
    ~CollatorConfigurationImpl() override = default;

    CollatorConfigurationImpl(const CollatorConfigurationImpl &) = delete;
    CollatorConfigurationImpl &operator=(const CollatorConfigurationImpl &) =
        delete;

    /**
     * Parse the arguments and the configuration file they point to
     * @return false if configuration is incomplete or malformed, the cause is
     * logged
     */
    [[nodiscard]] bool initializeFromArgs(int argc, const char **argv);

    parachain::ParachainId paraId() const override {
      return para_id_.value_or(0);
    }
    crypto::Sr25519Seed collatorSeed() const override {
      return collator_seed_.value_or(crypto::Sr25519Seed{});
    }
    std::chrono::milliseconds proposalDeadline() const override {
      return proposal_deadline_;
    }

   private:
    void parse_collator_segment(const rapidjson::Value &val);
    void parse_logging_segment(const rapidjson::Value &val);

    struct SegmentHandler {
      using Handler = std::function<void(const rapidjson::Value &)>;
      const char *segment_name;
      Handler handler;
    };

    // clang-format off
    std::vector<SegmentHandler> handlers_ = {
        SegmentHandler{"collator", [this](const rapidjson::Value &val) { parse_collator_segment(val); }},
        SegmentHandler{"logging",  [this](const rapidjson::Value &val) { parse_logging_segment(val); }},
    };
    // clang-format on

    outcome::result<void> read_config_from_file(const std::string &filepath);
    outcome::result<void> validate_config() const;
    /// malformed key is remembered and reported by validate_config
    void set_collator_key(std::string_view hex);

    FilePtr open_file(const std::string &filepath);

    bool load_str(const rapidjson::Value &val,
                  const char *name,
                  std::string &target);
    bool load_u32(const rapidjson::Value &val,
                  const char *name,
                  uint32_t &target);
    bool load_ms(const rapidjson::Value &val,
                 const char *name,
                 std::vector<std::string> &target);

    log::Logger logger_;

    std::optional<parachain::ParachainId> para_id_;
    std::optional<crypto::Sr25519Seed> collator_seed_;
    std::chrono::milliseconds proposal_deadline_;
    bool malformed_key_ = false;

    PARACOL_DECLARE_PROPERTY(std::optional<std::string>, logConfigFile);
    PARACOL_DECLARE_PROPERTY(std::vector<std::string>, log);
  };

}  // namespace paracol::application

#undef PARACOL_DECLARE_PROPERTY
