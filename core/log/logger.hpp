/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <memory>
#include <sstream>

#include <soralog/level.hpp>
#include <soralog/logger.hpp>
#include <soralog/logging_system.hpp>
#include <soralog/macro.hpp>

#include "outcome/outcome.hpp"

namespace paracol::log {

  using Level = soralog::Level;
  using Logger = std::shared_ptr<soralog::Logger>;

  enum class Error : uint8_t { WRONG_LEVEL = 1, WRONG_GROUP, WRONG_LOGGER };

  outcome::result<Level> str2lvl(std::string_view str);

  void setLoggingSystem(std::weak_ptr<soralog::LoggingSystem> logging_system);

  /**
   * Applies level overrides in form of `level` (for the default group) or
   * `group=level`
   */
  void tuneLoggingSystem(const std::vector<std::string> &cfg);

  static const std::string defaultGroupName("paracol");

  [[nodiscard]] Logger createLogger(const std::string &tag,
                                    const std::string &group);

  bool setLevelOfGroup(const std::string &group_name, Level level);
  bool resetLevelOfGroup(const std::string &group_name);

}  // namespace paracol::log

OUTCOME_HPP_DECLARE_ERROR(paracol::log, Error);
