/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <filesystem>
#include <optional>

#include <soralog/impl/configurator_from_yaml.hpp>

namespace paracol::log {

  class Configurator : public soralog::ConfiguratorFromYAML {
    using PrevConfigurator = soralog::Configurator;

   public:
    /// Uses the embedded group tree
    explicit Configurator(std::shared_ptr<PrevConfigurator> previous);

    explicit Configurator(std::shared_ptr<PrevConfigurator> previous,
                          std::string config);

    explicit Configurator(std::shared_ptr<PrevConfigurator> previous,
                          std::filesystem::path path);

    /// Extracts value of `--logcfg` without touching the rest of arguments
    static std::optional<std::filesystem::path> getLogConfigFile(
        int argc, const char **argv);
  };

}  // namespace paracol::log
