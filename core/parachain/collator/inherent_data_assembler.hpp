/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <memory>
#include <optional>

#include "authorship/inherent_data_provider.hpp"
#include "log/logger.hpp"
#include "parachain/collator_fn.hpp"
#include "parachain/types.hpp"
#include "primitives/inherent_data.hpp"

namespace paracol::parachain {

  /**
   * Builds the inherent data of a parachain block: the generic inherents,
   * the validation data and the downward messages
   */
  class InherentDataAssembler {
   public:
    InherentDataAssembler(
        std::shared_ptr<const authorship::InherentDataProvider> provider,
        DownwardMessagesRetriever retrieve_dmq_contents);

    /**
     * @param validation_data validation data supplied by the relay chain
     * @param relay_parent relay block the candidate is built for
     * @return complete inherent data, std::nullopt if any part of it could not
     * be created
     */
    std::optional<primitives::InherentData> assemble(
        const ValidationData &validation_data,
        const RelayHash &relay_parent) const;

   private:
    std::shared_ptr<const authorship::InherentDataProvider> provider_;
    DownwardMessagesRetriever retrieve_dmq_contents_;
    log::Logger logger_;
  };

}  // namespace paracol::parachain
