/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#include "parachain/collator/inherent_data_assembler.hpp"

#include <boost/assert.hpp>

#include "parachain/well_known_keys.hpp"

namespace paracol::parachain {

  InherentDataAssembler::InherentDataAssembler(
      std::shared_ptr<const authorship::InherentDataProvider> provider,
      DownwardMessagesRetriever retrieve_dmq_contents)
      : provider_{std::move(provider)},
        retrieve_dmq_contents_{std::move(retrieve_dmq_contents)},
        logger_{log::createLogger("InherentDataAssembler", "collator")} {
    BOOST_ASSERT(provider_);
    BOOST_ASSERT(retrieve_dmq_contents_);
  }

  std::optional<primitives::InherentData> InherentDataAssembler::assemble(
      const ValidationData &validation_data,
      const RelayHash &relay_parent) const {
    auto inherent_data_res = provider_->createInherentData();
    if (inherent_data_res.has_error()) {
      SL_ERROR(logger_,
               "Failed to create inherent data: {}",
               inherent_data_res.error());
      return std::nullopt;
    }
    auto &inherent_data = inherent_data_res.value();

    if (auto res =
            inherent_data.putData(kValidationDataIdentifier, validation_data);
        res.has_error()) {
      SL_ERROR(logger_,
               "Failed to put validation function params into inherents: {}",
               res.error());
      return std::nullopt;
    }

    auto downward_messages = retrieve_dmq_contents_(relay_parent);
    if (not downward_messages.has_value()) {
      SL_ERROR(logger_,
               "Failed to retrieve downward messages for relay parent {}",
               relay_parent);
      return std::nullopt;
    }

    if (auto res = inherent_data.putData(kDownwardMessagesIdentifier,
                                         downward_messages.value());
        res.has_error()) {
      SL_ERROR(logger_,
               "Failed to put downward messages into inherents: {}",
               res.error());
      return std::nullopt;
    }

    return std::move(inherent_data);
  }

}  // namespace paracol::parachain
