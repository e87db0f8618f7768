/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#include "parachain/collator/collation_extractor.hpp"

#include <boost/assert.hpp>

#include "parachain/well_known_keys.hpp"

namespace paracol::parachain {

  CollationExtractor::CollationExtractor(
      std::shared_ptr<const blockchain::StateBackend> state_backend)
      : state_backend_{std::move(state_backend)},
        logger_{log::createLogger("CollationExtractor", "collator")} {
    BOOST_ASSERT(state_backend_);
  }

  std::optional<CollationOutputs> CollationExtractor::extract(
      const storage::StateSnapshot &state, BlockNumber hrmp_watermark) const {
    CollationOutputs outputs;
    outputs.hrmp_watermark = hrmp_watermark;

    auto upward_res =
        state.tryGet(well_known_keys::asKey(well_known_keys::kUpwardMessages));
    if (upward_res.has_error()) {
      SL_ERROR(logger_,
               "Failed to read upward messages from state: {}",
               upward_res.error());
      return std::nullopt;
    }
    if (const auto &encoded = upward_res.value(); encoded.has_value()) {
      auto decoded = scale::decode<std::vector<UpwardMessage>>(*encoded);
      if (decoded.has_error()) {
        SL_ERROR(logger_,
                 "Failed to decode upward messages: {}",
                 decoded.error());
        return std::nullopt;
      }
      outputs.upward_messages = std::move(decoded.value());
    }

    auto code_res = state.tryGet(
        well_known_keys::asKey(well_known_keys::kNewValidationCode));
    if (code_res.has_error()) {
      SL_ERROR(logger_,
               "Failed to read new validation code from state: {}",
               code_res.error());
      return std::nullopt;
    }
    outputs.new_validation_code = std::move(code_res.value());

    auto processed_res = state.tryGet(
        well_known_keys::asKey(well_known_keys::kProcessedDownwardMessages));
    if (processed_res.has_error()) {
      SL_ERROR(logger_,
               "Failed to read processed downward messages from state: {}",
               processed_res.error());
      return std::nullopt;
    }
    if (const auto &encoded = processed_res.value(); encoded.has_value()) {
      auto decoded = scale::decode<uint32_t>(*encoded);
      if (decoded.has_error()) {
        SL_ERROR(logger_,
                 "Failed to decode processed downward messages: {}",
                 decoded.error());
        return std::nullopt;
      }
      outputs.processed_downward_messages = decoded.value();
    }

    // TODO: read horizontal messages once the runtime exposes them under a
    // well-known key
    return outputs;
  }

  std::optional<Collation> CollationExtractor::buildCollation(
      const ParachainBlockData &block_data,
      const primitives::BlockHash &block_hash,
      BlockNumber hrmp_watermark) const {
    auto state_res = state_backend_->stateAt(block_hash);
    if (state_res.has_error()) {
      SL_ERROR(logger_,
               "Failed to get state of the freshly built block {}: {}",
               block_hash,
               state_res.error());
      return std::nullopt;
    }

    auto outputs = extract(*state_res.value(), hrmp_watermark);
    if (not outputs.has_value()) {
      return std::nullopt;
    }

    auto head_data = scale::encode(block_data.header);
    if (head_data.has_error()) {
      SL_ERROR(logger_,
               "Failed to encode head data of block {}: {}",
               block_hash,
               head_data.error());
      return std::nullopt;
    }

    auto pov_block_data = scale::encode(block_data);
    if (pov_block_data.has_error()) {
      SL_ERROR(logger_,
               "Failed to encode proof-of-validity of block {}: {}",
               block_hash,
               pov_block_data.error());
      return std::nullopt;
    }

    return Collation{
        .upward_messages = std::move(outputs->upward_messages),
        .new_validation_code = std::move(outputs->new_validation_code),
        .head_data = HeadData(std::move(head_data.value())),
        .proof_of_validity =
            PoV{.block_data = BlockData(std::move(pov_block_data.value()))},
        .processed_downward_messages = outputs->processed_downward_messages,
        .horizontal_messages = std::move(outputs->horizontal_messages),
        .hrmp_watermark = outputs->hrmp_watermark,
    };
  }

}  // namespace paracol::parachain
