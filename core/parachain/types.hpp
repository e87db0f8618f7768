/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <optional>
#include <utility>
#include <vector>

#include <scale/scale.hpp>

#include "common/blob.hpp"
#include "common/buffer.hpp"
#include "crypto/sr25519_types.hpp"
#include "primitives/common.hpp"

namespace paracol::parachain {

  using Hash = common::Hash256;
  using ParachainId = uint32_t;
  /// Collator signing identity
  using CollatorPair = crypto::Sr25519Keypair;
  using UpwardMessage = common::Buffer;
  using ParachainRuntime = common::Buffer;
  using HeadData = common::Buffer;
  using BlockData = common::Buffer;
  using RelayHash = Hash;
  using BlockNumber = primitives::BlockNumber;
  using DownwardMessage = common::Buffer;
  using Balance = common::Blob<16>;

  struct InboundDownwardMessage {
    /// The block number at which these messages were put into the downward
    /// message queue.
    BlockNumber sent_at;
    /// The actual downward message to processes.
    DownwardMessage msg;

    bool operator==(const InboundDownwardMessage &) const = default;
  };

  template <class Stream,
            typename = std::enable_if_t<Stream::is_encoder_stream>>
  Stream &operator<<(Stream &s, const InboundDownwardMessage &v) {
    return s << v.sent_at << v.msg;
  }

  template <class Stream,
            typename = std::enable_if_t<Stream::is_decoder_stream>>
  Stream &operator>>(Stream &s, InboundDownwardMessage &v) {
    return s >> v.sent_at >> v.msg;
  }

  struct OutboundHrmpMessage {
    /// The para that will get this message in its downward message queue.
    ParachainId recipient;
    /// The message payload.
    common::Buffer data;

    bool operator==(const OutboundHrmpMessage &) const = default;
  };

  template <class Stream,
            typename = std::enable_if_t<Stream::is_encoder_stream>>
  Stream &operator<<(Stream &s, const OutboundHrmpMessage &v) {
    return s << v.recipient << v.data;
  }

  template <class Stream,
            typename = std::enable_if_t<Stream::is_decoder_stream>>
  Stream &operator>>(Stream &s, OutboundHrmpMessage &v) {
    return s >> v.recipient >> v.data;
  }

  /// Proof-of-validity, what validators need to re-execute the block
  struct PoV {
    BlockData block_data;

    bool operator==(const PoV &) const = default;
  };

  template <class Stream,
            typename = std::enable_if_t<Stream::is_encoder_stream>>
  Stream &operator<<(Stream &s, const PoV &v) {
    return s << v.block_data;
  }

  template <class Stream,
            typename = std::enable_if_t<Stream::is_decoder_stream>>
  Stream &operator>>(Stream &s, PoV &v) {
    return s >> v.block_data;
  }

  /**
   * Validation data persisted by the relay chain, the part validators commit
   * to when checking a candidate
   */
  struct PersistedValidationData {
    /// The parent head-data.
    HeadData parent_head;
    /// The relay-chain block number this is in the context of.
    BlockNumber block_number;
    /// The list of MQC heads for the inbound channels paired with the sender
    /// para ids.
    std::vector<std::pair<ParachainId, Hash>> hrmp_mqc_heads;
    /// The MQC head for the DMQ.
    Hash dmq_mqc_head;
    /// The maximum legal size of a POV block, in bytes.
    uint32_t max_pov_size;

    bool operator==(const PersistedValidationData &) const = default;
  };

  template <class Stream,
            typename = std::enable_if_t<Stream::is_encoder_stream>>
  Stream &operator<<(Stream &s, const PersistedValidationData &v) {
    return s << v.parent_head << v.block_number << v.hrmp_mqc_heads
             << v.dmq_mqc_head << v.max_pov_size;
  }

  template <class Stream,
            typename = std::enable_if_t<Stream::is_decoder_stream>>
  Stream &operator>>(Stream &s, PersistedValidationData &v) {
    return s >> v.parent_head >> v.block_number >> v.hrmp_mqc_heads
        >> v.dmq_mqc_head >> v.max_pov_size;
  }

  /**
   * Validation data which is not committed to by validators
   */
  struct TransientValidationData {
    /// The maximum code size permitted, in bytes.
    uint32_t max_code_size;
    /// The maximum head-data size permitted, in bytes.
    uint32_t max_head_data_size;
    /// The balance of the parachain at the moment of validation.
    Balance balance;
    /// Whether the parachain is allowed to upgrade its validation code, and
    /// the relay block number it would be applied at.
    std::optional<BlockNumber> code_upgrade_allowed;
    /// The number of messages pending in the downward message queue.
    uint32_t dmq_length;

    bool operator==(const TransientValidationData &) const = default;
  };

  template <class Stream,
            typename = std::enable_if_t<Stream::is_encoder_stream>>
  Stream &operator<<(Stream &s, const TransientValidationData &v) {
    return s << v.max_code_size << v.max_head_data_size << v.balance
             << v.code_upgrade_allowed << v.dmq_length;
  }

  template <class Stream,
            typename = std::enable_if_t<Stream::is_decoder_stream>>
  Stream &operator>>(Stream &s, TransientValidationData &v) {
    return s >> v.max_code_size >> v.max_head_data_size >> v.balance
        >> v.code_upgrade_allowed >> v.dmq_length;
  }

  /// Everything the relay chain supplies to build and validate a candidate
  struct ValidationData {
    PersistedValidationData persisted;
    TransientValidationData transient;

    bool operator==(const ValidationData &) const = default;
  };

  template <class Stream,
            typename = std::enable_if_t<Stream::is_encoder_stream>>
  Stream &operator<<(Stream &s, const ValidationData &v) {
    return s << v.persisted << v.transient;
  }

  template <class Stream,
            typename = std::enable_if_t<Stream::is_decoder_stream>>
  Stream &operator>>(Stream &s, ValidationData &v) {
    return s >> v.persisted >> v.transient;
  }

  /**
   * Candidate of the parachain block, produced by the collator and sent to
   * the relay chain validators
   */
  struct Collation {
    /// Messages destined to be interpreted by the Relay chain itself.
    std::vector<UpwardMessage> upward_messages;
    /// New validation code.
    std::optional<ParachainRuntime> new_validation_code;
    /// The head-data produced as a result of execution.
    HeadData head_data;
    /// Proof to verify the state transition of the parachain.
    PoV proof_of_validity;
    /// The number of messages processed from the DMQ.
    uint32_t processed_downward_messages;
    /// Horizontal messages sent by the parachain.
    std::vector<OutboundHrmpMessage> horizontal_messages;
    /// The mark which specifies the block number up to which all inbound HRMP
    /// messages are processed.
    BlockNumber hrmp_watermark;

    bool operator==(const Collation &) const = default;
  };

}  // namespace paracol::parachain
