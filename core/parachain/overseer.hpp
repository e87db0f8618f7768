/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <functional>

#include <boost/variant.hpp>

#include "outcome/outcome.hpp"
#include "parachain/collator_fn.hpp"
#include "parachain/types.hpp"

namespace paracol::parachain {

  /// Configuration of the collation generation subsystem
  struct CollationGenerationConfig {
    /// Keypair collations are signed with
    CollatorPair key;
    /// Parachain the collations are produced for
    ParachainId para_id;
    /// Produces collations on request
    CollatorFn collator;
  };

  namespace CollationGenerationMessage {
    /// Initialize the collation generation subsystem
    struct Initialize {
      CollationGenerationConfig config;
    };
  }  // namespace CollationGenerationMessage

  namespace CollatorProtocolMessage {
    /// Signal to the collator protocol that it should connect to validators
    /// of the given parachain
    struct CollateOn {
      ParachainId para_id;
    };
  }  // namespace CollatorProtocolMessage

  using OverseerMessage = boost::variant<CollationGenerationMessage::Initialize,
                                         CollatorProtocolMessage::CollateOn>;

  /**
   * Handle to the subsystem messaging bus of the relay chain node
   */
  class OverseerHandler {
   public:
    using SendCallback = std::function<void(outcome::result<void>)>;

    virtual ~OverseerHandler() = default;

    /**
     * Deliver message to the subsystem it is addressed to
     * @param message message to send
     * @param cb called once the message is accepted or rejected
     */
    virtual void sendMessage(OverseerMessage message, SendCallback cb) = 0;
  };

}  // namespace paracol::parachain
