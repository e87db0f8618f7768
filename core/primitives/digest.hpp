/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <vector>

#include <boost/variant.hpp>
#include <scale/scale.hpp>

#include "common/blob.hpp"
#include "common/buffer.hpp"
#include "outcome/outcome.hpp"

namespace paracol::primitives {
  /// Consensus engine unique ID, e.g. "aura" or "BABE"
  using ConsensusEngineId = common::Blob<4>;

  namespace detail {
    struct DigestItemCommon {
      ConsensusEngineId consensus_engine_id;
      common::Buffer data;

      bool operator==(const DigestItemCommon &rhs) const = default;
    };
  }  // namespace detail

  /// A pre-runtime digest, produced by the block author before the runtime
  struct PreRuntime : public detail::DigestItemCommon {};

  /// A message from the runtime to the consensus engine
  struct Consensus : public detail::DigestItemCommon {};

  /// Put a Seal on it. Always the last item of a sealed header
  struct Seal : public detail::DigestItemCommon {};

  /// Any other opaque chain-specific data
  struct Other {
    common::Buffer data;

    bool operator==(const Other &rhs) const = default;
  };

  /// Runtime code or heap pages were updated
  struct RuntimeEnvironmentUpdated {
    bool operator==(const RuntimeEnvironmentUpdated &) const = default;
  };

  /**
   * Single item of a header digest. Encoded with the same type tags Substrate
   * uses: Other = 0, Consensus = 4, Seal = 5, PreRuntime = 6,
   * RuntimeEnvironmentUpdated = 8
   */
  struct DigestItem {
    enum class Tag : uint8_t {
      OTHER = 0,
      CONSENSUS = 4,
      SEAL = 5,
      PRE_RUNTIME = 6,
      RUNTIME_ENVIRONMENT_UPDATED = 8,
    };

    boost::variant<Other,
                   Consensus,
                   Seal,
                   PreRuntime,
                   RuntimeEnvironmentUpdated>
        value;

    Tag tag() const {
      return boost::apply_visitor(
          [](const auto &v) {
            using T = std::decay_t<decltype(v)>;
            if constexpr (std::is_same_v<T, Consensus>) {
              return Tag::CONSENSUS;
            } else if constexpr (std::is_same_v<T, Seal>) {
              return Tag::SEAL;
            } else if constexpr (std::is_same_v<T, PreRuntime>) {
              return Tag::PRE_RUNTIME;
            } else if constexpr (std::is_same_v<T, RuntimeEnvironmentUpdated>) {
              return Tag::RUNTIME_ENVIRONMENT_UPDATED;
            } else {
              return Tag::OTHER;
            }
          },
          value);
    }

    bool operator==(const DigestItem &rhs) const {
      return value == rhs.value;
    }
  };

  /**
   * Digest is an implementation- and usage-defined entity, for example,
   * information, needed to verify the block
   */
  using Digest = std::vector<DigestItem>;

  template <class Stream,
            typename = std::enable_if_t<Stream::is_encoder_stream>>
  Stream &operator<<(Stream &s, const DigestItem &item) {
    s << static_cast<uint8_t>(item.tag());
    boost::apply_visitor(
        [&s](const auto &v) {
          using T = std::decay_t<decltype(v)>;
          if constexpr (std::is_base_of_v<detail::DigestItemCommon, T>) {
            s << v.consensus_engine_id << v.data;
          } else if constexpr (std::is_same_v<T, Other>) {
            s << v.data;
          }
        },
        item.value);
    return s;
  }

  template <class Stream,
            typename = std::enable_if_t<Stream::is_decoder_stream>>
  Stream &operator>>(Stream &s, DigestItem &item) {
    uint8_t tag = 0;
    s >> tag;
    auto decode_common = [&s]<typename T>(T item) {
      s >> item.consensus_engine_id >> item.data;
      return item;
    };
    switch (static_cast<DigestItem::Tag>(tag)) {
      case DigestItem::Tag::OTHER: {
        Other other;
        s >> other.data;
        item.value = std::move(other);
        break;
      }
      case DigestItem::Tag::CONSENSUS:
        item.value = decode_common(Consensus{});
        break;
      case DigestItem::Tag::SEAL:
        item.value = decode_common(Seal{});
        break;
      case DigestItem::Tag::PRE_RUNTIME:
        item.value = decode_common(PreRuntime{});
        break;
      case DigestItem::Tag::RUNTIME_ENVIRONMENT_UPDATED:
        item.value = RuntimeEnvironmentUpdated{};
        break;
      default:
        scale::raise(scale::DecodeError::UNEXPECTED_VALUE);
    }
    return s;
  }

}  // namespace paracol::primitives
