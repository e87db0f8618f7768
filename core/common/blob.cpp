/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#include "common/blob.hpp"

OUTCOME_CPP_DEFINE_CATEGORY(paracol::common, BlobError, e) {
  using E = paracol::common::BlobError;
  switch (e) {
    case E::INCORRECT_LENGTH:
      return "Size of the input does not match the blob size";
  }
  return "Unknown BlobError";
}

namespace paracol::common {

  template class Blob<4ul>;
  template class Blob<8ul>;
  template class Blob<16ul>;
  template class Blob<32ul>;

}  // namespace paracol::common
