/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#include "common/blob.hpp"

OUTCOME_CPP_DEFINE_CATEGORY(eraoracle::common, BlobError, e) {
  using eraoracle::common::BlobError;

  switch (e) {
    case BlobError::INCORRECT_LENGTH:
      return "Input has incorrect length, not matching the blob size";
  }

  return "Unknown error";
}

namespace eraoracle::common {

  template class Blob<16ul>;
  template class Blob<20ul>;
  template class Blob<32ul>;

}  // namespace eraoracle::common
