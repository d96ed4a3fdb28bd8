/**
 * Copyright Soramitsu Co., Ltd. All Rights Reserved.
 * SPDX-License-Identifier: Apache-2.0
 */

#include "ledger/ledger_error.hpp"

OUTCOME_CPP_DEFINE_CATEGORY(exl::ledger, LedgerError, e) {
  using E = exl::ledger::LedgerError;
  switch (e) {
    case E::kInsufficientBalance:
      return "Insufficient unexpired balance";
    case E::kInsufficientBucketAmount:
      return "Bucket holds less than requested amount";
    case E::kTransferExpired:
      return "Requested bucket has expired";
    case E::kAmountOverflow:
      return "Amount is out of token range";
    default:
      return "Unknown error";
  }
}
