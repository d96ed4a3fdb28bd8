/**
 * Copyright Soramitsu Co., Ltd. All Rights Reserved.
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include "common/outcome.hpp"

namespace exl::ledger {
  enum class LedgerError {
    kInsufficientBalance = 1,
    kInsufficientBucketAmount,
    kTransferExpired,
    kAmountOverflow,
  };
}  // namespace exl::ledger

OUTCOME_HPP_DECLARE_ERROR(exl::ledger, LedgerError);
