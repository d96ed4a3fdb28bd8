/**
 * Copyright Soramitsu Co., Ltd. All Rights Reserved.
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <cstdint>

#include "primitives/big_int.hpp"

namespace exl::primitives {
  using TokenAmount = BigInt;

  /**
   * @brief absolute time coordinate supplied by the environment, either block
   * height or timestamp
   */
  using Tick = uint64_t;

  /// flat slot counter, floor(tick / unit duration)
  using SlotIndex = uint64_t;

  using Era = uint64_t;

  using SlotInEra = uint64_t;

  /// largest amount representable by the token standard, 2^256 - 1
  const TokenAmount kMaxTokenAmount{(TokenAmount{1} << 256) - 1};

  /**
   * Amount is representable by the token standard
   */
  inline bool isValidAmount(const TokenAmount &amount) {
    return amount >= 0 && amount <= kMaxTokenAmount;
  }
}  // namespace exl::primitives
