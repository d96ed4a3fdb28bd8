/**
 * Copyright Soramitsu Co., Ltd. All Rights Reserved.
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include "common/outcome.hpp"
#include "primitives/types.hpp"

namespace exl::clock {
  enum class TickClockError { kBeforeGenesis = 1 };

  /// unit ticks are counted in
  enum class ExpiryType { kBlocksBased, kTimeBased };

  using primitives::Tick;

  /**
   * Source of the absolute time coordinate the ledger is evaluated at.
   * Ticks are block heights or timestamps depending on the implementation.
   */
  class TickClock {
   public:
    virtual outcome::result<Tick> currentTick() const = 0;
    virtual ExpiryType expiryType() const = 0;
    virtual ~TickClock() = default;
  };
}  // namespace exl::clock

OUTCOME_HPP_DECLARE_ERROR(exl::clock, TickClockError);
