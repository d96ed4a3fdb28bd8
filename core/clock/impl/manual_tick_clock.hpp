/**
 * Copyright Soramitsu Co., Ltd. All Rights Reserved.
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <atomic>

#include "clock/tick_clock.hpp"

namespace exl::clock {
  /**
   * Block height clock, moved forward by whoever imports blocks
   */
  class ManualTickClock : public TickClock {
   public:
    explicit ManualTickClock(Tick start = 0);

    outcome::result<Tick> currentTick() const override;

    ExpiryType expiryType() const override;

    void set(Tick tick);

    /// moves clock forward, saturates at max tick
    void advance(Tick ticks);

   private:
    std::atomic<Tick> tick_;
  };
}  // namespace exl::clock
