/**
 * Copyright Soramitsu Co., Ltd. All Rights Reserved.
 * SPDX-License-Identifier: Apache-2.0
 */

#include "clock/impl/manual_tick_clock.hpp"

#include <limits>

namespace exl::clock {
  ManualTickClock::ManualTickClock(Tick start) : tick_{start} {}

  ExpiryType ManualTickClock::expiryType() const {
    return ExpiryType::kBlocksBased;
  }

  outcome::result<Tick> ManualTickClock::currentTick() const {
    return tick_.load();
  }

  void ManualTickClock::set(Tick tick) {
    tick_ = tick;
  }

  void ManualTickClock::advance(Tick ticks) {
    auto current{tick_.load()};
    Tick next;
    do {
      next = ticks > std::numeric_limits<Tick>::max() - current
                 ? std::numeric_limits<Tick>::max()
                 : current + ticks;
    } while (!tick_.compare_exchange_weak(current, next));
  }
}  // namespace exl::clock
