/**
 * Copyright Soramitsu Co., Ltd. All Rights Reserved.
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <memory>

#include "clock/tick_clock.hpp"
#include "clock/utc_clock.hpp"

namespace exl::clock {
  /**
   * Timestamp clock, ticks are milliseconds elapsed since genesis
   */
  class UtcTickClockImpl : public TickClock {
   public:
    UtcTickClockImpl(std::shared_ptr<UTCClock> utc_clock,
                     milliseconds genesis_time);

    milliseconds genesisTime() const;

    outcome::result<Tick> currentTick() const override;

    ExpiryType expiryType() const override;

   private:
    std::shared_ptr<UTCClock> utc_clock_;
    milliseconds genesis_time_;
  };
}  // namespace exl::clock
