/**
 * Copyright Soramitsu Co., Ltd. All Rights Reserved.
 * SPDX-License-Identifier: Apache-2.0
 */

#include "clock/impl/utc_tick_clock_impl.hpp"

namespace exl::clock {
  UtcTickClockImpl::UtcTickClockImpl(std::shared_ptr<UTCClock> utc_clock,
                                     milliseconds genesis_time)
      : utc_clock_{std::move(utc_clock)}, genesis_time_{genesis_time} {}

  milliseconds UtcTickClockImpl::genesisTime() const {
    return genesis_time_;
  }

  ExpiryType UtcTickClockImpl::expiryType() const {
    return ExpiryType::kTimeBased;
  }

  outcome::result<Tick> UtcTickClockImpl::currentTick() const {
    const auto now{utc_clock_->nowMillis()};
    if (now < genesis_time_) {
      return TickClockError::kBeforeGenesis;
    }
    return static_cast<Tick>((now - genesis_time_).count());
  }
}  // namespace exl::clock
