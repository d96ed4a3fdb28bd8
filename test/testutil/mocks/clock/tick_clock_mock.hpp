/**
 * Copyright Soramitsu Co., Ltd. All Rights Reserved.
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <gmock/gmock.h>

#include "clock/tick_clock.hpp"

namespace exl::clock {
  class TickClockMock : public TickClock {
   public:
    MOCK_CONST_METHOD0(currentTick, outcome::result<Tick>());
    MOCK_CONST_METHOD0(expiryType, ExpiryType());
  };
}  // namespace exl::clock
