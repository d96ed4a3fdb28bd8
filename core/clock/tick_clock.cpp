/**
 * Copyright Soramitsu Co., Ltd. All Rights Reserved.
 * SPDX-License-Identifier: Apache-2.0
 */

#include "clock/tick_clock.hpp"

OUTCOME_CPP_DEFINE_CATEGORY(exl::clock, TickClockError, e) {
  using exl::clock::TickClockError;
  switch (e) {
    case TickClockError::kBeforeGenesis:
      return "Current time is before genesis time";
    default:
      return "Unknown error";
  }
}
