/**
 * Copyright Soramitsu Co., Ltd. All Rights Reserved.
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <chrono>

namespace exl::clock {
  using UnixTime = std::chrono::seconds;
  using std::chrono::microseconds;
  using std::chrono::milliseconds;
}  // namespace exl::clock
