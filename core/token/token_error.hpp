/**
 * Copyright Soramitsu Co., Ltd. All Rights Reserved.
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include "common/outcome.hpp"

namespace exl::token {
  enum class TokenError {
    kInvalidReceiver = 1,
    kInvalidSender,
    kAllowanceUnavailable,
  };
}  // namespace exl::token

OUTCOME_HPP_DECLARE_ERROR(exl::token, TokenError);
