/**
 * Copyright Soramitsu Co., Ltd. All Rights Reserved.
 * SPDX-License-Identifier: Apache-2.0
 */

#include "token/token_error.hpp"

OUTCOME_CPP_DEFINE_CATEGORY(exl::token, TokenError, e) {
  using E = exl::token::TokenError;
  switch (e) {
    case E::kInvalidReceiver:
      return "Invalid receiver";
    case E::kInvalidSender:
      return "Invalid sender";
    case E::kAllowanceUnavailable:
      return "No allowance provider configured";
    default:
      return "Unknown error";
  }
}
