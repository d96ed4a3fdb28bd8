/**
 * Copyright Soramitsu Co., Ltd. All Rights Reserved.
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include "common/outcome.hpp"
#include "primitives/address/address.hpp"
#include "primitives/types.hpp"

namespace exl::token {
  using primitives::TokenAmount;
  using primitives::address::Address;

  /**
   * Allowance bookkeeping owned by the surrounding token implementation.
   * Token only asks it to consume allowance before moving funds on behalf of
   * owner.
   *
   * spendAllowance is called on the thread of transferFrom after the transfer
   * passed its ledger checks. It may call the token from that thread. If it
   * moves funds of owner itself, the pending transfer is checked again and
   * may still fail after allowance was spent.
   */
  class AllowanceGate {
   public:
    virtual ~AllowanceGate() = default;

    /**
     * Consumes amount of allowance given by owner to spender
     * @return error of the allowance implementation if it is not enough
     */
    virtual outcome::result<void> spendAllowance(const Address &owner,
                                                 const Address &spender,
                                                 const TokenAmount &amount) = 0;
  };
}  // namespace exl::token
