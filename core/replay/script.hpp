/**
 * Copyright Soramitsu Co., Ltd. All Rights Reserved.
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <boost/optional.hpp>
#include <boost/variant.hpp>
#include <istream>
#include <string_view>
#include <vector>

#include "common/outcome.hpp"
#include "primitives/address/address.hpp"
#include "primitives/types.hpp"

namespace exl::replay {
  using primitives::SlotIndex;
  using primitives::Tick;
  using primitives::TokenAmount;
  using primitives::address::Address;

  enum class ScriptError {
    kUnknownCommand = 1,
    kWrongArity,
    kBadNumber,
    kBadAddress,
  };

  namespace command {
    /// sets clock to absolute tick
    struct SetTick {
      Tick tick{};
    };

    struct Advance {
      Tick ticks{};
    };

    struct Mint {
      Address account;
      TokenAmount amount;
    };

    struct Burn {
      Address account;
      TokenAmount amount;
    };

    struct Transfer {
      Address from;
      Address to;
      TokenAmount amount;
    };

    struct TransferSlot {
      Address from;
      Address to;
      SlotIndex slot{};
      TokenAmount amount;
    };

    struct Balance {
      Address account;
    };

    struct BalanceAt {
      Address account;
      SlotIndex slot{};
    };

    struct Buckets {
      Address account;
    };

    struct Prune {};
  }  // namespace command

  using Command = boost::variant<command::SetTick,
                                 command::Advance,
                                 command::Mint,
                                 command::Burn,
                                 command::Transfer,
                                 command::TransferSlot,
                                 command::Balance,
                                 command::BalanceAt,
                                 command::Buckets,
                                 command::Prune>;

  struct ScriptLine {
    /// 1-based line number in script
    size_t line{};
    Command command;
  };

  /**
   * Parses one script line. Text after '#' is a comment.
   * @return none for blank and comment-only lines
   */
  outcome::result<boost::optional<Command>> parseCommand(std::string_view line);

  /**
   * Parses whole script, stops at first bad line
   * @param[out] error_line - line number of the failed line
   */
  outcome::result<std::vector<ScriptLine>> parseScript(std::istream &input,
                                                       size_t &error_line);
}  // namespace exl::replay

OUTCOME_HPP_DECLARE_ERROR(exl::replay, ScriptError);
