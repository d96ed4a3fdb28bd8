/**
 * Copyright Soramitsu Co., Ltd. All Rights Reserved.
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <ostream>

#include "clock/impl/manual_tick_clock.hpp"
#include "replay/script.hpp"
#include "token/expirable_token.hpp"

namespace exl::replay {
  using clock::ManualTickClock;
  using token::ExpirableToken;
  using window::SlidingWindow;
  using window::WindowConfig;

  /**
   * Runs script commands against a fresh token driven by manual clock.
   * Prints one line per command, failed operation prints its error and does
   * not stop the replay.
   */
  class Replayer {
   public:
    Replayer(const WindowConfig &config, std::ostream &out);

    /// @return number of failed commands
    size_t run(const std::vector<ScriptLine> &script);

    /// @return false if command failed
    bool execute(const Command &command);

    const ExpirableToken &token() const;

   private:
    outcome::result<void> apply(const Command &command);

    SlidingWindow window_;
    std::shared_ptr<ManualTickClock> clock_;
    ExpirableToken token_;
    std::ostream &out_;
  };
}  // namespace exl::replay
