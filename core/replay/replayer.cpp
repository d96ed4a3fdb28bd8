/**
 * Copyright Soramitsu Co., Ltd. All Rights Reserved.
 * SPDX-License-Identifier: Apache-2.0
 */

#include "replay/replayer.hpp"

#include "common/logger.hpp"

namespace exl::replay {
  static common::Logger logger = common::createLogger("replay");

  /**
   * Applies one command, writes its output line
   */
  class CommandVisitor : public boost::static_visitor<outcome::result<void>> {
   public:
    CommandVisitor(const SlidingWindow &window,
                   ManualTickClock &clock,
                   ExpirableToken &token,
                   std::ostream &out)
        : window_{window}, clock_{clock}, token_{token}, out_{out} {}

    outcome::result<void> operator()(const command::SetTick &command) const {
      clock_.set(command.tick);
      return printTick();
    }

    outcome::result<void> operator()(const command::Advance &command) const {
      clock_.advance(command.ticks);
      return printTick();
    }

    outcome::result<void> operator()(const command::Mint &command) const {
      OUTCOME_TRY(token_.mint(command.account, command.amount));
      out_ << "ok" << std::endl;
      return outcome::success();
    }

    outcome::result<void> operator()(const command::Burn &command) const {
      OUTCOME_TRY(token_.burn(command.account, command.amount));
      out_ << "ok" << std::endl;
      return outcome::success();
    }

    outcome::result<void> operator()(const command::Transfer &command) const {
      OUTCOME_TRY(token_.transfer(command.from, command.to, command.amount));
      out_ << "ok" << std::endl;
      return outcome::success();
    }

    outcome::result<void> operator()(
        const command::TransferSlot &command) const {
      OUTCOME_TRY(token_.transferAtSlot(
          command.from, command.to, command.slot, command.amount));
      out_ << "ok" << std::endl;
      return outcome::success();
    }

    outcome::result<void> operator()(const command::Balance &command) const {
      OUTCOME_TRY(balance, token_.balanceOf(command.account));
      out_ << command.account << " " << balance << std::endl;
      return outcome::success();
    }

    outcome::result<void> operator()(const command::BalanceAt &command) const {
      out_ << command.account << " @" << command.slot << " "
           << token_.balanceOfAtSlot(command.account, command.slot)
           << std::endl;
      return outcome::success();
    }

    outcome::result<void> operator()(const command::Buckets &command) const {
      OUTCOME_TRY(tick, clock_.currentTick());
      const auto buckets{token_.ledger().listBuckets(command.account)};
      if (buckets.empty()) {
        out_ << command.account << " no buckets" << std::endl;
        return outcome::success();
      }
      for (const auto &bucket : buckets) {
        out_ << command.account << " slot " << bucket.slot << " "
             << bucket.amount;
        if (window_.isExpired(bucket.slot, tick)) {
          out_ << " expired";
        }
        out_ << std::endl;
      }
      return outcome::success();
    }

    outcome::result<void> operator()(const command::Prune &) const {
      OUTCOME_TRY(pruned, token_.prune());
      out_ << "pruned " << pruned << std::endl;
      return outcome::success();
    }

   private:
    outcome::result<void> printTick() const {
      OUTCOME_TRY(tick, clock_.currentTick());
      const auto position{window_.currentEraAndSlot(tick)};
      out_ << "tick " << tick << " slot " << window_.slotAt(tick) << " era "
           << position.era << std::endl;
      return outcome::success();
    }

    const SlidingWindow &window_;
    ManualTickClock &clock_;
    ExpirableToken &token_;
    std::ostream &out_;
  };

  Replayer::Replayer(const WindowConfig &config, std::ostream &out)
      : window_{config},
        clock_{std::make_shared<ManualTickClock>()},
        token_{"Replay", "RPL", clock_, window_},
        out_{out} {}

  size_t Replayer::run(const std::vector<ScriptLine> &script) {
    size_t failed{0};
    for (const auto &line : script) {
      if (!execute(line.command)) {
        logger->warn("script line {} failed", line.line);
        ++failed;
      }
    }
    return failed;
  }

  bool Replayer::execute(const Command &command) {
    const auto result{apply(command)};
    if (!result) {
      out_ << "error: " << result.error().message() << std::endl;
      return false;
    }
    return true;
  }

  const ExpirableToken &Replayer::token() const {
    return token_;
  }

  outcome::result<void> Replayer::apply(const Command &command) {
    return boost::apply_visitor(
        CommandVisitor{window_, *clock_, token_, out_}, command);
  }
}  // namespace exl::replay
