/**
 * Copyright Soramitsu Co., Ltd. All Rights Reserved.
 * SPDX-License-Identifier: Apache-2.0
 */

#include "replay/script.hpp"

#include <algorithm>
#include <boost/algorithm/string/classification.hpp>
#include <boost/algorithm/string/split.hpp>
#include <boost/algorithm/string/trim.hpp>
#include <boost/lexical_cast.hpp>

#include "common/logger.hpp"

OUTCOME_CPP_DEFINE_CATEGORY(exl::replay, ScriptError, e) {
  using E = exl::replay::ScriptError;
  switch (e) {
    case E::kUnknownCommand:
      return "Unknown script command";
    case E::kWrongArity:
      return "Wrong number of command arguments";
    case E::kBadNumber:
      return "Argument is not a decimal number";
    case E::kBadAddress:
      return "Argument is not a hex address";
    default:
      return "Unknown error";
  }
}

namespace exl::replay {
  namespace {
    using Args = std::vector<std::string>;

    common::Logger logger() {
      static common::Logger logger = common::createLogger("replay");
      return logger;
    }

    bool isDecimal(const std::string &value) {
      return !value.empty()
             && std::all_of(value.begin(), value.end(), [](char c) {
                  return c >= '0' && c <= '9';
                });
    }

    outcome::result<uint64_t> parseUint(const std::string &value) {
      if (!isDecimal(value)) {
        return ScriptError::kBadNumber;
      }
      try {
        return boost::lexical_cast<uint64_t>(value);
      } catch (const boost::bad_lexical_cast &) {
        return ScriptError::kBadNumber;
      }
    }

    /// range is checked by ledger
    outcome::result<TokenAmount> parseAmount(const std::string &value) {
      if (!isDecimal(value)) {
        return ScriptError::kBadNumber;
      }
      return TokenAmount{value};
    }

    outcome::result<Address> parseAddress(const std::string &value) {
      auto _address{Address::fromHex(value)};
      if (!_address) {
        return ScriptError::kBadAddress;
      }
      return _address.value();
    }

    outcome::result<Command> parseArgs(const std::string &name,
                                       const Args &args) {
      auto arity{[&](size_t expected) -> outcome::result<void> {
        if (args.size() != expected) {
          return ScriptError::kWrongArity;
        }
        return outcome::success();
      }};
      if (name == "tick") {
        OUTCOME_TRY(arity(1));
        OUTCOME_TRY(tick, parseUint(args[0]));
        return command::SetTick{tick};
      }
      if (name == "advance") {
        OUTCOME_TRY(arity(1));
        OUTCOME_TRY(ticks, parseUint(args[0]));
        return command::Advance{ticks};
      }
      if (name == "mint" || name == "burn") {
        OUTCOME_TRY(arity(2));
        OUTCOME_TRY(account, parseAddress(args[0]));
        OUTCOME_TRY(amount, parseAmount(args[1]));
        if (name == "mint") {
          return command::Mint{account, amount};
        }
        return command::Burn{account, amount};
      }
      if (name == "transfer") {
        OUTCOME_TRY(arity(3));
        OUTCOME_TRY(from, parseAddress(args[0]));
        OUTCOME_TRY(to, parseAddress(args[1]));
        OUTCOME_TRY(amount, parseAmount(args[2]));
        return command::Transfer{from, to, amount};
      }
      if (name == "transfer-slot") {
        OUTCOME_TRY(arity(4));
        OUTCOME_TRY(from, parseAddress(args[0]));
        OUTCOME_TRY(to, parseAddress(args[1]));
        OUTCOME_TRY(slot, parseUint(args[2]));
        OUTCOME_TRY(amount, parseAmount(args[3]));
        return command::TransferSlot{from, to, slot, amount};
      }
      if (name == "balance" || name == "buckets") {
        OUTCOME_TRY(arity(1));
        OUTCOME_TRY(account, parseAddress(args[0]));
        if (name == "balance") {
          return command::Balance{account};
        }
        return command::Buckets{account};
      }
      if (name == "balance-at") {
        OUTCOME_TRY(arity(2));
        OUTCOME_TRY(account, parseAddress(args[0]));
        OUTCOME_TRY(slot, parseUint(args[1]));
        return command::BalanceAt{account, slot};
      }
      if (name == "prune") {
        OUTCOME_TRY(arity(0));
        return command::Prune{};
      }
      return ScriptError::kUnknownCommand;
    }
  }  // namespace

  outcome::result<boost::optional<Command>> parseCommand(
      std::string_view line) {
    std::string text{line.substr(0, line.find('#'))};
    boost::algorithm::trim(text);
    if (text.empty()) {
      return boost::none;
    }
    Args words;
    boost::algorithm::split(words,
                            text,
                            boost::algorithm::is_space(),
                            boost::algorithm::token_compress_on);
    const Args args(std::next(words.begin()), words.end());
    OUTCOME_TRY(command, parseArgs(words[0], args));
    return boost::make_optional(std::move(command));
  }

  outcome::result<std::vector<ScriptLine>> parseScript(std::istream &input,
                                                       size_t &error_line) {
    std::vector<ScriptLine> script;
    std::string line;
    size_t number{0};
    while (std::getline(input, line)) {
      ++number;
      auto _command{parseCommand(line)};
      if (!_command) {
        error_line = number;
        logger()->error(
            "script line {}: {}", number, _command.error().message());
        return _command.error();
      }
      if (_command.value()) {
        script.push_back({number, std::move(*_command.value())});
      }
    }
    return script;
  }
}  // namespace exl::replay
