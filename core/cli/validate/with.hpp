/**
 * Copyright Soramitsu Co., Ltd. All Rights Reserved.
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <boost/program_options/errors.hpp>
#include <boost/program_options/value_semantic.hpp>
#include <boost/throw_exception.hpp>
#include <initializer_list>
#include <string_view>
#include <utility>

#define CLI_VALIDATE(TYPE) \
  inline void validate(    \
      boost::any &out, const std::vector<std::string> &values, TYPE *, int)

namespace exl {
  template <typename T>
  using CliChoices = std::initializer_list<std::pair<std::string_view, T>>;

  /**
   * Accepts single option value equal to one of choice names, stores value
   * paired with the name
   */
  template <typename T>
  void validateOneOf(boost::any &out,
                     const std::vector<std::string> &values,
                     CliChoices<T> choices) {
    namespace po = boost::program_options;
    po::validators::check_first_occurrence(out);
    const auto &value{po::validators::get_single_string(values)};
    for (const auto &[name, choice] : choices) {
      if (name == value) {
        out = choice;
        return;
      }
    }
    boost::throw_exception(po::invalid_option_value{value});
  }
}  // namespace exl
