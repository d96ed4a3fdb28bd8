/**
 * Copyright Soramitsu Co., Ltd. All Rights Reserved.
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <string>
#include <string_view>
#include <vector>

#include "common/outcome.hpp"

namespace exl::common {
  using Bytes = std::vector<uint8_t>;

  enum class UnhexError { kNotEnoughInput = 1, kNonHexInput };

  /**
   * @brief Converts bytes to lower case hex representation, no 0x prefix
   */
  std::string hex_lower(const uint8_t *data, size_t size);

  /**
   * @brief Converts hex representation to bytes
   * @param hex string with even number of hex digits, optional 0x prefix
   * @return bytes or error
   */
  outcome::result<Bytes> unhex(std::string_view hex);
}  // namespace exl::common

OUTCOME_HPP_DECLARE_ERROR(exl::common, UnhexError);
