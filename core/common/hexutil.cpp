/**
 * Copyright Soramitsu Co., Ltd. All Rights Reserved.
 * SPDX-License-Identifier: Apache-2.0
 */

#include "common/hexutil.hpp"

#include <boost/algorithm/hex.hpp>
#include <iterator>

OUTCOME_CPP_DEFINE_CATEGORY(exl::common, UnhexError, e) {
  using exl::common::UnhexError;
  switch (e) {
    case UnhexError::kNotEnoughInput:
      return "Input contains odd number of characters";
    case UnhexError::kNonHexInput:
      return "Input contains non-hex characters";
    default:
      return "Unknown error";
  }
}

namespace exl::common {
  std::string hex_lower(const uint8_t *data, size_t size) {
    std::string res;
    res.reserve(size * 2);
    boost::algorithm::hex_lower(data, data + size, std::back_inserter(res));
    return res;
  }

  outcome::result<Bytes> unhex(std::string_view hex) {
    if (hex.size() >= 2 && hex[0] == '0' && (hex[1] == 'x' || hex[1] == 'X')) {
      hex.remove_prefix(2);
    }
    Bytes blob;
    blob.reserve(hex.size() / 2);
    try {
      boost::algorithm::unhex(hex.begin(), hex.end(), std::back_inserter(blob));
      return blob;
    } catch (const boost::algorithm::not_enough_input &) {
      return UnhexError::kNotEnoughInput;
    } catch (const boost::algorithm::non_hex_input &) {
      return UnhexError::kNonHexInput;
    }
  }
}  // namespace exl::common
