/**
 * Copyright Soramitsu Co., Ltd. All Rights Reserved.
 * SPDX-License-Identifier: Apache-2.0
 */

#include "primitives/address/address.hpp"

#include <algorithm>

#include "common/hexutil.hpp"

OUTCOME_CPP_DEFINE_CATEGORY(exl::primitives::address, AddressError, e) {
  using exl::primitives::address::AddressError;
  switch (e) {
    case AddressError::kInvalidLength:
      return "Address must be 20 bytes long";
    case AddressError::kInvalidHex:
      return "Address is not a hex string";
    default:
      return "Unknown error";
  }
}

namespace exl::primitives::address {
  outcome::result<Address> Address::fromHex(std::string_view hex) {
    auto bytes{common::unhex(hex)};
    if (!bytes) {
      return AddressError::kInvalidHex;
    }
    if (bytes.value().size() != kAddressSize) {
      return AddressError::kInvalidLength;
    }
    Address address;
    std::copy(bytes.value().begin(), bytes.value().end(), address.bytes.begin());
    return address;
  }

  std::string Address::toHex() const {
    return "0x" + common::hex_lower(bytes.data(), bytes.size());
  }

  bool Address::isZero() const {
    return std::all_of(
        bytes.begin(), bytes.end(), [](auto byte) { return byte == 0; });
  }
}  // namespace exl::primitives::address
