/**
 * Copyright Soramitsu Co., Ltd. All Rights Reserved.
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <array>
#include <functional>
#include <ostream>
#include <string>
#include <string_view>

#include "common/cmp.hpp"
#include "common/outcome.hpp"

namespace exl::primitives::address {
  /**
   * @brief Potential errors parsing account addresses
   */
  enum class AddressError {
    kInvalidLength = 1, /**< Not 20 bytes */
    kInvalidHex,        /**< Not a hex string */
  };

  constexpr size_t kAddressSize{20};

  /**
   * @brief Address refers to an account holding expirable balance
   */
  struct Address {
    std::array<uint8_t, kAddressSize> bytes{};

    /**
     * @brief Parses "0x" prefixed or bare 40 digit hex string
     */
    static outcome::result<Address> fromHex(std::string_view hex);

    /**
     * @brief Lower case "0x" prefixed representation
     */
    std::string toHex() const;

    /**
     * @brief Zero address is reserved for mint source and burn sink
     */
    bool isZero() const;

    bool operator==(const Address &other) const {
      return bytes == other.bytes;
    }

    bool operator<(const Address &other) const {
      return bytes < other.bytes;
    }
  };
  EXL_OPERATOR_NOT_EQUAL(Address)

  const Address kZeroAddress{};

  inline std::ostream &operator<<(std::ostream &os, const Address &address) {
    return os << address.toHex();
  }
}  // namespace exl::primitives::address

namespace std {
  template <>
  struct hash<exl::primitives::address::Address> {
    size_t operator()(const exl::primitives::address::Address &address) const {
      size_t seed{0};
      for (auto byte : address.bytes) {
        seed = seed * 31 + byte;
      }
      return seed;
    }
  };
}  // namespace std

OUTCOME_HPP_DECLARE_ERROR(exl::primitives::address, AddressError);
