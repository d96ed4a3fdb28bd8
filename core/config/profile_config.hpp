/**
 * Copyright Soramitsu Co., Ltd. All Rights Reserved.
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <boost/optional.hpp>
#include <boost/program_options.hpp>
#include <string>

#include "window/window_config.hpp"

namespace exl::config {
  using boost::program_options::options_description;
  using window::TransferStamping;
  using window::WindowConfig;

  /**
   * Window profile name validated by program options
   */
  struct Profile : public std::string {};

  /**
   * Stamping policy name validated by program options
   */
  struct Stamping {
    TransferStamping value{TransferStamping::kPreserveMintSlot};
  };

  /**
   * Raw window options, profile values are overridden by explicit ones
   */
  struct WindowOptions {
    Profile profile{{"erc7818"}};
    boost::optional<uint64_t> block_time_ms;
    boost::optional<uint64_t> frame_size;
    boost::optional<uint64_t> slots_per_era;
    boost::optional<uint64_t> unit_duration;
    Stamping stamping;
  };

  /**
   * Creates program option description for window 'profile' and its
   * parameters.
   *
   * @param options - filled when parsed values are notified
   * @return window program option description
   */
  options_description configProfile(WindowOptions &options);

  /**
   * Builds validated window config from profile and overrides
   */
  outcome::result<WindowConfig> resolveWindowConfig(
      const WindowOptions &options);
}  // namespace exl::config
