/**
 * Copyright Soramitsu Co., Ltd. All Rights Reserved.
 * SPDX-License-Identifier: Apache-2.0
 */

#include "config/profile_config.hpp"

#include "cli/validate/with.hpp"

namespace exl::config {
  namespace po = boost::program_options;

  /**
   * Checks that profile name is expected one.
   */
  CLI_VALIDATE(Profile) {
    validateOneOf<Profile>(out,
                           values,
                           {{"erc7818", Profile{{"erc7818"}}},
                            {"erc7858", Profile{{"erc7858"}}},
                            {"custom", Profile{{"custom"}}}});
  }

  CLI_VALIDATE(Stamping) {
    validateOneOf<Stamping>(
        out,
        values,
        {{"preserve", Stamping{TransferStamping::kPreserveMintSlot}},
         {"restamp", Stamping{TransferStamping::kRestampCurrentSlot}}});
  }

  options_description configProfile(WindowOptions &options) {
    options_description optionsDescription("Window options");
    auto option{optionsDescription.add_options()};
    option("profile",
           po::value(&options.profile)->default_value(options.profile,
                                                      options.profile),
           "Sliding window profile that defines block time, frame size and "
           "slots per era. Supported profiles: \n"
           " * 'erc7818' - 400 ms blocks, 4 slots per yearly era, 2 slots "
           "frame\n"
           " * 'erc7858' - 4800 ms blocks, one slot epochs, 4 epochs frame\n"
           " * 'custom' - requires unit-duration, slots-per-era, frame-size\n");
    option("block-time",
           po::value(&options.block_time_ms),
           "block time in milliseconds, [100, 600000]");
    option("frame-size",
           po::value(&options.frame_size),
           "validity window in slots");
    option("slots-per-era", po::value(&options.slots_per_era));
    option("unit-duration",
           po::value(&options.unit_duration),
           "ticks per slot, custom profile only");
    option("stamping",
           po::value(&options.stamping),
           "transferred units stamping, [preserve, restamp]");
    return optionsDescription;
  }

  outcome::result<WindowConfig> resolveWindowConfig(
      const WindowOptions &options) {
    const auto stamping{options.stamping.value};
    if (options.profile == "custom") {
      return window::makeWindowConfig(options.unit_duration.value_or(0),
                                      options.slots_per_era.value_or(0),
                                      options.frame_size.value_or(0),
                                      stamping);
    }
    uint64_t block_time_ms{400};
    uint64_t frame_size{2};
    uint64_t slots_per_era{4};
    if (options.profile == "erc7858") {
      block_time_ms = 4800;
      frame_size = 4;
      slots_per_era = 1;
    }
    return window::windowConfigFromBlockTime(
        options.block_time_ms.value_or(block_time_ms),
        options.frame_size.value_or(frame_size),
        options.slots_per_era.value_or(slots_per_era),
        stamping);
  }
}  // namespace exl::config
