/**
 * Copyright Soramitsu Co., Ltd. All Rights Reserved.
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <boost/filesystem/path.hpp>
#include <boost/optional.hpp>

#include "common/logger.hpp"
#include "common/outcome.hpp"
#include "window/window_config.hpp"

namespace exl::replay {
  constexpr auto kConfigFileName{"ledger_replay.cfg"};

  struct Config {
    window::WindowConfig window;
    boost::filesystem::path script_path;
    spdlog::level::level_enum log_level{spdlog::level::info};
    boost::optional<std::string> log_file;

    /**
     * Reads command line, then ledger_replay.cfg next to the script.
     * Command line values win.
     */
    static outcome::result<Config> read(int argc, char **argv);
  };

  spdlog::level::level_enum getLogLevel(char level);
}  // namespace exl::replay
