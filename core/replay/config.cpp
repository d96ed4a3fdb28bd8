/**
 * Copyright Soramitsu Co., Ltd. All Rights Reserved.
 * SPDX-License-Identifier: Apache-2.0
 */

#include "replay/config.hpp"

#include <boost/filesystem.hpp>
#include <boost/program_options.hpp>
#include <cstdlib>
#include <fstream>
#include <iostream>

#include "config/profile_config.hpp"

namespace exl::replay {
  using config::configProfile;
  using config::resolveWindowConfig;
  using config::WindowOptions;

  spdlog::level::level_enum getLogLevel(char level) {
    switch (level) {
      case 'e':
        return spdlog::level::err;
      case 'w':
        return spdlog::level::warn;
      case 'd':
        return spdlog::level::debug;
      case 't':
        return spdlog::level::trace;
    }
    return spdlog::level::info;
  }

  outcome::result<Config> Config::read(int argc, char **argv) {
    Config config;
    struct {
      char log_level;
      WindowOptions window;
    } raw;
    namespace po = boost::program_options;
    po::options_description desc("Ledger replay options");
    auto option{desc.add_options()};
    option("help,h", "print usage message");
    option("script",
           po::value(&config.script_path)->required(),
           "script file, one command per line");
    option("log,l",
           po::value(&raw.log_level)->default_value('i'),
           "log level, [e,w,i,d,t]");
    option("log-file", po::value(&config.log_file), "duplicate log to file");
    desc.add(configProfile(raw.window));

    po::positional_options_description positional;
    positional.add("script", 1);

    po::variables_map vm;
    po::store(po::command_line_parser(argc, argv)
                  .options(desc)
                  .positional(positional)
                  .run(),
              vm);
    if (vm.count("help") != 0) {
      std::cerr << desc << std::endl;
      exit(EXIT_SUCCESS);
    }
    if (vm.count("script") != 0) {
      const auto config_path{
          vm["script"].as<boost::filesystem::path>().parent_path()
          / kConfigFileName};
      std::ifstream config_file{config_path.string()};
      if (config_file.good()) {
        po::store(po::parse_config_file(config_file, desc), vm);
      }
    }
    po::notify(vm);

    config.log_level = getLogLevel(raw.log_level);
    spdlog::set_level(config.log_level);
    if (config.log_file) {
      common::logToFile(*config.log_file);
    }

    OUTCOME_TRYA(config.window, resolveWindowConfig(raw.window));
    return config;
  }
}  // namespace exl::replay
