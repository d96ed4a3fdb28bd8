/**
 * Copyright Soramitsu Co., Ltd. All Rights Reserved.
 * SPDX-License-Identifier: Apache-2.0
 */

#include <boost/program_options/errors.hpp>
#include <fstream>
#include <iostream>

#include "replay/config.hpp"
#include "replay/replayer.hpp"

namespace exl::replay {
  static common::Logger logger = common::createLogger("replay");

  int main(const Config &config) {
    std::ifstream script_file{config.script_path.string()};
    if (!script_file.good()) {
      logger->error("cannot open script {}", config.script_path.string());
      return EXIT_FAILURE;
    }
    size_t error_line{0};
    auto _script{parseScript(script_file, error_line)};
    if (!_script) {
      std::cerr << config.script_path.string() << ":" << error_line << ": "
                << _script.error().message() << std::endl;
      return EXIT_FAILURE;
    }
    logger->info("window: {} ticks per slot, {} slots per era, {} slots valid",
                 config.window.unit_duration,
                 config.window.slots_per_era,
                 config.window.validity_window_slots);
    Replayer replayer{config.window, std::cout};
    const auto failed{replayer.run(_script.value())};
    logger->info("{} commands, {} failed", _script.value().size(), failed);
    return EXIT_SUCCESS;
  }
}  // namespace exl::replay

int main(int argc, char **argv) {
  try {
    const auto _config{exl::replay::Config::read(argc, argv)};
    if (!_config) {
      std::cerr << _config.error().message() << std::endl;
      return EXIT_FAILURE;
    }
    return exl::replay::main(_config.value());
  } catch (const boost::program_options::error &e) {
    std::cerr << e.what() << std::endl;
    return EXIT_FAILURE;
  }
}
