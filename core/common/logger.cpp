/**
 * Copyright Soramitsu Co., Ltd. All Rights Reserved.
 * SPDX-License-Identifier: Apache-2.0
 */

#include "common/logger.hpp"

#include <mutex>
#include <spdlog/sinks/basic_file_sink.h>
#include <spdlog/sinks/stdout_color_sinks.h>

namespace exl::common {
  namespace {
    std::mutex &loggersMutex() {
      static std::mutex mutex;
      return mutex;
    }

    spdlog::sink_ptr consoleSink() {
      static auto sink{std::make_shared<spdlog::sinks::stderr_color_sink_mt>()};
      return sink;
    }
  }  // namespace

  spdlog::sink_ptr file_sink;

  Logger createLogger(const std::string &tag) {
    std::lock_guard lock{loggersMutex()};
    if (auto logger{spdlog::get(tag)}) {
      return logger;
    }
    std::vector<spdlog::sink_ptr> sinks{consoleSink()};
    if (file_sink) {
      sinks.push_back(file_sink);
    }
    auto logger{
        std::make_shared<spdlog::logger>(tag, sinks.begin(), sinks.end())};
    logger->set_level(spdlog::get_level());
    spdlog::register_logger(logger);
    return logger;
  }

  void logToFile(const std::string &path) {
    std::lock_guard lock{loggersMutex()};
    file_sink = std::make_shared<spdlog::sinks::basic_file_sink_mt>(path);
    spdlog::apply_all([](const Logger &logger) {
      logger->sinks().push_back(file_sink);
    });
  }
}  // namespace exl::common
