// Copyright 2025 The txproc Authors.
//
// Licensed under the Apache License, Version 2.0 (the "License");
// you may not use this file except in compliance with the License.
// You may obtain a copy of the License at
//
//   http://www.apache.org/licenses/LICENSE-2.0
//
// Unless required by applicable law or agreed to in writing, software
// distributed under the License is distributed on an "AS IS" BASIS,
// WITHOUT WARRANTIES OR CONDITIONS OF ANY KIND, either express or implied.
// See the License for the specific language governing permissions and
// limitations under the License.

#include "txproc/internal/logging.h"

#include <cstdlib>
#include <typeinfo>

#include <spdlog/spdlog.h>

#include "spdlog/sinks/basic_file_sink.h"
#include "spdlog/sinks/stdout_color_sinks.h"

namespace txproc::internal::logging {
using txproc::logging::LogConfig;
using txproc::logging::LogLevel;

spdlog::level::level_enum ToSpdlogLevel(LogLevel level) {
  switch (level) {
    case LogLevel::kDebug:
      return spdlog::level::debug;
    case LogLevel::kInfo:
      return spdlog::level::info;
    case LogLevel::kWarn:
      return spdlog::level::warn;
    case LogLevel::kError:
      return spdlog::level::err;
    case LogLevel::kFatal:
      return spdlog::level::critical;
  }
  TXP_THROW << "Invalid log level: " << level;
}

std::unique_ptr<spdlog::logger> CreateLoggerUsingConfig(const LogConfig& config) {
  constexpr char kLoggerName[] = "txproc";
  std::unique_ptr<spdlog::logger> logger;
  if (config.log_file_path.empty()) {
    logger = std::make_unique<spdlog::logger>(kLoggerName, std::make_shared<spdlog::sinks::stderr_color_sink_mt>());
  } else {
    logger = std::make_unique<spdlog::logger>(
        kLoggerName, std::make_shared<spdlog::sinks::basic_file_sink_mt>(config.log_file_path));
  }
  logger->set_level(ToSpdlogLevel(config.level));
  logger->set_pattern(kDefaultLoggerPattern);
  return logger;
}

std::unique_ptr<spdlog::logger>& GlobalLogger() {
  static std::unique_ptr<spdlog::logger> global_logger = CreateLoggerUsingConfig({});
  return global_logger;
}

void InstallFallbackExceptionHandler() {
  std::set_terminate([] {
    if (auto ex = std::current_exception()) {
      try {
        std::rethrow_exception(ex);
      } catch (const std::exception& e) {
        Critical("terminate called with an active exception, type: {}, what: {}", typeid(e).name(), e.what());
      } catch (...) {
        Critical("terminate called with an unknown exception");
      }
    } else {
      Critical("terminate called without an active exception");
    }
    GlobalLogger()->flush();
    std::abort();
  });
}
}  // namespace txproc::internal::logging

namespace txproc {
void ConfigureLogging(const logging::LogConfig& config) {
  internal::logging::GlobalLogger() = internal::logging::CreateLoggerUsingConfig(config);
}
}  // namespace txproc
