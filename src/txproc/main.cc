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

// txproc [options] <transactions.csv>
//
// Applies the transactions in the CSV file and prints the final state of every account to stdout.

#include <cstdlib>
#include <exception>
#include <iostream>
#include <optional>
#include <stdexcept>
#include <string>
#include <string_view>
#include <utility>

#include "txproc/api.h"

namespace {

struct CliOptions {
  std::string input_path;
  txproc::EngineConfig engine_config;
  txproc::logging::LogConfig log_config {.level = txproc::logging::LogLevel::kWarn};
  bool show_help = false;
};

void PrintUsage(const char* program) {
  std::cerr << "Usage: " << program << " [options] <transactions.csv>\n"
            << "\nOptions:\n"
            << "  --threads N                  Worker threads (default: hardware concurrency)\n"
            << "  --work-stealing              Use the work-stealing thread pool\n"
            << "  --allow-withdrawal-disputes  Accept disputes that reference a withdrawal\n"
            << "  --log-level LEVEL            debug|info|warn|error|fatal (default: warn)\n"
            << "  --log-file PATH              Write logs to PATH instead of stderr\n"
            << "  -h, --help                   Show this help message\n";
}

std::optional<txproc::logging::LogLevel> ParseLogLevel(std::string_view text) {
  using txproc::logging::LogLevel;
  if (text == "debug") return LogLevel::kDebug;
  if (text == "info") return LogLevel::kInfo;
  if (text == "warn") return LogLevel::kWarn;
  if (text == "error") return LogLevel::kError;
  if (text == "fatal") return LogLevel::kFatal;
  return std::nullopt;
}

// Throws std::invalid_argument on a malformed command line.
CliOptions ParseArgs(int argc, char* argv[]) {
  CliOptions options;
  std::optional<std::string> input_path;
  auto next_value = [&](int& i, std::string_view flag) -> std::string {
    if (i + 1 >= argc) {
      throw std::invalid_argument(std::string(flag) + " needs a value");
    }
    return argv[++i];
  };

  for (int i = 1; i < argc; ++i) {
    std::string arg = argv[i];
    if (arg == "-h" || arg == "--help") {
      options.show_help = true;
      return options;
    }
    if (arg == "--threads") {
      auto value = next_value(i, arg);
      size_t parsed_chars = 0;
      auto threads = std::stoul(value, &parsed_chars);
      if (parsed_chars != value.size() || threads == 0) {
        throw std::invalid_argument("--threads must be a positive integer, got " + value);
      }
      options.engine_config.thread_pool_size = threads;
    } else if (arg == "--work-stealing") {
      options.engine_config.scheduler = txproc::SchedulerKind::kWorkStealing;
    } else if (arg == "--allow-withdrawal-disputes") {
      options.engine_config.account_policy.allow_withdrawal_disputes = true;
    } else if (arg == "--log-level") {
      auto value = next_value(i, arg);
      auto level = ParseLogLevel(value);
      if (!level.has_value()) {
        throw std::invalid_argument("Unknown log level " + value);
      }
      options.log_config.level = *level;
    } else if (arg == "--log-file") {
      options.log_config.log_file_path = next_value(i, arg);
    } else if (arg.starts_with("-") && arg.size() > 1) {
      throw std::invalid_argument("Unknown option " + arg);
    } else {
      if (input_path.has_value()) {
        throw std::invalid_argument("Expected exactly one input file, got " + *input_path + " and " + arg);
      }
      input_path = arg;
    }
  }
  if (!input_path.has_value()) {
    throw std::invalid_argument("Missing input file");
  }
  options.input_path = std::move(*input_path);
  return options;
}

}  // namespace

int main(int argc, char* argv[]) {
  CliOptions options;
  try {
    options = ParseArgs(argc, argv);
  } catch (const std::exception& e) {
    std::cerr << "Error: " << e.what() << "\n";
    PrintUsage(argv[0]);
    return EXIT_FAILURE;
  }
  if (options.show_help) {
    PrintUsage(argv[0]);
    return EXIT_SUCCESS;
  }

  try {
    txproc::ConfigureLogging(options.log_config);
    txproc::internal::logging::InstallFallbackExceptionHandler();

    txproc::CsvTransactionSource source(options.input_path);
    txproc::Engine engine(options.engine_config);
    txproc::Report report = engine.Run(source);
    txproc::WriteReport(std::cout, report);
  } catch (const std::exception& e) {
    txproc::internal::logging::Critical("{}", e.what());
    txproc::internal::logging::GlobalLogger()->flush();
    return EXIT_FAILURE;
  }
  return EXIT_SUCCESS;
}
