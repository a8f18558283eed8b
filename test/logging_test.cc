#include "txproc/internal/logging.h"

#include <filesystem>
#include <fstream>
#include <sstream>
#include <string>

#include <gtest/gtest.h>

#include "txproc/api.h"

namespace fs = std::filesystem;

using txproc::Amount;
using txproc::Transaction;

namespace {

std::string ReadFile(const std::string& path) {
  std::ifstream file(path);
  if (!file.is_open()) {
    return "";
  }
  std::stringstream buffer;
  buffer << file.rdbuf();
  return buffer.str();
}

bool Contains(const std::string& str, const std::string& substring) { return str.find(substring) != std::string::npos; }

// resets the logger first, so the file handle is closed before removal
void CleanupLogFile(const std::string& log_file) {
  if (fs::exists(log_file)) {
    txproc::ConfigureLogging({});
    fs::remove(log_file);
  }
}

void RunSmallInput() {
  txproc::Engine engine({.thread_pool_size = 2});
  txproc::VectorTransactionSource source({
      Transaction::Deposit(1, 1, Amount::FromUnits(1)),
      Transaction::Withdrawal(1, 2, Amount::FromUnits(5)),
  });
  auto report = engine.Run(source);
  EXPECT_EQ(report.TotalRejected(), 1u);
}

}  // namespace

TEST(LoggingTest, InfoLevelSeesLifecycleAndRejections) {
  std::string log_file = "test_log_1.txt";
  CleanupLogFile(log_file);

  txproc::ConfigureLogging({
      .log_file_path = log_file,
  });
  RunSmallInput();
  txproc::internal::logging::GlobalLogger()->flush();

  std::string log_contents = ReadFile(log_file);
  EXPECT_TRUE(Contains(log_contents, "Engine started")) << "Log contents:\n" << log_contents;
  EXPECT_TRUE(Contains(log_contents, "Dispatch finished, summary_={routed=2,accounts=1,}"))
      << "Log contents:\n"
      << log_contents;
  EXPECT_TRUE(Contains(log_contents, "Transaction rejected, client_id=1,tx_id=2,kind=withdrawal,error=insufficient funds"))
      << "Log contents:\n"
      << log_contents;
  EXPECT_TRUE(Contains(log_contents, "Engine stopped")) << "Log contents:\n" << log_contents;
  EXPECT_FALSE(Contains(log_contents, "Applied deposit")) << "Debug logs should be filtered. Log contents:\n"
                                                          << log_contents;

  CleanupLogFile(log_file);
}

TEST(LoggingTest, ErrorLevelFiltersWarnings) {
  std::string log_file = "test_log_2.txt";
  CleanupLogFile(log_file);

  txproc::ConfigureLogging({
      .level = txproc::logging::LogLevel::kError,
      .log_file_path = log_file,
  });
  RunSmallInput();
  txproc::internal::logging::GlobalLogger()->flush();

  std::string log_contents = ReadFile(log_file);
  EXPECT_FALSE(Contains(log_contents, "Engine started")) << "Log contents:\n" << log_contents;
  EXPECT_FALSE(Contains(log_contents, "Transaction rejected")) << "Log contents:\n" << log_contents;

  CleanupLogFile(log_file);
}

TEST(LoggingTest, DebugLevelSeesEveryTransaction) {
  std::string log_file = "test_log_3.txt";
  CleanupLogFile(log_file);

  txproc::ConfigureLogging({
      .level = txproc::logging::LogLevel::kDebug,
      .log_file_path = log_file,
  });
  RunSmallInput();
  txproc::internal::logging::GlobalLogger()->flush();

  std::string log_contents = ReadFile(log_file);
  EXPECT_TRUE(Contains(log_contents, "Applied deposit tx=1 on client 1")) << "Log contents:\n" << log_contents;
  EXPECT_TRUE(Contains(log_contents, "Created account actor for client 1")) << "Log contents:\n" << log_contents;

  CleanupLogFile(log_file);
}

struct Point {
  int x;
  int y;
};

TEST(LoggingTest, DumpVarsUsesStreamOperatorOrReflection) {
  int count = 3;
  Amount amount = Amount::FromRaw(15000);
  Point point {.x = 1, .y = 2};
  EXPECT_EQ(TXP_DUMP_VARS(count, amount), "count=3,amount=1.5000");
  EXPECT_EQ(TXP_DUMP_VARS(point), "point={x=1,y=2,}");
}
