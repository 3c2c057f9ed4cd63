#include <gtest/gtest.h>

#include <iostream>
#include <new>
#include <stdexcept>
#include <string>

#include "core/exception_logging_utils.hpp"
#include "test_helpers.hpp"
#include "utils/exceptions.hpp"
#include "utils/logger.hpp"

using namespace gpusched;

TEST(Logger, ParsesNumericAndNamedLevels)
{
  EXPECT_EQ(parse_verbosity_level("0"), VerbosityLevel::Silent);
  EXPECT_EQ(parse_verbosity_level("3"), VerbosityLevel::Debug);
  EXPECT_EQ(parse_verbosity_level(" Trace "), VerbosityLevel::Trace);
  EXPECT_EQ(parse_verbosity_level("STATS"), VerbosityLevel::Stats);
  EXPECT_EQ(parse_verbosity_level("info"), VerbosityLevel::Info);
}

TEST(Logger, RejectsUnknownLevels)
{
  EXPECT_THROW(parse_verbosity_level(""), std::invalid_argument);
  EXPECT_THROW(parse_verbosity_level("5"), std::invalid_argument);
  EXPECT_THROW(parse_verbosity_level("12"), std::invalid_argument);
  EXPECT_THROW(parse_verbosity_level("chatty"), std::invalid_argument);
}

struct LevelCase {
  VerbosityLevel message_level;
  VerbosityLevel current_level;
  bool printed;
};

class LogVerbosity : public ::testing::TestWithParam<LevelCase> {};

TEST_P(LogVerbosity, PrintsOnlyUpToCurrentLevel)
{
  const auto& param = GetParam();
  CaptureStream capture{std::cout};
  log_verbose(param.message_level, param.current_level, "GPU 0 admitted");
  if (param.printed) {
    EXPECT_EQ(
        capture.str(),
        expected_log_line(param.message_level, "GPU 0 admitted"));
  } else {
    EXPECT_EQ(capture.str(), "");
  }
}

INSTANTIATE_TEST_SUITE_P(
    Logger, LogVerbosity,
    ::testing::Values(
        LevelCase{VerbosityLevel::Info, VerbosityLevel::Info, true},
        LevelCase{VerbosityLevel::Debug, VerbosityLevel::Trace, true},
        LevelCase{VerbosityLevel::Trace, VerbosityLevel::Debug, false},
        LevelCase{VerbosityLevel::Info, VerbosityLevel::Silent, false},
        LevelCase{VerbosityLevel::Silent, VerbosityLevel::Trace, false}));

TEST(Logger, WarningAndErrorGoToStderr)
{
  CaptureStream capture{std::cerr};
  log_warning("queue tier batch is full");
  log_error("hook failed");
  EXPECT_EQ(
      capture.str(),
      expected_log_line(WarningLevel, "queue tier batch is full") +
          expected_log_line(ErrorLevel, "hook failed"));
}

TEST(Logger, CriticalWarningIsHighlighted)
{
  CaptureStream capture{std::cerr};
  log_warning_critical("Failover of GPU 1");
  EXPECT_EQ(capture.str(), "\x1b[1;31m[WARNING] Failover of GPU 1\x1b[0m\n");
}

TEST(Logger, LogFatalTerminates)
{
  EXPECT_DEATH({ log_fatal("ledger corrupted"); }, "\\[FATAL\\] ledger corrupted");
}

TEST(RunWithLoggedExceptions, LogsEveryExceptionFamily)
{
  CaptureStream capture{std::cerr};
  const ExceptionLoggingMessages messages{"sweep: "};
  run_with_logged_exceptions(
      [] { throw UnknownDeviceException("Unknown GPU device id 9"); }, messages);
  run_with_logged_exceptions([] { throw std::bad_alloc(); }, messages);
  run_with_logged_exceptions(
      [] { throw std::runtime_error("telemetry offline"); }, messages);

  const auto output = capture.str();
  EXPECT_NE(
      output.find(expected_log_line(ErrorLevel, "sweep: Unknown GPU device id 9")),
      std::string::npos);
  EXPECT_NE(output.find("sweep: std::bad_alloc"), std::string::npos);
  EXPECT_NE(
      output.find(expected_log_line(ErrorLevel, "sweep: telemetry offline")),
      std::string::npos);
}

TEST(RunWithLoggedExceptions, SilentOnSuccess)
{
  CaptureStream capture{std::cerr};
  int calls = 0;
  run_with_logged_exceptions([&calls] { ++calls; });
  EXPECT_EQ(calls, 1);
  EXPECT_EQ(capture.str(), "");
}
