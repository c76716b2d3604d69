/**
 * @file tests/unit/test_logging.cpp
 * @brief Test src/logging.*.
 */
#include "../tests_common.h"
#include "../tests_log_checker.h"

#include <format>
#include <random>
#include <src/logging.h>

namespace {
  std::array log_levels = {
    std::tuple("verbose", &verbose),
    std::tuple("debug", &debug),
    std::tuple("info", &info),
    std::tuple("warning", &warning),
    std::tuple("error", &error),
    std::tuple("fatal", &fatal),
  };

  // Destroyed during static destruction, after the logging globals
  std::unique_ptr<logging::deinit_t> static_guard;
}  // namespace

struct LogLevelsTest: testing::TestWithParam<decltype(log_levels)::value_type> {};

INSTANTIATE_TEST_SUITE_P(
  Logging,
  LogLevelsTest,
  testing::ValuesIn(log_levels),
  [](const auto &info) {
    return std::string(std::get<0>(info.param));
  }
);

TEST_P(LogLevelsTest, PutMessage) {
  auto [label, plogger] = GetParam();
  ASSERT_TRUE(plogger);
  auto &logger = *plogger;

  std::random_device rand_dev;
  std::mt19937_64 rand_gen(rand_dev());
  auto test_message = std::format("{}{}", rand_gen(), rand_gen());
  BOOST_LOG(logger) << test_message;

  ASSERT_TRUE(log_checker::line_contains(test_log_file, test_message));
}

TEST(LoggingTest, FormatterPrefixesSeverity) {
  std::random_device rand_dev;
  std::mt19937_64 rand_gen(rand_dev());
  auto test_message = std::format("formatter {}", rand_gen());
  BOOST_LOG(warning) << test_message;

  ASSERT_TRUE(log_checker::line_ends_with(test_log_file, "Warning: " + test_message));
}

TEST(LoggingTest, GuardOutlivesGlobalSink) {
  constexpr auto guard_log_file = "test_vavk_guard.log";

  std::random_device rand_dev;
  std::mt19937_64 rand_gen(rand_dev());
  auto test_message = std::format("guard {}", rand_gen());

  auto guard = logging::init(0, guard_log_file);
  BOOST_LOG(info) << test_message;

  // Release the global reference first, the way static destruction may
  logging::deinit();
  guard.reset();

  EXPECT_TRUE(log_checker::line_ends_with(guard_log_file, "Info: " + test_message));

  // Keep logging to the test log for the rest of the run through a namespace-scope guard
  static_guard = logging::init(0, test_log_file);
  BOOST_LOG(info) << test_message;
  EXPECT_TRUE(log_checker::line_ends_with(test_log_file, "Info: " + test_message));
}
