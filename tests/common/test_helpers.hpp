#pragma once

#include <gtest/gtest.h>

#include <cstdint>
#include <filesystem>
#include <string>

#include "tuid/common.hpp"

namespace tuid::test {

// Test fixture base class for tests that need temporary directories
class TempDirTest : public ::testing::Test {
 protected:
  void SetUp() override;
  void TearDown() override;

  std::filesystem::path temp_dir_;
};

// Generate random string for testing
std::string randomString(size_t length);

// Build a UTC timestamp from calendar fields
Timestamp makeTimestamp(int year, unsigned month, unsigned day, int hour = 0, int minute = 0,
                        int second = 0, std::int64_t nanos = 0);

// Write text content to a file, creating parent directories
void writeFile(const std::filesystem::path& path, const std::string& content);

// Assertion helpers
#define EXPECT_OK(result)                                                                          \
  do {                                                                                             \
    auto&& r = (result);                                                                           \
    EXPECT_TRUE(r.has_value()) << "Expected success but got error: " << r.error().message();     \
  } while (0)

#define ASSERT_OK(result)                                                                          \
  do {                                                                                             \
    auto&& r = (result);                                                                           \
    ASSERT_TRUE(r.has_value()) << "Expected success but got error: " << r.error().message();     \
  } while (0)

#define EXPECT_ERROR(result, expected_code)                                                        \
  do {                                                                                             \
    auto&& r = (result);                                                                           \
    EXPECT_FALSE(r.has_value()) << "Expected error but got success";                              \
    if (!r.has_value()) {                                                                          \
      EXPECT_EQ(r.error().code(), expected_code);                                                  \
    }                                                                                              \
  } while (0)

}  // namespace tuid::test
