/**
 * @file tests/unit/test_context.cpp
 * @brief Test src/context.*.
 */
#include "../tests_common.h"
#include "../tests_log_checker.h"

#include <cstring>
#include <new>
#include <src/context.h>
#include <src/driver.h>

TEST(ContextTest, RejectsNullContext) {
  auto result = context::validate(nullptr);
  ASSERT_TRUE(result.has_right());
  EXPECT_EQ(result.right(), context::rejection_e::null_pointer);
  EXPECT_TRUE(log_checker::line_contains(test_log_file, "Rejected driver context: null pointer"));
}

TEST(ContextTest, RejectsMisalignedContext) {
  alignas(VADriverContext) unsigned char storage[sizeof(VADriverContext) + 1] {};
  auto ctx = reinterpret_cast<VADriverContextP>(storage + 1);

  auto result = context::validate(ctx);
  ASSERT_TRUE(result.has_right());
  EXPECT_EQ(result.right(), context::rejection_e::misaligned);
}

TEST(ContextTest, AcceptsContext) {
  VADriverContext ctx {};

  auto result = context::validate(&ctx);
  ASSERT_TRUE(result.has_left());
  EXPECT_EQ(result.left(), &ctx);
}

TEST(ContextTest, RejectionsAreInvalidParameter) {
  for (auto rejection : {
         context::rejection_e::null_pointer,
         context::rejection_e::misaligned,
         context::rejection_e::bad_magic,
         context::rejection_e::bad_version,
       }) {
    EXPECT_EQ(context::to_status(rejection), status_e::invalid_parameter);
  }
}

TEST(ContextTest, WithContextSkipsCallbackOnNull) {
  bool called = false;
  auto status = context::with_context(nullptr, [&](VADriverContext &) {
    called = true;
    return status_e::ok;
  });

  EXPECT_EQ(status, VA_STATUS_ERROR_INVALID_PARAMETER);
  EXPECT_FALSE(called);
}

TEST(ContextTest, WithContextTranslatesResult) {
  VADriverContext ctx {};
  auto status = context::with_context(&ctx, [&](VADriverContext &c) {
    EXPECT_EQ(&c, &ctx);
    return status_e::unsupported_profile;
  });

  EXPECT_EQ(status, VA_STATUS_ERROR_UNSUPPORTED_PROFILE);
}

TEST(DriverDataTest, AcceptsLiveRecord) {
  driver::driver_data_t data;

  auto result = context::validate_driver_data(&data);
  ASSERT_TRUE(result.has_left());
  EXPECT_EQ(result.left(), &data);
}

TEST(DriverDataTest, RejectsNull) {
  auto result = context::validate_driver_data(nullptr);
  ASSERT_TRUE(result.has_right());
  EXPECT_EQ(result.right(), context::rejection_e::null_pointer);
}

TEST(DriverDataTest, RejectsForeignRecord) {
  alignas(driver::driver_data_t) unsigned char storage[sizeof(driver::driver_data_t)] {};
  context::header_t header {0xdeadbeef, context::VERSION};
  std::memcpy(storage, &header, sizeof(header));

  auto result = context::validate_driver_data(storage);
  ASSERT_TRUE(result.has_right());
  EXPECT_EQ(result.right(), context::rejection_e::bad_magic);
}

TEST(DriverDataTest, RejectsOtherVersion) {
  alignas(driver::driver_data_t) unsigned char storage[sizeof(driver::driver_data_t)] {};
  context::header_t header {context::MAGIC, context::VERSION + 1};
  std::memcpy(storage, &header, sizeof(header));

  auto result = context::validate_driver_data(storage);
  ASSERT_TRUE(result.has_right());
  EXPECT_EQ(result.right(), context::rejection_e::bad_version);
}

TEST(DriverDataTest, RejectsMisaligned) {
  alignas(driver::driver_data_t) unsigned char storage[sizeof(driver::driver_data_t) + 1] {};

  auto result = context::validate_driver_data(storage + 1);
  ASSERT_TRUE(result.has_right());
  EXPECT_EQ(result.right(), context::rejection_e::misaligned);
}

TEST(DriverDataTest, DestructorClearsMagic) {
  alignas(driver::driver_data_t) unsigned char storage[sizeof(driver::driver_data_t)];
  auto data = new (storage) driver::driver_data_t;
  data->~driver_data_t();

  context::header_t header;
  std::memcpy(&header, storage, sizeof(header));
  EXPECT_NE(header.magic, context::MAGIC);
}
