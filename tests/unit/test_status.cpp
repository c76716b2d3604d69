/**
 * @file tests/unit/test_status.cpp
 * @brief Test src/status.*.
 */
#include "../tests_common.h"

#include <src/status.h>

struct StatusTest: testing::TestWithParam<std::tuple<status_e, VAStatus>> {};

INSTANTIATE_TEST_SUITE_P(
  Status,
  StatusTest,
  testing::Values(
    std::make_tuple(status_e::ok, VA_STATUS_SUCCESS),
    std::make_tuple(status_e::operation_failed, VA_STATUS_ERROR_OPERATION_FAILED),
    std::make_tuple(status_e::allocation_failed, VA_STATUS_ERROR_ALLOCATION_FAILED),
    std::make_tuple(status_e::invalid_display, VA_STATUS_ERROR_INVALID_DISPLAY),
    std::make_tuple(status_e::invalid_config, VA_STATUS_ERROR_INVALID_CONFIG),
    std::make_tuple(status_e::invalid_context, VA_STATUS_ERROR_INVALID_CONTEXT),
    std::make_tuple(status_e::invalid_surface, VA_STATUS_ERROR_INVALID_SURFACE),
    std::make_tuple(status_e::invalid_buffer, VA_STATUS_ERROR_INVALID_BUFFER),
    std::make_tuple(status_e::invalid_image, VA_STATUS_ERROR_INVALID_IMAGE),
    std::make_tuple(status_e::invalid_subpicture, VA_STATUS_ERROR_INVALID_SUBPICTURE),
    std::make_tuple(status_e::attr_not_supported, VA_STATUS_ERROR_ATTR_NOT_SUPPORTED),
    std::make_tuple(status_e::max_num_exceeded, VA_STATUS_ERROR_MAX_NUM_EXCEEDED),
    std::make_tuple(status_e::unsupported_profile, VA_STATUS_ERROR_UNSUPPORTED_PROFILE),
    std::make_tuple(status_e::unsupported_entrypoint, VA_STATUS_ERROR_UNSUPPORTED_ENTRYPOINT),
    std::make_tuple(status_e::unsupported_rt_format, VA_STATUS_ERROR_UNSUPPORTED_RT_FORMAT),
    std::make_tuple(status_e::unsupported_buffertype, VA_STATUS_ERROR_UNSUPPORTED_BUFFERTYPE),
    std::make_tuple(status_e::surface_busy, VA_STATUS_ERROR_SURFACE_BUSY),
    std::make_tuple(status_e::flag_not_supported, VA_STATUS_ERROR_FLAG_NOT_SUPPORTED),
    std::make_tuple(status_e::invalid_parameter, VA_STATUS_ERROR_INVALID_PARAMETER),
    std::make_tuple(status_e::resolution_not_supported, VA_STATUS_ERROR_RESOLUTION_NOT_SUPPORTED),
    std::make_tuple(status_e::unimplemented, VA_STATUS_ERROR_UNIMPLEMENTED),
    std::make_tuple(status_e::surface_in_displaying, VA_STATUS_ERROR_SURFACE_IN_DISPLAYING),
    std::make_tuple(status_e::invalid_image_format, VA_STATUS_ERROR_INVALID_IMAGE_FORMAT),
    std::make_tuple(status_e::decoding_error, VA_STATUS_ERROR_DECODING_ERROR),
    std::make_tuple(status_e::encoding_error, VA_STATUS_ERROR_ENCODING_ERROR)
  )
);

TEST_P(StatusTest, ToVaStatus) {
  auto [status, expected] = GetParam();
  ASSERT_EQ(status::to_va_status(status), expected);
}

TEST_P(StatusTest, HasName) {
  auto [status, _] = GetParam();
  ASSERT_NE(status::to_string(status), "unknown");
}

TEST(StatusTest, SuccessIsZero) {
  ASSERT_EQ(status::to_va_status(status_e::ok), 0);
}

TEST(StatusTest, FromVkResult) {
  EXPECT_EQ(status::from_vk_result(VK_SUCCESS), status_e::ok);
  EXPECT_EQ(status::from_vk_result(VK_ERROR_OUT_OF_HOST_MEMORY), status_e::allocation_failed);
  EXPECT_EQ(status::from_vk_result(VK_ERROR_OUT_OF_DEVICE_MEMORY), status_e::allocation_failed);
  EXPECT_EQ(status::from_vk_result(VK_ERROR_INITIALIZATION_FAILED), status_e::operation_failed);
  EXPECT_EQ(status::from_vk_result(VK_ERROR_LAYER_NOT_PRESENT), status_e::operation_failed);
  EXPECT_EQ(status::from_vk_result(VK_ERROR_DEVICE_LOST), status_e::operation_failed);
}
