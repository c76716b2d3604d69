/**
 * @file src/status.h
 * @brief Declarations for translating internal errors into VA-API status codes.
 */
#pragma once

// standard includes
#include <ostream>
#include <string_view>

// lib includes
#include <va/va.h>
#include <vulkan/vulkan.h>

/**
 * @brief Every public entry point reports its outcome as exactly one of these values.
 */
enum class status_e {
  ok,  ///< VA_STATUS_SUCCESS
  operation_failed,
  allocation_failed,
  invalid_display,
  invalid_config,
  invalid_context,
  invalid_surface,
  invalid_buffer,
  invalid_image,
  invalid_subpicture,
  attr_not_supported,
  max_num_exceeded,
  unsupported_profile,
  unsupported_entrypoint,
  unsupported_rt_format,
  unsupported_buffertype,
  surface_busy,
  flag_not_supported,
  invalid_parameter,
  resolution_not_supported,
  unimplemented,
  surface_in_displaying,
  invalid_image_format,
  decoding_error,
  encoding_error,
};

namespace status {
  /**
   * @brief Convert to the status code published by libva.
   * @param status The internal status.
   * @return The matching `VA_STATUS_*` value.
   */
  VAStatus to_va_status(status_e status);

  /**
   * @brief Collapse a Vulkan failure into the internal taxonomy.
   * @param result A Vulkan result code.
   * @return `ok` for success, `allocation_failed` for out of memory, `operation_failed` otherwise.
   */
  status_e from_vk_result(VkResult result);

  std::string_view to_string(status_e status);
}  // namespace status

std::ostream &operator<<(std::ostream &os, status_e status);
