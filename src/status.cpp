/**
 * @file src/status.cpp
 * @brief Definitions for translating internal errors into VA-API status codes.
 */
// local includes
#include "status.h"

using namespace std::literals;

namespace status {
  VAStatus to_va_status(status_e status) {
    switch (status) {
      case status_e::ok:
        return VA_STATUS_SUCCESS;
      case status_e::operation_failed:
        return VA_STATUS_ERROR_OPERATION_FAILED;
      case status_e::allocation_failed:
        return VA_STATUS_ERROR_ALLOCATION_FAILED;
      case status_e::invalid_display:
        return VA_STATUS_ERROR_INVALID_DISPLAY;
      case status_e::invalid_config:
        return VA_STATUS_ERROR_INVALID_CONFIG;
      case status_e::invalid_context:
        return VA_STATUS_ERROR_INVALID_CONTEXT;
      case status_e::invalid_surface:
        return VA_STATUS_ERROR_INVALID_SURFACE;
      case status_e::invalid_buffer:
        return VA_STATUS_ERROR_INVALID_BUFFER;
      case status_e::invalid_image:
        return VA_STATUS_ERROR_INVALID_IMAGE;
      case status_e::invalid_subpicture:
        return VA_STATUS_ERROR_INVALID_SUBPICTURE;
      case status_e::attr_not_supported:
        return VA_STATUS_ERROR_ATTR_NOT_SUPPORTED;
      case status_e::max_num_exceeded:
        return VA_STATUS_ERROR_MAX_NUM_EXCEEDED;
      case status_e::unsupported_profile:
        return VA_STATUS_ERROR_UNSUPPORTED_PROFILE;
      case status_e::unsupported_entrypoint:
        return VA_STATUS_ERROR_UNSUPPORTED_ENTRYPOINT;
      case status_e::unsupported_rt_format:
        return VA_STATUS_ERROR_UNSUPPORTED_RT_FORMAT;
      case status_e::unsupported_buffertype:
        return VA_STATUS_ERROR_UNSUPPORTED_BUFFERTYPE;
      case status_e::surface_busy:
        return VA_STATUS_ERROR_SURFACE_BUSY;
      case status_e::flag_not_supported:
        return VA_STATUS_ERROR_FLAG_NOT_SUPPORTED;
      case status_e::invalid_parameter:
        return VA_STATUS_ERROR_INVALID_PARAMETER;
      case status_e::resolution_not_supported:
        return VA_STATUS_ERROR_RESOLUTION_NOT_SUPPORTED;
      case status_e::unimplemented:
        return VA_STATUS_ERROR_UNIMPLEMENTED;
      case status_e::surface_in_displaying:
        return VA_STATUS_ERROR_SURFACE_IN_DISPLAYING;
      case status_e::invalid_image_format:
        return VA_STATUS_ERROR_INVALID_IMAGE_FORMAT;
      case status_e::decoding_error:
        return VA_STATUS_ERROR_DECODING_ERROR;
      case status_e::encoding_error:
        return VA_STATUS_ERROR_ENCODING_ERROR;
    }

    // Out of range values never cross the boundary as-is
    return VA_STATUS_ERROR_OPERATION_FAILED;
  }

  status_e from_vk_result(VkResult result) {
    switch (result) {
      case VK_SUCCESS:
        return status_e::ok;
      case VK_ERROR_OUT_OF_HOST_MEMORY:
      case VK_ERROR_OUT_OF_DEVICE_MEMORY:
        return status_e::allocation_failed;
      default:
        return status_e::operation_failed;
    }
  }

  std::string_view to_string(status_e status) {
    switch (status) {
      case status_e::ok:
        return "ok"sv;
      case status_e::operation_failed:
        return "operation failed"sv;
      case status_e::allocation_failed:
        return "allocation failed"sv;
      case status_e::invalid_display:
        return "invalid display"sv;
      case status_e::invalid_config:
        return "invalid config"sv;
      case status_e::invalid_context:
        return "invalid context"sv;
      case status_e::invalid_surface:
        return "invalid surface"sv;
      case status_e::invalid_buffer:
        return "invalid buffer"sv;
      case status_e::invalid_image:
        return "invalid image"sv;
      case status_e::invalid_subpicture:
        return "invalid subpicture"sv;
      case status_e::attr_not_supported:
        return "attribute not supported"sv;
      case status_e::max_num_exceeded:
        return "max number exceeded"sv;
      case status_e::unsupported_profile:
        return "unsupported profile"sv;
      case status_e::unsupported_entrypoint:
        return "unsupported entrypoint"sv;
      case status_e::unsupported_rt_format:
        return "unsupported RT format"sv;
      case status_e::unsupported_buffertype:
        return "unsupported buffer type"sv;
      case status_e::surface_busy:
        return "surface busy"sv;
      case status_e::flag_not_supported:
        return "flag not supported"sv;
      case status_e::invalid_parameter:
        return "invalid parameter"sv;
      case status_e::resolution_not_supported:
        return "resolution not supported"sv;
      case status_e::unimplemented:
        return "unimplemented"sv;
      case status_e::surface_in_displaying:
        return "surface in displaying"sv;
      case status_e::invalid_image_format:
        return "invalid image format"sv;
      case status_e::decoding_error:
        return "decoding error"sv;
      case status_e::encoding_error:
        return "encoding error"sv;
    }

    return "unknown"sv;
  }
}  // namespace status

std::ostream &operator<<(std::ostream &os, status_e status) {
  return os << status::to_string(status);
}
