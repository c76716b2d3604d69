/**
 * @file src/capabilities.h
 * @brief Declarations for the codec capability decisions made while picking a Vulkan device.
 */
#pragma once

// standard includes
#include <array>
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

// lib includes
#include <vulkan/vulkan.h>

// local includes
#include "platform/linux/drm.h"

namespace caps {
  using namespace std::literals;

  enum class codec_e {
    h264,
    h265,
    vp9,
    av1,
  };

  enum class operation_e {
    decode,
    encode,
  };

  std::string_view to_string(codec_e codec);
  std::string_view to_string(operation_e operation);

  /**
   * @brief Codec support advertised by a physical device.
   */
  struct supported_codecs_t {
    bool h264_decode;
    bool h264_encode;
    bool h265_decode;
    bool h265_encode;
    bool vp9_decode;
    bool av1_decode;
    bool av1_encode;

    void set(codec_e codec, operation_e operation);

    bool decode(codec_e codec) const;

    /**
     * @return false for VP9, Vulkan has no VP9 encode extension.
     */
    bool encode(codec_e codec) const;

    bool supports(codec_e codec, operation_e operation) const;
  };

  struct codec_extension_t {
    std::string_view name;
    codec_e codec;
    operation_e operation;
  };

  constexpr std::array codec_extensions {
    codec_extension_t {"VK_KHR_video_decode_av1"sv, codec_e::av1, operation_e::decode},
    codec_extension_t {"VK_KHR_video_decode_h264"sv, codec_e::h264, operation_e::decode},
    codec_extension_t {"VK_KHR_video_decode_h265"sv, codec_e::h265, operation_e::decode},
    codec_extension_t {"VK_KHR_video_decode_vp9"sv, codec_e::vp9, operation_e::decode},
    codec_extension_t {"VK_KHR_video_encode_av1"sv, codec_e::av1, operation_e::encode},
    codec_extension_t {"VK_KHR_video_encode_h264"sv, codec_e::h264, operation_e::encode},
    codec_extension_t {"VK_KHR_video_encode_h265"sv, codec_e::h265, operation_e::encode},
  };

  /**
   * @brief Binary search `codec_extensions` by name.
   * @param name A device extension name.
   * @return The entry, or nullptr for an extension unrelated to video codecs.
   */
  const codec_extension_t *find_codec_extension(std::string_view name);

  supported_codecs_t supported_codecs_from_extensions(const std::vector<VkExtensionProperties> &extensions);

  /**
   * @brief A device matches when its primary or render node has the device number `id`.
   */
  bool matches_device(const VkPhysicalDeviceDrmPropertiesEXT &props, const drm::device_id_t &id);

  /**
   * @brief What is known about a physical device before one is picked.
   *
   * `drm` is only meaningful when `extensions` lists VK_EXT_physical_device_drm.
   */
  struct device_info_t {
    std::string name;
    std::vector<VkExtensionProperties> extensions;
    VkPhysicalDeviceDrmPropertiesEXT drm;
  };

  struct device_selection_t {
    std::size_t index;
    supported_codecs_t supported_codecs;
  };

  bool has_extension(const std::vector<VkExtensionProperties> &extensions, std::string_view name);

  /**
   * @brief Pick the first device whose DRM node is `id`.
   *
   * Devices without VK_EXT_physical_device_drm are skipped. The codecs come from
   * the selected device alone.
   * @return The index into `devices` and its codecs, or std::nullopt when nothing matches.
   */
  std::optional<device_selection_t> select_device(const std::vector<device_info_t> &devices, const drm::device_id_t &id);

  struct queue_family_t {
    std::uint32_t index;
    std::uint32_t count;
    VkVideoCodecOperationFlagsKHR operations;
    bool query_result_status_support;
  };

  /**
   * @brief Pick the first queue family able to decode video and transfer.
   *
   * The three vectors are the parallel outputs of `vkGetPhysicalDeviceQueueFamilyProperties2`.
   * @return The selected family, or std::nullopt when none qualifies.
   */
  std::optional<queue_family_t> select_decode_queue_family(
    const std::vector<VkQueueFamilyProperties2> &families,
    const std::vector<VkQueueFamilyVideoPropertiesKHR> &video,
    const std::vector<VkQueueFamilyQueryResultStatusPropertiesKHR> &query_result_status
  );
}  // namespace caps
