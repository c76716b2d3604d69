/**
 * @file src/capabilities.cpp
 * @brief Definitions for the codec capability decisions made while picking a Vulkan device.
 */
// standard includes
#include <algorithm>
#include <cstring>

// local includes
#include "capabilities.h"
#include "logging.h"

namespace caps {
  static_assert(
    std::is_sorted(std::begin(codec_extensions), std::end(codec_extensions), [](const auto &l, const auto &r) {
      return l.name < r.name;
    }),
    "codec_extensions must be sorted by name"
  );

  std::string_view to_string(codec_e codec) {
    switch (codec) {
      case codec_e::h264:
        return "H.264"sv;
      case codec_e::h265:
        return "H.265"sv;
      case codec_e::vp9:
        return "VP9"sv;
      case codec_e::av1:
        return "AV1"sv;
    }

    return "unknown"sv;
  }

  std::string_view to_string(operation_e operation) {
    return operation == operation_e::decode ? "decode"sv : "encode"sv;
  }

  void supported_codecs_t::set(codec_e codec, operation_e operation) {
    auto is_decode = operation == operation_e::decode;

    switch (codec) {
      case codec_e::h264:
        (is_decode ? h264_decode : h264_encode) = true;
        break;
      case codec_e::h265:
        (is_decode ? h265_decode : h265_encode) = true;
        break;
      case codec_e::vp9:
        if (is_decode) {
          vp9_decode = true;
        }
        break;
      case codec_e::av1:
        (is_decode ? av1_decode : av1_encode) = true;
        break;
    }
  }

  bool supported_codecs_t::decode(codec_e codec) const {
    switch (codec) {
      case codec_e::h264:
        return h264_decode;
      case codec_e::h265:
        return h265_decode;
      case codec_e::vp9:
        return vp9_decode;
      case codec_e::av1:
        return av1_decode;
    }

    return false;
  }

  bool supported_codecs_t::encode(codec_e codec) const {
    switch (codec) {
      case codec_e::h264:
        return h264_encode;
      case codec_e::h265:
        return h265_encode;
      case codec_e::vp9:
        return false;
      case codec_e::av1:
        return av1_encode;
    }

    return false;
  }

  bool supported_codecs_t::supports(codec_e codec, operation_e operation) const {
    return operation == operation_e::decode ? decode(codec) : encode(codec);
  }

  const codec_extension_t *find_codec_extension(std::string_view name) {
    auto it = std::lower_bound(std::begin(codec_extensions), std::end(codec_extensions), name, [](const codec_extension_t &ext, std::string_view name) {
      return ext.name < name;
    });

    if (it == std::end(codec_extensions) || it->name != name) {
      return nullptr;
    }

    return &*it;
  }

  supported_codecs_t supported_codecs_from_extensions(const std::vector<VkExtensionProperties> &extensions) {
    supported_codecs_t codecs {};

    for (auto &extension : extensions) {
      std::string_view name {extension.extensionName, strnlen(extension.extensionName, VK_MAX_EXTENSION_NAME_SIZE)};

      auto codec_extension = find_codec_extension(name);
      if (!codec_extension) {
        continue;
      }

      BOOST_LOG(debug) << name << ": "sv << to_string(codec_extension->codec) << ' ' << to_string(codec_extension->operation);
      codecs.set(codec_extension->codec, codec_extension->operation);
    }

    return codecs;
  }

  bool matches_device(const VkPhysicalDeviceDrmPropertiesEXT &props, const drm::device_id_t &id) {
    if (props.hasPrimary && drm::device_id_t {props.primaryMajor, props.primaryMinor} == id) {
      return true;
    }

    return props.hasRender && drm::device_id_t {props.renderMajor, props.renderMinor} == id;
  }

  bool has_extension(const std::vector<VkExtensionProperties> &extensions, std::string_view name) {
    return std::any_of(std::begin(extensions), std::end(extensions), [name](const VkExtensionProperties &extension) {
      return std::string_view {extension.extensionName, strnlen(extension.extensionName, VK_MAX_EXTENSION_NAME_SIZE)} == name;
    });
  }

  std::optional<device_selection_t> select_device(const std::vector<device_info_t> &devices, const drm::device_id_t &id) {
    for (std::size_t x = 0; x < devices.size(); ++x) {
      auto &device = devices[x];

      if (!has_extension(device.extensions, VK_EXT_PHYSICAL_DEVICE_DRM_EXTENSION_NAME)) {
        BOOST_LOG(debug) << device.name << ": no "sv << VK_EXT_PHYSICAL_DEVICE_DRM_EXTENSION_NAME << ", skipping"sv;
        continue;
      }

      auto &drm = device.drm;
      BOOST_LOG(debug)
        << device.name << ": primary "sv << (drm.hasPrimary ? "yes "sv : "no "sv)
        << drm::device_id_t {drm.primaryMajor, drm.primaryMinor}
        << ", render "sv << (drm.hasRender ? "yes "sv : "no "sv)
        << drm::device_id_t {drm.renderMajor, drm.renderMinor};

      if (!matches_device(drm, id)) {
        continue;
      }

      return device_selection_t {x, supported_codecs_from_extensions(device.extensions)};
    }

    return std::nullopt;
  }

  std::optional<queue_family_t> select_decode_queue_family(
    const std::vector<VkQueueFamilyProperties2> &families,
    const std::vector<VkQueueFamilyVideoPropertiesKHR> &video,
    const std::vector<VkQueueFamilyQueryResultStatusPropertiesKHR> &query_result_status
  ) {
    constexpr VkQueueFlags required = VK_QUEUE_VIDEO_DECODE_BIT_KHR | VK_QUEUE_TRANSFER_BIT;

    auto count = std::min({families.size(), video.size(), query_result_status.size()});
    for (std::size_t x = 0; x < count; ++x) {
      auto &props = families[x].queueFamilyProperties;

      BOOST_LOG(debug)
        << "Queue family "sv << x << ": count "sv << props.queueCount
        << ", flags "sv << util::log_hex(props.queueFlags)
        << ", video codec operations "sv << util::log_hex(video[x].videoCodecOperations)
        << ", query result status "sv << (query_result_status[x].queryResultStatusSupport ? "yes"sv : "no"sv);

      if (props.queueCount == 0 || (props.queueFlags & required) != required) {
        continue;
      }

      return queue_family_t {
        (std::uint32_t) x,
        props.queueCount,
        video[x].videoCodecOperations,
        query_result_status[x].queryResultStatusSupport == VK_TRUE,
      };
    }

    return std::nullopt;
  }
}  // namespace caps
