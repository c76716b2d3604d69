/**
 * @file src/profiles.h
 * @brief Declarations for translating between VA-API profiles and Vulkan Video codecs.
 */
#pragma once

// standard includes
#include <cstddef>
#include <optional>
#include <span>
#include <string_view>
#include <variant>

// lib includes
#include <va/va.h>
#include <vulkan/vulkan.h>

// local includes
#include "capabilities.h"
#include "status.h"

namespace profiles {
  /**
   * @brief Longest profile list `profiles_for` can produce.
   */
  constexpr std::size_t MAX_PROFILES = 11;

  /**
   * @brief VLD and EncSlice.
   */
  constexpr std::size_t MAX_ENTRYPOINTS = 2;

  struct h264_decode_t {
    StdVideoH264ProfileIdc std_profile_idc;
  };

  struct h265_decode_t {
    StdVideoH265ProfileIdc std_profile_idc;
  };

  struct av1_decode_t {
    StdVideoAV1Profile std_profile;
  };

  /**
   * @brief The codec specific part of a `VkVideoProfileInfoKHR` chain.
   */
  using video_profile_t = std::variant<h264_decode_t, h265_decode_t, av1_decode_t>;

  /**
   * @brief List the profiles to advertise for a set of supported codecs.
   *
   * Profiles are grouped by codec in the order H.264, H.265, AV1, VP9. A codec
   * contributes its profiles when it can be decoded or encoded.
   * @param codecs The codecs supported by the device.
   * @param out Destination, left untouched when it is too small.
   * @param count Receives the number of profiles written.
   * @return `ok`, or `operation_failed` when `out` can't hold the list.
   */
  status_e profiles_for(const caps::supported_codecs_t &codecs, std::span<VAProfile> out, std::size_t &count);

  /**
   * @brief List the entrypoints of a profile, VLD before EncSlice.
   * @param profile The profile queried by the host.
   * @param codecs The codecs supported by the device.
   * @param out Destination, must hold at least `MAX_ENTRYPOINTS` entries.
   * @param count Receives the number of entrypoints written.
   * @return `ok`, `unsupported_profile` for a profile without any entrypoint,
   * or `operation_failed` when `out` is too small.
   */
  status_e entrypoints_for(VAProfile profile, const caps::supported_codecs_t &codecs, std::span<VAEntrypoint> out, std::size_t &count);

  std::optional<caps::codec_e> codec_for(VAProfile profile);

  /**
   * @return std::nullopt when creating a Vulkan video profile isn't supported for `profile`.
   */
  std::optional<video_profile_t> gpu_profile_info_for(VAProfile profile);

  VkVideoCodecOperationFlagBitsKHR codec_operation(const video_profile_t &profile);

  std::string_view to_string(VAProfile profile);
}  // namespace profiles
