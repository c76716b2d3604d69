/**
 * @file src/profiles.cpp
 * @brief Definitions for translating between VA-API profiles and Vulkan Video codecs.
 */
// standard includes
#include <algorithm>
#include <array>
#include <initializer_list>

// local includes
#include "logging.h"
#include "profiles.h"
#include "utility.h"

using namespace std::literals;

namespace profiles {
  status_e profiles_for(const caps::supported_codecs_t &codecs, std::span<VAProfile> out, std::size_t &count) {
    std::array<VAProfile, MAX_PROFILES> list;
    std::size_t size = 0;

    auto push = [&](std::initializer_list<VAProfile> profiles) {
      for (auto profile : profiles) {
        list[size++] = profile;
      }
    };

    if (codecs.h264_decode || codecs.h264_encode) {
      push({VAProfileH264ConstrainedBaseline, VAProfileH264Main, VAProfileH264High});
    }
    if (codecs.h265_decode || codecs.h265_encode) {
      push({VAProfileHEVCMain, VAProfileHEVCMain10});
    }
    if (codecs.av1_decode || codecs.av1_encode) {
      push({VAProfileAV1Profile0, VAProfileAV1Profile1});
    }
    if (codecs.vp9_decode) {
      push({VAProfileVP9Profile0, VAProfileVP9Profile1, VAProfileVP9Profile2, VAProfileVP9Profile3});
    }

    if (out.size() < size) {
      BOOST_LOG(error) << "Profile list needs "sv << size << " entries, host provided "sv << out.size();
      return status_e::operation_failed;
    }

    std::copy_n(std::begin(list), size, std::begin(out));
    count = size;

    return status_e::ok;
  }

  std::optional<caps::codec_e> codec_for(VAProfile profile) {
    switch (profile) {
      case VAProfileH264Baseline:
      case VAProfileH264ConstrainedBaseline:
      case VAProfileH264Main:
      case VAProfileH264High:
        return caps::codec_e::h264;
      case VAProfileHEVCMain:
      case VAProfileHEVCMain10:
        return caps::codec_e::h265;
      case VAProfileAV1Profile0:
      case VAProfileAV1Profile1:
        return caps::codec_e::av1;
      case VAProfileVP9Profile0:
      case VAProfileVP9Profile1:
      case VAProfileVP9Profile2:
      case VAProfileVP9Profile3:
        return caps::codec_e::vp9;
      default:
        return std::nullopt;
    }
  }

  status_e entrypoints_for(VAProfile profile, const caps::supported_codecs_t &codecs, std::span<VAEntrypoint> out, std::size_t &count) {
    auto codec = codec_for(profile);
    if (!codec) {
      BOOST_LOG(debug) << "No entrypoints for profile "sv << to_string(profile) << " ("sv << (int) profile << ')';
      return status_e::unsupported_profile;
    }

    if (out.size() < MAX_ENTRYPOINTS) {
      BOOST_LOG(error) << "Entrypoint list needs "sv << MAX_ENTRYPOINTS << " entries, host provided "sv << out.size();
      return status_e::operation_failed;
    }

    std::size_t size = 0;
    if (codecs.decode(*codec)) {
      out[size++] = VAEntrypointVLD;
    }
    if (codecs.encode(*codec)) {
      out[size++] = VAEntrypointEncSlice;
    }

    if (!size) {
      return status_e::unsupported_profile;
    }

    count = size;
    return status_e::ok;
  }

  std::optional<video_profile_t> gpu_profile_info_for(VAProfile profile) {
    switch (profile) {
      case VAProfileH264Baseline:
      case VAProfileH264ConstrainedBaseline:
        return h264_decode_t {STD_VIDEO_H264_PROFILE_IDC_BASELINE};
      case VAProfileH264Main:
        return h264_decode_t {STD_VIDEO_H264_PROFILE_IDC_MAIN};
      case VAProfileH264High:
        return h264_decode_t {STD_VIDEO_H264_PROFILE_IDC_HIGH};
      case VAProfileHEVCMain:
        return h265_decode_t {STD_VIDEO_H265_PROFILE_IDC_MAIN};
      case VAProfileHEVCMain10:
        return h265_decode_t {STD_VIDEO_H265_PROFILE_IDC_MAIN_10};
      case VAProfileAV1Profile0:
        return av1_decode_t {STD_VIDEO_AV1_PROFILE_MAIN};
      case VAProfileAV1Profile1:
        return av1_decode_t {STD_VIDEO_AV1_PROFILE_HIGH};
      default:
        return std::nullopt;
    }
  }

  VkVideoCodecOperationFlagBitsKHR codec_operation(const video_profile_t &profile) {
    return std::visit(util::overloaded {
      [](const h264_decode_t &) { return VK_VIDEO_CODEC_OPERATION_DECODE_H264_BIT_KHR; },
      [](const h265_decode_t &) { return VK_VIDEO_CODEC_OPERATION_DECODE_H265_BIT_KHR; },
      [](const av1_decode_t &) { return VK_VIDEO_CODEC_OPERATION_DECODE_AV1_BIT_KHR; },
    }, profile);
  }

  std::string_view to_string(VAProfile profile) {
    switch (profile) {
      case VAProfileH264Baseline:
        return "H264Baseline"sv;
      case VAProfileH264ConstrainedBaseline:
        return "H264ConstrainedBaseline"sv;
      case VAProfileH264Main:
        return "H264Main"sv;
      case VAProfileH264High:
        return "H264High"sv;
      case VAProfileHEVCMain:
        return "HEVCMain"sv;
      case VAProfileHEVCMain10:
        return "HEVCMain10"sv;
      case VAProfileAV1Profile0:
        return "AV1Profile0"sv;
      case VAProfileAV1Profile1:
        return "AV1Profile1"sv;
      case VAProfileVP9Profile0:
        return "VP9Profile0"sv;
      case VAProfileVP9Profile1:
        return "VP9Profile1"sv;
      case VAProfileVP9Profile2:
        return "VP9Profile2"sv;
      case VAProfileVP9Profile3:
        return "VP9Profile3"sv;
      default:
        return "unknown"sv;
    }
  }
}  // namespace profiles
