/**
 * @file src/vulkan.h
 * @brief Declarations for the Vulkan instance and the physical device backing the driver.
 */
#pragma once

// standard includes
#include <memory>
#include <string>

// lib includes
#include <vulkan/vulkan.h>

// local includes
#include "capabilities.h"
#include "config.h"
#include "platform/linux/drm.h"
#include "utility.h"

namespace vk {
  struct instance_data_t {
    VkInstance instance;
    PFN_vkDestroyInstance destroy;
  };

  KITTY_USING_MOVE_T(instance_t, instance_data_t, , {
    if (el.instance != VK_NULL_HANDLE && el.destroy) {
      el.destroy(el.instance, nullptr);
    }
  });

  struct messenger_data_t {
    VkInstance instance;
    VkDebugUtilsMessengerEXT messenger;
    PFN_vkDestroyDebugUtilsMessengerEXT destroy;
  };

  KITTY_USING_MOVE_T(messenger_t, messenger_data_t, , {
    if (el.messenger != VK_NULL_HANDLE && el.destroy) {
      el.destroy(el.instance, el.messenger, nullptr);
    }
  });

  /**
   * @brief Everything the driver learned about the GPU during initialization.
   *
   * Read-only once `init` returns. The messenger is declared after the
   * instance so it is destroyed first.
   */
  struct backend_t {
    instance_t instance;
    messenger_t messenger;

    VkPhysicalDevice physical_device = VK_NULL_HANDLE;
    std::string device_name;

    caps::supported_codecs_t supported_codecs {};
    caps::queue_family_t decode_queue_family {};
  };

  /**
   * @brief Create a Vulkan instance and select the physical device behind `device_id`.
   * @param device_id Device number of the DRM node libva opened.
   * @param config Vulkan related settings.
   * @return The backend, or the Vulkan error that stopped initialization.
   */
  util::Either<std::unique_ptr<backend_t>, VkResult> init(const drm::device_id_t &device_id, const config::vulkan_t &config);

  /**
   * @brief Route a debug utils message to the matching logger.
   * @return Always VK_FALSE, messages never abort the Vulkan call.
   */
  VKAPI_ATTR VkBool32 VKAPI_CALL debug_callback(
    VkDebugUtilsMessageSeverityFlagBitsEXT severity,
    VkDebugUtilsMessageTypeFlagsEXT types,
    const VkDebugUtilsMessengerCallbackDataEXT *data,
    void *user_data
  );

  std::string message_types(VkDebugUtilsMessageTypeFlagsEXT types);
}  // namespace vk
