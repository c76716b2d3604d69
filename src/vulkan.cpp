/**
 * @file src/vulkan.cpp
 * @brief Definitions for the Vulkan instance and the physical device backing the driver.
 */
// standard includes
#include <algorithm>
#include <array>
#include <cstring>
#include <sstream>
#include <vector>

// local includes
#include "logging.h"
#include "profiles.h"
#include "vulkan.h"

using namespace std::literals;

namespace vk {
  constexpr auto VALIDATION_LAYER = "VK_LAYER_KHRONOS_validation";

  std::string message_types(VkDebugUtilsMessageTypeFlagsEXT types) {
    constexpr std::pair<VkDebugUtilsMessageTypeFlagBitsEXT, std::string_view> names[] {
      {VK_DEBUG_UTILS_MESSAGE_TYPE_GENERAL_BIT_EXT, "GENERAL"sv},
      {VK_DEBUG_UTILS_MESSAGE_TYPE_VALIDATION_BIT_EXT, "VALIDATION"sv},
      {VK_DEBUG_UTILS_MESSAGE_TYPE_PERFORMANCE_BIT_EXT, "PERFORMANCE"sv},
      {VK_DEBUG_UTILS_MESSAGE_TYPE_DEVICE_ADDRESS_BINDING_BIT_EXT, "DEVICE_ADDRESS_BINDING"sv},
    };

    std::string result;
    for (auto &[bit, name] : names) {
      if (!(types & bit)) {
        continue;
      }

      if (!result.empty()) {
        result += " | "sv;
      }
      result += name;
    }

    return result;
  }

  VKAPI_ATTR VkBool32 VKAPI_CALL debug_callback(
    VkDebugUtilsMessageSeverityFlagBitsEXT severity,
    VkDebugUtilsMessageTypeFlagsEXT types,
    const VkDebugUtilsMessengerCallbackDataEXT *data,
    void *
  ) {
    if (!data) {
      return VK_FALSE;
    }

    auto id_name = data->pMessageIdName ? data->pMessageIdName : "";
    auto message = data->pMessage ? data->pMessage : "";

    std::stringstream ss;
    ss << message_types(types) << " ["sv << id_name << " ("sv << data->messageIdNumber << ")] : "sv << message;

    if (severity & VK_DEBUG_UTILS_MESSAGE_SEVERITY_ERROR_BIT_EXT) {
      BOOST_LOG(error) << ss.str();
    } else if (severity & VK_DEBUG_UTILS_MESSAGE_SEVERITY_WARNING_BIT_EXT) {
      BOOST_LOG(warning) << ss.str();
    } else if (severity & VK_DEBUG_UTILS_MESSAGE_SEVERITY_INFO_BIT_EXT) {
      BOOST_LOG(info) << ss.str();
    } else {
      BOOST_LOG(verbose) << ss.str();
    }

    return VK_FALSE;
  }

  VkDebugUtilsMessengerCreateInfoEXT messenger_info() {
    VkDebugUtilsMessengerCreateInfoEXT info {VK_STRUCTURE_TYPE_DEBUG_UTILS_MESSENGER_CREATE_INFO_EXT};
    info.messageSeverity =
      VK_DEBUG_UTILS_MESSAGE_SEVERITY_VERBOSE_BIT_EXT |
      VK_DEBUG_UTILS_MESSAGE_SEVERITY_INFO_BIT_EXT |
      VK_DEBUG_UTILS_MESSAGE_SEVERITY_WARNING_BIT_EXT |
      VK_DEBUG_UTILS_MESSAGE_SEVERITY_ERROR_BIT_EXT;
    info.messageType =
      VK_DEBUG_UTILS_MESSAGE_TYPE_GENERAL_BIT_EXT |
      VK_DEBUG_UTILS_MESSAGE_TYPE_VALIDATION_BIT_EXT |
      VK_DEBUG_UTILS_MESSAGE_TYPE_PERFORMANCE_BIT_EXT;
    info.pfnUserCallback = debug_callback;

    return info;
  }

  bool has_layer(const char *name) {
    std::uint32_t count = 0;
    if (vkEnumerateInstanceLayerProperties(&count, nullptr) != VK_SUCCESS) {
      return false;
    }

    std::vector<VkLayerProperties> layers(count);
    if (vkEnumerateInstanceLayerProperties(&count, layers.data()) != VK_SUCCESS) {
      return false;
    }

    return std::any_of(std::begin(layers), std::end(layers), [name](const VkLayerProperties &layer) {
      return std::strcmp(layer.layerName, name) == 0;
    });
  }

  util::Either<instance_t, VkResult> create_instance(const config::vulkan_t &config, const VkDebugUtilsMessengerCreateInfoEXT &debug_info) {
    VkApplicationInfo app {VK_STRUCTURE_TYPE_APPLICATION_INFO};
    app.pApplicationName = "Vulkan Video VA-API Driver";
    app.applicationVersion = VK_MAKE_API_VERSION(0, 0, 1, 0);
    app.pEngineName = "vavk";
    app.engineVersion = VK_MAKE_API_VERSION(0, 0, 1, 0);
    app.apiVersion = VK_API_VERSION_1_3;

    std::vector<const char *> layers;
    if (config.validation) {
      if (has_layer(VALIDATION_LAYER)) {
        layers.emplace_back(VALIDATION_LAYER);
      } else {
        BOOST_LOG(warning) << VALIDATION_LAYER << " is not installed, continuing without validation"sv;
      }
    }

    const char *extensions[] {VK_EXT_DEBUG_UTILS_EXTENSION_NAME};

    VkInstanceCreateInfo info {VK_STRUCTURE_TYPE_INSTANCE_CREATE_INFO};
    info.pNext = &debug_info;
    info.pApplicationInfo = &app;
    info.enabledLayerCount = (std::uint32_t) layers.size();
    info.ppEnabledLayerNames = layers.data();
    info.enabledExtensionCount = (std::uint32_t) std::size(extensions);
    info.ppEnabledExtensionNames = extensions;

    VkInstance instance = VK_NULL_HANDLE;
    auto result = vkCreateInstance(&info, nullptr, &instance);
    if (result != VK_SUCCESS) {
      BOOST_LOG(error) << "vkCreateInstance failed: "sv << (int) result;
      return result;
    }

    return instance_t {instance_data_t {instance, vkDestroyInstance}};
  }

  util::Either<messenger_t, VkResult> create_messenger(VkInstance instance, const VkDebugUtilsMessengerCreateInfoEXT &debug_info) {
    auto create = (PFN_vkCreateDebugUtilsMessengerEXT) vkGetInstanceProcAddr(instance, "vkCreateDebugUtilsMessengerEXT");
    auto destroy = (PFN_vkDestroyDebugUtilsMessengerEXT) vkGetInstanceProcAddr(instance, "vkDestroyDebugUtilsMessengerEXT");
    if (!create || !destroy) {
      BOOST_LOG(error) << "Couldn't load "sv << VK_EXT_DEBUG_UTILS_EXTENSION_NAME << " entry points"sv;
      return VK_ERROR_EXTENSION_NOT_PRESENT;
    }

    VkDebugUtilsMessengerEXT messenger = VK_NULL_HANDLE;
    auto result = create(instance, &debug_info, nullptr, &messenger);
    if (result != VK_SUCCESS) {
      BOOST_LOG(error) << "vkCreateDebugUtilsMessengerEXT failed: "sv << (int) result;
      return result;
    }

    return messenger_t {messenger_data_t {instance, messenger, destroy}};
  }

  util::Either<std::vector<VkPhysicalDevice>, VkResult> physical_devices(VkInstance instance) {
    std::uint32_t count = 0;
    auto result = vkEnumeratePhysicalDevices(instance, &count, nullptr);
    if (result != VK_SUCCESS) {
      BOOST_LOG(error) << "vkEnumeratePhysicalDevices failed: "sv << (int) result;
      return result;
    }

    std::vector<VkPhysicalDevice> devices(count);
    result = vkEnumeratePhysicalDevices(instance, &count, devices.data());
    if (result != VK_SUCCESS && result != VK_INCOMPLETE) {
      BOOST_LOG(error) << "vkEnumeratePhysicalDevices failed: "sv << (int) result;
      return result;
    }
    devices.resize(count);

    return devices;
  }

  util::Either<std::vector<VkExtensionProperties>, VkResult> device_extensions(VkPhysicalDevice device) {
    std::uint32_t count = 0;
    auto result = vkEnumerateDeviceExtensionProperties(device, nullptr, &count, nullptr);
    if (result != VK_SUCCESS) {
      BOOST_LOG(error) << "vkEnumerateDeviceExtensionProperties failed: "sv << (int) result;
      return result;
    }

    std::vector<VkExtensionProperties> extensions(count);
    result = vkEnumerateDeviceExtensionProperties(device, nullptr, &count, extensions.data());
    if (result != VK_SUCCESS && result != VK_INCOMPLETE) {
      BOOST_LOG(error) << "vkEnumerateDeviceExtensionProperties failed: "sv << (int) result;
      return result;
    }
    extensions.resize(count);

    return extensions;
  }

  std::optional<caps::queue_family_t> decode_queue_family(VkPhysicalDevice device) {
    std::uint32_t count = 0;
    vkGetPhysicalDeviceQueueFamilyProperties2(device, &count, nullptr);

    std::vector<VkQueueFamilyQueryResultStatusPropertiesKHR> query_result_status(count, {VK_STRUCTURE_TYPE_QUEUE_FAMILY_QUERY_RESULT_STATUS_PROPERTIES_KHR});
    std::vector<VkQueueFamilyVideoPropertiesKHR> video(count, {VK_STRUCTURE_TYPE_QUEUE_FAMILY_VIDEO_PROPERTIES_KHR});
    std::vector<VkQueueFamilyProperties2> families(count, {VK_STRUCTURE_TYPE_QUEUE_FAMILY_PROPERTIES_2});
    for (std::uint32_t x = 0; x < count; ++x) {
      video[x].pNext = &query_result_status[x];
      families[x].pNext = &video[x];
    }

    vkGetPhysicalDeviceQueueFamilyProperties2(device, &count, families.data());
    families.resize(count);

    return caps::select_decode_queue_family(families, video, query_result_status);
  }

  void log_profile_support(const backend_t &backend) {
    std::array<VAProfile, profiles::MAX_PROFILES> list;
    std::size_t count = 0;
    if (profiles::profiles_for(backend.supported_codecs, list, count) != status_e::ok) {
      return;
    }

    for (std::size_t x = 0; x < count; ++x) {
      auto profile_info = profiles::gpu_profile_info_for(list[x]);
      if (!profile_info) {
        BOOST_LOG(debug) << profiles::to_string(list[x]) << ": no Vulkan video profile"sv;
        continue;
      }

      auto operation = profiles::codec_operation(*profile_info);
      BOOST_LOG(info)
        << profiles::to_string(list[x]) << ": decode "sv
        << ((backend.decode_queue_family.operations & operation) ? "supported"sv : "not supported"sv)
        << " by queue family "sv << backend.decode_queue_family.index;
    }
  }

  util::Either<std::unique_ptr<backend_t>, VkResult> init(const drm::device_id_t &device_id, const config::vulkan_t &config) {
    auto backend = std::make_unique<backend_t>();
    auto debug_info = messenger_info();

    auto instance = create_instance(config, debug_info);
    if (instance.has_right()) {
      return instance.right();
    }
    backend->instance = std::move(instance.left());

    auto messenger = create_messenger(backend->instance.el.instance, debug_info);
    if (messenger.has_right()) {
      return messenger.right();
    }
    backend->messenger = std::move(messenger.left());

    auto devices = physical_devices(backend->instance.el.instance);
    if (devices.has_right()) {
      return devices.right();
    }

    std::vector<caps::device_info_t> infos;
    for (auto device : devices.left()) {
      auto extensions = device_extensions(device);
      if (extensions.has_right()) {
        return extensions.right();
      }

      caps::device_info_t info {{}, std::move(extensions.left()), {VK_STRUCTURE_TYPE_PHYSICAL_DEVICE_DRM_PROPERTIES_EXT}};

      VkPhysicalDeviceProperties2 props {VK_STRUCTURE_TYPE_PHYSICAL_DEVICE_PROPERTIES_2};
      if (caps::has_extension(info.extensions, VK_EXT_PHYSICAL_DEVICE_DRM_EXTENSION_NAME)) {
        props.pNext = &info.drm;
      }
      vkGetPhysicalDeviceProperties2(device, &props);
      info.name = props.properties.deviceName;

      infos.emplace_back(std::move(info));
    }

    auto selected = caps::select_device(infos, device_id);
    if (!selected) {
      BOOST_LOG(error) << "No Vulkan device matches DRM device "sv << device_id;
      return VK_ERROR_INITIALIZATION_FAILED;
    }

    backend->physical_device = devices.left()[selected->index];
    backend->device_name = infos[selected->index].name;
    backend->supported_codecs = selected->supported_codecs;
    BOOST_LOG(info) << "Using Vulkan device: "sv << backend->device_name;

    auto queue_family = decode_queue_family(backend->physical_device);
    if (!queue_family) {
      BOOST_LOG(error) << backend->device_name << " has no queue family with video decode and transfer support"sv;
      return VK_ERROR_INITIALIZATION_FAILED;
    }
    backend->decode_queue_family = *queue_family;

    BOOST_LOG(info) << "Video decode queue family: "sv << queue_family->index << " ("sv << queue_family->count << " queues)"sv;
    log_profile_support(*backend);

    return backend;
  }
}  // namespace vk
