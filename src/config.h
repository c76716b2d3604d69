/**
 * @file src/config.h
 * @brief Declarations for the configuration of vavk.
 */
#pragma once

// standard includes
#include <string>
#include <string_view>
#include <unordered_map>

namespace config {
  struct driver_t {
    int min_log_level;  // 0 = verbose ... 5 = fatal, 6 = none
    std::string log_file;  // empty to log to stderr only
    std::string config_file;
  };

  struct vulkan_t {
    bool validation;  // request VK_LAYER_KHRONOS_validation
  };

  extern driver_t driver;
  extern vulkan_t vulkan;

  /**
   * @brief Parse `name = value` lines, `#` starts a comment.
   * @param file_content The content of a configuration file.
   * @return The parsed options.
   */
  std::unordered_map<std::string, std::string> parse_config(const std::string_view &file_content);

  /**
   * @brief Apply parsed options to `config::driver` and `config::vulkan`.
   * @param vars The options, consumed options are removed.
   */
  void apply_config(std::unordered_map<std::string, std::string> &&vars);

  /**
   * @brief Load the configuration file named by `VAVK_CONFIG_FILE` and apply the
   * `VAVK_*` environment overrides on top of it.
   */
  void load();
}  // namespace config
