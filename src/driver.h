/**
 * @file src/driver.h
 * @brief Declarations for the driver entry point and the implemented VA-API operations.
 */
#pragma once

// standard includes
#include <memory>

// lib includes
#include <va/va_backend.h>

// local includes
#include "context.h"
#include "status.h"
#include "vulkan.h"

namespace driver {
  constexpr const char *VENDOR = "vavk";

  /**
   * @brief The record stored in `VADriverContext::pDriverData`.
   */
  struct driver_data_t {
    context::header_t header {context::MAGIC, context::VERSION};
    std::unique_ptr<vk::backend_t> backend;

    ~driver_data_t();
  };

  /**
   * @brief Load the configuration and start logging, once per process.
   */
  void init_once();

  /**
   * @brief Set up `ctx` and attach the driver data.
   *
   * `ctx->pDriverData` is only written on success. A context that still
   * carries driver data is rejected untouched.
   * @param ctx The context received from libva.
   * @return The outcome.
   */
  status_e init(VADriverContextP ctx);

  VAStatus terminate(VADriverContextP ctx);
  VAStatus query_config_profiles(VADriverContextP ctx, VAProfile *profile_list, int *num_profiles);
  VAStatus query_config_entrypoints(VADriverContextP ctx, VAProfile profile, VAEntrypoint *entrypoint_list, int *num_entrypoints);
}  // namespace driver
