/**
 * @file src/driver.cpp
 * @brief Definitions for the driver entry point and the implemented VA-API operations.
 */
// standard includes
#include <algorithm>
#include <exception>
#include <mutex>
#include <memory>
#include <new>
#include <span>

// local includes
#include "config.h"
#include "dispatch.h"
#include "driver.h"
#include "logging.h"
#include "platform/linux/drm.h"
#include "profiles.h"

#define VA_DRV_INIT_DEF(_major, _minor) __vaDriverInit_##_major##_##_minor
#define VA_DRV_INIT_FUNC(_major, _minor) VA_DRV_INIT_DEF(_major, _minor)
#define VA_DRV_INIT_FUNC_NAME VA_DRV_INIT_FUNC(VA_MAJOR_VERSION, VA_MINOR_VERSION)

using namespace std::literals;

namespace driver {
  std::once_flag init_flag;
  std::unique_ptr<logging::deinit_t> log_deinit;

  driver_data_t::~driver_data_t() {
    // Stale handles must not pass validation
    *static_cast<volatile std::uint32_t *>(&header.magic) = 0;
  }

  void init_once() {
    std::call_once(init_flag, []() {
      // Anything logged while loading the configuration goes through the default settings
      log_deinit = logging::init(config::driver.min_log_level, config::driver.log_file);
      config::load();

      log_deinit.reset();
      log_deinit = logging::init(config::driver.min_log_level, config::driver.log_file);

      BOOST_LOG(info) << "vavk driver for VA-API "sv << VA_MAJOR_VERSION << '.' << VA_MINOR_VERSION;
    });
  }

  /**
   * @brief Validate the driver data attached to `ctx` and return its backend.
   */
  util::Either<vk::backend_t *, status_e> backend_of(VADriverContext &ctx) {
    auto data = context::validate_driver_data(ctx.pDriverData);
    if (data.has_right()) {
      return context::to_status(data.right());
    }

    auto backend = data.left()->backend.get();
    if (!backend) {
      BOOST_LOG(error) << "Driver data has no Vulkan backend"sv;
      return status_e::operation_failed;
    }

    return backend;
  }

  status_e init(VADriverContextP ctx) {
    auto validated = context::validate(ctx);
    if (validated.has_right()) {
      return context::to_status(validated.right());
    }
    auto &c = *validated.left();

    if (c.pDriverData) {
      BOOST_LOG(error) << "Context already carries driver data, vaTerminate must run before another init"sv;
      return status_e::invalid_parameter;
    }

    auto vtable = context::validate_pointer(c.vtable, "vtable"sv);
    if (vtable.has_right()) {
      return context::to_status(vtable.right());
    }

    c.max_profiles = (int) profiles::MAX_PROFILES;
    c.max_entrypoints = (int) profiles::MAX_ENTRYPOINTS;
    c.max_attributes = 1;
    c.max_image_formats = 1;
    c.max_subpic_formats = 1;
    c.max_display_attributes = 1;
    c.str_vendor = VENDOR;

    dispatch::fill_vtable(*vtable.left());
    BOOST_LOG(debug) << "Installed "sv << dispatch::populated(*vtable.left()) << " of "sv << dispatch::slots().size() << " operations"sv;

    auto device_id = drm::extract_device_id(c);
    if (device_id.has_right()) {
      return device_id.right();
    }

    auto backend = vk::init(device_id.left(), config::vulkan);
    if (backend.has_right()) {
      BOOST_LOG(error) << "Vulkan initialization failed: "sv << (int) backend.right();
      return status_e::operation_failed;
    }

    auto data = std::make_unique<driver_data_t>();
    data->backend = std::move(backend.left());

    c.pDriverData = data.release();

    BOOST_LOG(info) << "Driver initialized on "sv << ((driver_data_t *) c.pDriverData)->backend->device_name;
    return status_e::ok;
  }

  VAStatus terminate(VADriverContextP ctx) {
    return context::with_context(ctx, [](VADriverContext &c) {
      if (!c.pDriverData) {
        BOOST_LOG(warning) << "vaTerminate: driver data was already released"sv;
        return status_e::ok;
      }

      auto data = context::validate_driver_data(c.pDriverData);
      if (data.has_right()) {
        return context::to_status(data.right());
      }

      delete data.left();
      c.pDriverData = nullptr;

      BOOST_LOG(info) << "Driver terminated"sv;
      logging::log_flush();

      return status_e::ok;
    });
  }

  VAStatus query_config_profiles(VADriverContextP ctx, VAProfile *profile_list, int *num_profiles) {
    return context::with_context(ctx, [&](VADriverContext &c) {
      auto list = context::validate_pointer(profile_list, "profile_list"sv);
      if (list.has_right()) {
        return context::to_status(list.right());
      }

      auto num = context::validate_pointer(num_profiles, "num_profiles"sv);
      if (num.has_right()) {
        return context::to_status(num.right());
      }

      auto backend = backend_of(c);
      if (backend.has_right()) {
        return backend.right();
      }

      std::size_t count = 0;
      std::span<VAProfile> out {list.left(), (std::size_t) std::max(c.max_profiles, 0)};
      auto status = profiles::profiles_for(backend.left()->supported_codecs, out, count);
      if (status != status_e::ok) {
        return status;
      }

      *num.left() = (int) count;
      return status_e::ok;
    });
  }

  VAStatus query_config_entrypoints(VADriverContextP ctx, VAProfile profile, VAEntrypoint *entrypoint_list, int *num_entrypoints) {
    return context::with_context(ctx, [&](VADriverContext &c) {
      auto list = context::validate_pointer(entrypoint_list, "entrypoint_list"sv);
      if (list.has_right()) {
        return context::to_status(list.right());
      }

      auto num = context::validate_pointer(num_entrypoints, "num_entrypoints"sv);
      if (num.has_right()) {
        return context::to_status(num.right());
      }

      auto backend = backend_of(c);
      if (backend.has_right()) {
        return backend.right();
      }

      std::size_t count = 0;
      std::span<VAEntrypoint> out {list.left(), (std::size_t) std::max(c.max_entrypoints, 0)};
      auto status = profiles::entrypoints_for(profile, backend.left()->supported_codecs, out, count);
      if (status != status_e::ok) {
        return status;
      }

      *num.left() = (int) count;
      return status_e::ok;
    });
  }
}  // namespace driver

extern "C" __attribute__((visibility("default"))) VAStatus VA_DRV_INIT_FUNC_NAME(VADriverContextP ctx) {
  try {
    driver::init_once();

    auto result = driver::init(ctx);
    if (result != status_e::ok) {
      BOOST_LOG(error) << "Driver initialization failed: "sv << result;
    }

    return status::to_va_status(result);
  } catch (const std::bad_alloc &e) {
    BOOST_LOG(fatal) << "Driver initialization ran out of memory: "sv << e.what();
    return VA_STATUS_ERROR_ALLOCATION_FAILED;
  } catch (const std::exception &e) {
    BOOST_LOG(fatal) << "Driver initialization failed: "sv << e.what();
    return VA_STATUS_ERROR_OPERATION_FAILED;
  }
}
