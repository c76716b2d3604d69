/**
 * @file src/platform/linux/drm.h
 * @brief Declarations for resolving the DRM device libva is bound to.
 */
#pragma once

// standard includes
#include <cstdint>
#include <ostream>

// lib includes
#include <va/va_backend.h>

// local includes
#include "src/status.h"
#include "src/utility.h"

namespace drm {
  /**
   * @brief Kernel device number of a DRM node.
   */
  struct device_id_t {
    std::int64_t major;
    std::int64_t minor;

    friend bool operator==(const device_id_t &l, const device_id_t &r) {
      return l.major == r.major && l.minor == r.minor;
    }

    friend bool operator!=(const device_id_t &l, const device_id_t &r) {
      return !(l == r);
    }
  };

  std::ostream &operator<<(std::ostream &os, const device_id_t &id);

  /**
   * @brief Read the device number behind a file descriptor.
   *
   * The descriptor belongs to the caller and is left open.
   * @param fd The descriptor to query.
   * @return The device number, `invalid_parameter` for a negative descriptor or
   * a file that isn't a character device, `operation_failed` if `fstat` fails.
   */
  util::Either<device_id_t, status_e> device_id_from_fd(int fd);

  /**
   * @brief Resolve the device number of `ctx.drm_state->fd`.
   * @param ctx A validated driver context.
   * @return The device number or the failure.
   */
  util::Either<device_id_t, status_e> extract_device_id(VADriverContext &ctx);
}  // namespace drm
