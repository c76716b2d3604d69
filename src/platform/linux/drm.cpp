/**
 * @file src/platform/linux/drm.cpp
 * @brief Definitions for resolving the DRM device libva is bound to.
 */
// standard includes
#include <cerrno>
#include <cstring>

// platform includes
#include <sys/stat.h>
#include <sys/sysmacros.h>

// lib includes
#include <va/va_drmcommon.h>

// local includes
#include "drm.h"
#include "src/context.h"
#include "src/logging.h"

using namespace std::literals;

namespace drm {
  std::ostream &operator<<(std::ostream &os, const device_id_t &id) {
    return os << id.major << ':' << id.minor;
  }

  util::Either<device_id_t, status_e> device_id_from_fd(int fd) {
    if (fd < 0) {
      BOOST_LOG(error) << "Invalid DRM file descriptor: "sv << fd;
      return status_e::invalid_parameter;
    }

    struct stat st {};
    if (fstat(fd, &st)) {
      BOOST_LOG(error) << "Couldn't stat DRM file descriptor ["sv << fd << "]: "sv << std::strerror(errno);
      return status_e::operation_failed;
    }

    if (!S_ISCHR(st.st_mode)) {
      BOOST_LOG(error) << "DRM file descriptor ["sv << fd << "] is not a character device"sv;
      return status_e::invalid_parameter;
    }

    BOOST_LOG(debug) << "DRM file descriptor ["sv << fd << "] st_rdev: "sv << util::log_hex(st.st_rdev);

    return device_id_t {
      (std::int64_t) major(st.st_rdev),
      (std::int64_t) minor(st.st_rdev),
    };
  }

  util::Either<device_id_t, status_e> extract_device_id(VADriverContext &ctx) {
    auto state = context::validate_pointer(static_cast<drm_state *>(ctx.drm_state), "drm_state"sv);
    if (state.has_right()) {
      return context::to_status(state.right());
    }

    auto drm = state.left();
    BOOST_LOG(debug) << "DRM state: fd "sv << drm->fd << ", auth type "sv << drm->auth_type;

    auto id = device_id_from_fd(drm->fd);
    if (id.has_left()) {
      BOOST_LOG(info) << "Display is bound to DRM device "sv << id.left();
    }

    return id;
  }
}  // namespace drm
