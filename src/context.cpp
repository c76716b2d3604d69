/**
 * @file src/context.cpp
 * @brief Definitions for validating the opaque handles handed over by libva.
 */
// standard includes
#include <cstring>

// local includes
#include "context.h"
#include "driver.h"

namespace context {
  std::string_view to_string(rejection_e rejection) {
    switch (rejection) {
      case rejection_e::null_pointer:
        return "null pointer"sv;
      case rejection_e::misaligned:
        return "misaligned pointer"sv;
      case rejection_e::bad_magic:
        return "bad magic"sv;
      case rejection_e::bad_version:
        return "unsupported version"sv;
    }

    return "unknown"sv;
  }

  util::Either<VADriverContext *, rejection_e> validate(VADriverContextP ctx) {
    return validate_pointer(ctx, "driver context"sv);
  }

  util::Either<driver::driver_data_t *, rejection_e> validate_driver_data(void *data) {
    auto ptr = validate_pointer(static_cast<driver::driver_data_t *>(data), "driver data"sv);
    if (ptr.has_right()) {
      return ptr.right();
    }

    header_t header;
    std::memcpy(&header, data, sizeof(header));

    if (header.magic != MAGIC) {
      BOOST_LOG(error) << "Rejected driver data: "sv << to_string(rejection_e::bad_magic) << ' ' << util::log_hex(header.magic);
      return rejection_e::bad_magic;
    }

    if (header.version != VERSION) {
      BOOST_LOG(error) << "Rejected driver data: "sv << to_string(rejection_e::bad_version) << ' ' << header.version;
      return rejection_e::bad_version;
    }

    return ptr.left();
  }
}  // namespace context
