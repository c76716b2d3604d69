/**
 * @file src/context.h
 * @brief Declarations for validating the opaque handles handed over by libva.
 */
#pragma once

// standard includes
#include <cstdint>
#include <string_view>

// lib includes
#include <va/va_backend.h>

// local includes
#include "logging.h"
#include "status.h"
#include "utility.h"

namespace driver {
  struct driver_data_t;
}  // namespace driver

namespace context {
  using namespace std::literals;

  constexpr std::uint32_t MAGIC = 0x5641564b;  // "VAVK"
  constexpr std::uint32_t VERSION = 1;

  /**
   * @brief Leading bytes of every record stored in `pDriverData`.
   */
  struct header_t {
    std::uint32_t magic;
    std::uint32_t version;
  };

  enum class rejection_e {
    null_pointer,
    misaligned,
    bad_magic,
    bad_version,
  };

  std::string_view to_string(rejection_e rejection);

  /**
   * @brief Every rejection is reported to the host as an invalid parameter.
   */
  constexpr status_e to_status(rejection_e) {
    return status_e::invalid_parameter;
  }

  /**
   * @brief Check that a pointer is non-null and naturally aligned for `T`.
   * @param ptr The pointer to check, it is never dereferenced.
   * @param what Name of the object in log output.
   * @return The pointer, or the reason it was rejected.
   */
  template<class T>
  util::Either<T *, rejection_e> validate_pointer(T *ptr, std::string_view what) {
    if (!ptr) {
      BOOST_LOG(error) << "Rejected "sv << what << ": "sv << to_string(rejection_e::null_pointer);
      return rejection_e::null_pointer;
    }

    if (reinterpret_cast<std::uintptr_t>(ptr) % alignof(T)) {
      BOOST_LOG(error) << "Rejected "sv << what << " ["sv << (void *) ptr << "]: "sv << to_string(rejection_e::misaligned);
      return rejection_e::misaligned;
    }

    return ptr;
  }

  util::Either<VADriverContext *, rejection_e> validate(VADriverContextP ctx);

  /**
   * @brief Validate the private data slot of a driver context.
   *
   * Only the header is read: a record is accepted when it is non-null, aligned,
   * and carries the expected magic and version.
   * @param data The value of `ctx->pDriverData`.
   * @return The driver data, or the reason it was rejected.
   */
  util::Either<driver::driver_data_t *, rejection_e> validate_driver_data(void *data);

  /**
   * @brief Validate `ctx` and run `f` against it.
   * @param ctx The context received from libva.
   * @param f Callable taking `VADriverContext &` and returning `status_e`.
   * @return The translated status.
   */
  template<class F>
  VAStatus with_context(VADriverContextP ctx, F &&f) {
    auto result = validate(ctx);
    if (result.has_right()) {
      return status::to_va_status(to_status(result.right()));
    }

    return status::to_va_status(f(*result.left()));
  }
}  // namespace context
