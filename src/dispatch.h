/**
 * @file src/dispatch.h
 * @brief Declarations for populating the VA-API driver vtable.
 */
#pragma once

// standard includes
#include <cstddef>
#include <span>
#include <string_view>

// lib includes
#include <va/va_backend.h>

// local includes
#include "context.h"
#include "logging.h"

/**
 * @brief Every slot of `VADriverVTable` and how it is handled.
 *
 * `IMPL(slot, fn)` installs `fn`, `STUB(slot)` installs a handler that validates
 * the context and reports `VA_STATUS_ERROR_UNIMPLEMENTED`, `ABSENT(slot)` leaves
 * the slot null.
 */
#define VAVK_VTABLE_SLOTS(IMPL, STUB, ABSENT)              \
  IMPL(vaTerminate, driver::terminate)                     \
  IMPL(vaQueryConfigProfiles, driver::query_config_profiles) \
  IMPL(vaQueryConfigEntrypoints, driver::query_config_entrypoints) \
  STUB(vaGetConfigAttributes)                              \
  STUB(vaCreateConfig)                                     \
  STUB(vaDestroyConfig)                                    \
  STUB(vaQueryConfigAttributes)                            \
  STUB(vaCreateSurfaces)                                   \
  STUB(vaDestroySurfaces)                                  \
  STUB(vaCreateContext)                                    \
  STUB(vaDestroyContext)                                   \
  STUB(vaCreateBuffer)                                     \
  STUB(vaBufferSetNumElements)                             \
  STUB(vaMapBuffer)                                        \
  STUB(vaUnmapBuffer)                                      \
  STUB(vaDestroyBuffer)                                    \
  STUB(vaBeginPicture)                                     \
  STUB(vaRenderPicture)                                    \
  STUB(vaEndPicture)                                       \
  STUB(vaSyncSurface)                                      \
  STUB(vaQuerySurfaceStatus)                               \
  ABSENT(vaQuerySurfaceError)                              \
  ABSENT(vaPutSurface)                                     \
  STUB(vaQueryImageFormats)                                \
  STUB(vaCreateImage)                                      \
  STUB(vaDeriveImage)                                      \
  STUB(vaDestroyImage)                                     \
  STUB(vaSetImagePalette)                                  \
  STUB(vaGetImage)                                         \
  STUB(vaPutImage)                                         \
  STUB(vaQuerySubpictureFormats)                           \
  STUB(vaCreateSubpicture)                                 \
  STUB(vaDestroySubpicture)                                \
  STUB(vaSetSubpictureImage)                               \
  STUB(vaSetSubpictureChromakey)                           \
  STUB(vaSetSubpictureGlobalAlpha)                         \
  STUB(vaAssociateSubpicture)                              \
  STUB(vaDeassociateSubpicture)                            \
  STUB(vaQueryDisplayAttributes)                           \
  STUB(vaGetDisplayAttributes)                             \
  STUB(vaSetDisplayAttributes)                             \
  ABSENT(vaBufferInfo)                                     \
  ABSENT(vaLockSurface)                                    \
  ABSENT(vaUnlockSurface)                                  \
  ABSENT(vaGetSurfaceAttributes)                           \
  ABSENT(vaCreateSurfaces2)                                \
  ABSENT(vaQuerySurfaceAttributes)                         \
  ABSENT(vaAcquireBufferHandle)                            \
  ABSENT(vaReleaseBufferHandle)                            \
  ABSENT(vaCreateMFContext)                                \
  ABSENT(vaMFAddContext)                                   \
  ABSENT(vaMFReleaseContext)                               \
  ABSENT(vaMFSubmit)                                       \
  ABSENT(vaCreateBuffer2)                                  \
  ABSENT(vaQueryProcessingRate)                            \
  ABSENT(vaExportSurfaceHandle)                            \
  ABSENT(vaSyncSurface2)                                   \
  ABSENT(vaSyncBuffer)                                     \
  ABSENT(vaCopy)                                           \
  ABSENT(vaMapBuffer2)

namespace dispatch {
  using namespace std::literals;

  enum class handler_e {
    implemented,
    unimplemented,
    absent,
  };

  struct slot_t {
    std::string_view name;
    handler_e handler;
  };

  /**
   * @brief Handler installed in slots without an implementation.
   *
   * @tparam Slot The function pointer type of the vtable slot.
   * @tparam Name The name of the slot, for log output.
   */
  template<class Slot, const char *Name>
  struct stub;

  template<const char *Name, class... Args>
  struct stub<VAStatus (*)(VADriverContextP, Args...), Name> {
    static VAStatus call(VADriverContextP ctx, Args...) {
      return context::with_context(ctx, [](VADriverContext &) {
        BOOST_LOG(debug) << Name << ": not implemented"sv;
        return status_e::unimplemented;
      });
    }
  };

  /**
   * @brief Assign every slot of `vtable`, slots that are absent are set to null.
   */
  void fill_vtable(VADriverVTable &vtable);

  /**
   * @return The slots in vtable order.
   */
  std::span<const slot_t> slots();

  /**
   * @return The number of non-null slots `fill_vtable` knows about.
   */
  std::size_t populated(const VADriverVTable &vtable);

  std::string_view to_string(handler_e handler);
}  // namespace dispatch
