/**
 * @file src/dispatch.cpp
 * @brief Definitions for populating the VA-API driver vtable.
 */
// standard includes
#include <array>

// local includes
#include "dispatch.h"
#include "driver.h"

using namespace std::literals;

namespace dispatch {
  namespace name {
#define VAVK_SLOT_NAME(slot, ...) inline constexpr char slot[] = #slot;
    VAVK_VTABLE_SLOTS(VAVK_SLOT_NAME, VAVK_SLOT_NAME, VAVK_SLOT_NAME)
#undef VAVK_SLOT_NAME
  }  // namespace name

#define VAVK_SLOT_IMPL(slot, fn) slot_t {std::string_view {#slot}, handler_e::implemented},
#define VAVK_SLOT_STUB(slot) slot_t {std::string_view {#slot}, handler_e::unimplemented},
#define VAVK_SLOT_ABSENT(slot) slot_t {std::string_view {#slot}, handler_e::absent},
  constexpr std::array slot_table {
    VAVK_VTABLE_SLOTS(VAVK_SLOT_IMPL, VAVK_SLOT_STUB, VAVK_SLOT_ABSENT)
  };
#undef VAVK_SLOT_IMPL
#undef VAVK_SLOT_STUB
#undef VAVK_SLOT_ABSENT

  void fill_vtable(VADriverVTable &vtable) {
    vtable = {};

#define VAVK_FILL_IMPL(slot, fn) vtable.slot = fn;
#define VAVK_FILL_STUB(slot) vtable.slot = stub<decltype(vtable.slot), name::slot>::call;
#define VAVK_FILL_ABSENT(slot) vtable.slot = nullptr;
    VAVK_VTABLE_SLOTS(VAVK_FILL_IMPL, VAVK_FILL_STUB, VAVK_FILL_ABSENT)
#undef VAVK_FILL_IMPL
#undef VAVK_FILL_STUB
#undef VAVK_FILL_ABSENT
  }

  std::span<const slot_t> slots() {
    return slot_table;
  }

  std::size_t populated(const VADriverVTable &vtable) {
    std::size_t count = 0;

#define VAVK_COUNT(slot, ...) count += vtable.slot != nullptr;
    VAVK_VTABLE_SLOTS(VAVK_COUNT, VAVK_COUNT, VAVK_COUNT)
#undef VAVK_COUNT

    return count;
  }

  std::string_view to_string(handler_e handler) {
    switch (handler) {
      case handler_e::implemented:
        return "implemented"sv;
      case handler_e::unimplemented:
        return "unimplemented"sv;
      case handler_e::absent:
        return "absent"sv;
    }

    return "unknown"sv;
  }
}  // namespace dispatch
