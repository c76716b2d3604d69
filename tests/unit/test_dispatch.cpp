/**
 * @file tests/unit/test_dispatch.cpp
 * @brief Test src/dispatch.*.
 */
#include "../tests_common.h"

#include <algorithm>
#include <cstring>
#include <set>
#include <src/dispatch.h>
#include <src/driver.h>

TEST(DispatchTest, ImplementedSlots) {
  VADriverVTable vtable;
  std::memset(&vtable, 0xff, sizeof(vtable));

  dispatch::fill_vtable(vtable);

  EXPECT_EQ(vtable.vaTerminate, &driver::terminate);
  EXPECT_EQ(vtable.vaQueryConfigProfiles, &driver::query_config_profiles);
  EXPECT_EQ(vtable.vaQueryConfigEntrypoints, &driver::query_config_entrypoints);
}

TEST(DispatchTest, AbsentSlotsAreNull) {
  VADriverVTable vtable;
  std::memset(&vtable, 0xff, sizeof(vtable));

  dispatch::fill_vtable(vtable);

  EXPECT_EQ(vtable.vaQuerySurfaceError, nullptr);
  EXPECT_EQ(vtable.vaPutSurface, nullptr);
  EXPECT_EQ(vtable.vaBufferInfo, nullptr);
  EXPECT_EQ(vtable.vaExportSurfaceHandle, nullptr);
  EXPECT_EQ(vtable.vaSyncBuffer, nullptr);
  EXPECT_EQ(vtable.vaCopy, nullptr);
  EXPECT_EQ(vtable.vaMapBuffer2, nullptr);
}

TEST(DispatchTest, PopulatedMatchesTable) {
  VADriverVTable vtable {};
  dispatch::fill_vtable(vtable);

  auto slots = dispatch::slots();
  auto expected = std::count_if(std::begin(slots), std::end(slots), [](const dispatch::slot_t &slot) {
    return slot.handler != dispatch::handler_e::absent;
  });

  EXPECT_EQ(dispatch::populated(vtable), (std::size_t) expected);
  EXPECT_EQ(std::count_if(std::begin(slots), std::end(slots), [](const dispatch::slot_t &slot) {
              return slot.handler == dispatch::handler_e::implemented;
            }),
            3);
}

TEST(DispatchTest, SlotNamesAreUnique) {
  auto slots = dispatch::slots();

  std::set<std::string_view> names;
  for (auto &slot : slots) {
    EXPECT_TRUE(names.insert(slot.name).second) << slot.name;
  }
  EXPECT_EQ(slots.front().name, "vaTerminate");
  EXPECT_EQ(slots.back().name, "vaMapBuffer2");
}

TEST(DispatchTest, StubsValidateContext) {
  VADriverVTable vtable {};
  dispatch::fill_vtable(vtable);

  EXPECT_EQ(vtable.vaDestroyConfig(nullptr, 0), VA_STATUS_ERROR_INVALID_PARAMETER);
  EXPECT_EQ(vtable.vaSyncSurface(nullptr, 0), VA_STATUS_ERROR_INVALID_PARAMETER);
}

TEST(DispatchTest, StubsAreUnimplemented) {
  VADriverVTable vtable {};
  dispatch::fill_vtable(vtable);

  VADriverContext ctx {};
  ctx.vtable = &vtable;

  VAConfigID config_id = 0;
  EXPECT_EQ(vtable.vaCreateConfig(&ctx, VAProfileH264Main, VAEntrypointVLD, nullptr, 0, &config_id), VA_STATUS_ERROR_UNIMPLEMENTED);
  EXPECT_EQ(vtable.vaDestroyConfig(&ctx, 0), VA_STATUS_ERROR_UNIMPLEMENTED);
  EXPECT_EQ(vtable.vaBeginPicture(&ctx, 0, 0), VA_STATUS_ERROR_UNIMPLEMENTED);
  EXPECT_EQ(vtable.vaEndPicture(&ctx, 0), VA_STATUS_ERROR_UNIMPLEMENTED);
  EXPECT_EQ(vtable.vaDestroyImage(&ctx, 0), VA_STATUS_ERROR_UNIMPLEMENTED);
  EXPECT_EQ(config_id, 0);
}

TEST(DispatchTest, HandlerNames) {
  EXPECT_EQ(dispatch::to_string(dispatch::handler_e::implemented), "implemented");
  EXPECT_EQ(dispatch::to_string(dispatch::handler_e::unimplemented), "unimplemented");
  EXPECT_EQ(dispatch::to_string(dispatch::handler_e::absent), "absent");
}
