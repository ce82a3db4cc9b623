#include <array>
#include <vector>

#include <gtest/gtest.h>

#include "podkit/collections/flex_set.hpp"
#include "podkit/types/pod_int.hpp"

namespace {
    using podkit::types::PodU16;
    using u32 = podkit::core::u32;
} // namespace

TEST(FlexSet, InsertKeepsSortedUniqueValues) {
    std::array<podkit::core::u8, 4 + 2 * 6> buf{};
    const podkit::bytes::BufferMut region{buf.data(), static_cast<u32>(buf.size())};
    ASSERT_TRUE(podkit::core::is_ok(podkit::collections::seq_init(region)));

    for (podkit::core::u16 v : {40, 10, 30, 20}) {
        bool inserted = false;
        ASSERT_TRUE(podkit::core::is_ok(podkit::collections::set_insert(region, PodU16::from(v), &inserted)));
        EXPECT_TRUE(inserted);
    }
    bool inserted = true;
    ASSERT_TRUE(podkit::core::is_ok(podkit::collections::set_insert(region, PodU16::from(30), &inserted)));
    EXPECT_FALSE(inserted);

    podkit::bytes::PodSlice<PodU16> items{};
    ASSERT_TRUE(podkit::core::is_ok(podkit::collections::set_items<PodU16>(podkit::bytes::as_view(region), &items)));
    std::vector<podkit::core::u16> got;
    for (const PodU16& v : items) {
        got.push_back(v.get());
    }
    EXPECT_EQ(got, (std::vector<podkit::core::u16>{10, 20, 30, 40}));
}

TEST(FlexSet, FullSetRejectsNewButAcceptsExisting) {
    std::array<podkit::core::u8, 4 + 2 * 2> buf{};
    const podkit::bytes::BufferMut region{buf.data(), static_cast<u32>(buf.size())};
    ASSERT_TRUE(podkit::core::is_ok(podkit::collections::seq_init(region)));
    ASSERT_TRUE(podkit::core::is_ok(podkit::collections::set_insert(region, PodU16::from(1), nullptr)));
    ASSERT_TRUE(podkit::core::is_ok(podkit::collections::set_insert(region, PodU16::from(2), nullptr)));

    EXPECT_EQ(podkit::collections::set_insert(region, PodU16::from(3), nullptr).code,
              podkit::core::StatusCode::CapacityExceeded);
    bool inserted = true;
    EXPECT_TRUE(podkit::core::is_ok(podkit::collections::set_insert(region, PodU16::from(2), &inserted)));
    EXPECT_FALSE(inserted);
}

TEST(FlexSet, TakeAndRemove) {
    std::array<podkit::core::u8, 16> buf{};
    const podkit::bytes::BufferMut region{buf.data(), 16};
    ASSERT_TRUE(podkit::core::is_ok(podkit::collections::seq_init(region)));
    for (podkit::core::u16 v : {5, 6, 7}) {
        ASSERT_TRUE(podkit::core::is_ok(podkit::collections::set_insert(region, PodU16::from(v), nullptr)));
    }

    PodU16 taken{};
    ASSERT_TRUE(podkit::core::is_ok(podkit::collections::set_take(region, PodU16::from(6), &taken)));
    EXPECT_EQ(taken.get(), 6);
    EXPECT_EQ(podkit::collections::set_take(region, PodU16::from(6), &taken).code,
              podkit::core::StatusCode::KeyNotFound);

    bool removed = false;
    ASSERT_TRUE(podkit::core::is_ok(podkit::collections::set_remove(region, PodU16::from(5), &removed)));
    EXPECT_TRUE(removed);
    ASSERT_TRUE(podkit::core::is_ok(podkit::collections::set_remove(region, PodU16::from(5), &removed)));
    EXPECT_FALSE(removed);

    u32 len = 0;
    ASSERT_TRUE(podkit::core::is_ok(podkit::collections::set_len<PodU16>(podkit::bytes::as_view(region), &len)));
    EXPECT_EQ(len, 1u);

    bool present = false;
    ASSERT_TRUE(podkit::core::is_ok(
        podkit::collections::set_contains(podkit::bytes::as_view(region), PodU16::from(7), &present)));
    EXPECT_TRUE(present);
    const PodU16* got = nullptr;
    ASSERT_TRUE(podkit::core::is_ok(podkit::collections::set_get(podkit::bytes::as_view(region), PodU16::from(7), &got)));
    EXPECT_EQ(got->get(), 7);
}

TEST(FlexSet, GetMutAndFullness) {
    std::array<podkit::core::u8, 4 + 2 * 2> buf{};
    const podkit::bytes::BufferMut region{buf.data(), static_cast<u32>(buf.size())};
    const podkit::bytes::BufferView view = podkit::bytes::as_view(region);
    ASSERT_TRUE(podkit::core::is_ok(podkit::collections::seq_init(region)));

    bool empty = false;
    bool full = true;
    ASSERT_TRUE(podkit::core::is_ok(podkit::collections::set_is_empty<PodU16>(view, &empty)));
    ASSERT_TRUE(podkit::core::is_ok(podkit::collections::set_is_full<PodU16>(view, &full)));
    EXPECT_TRUE(empty);
    EXPECT_FALSE(full);
    u32 cap = 0;
    ASSERT_TRUE(podkit::core::is_ok(podkit::collections::set_capacity<PodU16>(view, &cap)));
    EXPECT_EQ(cap, 2u);

    ASSERT_TRUE(podkit::core::is_ok(podkit::collections::set_insert(region, PodU16::from(10), nullptr)));
    ASSERT_TRUE(podkit::core::is_ok(podkit::collections::set_insert(region, PodU16::from(20), nullptr)));
    ASSERT_TRUE(podkit::core::is_ok(podkit::collections::set_is_empty<PodU16>(view, &empty)));
    ASSERT_TRUE(podkit::core::is_ok(podkit::collections::set_is_full<PodU16>(view, &full)));
    EXPECT_FALSE(empty);
    EXPECT_TRUE(full);

    PodU16* slot = nullptr;
    ASSERT_TRUE(podkit::core::is_ok(podkit::collections::set_get_mut(region, PodU16::from(20), &slot)));
    ASSERT_NE(slot, nullptr);
    EXPECT_EQ(slot->get(), 20);
    // Still above 10, so the order holds.
    slot->set(25);

    bool present = false;
    ASSERT_TRUE(podkit::core::is_ok(podkit::collections::set_contains(view, PodU16::from(25), &present)));
    EXPECT_TRUE(present);
    ASSERT_TRUE(podkit::core::is_ok(podkit::collections::set_contains(view, PodU16::from(20), &present)));
    EXPECT_FALSE(present);

    EXPECT_EQ(podkit::collections::set_get_mut(region, PodU16::from(20), &slot).code,
              podkit::core::StatusCode::KeyNotFound);
    EXPECT_EQ(podkit::collections::set_get_mut<PodU16>(region, PodU16::from(10), nullptr).code,
              podkit::core::StatusCode::Invalid);
}
