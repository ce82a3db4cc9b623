#include <array>
#include <cstring>
#include <vector>

#include <gtest/gtest.h>

#include "podkit/collections/flex_seq.hpp"
#include "podkit/types/pod_int.hpp"

namespace {
    using podkit::types::PodU32;
    using u32 = podkit::core::u32;

    template <std::size_t N>
    podkit::bytes::BufferMut mut(std::array<podkit::core::u8, N>& b, u32 offset = 0, u32 len = N) {
        return podkit::bytes::BufferMut{b.data() + offset, len};
    }

    template <std::size_t N>
    std::vector<u32> values(std::array<podkit::core::u8, N>& b, u32 offset, u32 len) {
        podkit::bytes::PodSlice<PodU32> items{};
        EXPECT_TRUE(podkit::core::is_ok(
            podkit::collections::seq_items<PodU32>(podkit::bytes::as_view(mut(b, offset, len)), &items)));
        std::vector<u32> out;
        for (const PodU32& v : items) {
            out.push_back(v.get());
        }
        return out;
    }
} // namespace

TEST(FlexSeq, InitWritesAnEmptyHeader) {
    std::array<podkit::core::u8, 16> buf{};
    buf.fill(0xaa);
    ASSERT_TRUE(podkit::core::is_ok(podkit::collections::seq_init(mut(buf))));
    EXPECT_EQ(buf[0], 0);
    EXPECT_EQ(buf[3], 0);
    EXPECT_EQ(buf[4], 0xaa);

    u32 cap = 0;
    ASSERT_TRUE(podkit::core::is_ok(podkit::collections::seq_capacity<PodU32>(podkit::bytes::as_view(mut(buf)), &cap)));
    EXPECT_EQ(cap, 3u);

    std::array<podkit::core::u8, 3> tiny{};
    EXPECT_EQ(podkit::collections::seq_init(mut(tiny)).code, podkit::core::StatusCode::OutOfBounds);
}

TEST(FlexSeq, PushThenGetLast) {
    std::array<podkit::core::u8, 64> buf{};
    const auto region = mut(buf, 0, 40);
    ASSERT_TRUE(podkit::core::is_ok(podkit::collections::seq_init(region)));

    for (u32 v = 1; v <= 4; ++v) {
        ASSERT_TRUE(podkit::core::is_ok(podkit::collections::seq_push(region, PodU32::from(v))));
        u32 len = 0;
        ASSERT_TRUE(podkit::core::is_ok(podkit::collections::seq_len(podkit::bytes::as_view(region), &len)));
        EXPECT_EQ(len, v);
        const PodU32* last = nullptr;
        ASSERT_TRUE(podkit::core::is_ok(
            podkit::collections::seq_get<PodU32>(podkit::bytes::as_view(region), len - 1, &last)));
        EXPECT_EQ(last->get(), v);
    }
}

TEST(FlexSeq, ScenarioInsertAtFrontThenFillToTheSpan) {
    std::array<podkit::core::u8, 64> buf{};
    const auto region = mut(buf, 0, 40);
    ASSERT_TRUE(podkit::core::is_ok(podkit::collections::seq_init(region)));
    for (u32 v = 1; v <= 4; ++v) {
        ASSERT_TRUE(podkit::core::is_ok(podkit::collections::seq_push(region, PodU32::from(v))));
    }
    ASSERT_TRUE(podkit::core::is_ok(podkit::collections::seq_insert(region, 0, PodU32::from(0))));
    EXPECT_EQ(values(buf, 0, 40), (std::vector<u32>{0, 1, 2, 3, 4}));

    // 4-byte header + 9 elements fill the 40-byte span
    for (u32 v = 5; v <= 8; ++v) {
        ASSERT_TRUE(podkit::core::is_ok(podkit::collections::seq_push(region, PodU32::from(v))));
    }
    const std::array<podkit::core::u8, 64> before = buf;
    const podkit::core::Status s = podkit::collections::seq_push(region, PodU32::from(9));
    EXPECT_EQ(s.code, podkit::core::StatusCode::CapacityExceeded);
    EXPECT_EQ(buf, before);
    EXPECT_EQ(values(buf, 0, 40), (std::vector<u32>{0, 1, 2, 3, 4, 5, 6, 7, 8}));
}

TEST(FlexSeq, InsertThenRemoveRestoresOrder) {
    std::array<podkit::core::u8, 40> buf{};
    const auto region = mut(buf);
    ASSERT_TRUE(podkit::core::is_ok(podkit::collections::seq_init(region)));
    for (u32 v = 10; v < 15; ++v) {
        ASSERT_TRUE(podkit::core::is_ok(podkit::collections::seq_push(region, PodU32::from(v))));
    }
    const std::vector<u32> original = values(buf, 0, 40);

    for (u32 i = 0; i <= 5; ++i) {
        ASSERT_TRUE(podkit::core::is_ok(podkit::collections::seq_insert(region, i, PodU32::from(99))));
        PodU32 out{};
        ASSERT_TRUE(podkit::core::is_ok(podkit::collections::seq_remove(region, i, &out)));
        EXPECT_EQ(out.get(), 99u);
        EXPECT_EQ(values(buf, 0, 40), original);
    }
}

TEST(FlexSeq, BadIndexChangesNothing) {
    std::array<podkit::core::u8, 24> buf{};
    const auto region = mut(buf);
    ASSERT_TRUE(podkit::core::is_ok(podkit::collections::seq_init(region)));
    ASSERT_TRUE(podkit::core::is_ok(podkit::collections::seq_push(region, PodU32::from(1))));
    const auto before = buf;

    EXPECT_EQ(podkit::collections::seq_insert(region, 2, PodU32::from(5)).code,
              podkit::core::StatusCode::IndexOutOfRange);
    EXPECT_EQ(podkit::collections::seq_remove<PodU32>(region, 1, nullptr).code,
              podkit::core::StatusCode::IndexOutOfRange);
    const PodU32* v = nullptr;
    EXPECT_EQ(podkit::collections::seq_get<PodU32>(podkit::bytes::as_view(region), 1, &v).code,
              podkit::core::StatusCode::IndexOutOfRange);
    EXPECT_EQ(buf, before);
}

TEST(FlexSeq, HeaderLargerThanSpanIsInvalidRegion) {
    std::array<podkit::core::u8, 12> buf{};
    buf[0] = 3; // 3 * 4 + 4 > 12
    u32 len = 0;
    EXPECT_EQ(podkit::collections::seq_validate(podkit::bytes::as_view(mut(buf)), 4, &len).code,
              podkit::core::StatusCode::InvalidRegion);
    EXPECT_EQ(podkit::collections::seq_push(mut(buf), PodU32::from(1)).code, podkit::core::StatusCode::InvalidRegion);
}

TEST(FlexSeq, InsertValueFromInsideTheRegion) {
    std::array<podkit::core::u8, 24> buf{};
    const auto region = mut(buf);
    ASSERT_TRUE(podkit::core::is_ok(podkit::collections::seq_init(region)));
    ASSERT_TRUE(podkit::core::is_ok(podkit::collections::seq_push(region, PodU32::from(7))));
    ASSERT_TRUE(podkit::core::is_ok(podkit::collections::seq_push(region, PodU32::from(8))));

    const PodU32* first = nullptr;
    ASSERT_TRUE(podkit::core::is_ok(podkit::collections::seq_get<PodU32>(podkit::bytes::as_view(region), 0, &first)));
    ASSERT_TRUE(podkit::core::is_ok(podkit::collections::seq_insert(region, 0, *first)));
    EXPECT_EQ(values(buf, 0, 24), (std::vector<u32>{7, 7, 8}));
}

TEST(FlexSeq, RawEngineChecksElementSize) {
    std::array<podkit::core::u8, 16> buf{};
    const auto region = mut(buf);
    ASSERT_TRUE(podkit::core::is_ok(podkit::collections::seq_init(region)));
    const podkit::core::u8 three[3] = {1, 2, 3};
    EXPECT_EQ(podkit::collections::seq_insert_raw(region, 4, 0, {three, 3}).code,
              podkit::core::StatusCode::SizeMismatch);
    ASSERT_TRUE(podkit::core::is_ok(podkit::collections::seq_insert_raw(region, 3, 0, {three, 3})));
    podkit::bytes::BufferView elem{};
    ASSERT_TRUE(podkit::core::is_ok(podkit::collections::seq_get_raw(podkit::bytes::as_view(region), 3, 0, &elem)));
    EXPECT_EQ(std::memcmp(elem.data, three, 3), 0);
}

TEST(FlexSeq, TruncateAndClear) {
    std::array<podkit::core::u8, 24> buf{};
    const auto region = mut(buf);
    ASSERT_TRUE(podkit::core::is_ok(podkit::collections::seq_init(region)));
    for (u32 v = 0; v < 4; ++v) {
        ASSERT_TRUE(podkit::core::is_ok(podkit::collections::seq_push(region, PodU32::from(v))));
    }
    EXPECT_EQ(podkit::collections::seq_truncate(region, 4, 5).code, podkit::core::StatusCode::IndexOutOfRange);
    ASSERT_TRUE(podkit::core::is_ok(podkit::collections::seq_truncate(region, 4, 2)));
    EXPECT_EQ(values(buf, 0, 24), (std::vector<u32>{0, 1}));
    ASSERT_TRUE(podkit::core::is_ok(podkit::collections::seq_clear(region)));
    EXPECT_TRUE(values(buf, 0, 24).empty());
}

TEST(FlexSeq, ItemsMutWritesInPlace) {
    std::array<podkit::core::u8, 16> buf{};
    const auto region = mut(buf);
    ASSERT_TRUE(podkit::core::is_ok(podkit::collections::seq_init(region)));
    ASSERT_TRUE(podkit::core::is_ok(podkit::collections::seq_push(region, PodU32::from(1))));
    ASSERT_TRUE(podkit::core::is_ok(podkit::collections::seq_push(region, PodU32::from(2))));

    podkit::bytes::PodSliceMut<PodU32> items{};
    ASSERT_TRUE(podkit::core::is_ok(podkit::collections::seq_items_mut<PodU32>(region, &items)));
    for (PodU32& v : items) {
        v.set(v.get() * 10);
    }
    EXPECT_EQ(values(buf, 0, 16), (std::vector<u32>{10, 20}));
}

TEST(FlexSeqGrow, GrowingFirstRegionShiftsTheSecond) {
    std::array<podkit::core::u8, 64> buf{};
    const auto whole = mut(buf);
    u32 used = 0;
    podkit::collections::RegionSpan first{};
    podkit::collections::RegionSpan second{};
    ASSERT_TRUE(podkit::core::is_ok(podkit::collections::seq_create(whole, &used, &first)));
    ASSERT_TRUE(podkit::core::is_ok(podkit::collections::seq_create(whole, &used, &second)));
    ASSERT_EQ(used, 8u);

    ASSERT_TRUE(podkit::core::is_ok(podkit::collections::seq_push_grow(whole, &used, &second, PodU32::from(70))));
    ASSERT_TRUE(podkit::core::is_ok(podkit::collections::seq_push_grow(whole, &used, &second, PodU32::from(71))));
    const u32 second_before = second.offset;

    for (u32 v = 0; v < 3; ++v) {
        ASSERT_TRUE(podkit::core::is_ok(podkit::collections::seq_push_grow(whole, &used, &first, PodU32::from(v))));
    }
    EXPECT_EQ(first.len, 16u);
    // sibling spans are not rewritten; the caller adds the delta
    EXPECT_EQ(second.offset, second_before);
    const u32 moved_to = first.offset + first.len;
    EXPECT_EQ(used, moved_to + second.len);

    EXPECT_EQ(values(buf, first.offset, first.len), (std::vector<u32>{0, 1, 2}));
    EXPECT_EQ(values(buf, moved_to, second.len), (std::vector<u32>{70, 71}));
}

TEST(FlexSeqGrow, FullBufferLeavesEveryByteInPlace) {
    std::array<podkit::core::u8, 16> buf{};
    const auto whole = mut(buf);
    u32 used = 0;
    podkit::collections::RegionSpan a{};
    podkit::collections::RegionSpan b{};
    ASSERT_TRUE(podkit::core::is_ok(podkit::collections::seq_create(whole, &used, &a)));
    ASSERT_TRUE(podkit::core::is_ok(podkit::collections::seq_create(whole, &used, &b)));
    ASSERT_TRUE(podkit::core::is_ok(podkit::collections::seq_push_grow(whole, &used, &b, PodU32::from(5))));
    ASSERT_TRUE(podkit::core::is_ok(podkit::collections::seq_push_grow(whole, &used, &a, PodU32::from(6))));
    ASSERT_EQ(used, 16u);

    const auto before = buf;
    const auto a_before = a;
    const podkit::core::Status s = podkit::collections::seq_push_grow(whole, &used, &a, PodU32::from(7));
    EXPECT_EQ(s.code, podkit::core::StatusCode::CapacityExceeded);
    EXPECT_EQ(buf, before);
    EXPECT_EQ(used, 16u);
    EXPECT_EQ(a.len, a_before.len);
}

TEST(FlexSeqGrow, RemoveShrinkReturnsBytesToTheTail) {
    std::array<podkit::core::u8, 48> buf{};
    const auto whole = mut(buf);
    u32 used = 0;
    podkit::collections::RegionSpan a{};
    podkit::collections::RegionSpan b{};
    ASSERT_TRUE(podkit::core::is_ok(podkit::collections::seq_create(whole, &used, &a)));
    ASSERT_TRUE(podkit::core::is_ok(podkit::collections::seq_create(whole, &used, &b)));
    ASSERT_TRUE(podkit::core::is_ok(podkit::collections::seq_push_grow(whole, &used, &b, PodU32::from(9))));
    for (u32 v = 0; v < 3; ++v) {
        ASSERT_TRUE(podkit::core::is_ok(podkit::collections::seq_push_grow(whole, &used, &a, PodU32::from(v))));
    }
    ASSERT_EQ(used, 24u);

    PodU32 out{};
    ASSERT_TRUE(podkit::core::is_ok(podkit::collections::seq_remove_shrink(whole, &used, &a, 1, &out)));
    EXPECT_EQ(out.get(), 1u);
    EXPECT_EQ(a.len, 12u);
    EXPECT_EQ(used, 20u);
    EXPECT_EQ(values(buf, a.offset, a.len), (std::vector<u32>{0, 2}));
    EXPECT_EQ(values(buf, a.offset + a.len, 8), (std::vector<u32>{9}));
}

TEST(FlexSeqGrow, BorrowOnSiblingBlocksGrowth) {
    std::array<podkit::core::u8, 32> buf{};
    const auto whole = mut(buf);
    u32 used = 0;
    podkit::collections::RegionSpan a{};
    podkit::collections::RegionSpan b{};
    ASSERT_TRUE(podkit::core::is_ok(podkit::collections::seq_create(whole, &used, &a)));
    ASSERT_TRUE(podkit::core::is_ok(podkit::collections::seq_create(whole, &used, &b)));

    podkit::bytes::BorrowLedger ledger;
    podkit::bytes::BorrowTicket t{};
    ASSERT_TRUE(podkit::core::is_ok(ledger.acquire(podkit::bytes::BorrowKind::Shared, {b.offset, b.len}, &t)));
    EXPECT_EQ(podkit::collections::seq_push_grow(whole, &used, &a, PodU32::from(1), &ledger).code,
              podkit::core::StatusCode::BorrowConflict);
    EXPECT_EQ(used, 8u);

    ASSERT_TRUE(podkit::core::is_ok(ledger.release(t)));
    EXPECT_TRUE(podkit::core::is_ok(podkit::collections::seq_push_grow(whole, &used, &a, PodU32::from(1), &ledger)));
}

TEST(FlexSeqGrow, ShrinkToFitPullsTheSiblingBackByTheSlack) {
    std::array<podkit::core::u8, 64> buf{};
    const auto whole = mut(buf);
    u32 used = 0;
    podkit::collections::RegionSpan a{};
    podkit::collections::RegionSpan b{};
    // a reserves eight slots up front, b follows it
    ASSERT_TRUE(podkit::core::is_ok(podkit::collections::region_append(whole, &used, 4 + 8 * 4, &a)));
    ASSERT_TRUE(podkit::core::is_ok(podkit::collections::seq_init(mut(buf, a.offset, a.len))));
    for (u32 v = 0; v < 3; ++v) {
        ASSERT_TRUE(podkit::core::is_ok(podkit::collections::seq_push(mut(buf, a.offset, a.len), PodU32::from(v))));
    }
    ASSERT_TRUE(podkit::core::is_ok(podkit::collections::seq_create(whole, &used, &b)));
    ASSERT_TRUE(podkit::core::is_ok(podkit::collections::seq_push_grow(whole, &used, &b, PodU32::from(9))));
    ASSERT_EQ(b.offset, 36u);
    ASSERT_EQ(used, 44u);

    podkit::bytes::BorrowLedger ledger;
    podkit::bytes::BorrowTicket t{};
    ASSERT_TRUE(podkit::core::is_ok(ledger.acquire(podkit::bytes::BorrowKind::Shared, {b.offset, b.len}, &t)));
    const auto before = buf;
    EXPECT_EQ(podkit::collections::seq_shrink_to_fit(whole, &used, &a, 4, &ledger).code,
              podkit::core::StatusCode::BorrowConflict);
    EXPECT_EQ(buf, before);
    EXPECT_EQ(a.len, 36u);
    ASSERT_TRUE(podkit::core::is_ok(ledger.release(t)));

    ASSERT_TRUE(podkit::core::is_ok(podkit::collections::seq_shrink_to_fit(whole, &used, &a, 4, &ledger)));
    EXPECT_EQ(a.len, 16u);
    EXPECT_EQ(used, 24u);
    EXPECT_EQ(values(buf, a.offset, a.len), (std::vector<u32>{0, 1, 2}));
    // b moved back by exactly the 20 bytes of slack
    EXPECT_EQ(values(buf, b.offset - 20, b.len), (std::vector<u32>{9}));

    // already tight
    ASSERT_TRUE(podkit::core::is_ok(podkit::collections::seq_shrink_to_fit(whole, &used, &a, 4)));
    EXPECT_EQ(a.len, 16u);
    EXPECT_EQ(used, 24u);
}
