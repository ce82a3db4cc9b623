#include <array>
#include <cstring>

#include <gtest/gtest.h>

#include "podkit/bytes/byte_view.hpp"
#include "podkit/types/pod_int.hpp"

namespace {
    struct Pair {
        podkit::core::u8 a;
        podkit::core::u8 b;
    };

    struct Unmarked {
        podkit::core::u8 a;
        podkit::core::u8 b;
    };
} // namespace

namespace podkit::bytes {
    template <>
    struct pod_traits<Pair> {
        static constexpr bool enabled = true;
    };
} // namespace podkit::bytes

static_assert(podkit::bytes::Pod<Pair>);
static_assert(!podkit::bytes::Pod<Unmarked>);

TEST(ByteView, CheckRangeUsesWideArithmetic) {
    EXPECT_TRUE(podkit::core::is_ok(podkit::bytes::check_range(16, 0, 16)));
    EXPECT_TRUE(podkit::core::is_ok(podkit::bytes::check_range(16, 16, 0)));

    const podkit::core::Status past = podkit::bytes::check_range(16, 10, 8);
    EXPECT_EQ(past.code, podkit::core::StatusCode::OutOfBounds);
    EXPECT_EQ(past.domain, podkit::core::StatusDomain::Bytes);
    EXPECT_EQ(past.aux, 2u);

    // offset + len wraps in 32 bits
    const podkit::core::Status wrap = podkit::bytes::check_range(16, 0xfffffff0u, 0x20u);
    EXPECT_EQ(wrap.code, podkit::core::StatusCode::OutOfBounds);
}

TEST(ByteView, ReadWriteRoundTripsExactBytes) {
    std::array<podkit::core::u8, 64> buf{};
    const podkit::bytes::BufferMut mut{buf.data(), static_cast<podkit::core::u32>(buf.size())};

    for (podkit::core::u32 offset : {0u, 1u, 7u, 60u}) {
        const auto v = podkit::types::PodU32::from(0xdeadbeefu ^ offset);
        ASSERT_TRUE(podkit::core::is_ok(podkit::bytes::write(mut, offset, v)));

        const podkit::types::PodU32* view = nullptr;
        ASSERT_TRUE(podkit::core::is_ok(podkit::bytes::read(podkit::bytes::as_view(mut), offset, &view)));
        EXPECT_EQ(view->get(), 0xdeadbeefu ^ offset);
        EXPECT_EQ(std::memcmp(view, &v, sizeof(v)), 0);
    }
}

TEST(ByteView, ReadPastEndIsOutOfBounds) {
    std::array<podkit::core::u8, 8> buf{};
    const podkit::bytes::BufferView view{buf.data(), static_cast<podkit::core::u32>(buf.size())};

    const podkit::types::PodU64* ok = nullptr;
    EXPECT_TRUE(podkit::core::is_ok(podkit::bytes::read(view, 0, &ok)));

    const podkit::types::PodU64* bad = nullptr;
    const podkit::core::Status s = podkit::bytes::read(view, 1, &bad);
    EXPECT_EQ(s.code, podkit::core::StatusCode::OutOfBounds);
    EXPECT_EQ(bad, nullptr);
}

TEST(ByteView, WriteFailureLeavesBufferUntouched) {
    std::array<podkit::core::u8, 4> buf{1, 2, 3, 4};
    const podkit::bytes::BufferMut mut{buf.data(), static_cast<podkit::core::u32>(buf.size())};

    const podkit::core::Status s = podkit::bytes::write(mut, 2, podkit::types::PodU32::from(0));
    EXPECT_EQ(s.code, podkit::core::StatusCode::OutOfBounds);
    EXPECT_EQ(buf, (std::array<podkit::core::u8, 4>{1, 2, 3, 4}));
}

TEST(ByteView, MutableViewWritesThrough) {
    std::array<podkit::core::u8, 4> buf{};
    const podkit::bytes::BufferMut mut{buf.data(), static_cast<podkit::core::u32>(buf.size())};

    Pair* p = nullptr;
    ASSERT_TRUE(podkit::core::is_ok(podkit::bytes::read_mut(mut, 2, &p)));
    p->a = 0x11;
    p->b = 0x22;
    EXPECT_EQ(buf[2], 0x11);
    EXPECT_EQ(buf[3], 0x22);

    Pair copy{};
    ASSERT_TRUE(podkit::core::is_ok(podkit::bytes::read_copy(podkit::bytes::as_view(mut), 2, &copy)));
    EXPECT_EQ(copy.a, 0x11);
}

TEST(ByteView, SliceRejectsNullOutAndBadBuffer) {
    std::array<podkit::core::u8, 4> buf{};
    const podkit::bytes::BufferView view{buf.data(), 4};
    EXPECT_EQ(podkit::bytes::slice(view, 0, 1, nullptr).code, podkit::core::StatusCode::Invalid);

    podkit::bytes::BufferView out{};
    EXPECT_EQ(podkit::bytes::slice(podkit::bytes::BufferView{nullptr, 4}, 0, 1, &out).code,
              podkit::core::StatusCode::Invalid);

    // an empty buffer has no bytes but an empty slice is still fine
    EXPECT_TRUE(podkit::core::is_ok(podkit::bytes::slice(podkit::bytes::BufferView{}, 0, 0, &out)));
    EXPECT_EQ(out.len, 0u);
}
