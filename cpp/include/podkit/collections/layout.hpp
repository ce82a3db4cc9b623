#pragma once

#include <type_traits>

#include "podkit/bytes/buffer.hpp"
#include "podkit/core/types.hpp"

namespace podkit::collections {
    using u8 = podkit::core::u8;
    using u32 = podkit::core::u32;
    using u64 = podkit::core::u64;
    using podkit::bytes::BufferMut;
    using podkit::bytes::BufferView;

    // Persisted sequence layout (little-endian):
    // 0..3 length(u32), then length elements back to back, then unused span.
    // Capacity is not stored; it follows from the span the caller reserves.
    inline constexpr u32 kLengthHeaderBytes = 4;

    // Bytes a sequence of count elements needs, header included.
    [[nodiscard]] constexpr u64 seq_region_bytes(u32 elem_size, u32 count) noexcept {
        return static_cast<u64>(kLengthHeaderBytes) + static_cast<u64>(elem_size) * count;
    }

    // Elements that fit in a span of span bytes.
    [[nodiscard]] constexpr u32 seq_capacity_of(u32 span, u32 elem_size) noexcept {
        if (elem_size == 0 || span < kLengthHeaderBytes) {
            return 0;
        }
        return (span - kLengthHeaderBytes) / elem_size;
    }

    // A region inside a buffer shared with sibling regions: [offset, offset + len).
    struct RegionSpan {
        u32 offset{0};
        u32 len{0};
    };

    static_assert(std::is_trivially_copyable_v<RegionSpan>);
    static_assert(std::is_standard_layout_v<RegionSpan>);
} // namespace podkit::collections
