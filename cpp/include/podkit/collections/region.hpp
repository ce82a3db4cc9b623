#pragma once

#include "podkit/bytes/borrow.hpp"
#include "podkit/collections/layout.hpp"
#include "podkit/core/errors.hpp"

namespace podkit::collections {

    // ========================================================================
    // Relocation
    // ========================================================================
    //
    // Regions are laid out back to back in one buffer; `used` is one past the
    // last byte of the last region and [used, buffer.len) is free space.
    //
    // region_resize changes region->len to new_len and shifts every byte in
    // [region end, used) by the difference with a single memmove, so sibling
    // regions keep their internal layout. Bytes left behind by a shrink, or
    // uncovered by a grow, keep whatever they held.
    //
    // Fails before moving anything:
    // - OutOfBounds if region end > used or used > buffer.len
    // - CapacityExceeded if the buffer has no room for the growth (aux = bytes short)
    // - BorrowConflict if ledger is given and any borrow overlaps [region->offset, buffer.len)
    [[nodiscard]] podkit::core::Status region_resize(BufferMut buffer,
                                                     u32 used,
                                                     RegionSpan* region,
                                                     u32 new_len,
                                                     u32* new_used,
                                                     const podkit::bytes::BorrowLedger* ledger = nullptr) noexcept;

    // Checks done by region_resize, without moving anything.
    [[nodiscard]] podkit::core::Status region_resize_check(BufferMut buffer,
                                                           u32 used,
                                                           const RegionSpan& region,
                                                           u32 new_len,
                                                           const podkit::bytes::BorrowLedger* ledger) noexcept;

    // Reserves len bytes at the end of the used part of the buffer and advances
    // *used. CapacityExceeded if the free space is too small.
    [[nodiscard]] podkit::core::Status region_append(BufferMut buffer, u32* used, u32 len, RegionSpan* out) noexcept;

    // The bytes of a region as a sub-buffer.
    [[nodiscard]] podkit::core::Status region_bytes(BufferMut buffer, const RegionSpan& region, BufferMut* out) noexcept;

} // namespace podkit::collections
