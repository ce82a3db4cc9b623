#include "podkit/collections/region.hpp"

#include <cstring>

#include "podkit/bytes/byte_view.hpp"

namespace podkit::collections {
    using podkit::core::Status;
    using podkit::core::StatusCode;
    using podkit::core::StatusDomain;

    Status region_resize_check(BufferMut buffer,
                               u32 used,
                               const RegionSpan& region,
                               u32 new_len,
                               const podkit::bytes::BorrowLedger* ledger) noexcept {
        if (!podkit::bytes::buffer_ok(buffer)) {
            return podkit::core::make_status(StatusDomain::Collections, StatusCode::Invalid);
        }
        if (used > buffer.len) {
            return podkit::core::make_status(StatusDomain::Collections, StatusCode::OutOfBounds, used - buffer.len);
        }
        const Status s = podkit::bytes::check_range(used, region.offset, region.len);
        if (!podkit::core::is_ok(s)) {
            return podkit::core::make_status(StatusDomain::Collections, StatusCode::OutOfBounds, s.aux);
        }

        if (ledger != nullptr &&
            ledger->overlaps(podkit::bytes::BorrowRange{region.offset, buffer.len - region.offset})) {
            return podkit::core::make_status(StatusDomain::Collections, StatusCode::BorrowConflict, region.offset);
        }

        if (new_len > region.len) {
            const u64 grown = static_cast<u64>(used) + (new_len - region.len);
            if (grown > buffer.len) {
                return podkit::core::make_status(StatusDomain::Collections, StatusCode::CapacityExceeded,
                                                 static_cast<u32>(grown - buffer.len));
            }
        }
        return podkit::core::ok_status();
    }

    Status region_resize(BufferMut buffer,
                         u32 used,
                         RegionSpan* region,
                         u32 new_len,
                         u32* new_used,
                         const podkit::bytes::BorrowLedger* ledger) noexcept {
        if (region == nullptr || new_used == nullptr) {
            return podkit::core::make_status(StatusDomain::Collections, StatusCode::Invalid);
        }
        const Status s = region_resize_check(buffer, used, *region, new_len, ledger);
        if (!podkit::core::is_ok(s)) {
            return s;
        }

        const u32 old_end = region->offset + region->len;
        const u32 new_end = region->offset + new_len;
        const u32 tail = used - old_end;
        if (tail > 0 && old_end != new_end) {
            std::memmove(buffer.data + new_end, buffer.data + old_end, tail);
        }

        region->len = new_len;
        *new_used = new_end + tail;
        return podkit::core::ok_status();
    }

    Status region_append(BufferMut buffer, u32* used, u32 len, RegionSpan* out) noexcept {
        if (used == nullptr || out == nullptr || !podkit::bytes::buffer_ok(buffer)) {
            return podkit::core::make_status(StatusDomain::Collections, StatusCode::Invalid);
        }
        if (*used > buffer.len) {
            return podkit::core::make_status(StatusDomain::Collections, StatusCode::OutOfBounds, *used - buffer.len);
        }
        const u64 end = static_cast<u64>(*used) + len;
        if (end > buffer.len) {
            return podkit::core::make_status(StatusDomain::Collections, StatusCode::CapacityExceeded,
                                             static_cast<u32>(end - buffer.len));
        }
        out->offset = *used;
        out->len = len;
        *used = static_cast<u32>(end);
        return podkit::core::ok_status();
    }

    Status region_bytes(BufferMut buffer, const RegionSpan& region, BufferMut* out) noexcept {
        const Status s = podkit::bytes::slice_mut(buffer, region.offset, region.len, out);
        if (!podkit::core::is_ok(s)) {
            return podkit::core::make_status(StatusDomain::Collections, s.code, s.aux);
        }
        return podkit::core::ok_status();
    }
} // namespace podkit::collections
