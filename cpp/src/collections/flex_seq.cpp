#include "podkit/collections/flex_seq.hpp"

#include <cstring>

#include "podkit/bytes/byte_view.hpp"

namespace podkit::collections {
    using podkit::core::Status;
    using podkit::core::StatusCode;
    using podkit::core::StatusDomain;

    namespace {
        void put_u32_le(u8* out, u32 v) noexcept {
            out[0] = static_cast<u8>(v & 0xffu);
            out[1] = static_cast<u8>((v >> 8) & 0xffu);
            out[2] = static_cast<u8>((v >> 16) & 0xffu);
            out[3] = static_cast<u8>((v >> 24) & 0xffu);
        }

        u32 get_u32_le(const u8* in) noexcept {
            return static_cast<u32>(in[0]) | (static_cast<u32>(in[1]) << 8) | (static_cast<u32>(in[2]) << 16) |
                   (static_cast<u32>(in[3]) << 24);
        }

        Status invalid() noexcept {
            return podkit::core::make_status(StatusDomain::Collections, StatusCode::Invalid);
        }

        // Header present and len fits the span.
        Status load_len(BufferView region, u32 elem_size, u32* len) noexcept {
            if (elem_size == 0 || !podkit::bytes::buffer_ok(region)) {
                return invalid();
            }
            if (region.len < kLengthHeaderBytes) {
                return podkit::core::make_status(StatusDomain::Collections, StatusCode::OutOfBounds,
                                                 kLengthHeaderBytes - region.len);
            }
            const u32 n = get_u32_le(region.data);
            if (n > seq_capacity_of(region.len, elem_size)) {
                return podkit::core::make_status(StatusDomain::Collections, StatusCode::InvalidRegion, n);
            }
            *len = n;
            return podkit::core::ok_status();
        }

        u8* elem_at(u8* base, u32 elem_size, u32 index) noexcept {
            return base + kLengthHeaderBytes + static_cast<u64>(elem_size) * index;
        }

        const u8* elem_at(const u8* base, u32 elem_size, u32 index) noexcept {
            return base + kLengthHeaderBytes + static_cast<u64>(elem_size) * index;
        }

        // Every check seq_insert_raw makes, against a span of span_len bytes.
        Status insert_check(u32 len, u32 span_len, u32 elem_size, u32 index, BufferView elem) noexcept {
            if (!podkit::bytes::buffer_ok(elem)) {
                return invalid();
            }
            if (elem.len != elem_size) {
                return podkit::core::make_status(StatusDomain::Collections, StatusCode::SizeMismatch, elem_size);
            }
            if (index > len) {
                return podkit::core::make_status(StatusDomain::Collections, StatusCode::IndexOutOfRange, index);
            }
            if (len >= seq_capacity_of(span_len, elem_size)) {
                return podkit::core::make_status(StatusDomain::Collections, StatusCode::CapacityExceeded, len + 1);
            }
            return podkit::core::ok_status();
        }

        Status ledger_check(const podkit::bytes::BorrowLedger* ledger, const RegionSpan& region) noexcept {
            if (ledger != nullptr && ledger->overlaps(podkit::bytes::BorrowRange{region.offset, region.len})) {
                return podkit::core::make_status(StatusDomain::Collections, StatusCode::BorrowConflict, region.offset);
            }
            return podkit::core::ok_status();
        }
    } // namespace

    Status seq_init(BufferMut region) noexcept {
        if (!podkit::bytes::buffer_ok(region)) {
            return invalid();
        }
        if (region.len < kLengthHeaderBytes) {
            return podkit::core::make_status(StatusDomain::Collections, StatusCode::OutOfBounds,
                                             kLengthHeaderBytes - region.len);
        }
        put_u32_le(region.data, 0);
        return podkit::core::ok_status();
    }

    Status seq_len(BufferView region, u32* out) noexcept {
        if (out == nullptr || !podkit::bytes::buffer_ok(region)) {
            return invalid();
        }
        if (region.len < kLengthHeaderBytes) {
            return podkit::core::make_status(StatusDomain::Collections, StatusCode::OutOfBounds,
                                             kLengthHeaderBytes - region.len);
        }
        *out = get_u32_le(region.data);
        return podkit::core::ok_status();
    }

    Status seq_validate(BufferView region, u32 elem_size, u32* len) noexcept {
        if (len == nullptr) {
            return invalid();
        }
        return load_len(region, elem_size, len);
    }

    Status seq_get_raw(BufferView region, u32 elem_size, u32 index, BufferView* out) noexcept {
        if (out == nullptr) {
            return invalid();
        }
        u32 len = 0;
        const Status s = load_len(region, elem_size, &len);
        if (!podkit::core::is_ok(s)) {
            return s;
        }
        if (index >= len) {
            return podkit::core::make_status(StatusDomain::Collections, StatusCode::IndexOutOfRange, index);
        }
        out->data = elem_at(region.data, elem_size, index);
        out->len = elem_size;
        return podkit::core::ok_status();
    }

    Status seq_get_mut_raw(BufferMut region, u32 elem_size, u32 index, BufferMut* out) noexcept {
        if (out == nullptr) {
            return invalid();
        }
        u32 len = 0;
        const Status s = load_len(podkit::bytes::as_view(region), elem_size, &len);
        if (!podkit::core::is_ok(s)) {
            return s;
        }
        if (index >= len) {
            return podkit::core::make_status(StatusDomain::Collections, StatusCode::IndexOutOfRange, index);
        }
        out->data = elem_at(region.data, elem_size, index);
        out->len = elem_size;
        return podkit::core::ok_status();
    }

    Status seq_items_raw(BufferView region, u32 elem_size, BufferView* out) noexcept {
        if (out == nullptr) {
            return invalid();
        }
        u32 len = 0;
        const Status s = load_len(region, elem_size, &len);
        if (!podkit::core::is_ok(s)) {
            return s;
        }
        out->data = region.data + kLengthHeaderBytes;
        out->len = len * elem_size;
        return podkit::core::ok_status();
    }

    Status seq_items_mut_raw(BufferMut region, u32 elem_size, BufferMut* out) noexcept {
        if (out == nullptr) {
            return invalid();
        }
        u32 len = 0;
        const Status s = load_len(podkit::bytes::as_view(region), elem_size, &len);
        if (!podkit::core::is_ok(s)) {
            return s;
        }
        out->data = region.data + kLengthHeaderBytes;
        out->len = len * elem_size;
        return podkit::core::ok_status();
    }

    Status seq_insert_raw(BufferMut region, u32 elem_size, u32 index, BufferView elem) noexcept {
        u32 len = 0;
        Status s = load_len(podkit::bytes::as_view(region), elem_size, &len);
        if (!podkit::core::is_ok(s)) {
            return s;
        }
        s = insert_check(len, region.len, elem_size, index, elem);
        if (!podkit::core::is_ok(s)) {
            return s;
        }

        u8* slot = elem_at(region.data, elem_size, index);
        const u32 shifted = (len - index) * elem_size;
        if (shifted > 0) {
            std::memmove(slot + elem_size, slot, shifted);
        }
        std::memcpy(slot, elem.data, elem_size);
        put_u32_le(region.data, len + 1);
        return podkit::core::ok_status();
    }

    Status seq_remove_raw(BufferMut region, u32 elem_size, u32 index, BufferMut out) noexcept {
        u32 len = 0;
        const Status s = load_len(podkit::bytes::as_view(region), elem_size, &len);
        if (!podkit::core::is_ok(s)) {
            return s;
        }
        if (out.data != nullptr && out.len != elem_size) {
            return podkit::core::make_status(StatusDomain::Collections, StatusCode::SizeMismatch, elem_size);
        }
        if (index >= len) {
            return podkit::core::make_status(StatusDomain::Collections, StatusCode::IndexOutOfRange, index);
        }

        u8* slot = elem_at(region.data, elem_size, index);
        if (out.data != nullptr) {
            std::memcpy(out.data, slot, elem_size);
        }
        const u32 shifted = (len - index - 1) * elem_size;
        if (shifted > 0) {
            std::memmove(slot, slot + elem_size, shifted);
        }
        put_u32_le(region.data, len - 1);
        return podkit::core::ok_status();
    }

    Status seq_truncate(BufferMut region, u32 elem_size, u32 new_len) noexcept {
        u32 len = 0;
        const Status s = load_len(podkit::bytes::as_view(region), elem_size, &len);
        if (!podkit::core::is_ok(s)) {
            return s;
        }
        if (new_len > len) {
            return podkit::core::make_status(StatusDomain::Collections, StatusCode::IndexOutOfRange, new_len);
        }
        put_u32_le(region.data, new_len);
        return podkit::core::ok_status();
    }

    Status seq_clear(BufferMut region) noexcept {
        return seq_init(region);
    }

    Status seq_create(BufferMut buffer, u32* used, RegionSpan* out) noexcept {
        if (used == nullptr || out == nullptr) {
            return invalid();
        }
        RegionSpan span{};
        u32 next_used = *used;
        Status s = region_append(buffer, &next_used, kLengthHeaderBytes, &span);
        if (!podkit::core::is_ok(s)) {
            return s;
        }
        BufferMut bytes{};
        s = region_bytes(buffer, span, &bytes);
        if (!podkit::core::is_ok(s)) {
            return s;
        }
        s = seq_init(bytes);
        if (!podkit::core::is_ok(s)) {
            return s;
        }
        *used = next_used;
        *out = span;
        return podkit::core::ok_status();
    }

    Status seq_insert_grow_raw(BufferMut buffer,
                               u32* used,
                               RegionSpan* region,
                               u32 elem_size,
                               u32 index,
                               BufferView elem,
                               const podkit::bytes::BorrowLedger* ledger) noexcept {
        if (used == nullptr || region == nullptr) {
            return invalid();
        }
        BufferMut bytes{};
        Status s = region_bytes(buffer, *region, &bytes);
        if (!podkit::core::is_ok(s)) {
            return s;
        }
        u32 len = 0;
        s = load_len(podkit::bytes::as_view(bytes), elem_size, &len);
        if (!podkit::core::is_ok(s)) {
            return s;
        }
        s = ledger_check(ledger, *region);
        if (!podkit::core::is_ok(s)) {
            return s;
        }

        const u64 needed = seq_region_bytes(elem_size, len + 1);
        if (needed > 0xffffffffull) {
            return podkit::core::make_status(StatusDomain::Collections, StatusCode::CapacityExceeded, len + 1);
        }
        const u32 target = needed > region->len ? static_cast<u32>(needed) : region->len;

        // Validate the insert against the span it will have after growth.
        s = insert_check(len, target, elem_size, index, elem);
        if (!podkit::core::is_ok(s)) {
            return s;
        }

        if (target != region->len) {
            u32 next_used = 0;
            s = region_resize(buffer, *used, region, target, &next_used, ledger);
            if (!podkit::core::is_ok(s)) {
                return s;
            }
            *used = next_used;
            s = region_bytes(buffer, *region, &bytes);
            if (!podkit::core::is_ok(s)) {
                return s;
            }
        }
        return seq_insert_raw(bytes, elem_size, index, elem);
    }

    Status seq_remove_shrink_raw(BufferMut buffer,
                                 u32* used,
                                 RegionSpan* region,
                                 u32 elem_size,
                                 u32 index,
                                 BufferMut out,
                                 const podkit::bytes::BorrowLedger* ledger) noexcept {
        if (used == nullptr || region == nullptr) {
            return invalid();
        }
        BufferMut bytes{};
        Status s = region_bytes(buffer, *region, &bytes);
        if (!podkit::core::is_ok(s)) {
            return s;
        }
        u32 len = 0;
        s = load_len(podkit::bytes::as_view(bytes), elem_size, &len);
        if (!podkit::core::is_ok(s)) {
            return s;
        }
        if (index >= len) {
            return podkit::core::make_status(StatusDomain::Collections, StatusCode::IndexOutOfRange, index);
        }
        if (out.data != nullptr && out.len != elem_size) {
            return podkit::core::make_status(StatusDomain::Collections, StatusCode::SizeMismatch, elem_size);
        }

        const u32 target = static_cast<u32>(seq_region_bytes(elem_size, len - 1));
        s = region_resize_check(buffer, *used, *region, target, ledger);
        if (!podkit::core::is_ok(s)) {
            return s;
        }

        s = seq_remove_raw(bytes, elem_size, index, out);
        if (!podkit::core::is_ok(s)) {
            return s;
        }
        u32 next_used = 0;
        s = region_resize(buffer, *used, region, target, &next_used, ledger);
        if (!podkit::core::is_ok(s)) {
            return s;
        }
        *used = next_used;
        return podkit::core::ok_status();
    }

    Status seq_shrink_to_fit(BufferMut buffer,
                             u32* used,
                             RegionSpan* region,
                             u32 elem_size,
                             const podkit::bytes::BorrowLedger* ledger) noexcept {
        if (used == nullptr || region == nullptr) {
            return invalid();
        }
        BufferMut bytes{};
        Status s = region_bytes(buffer, *region, &bytes);
        if (!podkit::core::is_ok(s)) {
            return s;
        }
        u32 len = 0;
        s = load_len(podkit::bytes::as_view(bytes), elem_size, &len);
        if (!podkit::core::is_ok(s)) {
            return s;
        }
        const u32 target = static_cast<u32>(seq_region_bytes(elem_size, len));
        if (target == region->len) {
            return podkit::core::ok_status();
        }
        u32 next_used = 0;
        s = region_resize(buffer, *used, region, target, &next_used, ledger);
        if (!podkit::core::is_ok(s)) {
            return s;
        }
        *used = next_used;
        return podkit::core::ok_status();
    }
} // namespace podkit::collections
