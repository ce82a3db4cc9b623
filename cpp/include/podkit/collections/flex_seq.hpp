#pragma once

#include "podkit/bytes/borrow.hpp"
#include "podkit/bytes/pod.hpp"
#include "podkit/bytes/pod_cast.hpp"
#include "podkit/collections/layout.hpp"
#include "podkit/collections/region.hpp"
#include "podkit/core/errors.hpp"

namespace podkit::collections {

    // ========================================================================
    // Flexible sequence, byte level
    // ========================================================================
    //
    // `region` is exactly the span reserved for the sequence:
    // [len u32][elements...][unused]. Element size is a run-time value here; the
    // typed wrappers below pass sizeof(T).
    //
    // A header that claims more elements than the span holds is InvalidRegion;
    // it is reported, never repaired.

    // Writes an empty header. OutOfBounds if the span is shorter than the header.
    [[nodiscard]] podkit::core::Status seq_init(BufferMut region) noexcept;

    // Reads the length header only.
    [[nodiscard]] podkit::core::Status seq_len(BufferView region, u32* out) noexcept;

    // Reads the length header and checks it against the span.
    [[nodiscard]] podkit::core::Status seq_validate(BufferView region, u32 elem_size, u32* len) noexcept;

    [[nodiscard]] podkit::core::Status seq_get_raw(BufferView region, u32 elem_size, u32 index, BufferView* out) noexcept;
    [[nodiscard]] podkit::core::Status seq_get_mut_raw(BufferMut region, u32 elem_size, u32 index, BufferMut* out) noexcept;

    // The live elements as one byte range (len * elem_size bytes).
    [[nodiscard]] podkit::core::Status seq_items_raw(BufferView region, u32 elem_size, BufferView* out) noexcept;
    [[nodiscard]] podkit::core::Status seq_items_mut_raw(BufferMut region, u32 elem_size, BufferMut* out) noexcept;

    // Inserts at index (0 <= index <= len), shifting [index, len) one slot right.
    // `elem` must be elem_size bytes and must not alias the region.
    // IndexOutOfRange / CapacityExceeded leave the region untouched.
    [[nodiscard]] podkit::core::Status seq_insert_raw(BufferMut region, u32 elem_size, u32 index, BufferView elem) noexcept;

    // Removes index (< len), shifting (index, len) one slot left. The removed
    // bytes are copied to `out` unless out.data is null.
    [[nodiscard]] podkit::core::Status seq_remove_raw(BufferMut region, u32 elem_size, u32 index, BufferMut out) noexcept;

    // Drops elements past new_len. IndexOutOfRange if new_len > len.
    [[nodiscard]] podkit::core::Status seq_truncate(BufferMut region, u32 elem_size, u32 new_len) noexcept;

    [[nodiscard]] podkit::core::Status seq_clear(BufferMut region) noexcept;

    // Shared-buffer variants. The sequence lives at *region inside buffer and
    // *used marks the end of the last sibling region. When the span is too
    // small, insert grows it by exactly what is missing through region_resize;
    // all checks run before the first byte moves, so a failure leaves the
    // buffer as it was.
    [[nodiscard]] podkit::core::Status seq_create(BufferMut buffer, u32* used, RegionSpan* out) noexcept;

    [[nodiscard]] podkit::core::Status seq_insert_grow_raw(BufferMut buffer,
                                                           u32* used,
                                                           RegionSpan* region,
                                                           u32 elem_size,
                                                           u32 index,
                                                           BufferView elem,
                                                           const podkit::bytes::BorrowLedger* ledger = nullptr) noexcept;

    // Removes index, then shrinks the span to header + len * elem_size.
    [[nodiscard]] podkit::core::Status seq_remove_shrink_raw(BufferMut buffer,
                                                             u32* used,
                                                             RegionSpan* region,
                                                             u32 elem_size,
                                                             u32 index,
                                                             BufferMut out,
                                                             const podkit::bytes::BorrowLedger* ledger = nullptr) noexcept;

    // Shrinks the span to header + len * elem_size, releasing slack to the tail.
    [[nodiscard]] podkit::core::Status seq_shrink_to_fit(BufferMut buffer,
                                                         u32* used,
                                                         RegionSpan* region,
                                                         u32 elem_size,
                                                         const podkit::bytes::BorrowLedger* ledger = nullptr) noexcept;

    // ========================================================================
    // Flexible sequence, typed
    // ========================================================================

    template <podkit::bytes::Pod T>
    [[nodiscard]] podkit::core::Status seq_capacity(BufferView region, u32* out) noexcept {
        if (out == nullptr) {
            return podkit::core::make_status(podkit::core::StatusDomain::Collections, podkit::core::StatusCode::Invalid);
        }
        u32 len = 0;
        const podkit::core::Status s = seq_validate(region, podkit::bytes::pod_size<T>, &len);
        if (!podkit::core::is_ok(s)) {
            return s;
        }
        *out = seq_capacity_of(region.len, podkit::bytes::pod_size<T>);
        return podkit::core::ok_status();
    }

    template <podkit::bytes::Pod T>
    [[nodiscard]] podkit::core::Status seq_get(BufferView region, u32 index, const T** out) noexcept {
        if (out == nullptr) {
            return podkit::core::make_status(podkit::core::StatusDomain::Collections, podkit::core::StatusCode::Invalid);
        }
        BufferView elem{};
        const podkit::core::Status s = seq_get_raw(region, podkit::bytes::pod_size<T>, index, &elem);
        if (!podkit::core::is_ok(s)) {
            return s;
        }
        return podkit::bytes::try_cast<T>(elem, out);
    }

    template <podkit::bytes::Pod T>
    [[nodiscard]] podkit::core::Status seq_get_mut(BufferMut region, u32 index, T** out) noexcept {
        if (out == nullptr) {
            return podkit::core::make_status(podkit::core::StatusDomain::Collections, podkit::core::StatusCode::Invalid);
        }
        BufferMut elem{};
        const podkit::core::Status s = seq_get_mut_raw(region, podkit::bytes::pod_size<T>, index, &elem);
        if (!podkit::core::is_ok(s)) {
            return s;
        }
        return podkit::bytes::try_cast_mut<T>(elem, out);
    }

    // Snapshot of [0, len) taken now. Mutating the sequence afterwards leaves
    // the slice stale.
    template <podkit::bytes::Pod T>
    [[nodiscard]] podkit::core::Status seq_items(BufferView region, podkit::bytes::PodSlice<T>* out) noexcept {
        if (out == nullptr) {
            return podkit::core::make_status(podkit::core::StatusDomain::Collections, podkit::core::StatusCode::Invalid);
        }
        BufferView items{};
        const podkit::core::Status s = seq_items_raw(region, podkit::bytes::pod_size<T>, &items);
        if (!podkit::core::is_ok(s)) {
            return s;
        }
        return podkit::bytes::cast_slice<T>(items, out);
    }

    template <podkit::bytes::Pod T>
    [[nodiscard]] podkit::core::Status seq_items_mut(BufferMut region, podkit::bytes::PodSliceMut<T>* out) noexcept {
        if (out == nullptr) {
            return podkit::core::make_status(podkit::core::StatusDomain::Collections, podkit::core::StatusCode::Invalid);
        }
        BufferMut items{};
        const podkit::core::Status s = seq_items_mut_raw(region, podkit::bytes::pod_size<T>, &items);
        if (!podkit::core::is_ok(s)) {
            return s;
        }
        return podkit::bytes::cast_slice_mut<T>(items, out);
    }

    template <podkit::bytes::Pod T>
    [[nodiscard]] podkit::core::Status seq_insert(BufferMut region, u32 index, const T& value) noexcept {
        // value may point into the region itself
        const T copy = value;
        return seq_insert_raw(region, podkit::bytes::pod_size<T>, index, podkit::bytes::bytes_of(copy));
    }

    template <podkit::bytes::Pod T>
    [[nodiscard]] podkit::core::Status seq_push(BufferMut region, const T& value) noexcept {
        u32 len = 0;
        const podkit::core::Status s = seq_validate(podkit::bytes::as_view(region), podkit::bytes::pod_size<T>, &len);
        if (!podkit::core::is_ok(s)) {
            return s;
        }
        return seq_insert<T>(region, len, value);
    }

    // out may be null to discard the removed value.
    template <podkit::bytes::Pod T>
    [[nodiscard]] podkit::core::Status seq_remove(BufferMut region, u32 index, T* out) noexcept {
        BufferMut dst{};
        if (out != nullptr) {
            dst = podkit::bytes::bytes_of_mut(*out);
        }
        return seq_remove_raw(region, podkit::bytes::pod_size<T>, index, dst);
    }

    template <podkit::bytes::Pod T>
    [[nodiscard]] podkit::core::Status seq_insert_grow(BufferMut buffer,
                                                       u32* used,
                                                       RegionSpan* region,
                                                       u32 index,
                                                       const T& value,
                                                       const podkit::bytes::BorrowLedger* ledger = nullptr) noexcept {
        const T copy = value;
        return seq_insert_grow_raw(buffer, used, region, podkit::bytes::pod_size<T>, index,
                                   podkit::bytes::bytes_of(copy), ledger);
    }

    template <podkit::bytes::Pod T>
    [[nodiscard]] podkit::core::Status seq_push_grow(BufferMut buffer,
                                                     u32* used,
                                                     RegionSpan* region,
                                                     const T& value,
                                                     const podkit::bytes::BorrowLedger* ledger = nullptr) noexcept {
        if (region == nullptr) {
            return podkit::core::make_status(podkit::core::StatusDomain::Collections, podkit::core::StatusCode::Invalid);
        }
        BufferMut bytes{};
        podkit::core::Status s = region_bytes(buffer, *region, &bytes);
        if (!podkit::core::is_ok(s)) {
            return s;
        }
        u32 len = 0;
        s = seq_validate(podkit::bytes::as_view(bytes), podkit::bytes::pod_size<T>, &len);
        if (!podkit::core::is_ok(s)) {
            return s;
        }
        return seq_insert_grow<T>(buffer, used, region, len, value, ledger);
    }

    template <podkit::bytes::Pod T>
    [[nodiscard]] podkit::core::Status seq_remove_shrink(BufferMut buffer,
                                                         u32* used,
                                                         RegionSpan* region,
                                                         u32 index,
                                                         T* out,
                                                         const podkit::bytes::BorrowLedger* ledger = nullptr) noexcept {
        BufferMut dst{};
        if (out != nullptr) {
            dst = podkit::bytes::bytes_of_mut(*out);
        }
        return seq_remove_shrink_raw(buffer, used, region, podkit::bytes::pod_size<T>, index, dst, ledger);
    }

} // namespace podkit::collections
