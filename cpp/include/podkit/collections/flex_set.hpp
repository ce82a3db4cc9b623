#pragma once

#include "podkit/bytes/pod.hpp"
#include "podkit/bytes/pod_cast.hpp"
#include "podkit/collections/flex_seq.hpp"
#include "podkit/collections/sorted.hpp"
#include "podkit/core/errors.hpp"

namespace podkit::collections {

    // Flexible sequence of V kept strictly ascending. Values are their own keys.

    namespace detail {
        template <podkit::bytes::PodKey V>
        [[nodiscard]] podkit::core::Status set_find(BufferView region, const V& value, u32* lower, bool* found) noexcept {
            podkit::bytes::PodSlice<V> items{};
            const podkit::core::Status s = seq_items<V>(region, &items);
            if (!podkit::core::is_ok(s)) {
                return s;
            }
            *lower = lower_bound_index(items, value, Identity{});
            *found = key_eq_at(items, *lower, value, Identity{});
            return podkit::core::ok_status();
        }
    } // namespace detail

    template <podkit::bytes::PodKey V>
    [[nodiscard]] podkit::core::Status set_len(BufferView region, u32* out) noexcept {
        return seq_validate(region, podkit::bytes::pod_size<V>, out);
    }

    template <podkit::bytes::PodKey V>
    [[nodiscard]] podkit::core::Status set_items(BufferView region, podkit::bytes::PodSlice<V>* out) noexcept {
        return seq_items<V>(region, out);
    }

    template <podkit::bytes::PodKey V>
    [[nodiscard]] podkit::core::Status set_contains(BufferView region, const V& value, bool* out) noexcept {
        if (out == nullptr) {
            return podkit::core::make_status(podkit::core::StatusDomain::Collections, podkit::core::StatusCode::Invalid);
        }
        u32 pos = 0;
        return detail::set_find<V>(region, value, &pos, out);
    }

    // The stored value equal to `value`. KeyNotFound if absent.
    template <podkit::bytes::PodKey V>
    [[nodiscard]] podkit::core::Status set_get(BufferView region, const V& value, const V** out) noexcept {
        if (out == nullptr) {
            return podkit::core::make_status(podkit::core::StatusDomain::Collections, podkit::core::StatusCode::Invalid);
        }
        u32 pos = 0;
        bool found = false;
        const podkit::core::Status s = detail::set_find<V>(region, value, &pos, &found);
        if (!podkit::core::is_ok(s)) {
            return s;
        }
        if (!found) {
            return podkit::core::make_status(podkit::core::StatusDomain::Collections,
                                             podkit::core::StatusCode::KeyNotFound);
        }
        return seq_get<V>(region, pos, out);
    }

    // Mutable access to the stored value equal to `value`. The caller must keep
    // the element's ordering unchanged. KeyNotFound if absent.
    template <podkit::bytes::PodKey V>
    [[nodiscard]] podkit::core::Status set_get_mut(BufferMut region, const V& value, V** out) noexcept {
        if (out == nullptr) {
            return podkit::core::make_status(podkit::core::StatusDomain::Collections, podkit::core::StatusCode::Invalid);
        }
        u32 pos = 0;
        bool found = false;
        const podkit::core::Status s = detail::set_find<V>(podkit::bytes::as_view(region), value, &pos, &found);
        if (!podkit::core::is_ok(s)) {
            return s;
        }
        if (!found) {
            return podkit::core::make_status(podkit::core::StatusDomain::Collections,
                                             podkit::core::StatusCode::KeyNotFound);
        }
        return seq_get_mut<V>(region, pos, out);
    }

    template <podkit::bytes::PodKey V>
    [[nodiscard]] podkit::core::Status set_capacity(BufferView region, u32* out) noexcept {
        return seq_capacity<V>(region, out);
    }

    template <podkit::bytes::PodKey V>
    [[nodiscard]] podkit::core::Status set_is_empty(BufferView region, bool* out) noexcept {
        if (out == nullptr) {
            return podkit::core::make_status(podkit::core::StatusDomain::Collections, podkit::core::StatusCode::Invalid);
        }
        u32 len = 0;
        const podkit::core::Status s = set_len<V>(region, &len);
        if (!podkit::core::is_ok(s)) {
            return s;
        }
        *out = len == 0;
        return podkit::core::ok_status();
    }

    // True when no new value fits in the span.
    template <podkit::bytes::PodKey V>
    [[nodiscard]] podkit::core::Status set_is_full(BufferView region, bool* out) noexcept {
        if (out == nullptr) {
            return podkit::core::make_status(podkit::core::StatusDomain::Collections, podkit::core::StatusCode::Invalid);
        }
        u32 len = 0;
        podkit::core::Status s = set_len<V>(region, &len);
        if (!podkit::core::is_ok(s)) {
            return s;
        }
        u32 cap = 0;
        s = seq_capacity<V>(region, &cap);
        if (!podkit::core::is_ok(s)) {
            return s;
        }
        *out = len >= cap;
        return podkit::core::ok_status();
    }

    // A value already present is left alone and *inserted is false.
    template <podkit::bytes::PodKey V>
    [[nodiscard]] podkit::core::Status set_insert(BufferMut region, const V& value, bool* inserted) noexcept {
        const V copy = value;
        u32 pos = 0;
        bool found = false;
        const podkit::core::Status s = detail::set_find<V>(podkit::bytes::as_view(region), copy, &pos, &found);
        if (!podkit::core::is_ok(s)) {
            return s;
        }
        if (!found) {
            const podkit::core::Status i = seq_insert<V>(region, pos, copy);
            if (!podkit::core::is_ok(i)) {
                return i;
            }
        }
        if (inserted != nullptr) {
            *inserted = !found;
        }
        return podkit::core::ok_status();
    }

    // Removes the stored value equal to `value` and copies it out. KeyNotFound
    // if absent.
    template <podkit::bytes::PodKey V>
    [[nodiscard]] podkit::core::Status set_take(BufferMut region, const V& value, V* out) noexcept {
        u32 pos = 0;
        bool found = false;
        const podkit::core::Status s = detail::set_find<V>(podkit::bytes::as_view(region), value, &pos, &found);
        if (!podkit::core::is_ok(s)) {
            return s;
        }
        if (!found) {
            return podkit::core::make_status(podkit::core::StatusDomain::Collections,
                                             podkit::core::StatusCode::KeyNotFound);
        }
        return seq_remove<V>(region, pos, out);
    }

    // Ok with *removed = false when the value is absent.
    template <podkit::bytes::PodKey V>
    [[nodiscard]] podkit::core::Status set_remove(BufferMut region, const V& value, bool* removed) noexcept {
        const podkit::core::Status s = set_take<V>(region, value, nullptr);
        if (s.code == podkit::core::StatusCode::KeyNotFound) {
            if (removed != nullptr) {
                *removed = false;
            }
            return podkit::core::ok_status();
        }
        if (!podkit::core::is_ok(s)) {
            return s;
        }
        if (removed != nullptr) {
            *removed = true;
        }
        return podkit::core::ok_status();
    }

} // namespace podkit::collections
