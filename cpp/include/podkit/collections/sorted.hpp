#pragma once

#include "podkit/bytes/pod_cast.hpp"
#include "podkit/collections/layout.hpp"

namespace podkit::collections {

    // First index whose projected key is not less than key, over a slice
    // sorted ascending by that key. Returns items.len when every key is less.
    template <typename T, typename K, typename Proj>
    [[nodiscard]] constexpr u32 lower_bound_index(podkit::bytes::PodSlice<T> items, const K& key, Proj proj) noexcept {
        u32 lo = 0;
        u32 hi = items.len;
        while (lo < hi) {
            const u32 mid = lo + (hi - lo) / 2;
            if (proj(items.data[mid]) < key) {
                lo = mid + 1;
            } else {
                hi = mid;
            }
        }
        return lo;
    }

    // True if the element at pos exists and its projected key equals key.
    template <typename T, typename K, typename Proj>
    [[nodiscard]] constexpr bool key_eq_at(podkit::bytes::PodSlice<T> items, u32 pos, const K& key, Proj proj) noexcept {
        return pos < items.len && proj(items.data[pos]) == key;
    }

    // Index of the first element that is not strictly greater than its
    // predecessor, or items.len when the slice is strictly ascending.
    template <typename T, typename Proj>
    [[nodiscard]] constexpr u32 first_unordered_index(podkit::bytes::PodSlice<T> items, Proj proj) noexcept {
        for (u32 i = 1; i < items.len; ++i) {
            if (!(proj(items.data[i - 1]) < proj(items.data[i]))) {
                return i;
            }
        }
        return items.len;
    }

    struct Identity {
        template <typename T>
        [[nodiscard]] constexpr const T& operator()(const T& v) const noexcept {
            return v;
        }
    };

} // namespace podkit::collections
