#pragma once

#include <type_traits>

#include "podkit/bytes/pod.hpp"
#include "podkit/bytes/pod_cast.hpp"
#include "podkit/collections/flex_seq.hpp"
#include "podkit/collections/sorted.hpp"
#include "podkit/core/errors.hpp"

namespace podkit::collections {

    template <podkit::bytes::PodKey K, podkit::bytes::Pod V>
    struct MapEntry {
        K key;
        V value;
    };

    template <podkit::bytes::Pod V>
    struct MapInsertResult {
        bool replaced{false};
        V previous{};
    };

} // namespace podkit::collections

namespace podkit::bytes {
    template <typename K, typename V>
    struct pod_traits<podkit::collections::MapEntry<K, V>> {
        static constexpr bool enabled = pod_traits<K>::enabled && pod_traits<V>::enabled;
    };
} // namespace podkit::bytes

namespace podkit::collections {

    // ========================================================================
    // Flexible map
    // ========================================================================
    //
    // A flexible sequence of MapEntry<K, V> kept strictly ascending by key.
    // Lookups are binary searches; insert and remove shift entries like the
    // sequence does. Every function here assumes the ordering holds; use
    // map_validate on bytes that came from elsewhere.

    namespace detail {
        struct EntryKey {
            template <typename E>
            [[nodiscard]] constexpr const auto& operator()(const E& e) const noexcept {
                return e.key;
            }
        };

        inline podkit::core::Status map_invalid() noexcept {
            return podkit::core::make_status(podkit::core::StatusDomain::Collections, podkit::core::StatusCode::Invalid);
        }

        inline podkit::core::Status map_key_not_found() noexcept {
            return podkit::core::make_status(podkit::core::StatusDomain::Collections,
                                             podkit::core::StatusCode::KeyNotFound);
        }

        // Position of key, or KeyNotFound. lower is set either way.
        template <podkit::bytes::PodKey K, podkit::bytes::Pod V>
        [[nodiscard]] podkit::core::Status map_find(BufferView region, const K& key, u32* lower, bool* found) noexcept {
            podkit::bytes::PodSlice<MapEntry<K, V>> entries{};
            const podkit::core::Status s = seq_items<MapEntry<K, V>>(region, &entries);
            if (!podkit::core::is_ok(s)) {
                return s;
            }
            *lower = lower_bound_index(entries, key, EntryKey{});
            *found = key_eq_at(entries, *lower, key, EntryKey{});
            return podkit::core::ok_status();
        }
    } // namespace detail

    template <podkit::bytes::PodKey K, podkit::bytes::Pod V>
    [[nodiscard]] podkit::core::Status map_len(BufferView region, u32* out) noexcept {
        return seq_validate(region, podkit::bytes::pod_size<MapEntry<K, V>>, out);
    }

    template <podkit::bytes::PodKey K, podkit::bytes::Pod V>
    [[nodiscard]] podkit::core::Status map_entries(BufferView region,
                                                   podkit::bytes::PodSlice<MapEntry<K, V>>* out) noexcept {
        return seq_items<MapEntry<K, V>>(region, out);
    }

    template <podkit::bytes::PodKey K, podkit::bytes::Pod V>
    [[nodiscard]] podkit::core::Status map_get(BufferView region, const K& key, const V** out) noexcept {
        if (out == nullptr) {
            return detail::map_invalid();
        }
        u32 pos = 0;
        bool found = false;
        const podkit::core::Status s = detail::map_find<K, V>(region, key, &pos, &found);
        if (!podkit::core::is_ok(s)) {
            return s;
        }
        if (!found) {
            return detail::map_key_not_found();
        }
        const MapEntry<K, V>* entry = nullptr;
        const podkit::core::Status g = seq_get<MapEntry<K, V>>(region, pos, &entry);
        if (!podkit::core::is_ok(g)) {
            return g;
        }
        *out = &entry->value;
        return podkit::core::ok_status();
    }

    // The key is not handed out mutably: changing it would break the ordering.
    template <podkit::bytes::PodKey K, podkit::bytes::Pod V>
    [[nodiscard]] podkit::core::Status map_get_mut(BufferMut region, const K& key, V** out) noexcept {
        if (out == nullptr) {
            return detail::map_invalid();
        }
        u32 pos = 0;
        bool found = false;
        const podkit::core::Status s = detail::map_find<K, V>(podkit::bytes::as_view(region), key, &pos, &found);
        if (!podkit::core::is_ok(s)) {
            return s;
        }
        if (!found) {
            return detail::map_key_not_found();
        }
        MapEntry<K, V>* entry = nullptr;
        const podkit::core::Status g = seq_get_mut<MapEntry<K, V>>(region, pos, &entry);
        if (!podkit::core::is_ok(g)) {
            return g;
        }
        *out = &entry->value;
        return podkit::core::ok_status();
    }

    template <podkit::bytes::PodKey K, podkit::bytes::Pod V>
    [[nodiscard]] podkit::core::Status map_contains(BufferView region, const K& key, bool* out) noexcept {
        if (out == nullptr) {
            return detail::map_invalid();
        }
        u32 pos = 0;
        return detail::map_find<K, V>(region, key, &pos, out);
    }

    // Entry with the smallest key. NotFound when the map is empty.
    template <podkit::bytes::PodKey K, podkit::bytes::Pod V>
    [[nodiscard]] podkit::core::Status map_lowest(BufferView region, const MapEntry<K, V>** out) noexcept {
        if (out == nullptr) {
            return detail::map_invalid();
        }
        u32 len = 0;
        const podkit::core::Status s = map_len<K, V>(region, &len);
        if (!podkit::core::is_ok(s)) {
            return s;
        }
        if (len == 0) {
            return podkit::core::make_status(podkit::core::StatusDomain::Collections,
                                             podkit::core::StatusCode::NotFound);
        }
        return seq_get<MapEntry<K, V>>(region, 0, out);
    }

    // An existing key has its value overwritten in place; nothing shifts. result
    // may be null.
    template <podkit::bytes::PodKey K, podkit::bytes::Pod V>
    [[nodiscard]] podkit::core::Status map_insert(BufferMut region,
                                                  const K& key,
                                                  const V& value,
                                                  MapInsertResult<V>* result) noexcept {
        const MapEntry<K, V> entry{key, value};
        u32 pos = 0;
        bool found = false;
        const podkit::core::Status s = detail::map_find<K, V>(podkit::bytes::as_view(region), entry.key, &pos, &found);
        if (!podkit::core::is_ok(s)) {
            return s;
        }
        if (found) {
            MapEntry<K, V>* slot = nullptr;
            const podkit::core::Status g = seq_get_mut<MapEntry<K, V>>(region, pos, &slot);
            if (!podkit::core::is_ok(g)) {
                return g;
            }
            if (result != nullptr) {
                result->replaced = true;
                result->previous = slot->value;
            }
            slot->value = entry.value;
            return podkit::core::ok_status();
        }
        const podkit::core::Status i = seq_insert<MapEntry<K, V>>(region, pos, entry);
        if (!podkit::core::is_ok(i)) {
            return i;
        }
        if (result != nullptr) {
            result->replaced = false;
            result->previous = V{};
        }
        return podkit::core::ok_status();
    }

    // out may be null to discard the removed value.
    template <podkit::bytes::PodKey K, podkit::bytes::Pod V>
    [[nodiscard]] podkit::core::Status map_remove(BufferMut region, const K& key, V* out) noexcept {
        u32 pos = 0;
        bool found = false;
        const podkit::core::Status s = detail::map_find<K, V>(podkit::bytes::as_view(region), key, &pos, &found);
        if (!podkit::core::is_ok(s)) {
            return s;
        }
        if (!found) {
            return detail::map_key_not_found();
        }
        MapEntry<K, V> removed{};
        const podkit::core::Status r = seq_remove<MapEntry<K, V>>(region, pos, &removed);
        if (!podkit::core::is_ok(r)) {
            return r;
        }
        if (out != nullptr) {
            *out = removed.value;
        }
        return podkit::core::ok_status();
    }

    // InvalidRegion (aux = index) unless keys are strictly ascending.
    template <podkit::bytes::PodKey K, podkit::bytes::Pod V>
    [[nodiscard]] podkit::core::Status map_validate(BufferView region, u32* len) noexcept {
        podkit::bytes::PodSlice<MapEntry<K, V>> entries{};
        const podkit::core::Status s = seq_items<MapEntry<K, V>>(region, &entries);
        if (!podkit::core::is_ok(s)) {
            return s;
        }
        const u32 bad = first_unordered_index(entries, detail::EntryKey{});
        if (bad != entries.len) {
            return podkit::core::make_status(podkit::core::StatusDomain::Collections,
                                             podkit::core::StatusCode::InvalidRegion, bad);
        }
        if (len != nullptr) {
            *len = entries.len;
        }
        return podkit::core::ok_status();
    }

    template <podkit::bytes::PodKey K, podkit::bytes::Pod V>
    [[nodiscard]] podkit::core::Status map_insert_grow(BufferMut buffer,
                                                       u32* used,
                                                       RegionSpan* region,
                                                       const K& key,
                                                       const V& value,
                                                       MapInsertResult<V>* result,
                                                       const podkit::bytes::BorrowLedger* ledger = nullptr) noexcept {
        if (region == nullptr) {
            return detail::map_invalid();
        }
        const MapEntry<K, V> entry{key, value};
        BufferMut bytes{};
        podkit::core::Status s = region_bytes(buffer, *region, &bytes);
        if (!podkit::core::is_ok(s)) {
            return s;
        }
        u32 pos = 0;
        bool found = false;
        s = detail::map_find<K, V>(podkit::bytes::as_view(bytes), entry.key, &pos, &found);
        if (!podkit::core::is_ok(s)) {
            return s;
        }
        if (found) {
            if (ledger != nullptr && ledger->overlaps(podkit::bytes::BorrowRange{region->offset, region->len})) {
                return podkit::core::make_status(podkit::core::StatusDomain::Collections,
                                                 podkit::core::StatusCode::BorrowConflict, region->offset);
            }
            return map_insert<K, V>(bytes, entry.key, entry.value, result);
        }
        s = seq_insert_grow<MapEntry<K, V>>(buffer, used, region, pos, entry, ledger);
        if (!podkit::core::is_ok(s)) {
            return s;
        }
        if (result != nullptr) {
            result->replaced = false;
            result->previous = V{};
        }
        return podkit::core::ok_status();
    }

    template <podkit::bytes::PodKey K, podkit::bytes::Pod V>
    [[nodiscard]] podkit::core::Status map_remove_shrink(BufferMut buffer,
                                                         u32* used,
                                                         RegionSpan* region,
                                                         const K& key,
                                                         V* out,
                                                         const podkit::bytes::BorrowLedger* ledger = nullptr) noexcept {
        if (region == nullptr) {
            return detail::map_invalid();
        }
        const K k = key;
        BufferMut bytes{};
        podkit::core::Status s = region_bytes(buffer, *region, &bytes);
        if (!podkit::core::is_ok(s)) {
            return s;
        }
        u32 pos = 0;
        bool found = false;
        s = detail::map_find<K, V>(podkit::bytes::as_view(bytes), k, &pos, &found);
        if (!podkit::core::is_ok(s)) {
            return s;
        }
        if (!found) {
            return detail::map_key_not_found();
        }
        MapEntry<K, V> removed{};
        s = seq_remove_shrink<MapEntry<K, V>>(buffer, used, region, pos, &removed, ledger);
        if (!podkit::core::is_ok(s)) {
            return s;
        }
        if (out != nullptr) {
            *out = removed.value;
        }
        return podkit::core::ok_status();
    }

} // namespace podkit::collections
