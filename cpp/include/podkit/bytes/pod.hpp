#pragma once

#include <array>
#include <concepts>
#include <cstddef>
#include <type_traits>

#include "podkit/core/types.hpp"

namespace podkit::bytes {

    // Opt-in marker for types where every bit pattern of sizeof(T) bytes is a
    // valid value. The compiler can check size, padding and alignment, but not
    // that, so each type says it explicitly: specialize pod_traits<T> in this
    // namespace with `enabled = true`, after T is complete.
    template <typename T>
    struct pod_traits {
        static constexpr bool enabled = false;
    };

    template <>
    struct pod_traits<podkit::core::u8> {
        static constexpr bool enabled = true;
    };

    template <>
    struct pod_traits<podkit::core::i8> {
        static constexpr bool enabled = true;
    };

    template <>
    struct pod_traits<std::byte> {
        static constexpr bool enabled = true;
    };

    template <typename T, std::size_t N>
    struct pod_traits<std::array<T, N>> {
        static constexpr bool enabled = N > 0 && pod_traits<T>::enabled;
    };

    // Single-byte alignment is part of the contract: buffers hand out arbitrary
    // offsets, so a view into them may sit at any address.
    template <typename T>
    concept Pod = pod_traits<std::remove_cv_t<T>>::enabled &&
                  std::is_trivially_copyable_v<T> &&
                  std::is_standard_layout_v<T> &&
                  alignof(T) == 1 &&
                  std::has_unique_object_representations_v<T>;

    template <typename K>
    concept PodKey = Pod<K> && std::totally_ordered<K>;

    template <Pod T>
    inline constexpr podkit::core::u32 pod_size = static_cast<podkit::core::u32>(sizeof(T));

} // namespace podkit::bytes
