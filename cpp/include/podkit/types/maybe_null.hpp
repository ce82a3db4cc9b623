#pragma once

#include <array>
#include <cstddef>
#include <type_traits>

#include "podkit/bytes/pod.hpp"
#include "podkit/core/errors.hpp"
#include "podkit/types/pod_int.hpp"

namespace podkit::types {

    // Designates one value of T as "none". Types without a specialization are
    // not Nullable.
    template <typename T>
    struct nullable_traits;

    template <typename E, std::size_t N>
        requires std::is_unsigned_v<E>
    struct nullable_traits<std::array<E, N>> {
        [[nodiscard]] static constexpr std::array<E, N> none() noexcept { return std::array<E, N>{}; }
    };

    template <typename Repr>
    struct nullable_traits<PodInt<Repr>> {
        [[nodiscard]] static constexpr PodInt<Repr> none() noexcept { return PodInt<Repr>{}; }
    };

    template <typename T>
    concept Nullable = podkit::bytes::Pod<T> && std::equality_comparable<T> && requires {
        { nullable_traits<T>::none() } -> std::same_as<T>;
    };

    template <Nullable T>
    [[nodiscard]] constexpr bool is_none(const T& v) noexcept {
        return v == nullable_traits<T>::none();
    }

    // Optional value with the same size as T: the none() value stands for
    // "absent", so no flag byte is needed.
    template <Nullable T>
    struct MaybeNull {
        T v{nullable_traits<T>::none()};

        [[nodiscard]] static constexpr MaybeNull from(const T& value) noexcept { return MaybeNull{value}; }

        // value == nullptr gives an absent MaybeNull. A present value equal to
        // none() cannot be represented and is InvalidValue.
        [[nodiscard]] static podkit::core::Status from_optional(const T* value, MaybeNull* out) noexcept {
            if (out == nullptr) {
                return podkit::core::make_status(podkit::core::StatusDomain::Types, podkit::core::StatusCode::Invalid);
            }
            if (value == nullptr) {
                *out = MaybeNull{};
                return podkit::core::ok_status();
            }
            if (podkit::types::is_none(*value)) {
                return podkit::core::make_status(podkit::core::StatusDomain::Types,
                                                 podkit::core::StatusCode::InvalidValue);
            }
            *out = MaybeNull{*value};
            return podkit::core::ok_status();
        }

        [[nodiscard]] constexpr bool has_value() const noexcept { return !podkit::types::is_none(v); }

        // nullptr when absent.
        [[nodiscard]] constexpr const T* as_ptr() const noexcept { return has_value() ? &v : nullptr; }
        [[nodiscard]] constexpr T* as_mut() noexcept { return has_value() ? &v : nullptr; }

        friend constexpr bool operator==(const MaybeNull&, const MaybeNull&) noexcept = default;
    };

} // namespace podkit::types

namespace podkit::bytes {
    template <typename T>
    struct pod_traits<podkit::types::MaybeNull<T>> {
        static constexpr bool enabled = pod_traits<T>::enabled;
    };
} // namespace podkit::bytes

static_assert(podkit::bytes::Pod<podkit::types::MaybeNull<std::array<podkit::core::u8, 32>>>);
static_assert(sizeof(podkit::types::MaybeNull<podkit::types::PodU64>) == 8);
