#pragma once

#include <array>
#include <bit>
#include <compare>
#include <type_traits>

#include "podkit/bytes/pod.hpp"
#include "podkit/core/types.hpp"

namespace podkit::types {
    using u8 = podkit::core::u8;
    using u16 = podkit::core::u16;
    using u32 = podkit::core::u32;
    using u64 = podkit::core::u64;

    // Fixed-width integer stored as little-endian bytes. Alignment is 1, so it
    // can sit at any offset of a buffer; the byte order does not depend on the
    // host.
    template <typename Repr>
    struct PodInt {
        static_assert(std::is_integral_v<Repr> && !std::is_same_v<Repr, bool>);
        using Unsigned = std::make_unsigned_t<Repr>;

        std::array<u8, sizeof(Repr)> b{};

        [[nodiscard]] static constexpr PodInt from(Repr v) noexcept {
            PodInt out{};
            out.set(v);
            return out;
        }

        [[nodiscard]] constexpr Repr get() const noexcept {
            Unsigned v = 0;
            for (std::size_t i = 0; i < sizeof(Repr); ++i) {
                v = static_cast<Unsigned>(v | (static_cast<Unsigned>(b[i]) << (8 * i)));
            }
            return static_cast<Repr>(v);
        }

        constexpr void set(Repr v) noexcept {
            const Unsigned u = static_cast<Unsigned>(v);
            for (std::size_t i = 0; i < sizeof(Repr); ++i) {
                b[i] = static_cast<u8>((u >> (8 * i)) & 0xffu);
            }
        }

        friend constexpr bool operator==(PodInt x, PodInt y) noexcept { return x.b == y.b; }
        friend constexpr std::strong_ordering operator<=>(PodInt x, PodInt y) noexcept {
            return x.get() <=> y.get();
        }
    };

    using PodU16 = PodInt<podkit::core::u16>;
    using PodU32 = PodInt<podkit::core::u32>;
    using PodU64 = PodInt<podkit::core::u64>;
    using PodI16 = PodInt<podkit::core::i16>;
    using PodI32 = PodInt<podkit::core::i32>;
    using PodI64 = PodInt<podkit::core::i64>;

    // IEEE-754 value stored as little-endian bytes. Any bit pattern, NaNs
    // included, is a valid value.
    template <typename F>
    struct PodFloat {
        static_assert(std::is_floating_point_v<F> && (sizeof(F) == 4 || sizeof(F) == 8));
        using Bits = std::conditional_t<sizeof(F) == 4, u32, u64>;

        PodInt<Bits> bits{};

        [[nodiscard]] static constexpr PodFloat from(F v) noexcept {
            PodFloat out{};
            out.set(v);
            return out;
        }

        [[nodiscard]] constexpr F get() const noexcept { return std::bit_cast<F>(bits.get()); }
        constexpr void set(F v) noexcept { bits.set(std::bit_cast<Bits>(v)); }
    };

    using PodF32 = PodFloat<podkit::core::f32>;
    using PodF64 = PodFloat<podkit::core::f64>;

} // namespace podkit::types

namespace podkit::bytes {
    template <typename Repr>
    struct pod_traits<podkit::types::PodInt<Repr>> {
        static constexpr bool enabled = true;
    };

    template <typename F>
    struct pod_traits<podkit::types::PodFloat<F>> {
        static constexpr bool enabled = true;
    };
} // namespace podkit::bytes

namespace podkit::types {
    static_assert(podkit::bytes::PodKey<PodU32>);
    static_assert(podkit::bytes::PodKey<PodI64>);
    static_assert(podkit::bytes::Pod<PodF64>);
    static_assert(sizeof(PodU64) == 8);
    static_assert(sizeof(PodF32) == 4);
} // namespace podkit::types
