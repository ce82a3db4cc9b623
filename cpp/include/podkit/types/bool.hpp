#pragma once

#include "podkit/bytes/pod.hpp"
#include "podkit/core/types.hpp"

namespace podkit::types {

    // One-byte boolean: 0 is false, any other byte is true. Unlike bool, every
    // bit pattern is a valid value.
    struct PodBool {
        podkit::core::u8 v{0};

        [[nodiscard]] static constexpr PodBool from(bool value) noexcept {
            return PodBool{static_cast<podkit::core::u8>(value ? 1 : 0)};
        }

        [[nodiscard]] constexpr bool value() const noexcept { return v != 0; }

        friend constexpr bool operator==(PodBool x, PodBool y) noexcept { return x.value() == y.value(); }
    };

} // namespace podkit::types

namespace podkit::bytes {
    template <>
    struct pod_traits<podkit::types::PodBool> {
        static constexpr bool enabled = true;
    };
} // namespace podkit::bytes

static_assert(podkit::bytes::Pod<podkit::types::PodBool>);
