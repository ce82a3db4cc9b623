#pragma once

#include <type_traits>

#include "podkit/core/types.hpp"

namespace podkit::bytes {
    using u8 = podkit::core::u8;
    using u32 = podkit::core::u32;
    using u64 = podkit::core::u64;

    // Borrowed byte ranges. The owner of the memory stays outside the library and
    // may hand a different length on every call.
    struct BufferView {
        const u8* data{nullptr};
        u32 len{0};
    };

    struct BufferMut {
        u8* data{nullptr};
        u32 len{0};
    };

    [[nodiscard]] constexpr BufferView as_view(BufferMut b) noexcept {
        return BufferView{b.data, b.len};
    }

    // A buffer is well formed when it either points somewhere or is empty.
    [[nodiscard]] constexpr bool buffer_ok(BufferView b) noexcept {
        return b.data != nullptr || b.len == 0;
    }

    [[nodiscard]] constexpr bool buffer_ok(BufferMut b) noexcept {
        return b.data != nullptr || b.len == 0;
    }

    static_assert(std::is_trivially_copyable_v<BufferView>);
    static_assert(std::is_standard_layout_v<BufferView>);
    static_assert(std::is_trivially_copyable_v<BufferMut>);
    static_assert(std::is_standard_layout_v<BufferMut>);
} // namespace podkit::bytes
