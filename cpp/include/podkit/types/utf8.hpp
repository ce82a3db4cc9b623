#pragma once

#include "podkit/core/types.hpp"

namespace podkit::types {

    // Strict UTF-8 check: rejects overlong encodings, surrogates and code points
    // above U+10FFFF.
    [[nodiscard]] bool utf8_valid(const podkit::core::u8* data, podkit::core::u32 len) noexcept;

} // namespace podkit::types
