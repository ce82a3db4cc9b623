#include "podkit/types/utf8.hpp"

namespace podkit::types {
    using podkit::core::u32;
    using podkit::core::u8;

    namespace {
        [[nodiscard]] bool is_cont(u8 c) noexcept {
            return (c & 0xc0u) == 0x80u;
        }
    } // namespace

    bool utf8_valid(const u8* data, u32 len) noexcept {
        if (len == 0) {
            return true;
        }
        if (data == nullptr) {
            return false;
        }

        u32 i = 0;
        while (i < len) {
            const u8 c = data[i];
            if (c < 0x80u) {
                ++i;
                continue;
            }

            u32 need = 0;
            u8 lo = 0x80u;
            u8 hi = 0xbfu;
            if (c >= 0xc2u && c <= 0xdfu) {
                need = 1;
            } else if (c == 0xe0u) {
                need = 2;
                lo = 0xa0u; // overlong
            } else if (c >= 0xe1u && c <= 0xecu) {
                need = 2;
            } else if (c == 0xedu) {
                need = 2;
                hi = 0x9fu; // surrogates
            } else if (c >= 0xeeu && c <= 0xefu) {
                need = 2;
            } else if (c == 0xf0u) {
                need = 3;
                lo = 0x90u; // overlong
            } else if (c >= 0xf1u && c <= 0xf3u) {
                need = 3;
            } else if (c == 0xf4u) {
                need = 3;
                hi = 0x8fu; // > U+10FFFF
            } else {
                return false;
            }

            if (len - i - 1 < need) {
                return false;
            }
            const u8 c1 = data[i + 1];
            if (c1 < lo || c1 > hi) {
                return false;
            }
            for (u32 k = 2; k <= need; ++k) {
                if (!is_cont(data[i + k])) {
                    return false;
                }
            }
            i += need + 1;
        }
        return true;
    }
} // namespace podkit::types
