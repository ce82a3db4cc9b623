#include "podkit/types/prefix_str.hpp"

#include "podkit/types/utf8.hpp"

namespace podkit::types {
    using podkit::core::Status;
    using podkit::core::StatusCode;
    using podkit::core::StatusDomain;

    u32 prefix_len_read(const u8* p, u32 prefix_bytes) noexcept {
        u32 v = 0;
        for (u32 i = 0; i < prefix_bytes; ++i) {
            v |= static_cast<u32>(p[i]) << (8 * i);
        }
        return v;
    }

    void prefix_len_write(u8* p, u32 prefix_bytes, u32 len) noexcept {
        for (u32 i = 0; i < prefix_bytes; ++i) {
            p[i] = static_cast<u8>((len >> (8 * i)) & 0xffu);
        }
    }

    Status prefix_str_check(const u8* data, u32 buf_len, u32 prefix_bytes, u32* text_len) noexcept {
        if (text_len == nullptr) {
            return podkit::core::make_status(StatusDomain::Types, StatusCode::Invalid);
        }
        if (buf_len < prefix_bytes) {
            return podkit::core::make_status(StatusDomain::Types, StatusCode::OutOfBounds, prefix_bytes);
        }
        const u32 n = prefix_len_read(data, prefix_bytes);
        if (n > buf_len - prefix_bytes) {
            return podkit::core::make_status(StatusDomain::Types, StatusCode::OutOfBounds, n);
        }
        if (!utf8_valid(data + prefix_bytes, n)) {
            return podkit::core::make_status(StatusDomain::Types, StatusCode::InvalidValue);
        }
        *text_len = n;
        return podkit::core::ok_status();
    }
} // namespace podkit::types
