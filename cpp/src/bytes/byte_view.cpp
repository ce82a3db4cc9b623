#include "podkit/bytes/byte_view.hpp"

namespace podkit::bytes {
    using podkit::core::Status;
    using podkit::core::StatusCode;
    using podkit::core::StatusDomain;

    Status check_range(u32 buf_len, u32 offset, u32 len) noexcept {
        const u64 end = static_cast<u64>(offset) + static_cast<u64>(len);
        if (end > static_cast<u64>(buf_len)) {
            // aux: how far past the end the request reaches
            return podkit::core::make_status(StatusDomain::Bytes, StatusCode::OutOfBounds,
                                             static_cast<u32>(end - static_cast<u64>(buf_len)));
        }
        return podkit::core::ok_status();
    }

    Status slice(BufferView buf, u32 offset, u32 len, BufferView* out) noexcept {
        if (out == nullptr || !buffer_ok(buf)) {
            return podkit::core::make_status(StatusDomain::Bytes, StatusCode::Invalid);
        }
        const Status s = check_range(buf.len, offset, len);
        if (!podkit::core::is_ok(s)) {
            return s;
        }
        out->data = buf.data == nullptr ? nullptr : buf.data + offset;
        out->len = len;
        return podkit::core::ok_status();
    }

    Status slice_mut(BufferMut buf, u32 offset, u32 len, BufferMut* out) noexcept {
        if (out == nullptr || !buffer_ok(buf)) {
            return podkit::core::make_status(StatusDomain::Bytes, StatusCode::Invalid);
        }
        const Status s = check_range(buf.len, offset, len);
        if (!podkit::core::is_ok(s)) {
            return s;
        }
        out->data = buf.data == nullptr ? nullptr : buf.data + offset;
        out->len = len;
        return podkit::core::ok_status();
    }
} // namespace podkit::bytes
