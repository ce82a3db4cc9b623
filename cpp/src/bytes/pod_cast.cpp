#include "podkit/bytes/pod_cast.hpp"

namespace podkit::bytes {
    using podkit::core::Status;
    using podkit::core::StatusCode;
    using podkit::core::StatusDomain;

    Status check_cast_len(u32 len, u32 type_size) noexcept {
        if (len != type_size) {
            return podkit::core::make_status(StatusDomain::Bytes, StatusCode::SizeMismatch, type_size);
        }
        return podkit::core::ok_status();
    }

    Status check_slice_len(u32 len, u32 elem_size) noexcept {
        if (elem_size == 0) {
            return podkit::core::make_status(StatusDomain::Bytes, StatusCode::Invalid);
        }
        if (len % elem_size != 0) {
            return podkit::core::make_status(StatusDomain::Bytes, StatusCode::SizeMismatch, elem_size);
        }
        return podkit::core::ok_status();
    }
} // namespace podkit::bytes
