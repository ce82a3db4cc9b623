#pragma once

#include <cstring>

#include "podkit/bytes/buffer.hpp"
#include "podkit/bytes/pod.hpp"
#include "podkit/core/errors.hpp"

namespace podkit::bytes {

    // Ok iff [offset, offset + len) lies inside a buffer of buf_len bytes.
    // Computed in 64 bits so that offset + len cannot wrap.
    [[nodiscard]] podkit::core::Status check_range(u32 buf_len, u32 offset, u32 len) noexcept;

    // Checked sub-ranges. Bounds are taken from the buffer passed in, never cached.
    [[nodiscard]] podkit::core::Status slice(BufferView buf, u32 offset, u32 len, BufferView* out) noexcept;
    [[nodiscard]] podkit::core::Status slice_mut(BufferMut buf, u32 offset, u32 len, BufferMut* out) noexcept;

    // Typed view of sizeof(T) bytes at offset. No alignment requirement: Pod types
    // have single-byte alignment.
    template <Pod T>
    [[nodiscard]] podkit::core::Status read(BufferView buf, u32 offset, const T** out) noexcept {
        BufferView bytes{};
        const podkit::core::Status s = slice(buf, offset, pod_size<T>, &bytes);
        if (!podkit::core::is_ok(s)) {
            return s;
        }
        if (out == nullptr) {
            return podkit::core::make_status(podkit::core::StatusDomain::Bytes, podkit::core::StatusCode::Invalid);
        }
        *out = reinterpret_cast<const T*>(bytes.data);
        return podkit::core::ok_status();
    }

    template <Pod T>
    [[nodiscard]] podkit::core::Status read_mut(BufferMut buf, u32 offset, T** out) noexcept {
        BufferMut bytes{};
        const podkit::core::Status s = slice_mut(buf, offset, pod_size<T>, &bytes);
        if (!podkit::core::is_ok(s)) {
            return s;
        }
        if (out == nullptr) {
            return podkit::core::make_status(podkit::core::StatusDomain::Bytes, podkit::core::StatusCode::Invalid);
        }
        *out = reinterpret_cast<T*>(bytes.data);
        return podkit::core::ok_status();
    }

    template <Pod T>
    [[nodiscard]] podkit::core::Status read_copy(BufferView buf, u32 offset, T* out) noexcept {
        BufferView bytes{};
        const podkit::core::Status s = slice(buf, offset, pod_size<T>, &bytes);
        if (!podkit::core::is_ok(s)) {
            return s;
        }
        if (out == nullptr) {
            return podkit::core::make_status(podkit::core::StatusDomain::Bytes, podkit::core::StatusCode::Invalid);
        }
        std::memcpy(out, bytes.data, sizeof(T));
        return podkit::core::ok_status();
    }

    template <Pod T>
    [[nodiscard]] podkit::core::Status write(BufferMut buf, u32 offset, const T& value) noexcept {
        BufferMut bytes{};
        const podkit::core::Status s = slice_mut(buf, offset, pod_size<T>, &bytes);
        if (!podkit::core::is_ok(s)) {
            return s;
        }
        std::memcpy(bytes.data, &value, sizeof(T));
        return podkit::core::ok_status();
    }

} // namespace podkit::bytes
