#pragma once

#include <type_traits>

#include "podkit/bytes/buffer.hpp"
#include "podkit/bytes/pod.hpp"
#include "podkit/core/errors.hpp"

namespace podkit::bytes {

    // Contiguous run of Pod values aliasing a buffer.
    template <Pod T>
    struct PodSlice {
        const T* data{nullptr};
        u32 len{0};

        [[nodiscard]] constexpr const T* begin() const noexcept { return data; }
        [[nodiscard]] constexpr const T* end() const noexcept { return data + len; }
        [[nodiscard]] constexpr u32 size() const noexcept { return len; }
        [[nodiscard]] constexpr bool empty() const noexcept { return len == 0; }
        [[nodiscard]] constexpr const T& operator[](u32 i) const noexcept { return data[i]; }
    };

    template <Pod T>
    struct PodSliceMut {
        T* data{nullptr};
        u32 len{0};

        [[nodiscard]] constexpr T* begin() const noexcept { return data; }
        [[nodiscard]] constexpr T* end() const noexcept { return data + len; }
        [[nodiscard]] constexpr u32 size() const noexcept { return len; }
        [[nodiscard]] constexpr bool empty() const noexcept { return len == 0; }
        [[nodiscard]] constexpr T& operator[](u32 i) const noexcept { return data[i]; }
    };

    // Length checks shared by every cast. Content is never inspected.
    [[nodiscard]] podkit::core::Status check_cast_len(u32 len, u32 type_size) noexcept;
    [[nodiscard]] podkit::core::Status check_slice_len(u32 len, u32 elem_size) noexcept;

    template <Pod T>
    [[nodiscard]] podkit::core::Status try_cast(BufferView bytes, const T** out) noexcept {
        if (out == nullptr || !buffer_ok(bytes)) {
            return podkit::core::make_status(podkit::core::StatusDomain::Bytes, podkit::core::StatusCode::Invalid);
        }
        const podkit::core::Status s = check_cast_len(bytes.len, pod_size<T>);
        if (!podkit::core::is_ok(s)) {
            return s;
        }
        *out = reinterpret_cast<const T*>(bytes.data);
        return podkit::core::ok_status();
    }

    // The caller must hold the only live view over these bytes.
    template <Pod T>
    [[nodiscard]] podkit::core::Status try_cast_mut(BufferMut bytes, T** out) noexcept {
        if (out == nullptr || !buffer_ok(bytes)) {
            return podkit::core::make_status(podkit::core::StatusDomain::Bytes, podkit::core::StatusCode::Invalid);
        }
        const podkit::core::Status s = check_cast_len(bytes.len, pod_size<T>);
        if (!podkit::core::is_ok(s)) {
            return s;
        }
        *out = reinterpret_cast<T*>(bytes.data);
        return podkit::core::ok_status();
    }

    template <Pod T>
    [[nodiscard]] podkit::core::Status cast_slice(BufferView bytes, PodSlice<T>* out) noexcept {
        if (out == nullptr || !buffer_ok(bytes)) {
            return podkit::core::make_status(podkit::core::StatusDomain::Bytes, podkit::core::StatusCode::Invalid);
        }
        const podkit::core::Status s = check_slice_len(bytes.len, pod_size<T>);
        if (!podkit::core::is_ok(s)) {
            return s;
        }
        out->data = reinterpret_cast<const T*>(bytes.data);
        out->len = bytes.len / pod_size<T>;
        return podkit::core::ok_status();
    }

    template <Pod T>
    [[nodiscard]] podkit::core::Status cast_slice_mut(BufferMut bytes, PodSliceMut<T>* out) noexcept {
        if (out == nullptr || !buffer_ok(bytes)) {
            return podkit::core::make_status(podkit::core::StatusDomain::Bytes, podkit::core::StatusCode::Invalid);
        }
        const podkit::core::Status s = check_slice_len(bytes.len, pod_size<T>);
        if (!podkit::core::is_ok(s)) {
            return s;
        }
        out->data = reinterpret_cast<T*>(bytes.data);
        out->len = bytes.len / pod_size<T>;
        return podkit::core::ok_status();
    }

    template <Pod T>
    [[nodiscard]] BufferView bytes_of(const T& value) noexcept {
        return BufferView{reinterpret_cast<const u8*>(&value), pod_size<T>};
    }

    template <Pod T>
    [[nodiscard]] BufferMut bytes_of_mut(T& value) noexcept {
        return BufferMut{reinterpret_cast<u8*>(&value), pod_size<T>};
    }

    static_assert(std::is_trivially_copyable_v<PodSlice<u8>>);
    static_assert(std::is_trivially_copyable_v<PodSliceMut<u8>>);
} // namespace podkit::bytes
