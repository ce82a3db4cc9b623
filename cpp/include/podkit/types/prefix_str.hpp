#pragma once

#include <limits>
#include <string_view>
#include <type_traits>

#include "podkit/bytes/buffer.hpp"
#include "podkit/core/errors.hpp"
#include "podkit/core/types.hpp"

namespace podkit::types {
    using u8 = podkit::core::u8;
    using u16 = podkit::core::u16;
    using u32 = podkit::core::u32;

    // Layout: [len: P, little-endian][len bytes of UTF-8]. The value is a view;
    // the bytes stay in the caller's buffer.
    template <typename P>
    concept PrefixLen = std::is_same_v<P, u8> || std::is_same_v<P, u16>;

    [[nodiscard]] u32 prefix_len_read(const u8* p, u32 prefix_bytes) noexcept;
    void prefix_len_write(u8* p, u32 prefix_bytes, u32 len) noexcept;

    // Validates [prefix][text] at the start of a buffer of buf_len bytes and
    // reports the text length.
    [[nodiscard]] podkit::core::Status prefix_str_check(const u8* data, u32 buf_len, u32 prefix_bytes, u32* text_len) noexcept;

    template <PrefixLen P>
    struct PrefixStr {
        const u8* value{nullptr};
        u32 len{0};

        [[nodiscard]] std::string_view as_str() const noexcept {
            return std::string_view(reinterpret_cast<const char*>(value), len);
        }

        // Bytes occupied in the buffer, prefix included.
        [[nodiscard]] constexpr u32 size() const noexcept { return static_cast<u32>(sizeof(P)) + len; }
    };

    template <PrefixLen P>
    struct PrefixStrMut {
        u8* value{nullptr};
        u32 len{0};

        [[nodiscard]] std::string_view as_str() const noexcept {
            return std::string_view(reinterpret_cast<const char*>(value), len);
        }

        [[nodiscard]] constexpr u32 size() const noexcept { return static_cast<u32>(sizeof(P)) + len; }

        // Copies at most len bytes and zero-fills the rest. The caller keeps the
        // text UTF-8: truncation happens on a byte boundary.
        void copy_from(std::string_view s) noexcept {
            const u32 n = s.size() < len ? static_cast<u32>(s.size()) : len;
            for (u32 i = 0; i < n; ++i) {
                value[i] = static_cast<u8>(s[i]);
            }
            for (u32 i = n; i < len; ++i) {
                value[i] = 0;
            }
        }
    };

    template <PrefixLen P>
    [[nodiscard]] podkit::core::Status prefix_str_load(podkit::bytes::BufferView bytes, PrefixStr<P>* out) noexcept {
        if (out == nullptr || !podkit::bytes::buffer_ok(bytes)) {
            return podkit::core::make_status(podkit::core::StatusDomain::Types, podkit::core::StatusCode::Invalid);
        }
        u32 n = 0;
        const podkit::core::Status s = prefix_str_check(bytes.data, bytes.len, static_cast<u32>(sizeof(P)), &n);
        if (!podkit::core::is_ok(s)) {
            return s;
        }
        out->value = bytes.data + sizeof(P);
        out->len = n;
        return podkit::core::ok_status();
    }

    template <PrefixLen P>
    [[nodiscard]] podkit::core::Status prefix_str_load_mut(podkit::bytes::BufferMut bytes, PrefixStrMut<P>* out) noexcept {
        if (out == nullptr || !podkit::bytes::buffer_ok(bytes)) {
            return podkit::core::make_status(podkit::core::StatusDomain::Types, podkit::core::StatusCode::Invalid);
        }
        u32 n = 0;
        const podkit::core::Status s = prefix_str_check(bytes.data, bytes.len, static_cast<u32>(sizeof(P)), &n);
        if (!podkit::core::is_ok(s)) {
            return s;
        }
        out->value = bytes.data + sizeof(P);
        out->len = n;
        return podkit::core::ok_status();
    }

    // Claims the whole buffer: writes len = data.len - sizeof(P) into the prefix.
    // SizeMismatch if that length does not fit P. The existing bytes must already
    // be UTF-8 (a zeroed buffer is).
    template <PrefixLen P>
    [[nodiscard]] podkit::core::Status prefix_str_init(podkit::bytes::BufferMut data, PrefixStrMut<P>* out) noexcept {
        if (out == nullptr || !podkit::bytes::buffer_ok(data)) {
            return podkit::core::make_status(podkit::core::StatusDomain::Types, podkit::core::StatusCode::Invalid);
        }
        if (data.len < sizeof(P)) {
            return podkit::core::make_status(podkit::core::StatusDomain::Types, podkit::core::StatusCode::OutOfBounds,
                                             static_cast<u32>(sizeof(P)));
        }
        const u32 n = data.len - static_cast<u32>(sizeof(P));
        if (n > std::numeric_limits<P>::max()) {
            return podkit::core::make_status(podkit::core::StatusDomain::Types, podkit::core::StatusCode::SizeMismatch, n);
        }
        prefix_len_write(data.data, static_cast<u32>(sizeof(P)), n);
        return prefix_str_load_mut<P>(data, out);
    }

    using U8PrefixStr = PrefixStr<u8>;
    using U16PrefixStr = PrefixStr<u16>;
    using U8PrefixStrMut = PrefixStrMut<u8>;
    using U16PrefixStrMut = PrefixStrMut<u16>;

} // namespace podkit::types
