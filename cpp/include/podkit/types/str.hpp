#pragma once

#include <array>
#include <cstring>
#include <string_view>

#include "podkit/bytes/pod.hpp"
#include "podkit/core/errors.hpp"
#include "podkit/core/types.hpp"
#include "podkit/types/utf8.hpp"

namespace podkit::types {

    // String of up to N bytes in a fixed N-byte field. A NUL byte ends the value
    // early; a value of exactly N bytes has no terminator.
    template <podkit::core::u32 N>
    struct PodStr {
        static_assert(N > 0);

        std::array<podkit::core::u8, N> value{};

        [[nodiscard]] static PodStr from(std::string_view s) noexcept {
            PodStr out{};
            out.copy_from(s);
            return out;
        }

        [[nodiscard]] constexpr const std::array<podkit::core::u8, N>& as_bytes() const noexcept { return value; }

        // Number of bytes before the first NUL (or N).
        [[nodiscard]] constexpr podkit::core::u32 text_len() const noexcept {
            for (podkit::core::u32 i = 0; i < N; ++i) {
                if (value[i] == 0) {
                    return i;
                }
            }
            return N;
        }

        // InvalidValue if the text is not UTF-8.
        [[nodiscard]] podkit::core::Status as_str(std::string_view* out) const noexcept {
            if (out == nullptr) {
                return podkit::core::make_status(podkit::core::StatusDomain::Types, podkit::core::StatusCode::Invalid);
            }
            const podkit::core::u32 n = text_len();
            if (!utf8_valid(value.data(), n)) {
                return podkit::core::make_status(podkit::core::StatusDomain::Types, podkit::core::StatusCode::InvalidValue);
            }
            *out = std::string_view(reinterpret_cast<const char*>(value.data()), n);
            return podkit::core::ok_status();
        }

        // Caller guarantees the text is UTF-8.
        [[nodiscard]] std::string_view as_str_unchecked() const noexcept {
            return std::string_view(reinterpret_cast<const char*>(value.data()), text_len());
        }

        // Copies at most N bytes and zero-fills the rest.
        void copy_from(std::string_view s) noexcept {
            const std::size_t n = s.size() < N ? s.size() : N;
            if (n > 0) {
                std::memcpy(value.data(), s.data(), n);
            }
            if (n < N) {
                std::memset(value.data() + n, 0, N - n);
            }
        }

        friend constexpr bool operator==(const PodStr&, const PodStr&) noexcept = default;
    };

} // namespace podkit::types

namespace podkit::bytes {
    template <podkit::core::u32 N>
    struct pod_traits<podkit::types::PodStr<N>> {
        static constexpr bool enabled = true;
    };
} // namespace podkit::bytes

static_assert(podkit::bytes::Pod<podkit::types::PodStr<16>>);
