#pragma once
#include <cstdint>
#include <type_traits>

namespace podkit::core {
    using u16 = std::uint16_t;
    using u32 = std::uint32_t;

    enum class StatusCode : u16 {
        Ok = 0,
        Invalid,
        OutOfBounds,
        SizeMismatch,
        IndexOutOfRange,
        CapacityExceeded,
        KeyNotFound,
        KeyExists,
        InvalidValue,
        InvalidRegion,
        BorrowConflict,
        NotFound,
        Io,
    };

    enum class StatusDomain : u16 {
        Core = 0,
        Bytes,
        Types,
        Collections,
        Cli,
    };

    // aux carries a detail for the failing call: the offending index, the number
    // of bytes that were required, or errno for Io.
    struct Status {
        StatusCode code{StatusCode::Ok};
        StatusDomain domain{StatusDomain::Core};
        u32 aux{0};
    };

    [[nodiscard]] constexpr Status make_status(StatusDomain domain, StatusCode code, u32 aux = 0) noexcept {
        return Status{code, domain, aux};
    }

    [[nodiscard]] constexpr bool is_ok(Status s) noexcept {
        return s.code == StatusCode::Ok;
    }

    [[nodiscard]] constexpr Status ok_status() noexcept {
        return Status{};
    }

    [[nodiscard]] constexpr const char* status_code_name(StatusCode code) noexcept {
        switch (code) {
        case StatusCode::Ok: return "Ok";
        case StatusCode::Invalid: return "Invalid";
        case StatusCode::OutOfBounds: return "OutOfBounds";
        case StatusCode::SizeMismatch: return "SizeMismatch";
        case StatusCode::IndexOutOfRange: return "IndexOutOfRange";
        case StatusCode::CapacityExceeded: return "CapacityExceeded";
        case StatusCode::KeyNotFound: return "KeyNotFound";
        case StatusCode::KeyExists: return "KeyExists";
        case StatusCode::InvalidValue: return "InvalidValue";
        case StatusCode::InvalidRegion: return "InvalidRegion";
        case StatusCode::BorrowConflict: return "BorrowConflict";
        case StatusCode::NotFound: return "NotFound";
        case StatusCode::Io: return "Io";
        }
        return "Unknown";
    }

    [[nodiscard]] constexpr const char* status_domain_name(StatusDomain domain) noexcept {
        switch (domain) {
        case StatusDomain::Core: return "Core";
        case StatusDomain::Bytes: return "Bytes";
        case StatusDomain::Types: return "Types";
        case StatusDomain::Collections: return "Collections";
        case StatusDomain::Cli: return "Cli";
        }
        return "Unknown";
    }

    static_assert(std::is_trivially_copyable_v<Status>);
    static_assert(std::is_standard_layout_v<Status>);
} // namespace podkit::core
