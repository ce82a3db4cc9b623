#pragma once

#include <array>
#include <type_traits>

#include "podkit/bytes/byte_view.hpp"
#include "podkit/core/errors.hpp"
#include "podkit/core/types.hpp"

namespace podkit::bytes {

    enum class BorrowKind : u8 {
        Shared = 1,
        Exclusive = 2,
    };

    struct BorrowRange {
        u32 offset{0};
        u32 len{0};
    };

    struct BorrowTicket {
        u32 slot{0};
        u32 generation{0};
    };

    [[nodiscard]] constexpr bool ranges_overlap(BorrowRange a, BorrowRange b) noexcept {
        if (a.len == 0 || b.len == 0) {
            return false;
        }
        const u64 a_end = static_cast<u64>(a.offset) + a.len;
        const u64 b_end = static_cast<u64>(b.offset) + b.len;
        return static_cast<u64>(a.offset) < b_end && static_cast<u64>(b.offset) < a_end;
    }

    // ========================================================================
    // Borrow ledger
    // ========================================================================
    //
    // Single arbitration point for views into one buffer. Tracks which byte
    // ranges are borrowed shared or exclusive and refuses a borrow that would
    // alias a live exclusive one. Offsets are relative to the buffer the ledger
    // guards; the ledger itself never touches the bytes.
    class BorrowLedger {
    public:
        static constexpr u32 kMaxBorrows = 32;

        BorrowLedger() noexcept = default;

        // Exclusive conflicts with any overlapping borrow, Shared only with an
        // overlapping Exclusive one. CapacityExceeded when every slot is taken.
        [[nodiscard]] podkit::core::Status acquire(BorrowKind kind, BorrowRange range, BorrowTicket* out) noexcept;

        // Invalid for a ticket that is unknown or was already released.
        [[nodiscard]] podkit::core::Status release(BorrowTicket ticket) noexcept;

        // True if any live borrow overlaps the range.
        [[nodiscard]] bool overlaps(BorrowRange range) const noexcept;

        [[nodiscard]] u32 active() const noexcept { return active_; }

        void reset() noexcept;

    private:
        struct Entry {
            BorrowKind kind{BorrowKind::Shared};
            bool live{false};
            BorrowRange range{};
            u32 generation{0};
        };

        std::array<Entry, kMaxBorrows> entries_{};
        u32 active_{0};
    };

    // Releases its ticket when it goes out of scope.
    class BorrowGuard {
    public:
        BorrowGuard() noexcept = default;
        BorrowGuard(BorrowLedger* ledger, BorrowTicket ticket) noexcept : ledger_(ledger), ticket_(ticket) {}
        ~BorrowGuard() noexcept;

        BorrowGuard(const BorrowGuard&) = delete;
        BorrowGuard& operator=(const BorrowGuard&) = delete;
        BorrowGuard(BorrowGuard&& other) noexcept;
        BorrowGuard& operator=(BorrowGuard&& other) noexcept;

        [[nodiscard]] bool held() const noexcept { return ledger_ != nullptr; }

        // Releases early. Ok if nothing is held.
        [[nodiscard]] podkit::core::Status release() noexcept;

    private:
        BorrowLedger* ledger_{nullptr};
        BorrowTicket ticket_{};
    };

    // Checked-out typed views: the range is registered with the ledger for as
    // long as the guard lives.
    template <Pod T>
    [[nodiscard]] podkit::core::Status borrow_read(BorrowLedger& ledger,
                                                   BufferView buf,
                                                   u32 offset,
                                                   const T** out,
                                                   BorrowGuard* guard) noexcept {
        if (guard == nullptr || out == nullptr) {
            return podkit::core::make_status(podkit::core::StatusDomain::Bytes, podkit::core::StatusCode::Invalid);
        }
        const T* view = nullptr;
        podkit::core::Status s = read<T>(buf, offset, &view);
        if (!podkit::core::is_ok(s)) {
            return s;
        }
        BorrowTicket ticket{};
        s = ledger.acquire(BorrowKind::Shared, BorrowRange{offset, pod_size<T>}, &ticket);
        if (!podkit::core::is_ok(s)) {
            return s;
        }
        *guard = BorrowGuard(&ledger, ticket);
        *out = view;
        return podkit::core::ok_status();
    }

    template <Pod T>
    [[nodiscard]] podkit::core::Status borrow_write(BorrowLedger& ledger,
                                                    BufferMut buf,
                                                    u32 offset,
                                                    T** out,
                                                    BorrowGuard* guard) noexcept {
        if (guard == nullptr || out == nullptr) {
            return podkit::core::make_status(podkit::core::StatusDomain::Bytes, podkit::core::StatusCode::Invalid);
        }
        T* view = nullptr;
        podkit::core::Status s = read_mut<T>(buf, offset, &view);
        if (!podkit::core::is_ok(s)) {
            return s;
        }
        BorrowTicket ticket{};
        s = ledger.acquire(BorrowKind::Exclusive, BorrowRange{offset, pod_size<T>}, &ticket);
        if (!podkit::core::is_ok(s)) {
            return s;
        }
        *guard = BorrowGuard(&ledger, ticket);
        *out = view;
        return podkit::core::ok_status();
    }

    static_assert(std::is_trivially_copyable_v<BorrowRange>);
    static_assert(std::is_trivially_copyable_v<BorrowTicket>);
} // namespace podkit::bytes
