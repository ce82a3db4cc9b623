#include "podkit/bytes/borrow.hpp"

namespace podkit::bytes {
    using podkit::core::Status;
    using podkit::core::StatusCode;
    using podkit::core::StatusDomain;

    Status BorrowLedger::acquire(BorrowKind kind, BorrowRange range, BorrowTicket* out) noexcept {
        if (out == nullptr) {
            return podkit::core::make_status(StatusDomain::Bytes, StatusCode::Invalid);
        }
        if (kind != BorrowKind::Shared && kind != BorrowKind::Exclusive) {
            return podkit::core::make_status(StatusDomain::Bytes, StatusCode::Invalid);
        }

        u32 free_slot = kMaxBorrows;
        for (u32 i = 0; i < kMaxBorrows; ++i) {
            const Entry& e = entries_[i];
            if (!e.live) {
                if (free_slot == kMaxBorrows) {
                    free_slot = i;
                }
                continue;
            }
            if (!ranges_overlap(e.range, range)) {
                continue;
            }
            if (kind == BorrowKind::Exclusive || e.kind == BorrowKind::Exclusive) {
                // aux: the offset of the borrow that is in the way
                return podkit::core::make_status(StatusDomain::Bytes, StatusCode::BorrowConflict, e.range.offset);
            }
        }

        if (free_slot == kMaxBorrows) {
            return podkit::core::make_status(StatusDomain::Bytes, StatusCode::CapacityExceeded, kMaxBorrows);
        }

        Entry& e = entries_[free_slot];
        e.kind = kind;
        e.live = true;
        e.range = range;
        ++e.generation;
        ++active_;

        out->slot = free_slot;
        out->generation = e.generation;
        return podkit::core::ok_status();
    }

    Status BorrowLedger::release(BorrowTicket ticket) noexcept {
        if (ticket.slot >= kMaxBorrows) {
            return podkit::core::make_status(StatusDomain::Bytes, StatusCode::Invalid);
        }
        Entry& e = entries_[ticket.slot];
        if (!e.live || e.generation != ticket.generation) {
            return podkit::core::make_status(StatusDomain::Bytes, StatusCode::Invalid);
        }
        e.live = false;
        e.range = BorrowRange{};
        --active_;
        return podkit::core::ok_status();
    }

    bool BorrowLedger::overlaps(BorrowRange range) const noexcept {
        for (const Entry& e : entries_) {
            if (e.live && ranges_overlap(e.range, range)) {
                return true;
            }
        }
        return false;
    }

    void BorrowLedger::reset() noexcept {
        for (Entry& e : entries_) {
            // generations survive so that tickets from before the reset stay stale
            e.live = false;
            e.range = BorrowRange{};
        }
        active_ = 0;
    }

    BorrowGuard::~BorrowGuard() noexcept {
        if (ledger_ != nullptr) {
            (void)ledger_->release(ticket_);
        }
    }

    BorrowGuard::BorrowGuard(BorrowGuard&& other) noexcept : ledger_(other.ledger_), ticket_(other.ticket_) {
        other.ledger_ = nullptr;
    }

    BorrowGuard& BorrowGuard::operator=(BorrowGuard&& other) noexcept {
        if (this != &other) {
            if (ledger_ != nullptr) {
                (void)ledger_->release(ticket_);
            }
            ledger_ = other.ledger_;
            ticket_ = other.ticket_;
            other.ledger_ = nullptr;
        }
        return *this;
    }

    Status BorrowGuard::release() noexcept {
        if (ledger_ == nullptr) {
            return podkit::core::ok_status();
        }
        const Status s = ledger_->release(ticket_);
        ledger_ = nullptr;
        return s;
    }
} // namespace podkit::bytes
