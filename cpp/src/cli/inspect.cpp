#include "podkit/cli/inspect.hpp"

#include <cstdio>
#include <limits>

#include "podkit/bytes/byte_view.hpp"
#include "podkit/collections/flex_map.hpp"
#include "podkit/collections/flex_seq.hpp"
#include "podkit/types/pod_int.hpp"

namespace podkit::cli {
    using podkit::bytes::BufferMut;
    using podkit::bytes::BufferView;
    using podkit::core::Status;
    using podkit::core::StatusCode;
    using podkit::core::StatusDomain;
    using podkit::types::PodU32;

    using U32Entry = podkit::collections::MapEntry<PodU32, PodU32>;

    namespace {
        constexpr OptionSpec kInspectOptions[] = {
            {OptionId::Offset, OptionType::U64, "offset", 'o'},
            {OptionId::Span, OptionType::U64, "span", 's'},
            {OptionId::ElemSize, OptionType::U64, "elem-size", 'e'},
            {OptionId::Size, OptionType::U64, "size", '\0'},
            {OptionId::Value, OptionType::U64, "value", 'v'},
            {OptionId::Key, OptionType::U64, "key", 'k'},
            {OptionId::Index, OptionType::U64, "index", 'i'},
            {OptionId::Verbose, OptionType::Flag, "verbose", '\0'},
        };

        Status cli_status(StatusCode code, u32 aux = 0) noexcept {
            return podkit::core::make_status(StatusDomain::Cli, code, aux);
        }

        // Copies an optional u32 option into *dst; *present reports whether it was given.
        Status take_u32(const ParsedOptions& opts, OptionId id, u32* dst, bool* present) noexcept {
            const ParsedOption* opt = find_option(opts, id);
            if (present != nullptr) {
                *present = opt != nullptr;
            }
            if (opt == nullptr) {
                return podkit::core::ok_status();
            }
            if (opt->value.u64v > std::numeric_limits<u32>::max()) {
                return cli_status(StatusCode::InvalidValue, static_cast<u32>(id));
            }
            *dst = static_cast<u32>(opt->value.u64v);
            return podkit::core::ok_status();
        }

        void append_hex(std::string* out, BufferView bytes) {
            char buf[4];
            for (u32 i = 0; i < bytes.len; ++i) {
                std::snprintf(buf, sizeof(buf), "%02x", static_cast<unsigned>(bytes.data[i]));
                out->append(buf);
            }
        }

        void append_u32(std::string* out, const char* label, u32 v) {
            char buf[48];
            std::snprintf(buf, sizeof(buf), "%s%u", label, static_cast<unsigned>(v));
            out->append(buf);
        }

        Status require(bool present, OptionId id) noexcept {
            return present ? podkit::core::ok_status() : cli_status(StatusCode::Invalid, static_cast<u32>(id));
        }
    } // namespace

    const OptionSpec* inspect_option_specs(u32* count) noexcept {
        if (count != nullptr) {
            *count = static_cast<u32>(sizeof(kInspectOptions) / sizeof(kInspectOptions[0]));
        }
        return kInspectOptions;
    }

    Status build_inspect_config(const ParsedOptions& opts,
                                const char* image_arg,
                                const char* env_image,
                                InspectConfig* cfg) {
        if (cfg == nullptr) {
            return cli_status(StatusCode::Invalid);
        }
        InspectConfig next = *cfg;
        if (image_arg != nullptr && image_arg[0] != '\0') {
            next.image_path = image_arg;
        } else if (env_image != nullptr && env_image[0] != '\0') {
            next.image_path = env_image;
        }

        bool unused = false;
        Status s = take_u32(opts, OptionId::Offset, &next.offset, &unused);
        if (podkit::core::is_ok(s)) {
            s = take_u32(opts, OptionId::Span, &next.span, &unused);
        }
        if (podkit::core::is_ok(s)) {
            s = take_u32(opts, OptionId::ElemSize, &next.elem_size, &unused);
        }
        if (podkit::core::is_ok(s)) {
            s = take_u32(opts, OptionId::Size, &next.size, &unused);
        }
        if (podkit::core::is_ok(s)) {
            s = take_u32(opts, OptionId::Value, &next.value, &next.has_value);
        }
        if (podkit::core::is_ok(s)) {
            s = take_u32(opts, OptionId::Key, &next.key, &next.has_key);
        }
        if (podkit::core::is_ok(s)) {
            s = take_u32(opts, OptionId::Index, &next.index, &next.has_index);
        }
        if (!podkit::core::is_ok(s)) {
            return s;
        }
        if (next.elem_size == 0) {
            return cli_status(StatusCode::InvalidValue, static_cast<u32>(OptionId::ElemSize));
        }
        if (find_option(opts, OptionId::Verbose) != nullptr) {
            next.verbose = true;
        }
        *cfg = next;
        return podkit::core::ok_status();
    }

    Status inspect_region(BufferMut image, const InspectConfig& cfg, BufferMut* out) noexcept {
        if (cfg.offset > image.len) {
            return cli_status(StatusCode::OutOfBounds, cfg.offset - image.len);
        }
        const u32 span = cfg.span == 0 ? image.len - cfg.offset : cfg.span;
        const Status s = podkit::bytes::slice_mut(image, cfg.offset, span, out);
        if (!podkit::core::is_ok(s)) {
            return cli_status(s.code, s.aux);
        }
        return podkit::core::ok_status();
    }

    Status run_seq_init(BufferMut image, const InspectConfig& cfg) noexcept {
        BufferMut region{};
        const Status s = inspect_region(image, cfg, &region);
        if (!podkit::core::is_ok(s)) {
            return s;
        }
        return podkit::collections::seq_init(region);
    }

    Status run_seq_dump(BufferMut image, const InspectConfig& cfg, std::string* out) {
        if (out == nullptr) {
            return cli_status(StatusCode::Invalid);
        }
        BufferMut region{};
        Status s = inspect_region(image, cfg, &region);
        if (!podkit::core::is_ok(s)) {
            return s;
        }
        u32 len = 0;
        s = podkit::collections::seq_validate(podkit::bytes::as_view(region), cfg.elem_size, &len);
        if (!podkit::core::is_ok(s)) {
            return s;
        }
        append_u32(out, "len=", len);
        append_u32(out, " capacity=", podkit::collections::seq_capacity_of(region.len, cfg.elem_size));
        append_u32(out, " elem_size=", cfg.elem_size);
        out->push_back('\n');
        for (u32 i = 0; i < len; ++i) {
            BufferView elem{};
            s = podkit::collections::seq_get_raw(podkit::bytes::as_view(region), cfg.elem_size, i, &elem);
            if (!podkit::core::is_ok(s)) {
                return s;
            }
            append_u32(out, "[", i);
            out->append("] ");
            append_hex(out, elem);
            if (cfg.elem_size == sizeof(PodU32)) {
                PodU32 v{};
                s = podkit::bytes::read_copy<PodU32>(elem, 0, &v);
                if (!podkit::core::is_ok(s)) {
                    return s;
                }
                append_u32(out, " u32=", v.get());
            }
            out->push_back('\n');
        }
        return podkit::core::ok_status();
    }

    Status run_seq_push(BufferMut image, const InspectConfig& cfg) noexcept {
        Status s = require(cfg.has_value, OptionId::Value);
        if (!podkit::core::is_ok(s)) {
            return s;
        }
        if (cfg.elem_size != sizeof(PodU32)) {
            return cli_status(StatusCode::SizeMismatch, cfg.elem_size);
        }
        BufferMut region{};
        s = inspect_region(image, cfg, &region);
        if (!podkit::core::is_ok(s)) {
            return s;
        }
        if (cfg.has_index) {
            return podkit::collections::seq_insert<PodU32>(region, cfg.index, PodU32::from(cfg.value));
        }
        return podkit::collections::seq_push<PodU32>(region, PodU32::from(cfg.value));
    }

    Status run_seq_remove(BufferMut image, const InspectConfig& cfg, std::string* out) {
        if (out == nullptr) {
            return cli_status(StatusCode::Invalid);
        }
        Status s = require(cfg.has_index, OptionId::Index);
        if (!podkit::core::is_ok(s)) {
            return s;
        }
        BufferMut region{};
        s = inspect_region(image, cfg, &region);
        if (!podkit::core::is_ok(s)) {
            return s;
        }
        std::string removed(cfg.elem_size, '\0');
        s = podkit::collections::seq_remove_raw(
            region, cfg.elem_size, cfg.index,
            BufferMut{reinterpret_cast<podkit::core::u8*>(removed.data()), cfg.elem_size});
        if (!podkit::core::is_ok(s)) {
            return s;
        }
        out->append("removed ");
        append_hex(out, BufferView{reinterpret_cast<const podkit::core::u8*>(removed.data()), cfg.elem_size});
        out->push_back('\n');
        return podkit::core::ok_status();
    }

    Status run_map_dump(BufferMut image, const InspectConfig& cfg, std::string* out) {
        if (out == nullptr) {
            return cli_status(StatusCode::Invalid);
        }
        BufferMut region{};
        Status s = inspect_region(image, cfg, &region);
        if (!podkit::core::is_ok(s)) {
            return s;
        }
        u32 len = 0;
        s = podkit::collections::map_validate<PodU32, PodU32>(podkit::bytes::as_view(region), &len);
        if (!podkit::core::is_ok(s)) {
            return s;
        }
        podkit::bytes::PodSlice<U32Entry> entries{};
        s = podkit::collections::map_entries<PodU32, PodU32>(podkit::bytes::as_view(region), &entries);
        if (!podkit::core::is_ok(s)) {
            return s;
        }
        append_u32(out, "len=", len);
        out->push_back('\n');
        for (const U32Entry& e : entries) {
            append_u32(out, "", e.key.get());
            append_u32(out, " => ", e.value.get());
            out->push_back('\n');
        }
        return podkit::core::ok_status();
    }

    Status run_map_put(BufferMut image, const InspectConfig& cfg, std::string* out) {
        if (out == nullptr) {
            return cli_status(StatusCode::Invalid);
        }
        Status s = require(cfg.has_key, OptionId::Key);
        if (podkit::core::is_ok(s)) {
            s = require(cfg.has_value, OptionId::Value);
        }
        if (!podkit::core::is_ok(s)) {
            return s;
        }
        BufferMut region{};
        s = inspect_region(image, cfg, &region);
        if (!podkit::core::is_ok(s)) {
            return s;
        }
        podkit::collections::MapInsertResult<PodU32> result{};
        s = podkit::collections::map_insert<PodU32, PodU32>(region, PodU32::from(cfg.key), PodU32::from(cfg.value),
                                                             &result);
        if (!podkit::core::is_ok(s)) {
            return s;
        }
        if (result.replaced) {
            append_u32(out, "replaced ", result.previous.get());
        } else {
            out->append("inserted");
        }
        out->push_back('\n');
        return podkit::core::ok_status();
    }

    Status run_map_remove(BufferMut image, const InspectConfig& cfg, std::string* out) {
        if (out == nullptr) {
            return cli_status(StatusCode::Invalid);
        }
        Status s = require(cfg.has_key, OptionId::Key);
        if (!podkit::core::is_ok(s)) {
            return s;
        }
        BufferMut region{};
        s = inspect_region(image, cfg, &region);
        if (!podkit::core::is_ok(s)) {
            return s;
        }
        PodU32 removed{};
        s = podkit::collections::map_remove<PodU32, PodU32>(region, PodU32::from(cfg.key), &removed);
        if (!podkit::core::is_ok(s)) {
            return s;
        }
        append_u32(out, "removed ", removed.get());
        out->push_back('\n');
        return podkit::core::ok_status();
    }
} // namespace podkit::cli
