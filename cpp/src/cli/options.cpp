#include "podkit/cli/options.hpp"

#include <charconv>
#include <cstring>

namespace podkit::cli {
    using podkit::core::Status;
    using podkit::core::StatusCode;
    using podkit::core::StatusDomain;

    namespace {
        Status bad_token(u32 index) noexcept {
            return podkit::core::make_status(StatusDomain::Cli, StatusCode::Invalid, index);
        }

        [[nodiscard]] const OptionSpec* find_long(const OptionSpec* specs, u32 spec_count, const char* name, u32 name_len) noexcept {
            for (u32 i = 0; i < spec_count; ++i) {
                const char* ln = specs[i].long_name;
                if (ln != nullptr && std::strlen(ln) == name_len && std::strncmp(ln, name, name_len) == 0) {
                    return &specs[i];
                }
            }
            return nullptr;
        }

        [[nodiscard]] const OptionSpec* find_short(const OptionSpec* specs, u32 spec_count, char c) noexcept {
            for (u32 i = 0; i < spec_count; ++i) {
                if (specs[i].short_name != '\0' && specs[i].short_name == c) {
                    return &specs[i];
                }
            }
            return nullptr;
        }

        // Decimal, or hex with a 0x / 0X prefix. The whole string must parse.
        [[nodiscard]] bool parse_u64(const char* s, u64* out) noexcept {
            if (s == nullptr || *s == '\0') {
                return false;
            }
            int base = 10;
            if (s[0] == '0' && (s[1] == 'x' || s[1] == 'X')) {
                base = 16;
                s += 2;
            }
            const char* end = s + std::strlen(s);
            if (s == end) {
                return false;
            }
            u64 v = 0;
            const auto r = std::from_chars(s, end, v, base);
            if (r.ec != std::errc() || r.ptr != end) {
                return false;
            }
            *out = v;
            return true;
        }

        [[nodiscard]] Status push_option(ParsedOptions* out, const ParsedOption& opt, u32 index) noexcept {
            if (out->data == nullptr || out->len >= out->cap) {
                return podkit::core::make_status(StatusDomain::Cli, StatusCode::CapacityExceeded, index);
            }
            out->data[out->len++] = opt;
            return podkit::core::ok_status();
        }

        // Fills opt from a textual value according to the option's declared type.
        [[nodiscard]] bool set_value(const OptionSpec& spec, const char* value, ParsedOption* opt) noexcept {
            opt->id = spec.id;
            opt->type = spec.type;
            switch (spec.type) {
            case OptionType::Flag:
                opt->value.boolv = 1;
                return value == nullptr;
            case OptionType::String:
                opt->value.str = value;
                return value != nullptr;
            case OptionType::U64:
                return parse_u64(value, &opt->value.u64v);
            }
            return false;
        }
    } // namespace

    Status parse_options(const CliArgs& args,
                         const OptionSpec* specs,
                         u32 spec_count,
                         ParsedOptions* out,
                         u32* consumed) noexcept {
        if (out == nullptr || consumed == nullptr) {
            return podkit::core::make_status(StatusDomain::Cli, StatusCode::Invalid);
        }
        *consumed = 0;
        out->len = 0;
        if ((args.argc > 0 && args.argv == nullptr) || (spec_count > 0 && specs == nullptr)) {
            return podkit::core::make_status(StatusDomain::Cli, StatusCode::Invalid);
        }

        u32 i = 0;
        while (i < args.argc) {
            const char* tok = args.argv[i];
            if (tok == nullptr || tok[0] != '-' || tok[1] == '\0') {
                break;
            }
            if (std::strcmp(tok, "--") == 0) {
                ++i;
                break;
            }

            const OptionSpec* spec = nullptr;
            const char* value = nullptr;
            if (tok[1] == '-') {
                const char* name = tok + 2;
                const char* eq = std::strchr(name, '=');
                const u32 name_len = static_cast<u32>(eq != nullptr ? eq - name : std::strlen(name));
                spec = find_long(specs, spec_count, name, name_len);
                if (eq != nullptr) {
                    value = eq + 1;
                }
            } else {
                spec = find_short(specs, spec_count, tok[1]);
                if (tok[2] != '\0') {
                    value = tok + 2;
                }
            }
            if (spec == nullptr) {
                return bad_token(i);
            }

            const u32 at = i;
            ++i;
            if (spec->type != OptionType::Flag && value == nullptr) {
                if (i >= args.argc || args.argv[i] == nullptr) {
                    return bad_token(at);
                }
                value = args.argv[i];
                ++i;
            }

            ParsedOption opt{};
            if (!set_value(*spec, value, &opt)) {
                return bad_token(at);
            }
            const Status s = push_option(out, opt, at);
            if (!podkit::core::is_ok(s)) {
                return s;
            }
        }

        *consumed = i;
        return podkit::core::ok_status();
    }

    const ParsedOption* find_option(const ParsedOptions& opts, OptionId id) noexcept {
        const ParsedOption* found = nullptr;
        for (u32 i = 0; i < opts.len; ++i) {
            if (opts.data[i].id == id) {
                found = &opts.data[i];
            }
        }
        return found;
    }
} // namespace podkit::cli
