#pragma once

#include <type_traits>

#include "podkit/core/errors.hpp"
#include "podkit/core/types.hpp"

namespace podkit::cli {
    using u8 = podkit::core::u8;
    using u32 = podkit::core::u32;
    using u64 = podkit::core::u64;

    struct CliArgs {
        const char* const* argv{nullptr};
        u32 argc{0};
    };

    enum class OptionType : u8 {
        Flag = 0,
        String = 1,
        U64 = 2,
    };

    enum class OptionId : u32 {
        None = 0,
        Offset = 1,
        Span = 2,
        ElemSize = 3,
        Size = 4,
        Value = 5,
        Key = 6,
        Index = 7,
        Verbose = 8,
        Image = 9,
    };

    struct OptionSpec {
        OptionId id{OptionId::None};
        OptionType type{OptionType::Flag};
        const char* long_name{nullptr};
        char short_name{'\0'};
    };

    union OptionValue {
        const char* str;
        u64 u64v;
        u8 boolv;
    };

    struct ParsedOption {
        OptionId id{OptionId::None};
        OptionType type{OptionType::Flag};
        OptionValue value{};
    };

    struct ParsedOptions {
        ParsedOption* data{nullptr};
        u32 len{0};
        u32 cap{0};
    };

    // Parses leading options; stops at the first positional argument or after
    // "--". Accepts --name value, --name=value, -x value and -xvalue. Numbers are
    // decimal or 0x-prefixed hex. On failure aux is the argv index of the
    // offending token.
    [[nodiscard]] podkit::core::Status parse_options(const CliArgs& args,
                                                     const OptionSpec* specs,
                                                     u32 spec_count,
                                                     ParsedOptions* out,
                                                     u32* consumed) noexcept;

    // Last occurrence of id, or nullptr.
    [[nodiscard]] const ParsedOption* find_option(const ParsedOptions& opts, OptionId id) noexcept;

    static_assert(std::is_trivially_copyable_v<CliArgs>);
    static_assert(std::is_trivially_copyable_v<OptionSpec>);
    static_assert(std::is_trivially_copyable_v<ParsedOption>);
    static_assert(std::is_trivially_copyable_v<ParsedOptions>);
    static_assert(std::is_standard_layout_v<ParsedOption>);

} // namespace podkit::cli
