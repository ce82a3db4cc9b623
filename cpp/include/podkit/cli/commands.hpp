#pragma once

#include <type_traits>

#include "podkit/cli/options.hpp"
#include "podkit/core/errors.hpp"

namespace podkit::cli {

    enum class CommandId : u32 {
        None = 0,
        Help = 1,
        Create = 2,
        SeqInit = 3,
        SeqDump = 4,
        SeqPush = 5,
        SeqRemove = 6,
        MapDump = 7,
        MapPut = 8,
        MapRemove = 9,
    };

    struct CommandSpec {
        CommandId id{CommandId::None};
        const char* name{nullptr};
        const char* summary{nullptr};
    };

    struct CommandInvocation {
        CommandId id{CommandId::None};
        CliArgs args{};
    };

    // Matches argv[0] against specs. NotFound for an unknown name, Invalid for a
    // missing command or one that starts with '-'.
    [[nodiscard]] podkit::core::Status parse_command(const CliArgs& args,
                                                     const CommandSpec* specs,
                                                     u32 spec_count,
                                                     CommandInvocation* out,
                                                     u32* consumed) noexcept;

    static_assert(std::is_trivially_copyable_v<CommandSpec>);
    static_assert(std::is_trivially_copyable_v<CommandInvocation>);

} // namespace podkit::cli
