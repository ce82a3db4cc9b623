#include "podkit/cli/commands.hpp"

#include <cstring>

namespace podkit::cli {
    using podkit::core::Status;
    using podkit::core::StatusCode;
    using podkit::core::StatusDomain;

    Status parse_command(const CliArgs& args,
                         const CommandSpec* specs,
                         u32 spec_count,
                         CommandInvocation* out,
                         u32* consumed) noexcept {
        if (out == nullptr || consumed == nullptr) {
            return podkit::core::make_status(StatusDomain::Cli, StatusCode::Invalid);
        }
        *consumed = 0;
        *out = CommandInvocation{};

        if (args.argc == 0 || args.argv == nullptr || args.argv[0] == nullptr) {
            return podkit::core::make_status(StatusDomain::Cli, StatusCode::Invalid);
        }
        if (spec_count > 0 && specs == nullptr) {
            return podkit::core::make_status(StatusDomain::Cli, StatusCode::Invalid);
        }

        const char* name = args.argv[0];
        if (name[0] == '-' || name[0] == '\0') {
            return podkit::core::make_status(StatusDomain::Cli, StatusCode::Invalid);
        }

        for (u32 i = 0; i < spec_count; ++i) {
            if (specs[i].name != nullptr && std::strcmp(specs[i].name, name) == 0) {
                out->id = specs[i].id;
                out->args = CliArgs{args.argv + 1, args.argc - 1};
                *consumed = 1;
                return podkit::core::ok_status();
            }
        }
        return podkit::core::make_status(StatusDomain::Cli, StatusCode::NotFound);
    }
} // namespace podkit::cli
