#include <cerrno>
#include <cstdio>
#include <cstdlib>
#include <cstring>
#include <string>
#include <utility>
#include <vector>

#include "podkit/cli/commands.hpp"
#include "podkit/cli/inspect.hpp"
#include "podkit/cli/options.hpp"
#include "podkit/core/errors.hpp"

// ========================================================================
// Commands
// ========================================================================

namespace {

    const podkit::cli::CommandSpec g_commands[] = {
        {podkit::cli::CommandId::Help, "help", "Show this help"},
        {podkit::cli::CommandId::Create, "create", "Create a zero-filled image of --size bytes"},
        {podkit::cli::CommandId::SeqInit, "seq-init", "Write an empty sequence header at --offset"},
        {podkit::cli::CommandId::SeqDump, "seq-dump", "Print the sequence at --offset (--elem-size bytes each)"},
        {podkit::cli::CommandId::SeqPush, "seq-push", "Append --value (u32), or insert it at --index"},
        {podkit::cli::CommandId::SeqRemove, "seq-remove", "Remove the element at --index"},
        {podkit::cli::CommandId::MapDump, "map-dump", "Print the u32 -> u32 map at --offset"},
        {podkit::cli::CommandId::MapPut, "map-put", "Insert or update --key with --value"},
        {podkit::cli::CommandId::MapRemove, "map-remove", "Remove --key"},
    };

    constexpr podkit::cli::OptionSpec g_global_options[] = {
        {podkit::cli::OptionId::Verbose, podkit::cli::OptionType::Flag, "verbose", '\0'},
    };

    constexpr podkit::core::u32 kMaxOptions = 32;

    // ========================================================================
    // Logging
    // ========================================================================

    bool g_verbose = false;

    void print_error(const char* msg) {
        fprintf(stderr, "error: %s\n", msg);
    }

    void print_info(const char* msg) {
        if (g_verbose) {
            fprintf(stderr, "info: %s\n", msg);
        }
    }

    void print_status_error(const char* context, podkit::core::Status s) {
        fprintf(stderr,
                "error: %s failed (code=%s/%u, domain=%s/%u, aux=%u)\n",
                context,
                podkit::core::status_code_name(s.code),
                static_cast<unsigned>(s.code),
                podkit::core::status_domain_name(s.domain),
                static_cast<unsigned>(s.domain),
                s.aux);
        if (s.code == podkit::core::StatusCode::Io && s.aux != 0) {
            fprintf(stderr, "error: %s: %s\n", context, std::strerror(static_cast<int>(s.aux)));
        }
    }

    // ========================================================================
    // Image I/O
    // ========================================================================

    podkit::core::Status read_image(const std::string& path, std::vector<podkit::core::u8>* out) {
        FILE* f = fopen(path.c_str(), "rb");
        if (f == nullptr) {
            return podkit::core::make_status(podkit::core::StatusDomain::Cli, podkit::core::StatusCode::Io,
                                             static_cast<podkit::core::u32>(errno));
        }
        std::vector<podkit::core::u8> data;
        podkit::core::u8 chunk[4096];
        size_t n = 0;
        while ((n = fread(chunk, 1, sizeof(chunk), f)) > 0) {
            data.insert(data.end(), chunk, chunk + n);
        }
        const bool failed = ferror(f) != 0;
        fclose(f);
        if (failed) {
            return podkit::core::make_status(podkit::core::StatusDomain::Cli, podkit::core::StatusCode::Io);
        }
        if (data.size() > 0xffffffffu) {
            return podkit::core::make_status(podkit::core::StatusDomain::Cli,
                                             podkit::core::StatusCode::CapacityExceeded);
        }
        *out = std::move(data);
        return podkit::core::ok_status();
    }

    podkit::core::Status write_image(const std::string& path, const std::vector<podkit::core::u8>& data) {
        FILE* f = fopen(path.c_str(), "wb");
        if (f == nullptr) {
            return podkit::core::make_status(podkit::core::StatusDomain::Cli, podkit::core::StatusCode::Io,
                                             static_cast<podkit::core::u32>(errno));
        }
        const size_t written = data.empty() ? 0 : fwrite(data.data(), 1, data.size(), f);
        const bool closed = fclose(f) == 0;
        if (written != data.size() || !closed) {
            return podkit::core::make_status(podkit::core::StatusDomain::Cli, podkit::core::StatusCode::Io);
        }
        return podkit::core::ok_status();
    }

    podkit::bytes::BufferMut as_buffer(std::vector<podkit::core::u8>& data) {
        return podkit::bytes::BufferMut{data.data(), static_cast<podkit::core::u32>(data.size())};
    }

    // ========================================================================
    // Command Handlers
    // ========================================================================

    void handle_help() {
        printf("usage: podkit-inspect [--verbose] <command> [image] [options]\n\n");
        printf("Commands:\n");
        for (const auto& c : g_commands) {
            printf("  %-12s %s\n", c.name, c.summary);
        }
        printf("\nOptions:\n");
        printf("  -o, --offset N     region start in the image (default 0)\n");
        printf("  -s, --span N       region length (default: rest of the image)\n");
        printf("  -e, --elem-size N  element size for seq-init/seq-dump/seq-remove (default 4)\n");
        printf("      --size N       image size for create\n");
        printf("  -v, --value N      u32 value\n");
        printf("  -k, --key N        u32 key\n");
        printf("  -i, --index N      element index\n");
        printf("      --verbose      log progress to stderr\n");
        printf("\nThe image path may also come from PODKIT_IMAGE.\n");
    }

    int handle_create(const podkit::cli::InspectConfig& cfg) {
        std::vector<podkit::core::u8> data(cfg.size, 0);
        const podkit::core::Status s = write_image(cfg.image_path, data);
        if (!podkit::core::is_ok(s)) {
            print_status_error("create", s);
            return EXIT_FAILURE;
        }
        print_info("image created");
        return EXIT_SUCCESS;
    }

    // Loads the image, runs one command on it, writes it back when mutating.
    int handle_image_command(podkit::cli::CommandId id, const podkit::cli::InspectConfig& cfg, const char* name) {
        std::vector<podkit::core::u8> data;
        podkit::core::Status s = read_image(cfg.image_path, &data);
        if (!podkit::core::is_ok(s)) {
            print_status_error("read image", s);
            return EXIT_FAILURE;
        }
        print_info("image loaded");

        std::string report;
        bool mutated = true;
        const podkit::bytes::BufferMut image = as_buffer(data);
        switch (id) {
        case podkit::cli::CommandId::SeqInit:
            s = podkit::cli::run_seq_init(image, cfg);
            break;
        case podkit::cli::CommandId::SeqDump:
            s = podkit::cli::run_seq_dump(image, cfg, &report);
            mutated = false;
            break;
        case podkit::cli::CommandId::SeqPush:
            s = podkit::cli::run_seq_push(image, cfg);
            break;
        case podkit::cli::CommandId::SeqRemove:
            s = podkit::cli::run_seq_remove(image, cfg, &report);
            break;
        case podkit::cli::CommandId::MapDump:
            s = podkit::cli::run_map_dump(image, cfg, &report);
            mutated = false;
            break;
        case podkit::cli::CommandId::MapPut:
            s = podkit::cli::run_map_put(image, cfg, &report);
            break;
        case podkit::cli::CommandId::MapRemove:
            s = podkit::cli::run_map_remove(image, cfg, &report);
            break;
        default:
            print_error("unknown command");
            return EXIT_FAILURE;
        }
        if (!podkit::core::is_ok(s)) {
            print_status_error(name, s);
            return EXIT_FAILURE;
        }

        if (mutated) {
            s = write_image(cfg.image_path, data);
            if (!podkit::core::is_ok(s)) {
                print_status_error("write image", s);
                return EXIT_FAILURE;
            }
            print_info("image written");
        }
        fputs(report.c_str(), stdout);
        return EXIT_SUCCESS;
    }

} // namespace

// ========================================================================
// Main
// ========================================================================

int main(int argc, char** argv) {
    podkit::cli::CliArgs args{argv + 1, argc > 0 ? static_cast<podkit::core::u32>(argc - 1) : 0};

    podkit::cli::ParsedOption storage[kMaxOptions]{};
    podkit::cli::ParsedOptions opts{storage, 0, kMaxOptions};
    podkit::core::u32 consumed = 0;
    podkit::core::Status s = podkit::cli::parse_options(args, g_global_options, 1, &opts, &consumed);
    if (!podkit::core::is_ok(s)) {
        print_status_error("parse global options", s);
        return EXIT_FAILURE;
    }
    g_verbose = podkit::cli::find_option(opts, podkit::cli::OptionId::Verbose) != nullptr;
    args.argv += consumed;
    args.argc -= consumed;

    if (args.argc == 0) {
        handle_help();
        return EXIT_FAILURE;
    }

    podkit::cli::CommandInvocation cmd{};
    s = podkit::cli::parse_command(args, g_commands, static_cast<podkit::core::u32>(std::size(g_commands)), &cmd,
                                   &consumed);
    if (!podkit::core::is_ok(s)) {
        fprintf(stderr, "error: unknown command %s\n", args.argv[0] != nullptr ? args.argv[0] : "");
        return EXIT_FAILURE;
    }
    if (cmd.id == podkit::cli::CommandId::Help) {
        handle_help();
        return EXIT_SUCCESS;
    }

    // <command> [image] [options] or <command> [options] [image]
    podkit::cli::CliArgs rest = cmd.args;
    const char* image_arg = nullptr;
    if (rest.argc > 0 && rest.argv[0] != nullptr && rest.argv[0][0] != '-') {
        image_arg = rest.argv[0];
        ++rest.argv;
        --rest.argc;
    }

    podkit::core::u32 spec_count = 0;
    const podkit::cli::OptionSpec* specs = podkit::cli::inspect_option_specs(&spec_count);
    s = podkit::cli::parse_options(rest, specs, spec_count, &opts, &consumed);
    if (!podkit::core::is_ok(s)) {
        print_status_error("parse options", s);
        return EXIT_FAILURE;
    }
    rest.argv += consumed;
    rest.argc -= consumed;
    if (image_arg == nullptr && rest.argc > 0) {
        image_arg = rest.argv[0];
        ++rest.argv;
        --rest.argc;
    }
    if (rest.argc > 0) {
        fprintf(stderr, "error: unexpected argument %s\n", rest.argv[0]);
        return EXIT_FAILURE;
    }

    podkit::cli::InspectConfig cfg{};
    cfg.verbose = g_verbose;
    s = podkit::cli::build_inspect_config(opts, image_arg, std::getenv("PODKIT_IMAGE"), &cfg);
    if (!podkit::core::is_ok(s)) {
        print_status_error("configure", s);
        return EXIT_FAILURE;
    }
    g_verbose = cfg.verbose;
    if (cfg.image_path.empty()) {
        print_error("no image given (pass a path or set PODKIT_IMAGE)");
        return EXIT_FAILURE;
    }

    if (cmd.id == podkit::cli::CommandId::Create) {
        return handle_create(cfg);
    }
    return handle_image_command(cmd.id, cfg, args.argv[0]);
}
