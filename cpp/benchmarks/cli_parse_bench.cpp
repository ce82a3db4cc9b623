#include <array>

#include <benchmark/benchmark.h>

#include "podkit/cli/commands.hpp"
#include "podkit/cli/inspect.hpp"
#include "podkit/cli/options.hpp"

static void BM_CliParseOptions(benchmark::State& state) {
    podkit::cli::u32 count = 0;
    const podkit::cli::OptionSpec* specs = podkit::cli::inspect_option_specs(&count);

    const char* argv[] = {"--verbose", "--offset", "64", "--span=0x100", "-e4", "-v", "7", "--", "x"};
    const podkit::cli::CliArgs args{argv, 9};
    for (auto _ : state) {
        podkit::cli::ParsedOption buf[8]{};
        podkit::cli::ParsedOptions out{buf, 0, 8};
        podkit::cli::u32 consumed = 0;
        const podkit::core::Status s = podkit::cli::parse_options(args, specs, count, &out, &consumed);
        benchmark::DoNotOptimize(static_cast<podkit::core::u16>(s.code));
        benchmark::DoNotOptimize(out.len);
        benchmark::DoNotOptimize(consumed);
    }
}
BENCHMARK(BM_CliParseOptions);

static void BM_CliParseCommand(benchmark::State& state) {
    const std::array<podkit::cli::CommandSpec, 4> specs = {{
        {podkit::cli::CommandId::Help, "help", ""},
        {podkit::cli::CommandId::SeqDump, "seq-dump", ""},
        {podkit::cli::CommandId::SeqPush, "seq-push", ""},
        {podkit::cli::CommandId::MapPut, "map-put", ""},
    }};

    const char* argv[] = {"map-put", "image.bin", "--key", "1"};
    const podkit::cli::CliArgs args{argv, 4};
    for (auto _ : state) {
        podkit::cli::CommandInvocation out{};
        podkit::cli::u32 consumed = 0;
        const podkit::core::Status s = podkit::cli::parse_command(args, specs.data(), specs.size(), &out, &consumed);
        benchmark::DoNotOptimize(static_cast<podkit::core::u16>(s.code));
        benchmark::DoNotOptimize(static_cast<podkit::cli::u32>(out.id));
        benchmark::DoNotOptimize(consumed);
    }
}
BENCHMARK(BM_CliParseCommand);
