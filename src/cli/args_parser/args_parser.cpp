#include "args_parser.hpp"

#include <CLI/CLI.hpp>
#include <fmt/core.h>

namespace dirshift::args_parser {

namespace {

constexpr const char* kFormatsFooter = R"(
Operations may be combined (-tc, -t -c, --mode tc). Without any, the
program transfers, validates and then offers cleanup.

Config file supports two formats:

1. YAML, with individual and/or grouped transfers:
   transfers:
     - source: /path/to/source
       destination: /path/to/destination
   transfer_groups:
     - destination_base: /base/destination/path
       preserve_source_name: true   # false merges every source into the base
       sources:
         - /path/to/source1
         - /path/to/source2

2. CSV (file name ending in .csv), header required:
   source,destination
   # comments and blank lines are ignored
   /path/to/source,/path/to/destination
)";

} // namespace

auto parse_args(int argc, char const* const* argv) -> infra::Result<CLIArgs> {
    CLIArgs args;
    bool transfer = false;
    bool validate = false;
    bool cleanup = false;
    bool both = false;
    std::vector<std::string> mode_tokens;

    CLI::App app{"Bulk directory transfer with verification and guarded cleanup", "dirshift"};
    app.footer(kFormatsFooter);

    app.add_flag("-t,--transfer", transfer, "Copy each source to its destination");
    app.add_flag("-v,--validate", validate, "Verify destinations against sources");
    app.add_flag("-c,--cleanup", cleanup, "Offer to delete verified sources (implies validate)");
    app.add_flag("-b,--both", both, "Transfer and validate");
    app.add_option("-m,--mode", mode_tokens, "Operation letters, e.g. tv or tc")
        ->check([](const std::string& token) -> std::string {
            auto parsed = core::parse_operation_letters(token);
            return parsed ? std::string{} : parsed.error().message;
        });
    app.add_option("-f,--config", args.config_file, "YAML or CSV transfer file")
        ->capture_default_str();
    app.add_flag("--checksum", args.checksum, "Also compare xxHash64 digests when validating");
    app.add_option("--rsync", args.rsync_binary, "rsync executable to run");
    app.add_option("--exclude", args.exclude_patterns, "Extra name pattern to skip (repeatable)");
    app.add_option("--log-file", args.log_file, "Also write the log to this file");
    app.add_flag("-q,--quiet", args.quiet, "Only warnings, errors and prompts");
    app.add_flag("--verbose", args.verbose, "Debug logging");
    app.add_flag("--version", args.version, "Print build information and exit");

    try {
        app.parse(argc, argv);
    } catch (const CLI::CallForHelp&) {
        fmt::print("{}", app.help());
        args.help = true;
        return args;
    } catch (const CLI::ParseError& e) {
        return std::unexpected(infra::make_error(infra::ErrorCode::UsageError,
            fmt::format("{}\n\n{}", e.what(), app.help())));
    }

    if (transfer) args.operations.add(core::Operation::Transfer);
    if (validate) args.operations.add(core::Operation::Validate);
    if (cleanup) args.operations.add(core::Operation::Cleanup);
    if (both) args.operations.add(core::Operation::Transfer).add(core::Operation::Validate);
    for (const auto& token : mode_tokens) {
        auto parsed = core::parse_operation_letters(token);
        if (!parsed) {
            return std::unexpected(std::move(parsed.error()));
        }
        args.operations.merge(*parsed);
    }

    return args;
}

} // namespace dirshift::args_parser
