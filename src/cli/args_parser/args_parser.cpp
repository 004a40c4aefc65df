#include "args_parser.hpp"

#include <CLI/CLI.hpp>

namespace cupload::args_parser {

std::optional<CLIArgs> parse_args(int argc, char const* const* argv, int& exit_code)
{
    CLIArgs args;
    CLI::App app{"cupload: resumable parallel upload with content hashing"};

    app.add_option("source", args.source, "Local file to upload")->required()->check(CLI::ExistingFile);
    app.add_option("destination", args.destination, "Destination path in the store (absolute)")->required();

    app.add_option("--resume", args.resume, "Resume an interrupted upload: <session_id>,<offset>");
    app.add_option("--store", args.store_root, "Root directory of the local store");
    app.add_option("--resume-file", args.resume_file, "Where to keep resume state between runs");
    app.add_option("-j,--parallelism", args.parallelism, "Chunks uploaded in parallel")
        ->check(CLI::PositiveNumber);
    app.add_option("--blocks-per-request", args.blocks_per_request, "4 MiB blocks per append request")
        ->check(CLI::PositiveNumber);
    app.add_option("--retries", args.retry_count, "Consecutive failed attempts before giving up on a chunk")
        ->check(CLI::PositiveNumber);
    app.add_option("--log-level", args.log_level, "trace, debug, info, warn, error, critical, off");

    app.add_flag("--verify", args.verify, "Download the result and compare content hashes");
    app.add_flag("--no-progress", args.no_progress, "Do not show the progress line");
    app.add_flag("-q,--quiet", args.quiet, "Only print errors");

    try {
        app.parse(argc, argv);
    } catch (const CLI::ParseError& e) {
        exit_code = app.exit(e);
        return std::nullopt;
    }

    exit_code = 0;
    return args;
}

} // namespace cupload::args_parser
