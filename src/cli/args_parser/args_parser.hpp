#pragma once

#include <string>
#include <vector>
#include <cstdint>
#include <optional>



namespace cupload::args_parser {
    struct CLIArgs
{
    std::string source;                           // первый позиционный аргумент
    std::string destination;                      // второй: путь в хранилище, начинается с '/'
    std::optional<std::string> resume;            // --resume <id>,<offset>
    std::optional<std::string> store_root;        // --store DIR
    std::optional<std::string> resume_file;       // --resume-file PATH
    std::optional<std::size_t> parallelism;       // -j, --parallelism=N
    std::optional<std::size_t> blocks_per_request;// --blocks-per-request=N
    std::optional<int> retry_count;               // --retries=N
    std::optional<std::string> log_level;         // --log-level=LEVEL
    bool verify{false};                           // --verify
    bool no_progress{false};                      // --no-progress
    bool quiet{false};                            // -q, --quiet
};



/// Разбирает аргументы командной строки (CLI11).
/// nullopt: был --help или ошибка разбора, сообщение уже напечатано; exit_code заполнен.
std::optional<CLIArgs> parse_args(int argc, char const* const* argv, int& exit_code);

} // namespace cupload::args_parser

using __CLI = cupload::args_parser::CLIArgs;
