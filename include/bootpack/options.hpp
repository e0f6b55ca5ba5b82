#pragma once

#include <expected>
#include <span>
#include <string>
#include <string_view>

namespace bootpack {

struct BuildConfig {
    bool optimized = false;
    bool should_run = false;
    bool wait_for_debugger = false; ///< Only ever set together with should_run.

    bool operator==(const BuildConfig &) const = default;
};

struct UsageError {
    enum class Kind {
        UnknownOption,
        DuplicateOption,
        InvalidCombination,
    };

    Kind kind;
    std::string token;
};

struct ParsedArgs {
    bool show_help = false;
    BuildConfig config;
};

/**
 * @brief Parses the command line tokens (program name excluded).
 *
 * Recognized flags are `release`, `run`, `gdb` and `help`. `help` ends the scan
 * and requests the help screen; any error raised by a token before it still wins.
 *
 * @param args The raw tokens.
 * @return The parsed arguments, or the first usage error encountered.
 */
std::expected<ParsedArgs, UsageError> parse_options(std::span<const std::string_view> args);

/** @brief Renders the message printed for a usage error. */
std::string describe(const UsageError &err);

void print_usage();
void print_help();

} // namespace bootpack
