#include "bootpack/options.hpp"

#include <expected>
#include <format>
#include <print>
#include <string>
#include <string_view>
#include <unordered_set>

namespace bootpack {

std::expected<ParsedArgs, UsageError> parse_options(std::span<const std::string_view> args) {
    ParsedArgs parsed;
    std::unordered_set<std::string_view> used_options;

    auto mark_used = [&used_options](std::string_view option) -> std::expected<void, UsageError> {
        if (!used_options.insert(option).second) {
            return std::unexpected(UsageError{UsageError::Kind::DuplicateOption, std::string(option)});
        }
        return {};
    };

    for (std::string_view arg : args) {
        if (arg == "help") {
            // Nothing after help is looked at, including the gdb/run check.
            parsed.show_help = true;
            return parsed;
        } else if (arg == "release") {
            if (auto res = mark_used(arg); !res)
                return std::unexpected(res.error());
            parsed.config.optimized = true;
        } else if (arg == "run") {
            if (auto res = mark_used(arg); !res)
                return std::unexpected(res.error());
            parsed.config.should_run = true;
        } else if (arg == "gdb") {
            if (auto res = mark_used(arg); !res)
                return std::unexpected(res.error());
            parsed.config.wait_for_debugger = true;
        } else {
            return std::unexpected(UsageError{UsageError::Kind::UnknownOption, std::string(arg)});
        }
    }

    if (parsed.config.wait_for_debugger && !parsed.config.should_run) {
        return std::unexpected(UsageError{UsageError::Kind::InvalidCombination, "gdb"});
    }
    return parsed;
}

std::string describe(const UsageError &err) {
    switch (err.kind) {
    case UsageError::Kind::UnknownOption:
        return std::format("Error: Unknown argument '{}'", err.token);
    case UsageError::Kind::DuplicateOption:
        return std::format("Error: Option '{}' specified twice", err.token);
    case UsageError::Kind::InvalidCombination:
        return std::format("Error: Option '{}' specified but not 'run'\n"
                           "       '{}' must always be used in conjunction with 'run'.",
                           err.token,
                           err.token);
    }
    return std::format("Error: Invalid argument '{}'", err.token);
}

void print_usage() {
    std::println("usage: bootpack [options...]");
    std::println("  available options: release, run, gdb, help");
}

void print_help() {
    std::println("bootpack {}", BOOTPACK_PROJ_VER);
    std::println("usage: bootpack [options...]");
    std::println("  options:");
    std::println("     release");
    std::println("         Build the kernel with 'cargo build --release'.");
    std::println("         This enables optimizations and doesn't emit debug info.");
    std::println("     run");
    std::println("         After building the disk image, run it in qemu.");
    std::println("         qemu needs to be installed for this to work.");
    std::println("     gdb");
    std::println("         Tells qemu to wait for a connection from gdb at port 1234");
    std::println("         before starting execution.");
    std::println("         Must be used in conjunction with 'run'.");
    std::println("     help");
    std::println("         Prints this help screen, and then exits.");
}

} // namespace bootpack
