#pragma once

#include <string>

namespace bootpack {

/**
 * @brief Names and programs the orchestrator works with.
 *
 * The defaults describe the kernel project this tool ships with. Everything the
 * collaborating tools are called with is derived from these fields.
 */
struct OrchestratorConfig {
    std::string cargo = "cargo";
    std::string emulator = "qemu-system-x86_64";
    std::string manifest_name = "Cargo.toml";
    std::string target_triple = "x86_64-unknown-caesarsallad";
    std::string binary_name = "brynolv-evper-ofjall-project";
    std::string bootloader_package = "bootloader";
    std::string builder_subcommand = "builder";
    std::string bios_firmware = "bios.bin";
};

} // namespace bootpack
