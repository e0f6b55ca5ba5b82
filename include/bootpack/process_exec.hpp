#pragma once

#include "bootpack/utility.hpp"

#include <optional>
#include <string>
#include <vector>

namespace bootpack {

struct Command {
    std::vector<std::string> args; ///< First argument is the executable.
    std::optional<std::string> working_dir = std::nullopt;

    bool operator==(const Command &) const = default;
};

struct CapturedOutput {
    int status = 0;
    std::string out;
};

/**
 * @brief Executes a subprocess with the parent's standard streams.
 *
 * @param args The command line arguments (first argument is the executable).
 * @param working_dir Optional working directory for the subprocess.
 * @return The exit code of the process, or an error if it could not be started.
 */
Result<int> process_exec(std::vector<std::string> &&args, std::optional<std::string> working_dir = std::nullopt);

/**
 * @brief Executes a subprocess and collects its standard output.
 *
 * Standard error stays attached to the parent so diagnostics reach the terminal.
 */
Result<CapturedOutput> process_capture(std::vector<std::string> &&args,
                                       std::optional<std::string> working_dir = std::nullopt);

/**
 * @brief Seam between the orchestration logic and real subprocesses.
 */
class ProcessRunner {
public:
    virtual ~ProcessRunner() = default;

    virtual Result<int> run(const Command &cmd) = 0;
    virtual Result<CapturedOutput> capture(const Command &cmd) = 0;
};

class SubprocessRunner final : public ProcessRunner {
public:
    Result<int> run(const Command &cmd) override;
    Result<CapturedOutput> capture(const Command &cmd) override;
};

} // namespace bootpack
