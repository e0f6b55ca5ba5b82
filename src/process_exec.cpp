#include "bootpack/process_exec.hpp"

#include "bootpack/utility.hpp"

#include <expected>
#include <format>
#include <optional>
#include <reproc++/drain.hpp>
#include <reproc++/run.hpp>
#include <string>
#include <utility>
#include <vector>

namespace bootpack {

namespace {

reproc::options make_options(const std::optional<std::string> &working_dir) {
    reproc::options options;
    options.redirect.in.type = reproc::redirect::parent;
    options.redirect.err.type = reproc::redirect::parent;
    if (working_dir) {
        options.working_directory = working_dir->c_str();
    }
    return options;
}

} // namespace

Result<int> process_exec(std::vector<std::string> &&args, std::optional<std::string> working_dir) {
    if (args.empty()) {
        return std::unexpected("Cannot execute empty command");
    }

    reproc::options options = make_options(working_dir);
    options.redirect.out.type = reproc::redirect::parent;

    auto [status, ec] = reproc::run(args, options);
    if (ec) {
        return std::unexpected(std::format("Failed to execute {}: {}", args.front(), ec.message()));
    }
    return status;
}

Result<CapturedOutput> process_capture(std::vector<std::string> &&args, std::optional<std::string> working_dir) {
    if (args.empty()) {
        return std::unexpected("Cannot execute empty command");
    }

    reproc::options options = make_options(working_dir);
    options.redirect.out.type = reproc::redirect::pipe;

    CapturedOutput captured;
    auto [status, ec] = reproc::run(args, options, reproc::sink::string(captured.out), reproc::sink::null);
    if (ec) {
        return std::unexpected(std::format("Failed to execute {}: {}", args.front(), ec.message()));
    }
    captured.status = status;
    return captured;
}

Result<int> SubprocessRunner::run(const Command &cmd) {
    return process_exec(std::vector<std::string>(cmd.args), cmd.working_dir);
}

Result<CapturedOutput> SubprocessRunner::capture(const Command &cmd) {
    return process_capture(std::vector<std::string>(cmd.args), cmd.working_dir);
}

} // namespace bootpack
