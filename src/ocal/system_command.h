#ifndef EMUFLOW_SYSTEM_COMMAND_H
#define EMUFLOW_SYSTEM_COMMAND_H

#include <string>
#include <vector>

namespace emuflow {
namespace ocal {
namespace system {

struct CommandResult {
    bool success;
    int exitCode;
    std::string output;
    std::string error;
    std::string command;
    int executionTimeMs;
    bool timedOut;
    bool launchFailed;

    CommandResult() : success(false), exitCode(-1), executionTimeMs(0), timedOut(false), launchFailed(false) {}
};

/**
 * Run a program directly (no shell) and capture stdout and stderr
 *
 * @param argv Program followed by its arguments; argv[0] is looked up in PATH
 * @param timeoutMs Deadline for the whole run; the child is killed when it passes
 * @param maxOutputBytes Stdout beyond this size is discarded (stderr is capped at 64 KiB)
 * @return CommandResult; success means exit status 0 within the deadline
 */
CommandResult executeCommand(const std::vector<std::string>& argv,
                             int timeoutMs = 30000,
                             size_t maxOutputBytes = 64 * 1024 * 1024);

/**
 * Render argv for logs, quoting arguments that contain spaces or quotes
 */
std::string formatCommandLine(const std::vector<std::string>& argv);

} // namespace system
} // namespace ocal
} // namespace emuflow

#endif // EMUFLOW_SYSTEM_COMMAND_H
