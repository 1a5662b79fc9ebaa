/**
 * @file process_runner.hpp
 * @brief Runs an external tool and captures its exit status and output.
 */

#ifndef PROCESS_RUNNER_HPP
#define PROCESS_RUNNER_HPP

#include <chrono>
#include <string>
#include <vector>

/**
 * @brief Outcome of an external command.
 */
struct ProcessResult {
    int exitCode = -1;        ///< Exit status; -1 if the process could not be run or was killed.
    bool timedOut = false;    ///< The process was killed after the timeout.
    std::string out;          ///< Captured stdout.
    std::string err;          ///< Captured stderr, or the reason the process could not run.

    bool ok() const { return exitCode == 0 && !timedOut; }
};

/**
 * @brief Runs a command without a shell.
 *
 * @param argv Program and arguments; argv[0] is looked up in PATH.
 * @param timeout The process is killed once this much time has passed; zero disables it.
 */
ProcessResult runCommand(const std::vector<std::string>& argv,
                         std::chrono::seconds timeout = std::chrono::seconds(0));

#endif // PROCESS_RUNNER_HPP
