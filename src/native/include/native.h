#pragma once

#if defined(__unix__)
#include "unix/unix.h"
#else
#   error "Error, unsupported platform"
#endif

#include <chrono>
#include <filesystem>
#include <string>
#include <utility>
#include <vector>

namespace tad::native
{
    /**
     * Configures terminal settings for the current platform.
     * This is primarily used to ensure UTF-8 compatible console output.
     *
     * @return true if terminal configuration succeeded or was not required.
     * @return false if terminal configuration failed.
     */
    bool configureTerminal();

    /**
     * Outcome of a child process.
     */
    struct ProcessResult
    {
        int exit_code = -1;

        // standard output, empty when it was redirected to a file
        std::string output;
        std::string errors;

        bool timed_out = false;
    };

    /**
     * Spawns a new process and waits for it to finish.
     * The command is looked up in PATH. Standard output and standard error
     * are captured separately.
     *
     * When `timeout` is positive and the process is still running once it elapses,
     * the process group is killed, `timed_out` is set and `exit_code` is -1.
     *
     * @param command The command to execute in the new process
     * @param args The arguments to pass to the command
     * @param timeout Deadline for the whole run, zero waits indefinitely
     * @return Exit code (127 when the command cannot be started) and captured streams.
     */
    ProcessResult runProcess(const std::string & command, std::vector<std::string> args = {}, std::chrono::milliseconds timeout = std::chrono::milliseconds::zero());

    /**
     * Spawns a new process and streams its standard output into a file.
     * Used for commands that produce binary output.
     *
     * @param command The command to execute in the new process
     * @param args The arguments to pass to the command
     * @param output_path File receiving standard output. It is truncated first.
     * @param timeout Same as for runProcess
     * @return Exit code and captured standard error.
     */
    ProcessResult runProcessToFile(const std::string & command, std::vector<std::string> args, const std::filesystem::path & output_path, std::chrono::milliseconds timeout = std::chrono::milliseconds::zero());
}
