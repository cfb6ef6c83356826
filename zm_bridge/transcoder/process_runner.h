#ifndef PROCESS_RUNNER_H
#define PROCESS_RUNNER_H

// Standard Library
#include <string>
#include <vector>

/**
 * @brief Runs an external program to completion.
 */
class ProcessRunner
{
public:
    virtual ~ProcessRunner() = default;

    /**
     * @brief Runs a program and waits for it.
     * @param Program followed by its arguments; the program is searched on PATH.
     * @return Exit status, or 128 + signal number when the program was killed.
     * @throws TranscodeError when the program cannot be started.
     */
    virtual int run(const std::vector<std::string>& command) = 0;
};

/**
 * @brief fork/execvp/waitpid implementation. Blocks the calling thread, no timeout.
 */
class PosixProcessRunner : public ProcessRunner
{
public:
    int run(const std::vector<std::string>& command) override;
};

#endif // PROCESS_RUNNER_H
