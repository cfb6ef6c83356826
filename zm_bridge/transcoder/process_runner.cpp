// Standard Library
#include <cerrno>
#include <cstring>

// System Library
#include <pthread.h>
#include <signal.h>
#include <sys/types.h>
#include <sys/wait.h>
#include <unistd.h>

// Project headers
#include "process_runner.h"
#include "bridge_errors.h"

namespace {
    constexpr int k_exec_failed_status = 127;
}

int PosixProcessRunner::run(const std::vector<std::string>& command)
{
    if (command.empty())
    {
        throw TranscodeError("empty command line");
    }

    std::vector<char*> argv;
    argv.reserve(command.size() + 1);
    for (const auto& arg : command)
    {
        argv.push_back(const_cast<char*>(arg.c_str()));
    }
    argv.push_back(nullptr);

    pid_t pid = fork();
    if (pid < 0)
    {
        throw TranscodeError("fork for " + command.front() + " failed: " + std::strerror(errno));
    }

    if (pid == 0)
    {
        // The bridge blocks SIGINT/SIGTERM in every thread; the child must stay killable.
        sigset_t no_signals;
        sigemptyset(&no_signals);
        pthread_sigmask(SIG_SETMASK, &no_signals, nullptr);

        execvp(argv[0], argv.data());
        _exit(k_exec_failed_status);
    }

    int status = 0;
    while (waitpid(pid, &status, 0) < 0)
    {
        if (errno != EINTR)
        {
            throw TranscodeError("waitpid for " + command.front() + " failed: " + std::strerror(errno));
        }
    }

    if (WIFEXITED(status)) return WEXITSTATUS(status);
    if (WIFSIGNALED(status)) return 128 + WTERMSIG(status);
    return status;
}
