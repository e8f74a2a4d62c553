#pragma once

#include <cstddef>
#include <string>
#include <vector>
#include <sys/types.h>

namespace sandbox {

    struct ChildProcessOptions {
        std::string executable;          // Absolute, relative or bare name looked up on PATH
        std::vector<std::string> args;   // argv[1..]
        std::string working_directory;   // Also HOME and TMPDIR of the child
        int cpu_seconds = 0;             // RLIMIT_CPU, 0 = unlimited
        std::size_t memory_limit_mb = 0; // RLIMIT_AS, 0 = unlimited
    };

    // A worker process in its own process group with stdout/stderr on pipes.
    // Destruction kills the whole group and reaps the child, so nothing started
    // here outlives the object.
    class ChildProcess {
    public:
        // Throws ExecutionException when the executable is missing or fork fails
        explicit ChildProcess(const ChildProcessOptions& options);
        ~ChildProcess();

        ChildProcess(const ChildProcess&) = delete;
        ChildProcess& operator=(const ChildProcess&) = delete;

        pid_t pid() const { return pid_; }
        int stdoutFd() const { return stdout_fd_; }
        int stderrFd() const { return stderr_fd_; }
        void closeStdout();
        void closeStderr();

        // Non-blocking; true once the child has exited and been reaped
        bool tryReap();

        // SIGKILL to the process group, then a blocking reap. No-op once reaped.
        void killGroup();

        bool hasExited() const { return reaped_; }
        bool exitedNormally() const;
        int exitCode() const;        // Valid when exitedNormally()
        int terminationSignal() const; // Valid when !exitedNormally()

        // Resolves a bare name against PATH and makes the result absolute.
        // Throws ExecutionException if no executable file is found.
        static std::string resolveExecutable(const std::string& executable);

    private:
        void reap();

        pid_t pid_ = -1;
        int stdout_fd_ = -1;
        int stderr_fd_ = -1;
        bool reaped_ = false;
        int status_ = 0;
    };

} // namespace sandbox
