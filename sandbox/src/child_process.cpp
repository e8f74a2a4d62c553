#include "child_process.hpp"
#include "exceptions.hpp"
#include "logging.hpp"
#include <spdlog/fmt/fmt.h>

#include <cerrno>
#include <csignal>
#include <cstdlib>
#include <cstring>
#include <filesystem>
#include <sstream>

#include <fcntl.h>
#include <sys/resource.h>
#include <sys/wait.h>
#include <unistd.h>

namespace sandbox {

    namespace fs = std::filesystem;

    namespace {

        void closeFd(int& fd) {
            if (fd >= 0) {
                ::close(fd);
                fd = -1;
            }
        }

        bool isExecutableFile(const std::string& path) {
            std::error_code ec;
            return fs::is_regular_file(path, ec) && ::access(path.c_str(), X_OK) == 0;
        }

    } // namespace

    std::string ChildProcess::resolveExecutable(const std::string& executable) {
        if (executable.empty()) {
            throw core::ExecutionException("No sandbox worker executable configured");
        }
        if (executable.find('/') != std::string::npos) {
            std::error_code ec;
            std::string absolute = fs::absolute(executable, ec).string();
            if (ec || !isExecutableFile(absolute)) {
                throw core::ExecutionException("Sandbox worker not found or not executable: " + executable);
            }
            return absolute;
        }

        const char* path_env = std::getenv("PATH");
        std::stringstream dirs(path_env ? path_env : "/usr/local/bin:/usr/bin:/bin");
        std::string dir;
        while (std::getline(dirs, dir, ':')) {
            if (dir.empty()) continue;
            std::string candidate = (fs::path(dir) / executable).string();
            if (isExecutableFile(candidate)) {
                std::error_code ec;
                std::string absolute = fs::absolute(candidate, ec).string();
                return ec ? candidate : absolute;
            }
        }
        throw core::ExecutionException("Sandbox worker '" + executable + "' not found on PATH");
    }

    ChildProcess::ChildProcess(const ChildProcessOptions& options) {
        auto logger = core::logging::getLogger();
        const std::string executable = resolveExecutable(options.executable);

        // Everything the child needs is prepared before fork: after it only
        // async-signal-safe calls are allowed.
        std::vector<std::string> argv_storage;
        argv_storage.push_back(executable);
        argv_storage.insert(argv_storage.end(), options.args.begin(), options.args.end());
        std::vector<char*> argv;
        for (auto& arg : argv_storage) argv.push_back(const_cast<char*>(arg.c_str()));
        argv.push_back(nullptr);

        std::vector<std::string> env_storage = {
            "PATH=/usr/local/bin:/usr/bin:/bin",
            "HOME=" + options.working_directory,
            "TMPDIR=" + options.working_directory,
            "LANG=C",
        };
        if (const char* level = std::getenv("SPDLOG_LEVEL")) {
            env_storage.push_back(std::string("SPDLOG_LEVEL=") + level);
        }
        std::vector<char*> envp;
        for (auto& entry : env_storage) envp.push_back(const_cast<char*>(entry.c_str()));
        envp.push_back(nullptr);

        int out_pipe[2] = {-1, -1};
        int err_pipe[2] = {-1, -1};
        if (::pipe2(out_pipe, O_CLOEXEC) != 0) {
            throw core::ExecutionException(std::string("pipe2 failed: ") + std::strerror(errno));
        }
        if (::pipe2(err_pipe, O_CLOEXEC) != 0) {
            int saved = errno;
            ::close(out_pipe[0]);
            ::close(out_pipe[1]);
            throw core::ExecutionException(std::string("pipe2 failed: ") + std::strerror(saved));
        }

        const char* work_dir = options.working_directory.c_str();
        rlimit cpu_limit{static_cast<rlim_t>(options.cpu_seconds), static_cast<rlim_t>(options.cpu_seconds + 1)};
        rlimit mem_limit{static_cast<rlim_t>(options.memory_limit_mb) * 1024 * 1024,
                         static_cast<rlim_t>(options.memory_limit_mb) * 1024 * 1024};
        rlimit no_core{0, 0};

        pid_t pid = ::fork();
        if (pid < 0) {
            int saved = errno;
            ::close(out_pipe[0]); ::close(out_pipe[1]);
            ::close(err_pipe[0]); ::close(err_pipe[1]);
            throw core::ExecutionException(std::string("fork failed: ") + std::strerror(saved));
        }

        if (pid == 0) {
            ::setpgid(0, 0);
            if (::chdir(work_dir) != 0) ::_exit(126);
            if (options.cpu_seconds > 0) ::setrlimit(RLIMIT_CPU, &cpu_limit);
            if (options.memory_limit_mb > 0) ::setrlimit(RLIMIT_AS, &mem_limit);
            ::setrlimit(RLIMIT_CORE, &no_core);

            int dev_null = ::open("/dev/null", O_RDONLY);
            if (dev_null >= 0) ::dup2(dev_null, STDIN_FILENO);
            ::dup2(out_pipe[1], STDOUT_FILENO);
            ::dup2(err_pipe[1], STDERR_FILENO);

            ::execve(argv[0], argv.data(), envp.data());
            ::_exit(127);
        }

        // Both sides set the group to close the race with an early kill
        ::setpgid(pid, pid);
        pid_ = pid;
        ::close(out_pipe[1]);
        ::close(err_pipe[1]);
        stdout_fd_ = out_pipe[0];
        stderr_fd_ = err_pipe[0];
        logger->debug("Started sandbox worker {} (pid {}) in {}", executable, pid_, options.working_directory);
    }

    ChildProcess::~ChildProcess() {
        if (pid_ > 0 && !reaped_) {
            killGroup();
        }
        closeFd(stdout_fd_);
        closeFd(stderr_fd_);
    }

    void ChildProcess::closeStdout() { closeFd(stdout_fd_); }
    void ChildProcess::closeStderr() { closeFd(stderr_fd_); }

    bool ChildProcess::tryReap() {
        if (reaped_) return true;
        // Peek without reaping: while the leader is a zombie its pid, and with it
        // the group id, cannot be handed to another process
        siginfo_t info{};
        if (::waitid(P_PID, static_cast<id_t>(pid_), &info, WEXITED | WNOHANG | WNOWAIT) != 0) {
            if (errno == ECHILD) reaped_ = true;
            return reaped_;
        }
        if (info.si_pid == 0) return false;

        // Anything the worker left behind in its group goes too
        ::kill(-pid_, SIGKILL);
        reap();
        return true;
    }

    void ChildProcess::killGroup() {
        if (pid_ <= 0 || reaped_) return;
        ::kill(-pid_, SIGKILL);
        reap();
        core::logging::getLogger()->debug("Killed sandbox worker group {}", pid_);
    }

    void ChildProcess::reap() {
        int status = 0;
        pid_t result;
        do {
            result = ::waitpid(pid_, &status, 0);
        } while (result < 0 && errno == EINTR);
        reaped_ = true;
        status_ = status;
    }

    bool ChildProcess::exitedNormally() const {
        return reaped_ && WIFEXITED(status_);
    }

    int ChildProcess::exitCode() const {
        return WIFEXITED(status_) ? WEXITSTATUS(status_) : -1;
    }

    int ChildProcess::terminationSignal() const {
        return WIFSIGNALED(status_) ? WTERMSIG(status_) : 0;
    }

} // namespace sandbox
