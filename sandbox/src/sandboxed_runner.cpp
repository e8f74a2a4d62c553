#include "sandboxed_runner.hpp"
#include "child_process.hpp"
#include "scratch_directory.hpp"
#include "price_csv.hpp"
#include "exceptions.hpp"
#include "logging.hpp"
#include <spdlog/fmt/fmt.h>

#include <algorithm>
#include <cerrno>
#include <chrono>
#include <csignal>
#include <cstring>
#include <thread>
#include <utility>

#include <poll.h>
#include <unistd.h>

namespace sandbox {

    namespace {

        using Clock = std::chrono::steady_clock;

        std::string tail(const std::string& text, std::size_t max_chars) {
            return text.size() <= max_chars ? text : text.substr(text.size() - max_chars);
        }

        double secondsSince(Clock::time_point start) {
            return std::chrono::duration<double>(Clock::now() - start).count();
        }

        std::string describeOutput(const std::string& out, const std::string& err) {
            return fmt::format("\n--- stdout (tail) ---\n{}\n--- stderr (tail) ---\n{}",
                               tail(out, SandboxedRunner::kTailChars), tail(err, SandboxedRunner::kTailChars));
        }

    } // namespace

    SandboxedRunner::SandboxedRunner(core::SandboxSettings settings)
        : settings_(std::move(settings)) {
        if (settings_.timeout_seconds <= 0) {
            throw core::ConfigException("Sandbox timeout must be positive");
        }
    }

    void SandboxedRunner::validate(const std::string& logic_text) const {
        policy_.validate(logic_text);
    }

    nlohmann::json SandboxedRunner::extractPayload(const std::string& stdout_text) {
        auto begin = stdout_text.find(kResultsStart);
        if (begin == std::string::npos) {
            throw core::ExecutionException("Sandbox worker printed no results block");
        }
        begin += std::strlen(kResultsStart);
        auto end = stdout_text.find(kResultsEnd, begin);
        if (end == std::string::npos) {
            throw core::ExecutionException("Sandbox worker results block is not terminated");
        }

        nlohmann::json payload = nlohmann::json::parse(stdout_text.substr(begin, end - begin), nullptr, false);
        if (payload.is_discarded()) {
            throw core::ExecutionException("Sandbox worker results block is not valid JSON");
        }
        return payload;
    }

    SandboxRunResult SandboxedRunner::run(const std::string& logic_text,
                                          const core::TimeSeries<core::Candle>& prices) {
        auto logger = core::logging::getLogger();
        policy_.validate(logic_text);

        ScratchDirectory scratch(settings_.scratch_root);
        scratch.writeFile(kSpecFileName, logic_text);
        scratch.writeFile(kPricesFileName, data::formatPriceCsv(prices));

        ChildProcessOptions options;
        options.executable = settings_.runner_path;
        options.args = {"--spec", kSpecFileName, "--prices", kPricesFileName};
        options.working_directory = scratch.path();
        options.cpu_seconds = settings_.timeout_seconds;
        options.memory_limit_mb = settings_.memory_limit_mb;

        const auto started = Clock::now();
        const auto deadline = started + std::chrono::seconds(settings_.timeout_seconds);
        ChildProcess child(options);
        logger->info("Sandbox worker pid {} started ({} candles, timeout {} s)", child.pid(), prices.size(),
                     settings_.timeout_seconds);

        auto timeOut = [&]() {
            child.killGroup();
            std::string message = fmt::format("Sandbox worker exceeded its {} s wall-clock limit and was killed",
                                              settings_.timeout_seconds);
            logger->error(message);
            return core::TimeoutException(message);
        };

        std::string out;
        std::string err;
        char buffer[8192];
        while (child.stdoutFd() >= 0 || child.stderrFd() >= 0) {
            auto remaining = std::chrono::duration_cast<std::chrono::milliseconds>(deadline - Clock::now()).count();
            if (remaining <= 0) {
                throw timeOut();
            }

            pollfd fds[2];
            nfds_t count = 0;
            if (child.stdoutFd() >= 0) fds[count++] = {child.stdoutFd(), POLLIN, 0};
            if (child.stderrFd() >= 0) fds[count++] = {child.stderrFd(), POLLIN, 0};

            int ready = ::poll(fds, count, static_cast<int>(std::min<long long>(remaining, 1000)));
            if (ready < 0) {
                if (errno == EINTR) continue;
                throw core::ExecutionException(std::string("poll on sandbox pipes failed: ") + std::strerror(errno));
            }

            for (nfds_t i = 0; i < count; ++i) {
                if (!(fds[i].revents & (POLLIN | POLLHUP | POLLERR))) continue;
                const bool is_stdout = fds[i].fd == child.stdoutFd();
                ssize_t n = ::read(fds[i].fd, buffer, sizeof(buffer));
                if (n > 0) {
                    (is_stdout ? out : err).append(buffer, static_cast<std::size_t>(n));
                } else if (n == 0 || errno != EINTR) {
                    if (is_stdout) child.closeStdout(); else child.closeStderr();
                }
            }

            if (out.size() + err.size() > settings_.max_output_bytes) {
                child.killGroup();
                throw core::ExecutionException(fmt::format("Sandbox worker output exceeded {} bytes",
                                                           settings_.max_output_bytes));
            }
        }

        // Pipes are closed; the worker is exiting
        while (!child.tryReap()) {
            if (Clock::now() >= deadline) {
                throw timeOut();
            }
            std::this_thread::sleep_for(std::chrono::milliseconds(10));
        }

        SandboxRunResult result;
        result.elapsed_seconds = secondsSince(started);
        result.stdout_tail = tail(out, kTailChars);
        result.stderr_tail = tail(err, kTailChars);
        logger->debug("Sandbox worker stderr:\n{}", result.stderr_tail);

        if (!child.exitedNormally()) {
            int signal = child.terminationSignal();
            if (signal == SIGXCPU) {
                std::string message = fmt::format("Sandbox worker hit its {} s CPU limit", settings_.timeout_seconds);
                logger->error(message);
                throw core::TimeoutException(message);
            }
            throw core::ExecutionException(fmt::format("Sandbox worker killed by signal {} ({}){}", signal,
                                                       strsignal(signal), describeOutput(out, err)));
        }

        result.exit_code = child.exitCode();
        if (result.exit_code == 127) {
            throw core::ExecutionException("Sandbox worker could not be executed: " + settings_.runner_path +
                                           describeOutput(out, err));
        }
        if (result.exit_code != 0) {
            throw core::ExecutionException(fmt::format("Sandbox worker exited with code {}{}", result.exit_code,
                                                       describeOutput(out, err)));
        }

        try {
            result.payload = extractPayload(out);
        } catch (const core::ExecutionException& e) {
            throw core::ExecutionException(e.what() + describeOutput(out, err));
        }
        logger->info("Sandbox worker pid {} finished in {:.2f} s", child.pid(), result.elapsed_seconds);
        return result;
    }

} // namespace sandbox
