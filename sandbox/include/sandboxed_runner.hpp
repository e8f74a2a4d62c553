#pragma once

#include <string>
#include <nlohmann/json.hpp>

#include "config.hpp"
#include "datatypes.hpp"
#include "sandbox_policy.hpp"

namespace sandbox {

    struct SandboxRunResult {
        nlohmann::json payload;      // JSON printed between the result sentinels
        std::string stdout_tail;
        std::string stderr_tail;
        double elapsed_seconds = 0.0;
        int exit_code = 0;
    };

    // Executes generated logic in isolation. The orchestrator only talks to
    // this interface.
    class ISandboxRunner {
    public:
        virtual ~ISandboxRunner() = default;

        // Throws SecurityException; never starts a process
        virtual void validate(const std::string& logic_text) const = 0;

        // Throws SecurityException, TimeoutException or ExecutionException
        virtual SandboxRunResult run(const std::string& logic_text,
                                     const core::TimeSeries<core::Candle>& prices) = 0;
    };

    // Runs the signal_runner worker on a private scratch directory holding
    // the signal specification and the price history, under CPU, memory and
    // wall-clock limits.
    class SandboxedRunner : public ISandboxRunner {
    public:
        static constexpr const char* kSpecFileName = "signal_spec.json";
        static constexpr const char* kPricesFileName = "prices.csv";
        static constexpr const char* kResultsStart = "===RESULTS_START===";
        static constexpr const char* kResultsEnd = "===RESULTS_END===";
        static constexpr std::size_t kTailChars = 4000;

        explicit SandboxedRunner(core::SandboxSettings settings);

        void validate(const std::string& logic_text) const override;
        SandboxRunResult run(const std::string& logic_text,
                             const core::TimeSeries<core::Candle>& prices) override;

        // Payload between the sentinels; throws ExecutionException when the
        // markers are missing or the text is not JSON
        static nlohmann::json extractPayload(const std::string& stdout_text);

        const core::SandboxSettings& settings() const { return settings_; }

    private:
        core::SandboxSettings settings_;
        SandboxPolicy policy_;
    };

} // namespace sandbox
